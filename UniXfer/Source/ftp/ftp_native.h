// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef FTP_NATIVE_H_6102938475610293
#define FTP_NATIVE_H_6102938475610293

#include <cstdint>
#include <ctime>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <zen/sys_error.h>


namespace uxf
{
//MLSD entry: "name" plus the server's facts with lower-case keys, e.g. "type", "size", "modify", "unix.mode"
using FtpFacts = std::map<std::string, std::string>;


/*  Native FTP/FTPS control connection.
    Relative paths are resolved by the server against its current working directory.
    All calls throw SysError; the message is suitable as diagnostic detail.           */
class FtpConnection
{
public:
    virtual ~FtpConnection() {}

    virtual void login(const std::string& username, const std::string& password) = 0; //throw SysError

    virtual void setPassive(bool passive) = 0; //throw SysError; data channel mode for subsequent transfers

    virtual std::string pwd() = 0; //throw SysError
    virtual void chdir(const std::string& dirPath) = 0; //throw SysError

    virtual std::vector<std::string> nlist  (const std::string& dirPath) = 0; //throw SysError; NLST: names, maybe path-qualified
    virtual std::vector<std::string> rawList(const std::string& dirPath, bool recursive) = 0; //throw SysError; LIST lines
    virtual std::vector<FtpFacts>    mlsd   (const std::string& dirPath) = 0; //throw SysError; without "." and ".."

    virtual void download(const std::string& remotePath, const std::string& localFilePath) = 0; //throw SysError; binary mode
    virtual void upload  (const std::string& localFilePath, const std::string& remotePath) = 0; //throw SysError; binary mode, overwrites

    virtual void deleteFile     (const std::string& filePath) = 0; //throw SysError
    virtual void makeDirectory  (const std::string& dirPath) = 0; //throw SysError
    virtual void removeDirectory(const std::string& dirPath) = 0; //throw SysError
    virtual void rename(const std::string& pathFrom, const std::string& pathTo) = 0; //throw SysError
    virtual void chmod(const std::string& itemPath, int mode) = 0; //throw SysError; SITE CHMOD

    virtual int64_t getSize   (const std::string& filePath) = 0; //throw SysError; -1 if the server cannot tell
    virtual time_t  getModTime(const std::string& filePath) = 0; //throw SysError; UTC, -1 if the server cannot tell

    virtual void close() = 0; //throw SysError; connection is unusable afterwards
};


class FtpConnector
{
public:
    virtual ~FtpConnector() {}

    //useTls: explicit FTPS (AUTH TLS) for control and data channel
    virtual std::unique_ptr<FtpConnection> connect(const std::string& server, int port, bool useTls, std::optional<int> timeoutSec) = 0; //throw SysError
};
}

#endif //FTP_NATIVE_H_6102938475610293
