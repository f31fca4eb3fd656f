// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef SSH_NATIVE_H_7150294836107254
#define SSH_NATIVE_H_7150294836107254

#include <cstdint>
#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <zen/sys_error.h>
#include "../base/host_key.h"


namespace uxf
{
struct SftpAttributes
{
    std::optional<uint32_t> mode; //POSIX st_mode incl. file type bits
    std::optional<uint64_t> size;
    std::optional<time_t>   modTime;
};

inline bool isDirectoryMode(uint32_t mode) { return (mode & 0170000) == 0040000; }


class SftpDirectory
{
public:
    virtual ~SftpDirectory() {}

    virtual std::optional<std::string> readEntry() = 0; //throw SysError; std::nullopt at end of listing; includes "." and ".."
    virtual void close() = 0; //throw SysError
};


class SftpFile
{
public:
    virtual ~SftpFile() {} //closes if not yet closed; errors are dropped

    virtual void setTimeout(int timeoutSec) = 0;

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    virtual size_t tryRead(void* buffer, size_t bytesToRead) = 0; //throw SysError
    //may return short! CONTRACT: bytesToWrite > 0
    virtual size_t tryWrite(const void* buffer, size_t bytesToWrite) = 0; //throw SysError

    virtual void close() = 0; //throw SysError
};


enum class SftpOpenMode
{
    read,
    write, //create or truncate
};


class SftpChannel
{
public:
    virtual ~SftpChannel() {}

    virtual SftpAttributes stat(const std::string& remotePath) = 0; //throw SysError; follows symlinks

    virtual void makeDirectory  (const std::string& remotePath, int mode) = 0; //throw SysError
    virtual void removeDirectory(const std::string& remotePath) = 0; //throw SysError
    virtual void unlink(const std::string& remotePath) = 0; //throw SysError
    virtual void rename(const std::string& pathFrom, const std::string& pathTo) = 0; //throw SysError
    virtual void chmod(const std::string& remotePath, int mode) = 0; //throw SysError

    virtual std::unique_ptr<SftpDirectory> openDirectory(const std::string& remotePath) = 0; //throw SysError
    virtual std::unique_ptr<SftpFile>      openFile(const std::string& remotePath, SftpOpenMode mode) = 0; //throw SysError
};


//authenticated or not: the handshake has completed
class SshConnection
{
public:
    virtual ~SshConnection() {} //disconnect + free

    virtual std::string getFingerprintHex(FingerprintAlgorithm algo) = 0; //throw SysError; server host key hash, format unspecified: will be normalized

    virtual void authPassword(const std::string& username, const std::string& password) = 0; //throw SysError
    virtual void authPublicKey(const std::string& username,
                               const std::string& publicKeyFilePath,
                               const std::string& privateKeyFilePath,
                               const std::string& passphrase) = 0; //throw SysError

    virtual SftpChannel& getSftpChannel() = 0; //throw SysError; initialized on first use, then reused
};


class SshConnector
{
public:
    virtual ~SshConnector() {}

    //hostKeyAlgorithm: preferred server host key method, e.g. "ssh-rsa"
    virtual std::unique_ptr<SshConnection> connect(const std::string& server, int port, const std::string& hostKeyAlgorithm, std::optional<int> timeoutSec) = 0; //throw SysError
};
}

#endif //SSH_NATIVE_H_7150294836107254
