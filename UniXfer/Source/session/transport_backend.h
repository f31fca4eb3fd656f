// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef TRANSPORT_BACKEND_H_9461027385016294
#define TRANSPORT_BACKEND_H_9461027385016294

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "../base/xfer_error.h"
#include "../ftp/ftp_native.h"


namespace uxf
{
/*  Protocol-specific half of a TransportSession.
    The session validates state and credentials, runs every call below through its retry engine and logs.
    Backends translate native failures into the XferError family; remote paths are interpreted relative
    to the URL's base path, absolute paths are used as is.                                              */
class TransportBackend
{
public:
    virtual ~TransportBackend() {}

    virtual bool isConnected() const = 0;

    virtual void connect() = 0; //throw ConnectionError; replaces an existing connection

    virtual void loginWithPassword(const std::string& username, const std::string& password) = 0; //throw AuthenticationError

    virtual bool supportsPublicKeyLogin() const = 0;
    virtual void loginWithPublicKey(const std::string& username,
                                    const std::string& publicKeyFilePath,
                                    const std::string& privateKeyFilePath,
                                    const std::string& passphrase) = 0; //throw AuthenticationError

    virtual void onAuthenticated() = 0; //post-login setup: must not throw

    virtual void closeConnection() = 0; //no-op if not connected; must not throw

    //---------------------------------------------------------------------------
    virtual std::vector<std::string> listFiles(const std::string& remoteDir) = 0; //throw XferError; without hidden entries
    virtual void downloadFile(const std::string& remoteFilePath, const std::string& localFilePath) = 0; //throw XferError
    virtual void uploadFile  (const std::string& localFilePath, const std::string& remoteFilePath) = 0; //throw XferError
    virtual bool isDirectory(const std::string& remotePath) = 0; //throw XferError
    virtual void deleteFile(const std::string& remoteFilePath) = 0; //throw XferError
    virtual void makeDirectory(const std::string& remoteDir, bool recursive) = 0; //throw XferError
    virtual void removeDirectory(const std::string& remoteDir) = 0; //throw XferError
    virtual void removeDirectoryRecursive(const std::string& remoteDir) = 0; //throw XferError
    virtual void rename(const std::string& pathFrom, const std::string& pathTo) = 0; //throw XferError
    virtual std::optional<int64_t> getSize   (const std::string& remoteFilePath) = 0; //throw XferError; std::nullopt if unknown
    virtual std::optional<time_t>  getModTime(const std::string& remoteFilePath) = 0; //throw XferError; std::nullopt if unknown
    virtual void chmod(const std::string& remotePath, int mode) = 0; //throw XferError

    //FTP family only:
    virtual bool supportsFtpListings() const = 0;
    virtual std::vector<std::string> rawList(const std::string& remoteDir, bool recursive) = 0; //throw XferError
    virtual std::vector<FtpFacts>    mlsd   (const std::string& remoteDir) = 0; //throw XferError
};
}

#endif //TRANSPORT_BACKEND_H_9461027385016294
