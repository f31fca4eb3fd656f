// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef FTP_BACKEND_H_3810295746102837
#define FTP_BACKEND_H_3810295746102837

#include <memory>
#include <zen/error_log.h>
#include "ftp_native.h"
#include "../base/connection_options.h"
#include "../base/diagnostic_capture.h"
#include "../base/url.h"
#include "../session/transport_backend.h"


namespace uxf
{
//FTP and FTPS: the server's working directory is kept at the URL's base path before every operation
class FileTransportBackend : public TransportBackend
{
public:
    FileTransportBackend(const UrlDescriptor& url, const ConnectionOptions& options,
                         const std::shared_ptr<FtpConnector>& connector, zen::ErrorLog* log);

    bool isConnected() const override { return static_cast<bool>(conn_); }

    void connect() override; //throw ConnectionError
    void loginWithPassword(const std::string& username, const std::string& password) override; //throw AuthenticationError

    bool supportsPublicKeyLogin() const override { return false; }
    void loginWithPublicKey(const std::string& username,
                            const std::string& publicKeyFilePath,
                            const std::string& privateKeyFilePath,
                            const std::string& passphrase) override; //throw MissingCapabilityError

    void onAuthenticated() override;
    void closeConnection() override;

    std::vector<std::string> listFiles(const std::string& remoteDir) override; //throw TransferError
    void downloadFile(const std::string& remoteFilePath, const std::string& localFilePath) override; //throw TransferError
    void uploadFile  (const std::string& localFilePath, const std::string& remoteFilePath) override; //throw TransferError
    bool isDirectory(const std::string& remotePath) override; //throw TransferError
    void deleteFile(const std::string& remoteFilePath) override; //throw TransferError
    void makeDirectory(const std::string& remoteDir, bool recursive) override; //throw TransferError
    void removeDirectory(const std::string& remoteDir) override; //throw TransferError
    void removeDirectoryRecursive(const std::string& remoteDir) override; //throw TransferError
    void rename(const std::string& pathFrom, const std::string& pathTo) override; //throw TransferError
    std::optional<int64_t> getSize   (const std::string& remoteFilePath) override; //throw TransferError
    std::optional<time_t>  getModTime(const std::string& remoteFilePath) override; //throw TransferError
    void chmod(const std::string& remotePath, int mode) override; //throw TransferError

    bool supportsFtpListings() const override { return true; }
    std::vector<std::string> rawList(const std::string& remoteDir, bool recursive) override; //throw TransferError
    std::vector<FtpFacts>    mlsd   (const std::string& remoteDir) override; //throw TransferError

private:
    FileTransportBackend           (const FileTransportBackend&) = delete;
    FileTransportBackend& operator=(const FileTransportBackend&) = delete;

    FtpConnection& getConnection(); //throw TransferError

    void ensureBaseDirectory(); //throw TransferError
    bool isDirectoryImpl(const std::string& remotePath); //no base directory check
    void removeDirectoryRecursiveImpl(const std::string& remoteDir); //throw TransferError

    const UrlDescriptor url_;
    const ConnectionOptions options_;
    const std::shared_ptr<FtpConnector> connector_;
    zen::ErrorLog* const log_; //optional

    std::unique_ptr<FtpConnection> conn_; //null if disconnected
    DiagnosticCapture diag_;
};
}

#endif //FTP_BACKEND_H_3810295746102837
