// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef SFTP_BACKEND_H_6628301947562018
#define SFTP_BACKEND_H_6628301947562018

#include <memory>
#include <zen/error_log.h>
#include "ssh_native.h"
#include "../base/connection_options.h"
#include "../base/diagnostic_capture.h"
#include "../base/url.h"
#include "../session/transport_backend.h"


namespace uxf
{
//SFTP: relative paths are resolved against the URL's base path on the client side
class SecureShellTransportBackend : public TransportBackend
{
public:
    SecureShellTransportBackend(const UrlDescriptor& url, const ConnectionOptions& options,
                                const std::shared_ptr<SshConnector>& connector, zen::ErrorLog* log);

    bool isConnected() const override { return static_cast<bool>(conn_); }

    void connect() override; //throw ConnectionError
    void loginWithPassword(const std::string& username, const std::string& password) override; //throw AuthenticationError

    bool supportsPublicKeyLogin() const override { return true; }
    void loginWithPublicKey(const std::string& username,
                            const std::string& publicKeyFilePath,
                            const std::string& privateKeyFilePath,
                            const std::string& passphrase) override; //throw AuthenticationError

    void onAuthenticated() override {}
    void closeConnection() override;

    std::vector<std::string> listFiles(const std::string& remoteDir) override; //throw XferError
    void downloadFile(const std::string& remoteFilePath, const std::string& localFilePath) override; //throw XferError
    void uploadFile  (const std::string& localFilePath, const std::string& remoteFilePath) override; //throw XferError
    bool isDirectory(const std::string& remotePath) override; //throw XferError
    void deleteFile(const std::string& remoteFilePath) override; //throw XferError
    void makeDirectory(const std::string& remoteDir, bool recursive) override; //throw XferError
    void removeDirectory(const std::string& remoteDir) override; //throw XferError
    void removeDirectoryRecursive(const std::string& remoteDir) override; //throw XferError
    void rename(const std::string& pathFrom, const std::string& pathTo) override; //throw XferError
    std::optional<int64_t> getSize   (const std::string& remoteFilePath) override; //throw XferError
    std::optional<time_t>  getModTime(const std::string& remoteFilePath) override; //throw XferError
    void chmod(const std::string& remotePath, int mode) override; //throw XferError

    bool supportsFtpListings() const override { return false; }
    std::vector<std::string> rawList(const std::string& remoteDir, bool recursive) override; //throw MissingCapabilityError
    std::vector<FtpFacts>    mlsd   (const std::string& remoteDir) override; //throw MissingCapabilityError

    std::string normalizeRemotePath(const std::string& remotePath) const;

private:
    SecureShellTransportBackend           (const SecureShellTransportBackend&) = delete;
    SecureShellTransportBackend& operator=(const SecureShellTransportBackend&) = delete;

    void verifyHostKey(); //throw ConnectionError

    SshConnection& getConnection(); //throw TransferError
    SftpChannel& requireSftp(); //throw ConnectionError, TransferError

    std::optional<SftpAttributes> tryStat(SftpChannel& sftp, const std::string& fullPath);

    std::vector<std::string> listDirectory(const std::string& remoteDir, bool skipHidden); //throw XferError
    void removeDirectoryRecursiveImpl(const std::string& remoteDir); //throw XferError

    const UrlDescriptor url_;
    const ConnectionOptions options_;
    const std::shared_ptr<SshConnector> connector_;
    zen::ErrorLog* const log_; //optional

    std::unique_ptr<SshConnection> conn_; //null if disconnected
    DiagnosticCapture diag_;
};
}

#endif //SFTP_BACKEND_H_6628301947562018
