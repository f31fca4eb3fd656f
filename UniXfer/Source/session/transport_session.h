// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef TRANSPORT_SESSION_H_3015728469120384
#define TRANSPORT_SESSION_H_3015728469120384

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <memory>
#include <zen/error_log.h>
#include <zen/string_tools.h>
#include "transport_backend.h"
#include "../base/connection_options.h"
#include "../base/transport_log.h"
#include "../base/url.h"


namespace uxf
{
enum class OperationSafety
{
    safe,   //read-only or idempotent: may always be retried
    unsafe, //retried only if RetryPolicy::allowUnsafe
};

/*  Disconnected --connect()--> Connected --login*()--> Authenticated
    closeConnection() returns to Disconnected from any state

    - every remote operation requires Authenticated, else TransferError
    - every remote operation runs through withRetry()
    - not thread-safe: one session per thread                                  */
class TransportSession
{
public:
    using Sleeper      = std::function<void(std::chrono::milliseconds delay)>;
    using JitterSource = std::function<double()>; //factor in [0.5, 1.5]

    TransportSession(const UrlDescriptor& url,
                     const ConnectionOptions& options,
                     std::unique_ptr<TransportBackend>&& backend,
                     zen::ErrorLog* log /*optional*/);
    ~TransportSession(); //closes connection; errors are logged, not thrown

    const UrlDescriptor& getUrl() const { return url_; }
    const ConnectionOptions& getOptions() const { return options_; }

    bool isConnected() const { return backend_->isConnected(); }
    bool isAuthenticated() const { return authenticated_ && backend_->isConnected(); }

    void connect(); //throw ConnectionError, MissingCapabilityError

    //user/password default to the URL's credentials
    void loginWithPassword(const std::optional<std::string>& username = std::nullopt,
                           const std::optional<std::string>& password = std::nullopt); //throw AuthenticationError
    //SFTP only
    void loginWithKey(const std::string& publicKeyFilePath,
                      const std::string& privateKeyFilePath,
                      const std::optional<std::string>& username   = std::nullopt,
                      const std::optional<std::string>& passphrase = std::nullopt); //throw AuthenticationError, MissingCapabilityError

    void closeConnection(); //idempotent

    //relative remote paths: FTP resolves against the URL base directory on the server, SFTP on the client side
    std::vector<std::string> listFiles(const std::string& remoteDir = "."); //throw XferError
    void downloadFile(const std::string& remoteFilePath, const std::string& localFilePath); //throw XferError
    void uploadFile  (const std::string& localFilePath, const std::string& remoteFilePath); //throw XferError
    bool isDirectory(const std::string& remotePath); //throw XferError
    void deleteFile(const std::string& remoteFilePath); //throw XferError
    void makeDirectory(const std::string& remoteDir, bool recursive = true); //throw XferError
    void removeDirectory(const std::string& remoteDir); //throw XferError
    void removeDirectoryRecursive(const std::string& remoteDir); //throw XferError
    void rename(const std::string& pathFrom, const std::string& pathTo); //throw XferError
    std::optional<int64_t> getSize   (const std::string& remoteFilePath); //throw XferError
    std::optional<time_t>  getModTime(const std::string& remoteFilePath); //throw XferError
    void chmod(const std::string& remotePath, int mode); //throw XferError

    //FTP/FTPS only
    std::vector<std::string> rawList(const std::string& remoteDir = ".", bool recursive = false); //throw XferError
    std::vector<FtpFacts>    mlsd   (const std::string& remoteDir = "."); //throw XferError

    //run "work" with the configured retry policy; only XferError (except MissingCapabilityError) is retried
    template <class Function>
    auto withRetry(const std::string& operationName, Function work, OperationSafety safety); //throw X

    void setSleeper(const Sleeper& sleeper) { sleeper_ = sleeper; }
    void setJitterSource(const JitterSource& jitter) { jitter_ = jitter; }

private:
    TransportSession           (const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    void requireAuthenticated(const std::string& operationName) const; //throw TransferError

    const UrlDescriptor url_;
    const ConnectionOptions options_;
    const std::unique_ptr<TransportBackend> backend_;
    zen::ErrorLog* const log_;

    bool authenticated_ = false;
    std::optional<std::string> username_; //credentials of the last successful login
    std::optional<std::string> password_; //

    Sleeper sleeper_;
    JitterSource jitter_;
};


//default sleeper/jitter source used by TransportSession
void sleepFor(std::chrono::milliseconds delay);
double getRandomJitterFactor(); //uniform in [0.5, 1.5], steps of 0.01








//------------------------------- implementation -------------------------------
template <class Function> inline
auto TransportSession::withRetry(const std::string& operationName, Function work, OperationSafety safety) //throw X
{
    const RetryPolicy& retry = options_.getRetryPolicy();

    if (retry.maxRetries == 0 ||
        (safety == OperationSafety::unsafe && !retry.allowUnsafe))
        return work(); //throw X

    int attempt = 0;
    int64_t delayMs = retry.delayMs;
    for (;;)
    {
        try
        {
            return work(); //throw X
        }
        catch (const MissingCapabilityError&) { throw; }
        catch (const XferError& e)
        {
            if (++attempt > retry.maxRetries)
                throw;

            logTransport(log_, zen::MSG_TYPE_WARNING, "Transport retry",
            {
                {"operation", operationName},
                {"attempt", zen::numberTo<std::string>(attempt)},
                {"max", zen::numberTo<std::string>(retry.maxRetries)},
                {"sleepMs", zen::numberTo<std::string>(delayMs)},
                {"error", e.toString()},
            });

            if (delayMs > 0)
            {
                int64_t sleepMs = delayMs;
                if (retry.jitter)
                    sleepMs = std::llround(std::min(static_cast<double>(delayMs) * jitter_(), static_cast<double>(MAX_RETRY_DELAY_MS)));

                sleeper_(std::chrono::milliseconds(std::max<int64_t>(sleepMs, 0)));
            }
            //saturate before rounding: llround() is undefined outside of int64_t
            delayMs = std::llround(std::min(static_cast<double>(delayMs) * retry.backoffFactor, static_cast<double>(MAX_RETRY_DELAY_MS)));
        }
    }
}
}

#endif //TRANSPORT_SESSION_H_3015728469120384
