// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "transport_session.h"
#include <cassert>
#include <random>
#include <thread>
#include <zen/extra_log.h>
#include <zen/file_access.h>

using namespace zen;
using namespace uxf;


void uxf::sleepFor(std::chrono::milliseconds delay)
{
    std::this_thread::sleep_for(delay);
}


double uxf::getRandomJitterFactor()
{
    static thread_local std::mt19937 rng(std::random_device{}());
    return std::uniform_int_distribution<int>(50, 150)(rng) / 100.0;
}


TransportSession::TransportSession(const UrlDescriptor& url,
                                   const ConnectionOptions& options,
                                   std::unique_ptr<TransportBackend>&& backend,
                                   zen::ErrorLog* log) :
    url_(url),
    options_(options),
    backend_(std::move(backend)),
    log_(log),
    username_(url.user),
    password_(url.password),
    sleeper_(sleepFor),
    jitter_(getRandomJitterFactor)
{
    assert(backend_);
}


TransportSession::~TransportSession()
{
    try
    {
        closeConnection();
    }
    catch (const XferError& e) { logExtraError("Cannot close connection to " + fmtHost(url_.host) + ".\n\n" + e.toString()); }
}


void TransportSession::requireAuthenticated(const std::string& operationName) const //throw TransferError
{
    if (!backend_->isConnected())
        throw TransferError("Cannot " + operationName + ": connection has not been established yet.");
    if (!authenticated_)
        throw TransferError("Cannot " + operationName + ": session is not authenticated.");
}


void TransportSession::connect() //throw ConnectionError, MissingCapabilityError
{
    authenticated_ = false; //a new connection needs a new login

    logTransport(log_, MSG_TYPE_INFO, "Transport connecting",
    {
        {"protocol", getSchemeName(url_.protocol)},
        {"host", url_.host},
        {"port", numberTo<std::string>(url_.getEffectivePort())},
        {"path", url_.basePath},
    });

    withRetry("connect", [&] { backend_->connect(); /*throw ConnectionError*/ }, OperationSafety::safe);

    logTransport(log_, MSG_TYPE_INFO, "Transport connected",
    {
        {"protocol", getSchemeName(url_.protocol)},
        {"host", url_.host},
        {"port", numberTo<std::string>(url_.getEffectivePort())},
    });
}


void TransportSession::loginWithPassword(const std::optional<std::string>& username, const std::optional<std::string>& password) //throw AuthenticationError
{
    if (!backend_->isConnected())
        throw AuthenticationError("Cannot login: connection not established yet.");

    const std::string user = username ? *username : username_.value_or("");
    const std::string pass = password ? *password : password_.value_or("");

    if (user.empty() || pass.empty())
        throw AuthenticationError("Missing username or password for login.");

    logTransport(log_, MSG_TYPE_INFO, "Transport authenticating (password)",
    {
        {"protocol", getSchemeName(url_.protocol)},
        {"host", url_.host},
        {"user", user},
    });

    withRetry("login", [&] { backend_->loginWithPassword(user, pass); /*throw AuthenticationError*/ }, OperationSafety::safe);

    username_ = user;
    password_ = pass;
    authenticated_ = true;

    backend_->onAuthenticated();

    logTransport(log_, MSG_TYPE_INFO, "Transport authenticated",
    {
        {"protocol", getSchemeName(url_.protocol)},
        {"host", url_.host},
        {"user", user},
    });
}


void TransportSession::loginWithKey(const std::string& publicKeyFilePath,
                                    const std::string& privateKeyFilePath,
                                    const std::optional<std::string>& username,
                                    const std::optional<std::string>& passphrase) //throw AuthenticationError, MissingCapabilityError
{
    if (!backend_->supportsPublicKeyLogin())
        throw MissingCapabilityError("Public key authentication is not supported for FTP/FTPS.");

    if (!backend_->isConnected())
        throw AuthenticationError("Cannot login: connection not established yet.");

    try
    {
        if (!itemExists(publicKeyFilePath) || !itemExists(privateKeyFilePath)) //throw FileError
            throw AuthenticationError("Public or private key file does not exist.");
    }
    catch (const FileError& e) { throw AuthenticationError("Public or private key file does not exist. Details: " + e.toString()); }

    if (!isReadable(publicKeyFilePath) || !isReadable(privateKeyFilePath))
        throw AuthenticationError("Public or private key file is not readable.");

    const std::string user = username ? *username : username_.value_or("");
    if (user.empty())
        throw AuthenticationError("Username must be provided for public key authentication.");

    logTransport(log_, MSG_TYPE_INFO, "Transport authenticating (public key)",
    {
        {"protocol", getSchemeName(url_.protocol)},
        {"host", url_.host},
        {"user", user},
        {"publicKey", publicKeyFilePath},
        {"privateKey", privateKeyFilePath},
    });

    withRetry("login with key", [&]
    {
        backend_->loginWithPublicKey(user, publicKeyFilePath, privateKeyFilePath, passphrase.value_or("")); //throw AuthenticationError
    }, OperationSafety::safe);

    username_ = user;
    authenticated_ = true;

    backend_->onAuthenticated();

    logTransport(log_, MSG_TYPE_INFO, "Transport authenticated",
    {
        {"protocol", getSchemeName(url_.protocol)},
        {"host", url_.host},
        {"user", user},
    });
}


void TransportSession::closeConnection()
{
    authenticated_ = false;
    backend_->closeConnection();
}


std::vector<std::string> TransportSession::listFiles(const std::string& remoteDir) //throw XferError
{
    requireAuthenticated("list files"); //throw TransferError

    std::vector<std::string> files = withRetry("list files", [&] { return backend_->listFiles(remoteDir); }, OperationSafety::safe); //throw XferError

    logTransport(log_, MSG_TYPE_INFO, "Transport list files ok",
    {
        {"host", url_.host},
        {"remoteDir", remoteDir},
        {"count", numberTo<std::string>(files.size())},
    });
    return files;
}


void TransportSession::downloadFile(const std::string& remoteFilePath, const std::string& localFilePath) //throw XferError
{
    requireAuthenticated("download file"); //throw TransferError

    if (const std::optional<std::string> parentPath = getParentFolderPath(localFilePath))
    {
        try
        {
            createDirectoryIfMissingRecursion(*parentPath); //throw FileError
        }
        catch (const FileError& e)
        {
            throw TransferError(replaceCpy("Unable to create local directory %x.", "%x", fmtPath(*parentPath)) + " Details: " + e.toString());
        }
    }

    logTransport(log_, MSG_TYPE_INFO, "Transport download file",
    {
        {"host", url_.host},
        {"remote", remoteFilePath},
        {"local", localFilePath},
    });

    withRetry("download file", [&] { backend_->downloadFile(remoteFilePath, localFilePath); }, OperationSafety::safe); //throw XferError

    logTransport(log_, MSG_TYPE_INFO, "Transport download file ok",
    {
        {"host", url_.host},
        {"remote", remoteFilePath},
        {"local", localFilePath},
    });
}


void TransportSession::uploadFile(const std::string& localFilePath, const std::string& remoteFilePath) //throw XferError
{
    requireAuthenticated("upload file"); //throw TransferError

    const std::string errorMsg = replaceCpy("Local file %x does not exist or is not readable.", "%x", fmtPath(localFilePath));
    try
    {
        if (!itemExists(localFilePath) || !isReadable(localFilePath)) //throw FileError
            throw TransferError(errorMsg);
    }
    catch (const FileError& e) { throw TransferError(errorMsg + " Details: " + e.toString()); }

    logTransport(log_, MSG_TYPE_INFO, "Transport upload file",
    {
        {"host", url_.host},
        {"local", localFilePath},
        {"remote", remoteFilePath},
    });

    withRetry("upload file", [&] { backend_->uploadFile(localFilePath, remoteFilePath); }, OperationSafety::unsafe); //throw XferError

    logTransport(log_, MSG_TYPE_INFO, "Transport upload file ok",
    {
        {"host", url_.host},
        {"local", localFilePath},
        {"remote", remoteFilePath},
    });
}


bool TransportSession::isDirectory(const std::string& remotePath) //throw XferError
{
    requireAuthenticated("check directory"); //throw TransferError

    return withRetry("check directory", [&] { return backend_->isDirectory(remotePath); }, OperationSafety::safe); //throw XferError
}


void TransportSession::deleteFile(const std::string& remoteFilePath) //throw XferError
{
    requireAuthenticated("delete file"); //throw TransferError

    logTransport(log_, MSG_TYPE_INFO, "Transport delete file", {{"host", url_.host}, {"remote", remoteFilePath}});

    withRetry("delete file", [&] { backend_->deleteFile(remoteFilePath); }, OperationSafety::unsafe); //throw XferError

    logTransport(log_, MSG_TYPE_INFO, "Transport delete file ok", {{"host", url_.host}, {"remote", remoteFilePath}});
}


void TransportSession::makeDirectory(const std::string& remoteDir, bool recursive) //throw XferError
{
    requireAuthenticated("make directory"); //throw TransferError

    logTransport(log_, MSG_TYPE_INFO, "Transport make directory",
    {
        {"host", url_.host},
        {"remoteDir", remoteDir},
        {"recursive", formatLogFlag(recursive)},
    });

    withRetry("make directory", [&] { backend_->makeDirectory(remoteDir, recursive); }, OperationSafety::unsafe); //throw XferError

    logTransport(log_, MSG_TYPE_INFO, "Transport make directory ok", {{"host", url_.host}, {"remoteDir", remoteDir}});
}


void TransportSession::removeDirectory(const std::string& remoteDir) //throw XferError
{
    requireAuthenticated("remove directory"); //throw TransferError

    logTransport(log_, MSG_TYPE_INFO, "Transport remove directory", {{"host", url_.host}, {"remoteDir", remoteDir}});

    withRetry("remove directory", [&] { backend_->removeDirectory(remoteDir); }, OperationSafety::unsafe); //throw XferError

    logTransport(log_, MSG_TYPE_INFO, "Transport remove directory ok", {{"host", url_.host}, {"remoteDir", remoteDir}});
}


void TransportSession::removeDirectoryRecursive(const std::string& remoteDir) //throw XferError
{
    requireAuthenticated("remove directory recursively"); //throw TransferError

    const std::string_view dirTrm = trimCpy(remoteDir);
    if (dirTrm.empty() || dirTrm == "." || dirTrm == ".." || dirTrm == "/")
        throw TransferError("Refusing to remove directory recursively: invalid or unsafe target.");

    logTransport(log_, MSG_TYPE_WARNING, "Transport remove directory recursively", {{"host", url_.host}, {"remoteDir", remoteDir}});

    withRetry("remove directory recursively", [&] { backend_->removeDirectoryRecursive(remoteDir); }, OperationSafety::unsafe); //throw XferError

    logTransport(log_, MSG_TYPE_WARNING, "Transport remove directory recursively ok", {{"host", url_.host}, {"remoteDir", remoteDir}});
}


void TransportSession::rename(const std::string& pathFrom, const std::string& pathTo) //throw XferError
{
    requireAuthenticated("rename"); //throw TransferError

    logTransport(log_, MSG_TYPE_INFO, "Transport rename", {{"host", url_.host}, {"from", pathFrom}, {"to", pathTo}});

    withRetry("rename", [&] { backend_->rename(pathFrom, pathTo); }, OperationSafety::unsafe); //throw XferError

    logTransport(log_, MSG_TYPE_INFO, "Transport rename ok", {{"host", url_.host}, {"from", pathFrom}, {"to", pathTo}});
}


std::optional<int64_t> TransportSession::getSize(const std::string& remoteFilePath) //throw XferError
{
    requireAuthenticated("get size"); //throw TransferError

    return withRetry("get size", [&] { return backend_->getSize(remoteFilePath); }, OperationSafety::safe); //throw XferError
}


std::optional<time_t> TransportSession::getModTime(const std::string& remoteFilePath) //throw XferError
{
    requireAuthenticated("get mtime"); //throw TransferError

    return withRetry("get mtime", [&] { return backend_->getModTime(remoteFilePath); }, OperationSafety::safe); //throw XferError
}


void TransportSession::chmod(const std::string& remotePath, int mode) //throw XferError
{
    requireAuthenticated("chmod"); //throw TransferError

    const std::string modeOctal = [&]
    {
        std::string str;
        for (int i = 0; i < 4; ++i)
            str.insert(str.begin(), static_cast<char>('0' + ((mode >> (3 * i)) & 7)));
        return str;
    }();

    logTransport(log_, MSG_TYPE_INFO, "Transport chmod", {{"host", url_.host}, {"remote", remotePath}, {"mode", modeOctal}});

    withRetry("chmod", [&] { backend_->chmod(remotePath, mode); }, OperationSafety::unsafe); //throw XferError

    logTransport(log_, MSG_TYPE_INFO, "Transport chmod ok", {{"host", url_.host}, {"remote", remotePath}, {"mode", modeOctal}});
}


std::vector<std::string> TransportSession::rawList(const std::string& remoteDir, bool recursive) //throw XferError
{
    if (!backend_->supportsFtpListings())
        throw MissingCapabilityError("Raw directory listings are available for FTP/FTPS only.");

    requireAuthenticated("raw list"); //throw TransferError

    return withRetry("raw list", [&] { return backend_->rawList(remoteDir, recursive); }, OperationSafety::safe); //throw XferError
}


std::vector<FtpFacts> TransportSession::mlsd(const std::string& remoteDir) //throw XferError
{
    if (!backend_->supportsFtpListings())
        throw MissingCapabilityError("MLSD listings are available for FTP/FTPS only.");

    requireAuthenticated("mlsd"); //throw TransferError

    return withRetry("mlsd", [&] { return backend_->mlsd(remoteDir); }, OperationSafety::safe); //throw XferError
}
