// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "ftp_backend.h"
#include <zen/file_error.h>
#include <zen/string_tools.h>
#include "../base/remote_path.h"
#include "../base/transport_log.h"

using namespace zen;
using namespace uxf;


namespace
{
std::string getBaseName(const std::string& path) { return std::string(afterLast(path, REMOTE_PATH_SEPARATOR, IfNotFoundReturn::all)); }
}


FileTransportBackend::FileTransportBackend(const UrlDescriptor& url, const ConnectionOptions& options,
                                           const std::shared_ptr<FtpConnector>& connector, zen::ErrorLog* log) :
    url_(url),
    options_(options),
    connector_(connector),
    log_(log) {}


FtpConnection& FileTransportBackend::getConnection() //throw TransferError
{
    if (!conn_)
        throw TransferError(replaceCpy("Connection to %x has not been established yet.", "%x", fmtHost(url_.host)));
    return *conn_;
}


void FileTransportBackend::connect() //throw ConnectionError
{
    conn_.reset(); //replace existing connection

    std::optional<std::unique_ptr<FtpConnection>> conn = diag_.tryRun([&]
    {
        return connector_->connect(url_.host, url_.getEffectivePort(), url_.protocol == Protocol::ftps, options_.getTimeoutSec()); //throw SysError
    });

    if (!conn || !*conn)
    {
        logTransport(log_, MSG_TYPE_ERROR, "FTP transport connection failed",
        {
            {"protocol", getSchemeName(url_.protocol)},
            {"host", url_.host},
            {"port", numberTo<std::string>(url_.getEffectivePort())},
            {"path", url_.basePath},
            {"details", diag_.getLastDiagnostic() ? *diag_.getLastDiagnostic() : ""},
        });
        throw ConnectionError(replaceCpy("Unable to connect to server %x (FTP family).", "%x", fmtHost(url_.host)) + diag_.formatLastDiagnostic());
    }
    conn_ = std::move(*conn);
}


void FileTransportBackend::loginWithPassword(const std::string& username, const std::string& password) //throw AuthenticationError
{
    if (!conn_)
        throw AuthenticationError("Cannot login: connection not established yet.");
    FtpConnection& conn = *conn_;

    if (!diag_.tryRun([&] { conn.login(username, password); })) //throw SysError
    {
        logTransport(log_, MSG_TYPE_WARNING, "FTP transport authentication failed",
        {
            {"protocol", getSchemeName(url_.protocol)},
            {"host", url_.host},
            {"user", username},
        });
        throw AuthenticationError(replaceCpy(replaceCpy("Login failed on %x for user %y.", "%x", fmtHost(url_.host)), "%y", fmtPath(username)) +
                                  diag_.formatLastDiagnostic());
    }
}


void FileTransportBackend::loginWithPublicKey(const std::string& /*username*/,
                                              const std::string& /*publicKeyFilePath*/,
                                              const std::string& /*privateKeyFilePath*/,
                                              const std::string& /*passphrase*/) //throw MissingCapabilityError
{
    throw MissingCapabilityError("Public key authentication is not supported for FTP/FTPS.");
}


void FileTransportBackend::onAuthenticated()
{
    if (!conn_)
        return;
    FtpConnection& conn = *conn_;

    const auto setPassive = [&](bool passive)
    {
        if (!diag_.tryRun([&] { conn.setPassive(passive); })) //throw SysError
            logTransport(log_, MSG_TYPE_WARNING, "FTP transport passive mode not applied",
            {
                {"host", url_.host},
                {"passive", formatLogFlag(passive)},
                {"details", *diag_.getLastDiagnostic()},
            });
    };

    switch (options_.getPassiveMode())
    {
        case PassiveMode::on:
            setPassive(true);
            return;

        case PassiveMode::off:
            setPassive(false);
            return;

        case PassiveMode::automatic:
            setPassive(true);

            //test the data channel; the listing itself is not needed
            if (!diag_.tryRun([&] { conn.nlist("."); })) //throw SysError
            {
                logTransport(log_, MSG_TYPE_INFO, "FTP transport passive listing failed, using active mode", {{"host", url_.host}});
                setPassive(false);
            }
            return;
    }
}


void FileTransportBackend::closeConnection()
{
    if (!conn_)
        return;

    logTransport(log_, MSG_TYPE_INFO, "FTP transport closing connection",
    {
        {"host", url_.host},
        {"port", numberTo<std::string>(url_.getEffectivePort())},
    });

    if (!diag_.tryRun([&] { conn_->close(); })) //throw SysError
        logTransport(log_, MSG_TYPE_WARNING, "FTP transport close failed",
        {
            {"host", url_.host},
            {"details", *diag_.getLastDiagnostic()},
        });
    conn_.reset();
}


void FileTransportBackend::ensureBaseDirectory() //throw TransferError
{
    FtpConnection& conn = getConnection(); //throw TransferError

    const std::optional<std::string> currentDir = diag_.tryRun([&] { return conn.pwd(); }); //throw SysError
    if (!currentDir || currentDir->empty())
        throw TransferError(replaceCpy("Unable to determine current directory on %x.", "%x", fmtHost(url_.host)) + diag_.formatLastDiagnostic());

    if (rtrimSeparator(*currentDir) != rtrimSeparator(url_.basePath))
        if (!diag_.tryRun([&] { conn.chdir(url_.basePath); })) //throw SysError
            throw TransferError(replaceCpy(replaceCpy("Unable to change directory to %x on %y.", "%x", fmtPath(url_.basePath)), "%y", fmtHost(url_.host)) +
                                diag_.formatLastDiagnostic());
}


std::vector<std::string> FileTransportBackend::listFiles(const std::string& remoteDir) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    FtpConnection& conn = getConnection(); //throw TransferError

    std::optional<std::vector<std::string>> files = diag_.tryRun([&] { return conn.nlist(remoteDir); }); //throw SysError
    if (!files)
    {
        logTransport(log_, MSG_TYPE_WARNING, "FTP transport list files failed",
        {
            {"host", url_.host},
            {"remoteDir", remoteDir},
            {"details", *diag_.getLastDiagnostic()},
        });
        throw TransferError(replaceCpy("Unable to list files on %x.", "%x", fmtHost(url_.host)) + diag_.formatLastDiagnostic());
    }

    std::erase_if(*files, [](const std::string& filePath) { return startsWith(getBaseName(filePath), '.'); });
    return *files;
}


std::vector<std::string> FileTransportBackend::rawList(const std::string& remoteDir, bool recursive) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    FtpConnection& conn = getConnection(); //throw TransferError

    std::optional<std::vector<std::string>> lines = diag_.tryRun([&] { return conn.rawList(remoteDir, recursive); }); //throw SysError
    if (!lines)
        throw TransferError(replaceCpy(replaceCpy("Unable to raw list %x on %y.", "%x", fmtPath(remoteDir)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
    return *lines;
}


std::vector<FtpFacts> FileTransportBackend::mlsd(const std::string& remoteDir) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    FtpConnection& conn = getConnection(); //throw TransferError

    std::optional<std::vector<FtpFacts>> entries = diag_.tryRun([&] { return conn.mlsd(remoteDir); }); //throw SysError
    if (!entries)
        throw TransferError(replaceCpy(replaceCpy("Unable to MLSD %x on %y.", "%x", fmtPath(remoteDir)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
    return *entries;
}


void FileTransportBackend::downloadFile(const std::string& remoteFilePath, const std::string& localFilePath) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    FtpConnection& conn = getConnection(); //throw TransferError

    if (!diag_.tryRun([&] { conn.download(remoteFilePath, localFilePath); })) //throw SysError
        throw TransferError(replaceCpy(replaceCpy("Download %x from %y failed.", "%x", fmtPath(remoteFilePath)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
}


void FileTransportBackend::uploadFile(const std::string& localFilePath, const std::string& remoteFilePath) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    FtpConnection& conn = getConnection(); //throw TransferError

    if (!diag_.tryRun([&] { conn.upload(localFilePath, remoteFilePath); })) //throw SysError
        throw TransferError(replaceCpy(replaceCpy("Upload %x to %y failed.", "%x", fmtPath(localFilePath)), "%y", fmtPath(remoteFilePath)) +
                            diag_.formatLastDiagnostic());
}


bool FileTransportBackend::isDirectory(const std::string& remotePath) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    return isDirectoryImpl(remotePath);
}


bool FileTransportBackend::isDirectoryImpl(const std::string& remotePath)
{
    FtpConnection& conn = getConnection(); //throw TransferError

    const std::optional<std::string> currentDir = diag_.tryRun([&] { return conn.pwd(); }); //throw SysError
    if (!currentDir || currentDir->empty())
        return false;

    if (!diag_.tryRun([&] { conn.chdir(remotePath); })) //throw SysError
        return false;

    if (!diag_.tryRun([&] { conn.chdir(*currentDir); })) //throw SysError
        logTransport(log_, MSG_TYPE_WARNING, "FTP transport working directory not restored",
        {
            {"host", url_.host},
            {"path", *currentDir},
            {"details", *diag_.getLastDiagnostic()},
        });
    return true;
}


void FileTransportBackend::deleteFile(const std::string& remoteFilePath) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    FtpConnection& conn = getConnection(); //throw TransferError

    if (!diag_.tryRun([&] { conn.deleteFile(remoteFilePath); })) //throw SysError
        throw TransferError(replaceCpy(replaceCpy("Unable to delete %x on %y.", "%x", fmtPath(remoteFilePath)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
}


void FileTransportBackend::makeDirectory(const std::string& remoteDir, bool recursive) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    FtpConnection& conn = getConnection(); //throw TransferError

    const std::string_view dirTrm = trimCpy(remoteDir);
    if (dirTrm.empty() || dirTrm == ".")
        return;

    const bool isAbsolute = startsWith(dirTrm, REMOTE_PATH_SEPARATOR);

    const std::vector<std::string> parts = splitCpy(dirTrm, REMOTE_PATH_SEPARATOR, SplitOnEmpty::skip);
    if (parts.empty())
        return;

    const auto throwCreateFailed = [&](const std::string& dirPath)
    {
        throw TransferError(replaceCpy(replaceCpy("Unable to create directory %x on %y.", "%x", fmtPath(dirPath)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
    };

    if (!recursive)
    {
        if (!diag_.tryRun([&] { conn.makeDirectory(remoteDir); })) //throw SysError
            throwCreateFailed(remoteDir);
        return;
    }

    std::string currentPath = isAbsolute ? std::string(1, REMOTE_PATH_SEPARATOR) : std::string();
    for (const std::string& part : parts)
    {
        if (currentPath.empty() || currentPath == "/")
            currentPath += part;
        else
            currentPath += REMOTE_PATH_SEPARATOR + part;

        if (isDirectoryImpl(currentPath))
            continue;

        if (diag_.tryRun([&] { conn.makeDirectory(currentPath); })) //throw SysError
            continue;

        //created concurrently, or the server reports failure for an existing directory?
        if (!isDirectoryImpl(currentPath))
            throwCreateFailed(currentPath);
    }
}


void FileTransportBackend::removeDirectory(const std::string& remoteDir) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    FtpConnection& conn = getConnection(); //throw TransferError

    if (!diag_.tryRun([&] { conn.removeDirectory(remoteDir); })) //throw SysError
        throw TransferError(replaceCpy(replaceCpy("Unable to remove directory %x on %y.", "%x", fmtPath(remoteDir)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
}


void FileTransportBackend::removeDirectoryRecursive(const std::string& remoteDir) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    removeDirectoryRecursiveImpl(std::string(trimCpy(remoteDir))); //throw TransferError
}


void FileTransportBackend::removeDirectoryRecursiveImpl(const std::string& dirPath) //throw TransferError
{
    FtpConnection& conn = getConnection(); //throw TransferError

    if (!isDirectoryImpl(dirPath))
        throw TransferError(replaceCpy(replaceCpy("Path %x is not a directory on %y.", "%x", fmtPath(dirPath)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());

    std::optional<std::vector<std::string>> entries = diag_.tryRun([&] { return conn.nlist(dirPath); }); //throw SysError
    if (!entries)
        throw TransferError(replaceCpy(replaceCpy("Unable to list directory %x on %y.", "%x", fmtPath(dirPath)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());

    std::erase_if(*entries, [](const std::string& entry)
    {
        const std::string& itemName = getBaseName(entry);
        return endsWith(entry, "/.") || endsWith(entry, "/..") || itemName == "." || itemName == "..";
    });

    for (const std::string& entry : *entries)
    {
        //NLST entries may be path-qualified or bare names, depending on the server
        if (isDirectoryImpl(entry))
        {
            removeDirectoryRecursiveImpl(entry); //throw TransferError
            continue;
        }

        if (diag_.tryRun([&] { conn.deleteFile(entry); })) //throw SysError
            continue;

        const std::string joinedPath = rtrimSeparator(dirPath) + REMOTE_PATH_SEPARATOR + ltrimSeparator(entry);

        if (isDirectoryImpl(joinedPath))
        {
            removeDirectoryRecursiveImpl(joinedPath); //throw TransferError
            continue;
        }

        if (!diag_.tryRun([&] { conn.deleteFile(joinedPath); })) //throw SysError
            throw TransferError(replaceCpy(replaceCpy(replaceCpy("Unable to delete %x in %y on %z.",
                                                                 "%x", fmtPath(entry)),
                                                      "%y", fmtPath(dirPath)),
                                           "%z", fmtHost(url_.host)) + diag_.formatLastDiagnostic());
    }

    if (!diag_.tryRun([&] { conn.removeDirectory(dirPath); })) //throw SysError
        throw TransferError(replaceCpy(replaceCpy("Unable to remove directory %x on %y.", "%x", fmtPath(dirPath)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
}


void FileTransportBackend::rename(const std::string& pathFrom, const std::string& pathTo) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    FtpConnection& conn = getConnection(); //throw TransferError

    if (!diag_.tryRun([&] { conn.rename(pathFrom, pathTo); })) //throw SysError
        throw TransferError(replaceCpy(replaceCpy(replaceCpy("Unable to rename %x to %y on %z.",
                                                             "%x", fmtPath(pathFrom)),
                                                  "%y", fmtPath(pathTo)),
                                       "%z", fmtHost(url_.host)) + diag_.formatLastDiagnostic());
}


std::optional<int64_t> FileTransportBackend::getSize(const std::string& remoteFilePath) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    FtpConnection& conn = getConnection(); //throw TransferError

    const std::optional<int64_t> fileSize = diag_.tryRun([&] { return conn.getSize(remoteFilePath); }); //throw SysError
    if (!fileSize || *fileSize < 0)
        return std::nullopt;
    return *fileSize;
}


std::optional<time_t> FileTransportBackend::getModTime(const std::string& remoteFilePath) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    FtpConnection& conn = getConnection(); //throw TransferError

    const std::optional<time_t> modTime = diag_.tryRun([&] { return conn.getModTime(remoteFilePath); }); //throw SysError
    if (!modTime || *modTime < 0)
        return std::nullopt;
    return *modTime;
}


void FileTransportBackend::chmod(const std::string& remotePath, int mode) //throw TransferError
{
    ensureBaseDirectory(); //throw TransferError
    FtpConnection& conn = getConnection(); //throw TransferError

    if (!diag_.tryRun([&] { conn.chmod(remotePath, mode); })) //throw SysError
        throw TransferError(replaceCpy(replaceCpy("Unable to chmod %x on %y.", "%x", fmtPath(remotePath)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
}
