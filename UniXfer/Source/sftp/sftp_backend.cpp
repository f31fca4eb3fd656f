// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "sftp_backend.h"
#include <vector>
#include <zen/file_io.h>
#include <zen/scope_guard.h>
#include <zen/string_tools.h>
#include "../base/host_key.h"
#include "../base/remote_path.h"
#include "../base/transport_log.h"

using namespace zen;
using namespace uxf;


namespace
{
const size_t SFTP_COPY_BLOCK_SIZE = 64 * 1024;
const int SFTP_DIRECTORY_MODE = 0775;


bool isDotEntry(const std::string& itemName) { return itemName == "." || itemName == ".."; }
}


SecureShellTransportBackend::SecureShellTransportBackend(const UrlDescriptor& url, const ConnectionOptions& options,
                                                         const std::shared_ptr<SshConnector>& connector, zen::ErrorLog* log) :
    url_(url),
    options_(options),
    connector_(connector),
    log_(log) {}


SshConnection& SecureShellTransportBackend::getConnection() //throw TransferError
{
    if (!conn_)
        throw TransferError(replaceCpy("Connection to %x has not been established yet.", "%x", fmtHost(url_.host)));
    return *conn_;
}


SftpChannel& SecureShellTransportBackend::requireSftp() //throw ConnectionError, TransferError
{
    SshConnection& conn = getConnection(); //throw TransferError

    const std::optional<SftpChannel*> sftp = diag_.tryRun([&] { return &conn.getSftpChannel(); }); //throw SysError
    if (!sftp)
        throw ConnectionError("Failed to initialize SFTP subsystem." + diag_.formatLastDiagnostic());
    return **sftp;
}


std::string SecureShellTransportBackend::normalizeRemotePath(const std::string& remotePath) const
{
    const std::string_view pathTrm = trimCpy(remotePath);

    if (pathTrm.empty() || pathTrm == ".")
        return url_.basePath;

    if (startsWith(pathTrm, REMOTE_PATH_SEPARATOR))
        return std::string(pathTrm);

    return joinRemote(url_.basePath, std::string(pathTrm));
}


std::optional<SftpAttributes> SecureShellTransportBackend::tryStat(SftpChannel& sftp, const std::string& fullPath)
{
    return diag_.tryRun([&] { return sftp.stat(fullPath); }); //throw SysError
}


void SecureShellTransportBackend::connect() //throw ConnectionError
{
    conn_.reset(); //replace existing connection

    const HostKeyPolicy& hostKey = options_.getHostKeyPolicy();

    std::optional<std::unique_ptr<SshConnection>> conn = diag_.tryRun([&]
    {
        return connector_->connect(url_.host, url_.getEffectivePort(), hostKey.algorithm, options_.getTimeoutSec()); //throw SysError
    });

    if (!conn || !*conn)
    {
        logTransport(log_, MSG_TYPE_ERROR, "SFTP transport connection failed",
        {
            {"host", url_.host},
            {"port", numberTo<std::string>(url_.getEffectivePort())},
            {"hostKeyAlgo", hostKey.algorithm},
            {"details", diag_.getLastDiagnostic() ? *diag_.getLastDiagnostic() : ""},
        });
        throw ConnectionError(replaceCpy("Unable to connect to server %x (SFTP).", "%x", fmtHost(url_.host)) + diag_.formatLastDiagnostic());
    }
    conn_ = std::move(*conn);

    verifyHostKey(); //throw ConnectionError
}


void SecureShellTransportBackend::verifyHostKey() //throw ConnectionError
{
    //a connection failing verification must not be used
    ZEN_ON_SCOPE_FAIL(conn_.reset());

    const HostKeyPolicy& hostKey = options_.getHostKeyPolicy();

    const std::optional<HostKeyExpectation> expected = parseExpectedFingerprint(hostKey.expectedFingerprint, url_.host); //throw ConnectionError
    if (!expected)
    {
        if (hostKey.strictChecking)
            throw ConnectionError(replaceCpy("Strict host key checking is enabled but no expected fingerprint is configured for %x.", "%x", fmtHost(url_.host)));
        return;
    }

    SshConnection& conn = *conn_;

    const std::optional<std::string> fingerprint = diag_.tryRun([&] { return conn.getFingerprintHex(expected->algorithm); }); //throw SysError
    if (!fingerprint)
        throw ConnectionError(replaceCpy("Unable to retrieve server host key fingerprint for %x.", "%x", fmtHost(url_.host)) + diag_.formatLastDiagnostic());

    const std::string serverFingerprint = normalizeHexFingerprint(*fingerprint);
    if (serverFingerprint.empty())
        throw ConnectionError(replaceCpy("Unable to retrieve server host key fingerprint for %x (empty value).", "%x", fmtHost(url_.host)) +
                              diag_.formatLastDiagnostic());

    logTransport(log_, MSG_TYPE_INFO, "SFTP transport server fingerprint retrieved",
    {
        {"host", url_.host},
        {"port", numberTo<std::string>(url_.getEffectivePort())},
        {"fingerprintAlgo", getFingerprintAlgorithmName(expected->algorithm)},
        {"fingerprint", truncateFingerprint(serverFingerprint)},
    });

    if (!fingerprintMatches(*expected, serverFingerprint))
        throw ConnectionError(replaceCpy(replaceCpy("SFTP host key fingerprint mismatch for %x (%y).",
                                                    "%x", fmtHost(url_.host)),
                                         "%y", getFingerprintAlgorithmName(expected->algorithm)));
}


void SecureShellTransportBackend::loginWithPassword(const std::string& username, const std::string& password) //throw AuthenticationError
{
    if (!conn_)
        throw AuthenticationError("Cannot login: connection not established yet.");
    SshConnection& conn = *conn_;

    if (!diag_.tryRun([&] { conn.authPassword(username, password); })) //throw SysError
    {
        logTransport(log_, MSG_TYPE_WARNING, "SFTP transport authentication failed",
        {
            {"host", url_.host},
            {"user", username},
        });
        throw AuthenticationError(replaceCpy(replaceCpy("Login failed on %x for user %y.", "%x", fmtHost(url_.host)), "%y", fmtPath(username)) +
                                  diag_.formatLastDiagnostic());
    }
}


void SecureShellTransportBackend::loginWithPublicKey(const std::string& username,
                                                     const std::string& publicKeyFilePath,
                                                     const std::string& privateKeyFilePath,
                                                     const std::string& passphrase) //throw AuthenticationError
{
    if (!conn_)
        throw AuthenticationError("Cannot login: connection not established yet.");
    SshConnection& conn = *conn_;

    if (!diag_.tryRun([&] { conn.authPublicKey(username, publicKeyFilePath, privateKeyFilePath, passphrase); })) //throw SysError
    {
        logTransport(log_, MSG_TYPE_WARNING, "SFTP transport public key authentication failed",
        {
            {"host", url_.host},
            {"user", username},
        });
        throw AuthenticationError(replaceCpy(replaceCpy("Public key authentication failed for user %x on host %y.", "%x", fmtPath(username)), "%y", fmtHost(url_.host)) +
                                  diag_.formatLastDiagnostic());
    }
}


void SecureShellTransportBackend::closeConnection()
{
    if (!conn_)
        return;

    logTransport(log_, MSG_TYPE_INFO, "SFTP transport closing connection",
    {
        {"host", url_.host},
        {"port", numberTo<std::string>(url_.getEffectivePort())},
    });
    conn_.reset(); //disconnect + free
}


std::vector<std::string> SecureShellTransportBackend::listDirectory(const std::string& remoteDir, bool skipHidden) //throw XferError
{
    SftpChannel& sftp = requireSftp(); //throw ConnectionError, TransferError

    std::string dirPath = rtrimSeparator(normalizeRemotePath(remoteDir));
    if (dirPath.empty())
        dirPath = REMOTE_PATH_SEPARATOR;

    std::optional<std::unique_ptr<SftpDirectory>> dir = diag_.tryRun([&] { return sftp.openDirectory(dirPath); }); //throw SysError
    if (!dir || !*dir)
        throw TransferError(replaceCpy(replaceCpy("Unable to open remote directory %x on %y.", "%x", fmtPath(dirPath)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
    SftpDirectory& dirHandle = **dir;

    std::vector<std::string> itemNames;
    for (;;)
    {
        const std::optional<std::optional<std::string>> itemName = diag_.tryRun([&] { return dirHandle.readEntry(); }); //throw SysError
        if (!itemName)
            throw TransferError(replaceCpy(replaceCpy("Unable to read remote directory %x on %y.", "%x", fmtPath(dirPath)), "%y", fmtHost(url_.host)) +
                                diag_.formatLastDiagnostic());
        if (!*itemName)
            break;

        const std::string& name = **itemName;
        if (name.empty() || isDotEntry(name))
            continue;
        if (skipHidden && startsWith(name, '.'))
            continue;

        itemNames.push_back(name);
    }

    if (!diag_.tryRun([&] { dirHandle.close(); })) //throw SysError
        logTransport(log_, MSG_TYPE_WARNING, "SFTP transport directory close failed",
        {
            {"path", dirPath},
            {"details", *diag_.getLastDiagnostic()},
        });
    return itemNames;
}


std::vector<std::string> SecureShellTransportBackend::listFiles(const std::string& remoteDir) //throw XferError
{
    return listDirectory(remoteDir, true /*skipHidden*/); //throw XferError
}


void SecureShellTransportBackend::downloadFile(const std::string& remoteFilePath, const std::string& localFilePath) //throw XferError
{
    SftpChannel& sftp = requireSftp(); //throw ConnectionError, TransferError
    const std::string remotePath = normalizeRemotePath(remoteFilePath);

    std::optional<std::unique_ptr<SftpFile>> remoteFile = diag_.tryRun([&] { return sftp.openFile(remotePath, SftpOpenMode::read); }); //throw SysError
    if (!remoteFile || !*remoteFile)
        throw TransferError(replaceCpy(replaceCpy("Unable to open remote file %x for reading on %y.", "%x", fmtPath(remotePath)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
    SftpFile& remoteStream = **remoteFile; //closed by destructor on error

    std::optional<FileOutputPlain> localFile;
    try
    {
        localFile.emplace(localFilePath, FileOutputMode::overwrite); //throw FileError
    }
    catch (const FileError& e)
    {
        throw TransferError(replaceCpy("Unable to open local file %x for writing.", "%x", fmtPath(localFilePath)) + " Details: " + e.toString());
    }

    if (const std::optional<int>& timeoutSec = options_.getTimeoutSec())
        remoteStream.setTimeout(*timeoutSec);

    const std::string errorMsg = replaceCpy(replaceCpy("Download %x from %y failed.", "%x", fmtPath(remotePath)), "%y", fmtHost(url_.host));
    try
    {
        std::vector<std::byte> buffer(SFTP_COPY_BLOCK_SIZE);
        for (;;)
        {
            const size_t bytesRead = remoteStream.tryRead(buffer.data(), buffer.size()); //throw SysError
            if (bytesRead == 0) //EOF
                break;

            for (size_t bytesWritten = 0; bytesWritten < bytesRead;)
                bytesWritten += localFile->tryWrite(buffer.data() + bytesWritten, bytesRead - bytesWritten); //throw FileError
        }
        localFile->close(); //throw FileError
        //an unclosed FileOutputPlain deletes the incomplete file
    }
    catch (const SysError&  e) { throw TransferError(errorMsg + " Details: " + e.toString()); }
    catch (const FileError& e) { throw TransferError(errorMsg + " Details: " + e.toString()); }

    if (!diag_.tryRun([&] { remoteStream.close(); })) //throw SysError
        logTransport(log_, MSG_TYPE_WARNING, "SFTP transport remote file close failed",
        {
            {"path", remotePath},
            {"details", *diag_.getLastDiagnostic()},
        });
}


void SecureShellTransportBackend::uploadFile(const std::string& localFilePath, const std::string& remoteFilePath) //throw XferError
{
    SftpChannel& sftp = requireSftp(); //throw ConnectionError, TransferError
    const std::string remotePath = normalizeRemotePath(remoteFilePath);

    std::optional<FileInputPlain> localFile;
    try
    {
        localFile.emplace(localFilePath); //throw FileError
    }
    catch (const FileError& e)
    {
        throw TransferError(replaceCpy("Unable to open local file %x.", "%x", fmtPath(localFilePath)) + " Details: " + e.toString());
    }

    std::optional<std::unique_ptr<SftpFile>> remoteFile = diag_.tryRun([&] { return sftp.openFile(remotePath, SftpOpenMode::write); }); //throw SysError
    if (!remoteFile || !*remoteFile)
        throw TransferError(replaceCpy(replaceCpy("Unable to open remote file %x for writing on %y.", "%x", fmtPath(remotePath)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
    SftpFile& remoteStream = **remoteFile; //closed by destructor on error

    if (const std::optional<int>& timeoutSec = options_.getTimeoutSec())
        remoteStream.setTimeout(*timeoutSec);

    const std::string errorMsg = replaceCpy(replaceCpy("Upload %x to %y failed.", "%x", fmtPath(localFilePath)), "%y", fmtPath(remotePath));
    try
    {
        std::vector<std::byte> buffer(SFTP_COPY_BLOCK_SIZE);
        for (;;)
        {
            const size_t bytesRead = localFile->tryRead(buffer.data(), buffer.size()); //throw FileError
            if (bytesRead == 0) //EOF
                break;

            for (size_t bytesWritten = 0; bytesWritten < bytesRead;)
                bytesWritten += remoteStream.tryWrite(buffer.data() + bytesWritten, bytesRead - bytesWritten); //throw SysError
        }
        remoteStream.close(); //throw SysError: flushes pending writes
    }
    catch (const SysError&  e) { throw TransferError(errorMsg + " Details: " + e.toString()); }
    catch (const FileError& e) { throw TransferError(errorMsg + " Details: " + e.toString()); }
}


bool SecureShellTransportBackend::isDirectory(const std::string& remotePath) //throw XferError
{
    SftpChannel& sftp = requireSftp(); //throw ConnectionError, TransferError

    const std::optional<SftpAttributes> attr = tryStat(sftp, normalizeRemotePath(remotePath));
    return attr && attr->mode && isDirectoryMode(*attr->mode);
}


void SecureShellTransportBackend::deleteFile(const std::string& remoteFilePath) //throw XferError
{
    SftpChannel& sftp = requireSftp(); //throw ConnectionError, TransferError
    const std::string fullPath = normalizeRemotePath(remoteFilePath);

    if (!diag_.tryRun([&] { sftp.unlink(fullPath); })) //throw SysError
        throw TransferError(replaceCpy(replaceCpy("Unable to delete %x on %y.", "%x", fmtPath(fullPath)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
}


void SecureShellTransportBackend::makeDirectory(const std::string& remoteDir, bool recursive) //throw XferError
{
    SftpChannel& sftp = requireSftp(); //throw ConnectionError, TransferError

    const std::string_view dirTrm = trimCpy(remoteDir);
    if (dirTrm.empty() || dirTrm == ".")
        return;

    const std::string fullPath = normalizeRemotePath(remoteDir);
    if (fullPath.empty() || fullPath == "/")
        return;

    const bool isAbsolute = startsWith(fullPath, REMOTE_PATH_SEPARATOR);
    const std::vector<std::string> parts = splitCpy(fullPath, REMOTE_PATH_SEPARATOR, SplitOnEmpty::skip);

    const auto isExistingDir = [&](const std::string& dirPath)
    {
        const std::optional<SftpAttributes> attr = tryStat(sftp, dirPath);
        return attr && attr->mode && isDirectoryMode(*attr->mode);
    };

    std::string currentPath = isAbsolute ? std::string(1, REMOTE_PATH_SEPARATOR) : std::string();
    for (const std::string& part : parts)
    {
        if (currentPath.empty() || currentPath == "/")
            currentPath += part;
        else
            currentPath += REMOTE_PATH_SEPARATOR + part;

        if (isExistingDir(currentPath))
            continue;

        if (!diag_.tryRun([&] { sftp.makeDirectory(currentPath, SFTP_DIRECTORY_MODE); })) //throw SysError
            if (!isExistingDir(currentPath)) //created concurrently?
                throw TransferError(replaceCpy(replaceCpy("Unable to create directory %x on %y.", "%x", fmtPath(currentPath)), "%y", fmtHost(url_.host)) +
                                    diag_.formatLastDiagnostic());
        if (!recursive)
            break;
    }
}


void SecureShellTransportBackend::removeDirectory(const std::string& remoteDir) //throw XferError
{
    SftpChannel& sftp = requireSftp(); //throw ConnectionError, TransferError
    const std::string fullPath = normalizeRemotePath(remoteDir);

    if (!diag_.tryRun([&] { sftp.removeDirectory(fullPath); })) //throw SysError
        throw TransferError(replaceCpy(replaceCpy("Unable to remove directory %x on %y.", "%x", fmtPath(fullPath)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
}


void SecureShellTransportBackend::removeDirectoryRecursive(const std::string& remoteDir) //throw XferError
{
    removeDirectoryRecursiveImpl(remoteDir); //throw XferError
}


void SecureShellTransportBackend::removeDirectoryRecursiveImpl(const std::string& remoteDir) //throw XferError
{
    if (!isDirectory(remoteDir))
        throw TransferError(replaceCpy(replaceCpy("Path %x is not a directory on %y.", "%x", fmtPath(remoteDir)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());

    //hidden items must go too, or the final rmdir fails
    for (const std::string& itemName : listDirectory(remoteDir, false /*skipHidden*/)) //throw XferError
    {
        const std::string childPath = rtrimSeparator(remoteDir) + REMOTE_PATH_SEPARATOR + ltrimSeparator(itemName);

        if (isDirectory(childPath))
            removeDirectoryRecursiveImpl(childPath); //throw XferError
        else
            deleteFile(childPath); //throw XferError
    }

    removeDirectory(remoteDir); //throw XferError
}


void SecureShellTransportBackend::rename(const std::string& pathFrom, const std::string& pathTo) //throw XferError
{
    SftpChannel& sftp = requireSftp(); //throw ConnectionError, TransferError
    const std::string fullPathFrom = normalizeRemotePath(pathFrom);
    const std::string fullPathTo   = normalizeRemotePath(pathTo);

    if (!diag_.tryRun([&] { sftp.rename(fullPathFrom, fullPathTo); })) //throw SysError
        throw TransferError(replaceCpy(replaceCpy(replaceCpy("Unable to rename %x to %y on %z.",
                                                             "%x", fmtPath(fullPathFrom)),
                                                  "%y", fmtPath(fullPathTo)),
                                       "%z", fmtHost(url_.host)) + diag_.formatLastDiagnostic());
}


std::optional<int64_t> SecureShellTransportBackend::getSize(const std::string& remoteFilePath) //throw XferError
{
    SftpChannel& sftp = requireSftp(); //throw ConnectionError, TransferError

    const std::optional<SftpAttributes> attr = tryStat(sftp, normalizeRemotePath(remoteFilePath));
    if (!attr || !attr->size)
        return std::nullopt;
    return static_cast<int64_t>(*attr->size);
}


std::optional<time_t> SecureShellTransportBackend::getModTime(const std::string& remoteFilePath) //throw XferError
{
    SftpChannel& sftp = requireSftp(); //throw ConnectionError, TransferError

    const std::optional<SftpAttributes> attr = tryStat(sftp, normalizeRemotePath(remoteFilePath));
    if (!attr)
        return std::nullopt;
    return attr->modTime;
}


void SecureShellTransportBackend::chmod(const std::string& remotePath, int mode) //throw XferError
{
    SftpChannel& sftp = requireSftp(); //throw ConnectionError, TransferError
    const std::string fullPath = normalizeRemotePath(remotePath);

    if (!diag_.tryRun([&] { sftp.chmod(fullPath, mode); })) //throw SysError
        throw TransferError(replaceCpy(replaceCpy("Unable to chmod %x on %y.", "%x", fmtPath(fullPath)), "%y", fmtHost(url_.host)) +
                            diag_.formatLastDiagnostic());
}


std::vector<std::string> SecureShellTransportBackend::rawList(const std::string& /*remoteDir*/, bool /*recursive*/) //throw MissingCapabilityError
{
    throw MissingCapabilityError("Raw directory listings are available for FTP/FTPS only.");
}


std::vector<FtpFacts> SecureShellTransportBackend::mlsd(const std::string& /*remoteDir*/) //throw MissingCapabilityError
{
    throw MissingCapabilityError("MLSD listings are available for FTP/FTPS only.");
}
