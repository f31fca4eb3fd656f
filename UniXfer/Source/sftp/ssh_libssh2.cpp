// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "ssh_libssh2.h"
#include <array>
#include <stdexcept>
#include <zen/extra_log.h>
#include <zen/file_io.h>
#include <zen/scope_guard.h>
#include <zen/socket.h>
#include <zen/string_tools.h>
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2_sftp.h> directly!

using namespace zen;
using namespace uxf;


namespace
{
const int DEFAULT_CONNECT_TIMEOUT_SEC = 30; //TCP connect only: no timeout for SSH round-trips unless configured


std::string formatLastSshError(const char* functionName, LIBSSH2_SESSION* sshSession, LIBSSH2_SFTP* sftpChannel /*optional*/)
{
    char* lastErrorMsg = nullptr; //owned by "sshSession"
    const int sshStatusCode = ::libssh2_session_last_error(sshSession, &lastErrorMsg, nullptr, false /*want_buf*/);

    std::string errorMsg;
    if (lastErrorMsg)
        errorMsg = trimCpy(lastErrorMsg);

    //LIBSSH2_ERROR_SFTP_PROTOCOL does *not* mean libssh2_sftp_last_error() is also available!
    //But if it's not, we have a broken connection, and lastErrorMsg contains meaningful details!
    if (sftpChannel && sshStatusCode == LIBSSH2_ERROR_SFTP_PROTOCOL && ::libssh2_sftp_last_error(sftpChannel) != LIBSSH2_FX_OK)
    {
        if (errorMsg == "SFTP Protocol Error") //that's trite!
            errorMsg.clear();
        return formatSystemError(functionName, formatSftpStatusCode(::libssh2_sftp_last_error(sftpChannel)), errorMsg);
    }

    return formatSystemError(functionName, formatSshStatusCode(sshStatusCode), errorMsg);
}


void setSessionTimeout(LIBSSH2_SESSION* sshSession, std::optional<int> timeoutSec)
{
    ::libssh2_session_set_timeout(sshSession, timeoutSec ? static_cast<long>(*timeoutSec) * 1000 /*ms*/ : 0 /*no timeout*/);
}


class Libssh2Directory : public SftpDirectory
{
public:
    Libssh2Directory(LIBSSH2_SESSION* sshSession, LIBSSH2_SFTP* sftpChannel, LIBSSH2_SFTP_HANDLE* dirHandle, const std::string& dirPath) :
        sshSession_(sshSession), sftpChannel_(sftpChannel), dirHandle_(dirHandle), dirPath_(dirPath) {}

    ~Libssh2Directory()
    {
        if (dirHandle_)
            try
            {
                close(); //throw SysError
            }
            catch (const SysError& e) { logExtraError("Cannot close directory " + fmtPath(dirPath_) + ".\n\n" + e.toString()); }
    }

    std::optional<std::string> readEntry() override //throw SysError
    {
        std::array<char, 1024> buf; //in practice NAME_MAX(255)+1 should suffice
        LIBSSH2_SFTP_ATTRIBUTES attribs = {};

        const int rc = ::libssh2_sftp_readdir(dirHandle_, buf.data(), buf.size(), &attribs);
        if (rc < 0)
            throw SysError(formatLastSshError("libssh2_sftp_readdir", sshSession_, sftpChannel_));

        if (rc == 0) //no more items
            return std::nullopt;

        return std::string(buf.data(), rc);
    }

    void close() override //throw SysError
    {
        if (!dirHandle_)
            throw SysError("Contract error: close() called more than once.");

        const int rc = ::libssh2_sftp_closedir(dirHandle_);
        dirHandle_ = nullptr; //handle is freed even on error
        if (rc != 0)
            throw SysError(formatLastSshError("libssh2_sftp_closedir", sshSession_, sftpChannel_));
    }

private:
    Libssh2Directory           (const Libssh2Directory&) = delete;
    Libssh2Directory& operator=(const Libssh2Directory&) = delete;

    LIBSSH2_SESSION* const sshSession_;
    LIBSSH2_SFTP* const sftpChannel_;
    LIBSSH2_SFTP_HANDLE* dirHandle_;
    const std::string dirPath_;
};


class Libssh2File : public SftpFile
{
public:
    Libssh2File(LIBSSH2_SESSION* sshSession, LIBSSH2_SFTP* sftpChannel, LIBSSH2_SFTP_HANDLE* fileHandle, const std::string& filePath) :
        sshSession_(sshSession), sftpChannel_(sftpChannel), fileHandle_(fileHandle), filePath_(filePath) {}

    ~Libssh2File()
    {
        if (fileHandle_)
            try
            {
                close(); //throw SysError
            }
            catch (const SysError& e) { logExtraError("Cannot close file " + fmtPath(filePath_) + ".\n\n" + e.toString()); }
    }

    //libssh2's timeout is per session: affects all further round-trips of this connection
    void setTimeout(int timeoutSec) override { setSessionTimeout(sshSession_, timeoutSec); }

    size_t tryRead(void* buffer, size_t bytesToRead) override //throw SysError
    {
        //libssh2_sftp_read has same semantics as Posix read:
        if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        const ssize_t bytesRead = ::libssh2_sftp_read(fileHandle_, static_cast<char*>(buffer), bytesToRead);
        if (bytesRead < 0)
            throw SysError(formatLastSshError("libssh2_sftp_read", sshSession_, sftpChannel_));

        ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead); //better safe than sorry
        return bytesRead; //"zero indicates end of file"
    }

    size_t tryWrite(const void* buffer, size_t bytesToWrite) override //throw SysError
    {
        if (bytesToWrite == 0)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        const ssize_t bytesWritten = ::libssh2_sftp_write(fileHandle_, static_cast<const char*>(buffer), bytesToWrite);
        if (bytesWritten < 0)
            throw SysError(formatLastSshError("libssh2_sftp_write", sshSession_, sftpChannel_));

        ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite); //better safe than sorry
        return bytesWritten;
    }

    void close() override //throw SysError
    {
        if (!fileHandle_)
            throw SysError("Contract error: close() called more than once.");

        const int rc = ::libssh2_sftp_close(fileHandle_);
        fileHandle_ = nullptr; //handle is freed even on error
        if (rc != 0)
            throw SysError(formatLastSshError("libssh2_sftp_close", sshSession_, sftpChannel_));
    }

private:
    Libssh2File           (const Libssh2File&) = delete;
    Libssh2File& operator=(const Libssh2File&) = delete;

    LIBSSH2_SESSION* const sshSession_;
    LIBSSH2_SFTP* const sftpChannel_;
    LIBSSH2_SFTP_HANDLE* fileHandle_;
    const std::string filePath_;
};


class Libssh2Channel : public SftpChannel
{
public:
    Libssh2Channel(LIBSSH2_SESSION* sshSession, LIBSSH2_SFTP* sftpChannel) : sshSession_(sshSession), sftpChannel_(sftpChannel) {}

    ~Libssh2Channel()
    {
        if (::libssh2_sftp_shutdown(sftpChannel_) != LIBSSH2_ERROR_NONE)
            logExtraError(formatLastSshError("libssh2_sftp_shutdown", sshSession_, nullptr));
    }

    SftpAttributes stat(const std::string& remotePath) override //throw SysError
    {
        LIBSSH2_SFTP_ATTRIBUTES attribs = {};
        if (::libssh2_sftp_stat(sftpChannel_, remotePath, &attribs) != 0)
            throw SysError(formatLastSshError("libssh2_sftp_stat", sshSession_, sftpChannel_));

        SftpAttributes output;
        if (attribs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
            output.mode = static_cast<uint32_t>(attribs.permissions);
        if (attribs.flags & LIBSSH2_SFTP_ATTR_SIZE)
            output.size = attribs.filesize;
        if (attribs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
            output.modTime = static_cast<time_t>(attribs.mtime);
        return output;
    }

    void makeDirectory(const std::string& remotePath, int mode) override //throw SysError
    {
        if (::libssh2_sftp_mkdir(sftpChannel_, remotePath, mode) != 0)
            throw SysError(formatLastSshError("libssh2_sftp_mkdir", sshSession_, sftpChannel_));
    }

    void removeDirectory(const std::string& remotePath) override //throw SysError
    {
        if (::libssh2_sftp_rmdir(sftpChannel_, remotePath) != 0)
            throw SysError(formatLastSshError("libssh2_sftp_rmdir", sshSession_, sftpChannel_));
    }

    void unlink(const std::string& remotePath) override //throw SysError
    {
        if (::libssh2_sftp_unlink(sftpChannel_, remotePath) != 0)
            throw SysError(formatLastSshError("libssh2_sftp_unlink", sshSession_, sftpChannel_));
    }

    void rename(const std::string& pathFrom, const std::string& pathTo) override //throw SysError
    {
        if (::libssh2_sftp_rename(sftpChannel_, pathFrom, pathTo, LIBSSH2_SFTP_RENAME_OVERWRITE | LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE) != 0)
            throw SysError(formatLastSshError("libssh2_sftp_rename", sshSession_, sftpChannel_));
    }

    void chmod(const std::string& remotePath, int mode) override //throw SysError
    {
        LIBSSH2_SFTP_ATTRIBUTES attribs = {};
        attribs.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
        attribs.permissions = static_cast<unsigned long>(mode);

        if (::libssh2_sftp_setstat(sftpChannel_, remotePath, &attribs) != 0)
            throw SysError(formatLastSshError("libssh2_sftp_setstat", sshSession_, sftpChannel_));
    }

    std::unique_ptr<SftpDirectory> openDirectory(const std::string& remotePath) override //throw SysError
    {
        LIBSSH2_SFTP_HANDLE* dirHandle = ::libssh2_sftp_opendir(sftpChannel_, remotePath);
        if (!dirHandle)
            throw SysError(formatLastSshError("libssh2_sftp_opendir", sshSession_, sftpChannel_));

        return std::make_unique<Libssh2Directory>(sshSession_, sftpChannel_, dirHandle, remotePath);
    }

    std::unique_ptr<SftpFile> openFile(const std::string& remotePath, SftpOpenMode mode) override //throw SysError
    {
        LIBSSH2_SFTP_HANDLE* fileHandle = nullptr;
        switch (mode)
        {
            case SftpOpenMode::read:
                fileHandle = ::libssh2_sftp_open(sftpChannel_, remotePath, LIBSSH2_FXF_READ, 0);
                break;
            case SftpOpenMode::write:
                fileHandle = ::libssh2_sftp_open(sftpChannel_, remotePath, LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                                 LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH); //0644
                break;
        }
        if (!fileHandle)
            throw SysError(formatLastSshError("libssh2_sftp_open", sshSession_, sftpChannel_));

        return std::make_unique<Libssh2File>(sshSession_, sftpChannel_, fileHandle, remotePath);
    }

private:
    Libssh2Channel           (const Libssh2Channel&) = delete;
    Libssh2Channel& operator=(const Libssh2Channel&) = delete;

    LIBSSH2_SESSION* const sshSession_;
    LIBSSH2_SFTP* const sftpChannel_;
};


class Libssh2Connection : public SshConnection
{
public:
    Libssh2Connection(const std::string& server, int port, const std::string& hostKeyAlgorithm, std::optional<int> timeoutSec) : //throw SysError
        timeoutSec_(timeoutSec)
    {
        ZEN_ON_SCOPE_FAIL(cleanup()); //destructor call would lead to member double clean-up!!!

        socket_.emplace(server, numberTo<std::string>(port), timeoutSec.value_or(DEFAULT_CONNECT_TIMEOUT_SEC)); //throw SysError

        sshSession_ = ::libssh2_session_init();
        if (!sshSession_) //does not set ssh last error; source: only memory allocation may fail
            throw SysError(formatSystemError("libssh2_session_init", formatSshStatusCode(LIBSSH2_ERROR_ALLOC), ""));

        ::libssh2_session_set_blocking(sshSession_, 1);
        setSessionTimeout(sshSession_, timeoutSec_);

        if (!hostKeyAlgorithm.empty())
            if (::libssh2_session_method_pref(sshSession_, LIBSSH2_METHOD_HOSTKEY, hostKeyAlgorithm.c_str()) != 0)
                throw SysError(formatLastSshError("libssh2_session_method_pref", sshSession_, nullptr));

        if (::libssh2_session_handshake(sshSession_, socket_->get()) != 0)
            throw SysError(formatLastSshError("libssh2_session_handshake", sshSession_, nullptr));
    }

    ~Libssh2Connection() { cleanup(); }

    std::string getFingerprintHex(FingerprintAlgorithm algo) override //throw SysError
    {
        const auto [hashType, hashLength] = [&]() -> std::pair<int, size_t>
        {
            switch (algo)
            {
                case FingerprintAlgorithm::md5:
                    return {LIBSSH2_HOSTKEY_HASH_MD5, 16};
                case FingerprintAlgorithm::sha1:
                    return {LIBSSH2_HOSTKEY_HASH_SHA1, 20};
            }
            throw SysError("Unsupported fingerprint algorithm.");
        }();

        const char* hostKeyHash = ::libssh2_hostkey_hash(sshSession_, hashType); //owned by "sshSession"
        if (!hostKeyHash) //"NULL if the session has not yet been started up, or the requested hash algorithm was not available"
            throw SysError(formatLastSshError("libssh2_hostkey_hash", sshSession_, nullptr));

        return formatAsHexString(std::string_view(hostKeyHash, hashLength));
    }

    void authPassword(const std::string& username, const std::string& password) override //throw SysError
    {
        if (::libssh2_userauth_password(sshSession_, username, password) != 0)
            throw SysError(formatLastSshError("libssh2_userauth_password", sshSession_, nullptr));
    }

    void authPublicKey(const std::string& username,
                       const std::string& publicKeyFilePath,
                       const std::string& privateKeyFilePath,
                       const std::string& passphrase) override //throw SysError
    {
        std::string publicKeyStream;
        std::string privateKeyStream;
        try
        {
            publicKeyStream  = getFileContent(publicKeyFilePath);  //throw FileError
            privateKeyStream = getFileContent(privateKeyFilePath); //throw FileError
        }
        catch (const FileError& e) { throw SysError(replaceCpy(e.toString(), "\n\n", "\n")); } //errors should be further enriched by context info => SysError

        if (::libssh2_userauth_publickey_frommemory(sshSession_, username, publicKeyStream, privateKeyStream, passphrase) != 0)
            throw SysError(formatLastSshError("libssh2_userauth_publickey_frommemory", sshSession_, nullptr));
    }

    SftpChannel& getSftpChannel() override //throw SysError
    {
        if (!sftpChannel_)
        {
            LIBSSH2_SFTP* sftpChannelNew = ::libssh2_sftp_init(sshSession_);
            if (!sftpChannelNew)
                throw SysError(formatLastSshError("libssh2_sftp_init", sshSession_, nullptr));

            sftpChannel_ = std::make_unique<Libssh2Channel>(sshSession_, sftpChannelNew);
        }
        return *sftpChannel_;
    }

private:
    Libssh2Connection           (const Libssh2Connection&) = delete;
    Libssh2Connection& operator=(const Libssh2Connection&) = delete;

    void cleanup()
    {
        sftpChannel_.reset(); //libssh2_sftp_shutdown

        if (sshSession_)
        {
            if (::libssh2_session_disconnect(sshSession_, "UniXfer says \"bye\"!") != LIBSSH2_ERROR_NONE) //= server notification only! no local cleanup apparently
                logExtraError(formatLastSshError("libssh2_session_disconnect", sshSession_, nullptr));

            if (::libssh2_session_free(sshSession_) != LIBSSH2_ERROR_NONE)
                logExtraError(formatSystemError("libssh2_session_free", "", "Session clean-up failed."));
            sshSession_ = nullptr;
        }
        socket_.reset();
    }

    const std::optional<int> timeoutSec_;
    std::optional<Socket> socket_; //*bound* after constructor has run
    LIBSSH2_SESSION* sshSession_ = nullptr;
    std::unique_ptr<Libssh2Channel> sftpChannel_;
};
}


std::unique_ptr<SshConnection> Libssh2Connector::connect(const std::string& server, int port, const std::string& hostKeyAlgorithm, std::optional<int> timeoutSec) //throw SysError
{
    const std::string serverPlain(trimCpy(server, TrimSide::both, [](char c) { return c == '[' || c == ']'; })); //IPv6 literal
    return std::make_unique<Libssh2Connection>(serverPlain, port, hostKeyAlgorithm, timeoutSec); //throw SysError
}
