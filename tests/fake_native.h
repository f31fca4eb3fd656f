// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef FAKE_NATIVE_H_4410928375610294
#define FAKE_NATIVE_H_4410928375610294

#include <algorithm>
#include <climits>
#include <cstring>
#include <map>
#include <set>
#include <zen/file_io.h>
#include <zen/string_tools.h>
#include "../UniXfer/Source/ftp/ftp_native.h"
#include "../UniXfer/Source/sftp/ssh_native.h"


namespace uxf::test
{
//in-memory remote file system shared by the fake connectors and the test
struct FakeRemoteFs
{
    std::set<std::string> dirs{"/"};
    std::map<std::string, std::string> files; //absolute path => content
    std::map<std::string, int> modes;         //chmod history

    std::vector<std::string> calls; //"<op> <arg>"
    std::map<std::string, int> failures; //op => number of upcoming calls that fail

    std::string user = "user";
    std::string password = "secret";

    bool mkdirReportsFailure = false; //directory is created, but the server answers with an error

    void failNext(const std::string& op, int count = 1) { failures[op] = count; }
    void failAlways(const std::string& op) { failures[op] = INT_MAX; }

    void record(const std::string& op, const std::string& arg) //throw SysError
    {
        calls.push_back(arg.empty() ? op : op + ' ' + arg);

        if (auto it = failures.find(op);
            it != failures.end() && it->second > 0)
        {
            if (it->second != INT_MAX)
                --it->second;
            throw zen::SysError("Fake failure: " + op + ' ' + arg);
        }
    }

    size_t countCalls(const std::string& op) const
    {
        size_t count = 0;
        for (const std::string& call : calls)
            if (call == op || zen::startsWith(call, op + ' '))
                ++count;
        return count;
    }

    bool hasCall(const std::string& call) const { return std::find(calls.begin(), calls.end(), call) != calls.end(); }

    static std::string resolve(const std::string& cwd, const std::string& path)
    {
        const std::string fullPath = zen::startsWith(path, '/') ? path : cwd + '/' + path;

        std::vector<std::string> parts;
        for (const std::string& part : zen::splitCpy(fullPath, '/', zen::SplitOnEmpty::skip))
            if (part == "..")
            {
                if (!parts.empty())
                    parts.pop_back();
            }
            else if (part != ".")
                parts.push_back(part);

        std::string out;
        for (const std::string& part : parts)
            out += '/' + part;
        return out.empty() ? "/" : out;
    }

    static std::string getParent(const std::string& absPath)
    {
        const size_t pos = absPath.rfind('/');
        return pos == 0 || pos == std::string::npos ? "/" : absPath.substr(0, pos);
    }

    //direct children: item names
    std::vector<std::string> getChildren(const std::string& absDir) const
    {
        std::vector<std::string> names;
        for (const std::string& dir : dirs)
            if (dir != "/" && getParent(dir) == absDir)
                names.push_back(std::string(zen::afterLast(dir, '/', zen::IfNotFoundReturn::all)));
        for (const auto& [filePath, content] : files)
            if (getParent(filePath) == absDir)
                names.push_back(std::string(zen::afterLast(filePath, '/', zen::IfNotFoundReturn::all)));
        return names;
    }

    void addFile(const std::string& absPath, const std::string& content)
    {
        for (std::string dir = getParent(absPath); dir != "/"; dir = getParent(dir))
            dirs.insert(dir);
        files[absPath] = content;
    }

    void addDir(const std::string& absPath)
    {
        for (std::string dir = absPath; dir != "/"; dir = getParent(dir))
            dirs.insert(dir);
    }
};

//----------------------------------------------------------------------------------------------------------------

class FakeFtpConnection : public FtpConnection
{
public:
    explicit FakeFtpConnection(const std::shared_ptr<FakeRemoteFs>& fs) : fs_(fs) {}

    void login(const std::string& username, const std::string& password) override
    {
        fs_->record("login", username);
        if (username != fs_->user || password != fs_->password)
            throw zen::SysError("530 Login incorrect.");
    }

    void setPassive(bool passive) override
    {
        fs_->record("passive", passive ? "on" : "off");
        passive_ = passive;
    }

    std::string pwd() override
    {
        fs_->record("pwd", "");
        return cwd;
    }

    void chdir(const std::string& dirPath) override
    {
        fs_->record("cwd", dirPath);
        const std::string absPath = FakeRemoteFs::resolve(cwd, dirPath);
        if (!fs_->dirs.contains(absPath))
            throw zen::SysError("550 " + dirPath + ": No such directory.");
        cwd = absPath;
    }

    std::vector<std::string> nlist(const std::string& dirPath) override
    {
        fs_->record("nlist", dirPath);
        if (passive_ && !passiveWorks)
            throw zen::SysError("425 Can't open data connection.");

        const std::string absPath = FakeRemoteFs::resolve(cwd, dirPath);
        if (!fs_->dirs.contains(absPath))
            throw zen::SysError("550 " + dirPath + ": No such directory.");

        std::vector<std::string> names = fs_->getChildren(absPath);
        if (qualifiedNames)
            for (std::string& name : names)
                name = std::string(zen::trimCpy(dirPath, zen::TrimSide::right, [](char c) { return c == '/'; })) + '/' + name;
        return names;
    }

    std::vector<std::string> rawList(const std::string& dirPath, bool recursive) override
    {
        fs_->record("list", recursive ? "-R " + dirPath : dirPath);
        std::vector<std::string> lines;
        for (const std::string& name : fs_->getChildren(FakeRemoteFs::resolve(cwd, dirPath)))
            lines.push_back("-rw-r--r-- 1 owner group 0 Jan 01 00:00 " + name);
        return lines;
    }

    std::vector<FtpFacts> mlsd(const std::string& dirPath) override
    {
        fs_->record("mlsd", dirPath);
        const std::string absPath = FakeRemoteFs::resolve(cwd, dirPath);
        std::vector<FtpFacts> entries;
        for (const std::string& name : fs_->getChildren(absPath))
            entries.push_back({{"name", name}, {"type", fs_->dirs.contains(absPath + '/' + name) ? "dir" : "file"}});
        return entries;
    }

    void download(const std::string& remotePath, const std::string& localFilePath) override
    {
        fs_->record("retr", remotePath);
        auto it = fs_->files.find(FakeRemoteFs::resolve(cwd, remotePath));
        if (it == fs_->files.end())
            throw zen::SysError("550 " + remotePath + ": No such file.");
        try { zen::setFileContent(localFilePath, it->second); }
        catch (const zen::FileError& e) { throw zen::SysError(e.toString()); }
    }

    void upload(const std::string& localFilePath, const std::string& remotePath) override
    {
        fs_->record("stor", remotePath);
        try { fs_->files[FakeRemoteFs::resolve(cwd, remotePath)] = zen::getFileContent(localFilePath); }
        catch (const zen::FileError& e) { throw zen::SysError(e.toString()); }
    }

    void deleteFile(const std::string& filePath) override
    {
        fs_->record("dele", filePath);
        if (fs_->files.erase(FakeRemoteFs::resolve(cwd, filePath)) == 0)
            throw zen::SysError("550 " + filePath + ": No such file.");
    }

    void makeDirectory(const std::string& dirPath) override
    {
        fs_->record("mkd", dirPath);
        const std::string absPath = FakeRemoteFs::resolve(cwd, dirPath);
        if (fs_->dirs.contains(absPath) || fs_->files.contains(absPath) || !fs_->dirs.contains(FakeRemoteFs::getParent(absPath)))
            throw zen::SysError("550 " + dirPath + ": Cannot create directory.");
        fs_->dirs.insert(absPath);
        if (fs_->mkdirReportsFailure)
            throw zen::SysError("550 " + dirPath + ": Cannot create directory.");
    }

    void removeDirectory(const std::string& dirPath) override
    {
        fs_->record("rmd", dirPath);
        const std::string absPath = FakeRemoteFs::resolve(cwd, dirPath);
        if (!fs_->dirs.contains(absPath) || !fs_->getChildren(absPath).empty())
            throw zen::SysError("550 " + dirPath + ": Cannot remove directory.");
        fs_->dirs.erase(absPath);
    }

    void rename(const std::string& pathFrom, const std::string& pathTo) override
    {
        fs_->record("rename", pathFrom + " -> " + pathTo);
        auto it = fs_->files.find(FakeRemoteFs::resolve(cwd, pathFrom));
        if (it == fs_->files.end())
            throw zen::SysError("550 " + pathFrom + ": No such file.");
        const std::string content = it->second;
        fs_->files.erase(it);
        fs_->files[FakeRemoteFs::resolve(cwd, pathTo)] = content;
    }

    void chmod(const std::string& itemPath, int mode) override
    {
        fs_->record("chmod", itemPath);
        fs_->modes[FakeRemoteFs::resolve(cwd, itemPath)] = mode;
    }

    int64_t getSize(const std::string& filePath) override
    {
        fs_->record("size", filePath);
        auto it = fs_->files.find(FakeRemoteFs::resolve(cwd, filePath));
        return it == fs_->files.end() ? -1 : static_cast<int64_t>(it->second.size());
    }

    time_t getModTime(const std::string& filePath) override
    {
        fs_->record("mdtm", filePath);
        return fs_->files.contains(FakeRemoteFs::resolve(cwd, filePath)) ? modTime : -1;
    }

    void close() override { fs_->record("quit", ""); }

    static constexpr time_t modTime = 1700000000;

    bool passiveWorks   = true;
    bool qualifiedNames = false;
    std::string cwd = "/";

private:
    const std::shared_ptr<FakeRemoteFs> fs_;
    bool passive_ = true;
};


class FakeFtpConnector : public FtpConnector
{
public:
    explicit FakeFtpConnector(const std::shared_ptr<FakeRemoteFs>& fs) : fs_(fs) {}

    std::unique_ptr<FtpConnection> connect(const std::string& server, int port, bool useTls, std::optional<int> timeoutSec) override
    {
        fs_->record("connect", server + ':' + zen::numberTo<std::string>(port) + (useTls ? " tls" : "") +
                    (timeoutSec ? " timeout=" + zen::numberTo<std::string>(*timeoutSec) : ""));

        auto conn = std::make_unique<FakeFtpConnection>(fs_);
        conn->passiveWorks   = passiveWorks;
        conn->qualifiedNames = qualifiedNames;
        conn->cwd = initialDir;
        return conn;
    }

    bool passiveWorks   = true;
    bool qualifiedNames = false;
    std::string initialDir = "/";

private:
    const std::shared_ptr<FakeRemoteFs> fs_;
};

//----------------------------------------------------------------------------------------------------------------

struct FakeSshState
{
    std::string fingerprintMd5  = "0123456789abcdef0123456789abcdef";
    std::string fingerprintSha1 = "0123456789abcdef0123456789abcdef01234567";
    int openHandles = 0; //directories and files not yet closed
    std::string publicKeyUser = "user";
    bool statWithoutMode = false;
    std::optional<int> lastTimeoutSec;
};


class FakeSftpDirectory : public SftpDirectory
{
public:
    FakeSftpDirectory(const std::shared_ptr<FakeRemoteFs>& fs, FakeSshState& state, const std::vector<std::string>& names) :
        fs_(fs), state_(state), names_(names) { ++state_.openHandles; }

    ~FakeSftpDirectory() { if (!closed_) --state_.openHandles; }

    std::optional<std::string> readEntry() override
    {
        fs_->record("readdir", "");
        if (pos_ >= names_.size())
            return std::nullopt;
        return names_[pos_++];
    }

    void close() override
    {
        --state_.openHandles;
        closed_ = true;
    }

private:
    const std::shared_ptr<FakeRemoteFs> fs_;
    FakeSshState& state_;
    const std::vector<std::string> names_;
    size_t pos_ = 0;
    bool closed_ = false;
};


class FakeSftpFile : public SftpFile
{
public:
    FakeSftpFile(const std::shared_ptr<FakeRemoteFs>& fs, FakeSshState& state, const std::string& absPath, SftpOpenMode mode) :
        fs_(fs), state_(state), absPath_(absPath), mode_(mode)
    {
        if (mode_ == SftpOpenMode::read)
            content_ = fs_->files[absPath_];
        ++state_.openHandles;
    }

    ~FakeSftpFile() { if (!closed_) --state_.openHandles; }

    void setTimeout(int timeoutSec) override { state_.lastTimeoutSec = timeoutSec; }

    size_t tryRead(void* buffer, size_t bytesToRead) override
    {
        fs_->record("read", absPath_);
        const size_t bytesRead = std::min(bytesToRead, content_.size() - pos_);
        std::memcpy(buffer, content_.data() + pos_, bytesRead);
        pos_ += bytesRead;
        return bytesRead;
    }

    size_t tryWrite(const void* buffer, size_t bytesToWrite) override
    {
        fs_->record("write", absPath_);
        content_.append(static_cast<const char*>(buffer), bytesToWrite);
        return bytesToWrite;
    }

    void close() override
    {
        --state_.openHandles;
        closed_ = true;
        if (mode_ == SftpOpenMode::write)
            fs_->files[absPath_] = content_;
    }

private:
    const std::shared_ptr<FakeRemoteFs> fs_;
    FakeSshState& state_;
    const std::string absPath_;
    const SftpOpenMode mode_;
    std::string content_;
    size_t pos_ = 0;
    bool closed_ = false;
};


class FakeSftpChannel : public SftpChannel
{
public:
    FakeSftpChannel(const std::shared_ptr<FakeRemoteFs>& fs, FakeSshState& state) : fs_(fs), state_(state) {}

    SftpAttributes stat(const std::string& remotePath) override
    {
        fs_->record("stat", remotePath);
        SftpAttributes attr;
        if (fs_->dirs.contains(remotePath))
            attr.mode = 040755;
        else if (auto it = fs_->files.find(remotePath); it != fs_->files.end())
        {
            attr.mode = 0100644;
            attr.size = it->second.size();
            attr.modTime = 1700000000;
        }
        else
            throw zen::SysError("SFTP: No such file.");

        if (state_.statWithoutMode)
            attr.mode = std::nullopt;
        return attr;
    }

    void makeDirectory(const std::string& remotePath, int mode) override
    {
        fs_->record("mkdir", remotePath);
        fs_->modes[remotePath] = mode;
        if (fs_->dirs.contains(remotePath) || fs_->files.contains(remotePath) || !fs_->dirs.contains(FakeRemoteFs::getParent(remotePath)))
            throw zen::SysError("SFTP: Cannot create directory.");
        fs_->dirs.insert(remotePath);
        if (fs_->mkdirReportsFailure)
            throw zen::SysError("SFTP: Cannot create directory.");
    }

    void removeDirectory(const std::string& remotePath) override
    {
        fs_->record("rmdir", remotePath);
        if (!fs_->dirs.contains(remotePath) || !fs_->getChildren(remotePath).empty())
            throw zen::SysError("SFTP: Cannot remove directory.");
        fs_->dirs.erase(remotePath);
    }

    void unlink(const std::string& remotePath) override
    {
        fs_->record("unlink", remotePath);
        if (fs_->files.erase(remotePath) == 0)
            throw zen::SysError("SFTP: No such file.");
    }

    void rename(const std::string& pathFrom, const std::string& pathTo) override
    {
        fs_->record("rename", pathFrom + " -> " + pathTo);
        auto it = fs_->files.find(pathFrom);
        if (it == fs_->files.end())
            throw zen::SysError("SFTP: No such file.");
        const std::string content = it->second;
        fs_->files.erase(it);
        fs_->files[pathTo] = content;
    }

    void chmod(const std::string& remotePath, int mode) override
    {
        fs_->record("chmod", remotePath);
        fs_->modes[remotePath] = mode;
    }

    std::unique_ptr<SftpDirectory> openDirectory(const std::string& remotePath) override
    {
        fs_->record("opendir", remotePath);
        if (!fs_->dirs.contains(remotePath))
            throw zen::SysError("SFTP: No such directory.");

        std::vector<std::string> names{".", ".."};
        for (const std::string& name : fs_->getChildren(remotePath))
            names.push_back(name);
        return std::make_unique<FakeSftpDirectory>(fs_, state_, names);
    }

    std::unique_ptr<SftpFile> openFile(const std::string& remotePath, SftpOpenMode mode) override
    {
        fs_->record(mode == SftpOpenMode::read ? "open-read" : "open-write", remotePath);
        if (mode == SftpOpenMode::read && !fs_->files.contains(remotePath))
            throw zen::SysError("SFTP: No such file.");
        return std::make_unique<FakeSftpFile>(fs_, state_, remotePath, mode);
    }

private:
    const std::shared_ptr<FakeRemoteFs> fs_;
    FakeSshState& state_;
};


class FakeSshConnection : public SshConnection
{
public:
    FakeSshConnection(const std::shared_ptr<FakeRemoteFs>& fs, FakeSshState& state) : fs_(fs), state_(state) {}

    ~FakeSshConnection() { fs_->calls.push_back("disconnect"); }

    std::string getFingerprintHex(FingerprintAlgorithm algo) override
    {
        fs_->record("fingerprint", getFingerprintAlgorithmName(algo));
        return algo == FingerprintAlgorithm::md5 ? state_.fingerprintMd5 : state_.fingerprintSha1;
    }

    void authPassword(const std::string& username, const std::string& password) override
    {
        fs_->record("auth-password", username);
        if (username != fs_->user || password != fs_->password)
            throw zen::SysError("Authentication failed (username/password)");
    }

    void authPublicKey(const std::string& username,
                       const std::string& /*publicKeyFilePath*/,
                       const std::string& /*privateKeyFilePath*/,
                       const std::string& /*passphrase*/) override
    {
        fs_->record("auth-publickey", username);
        if (username != state_.publicKeyUser)
            throw zen::SysError("Authentication failed (public key)");
    }

    SftpChannel& getSftpChannel() override
    {
        if (!channel_)
        {
            fs_->record("sftp-init", "");
            channel_ = std::make_unique<FakeSftpChannel>(fs_, state_);
        }
        return *channel_;
    }

private:
    const std::shared_ptr<FakeRemoteFs> fs_;
    FakeSshState& state_;
    std::unique_ptr<FakeSftpChannel> channel_;
};


class FakeSshConnector : public SshConnector
{
public:
    explicit FakeSshConnector(const std::shared_ptr<FakeRemoteFs>& fs) : fs_(fs) {}

    std::unique_ptr<SshConnection> connect(const std::string& server, int port, const std::string& hostKeyAlgorithm, std::optional<int> /*timeoutSec*/) override
    {
        fs_->record("connect", server + ':' + zen::numberTo<std::string>(port) + ' ' + hostKeyAlgorithm);
        return std::make_unique<FakeSshConnection>(fs_, state);
    }

    FakeSshState state;

private:
    const std::shared_ptr<FakeRemoteFs> fs_;
};
}

#endif //FAKE_NATIVE_H_4410928375610294
