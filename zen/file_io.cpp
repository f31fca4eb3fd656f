// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "file_io.h"
#include <algorithm>
#include <stdexcept>
#include <vector>
#include "extra_log.h"
#include "string_tools.h"
    #include <fcntl.h>  //open
    #include <unistd.h> //close, read, write

using namespace zen;


size_t FileBase::getBlockSize() //throw FileError
{
    if (blockSizeBuf_ == 0)
    {
        //stat::st_blksize - "blocksize for file system I/O. Writing in smaller chunks may cause an inefficient read-modify-rewrite."
        const auto st_blksize = getStatBuffered().st_blksize; //throw FileError
        if (st_blksize > 0)             //st_blksize is signed!
            blockSizeBuf_ = st_blksize; //

        blockSizeBuf_ = std::max(blockSizeBuf_, defaultBlockSize);
    }
    return blockSizeBuf_;
}


const struct stat& FileBase::getStatBuffered() //throw FileError
{
    if (!statBuf_)
        try
        {
            if (hFile_ == invalidFileHandle)
                throw SysError("Contract error: getStatBuffered() called after close().");

            struct stat fileInfo = {};
            if (::fstat(hFile_, &fileInfo) != 0)
                THROW_LAST_SYS_ERROR("fstat");
            statBuf_ = std::move(fileInfo);
        }
        catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(filePath_)), e.toString()); }

    return *statBuf_;
}


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            close(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


void FileBase::close() //throw FileError
{
    try
    {
        if (hFile_ == invalidFileHandle)
            throw SysError("Contract error: close() called more than once.");
        if (::close(hFile_) != 0)
            THROW_LAST_SYS_ERROR("close");
        hFile_ = invalidFileHandle; //do NOT set on error! => ~FileOutputPlain() still wants to (try to) delete the file!
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot write file %x.", "%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
std::pair<FileBase::FileHandle, struct stat>
openHandleForRead(const std::string& filePath) //throw FileError
{
    try
    {
        //caveat: check for file types that block during open(): character device, block device, named pipe
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
            THROW_LAST_SYS_ERROR("stat");

        if (!S_ISREG(fileInfo.st_mode) &&
            !S_ISDIR(fileInfo.st_mode)) //open() will fail with "EISDIR: Is a directory" => nice
            throw SysError("Unsupported item type. [" + std::string(S_ISCHR (fileInfo.st_mode) ? "character device" :
                                                                    S_ISBLK (fileInfo.st_mode) ? "block device" :
                                                                    S_ISFIFO(fileInfo.st_mode) ? "FIFO, named pipe" :
                                                                    S_ISSOCK(fileInfo.st_mode) ? "socket" : "unknown") + ']');

        const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
            THROW_LAST_SYS_ERROR("open");
        return {fdFile /*pass ownership*/, fileInfo};
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot open file %x.", "%x", fmtPath(filePath)), e.toString()); }
}
}


FileInputPlain::FileInputPlain(const std::string& filePath) :
    FileInputPlain(openHandleForRead(filePath), filePath) {} //throw FileError


FileInputPlain::FileInputPlain(const std::pair<FileBase::FileHandle, struct stat>& fileDetails, const std::string& filePath) :
    FileBase(fileDetails.first, filePath)
{
    setStatBuffered(fileDetails.second);

    //optimize read-ahead on input file:
    if (::posix_fadvise(getHandle(), 0 /*offset*/, 0 /*len*/, POSIX_FADV_SEQUENTIAL) != 0) //"len == 0" means "end of the file"
        THROW_LAST_FILE_ERROR(replaceCpy("Cannot read file %x.", "%x", fmtPath(filePath)), "posix_fadvise(POSIX_FADV_SEQUENTIAL)");
}


//may return short, only 0 means EOF! =>  CONTRACT: bytesToRead > 0!
size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(getHandle(), buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR);
        //if ::read is interrupted (EINTR) right in the middle, it will return successfully with "bytesRead < bytesToRead"

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");

        ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead); //better safe than sorry
        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file %x.", "%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForWrite(const std::string& filePath, FileOutputMode mode) //throw FileError, ErrorTargetExisting
{
    try
    {
        const mode_t lockFileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH; //0666 => umask will be applied implicitly!

        const int fdFile = ::open(filePath.c_str(), //const char* pathname
                                  O_CREAT | (mode == FileOutputMode::overwrite ? O_TRUNC : O_EXCL) | O_WRONLY | O_CLOEXEC, //int flags
                                  lockFileMode);    //mode_t mode
        if (fdFile == -1)
        {
            const int ec = errno; //copy before making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy("Cannot write file %x.", "%x", fmtPath(filePath)), formatSystemError("open", ec));

            THROW_LAST_SYS_ERROR("open");
        }
        return fdFile; //pass ownership
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot write file %x.", "%x", fmtPath(filePath)), e.toString()); }
}
}


FileOutputPlain::FileOutputPlain(const std::string& filePath, FileOutputMode mode) :
    FileBase(openHandleForWrite(filePath, mode), filePath) {} //throw FileError, ErrorTargetExisting


FileOutputPlain::~FileOutputPlain()
{
    if (getHandle() != invalidFileHandle) //not finalized => clean up garbage
        try
        {
            if (::unlink(getFilePath().c_str()) != 0)
                THROW_LAST_SYS_ERROR("unlink");
        }
        catch (const SysError& e)
        {
            logExtraError(replaceCpy("Cannot delete file %x.", "%x", fmtPath(getFilePath())) + "\n\n" + e.toString());
        }
}


//may return short! CONTRACT: bytesToWrite > 0
size_t FileOutputPlain::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesWritten = 0;
        do
        {
            bytesWritten = ::write(getHandle(), buffer, bytesToWrite);
        }
        while (bytesWritten < 0 && errno == EINTR);

        if (bytesWritten <= 0)
        {
            if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
                errno = ENOSPC;

            THROW_LAST_SYS_ERROR("write");
        }

        ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite); //better safe than sorry
        return bytesWritten;
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot write file %x.", "%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

std::string zen::getFileContent(const std::string& filePath) //throw FileError
{
    FileInputPlain fileIn(filePath); //throw FileError

    const size_t blockSize = fileIn.getBlockSize(); //throw FileError
    std::string output;
    for (;;)
    {
        const size_t sizeOld = output.size();
        output.resize(sizeOld + blockSize);

        const size_t bytesRead = fileIn.tryRead(output.data() + sizeOld, blockSize); //throw FileError
        output.resize(sizeOld + bytesRead);

        if (bytesRead == 0) //end of file
            return output;
    }
}


void zen::setFileContent(const std::string& filePath, std::string_view bytes) //throw FileError
{
    FileOutputPlain fileOut(filePath, FileOutputMode::overwrite); //throw FileError

    while (!bytes.empty())
    {
        const size_t bytesWritten = fileOut.tryWrite(bytes.data(), std::min(bytes.size(), fileOut.getBlockSize())); //throw FileError
        bytes.remove_prefix(bytesWritten);
    }
    fileOut.close(); //throw FileError
}
