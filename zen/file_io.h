// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef FILE_IO_H_89578342758342572345
#define FILE_IO_H_89578342758342572345

#include <optional>
#include <string_view>
#include "file_access.h"
    #include <sys/stat.h>


namespace zen
{
/*  OS-buffered file I/O:
    - sequential read/write accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const std::string& getFilePath() const { return filePath_; }

    size_t getBlockSize(); //throw FileError

    static constexpr size_t defaultBlockSize = 256 * 1024;

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

    const struct stat& getStatBuffered(); //throw FileError

protected:
    FileBase(FileHandle handle, const std::string& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

    void setStatBuffered(const struct stat& fileInfo) { statBuf_ = fileInfo; }

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const std::string filePath_;
    size_t blockSizeBuf_ = 0;
    std::optional<struct stat> statBuf_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    explicit FileInputPlain(const std::string& filePath); //throw FileError

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError

private:
    FileInputPlain(const std::pair<FileBase::FileHandle, struct stat>& fileDetails, const std::string& filePath);
};


enum class FileOutputMode
{
    createNew, //fail with ErrorTargetExisting
    overwrite,
};

class FileOutputPlain : public FileBase
{
public:
    FileOutputPlain(const std::string& filePath, FileOutputMode mode); //throw FileError, ErrorTargetExisting
    ~FileOutputPlain();

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    //close() when done, or else file is considered incomplete and will be deleted!
};

//--------------------------------------------------------------------

//stream I/O convenience functions:
[[nodiscard]] std::string getFileContent(const std::string& filePath); //throw FileError

//overwrites if existing
void setFileContent(const std::string& filePath, std::string_view bytes); //throw FileError
}

#endif //FILE_IO_H_89578342758342572345
