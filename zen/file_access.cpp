// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "file_access.h"
#include <algorithm>
#include <vector>
#include "string_tools.h"

    #include <sys/stat.h>
    #include <unistd.h> //access, unlink, rmdir

using namespace zen;


std::optional<std::string> zen::getParentFolderPath(const std::string& itemPath)
{
    const std::string_view trimmed = trimCpy(itemPath, TrimSide::right, [](char c) { return c == FILE_NAME_SEPARATOR; });
    const size_t pos = trimmed.rfind(FILE_NAME_SEPARATOR);
    if (pos == std::string_view::npos)
        return std::nullopt; //relative item name or empty

    if (pos == 0)
    {
        if (trimmed.size() == 1) //root
            return std::nullopt;
        return std::string(1, FILE_NAME_SEPARATOR);
    }
    return std::string(trimmed.substr(0, pos));
}


std::string zen::getItemName(const std::string& itemPath)
{
    const std::string_view trimmed = trimCpy(itemPath, TrimSide::right, [](char c) { return c == FILE_NAME_SEPARATOR; });
    return std::string(afterLast(trimmed, FILE_NAME_SEPARATOR, IfNotFoundReturn::all));
}


std::string zen::appendPath(const std::string& basePath, const std::string& relPath)
{
    if (relPath.empty())
        return basePath;

    if (basePath.empty()) //basePath might be a relative path, too!
        return relPath;

    if (endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + relPath;

    return basePath + FILE_NAME_SEPARATOR + relPath;
}


namespace
{
struct SysErrorCode : public zen::SysError
{
    SysErrorCode(const std::string& functionName, ErrorCode ec) : SysError(formatSystemError(functionName, ec)), errorCode(ec) {}

    const ErrorCode errorCode;
};


ItemType getItemTypeImpl(const std::string& itemPath) //throw SysErrorCode
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        throw SysErrorCode("lstat", errno);

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}
}


ItemType zen::getItemType(const std::string& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(itemPath)), e.toString()); }
}


std::optional<ItemType> zen::getItemTypeIfExists(const std::string& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysErrorCode& e)
    {
        if (e.errorCode == ENOENT || e.errorCode == ENOTDIR)
            return std::nullopt;

        throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(itemPath)), e.toString());
    }
}


bool zen::isReadable(const std::string& itemPath)
{
    return ::access(itemPath.c_str(), R_OK) == 0;
}


void zen::createDirectory(const std::string& dirPath) //throw FileError, ErrorTargetExisting
{
    try
    {
        //don't allow creating irregular folders!
        const std::string dirName = getItemName(dirPath);

        if (std::all_of(dirName.begin(), dirName.end(), [](char c) { return c == '.'; }))
            throw SysError(replaceCpy("Invalid folder name %x.", "%x", fmtPath(dirName)));

        const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

        if (::mkdir(dirPath.c_str(), mode) != 0)
        {
            const int ec = errno; //copy before directly or indirectly making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy("Cannot create directory %x.", "%x", fmtPath(dirPath)), formatSystemError("mkdir", ec));
            THROW_LAST_SYS_ERROR("mkdir");
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot create directory %x.", "%x", fmtPath(dirPath)), e.toString()); }
}


void zen::createDirectoryIfMissingRecursion(const std::string& dirPath) //throw FileError
{
    try
    {
        //find first existing parent folder (backwards iteration):
        std::string dirPathEx = dirPath;
        std::vector<std::string> dirNames;
        for (;;)
        {
            if (const std::optional<ItemType> type = getItemTypeIfExists(dirPathEx)) //throw FileError
            {
                if (*type == ItemType::file /*obscure, but possible*/)
                    throw SysError(replaceCpy("The name %x is already used by another item.", "%x", fmtPath(getItemName(dirPathEx))));
                break;
            }

            const std::optional<std::string>& parentPath = getParentFolderPath(dirPathEx);
            dirNames.push_back(getItemName(dirPathEx));
            if (!parentPath) //relative path: create below the working directory
            {
                dirPathEx.clear();
                break;
            }
            dirPathEx = *parentPath;
        }
        //-----------------------------------------------------------

        std::string dirPathNew = dirPathEx;
        for (auto it = dirNames.rbegin(); it != dirNames.rend(); ++it)
        {
            dirPathNew = appendPath(dirPathNew, *it);
            try
            {
                createDirectory(dirPathNew); //throw FileError, ErrorTargetExisting
            }
            catch (const ErrorTargetExisting&)
            {
                if (getItemType(dirPathNew) == ItemType::file) //throw FileError
                    throw SysError(replaceCpy("The name %x is already used by another item.", "%x", fmtPath(getItemName(dirPathNew))));
                //else: created in the meantime
            }
        }
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy("Cannot create directory %x.", "%x", fmtPath(dirPath)), e.toString());
    }
}
