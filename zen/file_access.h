// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef FILE_ACCESS_H_8017341345614857
#define FILE_ACCESS_H_8017341345614857

#include <optional>
#include "file_error.h"


namespace zen
{
const char FILE_NAME_SEPARATOR = '/';

//"/a/b" => "/a"; "/" => none; "b" => none
std::optional<std::string> getParentFolderPath(const std::string& itemPath);
std::string getItemName(const std::string& itemPath);
std::string appendPath(const std::string& basePath, const std::string& relPath);

enum class ItemType
{
    file,
    folder,
    symlink,
};
ItemType getItemType(const std::string& itemPath); //throw FileError
//distinguish error/not existing
std::optional<ItemType> getItemTypeIfExists(const std::string& itemPath); //throw FileError

inline bool itemExists(const std::string& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError

//symlink handling: follow; no error reporting
bool isReadable(const std::string& itemPath);

DEFINE_NEW_FILE_ERROR(ErrorTargetExisting)
void createDirectory(const std::string& dirPath); //throw FileError, ErrorTargetExisting

//creates directories recursively if not existing
void createDirectoryIfMissingRecursion(const std::string& dirPath); //throw FileError
}

#endif //FILE_ACCESS_H_8017341345614857
