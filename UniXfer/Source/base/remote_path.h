// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef REMOTE_PATH_H_1658203947521836
#define REMOTE_PATH_H_1658203947521836

#include <string>
#include <zen/string_tools.h>


namespace uxf
{
//remote paths always use '/', independent of the local OS
const char REMOTE_PATH_SEPARATOR = '/';

//joinRemote("", "dir") == "/dir"; joinRemote("/base/", "") == "/base"; joinRemote("/var/www", "/file.txt") == "/var/www/file.txt"
inline
std::string joinRemote(const std::string& base, const std::string& child)
{
    const auto isSeparator = [](char c) { return c == REMOTE_PATH_SEPARATOR; };

    const std::string_view baseTrm  = zen::trimCpy(base.empty() ? std::string_view("/") : base, zen::TrimSide::right, isSeparator);
    const std::string_view childTrm = zen::trimCpy(child, zen::TrimSide::left, isSeparator);

    if (childTrm.empty())
        return baseTrm.empty() ? std::string(1, REMOTE_PATH_SEPARATOR) : std::string(baseTrm);

    return std::string(baseTrm) + REMOTE_PATH_SEPARATOR + std::string(childTrm);
}


inline std::string rtrimSeparator(std::string_view path) { return std::string(zen::trimCpy(path, zen::TrimSide::right, [](char c) { return c == REMOTE_PATH_SEPARATOR; })); }
inline std::string ltrimSeparator(std::string_view path) { return std::string(zen::trimCpy(path, zen::TrimSide::left,  [](char c) { return c == REMOTE_PATH_SEPARATOR; })); }
}

#endif //REMOTE_PATH_H_1658203947521836
