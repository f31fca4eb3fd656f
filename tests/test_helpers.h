// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef TEST_HELPERS_H_7702918346501827
#define TEST_HELPERS_H_7702918346501827

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <gtest/gtest.h>
#include <zen/error_log.h>
#include <zen/sys_error.h>
#include "../UniXfer/Source/base/xfer_error.h"


namespace uxf::test
{
//unique local directory, removed with everything inside on destruction
class TempDir
{
public:
    TempDir()
    {
        std::string pattern = (std::filesystem::temp_directory_path() / "uniXferTest.XXXXXX").string();
        if (!::mkdtemp(pattern.data()))
            THROW_LAST_SYS_ERROR("mkdtemp");
        path_ = pattern;
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::string& path() const { return path_; }
    std::string operator/(const std::string& name) const { return path_ + '/' + name; }

private:
    TempDir           (const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path_;
};


inline
bool logContains(const zen::ErrorLog& log, const std::string& text, std::optional<zen::MessageType> type = std::nullopt)
{
    for (const zen::LogEntry& entry : log)
        if (entry.message.find(text) != std::string::npos && (!type || entry.type == *type))
            return true;
    return false;
}
}

//EXPECT_THROW plus a check of the message prefix
#define EXPECT_XFER_ERROR(statement, ErrorType, expectedPrefix)                   \
    try                                                                           \
    {                                                                             \
        statement;                                                                \
        ADD_FAILURE() << "Expected " #ErrorType ": " << (expectedPrefix);         \
    }                                                                             \
    catch (const ErrorType& e)                                                    \
    {                                                                             \
        EXPECT_EQ(e.toString().substr(0, std::string(expectedPrefix).size()),     \
                  std::string(expectedPrefix));                                   \
    }

#endif //TEST_HELPERS_H_7702918346501827
