// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef TRANSPORT_LOG_H_5720194836152047
#define TRANSPORT_LOG_H_5720194836152047

#include <initializer_list>
#include <string_view>
#include <utility>
#include <zen/error_log.h>


namespace uxf
{
using LogField = std::pair<std::string_view, std::string>;

//"Transport connecting [host: example.com, port: 21]"; no-op if log is null
void logTransport(zen::ErrorLog* log, zen::MessageType type, const std::string& event, std::initializer_list<LogField> context = {});

std::string formatLogFlag(bool value); //"true"/"false"

//never log a complete fingerprint
std::string truncateFingerprint(const std::string& fingerprint);







//------------------------------- implementation -------------------------------
inline
void logTransport(zen::ErrorLog* log, zen::MessageType type, const std::string& event, std::initializer_list<LogField> context)
{
    if (!log)
        return;

    std::string msg = event;
    if (context.size() > 0)
    {
        msg += " [";
        bool firstField = true;
        for (const auto& [key, value] : context)
        {
            if (!firstField)
                msg += ", ";
            firstField = false;

            msg += key;
            msg += ": ";
            msg += value;
        }
        msg += ']';
    }
    zen::logMsg(*log, msg, type);
}


inline std::string formatLogFlag(bool value) { return value ? "true" : "false"; }


inline
std::string truncateFingerprint(const std::string& fingerprint)
{
    const size_t visibleChars = 12;
    if (fingerprint.size() <= visibleChars)
        return fingerprint;
    return fingerprint.substr(0, visibleChars) + "...";
}
}

#endif //TRANSPORT_LOG_H_5720194836152047
