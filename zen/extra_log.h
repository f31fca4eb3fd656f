// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef EXTRA_LOG_H_601673246392441846218957402563
#define EXTRA_LOG_H_601673246392441846218957402563

#include <functional>
#include <mutex>
#include <utility>
#include "error_log.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - while an exception is in flight
    - cleanup errors in destructors                            */

namespace zen
{
namespace impl
{
class ExtraLog
{
public:
    ~ExtraLog()
    {
        if (!log_.empty() && reportOutstandingLog_)
            reportOutstandingLog_(log_);
    }

    void init(const std::function<void(const ErrorLog& log)>& reportOutstandingLog)
    {
        assert(!reportOutstandingLog_);
        reportOutstandingLog_ = reportOutstandingLog;
    }

    ErrorLog fetchLog() { return std::exchange(log_, ErrorLog()); }

    void logError(const std::string& msg) { logMsg(log_, msg, MessageType::MSG_TYPE_ERROR); }

private:
    ErrorLog log_;
    std::function<void(const ErrorLog& log)> reportOutstandingLog_;
};


template <class Function>
void accessExtraLog(Function fun)
{
    static ExtraLog extraLog;
    static std::mutex lockExtraLog;

    std::lock_guard dummy(lockExtraLog);
    fun(extraLog);
}
}

inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog /*nothrow! runs during global shutdown!*/)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.init(reportOutstandingLog); });
}


inline
ErrorLog fetchExtraLog()
{
    ErrorLog output;
    impl::accessExtraLog([&](impl::ExtraLog& el) { output = el.fetchLog(); });
    return output;
}


inline
void logExtraError(const std::string& msg) //nothrow!
{
    try { impl::accessExtraLog([&](impl::ExtraLog& el) { el.logError(msg); }); }
    catch (const std::exception&) { assert(false); } //std::system_error from mutex, std::bad_alloc
}
}

#endif //EXTRA_LOG_H_601673246392441846218957402563
