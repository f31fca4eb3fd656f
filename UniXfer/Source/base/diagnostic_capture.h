// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef DIAGNOSTIC_CAPTURE_H_4820957138402765
#define DIAGNOSTIC_CAPTURE_H_4820957138402765

#include <optional>
#include <type_traits>
#include <zen/sys_error.h>


namespace uxf
{
/*  Records the diagnostic (SysError text) of the most recent native call: every run()/tryRun() starts afresh.
    Does not change control flow: run() rethrows, tryRun() reports failure to the caller.

        DiagnosticCapture diag;
        if (!diag.tryRun([&] { conn.deleteFile(path); }))
            throw TransferError(... + diag.formatLastDiagnostic());                  */
class DiagnosticCapture
{
public:
    template <class Function> //Function returning void or value, may throw SysError
    auto run(Function fun) //throw SysError
    {
        lastDiagnostic_.reset();
        try
        {
            return fun(); //throw SysError
        }
        catch (const zen::SysError& e)
        {
            lastDiagnostic_ = e.toString();
            throw;
        }
    }

    //void function: false on SysError; value function: std::nullopt on SysError
    template <class Function>
    auto tryRun(Function fun)
    {
        using ResultType = decltype(fun());
        lastDiagnostic_.reset();
        try
        {
            if constexpr (std::is_void_v<ResultType>)
            {
                fun(); //throw SysError
                return true;
            }
            else
                return std::optional<ResultType>(fun()); //throw SysError
        }
        catch (const zen::SysError& e)
        {
            lastDiagnostic_ = e.toString();
            if constexpr (std::is_void_v<ResultType>)
                return false;
            else
                return std::optional<ResultType>();
        }
    }

    const std::optional<std::string>& getLastDiagnostic() const { return lastDiagnostic_; }

    //" Details: <msg>" or empty: append directly to an error message
    std::string formatLastDiagnostic() const
    {
        if (!lastDiagnostic_ || lastDiagnostic_->empty())
            return std::string();
        return " Details: " + *lastDiagnostic_;
    }

    void clear() { lastDiagnostic_.reset(); }

private:
    std::optional<std::string> lastDiagnostic_;
};
}

#endif //DIAGNOSTIC_CAPTURE_H_4820957138402765
