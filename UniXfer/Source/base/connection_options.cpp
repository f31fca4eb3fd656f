// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "connection_options.h"
#include <algorithm>
#include <cassert>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <zen/string_tools.h>

using namespace zen;
using namespace uxf;


std::string uxf::getPassiveModeName(PassiveMode mode)
{
    switch (mode)
    {
        case PassiveMode::automatic:
            return "auto";
        case PassiveMode::on:
            return "true";
        case PassiveMode::off:
            return "false";
    }
    assert(false);
    return std::string();
}


ConnectionOptions::ConnectionOptions(std::optional<int> timeoutSec, PassiveMode passiveMode, const HostKeyPolicy& hostKey, const RetryPolicy& retry) :
    timeoutSec_(timeoutSec),
    passiveMode_(passiveMode),
    hostKey_(hostKey),
    retry_(retry)
{
    if (timeoutSec_ && *timeoutSec_ <= 0)
        timeoutSec_ = std::nullopt;

    hostKey_.algorithm = trimCpy(hostKey_.algorithm);
    if (hostKey_.algorithm.empty())
        hostKey_.algorithm = DEFAULT_HOST_KEY_ALGORITHM;

    if (hostKey_.expectedFingerprint)
    {
        hostKey_.expectedFingerprint = std::string(trimCpy(*hostKey_.expectedFingerprint));
        if (hostKey_.expectedFingerprint->empty())
            hostKey_.expectedFingerprint = std::nullopt;
    }

    retry_.maxRetries = std::max(retry_.maxRetries, 0);
    retry_.delayMs    = static_cast<int>(std::clamp<int64_t>(retry_.delayMs, 0, MAX_RETRY_DELAY_MS));
    if (!(retry_.backoffFactor > 0) || !std::isfinite(retry_.backoffFactor)) //NaN!
        retry_.backoffFactor = DEFAULT_RETRY_BACKOFF;
}

//--------------------------------------------------------------------------------------------

namespace
{
bool isDigitString(const std::string& str)
{
    return !str.empty() && std::all_of(str.begin(), str.end(), [](char c) { return isDigit(c); });
}


std::optional<double> parseNumericString(const std::string& str)
{
    const std::string strTrm(trimCpy(str));
    if (strTrm.empty())
        return std::nullopt;

    char* endPtr = nullptr;
    const double number = std::strtod(strTrm.c_str(), &endPtr);
    if (endPtr != strTrm.c_str() + strTrm.size())
        return std::nullopt;
    return number;
}


//"group.key" beats nested "group" -> "key"
const OptionValue* findOption(const OptionMap& options, const std::string& group, const std::string& key)
{
    if (group.empty())
    {
        auto it = options.find(key);
        return it != options.end() ? &it->second : nullptr;
    }

    if (auto it = options.find(group + '.' + key);
        it != options.end())
        return &it->second;

    if (auto itGroup = options.find(group);
        itGroup != options.end())
        if (const auto nested = std::get_if<std::shared_ptr<const OptionMap>>(&itGroup->second.value))
            if (*nested)
                if (auto it = (*nested)->find(key);
                    it != (*nested)->end())
                    return &it->second;

    return nullptr;
}


int clampToInt(int64_t n)
{
    return static_cast<int>(std::clamp<int64_t>(n, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
}
}


std::optional<int64_t> uxf::coerceIntLike(const OptionValue& v)
{
    if (const int64_t* n = std::get_if<int64_t>(&v.value))
        return *n;

    if (const std::string* str = std::get_if<std::string>(&v.value))
        if (isDigitString(*str))
        {
            int64_t number = 0;
            if (std::from_chars(str->data(), str->data() + str->size(), number).ec == std::errc::result_out_of_range)
                return std::numeric_limits<int64_t>::max(); //digits only: saturate, clamped by the caller
            return number;
        }

    return std::nullopt;
}


std::optional<bool> uxf::coerceBoolLike(const OptionValue& v)
{
    if (const bool* b = std::get_if<bool>(&v.value))
        return *b;

    if (const int64_t* n = std::get_if<int64_t>(&v.value))
    {
        if (*n == 1) return true;
        if (*n == 0) return false;
        return std::nullopt;
    }

    if (const std::string* str = std::get_if<std::string>(&v.value))
    {
        const std::string val = getLowerCaseAscii(trimCpy(*str));
        if (val == "1" || val == "true"  || val == "yes" || val == "on")
            return true;
        if (val == "0" || val == "false" || val == "no"  || val == "off")
            return false;
    }
    return std::nullopt;
}


std::optional<double> uxf::coerceFloatLike(const OptionValue& v)
{
    if (const double* d = std::get_if<double>(&v.value))
        return *d;

    if (const int64_t* n = std::get_if<int64_t>(&v.value))
        return static_cast<double>(*n);

    if (const std::string* str = std::get_if<std::string>(&v.value))
        return parseNumericString(*str);

    return std::nullopt;
}


PassiveMode uxf::coercePassiveMode(const OptionValue& v)
{
    if (const bool* b = std::get_if<bool>(&v.value))
        return *b ? PassiveMode::on : PassiveMode::off;

    if (const int64_t* n = std::get_if<int64_t>(&v.value))
    {
        if (*n == 1) return PassiveMode::on;
        if (*n == 0) return PassiveMode::off;
        return PassiveMode::automatic;
    }

    if (const std::string* str = std::get_if<std::string>(&v.value))
    {
        const std::string val = getLowerCaseAscii(*str);
        if (val == "1" || val == "true")
            return PassiveMode::on;
        if (val == "0" || val == "false")
            return PassiveMode::off;
    }
    return PassiveMode::automatic;
}


ConnectionOptions uxf::parseConnectionOptions(const OptionMap& options)
{
    std::optional<int> timeoutSec;
    if (const OptionValue* v = findOption(options, "", "timeout"))
        if (const std::optional<int64_t> n = coerceIntLike(*v))
            timeoutSec = clampToInt(*n);

    PassiveMode passiveMode = PassiveMode::automatic;
    if (const OptionValue* v = findOption(options, "", "passive"))
        passiveMode = coercePassiveMode(*v);

    HostKeyPolicy hostKey;
    if (const OptionValue* v = findOption(options, "ssh", "host_key_algo"))
        if (const std::string* str = std::get_if<std::string>(&v->value))
            hostKey.algorithm = *str; //empty: default

    if (const OptionValue* v = findOption(options, "ssh", "expected_fingerprint"))
        if (const std::string* str = std::get_if<std::string>(&v->value))
            hostKey.expectedFingerprint = *str;

    if (const OptionValue* v = findOption(options, "ssh", "strict_host_key_checking"))
        hostKey.strictChecking = coerceBoolLike(*v).value_or(false);

    RetryPolicy retry;
    if (const OptionValue* v = findOption(options, "retry", "max"))
        retry.maxRetries = clampToInt(coerceIntLike(*v).value_or(0));

    if (const OptionValue* v = findOption(options, "retry", "delay_ms"))
        retry.delayMs = clampToInt(coerceIntLike(*v).value_or(0));

    if (const OptionValue* v = findOption(options, "retry", "backoff"))
        retry.backoffFactor = coerceFloatLike(*v).value_or(DEFAULT_RETRY_BACKOFF);

    if (const OptionValue* v = findOption(options, "retry", "jitter"))
        retry.jitter = coerceBoolLike(*v).value_or(false);

    if (const OptionValue* v = findOption(options, "retry", "unsafe_operations"))
        retry.allowUnsafe = coerceBoolLike(*v).value_or(false);

    return ConnectionOptions(timeoutSec, passiveMode, hostKey, retry); //clamps the rest
}
