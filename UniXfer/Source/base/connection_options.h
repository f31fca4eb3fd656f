// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef CONNECTION_OPTIONS_H_5017293846510293
#define CONNECTION_OPTIONS_H_5017293846510293

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>


namespace uxf
{
enum class PassiveMode //FTP/FTPS only
{
    automatic, //enable passive, test with a listing, fall back to active on failure
    on,
    off,
};
std::string getPassiveModeName(PassiveMode mode); //"auto", "true", "false"

const char DEFAULT_HOST_KEY_ALGORITHM[] = "ssh-rsa";
const double DEFAULT_RETRY_BACKOFF = 2.0;
const int64_t MAX_RETRY_DELAY_MS = 24 * 3600 * 1000; //backoff saturates here


struct HostKeyPolicy //SFTP only
{
    std::string algorithm = DEFAULT_HOST_KEY_ALGORITHM;
    std::optional<std::string> expectedFingerprint; //"MD5:<hex>", "SHA1:<hex>" or bare hex
    bool strictChecking = false;
};

struct RetryPolicy
{
    int    maxRetries    = 0; //valid range: [0, inf); 0 disables retries
    int    delayMs       = 0; //valid range: [0, inf)
    double backoffFactor = DEFAULT_RETRY_BACKOFF; //valid range: (0, inf)
    bool   jitter        = false;
    bool   allowUnsafe   = false; //retry non-idempotent operations
};


//immutable: all values are clamped to their valid range on construction
class ConnectionOptions
{
public:
    ConnectionOptions() {}
    ConnectionOptions(std::optional<int> timeoutSec, PassiveMode passiveMode, const HostKeyPolicy& hostKey, const RetryPolicy& retry);

    const std::optional<int>& getTimeoutSec() const { return timeoutSec_; } //positive if set
    PassiveMode getPassiveMode() const { return passiveMode_; }
    const HostKeyPolicy& getHostKeyPolicy() const { return hostKey_; }
    const RetryPolicy& getRetryPolicy() const { return retry_; }

private:
    std::optional<int> timeoutSec_;
    PassiveMode passiveMode_ = PassiveMode::automatic;
    HostKeyPolicy hostKey_;
    RetryPolicy retry_;
};

//--------------------------------------------------------------------------------------------
//loosely typed configuration, e.g. from a config file:
//  { "timeout": 30, "passive": "auto", "retry": { "max": "3" }, "ssh.strict_host_key_checking": "yes" }

struct OptionValue;
using OptionMap = std::map<std::string, OptionValue>;

struct OptionValue
{
    OptionValue(bool b);
    OptionValue(int n);
    OptionValue(int64_t n);
    OptionValue(double d);
    OptionValue(const char* str);
    OptionValue(const std::string& str);
    OptionValue(const OptionMap& nested);

    std::variant<bool, int64_t, double, std::string, std::shared_ptr<const OptionMap>> value;
};

/*  Keys: timeout, passive, ssh.host_key_algo, ssh.expected_fingerprint, ssh.strict_host_key_checking,
          retry.max, retry.delay_ms, retry.backoff, retry.jitter, retry.unsafe_operations
    "ssh.x" may also be given as nested map "ssh" -> "x"; the dotted key takes precedence.
    Values of unexpected type fall back to the default.                                     */
ConnectionOptions parseConnectionOptions(const OptionMap& options);

//coercion rules, exposed for reuse:
std::optional<int64_t> coerceIntLike  (const OptionValue& v); //integer, or a string of digits only
std::optional<bool>    coerceBoolLike (const OptionValue& v); //bool, 1/0, "1"/"0", true|yes|on, false|no|off
std::optional<double>  coerceFloatLike(const OptionValue& v); //double, integer, or a numeric string
PassiveMode            coercePassiveMode(const OptionValue& v);




//------------------------------- implementation -------------------------------
inline OptionValue::OptionValue(bool b)                  : value(b) {}
inline OptionValue::OptionValue(int n)                   : value(static_cast<int64_t>(n)) {}
inline OptionValue::OptionValue(int64_t n)               : value(n) {}
inline OptionValue::OptionValue(double d)                : value(d) {}
inline OptionValue::OptionValue(const char* str)         : value(std::string(str)) {}
inline OptionValue::OptionValue(const std::string& str)  : value(str) {}
inline OptionValue::OptionValue(const OptionMap& nested) : value(std::make_shared<const OptionMap>(nested)) {}
}

#endif //CONNECTION_OPTIONS_H_5017293846510293
