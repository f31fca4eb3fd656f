// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "host_key.h"
#include <cassert>
#include <zen/open_ssl.h>
#include <zen/string_tools.h>

using namespace zen;
using namespace uxf;


bool uxf::isKnownHostKeyAlgorithm(const std::string& name)
{
    for (const char* knownName :
         {
             "ssh-rsa",
             "ssh-ed25519",
             "ecdsa-sha2-nistp256",
             "ecdsa-sha2-nistp384",
             "ecdsa-sha2-nistp521",
         })
        if (name == knownName)
            return true;
    return false;
}


std::string uxf::getFingerprintAlgorithmName(FingerprintAlgorithm algo)
{
    switch (algo)
    {
        case FingerprintAlgorithm::md5:
            return "MD5";
        case FingerprintAlgorithm::sha1:
            return "SHA1";
    }
    assert(false);
    return std::string();
}


size_t uxf::getFingerprintHexLength(FingerprintAlgorithm algo)
{
    switch (algo)
    {
        case FingerprintAlgorithm::md5:
            return 32;
        case FingerprintAlgorithm::sha1:
            return 40;
    }
    assert(false);
    return 0;
}


std::string uxf::normalizeHexFingerprint(std::string_view fingerprint)
{
    std::string output;
    for (const char c : trimCpy(fingerprint))
        if (isHexDigit(c))
            output += asciiToUpper(c);
    return output;
}


std::optional<HostKeyExpectation> uxf::parseExpectedFingerprint(const std::optional<std::string>& expected, const std::string& host) //throw ConnectionError
{
    if (!expected)
        return std::nullopt;

    std::string_view value = trimCpy(*expected);
    if (value.empty())
        return std::nullopt;

    if (startsWithAsciiNoCase(value, "sha256:"))
        throw ConnectionError("SHA256 fingerprints are not supported by this SFTP backend. Available algorithms: MD5, SHA1.");

    std::optional<FingerprintAlgorithm> algo;
    if (startsWithAsciiNoCase(value, "md5:"))
    {
        algo = FingerprintAlgorithm::md5;
        value.remove_prefix(4);
    }
    else if (startsWithAsciiNoCase(value, "sha1:"))
    {
        algo = FingerprintAlgorithm::sha1;
        value.remove_prefix(5);
    }

    const std::string fingerprint = normalizeHexFingerprint(value);
    if (fingerprint.empty())
        return std::nullopt;

    if (!algo)
    {
        if (fingerprint.size() == getFingerprintHexLength(FingerprintAlgorithm::md5))
            algo = FingerprintAlgorithm::md5;
        else if (fingerprint.size() == getFingerprintHexLength(FingerprintAlgorithm::sha1))
            algo = FingerprintAlgorithm::sha1;
        else
            throw ConnectionError(replaceCpy("Invalid expected fingerprint format for %x. Provide \"MD5:<hex>\" or \"SHA1:<hex>\".", "%x", fmtHost(host)));
    }

    if (fingerprint.size() != getFingerprintHexLength(*algo))
        throw ConnectionError(replaceCpy(replaceCpy("Invalid %y fingerprint length for %x.", "%x", fmtHost(host)), "%y", getFingerprintAlgorithmName(*algo)));

    return HostKeyExpectation{*algo, fingerprint};
}


bool uxf::fingerprintMatches(const HostKeyExpectation& expected, std::string_view serverFingerprint)
{
    return constantTimeEquals(expected.fingerprint, normalizeHexFingerprint(serverFingerprint));
}
