// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef HOST_KEY_H_2947501836492017
#define HOST_KEY_H_2947501836492017

#include <optional>
#include <string>
#include <string_view>
#include "xfer_error.h"


namespace uxf
{
//host key algorithms offered to the server (SSH "hostkey" method preference); other names are passed through verbatim
bool isKnownHostKeyAlgorithm(const std::string& name); //ssh-rsa, ssh-ed25519, ecdsa-sha2-nistp256/384/521


enum class FingerprintAlgorithm
{
    md5,
    sha1,
};
std::string getFingerprintAlgorithmName(FingerprintAlgorithm algo); //"MD5", "SHA1"
size_t getFingerprintHexLength(FingerprintAlgorithm algo); //32, 40

struct HostKeyExpectation
{
    FingerprintAlgorithm algorithm = FingerprintAlgorithm::md5;
    std::string fingerprint; //uppercase hex, no separators, getFingerprintHexLength() digits
};

//"aa:bb cc" => "AABBCC": drop separators and any other non-hex char
std::string normalizeHexFingerprint(std::string_view fingerprint);

/*  "MD5:<hex>", "SHA1:<hex>" (case-insensitive prefix) or bare hex with 32 (MD5) or 40 (SHA1) digits
    - std::nullopt: nothing configured, or nothing left after normalization
    - "SHA256:..." is always rejected                                                      */
std::optional<HostKeyExpectation> parseExpectedFingerprint(const std::optional<std::string>& expected, const std::string& host); //throw ConnectionError

//constant time for equal length input; both sides are normalized first
bool fingerprintMatches(const HostKeyExpectation& expected, std::string_view serverFingerprint);
}

#endif //HOST_KEY_H_2947501836492017
