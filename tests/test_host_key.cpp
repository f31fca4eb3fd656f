// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "test_helpers.h"
#include "../UniXfer/Source/base/host_key.h"

using namespace uxf;


TEST(HostKey, KnownAlgorithms)
{
    EXPECT_TRUE(isKnownHostKeyAlgorithm("ssh-ed25519"));
    EXPECT_TRUE(isKnownHostKeyAlgorithm("ecdsa-sha2-nistp521"));
    EXPECT_FALSE(isKnownHostKeyAlgorithm("ssh-dss"));
}


TEST(HostKey, Normalize)
{
    EXPECT_EQ(normalizeHexFingerprint(" aa:bb cc-dd "), "AABBCCDD");
    EXPECT_EQ(normalizeHexFingerprint("xyz"), "");
}


TEST(HostKey, ParsePrefixed)
{
    const std::optional<HostKeyExpectation> md5 = parseExpectedFingerprint("md5:00:11:22:33:44:55:66:77:88:99:aa:bb:cc:dd:ee:ff", "host");
    ASSERT_TRUE(md5);
    EXPECT_EQ(md5->algorithm, FingerprintAlgorithm::md5);
    EXPECT_EQ(md5->fingerprint, "00112233445566778899AABBCCDDEEFF");

    const std::optional<HostKeyExpectation> sha1 = parseExpectedFingerprint("SHA1:0123456789abcdef0123456789abcdef01234567", "host");
    ASSERT_TRUE(sha1);
    EXPECT_EQ(sha1->algorithm, FingerprintAlgorithm::sha1);
}


TEST(HostKey, ParseBareHexByLength)
{
    EXPECT_EQ(parseExpectedFingerprint("0123456789abcdef0123456789abcdef", "host")->algorithm, FingerprintAlgorithm::md5);
    EXPECT_EQ(parseExpectedFingerprint("0123456789abcdef0123456789abcdef01234567", "host")->algorithm, FingerprintAlgorithm::sha1);

    EXPECT_XFER_ERROR(parseExpectedFingerprint("0123", "example.com"), ConnectionError,
                      "Invalid expected fingerprint format for \"example.com\". Provide \"MD5:<hex>\" or \"SHA1:<hex>\".");
}


TEST(HostKey, ParseRejects)
{
    EXPECT_XFER_ERROR(parseExpectedFingerprint("SHA256:abcd", "host"), ConnectionError,
                      "SHA256 fingerprints are not supported by this SFTP backend. Available algorithms: MD5, SHA1.");
    EXPECT_XFER_ERROR(parseExpectedFingerprint("MD5:0123", "example.com"), ConnectionError,
                      "Invalid MD5 fingerprint length for \"example.com\".");
}


TEST(HostKey, ParseNothingConfigured)
{
    EXPECT_FALSE(parseExpectedFingerprint(std::nullopt, "host"));
    EXPECT_FALSE(parseExpectedFingerprint("   ", "host"));
    EXPECT_FALSE(parseExpectedFingerprint("MD5:::", "host"));
}


TEST(HostKey, Matches)
{
    const HostKeyExpectation expected{FingerprintAlgorithm::md5, "00112233445566778899AABBCCDDEEFF"};
    EXPECT_TRUE (fingerprintMatches(expected, "00:11:22:33:44:55:66:77:88:99:aa:bb:cc:dd:ee:ff"));
    EXPECT_FALSE(fingerprintMatches(expected, "00112233445566778899AABBCCDDEEF0"));
    EXPECT_FALSE(fingerprintMatches(expected, "0011"));
}
