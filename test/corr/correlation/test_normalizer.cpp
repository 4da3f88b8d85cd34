/*
 * The Sleuth Kit
 *
 * Copyright (c) 2010, 2025 Basis Technology Corp.  All Rights reserved
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "corr/correlation/CorrelationNormalizer.h"
#include "corr/correlation/CorrelationType.h"
#include "corr/utilities/CorrException.h"

#include "catch.hpp"

TEST_CASE("File hashes are lower cased","[normalizer]") {
    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::FILES_TYPE_ID, " 0123456789ABCDEF0123456789ABCDEF ")
            == "0123456789abcdef0123456789abcdef");
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::FILES_TYPE_ID, "0123456789abcdef"),
                      CorrNormalizationException);
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::FILES_TYPE_ID, "0123456789abcdef0123456789abcdeg"),
                      CorrNormalizationException);
}

TEST_CASE("Domains accept host names and addresses","[normalizer]") {
    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::DOMAIN_TYPE_ID, "WWW.Example.COM") == "www.example.com");
    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::DOMAIN_TYPE_ID, "192.168.1.10") == "192.168.1.10");
    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::DOMAIN_TYPE_ID, "LocalHost") == "localhost");
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::DOMAIN_TYPE_ID, "not a domain"),
                      CorrNormalizationException);
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::DOMAIN_TYPE_ID, "intranet"),
                      CorrNormalizationException);
}

TEST_CASE("Email addresses are lower cased","[normalizer]") {
    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::EMAIL_TYPE_ID, "Jane.Doe@Example.org") == "jane.doe@example.org");
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::EMAIL_TYPE_ID, "jane.doe"),
                      CorrNormalizationException);
}

TEST_CASE("Phone numbers keep digits and a leading plus","[normalizer]") {
    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::PHONE_TYPE_ID, "+1 (555) 123-4567") == "+15551234567");
    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::PHONE_TYPE_ID, "555 1234") == "5551234");
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::PHONE_TYPE_ID, "call me"),
                      CorrNormalizationException);
}

TEST_CASE("Device identifiers","[normalizer]") {
    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::USBID_TYPE_ID, "0781:5567") == "0781:5567");

    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::MAC_TYPE_ID, "00:1A:2B:3C:4D:5E") == "001a2b3c4d5e");
    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::MAC_TYPE_ID, "001a.2b3c.4d5e.6f70") == "001a2b3c4d5e6f70");
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::MAC_TYPE_ID, "00:1A:2B"),
                      CorrNormalizationException);

    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::IMEI_TYPE_ID, "35-209900-176148-1") == "352099001761481");
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::IMEI_TYPE_ID, "3520990"),
                      CorrNormalizationException);

    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::IMSI_TYPE_ID, "310 150 123456789") == "310150123456789");
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::IMSI_TYPE_ID, "31015012345678901"),
                      CorrNormalizationException);

    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::ICCID_TYPE_ID, "8901 2601 2345 6789 01F") == "890126012345678901f");
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::ICCID_TYPE_ID, "1234567890123456789"),
                      CorrNormalizationException);
}

TEST_CASE("Wireless network names are limited in length","[normalizer]") {
    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::SSID_TYPE_ID, "  Home Network ") == "Home Network");
    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::SSID_TYPE_ID, std::string(32, 'x')) == std::string(32, 'x'));
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::SSID_TYPE_ID, std::string(33, 'x')),
                      CorrNormalizationException);
}

static std::string repeat(const std::string &s, int n)
{
    std::string out;
    for (int i = 0; i < n; i++)
        out += s;
    return out;
}

TEST_CASE("Wireless network name length counts characters, not bytes","[normalizer]") {
    const std::string cjk("\xe6\x88\x91");          // U+6211, 3 bytes in UTF-8
    const std::string emoji("\xf0\x9f\x93\xb6");   // U+1F4F6, 2 UTF-16 units

    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::SSID_TYPE_ID, repeat(cjk, 13)) == repeat(cjk, 13));
    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::SSID_TYPE_ID, repeat(cjk, 32)) == repeat(cjk, 32));
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::SSID_TYPE_ID, repeat(cjk, 33)),
                      CorrNormalizationException);

    REQUIRE(CorrelationNormalizer::normalize(CorrelationType::SSID_TYPE_ID, repeat(emoji, 16)) == repeat(emoji, 16));
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::SSID_TYPE_ID, repeat(emoji, 17)),
                      CorrNormalizationException);
}

TEST_CASE("Empty values and custom types","[normalizer]") {
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(CorrelationType::EMAIL_TYPE_ID, "   "), CorrNormalizationException);
    REQUIRE_THROWS_AS(CorrelationNormalizer::normalize(1000, ""), CorrNormalizationException);
    REQUIRE(CorrelationNormalizer::normalize(1000, " Anything Goes ") == "Anything Goes");

    CorrelationType email(CorrelationType::EMAIL_TYPE_ID, "Email Addresses", "email", true, true);
    REQUIRE(CorrelationNormalizer::normalize(email, "A@B.CO") == "a@b.co");
}
