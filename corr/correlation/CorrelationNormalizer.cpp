/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "CorrelationNormalizer.h"
#include "corr/utilities/CorrException.h"

#include <sstream>

// Poco includes
#include "Poco/String.h"
#include "Poco/RegularExpression.h"
#include "Poco/Net/IPAddress.h"
#include "Poco/UnicodeConverter.h"
#include "Poco/UTFString.h"

namespace
{
    void reject(const std::string &what, const std::string &value)
    {
        std::stringstream msg;
        msg << "Data was expected to be " << what << ": " << value;
        throw CorrNormalizationException(msg.str());
    }

    /// Removes every match of the pattern from the value.
    std::string strip(const std::string &value, const std::string &pattern)
    {
        std::string result(value);
        Poco::RegularExpression regex(pattern);
        regex.subst(result, "", Poco::RegularExpression::RE_GLOBAL);
        return result;
    }

    std::string normalizeMd5(const std::string &data)
    {
        static const Poco::RegularExpression md5Regex("[a-f0-9]{32}$");
        std::string md5 = Poco::toLower(data);
        if (!md5Regex.match(md5))
            reject("a valid MD5 hash", data);
        return md5;
    }

    std::string normalizeDomain(const std::string &data)
    {
        static const Poco::RegularExpression hostRegex(
            "(?:[a-z0-9](?:[a-z0-9-]{0,61}[a-z0-9])?\\.)+[a-z][a-z0-9-]{0,61}[a-z0-9]$");
        std::string domain = Poco::toLower(data);

        Poco::Net::IPAddress address;
        if (Poco::Net::IPAddress::tryParse(domain, address))
            return domain;
        if (domain == "localhost")
            return domain;
        if (domain.size() > 253 || !hostRegex.match(domain))
            reject("a valid domain", data);
        return domain;
    }

    std::string normalizeEmail(const std::string &data)
    {
        static const Poco::RegularExpression emailRegex(
            "[a-z0-9!#$%&'*+/=?^_`{|}~.-]+@(?:[a-z0-9](?:[a-z0-9-]{0,61}[a-z0-9])?\\.)+[a-z][a-z0-9-]*[a-z0-9]$");
        std::string email = Poco::toLower(data);
        if (!emailRegex.match(email))
            reject("a valid email address", data);
        return email;
    }

    std::string normalizePhone(const std::string &data)
    {
        static const Poco::RegularExpression phoneRegex("\\+?[0-9()\\-\\s]+$");
        if (!phoneRegex.match(data))
            reject("a valid phone number", data);
        return strip(data, "[^0-9+]");
    }

    // Length is counted in UTF-16 code units, not bytes.
    std::string verifySsid(const std::string &data)
    {
        Poco::UTF16String ssid;
        Poco::UnicodeConverter::toUTF16(data, ssid);
        if (ssid.size() > CorrelationNormalizer::MAX_SSID_LENGTH)
            reject("a valid wireless network name", data);
        return data;
    }

    std::string normalizeMac(const std::string &data)
    {
        static const Poco::RegularExpression macRegex("(?:[0-9a-f]{16}|[0-9a-f]{12})$");
        std::string mac = strip(Poco::toLower(data), "[:.\\-]");
        if (!macRegex.match(mac))
            reject("a valid MAC address", data);
        return mac;
    }

    std::string normalizeImei(const std::string &data)
    {
        static const Poco::RegularExpression imeiRegex("[0-9]{14,16}$");
        std::string imei = strip(data, "[\\s\\-]");
        if (!imeiRegex.match(imei))
            reject("a valid IMEI number", data);
        return imei;
    }

    std::string normalizeImsi(const std::string &data)
    {
        static const Poco::RegularExpression imsiRegex("[0-9]{14,15}$");
        std::string imsi = strip(data, "[\\s\\-]");
        if (!imsiRegex.match(imsi))
            reject("a valid IMSI number", data);
        return imsi;
    }

    std::string normalizeIccid(const std::string &data)
    {
        static const Poco::RegularExpression iccidRegex("89[0-9f]{17,22}$");
        std::string iccid = Poco::toLower(strip(data, "[\\s\\-]"));
        if (!iccidRegex.match(iccid))
            reject("a valid ICCID number", data);
        return iccid;
    }
}

std::string CorrelationNormalizer::normalize(const CorrelationType &type, const std::string &value)
{
    return normalize(type.getId(), value);
}

std::string CorrelationNormalizer::normalize(int typeId, const std::string &value)
{
    std::string data = Poco::trim(value);
    if (data.empty())
    {
        std::stringstream msg;
        msg << "Data was expected to be a non-empty value for correlation type " << typeId;
        throw CorrNormalizationException(msg.str());
    }

    switch (typeId)
    {
    case CorrelationType::FILES_TYPE_ID:
        return normalizeMd5(data);
    case CorrelationType::DOMAIN_TYPE_ID:
        return normalizeDomain(data);
    case CorrelationType::EMAIL_TYPE_ID:
        return normalizeEmail(data);
    case CorrelationType::PHONE_TYPE_ID:
        return normalizePhone(data);
    case CorrelationType::USBID_TYPE_ID:
        return data;
    case CorrelationType::SSID_TYPE_ID:
        return verifySsid(data);
    case CorrelationType::MAC_TYPE_ID:
        return normalizeMac(data);
    case CorrelationType::IMEI_TYPE_ID:
        return normalizeImei(data);
    case CorrelationType::IMSI_TYPE_ID:
        return normalizeImsi(data);
    case CorrelationType::ICCID_TYPE_ID:
        return normalizeIccid(data);
    default:
        // Custom types have no rules of their own.
        return data;
    }
}
