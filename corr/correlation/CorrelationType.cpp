/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "CorrelationType.h"
#include "corr/utilities/CorrException.h"

#include "Poco/RegularExpression.h"

#include <sstream>

CorrelationType::CorrelationType(int id, const std::string &displayName, const std::string &dbTableName,
                                 bool supported, bool enabled) :
    m_id(id),
    m_displayName(displayName),
    m_dbTableName(dbTableName),
    m_supported(supported),
    m_enabled(enabled)
{
    static const Poco::RegularExpression tableNameRegex("[a-z0-9_]+$");
    if (!tableNameRegex.match(m_dbTableName))
    {
        std::stringstream msg;
        msg << "CorrelationType : invalid table name '" << m_dbTableName
            << "' for type " << m_id << ", only lower case letters, digits and underscores are allowed";
        throw CorrCentralRepoException(msg.str());
    }
}

bool CorrelationType::operator==(const CorrelationType &other) const
{
    return m_id == other.m_id
        && m_displayName == other.m_displayName
        && m_dbTableName == other.m_dbTableName
        && m_supported == other.m_supported
        && m_enabled == other.m_enabled;
}

std::vector<CorrelationType> CorrelationType::getDefaultCorrelationTypes()
{
    std::vector<CorrelationType> types;
    types.push_back(CorrelationType(FILES_TYPE_ID, "Files", "file", true, true));
    types.push_back(CorrelationType(DOMAIN_TYPE_ID, "Domains", "domain", true, false));
    types.push_back(CorrelationType(EMAIL_TYPE_ID, "Email Addresses", "email_address", true, true));
    types.push_back(CorrelationType(PHONE_TYPE_ID, "Phone Numbers", "phone_number", true, true));
    types.push_back(CorrelationType(USBID_TYPE_ID, "USB Devices", "usb_devices", true, true));
    types.push_back(CorrelationType(SSID_TYPE_ID, "Wireless Networks", "wireless_networks", true, true));
    types.push_back(CorrelationType(MAC_TYPE_ID, "MAC Addresses", "mac_address", true, true));
    types.push_back(CorrelationType(IMEI_TYPE_ID, "IMEI Number", "imei_number", true, true));
    types.push_back(CorrelationType(IMSI_TYPE_ID, "IMSI Number", "imsi_number", true, true));
    types.push_back(CorrelationType(ICCID_TYPE_ID, "ICCID Number", "iccid_number", true, true));
    return types;
}
