/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "CorrBlackboardAttribute.h"

#include "Poco/NumberFormatter.h"
#include "Poco/Timestamp.h"
#include "Poco/DateTimeFormatter.h"
#include "Poco/String.h"

#include <ctime>

using namespace std;

CorrBlackboardAttribute::CorrBlackboardAttribute(const int attributeTypeID, const string& moduleName,
                                                 CORR_BLACKBOARD_ATTRIBUTE_VALUE_TYPE valueType) :
    m_attributeTypeID(attributeTypeID),
    m_moduleName(moduleName),
    m_valueType(valueType),
    m_valueInt(),
    m_valueLong(),
    m_valueDouble(),
    m_valueString(),
    m_valueBytes() {}

CorrBlackboardAttribute::CorrBlackboardAttribute(const int attributeTypeID, const string& moduleName, const int valueInt) :
    CorrBlackboardAttribute(attributeTypeID, moduleName, CORR_INTEGER)
{
    m_valueInt = valueInt;
}

CorrBlackboardAttribute::CorrBlackboardAttribute(const int attributeTypeID, const string& moduleName, const int64_t valueLong) :
    CorrBlackboardAttribute(attributeTypeID, moduleName, CORR_LONG)
{
    m_valueLong = valueLong;
}

CorrBlackboardAttribute::CorrBlackboardAttribute(const int attributeTypeID, const string& moduleName, const double valueDouble) :
    CorrBlackboardAttribute(attributeTypeID, moduleName, CORR_DOUBLE)
{
    m_valueDouble = valueDouble;
}

CorrBlackboardAttribute::CorrBlackboardAttribute(const int attributeTypeID, const string& moduleName, const string& valueString) :
    CorrBlackboardAttribute(attributeTypeID, moduleName, CORR_STRING)
{
    m_valueString = valueString;
}

CorrBlackboardAttribute::CorrBlackboardAttribute(const int attributeTypeID, const string& moduleName, const vector<unsigned char>& valueBytes) :
    CorrBlackboardAttribute(attributeTypeID, moduleName, CORR_BYTE)
{
    m_valueBytes = valueBytes;
}

CorrBlackboardAttribute CorrBlackboardAttribute::dateTime(const int attributeTypeID, const string& moduleName, const int64_t epochSeconds)
{
    CorrBlackboardAttribute attr(attributeTypeID, moduleName, CORR_DATETIME);
    attr.m_valueLong = epochSeconds;
    return attr;
}

CorrBlackboardAttribute CorrBlackboardAttribute::json(const int attributeTypeID, const string& moduleName, const string& json)
{
    CorrBlackboardAttribute attr(attributeTypeID, moduleName, CORR_JSON);
    attr.m_valueString = json;
    return attr;
}

CorrBlackboardAttribute::~CorrBlackboardAttribute()
{
}

int CorrBlackboardAttribute::getAttributeTypeID() const
{
    return m_attributeTypeID;
}

CORR_BLACKBOARD_ATTRIBUTE_VALUE_TYPE CorrBlackboardAttribute::getValueType() const
{
    return m_valueType;
}

int CorrBlackboardAttribute::getValueInt() const
{
    return m_valueInt;
}

int64_t CorrBlackboardAttribute::getValueLong() const
{
    return m_valueLong;
}

double CorrBlackboardAttribute::getValueDouble() const
{
    return m_valueDouble;
}

string CorrBlackboardAttribute::getValueString() const
{
    switch (m_valueType) {
    case CORR_STRING:
    case CORR_JSON:
        return m_valueString;
    case CORR_INTEGER:
        return Poco::NumberFormatter::format(m_valueInt);
    case CORR_LONG:
        return Poco::NumberFormatter::format(static_cast<Poco::Int64>(m_valueLong));
    case CORR_DOUBLE:
        return Poco::NumberFormatter::format(m_valueDouble);
    case CORR_BYTE:
        {
            string hex;
            for (vector<unsigned char>::const_iterator it = m_valueBytes.begin(); it != m_valueBytes.end(); ++it) {
                hex += Poco::NumberFormatter::formatHex(static_cast<unsigned>(*it), 2);
            }
            return Poco::toLower(hex);
        }
    case CORR_DATETIME:
        {
            Poco::Timestamp ts = Poco::Timestamp::fromEpochTime(static_cast<std::time_t>(m_valueLong));
            return Poco::DateTimeFormatter::format(ts, "%Y-%m-%d %H:%M:%S");
        }
    }
    return "";
}

vector<unsigned char> CorrBlackboardAttribute::getValueBytes() const
{
    return m_valueBytes;
}

string CorrBlackboardAttribute::getModuleName() const
{
    return m_moduleName;
}
