/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

/**
 * \file CorrBlackboardAttribute.h
 * Contains the definition for the CorrBlackboardAttribute class.
 */

#ifndef _CORR_BLACKBOARD_ATTR_H
#define _CORR_BLACKBOARD_ATTR_H

#include <string>
#include <vector>

#include "corr/corr_i.h"

/**
 * Value type enum, should always correspond to the stored value in an
 * attribute
 */
enum CORR_BLACKBOARD_ATTRIBUTE_VALUE_TYPE {
    CORR_STRING = 0,    ///< string
    CORR_INTEGER,       ///< int
    CORR_LONG,          ///< 64 bit integer
    CORR_DOUBLE,        ///< double
    CORR_BYTE,          ///< byte array
    CORR_DATETIME,      ///< seconds since the epoch, UTC
    CORR_JSON           ///< JSON document kept as text
};

/**
 * Class that represents a blackboard attribute. Attributes are immutable
 * once constructed.
 */
class CORR_API CorrBlackboardAttribute
{
public:
    /**
    * Constructor for an attribute storing an int
    * @param attributeTypeID attribute type id
    * @param moduleName module that created this attribute
    * @param valueInt integer value
    */
    CorrBlackboardAttribute(const int attributeTypeID, const std::string& moduleName, const int valueInt);

    /**
    * Constructor for an attribute storing a 64 bit integer
    * @param attributeTypeID attribute type id
    * @param moduleName module that created this attribute
    * @param valueLong 64 bit integer value
    */
    CorrBlackboardAttribute(const int attributeTypeID, const std::string& moduleName, const int64_t valueLong);

    /**
    * Constructor for an attribute storing a double
    * @param attributeTypeID attribute type id
    * @param moduleName module that created this attribute
    * @param valueDouble double value
    */
    CorrBlackboardAttribute(const int attributeTypeID, const std::string& moduleName, const double valueDouble);

    /**
    * Constructor for an attribute storing a string
    * @param attributeTypeID attribute type id
    * @param moduleName module that created this attribute
    * @param valueString string value
    */
    CorrBlackboardAttribute(const int attributeTypeID, const std::string& moduleName, const std::string& valueString);

    /**
    * Constructor for an attribute storing a byte array
    * @param attributeTypeID attribute type id
    * @param moduleName module that created this attribute
    * @param valueBytes byte array value
    */
    CorrBlackboardAttribute(const int attributeTypeID, const std::string& moduleName, const std::vector<unsigned char>& valueBytes);

    /**
    * Create an attribute storing a date/time.
    * @param attributeTypeID attribute type id
    * @param moduleName module that created this attribute
    * @param epochSeconds seconds since the epoch, UTC
    */
    static CorrBlackboardAttribute dateTime(const int attributeTypeID, const std::string& moduleName, const int64_t epochSeconds);

    /**
    * Create an attribute storing a JSON document.
    * @param attributeTypeID attribute type id
    * @param moduleName module that created this attribute
    * @param json JSON text
    */
    static CorrBlackboardAttribute json(const int attributeTypeID, const std::string& moduleName, const std::string& json);

    ~CorrBlackboardAttribute();

    int getAttributeTypeID() const;
    CORR_BLACKBOARD_ATTRIBUTE_VALUE_TYPE getValueType() const;
    int getValueInt() const;
    /// Value of a CORR_LONG or CORR_DATETIME attribute
    int64_t getValueLong() const;
    double getValueDouble() const;
    /**
    * Get the value rendered as a string. String and JSON values are returned
    * as stored, numbers in decimal, byte arrays as lower case hex and
    * date/times as "yyyy-mm-dd HH:MM:SS" in UTC.
    * @returns value string
    */
    std::string getValueString() const;
    std::vector<unsigned char> getValueBytes() const;
    std::string getModuleName() const;

private:
    CorrBlackboardAttribute(const int attributeTypeID, const std::string& moduleName,
        CORR_BLACKBOARD_ATTRIBUTE_VALUE_TYPE valueType);

    int m_attributeTypeID;
    std::string m_moduleName;
    CORR_BLACKBOARD_ATTRIBUTE_VALUE_TYPE m_valueType;
    int m_valueInt;
    int64_t m_valueLong;
    double m_valueDouble;
    std::string m_valueString;
    std::vector<unsigned char> m_valueBytes;
};

#endif
