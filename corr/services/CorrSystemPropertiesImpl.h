/*
 *
 *  The Sleuth Kit
 *
 *  Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 *  Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 *  reserved.
 *
 *  This software is distributed under the Common Public License 1.0
 */

#ifndef _CORR_SYSTEMPROPERTIESIMPL_H
#define _CORR_SYSTEMPROPERTIESIMPL_H

#include <string>

#include "corr/corr_i.h"
#include "CorrSystemProperties.h"
#include "Poco/AutoPtr.h"
#include "Poco/Util/AbstractConfiguration.h"

/**
 * System properties kept in a Poco configuration. Either starts empty
 * or is read from a <CORR_CONFIG> document with one element per
 * property, e.g. <MIN_PHONE_NUMBER_LENGTH>7</MIN_PHONE_NUMBER_LENGTH>.
 * Elements that are not predefined properties are kept as custom
 * properties. One of the initialize() functions must be called first.
 */
class CORR_API CorrSystemPropertiesImpl : public CorrSystemProperties
{
public:
    CorrSystemPropertiesImpl() : m_config() {}

    /// Throws CorrSystemPropertiesException if the file is missing or is not well-formed XML.
    void initialize(const std::string &configFile);
    void initialize();

private:
    CorrSystemPropertiesImpl(const CorrSystemPropertiesImpl &);
    CorrSystemPropertiesImpl &operator=(const CorrSystemPropertiesImpl &);

    void checkInitialized(const char *caller) const;

    virtual void setProperty(const std::string &name, const std::string &value);
    virtual std::string getProperty(const std::string &name) const;

    Poco::AutoPtr<Poco::Util::AbstractConfiguration> m_config;
};

#endif
