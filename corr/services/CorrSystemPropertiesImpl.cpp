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

#include "CorrSystemPropertiesImpl.h"

#include "corr/utilities/CorrException.h"
#include "Poco/Exception.h"
#include "Poco/SAX/SAXException.h"
#include "Poco/Util/XMLConfiguration.h"
#include "Poco/Util/MapConfiguration.h"

void CorrSystemPropertiesImpl::initialize(const std::string &configFile)
{
    try {
        m_config = new Poco::Util::XMLConfiguration(configFile);
    }
    catch (const Poco::FileNotFoundException &) {
        throw CorrSystemPropertiesException("CorrSystemPropertiesImpl::initialize - no configuration file at " + configFile);
    }
    catch (const Poco::XML::SAXParseException &ex) {
        throw CorrSystemPropertiesException("CorrSystemPropertiesImpl::initialize - " + configFile
            + " is not a valid configuration file: " + ex.displayText());
    }
}

void CorrSystemPropertiesImpl::initialize()
{
    m_config = new Poco::Util::MapConfiguration();
}

void CorrSystemPropertiesImpl::checkInitialized(const char *caller) const
{
    if (m_config.isNull()) {
        throw CorrSystemPropertiesException(std::string(caller) + " - system properties used before initialize()");
    }
}

void CorrSystemPropertiesImpl::setProperty(const std::string &name, const std::string &value)
{
    checkInitialized("CorrSystemPropertiesImpl::set");
    m_config->setString(name, value);
}

std::string CorrSystemPropertiesImpl::getProperty(const std::string &name) const
{
    checkInitialized("CorrSystemPropertiesImpl::get");

    // unset properties read as empty
    return m_config->getString(name, "");
}
