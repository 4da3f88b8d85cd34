/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "CorrServices.h"
#include "corr/utilities/CorrException.h"
#include "corr/services/CorrSystemPropertiesImpl.h"

CorrServices::CorrServices()
    : m_defaultLog(), m_defaultSystemProperties(), m_log(NULL), m_systemProperties(NULL)
{
}

CorrServices::~CorrServices()
{
}

CorrServices &CorrServices::Instance()
{
    static CorrServices services;
    return services;
}

Log &CorrServices::getLog()
{
    return m_log ? *m_log : m_defaultLog;
}

void CorrServices::setLog(Log &log)
{
    if (m_log) {
        LOGERROR("CorrServices::setLog - a log is already registered.");
        throw CorrException("CorrServices::setLog - a log is already registered.");
    }
    m_log = &log;
}

void CorrServices::resetLog()
{
    m_log = NULL;
}

CorrSystemProperties &CorrServices::getSystemProperties()
{
    if (m_systemProperties) {
        return *m_systemProperties;
    }

    if (!m_defaultSystemProperties) {
        CorrSystemPropertiesImpl *defaults = new CorrSystemPropertiesImpl();
        defaults->initialize();
        m_defaultSystemProperties.reset(defaults);
        LOGINFO("CorrServices::getSystemProperties - no system properties registered, using built-in defaults.");
    }
    return *m_defaultSystemProperties;
}

void CorrServices::setSystemProperties(CorrSystemProperties &systemProperties)
{
    if (m_systemProperties) {
        LOGERROR("CorrServices::setSystemProperties - system properties are already registered.");
        throw CorrException("CorrServices::setSystemProperties - system properties are already registered.");
    }
    m_systemProperties = &systemProperties;
}

void CorrServices::resetSystemProperties()
{
    m_systemProperties = NULL;
}
