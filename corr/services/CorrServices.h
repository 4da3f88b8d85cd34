/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _CORR_SERVICES_H
#define _CORR_SERVICES_H

#include <memory>

#include "Log.h"
#include "corr/services/CorrSystemProperties.h"

/**
 * Process-wide registry for the log and the system properties used by
 * the correlation code. The case database and the correlation store
 * are handed to the Correlator directly and are not registered here.
 *
 * Until an application registers its own log or properties, a stderr
 * log and an in-memory property set are used.
 */
class CORR_API CorrServices
{
public:
    static CorrServices &Instance();

    Log &getLog();

    /**
     * Register the log for the process. The caller keeps ownership and
     * must call resetLog() before the log is destroyed.
     * Throws CorrException if a log is already registered.
     */
    void setLog(Log &log);
    void resetLog();

    CorrSystemProperties &getSystemProperties();

    /**
     * Register the system properties for the process. The caller keeps
     * ownership and must call resetSystemProperties() before they are
     * destroyed. Throws CorrException if properties are already
     * registered. The built-in defaults do not count as registered.
     */
    void setSystemProperties(CorrSystemProperties &systemProperties);
    void resetSystemProperties();

private:
    CorrServices();
    ~CorrServices();
    CorrServices(const CorrServices &);
    CorrServices &operator=(const CorrServices &);

    Log m_defaultLog;
    std::unique_ptr<CorrSystemProperties> m_defaultSystemProperties;

    Log *m_log;
    CorrSystemProperties *m_systemProperties;
};

inline void SetSystemProperty(CorrSystemProperties::PredefinedProperty prop, const std::string &value)
{
    CorrServices::Instance().getSystemProperties().set(prop, value);
}

inline void SetSystemProperty(const std::string &name, const std::string &value)
{
    CorrServices::Instance().getSystemProperties().set(name, value);
}

/**
 * Look up a property in the registered system properties, with macros
 * expanded. Throws CorrSystemPropertiesException for a required
 * property that has no value.
 */
inline std::string GetSystemProperty(CorrSystemProperties::PredefinedProperty prop)
{
    return CorrServices::Instance().getSystemProperties().get(prop);
}

inline std::string GetSystemProperty(const std::string &name)
{
    return CorrServices::Instance().getSystemProperties().get(name);
}

#endif
