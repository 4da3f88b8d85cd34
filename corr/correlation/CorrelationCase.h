/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _CORR_CORRELATION_CASE_H
#define _CORR_CORRELATION_CASE_H

#include <string>

#include "corr/corr_i.h"

/**
 * A case as registered in a correlation store.
 */
class CorrelationCase
{
public:
    CorrelationCase(int id, const std::string &caseUuid, const std::string &displayName) :
        m_id(id), m_caseUuid(caseUuid), m_displayName(displayName) {}

    /// Id assigned by the correlation store
    int getId() const { return m_id; }
    const std::string &getCaseUuid() const { return m_caseUuid; }
    const std::string &getDisplayName() const { return m_displayName; }

    bool operator==(const CorrelationCase &other) const
    {
        return m_id == other.m_id && m_caseUuid == other.m_caseUuid;
    }

private:
    int m_id;
    std::string m_caseUuid;
    std::string m_displayName;
};

#endif
