/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _CORR_CORRELATION_DATASOURCE_H
#define _CORR_CORRELATION_DATASOURCE_H

#include <string>

#include "corr/corr_i.h"

/**
 * A data source as registered in a correlation store. The data source
 * object id ties it back to the data source in the case database.
 */
class CorrelationDataSource
{
public:
    CorrelationDataSource(int id, int caseId, const std::string &deviceId,
                          const std::string &name, uint64_t dataSourceObjId) :
        m_id(id), m_caseId(caseId), m_deviceId(deviceId), m_name(name),
        m_dataSourceObjId(dataSourceObjId) {}

    int getId() const { return m_id; }
    int getCaseId() const { return m_caseId; }
    const std::string &getDeviceId() const { return m_deviceId; }
    const std::string &getName() const { return m_name; }
    uint64_t getDataSourceObjId() const { return m_dataSourceObjId; }

    bool operator==(const CorrelationDataSource &other) const
    {
        return m_id == other.m_id && m_caseId == other.m_caseId
            && m_deviceId == other.m_deviceId
            && m_dataSourceObjId == other.m_dataSourceObjId;
    }

private:
    int m_id;
    int m_caseId;
    std::string m_deviceId;
    std::string m_name;
    uint64_t m_dataSourceObjId;
};

#endif
