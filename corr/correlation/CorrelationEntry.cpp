/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "CorrelationEntry.h"
#include "CorrelationNormalizer.h"

CorrelationEntry::CorrelationEntry(const CorrelationType &type, const std::string &value,
                                   const CorrelationCase &correlationCase,
                                   const CorrelationDataSource &dataSource,
                                   const std::string &filePath, const std::string &comment,
                                   CORR_KNOWN_STATUS knownStatus, uint64_t fileObjectId) :
    m_type(type),
    m_value(CorrelationNormalizer::normalize(type, value)),
    m_case(correlationCase),
    m_dataSource(dataSource),
    m_filePath(filePath),
    m_comment(comment),
    m_knownStatus(knownStatus),
    m_fileObjectId(fileObjectId)
{
}

const CorrelationType &CorrelationEntry::getCorrelationType() const
{
    return m_type;
}

const std::string &CorrelationEntry::getCorrelationValue() const
{
    return m_value;
}

const CorrelationCase &CorrelationEntry::getCorrelationCase() const
{
    return m_case;
}

const CorrelationDataSource &CorrelationEntry::getCorrelationDataSource() const
{
    return m_dataSource;
}

int CorrelationEntry::getCaseId() const
{
    return m_case.getId();
}

int CorrelationEntry::getDataSourceId() const
{
    return m_dataSource.getId();
}

const std::string &CorrelationEntry::getFilePath() const
{
    return m_filePath;
}

const std::string &CorrelationEntry::getComment() const
{
    return m_comment;
}

CORR_KNOWN_STATUS CorrelationEntry::getKnownStatus() const
{
    return m_knownStatus;
}

uint64_t CorrelationEntry::getFileObjectId() const
{
    return m_fileObjectId;
}

bool CorrelationEntry::operator==(const CorrelationEntry &other) const
{
    return m_type.getId() == other.m_type.getId()
        && m_value == other.m_value
        && m_case == other.m_case
        && m_dataSource == other.m_dataSource
        && m_filePath == other.m_filePath
        && m_comment == other.m_comment
        && m_knownStatus == other.m_knownStatus
        && m_fileObjectId == other.m_fileObjectId;
}
