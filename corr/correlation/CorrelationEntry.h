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
 * \file CorrelationEntry.h
 * Contains the definition for the CorrelationEntry class.
 */

#ifndef _CORR_CORRELATION_ENTRY_H
#define _CORR_CORRELATION_ENTRY_H

#include <string>

#include "corr/corr_i.h"
#include "corr/datamodel/CorrFile.h"
#include "CorrelationType.h"
#include "CorrelationCase.h"
#include "CorrelationDataSource.h"

/**
 * One occurrence of a correlation value: the value, its type, and the
 * case, data source and file it was found in.
 */
class CORR_API CorrelationEntry
{
public:
    /**
     * @param type Correlation type of the value.
     * @param value Value, normalized here for the type.
     * @param correlationCase Case the value was found in.
     * @param dataSource Data source the value was found in.
     * @param filePath Full path of the file the value was found in.
     * @param comment Examiner comment.
     * @param knownStatus Known status of the value.
     * @param fileObjectId Id of the file in the case database.
     * @throws CorrNormalizationException if the value is not valid for
     * the type
     */
    CorrelationEntry(const CorrelationType &type, const std::string &value,
                     const CorrelationCase &correlationCase,
                     const CorrelationDataSource &dataSource,
                     const std::string &filePath, const std::string &comment,
                     CORR_KNOWN_STATUS knownStatus, uint64_t fileObjectId);

    const CorrelationType &getCorrelationType() const;
    /// The normalized value
    const std::string &getCorrelationValue() const;
    const CorrelationCase &getCorrelationCase() const;
    const CorrelationDataSource &getCorrelationDataSource() const;
    int getCaseId() const;
    int getDataSourceId() const;
    const std::string &getFilePath() const;
    const std::string &getComment() const;
    CORR_KNOWN_STATUS getKnownStatus() const;
    uint64_t getFileObjectId() const;

    bool operator==(const CorrelationEntry &other) const;
    bool operator!=(const CorrelationEntry &other) const { return !(*this == other); }

private:
    CorrelationType m_type;
    std::string m_value;
    CorrelationCase m_case;
    CorrelationDataSource m_dataSource;
    std::string m_filePath;
    std::string m_comment;
    CORR_KNOWN_STATUS m_knownStatus;
    uint64_t m_fileObjectId;
};

#endif
