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
 * \file MemoryCorrelationStore.h
 * A correlation store kept in memory.
 */

#ifndef _CORR_MEMORY_CORRELATION_STORE_H
#define _CORR_MEMORY_CORRELATION_STORE_H

#include <map>

#include "CorrelationStore.h"

class CORR_API MemoryCorrelationStore : public CorrelationStore
{
public:
    /// Creates a store holding the default correlation types.
    MemoryCorrelationStore();
    virtual ~MemoryCorrelationStore();

    /**
     * Register a correlation type, replacing any with the same id.
     */
    void addCorrelationType(const CorrelationType &type);

    /**
     * Register a case. Registering a case again returns the existing record.
     */
    CorrelationCase newCase(const CorrCaseInfo &caseInfo);

    /**
     * Record an entry. The entry's case must be registered.
     * @throws CorrCentralRepoException if the case or type is unknown
     */
    void addAttributeInstance(const CorrelationEntry &entry);

    /// Number of entries recorded
    size_t getEntryCount() const;

    virtual CorrelationType getCorrelationTypeById(int typeId) const;
    virtual std::vector<CorrelationType> getDefinedCorrelationTypes() const;
    virtual std::unique_ptr<CorrelationCase> getCase(const CorrCaseInfo &caseInfo) const;
    virtual CorrelationDataSource getDataSource(const CorrelationCase &correlationCase,
                                                const CorrDataSourceInfo &dataSource);
    virtual std::unique_ptr<CorrelationEntry> getAttributeInstance(const CorrelationType &type,
        const CorrelationCase &correlationCase, const CorrelationDataSource &dataSource,
        uint64_t fileObjectId) const;
    virtual std::unique_ptr<CorrelationEntry> getAttributeInstance(const CorrelationType &type,
        const CorrelationCase &correlationCase, const CorrelationDataSource &dataSource,
        const std::string &value, const std::string &filePath) const;
    virtual long getCountUniqueCaseDataSourceTuplesHavingTypeValue(const CorrelationType &type,
        const std::string &value) const;

private:
    std::map<int, CorrelationType> m_types;
    std::map<std::string, CorrelationCase> m_cases;
    std::vector<CorrelationDataSource> m_dataSources;
    std::vector<CorrelationEntry> m_entries;
    int m_nextCaseId;
    int m_nextDataSourceId;
};

#endif
