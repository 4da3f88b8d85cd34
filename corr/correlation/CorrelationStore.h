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
 * \file CorrelationStore.h
 * Interface to the central store that correlation entries from many cases
 * are kept in.
 */

#ifndef _CORR_CORRELATION_STORE_H
#define _CORR_CORRELATION_STORE_H

#include <string>
#include <vector>
#include <memory>

#include "corr/corr_i.h"
#include "corr/datamodel/CorrCaseDb.h"
#include "CorrelationType.h"
#include "CorrelationCase.h"
#include "CorrelationDataSource.h"
#include "CorrelationEntry.h"

/**
 * Implementations report failures with CorrCentralRepoException. Methods
 * that take a value normalize it first and may throw
 * CorrNormalizationException.
 */
class CORR_API CorrelationStore
{
public:
    virtual ~CorrelationStore() {}

    /**
     * Get a correlation type by id.
     * @throws CorrCentralRepoException if no type has that id
     */
    virtual CorrelationType getCorrelationTypeById(int typeId) const = 0;

    /// All correlation types known to the store, ordered by id.
    virtual std::vector<CorrelationType> getDefinedCorrelationTypes() const = 0;

    /**
     * Get the store's record of a case.
     * @returns the case, or an empty pointer if the case is not registered
     */
    virtual std::unique_ptr<CorrelationCase> getCase(const CorrCaseInfo &caseInfo) const = 0;

    /**
     * Get the store's record of a data source of a case, registering the
     * data source if the store has not seen it.
     */
    virtual CorrelationDataSource getDataSource(const CorrelationCase &correlationCase,
                                                const CorrDataSourceInfo &dataSource) = 0;

    /**
     * Find the entry of a type recorded for a file object.
     * @returns the entry, or an empty pointer if there is none
     */
    virtual std::unique_ptr<CorrelationEntry> getAttributeInstance(const CorrelationType &type,
        const CorrelationCase &correlationCase, const CorrelationDataSource &dataSource,
        uint64_t fileObjectId) const = 0;

    /**
     * Find the entry of a type recorded for a value and file path. Paths
     * compare without regard to case.
     * @returns the entry, or an empty pointer if there is none
     */
    virtual std::unique_ptr<CorrelationEntry> getAttributeInstance(const CorrelationType &type,
        const CorrelationCase &correlationCase, const CorrelationDataSource &dataSource,
        const std::string &value, const std::string &filePath) const = 0;

    /**
     * Count the distinct (case, data source) pairs that hold an entry of
     * the given type and value.
     */
    virtual long getCountUniqueCaseDataSourceTuplesHavingTypeValue(const CorrelationType &type,
        const std::string &value) const = 0;
};

#endif
