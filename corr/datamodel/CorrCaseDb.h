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
 * \file CorrCaseDb.h
 * Interface to the case database that holds the artifacts and files
 * correlation attributes are derived from.
 */

#ifndef _CORR_CASEDB_H
#define _CORR_CASEDB_H

#include <string>
#include <memory>

#include "corr/corr_i.h"
#include "CorrBlackboardArtifact.h"
#include "CorrFile.h"

/**
 * Contains data from a data source record in the case database.
 */
struct CorrDataSourceInfo
{
    uint64_t objectId;
    std::string deviceId;
    std::string name;
};

/**
 * Identity of the case currently open in the case database.
 */
struct CorrCaseInfo
{
    std::string uuid;
    std::string name;
};

/**
 * Read access to the case database. Implementations report failures with
 * CorrDatabaseException and report the absence of an open case with
 * CorrCaseClosedException.
 */
class CORR_API CorrCaseDb
{
public:
    virtual ~CorrCaseDb() {}

    /**
     * Get the case that is currently open.
     * @throws CorrCaseClosedException if no case is open
     */
    virtual CorrCaseInfo getCaseInfo() const = 0;

    /**
     * Get an artifact by id.
     * @throws CorrNotFoundException if there is no such artifact
     * @throws CorrDatabaseException on other failures
     */
    virtual CorrBlackboardArtifact getArtifact(const uint64_t artifactId) const = 0;

    /**
     * Get a file by object id.
     * @returns the file, or an empty pointer if no file has that id
     * @throws CorrDatabaseException on failure
     */
    virtual std::unique_ptr<CorrFile> getFileById(const uint64_t fileId) const = 0;

    /**
     * Get the data source that a file belongs to.
     * @throws CorrDatabaseException if it cannot be found
     */
    virtual CorrDataSourceInfo getDataSource(const CorrFile &file) const = 0;
};

#endif
