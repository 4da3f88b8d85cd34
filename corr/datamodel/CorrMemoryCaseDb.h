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
 * \file CorrMemoryCaseDb.h
 * A case database kept in memory. Used by the command line tools, which
 * load it from a case description file, and by tests.
 */

#ifndef _CORR_MEMORY_CASEDB_H
#define _CORR_MEMORY_CASEDB_H

#include <map>
#include <vector>

#include "CorrCaseDb.h"

class CORR_API CorrMemoryCaseDb : public CorrCaseDb
{
public:
    CorrMemoryCaseDb();
    virtual ~CorrMemoryCaseDb();

    void openCase(const std::string &uuid, const std::string &name);
    void closeCase();
    bool isCaseOpen() const;

    /// Adds a data source, replacing any with the same object id.
    void addDataSource(const CorrDataSourceInfo &dataSource);
    /// Adds a file, replacing any with the same id.
    void addFile(const CorrFile &file);
    /// Adds an artifact, replacing any with the same id.
    void addArtifact(const CorrBlackboardArtifact &artifact);

    /// All artifacts ordered by id.
    std::vector<CorrBlackboardArtifact> getArtifacts() const;
    /// All files ordered by id.
    std::vector<CorrFile> getFiles() const;

    virtual CorrCaseInfo getCaseInfo() const;
    virtual CorrBlackboardArtifact getArtifact(const uint64_t artifactId) const;
    virtual std::unique_ptr<CorrFile> getFileById(const uint64_t fileId) const;
    virtual CorrDataSourceInfo getDataSource(const CorrFile &file) const;

private:
    bool m_caseOpen;
    CorrCaseInfo m_caseInfo;
    std::map<uint64_t, CorrDataSourceInfo> m_dataSources;
    std::map<uint64_t, CorrFile> m_files;
    std::map<uint64_t, CorrBlackboardArtifact> m_artifacts;
};

#endif
