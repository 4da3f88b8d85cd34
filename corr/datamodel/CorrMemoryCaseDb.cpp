/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "CorrMemoryCaseDb.h"
#include "corr/utilities/CorrException.h"

#include <sstream>

using namespace std;

CorrMemoryCaseDb::CorrMemoryCaseDb() : m_caseOpen(false)
{
}

CorrMemoryCaseDb::~CorrMemoryCaseDb()
{
}

void CorrMemoryCaseDb::openCase(const string &uuid, const string &name)
{
    m_caseInfo.uuid = uuid;
    m_caseInfo.name = name;
    m_caseOpen = true;
}

void CorrMemoryCaseDb::closeCase()
{
    m_caseOpen = false;
    m_caseInfo = CorrCaseInfo();
}

bool CorrMemoryCaseDb::isCaseOpen() const
{
    return m_caseOpen;
}

void CorrMemoryCaseDb::addDataSource(const CorrDataSourceInfo &dataSource)
{
    m_dataSources[dataSource.objectId] = dataSource;
}

void CorrMemoryCaseDb::addFile(const CorrFile &file)
{
    m_files.erase(file.getId());
    m_files.insert(make_pair(file.getId(), file));
}

void CorrMemoryCaseDb::addArtifact(const CorrBlackboardArtifact &artifact)
{
    m_artifacts.erase(artifact.getArtifactID());
    m_artifacts.insert(make_pair(artifact.getArtifactID(), artifact));
}

vector<CorrBlackboardArtifact> CorrMemoryCaseDb::getArtifacts() const
{
    vector<CorrBlackboardArtifact> artifacts;
    for (map<uint64_t, CorrBlackboardArtifact>::const_iterator it = m_artifacts.begin(); it != m_artifacts.end(); ++it) {
        artifacts.push_back(it->second);
    }
    return artifacts;
}

vector<CorrFile> CorrMemoryCaseDb::getFiles() const
{
    vector<CorrFile> files;
    for (map<uint64_t, CorrFile>::const_iterator it = m_files.begin(); it != m_files.end(); ++it) {
        files.push_back(it->second);
    }
    return files;
}

CorrCaseInfo CorrMemoryCaseDb::getCaseInfo() const
{
    if (!m_caseOpen) {
        throw CorrCaseClosedException("No case is open");
    }
    return m_caseInfo;
}

CorrBlackboardArtifact CorrMemoryCaseDb::getArtifact(const uint64_t artifactId) const
{
    map<uint64_t, CorrBlackboardArtifact>::const_iterator it = m_artifacts.find(artifactId);
    if (it == m_artifacts.end()) {
        stringstream msg;
        msg << "No artifact with id " << artifactId;
        throw CorrNotFoundException(msg.str());
    }
    return it->second;
}

unique_ptr<CorrFile> CorrMemoryCaseDb::getFileById(const uint64_t fileId) const
{
    map<uint64_t, CorrFile>::const_iterator it = m_files.find(fileId);
    if (it == m_files.end()) {
        return unique_ptr<CorrFile>();
    }
    return unique_ptr<CorrFile>(new CorrFile(it->second));
}

CorrDataSourceInfo CorrMemoryCaseDb::getDataSource(const CorrFile &file) const
{
    map<uint64_t, CorrDataSourceInfo>::const_iterator it = m_dataSources.find(file.getDataSourceObjId());
    if (it == m_dataSources.end()) {
        stringstream msg;
        msg << "No data source with object id " << file.getDataSourceObjId()
            << " for file " << file.getId();
        throw CorrDatabaseException(msg.str());
    }
    return it->second;
}
