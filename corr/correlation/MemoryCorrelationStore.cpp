/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "MemoryCorrelationStore.h"
#include "CorrelationNormalizer.h"
#include "corr/utilities/CorrException.h"

#include <set>
#include <sstream>

#include "Poco/String.h"

MemoryCorrelationStore::MemoryCorrelationStore() :
    m_nextCaseId(1),
    m_nextDataSourceId(1)
{
    std::vector<CorrelationType> types = CorrelationType::getDefaultCorrelationTypes();
    for (std::vector<CorrelationType>::const_iterator it = types.begin(); it != types.end(); ++it)
    {
        addCorrelationType(*it);
    }
}

MemoryCorrelationStore::~MemoryCorrelationStore()
{
}

void MemoryCorrelationStore::addCorrelationType(const CorrelationType &type)
{
    m_types.erase(type.getId());
    m_types.insert(std::make_pair(type.getId(), type));
}

CorrelationCase MemoryCorrelationStore::newCase(const CorrCaseInfo &caseInfo)
{
    std::map<std::string, CorrelationCase>::const_iterator it = m_cases.find(caseInfo.uuid);
    if (it != m_cases.end())
        return it->second;

    CorrelationCase correlationCase(m_nextCaseId++, caseInfo.uuid, caseInfo.name);
    m_cases.insert(std::make_pair(caseInfo.uuid, correlationCase));
    return correlationCase;
}

void MemoryCorrelationStore::addAttributeInstance(const CorrelationEntry &entry)
{
    // Both throw if the store does not know them.
    getCorrelationTypeById(entry.getCorrelationType().getId());
    if (m_cases.find(entry.getCorrelationCase().getCaseUuid()) == m_cases.end())
    {
        std::stringstream msg;
        msg << "MemoryCorrelationStore::addAttributeInstance : case "
            << entry.getCorrelationCase().getCaseUuid() << " is not registered";
        throw CorrCentralRepoException(msg.str());
    }
    m_entries.push_back(entry);
}

size_t MemoryCorrelationStore::getEntryCount() const
{
    return m_entries.size();
}

CorrelationType MemoryCorrelationStore::getCorrelationTypeById(int typeId) const
{
    std::map<int, CorrelationType>::const_iterator it = m_types.find(typeId);
    if (it == m_types.end())
    {
        std::stringstream msg;
        msg << "MemoryCorrelationStore::getCorrelationTypeById : no correlation type with id " << typeId;
        throw CorrCentralRepoException(msg.str());
    }
    return it->second;
}

std::vector<CorrelationType> MemoryCorrelationStore::getDefinedCorrelationTypes() const
{
    std::vector<CorrelationType> types;
    for (std::map<int, CorrelationType>::const_iterator it = m_types.begin(); it != m_types.end(); ++it)
    {
        types.push_back(it->second);
    }
    return types;
}

std::unique_ptr<CorrelationCase> MemoryCorrelationStore::getCase(const CorrCaseInfo &caseInfo) const
{
    std::map<std::string, CorrelationCase>::const_iterator it = m_cases.find(caseInfo.uuid);
    if (it == m_cases.end())
        return std::unique_ptr<CorrelationCase>();
    return std::unique_ptr<CorrelationCase>(new CorrelationCase(it->second));
}

CorrelationDataSource MemoryCorrelationStore::getDataSource(const CorrelationCase &correlationCase,
                                                            const CorrDataSourceInfo &dataSource)
{
    for (std::vector<CorrelationDataSource>::const_iterator it = m_dataSources.begin(); it != m_dataSources.end(); ++it)
    {
        if (it->getCaseId() == correlationCase.getId()
            && it->getDataSourceObjId() == dataSource.objectId
            && it->getDeviceId() == dataSource.deviceId)
        {
            return *it;
        }
    }

    CorrelationDataSource newDataSource(m_nextDataSourceId++, correlationCase.getId(),
                                        dataSource.deviceId, dataSource.name, dataSource.objectId);
    m_dataSources.push_back(newDataSource);
    return newDataSource;
}

std::unique_ptr<CorrelationEntry> MemoryCorrelationStore::getAttributeInstance(const CorrelationType &type,
    const CorrelationCase &correlationCase, const CorrelationDataSource &dataSource,
    uint64_t fileObjectId) const
{
    for (std::vector<CorrelationEntry>::const_iterator it = m_entries.begin(); it != m_entries.end(); ++it)
    {
        if (it->getCorrelationType().getId() == type.getId()
            && it->getCaseId() == correlationCase.getId()
            && it->getDataSourceId() == dataSource.getId()
            && it->getFileObjectId() == fileObjectId)
        {
            return std::unique_ptr<CorrelationEntry>(new CorrelationEntry(*it));
        }
    }
    return std::unique_ptr<CorrelationEntry>();
}

std::unique_ptr<CorrelationEntry> MemoryCorrelationStore::getAttributeInstance(const CorrelationType &type,
    const CorrelationCase &correlationCase, const CorrelationDataSource &dataSource,
    const std::string &value, const std::string &filePath) const
{
    const std::string normalized = CorrelationNormalizer::normalize(type, value);
    for (std::vector<CorrelationEntry>::const_iterator it = m_entries.begin(); it != m_entries.end(); ++it)
    {
        if (it->getCorrelationType().getId() == type.getId()
            && it->getCaseId() == correlationCase.getId()
            && it->getDataSourceId() == dataSource.getId()
            && it->getCorrelationValue() == normalized
            && Poco::icompare(it->getFilePath(), filePath) == 0)
        {
            return std::unique_ptr<CorrelationEntry>(new CorrelationEntry(*it));
        }
    }
    return std::unique_ptr<CorrelationEntry>();
}

long MemoryCorrelationStore::getCountUniqueCaseDataSourceTuplesHavingTypeValue(const CorrelationType &type,
    const std::string &value) const
{
    const std::string normalized = CorrelationNormalizer::normalize(type, value);
    std::set<std::pair<int, int> > tuples;
    for (std::vector<CorrelationEntry>::const_iterator it = m_entries.begin(); it != m_entries.end(); ++it)
    {
        if (it->getCorrelationType().getId() == type.getId()
            && it->getCorrelationValue() == normalized)
        {
            tuples.insert(std::make_pair(it->getCaseId(), it->getDataSourceId()));
        }
    }
    return static_cast<long>(tuples.size());
}
