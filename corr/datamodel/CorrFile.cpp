/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "CorrFile.h"
#include "corr/utilities/CorrUtilities.h"

CorrFile::CorrFile(const uint64_t id, const std::string &name, const std::string &parentPath,
                   const int type, const int metaFlags, const std::string &md5,
                   const uint64_t dataSourceObjId) :
    m_id(id),
    m_name(name),
    m_parentPath(parentPath),
    m_type(type),
    m_metaFlags(metaFlags),
    m_md5(md5),
    m_dataSourceObjId(dataSourceObjId)
{
}

CorrFile::~CorrFile()
{
}

uint64_t CorrFile::getId() const
{
    return m_id;
}

std::string CorrFile::getName() const
{
    return m_name;
}

std::string CorrFile::getParentPath() const
{
    return m_parentPath;
}

int CorrFile::getTypeId() const
{
    return m_type;
}

int CorrFile::getMetaFlags() const
{
    return m_metaFlags;
}

bool CorrFile::isMetaFlagSet(CORR_META_FLAG flag) const
{
    return (m_metaFlags & flag) != 0;
}

std::string CorrFile::getMd5() const
{
    return m_md5;
}

uint64_t CorrFile::getDataSourceObjId() const
{
    return m_dataSourceObjId;
}

std::string CorrFile::getFullPath() const
{
    return CorrUtilities::makeFullPath(m_parentPath, m_name);
}
