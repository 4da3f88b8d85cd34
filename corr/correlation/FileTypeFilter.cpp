/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "FileTypeFilter.h"
#include "corr/services/CorrServices.h"

#include <sstream>

bool FileTypeFilter::isEligible(const CorrFile *file)
{
    if (file == NULL)
        return false;

    switch (file->getTypeId())
    {
    case CORR_FILE_TYPE_UNALLOC_BLOCKS:
    case CORR_FILE_TYPE_UNUSED_BLOCKS:
    case CORR_FILE_TYPE_SLACK:
    case CORR_FILE_TYPE_VIRTUAL_DIR:
    case CORR_FILE_TYPE_LOCAL_DIR:
        return false;
    case CORR_FILE_TYPE_CARVED:
    case CORR_FILE_TYPE_DERIVED:
    case CORR_FILE_TYPE_LOCAL:
    case CORR_FILE_TYPE_LAYOUT_FILE:
        return true;
    case CORR_FILE_TYPE_FS:
        return file->isMetaFlagSet(CORR_META_FLAG_ALLOC);
    default:
        {
            std::stringstream msg;
            msg << "FileTypeFilter::isEligible : unexpected file type " << file->getTypeId()
                << " for file " << file->getId();
            LOGWARN(msg.str());
            return false;
        }
    }
}
