/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _CORR_FILE_TYPE_FILTER_H
#define _CORR_FILE_TYPE_FILTER_H

#include "corr/corr_i.h"
#include "corr/datamodel/CorrFile.h"

/**
 * Decides which files can take part in file hash correlation.
 */
class CORR_API FileTypeFilter
{
public:
    /**
     * Carved, derived, local and layout files are eligible. File system
     * files are eligible when allocated. Unallocated and unused blocks,
     * slack, virtual directories and local directories are not.
     * @param file File to check, may be NULL.
     * @returns true if the file is eligible
     */
    static bool isEligible(const CorrFile *file);
};

#endif
