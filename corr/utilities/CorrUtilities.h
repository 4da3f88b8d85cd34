/*
 *
 *  The Sleuth Kit
 *
 *  Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 *  Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 *  reserved.
 *
 *  This software is distributed under the Common Public License 1.0
 */

#ifndef _CORR_UTILITIES_H
#define _CORR_UTILITIES_H

#include <string>

#include "corr/corr_i.h"

/**
 * Helpers shared by the services and data model code.
 */
class CORR_API CorrUtilities
{
public:
    static std::string toUTF8(const std::wstring& wideStr);

    /// Directory of the running executable with a trailing separator,
    /// or empty if it cannot be determined. Expands #PROG_DIR#.
    static std::string getProgDir();

    /**
     * Tests whether an MD5 hash is the hash of zero bytes of input. Such a
     * hash is computed for every empty file and says nothing about content.
     * @param md5 Hex encoded MD5, any case.
     * @returns true if md5 is the "no data" hash.
     */
    static bool isNoDataMd5(const std::string& md5);

    /**
     * Builds the full path of a file from its parent path and name.
     * A '/' is put between them unless the parent path is empty or
     * already ends in one.
     * @param parentPath Parent path, normally ending in '/'.
     * @param name File name.
     */
    static std::string makeFullPath(const std::string& parentPath, const std::string& name);

    /// Hash of zero bytes of data.
    static const std::string NO_DATA_MD5;
};

#endif
