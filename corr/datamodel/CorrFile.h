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
 * \file CorrFile.h
 * Contains the definition for the CorrFile class and the file
 * classification enums.
 */

#ifndef _CORR_FILE_H
#define _CORR_FILE_H

#include <string>

#include "corr/corr_i.h"

/**
 * High-level file type. Matches the ids used by the case database.
 */
enum CORR_FILE_TYPE {
    CORR_FILE_TYPE_FS = 0,              ///< File system file
    CORR_FILE_TYPE_CARVED = 1,          ///< Carved file
    CORR_FILE_TYPE_DERIVED = 2,         ///< File derived from another file (extracted, decoded)
    CORR_FILE_TYPE_LOCAL = 3,           ///< File added from the local file system
    CORR_FILE_TYPE_UNALLOC_BLOCKS = 4,  ///< Set of unallocated blocks
    CORR_FILE_TYPE_UNUSED_BLOCKS = 5,   ///< Set of unused blocks
    CORR_FILE_TYPE_VIRTUAL_DIR = 6,     ///< Virtual directory grouping other content
    CORR_FILE_TYPE_SLACK = 7,           ///< File slack space
    CORR_FILE_TYPE_LOCAL_DIR = 8,       ///< Directory added from the local file system
    CORR_FILE_TYPE_LAYOUT_FILE = 9      ///< File defined by a layout of ranges
};

/**
 * Metadata flags.
 */
enum CORR_META_FLAG {
    CORR_META_FLAG_ALLOC = 0x01,    ///< Metadata structure is currently in an allocated state
    CORR_META_FLAG_UNALLOC = 0x02,  ///< Metadata structure is currently in an unallocated state
    CORR_META_FLAG_USED = 0x04,     ///< Metadata structure has been allocated at least once
    CORR_META_FLAG_UNUSED = 0x08,   ///< Metadata structure has never been allocated
    CORR_META_FLAG_COMP = 0x10,     ///< The file contents are compressed
    CORR_META_FLAG_ORPHAN = 0x20    ///< Return only orphan files
};

/**
 * Known status of a file or correlation entry.
 */
enum CORR_KNOWN_STATUS {
    CORR_KNOWN_UNKNOWN = 0,
    CORR_KNOWN_KNOWN = 1,
    CORR_KNOWN_BAD = 2,
    CORR_KNOWN_GOOD = 3
};

/**
 * A file record from the case database.
 */
class CORR_API CorrFile
{
public:
    CorrFile(const uint64_t id, const std::string &name, const std::string &parentPath,
             const int type, const int metaFlags, const std::string &md5,
             const uint64_t dataSourceObjId);
    ~CorrFile();

    /** Returns the file id.
     */
    uint64_t getId() const;

    /** Get the name
     */
    std::string getName() const;

    /** Get the path of the parent directory, with a trailing separator
     */
    std::string getParentPath() const;

    /**
     * Get the high-level type (file system, local, carved, etc.). Kept as
     * an int since case databases may hold types this library does not know.
     */
    int getTypeId() const;

    /** Get the metadata flags
    */
    int getMetaFlags() const;

    /** Returns true if the given metadata flag is set
     */
    bool isMetaFlagSet(CORR_META_FLAG flag) const;

    /** Get the MD5 hash, empty if it was never computed
     */
    std::string getMd5() const;

    /** Get the object id of the data source the file belongs to
     */
    uint64_t getDataSourceObjId() const;

    /**
     * Get the full path of the file: parent path followed by the name.
     * @returns full path
     */
    std::string getFullPath() const;

private:
    uint64_t m_id;
    std::string m_name;
    std::string m_parentPath;
    int m_type;
    int m_metaFlags;
    std::string m_md5;
    uint64_t m_dataSourceObjId;
};

#endif
