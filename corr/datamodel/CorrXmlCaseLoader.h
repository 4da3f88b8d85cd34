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
 * \file CorrXmlCaseLoader.h
 * Loads a case description file into a CorrMemoryCaseDb.
 */

#ifndef _CORR_XML_CASE_LOADER_H
#define _CORR_XML_CASE_LOADER_H

#include <string>

#include "corr/corr_i.h"
#include "CorrMemoryCaseDb.h"

/**
 * Reads case description documents of the form:
 *
 * \verbatim
   <CORR_CASE uuid="..." name="...">
     <DATA_SOURCE id="1" device_id="..." name="..."/>
     <FILE id="10" data_source="1" name="a.db" parent_path="/data/"
           type="FS" meta_flags="ALLOC" md5="..."/>
     <ARTIFACT id="100" obj_id="10" type="TSK_CONTACT">
       <ATTRIBUTE type="TSK_PHONE_NUMBER" value_type="STRING">+1 555</ATTRIBUTE>
     </ARTIFACT>
   </CORR_CASE>
   \endverbatim
 *
 * Artifact and attribute types are given by their TSK_* names. File types
 * are FS, CARVED, DERIVED, LOCAL, UNALLOC_BLOCKS, UNUSED_BLOCKS,
 * VIRTUAL_DIR, SLACK, LOCAL_DIR or LAYOUT_FILE. Meta flags are a '|'
 * separated list of ALLOC, UNALLOC, USED, UNUSED, COMP and ORPHAN. Value
 * types are STRING (the default), INTEGER, LONG, DOUBLE, BYTE (hex text),
 * DATETIME (seconds since the epoch) and JSON.
 */
class CORR_API CorrXmlCaseLoader
{
public:
    static const std::string CASE_ELEMENT;
    static const std::string DATA_SOURCE_ELEMENT;
    static const std::string FILE_ELEMENT;
    static const std::string ARTIFACT_ELEMENT;
    static const std::string ATTRIBUTE_ELEMENT;

    /**
     * Load a case description file. On success the contents of caseDb
     * are replaced by the case the file describes, which is left open.
     * On failure caseDb is unchanged.
     * @param path Path of the XML file.
     * @param caseDb Database to load the case into.
     * @throws CorrCaseFileException if the file cannot be read, is not
     * well formed or describes something invalid.
     */
    static void loadFile(const std::string &path, CorrMemoryCaseDb &caseDb);

    /**
     * Load a case description held in a string.
     * @throws CorrCaseFileException as for loadFile()
     */
    static void loadString(const std::string &xml, CorrMemoryCaseDb &caseDb);
};

#endif
