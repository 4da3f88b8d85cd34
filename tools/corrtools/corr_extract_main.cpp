/*
*
*  The Sleuth Kit
*
*  Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
*  Copyright (c) 2011-2012 Basis Technology Corporation. All Rights
*  reserved.
*
*  This software is distributed under the Common Public License 1.0
*
*  corr_extract - derive correlation entries from a case file.
*       - This is main() that gets linked for the stand-alone program
*/
#include "corr_extract.h"

int
main(int argc, char **argv)
{
    return corr_extract_main(argc, argv);
}
