/*
*
*  The Sleuth Kit
*
*  Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
*  Copyright (c) 2011-2012 Basis Technology Corporation. All Rights
*  reserved.
*
*  This software is distributed under the Common Public License 1.0
*/
#ifndef _CORR_EXTRACT_H
#define _CORR_EXTRACT_H

int corr_extract_main(int argc, char **argv);

#endif
