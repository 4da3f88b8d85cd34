/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _CORR_I_H
#define _CORR_I_H

#include <stdlib.h>
#include <stdio.h>
#include <stdint.h>

#define CORR_VERSION_NUM 0x01000000
#define CORR_VERSION_STR "1.0.0"

#if defined(_WIN32) && !defined(CORR_STATIC)
#if defined(CORR_EXPORTS)
    #define CORR_API __declspec(dllexport)
#else
    #define CORR_API __declspec(dllimport)
#endif
// non-win32 or static library
#else
    #define CORR_API 
#endif

#if defined(_MSC_VER)
#pragma warning(disable:4251) // ... needs to have dll-interface warning
#endif

#endif
