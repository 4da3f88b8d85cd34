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

#ifndef _CORR_H
#define _CORR_H

/**
 * Include this file when incorporating the correlation library into an
 * application.
 */

#include "corr/corr_i.h"

#include "corr/services/CorrServices.h"
#include "corr/services/Log.h"
#include "corr/services/CorrSystemProperties.h"
#include "corr/services/CorrSystemPropertiesImpl.h"
#include "corr/utilities/CorrException.h"
#include "corr/utilities/CorrUtilities.h"
#include "corr/datamodel/CorrBlackboard.h"
#include "corr/datamodel/CorrBlackboardArtifact.h"
#include "corr/datamodel/CorrBlackboardAttribute.h"
#include "corr/datamodel/CorrFile.h"
#include "corr/datamodel/CorrCaseDb.h"
#include "corr/datamodel/CorrMemoryCaseDb.h"
#include "corr/datamodel/CorrXmlCaseLoader.h"
#include "corr/correlation/CorrelationType.h"
#include "corr/correlation/CorrelationNormalizer.h"
#include "corr/correlation/CorrelationCase.h"
#include "corr/correlation/CorrelationDataSource.h"
#include "corr/correlation/CorrelationEntry.h"
#include "corr/correlation/CorrelationStore.h"
#include "corr/correlation/MemoryCorrelationStore.h"
#include "corr/correlation/FileTypeFilter.h"
#include "corr/correlation/Correlator.h"

#endif
