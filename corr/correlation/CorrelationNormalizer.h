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
 * \file CorrelationNormalizer.h
 * Validation and normalization of correlation attribute values.
 */

#ifndef _CORR_CORRELATION_NORMALIZER_H
#define _CORR_CORRELATION_NORMALIZER_H

#include <string>

#include "corr/corr_i.h"
#include "CorrelationType.h"

/**
 * Puts correlation values into the canonical form they are stored and
 * compared in. Values are trimmed and then handled per type:
 *
 * - Files: lower case, 32 hex digits
 * - Domains: lower case, a DNS name or an IP address
 * - Email: lower case, local@domain.tld
 * - Phone: digits, ()- and white space with an optional leading '+';
 *   everything other than digits and '+' is removed
 * - USB device id: unchanged
 * - SSID: unchanged, at most 32 characters
 * - MAC: lower case without ':', '-' or '.', 12 or 16 hex digits
 * - IMEI: spaces and dashes removed, 14 to 16 digits
 * - IMSI: spaces and dashes removed, 14 or 15 digits
 * - ICCID: spaces and dashes removed, lower case, "89" followed by
 *   17 to 22 of [0-9f]
 *
 * Values of custom types are only trimmed.
 */
class CORR_API CorrelationNormalizer
{
public:
    /**
     * Normalize a value for the given type.
     * @param type Correlation type the value belongs to.
     * @param value Value to normalize.
     * @returns the normalized value
     * @throws CorrNormalizationException if the value is empty or not
     * valid for the type
     */
    static std::string normalize(const CorrelationType &type, const std::string &value);

    /**
     * Normalize a value for the type with the given id.
     * @throws CorrNormalizationException as for normalize()
     */
    static std::string normalize(int typeId, const std::string &value);

    /// Maximum length of a wireless network name.
    static const std::string::size_type MAX_SSID_LENGTH = 32;
};

#endif
