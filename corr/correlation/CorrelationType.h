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
 * \file CorrelationType.h
 * Contains the definition for the CorrelationType class.
 */

#ifndef _CORR_CORRELATION_TYPE_H
#define _CORR_CORRELATION_TYPE_H

#include <string>
#include <vector>

#include "corr/corr_i.h"

/**
 * Describes a kind of correlation attribute (file hash, email address,
 * phone number, ...) as it is registered in a correlation store.
 */
class CORR_API CorrelationType
{
public:
    /**
     * Ids of the default correlation types. Custom types use ids above
     * ICCID_TYPE_ID.
     */
    enum TypeId {
        FILES_TYPE_ID = 0,
        DOMAIN_TYPE_ID = 1,
        EMAIL_TYPE_ID = 2,
        PHONE_TYPE_ID = 3,
        USBID_TYPE_ID = 4,
        SSID_TYPE_ID = 5,
        MAC_TYPE_ID = 6,
        IMEI_TYPE_ID = 7,
        IMSI_TYPE_ID = 8,
        ICCID_TYPE_ID = 9
    };

    /**
     * @param id Type id.
     * @param displayName Name shown to users.
     * @param dbTableName Name of the table holding instances of the type.
     * Must be non-empty lower case letters, digits and underscores.
     * @param supported Whether the type can be correlated.
     * @param enabled Whether correlation of the type is switched on.
     * @throws CorrCentralRepoException if dbTableName is invalid
     */
    CorrelationType(int id, const std::string &displayName, const std::string &dbTableName,
                    bool supported, bool enabled);

    int getId() const { return m_id; }
    const std::string &getDisplayName() const { return m_displayName; }
    const std::string &getDbTableName() const { return m_dbTableName; }
    bool isSupported() const { return m_supported; }
    bool isEnabled() const { return m_enabled; }

    bool operator==(const CorrelationType &other) const;
    bool operator!=(const CorrelationType &other) const { return !(*this == other); }

    /**
     * The ten built in types with their default supported and enabled
     * settings, ordered by id.
     */
    static std::vector<CorrelationType> getDefaultCorrelationTypes();

private:
    int m_id;
    std::string m_displayName;
    std::string m_dbTableName;
    bool m_supported;
    bool m_enabled;
};

#endif
