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
 * \file Correlator.h
 * Derives correlation entries from blackboard artifacts and files.
 */

#ifndef _CORR_CORRELATOR_H
#define _CORR_CORRELATOR_H

#include <string>
#include <vector>
#include <memory>

#include "corr/corr_i.h"
#include "corr/datamodel/CorrCaseDb.h"
#include "CorrelationStore.h"
#include "CorrelationEntry.h"

/**
 * Turns the artifacts and files of the case open in a case database into
 * correlation entries for a correlation store.
 *
 * Nothing is thrown to the caller. Failures of the case database or the
 * correlation store are logged and yield fewer (or no) entries.
 *
 * The email keyword list name and the minimum phone number length are
 * read from the EMAIL_ADDRESS_SET_NAME and MIN_PHONE_NUMBER_LENGTH system
 * properties when the Correlator is constructed.
 */
class CORR_API Correlator
{
public:
    Correlator(const CorrCaseDb &caseDb, CorrelationStore &store);
    ~Correlator();

    /**
     * Derive the correlation entries of an artifact.
     *
     * An interesting artifact hit is replaced by the artifact its
     * TSK_ASSOCIATED_ARTIFACT attribute refers to, once. Each entry is
     * attributed to the file the examined artifact is attached to.
     *
     * @param artifact Artifact to examine.
     * @returns the entries, possibly none. On a database or store failure
     * the entries derived before it are returned.
     */
    std::vector<CorrelationEntry> deriveEntries(const CorrBlackboardArtifact &artifact) const;

    /**
     * Derive the file hash entry of a file.
     * @returns the entry, or an empty pointer if the file is not eligible,
     * has no MD5, has the MD5 of empty content, or an error occurred
     */
    std::unique_ptr<CorrelationEntry> deriveEntryForFile(const CorrFile &file) const;

    /**
     * Find the file hash entry already recorded in the store for a file.
     * The lookup is by file object id first and then by MD5 and path.
     * @returns the entry, or an empty pointer if the file is not eligible,
     * the case is not registered in the store, none is recorded or an
     * error occurred
     */
    std::unique_ptr<CorrelationEntry> lookupEntryForFile(const CorrFile &file) const;

    /**
     * Count the distinct (case, data source) pairs in the store holding a
     * value of a correlation type.
     * @returns the count, or -1 if the value is blank, the type is unknown
     * or the lookup failed
     */
    long countOccurrences(int correlationTypeId, const std::string &value) const;

    /// Name of the keyword list whose hits are email addresses.
    std::string emailAddressSetName() const;

private:
    void deriveFromExaminedArtifact(const CorrBlackboardArtifact &artifact,
                                    std::vector<CorrelationEntry> &entries) const;
    void addEntryFromAttribute(const CorrBlackboardArtifact &artifact, int attributeTypeId,
                               int correlationTypeId, std::vector<CorrelationEntry> &entries) const;
    void addPhoneEntry(const CorrBlackboardArtifact &artifact,
                       std::vector<CorrelationEntry> &entries) const;
    void addEntry(const CorrBlackboardArtifact &artifact, const CorrelationType &type,
                  const std::string &value, std::vector<CorrelationEntry> &entries) const;

    const CorrCaseDb &m_caseDb;
    CorrelationStore &m_store;
    std::string m_emailAddressSetName;
    std::string::size_type m_minPhoneNumberLength;
};

#endif
