/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "Correlator.h"
#include "FileTypeFilter.h"
#include "corr/datamodel/CorrBlackboard.h"
#include "corr/services/CorrServices.h"
#include "corr/utilities/CorrException.h"
#include "corr/utilities/CorrUtilities.h"

#include <sstream>

#include "Poco/Ascii.h"
#include "Poco/String.h"

namespace
{
    const std::string::size_type DEFAULT_MIN_PHONE_NUMBER_LENGTH = 6;

    std::string::size_type readMinPhoneNumberLength()
    {
        try
        {
            int length = CorrServices::Instance().getSystemProperties().getInt(CorrSystemProperties::MIN_PHONE_NUMBER_LENGTH);
            if (length >= 0)
                return static_cast<std::string::size_type>(length);

            std::stringstream msg;
            msg << "Correlator : negative MIN_PHONE_NUMBER_LENGTH " << length << ", using "
                << DEFAULT_MIN_PHONE_NUMBER_LENGTH;
            LOGWARN(msg.str());
        }
        catch (CorrSystemPropertiesException &ex)
        {
            std::stringstream msg;
            msg << "Correlator : " << ex.message() << ", using " << DEFAULT_MIN_PHONE_NUMBER_LENGTH;
            LOGWARN(msg.str());
        }
        return DEFAULT_MIN_PHONE_NUMBER_LENGTH;
    }

    /// Keeps only the digits, and a leading '+' if the number had one.
    std::string stripPhoneNumber(const std::string &value)
    {
        std::string digits;
        if (!value.empty() && value[0] == '+')
            digits += '+';
        for (std::string::const_iterator it = value.begin(); it != value.end(); ++it)
        {
            if (Poco::Ascii::isDigit(*it))
                digits += *it;
        }
        return digits;
    }

    std::string describe(const CorrBlackboardArtifact &artifact)
    {
        std::stringstream desc;
        desc << "artifact " << artifact.getArtifactID() << " (type " << artifact.getArtifactTypeID()
             << ", content " << artifact.getObjectID() << ")";
        return desc.str();
    }

    std::string describe(const CorrFile &file)
    {
        std::stringstream desc;
        desc << "'" << file.getName() << "' (id=" << file.getId() << ")";
        return desc.str();
    }
}

Correlator::Correlator(const CorrCaseDb &caseDb, CorrelationStore &store) :
    m_caseDb(caseDb),
    m_store(store),
    m_emailAddressSetName(GetSystemProperty(CorrSystemProperties::EMAIL_ADDRESS_SET_NAME)),
    m_minPhoneNumberLength(readMinPhoneNumberLength())
{
}

Correlator::~Correlator()
{
}

std::string Correlator::emailAddressSetName() const
{
    return m_emailAddressSetName;
}

std::vector<CorrelationEntry> Correlator::deriveEntries(const CorrBlackboardArtifact &artifact) const
{
    std::vector<CorrelationEntry> entries;
    try
    {
        if (artifact.getArtifactTypeID() == ART_INTERESTING_ARTIFACT_HIT)
        {
            const CorrBlackboardAttribute *associated = artifact.getAttribute(ATTR_ASSOCIATED_ARTIFACT);
            if (associated != NULL)
            {
                CorrBlackboardArtifact examined = m_caseDb.getArtifact(static_cast<uint64_t>(associated->getValueLong()));
                deriveFromExaminedArtifact(examined, entries);
            }
        }
        else
        {
            deriveFromExaminedArtifact(artifact, entries);
        }
    }
    catch (CorrCentralRepoException &ex)
    {
        std::stringstream msg;
        msg << "Correlator::deriveEntries : error getting defined correlation types for "
            << describe(artifact) << ": " << ex.message();
        LOGERROR(msg.str());
    }
    catch (CorrCaseClosedException &ex)
    {
        std::stringstream msg;
        msg << "Correlator::deriveEntries : exception while getting open case for "
            << describe(artifact) << ": " << ex.message();
        LOGERROR(msg.str());
    }
    catch (CorrException &ex)
    {
        std::stringstream msg;
        msg << "Correlator::deriveEntries : error getting attribute while getting type from "
            << describe(artifact) << ": " << ex.displayText();
        LOGERROR(msg.str());
    }
    return entries;
}

void Correlator::deriveFromExaminedArtifact(const CorrBlackboardArtifact &artifact,
                                            std::vector<CorrelationEntry> &entries) const
{
    switch (artifact.getArtifactTypeID())
    {
    case ART_KEYWORD_HIT:
        {
            const CorrBlackboardAttribute *setName = artifact.getAttribute(ATTR_SET_NAME);
            if (setName != NULL && setName->getValueString() == m_emailAddressSetName)
                addEntryFromAttribute(artifact, ATTR_KEYWORD, CorrelationType::EMAIL_TYPE_ID, entries);
        }
        break;

    case ART_WEB_BOOKMARK:
    case ART_WEB_COOKIE:
    case ART_WEB_DOWNLOAD:
    case ART_WEB_HISTORY:
        addEntryFromAttribute(artifact, ATTR_DOMAIN, CorrelationType::DOMAIN_TYPE_ID, entries);
        break;

    case ART_CONTACT:
    case ART_CALLLOG:
    case ART_MESSAGE:
        addPhoneEntry(artifact, entries);
        break;

    case ART_DEVICE_ATTACHED:
        addEntryFromAttribute(artifact, ATTR_DEVICE_ID, CorrelationType::USBID_TYPE_ID, entries);
        addEntryFromAttribute(artifact, ATTR_MAC_ADDRESS, CorrelationType::MAC_TYPE_ID, entries);
        break;

    case ART_WIFI_NETWORK:
        addEntryFromAttribute(artifact, ATTR_SSID, CorrelationType::SSID_TYPE_ID, entries);
        break;

    case ART_WIFI_NETWORK_ADAPTER:
    case ART_BLUETOOTH_PAIRING:
    case ART_BLUETOOTH_ADAPTER:
        addEntryFromAttribute(artifact, ATTR_MAC_ADDRESS, CorrelationType::MAC_TYPE_ID, entries);
        break;

    case ART_DEVICE_INFO:
        addEntryFromAttribute(artifact, ATTR_IMEI, CorrelationType::IMEI_TYPE_ID, entries);
        addEntryFromAttribute(artifact, ATTR_IMSI, CorrelationType::IMSI_TYPE_ID, entries);
        addEntryFromAttribute(artifact, ATTR_ICCID, CorrelationType::ICCID_TYPE_ID, entries);
        break;

    case ART_SIM_ATTACHED:
        addEntryFromAttribute(artifact, ATTR_IMSI, CorrelationType::IMSI_TYPE_ID, entries);
        addEntryFromAttribute(artifact, ATTR_ICCID, CorrelationType::ICCID_TYPE_ID, entries);
        break;

    case ART_WEB_FORM_ADDRESS:
        addEntryFromAttribute(artifact, ATTR_PHONE_NUMBER, CorrelationType::PHONE_TYPE_ID, entries);
        addEntryFromAttribute(artifact, ATTR_EMAIL, CorrelationType::EMAIL_TYPE_ID, entries);
        break;

    case ART_ACCOUNT:
        // TODO: correlate accounts by switching on TSK_ACCOUNT_TYPE.
        break;

    default:
        // Unhandled type, including an interesting artifact hit that
        // points at another interesting artifact hit.
        break;
    }
}

void Correlator::addEntryFromAttribute(const CorrBlackboardArtifact &artifact, int attributeTypeId,
                                       int correlationTypeId, std::vector<CorrelationEntry> &entries) const
{
    const CorrBlackboardAttribute *attribute = artifact.getAttribute(attributeTypeId);
    if (attribute == NULL)
        return;

    std::string value = attribute->getValueString();
    if (value.empty())
        return;

    addEntry(artifact, m_store.getCorrelationTypeById(correlationTypeId), value, entries);
}

void Correlator::addPhoneEntry(const CorrBlackboardArtifact &artifact,
                               std::vector<CorrelationEntry> &entries) const
{
    const CorrBlackboardAttribute *attribute = artifact.getAttribute(ATTR_PHONE_NUMBER);
    if (attribute == NULL)
        attribute = artifact.getAttribute(ATTR_PHONE_NUMBER_FROM);
    if (attribute == NULL)
        attribute = artifact.getAttribute(ATTR_PHONE_NUMBER_TO);
    if (attribute == NULL)
        return;

    std::string value = stripPhoneNumber(attribute->getValueString());
    if (value.length() < m_minPhoneNumberLength)
        return;

    addEntry(artifact, m_store.getCorrelationTypeById(CorrelationType::PHONE_TYPE_ID), value, entries);
}

void Correlator::addEntry(const CorrBlackboardArtifact &artifact, const CorrelationType &type,
                          const std::string &value, std::vector<CorrelationEntry> &entries) const
{
    try
    {
        CorrCaseInfo caseInfo = m_caseDb.getCaseInfo();
        std::unique_ptr<CorrFile> sourceFile = m_caseDb.getFileById(artifact.getObjectID());
        if (!sourceFile)
        {
            LOGERROR("Correlator : error creating entry for " + describe(artifact) + ". Source file was null.");
            return;
        }

        std::unique_ptr<CorrelationCase> correlationCase = m_store.getCase(caseInfo);
        if (!correlationCase)
        {
            LOGWARN("Correlator : case " + caseInfo.uuid + " is not in the correlation store, no entry for " + describe(artifact));
            return;
        }

        CorrelationDataSource dataSource = m_store.getDataSource(*correlationCase, m_caseDb.getDataSource(*sourceFile));
        entries.push_back(CorrelationEntry(type, value, *correlationCase, dataSource,
                                           sourceFile->getFullPath(), "", CORR_KNOWN_UNKNOWN,
                                           sourceFile->getId()));
    }
    catch (CorrCaseClosedException &ex)
    {
        LOGERROR("Correlator : case is closed, no entry for " + describe(artifact) + ": " + ex.message());
    }
    catch (CorrCentralRepoException &ex)
    {
        LOGWARN("Correlator : error creating entry for " + describe(artifact) + ": " + ex.message());
    }
    catch (CorrNormalizationException &ex)
    {
        LOGWARN("Correlator : error creating entry for " + describe(artifact) + ": " + ex.message());
    }
    catch (CorrException &ex)
    {
        LOGERROR("Correlator : error getting source file for " + describe(artifact) + ": " + ex.displayText());
    }
}

std::unique_ptr<CorrelationEntry> Correlator::deriveEntryForFile(const CorrFile &file) const
{
    if (!FileTypeFilter::isEligible(&file))
        return std::unique_ptr<CorrelationEntry>();

    const std::string md5 = file.getMd5();
    if (md5.empty() || CorrUtilities::isNoDataMd5(md5))
        return std::unique_ptr<CorrelationEntry>();

    try
    {
        CorrelationType filesType = m_store.getCorrelationTypeById(CorrelationType::FILES_TYPE_ID);
        std::unique_ptr<CorrelationCase> correlationCase = m_store.getCase(m_caseDb.getCaseInfo());
        if (!correlationCase)
        {
            LOGWARN("Correlator::deriveEntryForFile : open case is not in the correlation store, no entry for file " + describe(file));
            return std::unique_ptr<CorrelationEntry>();
        }

        CorrelationDataSource dataSource = m_store.getDataSource(*correlationCase, m_caseDb.getDataSource(file));
        return std::unique_ptr<CorrelationEntry>(new CorrelationEntry(filesType, md5, *correlationCase, dataSource,
                                                                      file.getFullPath(), "", CORR_KNOWN_UNKNOWN,
                                                                      file.getId()));
    }
    catch (CorrCaseClosedException &ex)
    {
        LOGERROR("Correlator::deriveEntryForFile : case is closed: " + ex.message());
    }
    catch (CorrException &ex)
    {
        LOGERROR("Correlator::deriveEntryForFile : error making correlation entry for file " + describe(file) + ": " + ex.displayText());
    }
    return std::unique_ptr<CorrelationEntry>();
}

std::unique_ptr<CorrelationEntry> Correlator::lookupEntryForFile(const CorrFile &file) const
{
    if (!FileTypeFilter::isEligible(&file))
        return std::unique_ptr<CorrelationEntry>();

    std::unique_ptr<CorrelationType> filesType;
    std::unique_ptr<CorrelationCase> correlationCase;
    std::unique_ptr<CorrelationDataSource> dataSource;
    try
    {
        filesType.reset(new CorrelationType(m_store.getCorrelationTypeById(CorrelationType::FILES_TYPE_ID)));
        correlationCase = m_store.getCase(m_caseDb.getCaseInfo());
        if (!correlationCase)
            return std::unique_ptr<CorrelationEntry>();
        dataSource.reset(new CorrelationDataSource(m_store.getDataSource(*correlationCase, m_caseDb.getDataSource(file))));
    }
    catch (CorrCaseClosedException &ex)
    {
        LOGERROR("Correlator::lookupEntryForFile : case is closed: " + ex.message());
        return std::unique_ptr<CorrelationEntry>();
    }
    catch (CorrException &ex)
    {
        LOGERROR("Correlator::lookupEntryForFile : error retrieving correlation entry for file " + describe(file) + ": " + ex.displayText());
        return std::unique_ptr<CorrelationEntry>();
    }

    try
    {
        std::unique_ptr<CorrelationEntry> entry = m_store.getAttributeInstance(*filesType, *correlationCase, *dataSource, file.getId());

        // Entries recorded without a file object id can only be found by hash and path.
        if (!entry && !file.getMd5().empty())
        {
            entry = m_store.getAttributeInstance(*filesType, *correlationCase, *dataSource,
                                                 file.getMd5(), Poco::toLower(file.getFullPath()));
        }
        return entry;
    }
    catch (CorrException &ex)
    {
        LOGWARN("Correlator::lookupEntryForFile : correlation entry could not be retrieved for file " + describe(file) + ": " + ex.message());
    }
    return std::unique_ptr<CorrelationEntry>();
}

long Correlator::countOccurrences(int correlationTypeId, const std::string &value) const
{
    if (Poco::trim(value).empty())
        return -1;

    try
    {
        CorrelationType type = m_store.getCorrelationTypeById(correlationTypeId);
        return m_store.getCountUniqueCaseDataSourceTuplesHavingTypeValue(type, value);
    }
    catch (CorrException &ex)
    {
        std::stringstream msg;
        msg << "Correlator::countOccurrences : error counting occurrences of value of correlation type "
            << correlationTypeId << ": " << ex.message();
        LOGWARN(msg.str());
    }
    return -1;
}
