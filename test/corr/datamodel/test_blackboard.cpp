/*
 * The Sleuth Kit
 *
 * Copyright (c) 2010, 2025 Basis Technology Corp.  All Rights reserved
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "corr/datamodel/CorrBlackboard.h"
#include "corr/datamodel/CorrBlackboardArtifact.h"
#include "corr/datamodel/CorrBlackboardAttribute.h"
#include "corr/datamodel/CorrFile.h"
#include "corr/datamodel/CorrMemoryCaseDb.h"
#include "corr/utilities/CorrException.h"

#include "catch.hpp"

TEST_CASE("Artifact type names map both ways","[blackboard]") {
    REQUIRE(CorrBlackboard::artTypeIDToTypeName(ART_CONTACT) == "TSK_CONTACT");
    REQUIRE(CorrBlackboard::artTypeNameToTypeID("TSK_WIFI_NETWORK") == ART_WIFI_NETWORK);
    REQUIRE(CorrBlackboard::artTypeNameToTypeID("TSK_INTERESTING_ARTIFACT_HIT") == ART_INTERESTING_ARTIFACT_HIT);
    REQUIRE(CorrBlackboard::artTypeIDToDisplayName(ART_KEYWORD_HIT) == "Keyword Hits");
    REQUIRE(ART_WEB_FORM_ADDRESS == 50);
}

TEST_CASE("Attribute type names map both ways","[blackboard]") {
    REQUIRE(CorrBlackboard::attrTypeIDToTypeName(ATTR_PHONE_NUMBER) == "TSK_PHONE_NUMBER");
    REQUIRE(CorrBlackboard::attrTypeNameToTypeID("TSK_ICCID") == ATTR_ICCID);
    REQUIRE(CorrBlackboard::attrTypeNameToTypeID("TSK_ASSOCIATED_ARTIFACT") == ATTR_ASSOCIATED_ARTIFACT);
    REQUIRE(CorrBlackboard::attrTypeIDToTypeDisplayName(ATTR_MAC_ADDRESS) == "MAC Address");
}

TEST_CASE("Every type name resolves to its own id","[blackboard]") {
    std::map<int, CorrArtifactNames> artifacts = CorrBlackboard::getAllArtifactTypes();
    REQUIRE(artifacts.size() == 50);
    for (std::map<int, CorrArtifactNames>::const_iterator it = artifacts.begin(); it != artifacts.end(); ++it) {
        REQUIRE(CorrBlackboard::artTypeNameToTypeID(it->second.typeName) == it->first);
    }

    std::map<int, CorrAttributeNames> attributes = CorrBlackboard::getAllAttributeTypes();
    for (std::map<int, CorrAttributeNames>::const_iterator it = attributes.begin(); it != attributes.end(); ++it) {
        REQUIRE(CorrBlackboard::attrTypeNameToTypeID(it->second.typeName) == it->first);
    }
}

TEST_CASE("Unknown type names and ids throw","[blackboard]") {
    REQUIRE_THROWS_AS(CorrBlackboard::artTypeNameToTypeID("TSK_NO_SUCH_THING"), CorrNotFoundException);
    REQUIRE_THROWS_AS(CorrBlackboard::artTypeIDToTypeName(9999), CorrNotFoundException);
    REQUIRE_THROWS_AS(CorrBlackboard::attrTypeNameToTypeID("TSK_NO_SUCH_THING"), CorrNotFoundException);
    REQUIRE_THROWS_AS(CorrBlackboard::attrTypeIDToTypeDisplayName(9999), CorrNotFoundException);
}

TEST_CASE("Attributes render their value as a string","[blackboard]") {
    REQUIRE(CorrBlackboardAttribute(ATTR_NAME, "test", std::string("Alice")).getValueString() == "Alice");
    REQUIRE(CorrBlackboardAttribute(ATTR_VALUE, "test", 42).getValueString() == "42");
    REQUIRE(CorrBlackboardAttribute(ATTR_ASSOCIATED_ARTIFACT, "test", static_cast<int64_t>(12345678901LL)).getValueString() == "12345678901");
    REQUIRE(CorrBlackboardAttribute(ATTR_VALUE, "test", 1.5).getValueString() == "1.5");

    std::vector<unsigned char> bytes;
    bytes.push_back(0xAB);
    bytes.push_back(0x01);
    REQUIRE(CorrBlackboardAttribute(ATTR_VALUE, "test", bytes).getValueString() == "ab01");

    CorrBlackboardAttribute when = CorrBlackboardAttribute::dateTime(ATTR_DATETIME, "test", 86400);
    REQUIRE(when.getValueType() == CORR_DATETIME);
    REQUIRE(when.getValueLong() == 86400);
    REQUIRE(when.getValueString() == "1970-01-02 00:00:00");

    CorrBlackboardAttribute json = CorrBlackboardAttribute::json(ATTR_TEXT, "test", "{\"a\":1}");
    REQUIRE(json.getValueType() == CORR_JSON);
    REQUIRE(json.getValueString() == "{\"a\":1}");
}

TEST_CASE("Artifacts return the first attribute of a type","[blackboard]") {
    CorrBlackboardArtifact artifact(1, 10, ART_CONTACT);
    artifact.addAttribute(CorrBlackboardAttribute(ATTR_PHONE_NUMBER, "test", std::string("111111")));
    artifact.addAttribute(CorrBlackboardAttribute(ATTR_PHONE_NUMBER, "test", std::string("222222")));

    REQUIRE(artifact.getAttributes().size() == 2);
    REQUIRE(artifact.getAttribute(ATTR_PHONE_NUMBER) != NULL);
    REQUIRE(artifact.getAttribute(ATTR_PHONE_NUMBER)->getValueString() == "111111");
    REQUIRE(artifact.getAttribute(ATTR_EMAIL) == NULL);
    REQUIRE(artifact.getArtifactTypeName() == "TSK_CONTACT");
    REQUIRE(artifact.getDisplayName() == "Contacts");
}

TEST_CASE("Files know their full path and flags","[blackboard]") {
    CorrFile file(10, "contacts.db", "/data/", CORR_FILE_TYPE_FS,
                  CORR_META_FLAG_ALLOC | CORR_META_FLAG_USED, "", 1);
    REQUIRE(file.getFullPath() == "/data/contacts.db");
    REQUIRE(file.isMetaFlagSet(CORR_META_FLAG_ALLOC));
    REQUIRE(file.isMetaFlagSet(CORR_META_FLAG_USED));
    REQUIRE_FALSE(file.isMetaFlagSet(CORR_META_FLAG_UNALLOC));
}

TEST_CASE("Memory case database lookups","[casedb]") {
    CorrMemoryCaseDb caseDb;
    REQUIRE_THROWS_AS(caseDb.getCaseInfo(), CorrCaseClosedException);

    caseDb.openCase("uuid-1", "Case One");
    REQUIRE(caseDb.getCaseInfo().uuid == "uuid-1");

    CorrDataSourceInfo dataSource;
    dataSource.objectId = 1;
    dataSource.deviceId = "device";
    dataSource.name = "image.e01";
    caseDb.addDataSource(dataSource);

    CorrFile file(10, "a.txt", "/", CORR_FILE_TYPE_LOCAL, 0, "", 1);
    caseDb.addFile(file);
    caseDb.addArtifact(CorrBlackboardArtifact(100, 10, ART_GEN_INFO));

    REQUIRE(caseDb.getFileById(10));
    REQUIRE_FALSE(caseDb.getFileById(11));
    REQUIRE(caseDb.getArtifact(100).getObjectID() == 10);
    REQUIRE_THROWS_AS(caseDb.getArtifact(101), CorrNotFoundException);
    REQUIRE(caseDb.getDataSource(file).name == "image.e01");

    CorrFile orphan(12, "b.txt", "/", CORR_FILE_TYPE_LOCAL, 0, "", 2);
    REQUIRE_THROWS_AS(caseDb.getDataSource(orphan), CorrDatabaseException);

    caseDb.closeCase();
    REQUIRE_FALSE(caseDb.isCaseOpen());
    REQUIRE_THROWS_AS(caseDb.getCaseInfo(), CorrCaseClosedException);
}
