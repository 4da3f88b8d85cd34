/*
 * The Sleuth Kit
 *
 * Copyright (c) 2010, 2025 Basis Technology Corp.  All Rights reserved
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "corr/correlation/CorrelationType.h"
#include "corr/correlation/CorrelationEntry.h"
#include "corr/correlation/FileTypeFilter.h"
#include "corr/datamodel/CorrFile.h"
#include "corr/utilities/CorrException.h"
#include "runner.h"

#include "catch.hpp"

TEST_CASE("Default correlation types","[correlation_type]") {
    std::vector<CorrelationType> types = CorrelationType::getDefaultCorrelationTypes();
    REQUIRE(types.size() == 10);
    for (size_t i = 0; i < types.size(); i++) {
        REQUIRE(types[i].getId() == static_cast<int>(i));
        REQUIRE(types[i].isSupported());
    }
    REQUIRE(types[CorrelationType::FILES_TYPE_ID].getDbTableName() == "file");
    REQUIRE(types[CorrelationType::PHONE_TYPE_ID].getDisplayName() == "Phone Numbers");
    REQUIRE_FALSE(types[CorrelationType::DOMAIN_TYPE_ID].isEnabled());
    REQUIRE(types[CorrelationType::ICCID_TYPE_ID].isEnabled());
}

TEST_CASE("Correlation type table names are restricted","[correlation_type]") {
    REQUIRE_NOTHROW(CorrelationType(20, "Custom", "custom_2", true, true));
    REQUIRE_THROWS_AS(CorrelationType(20, "Custom", "Custom", true, true), CorrCentralRepoException);
    REQUIRE_THROWS_AS(CorrelationType(20, "Custom", "drop table;", true, true), CorrCentralRepoException);
    REQUIRE_THROWS_AS(CorrelationType(20, "Custom", "", true, true), CorrCentralRepoException);

    CorrelationType a(20, "Custom", "custom", true, true);
    CorrelationType b(20, "Custom", "custom", true, false);
    REQUIRE(a == a);
    REQUIRE(a != b);
}

TEST_CASE("Correlation entries hold a normalized value","[correlation_entry]") {
    CorrelationType email(CorrelationType::EMAIL_TYPE_ID, "Email Addresses", "email_address", true, true);
    CorrelationCase correlationCase(1, "uuid", "Case");
    CorrelationDataSource dataSource(2, 1, "device", "image.e01", 7);

    CorrelationEntry entry(email, " Bob@Example.COM ", correlationCase, dataSource, "/mail/inbox", "", CORR_KNOWN_UNKNOWN, 42);
    REQUIRE(entry.getCorrelationValue() == "bob@example.com");
    REQUIRE(entry.getCaseId() == 1);
    REQUIRE(entry.getDataSourceId() == 2);
    REQUIRE(entry.getCorrelationDataSource().getDataSourceObjId() == 7);
    REQUIRE(entry.getFilePath() == "/mail/inbox");
    REQUIRE(entry.getKnownStatus() == CORR_KNOWN_UNKNOWN);
    REQUIRE(entry.getFileObjectId() == 42);

    CorrelationEntry same(email, "bob@example.com", correlationCase, dataSource, "/mail/inbox", "", CORR_KNOWN_UNKNOWN, 42);
    REQUIRE(entry == same);

    REQUIRE_THROWS_AS(CorrelationEntry(email, "bob", correlationCase, dataSource, "/mail/inbox", "", CORR_KNOWN_UNKNOWN, 42),
                      CorrNormalizationException);
}

TEST_CASE("File type filter","[file_type_filter]") {
    runner::ScopedLog scoped;

    REQUIRE_FALSE(FileTypeFilter::isEligible(NULL));

    CorrFile allocated(1, "a", "/", CORR_FILE_TYPE_FS, CORR_META_FLAG_ALLOC, "", 1);
    CorrFile deleted(2, "b", "/", CORR_FILE_TYPE_FS, CORR_META_FLAG_UNALLOC, "", 1);
    REQUIRE(FileTypeFilter::isEligible(&allocated));
    REQUIRE_FALSE(FileTypeFilter::isEligible(&deleted));

    const int eligible[] = { CORR_FILE_TYPE_CARVED, CORR_FILE_TYPE_DERIVED, CORR_FILE_TYPE_LOCAL, CORR_FILE_TYPE_LAYOUT_FILE };
    for (size_t i = 0; i < sizeof(eligible) / sizeof(eligible[0]); i++) {
        CorrFile file(3, "c", "/", eligible[i], 0, "", 1);
        REQUIRE(FileTypeFilter::isEligible(&file));
    }

    const int ineligible[] = { CORR_FILE_TYPE_UNALLOC_BLOCKS, CORR_FILE_TYPE_UNUSED_BLOCKS, CORR_FILE_TYPE_SLACK,
                               CORR_FILE_TYPE_VIRTUAL_DIR, CORR_FILE_TYPE_LOCAL_DIR };
    for (size_t i = 0; i < sizeof(ineligible) / sizeof(ineligible[0]); i++) {
        CorrFile file(4, "d", "/", ineligible[i], CORR_META_FLAG_ALLOC, "", 1);
        REQUIRE_FALSE(FileTypeFilter::isEligible(&file));
    }
    REQUIRE(scoped.log.count(Log::Warn) == 0);

    CorrFile odd(5, "e", "/", 77, CORR_META_FLAG_ALLOC, "", 1);
    REQUIRE_FALSE(FileTypeFilter::isEligible(&odd));
    REQUIRE(scoped.log.contains(Log::Warn, "unexpected file type 77"));
}
