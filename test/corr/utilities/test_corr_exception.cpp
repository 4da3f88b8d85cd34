/*
 * The Sleuth Kit
 *
 * Copyright (c) 2010, 2025 Basis Technology Corp.  All Rights reserved
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "corr/utilities/CorrException.h"
#include "corr/utilities/CorrUtilities.h"

#include "catch.hpp"

TEST_CASE("CorrException carries message and code","[exception]") {
    CorrException ex("something failed", 7);
    REQUIRE(ex.message() == "something failed");
    REQUIRE(ex.code() == 7);
    REQUIRE(std::string(ex.what()) == "something failed");
}

TEST_CASE("CorrException without message reports its name","[exception]") {
    CorrNotFoundException ex(3);
    REQUIRE(ex.message().empty());
    REQUIRE(std::string(ex.what()) == ex.name());
}

TEST_CASE("Derived exceptions have their own names","[exception]") {
    CorrNormalizationException ex("bad value");
    REQUIRE(std::string(ex.name()) != std::string(CorrException("x").name()));
    REQUIRE(ex.displayText() == std::string(ex.name()) + ": bad value");
}

TEST_CASE("Derived exceptions are caught as CorrException","[exception]") {
    bool caught = false;
    try {
        throw CorrCaseClosedException("No case is open");
    }
    catch (CorrException &ex) {
        caught = true;
        REQUIRE(ex.message() == "No case is open");
    }
    REQUIRE(caught);
}

TEST_CASE("Exceptions copy their message","[exception]") {
    CorrDatabaseException original("query failed", 2);
    CorrDatabaseException copy(original);
    REQUIRE(copy.message() == "query failed");
    REQUIRE(copy.code() == 2);

    CorrDatabaseException assigned("other");
    assigned = original;
    REQUIRE(assigned.message() == "query failed");
}

TEST_CASE("CorrUtilities::isNoDataMd5","[utilities]") {
    REQUIRE(CorrUtilities::isNoDataMd5("d41d8cd98f00b204e9800998ecf8427e"));
    REQUIRE(CorrUtilities::isNoDataMd5("D41D8CD98F00B204E9800998ECF8427E"));
    REQUIRE(CorrUtilities::isNoDataMd5(" d41d8cd98f00b204e9800998ecf8427e "));
    REQUIRE_FALSE(CorrUtilities::isNoDataMd5("0cc175b9c0f1b6a831c399e269772661"));
    REQUIRE_FALSE(CorrUtilities::isNoDataMd5(""));
}

TEST_CASE("CorrUtilities::makeFullPath","[utilities]") {
    REQUIRE(CorrUtilities::makeFullPath("/data/", "contacts.db") == "/data/contacts.db");
    REQUIRE(CorrUtilities::makeFullPath("", "contacts.db") == "contacts.db");
    REQUIRE(CorrUtilities::makeFullPath("/data", "contacts.db") == "/data/contacts.db");
}

TEST_CASE("CorrUtilities::toUTF8","[utilities]") {
    REQUIRE(CorrUtilities::toUTF8(L"caf\u00e9") == "caf\xc3\xa9");
}

TEST_CASE("CorrUtilities::getProgDir","[utilities]") {
    std::string dir = CorrUtilities::getProgDir();
    REQUIRE_FALSE(dir.empty());
    REQUIRE(dir[dir.size() - 1] == '/');
}
