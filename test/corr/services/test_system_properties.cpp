/*
 * The Sleuth Kit
 *
 * Copyright (c) 2010, 2025 Basis Technology Corp.  All Rights reserved
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "corr/services/CorrSystemPropertiesImpl.h"
#include "corr/services/CorrServices.h"
#include "corr/utilities/CorrException.h"
#include "runner.h"

#include "catch.hpp"

static const char *SEP = "/";

TEST_CASE("Predefined properties have defaults","[properties]") {
    CorrSystemPropertiesImpl props;
    props.initialize();
    REQUIRE(props.get(CorrSystemProperties::EMAIL_ADDRESS_SET_NAME) == "Email Addresses");
    REQUIRE(props.get(CorrSystemProperties::MIN_PHONE_NUMBER_LENGTH) == "6");
    REQUIRE(props.getInt(CorrSystemProperties::MIN_PHONE_NUMBER_LENGTH) == 6);
}

TEST_CASE("Required OUT_DIR must be set","[properties]") {
    CorrSystemPropertiesImpl props;
    props.initialize();
    REQUIRE_FALSE(props.isConfigured());
    REQUIRE_THROWS_AS(props.get(CorrSystemProperties::OUT_DIR), CorrSystemPropertiesException);

    props.set(CorrSystemProperties::OUT_DIR, "/tmp/out");
    REQUIRE(props.isConfigured());
    REQUIRE(props.get(CorrSystemProperties::OUT_DIR) == "/tmp/out");
}

TEST_CASE("Macros expand to other properties","[properties]") {
    CorrSystemPropertiesImpl props;
    props.initialize();
    props.set(CorrSystemProperties::OUT_DIR, "/tmp/out");
    REQUIRE(props.get(CorrSystemProperties::LOG_DIR) == std::string("/tmp/out") + SEP + "Logs");
    REQUIRE(props.get("LOG_DIR") == props.get(CorrSystemProperties::LOG_DIR));

    props.set("REPORT_DIR", "#OUT_DIR#/Reports");
    REQUIRE(props.get("REPORT_DIR") == "/tmp/out/Reports");
    REQUIRE(props.expandMacros("#OUT_DIR#/x") == "/tmp/out/x");
}

TEST_CASE("Macro expansion stops at the recursion limit","[properties]") {
    runner::ScopedLog scoped;
    CorrSystemPropertiesImpl props;
    props.initialize();
    props.set(CorrSystemProperties::OUT_DIR, "#LOG_DIR#");
    props.set(CorrSystemProperties::LOG_DIR, "#OUT_DIR#");
    REQUIRE_NOTHROW(props.get(CorrSystemProperties::LOG_DIR));
    REQUIRE(scoped.log.contains(Log::Error, "maximum depth"));
}

TEST_CASE("CURRENT_TIME is read only","[properties]") {
    runner::ScopedLog scoped;
    CorrSystemPropertiesImpl props;
    props.initialize();
    props.set("CURRENT_TIME", "yesterday");
    REQUIRE(props.get(CorrSystemProperties::CURRENT_TIME) != "yesterday");
    REQUIRE(scoped.log.contains(Log::Warn, "CURRENT_TIME"));
}

TEST_CASE("Empty property names are rejected","[properties]") {
    CorrSystemPropertiesImpl props;
    props.initialize();
    REQUIRE_THROWS_AS(props.set("", "value"), CorrSystemPropertiesException);
}

TEST_CASE("getInt rejects non-numeric values","[properties]") {
    CorrSystemPropertiesImpl props;
    props.initialize();
    props.set(CorrSystemProperties::MIN_PHONE_NUMBER_LENGTH, "six");
    REQUIRE_THROWS_AS(props.getInt(CorrSystemProperties::MIN_PHONE_NUMBER_LENGTH), CorrSystemPropertiesException);
}

TEST_CASE("Properties load from an XML file","[properties]") {
    runner::tempfile config("corr_config");
    config.write("<CORR_CONFIG>\n"
                 "  <OUT_DIR>/cases/out</OUT_DIR>\n"
                 "  <EMAIL_ADDRESS_SET_NAME>Mail</EMAIL_ADDRESS_SET_NAME>\n"
                 "</CORR_CONFIG>\n");

    CorrSystemPropertiesImpl props;
    props.initialize(config.temp_file_path.string());
    REQUIRE(props.isConfigured());
    REQUIRE(props.get(CorrSystemProperties::OUT_DIR) == "/cases/out");
    REQUIRE(props.get(CorrSystemProperties::EMAIL_ADDRESS_SET_NAME) == "Mail");
}

TEST_CASE("Missing or malformed XML configuration is reported","[properties]") {
    CorrSystemPropertiesImpl props;
    REQUIRE_THROWS_AS(props.initialize("/nonexistent/corr_config.xml"), CorrSystemPropertiesException);

    runner::tempfile config("corr_bad_config");
    config.write("<CORR_CONFIG><OUT_DIR>/x</CORR_CONFIG>");
    REQUIRE_THROWS_AS(props.initialize(config.temp_file_path.string()), CorrSystemPropertiesException);
}

TEST_CASE("CorrServices supplies default system properties","[properties]") {
    REQUIRE(GetSystemProperty(CorrSystemProperties::EMAIL_ADDRESS_SET_NAME) == "Email Addresses");
    SetSystemProperty("CORR_TEST_PROPERTY", "value");
    REQUIRE(GetSystemProperty("CORR_TEST_PROPERTY") == "value");
    SetSystemProperty("CORR_TEST_PROPERTY", "");
}

TEST_CASE("CorrServices uses registered system properties until reset","[properties]") {
    runner::ScopedLog scoped;
    CorrSystemPropertiesImpl props;
    props.initialize();
    props.set(CorrSystemProperties::EMAIL_ADDRESS_SET_NAME, "Mail");

    CorrServices::Instance().setSystemProperties(props);
    CHECK(GetSystemProperty(CorrSystemProperties::EMAIL_ADDRESS_SET_NAME) == "Mail");

    CorrSystemPropertiesImpl other;
    other.initialize();
    CHECK_THROWS_AS(CorrServices::Instance().setSystemProperties(other), CorrException);
    CHECK(scoped.log.contains(Log::Error, "already registered"));

    CorrServices::Instance().resetSystemProperties();
    REQUIRE(GetSystemProperty(CorrSystemProperties::EMAIL_ADDRESS_SET_NAME) == "Email Addresses");
}

TEST_CASE("Registered properties expand macros","[properties]") {
    CorrSystemPropertiesImpl props;
    props.initialize();
    props.set(CorrSystemProperties::OUT_DIR, "/cases/out");

    CorrServices::Instance().setSystemProperties(props);
    CHECK(CorrServices::Instance().getSystemProperties().expandMacros("#LOG_DIR#/x.txt") == "/cases/out/Logs/x.txt");
    CorrServices::Instance().resetSystemProperties();
}

TEST_CASE("Properties must be initialized before use","[properties]") {
    CorrSystemPropertiesImpl props;
    REQUIRE_THROWS_AS(props.set("CORR_TEST_PROPERTY", "value"), CorrSystemPropertiesException);
    REQUIRE_THROWS_AS(props.get("CORR_TEST_PROPERTY"), CorrSystemPropertiesException);
}
