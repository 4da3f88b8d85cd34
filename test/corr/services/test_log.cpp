/*
 * The Sleuth Kit
 *
 * Copyright (c) 2010, 2025 Basis Technology Corp.  All Rights reserved
 *
 * This software is distributed under the Common Public License 1.0
 */

#include "corr/services/Log.h"
#include "corr/services/CorrServices.h"
#include "corr/utilities/CorrException.h"
#include "runner.h"

#include "catch.hpp"

TEST_CASE("Log writes leveled lines to its file","[log]") {
    runner::tempfile logfile("corr_log");
    Log log;
    REQUIRE(log.open(logfile.temp_file_path.string().c_str()) == 0);
    REQUIRE(log.getLogPath() == logfile.temp_file_path.string());

    log.logError("disk on fire");
    log.logWarn("disk warm");
    log.logInfo("disk fine");
    log.close();

    REQUIRE(logfile.validate_contains("[ERROR] disk on fire"));
    REQUIRE(logfile.validate_contains("[WARN] disk warm"));
    REQUIRE(logfile.validate_contains("[INFO] disk fine"));
}

TEST_CASE("Log collapses repeated messages","[log]") {
    runner::tempfile logfile("corr_log_repeat");
    Log log;
    REQUIRE(log.open(logfile.temp_file_path.string().c_str()) == 0);

    for (int i = 0; i < 4; i++) {
        log.logWarn("same thing");
    }
    log.logWarn("something else");
    log.close();

    std::string contents = runner::file_contents(logfile.temp_file_path);
    REQUIRE(runner::contains(contents, "The previous message was repeated 3 times."));

    size_t occurrences = 0;
    for (size_t pos = contents.find("same thing"); pos != std::string::npos; pos = contents.find("same thing", pos + 1)) {
        occurrences++;
    }
    REQUIRE(occurrences == 1);
}

TEST_CASE("Log writes the pending repeat count on close","[log]") {
    runner::tempfile logfile("corr_log_close");
    Log log;
    REQUIRE(log.open(logfile.temp_file_path.string().c_str()) == 0);

    log.logInfo("tick");
    log.logInfo("tick");
    log.logInfo("tick");
    log.logError("tick");
    log.logError("tick");
    REQUIRE(log.close() == 0);

    REQUIRE(logfile.validate_contains("[INFO] tick"));
    REQUIRE(logfile.validate_contains("repeated 2 times."));
    REQUIRE(logfile.validate_contains("[ERROR] tick"));
    REQUIRE(logfile.validate_contains("repeated 1 times."));
}

TEST_CASE("Log formats printf-style messages","[log]") {
    runner::ScopedLog scoped;
    scoped.log.logf(Log::Warn, "%d entries from %s", 12, "phone.img");
    REQUIRE(scoped.log.contains(Log::Warn, "12 entries from phone.img"));
    REQUIRE(std::string(Log::channelName(Log::Warn)) == "[WARN]");
}

TEST_CASE("Log opens a timestamped file in LOG_DIR","[log]") {
    std::filesystem::path dir = runner::NamedTemporaryDirectory("corr_log_dir");
    std::filesystem::path logDir = dir / "Logs";
    SetSystemProperty(CorrSystemProperties::LOG_DIR, logDir.string());

    {
        Log log;
        REQUIRE(log.open() == 0);
        std::string path(log.getLogPath());
        REQUIRE(runner::contains(path, logDir.string()));
        REQUIRE(runner::contains(path, "log_"));
        log.logInfo("into the log dir");
        log.close();
        REQUIRE(runner::file_contains(path, "into the log dir"));
    }

    SetSystemProperty(CorrSystemProperties::LOG_DIR, "");
    std::filesystem::remove_all(dir);
}

TEST_CASE("Log reports unopenable files","[log]") {
    Log log;
    REQUIRE(log.open("/nonexistent/dir/log.txt") != 0);
}

TEST_CASE("LOG macros reach the registered log","[log]") {
    runner::ScopedLog scoped;
    LOGERROR("error via macro");
    LOGWARN(std::string("warning via macro"));
    LOGINFO(L"info via macro");
    REQUIRE(scoped.log.contains(Log::Error, "error via macro"));
    REQUIRE(scoped.log.contains(Log::Warn, "warning via macro"));
    REQUIRE(scoped.log.contains(Log::Info, "info via macro"));
}

TEST_CASE("Only one log can be registered","[log]") {
    runner::ScopedLog scoped;
    Log other;
    REQUIRE_THROWS_AS(CorrServices::Instance().setLog(other), CorrException);
}
