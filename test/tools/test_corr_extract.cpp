/*
 * The Sleuth Kit
 *
 * Copyright (c) 2010, 2025 Basis Technology Corp.  All Rights reserved
 *
 * This software is distributed under the Common Public License 1.0
 */

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "catch.hpp"
#include "runner.h"

#define corr_extract_main(x,y) mocked_corr_extract_main(x,y)

#include "tools/corrtools/corr_extract.cpp"

namespace {
    const std::string SAMPLE_CASE = "samples/phone_case.xml";

    /* Runs corr_extract with the given arguments. Returns the exit code;
     * what it printed to stdout is put in out.
     */
    int run_corr_extract(const std::vector<std::string> &args, std::string &out)
    {
        std::vector<char *> argv;
        for (const auto &arg : args) {
            argv.push_back(strdup(arg.c_str()));
        }
        argv.push_back(nullptr);

        // start a fresh getopt scan
#ifdef __GLIBC__
        optind = 0;
#else
        optind = 1;
#endif

        std::ostringstream captured;
        std::streambuf *saved = std::cout.rdbuf(captured.rdbuf());
        int ret = mocked_corr_extract_main((int)args.size(), argv.data());
        std::cout.rdbuf(saved);
        out = captured.str();

        for (char *arg : argv) {
            free(arg);
        }
        return ret;
    }

    /* Configuration file that sends the tool's output to a temporary directory. */
    struct ToolConfig {
        ToolConfig() : config("corr_extract_config") {
            outDir = (config.temp_dir / "out").string();
            config.write("<CORR_CONFIG>\n"
                         "  <OUT_DIR>" + outDir + "</OUT_DIR>\n"
                         "</CORR_CONFIG>\n");
        }
        std::string path() const { return config.temp_file_path.string(); }

        runner::tempfile config;
        std::string outDir;
    };
}

TEST_CASE("corr_extract -V", "[corrtools]") {
    std::string out;
    CHECK(run_corr_extract({"corr_extract", "-V"}, out) == 0);
    CHECK(out == std::string("corr_extract version ") + CORR_VERSION_STR + "\n");
}

TEST_CASE("corr_extract needs a case file", "[corrtools]") {
    std::string out;
    CHECK(run_corr_extract({"corr_extract"}, out) == 1);
    CHECK(run_corr_extract({"corr_extract", "-Z", SAMPLE_CASE}, out) == 1);
    CHECK(out.empty());
}

TEST_CASE("corr_extract with a missing case file", "[corrtools]") {
    ToolConfig config;
    Log *logBefore = &CorrServices::Instance().getLog();
    CorrSystemProperties *propertiesBefore = &CorrServices::Instance().getSystemProperties();

    std::string out;
    std::string missing = (config.config.temp_dir / "missing.xml").string();
    CHECK(run_corr_extract({"corr_extract", "-L", "-c", config.path(), missing}, out) == 1);
    CHECK(out.empty());

    // the tool's log and properties are unregistered on the way out
    CHECK(&CorrServices::Instance().getLog() == logBefore);
    CHECK(&CorrServices::Instance().getSystemProperties() == propertiesBefore);
}

TEST_CASE("corr_extract with a bad config file", "[corrtools]") {
    std::string out;
    CHECK(run_corr_extract({"corr_extract", "-L", "-c", "/nonexistent/corr_config.xml", SAMPLE_CASE}, out) == 1);
    CHECK(out.empty());
}

TEST_CASE("corr_extract prints the entries of a case", "[corrtools]") {
    ToolConfig config;
    std::string out;
    CHECK(run_corr_extract({"corr_extract", "-L", "-c", config.path(), SAMPLE_CASE}, out) == 0);

    CHECK(runner::contains(out, "Phone Numbers\t+15551234567\tphone.img\t"
                                "/data/data/com.android.providers.contacts/databases/contacts2.db\n"));
    CHECK(runner::contains(out, "Wireless Networks\thome\tphone.img\t/data/misc/wifi/WifiConfigStore.xml\n"));
    CHECK(runner::contains(out, "IMEI Number\t352099001761481\tphone.img\t"));
    CHECK(runner::contains(out, "IMSI Number\t310150123456789\tphone.img\t"));
    CHECK(runner::contains(out, "Email Addresses\talice@example.com\tphone.img\t"));

    // the call log number is below the minimum length
    CHECK_FALSE(runner::contains(out, "55598"));
    // file hashes only with -f
    CHECK_FALSE(runner::contains(out, "Files\t"));

    // log file goes to LOG_DIR under the configured OUT_DIR
    Poco::File logDir(config.outDir + "/Logs");
    REQUIRE(logDir.exists());
    std::vector<std::string> logs;
    logDir.list(logs);
    CHECK(logs.size() == 1);
}

TEST_CASE("corr_extract -f adds file hashes", "[corrtools]") {
    ToolConfig config;
    std::string out;
    CHECK(run_corr_extract({"corr_extract", "-L", "-f", "-c", config.path(), SAMPLE_CASE}, out) == 0);

    CHECK(runner::contains(out, "Files\t0cc175b9c0f1b6a831c399e269772661\tphone.img\t"
                                "/data/data/com.android.providers.contacts/databases/contacts2.db\n"));
    CHECK(runner::contains(out, "Files\t92eb5ffee6ae2fec3ad71c777531578f\tphone.img\t/data/misc/wifi/WifiConfigStore.xml\n"));
    CHECK(runner::contains(out, "Files\t4a8a08f09d37b73795649038408b5f33\tphone.img\t/$CarvedFiles/f0001.jpg\n"));
    // empty files have nothing to correlate on
    CHECK_FALSE(runner::contains(out, CorrUtilities::NO_DATA_MD5));
}
