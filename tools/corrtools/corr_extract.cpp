/*
*
*  The Sleuth Kit
*
*  Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
*  Copyright (c) 2011-2012 Basis Technology Corporation. All Rights
*  reserved.
*
*  This software is distributed under the Common Public License 1.0
*/
#include <iostream>
#include <cstdio>
#include <string>
#include <sstream>
#include <memory>
#include <vector>

#include <unistd.h>

#include "corr/corr.h"
#include "corr_extract.h"

#include "Poco/File.h"
#include "Poco/Exception.h"

static uint8_t
makeDirs(const std::string &dir)
{
    Poco::File path(dir);
    try {
        path.createDirectories();
    } catch (const Poco::Exception &ex) {
        std::stringstream msg;
        msg << "Error creating directory: " << dir << " Poco exception: " << ex.displayText();
        fprintf(stderr, "%s\n", msg.str().c_str());
        return 1;
    }
    return 0;
}

/**
 * Logs all messages to a log file and prints
 * error messages to STDERR
 */
class StderrLog : public Log
{
public:
    StderrLog() : Log() {
    }

    ~StderrLog() {
    }

    using Log::log;

    void log(Channel a_channel, const std::string &a_msg)
    {
        Log::log(a_channel, a_msg);
        if (a_channel != Error) {
            return;
        }
        fprintf(stderr, "%s\n", a_msg.c_str());
    }
};

static void
recordEntry(MemoryCorrelationStore &store, const CorrelationEntry &entry)
{
    try {
        store.addAttributeInstance(entry);
    }
    catch (const CorrException &e) {
        std::stringstream msg;
        msg << "corr_extract : entry not recorded: " << e.message();
        LOGWARN(msg.str());
    }
}

static void
printEntry(const CorrelationEntry &entry)
{
    std::cout << entry.getCorrelationType().getDisplayName() << '\t'
        << entry.getCorrelationValue() << '\t'
        << entry.getCorrelationDataSource().getName() << '\t'
        << entry.getFilePath() << std::endl;
}

/**
 * Unregisters the log and system properties installed by
 * corr_extract_main() when it returns.
 */
class RegisteredServices
{
public:
    ~RegisteredServices() {
        CorrServices::Instance().resetLog();
        CorrServices::Instance().resetSystemProperties();
    }
};

static int
usage(const char *program)
{
    fprintf(stderr, "%s [-c config_file] [-f] [-L] [-V] case_file\n", program);
    fprintf(stderr, "\t-c config_file: Path to XML system properties file\n");
    fprintf(stderr, "\t-f: Also derive file hash entries for the files of the case\n");
    fprintf(stderr, "\t-L: Print no error messages to STDERR -- only log them\n");
    fprintf(stderr, "\t-V: Display the tool version\n");
    return 1;
}

int
corr_extract_main(int argc, char **argv)
{
    int ch;
    std::string config;
    bool suppressSTDERR = false;
    bool doFiles = false;

    while ((ch = getopt(argc, argv, "c:fLV")) > 0) {
        switch (ch) {
        case 'c':
            config.assign(optarg);
            break;

        case 'f':
            doFiles = true;
            break;

        case 'L':
            suppressSTDERR = true;
            break;

        case 'V':
            std::cout << "corr_extract version " << CORR_VERSION_STR << std::endl;
            return 0;

        case '?':
        default:
            return usage(argv[0]);
        }
    }

    /* We need at least one more argument */
    if (optind == argc) {
        fprintf(stderr, "Missing case file name\n");
        return usage(argv[0]);
    }

    std::string casePath(argv[optind]);

    // Load the config if they specified it
    std::unique_ptr<CorrSystemPropertiesImpl> systemProperties(new CorrSystemPropertiesImpl());
    try {
        if (config.size()) {
            systemProperties->initialize(config);
        }
        // try the one in the current directory
        else if (Poco::File("corr_config.xml").exists()) {
            systemProperties->initialize("corr_config.xml");
        }
        else {
            systemProperties->initialize();
        }
    }
    catch (const CorrException &ex) {
        fprintf(stderr, "Loading config file: %s\n", ex.message().c_str());
        return 1;
    }

    std::unique_ptr<Log> log;
    if (suppressSTDERR)
        log.reset(new Log());
    else
        log.reset(new StderrLog());

    // destroyed before log and systemProperties
    RegisteredServices registered;
    try {
        CorrServices::Instance().setSystemProperties(*systemProperties);

        // if they didn't specify the output directory, make one beside the case file
        if (!systemProperties->isConfigured()) {
            SetSystemProperty(CorrSystemProperties::OUT_DIR, casePath + "_corr_out");
        }
        if (makeDirs(GetSystemProperty(CorrSystemProperties::OUT_DIR))) {
            return 1;
        }

        // timestamped file in LOG_DIR
        if (log->open()) {
            return 1;
        }
        CorrServices::Instance().setLog(*log);
    }
    catch (const CorrException &ex) {
        fprintf(stderr, "corr_extract: %s\n", ex.message().c_str());
        return 1;
    }

    CorrMemoryCaseDb caseDb;
    try {
        CorrXmlCaseLoader::loadFile(casePath, caseDb);
    }
    catch (const CorrException &e) {
        std::stringstream msg;
        msg << "Error loading case file: " << e.message();
        LOGERROR(msg.str());
        return 1;
    }

    MemoryCorrelationStore store;
    store.newCase(caseDb.getCaseInfo());
    Correlator correlator(caseDb, store);

    size_t entryCount = 0;
    std::vector<CorrBlackboardArtifact> artifacts = caseDb.getArtifacts();
    for (std::vector<CorrBlackboardArtifact>::const_iterator it = artifacts.begin(); it != artifacts.end(); ++it) {
        std::vector<CorrelationEntry> entries = correlator.deriveEntries(*it);
        for (std::vector<CorrelationEntry>::const_iterator entry = entries.begin(); entry != entries.end(); ++entry) {
            recordEntry(store, *entry);
            printEntry(*entry);
            ++entryCount;
        }
    }

    if (doFiles) {
        std::vector<CorrFile> files = caseDb.getFiles();
        for (std::vector<CorrFile>::const_iterator it = files.begin(); it != files.end(); ++it) {
            std::unique_ptr<CorrelationEntry> entry = correlator.deriveEntryForFile(*it);
            if (entry) {
                recordEntry(store, *entry);
                printEntry(*entry);
                ++entryCount;
            }
        }
    }

    std::stringstream msg;
    msg << "corr_extract : derived " << entryCount << " correlation entries from " << casePath
        << ", recorded " << store.getEntryCount();
    LOGINFO(msg.str());
    return 0;
}
