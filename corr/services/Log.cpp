/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#include <string>
#include <cstdio>
#include <cstdarg>
#include <sstream>
#include <vector>

#include "Log.h"
#include "CorrServices.h"
#include "corr/utilities/CorrUtilities.h"

#include "Poco/File.h"
#include "Poco/Path.h"
#include "Poco/Exception.h"
#include "Poco/LineEndingConverter.h"
#include "Poco/LocalDateTime.h"
#include "Poco/DateTimeFormatter.h"

// Number of identical messages counted before the count is written out
const int Log::REPEAT_THRESHOLD = 500;

Log::Log()
: m_filePath(""), m_outStream(), m_previousChannel(Info), m_previousMessage(""), m_messageRepeatCount(0)
{
}

Log::~Log()
{
    close();
}

const char * Log::channelName(Channel a_channel)
{
    switch (a_channel) {
    case Error:
        return "[ERROR]";
    case Warn:
        return "[WARN]";
    case Info:
        return "[INFO]";
    }
    return "[INFO]";
}

/**
 * Opens a log file named after the current time in the directory
 * named by the LOG_DIR system property. The directory is created
 * if needed.
 * @returns 1 on error and 0 on success.
 */
int Log::open()
{
    std::string logDir = GetSystemProperty(CorrSystemProperties::LOG_DIR);
    try {
        Poco::File(logDir).createDirectories();
    }
    catch (const Poco::Exception &ex) {
        fprintf(stderr, "The log directory '%s' cannot be created: %s\n", logDir.c_str(), ex.displayText().c_str());
        return 1;
    }

    Poco::Path logPath = Poco::Path::forDirectory(logDir);
    logPath.setFileName("log_" +
        Poco::DateTimeFormatter::format(Poco::LocalDateTime(), "%Y-%m-%d-%H-%M-%S") + ".txt");

    return open(logPath.toString().c_str());
}

/**
 * Open the log file at the path specified, appending to it if it
 * exists. Messages go to stderr until a file is open.
 * @param a_logFileFullPath Path to logfile to open.
 * @returns 1 on error and 0 on success.
 */
int Log::open(const char * a_logFileFullPath)
{
    close();

    m_outStream.clear();
    m_outStream.open(a_logFileFullPath, std::ios::app);
    if (!m_outStream.is_open()) {
        fprintf(stderr, "The file '%s' cannot be opened.\n", a_logFileFullPath);
        return 1;
    }

    m_filePath.assign(a_logFileFullPath);
    return 0;
}

/**
 * Write out any pending repeat count and close the log file.
 * @returns 0 on success
 */
int Log::close()
{
    flushRepeats();

    if (!m_outStream.is_open())
        return 0;

    m_outStream.close();
    if (m_outStream.fail()) {
        fprintf(stderr, "The file '%s' was not closed.\n", m_filePath.c_str());
        return 1;
    }
    return 0;
}

void Log::logf(Channel a_channel, char const *format, ...)
{
    va_list args;
    va_start(args, format);
    va_list sizeArgs;
    va_copy(sizeArgs, args);
    int length = vsnprintf(NULL, 0, format, sizeArgs);
    va_end(sizeArgs);

    if (length < 0) {
        va_end(args);
        log(Error, std::string("Log::logf : invalid format ") + format);
        return;
    }

    std::vector<char> buf(static_cast<size_t>(length) + 1);
    vsnprintf(&buf[0], buf.size(), format, args);
    va_end(args);

    log(a_channel, std::string(&buf[0], static_cast<size_t>(length)));
}

void Log::log(Channel a_channel, const std::string &a_msg)
{
    if (a_channel == m_previousChannel && a_msg == m_previousMessage
        && m_messageRepeatCount < Log::REPEAT_THRESHOLD) {
        m_messageRepeatCount++;
        return;
    }

    flushRepeats();
    m_previousChannel = a_channel;
    m_previousMessage = a_msg;
    logMessage(channelName(a_channel), a_msg);
}

void Log::log(Channel a_channel, const std::wstring &a_msg)
{
    log(a_channel, CorrUtilities::toUTF8(a_msg));
}

void Log::flushRepeats()
{
    if (m_messageRepeatCount == 0)
        return;

    std::stringstream repeatMessage;
    repeatMessage << "The previous message was repeated " << m_messageRepeatCount << " times.";
    m_messageRepeatCount = 0;
    logMessage(channelName(Info), repeatMessage.str());
}

void Log::logMessage(const std::string& level, const std::string& msg)
{
    std::ostream &out = m_outStream.is_open() && m_outStream.good()
        ? static_cast<std::ostream &>(m_outStream) : std::cerr;

    out << Poco::DateTimeFormatter::format(Poco::LocalDateTime(), "%m/%d/%y %H:%M:%S")
        << " " << level << " " << msg << Poco::LineEnding::NEWLINE_DEFAULT;
    out.flush();
}
