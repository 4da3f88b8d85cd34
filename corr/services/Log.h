/*
 * The Sleuth Kit
 *
 * Contact: Brian Carrier [carrier <at> sleuthkit [dot] org]
 * Copyright (c) 2010-2012 Basis Technology Corporation. All Rights
 * reserved.
 *
 * This software is distributed under the Common Public License 1.0
 */

#ifndef _CORR_LOG_H
#define _CORR_LOG_H

#include "corr/corr_i.h"
#include <string>
#include <iostream>
#include <fstream>

// Write to the log registered with CorrServices.
#define LOGERROR(msg) CorrServices::Instance().getLog().log(Log::Error, msg)
#define LOGWARN(msg) CorrServices::Instance().getLog().log(Log::Warn, msg)
#define LOGINFO(msg) CorrServices::Instance().getLog().log(Log::Info, msg)

/**
 * Log for the correlation library and the tools built on it. Lines are
 * timestamped and tagged with their channel, and go to the file given
 * to open() or to stderr while no file is open. Subclasses can send
 * messages elsewhere by overriding log() or logMessage().
 *
 * Runs of the same message on the same channel are written once,
 * followed by a line giving the repeat count. That line is written when
 * a different message arrives, after REPEAT_THRESHOLD repeats, or on
 * close().
 */
class CORR_API Log
{
public:
    enum Channel {
        Error, ///< The current operation was abandoned
        Warn,  ///< Something was skipped, the operation went on
        Info   ///< Progress and summaries
    };

    Log();
    virtual ~Log();

    virtual void log(Channel a_channel, const std::wstring &a_msg);
    virtual void log(Channel a_channel, const std::string &a_msg);
    virtual void logf(Channel a_channel, char const *format, ...);

    void logError(const std::string &msg) { log(Log::Error, msg); }
    void logWarn(const std::string &msg)  { log(Log::Warn,  msg); }
    void logInfo(const std::string &msg)  { log(Log::Info,  msg); }

    /// Returns 0 on success, 1 if the file cannot be opened.
    int open(const char * a_logFileFullPath);

    /// Opens log_<local time>.txt in LOG_DIR, creating LOG_DIR if needed.
    int open();
    int close();
    const char * getLogPath() { return m_filePath.c_str(); }

    /// Tag written in front of the messages of a channel, e.g. "[WARN]".
    static const char * channelName(Channel a_channel);

    static const int REPEAT_THRESHOLD;

protected:
    /// Writes one timestamped line to the file, or to stderr if none is open.
    virtual void logMessage(const std::string& level, const std::string& msg);

    std::string m_filePath;
    std::ofstream m_outStream;

private:
    void flushRepeats();

    Channel m_previousChannel;
    std::string m_previousMessage;
    int m_messageRepeatCount;
};
#endif
