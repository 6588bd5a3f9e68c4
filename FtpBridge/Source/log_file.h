// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef LOG_FILE_H_89347583475983475
#define LOG_FILE_H_89347583475983475

#include <zen/error_log.h>
#include <zen/file_io.h>
#include <zen/thread.h>


namespace fbr
{
//first 8 characters + "***": enough to tell tokens apart in a log
std::string maskToken(std::string_view token);


/*  server log sink: stderr + optional log file (append, never rotated)
    - messages below minLevel are dropped
    - errors recorded via zen::logExtraError() (e.g. failing session close) are flushed here

    THREAD-SAFETY: all member functions                 */
class ServerLog
{
public:
    ServerLog(const std::string& logFilePath /*empty: stderr only*/, zen::MessageType minLevel); //throw FileError
    ~ServerLog();

    void log(const std::string& msg, zen::MessageType type); //noexcept

    void logDebug  (const std::string& msg) { log(msg, zen::MSG_TYPE_DEBUG); }
    void logInfo   (const std::string& msg) { log(msg, zen::MSG_TYPE_INFO); }
    void logWarning(const std::string& msg) { log(msg, zen::MSG_TYPE_WARNING); }
    void logError  (const std::string& msg) { log(msg, zen::MSG_TYPE_ERROR); }

    //move entries of the process-wide extra log into this log
    void flushExtraLog(); //noexcept

    zen::ErrorLogStats getStats() { return stats_.access([](const zen::ErrorLogStats& stats) { return stats; }); }

private:
    ServerLog           (const ServerLog&) = delete;
    ServerLog& operator=(const ServerLog&) = delete;

    void write(const zen::LogEntry& entry); //noexcept

    const zen::MessageType minLevel_;

    std::mutex lockOutput_;
    std::unique_ptr<zen::FileOutputAppend> logFile_; //protected by lockOutput_
    bool logFileBroken_ = false;                     //

    zen::Protected<zen::ErrorLogStats> stats_;
};
}

#endif //LOG_FILE_H_89347583475983475
