// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "log_file.h"
#include <iostream>
#include <zen/extra_log.h>

using namespace zen;
using namespace fbr;


std::string fbr::maskToken(std::string_view token)
{
    const size_t visibleChars = 8;
    return std::string(token.substr(0, visibleChars)) + "***";
}


ServerLog::ServerLog(const std::string& logFilePath, MessageType minLevel) : minLevel_(minLevel) //throw FileError
{
    if (!logFilePath.empty())
        logFile_ = std::make_unique<FileOutputAppend>(logFilePath); //throw FileError
}


ServerLog::~ServerLog()
{
    flushExtraLog();
}


void ServerLog::log(const std::string& msg, MessageType type) //noexcept
{
    write({std::time(nullptr), type, msg});
}


void ServerLog::flushExtraLog() //noexcept
{
    for (const LogEntry& entry : fetchExtraLog())
        write(entry);
}


void ServerLog::write(const LogEntry& entry) //noexcept
{
    stats_.access([&](ErrorLogStats& stats)
    {
        switch (entry.type)
        {
            case MSG_TYPE_DEBUG:
                ++stats.debug;
                break;
            case MSG_TYPE_INFO:
                ++stats.info;
                break;
            case MSG_TYPE_WARNING:
                ++stats.warning;
                break;
            case MSG_TYPE_ERROR:
                ++stats.error;
                break;
        }
    });

    if (getSeverity(entry.type) < getSeverity(minLevel_))
        return;

    const std::string msgFmt = formatMessage(entry);

    std::lock_guard dummy(lockOutput_);

    std::cerr << msgFmt << std::flush;

    if (logFile_ && !logFileBroken_)
        try
        {
            logFile_->write(msgFmt.data(), msgFmt.size()); //throw FileError
        }
        catch (const FileError& e) //stderr is all that's left: report once, not for every message
        {
            logFileBroken_ = true;
            std::cerr << formatMessage({std::time(nullptr), MSG_TYPE_ERROR, e.toString()}) << std::flush;
        }
}
