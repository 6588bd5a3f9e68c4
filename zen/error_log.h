// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ERROR_LOG_H_8917590832147915
#define ERROR_LOG_H_8917590832147915

#include <cassert>
#include <ctime>
#include <vector>
#include "string_tools.h"


namespace zen
{
enum MessageType
{
    MSG_TYPE_DEBUG   = 0x8,
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::string message;
};

std::string formatMessage(const LogEntry& entry);

using ErrorLog = std::vector<LogEntry>;

void logMsg(ErrorLog& log, const std::string& msg, MessageType type, time_t time = std::time(nullptr));

struct ErrorLogStats
{
    int debug   = 0;
    int info    = 0;
    int warning = 0;
    int error   = 0;
};
ErrorLogStats getStats(const ErrorLog& log);

int getSeverity(MessageType type); //debug < info < warning < error

std::string formatLogTime(time_t time); //"2026-10-19 14:03:27"





//######################## implementation ##########################
inline
void logMsg(ErrorLog& log, const std::string& msg, MessageType type, time_t time)
{
    log.push_back({time, type, msg});
}


inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats count;
    for (const LogEntry& entry : log)
        switch (entry.type)
        {
            case MSG_TYPE_DEBUG:
                ++count.debug;
                break;
            case MSG_TYPE_INFO:
                ++count.info;
                break;
            case MSG_TYPE_WARNING:
                ++count.warning;
                break;
            case MSG_TYPE_ERROR:
                ++count.error;
                break;
        }
    return count;
}


inline
int getSeverity(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_DEBUG:
            return 0;
        case MSG_TYPE_INFO:
            return 1;
        case MSG_TYPE_WARNING:
            return 2;
        case MSG_TYPE_ERROR:
            return 3;
    }
    assert(false);
    return 3;
}


inline
std::string getMessageTypeLabel(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_DEBUG:
            return "Debug";
        case MSG_TYPE_INFO:
            return "Info";
        case MSG_TYPE_WARNING:
            return "Warning";
        case MSG_TYPE_ERROR:
            return "Error";
    }
    assert(false);
    return std::string();
}


inline
std::string formatLogTime(time_t time)
{
    std::tm tmLocal{};
    if (!::localtime_r(&time, &tmLocal))
        return numberTo(static_cast<int64_t>(time));

    char buffer[64] = {};
    const size_t len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tmLocal);
    return std::string(buffer, len);
}


inline
std::string formatMessage(const LogEntry& entry)
{
    std::string msgFmt = '[' + formatLogTime(entry.time) + "]  " + getMessageTypeLabel(entry.type) + ":  ";
    const size_t prefixLen = msgFmt.size(); //labels and time stamp are ASCII

    const std::string msg = trimCpy(entry.message);

    for (auto it = msg.begin(); it != msg.end(); )
        if (*it == '\n')
        {
            msgFmt += *it++;
            msgFmt.append(prefixLen, ' ');
            //skip duplicate newlines
            for (; it != msg.end() && *it == '\n'; ++it)
                ;
        }
        else
            msgFmt += *it++;

    msgFmt += '\n';
    return msgFmt;
}
}

#endif //ERROR_LOG_H_8917590832147915
