// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ERROR_H_839567308565656789
#define FILE_ERROR_H_839567308565656789

#include "sys_error.h" //we'll need this later anyway!


namespace zen
{
class FileError //high-level exception class for local files: config, .env, log, temp folder
{
public:
    explicit FileError(const std::string& msg) : msg_(msg) {}
    FileError(const std::string& msg, const std::string& details) : msg_(msg + "\n\n" + details) {}
    virtual ~FileError() {}

    const std::string& toString() const { return msg_; }

private:
    std::string msg_;
};

#define DEFINE_NEW_FILE_ERROR(X) struct X : public zen::FileError { X(const std::string& msg) : FileError(msg) {} X(const std::string& msg, const std::string& descr) : FileError(msg, descr) {} };


#define THROW_LAST_FILE_ERROR(msg, functionName)                           \
    do { const zen::ErrorCode ecInternal = zen::getLastError(); throw zen::FileError(msg, zen::formatSystemError(functionName, ecInternal)); } while (false)

//----------- facilitate usage of std::string for error messages --------------------

inline std::string fmtFilePath(const std::string& filePath) { return '"' + filePath + '"'; }
}

#endif //FILE_ERROR_H_839567308565656789
