// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef BRIDGE_ERROR_H_6230984571209348756
#define BRIDGE_ERROR_H_6230984571209348756

#include <zen/sys_error.h> //we'll need this later anyway!


namespace fbr
{
class BridgeError //high-level exception: what went wrong from the HTTP client's point of view
{
public:
    explicit BridgeError(const std::string& msg) : msg_(msg) {}
    BridgeError(const std::string& msg, const std::string& details) : msg_(msg), details_(details) {}
    virtual ~BridgeError() {}

    const std::string& getMessage() const { return msg_; }     //safe to show to HTTP clients
    const std::string& getDetails() const { return details_; } //log only: may contain server responses

    std::string toString() const { return details_.empty() ? msg_ : msg_ + "\n\n" + details_; }

private:
    std::string msg_;
    std::string details_;
};

#define DEFINE_NEW_BRIDGE_ERROR(X) struct X : public fbr::BridgeError { X(const std::string& msg) : BridgeError(msg) {} X(const std::string& msg, const std::string& descr) : BridgeError(msg, descr) {} };

DEFINE_NEW_BRIDGE_ERROR(DegradedModeError)
DEFINE_NEW_BRIDGE_ERROR(UnsupportedProtocolError)
DEFINE_NEW_BRIDGE_ERROR(AuthError)
DEFINE_NEW_BRIDGE_ERROR(ConnectionError)
DEFINE_NEW_BRIDGE_ERROR(TimeoutError)
DEFINE_NEW_BRIDGE_ERROR(HostKeyError)
DEFINE_NEW_BRIDGE_ERROR(NotFoundError)
DEFINE_NEW_BRIDGE_ERROR(SizeLimitExceeded)
DEFINE_NEW_BRIDGE_ERROR(TransferCancelled)


enum class ValidationIssue
{
    emptyPath,
    invalidCharacters,
    pathTraversal,
    missingFileName,
    invalidExtension,
    invalidParameter, //query parameters other than the path
};

struct ValidationError : public BridgeError
{
    ValidationError(ValidationIssue issue, const std::string& msg) : BridgeError(msg), issue_(issue) {}

    ValidationIssue getIssue() const { return issue_; }

private:
    ValidationIssue issue_;
};


inline std::string fmtPath(const std::string& displayPath) { return '"' + displayPath + '"'; }
}

#endif //BRIDGE_ERROR_H_6230984571209348756
