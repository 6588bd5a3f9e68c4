// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ROUTES_H_1092837465019283
#define ROUTES_H_1092837465019283

#include <zen/json.h>
#include "http_server.h"
#include "../base/transfer_engine.h"


namespace fbr
{
//everything a request needs: shared by all request threads
struct BridgeContext
{
    const BridgeConfig& cfg;
    const BackendFactory& factory;
    DegradedModeController& degradedMode;
    ServerLog& log;
};


enum class AuthStatus
{
    ok,
    missingCredentials, //401
    invalidToken,       //403
};
struct AuthResult
{
    AuthStatus status = AuthStatus::missingCredentials;
    std::string clientName;
};
//"Authorization: Bearer <token>": every configured token is compared in constant time
AuthResult authenticateClient(const zen::HttpHeaders& headers, const std::vector<AccessToken>& accessTokens);


int getHttpStatus(const BridgeError& e);

std::string getContentType(std::string_view fileName); //"application/octet-stream" if unknown

//host, user, password, path: required; protocol: "auto" if missing; port: optional
DownloadRequest parseDownloadQuery(std::string_view query); //throw ValidationError

//Content-Disposition: RFC 6266 + RFC 5987 for non-ASCII names
std::string formatContentDisposition(const std::string& fileName);

zen::JsonValue getServiceInfo  (const BridgeContext& ctx);
zen::JsonValue getHealthStatus (const BridgeContext& ctx);


class RequestRouter
{
public:
    explicit RequestRouter(const BridgeContext& ctx) : ctx_(ctx) {}

    void handleRequest(const zen::HttpRequest& request, HttpResponseSink& response, const std::string& peerName); //throw SysError

private:
    void onDownload  (const zen::HttpRequest& request, HttpResponseSink& response, const std::string& clientName); //throw SysError
    void onDownloadHead(const zen::HttpRequest& request, HttpResponseSink& response, const std::string& clientName); //throw SysError
    void onRevalidate(HttpResponseSink& response, const std::string& clientName); //throw SysError

    void sendBridgeError(HttpResponseSink& response, const BridgeError& e, const std::string& context); //throw SysError

    //false: response was sent already
    bool checkAuthentication(const zen::HttpRequest& request, HttpResponseSink& response, const std::string& peerName,
                             const std::vector<AccessToken>& accessTokens, std::string& clientName); //throw SysError

    const BridgeContext ctx_;
};
}

#endif //ROUTES_H_1092837465019283
