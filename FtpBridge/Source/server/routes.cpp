// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "routes.h"
#include <algorithm>
#include <zen/file_access.h>
#include <zen/open_ssl.h>
#include "../afs/ftp.h"
#include "../afs/sftp.h"
#include "../version/version.h"

using namespace zen;
using namespace fbr;


namespace
{
const char ROUTE_INFO[]       = "/";
const char ROUTE_HEALTH[]     = "/health";
const char ROUTE_DOWNLOAD[]   = "/download";
const char ROUTE_REVALIDATE[] = "/admin/revalidate";

const char ADMIN_CLIENT_NAME[] = "admin";


JsonValue getProtocolList(const std::vector<RemoteProtocol>& protocols)
{
    JsonValue jlist(JsonValue::Type::array);
    for (const RemoteProtocol protocol : protocols)
        jlist.arrayVal.emplace_back(getProtocolName(protocol));
    return jlist;
}


std::string serializeJsonResponse(const JsonValue& jval) { return serializeJson(jval, "\n", "  "); }


bool isAsciiOnly(std::string_view str) { return std::all_of(str.begin(), str.end(), isAsciiChar); }
}


AuthResult fbr::authenticateClient(const HttpHeaders& headers, const std::vector<AccessToken>& accessTokens)
{
    auto it = headers.find("Authorization");
    if (it == headers.end())
        return {AuthStatus::missingCredentials, ""};

    const std::string authValue = trimCpy(it->second);
    const std::string scheme = beforeFirst(authValue, " ", IfNotFoundReturn::all);
    if (!equalAsciiNoCase(scheme, "Bearer"))
        return {AuthStatus::missingCredentials, ""};

    const std::string token = trimCpy(afterFirst(authValue, " ", IfNotFoundReturn::none));
    if (token.empty())
        return {AuthStatus::missingCredentials, ""};

    //no early exit: runtime must not depend on which token matched
    const AccessToken* match = nullptr;
    for (const AccessToken& at : accessTokens)
        if (equalConstantTime(at.token, token) && !match)
            match = &at;

    if (!match)
        return {AuthStatus::invalidToken, ""};

    return {AuthStatus::ok, match->clientName};
}


int fbr::getHttpStatus(const BridgeError& e)
{
    if (dynamic_cast<const ValidationError*>(&e) ||
        dynamic_cast<const UnsupportedProtocolError*>(&e) ||
        dynamic_cast<const HostKeyError*>(&e)) //host key unknown or changed: fix known_hosts, not retry
        return 400;
    if (dynamic_cast<const AuthError*>(&e))
        return 401;
    if (dynamic_cast<const NotFoundError*>(&e))
        return 404;
    if (dynamic_cast<const SizeLimitExceeded*>(&e))
        return 413;
    if (dynamic_cast<const DegradedModeError*>(&e))
        return 503;
    if (dynamic_cast<const TimeoutError*>(&e))
        return 504;
    return 500; //ConnectionError, TransferCancelled
}


std::string fbr::getContentType(std::string_view fileName)
{
    const std::string ext = getFileExtension(fileName);

    if (ext == ".xlsx")
        return "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";
    if (ext == ".xls")
        return "application/vnd.ms-excel";
    if (ext == ".csv")
        return "text/csv";
    if (ext == ".txt")
        return "text/plain";
    if (ext == ".pdf")
        return "application/pdf";
    if (ext == ".zip")
        return "application/zip";
    if (ext == ".json")
        return "application/json";
    if (ext == ".xml")
        return "application/xml";
    return "application/octet-stream";
}


DownloadRequest fbr::parseDownloadQuery(std::string_view query) //throw ValidationError
{
    std::optional<std::string> host;
    std::optional<std::string> user;
    std::optional<std::string> password;
    std::optional<std::string> path;
    std::optional<std::string> protocol;
    std::optional<std::string> port;

    for (const auto& [name, value] : xWwwFormUrlDecode(query))
        if (name == "host")
            host = value;
        else if (name == "user")
            user = value;
        else if (name == "password")
            password = value;
        else if (name == "path")
            path = value;
        else if (name == "protocol")
            protocol = value;
        else if (name == "port")
            port = value;

    auto requireParam = [](const std::optional<std::string>& value, const char* name)
    {
        if (!value)
            throw ValidationError(ValidationIssue::invalidParameter, "Missing query parameter " + fmtPath(name) + '.');
        return *value;
    };

    DownloadRequest request;
    request.host       = requireParam(host,     "host"); //throw ValidationError
    request.username   = requireParam(user,     "user");
    request.password   = requireParam(password, "password");
    request.remotePath = requireParam(path,     "path");

    if (protocol && !trimCpy(*protocol).empty())
    {
        const std::optional<RequestedProtocol> requested = parseRequestedProtocol(*protocol);
        if (!requested)
            throw ValidationError(ValidationIssue::invalidParameter, "Invalid protocol " + fmtPath(*protocol) + ". Use: auto, ftp, ftps, sftp");
        request.protocol = *requested;
    }

    if (port && !trimCpy(*port).empty())
    {
        const std::optional<int> portNo = tryStringTo<int>(*port);
        if (!portNo || *portNo < 1 || *portNo > 65535)
            throw ValidationError(ValidationIssue::invalidParameter, "Invalid port number " + fmtPath(*port) + '.');
        request.port = *portNo;
    }
    return request;
}


std::string fbr::formatContentDisposition(const std::string& fileName)
{
    std::string asciiName;
    for (const char c : fileName)
        asciiName += isAsciiChar(c) && c != '"' && c != '\\' && !isControlChar(c) ? c : '_';

    std::string disposition = "attachment; filename=\"" + asciiName + '"';

    if (!isAsciiOnly(fileName)) //RFC 5987: percent-encoded UTF-8
    {
        std::string nameEnc;
        for (const char c : fileName)
            if (isDigit(c) || isAsciiAlpha(c) || c == '.' || c == '-' || c == '_')
                nameEnc += c;
            else
            {
                const auto [high, low] = hexify(static_cast<unsigned char>(c));
                nameEnc += '%';
                nameEnc += high;
                nameEnc += low;
            }
        disposition += "; filename*=UTF-8''" + nameEnc;
    }
    return disposition;
}


JsonValue fbr::getServiceInfo(const BridgeContext& ctx)
{
    JsonValue jendpoints(JsonValue::Type::object);
    jendpoints.objectVal["download"]   = JsonValue(ROUTE_DOWNLOAD);
    jendpoints.objectVal["head"]       = JsonValue(std::string(ROUTE_DOWNLOAD) + " (HEAD method)");
    jendpoints.objectVal["health"]     = JsonValue(ROUTE_HEALTH);
    jendpoints.objectVal["revalidate"] = JsonValue(std::string(ROUTE_REVALIDATE) + " (POST method)");

    JsonValue jextensions(JsonValue::Type::array);
    for (const std::string& ext : ctx.cfg.allowedExtensions)
        jextensions.arrayVal.emplace_back(ext);

    JsonValue jconfig(JsonValue::Type::object);
    jconfig.objectVal["default_protocol"] = JsonValue(getProtocolName(ctx.cfg.defaultProtocol));
    jconfig.objectVal["max_file_size"]    = JsonValue(static_cast<uint64_t>(ctx.cfg.maxFileSize));
    jconfig.objectVal["chunk_size"]       = JsonValue(static_cast<uint64_t>(ctx.cfg.chunkSize));
    jconfig.objectVal["allowed_extensions"] = std::move(jextensions);
    jconfig.objectVal["protocols"]        = getProtocolList(ctx.factory.getAvailableProtocols());
    jconfig.objectVal["sftp_host_key_verification"] = JsonValue(!ctx.cfg.knownHostsPath.empty());
    jconfig.objectVal["ftps_certificate_verification"] = JsonValue(!ctx.cfg.caBundlePath.empty());

    JsonValue jinfo(JsonValue::Type::object);
    jinfo.objectVal["service"]   = JsonValue(bridgeServiceName);
    jinfo.objectVal["version"]   = JsonValue(bridgeVersion);
    jinfo.objectVal["endpoints"] = std::move(jendpoints);
    jinfo.objectVal["config"]    = std::move(jconfig);
    return jinfo;
}


JsonValue fbr::getHealthStatus(const BridgeContext& ctx)
{
    bool tempDirExists = false;
    try
    {
        tempDirExists = getItemTypeIfExists(ctx.cfg.tempDir) == ItemType::folder; //throw FileError
    }
    catch (const FileError& e) { ctx.log.logWarning(e.toString()); }

    const bool tempDirWritable = tempDirExists && folderIsWritable(ctx.cfg.tempDir);

    const DegradedModeState degradedState = ctx.degradedMode.getState();

    const char* status = degradedState.isDegraded ? "degraded" :
                         tempDirExists && tempDirWritable ? "healthy" : "unhealthy";

    JsonValue jhealth(JsonValue::Type::object);
    jhealth.objectVal["status"]            = JsonValue(status);
    jhealth.objectVal["degraded_mode"]     = JsonValue(degradedState.isDegraded);
    jhealth.objectVal["degraded_reason"]   = JsonValue(degradedState.reason);
    jhealth.objectVal["temp_dir"]          = JsonValue(ctx.cfg.tempDir);
    jhealth.objectVal["temp_dir_exists"]   = JsonValue(tempDirExists);
    jhealth.objectVal["temp_dir_writable"] = JsonValue(tempDirWritable);
    jhealth.objectVal["active_tokens"]     = JsonValue(static_cast<uint64_t>(ctx.cfg.accessTokens.size()));
    jhealth.objectVal["active_sessions"]   = JsonValue(getFtpSessionCount() + getSftpSessionCount());
    jhealth.objectVal["protocols_available"] = getProtocolList(ctx.factory.getAvailableProtocols());
    jhealth.objectVal["default_protocol"]  = JsonValue(getProtocolName(ctx.cfg.defaultProtocol));
    jhealth.objectVal["sftp_host_key_verification"] = JsonValue(!ctx.cfg.knownHostsPath.empty());
    jhealth.objectVal["ftps_certificate_verification"] = JsonValue(!ctx.cfg.caBundlePath.empty());
    jhealth.objectVal["maintenance_trigger"] = JsonValue(!ctx.cfg.adminToken.empty());
    return jhealth;
}

//##########################################################################################

void RequestRouter::handleRequest(const HttpRequest& request, HttpResponseSink& response, const std::string& peerName) //throw SysError
{
    ctx_.log.logDebug(request.method + ' ' + request.path + " from " + peerName);

    auto sendMethodNotAllowed = [&](const char* allowedMethods)
    {
        sendErrorResponse(response, 405, "Method Not Allowed", {{"Allow", allowedMethods}}); //throw SysError
    };

    if (request.path == ROUTE_INFO)
    {
        if (request.method != "GET")
            return sendMethodNotAllowed("GET");
        return sendJsonResponse(response, 200, serializeJsonResponse(getServiceInfo(ctx_))); //throw SysError
    }

    if (request.path == ROUTE_HEALTH)
    {
        if (request.method != "GET")
            return sendMethodNotAllowed("GET");
        return sendJsonResponse(response, 200, serializeJsonResponse(getHealthStatus(ctx_))); //throw SysError
    }

    if (request.path == ROUTE_DOWNLOAD)
    {
        if (request.method != "GET" && request.method != "HEAD")
            return sendMethodNotAllowed("GET, HEAD");

        std::string clientName;
        if (!checkAuthentication(request, response, peerName, ctx_.cfg.accessTokens, clientName)) //throw SysError
            return;

        if (request.method == "HEAD")
            return onDownloadHead(request, response, clientName); //throw SysError
        return onDownload(request, response, clientName); //throw SysError
    }

    if (request.path == ROUTE_REVALIDATE)
    {
        if (request.method != "POST")
            return sendMethodNotAllowed("POST");

        //client tokens can't change process-wide state: admin token only
        std::vector<AccessToken> adminTokens;
        if (!ctx_.cfg.adminToken.empty())
            adminTokens.push_back({ADMIN_CLIENT_NAME, ctx_.cfg.adminToken});

        std::string clientName;
        if (!checkAuthentication(request, response, peerName, adminTokens, clientName)) //throw SysError
            return;

        return onRevalidate(response, clientName); //throw SysError
    }

    sendErrorResponse(response, 404, "Not Found"); //throw SysError
}


bool RequestRouter::checkAuthentication(const HttpRequest& request, HttpResponseSink& response, const std::string& peerName,
                                        const std::vector<AccessToken>& accessTokens, std::string& clientName) //throw SysError
{
    const AuthResult auth = authenticateClient(request.headers, accessTokens);
    switch (auth.status)
    {
        case AuthStatus::ok:
            clientName = auth.clientName;
            ctx_.log.logDebug("Client " + fmtPath(clientName) + " authenticated from " + peerName);
            return true;

        case AuthStatus::missingCredentials:
            ctx_.log.logWarning("Missing bearer token: " + request.method + ' ' + request.path + " from " + peerName);
            sendErrorResponse(response, 401, "Not authenticated", {{"WWW-Authenticate", "Bearer"}}); //throw SysError
            return false;

        case AuthStatus::invalidToken:
        {
            const std::string authValue = request.headers.find("Authorization")->second;
            ctx_.log.logWarning("Invalid token " + maskToken(trimCpy(afterFirst(authValue, " ", IfNotFoundReturn::none))) + " from " + peerName);
        }
        sendErrorResponse(response, 403, "Access Denied: Invalid token"); //throw SysError
        return false;
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");
}


void RequestRouter::sendBridgeError(HttpResponseSink& response, const BridgeError& e, const std::string& context) //throw SysError
{
    const int httpStatus = getHttpStatus(e);

    ctx_.log.log(context + "\n" + e.toString(), httpStatus >= 500 ? MSG_TYPE_ERROR : MSG_TYPE_WARNING);

    if (response.headSent()) //too late for an error response: abort the connection => client sees a truncated transfer
        throw SysError("Transfer aborted after response header was sent.");

    sendErrorResponse(response, httpStatus, e.getMessage()); //throw SysError; details stay in the log: may contain server responses
}


void RequestRouter::onDownloadHead(const HttpRequest& request, HttpResponseSink& response, const std::string& clientName) //throw SysError
{
    const std::string context = "HEAD request by client " + fmtPath(clientName) + " failed.";

    TransferEngine engine(ctx_.cfg, ctx_.factory, ctx_.degradedMode);
    FileMetadata metadata;
    try
    {
        const DownloadRequest dlRequest = parseDownloadQuery(request.query); //throw ValidationError
        metadata = engine.queryMetadata(dlRequest); //throw BridgeError
    }
    catch (const BridgeError& e) { return sendBridgeError(response, e, context); } //throw SysError

    ctx_.log.logInfo("HEAD request by client " + fmtPath(clientName) + ": " + metadata.fileName +
                     " (" + (metadata.fileSize ? numberTo(*metadata.fileSize) + " bytes" : std::string("size unknown")) +
                     ", protocol: " + getProtocolName(metadata.protocol) + ')');

    HttpHeaders headers
    {
        {"X-Protocol",    getProtocolName(metadata.protocol)},
        {"X-File-Name",   metadata.fileName},
        {"Cache-Control", "no-cache"},
    };
    if (metadata.fileSize)
    {
        headers["X-File-Size"]    = numberTo(*metadata.fileSize);
        headers["Content-Length"] = numberTo(*metadata.fileSize);
    }
    response.sendHead(200, headers); //throw SysError
}


void RequestRouter::onDownload(const HttpRequest& request, HttpResponseSink& response, const std::string& clientName) //throw SysError
{
    const std::string context = "Download by client " + fmtPath(clientName) + " failed.";

    TransferEngine engine(ctx_.cfg, ctx_.factory, ctx_.degradedMode); //~TransferEngine: cancel if still streaming
    DownloadInfo info;
    try
    {
        const DownloadRequest dlRequest = parseDownloadQuery(request.query); //throw ValidationError
        info = engine.startDownload(dlRequest); //throw BridgeError
    }
    catch (const BridgeError& e) { return sendBridgeError(response, e, context); } //throw SysError

    const std::string& fileName = info.metadata.fileName;

    HttpHeaders headers
    {
        {"Content-Type",        getContentType(fileName)},
        {"Content-Disposition", formatContentDisposition(fileName)},
        {"Cache-Control",       "no-cache"},
        {"X-Protocol",          getProtocolName(info.metadata.protocol)},
        {"X-File-Name",         fileName},
    };
    if (info.metadata.fileSize) //else: end of body = end of connection
    {
        headers["Content-Length"] = numberTo(*info.metadata.fileSize);
        headers["X-File-Size"]    = numberTo(*info.metadata.fileSize);
    }
    if (info.chunkSizeTuned)
        headers["X-Auto-Chunk-Tuned"] = "true";

    ctx_.log.logInfo("Sending file to client " + fmtPath(clientName) + ": " + fileName +
                     " (" + (info.metadata.fileSize ? numberTo(*info.metadata.fileSize) + " bytes" : std::string("size unknown")) +
                     ", protocol: " + getProtocolName(info.metadata.protocol) + ", chunk size: " + numberTo(info.chunkSize) + ')');

    std::vector<std::byte> buffer(info.chunkSize);
    try
    {
        response.sendHead(200, headers); //throw SysError

        for (;;)
        {
            size_t bytesRead = 0;
            try
            {
                bytesRead = engine.readChunk(buffer.data(), buffer.size()); //throw BridgeError
            }
            catch (const BridgeError& e) { return sendBridgeError(response, e, context); } //throw SysError

            if (bytesRead == 0)
                break;

            response.sendBody(buffer.data(), bytesRead); //throw SysError
        }
    }
    catch (const SysError&)
    {
        if (engine.getState() == TransferState::streaming) //HTTP client disconnected: cancel the remote transfer right away
        {
            engine.cancel();
            ctx_.log.logWarning("Transfer of " + fileName + " to client " + fmtPath(clientName) + " cancelled after " +
                                numberTo(engine.getBytesDelivered()) + " bytes.");
        }
        throw;
    }

    ctx_.log.logInfo("File sent to client " + fmtPath(clientName) + ": " + fileName + " (" + numberTo(engine.getBytesDelivered()) + " bytes)");
}


void RequestRouter::onRevalidate(HttpResponseSink& response, const std::string& clientName) //throw SysError
{
    const DegradedModeState state = ctx_.degradedMode.reevaluate();

    if (state.isDegraded)
        ctx_.log.logWarning("Degraded mode re-evaluated by client " + fmtPath(clientName) + ": " + state.reason);
    else
        ctx_.log.logInfo("Degraded mode re-evaluated by client " + fmtPath(clientName) + ": service fully available.");

    JsonValue jstate(JsonValue::Type::object);
    jstate.objectVal["degraded_mode"]   = JsonValue(state.isDegraded);
    jstate.objectVal["degraded_reason"] = JsonValue(state.reason);
    sendJsonResponse(response, 200, serializeJsonResponse(jstate)); //throw SysError
}
