// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "http_server.h"
#include <zen/json.h>
#include <zen/thread.h>

using namespace zen;
using namespace fbr;


namespace
{
const int ACCEPT_POLL_INTERVAL_MS = 200; //how quickly run() notices a stop request
const int LISTEN_BACKLOG = 64;
}


std::string HttpConnection::readRequestHead() //throw SysError
{
    std::string buf;
    char chunk[4096] = {};

    for (;;)
    {
        interruptionPoint(); //throw ThreadStopRequest

        const size_t bytesRead = tryReadSocket(socket_, chunk, sizeof(chunk)); //throw SysError; may return short, only 0 means EOF!
        if (bytesRead == 0)
            throw SysError("Connection closed before the request header was complete.");

        const size_t searchStart = buf.size() < 3 ? 0 : buf.size() - 3;
        buf.append(chunk, bytesRead);

        if (const size_t pos = buf.find("\r\n\r\n", searchStart); pos != std::string::npos)
        {
            buf.resize(pos);
            return buf;
        }

        if (buf.size() > HTTP_REQUEST_HEAD_MAX)
            throw SysError("Request header exceeds " + numberTo(HTTP_REQUEST_HEAD_MAX) + " bytes.");
    }
}


void HttpConnection::sendHead(int httpStatus, const HttpHeaders& headers) //throw SysError
{
    if (headSent_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");

    HttpHeaders headersFmt = headers;
    headersFmt["Connection"] = "close";
    headersFmt["Server"] = "FtpBridge";

    const std::string head = formatHttpResponseHead(httpStatus, headersFmt);
    headSent_ = true; //even if partially written: no second attempt
    writeSocketAll(socket_, head.data(), head.size()); //throw SysError
}


void HttpConnection::sendBody(const void* buffer, size_t bytesToWrite) //throw SysError
{
    if (!headSent_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");

    if (bytesToWrite > 0)
        writeSocketAll(socket_, buffer, bytesToWrite); //throw SysError
}


void fbr::sendJsonResponse(HttpResponseSink& response, int httpStatus, const std::string& jsonBody, HttpHeaders extraHeaders) //throw SysError
{
    extraHeaders["Content-Type"] = "application/json";
    extraHeaders["Content-Length"] = numberTo(jsonBody.size());

    response.sendHead(httpStatus, extraHeaders); //throw SysError
    response.sendBody(jsonBody.data(), jsonBody.size()); //
}


void fbr::sendErrorResponse(HttpResponseSink& response, int httpStatus, const std::string& detail, HttpHeaders extraHeaders) //throw SysError
{
    JsonValue jbody(JsonValue::Type::object);
    jbody.objectVal["detail"] = JsonValue(detail);

    sendJsonResponse(response, httpStatus, serializeJson(jbody, "" /*lineBreak*/, "" /*indent*/), std::move(extraHeaders)); //throw SysError
}

//##########################################################################################

HttpServer::HttpServer(const HttpServerConfig& cfg, HttpRequestHandler handler, ServerLog& log) : //throw SysError
    cfg_(cfg),
    handler_(std::move(handler)),
    log_(log),
    serverSocket_(cfg.bindAddress, cfg.port, LISTEN_BACKLOG) {} //throw SysError


void HttpServer::run(const std::atomic<bool>& stopRequested) //throw SysError
{
    //requests beyond maxConnections wait in the queue: the remote servers are the bottleneck, not us
    ThreadGroup<std::function<void()>> requestThreads(cfg_.maxConnections, "HTTP request");

    while (!stopRequested)
    {
        std::string peerName;
        const SocketType clientSocket = serverSocket_.tryAccept(ACCEPT_POLL_INTERVAL_MS, peerName); //throw SysError
        if (clientSocket == invalidSocket) //time-out or EINTR: check stop request
        {
            log_.flushExtraLog();
            continue;
        }

        requestThreads.run([this, clientSocket, peerName] { handleConnection(clientSocket, peerName); });
    }

    log_.logInfo("Stopping server. Cancelling " + numberTo(requestThreads.getTasksPending()) + " pending request(s).");
} //~ThreadGroup(): stop all request threads => ~TransferEngine closes their sessions


void HttpServer::handleConnection(SocketType socket, const std::string& peerName) //throw ThreadStopRequest
{
    HttpConnection conn(socket, peerName); //take ownership *first*
    ZEN_ON_SCOPE_EXIT(log_.flushExtraLog());

    std::string head;
    try
    {
        setSocketTimeouts(socket, cfg_.socketTimeoutSec); //throw SysError
        head = conn.readRequestHead(); //throw SysError
    }
    catch (const SysError& e) { return log_.logDebug("Connection from " + peerName + " dropped: " + e.toString()); }

    try
    {
        HttpRequest request;
        try
        {
            request = parseHttpRequestHead(head); //throw SysError
        }
        catch (const SysError& e)
        {
            log_.logDebug("Malformed request from " + peerName + ": " + e.toString());
            return sendErrorResponse(conn, 400, "Malformed HTTP request."); //throw SysError
        }

        handler_(request, conn, peerName); //throw SysError
    }
    catch (const SysError& e) //client connection broken: nobody left to report to
    {
        log_.logDebug("Connection to " + peerName + " failed: " + e.toString());
    }
}
