// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef HTTP_SERVER_H_2309847502938475
#define HTTP_SERVER_H_2309847502938475

#include <atomic>
#include <functional>
#include <zen/http.h>
#include <zen/socket.h>
#include "../log_file.h"


namespace fbr
{
//where a request handler writes its response: decouples routing from sockets
struct HttpResponseSink
{
    virtual ~HttpResponseSink() {}

    virtual void sendHead(int httpStatus, const zen::HttpHeaders& headers) = 0; //throw SysError
    virtual void sendBody(const void* buffer, size_t bytesToWrite) = 0;         //throw SysError

    virtual bool headSent() const = 0;
};


//one accepted client connection: "Connection: close" => exactly one request
class HttpConnection : public HttpResponseSink
{
public:
    HttpConnection(zen::SocketType socket, const std::string& peerName) : socket_(socket), peerName_(peerName) {} //takes ownership!
    ~HttpConnection() { zen::closeSocket(socket_); }

    //blocks until "\r\n\r\n"; the request body (if any) is ignored
    std::string readRequestHead(); //throw SysError

    void sendHead(int httpStatus, const zen::HttpHeaders& headers) override; //throw SysError
    void sendBody(const void* buffer, size_t bytesToWrite) override;         //throw SysError

    bool headSent() const override { return headSent_; }

    const std::string& getPeerName() const { return peerName_; }
    zen::SocketType get() const { return socket_; }

private:
    HttpConnection           (const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    const zen::SocketType socket_;
    const std::string peerName_;
    bool headSent_ = false;
};


using HttpRequestHandler = std::function<void(const zen::HttpRequest& request, HttpResponseSink& response, const std::string& peerName)>; //throw SysError


struct HttpServerConfig
{
    std::string bindAddress; //"0.0.0.0", "::", "127.0.0.1"
    int port = 0;
    size_t maxConnections = 1; //worker threads
    int socketTimeoutSec = 0;  //read/write time-out per client socket
};


class HttpServer
{
public:
    HttpServer(const HttpServerConfig& cfg, HttpRequestHandler handler, ServerLog& log); //throw SysError: bind failed

    //blocks until stopRequested becomes true; then waits for running requests to be cancelled
    void run(const std::atomic<bool>& stopRequested); //throw SysError

    int getPort() const { return serverSocket_.getPort(); } //throw SysError

private:
    HttpServer           (const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void handleConnection(zen::SocketType socket, const std::string& peerName); //throw ThreadStopRequest

    const HttpServerConfig cfg_;
    const HttpRequestHandler handler_;
    ServerLog& log_;
    zen::ServerSocket serverSocket_;
};


//error body for all failures: {"detail": "..."}
void sendJsonResponse(HttpResponseSink& response, int httpStatus, const std::string& jsonBody, zen::HttpHeaders extraHeaders = {}); //throw SysError
void sendErrorResponse(HttpResponseSink& response, int httpStatus, const std::string& detail, zen::HttpHeaders extraHeaders = {}); //throw SysError
}

#endif //HTTP_SERVER_H_2309847502938475
