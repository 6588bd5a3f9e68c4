// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftp.h"
#include <zen/stream_buffer.h>
#include <zen/thread.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include "init_curl_libssh2.h"
#include <fcntl.h> //fcntl(FD_CLOEXEC)

using namespace zen;
using namespace fbr;


namespace
{
const size_t FTP_STREAM_BUFFER_SIZE_MIN = 512 * 1024; //prefetch at least this much while the HTTP client is busy


std::vector<std::string_view> splitFtpResponse(std::string&&) = delete;

std::vector<std::string_view> splitFtpResponse(const std::string& buf)
{
    std::vector<std::string_view> lines;

    split(buf, '\n', [&](const std::string_view block)
    {
        split(block, '\r', [&](const std::string_view line) //Windows FTP servers reply with "\r\n"
        {
            if (!line.empty())
                lines.push_back(line);
        });
    });
    return lines;
}


std::string formatFtpStatus(int sc)
{
    const char* statusText = [&] //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
    {
        switch (sc)
        {
            //*INDENT-OFF*
            case 400: return "The command was not accepted but the error condition is temporary.";
            case 421: return "Service not available, closing control connection.";
            case 425: return "Cannot open data connection.";
            case 426: return "Connection closed; transfer aborted.";
            case 430: return "Invalid username or password.";
            case 434: return "Requested host unavailable.";
            case 450: return "Requested file action not taken.";
            case 451: return "Local error in processing.";

            case 500: return "Syntax error, command unrecognized or command line too long.";
            case 501: return "Syntax error in parameters or arguments.";
            case 502: return "Command not implemented.";
            case 503: return "Bad sequence of commands.";
            case 504: return "Command not implemented for that parameter.";
            case 521: return "Data connection cannot be opened with this PROT setting.";
            case 522: return "Server does not support the requested network protocol.";
            case 530: return "User not logged in.";
            case 534: return "Could not connect to server; issue regarding SSL.";
            case 535: return "Failed security check.";
            case 536: return "Requested PROT level not supported by mechanism.";
            case 550: return "File unavailable, e.g. file not found, no access.";
            case 551: return "Requested action aborted. Page type unknown.";
            case 553: return "File name not allowed.";

            default:  return "";
            //*INDENT-ON*
        }
    }();

    if (std::string_view(statusText).empty())
        return replaceCpy("FTP status %x.", "%x", numberTo(sc));
    else
        return replaceCpy("FTP status %x: ", "%x", numberTo(sc)) + statusText;
}

//================================================================================================================
//================================================================================================================

struct SysErrorFtpProtocol : public zen::SysError
{
    SysErrorFtpProtocol(const std::string& msg, long ftpError) : SysError(msg), ftpErrorCode(ftpError) {}

    long ftpErrorCode;
};

DEFINE_NEW_SYS_ERROR(SysErrorPassword)
DEFINE_NEW_SYS_ERROR(SysErrorNotFound)
DEFINE_NEW_SYS_ERROR(SysErrorCertificate)


constinit Global<UniSessionCounter> globalFtpSessionCount;
GLOBAL_RUN_ONCE(globalFtpSessionCount.set(createUniSessionCounter()));


//one control connection (+ the data connections libcurl opens on it)
class FtpSession
{
public:
    FtpSession(const RemoteLogin& login, bool useTls, const std::string& caBundlePath) : //throw SysError
        login_(login),
        useTls_(useTls),
        caBundlePath_(caBundlePath) {}

    ~FtpSession()
    {
        if (easyHandle_)
            ::curl_easy_cleanup(easyHandle_); //sends QUIT if the connection is still alive
    }

    //returns server response (header data)
    std::string perform(const std::string& serverPath /*empty for session-level commands*/,
                        const std::vector<CurlOption>& extraOptions) //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorNotFound, SysErrorTimeOut
    {
        if (!easyHandle_)
        {
            easyHandle_ = ::curl_easy_init();
            if (!easyHandle_)
                throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), ""));
        }
        else
            ::curl_easy_reset(easyHandle_); //keeps the open connection in the handle's cache

        auto setOption = [easyHandle = easyHandle_](const CurlOption& curlOpt) { setCurlOption(easyHandle, curlOpt); }; //throw SysError

        char curlErrorBuf[CURL_ERROR_SIZE] = {};
        setOption({CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

        std::string headerData;
        curl_write_callback onHeaderReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& output = *static_cast<std::string*>(callbackData);
            output.append(buffer, size * nitems);
            return size * nitems;
        };
        setOption({CURLOPT_HEADERDATA, &headerData}); //throw SysError
        setOption({CURLOPT_HEADERFUNCTION, onHeaderReceived}); //throw SysError

        setOption({CURLOPT_URL, getCurlUrlPath(serverPath).c_str()}); //throw SysError

        //absolute paths => no CWD round trips at all
        setOption({CURLOPT_FTP_FILEMETHOD, CURLFTPMETHOD_NOCWD}); //throw SysError

        if (!login_.username.empty()) //else: libcurl will default to CURL_DEFAULT_USER("anonymous") and CURL_DEFAULT_PASSWORD("ftp@example.com")
        {
            setOption({CURLOPT_USERNAME, login_.username.c_str()}); //throw SysError
            setOption({CURLOPT_PASSWORD, login_.password.c_str()}); //throw SysError
        }

        setOption({CURLOPT_PORT, login_.port}); //throw SysError

        //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html
        setOption({CURLOPT_NOSIGNAL, 1}); //throw SysError

        //allow PASV IP: some FTP servers really use IP different from control connection
        setOption({CURLOPT_FTP_SKIP_PASV_IP, 0}); //throw SysError

        setOption({CURLOPT_CONNECTTIMEOUT, login_.timeoutSec}); //throw SysError

        //CURLOPT_TIMEOUT would limit the total transfer time => instead: fail on a stalled connection
        setOption({CURLOPT_LOW_SPEED_TIME, login_.timeoutSec}); //throw SysError
        setOption({CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/}); //throw SysError
        //can't use "0" which means "inactive", so use some low number

        setOption({CURLOPT_SERVER_RESPONSE_TIMEOUT, login_.timeoutSec}); //throw SysError

        //slow HTTP clients may leave the control connection idle for a long time during RETR
        setOption({CURLOPT_TCP_KEEPALIVE, 1}); //throw SysError

        std::optional<SysError> socketException;
        //libcurl does *not* set FD_CLOEXEC for us! https://github.com/curl/curl/issues/2252
        auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype purpose)
        {
            if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1)
            {
                socketException = SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno));
                return CURL_SOCKOPT_ERROR;
            }
            return CURL_SOCKOPT_OK;
        };

        using SocketCbType = decltype(onSocketCreate);
        using SocketCbWrapperType =            int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
        SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
        {
            return (*clientp)(curlfd, purpose); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        setOption({CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper}); //throw SysError
        setOption({CURLOPT_SOCKOPTDATA, &onSocketCreate}); //throw SysError

        if (useTls_ && !caBundlePath_.empty())
        {
            setOption({CURLOPT_CAINFO, caBundlePath_.c_str()}); //throw SysError
            setOption({CURLOPT_SSL_VERIFYPEER, 1}); //throw SysError
            setOption({CURLOPT_SSL_VERIFYHOST, 2}); //throw SysError
        }
        else
        {
            setOption({CURLOPT_CAINFO, 0}); //throw SysError
            //be explicit: "even when [CURLOPT_SSL_VERIFYPEER] is disabled [...] curl may still load the certificate file specified in CURLOPT_CAINFO."
            setOption({CURLOPT_SSL_VERIFYPEER, 0}); //throw SysError
            setOption({CURLOPT_SSL_VERIFYHOST, 0}); //throw SysError
        }

        if (useTls_) //https://tools.ietf.org/html/rfc4217
        {
            //require SSL for both control and data:
            setOption({CURLOPT_USE_SSL, CURLUSESSL_ALL}); //throw SysError
            if (!useImplicitTls())
                setOption({CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS}); //throw SysError
        }

        for (const CurlOption& option : extraOptions)
            setOption(option); //throw SysError

        //=======================================================================================================
        const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);
        //curl_easy_perform() considers FTP response codes >= 400 as failure

        if (socketException)
            throw* socketException; //throw SysError
        //=======================================================================================================

        if (rcPerf != CURLE_OK)
        {
            std::string errorMsg = trimCpy(curlErrorBuf); //optional

            if (const std::vector<std::string_view>& headerLines = splitFtpResponse(headerData);
                !headerLines.empty())
                if (const std::string response = trimCpy(headerLines.back()); //that *should* be the server's error response
                    !response.empty())
                    errorMsg += (errorMsg.empty() ? "" : "\n") + response;

            const std::string sysErrorMsg = formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg);

            if (rcPerf == CURLE_LOGIN_DENIED)
                throw SysErrorPassword(sysErrorMsg);

            if (rcPerf == CURLE_OPERATION_TIMEDOUT)
                throw SysErrorTimeOut(sysErrorMsg);

            if (rcPerf == CURLE_REMOTE_FILE_NOT_FOUND)
                throw SysErrorNotFound(sysErrorMsg);

            if (rcPerf == CURLE_PEER_FAILED_VERIFICATION)
                throw SysErrorCertificate(sysErrorMsg);

            long ftpStatusCode = 0; //optional
            /*const CURLcode rc =*/ ::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &ftpStatusCode);
            if (ftpStatusCode == 550 && !serverPath.empty())
                throw SysErrorNotFound(sysErrorMsg + '\n' + formatFtpStatus(ftpStatusCode));

            if (ftpStatusCode == 530)
                throw SysErrorPassword(sysErrorMsg + '\n' + formatFtpStatus(ftpStatusCode));

            if (ftpStatusCode != 0)
                throw SysErrorFtpProtocol(sysErrorMsg + '\n' + formatFtpStatus(ftpStatusCode), ftpStatusCode);

            throw SysError(sysErrorMsg);
        }
        return headerData;
    }

    //returns server response (header data)
    std::string runSingleFtpCommand(const std::string& ftpCmd) //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorTimeOut
    {
        curl_slist* quote = nullptr;
        ZEN_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        quote = ::curl_slist_append(quote, ftpCmd.c_str());
        if (!quote)
            throw SysError(formatSystemError("curl_slist_append", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), ""));

        return perform("" /*serverPath*/,
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
        }); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorTimeOut
    }

    //connect + login (+ TLS handshake); any FTP reply to the test command means the control connection is fine
    void testConnection() //throw SysError, SysErrorPassword, SysErrorTimeOut
    {
        //'*' prefix: "550 NOOP: Operation not permitted" still counts as a response
        runSingleFtpCommand("*NOOP"); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorTimeOut
    }

    //evaluate after perform() with CURLOPT_NOBODY + CURLOPT_FILETIME
    std::optional<uint64_t> getLastContentLength() const
    {
        curl_off_t fileSize = -1;
        if (easyHandle_ && ::curl_easy_getinfo(easyHandle_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &fileSize) == CURLE_OK && fileSize >= 0)
            return static_cast<uint64_t>(fileSize);
        return {}; //server does not support "SIZE"
    }

    std::optional<time_t> getLastFileTime() const
    {
        curl_off_t modTime = -1;
        if (easyHandle_ && ::curl_easy_getinfo(easyHandle_, CURLINFO_FILETIME_T, &modTime) == CURLE_OK && modTime >= 0)
            return static_cast<time_t>(modTime);
        return {}; //no "MDTM"
    }

private:
    FtpSession           (const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    bool useImplicitTls() const { return useTls_ && login_.port == DEFAULT_PORT_FTPS_IMPLICIT; }

    std::string getCurlUrlPath(const std::string& serverPath) //throw SysError
    {
        std::string curlRelPath; //libcurl expects encoded paths (except for '/' char!!!)

        split(serverPath, '/', [&](std::string_view comp)
        {
            if (!comp.empty())
            {
                char* compFmt = ::curl_easy_escape(easyHandle_, comp.data(), static_cast<int>(comp.size()));
                if (!compFmt)
                    throw SysError(formatSystemError("curl_easy_escape(" + std::string(comp) + ')', "", "Conversion failure"));
                ZEN_ON_SCOPE_EXIT(::curl_free(compFmt));

                if (!curlRelPath.empty())
                    curlRelPath += '/';
                curlRelPath += compFmt;
            }
        });

        if (trimCpy(login_.server).empty())
            throw SysError("Server name must not be empty.");

        const std::string server = contains(login_.server, ':') ? '[' + login_.server + ']' : login_.server; //IPv6 literal

        //CURLFTPMETHOD_NOCWD requires absolute paths: use "//" because "/%2f" had bugs: https://github.com/curl/curl/pull/4348
        return (useImplicitTls() ? "ftps://" : "ftp://") + server + "//" + curlRelPath;
    }

    const RemoteLogin login_;
    const bool useTls_;
    const std::string caBundlePath_;
    CURL* easyHandle_ = nullptr;
    const std::shared_ptr<UniCounterCookie> libsshCurlUnifiedInitCookie_{getLibsshCurlUnifiedInitCookie(globalFtpSessionCount)}; //throw SysError
};

//===========================================================================================================================

UniInitializer globalStartupInitFtp(*globalFtpSessionCount.get());

//===========================================================================================================================

//SysError is what libcurl has to say; the HTTP client gets one of the bridge error types
template <class Function>
auto runFtpOperation(const std::string& errorMsg, Function fun) //throw AuthError, TimeoutError, NotFoundError, HostKeyError, ConnectionError
{
    try
    {
        return fun(); //throw SysError, SysErrorPassword, SysErrorNotFound, SysErrorTimeOut, SysErrorCertificate
    }
    catch (const SysErrorPassword&    e) { throw AuthError    (errorMsg, e.toString()); }
    catch (const SysErrorTimeOut&     e) { throw TimeoutError (errorMsg, e.toString()); }
    catch (const SysErrorNotFound&    e) { throw NotFoundError(errorMsg, e.toString()); }
    catch (const SysErrorCertificate& e) { throw HostKeyError (errorMsg + " The server certificate could not be verified.", e.toString()); }
    catch (const SysError&         e) { throw ConnectionError(errorMsg, e.toString()); }
}


void ftpFileDownload(FtpSession& session, const std::string& filePath, size_t blockSize, //throw SysError, X
                     const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/)
{
    std::exception_ptr exception;

    auto onBytesReceived = [&](const void* buffer, size_t bytesToWrite)
    {
        try
        {
            writeBlock(buffer, bytesToWrite); //throw X
            return bytesToWrite;
        }
        catch (...)
        {
            exception = std::current_exception();
            return bytesToWrite + 1; //signal error condition => CURLE_WRITE_ERROR
        }
    };
    curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
    {
        return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
    };

    //a stalled server must not delay cancellation until CURLOPT_LOW_SPEED_TIME kicks in
    auto onProgress = [&]
    {
        try
        {
            interruptionPoint(); //throw ThreadStopRequest
            return 0;
        }
        catch (ThreadStopRequest&)
        {
            exception = std::current_exception();
            return 1; //=> CURLE_ABORTED_BY_CALLBACK
        }
    };
    using ProgressCbWrapperType = int (*)(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow); //needed for cdecl function pointer cast
    ProgressCbWrapperType onProgressWrapper = [](void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow)
    {
        return (*static_cast<decltype(onProgress)*>(clientp))();
    };

    try
    {
        session.perform(filePath,
        {
            {CURLOPT_WRITEDATA, &onBytesReceived},
            {CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper},
            {CURLOPT_XFERINFODATA, &onProgress},
            {CURLOPT_XFERINFOFUNCTION, onProgressWrapper},
            {CURLOPT_NOPROGRESS, 0L},
            {CURLOPT_BUFFERSIZE, static_cast<long>(std::min<size_t>(blockSize, CURL_MAX_READ_SIZE))},
        }); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorNotFound, SysErrorTimeOut
    }
    catch (const SysError&)
    {
        if (exception)
            std::rethrow_exception(exception);
        throw;
    }
}


class ChunkStreamFtp : public ChunkStream
{
public:
    ChunkStreamFtp(const std::shared_ptr<FtpSession>& session, const std::string& displayPath, const std::string& filePath, size_t chunkSize) :
        blockSize_(chunkSize),
        asyncStreamIn_(std::make_shared<AsyncStreamBuffer>(std::max(4 * chunkSize, FTP_STREAM_BUFFER_SIZE_MIN)))
    {
        worker_ = InterruptibleThread([asyncStreamOut = this->asyncStreamIn_, session /*share ownership: handle lives until RETR is done*/, displayPath, filePath, chunkSize]
        {
            setCurrentThreadName("Istream FTP");
            try
            {
                runFtpOperation("Cannot read file " + fmtPath(displayPath) + '.', [&]
                {
                    ftpFileDownload(*session, filePath, chunkSize, [&](const void* buffer, size_t bytesToWrite)
                    {
                        asyncStreamOut->write(buffer, bytesToWrite); //throw ThreadStopRequest
                    }); //throw SysError, ThreadStopRequest
                }); //throw BridgeError, ThreadStopRequest

                asyncStreamOut->closeStream();
            }
            catch (BridgeError&) { asyncStreamOut->setWriteError(std::current_exception()); } //let ThreadStopRequest pass through!
        });
    }

    ~ChunkStreamFtp()
    {
        asyncStreamIn_->setReadError(std::make_exception_ptr(ThreadStopRequest()));
        worker_.requestStop(); //=> progress callback aborts curl_easy_perform()
        //~InterruptibleThread joins
    }

    size_t getBlockSize() const override { return blockSize_; }

    size_t tryRead(void* buffer, size_t bytesToRead) override //throw ConnectionError, TimeoutError, NotFoundError
    {
        return asyncStreamIn_->tryRead(buffer, bytesToRead); //throw BridgeError
        //no need to check for write errors after EOF: closeStream() is only called on success
    }

private:
    const size_t blockSize_;
    std::shared_ptr<AsyncStreamBuffer> asyncStreamIn_;
    InterruptibleThread worker_;
};


class FtpRemoteSession : public RemoteSession
{
public:
    FtpRemoteSession(std::shared_ptr<FtpSession>&& session, const RemoteLogin& login, bool useTls) :
        session_(std::move(session)), login_(login), useTls_(useTls) {}

    ~FtpRemoteSession() { close(); }

    RemoteProtocol getProtocol() const override { return useTls_ ? RemoteProtocol::ftps : RemoteProtocol::ftp; }

    FileMetadata getFileMetadata(const std::string& remotePath) override //throw NotFoundError, ConnectionError, TimeoutError
    {
        const std::string displayPath = getDisplayPath(getProtocol(), login_, remotePath);

        return runFtpOperation("Cannot read file attributes of " + fmtPath(displayPath) + '.', [&]
        {
            FtpSession& session = getSession(); //throw SysError

            //NOBODY + FILETIME => "SIZE" + "MDTM", no data connection; fails with 550 for folders, too
            session.perform(remotePath,
            {
                {CURLOPT_NOBODY, 1L},
                {CURLOPT_FILETIME, 1L},
            }); //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorNotFound, SysErrorTimeOut

            FileMetadata metadata;
            metadata.fileName = afterLast(remotePath, "/", IfNotFoundReturn::all);
            metadata.protocol = getProtocol();

            metadata.fileSize = session.getLastContentLength();
            metadata.modTime  = session.getLastFileTime();
            return metadata;
        });
    }

    std::unique_ptr<ChunkStream> openReadStream(const std::string& remotePath, size_t chunkSize) override //throw NotFoundError, ConnectionError, TimeoutError
    {
        const std::string displayPath = getDisplayPath(getProtocol(), login_, remotePath);

        if (!session_)
            throw ConnectionError("Cannot read file " + fmtPath(displayPath) + '.', "Session already closed.");

        //RETR starts on the worker thread: errors show up in ChunkStream::tryRead()
        return std::make_unique<ChunkStreamFtp>(session_, displayPath, remotePath, chunkSize);
    }

    void close() override
    {
        //a running stream keeps its own reference => curl_easy_cleanup() after the worker thread is done
        session_.reset();
    }

private:
    FtpSession& getSession() //throw SysError
    {
        if (!session_)
            throw SysError("Session already closed.");
        return *session_;
    }

    std::shared_ptr<FtpSession> session_;
    const RemoteLogin login_;
    const bool useTls_;
};


class FtpBackend : public ProtocolBackend
{
public:
    FtpBackend(bool useTls, const std::string& caBundlePath) : useTls_(useTls), caBundlePath_(caBundlePath) {}

    RemoteProtocol getProtocol() const override { return useTls_ ? RemoteProtocol::ftps : RemoteProtocol::ftp; }

    std::unique_ptr<RemoteSession> connect(const RemoteLogin& login) const override //throw AuthError, ConnectionError, TimeoutError
    {
        const std::string displayPath = getDisplayPath(getProtocol(), login, "/");

        std::shared_ptr<FtpSession> session = runFtpOperation("Unable to connect to " + fmtPath(displayPath) + '.', [&]
        {
            auto newSession = std::make_shared<FtpSession>(login, useTls_, caBundlePath_); //throw SysError
            newSession->testConnection(); //throw SysError, SysErrorPassword, SysErrorTimeOut
            return newSession;
        });
        return std::make_unique<FtpRemoteSession>(std::move(session), login, useTls_);
    }

private:
    const bool useTls_;
    const std::string caBundlePath_;
};
}


std::unique_ptr<ProtocolBackend> fbr::createFtpBackend(bool useTls, const std::string& caBundlePath)
{
    return std::make_unique<FtpBackend>(useTls, caBundlePath);
}


bool fbr::ftpBackendAvailable(bool useTls)
{
    const CurlFeatures features = getCurlFeatures();

    if (!features.protocols.contains("ftp"))
        return false;

    //explicit FTPS runs on an "ftp://" URL => TLS support is what matters
    return !useTls || features.tlsSupport;
}


int fbr::getFtpSessionCount()
{
    return getLiveSessionCount(globalFtpSessionCount);
}
