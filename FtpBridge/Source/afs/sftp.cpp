// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sftp.h"
#include <cstring>
#include <zen/extra_log.h>
#include <zen/open_ssl.h>
#include <zen/socket.h>
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2_sftp.h> directly!
#include "init_curl_libssh2.h"

using namespace zen;
using namespace fbr;


namespace
{
/*  SFTP specification version 3 (implemented by libssh2): https://filezilla-project.org/specs/draft-ietf-secsh-filexfer-02.txt

    one request = one SSH session = one SFTP channel: no reuse, no non-blocking multiplexing
    => plain blocking libssh2 calls, bounded by libssh2_session_set_timeout()                  */

//=> most likely *not* a connection issue
struct SysErrorSftpProtocol : public zen::SysError
{
    SysErrorSftpProtocol(const std::string& msg, unsigned long sftpError) : SysError(msg), sftpErrorCode(sftpError) {}

    const unsigned long sftpErrorCode;
};

DEFINE_NEW_SYS_ERROR(SysErrorPassword)
DEFINE_NEW_SYS_ERROR(SysErrorHostKey)
DEFINE_NEW_SYS_ERROR(SysErrorNotFound)


constinit Global<UniSessionCounter> globalSftpSessionCount;
GLOBAL_RUN_ONCE(globalSftpSessionCount.set(createUniSessionCounter()));


class SshSession
{
public:
    SshSession(const RemoteLogin& login, const std::string& knownHostsPath) : //throw SysError, SysErrorPassword, SysErrorHostKey, SysErrorTimeOut
        login_(login)
    {
        ZEN_ON_SCOPE_FAIL(cleanup()); //destructor call would lead to member double clean-up!!!

        socket_.emplace(login_.server, numberTo(login_.port), login_.timeoutSec); //throw SysError, SysErrorTimeOut

        sshSession_ = ::libssh2_session_init();
        if (!sshSession_) //does not set ssh last error; source: only memory allocation may fail
            throw SysError(formatSystemError("libssh2_session_init", formatSshStatusCode(LIBSSH2_ERROR_ALLOC), ""));

        ::libssh2_session_set_blocking(sshSession_, 1);
        ::libssh2_session_set_timeout(sshSession_, login_.timeoutSec * 1000 /*ms*/);

        if (::libssh2_session_handshake(sshSession_, socket_->get()) != 0)
            throwLastSshError("libssh2_session_handshake", nullptr); //throw SysError, SysErrorTimeOut

        //before sending the password anywhere!
        verifyHostKey(knownHostsPath); //throw SysError, SysErrorHostKey

        authenticate(); //throw SysError, SysErrorPassword, SysErrorTimeOut

        sftpChannel_ = ::libssh2_sftp_init(sshSession_);
        if (!sftpChannel_)
            throwLastSshError("libssh2_sftp_init", nullptr); //throw SysError, SysErrorTimeOut
    }

    ~SshSession() { cleanup(); }

    LIBSSH2_SFTP* getSftpChannel() { return sftpChannel_; }

    [[noreturn]] void throwLastSshError(const char* functionName, LIBSSH2_SFTP* sftpChannel /*optional*/) const //throw SysError, SysErrorSftpProtocol, SysErrorTimeOut
    {
        char* lastErrorMsg = nullptr; //owned by "sshSession"
        const int sshStatusCode = ::libssh2_session_last_error(sshSession_, &lastErrorMsg, nullptr, false /*want_buf*/);

        std::string errorMsg;
        if (lastErrorMsg)
            errorMsg = trimCpy(lastErrorMsg);

        //LIBSSH2_ERROR_SFTP_PROTOCOL does *not* mean libssh2_sftp_last_error() is also available!
        //But if it's not, we have a broken connection, and lastErrorMsg contains meaningful details!
        if (sshStatusCode == LIBSSH2_ERROR_SFTP_PROTOCOL && sftpChannel && ::libssh2_sftp_last_error(sftpChannel) != LIBSSH2_FX_OK)
        {
            if (errorMsg == "SFTP Protocol Error") //that's trite!
                errorMsg.clear();
            const unsigned long sftpStatusCode = ::libssh2_sftp_last_error(sftpChannel);
            throw SysErrorSftpProtocol(formatSystemError(functionName, formatSftpStatusCode(sftpStatusCode), errorMsg), sftpStatusCode);
        }

        if (sshStatusCode == LIBSSH2_ERROR_TIMEOUT ||
            sshStatusCode == LIBSSH2_ERROR_SOCKET_TIMEOUT)
            throw SysErrorTimeOut(formatSystemError(functionName, formatSshStatusCode(sshStatusCode), errorMsg));

        throw SysError(formatSystemError(functionName, formatSshStatusCode(sshStatusCode), errorMsg));
    }

    //all libssh2 errors after the handshake are reported, but none of them is fatal for the caller
    void disconnect(std::vector<std::string>& errors) //noexcept
    {
        if (sftpChannel_)
        {
            if (::libssh2_sftp_shutdown(sftpChannel_) != LIBSSH2_ERROR_NONE)
                errors.push_back("libssh2_sftp_shutdown failed.");
            sftpChannel_ = nullptr;
        }

        if (sshSession_)
        {
            if (::libssh2_session_disconnect(sshSession_, "FtpBridge says \"bye\"!") != LIBSSH2_ERROR_NONE) //server notification only
                errors.push_back("libssh2_session_disconnect failed.");

            if (::libssh2_session_free(sshSession_) != LIBSSH2_ERROR_NONE)
                errors.push_back("libssh2_session_free failed.");
            sshSession_ = nullptr;
        }
        socket_.reset();
    }

private:
    SshSession           (const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    void verifyHostKey(const std::string& knownHostsPath) //throw SysError, SysErrorHostKey
    {
        size_t keyLen = 0;
        int keyType = LIBSSH2_HOSTKEY_TYPE_UNKNOWN;
        const char* hostKey = ::libssh2_session_hostkey(sshSession_, &keyLen, &keyType);
        if (!hostKey || keyLen == 0)
            throwLastSshError("libssh2_session_hostkey", nullptr); //throw SysError

        const std::string fingerprint = formatHostKeyType(keyType) + ' ' + formatSshFingerprint(sha256Digest({hostKey, keyLen})); //throw SysError

        if (knownHostsPath.empty()) //no verification configured: reduced security, but no error
            return;

        LIBSSH2_KNOWNHOSTS* knownHosts = ::libssh2_knownhost_init(sshSession_);
        if (!knownHosts)
            throwLastSshError("libssh2_knownhost_init", nullptr); //throw SysError
        ZEN_ON_SCOPE_EXIT(::libssh2_knownhost_free(knownHosts));

        if (const int rc = ::libssh2_knownhost_readfile(knownHosts, knownHostsPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH);
            rc < 0)
            throw SysErrorHostKey(formatSystemError("libssh2_knownhost_readfile", formatSshStatusCode(rc),
                                                    "Cannot read known_hosts file " + fmtPath(knownHostsPath) + '.'));

        libssh2_knownhost* knownHost = nullptr;
        //port != 22 => looks up "[server]:port" entries
        const int rc = ::libssh2_knownhost_checkp(knownHosts, login_.server.c_str(), login_.port, hostKey, keyLen,
                                                  LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | getKnownHostKeyTypeMask(keyType), &knownHost);
        switch (rc)
        {
            case LIBSSH2_KNOWNHOST_CHECK_MATCH:
                return;

            case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
                throw SysErrorHostKey("Host key for " + fmtPath(login_.server) + " does not match the entry in " + fmtPath(knownHostsPath) + ".\n" +
                                      "Server key: " + fingerprint);

            case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
                throw SysErrorHostKey("Host key for " + fmtPath(login_.server) + " not found in " + fmtPath(knownHostsPath) + ".\n" +
                                      "Server key: " + fingerprint);

            default: //LIBSSH2_KNOWNHOST_CHECK_FAILURE
                throw SysErrorHostKey(formatSystemError("libssh2_knownhost_checkp", numberTo(rc), "Host key verification failed."));
        }
    }

    void authenticate() //throw SysError, SysErrorPassword, SysErrorTimeOut
    {
        const char* authList = ::libssh2_userauth_list(sshSession_, login_.username);
        if (!authList)
        {
            if (::libssh2_userauth_authenticated(sshSession_) != 1)
                throwLastSshError("libssh2_userauth_list", nullptr); //throw SysError, SysErrorTimeOut
            return; //SSH_USERAUTH_NONE has authenticated successfully => we're already done
        }

        bool supportAuthPassword    = false;
        bool supportAuthInteractive = false;
        split(authList, ',', [&](const std::string_view block)
        {
            const std::string authMethod = trimCpy(block);
            if (authMethod == "password")
                supportAuthPassword = true;
            else if (authMethod == "keyboard-interactive")
                supportAuthInteractive = true;
        });

        if (supportAuthPassword)
        {
            if (::libssh2_userauth_password(sshSession_, login_.username, login_.password) != 0)
                try
                {
                    throwLastSshError("libssh2_userauth_password", nullptr); //throw SysError, SysErrorTimeOut
                }
                catch (const SysErrorTimeOut&) { throw; }
                catch (const SysError& e) { throw SysErrorPassword(e.toString()); }
        }
        else if (supportAuthInteractive) //some servers support "keyboard-interactive", but not "password"
        {
            std::string unexpectedPrompts;

            auto authCallback = [&](int num_prompts, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses)
            {
                //a single prompt without echo is the password request; prompt text may be localized!
                if (num_prompts == 1 && prompts[0].echo == 0)
                {
                    responses[0].text = //pass ownership; will be ::free()d
                        ::strdup(login_.password.c_str());
                    responses[0].length = static_cast<unsigned int>(login_.password.size());
                }
                else
                    for (int i = 0; i < num_prompts; ++i)
                        unexpectedPrompts += (unexpectedPrompts.empty() ? "" : "|") + std::string(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
            };
            using AuthCbType = decltype(authCallback);

            auto authCallbackWrapper = [](const char* name, int name_len, const char* instruction, int instruction_len,
                                          int num_prompts, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses, void** abstract)
            {
                AuthCbType* callback = *reinterpret_cast<AuthCbType**>(abstract); //free this poor little C-API from its shackles and redirect to a proper lambda
                (*callback)(num_prompts, prompts, responses); //only std::string appends: may throw std::bad_alloc => terminate, same as any C callback
            };

            if (*::libssh2_session_abstract(sshSession_))
                throw SysError("libssh2_session_abstract: non-null value");

            *reinterpret_cast<AuthCbType**>(::libssh2_session_abstract(sshSession_)) = &authCallback;
            ZEN_ON_SCOPE_EXIT(*::libssh2_session_abstract(sshSession_) = nullptr);

            if (::libssh2_userauth_keyboard_interactive(sshSession_, login_.username, authCallbackWrapper) != 0)
                try
                {
                    throwLastSshError("libssh2_userauth_keyboard_interactive", nullptr); //throw SysError, SysErrorTimeOut
                }
                catch (const SysErrorTimeOut&) { throw; }
                catch (const SysError& e)
                {
                    throw SysErrorPassword(e.toString() + (unexpectedPrompts.empty() ? "" : "\nUnexpected prompts: " + unexpectedPrompts));
                }
        }
        else
            throw SysErrorPassword(replaceCpy("The server does not support authentication via %x.", "%x", "\"username/password\"") +
                                   "\nRequired: " + authList);
    }

    void cleanup() //attention: may block heavily after error!
    {
        std::vector<std::string> errors;
        disconnect(errors); //nothing to report: constructor failed or session is already gone
    }

    const RemoteLogin login_;
    std::optional<Socket> socket_; //*bound* after constructor has run
    LIBSSH2_SESSION* sshSession_ = nullptr;
    LIBSSH2_SFTP* sftpChannel_ = nullptr;
    const std::shared_ptr<UniCounterCookie> libsshCurlUnifiedInitCookie_{getLibsshCurlUnifiedInitCookie(globalSftpSessionCount)}; //throw SysError
};

//===========================================================================================================================

UniInitializer globalInitSftp(*globalSftpSessionCount.get());

//===========================================================================================================================

template <class Function>
auto runSftpOperation(const std::string& errorMsg, Function fun) //throw AuthError, HostKeyError, TimeoutError, NotFoundError, ConnectionError
{
    try
    {
        return fun(); //throw SysError, SysErrorPassword, SysErrorHostKey, SysErrorNotFound, SysErrorSftpProtocol, SysErrorTimeOut
    }
    catch (const SysErrorPassword& e) { throw AuthError    (errorMsg, e.toString()); }
    catch (const SysErrorHostKey&  e) { throw HostKeyError (errorMsg, e.toString()); }
    catch (const SysErrorTimeOut&  e) { throw TimeoutError (errorMsg, e.toString()); }
    catch (const SysErrorNotFound& e) { throw NotFoundError(errorMsg, e.toString()); }
    catch (const SysErrorSftpProtocol& e)
    {
        if (e.sftpErrorCode == LIBSSH2_FX_NO_SUCH_FILE ||
            e.sftpErrorCode == LIBSSH2_FX_NO_SUCH_PATH)
            throw NotFoundError(errorMsg, e.toString());
        throw ConnectionError(errorMsg, e.toString());
    }
    catch (const SysError& e) { throw ConnectionError(errorMsg, e.toString()); }
}


class ChunkStreamSftp : public ChunkStream
{
public:
    ChunkStreamSftp(const std::shared_ptr<SshSession>& session, const std::string& displayPath, const std::string& filePath, size_t chunkSize) : //throw NotFoundError, ConnectionError, TimeoutError
        displayPath_(displayPath),
        blockSize_(chunkSize),
        session_(session)
    {
        runSftpOperation("Cannot open file " + fmtPath(displayPath_) + '.', [&]
        {
            fileHandle_ = ::libssh2_sftp_open(session_->getSftpChannel(), filePath, LIBSSH2_FXF_READ, 0);
            if (!fileHandle_)
                session_->throwLastSshError("libssh2_sftp_open", session_->getSftpChannel()); //throw SysError, SysErrorSftpProtocol, SysErrorTimeOut
        });
    }

    ~ChunkStreamSftp()
    {
        if (::libssh2_sftp_close(fileHandle_) != LIBSSH2_ERROR_NONE)
            logExtraError("Cannot close file " + fmtPath(displayPath_) + ".\n\nlibssh2_sftp_close failed.");
    }

    size_t getBlockSize() const override { return blockSize_; }

    size_t tryRead(void* buffer, size_t bytesToRead) override //throw ConnectionError, TimeoutError, NotFoundError
    {
        //libssh2_sftp_read has same semantics as Posix read:
        if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");

        return runSftpOperation("Cannot read file " + fmtPath(displayPath_) + '.', [&]
        {
            const ssize_t bytesRead = ::libssh2_sftp_read(fileHandle_, static_cast<char*>(buffer), bytesToRead);
            if (bytesRead < 0)
                session_->throwLastSshError("libssh2_sftp_read", session_->getSftpChannel()); //throw SysError, SysErrorSftpProtocol, SysErrorTimeOut

            ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead); //better safe than sorry
            return static_cast<size_t>(bytesRead); //"zero indicates end of file"
        });
    }

private:
    const std::string displayPath_;
    const size_t blockSize_;
    const std::shared_ptr<SshSession> session_;
    LIBSSH2_SFTP_HANDLE* fileHandle_ = nullptr;
};


class SftpRemoteSession : public RemoteSession
{
public:
    SftpRemoteSession(std::shared_ptr<SshSession>&& session, const RemoteLogin& login) : session_(std::move(session)), login_(login) {}

    ~SftpRemoteSession() { close(); }

    RemoteProtocol getProtocol() const override { return RemoteProtocol::sftp; }

    FileMetadata getFileMetadata(const std::string& remotePath) override //throw NotFoundError, ConnectionError, TimeoutError
    {
        const std::string displayPath = getDisplayPath(RemoteProtocol::sftp, login_, remotePath);

        return runSftpOperation("Cannot read file attributes of " + fmtPath(displayPath) + '.', [&]
        {
            SshSession& session = getSession(); //throw SysError

            LIBSSH2_SFTP_ATTRIBUTES attr = {};
            if (::libssh2_sftp_stat(session.getSftpChannel(), remotePath, &attr) != 0) //follows symlinks
                session.throwLastSshError("libssh2_sftp_stat", session.getSftpChannel()); //throw SysError, SysErrorSftpProtocol, SysErrorTimeOut

            if ((attr.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) && !LIBSSH2_SFTP_S_ISREG(attr.permissions))
                throw SysErrorNotFound("Item is not a regular file.");

            FileMetadata metadata;
            metadata.fileName = afterLast(remotePath, "/", IfNotFoundReturn::all);
            metadata.protocol = RemoteProtocol::sftp;
            if (attr.flags & LIBSSH2_SFTP_ATTR_SIZE)
                metadata.fileSize = attr.filesize;
            if (attr.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
                metadata.modTime = static_cast<time_t>(attr.mtime);
            return metadata;
        });
    }

    std::unique_ptr<ChunkStream> openReadStream(const std::string& remotePath, size_t chunkSize) override //throw NotFoundError, ConnectionError, TimeoutError
    {
        const std::string displayPath = getDisplayPath(RemoteProtocol::sftp, login_, remotePath);

        if (!session_)
            throw ConnectionError("Cannot open file " + fmtPath(displayPath) + '.', "Session already closed.");

        return std::make_unique<ChunkStreamSftp>(session_, displayPath, remotePath, chunkSize); //throw NotFoundError, ConnectionError, TimeoutError
    }

    void close() override
    {
        if (!session_)
            return;

        std::vector<std::string> errors;
        session_->disconnect(errors); //noexcept
        session_.reset();

        for (const std::string& errorMsg : errors)
            logExtraError("Cannot close session " + fmtPath(getDisplayPath(RemoteProtocol::sftp, login_, "/")) + ".\n\n" + errorMsg);
    }

private:
    SshSession& getSession() //throw SysError
    {
        if (!session_)
            throw SysError("Session already closed.");
        return *session_;
    }

    std::shared_ptr<SshSession> session_;
    const RemoteLogin login_;
};


class SftpBackend : public ProtocolBackend
{
public:
    explicit SftpBackend(const std::string& knownHostsPath) : knownHostsPath_(knownHostsPath) {}

    RemoteProtocol getProtocol() const override { return RemoteProtocol::sftp; }

    std::unique_ptr<RemoteSession> connect(const RemoteLogin& login) const override //throw AuthError, ConnectionError, TimeoutError, HostKeyError
    {
        const std::string displayPath = getDisplayPath(RemoteProtocol::sftp, login, "/");

        std::shared_ptr<SshSession> session = runSftpOperation("Unable to connect to " + fmtPath(displayPath) + '.', [&]
        {
            return std::make_shared<SshSession>(login, knownHostsPath_); //throw SysError, SysErrorPassword, SysErrorHostKey, SysErrorTimeOut
        });
        return std::make_unique<SftpRemoteSession>(std::move(session), login);
    }

private:
    const std::string knownHostsPath_;
};
}


std::unique_ptr<ProtocolBackend> fbr::createSftpBackend(const std::string& knownHostsPath)
{
    return std::make_unique<SftpBackend>(knownHostsPath);
}


size_t fbr::getKnownHostsEntryCount(const std::string& knownHostsPath) //throw SysError
{
    const std::shared_ptr<UniCounterCookie> initCookie = getLibsshCurlUnifiedInitCookie(globalSftpSessionCount); //throw SysError

    //libssh2_knownhost_init() needs a session, even if it never connects
    LIBSSH2_SESSION* sshSession = ::libssh2_session_init();
    if (!sshSession)
        throw SysError(formatSystemError("libssh2_session_init", formatSshStatusCode(LIBSSH2_ERROR_ALLOC), ""));
    ZEN_ON_SCOPE_EXIT(::libssh2_session_free(sshSession));

    LIBSSH2_KNOWNHOSTS* knownHosts = ::libssh2_knownhost_init(sshSession);
    if (!knownHosts)
        throw SysError(formatSystemError("libssh2_knownhost_init", formatSshStatusCode(LIBSSH2_ERROR_ALLOC), ""));
    ZEN_ON_SCOPE_EXIT(::libssh2_knownhost_free(knownHosts));

    const int rc = ::libssh2_knownhost_readfile(knownHosts, knownHostsPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH);
    if (rc < 0)
        throw SysError(formatSystemError("libssh2_knownhost_readfile", formatSshStatusCode(rc),
                                         "Cannot read known_hosts file " + fmtPath(knownHostsPath) + '.'));
    return static_cast<size_t>(rc); //number of entries read
}


bool fbr::sftpBackendAvailable()
{
    return !getLibssh2Version().empty();
}


std::string fbr::getLibssh2Version()
{
    if (const char* version = ::libssh2_version(0 /*required_version*/))
        return version;
    return std::string();
}


int fbr::getSftpSessionCount()
{
    return getLiveSessionCount(globalSftpSessionCount);
}
