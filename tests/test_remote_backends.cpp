// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <thread>
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <zen/socket.h>
#include "../FtpBridge/Source/afs/ftp.h"
#include "../FtpBridge/Source/afs/sftp.h"

using namespace zen;
using namespace fbr;
using ::testing::HasSubstr;


//real libcurl/libssh2 backends against local sockets: no remote server needed
class RemoteBackendTest : public ::testing::Test
{
protected:
    static RemoteLogin makeLogin(int port)
    {
        RemoteLogin login;
        login.server = "127.0.0.1";
        login.port = port;
        login.username = "user";
        login.password = "secret";
        login.timeoutSec = 1;
        return login;
    }

    //bound once, then released: connecting is refused from now on
    static int getClosedPort()
    {
        const ServerSocket tmpSocket("127.0.0.1", 0 /*any free port*/, 1);
        return tmpSocket.getPort();
    }

    template <class ExpectedError>
    static std::string getConnectError(const ProtocolBackend& backend, const RemoteLogin& login)
    {
        try
        {
            backend.connect(login);
            ADD_FAILURE() << "connect() succeeded unexpectedly";
        }
        catch (const ExpectedError& e) { return e.getMessage(); }
        catch (const BridgeError& e) { ADD_FAILURE() << "Unexpected error: " << e.getMessage() << '\n' << e.getDetails(); }
        return "";
    }
};


TEST_F(RemoteBackendTest, FtpConnectionRefused)
{
    if (!ftpBackendAvailable(false /*useTls*/))
        GTEST_SKIP() << "libcurl without FTP support";

    const std::unique_ptr<ProtocolBackend> backend = createFtpBackend(false /*useTls*/, "");
    EXPECT_THAT(getConnectError<ConnectionError>(*backend, makeLogin(getClosedPort())), HasSubstr("Unable to connect"));
    EXPECT_EQ(getFtpSessionCount(), 0);
}


TEST_F(RemoteBackendTest, FtpSilentServerTimesOut)
{
    if (!ftpBackendAvailable(false /*useTls*/))
        GTEST_SKIP() << "libcurl without FTP support";

    //TCP handshake is completed by the kernel's listen backlog, but no greeting ever arrives
    ServerSocket silentServer("127.0.0.1", 0, 1);

    const std::unique_ptr<ProtocolBackend> backend = createFtpBackend(false /*useTls*/, "");
    getConnectError<TimeoutError>(*backend, makeLogin(silentServer.getPort()));
    EXPECT_EQ(getFtpSessionCount(), 0);
}


TEST_F(RemoteBackendTest, FtpsSilentServerTimesOut)
{
    if (!ftpBackendAvailable(true /*useTls*/))
        GTEST_SKIP() << "libcurl without TLS support";

    ServerSocket silentServer("127.0.0.1", 0, 1);

    const std::unique_ptr<ProtocolBackend> backend = createFtpBackend(true /*useTls*/, "/nonexistent/ca-bundle.crt");
    getConnectError<TimeoutError>(*backend, makeLogin(silentServer.getPort()));
}


TEST_F(RemoteBackendTest, SftpConnectionRefused)
{
    if (!sftpBackendAvailable())
        GTEST_SKIP() << "libssh2 not usable";

    const std::unique_ptr<ProtocolBackend> backend = createSftpBackend("" /*knownHostsPath*/);
    EXPECT_THAT(getConnectError<ConnectionError>(*backend, makeLogin(getClosedPort())), HasSubstr("Unable to connect"));
    EXPECT_EQ(getSftpSessionCount(), 0);
}


TEST_F(RemoteBackendTest, SftpSilentServerTimesOut)
{
    if (!sftpBackendAvailable())
        GTEST_SKIP() << "libssh2 not usable";

    ServerSocket silentServer("127.0.0.1", 0, 1);

    const std::unique_ptr<ProtocolBackend> backend = createSftpBackend("");
    getConnectError<TimeoutError>(*backend, makeLogin(silentServer.getPort()));
    EXPECT_EQ(getSftpSessionCount(), 0);
}


TEST_F(RemoteBackendTest, SftpBogusBannerIsConnectionError)
{
    if (!sftpBackendAvailable())
        GTEST_SKIP() << "libssh2 not usable";

    ServerSocket fakeServer("127.0.0.1", 0, 1);

    std::thread serverThread([&]
    {
        try
        {
            std::string peerName;
            const SocketType clientSocket = fakeServer.tryAccept(5000, peerName); //throw SysError
            if (clientSocket == invalidSocket)
                return;
            ZEN_ON_SCOPE_EXIT(closeSocket(clientSocket));

            const std::string banner = "220 Welcome to some FTP server\r\n";
            writeSocketAll(clientSocket, banner.c_str(), banner.size()); //throw SysError
        }
        catch (const SysError& e) { ADD_FAILURE() << e.toString(); }
    });
    ZEN_ON_SCOPE_EXIT(serverThread.join());

    const std::unique_ptr<ProtocolBackend> backend = createSftpBackend("");
    EXPECT_THAT(getConnectError<ConnectionError>(*backend, makeLogin(fakeServer.getPort())), HasSubstr("Unable to connect"));
}
