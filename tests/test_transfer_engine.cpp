// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "../FtpBridge/Source/base/transfer_engine.h"
#include "fake_backend.h"

using namespace fbr;


namespace
{
const char testToken[] = "0123456789abcdef0123456789abcdef";
}


class TransferEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        cfg_.accessTokens.push_back({"powerbi", testToken});
        recreateFactory({RemoteProtocol::ftp, RemoteProtocol::ftps, RemoteProtocol::sftp});
    }

    void recreateFactory(const std::vector<RemoteProtocol>& protocols)
    {
        std::map<RemoteProtocol, std::shared_ptr<const ProtocolBackend>> backends;
        for (const RemoteProtocol protocol : protocols)
            backends.emplace(protocol, std::make_shared<FakeBackend>(remote_, protocol));
        factory_ = std::make_shared<BackendFactory>(std::move(backends));

        degradedMode_ = std::make_unique<DegradedModeController>(cfg_, factory_, [](const std::string&) {});
        degradedMode_->initialize();
    }

    static DownloadRequest makeRequest(const std::string& path, RequestedProtocol protocol = RequestedProtocol::ftps)
    {
        DownloadRequest request;
        request.host = "ftp.example.com";
        request.username = "user";
        request.password = "secret";
        request.remotePath = path;
        request.protocol = protocol;
        return request;
    }

    //drain until EOF; returns total bytes
    static uint64_t readAll(TransferEngine& engine, size_t chunkSize)
    {
        std::vector<std::byte> buffer(chunkSize);
        uint64_t total = 0;
        while (const size_t bytesRead = engine.readChunk(buffer.data(), buffer.size()))
            total += bytesRead;
        return total;
    }

    BridgeConfig cfg_;
    FakeRemote remote_;
    std::shared_ptr<const BackendFactory> factory_;
    std::unique_ptr<DegradedModeController> degradedMode_;
};


TEST_F(TransferEngineTest, PathTraversalRejectedBeforeConnect)
{
    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    try
    {
        engine.startDownload(makeRequest("/reports/../../etc/passwd"));
        FAIL() << "ValidationError expected";
    }
    catch (const ValidationError& e)
    {
        EXPECT_EQ(e.getIssue(), ValidationIssue::pathTraversal);
    }
    EXPECT_EQ(remote_.connectCount, 0);
    EXPECT_EQ(remote_.closeCount, 0);
    EXPECT_TRUE(remote_.lastLogin.server.empty());
    EXPECT_EQ(engine.getState(), TransferState::failed);
}


TEST_F(TransferEngineTest, HeadReturnsMetadataWithoutStream)
{
    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    const FileMetadata metadata = engine.queryMetadata(makeRequest("/reports/report.xlsx"));

    ASSERT_TRUE(metadata.fileSize.has_value());
    EXPECT_EQ(*metadata.fileSize, 2048000u);
    EXPECT_EQ(metadata.fileName, "report.xlsx");
    EXPECT_EQ(metadata.protocol, RemoteProtocol::ftps);

    EXPECT_EQ(remote_.openCount, 0);
    EXPECT_EQ(remote_.connectCount, 1);
    EXPECT_EQ(remote_.closeCount, 1);
    EXPECT_EQ(engine.getState(), TransferState::closed);
}


TEST_F(TransferEngineTest, GetStreamsExactFileSize)
{
    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    const DownloadInfo info = engine.startDownload(makeRequest("/reports/report.xlsx"));
    EXPECT_EQ(engine.getState(), TransferState::streaming);
    EXPECT_EQ(remote_.closeCount, 0); //session stays open while streaming

    EXPECT_EQ(readAll(engine, info.chunkSize), 2048000u);
    EXPECT_EQ(engine.getBytesDelivered(), 2048000u);

    EXPECT_EQ(engine.getState(), TransferState::closed);
    EXPECT_EQ(remote_.closeCount, 1);
    EXPECT_EQ(remote_.streamsAlive, 0);
    EXPECT_EQ(remote_.leakCount, 0);
}


TEST_F(TransferEngineTest, CancelMidStreamClosesSession)
{
    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    const DownloadInfo info = engine.startDownload(makeRequest("/reports/report.xlsx"));

    std::vector<std::byte> buffer(info.chunkSize);
    while (engine.getBytesDelivered() < 1000000)
        ASSERT_GT(engine.readChunk(buffer.data(), buffer.size()), 0u);

    engine.cancel(); //downstream client is gone

    EXPECT_EQ(engine.getState(), TransferState::failed);
    EXPECT_TRUE(engine.wasCancelled());
    EXPECT_EQ(remote_.closeCount, 1);
    EXPECT_EQ(remote_.streamsAlive, 0);
    EXPECT_FALSE(remote_.sessionOpen());

    EXPECT_THROW(engine.readChunk(buffer.data(), buffer.size()), TransferCancelled);

    engine.cancel(); //no second close
    EXPECT_EQ(remote_.closeCount, 1);
}


TEST_F(TransferEngineTest, HostKeyErrorBeforeStat)
{
    remote_.connectError = std::make_exception_ptr(HostKeyError("Host key verification failed."));

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    EXPECT_THROW(engine.startDownload(makeRequest("/data/export.csv", RequestedProtocol::sftp)), HostKeyError);

    EXPECT_EQ(remote_.statCount, 0);
    EXPECT_EQ(remote_.openCount, 0);
    EXPECT_EQ(remote_.closeCount, 0); //connect() failed: no session to close
    EXPECT_EQ(remote_.leakCount, 0);
    EXPECT_EQ(engine.getState(), TransferState::failed);
}


TEST_F(TransferEngineTest, DegradedModeRefusesImmediately)
{
    cfg_.accessTokens.clear();
    recreateFactory({RemoteProtocol::ftp, RemoteProtocol::ftps, RemoteProtocol::sftp});
    ASSERT_TRUE(degradedMode_->isDegraded());

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    try
    {
        engine.startDownload(makeRequest("/reports/report.xlsx"));
        FAIL() << "DegradedModeError expected";
    }
    catch (const DegradedModeError& e)
    {
        EXPECT_NE(e.getMessage().find("No access tokens configured."), std::string::npos);
    }
    EXPECT_TRUE(remote_.lastLogin.server.empty());
    EXPECT_EQ(remote_.connectCount, 0);
}


TEST_F(TransferEngineTest, UnavailableProtocolRejected)
{
    recreateFactory({RemoteProtocol::ftp, RemoteProtocol::ftps});

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    EXPECT_THROW(engine.queryMetadata(makeRequest("/data/export.csv", RequestedProtocol::sftp)), UnsupportedProtocolError);
    EXPECT_EQ(remote_.connectCount, 0);
}


TEST_F(TransferEngineTest, StatFailureClosesSessionOnce)
{
    remote_.statError = std::make_exception_ptr(NotFoundError("File not found."));

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    EXPECT_THROW(engine.queryMetadata(makeRequest("/reports/missing.xlsx")), NotFoundError);

    EXPECT_EQ(remote_.connectCount, 1);
    EXPECT_EQ(remote_.closeCount, 1);
    EXPECT_EQ(remote_.leakCount, 0);
    EXPECT_EQ(engine.getState(), TransferState::failed);

    engine.cancel(); //terminal already: no second close
    EXPECT_EQ(remote_.closeCount, 1);
}


TEST_F(TransferEngineTest, OpenFailureClosesSessionOnce)
{
    remote_.openError = std::make_exception_ptr(ConnectionError("Data connection refused."));

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    EXPECT_THROW(engine.startDownload(makeRequest("/reports/report.xlsx")), ConnectionError);

    EXPECT_EQ(remote_.closeCount, 1);
    EXPECT_EQ(remote_.leakCount, 0);
    EXPECT_EQ(engine.getState(), TransferState::failed);
}


TEST_F(TransferEngineTest, FirstReadFailureReportedByStartDownload)
{
    //e.g. FTP: SIZE works, but RETR is answered with "550 Permission denied"
    remote_.readError = std::make_exception_ptr(NotFoundError("Cannot read file."));
    remote_.readErrorAfterBytes = 0;

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    EXPECT_THROW(engine.startDownload(makeRequest("/reports/report.xlsx")), NotFoundError);

    EXPECT_EQ(engine.getState(), TransferState::failed);
    EXPECT_EQ(engine.getBytesDelivered(), 0u);
    EXPECT_EQ(remote_.openCount, 1);
    EXPECT_EQ(remote_.closeCount, 1);
    EXPECT_EQ(remote_.leakCount, 0);
    EXPECT_EQ(remote_.streamsAlive, 0);
}


TEST_F(TransferEngineTest, FirstChunkHandedOutInPieces)
{
    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    engine.startDownload(makeRequest("/reports/report.xlsx"));

    std::vector<std::byte> buffer(100);
    EXPECT_EQ(engine.readChunk(buffer.data(), buffer.size()), 100u);
    EXPECT_EQ(buffer[0], std::byte{'x'});
    EXPECT_EQ(engine.getBytesDelivered(), 100u);

    EXPECT_EQ(readAll(engine, 3000), 2048000u - 100);
    EXPECT_EQ(engine.getState(), TransferState::closed);
    EXPECT_EQ(remote_.closeCount, 1);
}


TEST_F(TransferEngineTest, EmptyFile)
{
    remote_.fileSize = remote_.bytesAvailable = 0;

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    const DownloadInfo info = engine.startDownload(makeRequest("/reports/report.xlsx"));
    EXPECT_EQ(engine.getState(), TransferState::streaming);
    EXPECT_EQ(remote_.closeCount, 0);

    EXPECT_EQ(readAll(engine, info.chunkSize), 0u);
    EXPECT_EQ(engine.getState(), TransferState::closed);
    EXPECT_EQ(remote_.closeCount, 1);
}


TEST_F(TransferEngineTest, NothingReceivedForNonEmptyFile)
{
    remote_.bytesAvailable = 0; //server announced 2048000

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    EXPECT_THROW(engine.startDownload(makeRequest("/reports/report.xlsx")), ConnectionError);
    EXPECT_EQ(engine.getState(), TransferState::failed);
    EXPECT_EQ(remote_.closeCount, 1);
}


TEST_F(TransferEngineTest, ReadFailureMidStream)
{
    remote_.readError = std::make_exception_ptr(ConnectionError("Connection reset by peer."));
    remote_.readErrorAfterBytes = 500000;

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    const DownloadInfo info = engine.startDownload(makeRequest("/reports/report.xlsx"));

    EXPECT_THROW(readAll(engine, info.chunkSize), ConnectionError);

    EXPECT_EQ(engine.getBytesDelivered(), 500000u);
    EXPECT_EQ(engine.getState(), TransferState::failed);
    EXPECT_FALSE(engine.wasCancelled());
    EXPECT_EQ(remote_.closeCount, 1);
    EXPECT_EQ(remote_.streamsAlive, 0);
}


TEST_F(TransferEngineTest, TruncatedStreamIsAnError)
{
    remote_.bytesAvailable = 1000000; //server announced 2048000

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    const DownloadInfo info = engine.startDownload(makeRequest("/reports/report.xlsx"));

    EXPECT_THROW(readAll(engine, info.chunkSize), ConnectionError);
    EXPECT_EQ(engine.getState(), TransferState::failed);
    EXPECT_EQ(remote_.closeCount, 1);
    EXPECT_EQ(remote_.leakCount, 0);
}


TEST_F(TransferEngineTest, FileTooLargeAtStat)
{
    cfg_.maxFileSize = 1000000;
    recreateFactory({RemoteProtocol::ftps});

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    EXPECT_THROW(engine.startDownload(makeRequest("/reports/report.xlsx")), SizeLimitExceeded);

    EXPECT_EQ(remote_.openCount, 0);
    EXPECT_EQ(remote_.closeCount, 1);
    EXPECT_EQ(remote_.leakCount, 0);
}


TEST_F(TransferEngineTest, UnknownSizeStillLimited)
{
    cfg_.maxFileSize = 100000;
    recreateFactory({RemoteProtocol::ftps});
    remote_.fileSize = std::nullopt;
    remote_.bytesAvailable = 150000;

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    const DownloadInfo info = engine.startDownload(makeRequest("/reports/report.xlsx"));
    EXPECT_FALSE(info.chunkSizeTuned);

    EXPECT_THROW(readAll(engine, info.chunkSize), SizeLimitExceeded);
    EXPECT_LE(engine.getBytesDelivered(), 100000u);
    EXPECT_EQ(remote_.closeCount, 1);
    EXPECT_EQ(remote_.streamsAlive, 0);
}


TEST_F(TransferEngineTest, UnknownSizeStreamsUntilEof)
{
    remote_.fileSize = std::nullopt;
    remote_.bytesAvailable = 12345;

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    const DownloadInfo info = engine.startDownload(makeRequest("/reports/report.xlsx"));

    EXPECT_EQ(readAll(engine, info.chunkSize), 12345u);
    EXPECT_EQ(engine.getState(), TransferState::closed);
    EXPECT_EQ(remote_.closeCount, 1);
}


TEST_F(TransferEngineTest, LargeFileGetsTunedChunkSize)
{
    remote_.fileSize = remote_.bytesAvailable = 100 * 1024 * 1024;

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    const DownloadInfo info = engine.startDownload(makeRequest("/reports/report.xlsx"));

    EXPECT_TRUE(info.chunkSizeTuned);
    EXPECT_GT(info.chunkSize, cfg_.chunkSize);
    EXPECT_LE(info.chunkSize, cfg_.chunkSizeMax);
    EXPECT_EQ(remote_.lastChunkSize, info.chunkSize);
    engine.cancel();
    EXPECT_EQ(remote_.closeCount, 1);
}


TEST_F(TransferEngineTest, PortDefaultsPerProtocol)
{
    {
        TransferEngine engine(cfg_, *factory_, *degradedMode_);
        engine.queryMetadata(makeRequest("/data/export.csv", RequestedProtocol::sftp));
        EXPECT_EQ(remote_.lastLogin.port, 22);
        EXPECT_EQ(remote_.lastLogin.timeoutSec, cfg_.ftpTimeoutSec);
    }
    {
        TransferEngine engine(cfg_, *factory_, *degradedMode_);
        engine.queryMetadata(makeRequest("/data/export.csv", RequestedProtocol::autoSelect));
        EXPECT_EQ(remote_.lastLogin.port, cfg_.ftpsPort);
    }
    {
        DownloadRequest request = makeRequest("/data/export.csv", RequestedProtocol::ftp);
        request.port = 2121;
        TransferEngine engine(cfg_, *factory_, *degradedMode_);
        engine.queryMetadata(request);
        EXPECT_EQ(remote_.lastLogin.port, 2121);
    }
    EXPECT_EQ(remote_.closeCount, 3);
}


TEST_F(TransferEngineTest, EmptyHostRejected)
{
    DownloadRequest request = makeRequest("/data/export.csv");
    request.host = "  ";

    TransferEngine engine(cfg_, *factory_, *degradedMode_);
    EXPECT_THROW(engine.queryMetadata(request), ValidationError);
    EXPECT_EQ(remote_.connectCount, 0);
    EXPECT_EQ(remote_.closeCount, 0);
}


TEST_F(TransferEngineTest, DestructorCancelsOpenTransfer)
{
    {
        TransferEngine engine(cfg_, *factory_, *degradedMode_);
        engine.startDownload(makeRequest("/reports/report.xlsx"));
        EXPECT_TRUE(remote_.sessionOpen());
    }
    EXPECT_EQ(remote_.closeCount, 1);
    EXPECT_EQ(remote_.leakCount, 0);
    EXPECT_EQ(remote_.streamsAlive, 0);
}
