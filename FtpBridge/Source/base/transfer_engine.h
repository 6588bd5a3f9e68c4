// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TRANSFER_ENGINE_H_5609238475610293
#define TRANSFER_ENGINE_H_5609238475610293

#include "config.h"
#include "degraded_mode.h"
#include "path_sanitizer.h"


namespace fbr
{
struct DownloadRequest
{
    std::string host;
    std::optional<int> port; //none: protocol default from config
    std::string username;
    std::string password;
    std::string remotePath; //unsanitized
    RequestedProtocol protocol = RequestedProtocol::autoSelect;
};


enum class TransferState
{
    init,
    sanitized,
    degradedCheck,
    backendSelected,
    connected,
    statted,
    metadataOnly,
    streaming,
    closed, //terminal: success
    failed, //terminal: error or cancellation
};
std::string getStateName(TransferState state);


struct DownloadInfo
{
    FileMetadata metadata;
    size_t chunkSize = 0;
    bool chunkSizeTuned = false; //differs from configured default
};


/*  one request, one engine, one session at most:

    Init -> Sanitized -> DegradedCheck -> BackendSelected -> Connected -> Stat'd -> MetadataOnly -> Closed
                                                                                 -> Streaming    -> Closed
    any error: -> Failed; an open session is closed exactly once on every path

    THREAD-SAFETY: single request thread; cancel() from the same thread only   */
class TransferEngine
{
public:
    TransferEngine(const BridgeConfig& cfg, const BackendFactory& factory, DegradedModeController& degradedMode) :
        cfg_(cfg), factory_(factory), degradedMode_(degradedMode) {}

    ~TransferEngine(); //still streaming => cancel

    //HEAD: never opens a data stream
    FileMetadata queryMetadata(const DownloadRequest& request); //throw BridgeError

    //GET: session stays open until readChunk() returns 0, an error occurs, or cancel()
    //the first chunk is read before returning: failures to open the remote file are reported *before* any response is sent
    DownloadInfo startDownload(const DownloadRequest& request); //throw BridgeError

    //may return short, only 0 means EOF: session is closed by then
    size_t readChunk(void* buffer, size_t bytesToRead); //throw BridgeError, TransferCancelled

    //downstream client is gone: close immediately
    void cancel(); //noexcept

    TransferState getState() const { return state_; }
    uint64_t getBytesDelivered() const { return bytesDelivered_; }
    bool wasCancelled() const { return cancelled_; }

private:
    TransferEngine           (const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    void connectAndStat(const DownloadRequest& request); //throw BridgeError
    void checkChunkSize(size_t bytesRead) const;          //throw SizeLimitExceeded, ConnectionError
    void checkStreamComplete() const;                     //throw ConnectionError
    void closeSession(); //noexcept
    void fail();         //

    const BridgeConfig& cfg_;
    const BackendFactory& factory_;
    DegradedModeController& degradedMode_;

    TransferState state_ = TransferState::init;
    SanitizedPath path_;
    std::unique_ptr<RemoteSession> session_;
    std::unique_ptr<ChunkStream> stream_; //must not outlive session_
    std::vector<std::byte> firstChunk_;   //read by startDownload(), handed out first
    size_t firstChunkPos_ = 0;
    bool firstChunkEof_ = false;
    FileMetadata metadata_;
    uint64_t bytesDelivered_ = 0;
    bool cancelled_ = false;
};
}

#endif //TRANSFER_ENGINE_H_5609238475610293
