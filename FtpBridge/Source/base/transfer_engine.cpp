// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "transfer_engine.h"
#include <cstring>
#include <zen/thread.h>

using namespace zen;
using namespace fbr;


std::string fbr::getStateName(TransferState state)
{
    switch (state)
    {
        case TransferState::init:
            return "Init";
        case TransferState::sanitized:
            return "Sanitized";
        case TransferState::degradedCheck:
            return "DegradedCheck";
        case TransferState::backendSelected:
            return "BackendSelected";
        case TransferState::connected:
            return "Connected";
        case TransferState::statted:
            return "Stat'd";
        case TransferState::metadataOnly:
            return "MetadataOnly";
        case TransferState::streaming:
            return "Streaming";
        case TransferState::closed:
            return "Closed";
        case TransferState::failed:
            return "Failed";
    }
    assert(false);
    return std::string();
}


TransferEngine::~TransferEngine()
{
    if (session_) //e.g. ThreadStopRequest during shutdown
        cancel();
}


void TransferEngine::connectAndStat(const DownloadRequest& request) //throw BridgeError
{
    if (state_ != TransferState::init) //one request per engine
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");

    path_ = sanitizePath(request.remotePath, cfg_.allowedExtensions); //throw ValidationError
    state_ = TransferState::sanitized;

    state_ = TransferState::degradedCheck;
    if (degradedMode_.isDegraded())
        throw DegradedModeError("Service is running in degraded mode: " + degradedMode_.getReason());

    const std::shared_ptr<const ProtocolBackend> backend = factory_.select(request.protocol, cfg_.defaultProtocol); //throw UnsupportedProtocolError
    state_ = TransferState::backendSelected;

    const std::string host = trimCpy(request.host);
    if (host.empty())
        throw ValidationError(ValidationIssue::invalidParameter, "Host must not be empty.");

    if (request.port && (*request.port < 1 || *request.port > 65535))
        throw ValidationError(ValidationIssue::invalidParameter, "Invalid port number " + numberTo(*request.port) + '.');

    RemoteLogin login;
    login.server     = host;
    login.port       = request.port ? *request.port : getDefaultPort(cfg_, backend->getProtocol());
    login.username   = request.username;
    login.password   = request.password;
    login.timeoutSec = cfg_.ftpTimeoutSec;

    session_ = backend->connect(login); //throw AuthError, ConnectionError, TimeoutError, HostKeyError
    state_ = TransferState::connected;

    metadata_ = session_->getFileMetadata(path_.remotePath); //throw NotFoundError, ConnectionError, TimeoutError
    if (metadata_.fileName.empty())
        metadata_.fileName = path_.fileName;
    state_ = TransferState::statted;

    if (metadata_.fileSize && *metadata_.fileSize > cfg_.maxFileSize)
        throw SizeLimitExceeded("File " + fmtPath(path_.fileName) + " exceeds the maximum file size.",
                                "File size: " + numberTo(*metadata_.fileSize) + " bytes; limit: " + numberTo(cfg_.maxFileSize) + " bytes");
}


FileMetadata TransferEngine::queryMetadata(const DownloadRequest& request) //throw BridgeError
{
    ZEN_ON_SCOPE_FAIL(fail());

    connectAndStat(request); //throw BridgeError

    state_ = TransferState::metadataOnly;
    closeSession();
    state_ = TransferState::closed;
    return metadata_;
}


DownloadInfo TransferEngine::startDownload(const DownloadRequest& request) //throw BridgeError
{
    ZEN_ON_SCOPE_FAIL(fail());

    connectAndStat(request); //throw BridgeError

    DownloadInfo info;
    info.metadata = metadata_;
    info.chunkSize = tuneChunkSize(metadata_.fileSize, cfg_.chunkSize, cfg_.chunkSizeMin, cfg_.chunkSizeMax, cfg_.chunkTuneThreshold);
    info.chunkSizeTuned = info.chunkSize != cfg_.chunkSize;

    stream_ = session_->openReadStream(path_.remotePath, info.chunkSize); //throw NotFoundError, ConnectionError, TimeoutError

    //FTP: RETR runs asynchronously => "550 Permission denied" only shows up with the first read
    firstChunk_.resize(info.chunkSize);
    const size_t bytesRead = stream_->tryRead(firstChunk_.data(), firstChunk_.size()); //throw ConnectionError, TimeoutError, NotFoundError
    firstChunk_.resize(bytesRead);
    firstChunkPos_ = 0;
    firstChunkEof_ = bytesRead == 0;

    if (firstChunkEof_)
        checkStreamComplete(); //throw ConnectionError
    else
        checkChunkSize(bytesRead); //throw SizeLimitExceeded, ConnectionError

    state_ = TransferState::streaming;
    return info;
}


size_t TransferEngine::readChunk(void* buffer, size_t bytesToRead) //throw BridgeError, TransferCancelled
{
    if (state_ != TransferState::streaming)
    {
        if (cancelled_)
            throw TransferCancelled("Transfer of " + fmtPath(path_.fileName) + " was cancelled.");
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");
    }

    if (bytesToRead == 0) //indistinguishable from end of file!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");

    ZEN_ON_SCOPE_FAIL(fail());

    if (firstChunkPos_ < firstChunk_.size()) //already checked by startDownload()
    {
        const size_t bytesRead = std::min(bytesToRead, firstChunk_.size() - firstChunkPos_);
        std::memcpy(buffer, firstChunk_.data() + firstChunkPos_, bytesRead);
        firstChunkPos_ += bytesRead;
        if (firstChunkPos_ == firstChunk_.size())
            std::vector<std::byte>().swap(firstChunk_);

        bytesDelivered_ += bytesRead;
        return bytesRead;
    }

    const size_t bytesRead = firstChunkEof_ ? 0 : stream_->tryRead(buffer, bytesToRead); //throw ConnectionError, TimeoutError, NotFoundError
    if (bytesRead == 0) //end of stream
    {
        checkStreamComplete(); //throw ConnectionError
        closeSession();
        state_ = TransferState::closed;
        return 0;
    }

    checkChunkSize(bytesRead); //throw SizeLimitExceeded, ConnectionError

    bytesDelivered_ += bytesRead;
    return bytesRead;
}


//checked *before* handing out the bytes: the caller never sees more than the limit
void TransferEngine::checkChunkSize(size_t bytesRead) const //throw SizeLimitExceeded, ConnectionError
{
    if (bytesDelivered_ + bytesRead > cfg_.maxFileSize)
        throw SizeLimitExceeded("File " + fmtPath(path_.fileName) + " exceeds the maximum file size.",
                                "Limit: " + numberTo(cfg_.maxFileSize) + " bytes");

    if (metadata_.fileSize && bytesDelivered_ + bytesRead > *metadata_.fileSize)
        throw ConnectionError("File " + fmtPath(path_.fileName) + " was modified during transfer.",
                              "Expected " + numberTo(*metadata_.fileSize) + " bytes");
}


void TransferEngine::checkStreamComplete() const //throw ConnectionError
{
    if (metadata_.fileSize && bytesDelivered_ != *metadata_.fileSize)
        throw ConnectionError("Transfer of " + fmtPath(path_.fileName) + " is incomplete.",
                              "Received " + numberTo(bytesDelivered_) + " of " + numberTo(*metadata_.fileSize) + " bytes");
}


void TransferEngine::cancel() //noexcept
{
    if (state_ == TransferState::closed || state_ == TransferState::failed)
        return;

    cancelled_ = true;
    fail();
}


void TransferEngine::closeSession() //noexcept
{
    stream_.reset(); //stop reading first: e.g. FTP worker thread still writing into the buffer

    if (session_)
    {
        session_->close(); //noexcept: errors end up in the extra log
        session_.reset();
    }
}


void TransferEngine::fail() //noexcept
{
    closeSession();
    state_ = TransferState::failed;
}
