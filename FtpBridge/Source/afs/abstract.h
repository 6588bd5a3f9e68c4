// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ABSTRACT_H_873450978453042524534234
#define ABSTRACT_H_873450978453042524534234

#include <memory>
#include <optional>
#include "../base/bridge_error.h"


namespace fbr
{
enum class RemoteProtocol
{
    ftp,
    ftps,
    sftp,
};
std::string getProtocolName(RemoteProtocol protocol); //"ftps"
std::optional<RemoteProtocol> parseRemoteProtocol(std::string_view name); //case-insensitive

enum class RequestedProtocol
{
    autoSelect,
    ftp,
    ftps,
    sftp,
};
std::optional<RequestedProtocol> parseRequestedProtocol(std::string_view name); //"auto", "ftp", ...


struct RemoteLogin
{
    std::string server;
    int port = 0; //always set: the caller applies the protocol default
    std::string username;
    std::string password;
    int timeoutSec = 30;
};
std::string getDisplayPath(RemoteProtocol protocol, const RemoteLogin& login, const std::string& remotePath); //no password!


struct FileMetadata
{
    std::optional<uint64_t> fileSize; //some FTP servers don't answer SIZE
    std::string fileName;
    RemoteProtocol protocol = RemoteProtocol::ftp;
    std::optional<time_t> modTime;
};


//lazy, finite, non-restartable: bytes are fetched from the server only on demand
struct ChunkStream
{
    virtual ~ChunkStream() {} //cancels a transfer still in progress

    virtual size_t getBlockSize() const = 0;

    //may return short; only 0 means EOF! CONTRACT: bytesToRead > 0!
    virtual size_t tryRead(void* buffer, size_t bytesToRead) = 0; //throw ConnectionError, TimeoutError, NotFoundError
};


//one authenticated connection, owned by exactly one request
//THREAD-SAFETY: none; a session is used by a single thread at a time
struct RemoteSession
{
    virtual ~RemoteSession() {}

    virtual RemoteProtocol getProtocol() const = 0;

    virtual FileMetadata getFileMetadata(const std::string& remotePath) = 0; //throw NotFoundError, ConnectionError, TimeoutError

    //the stream must not outlive the session
    virtual std::unique_ptr<ChunkStream> openReadStream(const std::string& remotePath, size_t chunkSize) = 0; //throw NotFoundError, ConnectionError, TimeoutError

    //idempotent, never throws: errors go to the extra log
    virtual void close() = 0;
};


//THREAD-SAFETY: "const" member functions must model thread-safe access!
struct ProtocolBackend
{
    virtual ~ProtocolBackend() {}

    virtual RemoteProtocol getProtocol() const = 0;

    virtual std::unique_ptr<RemoteSession> connect(const RemoteLogin& login) const = 0; //throw AuthError, ConnectionError, TimeoutError, HostKeyError
};
}

#endif //ABSTRACT_H_873450978453042524534234
