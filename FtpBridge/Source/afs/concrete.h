// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FS_CONCRETE_348787329573243
#define FS_CONCRETE_348787329573243

#include <map>
#include <vector>
#include "abstract.h"


namespace fbr
{
//"auto" => configured default: no probing of the remote server
RemoteProtocol resolveProtocol(RequestedProtocol requested, RemoteProtocol configuredDefault);


//THREAD-SAFETY: immutable after construction => shared by all request threads
class BackendFactory
{
public:
    //a protocol without backend counts as "not available"
    explicit BackendFactory(std::map<RemoteProtocol, std::shared_ptr<const ProtocolBackend>> backends) : backends_(std::move(backends)) {}

    std::shared_ptr<const ProtocolBackend> select(RequestedProtocol requested, RemoteProtocol configuredDefault) const; //throw UnsupportedProtocolError

    bool isAvailable(RemoteProtocol protocol) const { return backends_.contains(protocol); }

    std::vector<RemoteProtocol> getAvailableProtocols() const; //ordered: ftp, ftps, sftp

private:
    const std::map<RemoteProtocol, std::shared_ptr<const ProtocolBackend>> backends_;
};


struct BackendSetup
{
    std::string knownHostsPath; //SFTP: empty => no host key verification
    std::string caBundlePath;   //FTPS: empty => no certificate verification
};

//checks libcurl/libssh2 capabilities: unavailable protocols are left out
std::shared_ptr<const BackendFactory> createDefaultBackendFactory(const BackendSetup& setup);
}

#endif //FS_CONCRETE_348787329573243
