// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "concrete.h"
#include "ftp.h"
#include "sftp.h"

using namespace zen;
using namespace fbr;


RemoteProtocol fbr::resolveProtocol(RequestedProtocol requested, RemoteProtocol configuredDefault)
{
    switch (requested)
    {
        case RequestedProtocol::autoSelect:
            return configuredDefault;
        case RequestedProtocol::ftp:
            return RemoteProtocol::ftp;
        case RequestedProtocol::ftps:
            return RemoteProtocol::ftps;
        case RequestedProtocol::sftp:
            return RemoteProtocol::sftp;
    }
    assert(false);
    return configuredDefault;
}


std::shared_ptr<const ProtocolBackend> BackendFactory::select(RequestedProtocol requested, RemoteProtocol configuredDefault) const //throw UnsupportedProtocolError
{
    const RemoteProtocol protocol = resolveProtocol(requested, configuredDefault);

    auto it = backends_.find(protocol);
    if (it == backends_.end())
        throw UnsupportedProtocolError("Protocol " + fmtPath(getProtocolName(protocol)) + " is not available.",
                                       requested == RequestedProtocol::autoSelect ? "Resolved from \"auto\" via configured default protocol." : "");
    return it->second;
}


std::vector<RemoteProtocol> BackendFactory::getAvailableProtocols() const
{
    std::vector<RemoteProtocol> protocols;
    for (const auto& [protocol, backend] : backends_) //std::map: enum order
        protocols.push_back(protocol);
    return protocols;
}


std::shared_ptr<const BackendFactory> fbr::createDefaultBackendFactory(const BackendSetup& setup)
{
    std::map<RemoteProtocol, std::shared_ptr<const ProtocolBackend>> backends;

    if (ftpBackendAvailable(false /*useTls*/))
        backends.emplace(RemoteProtocol::ftp, createFtpBackend(false /*useTls*/, "" /*caBundlePath*/));

    if (ftpBackendAvailable(true /*useTls*/))
        backends.emplace(RemoteProtocol::ftps, createFtpBackend(true /*useTls*/, setup.caBundlePath));

    if (sftpBackendAvailable())
        backends.emplace(RemoteProtocol::sftp, createSftpBackend(setup.knownHostsPath));

    return std::make_shared<const BackendFactory>(std::move(backends));
}
