// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "abstract.h"

using namespace zen;
using namespace fbr;


std::string fbr::getProtocolName(RemoteProtocol protocol)
{
    switch (protocol)
    {
        case RemoteProtocol::ftp:
            return "ftp";
        case RemoteProtocol::ftps:
            return "ftps";
        case RemoteProtocol::sftp:
            return "sftp";
    }
    assert(false);
    return std::string();
}


std::optional<RemoteProtocol> fbr::parseRemoteProtocol(std::string_view name)
{
    const std::string nameFmt = asciiToLowerCpy(trimCpy(name));

    for (const RemoteProtocol protocol : {RemoteProtocol::ftp, RemoteProtocol::ftps, RemoteProtocol::sftp})
        if (nameFmt == getProtocolName(protocol))
            return protocol;
    return {};
}


std::optional<RequestedProtocol> fbr::parseRequestedProtocol(std::string_view name)
{
    const std::string nameFmt = asciiToLowerCpy(trimCpy(name));
    if (nameFmt == "auto")
        return RequestedProtocol::autoSelect;

    if (const std::optional<RemoteProtocol> protocol = parseRemoteProtocol(nameFmt))
        switch (*protocol)
        {
            case RemoteProtocol::ftp:
                return RequestedProtocol::ftp;
            case RemoteProtocol::ftps:
                return RequestedProtocol::ftps;
            case RemoteProtocol::sftp:
                return RequestedProtocol::sftp;
        }
    return {};
}


std::string fbr::getDisplayPath(RemoteProtocol protocol, const RemoteLogin& login, const std::string& remotePath)
{
    std::string displayPath = getProtocolName(protocol) + "://";
    if (!login.username.empty())
        displayPath += login.username + '@';

    displayPath += contains(login.server, ':') ? '[' + login.server + ']' : login.server; //IPv6 literal
    displayPath += ':' + numberTo(login.port);

    if (!startsWith(remotePath, "/"))
        displayPath += '/';
    return displayPath + remotePath;
}
