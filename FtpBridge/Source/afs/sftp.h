// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SFTP_H_5392187498172458
#define SFTP_H_5392187498172458

#include "abstract.h"


namespace fbr
{
const int DEFAULT_PORT_SFTP = 22;

//knownHostsPath empty => host key is not verified (reduced security: reported by /health)
std::unique_ptr<ProtocolBackend> createSftpBackend(const std::string& knownHostsPath);

//OpenSSH format; throws if the file is missing or libssh2 can't parse it
size_t getKnownHostsEntryCount(const std::string& knownHostsPath); //throw SysError

//false if the libssh2 found at runtime does not report a version: broken installation
bool sftpBackendAvailable();
std::string getLibssh2Version(); //"1.11.0"

int getSftpSessionCount();
}

#endif //SFTP_H_5392187498172458
