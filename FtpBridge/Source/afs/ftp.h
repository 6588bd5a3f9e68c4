// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTP_H_745895742383425326568678
#define FTP_H_745895742383425326568678

#include "abstract.h"


namespace fbr
{
const int DEFAULT_PORT_FTP = 21;
const int DEFAULT_PORT_FTPS_IMPLICIT = 990; //FTPS on this port => implicit TLS, explicit "AUTH TLS" otherwise

//FTP without TLS, or FTPS: "TLS for control and data connection or fail"
//caBundlePath: FTPS server certificate + host name are verified against this CA bundle; empty => no verification
std::unique_ptr<ProtocolBackend> createFtpBackend(bool useTls, const std::string& caBundlePath);

//false if the linked libcurl was built without FTP (or without TLS for FTPS)
bool ftpBackendAvailable(bool useTls);

int getFtpSessionCount();
}

#endif //FTP_H_745895742383425326568678
