// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef OPEN_SSL_H_801974580936508934568792347506
#define OPEN_SSL_H_801974580936508934568792347506

#include "sys_error.h"


namespace zen
{
//init OpenSSL before use!
void openSslInit();
void openSslTearDown();

//timing-safe: runtime depends on lengths only, not on where the inputs differ
bool equalConstantTime(std::string_view lhs, std::string_view rhs);

std::string sha256Digest(std::string_view data); //throw SysError; raw 32 bytes

std::string stringEncodeBase64(std::string_view data);

//"SHA256:<base64 without padding>" like "ssh-keygen -l"
std::string formatSshFingerprint(std::string_view sha256Digest);
}

#endif //OPEN_SSL_H_801974580936508934568792347506
