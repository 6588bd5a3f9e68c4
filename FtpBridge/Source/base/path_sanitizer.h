// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef PATH_SANITIZER_H_3874501938475610934
#define PATH_SANITIZER_H_3874501938475610934

#include <vector>
#include "bridge_error.h"


namespace fbr
{
struct SanitizedPath
{
    std::string remotePath; //absolute, normalized: "/reports/2026/q3.xlsx"
    std::string fileName;   //"q3.xlsx"
    std::string extension;  //".xlsx" lower-case; empty if none
};

/*  untrusted input from a query string:
    - absolute only: there is no server-side root to resolve against
    - any ".." segment is rejected, not resolved
    - allowedExtensions: ".csv" etc., compared case-insensitively           */
SanitizedPath sanitizePath(std::string_view path, const std::vector<std::string>& allowedExtensions); //throw ValidationError

std::string getFileExtension(std::string_view fileName); //".xlsx"; empty for "README" or ".profile"
}

#endif //PATH_SANITIZER_H_3874501938475610934
