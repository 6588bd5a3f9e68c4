// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "path_sanitizer.h"
#include <algorithm>

using namespace zen;
using namespace fbr;


namespace
{
//ASCII alphanumerics + "_-./ " and UTF-8 sequences: \w is Unicode-aware in the original regex ^/[\w\-\./]*$
bool isValidPathChar(char c)
{
    return isDigit(c) || isAsciiAlpha(c) ||
           c == '_' || c == '-' || c == '.' || c == '/' || c == ' ' ||
           !isAsciiChar(c);
}
}


std::string fbr::getFileExtension(std::string_view fileName)
{
    const size_t pos = fileName.rfind('.');
    if (pos == std::string_view::npos || pos == 0 /*".profile"*/ || pos + 1 == fileName.size() /*"file."*/)
        return std::string();

    return asciiToLowerCpy(fileName.substr(pos));
}


SanitizedPath fbr::sanitizePath(std::string_view path, const std::vector<std::string>& allowedExtensions) //throw ValidationError
{
    if (path.empty())
        throw ValidationError(ValidationIssue::emptyPath, "Path must not be empty.");

    std::vector<std::string_view> segments;
    split(path, '/', [&](const std::string_view segment) { segments.push_back(segment); });

    //first structural check: no traversal in any position, whether resolvable or not, and regardless of other defects
    if (std::any_of(segments.begin(), segments.end(), [](std::string_view segment) { return segment == ".."; }))
        throw ValidationError(ValidationIssue::pathTraversal, "Path traversal is not allowed.");

    if (std::any_of(path.begin(), path.end(), [](char c) { return c == '\0' || c == '\\' || isControlChar(c); }))
        throw ValidationError(ValidationIssue::invalidCharacters, "Path contains invalid characters.");

    if (!startsWith(path, "/"))
        throw ValidationError(ValidationIssue::invalidCharacters, "Path must be absolute.");

    if (contains(path, "//"))
        throw ValidationError(ValidationIssue::invalidCharacters, "Path must not contain empty segments.");

    if (!std::all_of(path.begin(), path.end(), isValidPathChar))
        throw ValidationError(ValidationIssue::invalidCharacters, "Path contains invalid characters.");

    //normalize: drop "." segments; the leading empty segment is the root
    std::string remotePath;
    for (const std::string_view segment : segments)
        if (!segment.empty() && segment != ".")
        {
            remotePath += '/';
            remotePath += segment;
        }

    const std::string fileName = afterLast(remotePath, "/", IfNotFoundReturn::all);
    if (fileName.empty() || endsWith(path, "/") || endsWith(path, "/."))
        throw ValidationError(ValidationIssue::missingFileName, "Path must name a file.");

    const std::string extension = getFileExtension(fileName);

    if (extension.empty() ||
        std::none_of(allowedExtensions.begin(), allowedExtensions.end(), [&](const std::string& ext) { return equalAsciiNoCase(ext, extension); }))
    {
        std::string allowedList;
        for (const std::string& ext : allowedExtensions)
            allowedList += (allowedList.empty() ? "" : ", ") + ext;

        throw ValidationError(ValidationIssue::invalidExtension, "File extension " + fmtPath(extension.empty() ? fileName : extension) +
                              " is not allowed. Allowed: " + allowedList);
    }

    return {remotePath, fileName, extension};
}
