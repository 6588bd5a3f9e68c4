// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ACCESS_H_8017341345614857
#define FILE_ACCESS_H_8017341345614857

#include <optional>
#include "file_error.h"


namespace zen
{
enum class ItemType
{
    file,
    folder,
    symlink,
};
ItemType getItemType(const std::string& itemPath); //throw FileError

//"not existing" (ENOENT/ENOTDIR) is no error
std::optional<ItemType> getItemTypeIfExists(const std::string& itemPath); //throw FileError

inline bool itemExists(const std::string& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw FileError

//symlink handling: follow
bool folderIsWritable(const std::string& folderPath); //noexcept; permission check for the current process only
}

#endif //FILE_ACCESS_H_8017341345614857
