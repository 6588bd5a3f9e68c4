// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_access.h"
#include <sys/stat.h>
#include <unistd.h> //access

using namespace zen;


namespace
{
DEFINE_NEW_SYS_ERROR(SysErrorNotExisting)


ItemType getItemTypeImpl(const std::string& itemPath) //throw SysError, SysErrorNotExisting
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) != 0)
    {
        const ErrorCode ec = getLastError(); //copy before making other system calls!
        if (ec == ENOENT || ec == ENOTDIR)
            throw SysErrorNotExisting(formatSystemError("lstat", ec));
        throw SysError(formatSystemError("lstat", ec));
    }

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}
}


ItemType zen::getItemType(const std::string& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysError
    }
    catch (const SysError& e) { throw FileError("Cannot read file attributes of " + fmtFilePath(itemPath) + '.', e.toString()); }
}


std::optional<ItemType> zen::getItemTypeIfExists(const std::string& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysError, SysErrorNotExisting
    }
    catch (const SysErrorNotExisting&) { return {}; }
    catch (const SysError& e) { throw FileError("Cannot read file attributes of " + fmtFilePath(itemPath) + '.', e.toString()); }
}


bool zen::folderIsWritable(const std::string& folderPath)
{
    struct stat folderInfo = {};
    if (::stat(folderPath.c_str(), &folderInfo) != 0 || !S_ISDIR(folderInfo.st_mode))
        return false;

    return ::access(folderPath.c_str(), W_OK | X_OK) == 0;
}
