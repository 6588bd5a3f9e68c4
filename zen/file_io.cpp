// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_io.h"
#include "extra_log.h"
#include <sys/stat.h>
#include <fcntl.h>  //open
#include <unistd.h> //close, read, write

using namespace zen;


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            close(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


void FileBase::close() //throw FileError
{
    try
    {
        if (hFile_ == invalidFileHandle)
            throw SysError("Contract error: close() called more than once.");
        if (::close(hFile_) != 0)
            THROW_LAST_SYS_ERROR("close");
        hFile_ = invalidFileHandle;
    }
    catch (const SysError& e) { throw FileError("Cannot close file " + fmtFilePath(getFilePath()) + '.', e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForRead(const std::string& filePath) //throw FileError
{
    try
    {
        //caveat: check for file types that block during open(): character device, block device, named pipe
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
            THROW_LAST_SYS_ERROR("stat");

        if (!S_ISREG(fileInfo.st_mode))
            throw SysError("Unsupported item type. [0" + numberTo(static_cast<unsigned int>(fileInfo.st_mode & S_IFMT)) + ']');

        const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
            THROW_LAST_SYS_ERROR("open");
        return fdFile; //pass ownership
    }
    catch (const SysError& e) { throw FileError("Cannot open file " + fmtFilePath(filePath) + '.', e.toString()); }
}


FileBase::FileHandle openHandleForAppend(const std::string& filePath) //throw FileError
{
    const mode_t logFileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH; //0644
    const int fdFile = ::open(filePath.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, logFileMode);
    if (fdFile == -1)
        THROW_LAST_FILE_ERROR("Cannot write file " + fmtFilePath(filePath) + '.', "open");
    return fdFile; //pass ownership
}
}


FileInputPlain::FileInputPlain(const std::string& filePath) :
    FileBase(openHandleForRead(filePath), filePath) {} //throw FileError


size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(getHandle(), buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR); //Compare copy_reg() in copy.c: ftp://ftp.gnu.org/gnu/coreutils/coreutils-8.23.tar.xz

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");
        ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead); //better safe than sorry
        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throw FileError("Cannot read file " + fmtFilePath(getFilePath()) + '.', e.toString()); }
}


FileOutputAppend::FileOutputAppend(const std::string& filePath) :
    FileBase(openHandleForAppend(filePath), filePath) {} //throw FileError


void FileOutputAppend::write(const void* buffer, size_t bytesToWrite) //throw FileError
{
    try
    {
        const char* it = static_cast<const char*>(buffer);
        const char* const itEnd = it + bytesToWrite;
        while (it != itEnd)
        {
            ssize_t bytesWritten = 0;
            do
            {
                bytesWritten = ::write(getHandle(), it, itEnd - it);
            }
            while (bytesWritten < 0 && errno == EINTR);

            if (bytesWritten <= 0)
            {
                if (bytesWritten == 0) //comment in safe-read.c suggests to treat this as an error due to buggy drivers
                    errno = ENOSPC;
                THROW_LAST_SYS_ERROR("write");
            }
            ASSERT_SYSERROR(bytesWritten <= itEnd - it); //better safe than sorry
            it += bytesWritten;
        }
    }
    catch (const SysError& e) { throw FileError("Cannot write file " + fmtFilePath(getFilePath()) + '.', e.toString()); }
}


std::string zen::getFileContent(const std::string& filePath) //throw FileError
{
    FileInputPlain fileIn(filePath); //throw FileError

    std::string content;
    std::string buffer(FileBase::defaultBlockSize, '\0');
    for (;;)
    {
        const size_t bytesRead = fileIn.tryRead(buffer.data(), buffer.size()); //throw FileError
        if (bytesRead == 0) //end of file
            break;
        content.append(buffer.data(), bytesRead);
    }
    fileIn.close(); //throw FileError
    return content;
}
