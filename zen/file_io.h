// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_IO_H_89578342758342572345
#define FILE_IO_H_89578342758342572345

#include "file_error.h"


namespace zen
{
/*  OS-buffered file I/O:
    - sequential read/append accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    const std::string& getFilePath() const { return filePath_; }

    static constexpr size_t defaultBlockSize = 64 * 1024;

    void close(); //throw FileError -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

protected:
    FileBase(FileHandle handle, const std::string& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

    FileHandle getHandle() { return hFile_; }

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const std::string filePath_;
};


class FileInputPlain : public FileBase
{
public:
    explicit FileInputPlain(const std::string& filePath); //throw FileError

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError
};


//O_APPEND: concurrent writers (e.g. two server instances sharing one log) never overwrite each other
class FileOutputAppend : public FileBase
{
public:
    explicit FileOutputAppend(const std::string& filePath); //throw FileError; creates file if missing

    void write(const void* buffer, size_t bytesToWrite); //throw FileError; writes all bytes
};

//-----------------------------------------------------------------------------------------------

[[nodiscard]] std::string getFileContent(const std::string& filePath); //throw FileError
}

#endif //FILE_IO_H_89578342758342572345
