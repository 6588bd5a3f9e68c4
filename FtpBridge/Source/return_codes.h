// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef RETURN_CODES_H_60918273645091827
#define RETURN_CODES_H_60918273645091827


namespace fbr
{
enum class BridgeExitCode //as returned on process exit
{
    success = 0,
    configError,   //unreadable or invalid configuration, bad command line
    startupFailure, //e.g. log file or listening socket not available
};
}

#endif //RETURN_CODES_H_60918273645091827
