// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef VERSION_H_0913874598324759
#define VERSION_H_0913874598324759


namespace fbr
{
const char bridgeVersion[] = "2.1.0"; //internal linkage!
const char bridgeServiceName[] = "FTP Bridge";
}

#endif //VERSION_H_0913874598324759
