// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef INIT_LIBSSH2_H_4570285702375915765
#define INIT_LIBSSH2_H_4570285702375915765

#include <memory>
#include <zen/sys_error.h>


namespace scpush
{
//libssh2 (+ OpenSSL) initialization/shutdown dance:

//1. create one "Libssh2Initializer" on the main thread *before* dialing the first SSH connection
//   => destructor waits until all remaining connections (possibly owned by worker threads) are gone
class Libssh2Initializer
{
public:
    Libssh2Initializer();
    ~Libssh2Initializer();

private:
    Libssh2Initializer           (const Libssh2Initializer&) = delete;
    Libssh2Initializer& operator=(const Libssh2Initializer&) = delete;
};


//2. tie to SSH connection instances: fails if libssh2 is not initialized
class Libssh2InitCookie;
std::shared_ptr<Libssh2InitCookie> getLibssh2InitCookie(); //throw SysError
}

#endif //INIT_LIBSSH2_H_4570285702375915765
