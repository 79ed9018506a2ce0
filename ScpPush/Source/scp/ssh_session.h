// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SSH_SESSION_H_5709247517863452
#define SSH_SESSION_H_5709247517863452

#include "session_factory.h"


namespace scpush
{
const int DEFAULT_PORT_SSH = 22;

struct ScpLogin
{
    Zstring server;
    int port = DEFAULT_PORT_SSH;
    Zstring username;

    //authentication: key takes precedence over password if both are set
    std::string privateKey; //key file content (OpenSSH/PEM format)
    Zstring passphrase;     //optional: for encrypted private key
    Zstring password;

    int timeoutSec = 10;    //connect + SSH operations
    bool allowZlib = false; //SSH-level compression
    std::string hostKeySha256; //optional pin in OpenSSH format, e.g. "SHA256:nThbg6kXUpJWGl7E1IGOCspRomTxdCARLviKw6E5SY8"
};


//requires a living Libssh2Initializer (init_libssh2.h) while connections exist
std::unique_ptr<ScpDialer> createSshDialer(const ScpLogin& login);
}

#endif //SSH_SESSION_H_5709247517863452
