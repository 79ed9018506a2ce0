// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef OPEN_SSL_H_801974580936508934568792347506
#define OPEN_SSL_H_801974580936508934568792347506

#include "sys_error.h"


namespace zen
{
//init OpenSSL before use!
void openSslInit();
void openSslTearDown();


std::string createSha256Hash(const std::string_view str); //throw SysError; raw bytes

std::string encodeBase64(const std::string_view str); //throw SysError; with '=' padding

//OpenSSH-style fingerprint: "SHA256:" + base64 without trailing '='
//e.g. "SHA256:nThbg6kXUpJWGl7E1IGOCspRomTxdCARLviKw6E5SY8"
std::string formatSshHostKeyFingerprint(const std::string_view sha256Hash); //throw SysError
}

#endif //OPEN_SSL_H_801974580936508934568792347506
