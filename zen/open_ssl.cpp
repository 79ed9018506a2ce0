// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "open_ssl.h"
#include "thread.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>


using namespace zen;


namespace
{
#ifndef OPENSSL_THREADS
    #error FFS, we are royally screwed!
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::wstring formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string()
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec)), utfTo<std::wstring>(errorBuf));
}


std::wstring formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //latest error code without modifying the thread's error queue
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}
}


void zen::openSslInit()
{
    //official Wiki: https://wiki.openssl.org/index.php/Library_Initialization
    assert(runningOnMainThread());
    //libssh2 uses OpenSSL as crypto backend => init explicitly on main thread before the first handshake
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError(_("Error during process initialization.") + L"\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


void zen::openSslTearDown() {}
//================================================================================

std::string zen::createSha256Hash(const std::string_view str) //throw SysError
{
    EVP_MD_CTX* mdctx = ::EVP_MD_CTX_new();
    if (!mdctx)
        throw SysError(formatSystemError("EVP_MD_CTX_new", L"", L"No more error details."));
    ZEN_ON_SCOPE_EXIT(::EVP_MD_CTX_free(mdctx));

    if (::EVP_DigestInit_ex(mdctx, ::EVP_sha256(), nullptr /*ENGINE* impl*/) != 1)
        throw SysError(formatLastOpenSSLError("EVP_DigestInit_ex"));

    if (::EVP_DigestUpdate(mdctx, str.data(), str.size()) != 1)
        throw SysError(formatLastOpenSSLError("EVP_DigestUpdate"));

    std::string output(EVP_MAX_MD_SIZE, '\0');
    unsigned int bytesWritten = 0;
    if (::EVP_DigestFinal_ex(mdctx, reinterpret_cast<unsigned char*>(output.data()), &bytesWritten) != 1)
        throw SysError(formatLastOpenSSLError("EVP_DigestFinal_ex"));

    output.resize(bytesWritten);
    return output;
}


std::string zen::encodeBase64(const std::string_view str) //throw SysError
{
    //EVP_EncodeBlock(): "4*((n+2)/3) bytes are written [...] plus a NUL terminator"
    std::string output(4 * ((str.size() + 2) / 3) + 1, '\0');

    const int charsWritten = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(output.data()),
                                               reinterpret_cast<const unsigned char*>(str.data()),
                                               static_cast<int>(str.size()));
    if (charsWritten < 0)
        throw SysError(formatLastOpenSSLError("EVP_EncodeBlock"));

    output.resize(charsWritten);
    return output;
}


std::string zen::formatSshHostKeyFingerprint(const std::string_view sha256Hash) //throw SysError
{
    std::string b64 = encodeBase64(sha256Hash); //throw SysError
    trim(b64); //no-op, just in case

    while (endsWith(b64, '='))
        b64.pop_back();

    return "SHA256:" + b64;
}
