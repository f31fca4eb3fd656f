// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "open_ssl.h"
#include "extra_log.h"
#include "string_tools.h"
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/crypto.h>


using namespace zen;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL built without thread support
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::string formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string(); err.c: it seems the message uses at most ~200 bytes
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, "Error code " + numberTo<std::string>(ec), errorBuf);
}


std::string formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //"returns latest error code from the thread's error queue without modifying it" - unlike ERR_get_error()
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}
}


void zen::openSslInit()
{
    //official Wiki: https://wiki.openssl.org/index.php/Library_Initialization
    //explicitly init OpenSSL on main thread: https://www.openssl.org/docs/manmaster/man3/OPENSSL_init_ssl.html
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError("Error during process initialization.\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


void zen::openSslTearDown() {}
//OpenSSL 1.1.0+ deprecates all clean up functions


bool zen::constantTimeEquals(std::string_view lhs, std::string_view rhs)
{
    if (lhs.size() != rhs.size())
        return false;
    if (lhs.empty())
        return true;

    return ::CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}
