// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "init_curl_libssh2.h"
#include <cassert>
#include <zen/extra_log.h>
#include <libcurl/curl_wrap.h>    //DON'T include <curl/curl.h> directly!
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2_sftp.h> directly!

using namespace zen;
using namespace uxf;


namespace
{
int uniInitLevel = 0; //support interleaving initialization calls! (e.g. use for libssh2 and libcurl)
//zero-initialized POD => not subject to static initialization order fiasco

void libsshCurlUnifiedInit()
{
    assert(uniInitLevel >= 0);
    if (++uniInitLevel != 1) //non-atomic => require call from main thread
        return;

    libcurlInit(); //includes OpenSSL initialization also needed by libssh2

    if (const int rc = ::libssh2_init(0);
        rc != 0)
        logExtraError("Error during process initialization.\n\n" + formatSystemError("libssh2_init", formatSshStatusCode(rc), ""));
}


void libsshCurlUnifiedTearDown()
{
    assert(uniInitLevel >= 1);
    if (--uniInitLevel != 0)
        return;

    ::libssh2_exit();
    libcurlTearDown();
}
}


UniInitializer::UniInitializer()
{
    libsshCurlUnifiedInit();
}


UniInitializer::~UniInitializer()
{
    libsshCurlUnifiedTearDown();
}
