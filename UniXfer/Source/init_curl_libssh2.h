// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef INIT_CURL_LIBSSH2_H_8130274659102837
#define INIT_CURL_LIBSSH2_H_8130274659102837


namespace uxf
{
/*  global init/shutdown of OpenSSL, libcurl and libssh2: reference-counted, instances may nest

    create on the main thread *before* the first session, destroy after the last one:

        int main()
        {
            uxf::UniInitializer initCurlSsh;
            ...                                                                       */
class UniInitializer
{
public:
    UniInitializer();
    ~UniInitializer();

private:
    UniInitializer           (const UniInitializer&) = delete;
    UniInitializer& operator=(const UniInitializer&) = delete;
};
}

#endif //INIT_CURL_LIBSSH2_H_8130274659102837
