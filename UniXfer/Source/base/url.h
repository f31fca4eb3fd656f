// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef URL_H_3098217465028317465
#define URL_H_3098217465028317465

#include <optional>
#include <string>
#include "xfer_error.h"


namespace uxf
{
enum class Protocol
{
    ftp,  //plain
    ftps, //explicit TLS: AUTH TLS
    sftp, //secure shell
};

const int DEFAULT_PORT_FTP  = 21;
const int DEFAULT_PORT_SFTP = 22;

Protocol parseProtocol(const std::string& scheme); //throw UnsupportedProtocolError; trimmed, case-insensitive
std::string getSchemeName(Protocol p);

inline bool isFtpFamily(Protocol p) { return p == Protocol::ftp || p == Protocol::ftps; }


//scheme://[user[:pass]@]host[:port][/path]
struct UrlDescriptor
{
    Protocol protocol = Protocol::ftp;
    std::string host;
    std::optional<int> port;
    std::optional<std::string> user;     //percent-decoded
    std::optional<std::string> password; //percent-decoded
    std::string basePath = "/";          //always starts with '/'

    int getEffectivePort() const { return port ? *port : (protocol == Protocol::sftp ? DEFAULT_PORT_SFTP : DEFAULT_PORT_FTP); }
};

UrlDescriptor parseUrl(const std::string& url); //throw InvalidUrlError, UnsupportedProtocolError

std::string decodePercent(const std::string& str); //invalid escapes are kept verbatim
}

#endif //URL_H_3098217465028317465
