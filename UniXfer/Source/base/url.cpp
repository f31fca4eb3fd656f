// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "url.h"
#include <algorithm>
#include <cassert>
#include <zen/file_error.h>
#include <zen/string_tools.h>
#include "remote_path.h"

using namespace zen;
using namespace uxf;


Protocol uxf::parseProtocol(const std::string& scheme) //throw UnsupportedProtocolError
{
    const std::string schemeFmt = getLowerCaseAscii(trimCpy(scheme));

    if (schemeFmt == "ftp")
        return Protocol::ftp;
    if (schemeFmt == "ftps")
        return Protocol::ftps;
    if (schemeFmt == "sftp")
        return Protocol::sftp;

    throw UnsupportedProtocolError(replaceCpy("Unsupported protocol: \"%x\"", "%x", schemeFmt));
}


std::string uxf::getSchemeName(Protocol p)
{
    switch (p)
    {
        case Protocol::ftp:
            return "ftp";
        case Protocol::ftps:
            return "ftps";
        case Protocol::sftp:
            return "sftp";
    }
    assert(false);
    return std::string();
}


std::string uxf::decodePercent(const std::string& str)
{
    std::string output;
    for (size_t i = 0; i < str.size(); ++i)
        if (str[i] == '%' && i + 2 < str.size() && isHexDigit(str[i + 1]) && isHexDigit(str[i + 2]))
        {
            output += unhexify(str[i + 1], str[i + 2]);
            i += 2;
        }
        else
            output += str[i];
    return output;
}


namespace
{
bool isSchemeChar(char c, bool first)
{
    if (('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z'))
        return true;
    return !first && (isDigit(c) || c == '+' || c == '-' || c == '.');
}
}


UrlDescriptor uxf::parseUrl(const std::string& url) //throw InvalidUrlError, UnsupportedProtocolError
{
    const auto throwMissingHost = [&] { throw InvalidUrlError(replaceCpy("Invalid FTP URL: missing host. URL: %x.", "%x", fmtPath(url))); };
    const auto throwUnparsable  = [&] { throw InvalidUrlError(replaceCpy("Invalid FTP URL: unable to parse. URL: %x.", "%x", fmtPath(url))); };

    //scheme: [a-z][a-z0-9+-.]*
    const size_t posSchemeEnd = url.find("://");
    if (posSchemeEnd == std::string::npos || posSchemeEnd == 0 || !isSchemeChar(url[0], true /*first*/) ||
        !std::all_of(url.begin() + 1, url.begin() + posSchemeEnd, [](char c) { return isSchemeChar(c, false /*first*/); }))
        throw InvalidUrlError(replaceCpy("Invalid FTP URL: missing scheme (expected \"ftp\", \"ftps\" or \"sftp\"). URL: %x.", "%x", fmtPath(url)));

    const std::string scheme = url.substr(0, posSchemeEnd);

    std::string_view rest = std::string_view(url).substr(posSchemeEnd + 3);
    rest = beforeFirst(rest, '#', IfNotFoundReturn::all);
    rest = beforeFirst(rest, '?', IfNotFoundReturn::all);

    if (rest.empty() || rest[0] == '/' || rest[0] == ':' || rest[0] == '@')
        throwMissingHost();

    const std::string_view authority = beforeFirst(rest, '/', IfNotFoundReturn::all);
    const std::string_view rawPath   = rest.substr(authority.size());

    UrlDescriptor output;

    std::string_view hostPort = authority;
    if (const size_t posAt = authority.rfind('@');
        posAt != std::string_view::npos)
    {
        const std::string_view userInfo = authority.substr(0, posAt);
        hostPort = authority.substr(posAt + 1);

        output.user = decodePercent(std::string(beforeFirst(userInfo, ':', IfNotFoundReturn::all)));
        if (contains(userInfo, ":"))
            output.password = decodePercent(std::string(afterFirst(userInfo, ':', IfNotFoundReturn::none)));
    }

    std::string_view host = hostPort;
    std::optional<std::string_view> portStr;
    if (startsWith(hostPort, '[')) //IPv6 literal: keep the brackets
    {
        const size_t posEnd = hostPort.find(']');
        if (posEnd == std::string_view::npos)
            throwUnparsable();
        host = hostPort.substr(0, posEnd + 1);

        const std::string_view tail = hostPort.substr(posEnd + 1);
        if (!tail.empty())
        {
            if (!startsWith(tail, ':'))
                throwUnparsable();
            portStr = tail.substr(1);
        }
    }
    else if (const size_t posColon = hostPort.rfind(':');
             posColon != std::string_view::npos)
    {
        host    = hostPort.substr(0, posColon);
        portStr = hostPort.substr(posColon + 1);
    }

    if (portStr && !portStr->empty()) //"host:" => no port
    {
        if (!std::all_of(portStr->begin(), portStr->end(), [](char c) { return isDigit(c); }) || portStr->size() > 5)
            throwUnparsable();

        const int port = stringTo<int>(*portStr);
        if (port > 65535)
            throwUnparsable();
        output.port = port;
    }

    if (host.empty())
        throwMissingHost();

    output.protocol = parseProtocol(scheme); //throw UnsupportedProtocolError
    output.host     = std::string(host);
    output.basePath = '/' + ltrimSeparator(rawPath);
    return output;
}
