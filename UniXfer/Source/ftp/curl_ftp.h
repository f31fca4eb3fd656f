// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef CURL_FTP_H_8302716495018273
#define CURL_FTP_H_8302716495018273

#include <memory>
#include "ftp_native.h"
#include "../init_curl_libssh2.h"


namespace uxf
{
//libcurl implementation: keeps libcurl initialized while connector or any backend using it is alive
class CurlFtpConnector : public FtpConnector
{
public:
    explicit CurlFtpConnector(const std::shared_ptr<UniInitializer>& init) : init_(init) {}

    std::unique_ptr<FtpConnection> connect(const std::string& server, int port, bool useTls, std::optional<int> timeoutSec) override; //throw SysError

private:
    const std::shared_ptr<UniInitializer> init_;
};


//MLSD line => facts; std::nullopt for "." and ".."
std::optional<FtpFacts> parseMlsdLine(std::string_view line); //throw SysError

//"257 "/dir/with ""quotes"""" => /dir/with "quotes"
std::string parsePwdResponse(const std::string& serverResponse); //throw SysError
}

#endif //CURL_FTP_H_8302716495018273
