// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef SSH_LIBSSH2_H_2093847561028374
#define SSH_LIBSSH2_H_2093847561028374

#include <memory>
#include "ssh_native.h"
#include "../init_curl_libssh2.h"


namespace uxf
{
/*  libssh2 implementation: keeps libssh2 initialized while connector or any backend using it is alive
    - blocking session, the configured timeout applies to every SSH round-trip
    - SftpDirectory and SftpFile must not outlive the SshConnection they were opened on */
class Libssh2Connector : public SshConnector
{
public:
    explicit Libssh2Connector(const std::shared_ptr<UniInitializer>& init) : init_(init) {}

    std::unique_ptr<SshConnection> connect(const std::string& server, int port, const std::string& hostKeyAlgorithm, std::optional<int> timeoutSec) override; //throw SysError

private:
    const std::shared_ptr<UniInitializer> init_;
};
}

#endif //SSH_LIBSSH2_H_2093847561028374
