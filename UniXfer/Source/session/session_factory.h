// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef SESSION_FACTORY_H_5903182746501938
#define SESSION_FACTORY_H_5903182746501938

#include <memory>
#include "transport_session.h"
#include "../ftp/ftp_native.h"
#include "../sftp/ssh_native.h"


namespace uxf
{
//protocol dispatch: one session per call, native bindings are shared between sessions
class SessionFactory
{
public:
    //a null connector: sessions for that protocol family throw MissingCapabilityError
    SessionFactory(const std::shared_ptr<FtpConnector>& ftpConnector,
                   const std::shared_ptr<SshConnector>& sshConnector) :
        ftpConnector_(ftpConnector),
        sshConnector_(sshConnector) {}

    std::unique_ptr<TransportSession> create(const UrlDescriptor& url, const ConnectionOptions& options, zen::ErrorLog* log) const; //throw MissingCapabilityError

    //parse "scheme://[user[:pass]@]host[:port][/path]" first
    std::unique_ptr<TransportSession> create(const std::string& url, const ConnectionOptions& options, zen::ErrorLog* log) const; //throw InvalidUrlError, UnsupportedProtocolError, MissingCapabilityError

private:
    const std::shared_ptr<FtpConnector> ftpConnector_;
    const std::shared_ptr<SshConnector> sshConnector_;
};


//libcurl and libssh2 bindings
SessionFactory createDefaultSessionFactory();

//not connected yet: call connect() and a login function next
std::unique_ptr<TransportSession> openSession(const std::string& url,
                                              const ConnectionOptions& options = ConnectionOptions(),
                                              zen::ErrorLog* log = nullptr); //throw InvalidUrlError, UnsupportedProtocolError, MissingCapabilityError
}

#endif //SESSION_FACTORY_H_5903182746501938
