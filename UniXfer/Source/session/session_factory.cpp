// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#include "session_factory.h"
#include "../ftp/curl_ftp.h"
#include "../ftp/ftp_backend.h"
#include "../sftp/sftp_backend.h"
#include "../sftp/ssh_libssh2.h"

using namespace zen;
using namespace uxf;


std::unique_ptr<TransportSession> SessionFactory::create(const UrlDescriptor& url, const ConnectionOptions& options, zen::ErrorLog* log) const //throw MissingCapabilityError
{
    std::unique_ptr<TransportBackend> backend;

    switch (url.protocol)
    {
        case Protocol::ftp:
        case Protocol::ftps:
            if (!ftpConnector_)
                throw MissingCapabilityError("libcurl support is required for FTP/FTPS operations.");
            backend = std::make_unique<FileTransportBackend>(url, options, ftpConnector_, log);
            break;

        case Protocol::sftp:
            if (!sshConnector_)
                throw MissingCapabilityError("libssh2 support is required for SFTP operations.");
            backend = std::make_unique<SecureShellTransportBackend>(url, options, sshConnector_, log);
            break;
    }
    return std::make_unique<TransportSession>(url, options, std::move(backend), log);
}


std::unique_ptr<TransportSession> SessionFactory::create(const std::string& url, const ConnectionOptions& options, zen::ErrorLog* log) const
{
    return create(parseUrl(url), options, log); //throw InvalidUrlError, UnsupportedProtocolError, MissingCapabilityError
}


SessionFactory uxf::createDefaultSessionFactory()
{
    //each session holds its connector => global init lives until the last session is gone
    const auto init = std::make_shared<UniInitializer>();
    return SessionFactory(std::make_shared<CurlFtpConnector>(init), std::make_shared<Libssh2Connector>(init));
}


std::unique_ptr<TransportSession> uxf::openSession(const std::string& url, const ConnectionOptions& options, zen::ErrorLog* log)
{
    return createDefaultSessionFactory().create(url, options, log); //throw InvalidUrlError, UnsupportedProtocolError, MissingCapabilityError
}
