// *****************************************************************************
// * This file is part of the UniXfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The UniXfer Authors - All Rights Reserved                   *
// *****************************************************************************

#ifndef XFER_ERROR_H_7390547128356209814
#define XFER_ERROR_H_7390547128356209814

#include <string>


namespace uxf
{
//high-level exception family: every error a transfer session raises on purpose
class XferError
{
public:
    explicit XferError(const std::string& msg) : msg_(msg) {}
    virtual ~XferError() {}

    const std::string& toString() const { return msg_; }

private:
    std::string msg_;
};

#define DEFINE_NEW_XFER_ERROR(X) struct X : public uxf::XferError { X(const std::string& msg) : XferError(msg) {} };

DEFINE_NEW_XFER_ERROR(ConnectionError)        //connect, host key verification, SFTP subsystem
DEFINE_NEW_XFER_ERROR(AuthenticationError)    //not connected, missing or rejected credentials, key files
DEFINE_NEW_XFER_ERROR(TransferError)          //not authenticated, any remote operation failing
DEFINE_NEW_XFER_ERROR(MissingCapabilityError) //never retried: cannot change while the retry loop runs
DEFINE_NEW_XFER_ERROR(InvalidUrlError)
DEFINE_NEW_XFER_ERROR(UnsupportedProtocolError)


inline std::string fmtHost(const std::string& host) { return '"' + host + '"'; }
}

#endif //XFER_ERROR_H_7390547128356209814
