// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "connection_manager.h"

using namespace zen;
using namespace scpush;


ConnectionManager::ConnectionManager(std::unique_ptr<ScpDialer>&& dialer, TransferCallback* callback) :
    dialer_(std::move(dialer)),
    callback_(callback)
{
    if (!dialer_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


bool ConnectionManager::hasConnection() const
{
    std::lock_guard dummy(lockConnection_);
    return static_cast<bool>(connection_);
}


void ConnectionManager::dial() //throw ErrorDial, ErrorAuthentication
{
    const std::wstring errorMsg = replaceCpy(_("Unable to connect to %x."), L"%x", fmtPath(getDisplayName()));

    if (callback_)
        callback_->logMessage(replaceCpy(_("Connecting to %x..."), L"%x", fmtPath(getDisplayName())), TransferCallback::MsgType::info);
    try
    {
        connection_ = dialer_->dial(); //throw SysError, SysErrorAuthentication
    }
    catch (const SysErrorAuthentication& e) { throw ErrorAuthentication(errorMsg, e.toString()); }
    catch (const SysError&               e) { throw ErrorDial          (errorMsg, e.toString()); }
}


std::unique_ptr<ScpSession> ConnectionManager::acquireSession() //throw ErrorDial, ErrorAuthentication, ErrorSession
{
    std::lock_guard dummy(lockConnection_);

    if (!connection_)
        dial(); //throw ErrorDial, ErrorAuthentication
    try
    {
        return connection_->openSession(); //throw SysError
    }
    catch (const SysError& e)
    {
        //don't close explicitly: running sessions still own the connection
        connection_.reset();

        if (callback_)
            callback_->logMessage(replaceCpy(_("Cannot open SSH session on %x."), L"%x", fmtPath(getDisplayName())) + L"\n\n" + e.toString() + L"\n\n" +
                                  _("Reconnecting..."), TransferCallback::MsgType::warning);
    }

    dial(); //throw ErrorDial, ErrorAuthentication
    try
    {
        return connection_->openSession(); //throw SysError
    }
    catch (const SysError& e)
    {
        connection_.reset(); //next call dials from scratch
        throw ErrorSession(replaceCpy(_("Cannot open SSH session on %x."), L"%x", fmtPath(getDisplayName())), e.toString());
    }
}
