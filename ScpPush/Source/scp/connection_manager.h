// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CONNECTION_MANAGER_H_3459872309457234
#define CONNECTION_MANAGER_H_3459872309457234

#include <mutex>
#include "session_factory.h"
#include "../base/process_callback.h"
#include "../base/scp_error.h"


namespace scpush
{
/*  lazily dialed connection, shared by all transfers of one helper:
    - at most one live connection
    - failed session => drop connection, redial exactly once
    - dialing and opening sessions are serialized under a single lock        */
class ConnectionManager
{
public:
    ConnectionManager(std::unique_ptr<ScpDialer>&& dialer, TransferCallback* callback /*optional*/);

    std::unique_ptr<ScpSession> acquireSession(); //throw ErrorDial, ErrorAuthentication, ErrorSession

    bool hasConnection() const;

    std::wstring getDisplayName() const { return dialer_->getDisplayName(); }

private:
    ConnectionManager           (const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void dial(); //throw ErrorDial, ErrorAuthentication; call while holding "lockConnection_"!

    const std::unique_ptr<ScpDialer> dialer_;
    TransferCallback* const callback_;

    mutable std::mutex lockConnection_;
    std::shared_ptr<ScpConnection> connection_; //protected by lockConnection_
};
}

#endif //CONNECTION_MANAGER_H_3459872309457234
