// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SESSION_FACTORY_H_8734509238475623
#define SESSION_FACTORY_H_8734509238475623

#include <functional>
#include <memory>
#include <zen/sys_error.h>


namespace scpush
{
//transport contract: implemented by libssh2 (ssh_session.h) and by in-memory fakes for testing

using AbortCheck = std::function<void()>; //throw X: called regularly while waiting for the network; may be empty

DEFINE_NEW_SYS_ERROR(SysErrorAuthentication) //login or host key rejected: retrying won't help


struct SysErrorRemoteCommand : public zen::SysError
{
    SysErrorRemoteCommand(const std::wstring& msg, int exitStatus) : SysError(msg), exitStatus_(exitStatus) {}

    int getExitStatus() const { return exitStatus_; }

private:
    int exitStatus_;
};


//one remote command execution; never reused
struct ScpSession
{
    virtual ~ScpSession() {}

    virtual size_t getBlockSize() const = 0;

    //remote process stdin: may return short! CONTRACT: bytesToWrite > 0
    //blocks until run() has started the command
    virtual size_t tryWrite(const void* buffer, size_t bytesToWrite, const AbortCheck& checkAbort) = 0; //throw SysError, X

    //send EOF: idempotent
    virtual void closeInput(const AbortCheck& checkAbort) = 0; //throw SysError, X

    //start command and block until it has exited and closeInput() was called
    virtual void run(const std::string& command, const AbortCheck& checkAbort) = 0; //throw SysError, SysErrorRemoteCommand, X

    //idempotent; run() and tryWrite() must not be active anymore
    virtual void close() = 0; //throw SysError
};


//authenticated transport: shared by all sessions opened on it
struct ScpConnection
{
    virtual ~ScpConnection() {}

    virtual std::unique_ptr<ScpSession> openSession() = 0; //throw SysError
};


struct ScpDialer
{
    virtual ~ScpDialer() {}

    virtual std::shared_ptr<ScpConnection> dial() = 0; //throw SysError, SysErrorAuthentication

    virtual std::wstring getDisplayName() const = 0; //e.g. "user@server:22"
};
}

#endif //SESSION_FACTORY_H_8734509238475623
