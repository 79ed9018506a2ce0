// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCP_ERROR_H_7342098157832465
#define SCP_ERROR_H_7342098157832465

#include <exception>
#include <zen/file_error.h>


namespace scpush
{
/*  Error hierarchy of a transfer:

    FileError
     |-- ErrorDial              connection could not be established
     |    |-- ErrorAuthentication    server rejected login or host key
     |-- ErrorSession           connection established, but no session could be opened (after one redial)
     |-- ErrorTransferIo        local source or input pipe failed
     |    |-- ErrorSourceFile        local source cannot be opened
     |-- ErrorRemoteCommand     remote "scp -t" failed: see exit status
     |-- ErrorRetryExhausted    bounded retry gave up
     |-- ErrorTimeout           deadline reached

    CancelTransfer: user request, not an error => not a FileError!      */

DEFINE_NEW_FILE_ERROR(ErrorDial)
DEFINE_NEW_FILE_ERROR(ErrorSession)
DEFINE_NEW_FILE_ERROR(ErrorTransferIo)
DEFINE_NEW_FILE_ERROR(ErrorTimeout)

struct ErrorAuthentication : public ErrorDial
{
    ErrorAuthentication(const std::wstring& msg, const std::wstring& details) : ErrorDial(msg, details) {}
};

struct ErrorSourceFile : public ErrorTransferIo
{
    explicit ErrorSourceFile(const std::wstring& msg) : ErrorTransferIo(msg) {}
    ErrorSourceFile(const std::wstring& msg, const std::wstring& details) : ErrorTransferIo(msg, details) {}
};


class ErrorRemoteCommand : public zen::FileError
{
public:
    ErrorRemoteCommand(const std::wstring& msg, const std::wstring& details, int exitStatus) :
        FileError(msg, details), exitStatus_(exitStatus) {}

    int getExitStatus() const { return exitStatus_; } //-1 if remote process did not report any

private:
    int exitStatus_;
};


class ErrorRetryExhausted : public zen::FileError
{
public:
    ErrorRetryExhausted(const std::exception_ptr& lastError, const std::wstring& lastErrorMsg, size_t attemptCount) :
        FileError(_P("Giving up after 1 attempt.", "Giving up after %x attempts.", attemptCount), lastErrorMsg),
        lastError_(lastError),
        attemptCount_(attemptCount) {}

    const std::exception_ptr& getLastError() const { return lastError_; } //rethrow to inspect the error type
    size_t getAttemptCount() const { return attemptCount_; }

private:
    std::exception_ptr lastError_;
    size_t attemptCount_;
};


//Exception class used to abort a transfer
class CancelTransfer {};
}

#endif //SCP_ERROR_H_7342098157832465
