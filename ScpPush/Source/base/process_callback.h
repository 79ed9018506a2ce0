// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef PROCESS_CALLBACK_H_48257827842345454545
#define PROCESS_CALLBACK_H_48257827842345454545

#include <string>
#include <chrono>


namespace scpush
{
//status reporting of a transfer: called from worker threads, too => implementation must be thread-safe!
struct TransferCallback
{
    virtual ~TransferCallback() {}

    enum class MsgType
    {
        info,
        warning,
        error,
    };
    virtual void logMessage(const std::wstring& msg, MsgType type) = 0; //noexcept!

    struct ErrorInfo
    {
        std::wstring msg;
        std::chrono::steady_clock::time_point failTime;
        size_t retryNumber = 0; //number of failed attempts so far
    };
    //failed attempt will be retried after "delay"
    virtual void reportRetry(const ErrorInfo& errorInfo, std::chrono::milliseconds delay) = 0; //noexcept!
};
}

#endif //PROCESS_CALLBACK_H_48257827842345454545
