// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCP_HELPER_H_0283745029384756
#define SCP_HELPER_H_0283745029384756

#include <zen/thread.h>
#include "base/retry_controller.h"
#include "scp/scp_transfer.h"


namespace scpush
{
/*  push single files to one SSH server; thread-safe: concurrent transfers share the connection

    copy*:     one attempt, errors are passed through
    tryCopy*:  at most "attempts" attempts, then ErrorRetryExhausted
    mustCopy*: retry until success; only CancelTransfer/ErrorTimeout end it

    "remotePath": destination folder + file name, e.g. "/var/log/app.log"            */
class ScpHelper
{
public:
    ScpHelper(std::unique_ptr<ScpDialer>&& dialer, TransferCallback* callback /*optional*/);

    void copy    (const SourceFactory& openSource, uint64_t size, const Zstring& remotePath, AbortControl& abortCtrl); //throw FileError, CancelTransfer
    void copyPath(const Zstring& localFilePath,                    const Zstring& remotePath, AbortControl& abortCtrl); //

    void tryCopy    (const SourceFactory& openSource, uint64_t size, const Zstring& remotePath, size_t attempts, AbortControl& abortCtrl); //throw FileError, ErrorRetryExhausted, CancelTransfer
    void tryCopyPath(const Zstring& localFilePath,                    const Zstring& remotePath, size_t attempts, AbortControl& abortCtrl); //

    void mustCopy    (const SourceFactory& openSource, uint64_t size, const Zstring& remotePath, AbortControl& abortCtrl); //throw ErrorTransferIo, ErrorTimeout, CancelTransfer
    void mustCopyPath(const Zstring& localFilePath,                    const Zstring& remotePath, AbortControl& abortCtrl); //throw ErrorSourceFile, ErrorTransferIo, ErrorTimeout, CancelTransfer

    //configuration: applies to transfers started afterwards
    void setLimitKB(int limitKBs); //<= 0: no limit
    void setGzipEnable(bool enable);
    void setBackoffSchedule(const BackoffSchedule& backoff);
    void setFailFast(bool failFast); //don't retry ErrorAuthentication, ErrorSourceFile

    ConnectionManager& getConnectionManager() { return connMgr_; }

private:
    ScpHelper           (const ScpHelper&) = delete;
    ScpHelper& operator=(const ScpHelper&) = delete;

    void runTransfer(const TransferDescriptor& descr, RetryPolicy policy, AbortControl& abortCtrl);

    struct Config
    {
        std::string flags;
        bool gzip = false;
        BackoffSchedule backoff;
        bool failFast = false;
    };
    zen::Protected<Config> config_;

    TransferCallback* const callback_;
    ConnectionManager connMgr_;
};


bool isPermanentScpError(const zen::FileError& e);
}

#endif //SCP_HELPER_H_0283745029384756
