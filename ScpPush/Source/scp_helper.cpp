// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "scp_helper.h"
#include "scp/gzip_adapter.h"
#include "scp/scp_protocol.h"

using namespace zen;
using namespace scpush;


bool scpush::isPermanentScpError(const FileError& e)
{
    return dynamic_cast<const ErrorAuthentication*>(&e) ||
           dynamic_cast<const ErrorSourceFile*>(&e);
}


ScpHelper::ScpHelper(std::unique_ptr<ScpDialer>&& dialer, TransferCallback* callback) :
    callback_(callback),
    connMgr_(std::move(dialer), callback) {}


void ScpHelper::setLimitKB(int limitKBs)
{
    config_.access([&](Config& cfg) { cfg.flags = formatRateLimitFlags(limitKBs); });
}


void ScpHelper::setGzipEnable(bool enable)
{
    config_.access([&](Config& cfg) { cfg.gzip = enable; });
}


void ScpHelper::setBackoffSchedule(const BackoffSchedule& backoff)
{
    config_.access([&](Config& cfg) { cfg.backoff = backoff; });
}


void ScpHelper::setFailFast(bool failFast)
{
    config_.access([&](Config& cfg) { cfg.failFast = failFast; });
}


void ScpHelper::runTransfer(const TransferDescriptor& descr, RetryPolicy policy, AbortControl& abortCtrl)
{
    const Config cfg = config_.access([](const Config& c) { return c; }); //snapshot: settings may change during a transfer

    policy.backoff = cfg.backoff;
    if (cfg.failFast)
        policy.isPermanentError = isPermanentScpError;

    std::optional<TransferDescriptor> gzipDescr; //compress at most once per transfer

    RetryController(policy, abortCtrl, callback_).run([&]
    {
        const TransferDescriptor* attemptDescr = &descr;
        if (cfg.gzip)
        {
            if (!gzipDescr)
                gzipDescr = makeGzipDescriptor(descr); //throw ErrorTransferIo, ErrorSourceFile
            attemptDescr = &*gzipDescr;
        }

        executeTransfer(connMgr_, *attemptDescr, cfg.flags, abortCtrl); //throw FileError, CancelTransfer

        if (callback_)
            callback_->logMessage(replaceCpy(replaceCpy(_("Copied %x to %y."), L"%x", fmtPath(attemptDescr->fileName)),
                                             L"%y", fmtPath(connMgr_.getDisplayName() + L':' + utfTo<std::wstring>(attemptDescr->destinationDir))),
                                  TransferCallback::MsgType::info);
    }); //throw FileError, ErrorRetryExhausted, CancelTransfer
}


void ScpHelper::copy(const SourceFactory& openSource, uint64_t size, const Zstring& remotePath, AbortControl& abortCtrl)
{
    runTransfer(makeStreamDescriptor(openSource, size, remotePath), RetryPolicy::single(), abortCtrl);
}


void ScpHelper::copyPath(const Zstring& localFilePath, const Zstring& remotePath, AbortControl& abortCtrl)
{
    runTransfer(makeFileDescriptor(localFilePath, remotePath), RetryPolicy::single(), abortCtrl); //throw ErrorSourceFile, ErrorTransferIo
}


void ScpHelper::tryCopy(const SourceFactory& openSource, uint64_t size, const Zstring& remotePath, size_t attempts, AbortControl& abortCtrl)
{
    runTransfer(makeStreamDescriptor(openSource, size, remotePath), RetryPolicy::bounded(attempts), abortCtrl);
}


void ScpHelper::tryCopyPath(const Zstring& localFilePath, const Zstring& remotePath, size_t attempts, AbortControl& abortCtrl)
{
    runTransfer(makeFileDescriptor(localFilePath, remotePath), RetryPolicy::bounded(attempts), abortCtrl); //throw ErrorSourceFile, ErrorTransferIo
}


void ScpHelper::mustCopy(const SourceFactory& openSource, uint64_t size, const Zstring& remotePath, AbortControl& abortCtrl)
{
    runTransfer(makeStreamDescriptor(openSource, size, remotePath), RetryPolicy::unbounded(), abortCtrl);
}


void ScpHelper::mustCopyPath(const Zstring& localFilePath, const Zstring& remotePath, AbortControl& abortCtrl)
{
    runTransfer(makeFileDescriptor(localFilePath, remotePath), RetryPolicy::unbounded(), abortCtrl); //throw ErrorSourceFile, ErrorTransferIo
}
