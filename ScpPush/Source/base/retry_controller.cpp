// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "retry_controller.h"

using namespace zen;
using namespace scpush;


std::chrono::milliseconds BackoffSchedule::getDelay(size_t retryNumber) const
{
    if (retryNumber == 0)
        return std::chrono::milliseconds(0);

    if (retryNumber <= linearRetriesMax)
        return unit * static_cast<int64_t>(retryNumber);

    return ceiling;
}


RetryController::RetryController(const RetryPolicy& policy, AbortControl& abortCtrl, TransferCallback* callback) :
    policy_(policy),
    abortCtrl_(abortCtrl),
    callback_(callback)
{
    if (policy_.mode == RetryMode::bounded && policy_.maxAttempts == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


void RetryController::run(const std::function<void()>& attempt) //throw FileError, ErrorRetryExhausted, ErrorTimeout, CancelTransfer
{
    assert(state_ == RetryState::idle);
    ZEN_ON_SCOPE_FAIL(state_ = RetryState::failed);

    std::chrono::milliseconds delay(0);

    for (size_t retryNumber = 0;; ++retryNumber)
    {
        if (delay > std::chrono::milliseconds(0))
        {
            state_ = RetryState::waiting;
            abortCtrl_.sleepFor(delay); //throw CancelTransfer, ErrorTimeout
        }
        abortCtrl_.checkpoint(); //throw CancelTransfer, ErrorTimeout

        state_ = RetryState::attempting;
        ++attemptCount_;
        try
        {
            attempt(); //throw FileError, CancelTransfer
            state_ = RetryState::done;
            return;
        }
        catch (ErrorTimeout&) { throw; } //deadline is final
        catch (const FileError& e)
        {
            if (policy_.mode == RetryMode::single)
                throw;

            if (policy_.isPermanentError && policy_.isPermanentError(e))
            {
                if (callback_)
                    callback_->logMessage(_("Error is not recoverable, retry skipped."), TransferCallback::MsgType::warning);
                throw;
            }

            if (policy_.mode == RetryMode::bounded && attemptCount_ >= policy_.maxAttempts)
                throw ErrorRetryExhausted(std::current_exception(), e.toString(), attemptCount_);

            delay = policy_.backoff.getDelay(retryNumber + 1);

            if (callback_)
                callback_->reportRetry({e.toString(), std::chrono::steady_clock::now(), retryNumber + 1}, delay);
        }
    }
}
