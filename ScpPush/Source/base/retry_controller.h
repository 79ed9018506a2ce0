// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef RETRY_CONTROLLER_H_1287340985723465
#define RETRY_CONTROLLER_H_1287340985723465

#include <functional>
#include "abort_control.h"
#include "process_callback.h"


namespace scpush
{
//delay before the next attempt, given the number of failed attempts so far:
//  0 failures: none, 1..linearRetriesMax: failures * unit, afterwards: ceiling
struct BackoffSchedule
{
    std::chrono::milliseconds unit    = std::chrono::seconds(1);
    std::chrono::milliseconds ceiling = std::chrono::minutes(1);
    size_t linearRetriesMax = 10;

    std::chrono::milliseconds getDelay(size_t retryNumber) const;
};


enum class RetryMode
{
    single,    //one attempt, error is passed through unchanged
    bounded,   //at most "maxAttempts", then ErrorRetryExhausted
    unbounded, //until success, cancel or deadline
};


struct RetryPolicy
{
    RetryMode mode = RetryMode::single;
    size_t maxAttempts = 1; //bounded only
    BackoffSchedule backoff;
    std::function<bool(const zen::FileError& e)> isPermanentError; //optional: don't retry these

    static RetryPolicy single   ()                   { return {RetryMode::single, 1}; }
    static RetryPolicy bounded  (size_t maxAttempts) { return {RetryMode::bounded, maxAttempts}; }
    static RetryPolicy unbounded()                   { return {RetryMode::unbounded, 0}; }
};


enum class RetryState
{
    idle,
    waiting,
    attempting,
    done,
    failed,
};


//run an attempt until it succeeds or the policy gives up; attempts are strictly sequential
class RetryController
{
public:
    RetryController(const RetryPolicy& policy, AbortControl& abortCtrl, TransferCallback* callback /*optional*/); //throw std::logic_error

    void run(const std::function<void()>& attempt /*throw FileError, CancelTransfer*/); //throw FileError, ErrorRetryExhausted, ErrorTimeout, CancelTransfer

    RetryState getState() const { return state_; }
    size_t getAttemptCount() const { return attemptCount_; }

private:
    RetryController           (const RetryController&) = delete;
    RetryController& operator=(const RetryController&) = delete;

    const RetryPolicy policy_;
    AbortControl& abortCtrl_;
    TransferCallback* const callback_;

    RetryState state_ = RetryState::idle;
    size_t attemptCount_ = 0;
};
}

#endif //RETRY_CONTROLLER_H_1287340985723465
