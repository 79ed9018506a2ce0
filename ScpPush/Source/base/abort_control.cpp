// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "abort_control.h"

using namespace zen;
using namespace scpush;


AbortControl::AbortControl(std::chrono::steady_clock::duration timeout) :
    deadline_(std::chrono::steady_clock::now() + timeout) {}


void AbortControl::requestCancel()
{
    cancelRequested_ = true;
    {
        std::lock_guard dummy(lockSleep_); //make sure the following signal is not lost!
    }
    conditionCancel_.notify_all();
}


void AbortControl::checkpoint() const //throw CancelTransfer, ErrorTimeout
{
    if (cancelRequested_)
        throw CancelTransfer();

    if (deadline_ && std::chrono::steady_clock::now() >= *deadline_)
    {
        const auto timeoutSec = std::chrono::ceil<std::chrono::seconds>(*deadline_ - startTime_).count();
        throw ErrorTimeout(_P("Operation timed out after 1 second.", "Operation timed out after %x seconds.", timeoutSec));
    }
}


void AbortControl::sleepFor(std::chrono::milliseconds delay) //throw CancelTransfer, ErrorTimeout
{
    auto wakeUpTime = std::chrono::steady_clock::now() + delay;
    if (deadline_ && *deadline_ < wakeUpTime)
        wakeUpTime = *deadline_;

    {
        std::unique_lock dummy(lockSleep_);
        conditionCancel_.wait_until(dummy, wakeUpTime, [this] { return static_cast<bool>(cancelRequested_); });
    }
    checkpoint(); //throw CancelTransfer, ErrorTimeout
}
