// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ABORT_CONTROL_H_9082374589023457
#define ABORT_CONTROL_H_9082374589023457

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include "scp_error.h"


namespace scpush
{
//cancel flag + optional deadline shared by all threads of a transfer
class AbortControl
{
public:
    AbortControl() {}
    explicit AbortControl(std::chrono::steady_clock::time_point deadline) : deadline_(deadline) {}
    explicit AbortControl(std::chrono::steady_clock::duration timeout); //deadline = now + timeout

    //context of any thread (e.g. signal watcher)
    void requestCancel();
    bool cancelRequested() const { return cancelRequested_; }

    const std::optional<std::chrono::steady_clock::time_point>& getDeadline() const { return deadline_; }

    void checkpoint() const; //throw CancelTransfer, ErrorTimeout

    //wake up early on cancel; never sleep past the deadline
    void sleepFor(std::chrono::milliseconds delay); //throw CancelTransfer, ErrorTimeout

private:
    AbortControl           (const AbortControl&) = delete;
    AbortControl& operator=(const AbortControl&) = delete;

    std::atomic<bool> cancelRequested_{false};
    const std::optional<std::chrono::steady_clock::time_point> deadline_;
    const std::chrono::steady_clock::time_point startTime_ = std::chrono::steady_clock::now();

    std::mutex lockSleep_;
    std::condition_variable conditionCancel_;
};
}

#endif //ABORT_CONTROL_H_9082374589023457
