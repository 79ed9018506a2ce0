// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <thread>
#include <gtest/gtest.h>
#include "../ScpPush/Source/base/retry_controller.h"
#include "fake_transport.h"

using namespace zen;
using namespace scpush;
using namespace scpush::test;
using namespace std::chrono_literals;


namespace
{
const BackoffSchedule noBackoff{0ms, 0ms};

RetryPolicy withoutBackoff(RetryPolicy policy)
{
    policy.backoff = noBackoff;
    return policy;
}
}


TEST(BackoffSchedule, DefaultDelays)
{
    const BackoffSchedule backoff;
    EXPECT_EQ(backoff.getDelay(0),   0ms);
    EXPECT_EQ(backoff.getDelay(1),   1s);
    EXPECT_EQ(backoff.getDelay(2),   2s);
    EXPECT_EQ(backoff.getDelay(10), 10s);
    EXPECT_EQ(backoff.getDelay(11),  1min);
    EXPECT_EQ(backoff.getDelay(500), 1min);
}


TEST(RetryController, SinglePassesErrorThrough)
{
    AbortControl abortCtrl;
    RecordingCallback callback;
    RetryController ctrl(RetryPolicy::single(), abortCtrl, &callback);

    EXPECT_THROW(ctrl.run([] { throw ErrorDial(L"dial failed"); }), ErrorDial);
    EXPECT_EQ(ctrl.getAttemptCount(), 1u);
    EXPECT_EQ(ctrl.getState(), RetryState::failed);
    EXPECT_TRUE(callback.getRetries().empty());
}


TEST(RetryController, BoundedGivesUp)
{
    AbortControl abortCtrl;
    RecordingCallback callback;
    RetryController ctrl(withoutBackoff(RetryPolicy::bounded(3)), abortCtrl, &callback);

    size_t calls = 0;
    try
    {
        ctrl.run([&] { ++calls; throw ErrorTransferIo(L"pipe broken"); });
        FAIL() << "ErrorRetryExhausted expected";
    }
    catch (const ErrorRetryExhausted& e)
    {
        EXPECT_EQ(e.getAttemptCount(), 3u);
        EXPECT_NE(e.toString().find(L"pipe broken"), std::wstring::npos);
        EXPECT_THROW(std::rethrow_exception(e.getLastError()), ErrorTransferIo);
    }
    EXPECT_EQ(calls, 3u);
    EXPECT_EQ(ctrl.getState(), RetryState::failed);

    //reported only if another attempt follows
    const auto retries = callback.getRetries();
    ASSERT_EQ(retries.size(), 2u);
    EXPECT_EQ(retries[0].first, 1u);
    EXPECT_EQ(retries[1].first, 2u);
}


TEST(RetryController, BoundedRecovers)
{
    AbortControl abortCtrl;
    RetryController ctrl(withoutBackoff(RetryPolicy::bounded(5)), abortCtrl, nullptr);

    size_t calls = 0;
    ctrl.run([&]
    {
        if (++calls <= 2)
            throw ErrorSession(L"no session");
    });
    EXPECT_EQ(calls, 3u);
    EXPECT_EQ(ctrl.getAttemptCount(), 3u);
    EXPECT_EQ(ctrl.getState(), RetryState::done);
}


TEST(RetryController, BoundedZeroAttempts)
{
    AbortControl abortCtrl;
    EXPECT_THROW({ RetryController ctrl(RetryPolicy::bounded(0), abortCtrl, nullptr); }, std::logic_error);
}


TEST(RetryController, ReportedDelays)
{
    AbortControl abortCtrl;
    RecordingCallback callback;

    RetryPolicy policy = RetryPolicy::bounded(5);
    policy.backoff = {1ms, 5ms, 2};
    RetryController ctrl(policy, abortCtrl, &callback);

    EXPECT_THROW(ctrl.run([] { throw ErrorDial(L"unreachable"); }), ErrorRetryExhausted);

    const auto retries = callback.getRetries();
    ASSERT_EQ(retries.size(), 4u);
    EXPECT_EQ(retries[0].second, 1ms);
    EXPECT_EQ(retries[1].second, 2ms);
    EXPECT_EQ(retries[2].second, 5ms);
    EXPECT_EQ(retries[3].second, 5ms);
}


TEST(RetryController, CancelDuringBackoff)
{
    AbortControl abortCtrl;
    RetryPolicy policy = RetryPolicy::unbounded();
    policy.backoff = {10s, 10s};
    RetryController ctrl(policy, abortCtrl, nullptr);

    std::thread canceller([&]
    {
        std::this_thread::sleep_for(50ms);
        abortCtrl.requestCancel();
    });

    const auto startTime = std::chrono::steady_clock::now();
    EXPECT_THROW(ctrl.run([] { throw ErrorDial(L"unreachable"); }), CancelTransfer);
    canceller.join();

    EXPECT_LT(std::chrono::steady_clock::now() - startTime, 5s);
    EXPECT_EQ(ctrl.getAttemptCount(), 1u);
    EXPECT_EQ(ctrl.getState(), RetryState::failed);
}


TEST(RetryController, DeadlineDuringBackoff)
{
    AbortControl abortCtrl(std::chrono::steady_clock::duration(100ms));
    RetryPolicy policy = RetryPolicy::unbounded();
    policy.backoff = {10s, 10s};
    RetryController ctrl(policy, abortCtrl, nullptr);

    const auto startTime = std::chrono::steady_clock::now();
    EXPECT_THROW(ctrl.run([] { throw ErrorDial(L"unreachable"); }), ErrorTimeout);

    EXPECT_LT(std::chrono::steady_clock::now() - startTime, 5s);
    EXPECT_EQ(ctrl.getAttemptCount(), 1u);
}


TEST(RetryController, CancelBeforeFirstAttempt)
{
    AbortControl abortCtrl;
    abortCtrl.requestCancel();
    RetryController ctrl(RetryPolicy::unbounded(), abortCtrl, nullptr);

    bool called = false;
    EXPECT_THROW(ctrl.run([&] { called = true; }), CancelTransfer);
    EXPECT_FALSE(called);
    EXPECT_EQ(ctrl.getAttemptCount(), 0u);
}


TEST(RetryController, TimeoutIsNotRetried)
{
    AbortControl abortCtrl;
    RetryController ctrl(withoutBackoff(RetryPolicy::unbounded()), abortCtrl, nullptr);

    EXPECT_THROW(ctrl.run([] { throw ErrorTimeout(L"too slow"); }), ErrorTimeout);
    EXPECT_EQ(ctrl.getAttemptCount(), 1u);
}


TEST(RetryController, CancelFromAttempt)
{
    AbortControl abortCtrl;
    RetryController ctrl(withoutBackoff(RetryPolicy::bounded(4)), abortCtrl, nullptr);

    EXPECT_THROW(ctrl.run([] { throw CancelTransfer(); }), CancelTransfer);
    EXPECT_EQ(ctrl.getAttemptCount(), 1u);
}


TEST(RetryController, PermanentError)
{
    AbortControl abortCtrl;
    RecordingCallback callback;

    RetryPolicy policy = withoutBackoff(RetryPolicy::bounded(5));
    policy.isPermanentError = [](const FileError& e) { return dynamic_cast<const ErrorAuthentication*>(&e) != nullptr; };
    RetryController ctrl(policy, abortCtrl, &callback);

    EXPECT_THROW(ctrl.run([] { throw ErrorAuthentication(L"login failed", L"wrong password"); }), ErrorAuthentication);
    EXPECT_EQ(ctrl.getAttemptCount(), 1u);
    EXPECT_EQ(callback.countMessages(TransferCallback::MsgType::warning), 1u);
    EXPECT_TRUE(callback.getRetries().empty());
}


TEST(RetryController, UnboundedRecovers)
{
    AbortControl abortCtrl;
    RetryController ctrl(withoutBackoff(RetryPolicy::unbounded()), abortCtrl, nullptr);

    size_t calls = 0;
    ctrl.run([&]
    {
        if (++calls < 20)
            throw ErrorDial(L"unreachable");
    });
    EXPECT_EQ(calls, 20u);
    EXPECT_EQ(ctrl.getState(), RetryState::done);
}
