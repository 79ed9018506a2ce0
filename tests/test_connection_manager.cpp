// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "../ScpPush/Source/scp/connection_manager.h"
#include "fake_transport.h"

using namespace zen;
using namespace scpush;
using namespace scpush::test;


TEST(ConnectionManager, NullDialer)
{
    EXPECT_THROW(ConnectionManager connMgr(nullptr, nullptr), std::logic_error);
}


TEST(ConnectionManager, LazyDialAndReuse)
{
    auto server = std::make_shared<FakeServer>();
    ConnectionManager connMgr(std::make_unique<FakeDialer>(server), nullptr);

    EXPECT_FALSE(connMgr.hasConnection());
    EXPECT_EQ(server->getDialCount(), 0u);

    EXPECT_TRUE(connMgr.acquireSession() != nullptr);
    EXPECT_TRUE(connMgr.acquireSession() != nullptr);
    EXPECT_TRUE(connMgr.acquireSession() != nullptr);

    EXPECT_TRUE(connMgr.hasConnection());
    EXPECT_EQ(server->getDialCount(), 1u);
    EXPECT_EQ(server->getSessionCount(), 3u);
}


TEST(ConnectionManager, RedialOnceAfterSessionFailure)
{
    auto server = std::make_shared<FakeServer>();
    server->onOpenSession = [](size_t sessionNo)
    {
        if (sessionNo == 2)
            throw SysError(L"channel open failure");
    };
    RecordingCallback callback;
    ConnectionManager connMgr(std::make_unique<FakeDialer>(server), &callback);

    EXPECT_TRUE(connMgr.acquireSession() != nullptr); //session 1
    EXPECT_TRUE(connMgr.acquireSession() != nullptr); //session 2 fails => redial => session 3

    EXPECT_EQ(server->getDialCount(), 2u);
    EXPECT_EQ(server->getSessionCount(), 3u);
    EXPECT_TRUE(connMgr.hasConnection());
    EXPECT_EQ(callback.countMessages(TransferCallback::MsgType::warning), 1u);
}


TEST(ConnectionManager, SecondSessionFailureDropsConnection)
{
    auto server = std::make_shared<FakeServer>();
    server->onOpenSession = [](size_t sessionNo)
    {
        if (sessionNo <= 2)
            throw SysError(L"channel open failure");
    };
    ConnectionManager connMgr(std::make_unique<FakeDialer>(server), nullptr);

    EXPECT_THROW(connMgr.acquireSession(), ErrorSession);
    EXPECT_EQ(server->getDialCount(), 2u);
    EXPECT_FALSE(connMgr.hasConnection());

    //next request starts from scratch
    EXPECT_TRUE(connMgr.acquireSession() != nullptr);
    EXPECT_EQ(server->getDialCount(), 3u);
    EXPECT_TRUE(connMgr.hasConnection());
}


TEST(ConnectionManager, DialFailure)
{
    auto server = std::make_shared<FakeServer>();
    server->onDial = [](size_t dialNo)
    {
        if (dialNo == 1)
            throw SysError(L"connection refused");
    };
    ConnectionManager connMgr(std::make_unique<FakeDialer>(server), nullptr);

    try
    {
        connMgr.acquireSession();
        FAIL() << "ErrorDial expected";
    }
    catch (const ErrorAuthentication&) { FAIL() << "ErrorDial expected"; }
    catch (const ErrorDial& e)
    {
        EXPECT_NE(e.toString().find(L"tester@fake-host"),   std::wstring::npos);
        EXPECT_NE(e.toString().find(L"connection refused"), std::wstring::npos);
    }
    EXPECT_FALSE(connMgr.hasConnection());

    EXPECT_TRUE(connMgr.acquireSession() != nullptr);
    EXPECT_EQ(server->getDialCount(), 2u);
}


TEST(ConnectionManager, AuthenticationFailure)
{
    auto server = std::make_shared<FakeServer>();
    server->onDial = [](size_t) { throw SysErrorAuthentication(L"password rejected"); };
    ConnectionManager connMgr(std::make_unique<FakeDialer>(server), nullptr);

    EXPECT_THROW(connMgr.acquireSession(), ErrorAuthentication);
    EXPECT_FALSE(connMgr.hasConnection());
}


TEST(ConnectionManager, RedialFailure)
{
    auto server = std::make_shared<FakeServer>();
    server->onDial = [](size_t dialNo)
    {
        if (dialNo == 2)
            throw SysError(L"host unreachable");
    };
    server->onOpenSession = [](size_t sessionNo)
    {
        if (sessionNo == 1)
            throw SysError(L"channel open failure");
    };
    ConnectionManager connMgr(std::make_unique<FakeDialer>(server), nullptr);

    EXPECT_THROW(connMgr.acquireSession(), ErrorDial);
    EXPECT_FALSE(connMgr.hasConnection());
}
