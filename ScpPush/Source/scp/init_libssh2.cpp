// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "init_libssh2.h"
#include <condition_variable>
#include <zen/open_ssl.h>
#include <zen/thread.h>
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2.h> directly!

using namespace zen;
using namespace scpush;


namespace
{
class ConnectionCounter
{
public:
    void inc() //throw SysError
    {
        {
            std::unique_lock dummy(lockCount_);
            assert(connectionCount_ >= 0);

            if (!newConnectionsAllowed_)
                throw SysError(formatSystemError("getLibssh2InitCookie", L"", L"Function call not allowed during init/shutdown."));

            ++connectionCount_;
        }
        conditionCountChanged_.notify_all();
    }

    void dec() //noexcept
    {
        {
            std::unique_lock dummy(lockCount_);
            assert(connectionCount_ >= 1);
            --connectionCount_;
        }
        conditionCountChanged_.notify_all();
    }

    void onInitCompleted() //noexcept
    {
        std::unique_lock dummy(lockCount_);
        newConnectionsAllowed_ = true;
    }

    void onBeforeTearDown() //noexcept
    {
        std::unique_lock dummy(lockCount_);
        newConnectionsAllowed_ = false;
        conditionCountChanged_.wait(dummy, [this] { return connectionCount_ == 0; });
    }

private:
    std::mutex              lockCount_;
    int                     connectionCount_ = 0;
    std::condition_variable conditionCountChanged_;

    bool newConnectionsAllowed_ = false;
};


ConnectionCounter& getConnectionCounter()
{
    static ConnectionCounter inst; //no dependencies on other globals => no static initialization order issues
    return inst;
}
}


class scpush::Libssh2InitCookie
{
public:
    Libssh2InitCookie() {}
    ~Libssh2InitCookie() { getConnectionCounter().dec(); }

private:
    Libssh2InitCookie           (const Libssh2InitCookie&) = delete;
    Libssh2InitCookie& operator=(const Libssh2InitCookie&) = delete;
};


std::shared_ptr<Libssh2InitCookie> scpush::getLibssh2InitCookie() //throw SysError
{
    getConnectionCounter().inc(); //throw SysError
    ZEN_ON_SCOPE_FAIL(getConnectionCounter().dec());

    //pass "ownership" of having to call ConnectionCounter::dec()
    return std::make_shared<Libssh2InitCookie>();
}


Libssh2Initializer::Libssh2Initializer()
{
    assert(runningOnMainThread());
    openSslInit();

    if (const int rc = ::libssh2_init(0); //includes OpenSSL-related initialization
        rc != 0)
        logExtraError(_("Error during process initialization.") + L"\n\n" + formatSystemError("libssh2_init", formatSshStatusCode(rc), L""));

    getConnectionCounter().onInitCompleted();
}


Libssh2Initializer::~Libssh2Initializer()
{
    //wait until all SSH connections owned by worker threads have ended! libssh2_exit() would pull the rug from under them
    getConnectionCounter().onBeforeTearDown();

    ::libssh2_exit();
    openSslTearDown();
}
