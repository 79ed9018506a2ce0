// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ssh_session.h"
#include <condition_variable>
#include <zen/file_error.h>
#include <zen/open_ssl.h>
#include <zen/socket.h>
#include <zen/thread.h>
#include "init_libssh2.h"
#include "scp_protocol.h"
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2.h> directly!

using namespace zen;
using namespace scpush;


namespace
{
//wait for socket traffic in short slices: the other thread of the transfer may need the session lock, abort checks must run regularly
constexpr std::chrono::milliseconds SSH_TRAFFIC_WAIT_SLICE(100);

const size_t SSH_CHANNEL_BLOCK_SIZE = 32 * 1024; //libssh2 sends at most 32 kB per channel packet


bool isChannelError(int sshStatusCode) //connection is still fine
{
    switch (sshStatusCode)
    {
        case LIBSSH2_ERROR_CHANNEL_OUTOFORDER:
        case LIBSSH2_ERROR_CHANNEL_FAILURE:
        case LIBSSH2_ERROR_CHANNEL_REQUEST_DENIED:
        case LIBSSH2_ERROR_CHANNEL_UNKNOWN:
        case LIBSSH2_ERROR_CHANNEL_CLOSED:
        case LIBSSH2_ERROR_CHANNEL_EOF_SENT:
        case LIBSSH2_ERROR_REQUEST_DENIED:
            return true;
    }
    return false;
}


class SshConnection : public ScpConnection, public std::enable_shared_from_this<SshConnection>
{
public:
    explicit SshConnection(const ScpLogin& login) : //throw SysError, SysErrorAuthentication
        login_(login)
    {
        ZEN_ON_SCOPE_FAIL(cleanup()); //destructor call would lead to member double clean-up!!!

        socket_.emplace(login_.server, numberTo<Zstring>(login_.port), login_.timeoutSec); //throw SysError

        sshSession_ = ::libssh2_session_init();
        if (!sshSession_) //does not set ssh last error; source: only memory allocation may fail
            throw SysError(formatSystemError("libssh2_session_init", formatSshStatusCode(LIBSSH2_ERROR_ALLOC), L""));

        if (login_.allowZlib)
            if (const int rc = ::libssh2_session_flag(sshSession_, LIBSSH2_FLAG_COMPRESS, 1);
                rc != 0) //does not set SSH last error
                throw SysError(formatSystemError("libssh2_session_flag", formatSshStatusCode(rc), L""));

        //blocking during handshake and authentication: switch to non-blocking only once two threads share the session
        ::libssh2_session_set_blocking(sshSession_, 1);
        ::libssh2_session_set_timeout(sshSession_, login_.timeoutSec * 1000 /*ms*/);

        if (::libssh2_session_handshake(sshSession_, socket_->get()) != 0)
            throw SysError(formatLastSshError("libssh2_session_handshake"));

        verifyHostKey(); //throw SysError, SysErrorAuthentication
        authenticate();  //throw SysError, SysErrorAuthentication

        ::libssh2_session_set_blocking(sshSession_, 0);
    }

    ~SshConnection() { cleanup(); }

    std::unique_ptr<ScpSession> openSession() override; //throw SysError

    //return "std::nullopt" if pending
    std::optional<int> tryNonBlocking(std::chrono::steady_clock::time_point commandStartTime, const char* functionName,
                                      const std::function<int(LIBSSH2_SESSION* sshSession)>& sshCommand /*noexcept!*/) //throw SysError
    {
        std::lock_guard dummy(lockSession_); //libssh2 session is not thread-safe!

        const int rc = sshCommand(sshSession_); //noexcept

        assert(rc >= 0 || ::libssh2_session_last_errno(sshSession_) == rc);
        if (rc < 0 && ::libssh2_session_last_errno(sshSession_) != rc) //when libssh2 fails to properly set last error; e.g. https://github.com/libssh2/libssh2/pull/123
            ::libssh2_session_set_last_error(sshSession_, rc, nullptr);

        if (rc >= LIBSSH2_ERROR_NONE)
            return rc;

        if (rc == LIBSSH2_ERROR_EAGAIN)
        {
            if (std::chrono::steady_clock::now() > commandStartTime + std::chrono::seconds(login_.timeoutSec))
            {
                possiblyCorrupted_ = true; //the server will still answer the timed-out command
                throw SysError(formatSystemError(functionName, formatSshStatusCode(LIBSSH2_ERROR_TIMEOUT),
                                                 _P("Operation timed out after 1 second.", "Operation timed out after %x seconds.", login_.timeoutSec)));
            }
            return std::nullopt;
        }

        if (!isChannelError(rc)) //e.g. LIBSSH2_ERROR_SOCKET_RECV
            possiblyCorrupted_ = true;
        throw SysError(formatLastSshError(functionName));
    }

    unsigned long getWriteWindow(LIBSSH2_CHANNEL* channel)
    {
        std::lock_guard dummy(lockSession_);
        return ::libssh2_channel_window_write(channel);
    }

    //"KILL", "TERM", ... empty if the remote process was not killed by a signal
    std::string getExitSignal(LIBSSH2_CHANNEL* channel)
    {
        std::lock_guard dummy(lockSession_);

        char* exitSignal = nullptr;
        size_t exitSignalLen = 0;
        ::libssh2_channel_get_exit_signal(channel, &exitSignal, &exitSignalLen, nullptr, nullptr, nullptr, nullptr); //fails only if out of memory => no signal name
        if (!exitSignal)
            return {};
        ZEN_ON_SCOPE_EXIT(::libssh2_free(sshSession_, exitSignal));

        return std::string(exitSignal, exitSignalLen);
    }

    //returns when traffic is available or after a short time slice: both cases are handled by next tryNonBlocking() call
    void waitForTraffic() //throw SysError
    {
        //reference: session.c: _libssh2_wait_socket()
        int dir = 0;
        {
            std::lock_guard dummy(lockSession_);
            dir = ::libssh2_session_block_directions(sshSession_);
        }
        //dir == 0: the other thread consumed the traffic we were waiting for => check again soon
        waitForSocket(socket_->get(),
                      dir == 0 || (dir & LIBSSH2_SESSION_BLOCK_INBOUND),
                      dir & LIBSSH2_SESSION_BLOCK_OUTBOUND,
                      SSH_TRAFFIC_WAIT_SLICE); //throw SysError
    }

    //blocking call in non-blocking mode: each call gets "timeoutSec" to complete
    int runNonBlocking(const char* functionName, const std::function<int(LIBSSH2_SESSION* sshSession)>& sshCommand /*noexcept!*/,
                       const AbortCheck& checkAbort) //throw SysError, X
    {
        const auto commandStartTime = std::chrono::steady_clock::now();
        for (;;)
        {
            if (const std::optional<int> rc = tryNonBlocking(commandStartTime, functionName, sshCommand)) //throw SysError
                return *rc;

            if (checkAbort)
                checkAbort(); //throw X
            waitForTraffic(); //throw SysError
        }
    }

private:
    SshConnection           (const SshConnection&) = delete;
    SshConnection& operator=(const SshConnection&) = delete;

    void verifyHostKey() //throw SysError, SysErrorAuthentication
    {
        if (login_.hostKeySha256.empty())
            return;

        const char* hostKeyHash = ::libssh2_hostkey_hash(sshSession_, LIBSSH2_HOSTKEY_HASH_SHA256);
        if (!hostKeyHash)
            throw SysError(formatLastSshError("libssh2_hostkey_hash"));

        const std::string fingerprint = formatSshHostKeyFingerprint(std::string_view(hostKeyHash, 32 /*SHA256 digest length*/)); //throw SysError

        std::string expected = trimCpy(login_.hostKeySha256);
        if (!startsWith(expected, "SHA256:"))
            expected = "SHA256:" + expected;

        while (endsWith(expected, '=')) //OpenSSH omits base64 padding
            expected.pop_back();

        if (fingerprint != expected)
            throw SysErrorAuthentication(replaceCpy(replaceCpy(_("Host key verification failed: expected fingerprint %x, server sent %y."),
                                                               L"%x", utfTo<std::wstring>(expected)),
                                                    L"%y", utfTo<std::wstring>(fingerprint)));
    }

    void authenticate() //throw SysError, SysErrorAuthentication
    {
        const auto usernameUtf8 = utfTo<std::string>(login_.username);
        const auto passwordUtf8 = utfTo<std::string>(login_.password);

        const char* authList = ::libssh2_userauth_list(sshSession_, usernameUtf8);
        if (!authList)
        {
            if (::libssh2_userauth_authenticated(sshSession_) != 1)
                throw SysError(formatLastSshError("libssh2_userauth_list"));
            return; //SSH_USERAUTH_NONE has authenticated successfully => we're already done
        }

        bool supportAuthPassword    = false;
        bool supportAuthKeyfile     = false;
        bool supportAuthInteractive = false;
        split(authList, ',', [&](std::string_view authMethod)
        {
            authMethod = trimCpy(authMethod);
            if (!authMethod.empty())
            {
                if (authMethod == "password")
                    supportAuthPassword = true;
                else if (authMethod == "publickey")
                    supportAuthKeyfile = true;
                else if (authMethod == "keyboard-interactive")
                    supportAuthInteractive = true;
            }
        });

        if (!login_.privateKey.empty())
        {
            if (!supportAuthKeyfile)
                throw SysErrorAuthentication(replaceCpy(_("The server does not support authentication via %x."), L"%x", L"\"key file\"") +
                                             L'\n' + _("Required:") + L' ' + utfTo<std::wstring>(authList));

            const std::string pkStream = trimCpy(login_.privateKey);

            if (::libssh2_userauth_publickey_frommemory(sshSession_, usernameUtf8, pkStream, utfTo<std::string>(login_.passphrase)) != 0)
            {
                //libssh2_userauth_publickey_frommemory()'s "Unable to extract public key from private key" isn't exactly *helpful*
                //=> detect public keys passed by mistake:
                const std::string_view firstLine(pkStream.data(), std::find_if(pkStream.begin(), pkStream.end(), isLineBreak<char>) - pkStream.begin());
                if (contains(firstLine, "PUBLIC KEY") ||
                    startsWith(pkStream, "ssh-") || //ssh-rsa, ssh-ed25519
                    startsWith(pkStream, "ecdsa-"))
                    throw SysErrorAuthentication(_("Authentication failed.") + L' ' + L"Private key expected, but found OpenSSH public key.");

                //can't rely on LIBSSH2_ERROR_AUTHENTICATION_FAILED: https://github.com/libssh2/libssh2/pull/789
                throw SysErrorAuthentication(formatLastSshError("libssh2_userauth_publickey_frommemory"));
            }
        }
        else if (supportAuthPassword)
        {
            if (::libssh2_userauth_password(sshSession_, usernameUtf8, passwordUtf8) != 0)
                throw SysErrorAuthentication(formatLastSshError("libssh2_userauth_password"));
        }
        else if (supportAuthInteractive) //some servers support "keyboard-interactive", but not "password"
        {
            std::wstring unexpectedPrompts;

            auto authCallback = [&](int num_prompts, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses)
            {
                //assume password request for a single prompt without echo: prompt text may be localized!
                if (num_prompts == 1 && prompts[0].echo == 0)
                {
                    responses[0].text = //pass ownership; will be ::free()d
                        ::strdup(passwordUtf8.c_str());
                    responses[0].length = static_cast<unsigned int>(passwordUtf8.size());
                }
                else
                    for (int i = 0; i < num_prompts; ++i)
                        unexpectedPrompts += (unexpectedPrompts.empty() ? L"" : L"|") +
                                             utfTo<std::wstring>(std::string_view(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length));
            };
            using AuthCbType = decltype(authCallback);

            auto authCallbackWrapper = [](const char* name, int name_len, const char* instruction, int instruction_len,
                                          int num_prompts, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses, void** abstract)
            {
                AuthCbType* callback = *reinterpret_cast<AuthCbType**>(abstract); //redirect the C-API callback to a proper lambda
                (*callback)(num_prompts, prompts, responses); //noexcept
            };

            if (*::libssh2_session_abstract(sshSession_))
                throw SysError(L"libssh2_session_abstract: non-null value");

            *reinterpret_cast<AuthCbType**>(::libssh2_session_abstract(sshSession_)) = &authCallback;
            ZEN_ON_SCOPE_EXIT(*::libssh2_session_abstract(sshSession_) = nullptr);

            if (::libssh2_userauth_keyboard_interactive(sshSession_, usernameUtf8, authCallbackWrapper) != 0)
                throw SysErrorAuthentication(formatLastSshError("libssh2_userauth_keyboard_interactive") +
                                             (unexpectedPrompts.empty() ? L"" : L"\nUnexpected prompts: " + unexpectedPrompts));
        }
        else
            throw SysErrorAuthentication(replaceCpy(_("The server does not support authentication via %x."), L"%x", L"\"username/password\"") +
                                         L'\n' + _("Required:") + L' ' + utfTo<std::wstring>(authList));
    }

    void cleanup() //attention: may block heavily after error!
    {
        if (sshSession_)
        {
            if (!possiblyCorrupted_)
            {
                ::libssh2_session_set_blocking(sshSession_, 1);
                if (const int rc = ::libssh2_session_disconnect(sshSession_, "scp_push says \"bye\"!"); //= server notification only! no local cleanup apparently
                    rc != LIBSSH2_ERROR_NONE)
                    logExtraError(formatSystemError("libssh2_session_disconnect", formatSshStatusCode(rc), L""));
            }
            //else: avoid further stress on the broken SSH session and take French leave

            if (const int rc = ::libssh2_session_free(sshSession_);
                rc != LIBSSH2_ERROR_NONE)
                logExtraError(formatSystemError("libssh2_session_free", formatSshStatusCode(rc), L""));
        }
    }

    std::wstring formatLastSshError(const char* functionName) const
    {
        char* lastErrorMsg = nullptr; //owned by "sshSession"
        const int sshStatusCode = ::libssh2_session_last_error(sshSession_, &lastErrorMsg, nullptr, false /*want_buf*/);
        assert(lastErrorMsg);

        std::wstring errorMsg;
        if (lastErrorMsg)
            errorMsg = trimCpy(utfTo<std::wstring>(lastErrorMsg));

        return formatSystemError(functionName, formatSshStatusCode(sshStatusCode), errorMsg);
    }

    const ScpLogin login_;
    const std::shared_ptr<Libssh2InitCookie> libsshInitCookie_{getLibssh2InitCookie()}; //throw SysError; *before* any libssh2 call!

    std::mutex lockSession_; //serialize all libssh2 calls on this session
    std::optional<Socket> socket_; //*bound* after constructor has run
    LIBSSH2_SESSION* sshSession_ = nullptr;
    bool possiblyCorrupted_ = false; //protected by lockSession_ (after constructor)
};

//===========================================================================================================================

//"exec" channel of a single command: stdin is fed by the writer thread while run() drains stdout/stderr
class SshExecSession : public ScpSession
{
public:
    SshExecSession(const std::shared_ptr<SshConnection>& connection, LIBSSH2_CHANNEL* channel) :
        connection_(connection), channel_(channel) {}

    ~SshExecSession()
    {
        try { close(); } //throw SysError
        catch (const SysError& e) { logExtraError(_("Cannot close SSH channel.") + L"\n\n" + e.toString()); }
    }

    size_t getBlockSize() const override { return SSH_CHANNEL_BLOCK_SIZE; }

    size_t tryWrite(const void* buffer, size_t bytesToWrite, const AbortCheck& checkAbort) override //throw SysError, X
    {
        if (bytesToWrite == 0)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
        bytesToWrite = std::min(bytesToWrite, SSH_CHANNEL_BLOCK_SIZE);

        if (waitUntilExecFinished(checkAbort) != ExecState::started) //throw X
            throw SysError(formatSystemError("libssh2_channel_write", L"", L"Remote command was not started."));

        auto commandStartTime = std::chrono::steady_clock::now();
        for (;;)
        {
            if (remoteEof_) //remote process stopped reading: don't wait for a window that never opens
                throw SysError(formatSystemError("libssh2_channel_write", formatSshStatusCode(LIBSSH2_ERROR_CHANNEL_CLOSED),
                                                 L"Remote process has closed its output."));

            const std::optional<int> rc = connection_->tryNonBlocking(commandStartTime, "libssh2_channel_write", [&](LIBSSH2_SESSION* sshSession)
            {
                return static_cast<int>(::libssh2_channel_write(channel_, static_cast<const char*>(buffer), bytesToWrite));
            }); //throw SysError
            if (rc && *rc > 0)
            {
                assert(static_cast<size_t>(*rc) <= bytesToWrite);
                return *rc;
            }

            //remote sink consumes slowly (e.g. "scp -l"): no time out while waiting for the window adjust of an open channel
            if (connection_->getWriteWindow(channel_) == 0)
                commandStartTime = std::chrono::steady_clock::now();

            interruptionPoint(); //throw ThreadStopRequest
            if (checkAbort)
                checkAbort(); //throw X
            connection_->waitForTraffic(); //throw SysError
        }
    }

    void closeInput(const AbortCheck& checkAbort) override //throw SysError, X
    {
        if (inputCloseRequested_.exchange(true))
            return;

        ZEN_ON_SCOPE_EXIT(
        {
            std::lock_guard dummy(lockExec_);
            inputFinished_ = true;
        }
        conditionExec_.notify_all());

        if (waitUntilExecFinished(checkAbort) != ExecState::started) //throw X
            return; //nobody is listening

        connection_->runNonBlocking("libssh2_channel_send_eof", [&](LIBSSH2_SESSION* sshSession)
        {
            return ::libssh2_channel_send_eof(channel_);
        }, checkAbort); //throw SysError, X
    }

    void run(const std::string& command, const AbortCheck& checkAbort) override //throw SysError, SysErrorRemoteCommand, X
    {
        {
            bool execStarted = false;
            ZEN_ON_SCOPE_EXIT(setExecState(execStarted ? ExecState::started : ExecState::failed));

            connection_->runNonBlocking("libssh2_channel_exec", [&](LIBSSH2_SESSION* sshSession)
            {
                return ::libssh2_channel_exec(channel_, command);
            }, checkAbort); //throw SysError, X
            execStarted = true;
        }

        //drain stdout (SCP acks) and stderr until remote EOF
        std::string ackStream;
        std::string errorStream;

        for (auto lastProgressTime = std::chrono::steady_clock::now();;)
        {
            if (!isInputFinished()) //no time out while our own input is still being sent
                lastProgressTime = std::chrono::steady_clock::now();

            const std::optional<int> rc = connection_->tryNonBlocking(lastProgressTime, "libssh2_channel_read", [&](LIBSSH2_SESSION* sshSession)
            {
                char buffer[4096];
                const ssize_t rcOut = ::libssh2_channel_read(channel_, buffer, sizeof(buffer));
                if (rcOut > 0)
                {
                    ackStream.append(buffer, rcOut);
                    return static_cast<int>(rcOut);
                }
                if (rcOut < 0 && rcOut != LIBSSH2_ERROR_EAGAIN)
                    return static_cast<int>(rcOut);

                const ssize_t rcErr = ::libssh2_channel_read_stderr(channel_, buffer, sizeof(buffer));
                if (rcErr > 0)
                {
                    errorStream.append(buffer, rcErr);
                    return static_cast<int>(rcErr);
                }
                if (rcErr < 0 && rcErr != LIBSSH2_ERROR_EAGAIN)
                    return static_cast<int>(rcErr);

                if (::libssh2_channel_eof(channel_) == 1)
                    return 0;
                return LIBSSH2_ERROR_EAGAIN;
            }); //throw SysError

            if (rc)
            {
                if (*rc == 0) //remote EOF
                    break;
                lastProgressTime = std::chrono::steady_clock::now();
                continue;
            }

            if (checkAbort)
                checkAbort(); //throw X
            connection_->waitForTraffic(); //throw SysError
        }
        remoteEof_ = true;

        //don't close the channel while the writer thread may still be using it
        waitUntil([this] { return inputFinished_; }, checkAbort); //throw X

        connection_->runNonBlocking("libssh2_channel_close", [&](LIBSSH2_SESSION* sshSession) { return ::libssh2_channel_close(channel_); }, checkAbort); //throw SysError, X
        connection_->runNonBlocking("libssh2_channel_wait_closed", [&](LIBSSH2_SESSION* sshSession) { return ::libssh2_channel_wait_closed(channel_); }, checkAbort); //

        const int exitStatus = connection_->runNonBlocking("libssh2_channel_get_exit_status", [&](LIBSSH2_SESSION* sshSession)
        {
            return ::libssh2_channel_get_exit_status(channel_); //0 if not (yet) received
        }, checkAbort); //throw SysError, X

        const std::string exitSignal = connection_->getExitSignal(channel_); //no exit status is sent in this case

        checkScpSinkExit(command, exitStatus, exitSignal, ackStream, errorStream); //throw SysErrorRemoteCommand
    }

    void close() override //throw SysError
    {
        if (!channel_)
            return;
        LIBSSH2_CHANNEL* channel = std::exchange(channel_, nullptr);

        connection_->runNonBlocking("libssh2_channel_free", [&](LIBSSH2_SESSION* sshSession)
        {
            return ::libssh2_channel_free(channel);
        }, nullptr /*checkAbort*/); //throw SysError
    }

private:
    SshExecSession           (const SshExecSession&) = delete;
    SshExecSession& operator=(const SshExecSession&) = delete;

    enum class ExecState
    {
        pending,
        started,
        failed,
    };

    void setExecState(ExecState state)
    {
        {
            std::lock_guard dummy(lockExec_);
            execState_ = state;
        }
        conditionExec_.notify_all();
    }

    bool isInputFinished()
    {
        std::lock_guard dummy(lockExec_);
        return inputFinished_;
    }

    template <class Predicate>
    void waitUntil(Predicate pred, const AbortCheck& checkAbort) //throw ThreadStopRequest, X
    {
        std::unique_lock dummy(lockExec_);
        while (!conditionExec_.wait_for(dummy, SSH_TRAFFIC_WAIT_SLICE, pred))
        {
            dummy.unlock();
            interruptionPoint(); //throw ThreadStopRequest
            if (checkAbort)
                checkAbort(); //throw X
            dummy.lock();
        }
    }

    ExecState waitUntilExecFinished(const AbortCheck& checkAbort) //throw ThreadStopRequest, X
    {
        waitUntil([this] { return execState_ != ExecState::pending; }, checkAbort); //throw ThreadStopRequest, X

        std::lock_guard dummy(lockExec_);
        return execState_;
    }

    const std::shared_ptr<SshConnection> connection_; //keep alive while the channel exists
    LIBSSH2_CHANNEL* channel_;

    std::mutex lockExec_;
    std::condition_variable conditionExec_;
    ExecState execState_ = ExecState::pending; //
    bool inputFinished_ = false;                //protected by lockExec_

    std::atomic<bool> inputCloseRequested_{false};
    std::atomic<bool> remoteEof_{false};
};


std::unique_ptr<ScpSession> SshConnection::openSession() //throw SysError
{
    {
        std::lock_guard dummy(lockSession_);
        if (possiblyCorrupted_)
            throw SysError(formatSystemError("libssh2_channel_open_session", L"", _("The SSH connection is no longer usable.")));
    }

    LIBSSH2_CHANNEL* channel = nullptr;
    runNonBlocking("libssh2_channel_open_session", [&](LIBSSH2_SESSION* sshSession)
    {
        channel = ::libssh2_channel_open_session(sshSession);
        if (!channel)
            return std::min(::libssh2_session_last_errno(sshSession), LIBSSH2_ERROR_SOCKET_NONE);
        //just in case libssh2 failed to properly set last error; e.g. https://github.com/libssh2/libssh2/pull/123
        return LIBSSH2_ERROR_NONE;
    }, nullptr /*checkAbort*/); //throw SysError

    return std::make_unique<SshExecSession>(shared_from_this(), channel);
}

//===========================================================================================================================

class SshDialer : public ScpDialer
{
public:
    explicit SshDialer(const ScpLogin& login) : login_(login) {}

    std::shared_ptr<ScpConnection> dial() override //throw SysError, SysErrorAuthentication
    {
        return std::make_shared<SshConnection>(login_); //throw SysError, SysErrorAuthentication
    }

    std::wstring getDisplayName() const override
    {
        Zstring displayName = login_.server;
        if (!login_.username.empty())
            displayName = login_.username + Zstr('@') + displayName;
        if (login_.port != DEFAULT_PORT_SSH)
            displayName += Zstr(':') + numberTo<Zstring>(login_.port);
        return utfTo<std::wstring>(displayName);
    }

private:
    const ScpLogin login_;
};
}


std::unique_ptr<ScpDialer> scpush::createSshDialer(const ScpLogin& login)
{
    return std::make_unique<SshDialer>(login);
}
