// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <algorithm>
#include <iostream>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <zen/error_log.h>
#include <zen/extra_log.h>
#include <zen/file_io.h>
#include <zen/thread.h>
#include "scp/init_libssh2.h"
#include "scp/ssh_session.h"
#include "return_codes.h"
#include "scp_helper.h"

using namespace zen;
using namespace scpush;


namespace
{
const wchar_t TAB_SPACE[] = L"    ";


void showSyntaxHelp()
{
    std::cout << utfTo<std::string>(_("Syntax:") + L"\n\n" +
                                    L"scp_push [" + _("options") + L"] <" + _("local file") + L"> <[user@]host[:port]:" + _("remote path") + L">\n\n" +
                                    TAB_SPACE + L"-i, --identity <" + _("key file") + L">\n" +
                                    TAB_SPACE + TAB_SPACE + _("Private key file: takes precedence over password.") + L'\n' +
                                    TAB_SPACE + L"--passphrase-env <VAR>\n" +
                                    TAB_SPACE + TAB_SPACE + _("Environment variable holding the key passphrase.") + L'\n' +
                                    TAB_SPACE + L"--password <" + _("password") + L">\n" +
                                    TAB_SPACE + TAB_SPACE + _("Password (default: environment variable SCP_PUSH_PASSWORD).") + L'\n' +
                                    TAB_SPACE + L"-l, --limit <KB/s>\n" +
                                    TAB_SPACE + TAB_SPACE + _("Bandwidth limit.") + L'\n' +
                                    TAB_SPACE + L"-z, --gzip\n" +
                                    TAB_SPACE + TAB_SPACE + _("Compress payload, remote file name gets \".gz\" extension.") + L'\n' +
                                    TAB_SPACE + L"-r, --retries <n>\n" +
                                    TAB_SPACE + TAB_SPACE + _("Number of attempts; 0 retries until success.") + L'\n' +
                                    TAB_SPACE + L"--timeout <" + _("seconds") + L">\n" +
                                    TAB_SPACE + TAB_SPACE + _("Deadline for the whole operation.") + L'\n' +
                                    TAB_SPACE + L"--connect-timeout <" + _("seconds") + L">\n" +
                                    TAB_SPACE + TAB_SPACE + _("Time out for network operations (default: 10).") + L'\n' +
                                    TAB_SPACE + L"--fail-fast\n" +
                                    TAB_SPACE + TAB_SPACE + _("Do not retry authentication errors and missing source files.") + L'\n' +
                                    TAB_SPACE + L"--host-key <SHA256:...>\n" +
                                    TAB_SPACE + TAB_SPACE + _("Expected server host key fingerprint.") + L'\n' +
                                    TAB_SPACE + L"--compress-ssh\n" +
                                    TAB_SPACE + TAB_SPACE + _("Enable SSH-level zlib compression.") + L'\n' +
                                    TAB_SPACE + L"-h, --help\n" +
                                    TAB_SPACE + TAB_SPACE + _("Show this help.") + L'\n');
}


//log to console as messages come in; called from worker threads, too
class ConsoleCallback : public TransferCallback
{
public:
    void logMessage(const std::wstring& msg, MsgType type) override //noexcept!
    {
        const MessageType logType = [&]
        {
            switch (type)
            {
                //*INDENT-OFF*
                case MsgType::info:    return MSG_TYPE_INFO;
                case MsgType::warning: return MSG_TYPE_WARNING;
                case MsgType::error:   return MSG_TYPE_ERROR;
                //*INDENT-ON*
            }
            assert(false);
            return MSG_TYPE_ERROR;
        }();

        std::lock_guard dummy(lockLog_);
        logMsg(log_, msg, logType);
        std::cerr << formatMessage(log_.back()) << std::flush;
    }

    void reportRetry(const ErrorInfo& errorInfo, std::chrono::milliseconds delay) override //noexcept!
    {
        const auto delaySec = std::chrono::ceil<std::chrono::seconds>(delay).count();

        logMessage(errorInfo.msg + L"\n\n" +
                   _("Automatic retry") + L' ' + numberTo<std::wstring>(errorInfo.retryNumber) + L": " +
                   _P("Waiting 1 second...", "Waiting %x seconds...", delaySec), MsgType::error);
    }

    ErrorLogStats getStats()
    {
        std::lock_guard dummy(lockLog_);
        return zen::getStats(log_);
    }

private:
    std::mutex lockLog_;
    ErrorLog log_;
};


struct CommandLine
{
    Zstring localFilePath;
    Zstring remotePath;
    ScpLogin login;

    int limitKBs = 0;
    bool gzip = false;
    std::optional<size_t> attempts; //0: unbounded; none: single attempt
    std::optional<int> timeoutSec;
    bool failFast = false;
};


int parseNumber(const Zstring& option, const Zstring& value) //throw FileError
{
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](Zchar c) { return isDigit(c); }))
        throw FileError(replaceCpy(replaceCpy(_("Invalid value %y for option %x."), L"%x", utfTo<std::wstring>(option)), L"%y", fmtPath(value)));
    return stringTo<int>(value);
}


Zstring getEnvironmentVar(const char* name)
{
    const char* value = ::getenv(name); //no other thread is running yet
    return value ? Zstring(value) : Zstring();
}


//"[user@]host[:port]:path", host may be an IPv6 address in brackets
void parseRemoteTarget(const Zstring& target, CommandLine& cmdLine) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Invalid remote target %x."), L"%x", fmtPath(target)) + L"\n\n" +
                                  _("Expected:") + L" [user@]host[:port]:" + _("remote path");

    Zstring rest = target;
    if (const size_t posAt = rest.find(Zstr('@'));
        posAt != Zstring::npos && posAt < rest.find(Zstr(':')))
    {
        cmdLine.login.username = rest.substr(0, posAt);
        rest = rest.substr(posAt + 1);
    }
    else
        cmdLine.login.username = getEnvironmentVar("USER");

    if (startsWith(rest, Zstr('[')))
    {
        const size_t posEnd = rest.find(Zstr(']'));
        if (posEnd == Zstring::npos)
            throw FileError(errorMsg);
        cmdLine.login.server = rest.substr(1, posEnd - 1);
        rest = rest.substr(posEnd + 1);
        if (!startsWith(rest, Zstr(':')))
            throw FileError(errorMsg);
        rest = rest.substr(1);
    }
    else
    {
        if (!contains(rest, Zstr(':')))
            throw FileError(errorMsg);
        cmdLine.login.server = beforeFirst(rest, Zstr(':'), IfNotFoundReturn::none);
        rest                 = afterFirst (rest, Zstr(':'), IfNotFoundReturn::none);
    }

    //optional port: all digits followed by ':'
    if (const Zstring portStr = beforeFirst(rest, Zstr(':'), IfNotFoundReturn::none);
        !portStr.empty() && std::all_of(portStr.begin(), portStr.end(), [](Zchar c) { return isDigit(c); }))
    {
        cmdLine.login.port = stringTo<int>(portStr);
        rest = afterFirst(rest, Zstr(':'), IfNotFoundReturn::none);
    }

    if (trimCpy(cmdLine.login.server).empty() || rest.empty())
        throw FileError(errorMsg);

    cmdLine.remotePath = rest;
}


//return "std::nullopt" if help was requested
std::optional<CommandLine> parseCommandLine(const std::vector<Zstring>& commandArgs) //throw FileError
{
    CommandLine cmdLine;
    cmdLine.login.password = getEnvironmentVar("SCP_PUSH_PASSWORD");

    std::vector<Zstring> positionalArgs;

    for (auto it = commandArgs.begin(); it != commandArgs.end(); ++it)
    {
        const Zstring& arg = *it;

        auto getValue = [&]() -> const Zstring& //throw FileError
        {
            if (++it == commandArgs.end())
                throw FileError(replaceCpy(_("A value is expected after %x."), L"%x", utfTo<std::wstring>(arg)));
            return *it;
        };

        if (arg == Zstr("-h") || arg == Zstr("--help") || arg == Zstr("-?"))
            return std::nullopt;
        else if (arg == Zstr("-i") || arg == Zstr("--identity"))
            cmdLine.login.privateKey = getFileContent(getValue()); //throw FileError
        else if (arg == Zstr("--passphrase-env"))
            cmdLine.login.passphrase = getEnvironmentVar(getValue().c_str());
        else if (arg == Zstr("--password"))
            cmdLine.login.password = getValue();
        else if (arg == Zstr("-l") || arg == Zstr("--limit"))
            cmdLine.limitKBs = parseNumber(arg, getValue()); //throw FileError
        else if (arg == Zstr("-z") || arg == Zstr("--gzip"))
            cmdLine.gzip = true;
        else if (arg == Zstr("-r") || arg == Zstr("--retries"))
            cmdLine.attempts = parseNumber(arg, getValue()); //throw FileError
        else if (arg == Zstr("--timeout"))
            cmdLine.timeoutSec = parseNumber(arg, getValue()); //throw FileError
        else if (arg == Zstr("--connect-timeout"))
            cmdLine.login.timeoutSec = parseNumber(arg, getValue()); //throw FileError
        else if (arg == Zstr("--fail-fast"))
            cmdLine.failFast = true;
        else if (arg == Zstr("--host-key"))
            cmdLine.login.hostKeySha256 = getValue();
        else if (arg == Zstr("--compress-ssh"))
            cmdLine.login.allowZlib = true;
        else if (startsWith(arg, Zstr('-')) && arg.size() > 1)
            throw FileError(replaceCpy(_("Unknown option %x."), L"%x", utfTo<std::wstring>(arg)));
        else
            positionalArgs.push_back(arg);
    }

    if (positionalArgs.size() != 2)
        throw FileError(_("A local file path and a remote target are expected."));

    cmdLine.localFilePath = positionalArgs[0];
    parseRemoteTarget(positionalArgs[1], cmdLine); //throw FileError

    if (cmdLine.login.timeoutSec <= 0)
        throw FileError(replaceCpy(replaceCpy(_("Invalid value %y for option %x."), L"%x", L"--connect-timeout"), L"%y", fmtPath(numberTo<Zstring>(cmdLine.login.timeoutSec))));
    return cmdLine;
}


//convert SIGINT/SIGTERM into cancel requests; signals must be blocked in all threads *before* calling
InterruptibleThread startSignalWatcher(AbortControl& abortCtrl, TransferCallback& callback, const sigset_t& signalSet)
{
    return InterruptibleThread([&abortCtrl, &callback, signalSet]
    {
        setCurrentThreadName(Zstr("Signal watcher"));

        for (;;)
        {
            interruptionPoint(); //throw ThreadStopRequest

            const timespec sliceTime{.tv_sec = 0, .tv_nsec = 100'000'000};
            const int sig = ::sigtimedwait(&signalSet, nullptr, &sliceTime);
            if (sig < 0)
            {
                if (errno == EAGAIN || errno == EINTR) //time out
                    continue;
                callback.logMessage(formatSystemError("sigtimedwait", getLastError()), TransferCallback::MsgType::error);
                return;
            }

            if (!abortCtrl.cancelRequested())
            {
                callback.logMessage(replaceCpy(_("Received signal %x: stopping..."), L"%x", utfTo<std::wstring>(::strsignal(sig))), TransferCallback::MsgType::warning);
                abortCtrl.requestCancel();
                continue;
            }

            //second signal: default handling => terminate immediately
            if (const int rv = ::pthread_sigmask(SIG_UNBLOCK, &signalSet, nullptr);
                rv != 0)
                std::_Exit(128 + sig);
            ::raise(sig);
            return;
        }
    });
}


ScpExitCode runTransfer(const CommandLine& cmdLine, ConsoleCallback& callback, AbortControl& abortCtrl) //throw FileError, CancelTransfer
{
    ScpHelper helper(createSshDialer(cmdLine.login), &callback);
    helper.setLimitKB(cmdLine.limitKBs);
    helper.setGzipEnable(cmdLine.gzip);
    helper.setFailFast(cmdLine.failFast);

    if (!cmdLine.attempts)
        helper.copyPath(cmdLine.localFilePath, cmdLine.remotePath, abortCtrl); //throw FileError, CancelTransfer
    else if (*cmdLine.attempts == 0)
        helper.mustCopyPath(cmdLine.localFilePath, cmdLine.remotePath, abortCtrl); //throw ErrorSourceFile, ErrorTimeout, CancelTransfer
    else
        helper.tryCopyPath(cmdLine.localFilePath, cmdLine.remotePath, *cmdLine.attempts, abortCtrl); //throw FileError, ErrorRetryExhausted, CancelTransfer

    return callback.getStats().warning > 0 ? ScpExitCode::warning : ScpExitCode::success;
}
}


int main(int argc, char* argv[])
{
    initExtraLog([](const ErrorLog& log) //runs during global shutdown => don't use other globals!
    {
        for (const LogEntry& entry : log)
            std::cerr << formatMessage(entry);
    });

    std::vector<Zstring> commandArgs;
    for (int i = 1; i < argc; ++i) //skip exe path
        commandArgs.push_back(argv[i]);

    ConsoleCallback callback;
    ScpExitCode exitCode = ScpExitCode::success;

    std::optional<CommandLine> cmdLine;
    try
    {
        cmdLine = parseCommandLine(commandArgs); //throw FileError
        if (!cmdLine)
        {
            showSyntaxHelp();
            return static_cast<int>(ScpExitCode::success);
        }
    }
    catch (const FileError& e)
    {
        callback.logMessage(e.toString(), TransferCallback::MsgType::error);
        std::cerr << '\n' << utfTo<std::string>(_("Use --help for syntax details.")) << '\n';
        return static_cast<int>(ScpExitCode::error);
    }

    //block signals *before* starting any threads: they are inherited
    sigset_t signalSet;
    ::sigemptyset(&signalSet);
    ::sigaddset(&signalSet, SIGINT);
    ::sigaddset(&signalSet, SIGTERM);
    if (const int rv = ::pthread_sigmask(SIG_BLOCK, &signalSet, nullptr);
        rv != 0)
        logExtraError(_("Error during process initialization.") + L"\n\n" + formatSystemError("pthread_sigmask", rv));

    try
    {
        const Libssh2Initializer libssh2Init; //*before* ScpHelper: waits for connections during destruction

        std::optional<AbortControl> abortCtrl;
        if (cmdLine->timeoutSec)
            abortCtrl.emplace(std::chrono::steady_clock::duration(std::chrono::seconds(*cmdLine->timeoutSec)));
        else
            abortCtrl.emplace();

        InterruptibleThread signalWatcher = startSignalWatcher(*abortCtrl, callback, signalSet);
        try
        {
            raiseExitCode(exitCode, runTransfer(*cmdLine, callback, *abortCtrl)); //throw FileError, CancelTransfer
        }
        catch (const FileError& e)
        {
            callback.logMessage(e.toString(), TransferCallback::MsgType::error);
            raiseExitCode(exitCode, ScpExitCode::error);
        }
        catch (CancelTransfer&)
        {
            callback.logMessage(_("Stopped"), TransferCallback::MsgType::warning);
            raiseExitCode(exitCode, ScpExitCode::cancelled);
        }
    }
    catch (const std::exception& e) //unexpected error: report and exit gracefully
    {
        callback.logMessage(utfTo<std::wstring>(e.what()), TransferCallback::MsgType::error);
        raiseExitCode(exitCode, ScpExitCode::exception);
    }

    //report "exceptional situations" now rather than during static shutdown
    if (const ErrorLog extraLog = fetchExtraLog();
        !extraLog.empty())
    {
        for (const LogEntry& entry : extraLog)
            std::cerr << formatMessage(entry);
        raiseExitCode(exitCode, ScpExitCode::warning);
    }

    std::cerr << utfTo<std::string>(getExitCodeLabel(exitCode)) << '\n';
    return static_cast<int>(exitCode);
}
