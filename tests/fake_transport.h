// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FAKE_TRANSPORT_H_3045872390458723
#define FAKE_TRANSPORT_H_3045872390458723

#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include <unistd.h>
#include <zen/string_tools.h>
#include "../ScpPush/Source/base/process_callback.h"
#include "../ScpPush/Source/scp/session_factory.h"


namespace scpush::test
{
/*  in-memory SCP server: records every command and the bytes received on stdin

    failure hooks run in the context of the calling thread and may throw SysError:
        onDial:        before a connection is handed out
        onOpenSession: before a session is handed out
        onWrite:       before stdin data is accepted
        isWindowOpen:  "false" stalls the writer like a full SSH channel window
        onCommandExit: after stdin was closed; throw SysErrorRemoteCommand to simulate a non-zero exit status      */
struct FakeServer
{
    std::function<void(size_t dialNo)>    onDial;
    std::function<void(size_t sessionNo)> onOpenSession;
    std::function<void(size_t sessionNo)> onWrite;
    std::function<bool(size_t sessionNo)> isWindowOpen;
    std::function<void(size_t sessionNo, const std::string& input)> onCommandExit;

    size_t getDialCount() const { std::lock_guard dummy(lock_); return dialCount_; }
    size_t getSessionCount() const { std::lock_guard dummy(lock_); return sessionCount_; }
    std::vector<std::string> getCommands() const { std::lock_guard dummy(lock_); return commands_; }
    std::vector<std::string> getInputs  () const { std::lock_guard dummy(lock_); return inputs_; }

    size_t registerDial   () { std::lock_guard dummy(lock_); return ++dialCount_; }
    size_t registerSession() { std::lock_guard dummy(lock_); return ++sessionCount_; }
    void addCommand(const std::string& command) { std::lock_guard dummy(lock_); commands_.push_back(command); }
    void addInput  (const std::string& input)   { std::lock_guard dummy(lock_); inputs_  .push_back(input); }

private:
    mutable std::mutex lock_;
    size_t dialCount_ = 0;
    size_t sessionCount_ = 0;
    std::vector<std::string> commands_;
    std::vector<std::string> inputs_;
};


class FakeSession : public ScpSession
{
public:
    FakeSession(const std::shared_ptr<FakeServer>& server, size_t sessionNo) : server_(server), sessionNo_(sessionNo) {}

    size_t getBlockSize() const override { return 7; } //odd size: exercise short writes

    size_t tryWrite(const void* buffer, size_t bytesToWrite, const AbortCheck& checkAbort) override //throw SysError, X
    {
        if (checkAbort)
            checkAbort(); //throw X
        if (server_->onWrite)
            server_->onWrite(sessionNo_); //throw SysError

        while (server_->isWindowOpen && !server_->isWindowOpen(sessionNo_))
        {
            if (checkAbort)
                checkAbort(); //throw X
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        const size_t junkSize = std::min<size_t>(bytesToWrite, 3);
        std::lock_guard dummy(lockInput_);
        input_.append(static_cast<const char*>(buffer), junkSize);
        return junkSize;
    }

    void closeInput(const AbortCheck& /*checkAbort*/) override
    {
        inputClosed_ = true;
    }

    void run(const std::string& command, const AbortCheck& checkAbort) override //throw SysError, SysErrorRemoteCommand, X
    {
        server_->addCommand(command);

        while (!inputClosed_)
        {
            if (checkAbort)
                checkAbort(); //throw X
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }

        const std::string input = [&] { std::lock_guard dummy(lockInput_); return input_; }();
        server_->addInput(input);

        if (server_->onCommandExit)
            server_->onCommandExit(sessionNo_, input); //throw SysError, SysErrorRemoteCommand
    }

    void close() override {}

private:
    const std::shared_ptr<FakeServer> server_;
    const size_t sessionNo_;

    std::mutex lockInput_;
    std::string input_;
    std::atomic<bool> inputClosed_{false};
};


class FakeConnection : public ScpConnection
{
public:
    explicit FakeConnection(const std::shared_ptr<FakeServer>& server) : server_(server) {}

    std::unique_ptr<ScpSession> openSession() override //throw SysError
    {
        const size_t sessionNo = server_->registerSession();
        if (server_->onOpenSession)
            server_->onOpenSession(sessionNo); //throw SysError
        return std::make_unique<FakeSession>(server_, sessionNo);
    }

private:
    const std::shared_ptr<FakeServer> server_;
};


class FakeDialer : public ScpDialer
{
public:
    explicit FakeDialer(const std::shared_ptr<FakeServer>& server) : server_(server) {}

    std::shared_ptr<ScpConnection> dial() override //throw SysError, SysErrorAuthentication
    {
        const size_t dialNo = server_->registerDial();
        if (server_->onDial)
            server_->onDial(dialNo); //throw SysError, SysErrorAuthentication
        return std::make_shared<FakeConnection>(server_);
    }

    std::wstring getDisplayName() const override { return L"tester@fake-host"; }

private:
    const std::shared_ptr<FakeServer> server_;
};


class RecordingCallback : public TransferCallback
{
public:
    void logMessage(const std::wstring& msg, MsgType type) override
    {
        std::lock_guard dummy(lock_);
        messages_.emplace_back(type, msg);
    }

    void reportRetry(const ErrorInfo& errorInfo, std::chrono::milliseconds delay) override
    {
        std::lock_guard dummy(lock_);
        retries_.emplace_back(errorInfo.retryNumber, delay);
    }

    size_t countMessages(MsgType type) const
    {
        std::lock_guard dummy(lock_);
        return std::count_if(messages_.begin(), messages_.end(), [&](const auto& item) { return item.first == type; });
    }

    std::vector<std::pair<size_t /*retryNumber*/, std::chrono::milliseconds>> getRetries() const { std::lock_guard dummy(lock_); return retries_; }

private:
    mutable std::mutex lock_;
    std::vector<std::pair<MsgType, std::wstring>> messages_;
    std::vector<std::pair<size_t, std::chrono::milliseconds>> retries_;
};


//local file deleted at end of scope
class TempFile
{
public:
    explicit TempFile(const std::string& content)
    {
        const int fd = ::mkstemp(filePath_); //mode 0600
        if (fd < 0)
            throw std::runtime_error("mkstemp failed");
        ::close(fd);
        append(content);
    }
    ~TempFile() { ::unlink(filePath_); }

    void append(const std::string& content) { std::ofstream(filePath_, std::ios::binary | std::ios::app) << content; }

    Zstring getPath() const { return filePath_; }

private:
    TempFile           (const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    char filePath_[32] = "/tmp/scp_push_test_XXXXXX";
};


//expected stdin of an SCP sink for a complete upload
inline
std::string makeEnvelope(const std::string& controlLine, const std::string& payload)
{
    std::string envelope = controlLine + payload;
    envelope += '\0';
    return envelope;
}
}

#endif //FAKE_TRANSPORT_H_3045872390458723
