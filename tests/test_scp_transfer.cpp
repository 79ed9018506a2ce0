// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <cstring>
#include <fstream>
#include <utility>
#include <unistd.h>
#include <sys/stat.h>
#include <gtest/gtest.h>
#include <zen/scope_guard.h>
#include "../ScpPush/Source/scp/scp_transfer.h"
#include "fake_transport.h"

using namespace zen;
using namespace scpush;
using namespace scpush::test;


namespace
{
//delivers "data", then fails instead of reporting EOF
class BrokenInputStream : public ScpInputStream
{
public:
    explicit BrokenInputStream(const std::string& data) : data_(data) {}

    size_t getBlockSize() override { return 4; }

    size_t tryRead(void* buffer, size_t bytesToRead) override //throw FileError
    {
        if (pos_ == data_.size())
            throw FileError(L"Cannot read file \"source\".", L"Input/output error");

        const size_t junkSize = std::min(bytesToRead, data_.size() - pos_);
        std::memcpy(buffer, data_.data() + pos_, junkSize);
        pos_ += junkSize;
        return junkSize;
    }

    std::optional<uint64_t> tryGetSizeFast() override { return std::nullopt; }

private:
    const std::string data_;
    size_t pos_ = 0;
};


TransferDescriptor makeMemoryDescriptor(const std::string& payload, const Zstring& remotePath)
{
    const auto buffer = std::make_shared<const std::string>(payload);
    return makeStreamDescriptor([buffer] { return createMemoryInputStream(buffer); }, buffer->size(), remotePath);
}


class ScpTransfer : public testing::Test
{
protected:
    const std::shared_ptr<FakeServer> server_ = std::make_shared<FakeServer>();
    ConnectionManager connMgr_{std::make_unique<FakeDialer>(server_), nullptr};
    AbortControl abortCtrl_;
};
}


TEST(SplitRemotePath, Variants)
{
    EXPECT_EQ(splitRemotePath("/var/log/app.log"), std::make_pair(Zstring("/var/log"), Zstring("app.log")));
    EXPECT_EQ(splitRemotePath("backup/db.sql"),    std::make_pair(Zstring("backup"),   Zstring("db.sql")));
    EXPECT_EQ(splitRemotePath("notes.txt"),        std::make_pair(Zstring("."),        Zstring("notes.txt")));
    EXPECT_EQ(splitRemotePath("/root.txt"),        std::make_pair(Zstring("/"),        Zstring("root.txt")));
}


TEST(TransferDescriptor, StreamRequiresFactory)
{
    EXPECT_THROW(makeStreamDescriptor(nullptr, 10, "/dst/file"), std::logic_error);

    const TransferDescriptor descr = makeMemoryDescriptor("abc", "/dst/file.bin");
    EXPECT_EQ(descr.size, 3u);
    EXPECT_EQ(descr.mode, 0644);
    EXPECT_EQ(descr.fileName, "file.bin");
    EXPECT_EQ(descr.destinationDir, "/dst");
}


TEST(TransferDescriptor, LocalFile)
{
    char tempPath[] = "/tmp/scp_push_test_XXXXXX";
    const int fd = ::mkstemp(tempPath);
    ASSERT_GE(fd, 0);
    ::close(fd);
    ZEN_ON_SCOPE_EXIT(::unlink(tempPath));

    std::ofstream(tempPath, std::ios::binary) << "local content";
    ASSERT_EQ(::chmod(tempPath, 0640), 0);

    const TransferDescriptor descr = makeFileDescriptor(tempPath, "/srv/upload/remote.txt");
    EXPECT_EQ(descr.size, 13u);
    EXPECT_EQ(descr.mode, 0640);
    EXPECT_EQ(descr.fileName, "remote.txt");
    EXPECT_EQ(descr.destinationDir, "/srv/upload");

    std::unique_ptr<ScpInputStream> stream = descr.openSource();
    std::string content(13, '\0');
    size_t bytesRead = 0;
    while (bytesRead < content.size())
    {
        const size_t junkSize = stream->tryRead(content.data() + bytesRead, content.size() - bytesRead);
        ASSERT_GT(junkSize, 0u);
        bytesRead += junkSize;
    }
    EXPECT_EQ(content, "local content");
}


TEST(TransferDescriptor, InvalidRemoteName)
{
    EXPECT_EQ(splitRemotePath("/dst/"), std::make_pair(Zstring("/dst"), Zstring()));

    const auto buffer = std::make_shared<const std::string>("abc");
    EXPECT_THROW(makeStreamDescriptor([buffer] { return createMemoryInputStream(buffer); }, 3, "/dst/"), ErrorTransferIo);

    const TempFile localFile("abc");
    try
    {
        makeFileDescriptor(localFile.getPath(), "/dst/");
        FAIL() << "ErrorTransferIo expected";
    }
    catch (const ErrorSourceFile&) { FAIL() << "local file is fine"; }
    catch (const ErrorTransferIo& e)
    {
        EXPECT_NE(e.toString().find(L"/dst/"), std::wstring::npos);
    }
}


TEST(TransferDescriptor, InvalidLocalFile)
{
    EXPECT_THROW(makeFileDescriptor("/nonexistent-folder/missing.txt", "/dst/missing.txt"), ErrorSourceFile);
    EXPECT_THROW(makeFileDescriptor("/tmp", "/dst/tmp"), ErrorSourceFile); //not a regular file
}


TEST_F(ScpTransfer, Success)
{
    executeTransfer(connMgr_, makeMemoryDescriptor("hello world", "/dst/hello.txt"), "", abortCtrl_);

    EXPECT_EQ(server_->getCommands(), std::vector<std::string>{"scp -t /dst"});
    EXPECT_EQ(server_->getInputs(), std::vector<std::string>{makeEnvelope("C0644 11 hello.txt\n", "hello world")});
}


TEST_F(ScpTransfer, EmptyPayloadWithFlags)
{
    executeTransfer(connMgr_, makeMemoryDescriptor("", "/dst/empty.txt"), "-l 800", abortCtrl_);

    EXPECT_EQ(server_->getCommands(), std::vector<std::string>{"scp -l 800 -t /dst"});
    EXPECT_EQ(server_->getInputs(), std::vector<std::string>{std::string("C0644 0 empty.txt\n\0", 19)});
}


TEST_F(ScpTransfer, SourceReadErrorDespiteCommandSuccess)
{
    const TransferDescriptor descr = makeStreamDescriptor([] { return std::make_unique<BrokenInputStream>("12345"); }, 10, "/dst/broken.bin");

    try
    {
        executeTransfer(connMgr_, descr, "", abortCtrl_);
        FAIL() << "ErrorTransferIo expected";
    }
    catch (const ErrorSourceFile&) { FAIL() << "read error is not an open error"; }
    catch (const ErrorTransferIo& e)
    {
        EXPECT_NE(e.toString().find(L"Input/output error"), std::wstring::npos);
    }
}


TEST_F(ScpTransfer, SourceOpenError)
{
    const TransferDescriptor descr = makeStreamDescriptor([]() -> std::unique_ptr<ScpInputStream>
    {
        throw FileError(L"Cannot open file \"source\".", L"Permission denied");
    }, 10, "/dst/locked.bin");

    EXPECT_THROW(executeTransfer(connMgr_, descr, "", abortCtrl_), ErrorSourceFile);
}


TEST_F(ScpTransfer, SizeMismatch)
{
    const auto buffer = std::make_shared<const std::string>("12345");
    const TransferDescriptor descr = makeStreamDescriptor([buffer] { return createMemoryInputStream(buffer); }, 8, "/dst/short.bin");

    try
    {
        executeTransfer(connMgr_, descr, "", abortCtrl_);
        FAIL() << "ErrorTransferIo expected";
    }
    catch (const ErrorTransferIo& e)
    {
        EXPECT_NE(e.toString().find(L"Unexpected size of data stream."), std::wstring::npos);
    }
}


TEST_F(ScpTransfer, RemoteCommandFailure)
{
    server_->onCommandExit = [](size_t, const std::string&)
    {
        throw SysErrorRemoteCommand(L"scp: /dst: No such file or directory", 1);
    };

    try
    {
        executeTransfer(connMgr_, makeMemoryDescriptor("data", "/dst/file.txt"), "", abortCtrl_);
        FAIL() << "ErrorRemoteCommand expected";
    }
    catch (const ErrorRemoteCommand& e)
    {
        EXPECT_EQ(e.getExitStatus(), 1);
        EXPECT_NE(e.toString().find(L"scp -t /dst"), std::wstring::npos);
        EXPECT_NE(e.toString().find(L"No such file or directory"), std::wstring::npos);
    }
}


TEST_F(ScpTransfer, BrokenPipeReportsRemoteFailure)
{
    server_->onWrite = [](size_t) { throw SysError(L"Broken pipe"); };
    server_->onCommandExit = [](size_t, const std::string&)
    {
        throw SysErrorRemoteCommand(L"scp: disk full", 1);
    };

    try
    {
        executeTransfer(connMgr_, makeMemoryDescriptor("data", "/dst/file.txt"), "", abortCtrl_);
        FAIL() << "ErrorRemoteCommand expected";
    }
    catch (const ErrorRemoteCommand& e)
    {
        const std::wstring msg = e.toString();
        EXPECT_NE(msg.find(L"disk full"),   std::wstring::npos);
        EXPECT_NE(msg.find(L"Broken pipe"), std::wstring::npos);
        EXPECT_LT(msg.find(L"disk full"), msg.find(L"Broken pipe")); //root cause first
    }
}


TEST_F(ScpTransfer, SourceErrorAndRemoteFailure)
{
    server_->onCommandExit = [](size_t, const std::string&)
    {
        throw SysErrorRemoteCommand(L"scp: protocol error: unexpected <newline>", 1);
    };
    const TransferDescriptor descr = makeStreamDescriptor([] { return std::make_unique<BrokenInputStream>("12345"); }, 10, "/dst/broken.bin");

    try
    {
        executeTransfer(connMgr_, descr, "", abortCtrl_);
        FAIL() << "ErrorTransferIo expected";
    }
    catch (const ErrorRemoteCommand&) { FAIL() << "local error is the root cause"; }
    catch (const ErrorTransferIo& e)
    {
        const std::wstring msg = e.toString();
        EXPECT_NE(msg.find(L"Input/output error"), std::wstring::npos);
        EXPECT_NE(msg.find(L"protocol error"),     std::wstring::npos);
    }
}


TEST_F(ScpTransfer, TransportError)
{
    server_->onCommandExit = [](size_t, const std::string&) { throw SysError(L"Connection reset by peer"); };

    EXPECT_THROW(executeTransfer(connMgr_, makeMemoryDescriptor("data", "/dst/file.txt"), "", abortCtrl_), ErrorTransferIo);
}


TEST_F(ScpTransfer, CancelBeforeStart)
{
    abortCtrl_.requestCancel();

    EXPECT_THROW(executeTransfer(connMgr_, makeMemoryDescriptor("data", "/dst/file.txt"), "", abortCtrl_), CancelTransfer);
    EXPECT_EQ(server_->getDialCount(), 0u);
}


TEST_F(ScpTransfer, CancelDuringUpload)
{
    const std::string payload(1000, 'x');
    size_t bytesRead = 0;

    class CancellingInputStream : public ScpInputStream
    {
    public:
        CancellingInputStream(const std::string& data, size_t& bytesRead, AbortControl& abortCtrl) : data_(data), bytesRead_(bytesRead), abortCtrl_(abortCtrl) {}

        size_t getBlockSize() override { return 10; }

        size_t tryRead(void* buffer, size_t bytesToRead) override
        {
            if (bytesRead_ >= 100)
                abortCtrl_.requestCancel();

            const size_t junkSize = std::min(bytesToRead, data_.size() - bytesRead_);
            std::memcpy(buffer, data_.data() + bytesRead_, junkSize);
            bytesRead_ += junkSize;
            return junkSize;
        }

        std::optional<uint64_t> tryGetSizeFast() override { return std::nullopt; }

    private:
        const std::string& data_;
        size_t& bytesRead_;
        AbortControl& abortCtrl_;
    };

    const TransferDescriptor descr = makeStreamDescriptor([&] { return std::make_unique<CancellingInputStream>(payload, bytesRead, abortCtrl_); },
                                                          payload.size(), "/dst/big.bin");

    EXPECT_THROW(executeTransfer(connMgr_, descr, "", abortCtrl_), CancelTransfer);
    EXPECT_LT(bytesRead, payload.size());
}


TEST_F(ScpTransfer, FileGrownBeforeAttempt)
{
    TempFile localFile("line1\n");
    const TransferDescriptor descr = makeFileDescriptor(localFile.getPath(), "/var/log/app.log");
    EXPECT_EQ(descr.size, 6u);

    localFile.append("line2\n");
    executeTransfer(connMgr_, descr, "", abortCtrl_);

    localFile.append("line3\n");
    executeTransfer(connMgr_, descr, "", abortCtrl_);

    EXPECT_EQ(server_->getInputs(), (std::vector<std::string>
    {
        makeEnvelope("C0600 12 app.log\n", "line1\nline2\n"),
        makeEnvelope("C0600 18 app.log\n", "line1\nline2\nline3\n"),
    }));
}


TEST_F(ScpTransfer, FileGrowingDuringUpload)
{
    TempFile localFile("0123456789");
    server_->onWrite = [&, appended = false](size_t) mutable
    {
        if (!std::exchange(appended, true))
            localFile.append("appended later");
    };

    executeTransfer(connMgr_, makeFileDescriptor(localFile.getPath(), "/dst/data.bin"), "", abortCtrl_);

    //size at the time of opening
    EXPECT_EQ(server_->getInputs(), std::vector<std::string>{makeEnvelope("C0600 10 data.bin\n", "0123456789")});
}


TEST_F(ScpTransfer, SlowRemoteSink)
{
    const auto windowOpenTime = std::chrono::steady_clock::now() + std::chrono::milliseconds(200);
    server_->isWindowOpen = [windowOpenTime](size_t) { return std::chrono::steady_clock::now() >= windowOpenTime; };

    executeTransfer(connMgr_, makeMemoryDescriptor("slow data", "/dst/slow.txt"), "-l 8", abortCtrl_);

    EXPECT_EQ(server_->getInputs(), std::vector<std::string>{makeEnvelope("C0644 9 slow.txt\n", "slow data")});
}


TEST_F(ScpTransfer, StalledRemoteSinkBoundedByDeadline)
{
    server_->isWindowOpen = [](size_t) { return false; };
    AbortControl abortCtrl(std::chrono::milliseconds(100));

    EXPECT_THROW(executeTransfer(connMgr_, makeMemoryDescriptor("data", "/dst/stalled.txt"), "", abortCtrl), ErrorTimeout);
}
