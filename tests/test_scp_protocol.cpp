// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <cstring>
#include <gtest/gtest.h>
#include "../ScpPush/Source/scp/scp_protocol.h"
#include "fake_transport.h"

using namespace zen;
using namespace scpush;
using namespace scpush::test;


namespace
{
//upload "payload" but pretend the stream has "declaredSize" bytes
std::string writeEnvelope(uint64_t declaredSize, int mode, const std::string& fileName, const std::string& payload)
{
    size_t readPos = 0;
    std::string output;

    writeScpEnvelope(declaredSize, mode, fileName,
                     [&](void* buffer, size_t bytesToRead) //return short on purpose
    {
        const size_t junkSize = std::min({bytesToRead, payload.size() - readPos, size_t(5)});
        std::memcpy(buffer, payload.data() + readPos, junkSize);
        readPos += junkSize;
        return junkSize;
    }, 11,
    [&](const void* buffer, size_t bytesToWrite)
    {
        const size_t junkSize = std::min<size_t>(bytesToWrite, 2);
        output.append(static_cast<const char*>(buffer), junkSize);
        return junkSize;
    }, 4); //throw SysError
    return output;
}
}


TEST(ScpProtocol, ControlLine)
{
    EXPECT_EQ(formatScpControlLine(5, 0644, "a.txt"), "C0644 5 a.txt\n");
    EXPECT_EQ(formatScpControlLine(0, 0600, "empty"), "C0600 0 empty\n");
    EXPECT_EQ(formatScpControlLine(1234567890123, 04755, "big file.bin"), "C04755 1234567890123 big file.bin\n");
    EXPECT_EQ(formatScpControlLine(7, 02750, "setgid"), "C02750 7 setgid\n");
    EXPECT_EQ(formatScpControlLine(7, 01777, "sticky"), "C01777 7 sticky\n");

    //file type bits are not part of the mode field
    EXPECT_EQ(formatScpControlLine(1, 0100755, "x"), "C0755 1 x\n");
}


TEST(ScpProtocol, InvalidFileName)
{
    EXPECT_THROW(formatScpControlLine(1, 0644, ""),                       SysError);
    EXPECT_THROW(formatScpControlLine(1, 0644, "dir/name"),               SysError);
    EXPECT_THROW(formatScpControlLine(1, 0644, "line\nbreak"),            SysError);
    EXPECT_THROW(formatScpControlLine(1, 0644, std::string("nu\0l", 4)), SysError);

    EXPECT_NO_THROW(formatScpControlLine(1, 0644, "name with spaces.txt"));

    EXPECT_THROW(checkScpFileName(""),      SysError);
    EXPECT_THROW(checkScpFileName("a/b"),   SysError);
    EXPECT_NO_THROW(checkScpFileName("a.b"));
}


TEST(ScpProtocol, Command)
{
    EXPECT_EQ(formatScpCommand("", "/var/log"), "scp -t /var/log");
    EXPECT_EQ(formatScpCommand("-l 800", "/dst"), "scp -l 800 -t /dst");
    EXPECT_EQ(formatScpCommand("", "."), "scp -t .");
}


TEST(ScpProtocol, RateLimit)
{
    EXPECT_EQ(formatRateLimitFlags(100), "-l 800");
    EXPECT_EQ(formatRateLimitFlags(1), "-l 8");
    EXPECT_EQ(formatRateLimitFlags(0), "");
    EXPECT_EQ(formatRateLimitFlags(-5), "");
}


TEST(ScpProtocol, Envelope)
{
    const std::string payload = "The quick brown fox jumps over the lazy dog";

    EXPECT_EQ(writeEnvelope(payload.size(), 0644, "fox.txt", payload),
              makeEnvelope("C0644 43 fox.txt\n", payload));
}


TEST(ScpProtocol, EmptyFile)
{
    const std::string expected("C0644 0 empty.txt\n\0", 19);
    EXPECT_EQ(writeEnvelope(0, 0644, "empty.txt", ""), expected);
}


TEST(ScpProtocol, SourceShorterThanDeclared)
{
    try
    {
        writeEnvelope(10, 0644, "short.txt", "12345");
        FAIL() << "SysError expected";
    }
    catch (const SysError& e)
    {
        EXPECT_NE(e.toString().find(L"Expected: 10"), std::wstring::npos);
        EXPECT_NE(e.toString().find(L"Actual: 5"),    std::wstring::npos);
    }
}


TEST(ScpProtocol, SourceLongerThanDeclared)
{
    EXPECT_THROW(writeEnvelope(3, 0644, "long.txt", "12345"), SysError);
}


TEST(ScpProtocol, InvalidNameWritesNothing)
{
    std::string output;
    EXPECT_THROW(writeScpEnvelope(1, 0644, "a/b", [](void*, size_t) { return size_t(0); }, 1,
                                  [&](const void* buffer, size_t bytesToWrite)
    {
        output.append(static_cast<const char*>(buffer), bytesToWrite);
        return bytesToWrite;
    }, 1), SysError);

    EXPECT_TRUE(output.empty());
}


TEST(ScpProtocol, AckMessages)
{
    EXPECT_EQ(extractScpAckMessages(""), L"");
    EXPECT_EQ(extractScpAckMessages(std::string("\0\0\0", 3)), L"");

    const std::string acks = std::string("\0", 1) +
                             "\1scp: /dst/a.txt: Permission denied\n" +
                             "\2scp: fatal protocol error\n";
    EXPECT_EQ(extractScpAckMessages(acks), L"scp: /dst/a.txt: Permission denied\nscp: fatal protocol error");

    //plain text, e.g. login banner
    EXPECT_EQ(extractScpAckMessages("  hello  \n"), L"hello");
}


TEST(ScpProtocol, SinkExit)
{
    EXPECT_NO_THROW(checkScpSinkExit("scp -t /dst", 0, "", std::string("\0", 1), ""));

    try
    {
        checkScpSinkExit("scp -t /dst", 1, "", "\1scp: /dst/a.txt: Permission denied\n", "");
        FAIL() << "SysErrorRemoteCommand expected";
    }
    catch (const SysErrorRemoteCommand& e)
    {
        EXPECT_EQ(e.getExitStatus(), 1);
        EXPECT_NE(e.toString().find(L"Permission denied"), std::wstring::npos);
    }
}


TEST(ScpProtocol, SinkKilledBySignal)
{
    //no exit status is reported for a killed process: libssh2 returns 0
    try
    {
        checkScpSinkExit("scp -t /dst", 0, "KILL", "", "");
        FAIL() << "SysErrorRemoteCommand expected";
    }
    catch (const SysErrorRemoteCommand& e)
    {
        EXPECT_EQ(e.getExitStatus(), -1);
        EXPECT_NE(e.toString().find(L"SIGKILL"), std::wstring::npos);
    }
}
