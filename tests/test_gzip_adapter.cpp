// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include <zen/zlib_wrap.h>
#include "../ScpPush/Source/scp/gzip_adapter.h"
#include "fake_transport.h"

using namespace zen;
using namespace scpush;
using namespace scpush::test;


namespace
{
std::string readAll(ScpInputStream& stream)
{
    std::string output;
    std::string buffer(stream.getBlockSize(), '\0');
    for (;;)
    {
        const size_t bytesRead = stream.tryRead(buffer.data(), buffer.size());
        if (bytesRead == 0)
            return output;
        output.append(buffer.data(), bytesRead);
    }
}


std::string makeLogText()
{
    std::string text;
    for (int i = 0; i < 5000; ++i)
        text += "2026-10-19 12:00:00 [info] request " + numberTo<std::string>(i) + " served\n";
    return text;
}
}


TEST(GzipAdapter, CompressOnce)
{
    const auto payload = std::make_shared<const std::string>(makeLogText());
    size_t openCount = 0;

    const TransferDescriptor descr = makeStreamDescriptor([&]
    {
        ++openCount;
        return createMemoryInputStream(payload);
    }, payload->size(), "/var/log/app.log", 0600);

    const TransferDescriptor gzipDescr = makeGzipDescriptor(descr);
    EXPECT_EQ(openCount, 1u);

    EXPECT_EQ(gzipDescr.fileName, "app.log.gz");
    EXPECT_EQ(gzipDescr.destinationDir, "/var/log");
    EXPECT_EQ(gzipDescr.mode, 0600);
    EXPECT_LT(gzipDescr.size, payload->size());

    //every stream starts from the beginning without re-reading the source
    const std::string compressed = readAll(*gzipDescr.openSource());
    EXPECT_EQ(readAll(*gzipDescr.openSource()), compressed);
    EXPECT_EQ(openCount, 1u);

    EXPECT_EQ(compressed.size(), gzipDescr.size);
    EXPECT_EQ(decompressGzip(compressed), *payload);
}


TEST(GzipAdapter, EmptyInput)
{
    const auto payload = std::make_shared<const std::string>();
    const TransferDescriptor gzipDescr = makeGzipDescriptor(makeStreamDescriptor([payload] { return createMemoryInputStream(payload); }, 0, "empty.txt"));

    EXPECT_EQ(gzipDescr.fileName, "empty.txt.gz");
    EXPECT_GT(gzipDescr.size, 0u); //gzip header + trailer
    EXPECT_EQ(decompressGzip(readAll(*gzipDescr.openSource())), "");
}


TEST(GzipAdapter, SourceOpenError)
{
    const TransferDescriptor descr = makeStreamDescriptor([]() -> std::unique_ptr<ScpInputStream>
    {
        throw FileError(L"Cannot open file \"app.log\".", L"Permission denied");
    }, 10, "/var/log/app.log");

    EXPECT_THROW(makeGzipDescriptor(descr), ErrorSourceFile);
}


TEST(GzipAdapter, SizeMismatch)
{
    const auto payload = std::make_shared<const std::string>("only 20 bytes here..");
    const TransferDescriptor descr = makeStreamDescriptor([payload] { return createMemoryInputStream(payload); }, 100, "/tmp/x.bin");

    try
    {
        makeGzipDescriptor(descr);
        FAIL() << "ErrorTransferIo expected";
    }
    catch (const ErrorSourceFile&) { FAIL() << "not an open error"; }
    catch (const ErrorTransferIo& e)
    {
        EXPECT_NE(e.toString().find(L"Expected: 100"), std::wstring::npos);
    }
}
