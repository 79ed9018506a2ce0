// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "gzip_adapter.h"
#include <zen/serialize.h>
#include <zen/zlib_wrap.h>

using namespace zen;
using namespace scpush;


TransferDescriptor scpush::makeGzipDescriptor(const TransferDescriptor& descr) //throw ErrorTransferIo, ErrorSourceFile
{
    const std::wstring errorMsg = replaceCpy(_("Cannot compress file %x."), L"%x", fmtPath(descr.fileName));

    std::unique_ptr<ScpInputStream> source;
    try
    {
        source = descr.openSource(); //throw FileError
    }
    catch (const FileError& e) { throw ErrorSourceFile(e.toString()); }

    uint64_t bytesRead = 0;
    uint64_t expectedSize = descr.size;
    std::string compressed;
    try
    {
        expectedSize = source->tryGetSizeFast().value_or(descr.size); //throw FileError

        InputStreamAsGzip gzipStream([&](void* buffer, size_t bytesToRead)
        {
            const size_t bytesReadBlock = source->tryRead(buffer, bytesToRead); //throw FileError
            bytesRead += bytesReadBlock;
            return bytesReadBlock;
        }, source->getBlockSize()); //throw SysError, FileError

        compressed = unbufferedLoad<std::string>([&](void* buffer, size_t bytesToRead)
        {
            return gzipStream.read(buffer, bytesToRead); //throw SysError, FileError
        }, gzipStream.getBlockSize()); //throw SysError, FileError
    }
    catch (const FileError& e) { throw ErrorTransferIo(e.toString()); }
    catch (const SysError&  e) { throw ErrorTransferIo(errorMsg, e.toString()); }

    if (bytesRead != expectedSize)
        throw ErrorTransferIo(errorMsg, _("Unexpected size of data stream.") + L' ' +
                              _("Expected:") + L' ' + numberTo<std::wstring>(expectedSize) + L' ' +
                              _("Actual:")   + L' ' + numberTo<std::wstring>(bytesRead));

    const auto buffer = std::make_shared<const std::string>(std::move(compressed));

    return
    {
        .size = buffer->size(),
        .mode = descr.mode,
        .fileName = descr.fileName + Zstr(".gz"),
        .destinationDir = descr.destinationDir,
        .openSource = [buffer] { return createMemoryInputStream(buffer); },
    };
}
