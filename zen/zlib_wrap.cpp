// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "zlib_wrap.h"
//use the zlib system header: same library libssh2 links against
#include <zlib.h>
#include <vector>
#include "scope_guard.h"
#include "serialize.h"

using namespace zen;


namespace
{
std::wstring getZlibErrorLiteral(int sc)
{
    switch (sc)
    {
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_NEED_DICT);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_STREAM_END);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_OK);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_ERRNO);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_STREAM_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_DATA_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_MEM_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_BUF_ERROR);
            ZEN_CHECK_CASE_FOR_CONSTANT(Z_VERSION_ERROR);

        default:
            return replaceCpy<std::wstring>(L"zlib error %x", L"%x", numberTo<std::wstring>(sc));
    }
}

const int GZIP_WINDOW_BITS = MAX_WBITS + 16; //"add 16 to windowBits to write a simple gzip header and trailer"
}


class InputStreamAsGzip::Impl
{
public:
    Impl(const std::function<size_t(void* buffer, size_t bytesToRead)>& tryReadBlock /*throw X; may return short, only 0 means EOF!*/,
         size_t blockSize) : //throw SysError
        tryReadBlock_(tryReadBlock),
        blockSize_(blockSize)
    {
        if (blockSize_ == 0)
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        const int rv = ::deflateInit2(&gzipStream_,
                                      Z_DEFAULT_COMPRESSION, //int level
                                      Z_DEFLATED,            //int method
                                      GZIP_WINDOW_BITS,      //int windowBits
                                      8,                     //int memLevel (== DEF_MEM_LEVEL)
                                      Z_DEFAULT_STRATEGY);   //int strategy
        if (rv != Z_OK)
            throw SysError(formatSystemError("zlib deflateInit2", getZlibErrorLiteral(rv), L""));
    }

    ~Impl()
    {
        [[maybe_unused]] const int rv = ::deflateEnd(&gzipStream_);
        //Z_DATA_ERROR if stream was freed prematurely, e.g. reader aborted by exception
    }

    size_t read(void* buffer, size_t bytesToRead) //throw SysError, X; return "bytesToRead" bytes unless end of stream!
    {
        if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        if (streamEnd_)
            return 0;

        gzipStream_.next_out  = static_cast<Bytef*>(buffer);
        gzipStream_.avail_out = static_cast<uInt>(bytesToRead);

        for (;;)
        {
            if (gzipStream_.avail_in == 0 && !eof_)
            {
                const size_t bytesRead = tryReadBlock_(bufIn_.data(), blockSize_); //throw X; may return short, only 0 means EOF!
                gzipStream_.next_in  = reinterpret_cast<z_const Bytef*>(bufIn_.data());
                gzipStream_.avail_in = static_cast<uInt>(bytesRead);
                if (bytesRead == 0)
                    eof_ = true;
            }

            const int rv = ::deflate(&gzipStream_, eof_ ? Z_FINISH : Z_NO_FLUSH);
            if (eof_ && rv == Z_STREAM_END)
            {
                streamEnd_ = true;
                return bytesToRead - gzipStream_.avail_out;
            }
            if (rv != Z_OK && rv != Z_BUF_ERROR) //Z_BUF_ERROR: no progress possible, e.g. output buffer full => not fatal
                throw SysError(formatSystemError("zlib deflate", getZlibErrorLiteral(rv), L""));

            if (gzipStream_.avail_out == 0)
                return bytesToRead;
        }
    }

    size_t getBlockSize() const { return blockSize_; }

private:
    const std::function<size_t(void* buffer, size_t bytesToRead)> tryReadBlock_; //throw X
    const size_t blockSize_;
    bool eof_ = false;
    bool streamEnd_ = false;
    std::vector<std::byte> bufIn_{blockSize_};
    z_stream gzipStream_ = {};
};


InputStreamAsGzip::InputStreamAsGzip(const std::function<size_t(void* buffer, size_t bytesToRead)>& tryReadBlock /*throw X*/, size_t blockSize) :
    pimpl_(std::make_unique<Impl>(tryReadBlock, blockSize)) {} //throw SysError

InputStreamAsGzip::~InputStreamAsGzip() {}

size_t InputStreamAsGzip::getBlockSize() const { return pimpl_->getBlockSize(); }

size_t InputStreamAsGzip::read(void* buffer, size_t bytesToRead) { return pimpl_->read(buffer, bytesToRead); } //throw SysError, X


std::string zen::decompressGzip(const std::string_view& stream) //throw SysError
{
    z_stream gunzipStream = {};
    const int rvInit = ::inflateInit2(&gunzipStream, GZIP_WINDOW_BITS);
    if (rvInit != Z_OK)
        throw SysError(formatSystemError("zlib inflateInit2", getZlibErrorLiteral(rvInit), L""));
    ZEN_ON_SCOPE_EXIT(::inflateEnd(&gunzipStream));

    gunzipStream.next_in  = reinterpret_cast<z_const Bytef*>(const_cast<char*>(stream.data()));
    gunzipStream.avail_in = static_cast<uInt>(stream.size());

    std::string output;
    const size_t blockSize = 128 * 1024;
    for (;;)
    {
        output.resize(output.size() + blockSize);
        gunzipStream.next_out  = reinterpret_cast<Bytef*>(output.data() + output.size() - blockSize);
        gunzipStream.avail_out = static_cast<uInt>(blockSize);

        const int rv = ::inflate(&gunzipStream, Z_NO_FLUSH);
        output.resize(output.size() - gunzipStream.avail_out);

        if (rv == Z_STREAM_END)
            break;
        if (rv == Z_BUF_ERROR && gunzipStream.avail_in == 0) //input exhausted before end of stream
            throw SysError(formatSystemError("zlib inflate", getZlibErrorLiteral(rv), L"Unexpected end of stream."));
        if (rv != Z_OK && rv != Z_BUF_ERROR)
            throw SysError(formatSystemError("zlib inflate", getZlibErrorLiteral(rv), L""));
    }

    if (gunzipStream.avail_in != 0)
        throw SysError(formatSystemError("zlib inflate", L"", L"Unexpected data after end of stream."));

    return output;
}
