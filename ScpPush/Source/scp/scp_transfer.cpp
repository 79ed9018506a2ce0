// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "scp_transfer.h"
#include <optional>
#include <zen/file_io.h>
#include <zen/file_path.h>
#include <zen/serialize.h>
#include <zen/thread.h>
#include "scp_protocol.h"

using namespace zen;
using namespace scpush;


namespace
{
//snapshot of the file size at the time of opening: data appended later is not sent
class FileInputStream : public ScpInputStream
{
public:
    explicit FileInputStream(const Zstring& filePath) : file_(filePath) {} //throw FileError

    size_t getBlockSize() override { return file_.getBlockSize(); } //throw FileError

    size_t tryRead(void* buffer, size_t bytesToRead) override //throw FileError
    {
        if (bytesRemaining_ == 0)
            return 0;

        const size_t bytesRead = file_.tryRead(buffer, static_cast<size_t>(std::min<uint64_t>(bytesToRead, bytesRemaining_))); //throw FileError
        bytesRemaining_ -= bytesRead;
        return bytesRead;
    }

    std::optional<uint64_t> tryGetSizeFast() override { return fileSize_; }

private:
    FileInputPlain file_;
    const uint64_t fileSize_ = file_.getStatBuffered().st_size; //throw FileError
    uint64_t bytesRemaining_ = fileSize_;
};


class MemoryInputStream : public ScpInputStream
{
public:
    explicit MemoryInputStream(const std::shared_ptr<const std::string>& buffer) : buffer_(buffer) {}

    size_t getBlockSize() override { return 128 * 1024; }
    size_t tryRead(void* buffer, size_t bytesToRead) override { return memStream_.read(buffer, bytesToRead); }

    std::optional<uint64_t> tryGetSizeFast() override { return std::nullopt; } //size was declared by the caller

private:
    const std::shared_ptr<const std::string> buffer_;
    MemoryStreamIn memStream_{std::string_view(*buffer_)};
};


//reject before dialing: the remote sink would only fail after the command was started
std::pair<Zstring, Zstring> splitCheckedRemotePath(const Zstring& remotePath) //throw ErrorTransferIo
{
    const auto& [destinationDir, fileName] = splitRemotePath(remotePath);
    try
    {
        checkScpFileName(utfTo<std::string>(fileName)); //throw SysError
    }
    catch (const SysError& e) { throw ErrorTransferIo(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(remotePath)), e.toString()); }

    return {destinationDir, fileName};
}
}


std::unique_ptr<ScpInputStream> scpush::createMemoryInputStream(const std::shared_ptr<const std::string>& buffer)
{
    return std::make_unique<MemoryInputStream>(buffer);
}


std::pair<Zstring, Zstring> scpush::splitRemotePath(const Zstring& remotePath)
{
    return {getParentFolderPath(remotePath).value_or(Zstr(".")), getItemName(remotePath)};
}


TransferDescriptor scpush::makeFileDescriptor(const Zstring& localFilePath, const Zstring& remotePath) //throw ErrorSourceFile, ErrorTransferIo
{
    struct stat fileInfo = {};
    if (::stat(localFilePath.c_str(), &fileInfo) != 0)
    {
        const ErrorCode ec = getLastError(); //copy before making other system calls!
        throw ErrorSourceFile(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(localFilePath)), formatSystemError("stat", ec));
    }
    if (!S_ISREG(fileInfo.st_mode))
        throw ErrorSourceFile(replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(localFilePath)), _("Unsupported item type."));

    const auto& [destinationDir, fileName] = splitCheckedRemotePath(remotePath); //throw ErrorTransferIo

    return
    {
        .size = static_cast<uint64_t>(fileInfo.st_size),
        .mode = static_cast<int>(fileInfo.st_mode & 07777),
        .fileName = fileName,
        .destinationDir = destinationDir,
        .openSource = [localFilePath] { return std::make_unique<FileInputStream>(localFilePath); }, //throw FileError
    };
}


TransferDescriptor scpush::makeStreamDescriptor(const SourceFactory& openSource, uint64_t size, const Zstring& remotePath, int mode) //throw ErrorTransferIo
{
    if (!openSource)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    const auto& [destinationDir, fileName] = splitCheckedRemotePath(remotePath); //throw ErrorTransferIo

    return {size, mode, fileName, destinationDir, openSource};
}


void scpush::executeTransfer(ConnectionManager& connMgr, const TransferDescriptor& descr, const std::string& flags,
                             AbortControl& abortCtrl) //throw ErrorDial, ErrorSession, ErrorTransferIo, ErrorRemoteCommand, ErrorTimeout, CancelTransfer
{
    abortCtrl.checkpoint(); //throw CancelTransfer, ErrorTimeout

    const Zstring remotePath = descr.destinationDir + FILE_NAME_SEPARATOR + descr.fileName;
    const std::wstring remoteDisplayPath = connMgr.getDisplayName() + L':' + utfTo<std::wstring>(remotePath);
    const std::wstring errorMsg = replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(remoteDisplayPath));

    const std::unique_ptr<ScpSession> session = connMgr.acquireSession(); //throw ErrorDial, ErrorAuthentication, ErrorSession
    ZEN_ON_SCOPE_EXIT( //*after* writer thread has ended
        try { session->close(); } //throw SysError
        catch (const SysError& e) { logExtraError(replaceCpy(_("Cannot close SSH session on %x."), L"%x", fmtPath(connMgr.getDisplayName())) + L"\n\n" + e.toString()); });

    struct WriterResult
    {
        std::exception_ptr abortError; //CancelTransfer, ErrorTimeout
        std::optional<std::wstring> errorMsg;
        bool sourceOpenFailed = false;
        bool pipeFailed = false;
    } writerResult; //access only after join()!

    InterruptibleThread writer([&]
    {
        setCurrentThreadName(Zstr("SCP writer"));

        const AbortCheck checkAbort = [&]
        {
            interruptionPoint(); //throw ThreadStopRequest
            abortCtrl.checkpoint(); //throw CancelTransfer, ErrorTimeout
        };

        try
        {
            std::unique_ptr<ScpInputStream> source;
            try
            {
                source = descr.openSource(); //throw FileError
            }
            catch (const FileError&)
            {
                writerResult.sourceOpenFailed = true;
                throw;
            }

            const auto tryWrite = [&](const void* buffer, size_t bytesToWrite)
            {
                try
                {
                    return session->tryWrite(buffer, bytesToWrite, checkAbort); //throw SysError, ThreadStopRequest, CancelTransfer, ErrorTimeout
                }
                catch (const SysError&)
                {
                    writerResult.pipeFailed = true;
                    throw;
                }
            };

            const uint64_t fileSize = source->tryGetSizeFast().value_or(descr.size); //throw FileError

            writeScpEnvelope(fileSize, descr.mode, utfTo<std::string>(descr.fileName),
                             [&](void* buffer, size_t bytesToRead) { return source->tryRead(buffer, bytesToRead); }, //throw FileError
                             source->getBlockSize(), //throw FileError
                             tryWrite, session->getBlockSize()); //throw SysError, FileError, CancelTransfer, ErrorTimeout, ThreadStopRequest
            try
            {
                session->closeInput(checkAbort); //throw SysError, ThreadStopRequest, CancelTransfer, ErrorTimeout
            }
            catch (const SysError&)
            {
                writerResult.pipeFailed = true;
                throw;
            }
            return;
        }
        catch (const ErrorTimeout&)   { writerResult.abortError = std::current_exception(); }
        catch (const CancelTransfer&) { writerResult.abortError = std::current_exception(); }
        catch (const FileError& e)    { writerResult.errorMsg = e.toString(); }
        catch (const SysError& e)     { writerResult.errorMsg = errorMsg + L"\n\n" + e.toString(); }

        //send EOF anyway: the remote process must terminate
        try { session->closeInput(nullptr /*checkAbort*/); } //throw SysError, ThreadStopRequest
        catch (const SysError& e) { logExtraError(errorMsg + L"\n\n" + e.toString()); }
    });

    const std::string command = formatScpCommand(flags, utfTo<std::string>(descr.destinationDir));

    struct CommandResult
    {
        std::wstring msg;
        std::wstring details;
        std::optional<int> exitStatus; //remote process failed
    };
    std::optional<CommandResult> commandResult;
    try
    {
        session->run(command, [&] { abortCtrl.checkpoint(); }); //throw SysError, SysErrorRemoteCommand, CancelTransfer, ErrorTimeout
    }
    catch (const SysErrorRemoteCommand& e)
    {
        commandResult = {replaceCpy(_("Remote command %x failed."), L"%x", fmtPath(utfTo<std::wstring>(command))), e.toString(), e.getExitStatus()};
    }
    catch (const SysError& e) { commandResult = {errorMsg, e.toString(), std::nullopt}; }

    if (commandResult)
        writer.requestStop(); //the writer may be stuck on a stalled pipe
    writer.join();

    //cancellation and timeout always win
    if (writerResult.abortError)
        std::rethrow_exception(writerResult.abortError); //throw CancelTransfer, ErrorTimeout
    abortCtrl.checkpoint(); //throw CancelTransfer, ErrorTimeout

    const auto throwWriterError = [&](const std::wstring& extraDetails)
    {
        const std::wstring msg = *writerResult.errorMsg + extraDetails;
        if (writerResult.sourceOpenFailed)
            throw ErrorSourceFile(msg);
        throw ErrorTransferIo(msg);
    };

    const auto throwCommandError = [&](const std::wstring& extraDetails)
    {
        if (commandResult->exitStatus)
            throw ErrorRemoteCommand(commandResult->msg, commandResult->details + extraDetails, *commandResult->exitStatus);
        throw ErrorTransferIo(commandResult->msg, commandResult->details + extraDetails);
    };

    if (writerResult.errorMsg)
    {
        if (!commandResult)
            throwWriterError(L""); //e.g. source file read error, remote sink saw a truncated stream and still exited with 0

        if (writerResult.pipeFailed) //pipe broke because the remote command failed: report root cause first
            throwCommandError(L"\n\n" + *writerResult.errorMsg);

        throwWriterError(L"\n\n" + commandResult->msg + L"\n\n" + commandResult->details);
    }
    if (commandResult)
        throwCommandError(L"");
}
