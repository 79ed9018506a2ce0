// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "scp_protocol.h"
#include <zen/file_error.h>
#include <zen/serialize.h>
#include "session_factory.h"

using namespace zen;
using namespace scpush;


void scpush::checkScpFileName(const std::string& fileName) //throw SysError
{
    if (fileName.empty())
        throw SysError(_("File name must not be empty."));

    //the control line is newline-terminated and the remote sink does not create sub folders:
    if (contains(fileName, '/') || contains(fileName, '\n') || contains(fileName, '\0'))
        throw SysError(replaceCpy(_("File name %x contains characters not supported by the SCP protocol."), L"%x", fmtPath(utfTo<std::wstring>(fileName))));
}


std::string scpush::formatScpControlLine(uint64_t fileSize, int mode, const std::string& fileName) //throw SysError
{
    checkScpFileName(fileName); //throw SysError

    //octal with leading zero: "0644", "04755"
    mode &= 07777;
    const std::string modeTxt = mode > 0777 ? '0' + printNumber<std::string>("%o", mode) : printNumber<std::string>("%04o", mode);

    return 'C' + modeTxt + ' ' + numberTo<std::string>(fileSize) + ' ' + fileName + '\n';
}


std::string scpush::formatScpCommand(const std::string& flags, const std::string& destinationDir)
{
    std::string command = "scp";
    if (!flags.empty())
        command += ' ' + flags;
    return command + " -t " + destinationDir;
}


std::string scpush::formatRateLimitFlags(int limitKBs)
{
    if (limitKBs <= 0)
        return std::string();

    return "-l " + numberTo<std::string>(static_cast<int64_t>(limitKBs) * 8); //scp expects Kbit/s
}


void scpush::writeScpEnvelope(uint64_t fileSize, int mode, const std::string& fileName,
                              const std::function<size_t(void* buffer, size_t bytesToRead)>& tryRead, size_t blockSizeIn,
                              const std::function<size_t(const void* buffer, size_t bytesToWrite)>& tryWrite, size_t blockSizeOut) //throw SysError, X
{
    const std::string controlLine = formatScpControlLine(fileSize, mode, fileName); //throw SysError
    unbufferedSave(controlLine, tryWrite, blockSizeOut); //throw X

    uint64_t bytesRemaining = fileSize;
    const auto tryReadExact = [&](void* buffer, size_t bytesToRead) -> size_t
    {
        if (bytesRemaining == 0)
            return 0;

        const size_t bytesRead = tryRead(buffer, static_cast<size_t>(std::min<uint64_t>(bytesToRead, bytesRemaining))); //throw X
        if (bytesRead == 0)
            throw SysError(_("Unexpected size of data stream.") + L' ' +
                           _("Expected:") + L' ' + numberTo<std::wstring>(fileSize) + L' ' +
                           _("Actual:")   + L' ' + numberTo<std::wstring>(fileSize - bytesRemaining));
        assert(bytesRead <= bytesRemaining);
        bytesRemaining -= bytesRead;
        return bytesRead;
    };
    unbufferedStreamCopy(tryReadExact, blockSizeIn, tryWrite, blockSizeOut); //throw SysError, X

    //source must be exhausted: a growing file would otherwise be truncated silently
    std::byte extraByte{};
    if (tryRead(&extraByte, 1) != 0) //throw X
        throw SysError(_("Unexpected size of data stream.") + L' ' +
                       _("Expected:") + L' ' + numberTo<std::wstring>(fileSize) + L' ' +
                       _("Actual:")   + L" > " + numberTo<std::wstring>(fileSize));

    const char endOfFile = '\0';
    while (tryWrite(&endOfFile, 1) == 0) //throw X
        ;
}


std::wstring scpush::extractScpAckMessages(const std::string_view& ackStream)
{
    std::wstring output;
    for (auto it = ackStream.begin(); it != ackStream.end();)
    {
        if (*it == '\0') //ok
        {
            ++it;
            continue;
        }
        if (*it == '\1' || *it == '\2') //warning, fatal
            ++it;

        auto itEnd = std::find(it, ackStream.end(), '\n');
        const std::string msg = trimCpy(std::string(it, itEnd));
        if (!msg.empty())
        {
            if (!output.empty())
                output += L'\n';
            output += utfTo<std::wstring>(msg);
        }
        it = itEnd == ackStream.end() ? itEnd : itEnd + 1;
    }
    return output;
}


void scpush::checkScpSinkExit(const std::string& command, int exitStatus, const std::string& exitSignal,
                              const std::string& ackStream, const std::string& errorStream) //throw SysErrorRemoteCommand
{
    if (exitStatus == 0 && exitSignal.empty())
        return;

    std::wstring remoteMsg = extractScpAckMessages(ackStream);
    if (const std::wstring stdErr = trimCpy(utfTo<std::wstring>(errorStream));
        !stdErr.empty())
        remoteMsg += (remoteMsg.empty() ? L"" : L"\n") + stdErr;

    const std::wstring exitDescr = exitSignal.empty() ?
                                   replaceCpy(_("Exit code %x"), L"%x", numberTo<std::wstring>(exitStatus)) :
                                   replaceCpy(_("Terminated by signal %x"), L"%x", utfTo<std::wstring>("SIG" + exitSignal));

    throw SysErrorRemoteCommand(formatSystemError(utfTo<std::string>(beforeFirst(command, ' ', IfNotFoundReturn::all)), exitDescr, remoteMsg),
                                exitSignal.empty() ? exitStatus : -1);
}
