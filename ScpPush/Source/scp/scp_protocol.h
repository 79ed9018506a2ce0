// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCP_PROTOCOL_H_2390478523094576
#define SCP_PROTOCOL_H_2390478523094576

#include <functional>
#include <zen/sys_error.h>


namespace scpush
{
/*  SCP sink protocol, push direction ("scp -t <dir>" reading from stdin):

        C<octal mode with leading zero> <size> <file name>\n
        <exactly "size" bytes>
        \0

    remote answers on stdout: \0 = ok, \1<msg>\n = warning, \2<msg>\n = fatal      */

void checkScpFileName(const std::string& fileName); //throw SysError

std::string formatScpControlLine(uint64_t fileSize, int mode, const std::string& fileName); //throw SysError

std::string formatScpCommand(const std::string& flags, const std::string& destinationDir); //"scp[ flags] -t <dir>"

std::string formatRateLimitFlags(int limitKBs); //"-l <Kbit/s>"; empty if no limit


void writeScpEnvelope(uint64_t fileSize, int mode, const std::string& fileName,
                      const std::function<size_t(void* buffer, size_t bytesToRead)>& tryRead /*throw X; may return short, only 0 means EOF*/, size_t blockSizeIn,
                      const std::function<size_t(const void* buffer, size_t bytesToWrite)>& tryWrite /*throw X; may return short*/, size_t blockSizeOut); //throw SysError, X

//warning and error messages sent by the remote sink (empty if none)
std::wstring extractScpAckMessages(const std::string_view& ackStream);

//remote sink has ended: "exitSignal" is empty unless the process was killed
void checkScpSinkExit(const std::string& command, int exitStatus, const std::string& exitSignal,
                      const std::string& ackStream, const std::string& errorStream); //throw SysErrorRemoteCommand
}

#endif //SCP_PROTOCOL_H_2390478523094576
