// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SCP_TRANSFER_H_0923847502938475
#define SCP_TRANSFER_H_0923847502938475

#include <optional>
#include "connection_manager.h"
#include "../base/abort_control.h"


namespace scpush
{
//unbuffered input stream: see zen/serialize.h
struct ScpInputStream
{
    virtual ~ScpInputStream() {}
    virtual size_t getBlockSize() = 0; //throw FileError
    virtual size_t tryRead(void* buffer, size_t bytesToRead) = 0; //throw FileError; may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    virtual std::optional<uint64_t> tryGetSizeFast() = 0; //throw FileError; if bound, overrides TransferDescriptor::size
};

//each attempt reads from a fresh stream positioned at byte 0
using SourceFactory = std::function<std::unique_ptr<ScpInputStream>()>; //throw FileError


struct TransferDescriptor
{
    uint64_t size = 0;
    int mode = 0644; //permission bits of the remote file
    Zstring fileName;       //remote: single path component
    Zstring destinationDir; //remote
    SourceFactory openSource;
};

//remote path => destination folder + file name; "." if there is no parent folder
std::pair<Zstring /*destinationDir*/, Zstring /*fileName*/> splitRemotePath(const Zstring& remotePath);

//file size is determined anew for each attempt: a file that grows in between is sent with its size at the time it is opened
TransferDescriptor makeFileDescriptor(const Zstring& localFilePath, const Zstring& remotePath); //throw ErrorSourceFile, ErrorTransferIo
TransferDescriptor makeStreamDescriptor(const SourceFactory& openSource, uint64_t size, const Zstring& remotePath, int mode = 0644); //throw ErrorTransferIo, std::logic_error

std::unique_ptr<ScpInputStream> createMemoryInputStream(const std::shared_ptr<const std::string>& buffer);


//one attempt: remote "scp[ flags] -t <dir>" fed by a writer thread
void executeTransfer(ConnectionManager& connMgr, const TransferDescriptor& descr, const std::string& flags,
                     AbortControl& abortCtrl); //throw ErrorDial, ErrorSession, ErrorTransferIo, ErrorRemoteCommand, ErrorTimeout, CancelTransfer
}

#endif //SCP_TRANSFER_H_0923847502938475
