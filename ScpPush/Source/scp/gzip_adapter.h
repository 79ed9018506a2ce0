// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef GZIP_ADAPTER_H_2834750923847562
#define GZIP_ADAPTER_H_2834750923847562

#include "scp_transfer.h"


namespace scpush
{
//read source once and compress it into memory: "name" => "name.gz", size = compressed size
//returned factory creates independent streams over the shared buffer
TransferDescriptor makeGzipDescriptor(const TransferDescriptor& descr); //throw ErrorTransferIo, ErrorSourceFile
}

#endif //GZIP_ADAPTER_H_2834750923847562
