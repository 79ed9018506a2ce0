// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_PATH_H_3984678473567247567
#define FILE_PATH_H_3984678473567247567

#include <optional>
#include "string_tools.h"
#include "zstring.h"


namespace zen
{
//POSIX paths only: local file system and SSH remote side

//no value if path has no parent, e.g. "file.txt" or "/"
std::optional<Zstring> getParentFolderPath(const Zstring& itemPath);

inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }








//######################## implementation ########################
inline
std::optional<Zstring> getParentFolderPath(const Zstring& itemPath)
{
    if (!contains(itemPath, FILE_NAME_SEPARATOR) || itemPath == Zstr("/"))
        return std::nullopt;

    const Zstring parentPath = beforeLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::none);
    if (parentPath.empty()) //"/file.txt"
        return Zstring(1, FILE_NAME_SEPARATOR);

    return parentPath;
}
}

#endif //FILE_PATH_H_3984678473567247567
