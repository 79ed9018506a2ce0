// *****************************************************************************
// * This file is part of the FreeFileSync project. It is distributed under    *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef RETURN_CODES_H_81307482137054156
#define RETURN_CODES_H_81307482137054156

#include <zen/i18n.h>


namespace scpush
{
enum class ScpExitCode //as returned on process exit
{
    success = 0,
    warning,
    error,
    cancelled,
    exception,
};


inline
void raiseExitCode(ScpExitCode& rc, ScpExitCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


inline
std::wstring getExitCodeLabel(ScpExitCode rc)
{
    switch (rc)
    {
        //*INDENT-OFF*
        case ScpExitCode::success:   return _("Completed successfully");
        case ScpExitCode::warning:   return _("Completed with warnings");
        case ScpExitCode::error:     return _("Completed with errors");
        case ScpExitCode::cancelled: return _("Stopped");
        case ScpExitCode::exception: return _("Stopped after unexpected error");
        //*INDENT-ON*
    }
    assert(false);
    return std::wstring();
}
}

#endif //RETURN_CODES_H_81307482137054156
