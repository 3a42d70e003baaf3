#pragma once

#include <QLoggingCategory>

// Side effects whose failure is logged and otherwise ignored (show, focus,
// keep-on-top, hotkey registration, frontend notifications). Anything whose
// failure the caller must see returns bool + errorString instead.
inline bool bestEffort(const QLoggingCategory &category, const char *what, bool ok)
{
    if (!ok)
        qCWarning(category, "best-effort step failed: %s", what);
    return ok;
}
