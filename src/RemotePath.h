#pragma once

#include <QString>

// POSIX-style remote path helpers (remote paths are always '/'-separated,
// whatever the client platform).
namespace RemotePath {
    // Absolute, no trailing slash except root, no "", "." or ".." segments.
    // Relative input is resolved against "/".
    QString normalize(const QString& path);

    // normalize(base + "/" + name)
    QString join(const QString& base, const QString& name);

    // Parent directory; the parent of "/" is "/".
    QString parent(const QString& path);

    // Last segment; empty for "/".
    QString baseName(const QString& path);

    bool isRoot(const QString& path);

    // Minimal POSIX shell quoting: wrap in single quotes, embedded quotes
    // become '"'"'.
    QString shQuote(const QString& s);
}
