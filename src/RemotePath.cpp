// RemotePath.cpp
#include "RemotePath.h"

#include <QStringList>

namespace RemotePath {

QString normalize(const QString& path)
{
    const QStringList parts = path.trimmed().split('/', Qt::SkipEmptyParts);

    QStringList out;
    for (const QString& p : parts) {
        if (p == ".")
            continue;
        if (p == "..") {
            if (!out.isEmpty()) out.removeLast();
            continue;
        }
        out << p;
    }

    return "/" + out.join('/');
}

QString join(const QString& base, const QString& name)
{
    return normalize(base + "/" + name);
}

QString parent(const QString& path)
{
    const QString s = normalize(path);
    const int idx = s.lastIndexOf('/');
    if (idx <= 0) return QStringLiteral("/");
    return s.left(idx);
}

QString baseName(const QString& path)
{
    const QString s = normalize(path);
    return s.mid(s.lastIndexOf('/') + 1);
}

bool isRoot(const QString& path)
{
    return normalize(path) == "/";
}

QString shQuote(const QString& s)
{
    QString out = s;
    out.replace("'", "'\"'\"'");
    return "'" + out + "'";
}

} // namespace RemotePath
