#pragma once

#include <QString>

namespace PlatformUtils {

QString normalizePath(const QString &path);
QString canonicalOrNormalized(const QString &path);
bool deletePermanently(const QString &path, QString *error);
bool renamePath(const QString &path, const QString &targetPath, QString *error);

} // namespace PlatformUtils
