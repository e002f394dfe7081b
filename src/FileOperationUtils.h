#pragma once

#include <QString>

class QFileInfo;

namespace FileOperationUtils {

bool applyFileTimes(const QFileInfo &sourceInfo, const QString &targetPath);
int pathDepth(const QString &path);
bool isSameOrAncestor(const QString &ancestor, const QString &path);
QString relocatedPath(const QString &sourceRoot, const QString &path, const QString &targetRoot);

} // namespace FileOperationUtils
