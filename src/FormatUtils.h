#pragma once

#include <QString>
#include <QtGlobal>

namespace FormatUtils {

QString formatBytes(quint64 bytes);
QString formatSize(quint64 bytes);

} // namespace FormatUtils
