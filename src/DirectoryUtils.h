#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>

#include <functional>

enum class SizeDisplayMode {
    None,
    Quick,
    Full
};

struct Entry {
    QString name;
    QString path;
    bool isDir = false;
    bool hasSize = false;
    quint64 size = 0;
};

namespace DirectoryUtils {

extern const QString parentEntryName;

bool listEntries(const QString &path,
                 bool showHidden,
                 SizeDisplayMode sizeMode,
                 QVector<Entry> *entries,
                 QString *error);
void sortEntries(QVector<Entry> &entries);
quint64 directorySize(const QString &path, const std::function<bool()> &isCancelled = {});

QString sizeModeName(SizeDisplayMode mode);
bool parseSizeMode(const QString &name, SizeDisplayMode *mode);

} // namespace DirectoryUtils
