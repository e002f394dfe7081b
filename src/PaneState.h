#pragma once

#include <QFuture>
#include <QSet>
#include <QString>
#include <QVector>

#include "Channel.h"
#include "DirectoryUtils.h"

struct LoadResult {
    QString path;
    bool ok = false;
    QVector<Entry> entries;
    QString error;
};

struct SizeResult {
    QString panePath;
    QString path;
    quint64 size = 0;
};

class PaneState
{
public:
    enum class LoadStatus {
        None,
        Applied,
        Failed,
        Discarded
    };

    explicit PaneState(const QString &path,
                       bool showHidden = false,
                       SizeDisplayMode sizeMode = SizeDisplayMode::None);
    ~PaneState();

    PaneState(const PaneState &) = delete;
    PaneState &operator=(const PaneState &) = delete;

    const QString &path() const;
    void setPath(const QString &path);
    const QVector<Entry> &entries() const;
    bool showHidden() const;
    SizeDisplayMode sizeMode() const;

    bool loadEntries(QString *error);
    void loadEntriesAsync();
    LoadStatus pollLoadResult(QString *error = nullptr);
    bool isLoading() const;

    void startSizeCalculation();
    int pollSizeResults();
    bool isCalculatingSizes() const;
    bool isLoadingAny() const;

    void cycleSizeMode();
    void toggleHidden();

    int cursor() const;
    const Entry *selectedEntry() const;
    void moveUp();
    void moveDown();
    void pageUp(int pageSize);
    void pageDown(int pageSize);
    void toggleSelection();
    bool isSelected(int row) const;
    void clearSelection();
    QVector<Entry> selectedEntries() const;
    bool enterSelected(QString *error);
    bool goUp(QString *error);

private:
    void applyEntries(const QVector<Entry> &entries);
    void selectRow(int row);

    QString m_path;
    QVector<Entry> m_entries;
    int m_cursor = -1;
    QSet<int> m_selected;
    bool m_showHidden = false;
    SizeDisplayMode m_sizeMode = SizeDisplayMode::None;

    ChannelReceiver<LoadResult> m_loadReceiver;
    ChannelReceiver<SizeResult> m_sizeReceiver;
    QFuture<void> m_loadFuture;
    QFuture<void> m_sizeFuture;
};
