/************************************************************************\

    Tandem - Dual-pane terminal file manager
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "PaneState.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QtConcurrent>

#include <algorithm>
#include <utility>

#include "Logging.h"

namespace {
struct PaneConstants {
    static constexpr int noRow = -1;
    static constexpr int firstRow = 0;
};

bool isParentEntry(const Entry &entry)
{
    return entry.name == DirectoryUtils::parentEntryName;
}
} // namespace

PaneState::PaneState(const QString &path, bool showHidden, SizeDisplayMode sizeMode)
    : m_path(QDir::cleanPath(path))
    , m_showHidden(showHidden)
    , m_sizeMode(sizeMode)
{
}

/**
 * @brief Stops the background tasks and waits for them to return.
 */
PaneState::~PaneState()
{
    m_loadReceiver.close();
    m_sizeReceiver.close();
    m_loadFuture.waitForFinished();
    m_sizeFuture.waitForFinished();
}

const QString &PaneState::path() const
{
    return m_path;
}

/**
 * @brief Points the pane at another folder without loading it.
 * @param path New folder path.
 */
void PaneState::setPath(const QString &path)
{
    m_path = QDir::cleanPath(path);
}

const QVector<Entry> &PaneState::entries() const
{
    return m_entries;
}

bool PaneState::showHidden() const
{
    return m_showHidden;
}

SizeDisplayMode PaneState::sizeMode() const
{
    return m_sizeMode;
}

void PaneState::applyEntries(const QVector<Entry> &entries)
{
    m_entries = entries;
    m_selected.clear();
    if (m_entries.isEmpty()) {
        m_cursor = PaneConstants::noRow;
    } else {
        m_cursor = std::clamp(m_cursor, static_cast<int>(PaneConstants::firstRow), static_cast<int>(m_entries.size()) - 1);
    }
    startSizeCalculation();
}

/**
 * @brief Lists the current folder on the calling thread.
 * @param error Optional output error message.
 * @return True when the entries were replaced.
 */
bool PaneState::loadEntries(QString *error)
{
    QVector<Entry> entries;
    if (!DirectoryUtils::listEntries(m_path, m_showHidden, m_sizeMode, &entries, error)) {
        return false;
    }
    applyEntries(entries);
    return true;
}

/**
 * @brief Lists the current folder on a background thread; see pollLoadResult().
 */
void PaneState::loadEntriesAsync()
{
    ChannelEnds<LoadResult> channel = makeChannel<LoadResult>();
    m_loadReceiver = std::move(channel.receiver);

    const QString path = m_path;
    const bool showHidden = m_showHidden;
    const SizeDisplayMode sizeMode = m_sizeMode;
    const ChannelSender<LoadResult> sender = channel.sender;
    channel.sender.close();

    qCDebug(lcPane) << "loading" << path;
    m_loadFuture = QtConcurrent::run([sender, path, showHidden, sizeMode]() {
        LoadResult result;
        result.path = path;
        result.ok = DirectoryUtils::listEntries(path, showHidden, sizeMode, &result.entries, &result.error);
        if (!sender.send(result)) {
            qCDebug(lcPane) << "listing of" << path << "no longer wanted";
        }
    });
}

/**
 * @brief Applies a finished background listing if it still matches the current folder.
 * @param error Receives the listing error when the result is Failed.
 * @return What happened to the pending result, None when nothing was ready.
 */
PaneState::LoadStatus PaneState::pollLoadResult(QString *error)
{
    if (!m_loadReceiver.isValid()) {
        return LoadStatus::None;
    }
    LoadResult result;
    if (!m_loadReceiver.tryReceive(result)) {
        return LoadStatus::None;
    }
    m_loadReceiver.close();

    if (result.path != m_path) {
        qCDebug(lcPane) << "discarding stale listing of" << result.path << "current" << m_path;
        return LoadStatus::Discarded;
    }
    if (!result.ok) {
        if (error) {
            *error = result.error;
        }
        return LoadStatus::Failed;
    }
    applyEntries(result.entries);
    return LoadStatus::Applied;
}

bool PaneState::isLoading() const
{
    return m_loadReceiver.isValid();
}

/**
 * @brief Starts computing folder sizes in Full mode, streaming one result per folder.
 */
void PaneState::startSizeCalculation()
{
    m_sizeReceiver.close();
    if (m_sizeMode != SizeDisplayMode::Full) {
        return;
    }

    QStringList folders;
    for (const Entry &entry : std::as_const(m_entries)) {
        if (entry.isDir && !isParentEntry(entry) && !entry.hasSize) {
            folders.append(entry.path);
        }
    }
    if (folders.isEmpty()) {
        return;
    }

    ChannelEnds<SizeResult> channel = makeChannel<SizeResult>();
    m_sizeReceiver = std::move(channel.receiver);
    const ChannelSender<SizeResult> sender = channel.sender;
    channel.sender.close();
    const QString panePath = m_path;

    m_sizeFuture = QtConcurrent::run([sender, folders, panePath]() {
        for (const QString &folder : folders) {
            const quint64 size = DirectoryUtils::directorySize(folder, [&sender]() {
                return !sender.isConnected();
            });
            if (!sender.send(SizeResult{panePath, folder, size})) {
                return;
            }
        }
    });
}

/**
 * @brief Patches entries with every folder size computed so far.
 * @return Number of entries updated.
 */
int PaneState::pollSizeResults()
{
    if (!m_sizeReceiver.isValid()) {
        return 0;
    }
    int applied = 0;
    SizeResult result;
    while (m_sizeReceiver.tryReceive(result)) {
        if (result.panePath != m_path) {
            continue;
        }
        auto it = std::find_if(m_entries.begin(), m_entries.end(), [&result](const Entry &entry) {
            return entry.path == result.path;
        });
        if (it == m_entries.end()) {
            continue;
        }
        it->hasSize = true;
        it->size = result.size;
        applied += 1;
    }
    if (m_sizeReceiver.isDisconnected()) {
        m_sizeReceiver.close();
    }
    return applied;
}

bool PaneState::isCalculatingSizes() const
{
    return m_sizeReceiver.isValid() && !m_sizeReceiver.isDisconnected();
}

bool PaneState::isLoadingAny() const
{
    return isLoading() || isCalculatingSizes();
}

/**
 * @brief Rotates None, Quick and Full size display and reloads the folder.
 */
void PaneState::cycleSizeMode()
{
    switch (m_sizeMode) {
    case SizeDisplayMode::None:
        m_sizeMode = SizeDisplayMode::Quick;
        break;
    case SizeDisplayMode::Quick:
        m_sizeMode = SizeDisplayMode::Full;
        break;
    case SizeDisplayMode::Full:
        m_sizeMode = SizeDisplayMode::None;
        break;
    }
    loadEntriesAsync();
}

void PaneState::toggleHidden()
{
    m_showHidden = !m_showHidden;
    m_cursor = PaneConstants::firstRow;
    loadEntriesAsync();
}

int PaneState::cursor() const
{
    return m_cursor;
}

const Entry *PaneState::selectedEntry() const
{
    if (m_cursor < 0 || m_cursor >= m_entries.size()) {
        return nullptr;
    }
    return &m_entries.at(m_cursor);
}

void PaneState::selectRow(int row)
{
    if (m_entries.isEmpty()) {
        m_cursor = PaneConstants::noRow;
        return;
    }
    m_cursor = std::clamp(row, static_cast<int>(PaneConstants::firstRow), static_cast<int>(m_entries.size()) - 1);
}

void PaneState::moveUp()
{
    if (m_cursor > PaneConstants::firstRow) {
        selectRow(m_cursor - 1);
    }
}

void PaneState::moveDown()
{
    if (m_cursor >= PaneConstants::firstRow) {
        selectRow(m_cursor + 1);
    }
}

void PaneState::pageUp(int pageSize)
{
    if (m_cursor >= PaneConstants::firstRow) {
        selectRow(m_cursor - pageSize);
    }
}

void PaneState::pageDown(int pageSize)
{
    if (m_cursor >= PaneConstants::firstRow) {
        selectRow(m_cursor + pageSize);
    }
}

/**
 * @brief Toggles the entry under the cursor and advances; ".." is never selected.
 */
void PaneState::toggleSelection()
{
    const Entry *entry = selectedEntry();
    if (!entry) {
        return;
    }
    if (!isParentEntry(*entry)) {
        if (m_selected.contains(m_cursor)) {
            m_selected.remove(m_cursor);
        } else {
            m_selected.insert(m_cursor);
        }
    }
    moveDown();
}

bool PaneState::isSelected(int row) const
{
    return m_selected.contains(row);
}

void PaneState::clearSelection()
{
    m_selected.clear();
}

/**
 * @brief Returns the explicitly selected entries, or the entry under the cursor.
 * @return Entries in row order.
 */
QVector<Entry> PaneState::selectedEntries() const
{
    QVector<Entry> result;
    if (m_selected.isEmpty()) {
        const Entry *entry = selectedEntry();
        if (entry) {
            result.append(*entry);
        }
        return result;
    }
    QList<int> rows = m_selected.values();
    std::sort(rows.begin(), rows.end());
    for (int row : std::as_const(rows)) {
        if (row >= 0 && row < m_entries.size()) {
            result.append(m_entries.at(row));
        }
    }
    return result;
}

/**
 * @brief Opens the folder under the cursor, restoring the previous state on failure.
 * @param error Optional output error message.
 * @return True when the pane now shows the folder, or the cursor is not on a folder.
 */
bool PaneState::enterSelected(QString *error)
{
    const Entry *entry = selectedEntry();
    if (!entry || !entry->isDir) {
        return true;
    }

    const QString targetPath = entry->path;
    const QString oldPath = m_path;
    const QVector<Entry> oldEntries = m_entries;
    const int oldCursor = m_cursor;
    const QSet<int> oldSelected = m_selected;

    const QString canonical = QFileInfo(targetPath).canonicalFilePath();
    m_path = canonical.isEmpty() ? QDir::cleanPath(targetPath) : canonical;
    m_cursor = PaneConstants::firstRow;

    QString loadError;
    if (!loadEntries(&loadError)) {
        m_path = oldPath;
        m_entries = oldEntries;
        m_cursor = oldCursor;
        m_selected = oldSelected;
        if (error) {
            *error = QFileInfo(targetPath).isReadable()
                ? loadError
                : QCoreApplication::translate("PaneState", "Permission denied");
        }
        return false;
    }
    return true;
}

/**
 * @brief Opens the parent folder.
 * @param error Optional output error message.
 * @return True when the pane now shows the parent, false at the root or on failure.
 */
bool PaneState::goUp(QString *error)
{
    QDir dir(m_path);
    if (!dir.cdUp()) {
        return false;
    }
    const QString oldPath = m_path;
    const int oldCursor = m_cursor;
    m_path = dir.absolutePath();
    m_cursor = PaneConstants::firstRow;
    if (!loadEntries(error)) {
        m_path = oldPath;
        m_cursor = oldCursor;
        return false;
    }
    return true;
}
