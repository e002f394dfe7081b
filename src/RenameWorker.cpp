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

#include "RenameWorker.h"

#include <QFileInfo>

#include "Logging.h"
#include "PlatformUtils.h"

RenameWorker::RenameWorker(JobId jobId,
                           const QString &originalPath,
                           const QString &targetPath,
                           const ChannelSender<JobUpdate> &updates,
                           const WorkerFlags &flags,
                           QObject *parent)
    : JobWorker(jobId, updates, flags, parent)
    , m_originalPath(originalPath)
    , m_targetPath(targetPath)
{
}

/**
 * @brief Performs the rename; once issued it runs to completion.
 */
void RenameWorker::run()
{
    if (isCancelled()) {
        post(JobUpdate::cancelled(jobId()));
        return;
    }

    const QFileInfo info(m_originalPath);
    post(JobUpdate::scanComplete(jobId(), info.isFile() ? static_cast<quint64>(info.size()) : 0, 1));

    QString error;
    if (!PlatformUtils::renamePath(m_originalPath, m_targetPath, &error)) {
        qCWarning(lcWorkers) << "rename" << m_originalPath << "->" << m_targetPath << "failed:" << error;
        post(JobUpdate::failed(jobId(), error));
        return;
    }

    post(JobUpdate::progress(jobId(), info.isFile() ? static_cast<quint64>(info.size()) : 0,
                             QFileInfo(m_targetPath).fileName(), 1));
    post(JobUpdate::completed(jobId()));
}
