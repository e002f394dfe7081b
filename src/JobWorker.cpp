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

#include "JobWorker.h"

#include <QThread>

#include "Logging.h"

namespace {
struct FlagConstants {
    static constexpr int cleared = 0;
    static constexpr int set = 1;
};
} // namespace

WorkerFlags WorkerFlags::create(int pausePollMs)
{
    WorkerFlags flags;
    flags.cancelled = QSharedPointer<QAtomicInt>::create(FlagConstants::cleared);
    flags.paused = QSharedPointer<QAtomicInt>::create(FlagConstants::cleared);
    flags.pausePollMs = pausePollMs;
    return flags;
}

JobWorker::JobWorker(JobId jobId,
                     const ChannelSender<JobUpdate> &updates,
                     const WorkerFlags &flags,
                     QObject *parent)
    : QObject(parent)
    , m_jobId(jobId)
    , m_updates(updates)
    , m_flags(flags)
{
}

JobId JobWorker::jobId() const
{
    return m_jobId;
}

/**
 * @brief Runs the worker algorithm on the calling thread and signals completion.
 */
void JobWorker::start()
{
    qCDebug(lcWorkers) << "worker" << m_jobId.value << "started";
    run();
    qCDebug(lcWorkers) << "worker" << m_jobId.value << "done";
    emit finished();
}

bool JobWorker::isCancelled() const
{
    return m_flags.cancelled && m_flags.cancelled->loadRelaxed() != FlagConstants::cleared;
}

bool JobWorker::isPaused() const
{
    return m_flags.paused && m_flags.paused->loadRelaxed() != FlagConstants::cleared;
}

/**
 * @brief Sleeps while the pause flag is set, waking periodically to check for cancellation.
 * @return False when cancellation was requested, true when the worker may continue.
 */
bool JobWorker::waitWhilePaused() const
{
    while (isPaused()) {
        if (isCancelled()) {
            return false;
        }
        QThread::msleep(static_cast<unsigned long>(m_flags.pausePollMs));
    }
    return !isCancelled();
}

void JobWorker::post(const JobUpdate &update) const
{
    // The manager may already be gone during shutdown; nothing to report to then.
    if (!m_updates.send(update)) {
        qCDebug(lcWorkers) << "update for job" << m_jobId.value << "dropped, receiver closed";
    }
}
