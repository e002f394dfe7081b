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

#include "ThroughputTracker.h"

#include <QDeadlineTimer>

namespace {
struct ThroughputConstants {
    static constexpr qint64 msPerSecond = 1000;
    static constexpr int minimumHistory = 1;
};
} // namespace

ThroughputTracker::ThroughputTracker()
    : ThroughputTracker(nowMs())
{
}

/**
 * @brief Creates a tracker whose first sample window starts at startMs.
 * @param startMs Monotonic timestamp in milliseconds.
 * @param historySize Maximum number of samples kept.
 * @param sampleIntervalMs Minimum spacing between two samples.
 */
ThroughputTracker::ThroughputTracker(qint64 startMs, int historySize, qint64 sampleIntervalMs)
    : m_historySize(qMax(historySize, ThroughputConstants::minimumHistory))
    , m_sampleIntervalMs(sampleIntervalMs)
    , m_lastSampleMs(startMs)
{
    m_history.reserve(m_historySize);
}

void ThroughputTracker::update(quint64 currentBytes)
{
    update(currentBytes, nowMs());
}

/**
 * @brief Records a rate sample when the sample interval has elapsed.
 * @param currentBytes Cumulative processed bytes.
 * @param nowMs Monotonic timestamp in milliseconds.
 */
void ThroughputTracker::update(quint64 currentBytes, qint64 nowMs)
{
    const qint64 elapsedMs = nowMs - m_lastSampleMs;
    if (elapsedMs < m_sampleIntervalMs) {
        return;
    }

    const quint64 delta = currentBytes > m_lastSampleBytes ? currentBytes - m_lastSampleBytes : 0;
    quint64 rate = 0;
    if (elapsedMs > 0) {
        rate = static_cast<quint64>(static_cast<double>(delta) * ThroughputConstants::msPerSecond / elapsedMs);
    }

    m_history.append(rate);
    if (m_history.size() > m_historySize) {
        m_history.removeFirst();
    }

    m_lastSampleMs = nowMs;
    m_lastSampleBytes = currentBytes;
}

/**
 * @brief Returns the most recent rate sample in bytes per second.
 * @return Latest sample, or zero before the first sample.
 */
quint64 ThroughputTracker::currentThroughput() const
{
    return m_history.isEmpty() ? 0 : m_history.last();
}

const QVector<quint64> &ThroughputTracker::history() const
{
    return m_history;
}

int ThroughputTracker::historySize() const
{
    return m_historySize;
}

qint64 ThroughputTracker::nowMs()
{
    return QDeadlineTimer::current().deadline();
}
