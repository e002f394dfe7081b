#pragma once

#include <QVector>
#include <QtGlobal>

class ThroughputTracker
{
public:
    static constexpr int defaultHistorySize = 60;
    static constexpr qint64 defaultSampleIntervalMs = 200;

    ThroughputTracker();
    explicit ThroughputTracker(qint64 startMs,
                               int historySize = defaultHistorySize,
                               qint64 sampleIntervalMs = defaultSampleIntervalMs);

    void update(quint64 currentBytes);
    void update(quint64 currentBytes, qint64 nowMs);

    quint64 currentThroughput() const;
    const QVector<quint64> &history() const;
    int historySize() const;

    static qint64 nowMs();

private:
    QVector<quint64> m_history;
    int m_historySize = defaultHistorySize;
    qint64 m_sampleIntervalMs = defaultSampleIntervalMs;
    qint64 m_lastSampleMs = 0;
    quint64 m_lastSampleBytes = 0;
};
