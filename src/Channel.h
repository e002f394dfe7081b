#pragma once

#include <QMutex>
#include <QMutexLocker>
#include <QQueue>
#include <QSharedPointer>
#include <QWaitCondition>

#include <utility>

// Unbounded queue shared by any number of senders and one receiver.
// A send fails once the receiver is gone; a blocking receive returns false
// once the queue is empty and every sender is gone.

namespace ChannelDetail {

template <typename T>
struct ChannelState {
    QMutex mutex;
    QWaitCondition available;
    QQueue<T> queue;
    int senderCount = 0;
    bool receiverAlive = true;
};

} // namespace ChannelDetail

template <typename T>
class ChannelSender
{
public:
    ChannelSender() = default;

    explicit ChannelSender(const QSharedPointer<ChannelDetail::ChannelState<T>> &state)
        : m_state(state)
    {
        attach();
    }

    ChannelSender(const ChannelSender &other)
        : m_state(other.m_state)
    {
        attach();
    }

    ChannelSender(ChannelSender &&other) noexcept
        : m_state(std::move(other.m_state))
    {
        other.m_state.reset();
    }

    ChannelSender &operator=(ChannelSender other) noexcept
    {
        std::swap(m_state, other.m_state);
        return *this;
    }

    ~ChannelSender()
    {
        close();
    }

    bool send(T value) const
    {
        if (!m_state) {
            return false;
        }
        QMutexLocker locker(&m_state->mutex);
        if (!m_state->receiverAlive) {
            return false;
        }
        m_state->queue.enqueue(std::move(value));
        m_state->available.wakeOne();
        return true;
    }

    bool isConnected() const
    {
        if (!m_state) {
            return false;
        }
        QMutexLocker locker(&m_state->mutex);
        return m_state->receiverAlive;
    }

    // Drops this end; the receiver observes disconnection after the last close.
    void close()
    {
        if (!m_state) {
            return;
        }
        {
            QMutexLocker locker(&m_state->mutex);
            m_state->senderCount -= 1;
            if (m_state->senderCount == 0) {
                m_state->available.wakeAll();
            }
        }
        m_state.reset();
    }

private:
    void attach()
    {
        if (!m_state) {
            return;
        }
        QMutexLocker locker(&m_state->mutex);
        m_state->senderCount += 1;
    }

    QSharedPointer<ChannelDetail::ChannelState<T>> m_state;
};

template <typename T>
class ChannelReceiver
{
public:
    ChannelReceiver() = default;

    explicit ChannelReceiver(const QSharedPointer<ChannelDetail::ChannelState<T>> &state)
        : m_state(state)
    {
    }

    ChannelReceiver(const ChannelReceiver &) = delete;
    ChannelReceiver &operator=(const ChannelReceiver &) = delete;

    ChannelReceiver(ChannelReceiver &&other) noexcept
        : m_state(std::move(other.m_state))
    {
        other.m_state.reset();
    }

    ChannelReceiver &operator=(ChannelReceiver &&other) noexcept
    {
        if (this != &other) {
            close();
            m_state = std::move(other.m_state);
            other.m_state.reset();
        }
        return *this;
    }

    ~ChannelReceiver()
    {
        close();
    }

    bool isValid() const
    {
        return !m_state.isNull();
    }

    bool tryReceive(T &value)
    {
        if (!m_state) {
            return false;
        }
        QMutexLocker locker(&m_state->mutex);
        if (m_state->queue.isEmpty()) {
            return false;
        }
        value = m_state->queue.dequeue();
        return true;
    }

    // Blocks until a value arrives or every sender has been dropped.
    bool receive(T &value)
    {
        if (!m_state) {
            return false;
        }
        QMutexLocker locker(&m_state->mutex);
        while (m_state->queue.isEmpty()) {
            if (m_state->senderCount == 0) {
                return false;
            }
            m_state->available.wait(&m_state->mutex);
        }
        value = m_state->queue.dequeue();
        return true;
    }

    // True once the queue is drained and no sender remains.
    bool isDisconnected() const
    {
        if (!m_state) {
            return true;
        }
        QMutexLocker locker(&m_state->mutex);
        return m_state->queue.isEmpty() && m_state->senderCount == 0;
    }

    void close()
    {
        if (!m_state) {
            return;
        }
        {
            QMutexLocker locker(&m_state->mutex);
            m_state->receiverAlive = false;
            m_state->queue.clear();
        }
        m_state.reset();
    }

private:
    QSharedPointer<ChannelDetail::ChannelState<T>> m_state;
};

template <typename T>
struct ChannelEnds {
    ChannelSender<T> sender;
    ChannelReceiver<T> receiver;
};

template <typename T>
ChannelEnds<T> makeChannel()
{
    const auto state = QSharedPointer<ChannelDetail::ChannelState<T>>::create();
    return ChannelEnds<T>{ChannelSender<T>(state), ChannelReceiver<T>(state)};
}
