module;
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QMutex>
#include <QMutexLocker>
#include <QString>
#include <QThread>

#include <atomic>
#include <functional>
#include <optional>

export module relaygate.tests.faketunnel;
export import relaygate.backend.tunnelplatform;

/**
 * @brief Pump the event loop until @p predicate holds or @p timeoutMs elapses.
 */
export bool waitFor(const std::function<bool()>& predicate, int timeoutMs = 5000)
{
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
    return true;
}

export class FakeTunnelPlatform : public TunnelPlatform
{
public:
    std::optional<InterfaceHandle> establish(const RoutePlan& plan, QString* errorMessage) override
    {
        ++establishCalls;
        if (establishDelayMs > 0) {
            QThread::msleep(static_cast<unsigned long>(establishDelayMs.load()));
        }
        {
            QMutexLocker locker(&m_mutex);
            m_lastPlan = plan;
        }
        if (failEstablish) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("interface permission denied");
            }
            return std::nullopt;
        }
        active = true;
        InterfaceHandle handle;
        handle.name = QStringLiteral("fake0");
        handle.mtu = plan.mtu;
        return handle;
    }

    void release(const InterfaceHandle&) override
    {
        ++releaseCalls;
        active = false;
        if (onRelease) {
            onRelease();
        }
    }

    std::optional<RoutePlan> lastPlan() const
    {
        QMutexLocker locker(&m_mutex);
        return m_lastPlan;
    }

    std::atomic<int> establishCalls {0};
    std::atomic<int> releaseCalls {0};
    std::atomic<int> establishDelayMs {0};
    std::atomic<bool> failEstablish {false};
    std::atomic<bool> active {false};
    //! Called from release() on the worker thread; assign before connecting.
    std::function<void()> onRelease;

private:
    mutable QMutex m_mutex;
    std::optional<RoutePlan> m_lastPlan;
};

export class FakeRelayEngine : public RelayEngine
{
public:
    bool start(const InterfaceHandle&, const RelayStartOptions& options, QString* errorMessage) override
    {
        ++startCalls;
        {
            QMutexLocker locker(&m_mutex);
            m_lastOptions = options;
        }
        if (failStart) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("relay refused to start");
            }
            return false;
        }
        running = true;
        return true;
    }

    void stop() override
    {
        ++stopCalls;
        running = false;
    }

    bool isRunning() const override
    {
        return running;
    }

    RelayStats stats() const override
    {
        RelayStats stats;
        stats.uploadBytes = uploadBytes;
        stats.downloadBytes = downloadBytes;
        return stats;
    }

    std::optional<RelayStartOptions> lastOptions() const
    {
        QMutexLocker locker(&m_mutex);
        return m_lastOptions;
    }

    std::atomic<int> startCalls {0};
    std::atomic<int> stopCalls {0};
    std::atomic<bool> failStart {false};
    std::atomic<bool> running {false};
    std::atomic<quint64> uploadBytes {0};
    std::atomic<quint64> downloadBytes {0};

private:
    mutable QMutex m_mutex;
    std::optional<RelayStartOptions> m_lastOptions;
};
