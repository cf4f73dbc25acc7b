#pragma once

#include <QFutureWatcher>
#include <QObject>
#include <QTimer>

#include <atomic>
#include <memory>

#include "license/LicenseOutcome.hpp"

class QThreadPool;

namespace wb::license {

class LicenseValidator;

//! Periodic background revalidation off the UI thread.
class BackgroundScheduler : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool running READ isRunning NOTIFY runningChanged)
    Q_PROPERTY(bool busy READ isBusy NOTIFY busyChanged)

public:
    explicit BackgroundScheduler(std::shared_ptr<LicenseValidator> validator, QObject* parent = nullptr);
    ~BackgroundScheduler() override;

    bool isRunning() const { return m_running; }
    bool isBusy() const { return m_busy; }

    //! Interval used for the next run, in milliseconds.
    int nextIntervalMs() const;

    void start();
    //! Stops the timer and abandons any validation still in flight.
    void stop();
    void triggerNow();

    void setIntervalOverrideForTesting(int msecs);
    void setThreadPoolForTesting(QThreadPool* pool);
    bool isTimerActiveForTesting() const { return m_timer.isActive(); }

signals:
    void validationFinished(const wb::license::LicenseOutcome& outcome);
    void warningRaised(const QString& message);
    void runningChanged();
    void busyChanged();

private slots:
    void handleValidationFinished();

private:
    void launch();
    void scheduleNext();

    std::shared_ptr<LicenseValidator>  m_validator;
    QTimer                             m_timer;
    QFutureWatcher<LicenseOutcome>     m_watcher;
    std::shared_ptr<std::atomic_bool>  m_cancelled;
    QThreadPool*                       m_threadPool = nullptr;
    bool                               m_running = false;
    bool                               m_busy = false;
    int                                m_intervalOverrideMs = 0;
};

} // namespace wb::license
