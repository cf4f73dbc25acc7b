#include "BackgroundScheduler.hpp"

#include <QLoggingCategory>
#include <QThreadPool>
#include <QtConcurrent>

#include <limits>

#include "license/LicenseValidator.hpp"

Q_LOGGING_CATEGORY(lcLicenseScheduler, "wb.license.scheduler")

namespace wb::license {

BackgroundScheduler::BackgroundScheduler(std::shared_ptr<LicenseValidator> validator, QObject* parent)
    : QObject(parent)
    , m_validator(std::move(validator))
    , m_cancelled(std::make_shared<std::atomic_bool>(false))
{
    qRegisterMetaType<wb::license::LicenseOutcome>();
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &BackgroundScheduler::launch);
    connect(&m_watcher, &QFutureWatcher<LicenseOutcome>::finished, this,
            &BackgroundScheduler::handleValidationFinished);
}

BackgroundScheduler::~BackgroundScheduler()
{
    stop();
}

int BackgroundScheduler::nextIntervalMs() const
{
    if (m_intervalOverrideMs > 0)
        return m_intervalOverrideMs;
    if (!m_validator)
        return 0;
    const qint64 intervalMs = static_cast<qint64>(m_validator->backgroundIntervalSeconds()) * 1000;
    return static_cast<int>(qBound<qint64>(1000, intervalMs, std::numeric_limits<int>::max()));
}

void BackgroundScheduler::start()
{
    if (m_running || !m_validator)
        return;
    m_cancelled = std::make_shared<std::atomic_bool>(false);
    m_running = true;
    Q_EMIT runningChanged();
    qCInfo(lcLicenseScheduler) << "Background validation every" << nextIntervalMs() / 1000 << "s";
    scheduleNext();
}

void BackgroundScheduler::stop()
{
    m_timer.stop();
    // A validation still in flight keeps its own validator reference; its result is dropped.
    m_cancelled->store(true);
    if (m_running) {
        m_running = false;
        Q_EMIT runningChanged();
        qCInfo(lcLicenseScheduler) << "Background validation stopped";
    }
}

void BackgroundScheduler::triggerNow()
{
    if (!m_validator || m_busy)
        return;
    m_timer.stop();
    if (m_cancelled->load())
        m_cancelled = std::make_shared<std::atomic_bool>(false);
    launch();
}

void BackgroundScheduler::setIntervalOverrideForTesting(int msecs)
{
    m_intervalOverrideMs = qMax(0, msecs);
}

void BackgroundScheduler::setThreadPoolForTesting(QThreadPool* pool)
{
    m_threadPool = pool;
}

void BackgroundScheduler::launch()
{
    if (m_busy || !m_validator)
        return;
    m_busy = true;
    Q_EMIT busyChanged();

    auto future = QtConcurrent::run(m_threadPool ? m_threadPool : QThreadPool::globalInstance(),
                                    [validator = m_validator, cancelled = m_cancelled]() {
                                        if (cancelled->load()) {
                                            LicenseOutcome skipped;
                                            skipped.mode = ValidationMode::Background;
                                            return skipped;
                                        }
                                        return validator->validateBackground();
                                    });
    m_watcher.setFuture(future);
}

void BackgroundScheduler::handleValidationFinished()
{
    if (!m_watcher.isFinished() || !m_busy)
        return;

    const LicenseOutcome outcome = m_watcher.result();
    m_busy = false;
    Q_EMIT busyChanged();

    if (m_cancelled->load())
        return;

    Q_EMIT validationFinished(outcome);
    if (!outcome.ok())
        Q_EMIT warningRaised(outcome.message);
    else if (!outcome.warning.isEmpty())
        Q_EMIT warningRaised(outcome.warning);

    scheduleNext();
}

void BackgroundScheduler::scheduleNext()
{
    if (!m_running || m_cancelled->load())
        return;
    m_timer.start(nextIntervalMs());
}

} // namespace wb::license
