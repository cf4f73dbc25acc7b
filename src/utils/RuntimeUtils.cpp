#include "RuntimeUtils.hpp"

#include <QByteArray>
#include <QDir>
#include <QLoggingCategory>

#include "PathUtils.hpp"

Q_LOGGING_CATEGORY(lcLicenseRuntime, "wb.license.runtime")

namespace wb::license::utils {

QString writerLockFilePath(const QString& dataDirectory)
{
    const QByteArray overridePath = qgetenv("WB_LICENSE_LOCK_FILE");
    if (!overridePath.isEmpty())
        return expandPath(QString::fromUtf8(overridePath));

    const QString directory = dataDirectory.isEmpty() ? defaultDataDirectory() : dataDirectory;
    return QDir(expandPath(directory)).filePath(QStringLiteral("license_state.lock"));
}

StateWriterLock::StateWriterLock(const QString& lockFilePath)
    : m_lock(lockFilePath)
{
    // Age never makes a lock stale; only a dead owner does.
    m_lock.setStaleLockTime(0);
}

bool StateWriterLock::tryAcquire(int timeoutMs)
{
    if (m_held)
        return true;

    m_status = QLockFile::NoError;
    m_holder = {};
    m_errorString.clear();

    if (!ensureParentDirectory(m_lock.fileName(), &m_errorString)) {
        m_status = QLockFile::PermissionError;
        return false;
    }

    m_held = m_lock.tryLock(timeoutMs);
    if (!m_held && m_lock.error() == QLockFile::LockFailedError && m_lock.removeStaleLockFile()) {
        qCInfo(lcLicenseRuntime) << "Removed stale lock" << m_lock.fileName();
        m_held = m_lock.tryLock(timeoutMs);
    }
    if (m_held)
        return true;

    describeFailure();
    qCWarning(lcLicenseRuntime) << m_errorString;
    return false;
}

void StateWriterLock::release()
{
    if (!m_held)
        return;
    m_lock.unlock();
    m_held = false;
}

void StateWriterLock::describeFailure()
{
    m_status = m_lock.error();
    switch (m_status) {
    case QLockFile::LockFailedError:
        m_lock.getLockInfo(&m_holder.pid, &m_holder.hostname, &m_holder.applicationId);
        m_errorString = m_holder.pid > 0
            ? QStringLiteral("license state is in use by process %1").arg(m_holder.pid)
            : QStringLiteral("license state is in use by another process");
        break;
    case QLockFile::PermissionError:
        m_errorString = QStringLiteral("no permission to create %1").arg(m_lock.fileName());
        break;
    default:
        m_errorString = QStringLiteral("cannot lock %1").arg(m_lock.fileName());
        break;
    }
}

} // namespace wb::license::utils
