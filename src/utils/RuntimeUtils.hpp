#pragma once

#include <QLockFile>
#include <QString>

namespace wb::license::utils {

//! Owner of a lock file as recorded by QLockFile.
struct LockHolder {
    qint64 pid = 0;
    QString hostname;
    QString applicationId;
};

//! Lock file guarding the license state in \a dataDirectory; WB_LICENSE_LOCK_FILE overrides it.
QString writerLockFilePath(const QString& dataDirectory);

//! Cross-process lock held while a process may write the license state.
class StateWriterLock {
public:
    explicit StateWriterLock(const QString& lockFilePath);
    StateWriterLock(const StateWriterLock&) = delete;
    StateWriterLock& operator=(const StateWriterLock&) = delete;

    bool tryAcquire(int timeoutMs = 0);
    void release();

    bool isHeld() const { return m_held; }
    bool isContended() const { return m_status == QLockFile::LockFailedError; }
    QString errorString() const { return m_errorString; }
    LockHolder holder() const { return m_holder; }
    QString lockFilePath() const { return m_lock.fileName(); }

private:
    void describeFailure();

    QLockFile            m_lock;
    QLockFile::LockError m_status = QLockFile::NoError;
    LockHolder           m_holder;
    QString              m_errorString;
    bool                 m_held = false;
};

} // namespace wb::license::utils
