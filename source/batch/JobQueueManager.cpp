#include "JobQueueManager.h"

#include <QCoreApplication>
#include <QDebug>
#include <QMutexLocker>
#include <QThread>

// ============================================================================
// Singleton Instance
// ============================================================================

JobQueueManager* JobQueueManager::s_instance = nullptr;
static QMutex s_instanceMutex;

JobQueueManager* JobQueueManager::instance()
{
    // Double-checked locking for thread-safe singleton
    if (!s_instance) {
        QMutexLocker locker(&s_instanceMutex);
        if (!s_instance) {
            s_instance = new JobQueueManager(qApp);
        }
    }
    return s_instance;
}

// ============================================================================
// JobQueueManager
// ============================================================================

JobQueueManager::JobQueueManager(QObject* parent)
    : QObject(parent)
{
    qRegisterMetaType<MixerOps::JobResult>();
    qRegisterMetaType<MixerOps::Command>();
}

JobQueueManager::~JobQueueManager()
{
    cancelAll();

    if (m_workerThread) {
        m_workerThread->quit();
        m_workerThread->wait(5000);
        delete m_workerThread;
    }

    if (s_instance == this) {
        s_instance = nullptr;
    }
}

void JobQueueManager::enqueue(const MixerOps::JobSpec& job)
{
    bool shouldStart = false;
    {
        QMutexLocker locker(&m_queueMutex);
        m_queue.enqueue(job);
        if (!m_running) {
            m_running = true;
            shouldStart = true;
        }
    }

    qDebug() << "[JobQueueManager] Queued" << MixerOps::commandName(job.command) << "job";

    if (shouldStart) {
        startProcessing();
    }
}

int JobQueueManager::queuedJobCount() const
{
    QMutexLocker locker(&m_queueMutex);
    return static_cast<int>(m_queue.size());
}

bool JobQueueManager::isRunning() const
{
    return m_running;
}

void JobQueueManager::cancelAll()
{
    {
        QMutexLocker locker(&m_queueMutex);
        m_queue.clear();
        // Only a running job can observe the flag
        if (m_running) {
            m_cancelled = true;
        }
    }
}

void JobQueueManager::startProcessing()
{
    if (!m_workerThread) {
        m_workerThread = new QThread();
        m_workerThread->setObjectName("JobWorkerThread");
    }

    if (!m_workerThread->isRunning()) {
        m_workerThread->start();
    }

    // Deferred so enqueue() returns before the first signal is emitted
    QMetaObject::invokeMethod(this, "processNextJob", Qt::QueuedConnection);
}

void JobQueueManager::processNextJob()
{
    MixerOps::JobSpec job;
    int remaining = 0;

    {
        QMutexLocker locker(&m_queueMutex);
        if (m_queue.isEmpty()) {
            m_running = false;
            m_cancelled = false;
            locker.unlock();
            emit queueEmpty();
            return;
        }
        job = m_queue.dequeue();
        remaining = static_cast<int>(m_queue.size());
        m_cancelled = false;
    }

    JobWorker* worker = new JobWorker(job, &m_cancelled);
    worker->moveToThread(m_workerThread);

    connect(worker, &JobWorker::progress,
            this, &JobQueueManager::onWorkerProgress);
    connect(worker, &JobWorker::complete,
            this, &JobQueueManager::onWorkerComplete);

    // Clean up worker when done
    connect(worker, &JobWorker::complete, worker, &QObject::deleteLater);

    emit jobStarted(job.command, remaining);

    QMetaObject::invokeMethod(worker, "process", Qt::QueuedConnection);
}

void JobQueueManager::onWorkerProgress(const QString& file, int current, int total)
{
    emit progressChanged(file, current, total, queuedJobCount());
}

void JobQueueManager::onWorkerComplete(const MixerOps::JobResult& result)
{
    emit jobComplete(result);

    QMetaObject::invokeMethod(this, "processNextJob", Qt::QueuedConnection);
}

// ============================================================================
// JobWorker
// ============================================================================

JobWorker::JobWorker(const MixerOps::JobSpec& job, std::atomic<bool>* cancelled,
                     QObject* parent)
    : QObject(parent)
    , m_job(job)
    , m_cancelled(cancelled)
{
}

void JobWorker::process()
{
    MixerOps::ProgressCallback progressCallback =
        [this](int current, int total, const QString& currentFile, const QString& /*status*/) {
            emit progress(currentFile, current, total);
        };

    MixerOps::JobResult result = MixerOps::run(m_job, progressCallback, m_cancelled);
    emit complete(result);
}
