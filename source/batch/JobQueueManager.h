#ifndef JOBQUEUEMANAGER_H
#define JOBQUEUEMANAGER_H

/**
 * @file JobQueueManager.h
 * @brief Singleton manager that runs page jobs on a background thread.
 *
 * Features:
 * - Queues jobs and runs them in FIFO order
 * - Runs jobs on a worker thread (callers are never blocked)
 * - Reports progress and results through queued signals
 * - Supports cancellation
 *
 * Each job owns its MuPDF context, so the worker shares no state with the
 * caller. The CLI runs jobs synchronously and does not use this class.
 */

#include <QObject>
#include <QQueue>
#include <QMutex>
#include <atomic>

#include "MixerOperations.h"

class QThread;

/**
 * @brief Singleton manager for queued jobs.
 *
 * Usage:
 * @code
 * JobQueueManager* mgr = JobQueueManager::instance();
 * connect(mgr, &JobQueueManager::jobComplete, this, &MyClass::showResult);
 *
 * MixerOps::JobSpec job;
 * job.command = MixerOps::Command::Merge;
 * job.inputs = {"a.pdf", "b.pdf"};
 * mgr->enqueue(job);
 * @endcode
 */
class JobQueueManager : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Get the singleton instance.
     */
    static JobQueueManager* instance();

    /**
     * @brief Queue a job. Starts processing if the queue was idle.
     */
    void enqueue(const MixerOps::JobSpec& job);

    /**
     * @brief Number of queued jobs (not including the running one).
     */
    int queuedJobCount() const;

    /**
     * @brief Check if a job is currently running.
     */
    bool isRunning() const;

    /**
     * @brief Clear pending jobs and ask the running job to stop.
     *
     * The running job stops at its next cancellation point (between inputs
     * or split chunks). Files already written are kept.
     */
    void cancelAll();

signals:
    /**
     * @brief Emitted when a job is handed to the worker.
     * @param command The job's command
     * @param queuedJobs Jobs still waiting
     */
    void jobStarted(MixerOps::Command command, int queuedJobs);

    /**
     * @brief Emitted when the running job reports progress.
     */
    void progressChanged(const QString& currentFile, int current, int total, int queuedJobs);

    /**
     * @brief Emitted when a job finishes (success, error or cancellation).
     */
    void jobComplete(const MixerOps::JobResult& result);

    /**
     * @brief Emitted when the queue becomes empty.
     */
    void queueEmpty();

private slots:
    void processNextJob();
    void onWorkerProgress(const QString& file, int current, int total);
    void onWorkerComplete(const MixerOps::JobResult& result);

private:
    explicit JobQueueManager(QObject* parent = nullptr);
    ~JobQueueManager() override;

    // Prevent copying
    JobQueueManager(const JobQueueManager&) = delete;
    JobQueueManager& operator=(const JobQueueManager&) = delete;

    void startProcessing();

    // Queue and state
    QQueue<MixerOps::JobSpec> m_queue;
    mutable QMutex m_queueMutex;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_cancelled{false};

    // Worker thread
    QThread* m_workerThread = nullptr;

    static JobQueueManager* s_instance;
};

// ============================================================================
// Worker object (internal, runs on background thread)
// ============================================================================

/**
 * @brief Worker object that runs one job on the background thread.
 * @internal
 */
class JobWorker : public QObject
{
    Q_OBJECT

public:
    explicit JobWorker(const MixerOps::JobSpec& job, std::atomic<bool>* cancelled,
                       QObject* parent = nullptr);

public slots:
    void process();

signals:
    void progress(const QString& file, int current, int total);
    void complete(const MixerOps::JobResult& result);

private:
    MixerOps::JobSpec m_job;
    std::atomic<bool>* m_cancelled = nullptr;
};

Q_DECLARE_METATYPE(MixerOps::JobResult)
Q_DECLARE_METATYPE(MixerOps::Command)

#endif // JOBQUEUEMANAGER_H
