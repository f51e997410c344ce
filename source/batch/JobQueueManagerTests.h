#ifndef JOBQUEUEMANAGERTESTS_H
#define JOBQUEUEMANAGERTESTS_H

/**
 * @file JobQueueManagerTests.h
 * @brief Tests for background job processing.
 *
 * Run with: pdfmixer_tests queue
 */

#include "JobQueueManager.h"
#include "../pdf/MuPdfContext.h"
#include "../pdf/PdfTestFixtures.h"

#include <QFile>
#include <QObject>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QTest>

class JobQueueManagerTests : public QObject {
    Q_OBJECT

private:
    static QString writePdf(const QTemporaryDir& dir, const QString& name, int pages) {
        auto context = MuPdfContext::create();
        QFile file(dir.filePath(name));
        if (!context || !file.open(QIODevice::WriteOnly)) {
            return QString();
        }
        file.write(PdfTestFixtures::buildPdf(context->get(), pages, true));
        return file.fileName();
    }

private slots:
    void testJobsRunInOrder() {
        QTemporaryDir dir;
        const QString input = writePdf(dir, "doc.pdf", 3);
        QVERIFY(!input.isEmpty());

        JobQueueManager* manager = JobQueueManager::instance();
        QSignalSpy started(manager, &JobQueueManager::jobStarted);
        QSignalSpy complete(manager, &JobQueueManager::jobComplete);
        QSignalSpy empty(manager, &JobQueueManager::queueEmpty);

        MixerOps::JobSpec reverse;
        reverse.command = MixerOps::Command::Reverse;
        reverse.inputs = {input};

        MixerOps::JobSpec split;
        split.command = MixerOps::Command::Split;
        split.inputs = {input};
        split.pagesPerChunk = 2;
        split.output.outputPath = dir.filePath("parts");

        manager->enqueue(reverse);
        manager->enqueue(split);
        QVERIFY(manager->isRunning());

        QVERIFY(empty.wait(30000));
        QCOMPARE(complete.count(), 2);
        QCOMPARE(started.count(), 2);

        const auto first = complete.at(0).at(0).value<MixerOps::JobResult>();
        const auto second = complete.at(1).at(0).value<MixerOps::JobResult>();
        QCOMPARE(first.command, MixerOps::Command::Reverse);
        QVERIFY(first.allSucceeded());
        QCOMPARE(second.command, MixerOps::Command::Split);
        QCOMPARE(second.successCount, 2);

        QVERIFY(QFile::exists(dir.filePath("reversed_doc.pdf")));
        QVERIFY(QFile::exists(dir.filePath("parts/doc_part_3-3.pdf")));
        QVERIFY(!manager->isRunning());
    }

    void testFailedJobIsReported() {
        JobQueueManager* manager = JobQueueManager::instance();
        QSignalSpy complete(manager, &JobQueueManager::jobComplete);

        MixerOps::JobSpec job;
        job.command = MixerOps::Command::Split;
        job.pagesPerChunk = 0;
        manager->enqueue(job);

        QVERIFY(complete.wait(30000));
        const auto result = complete.at(0).at(0).value<MixerOps::JobResult>();
        QCOMPARE(result.error, OperationError::ValidationError);
    }

    void testCancelAllWhenIdle() {
        JobQueueManager* manager = JobQueueManager::instance();
        QTRY_VERIFY(!manager->isRunning());
        manager->cancelAll();
        QCOMPARE(manager->queuedJobCount(), 0);
    }
};

#endif // JOBQUEUEMANAGERTESTS_H
