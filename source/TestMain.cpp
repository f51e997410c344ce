// ============================================================================
// TestMain - Runs the QTest suites
// ============================================================================
// Usage: pdfmixer_tests [suite] [QTest options...]
//
// Suites: pagerange, transforms, settings, backend, images, jobs, queue, cli.
// Without a suite name (or with "all") every suite runs.
// ============================================================================

#include "core/MixerSettingsTests.h"
#include "core/PageRangeTests.h"
#include "core/PageTransformsTests.h"
#include "pdf/ImageConverterTests.h"
#include "pdf/PdfBackendTests.h"
#include "batch/JobQueueManagerTests.h"
#include "batch/MixerOperationsTests.h"
#include "cli/CliTests.h"

#include <QCoreApplication>
#include <QStringList>
#include <QTest>

#include <cstdio>
#include <functional>

namespace {

struct Suite {
    const char* name;
    std::function<int(const QStringList&)> run;
};

template <typename T>
int runSuite(const QStringList& args)
{
    T tests;
    return QTest::qExec(&tests, args);
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("PdfMixer");
    QCoreApplication::setApplicationName("AppTests");

    const Suite suites[] = {
        {"pagerange",  runSuite<PageRangeTests>},
        {"transforms", runSuite<PageTransformsTests>},
        {"settings",   runSuite<MixerSettingsTests>},
        {"backend",    runSuite<PdfBackendTests>},
        {"images",     runSuite<ImageConverterTests>},
        {"jobs",       runSuite<MixerOperationsTests>},
        {"queue",      runSuite<JobQueueManagerTests>},
        {"cli",        runSuite<CliTests>},
    };

    QStringList args = app.arguments();
    QString selected = QStringLiteral("all");
    if (args.size() > 1 && !args.at(1).startsWith('-')) {
        selected = args.takeAt(1);
    }

    bool matched = false;
    int failures = 0;
    for (const Suite& suite : suites) {
        if (selected != QLatin1String("all") && selected != QLatin1String(suite.name)) {
            continue;
        }
        matched = true;
        failures += suite.run(args);
    }

    if (!matched) {
        std::fprintf(stderr, "Unknown test suite: %s\n", qPrintable(selected));
        return 1;
    }
    return failures;
}
