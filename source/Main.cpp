// ============================================================================
// PdfMixer - Main Entry Point
// ============================================================================

#include <QCoreApplication>

#include "cli/CliParser.h"

#ifdef Q_OS_WIN
#include <windows.h>
#endif

int main(int argc, char* argv[])
{
#ifdef Q_OS_WIN
    // UTF-8 file names and messages in the console
    SetConsoleOutputCP(CP_UTF8);
#endif

    QCoreApplication app(argc, argv);
    app.setOrganizationName("PdfMixer");
    app.setApplicationName("App");
    app.setApplicationVersion("1.2.0");

    return Cli::run(app, argc, argv);
}
