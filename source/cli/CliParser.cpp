#include "CliParser.h"
#include "CliHandler.h"
#include "CliSignal.h"

#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTextStream>
#include <cstring>

/**
 * @file CliParser.cpp
 * @brief Implementation of CLI argument parsing.
 *
 * @see CliParser.h for API documentation
 */

namespace Cli {

// Application version (matches CMakeLists.txt project VERSION)
static const char* APP_VERSION = "1.2.0";

struct CommandEntry {
    const char* name;
    Command command;
};

static const CommandEntry COMMANDS[] = {
    { "merge",      Command::Merge },
    { "interleave", Command::Interleave },
    { "extract",    Command::Extract },
    { "delete",     Command::Delete },
    { "rotate",     Command::Rotate },
    { "reverse",    Command::Reverse },
    { "split",      Command::Split },
    { "landscape",  Command::Landscape },
    { "images",     Command::Images },
};

// =============================================================================
// Command Detection
// =============================================================================

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }

    const char* arg1 = argv[1];

    for (const CommandEntry& entry : COMMANDS) {
        if (std::strcmp(arg1, entry.name) == 0) {
            return entry.command;
        }
    }

    if (std::strcmp(arg1, "--help") == 0 || std::strcmp(arg1, "-h") == 0) {
        return Command::Help;
    }
    if (std::strcmp(arg1, "--version") == 0 || std::strcmp(arg1, "-v") == 0) {
        return Command::Version;
    }

    return Command::None;
}

QString commandName(Command cmd)
{
    for (const CommandEntry& entry : COMMANDS) {
        if (entry.command == cmd) {
            return QString::fromLatin1(entry.name);
        }
    }
    if (cmd == Command::Help) {
        return QStringLiteral("help");
    }
    if (cmd == Command::Version) {
        return QStringLiteral("version");
    }
    return QString();
}

// =============================================================================
// Parser Setup
// =============================================================================

static void addOption(QCommandLineParser& parser, const QString& name,
                      const char* description, const QString& valueName = QString())
{
    parser.addOption(QCommandLineOption(
        name, QCoreApplication::translate("CLI", description), valueName));
}

static void addInputArgument(QCommandLineParser& parser, const char* description,
                             const QString& syntax = QStringLiteral("<input.pdf>..."))
{
    parser.addPositionalArgument(QStringLiteral("input"),
                                 QCoreApplication::translate("CLI", description),
                                 syntax);
}

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(
        QCoreApplication::translate("CLI", "PdfMixer - page operations on PDF files without metadata"));

    parser.addHelpOption();
    parser.addVersionOption();

    if (cmd == Command::None || cmd == Command::Help || cmd == Command::Version) {
        return;
    }

    // Common options
    parser.addOption(QCommandLineOption(
        {QStringLiteral("o"), QStringLiteral("output")},
        QCoreApplication::translate("CLI", "Output file (single output) or directory"),
        QStringLiteral("path")));
    addOption(parser, QStringLiteral("overwrite"), "Overwrite existing output files");
    addOption(parser, QStringLiteral("dry-run"), "Preview without creating files");
    addOption(parser, QStringLiteral("verbose"), "Show detailed progress and debug output");
    addOption(parser, QStringLiteral("json"), "Output results as JSON");

    switch (cmd) {
        case Command::Merge:
            addInputArgument(parser, "PDF files or directories, merged in the order given",
                             QStringLiteral("<input>..."));
            addOption(parser, QStringLiteral("recursive"), "Search input directories recursively");
            addOption(parser, QStringLiteral("skip-invalid"), "Skip unreadable inputs instead of failing");
            break;

        case Command::Interleave:
            addInputArgument(parser, "Document A and document B",
                             QStringLiteral("<a.pdf> <b.pdf>"));
            addOption(parser, QStringLiteral("mode"),
                      "alternate, a-odd-b-even, a-even-b-odd, a-odd or b-even", QStringLiteral("mode"));
            addOption(parser, QStringLiteral("start"), "First page position to use (default: 1)",
                      QStringLiteral("N"));
            addOption(parser, QStringLiteral("save-defaults"), "Remember --mode as the default");
            break;

        case Command::Extract:
        case Command::Delete:
            addInputArgument(parser, "PDF files");
            addOption(parser, QStringLiteral("pages"), "Page range, e.g. \"1-3,5,12-10\"",
                      QStringLiteral("range"));
            break;

        case Command::Rotate:
            addInputArgument(parser, "PDF files");
            addOption(parser, QStringLiteral("pages"), "Page range (default: all pages)",
                      QStringLiteral("range"));
            addOption(parser, QStringLiteral("degrees"), "Multiple of 90, negative turns left",
                      QStringLiteral("N"));
            addOption(parser, QStringLiteral("save-defaults"), "Remember --degrees as the default");
            break;

        case Command::Reverse:
        case Command::Landscape:
            addInputArgument(parser, "PDF files");
            break;

        case Command::Split:
            addInputArgument(parser, "PDF files");
            addOption(parser, QStringLiteral("every"), "Pages per output file", QStringLiteral("N"));
            addOption(parser, QStringLiteral("save-defaults"), "Remember --every as the default");
            break;

        case Command::Images:
            addInputArgument(parser, "Image files or directories", QStringLiteral("<image>..."));
            addOption(parser, QStringLiteral("page-size"), "A4, A3, Letter or Legal",
                      QStringLiteral("size"));
            addOption(parser, QStringLiteral("margin"), "Margin in millimetres", QStringLiteral("mm"));
            addOption(parser, QStringLiteral("dpi"), "Image resolution (72-600)", QStringLiteral("N"));
            addOption(parser, QStringLiteral("no-fit"), "Size each page to its image instead of paper");
            addOption(parser, QStringLiteral("no-keep-aspect"), "Stretch images to the printable area");
            addOption(parser, QStringLiteral("no-center"), "Place images at the top-left margin");
            addOption(parser, QStringLiteral("no-sort"), "Keep the given order instead of sorting by name");
            addOption(parser, QStringLiteral("recursive"), "Search input directories recursively");
            addOption(parser, QStringLiteral("save-defaults"), "Remember the layout options as defaults");
            break;

        default:
            break;
    }
}

// =============================================================================
// Help and Version
// =============================================================================

static QString generalHelp()
{
    return QCoreApplication::translate("CLI",
        "Usage: pdfmixer <command> [options] <inputs...>\n"
        "\n"
        "PdfMixer - page operations on PDF files.\n"
        "Every written file goes through a rewrite that keeps page content only:\n"
        "document info, XMP metadata and page metadata are not carried over.\n"
        "\n"
        "COMMANDS:\n"
        "  merge        Concatenate PDFs\n"
        "  interleave   Combine two PDFs page by page\n"
        "  extract      Keep the pages in a range, in range order\n"
        "  delete       Remove the pages in a range\n"
        "  rotate       Rotate pages by multiples of 90 degrees\n"
        "  reverse      Reverse the page order\n"
        "  split        Split into files of N pages\n"
        "  landscape    Rotate portrait pages to landscape\n"
        "  images       Build a PDF from images\n"
        "\n"
        "GLOBAL OPTIONS:\n"
        "  -h, --help      Show this help message\n"
        "  -v, --version   Show version information\n"
        "\n"
        "COMMON OPTIONS:\n"
        "  -o, --output    Output file or directory (default: next to the input)\n"
        "  --overwrite     Overwrite existing files\n"
        "  --dry-run       Preview without creating files\n"
        "  --verbose       Show detailed progress\n"
        "  --json          Output results as JSON (for scripting)\n"
        "\n"
        "PAGE RANGES:\n"
        "  \"1-3,5,10\" selects 1, 2, 3, 5, 10. \"12-10\" selects 12, 11, 10.\n"
        "  Malformed parts and pages outside the document are ignored.\n"
        "\n"
        "EXIT CODES:\n"
        "  0   All outputs written\n"
        "  1   Some outputs were skipped or failed\n"
        "  2   Nothing could be written\n"
        "  3   Invalid arguments\n"
        "  4   Input file missing or unreadable\n"
        "  5   Cancelled (Ctrl+C)\n"
        "\n"
        "Run 'pdfmixer <command> --help' for command-specific options.\n");
}

static QString commandExamples(Command cmd)
{
    switch (cmd) {
        case Command::Merge:
            return QCoreApplication::translate("CLI",
                "  pdfmixer merge a.pdf b.pdf -o all.pdf\n"
                "  pdfmixer merge ~/Scans/ --skip-invalid\n");
        case Command::Interleave:
            return QCoreApplication::translate("CLI",
                "  pdfmixer interleave fronts.pdf backs.pdf\n"
                "  pdfmixer interleave a.pdf b.pdf --mode a-odd-b-even --start 3\n");
        case Command::Extract:
            return QCoreApplication::translate("CLI",
                "  pdfmixer extract report.pdf --pages \"1-3,10\"\n"
                "  pdfmixer extract report.pdf --pages \"12-10\" -o tail.pdf\n");
        case Command::Delete:
            return QCoreApplication::translate("CLI",
                "  pdfmixer delete report.pdf --pages \"2,4-6\"\n");
        case Command::Rotate:
            return QCoreApplication::translate("CLI",
                "  pdfmixer rotate scan.pdf --degrees 180\n"
                "  pdfmixer rotate scan.pdf --pages \"1,3\" --degrees -90\n");
        case Command::Reverse:
            return QCoreApplication::translate("CLI",
                "  pdfmixer reverse backs.pdf\n");
        case Command::Split:
            return QCoreApplication::translate("CLI",
                "  pdfmixer split book.pdf --every 10 -o ~/Chapters/\n");
        case Command::Landscape:
            return QCoreApplication::translate("CLI",
                "  pdfmixer landscape sheet.pdf\n");
        case Command::Images:
            return QCoreApplication::translate("CLI",
                "  pdfmixer images ~/Photos/ --page-size Letter --margin 5\n"
                "  pdfmixer images a.png b.jpg --no-fit --dpi 150 -o photos.pdf\n");
        default:
            return QString();
    }
}

void showHelp(const QCommandLineParser& parser, Command cmd)
{
    QTextStream out(stdout);

    if (cmd == Command::None || cmd == Command::Help || cmd == Command::Version) {
        out << generalHelp();
        return;
    }

    out << QCoreApplication::translate("CLI", "Command: %1\n\n").arg(commandName(cmd));
    out << parser.helpText();
    out << QCoreApplication::translate("CLI", "\nExamples:\n") << commandExamples(cmd);
}

void showVersion()
{
    QTextStream out(stdout);
    out << "PdfMixer " << APP_VERSION << "\n";
}

// =============================================================================
// Logging
// =============================================================================

/**
 * @brief Silence debug logging unless --verbose; keep stderr JSON-only in --json mode.
 */
static void configureLogging(OutputMode mode)
{
    if (mode == OutputMode::Verbose) {
        return;
    }

    QString rules = QStringLiteral("*.debug=false");
    if (mode == OutputMode::Json) {
        rules += QStringLiteral("\n*.warning=false");
    }
    QLoggingCategory::setFilterRules(rules);
}

// =============================================================================
// Main Entry Point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    Q_UNUSED(app)

    installSignalHandlers();

    Command cmd = parseCommand(argc, argv);

    if (cmd == Command::Version) {
        showVersion();
        return ExitCode::Success;
    }

    if (cmd == Command::Help || cmd == Command::None) {
        QCommandLineParser parser;
        setupParser(parser, Command::None);
        if (cmd == Command::None && argc >= 2) {
            QTextStream err(stderr);
            err << QCoreApplication::translate("CLI", "Error: unknown command '%1'\n\n")
                   .arg(QString::fromLocal8Bit(argv[1]));
        }
        showHelp(parser, cmd);
        return (cmd == Command::Help) ? ExitCode::Success : ExitCode::InvalidArgs;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    // QCommandLineParser doesn't understand subcommands: drop the command name
    QStringList args;
    args << QString::fromLocal8Bit(argv[0]);
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }

    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << QCoreApplication::translate("CLI", "Error: ")
            << parser.errorText() << "\n\n";
        showHelp(parser, cmd);
        return ExitCode::InvalidArgs;
    }

    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(parser, cmd);
        return ExitCode::Success;
    }

    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    configureLogging(getOutputMode(parser));

    switch (cmd) {
        case Command::Merge:
            return handleMerge(parser);
        case Command::Interleave:
            return handleInterleave(parser);
        case Command::Extract:
        case Command::Delete:
            return handleRangeCommand(parser, cmd);
        case Command::Rotate:
            return handleRotate(parser);
        case Command::Reverse:
        case Command::Landscape:
            return handleSimpleCommand(parser, cmd);
        case Command::Split:
            return handleSplit(parser);
        case Command::Images:
            return handleImages(parser);
        default:
            return ExitCode::InvalidArgs;
    }
}

} // namespace Cli
