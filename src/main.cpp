#include <QGuiApplication>
#include <QCommandLineParser>
#include <QTextStream>
#include <QDir>
#include "configmanager.h"
#include "deduppipeline.h"
#include "interrupthandler.h"

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitConfigurationError = 1,
    ExitAssemblyError = 2,
    ExitCancelled = 3,
    ExitUsage = 64
};

bool g_verbose = false;

void messageHandler(QtMsgType type, const QMessageLogContext&, const QString& message)
{
    // Debug and info output is only shown with --verbose
    if ((type == QtDebugMsg || type == QtInfoMsg) && !g_verbose) {
        return;
    }

    const char* level = "info";
    switch (type) {
        case QtDebugMsg:    level = "debug"; break;
        case QtInfoMsg:     level = "info"; break;
        case QtWarningMsg:  level = "warning"; break;
        case QtCriticalMsg: level = "error"; break;
        case QtFatalMsg:    level = "fatal"; break;
    }

    QTextStream err(stderr);
    err << "[" << level << "] " << message << Qt::endl;
}

bool parseIntOption(const QCommandLineParser& parser, const QString& name, int& value)
{
    if (!parser.isSet(name)) {
        return true;
    }
    bool ok = false;
    int parsed = parser.value(name).toInt(&ok);
    if (!ok) {
        QTextStream(stderr) << "Invalid value for --" << name << ": " << parser.value(name) << Qt::endl;
        return false;
    }
    value = parsed;
    return true;
}

int exitCodeFor(RunStatus status)
{
    switch (status) {
        case RunStatus::Success:
        case RunStatus::PartialFailure:
        case RunStatus::EmptyInput:
            return ExitOk;
        case RunStatus::ConfigurationError:
            return ExitConfigurationError;
        case RunStatus::AssemblyError:
            return ExitAssemblyError;
        case RunStatus::Cancelled:
            return ExitCancelled;
    }
    return ExitConfigurationError;
}

} // namespace

int main(int argc, char *argv[])
{
    // Only the PDF writer needs the GUI module; no display is required
    if (qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        qputenv("QT_QPA_PLATFORM", "offscreen");
    }

    QGuiApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("slides-dedup");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("SlidesDedup");

    qInstallMessageHandler(messageHandler);

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Removes duplicate lecture slide screenshots and assembles the unique frames into a PDF.");
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOptions({
        {{"i", "input-dir"}, "Folder containing the captured frames (e.g. 1.jpg, 2.jpg, ...).", "dir"},
        {{"o", "output-file"}, "PDF file to write (default: cleaned_lecture.pdf).", "file"},
        {{"t", "threshold"}, "Largest Hamming distance treated as a duplicate (default: 8).", "n"},
        {{"a", "algorithm"}, "Fingerprint algorithm: phash, ahash or dhash (default: phash).", "name"},
        {"hash-size", "Fingerprint grid side, 8 (64 bits) or 16 (256 bits).", "n"},
        {{"j", "jobs"}, "Fingerprint worker threads, 0 = automatic.", "n"},
        {"numeric-names-only", "Only accept files named <digits>.<ext>."},
        {"resolution", "PDF resolution in DPI (default: 100).", "dpi"},
        {"reduce-size", "Re-encode PDF pages as JPEG."},
        {"jpeg-quality", "JPEG quality for --reduce-size, 1-100.", "n"},
        {"max-height", "Downscale pages taller than this many pixels.", "px"},
        {"report", "Write a JSON run report to this file.", "file"},
        {"save-settings", "Persist the effective settings as new defaults."},
        {{"v", "verbose"}, "Print per-frame details."}
    });

    parser.process(app);

    g_verbose = parser.isSet("verbose");

    QTextStream out(stdout);

    if (!parser.isSet("input-dir")) {
        QTextStream(stderr) << "Missing required option --input-dir" << Qt::endl;
        parser.showHelp(ExitUsage);
    }

    // Command-line options override persisted settings
    ConfigManager configManager;
    AppConfig config = configManager.loadConfig();

    if (parser.isSet("output-file")) {
        config.outputFile = parser.value("output-file");
    }
    if (parser.isSet("algorithm")) {
        bool ok = false;
        config.hashAlgorithm = ConfigManager::getAlgorithmFromName(parser.value("algorithm"), &ok);
        if (!ok) {
            QTextStream(stderr) << "Unknown algorithm: " << parser.value("algorithm") << Qt::endl;
            return ExitUsage;
        }
    }
    if (!parseIntOption(parser, "threshold", config.hammingThreshold) ||
        !parseIntOption(parser, "hash-size", config.hashSize) ||
        !parseIntOption(parser, "jobs", config.workerThreads) ||
        !parseIntOption(parser, "resolution", config.pdfResolution) ||
        !parseIntOption(parser, "jpeg-quality", config.jpegQuality) ||
        !parseIntOption(parser, "max-height", config.targetHeight)) {
        return ExitUsage;
    }
    if (parser.isSet("numeric-names-only")) {
        config.numericNamesOnly = true;
    }
    if (parser.isSet("reduce-size")) {
        config.reduceFileSize = true;
    }

    if (parser.isSet("save-settings")) {
        QString error;
        if (!ConfigManager::validate(config, &error)) {
            QTextStream(stderr) << "Settings not saved: " << error << Qt::endl;
            return ExitConfigurationError;
        }
        configManager.saveConfig(config);
        out << "Settings saved to " << configManager.settingsFileName() << Qt::endl;
    }

    const QString inputDir = parser.value("input-dir");

    out << "Input folder:  " << QDir::toNativeSeparators(inputDir) << Qt::endl;
    out << "Output file:   " << QDir::toNativeSeparators(config.outputFile) << Qt::endl;
    out << "Fingerprint:   " << ConfigManager::getAlgorithmName(config.hashAlgorithm)
        << " " << config.hashSize << "x" << config.hashSize
        << ", threshold " << config.hammingThreshold << Qt::endl;

    DedupPipeline pipeline(config);
    InterruptHandler::install(&pipeline);

    QObject::connect(&pipeline, &DedupPipeline::progressUpdated,
                     [&out](const QString& stage, int current, int total) {
        // Print every 50 items and at the end of each stage
        if (current == 0 || (current % 50 != 0 && current != total)) {
            return;
        }
        out << "  " << stage << ": " << current << " / " << total << Qt::endl;
    });
    QObject::connect(&pipeline, &DedupPipeline::frameSkipped,
                     [&out](const QString& filePath, const QString& reason) {
        out << "  skipped " << QDir::toNativeSeparators(filePath) << " (" << reason << ")" << Qt::endl;
    });

    RunReport report = pipeline.run(inputDir, config.outputFile);

    InterruptHandler::uninstall();

    switch (report.status) {
        case RunStatus::Success:
            out << "Done: kept " << report.retainedFrames.size() << " of " << report.totalFrames
                << " frames, " << report.pagesWritten << " pages written." << Qt::endl;
            break;
        case RunStatus::PartialFailure:
            out << "Done with warnings: kept " << report.retainedFrames.size() << " of "
                << report.totalFrames << " frames, " << report.warningCount()
                << " unreadable frame(s) skipped." << Qt::endl;
            break;
        case RunStatus::EmptyInput:
            out << "Nothing to do: " << report.errorMessage << Qt::endl;
            break;
        case RunStatus::Cancelled:
            out << "Cancelled, no PDF written." << Qt::endl;
            break;
        case RunStatus::ConfigurationError:
        case RunStatus::AssemblyError:
            QTextStream(stderr) << "Error (" << report.statusName() << "): " << report.errorMessage << Qt::endl;
            break;
    }

    if (parser.isSet("report")) {
        QString error;
        if (!report.saveJson(parser.value("report"), &error)) {
            QTextStream(stderr) << error << Qt::endl;
        }
    }

    return exitCodeFor(report.status);
}
