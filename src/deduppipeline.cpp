#include "deduppipeline.h"
#include "framecollector.h"
#include <QDebug>
#include <QFileInfo>

DedupPipeline::DedupPipeline(const AppConfig& config, QObject *parent)
    : QObject(parent),
      m_config(config),
      m_shouldCancel(false)
{
    m_deduplicator = std::make_unique<Deduplicator>();
    m_assembler = std::make_unique<PdfAssembler>();

    connect(m_deduplicator.get(), &Deduplicator::fingerprintProgress, this, [this](int current, int total) {
        emit progressUpdated("fingerprint", current, total);
    });
    connect(m_deduplicator.get(), &Deduplicator::frameSkipped,
            this, &DedupPipeline::frameSkipped);
    connect(m_assembler.get(), &PdfAssembler::progressUpdated, this, [this](int current, int total) {
        emit progressUpdated("pdf", current, total);
    });
}

DedupPipeline::~DedupPipeline() = default;

void DedupPipeline::requestCancel()
{
    m_shouldCancel.store(true);
    m_deduplicator->requestCancel();
    m_assembler->requestCancel();
}

bool DedupPipeline::checkOutputPath(const QString& outputFile, QString* errorMessage)
{
    auto setError = [errorMessage](const QString& message) {
        if (errorMessage) {
            *errorMessage = message;
        }
        return false;
    };

    if (outputFile.trimmed().isEmpty()) {
        return setError("Output file path is empty");
    }

    QFileInfo outputInfo(outputFile);
    if (outputInfo.exists() && outputInfo.isDir()) {
        return setError(QString("Output path is a folder: %1").arg(outputFile));
    }
    if (outputInfo.exists() && !outputInfo.isWritable()) {
        return setError(QString("Output file is not writable: %1").arg(outputFile));
    }

    QFileInfo parentInfo(outputInfo.absolutePath());
    if (!parentInfo.exists() || !parentInfo.isDir()) {
        return setError(QString("Output folder does not exist: %1").arg(outputInfo.absolutePath()));
    }
    if (!parentInfo.isWritable()) {
        return setError(QString("Output folder is not writable: %1").arg(outputInfo.absolutePath()));
    }

    return true;
}

RunReport DedupPipeline::finish(RunReport report, RunStatus status, const QString& errorMessage)
{
    report.status = status;
    if (!errorMessage.isEmpty()) {
        report.errorMessage = errorMessage;
    }
    report.elapsedSeconds = m_timer.elapsed() / 1000.0;

    if (report.isFatal()) {
        qCritical().noquote() << "DedupPipeline:" << report.statusName() << "-" << report.errorMessage;
    } else {
        qInfo().noquote() << "DedupPipeline: Finished with status" << report.statusName();
    }
    return report;
}

RunReport DedupPipeline::run(const QString& inputDirectory, const QString& outputFile)
{
    m_timer.start();
    m_shouldCancel.store(false);
    m_deduplicator->resetCancel();
    m_assembler->resetCancel();

    RunReport report;
    report.inputDirectory = inputDirectory;
    report.outputFile = outputFile;
    report.threshold = m_config.hammingThreshold;
    report.algorithm = ConfigManager::getAlgorithmName(m_config.hashAlgorithm);

    // Step 1: Validate everything before touching any frame
    QString error;
    if (!ConfigManager::validate(m_config, &error)) {
        return finish(report, RunStatus::ConfigurationError, error);
    }
    if (!checkOutputPath(outputFile, &error)) {
        return finish(report, RunStatus::ConfigurationError, error);
    }

    std::unique_ptr<ImageFingerprinter> fingerprinter =
        ImageFingerprinter::create(m_config.hashAlgorithm, m_config.hashSize);
    if (!fingerprinter) {
        return finish(report, RunStatus::ConfigurationError,
                      QString("Cannot create %1 fingerprinter with hash size %2")
                          .arg(report.algorithm).arg(m_config.hashSize));
    }

    // Step 2: Collect frames in natural order
    emit stageChanged("collect");
    CollectionResult collection = FrameCollector::collect(inputDirectory, m_config.numericNamesOnly);
    if (collection.status == CollectionStatus::ConfigurationError) {
        return finish(report, RunStatus::ConfigurationError, collection.errorMessage);
    }
    if (collection.status == CollectionStatus::EmptyInput) {
        return finish(report, RunStatus::EmptyInput, collection.errorMessage);
    }
    report.totalFrames = collection.imagePaths.size();

    qInfo().noquote() << "DedupPipeline:" << report.totalFrames << "frames, algorithm"
                      << fingerprinter->name() << QString("(%1 bits)").arg(fingerprinter->bitLength())
                      << "threshold" << m_config.hammingThreshold;

    // Step 3: Fingerprint and deduplicate
    emit stageChanged("deduplicate");
    DeduplicationResult dedup = m_deduplicator->run(collection.imagePaths,
                                                    m_config.hammingThreshold,
                                                    *fingerprinter,
                                                    m_config.workerThreads);
    report.duplicateCount = dedup.duplicateCount;
    report.skippedFrames = dedup.skipped;
    for (const Frame& frame : dedup.retained) {
        report.retainedFrames.append(frame.path);
    }

    if (dedup.cancelled || m_shouldCancel.load()) {
        return finish(report, RunStatus::Cancelled, "Run cancelled");
    }
    if (dedup.retained.empty()) {
        return finish(report, RunStatus::EmptyInput,
                      QString("None of the %1 frames could be read").arg(report.totalFrames));
    }

    // Step 4: Assemble the document
    emit stageChanged("pdf");
    if (!m_assembler->assemble(report.retainedFrames, outputFile, m_config.pdfOptions())) {
        if (m_shouldCancel.load()) {
            return finish(report, RunStatus::Cancelled, "Run cancelled");
        }
        return finish(report, RunStatus::AssemblyError, m_assembler->lastError());
    }
    report.pagesWritten = m_assembler->pagesWritten();

    if (report.warningCount() > 0) {
        return finish(report, RunStatus::PartialFailure,
                      QString("%1 frame(s) could not be read and were skipped").arg(report.warningCount()));
    }
    return finish(report, RunStatus::Success);
}
