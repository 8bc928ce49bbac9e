#ifndef DEDUPPIPELINE_H
#define DEDUPPIPELINE_H

#include <QObject>
#include <QString>
#include <QElapsedTimer>
#include <atomic>
#include <memory>
#include "configmanager.h"
#include "deduplicator.h"
#include "pdfassembler.h"
#include "runreport.h"

/**
 * @brief Runs collection, deduplication and PDF assembly for one folder
 *
 * Configuration problems are reported before any frame is read. Unreadable
 * frames are skipped and counted; a failed PDF write is fatal and leaves no
 * document behind.
 */
class DedupPipeline : public QObject
{
    Q_OBJECT

public:
    explicit DedupPipeline(const AppConfig& config, QObject *parent = nullptr);
    ~DedupPipeline();

    /**
     * Process a folder of frames into a PDF
     * @param inputDirectory Folder containing the captured frames
     * @param outputFile Destination PDF path
     * @return RunReport describing the outcome
     */
    RunReport run(const QString& inputDirectory, const QString& outputFile);

    /**
     * Stop the current run before the next frame or page (thread-safe)
     */
    void requestCancel();
    bool isCancelRequested() const { return m_shouldCancel.load(); }

    /**
     * Check that the output file can be created
     * @param outputFile Destination path
     * @param errorMessage Set to the reason on failure
     */
    static bool checkOutputPath(const QString& outputFile, QString* errorMessage);

    const AppConfig& config() const { return m_config; }

signals:
    void stageChanged(const QString& stage);
    void progressUpdated(const QString& stage, int current, int total);
    void frameSkipped(const QString& filePath, const QString& reason);

private:
    RunReport finish(RunReport report, RunStatus status, const QString& errorMessage = QString());

    AppConfig m_config;
    std::unique_ptr<Deduplicator> m_deduplicator;
    std::unique_ptr<PdfAssembler> m_assembler;
    std::atomic<bool> m_shouldCancel;
    QElapsedTimer m_timer;
};

#endif // DEDUPPIPELINE_H
