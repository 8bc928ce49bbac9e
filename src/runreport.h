#ifndef RUNREPORT_H
#define RUNREPORT_H

#include <QString>
#include <QStringList>
#include <QJsonObject>
#include <vector>
#include "frame.h"

enum class RunStatus {
    Success,
    EmptyInput,
    PartialFailure,
    ConfigurationError,
    AssemblyError,
    Cancelled
};

/**
 * @brief Outcome of one deduplication run
 *
 * Carries everything a front end needs to render the result: the completion
 * status, retained and skipped frames, and the error detail of a failed run.
 */
struct RunReport {
    RunStatus status;
    QString inputDirectory;
    QString outputFile;
    QString algorithm;
    int threshold;
    int totalFrames;
    int duplicateCount;
    int pagesWritten;
    QStringList retainedFrames;
    std::vector<SkippedFrame> skippedFrames;
    QString errorMessage;
    double elapsedSeconds;

    RunReport() :
        status(RunStatus::Success),
        threshold(0),
        totalFrames(0),
        duplicateCount(0),
        pagesWritten(0),
        elapsedSeconds(0.0)
    {}

    int warningCount() const { return static_cast<int>(skippedFrames.size()); }

    /**
     * @brief true for ConfigurationError and AssemblyError
     */
    bool isFatal() const;

    QString statusName() const;
    static QString statusName(RunStatus status);

    QJsonObject toJson() const;

    /**
     * @brief Write the report as an indented JSON document
     * @param filePath Destination path
     * @param errorMessage Set to the reason on failure
     * @return true if saved successfully
     */
    bool saveJson(const QString& filePath, QString* errorMessage = nullptr) const;
};

#endif // RUNREPORT_H
