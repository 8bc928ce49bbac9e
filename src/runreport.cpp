#include "runreport.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QDebug>

bool RunReport::isFatal() const
{
    return status == RunStatus::ConfigurationError || status == RunStatus::AssemblyError;
}

QString RunReport::statusName() const
{
    return statusName(status);
}

QString RunReport::statusName(RunStatus status)
{
    switch (status) {
        case RunStatus::Success:
            return "success";
        case RunStatus::EmptyInput:
            return "empty-input";
        case RunStatus::PartialFailure:
            return "partial-failure";
        case RunStatus::ConfigurationError:
            return "configuration-error";
        case RunStatus::AssemblyError:
            return "assembly-error";
        case RunStatus::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

QJsonObject RunReport::toJson() const
{
    QJsonObject root;
    root["version"] = "1.0";
    root["status"] = statusName();
    root["inputDirectory"] = inputDirectory;
    root["outputFile"] = outputFile;
    root["algorithm"] = algorithm;
    root["threshold"] = threshold;
    root["totalFrames"] = totalFrames;
    root["duplicateCount"] = duplicateCount;
    root["pagesWritten"] = pagesWritten;
    root["elapsedSeconds"] = elapsedSeconds;

    if (!errorMessage.isEmpty()) {
        root["error"] = errorMessage;
    }

    root["retainedFrames"] = QJsonArray::fromStringList(retainedFrames);

    QJsonArray skippedArray;
    for (const SkippedFrame& skipped : skippedFrames) {
        QJsonObject obj;
        obj["path"] = skipped.path;
        obj["reason"] = skipped.reason;
        skippedArray.append(obj);
    }
    root["skippedFrames"] = skippedArray;

    return root;
}

bool RunReport::saveJson(const QString& filePath, QString* errorMessage) const
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (errorMessage) {
            *errorMessage = QString("Failed to open report file %1: %2").arg(filePath, file.errorString());
        }
        qWarning() << "RunReport: Failed to open report file for writing:" << filePath;
        return false;
    }

    QJsonDocument doc(toJson());
    file.write(doc.toJson(QJsonDocument::Indented));

    if (!file.commit()) {
        if (errorMessage) {
            *errorMessage = QString("Failed to write report file %1: %2").arg(filePath, file.errorString());
        }
        qWarning() << "RunReport: Failed to write report file:" << filePath;
        return false;
    }

    return true;
}
