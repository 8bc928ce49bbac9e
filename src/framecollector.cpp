#include "framecollector.h"
#include "naturalsort.h"
#include <QDir>
#include <QFileInfo>
#include <QRegularExpression>
#include <QDebug>

QStringList FrameCollector::imageNameFilters()
{
    return QStringList() << "*.jpg" << "*.jpeg" << "*.png" << "*.bmp";
}

bool FrameCollector::isFrameFileName(const QString& fileName, bool numericNamesOnly)
{
    static const QRegularExpression anyImage(
        "^.+\\.(jpg|jpeg|png|bmp)$", QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression numericImage(
        "^\\d+\\.(jpg|jpeg|png|bmp)$", QRegularExpression::CaseInsensitiveOption);

    const QRegularExpression& pattern = numericNamesOnly ? numericImage : anyImage;
    return pattern.match(fileName).hasMatch();
}

CollectionResult FrameCollector::collect(const QString& folderPath, bool numericNamesOnly)
{
    CollectionResult result;

    QFileInfo folderInfo(folderPath);
    if (!folderInfo.exists()) {
        result.status = CollectionStatus::ConfigurationError;
        result.errorMessage = QString("Input folder does not exist: %1").arg(folderPath);
        return result;
    }
    if (!folderInfo.isDir()) {
        result.status = CollectionStatus::ConfigurationError;
        result.errorMessage = QString("Input path is not a folder: %1").arg(folderPath);
        return result;
    }
    if (!folderInfo.isReadable()) {
        result.status = CollectionStatus::ConfigurationError;
        result.errorMessage = QString("Input folder is not readable: %1").arg(folderPath);
        return result;
    }

    QDir dir(folderPath);
    // QDir name filters are case-insensitive by default
    QStringList names = dir.entryList(imageNameFilters(), QDir::Files, QDir::NoSort);

    QStringList frameNames;
    for (const QString& name : names) {
        if (isFrameFileName(name, numericNamesOnly)) {
            frameNames.append(name);
        }
    }

    if (frameNames.isEmpty()) {
        result.status = CollectionStatus::EmptyInput;
        result.errorMessage = QString("No image files found in: %1").arg(folderPath);
        return result;
    }

    NaturalSort::sort(frameNames);

    for (const QString& name : frameNames) {
        result.imagePaths.append(dir.absoluteFilePath(name));
    }

    qDebug() << "FrameCollector: Collected" << result.imagePaths.size() << "frames from" << folderPath;
    return result;
}
