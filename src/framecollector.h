#ifndef FRAMECOLLECTOR_H
#define FRAMECOLLECTOR_H

#include <QString>
#include <QStringList>

enum class CollectionStatus {
    Ok,
    EmptyInput,
    ConfigurationError
};

struct CollectionResult {
    CollectionStatus status;
    QStringList imagePaths;   // Absolute paths in natural order
    QString errorMessage;

    CollectionResult() : status(CollectionStatus::Ok) {}
};

/**
 * @brief Collects slide frame images from a folder in natural order
 */
class FrameCollector
{
public:
    /**
     * @brief Collect image files from a folder
     * @param folderPath Folder containing the captured frames
     * @param numericNamesOnly Only accept names made of digits plus extension (e.g. "12.jpg")
     * @return CollectionResult with sorted absolute paths or the failure reason
     */
    static CollectionResult collect(const QString& folderPath, bool numericNamesOnly = false);

    /**
     * @brief Check whether a file name qualifies as a frame image
     * @param fileName File name without directory
     * @param numericNamesOnly Require the base name to be digits only
     */
    static bool isFrameFileName(const QString& fileName, bool numericNamesOnly = false);

    /**
     * @brief Name filters for supported image extensions
     */
    static QStringList imageNameFilters();
};

#endif // FRAMECOLLECTOR_H
