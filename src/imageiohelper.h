#ifndef IMAGEIOHELPER_H
#define IMAGEIOHELPER_H

#include <QString>
#include <QFile>
#include <opencv2/opencv.hpp>
#include <vector>

/**
 * Helper for Unicode-safe frame reading
 *
 * cv::imread() does not accept Unicode paths on every platform, so frames are
 * read through QFile and decoded from memory with cv::imdecode().
 */
class ImageIOHelper
{
public:
    /**
     * Read and decode an image file
     * @param filePath Path to the image (supports Unicode)
     * @param errorMessage Optional output, set to the failure reason
     * @param flags OpenCV imdecode flags (e.g., cv::IMREAD_COLOR)
     * @return Decoded image (empty if the file could not be read or decoded)
     */
    static cv::Mat readFrame(const QString& filePath, QString* errorMessage = nullptr,
                             int flags = cv::IMREAD_COLOR)
    {
        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly)) {
            setError(errorMessage, QString("cannot open file: %1").arg(file.errorString()));
            return cv::Mat();
        }

        QByteArray fileData = file.readAll();
        file.close();

        if (fileData.isEmpty()) {
            setError(errorMessage, "file is empty");
            return cv::Mat();
        }

        std::vector<uchar> buffer(fileData.begin(), fileData.end());
        cv::Mat image;
        try {
            image = cv::imdecode(buffer, flags);
        } catch (const cv::Exception& e) {
            setError(errorMessage, QString("decoder error: %1").arg(QString::fromStdString(e.what())));
            return cv::Mat();
        }

        if (image.empty()) {
            setError(errorMessage, "unsupported or corrupt image data");
        }
        return image;
    }

private:
    static void setError(QString* errorMessage, const QString& reason)
    {
        if (errorMessage) {
            *errorMessage = reason;
        }
    }
};

#endif // IMAGEIOHELPER_H
