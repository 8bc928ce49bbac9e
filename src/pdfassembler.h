#ifndef PDFASSEMBLER_H
#define PDFASSEMBLER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QImage>
#include <atomic>

struct PdfOptions {
    int resolution;        // Dots per inch used to map image pixels to page size
    bool reduceFileSize;   // Re-encode pages as JPEG
    int jpegQuality;       // 1-100, used when reduceFileSize is set
    int targetHeight;      // Downscale pages taller than this (0 = original)

    PdfOptions() :
        resolution(100),
        reduceFileSize(false),
        jpegQuality(75),
        targetHeight(0)
    {}
};

/**
 * @brief Writes an ordered list of images into a PDF, one page per image
 *
 * Each page takes the size of its image so orientation and aspect ratio are
 * preserved. The document is written through QSaveFile and only appears at
 * the output path once every page has been written.
 */
class PdfAssembler : public QObject
{
    Q_OBJECT

public:
    explicit PdfAssembler(QObject *parent = nullptr);

    /**
     * @brief Assemble the images into a PDF document
     * @param imagePaths Image files in page order
     * @param outputPath Destination PDF path
     * @param options Page rendering options
     * @return true on success; lastError() describes a failure
     */
    bool assemble(const QStringList& imagePaths, const QString& outputPath,
                  const PdfOptions& options = PdfOptions());

    QString lastError() const { return m_lastError; }
    int pagesWritten() const { return m_pagesWritten; }

    void requestCancel();
    void resetCancel();

signals:
    void progressUpdated(int current, int total);

private:
    /**
     * @brief Load an image and apply the resize / re-encode options
     * @return Prepared image, null on failure (m_lastError is set)
     */
    QImage preparePage(const QString& imagePath, const PdfOptions& options);

    bool fail(const QString& message);

    QString m_lastError;
    int m_pagesWritten;
    std::atomic<bool> m_shouldCancel;
};

#endif // PDFASSEMBLER_H
