#include "pdfassembler.h"
#include <QBuffer>
#include <QDebug>
#include <QImageReader>
#include <QMarginsF>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QSaveFile>

PdfAssembler::PdfAssembler(QObject *parent)
    : QObject(parent), m_pagesWritten(0), m_shouldCancel(false)
{
}

void PdfAssembler::requestCancel()
{
    m_shouldCancel.store(true);
}

void PdfAssembler::resetCancel()
{
    m_shouldCancel.store(false);
}

bool PdfAssembler::fail(const QString& message)
{
    m_lastError = message;
    qWarning().noquote() << "PdfAssembler:" << message;
    return false;
}

QImage PdfAssembler::preparePage(const QString& imagePath, const PdfOptions& options)
{
    QImageReader reader(imagePath);
    reader.setAutoTransform(true);  // Honour EXIF orientation
    QImage image = reader.read();

    if (image.isNull()) {
        m_lastError = QString("Failed to load image %1: %2").arg(imagePath, reader.errorString());
        return QImage();
    }

    // Apply resize if needed
    if (options.targetHeight > 0 && image.height() > options.targetHeight) {
        image = image.scaledToHeight(options.targetHeight, Qt::SmoothTransformation);
    }

    // Optionally reduce quality
    if (options.reduceFileSize) {
        QBuffer buffer;
        buffer.open(QIODevice::WriteOnly);
        if (!image.save(&buffer, "JPEG", options.jpegQuality)) {
            m_lastError = QString("Failed to re-encode image %1").arg(imagePath);
            return QImage();
        }
        buffer.close();

        QImage reencoded;
        if (!reencoded.loadFromData(buffer.data(), "JPEG")) {
            m_lastError = QString("Failed to decode re-encoded image %1").arg(imagePath);
            return QImage();
        }
        image = reencoded;
    }

    return image;
}

bool PdfAssembler::assemble(const QStringList& imagePaths, const QString& outputPath,
                            const PdfOptions& options)
{
    m_lastError.clear();
    m_pagesWritten = 0;

    if (imagePaths.isEmpty()) {
        return fail("No images to write");
    }
    if (options.resolution <= 0) {
        return fail(QString("Invalid PDF resolution: %1").arg(options.resolution));
    }

    QSaveFile file(outputPath);
    if (!file.open(QIODevice::WriteOnly)) {
        return fail(QString("Cannot open %1 for writing: %2").arg(outputPath, file.errorString()));
    }

    const int total = imagePaths.size();
    emit progressUpdated(0, total);

    // Point size of a page showing the image at the configured resolution
    auto pageSizeFor = [&options](const QImage& image) {
        const double pointsPerPixel = 72.0 / options.resolution;
        // ExactMatch keeps the page from snapping to a nearby standard paper size
        return QPageSize(QSizeF(image.width() * pointsPerPixel, image.height() * pointsPerPixel),
                         QPageSize::Point, QString(), QPageSize::ExactMatch);
    };

    QImage firstImage = preparePage(imagePaths.first(), options);
    if (firstImage.isNull()) {
        file.cancelWriting();
        return fail(m_lastError);
    }

    QPdfWriter writer(&file);
    writer.setResolution(options.resolution);
    writer.setPageMargins(QMarginsF(0, 0, 0, 0));
    writer.setPageSize(pageSizeFor(firstImage));
    writer.setCreator("SlidesDedup");

    QPainter painter;
    if (!painter.begin(&writer)) {
        file.cancelWriting();
        return fail(QString("Cannot start PDF output for %1").arg(outputPath));
    }
    painter.setRenderHint(QPainter::SmoothPixmapTransform);

    for (int i = 0; i < total; ++i) {
        if (m_shouldCancel.load()) {
            painter.end();
            file.cancelWriting();
            return fail("PDF generation cancelled");
        }

        QImage image = (i == 0) ? firstImage : preparePage(imagePaths[i], options);
        if (image.isNull()) {
            painter.end();
            file.cancelWriting();
            return fail(m_lastError);
        }

        if (i > 0) {
            // Page size changes apply to the page started by newPage()
            writer.setPageSize(pageSizeFor(image));
            if (!writer.newPage()) {
                painter.end();
                file.cancelWriting();
                return fail(QString("Failed to start page %1").arg(i + 1));
            }
        }

        // Draw image to fill the page
        QRect pageRect(0, 0, writer.width(), writer.height());
        painter.drawImage(pageRect, image);

        m_pagesWritten++;
        emit progressUpdated(m_pagesWritten, total);
    }

    painter.end();

    if (!file.commit()) {
        m_pagesWritten = 0;
        return fail(QString("Failed to write %1: %2").arg(outputPath, file.errorString()));
    }

    qInfo().noquote() << "PdfAssembler: Wrote" << m_pagesWritten << "pages to" << outputPath;
    return true;
}
