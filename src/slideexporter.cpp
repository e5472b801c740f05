#include "slideexporter.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QPageLayout>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <algorithm>

namespace {

void setError(QString* errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

QPageLayout::Orientation orientationFor(const QImage& image)
{
    return image.width() >= image.height() ? QPageLayout::Landscape : QPageLayout::Portrait;
}

}

QString SlideExporter::exportFileName(int index, const QString& sourcePath)
{
    QString suffix = QFileInfo(sourcePath).suffix();
    QString extension = suffix.isEmpty() ? QString(".png") : "." + suffix;
    return QString("slide_%1%2").arg(index, 3, 10, QChar('0')).arg(extension);
}

QRectF SlideExporter::fitImageRect(const QSizeF& imageSize, const QSizeF& pageSize, double margin)
{
    if (imageSize.isEmpty()) {
        return QRectF();
    }

    double availableWidth = std::max(0.0, pageSize.width() - 2 * margin);
    double availableHeight = std::max(0.0, pageSize.height() - 2 * margin);
    double scale = std::min(availableWidth / imageSize.width(),
                            availableHeight / imageSize.height());

    double drawWidth = imageSize.width() * scale;
    double drawHeight = imageSize.height() * scale;
    return QRectF((pageSize.width() - drawWidth) / 2,
                  (pageSize.height() - drawHeight) / 2,
                  drawWidth, drawHeight);
}

QString SlideExporter::defaultPdfPath(const QString& videoPath)
{
    QFileInfo info(videoPath);
    return info.dir().filePath(info.completeBaseName() + "_extracted-slides.pdf");
}

QString SlideExporter::defaultExportFolder(const QString& videoPath)
{
    QFileInfo info(videoPath);
    return info.dir().filePath(info.completeBaseName() + "_extracted-slides");
}

bool SlideExporter::buildPdf(const QStringList& imagePaths, const QString& pdfPath,
                             double margin, QString* errorMessage)
{
    if (imagePaths.isEmpty()) {
        setError(errorMessage, "No images selected.");
        return false;
    }

    // Load the first page up front so its orientation is set before painting starts
    QImage firstImage(imagePaths.first());
    if (firstImage.isNull()) {
        setError(errorMessage, "Failed to load image: " + imagePaths.first());
        return false;
    }

    qInfo().noquote() << QString("Building PDF: %1 slides -> %2").arg(imagePaths.size()).arg(pdfPath);

    QPdfWriter writer(pdfPath);
    writer.setResolution(72);  // 1 device pixel = 1 point
    writer.setPageLayout(QPageLayout(QPageSize(QPageSize::A4), orientationFor(firstImage),
                                     QMarginsF(0, 0, 0, 0), QPageLayout::Point));

    QPainter painter;
    if (!painter.begin(&writer)) {
        setError(errorMessage, "Cannot write PDF: " + pdfPath);
        return false;
    }
    painter.setRenderHint(QPainter::SmoothPixmapTransform);

    for (int i = 0; i < imagePaths.size(); i++) {
        QImage image = (i == 0) ? firstImage : QImage(imagePaths[i]);
        if (image.isNull()) {
            painter.end();
            setError(errorMessage, "Failed to load image: " + imagePaths[i]);
            return false;
        }

        if (i > 0) {
            writer.setPageOrientation(orientationFor(image));
            writer.newPage();
        }

        QSizeF pageSize = writer.pageLayout().fullRect(QPageLayout::Point).size();
        painter.drawImage(fitImageRect(image.size(), pageSize, margin), image);
    }

    if (!painter.end()) {
        setError(errorMessage, "Failed to finish PDF: " + pdfPath);
        return false;
    }

    qInfo() << "PDF saved successfully";
    return true;
}

int SlideExporter::exportImages(const QStringList& imagePaths, const QString& destFolder,
                                QString* errorMessage)
{
    if (imagePaths.isEmpty()) {
        setError(errorMessage, "No images selected.");
        return -1;
    }

    QDir dir;
    if (!dir.mkpath(destFolder)) {
        setError(errorMessage, "Failed to create folder: " + destFolder);
        return -1;
    }

    qInfo().noquote() << QString("Exporting %1 images -> %2").arg(imagePaths.size()).arg(destFolder);

    int copiedCount = 0;
    for (int i = 0; i < imagePaths.size(); i++) {
        QString destPath = QDir(destFolder).filePath(exportFileName(i + 1, imagePaths[i]));

        if (QFile::exists(destPath) && !QFile::remove(destPath)) {
            setError(errorMessage, "Cannot replace existing file: " + destPath);
            return -1;
        }
        if (!QFile::copy(imagePaths[i], destPath)) {
            setError(errorMessage, QString("Failed to copy %1 to %2").arg(imagePaths[i], destPath));
            return -1;
        }
        copiedCount++;
    }

    qInfo() << "Image export complete";
    return copiedCount;
}
