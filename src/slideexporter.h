#ifndef SLIDEEXPORTER_H
#define SLIDEEXPORTER_H

#include <QString>
#include <QStringList>
#include <QSizeF>
#include <QRectF>

/**
 * @brief Writes reviewed slides to their final destination
 *
 * Both exporters keep the order they are given and refuse an empty list.
 */
class SlideExporter
{
public:
    /**
     * @brief Build a PDF with one slide per A4 page
     *
     * Landscape pages are used for images at least as wide as they are tall.
     * Each image is scaled uniformly to fit inside the margin and centred.
     *
     * @param imagePaths Slides in page order
     * @param pdfPath Output file
     * @param margin Page margin in points
     * @param errorMessage Receives the reason on failure (may be null)
     * @return true if every page was written
     */
    static bool buildPdf(const QStringList& imagePaths, const QString& pdfPath,
                         double margin = 20.0, QString* errorMessage = nullptr);

    /**
     * @brief Copy slides into a folder as slide_001.png, slide_002.png, ...
     *
     * The source extension is kept (.png when it has none); existing files
     * with the same name are replaced.
     *
     * @param imagePaths Slides in order
     * @param destFolder Target folder (created if missing)
     * @param errorMessage Receives the reason on failure (may be null)
     * @return Number of files written, -1 on failure
     */
    static int exportImages(const QStringList& imagePaths, const QString& destFolder,
                            QString* errorMessage = nullptr);

    /**
     * @brief File name used for the n-th exported slide (1-based)
     */
    static QString exportFileName(int index, const QString& sourcePath);

    /**
     * @brief Page rectangle (in points) where an image is drawn
     * @param imageSize Image size in pixels
     * @param pageSize Page size in points
     * @param margin Margin in points
     */
    static QRectF fitImageRect(const QSizeF& imageSize, const QSizeF& pageSize, double margin);

    /**
     * @brief Default file names derived from the video
     */
    static QString defaultPdfPath(const QString& videoPath);
    static QString defaultExportFolder(const QString& videoPath);
};

#endif // SLIDEEXPORTER_H
