#ifndef IMAGELOADER_H
#define IMAGELOADER_H

#include <QString>
#include <opencv2/opencv.hpp>

/**
 * Decodes candidate frames from disk.
 *
 * cv::imread() cannot open non-ASCII paths on Windows, so the file is read
 * through QFile and handed to cv::imdecode().
 */
class ImageLoader
{
public:
    /**
     * Load an image, keeping its channel count and bit depth
     * @param filePath Path to the image file (may contain Unicode)
     * @return Decoded image, never empty
     * @throws DecodeError if the file cannot be read or is not an image
     */
    static cv::Mat load(const QString& filePath);
};

#endif // IMAGELOADER_H
