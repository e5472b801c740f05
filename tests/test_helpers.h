#ifndef TEST_HELPERS_H
#define TEST_HELPERS_H

#include <QDir>
#include <QFile>
#include <QString>
#include <opencv2/opencv.hpp>
#include <random>
#include <vector>

namespace testimages {

// Side of each block in images built by fromBits()
constexpr int BLOCK = 10;

/**
 * Horizontal gradient. A descending one fingerprints to all ones, an
 * ascending one to all zeros, at any resolution.
 */
inline cv::Mat gradient(int width, int height, bool descending)
{
    cv::Mat image(height, width, CV_8UC3);
    for (int col = 0; col < width; col++) {
        int value = 10 + col * 190 / (width - 1);
        if (descending) {
            value = 210 - value;
        }
        image.col(col).setTo(cv::Scalar(value, value, value));
    }
    return image;
}

/**
 * Grayscale image whose 16x16 dHash is exactly the given bits.
 *
 * Built from 17x16 constant blocks, so the area resize reproduces the block
 * values and each bit only depends on the step between two blocks.
 */
inline cv::Mat fromBits(const std::vector<bool>& bits, int gridSize = 16)
{
    cv::Mat image((gridSize) * BLOCK, (gridSize + 1) * BLOCK, CV_8UC1);
    for (int row = 0; row < gridSize; row++) {
        int value = 128;
        for (int col = 0; col <= gridSize; col++) {
            image(cv::Rect(col * BLOCK, row * BLOCK, BLOCK, BLOCK)).setTo(cv::Scalar(value));
            if (col < gridSize) {
                value += bits[row * gridSize + col] ? -5 : 5;
            }
        }
    }
    return image;
}

/**
 * Fingerprint pattern with the first setCount bits set
 */
inline std::vector<bool> leadingBits(int setCount, int bitCount = 256)
{
    std::vector<bool> bits(bitCount, false);
    for (int i = 0; i < setCount && i < bitCount; i++) {
        bits[i] = true;
    }
    return bits;
}

inline std::vector<bool> randomBits(unsigned seed, int bitCount = 256)
{
    std::mt19937 rng(seed);
    std::bernoulli_distribution coin(0.5);
    std::vector<bool> bits(bitCount);
    for (int i = 0; i < bitCount; i++) {
        bits[i] = coin(rng);
    }
    return bits;
}

inline QString writeImage(const QString& dir, const QString& name, const cv::Mat& image)
{
    QString path = QDir(dir).filePath(name);
    cv::imwrite(path.toStdString(), image);
    return path;
}

inline QString writeGarbage(const QString& dir, const QString& name)
{
    QString path = QDir(dir).filePath(name);
    QFile file(path);
    if (file.open(QIODevice::WriteOnly)) {
        file.write("this is not an image");
    }
    return path;
}

}

#endif // TEST_HELPERS_H
