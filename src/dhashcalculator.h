#ifndef DHASHCALCULATOR_H
#define DHASHCALCULATOR_H

#include <opencv2/opencv.hpp>
#include <QString>
#include <cstdint>
#include <vector>

/**
 * @brief Fixed-length perceptual fingerprint of one image
 *
 * Holds gridSize x gridSize bits packed MSB first, row-major. A default
 * constructed Fingerprint is invalid and compares unequal to every valid one.
 */
class Fingerprint
{
public:
    Fingerprint() = default;
    Fingerprint(int bitCount, std::vector<uint8_t> bytes);

    bool isValid() const { return m_bitCount > 0; }
    int bitCount() const { return m_bitCount; }
    const std::vector<uint8_t>& bytes() const { return m_bytes; }

    /**
     * @brief Lowercase hex rendering, two characters per byte
     */
    QString toHex() const;

    bool operator==(const Fingerprint& other) const
    {
        return m_bitCount == other.m_bitCount && m_bytes == other.m_bytes;
    }
    bool operator!=(const Fingerprint& other) const { return !(*this == other); }

private:
    int m_bitCount = 0;
    std::vector<uint8_t> m_bytes;
};

/**
 * @brief Difference hash (dHash) calculator
 *
 * Shrinks the luminance of an image to a (gridSize + 1) x gridSize grid with
 * a box filter and records, for every cell, whether it is brighter than its
 * right-hand neighbour. The result does not depend on the source resolution
 * or aspect ratio, so frames of one video always produce comparable
 * fingerprints.
 */
class DHashCalculator
{
public:
    static constexpr int DEFAULT_GRID_SIZE = 16;  // 16x16 = 256 bits

    /**
     * @brief Fingerprint an image file
     * @param imagePath Path to the image
     * @param gridSize Side of the bit grid
     * @return Fingerprint with gridSize * gridSize bits
     * @throws DecodeError if the file cannot be decoded
     */
    static Fingerprint calculate(const QString& imagePath,
                                 int gridSize = DEFAULT_GRID_SIZE);

    /**
     * @brief Fingerprint a decoded image
     * @param image 1, 3 (BGR) or 4 (BGRA) channel image of any depth, at least 2x1
     * @param gridSize Side of the bit grid
     * @return Fingerprint with gridSize * gridSize bits
     * @throws DecodeError if the image is empty, too small or has an
     *         unsupported channel layout
     */
    static Fingerprint calculate(const cv::Mat& image,
                                 int gridSize = DEFAULT_GRID_SIZE);

    /**
     * @brief Number of differing bits between two fingerprints
     * @return Hamming distance, or -1 if either is invalid or their sizes differ
     */
    static int hammingDistance(const Fingerprint& a, const Fingerprint& b);

private:
    /**
     * @brief Single-channel float luminance of the input image
     */
    static cv::Mat toLuminance(const cv::Mat& image);
};

#endif // DHASHCALCULATOR_H
