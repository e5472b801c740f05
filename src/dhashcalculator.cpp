#include "dhashcalculator.h"
#include "imageloader.h"
#include "slidesifterrors.h"
#include <stdexcept>
#include <string>
#include <utility>

Fingerprint::Fingerprint(int bitCount, std::vector<uint8_t> bytes)
    : m_bitCount(bitCount), m_bytes(std::move(bytes))
{
    if (bitCount < 0 || m_bytes.size() != static_cast<size_t>((bitCount + 7) / 8)) {
        throw std::invalid_argument("Fingerprint byte count does not match bit count");
    }
}

QString Fingerprint::toHex() const
{
    QString hexString;
    hexString.reserve(static_cast<int>(m_bytes.size()) * 2);

    for (uint8_t byte : m_bytes) {
        hexString.append(QString("%1").arg(byte, 2, 16, QChar('0')));
    }

    return hexString;
}

Fingerprint DHashCalculator::calculate(const QString& imagePath, int gridSize)
{
    cv::Mat image = ImageLoader::load(imagePath);
    return calculate(image, gridSize);
}

Fingerprint DHashCalculator::calculate(const cv::Mat& image, int gridSize)
{
    if (gridSize < 1) {
        throw std::invalid_argument("Fingerprint grid size must be positive");
    }
    if (image.empty()) {
        throw DecodeError("Image is empty");
    }
    if (image.cols < 2 || image.rows < 1) {
        throw DecodeError("Image must be at least 2x1 pixels");
    }

    // Step 1: Luminance as float so every bit depth compares the same way
    cv::Mat luminance = toLuminance(image);

    // Step 2: Box-filter down to (gridSize + 1) x gridSize
    cv::Mat grid;
    cv::resize(luminance, grid, cv::Size(gridSize + 1, gridSize), 0, 0, cv::INTER_AREA);

    // Step 3: One bit per horizontal neighbour pair, MSB first
    const int bitCount = gridSize * gridSize;
    std::vector<uint8_t> bytes((bitCount + 7) / 8, 0);
    int bitIndex = 0;
    for (int row = 0; row < gridSize; row++) {
        const float* line = grid.ptr<float>(row);
        for (int col = 0; col < gridSize; col++) {
            if (line[col] > line[col + 1]) {
                bytes[bitIndex / 8] |= static_cast<uint8_t>(1 << (7 - bitIndex % 8));
            }
            bitIndex++;
        }
    }

    return Fingerprint(bitCount, std::move(bytes));
}

int DHashCalculator::hammingDistance(const Fingerprint& a, const Fingerprint& b)
{
    if (!a.isValid() || !b.isValid() || a.bitCount() != b.bitCount()) {
        return -1;
    }

    int distance = 0;
    const std::vector<uint8_t>& bytesA = a.bytes();
    const std::vector<uint8_t>& bytesB = b.bytes();
    for (size_t i = 0; i < bytesA.size(); i++) {
        uint8_t xorResult = bytesA[i] ^ bytesB[i];
        // Brian Kernighan's bit count
        while (xorResult) {
            distance++;
            xorResult &= (xorResult - 1);
        }
    }

    return distance;
}

cv::Mat DHashCalculator::toLuminance(const cv::Mat& image)
{
    const int channels = image.channels();
    if (channels != 1 && channels != 3 && channels != 4) {
        throw DecodeError("Unsupported channel count: " + std::to_string(channels));
    }

    // cvtColor only accepts 8U, 16U and 32F, so widen first
    cv::Mat floatImage;
    image.convertTo(floatImage, CV_32F);

    if (channels == 1) {
        return floatImage;
    }

    cv::Mat luminance;
    cv::cvtColor(floatImage, luminance,
                 channels == 3 ? cv::COLOR_BGR2GRAY : cv::COLOR_BGRA2GRAY);
    return luminance;
}
