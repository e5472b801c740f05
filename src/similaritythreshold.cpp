#include "similaritythreshold.h"
#include "slidesifterrors.h"
#include <QString>
#include <cmath>

void SimilarityThreshold::validate(double threshold)
{
    if (std::isnan(threshold) || threshold < 0.0 || threshold > 1.0) {
        throw InvalidConfiguration(
            QString("Similarity threshold must be within [0, 1], got %1")
                .arg(threshold).toStdString());
    }
}

int SimilarityThreshold::maxHammingDistance(double threshold, int bitCount)
{
    validate(threshold);
    if (bitCount <= 0) {
        throw InvalidConfiguration("Fingerprint bit count must be positive");
    }

    return static_cast<int>((1.0 - threshold) * bitCount);
}
