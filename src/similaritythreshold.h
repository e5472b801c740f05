#ifndef SIMILARITYTHRESHOLD_H
#define SIMILARITYTHRESHOLD_H

/**
 * @brief Converts the user-facing similarity threshold into a Hamming cutoff
 *
 * A threshold of 1.0 treats only bit-identical fingerprints as duplicates;
 * 0.0 treats everything that is not a perfect inverse as a duplicate.
 */
class SimilarityThreshold
{
public:
    /**
     * @brief Check that a threshold can be used for a run
     * @param threshold Similarity threshold
     * @throws InvalidConfiguration if the value is NaN or outside [0, 1]
     */
    static void validate(double threshold);

    /**
     * @brief Largest Hamming distance still counted as a duplicate
     * @param threshold Similarity threshold in [0, 1]
     * @param bitCount Fingerprint length in bits
     * @return int((1 - threshold) * bitCount), truncated toward zero
     * @throws InvalidConfiguration on an invalid threshold or bit count
     */
    static int maxHammingDistance(double threshold, int bitCount);
};

#endif // SIMILARITYTHRESHOLD_H
