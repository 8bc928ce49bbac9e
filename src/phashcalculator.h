#ifndef PHASHCALCULATOR_H
#define PHASHCALCULATOR_H

#include "imagefingerprinter.h"

/**
 * @brief DCT-based Perceptual Hash (pHash) Calculator
 *
 * Keeps the low-frequency block of a 2D Discrete Cosine Transform of the
 * downscaled grayscale image and thresholds it against the median of its AC
 * coefficients. A hash side of 8 gives 64 bits, 16 gives 256 bits.
 */
class PHashCalculator : public ImageFingerprinter
{
public:
    explicit PHashCalculator(int hashSide = 8);

    using ImageFingerprinter::computeFingerprint;

    /**
     * @brief Calculate perceptual hash from OpenCV Mat
     * @param image OpenCV Mat image (will be converted to grayscale if needed)
     * @return hashSide * hashSide bit hash (returns empty vector on error)
     */
    std::vector<uint8_t> computeFingerprint(const cv::Mat& image) const override;

    int bitLength() const override { return m_hashSide * m_hashSide; }
    QString name() const override { return "phash"; }

private:
    /**
     * @brief Calculate median of a coefficient list
     */
    static double calculateMedian(std::vector<float> values);

    int m_hashSide;

    // The DCT input is this many times larger than the hash grid
    static constexpr int DCT_SCALE = 4;
};

#endif // PHASHCALCULATOR_H
