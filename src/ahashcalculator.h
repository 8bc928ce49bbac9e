#ifndef AHASHCALCULATOR_H
#define AHASHCALCULATOR_H

#include "imagefingerprinter.h"

/**
 * @brief Average Hash (aHash) Calculator
 *
 * Each bit is set when the corresponding pixel of the downscaled grayscale
 * image is at least as bright as the mean.
 */
class AHashCalculator : public ImageFingerprinter
{
public:
    explicit AHashCalculator(int hashSide = 8);

    using ImageFingerprinter::computeFingerprint;

    std::vector<uint8_t> computeFingerprint(const cv::Mat& image) const override;

    int bitLength() const override { return m_hashSide * m_hashSide; }
    QString name() const override { return "ahash"; }

private:
    int m_hashSide;
};

#endif // AHASHCALCULATOR_H
