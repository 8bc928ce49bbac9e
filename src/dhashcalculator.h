#ifndef DHASHCALCULATOR_H
#define DHASHCALCULATOR_H

#include "imagefingerprinter.h"

/**
 * @brief Difference Hash (dHash) Calculator
 *
 * Encodes the horizontal brightness gradient of a (hashSide + 1) x hashSide
 * grayscale thumbnail: a bit is set when a pixel is brighter than its right
 * neighbour.
 */
class DHashCalculator : public ImageFingerprinter
{
public:
    explicit DHashCalculator(int hashSide = 8);

    using ImageFingerprinter::computeFingerprint;

    std::vector<uint8_t> computeFingerprint(const cv::Mat& image) const override;

    int bitLength() const override { return m_hashSide * m_hashSide; }
    QString name() const override { return "dhash"; }

private:
    int m_hashSide;
};

#endif // DHASHCALCULATOR_H
