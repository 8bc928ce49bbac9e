#include "dhashcalculator.h"

DHashCalculator::DHashCalculator(int hashSide)
    : m_hashSide(hashSide)
{
}

std::vector<uint8_t> DHashCalculator::computeFingerprint(const cv::Mat& image) const
{
    if (image.empty()) {
        return std::vector<uint8_t>();
    }

    cv::Mat resized;
    cv::resize(toGrayscale(image), resized, cv::Size(m_hashSide + 1, m_hashSide), 0, 0, cv::INTER_AREA);

    std::vector<bool> bits;
    bits.reserve(m_hashSide * m_hashSide);
    for (int y = 0; y < m_hashSide; y++) {
        for (int x = 0; x < m_hashSide; x++) {
            bits.push_back(resized.at<uchar>(y, x) > resized.at<uchar>(y, x + 1));
        }
    }

    return packBits(bits);
}
