#include "ahashcalculator.h"

AHashCalculator::AHashCalculator(int hashSide)
    : m_hashSide(hashSide)
{
}

std::vector<uint8_t> AHashCalculator::computeFingerprint(const cv::Mat& image) const
{
    if (image.empty()) {
        return std::vector<uint8_t>();
    }

    cv::Mat resized;
    cv::resize(toGrayscale(image), resized, cv::Size(m_hashSide, m_hashSide), 0, 0, cv::INTER_AREA);

    const double mean = cv::mean(resized)[0];

    std::vector<bool> bits;
    bits.reserve(m_hashSide * m_hashSide);
    for (int y = 0; y < m_hashSide; y++) {
        for (int x = 0; x < m_hashSide; x++) {
            bits.push_back(resized.at<uchar>(y, x) >= mean);
        }
    }

    return packBits(bits);
}
