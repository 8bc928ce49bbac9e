#include "phashcalculator.h"
#include <algorithm>

PHashCalculator::PHashCalculator(int hashSide)
    : m_hashSide(hashSide)
{
}

std::vector<uint8_t> PHashCalculator::computeFingerprint(const cv::Mat& image) const
{
    if (image.empty()) {
        return std::vector<uint8_t>();
    }

    // Step 1: Convert to grayscale
    cv::Mat grayscale = toGrayscale(image);

    // Step 2: Resize to the DCT input size
    const int dctSide = m_hashSide * DCT_SCALE;
    cv::Mat resized;
    cv::resize(grayscale, resized, cv::Size(dctSide, dctSide), 0, 0, cv::INTER_AREA);

    // Step 3: Convert to float for DCT
    cv::Mat floatImage;
    resized.convertTo(floatImage, CV_32F);

    // Step 4: Apply DCT
    cv::Mat dctCoeffs;
    cv::dct(floatImage, dctCoeffs);

    // Step 5: Keep the low-frequency block (top-left hashSide x hashSide)
    cv::Mat lowFreq = dctCoeffs(cv::Rect(0, 0, m_hashSide, m_hashSide));

    std::vector<float> coeffs;
    coeffs.reserve(m_hashSide * m_hashSide);
    for (int i = 0; i < m_hashSide; i++) {
        for (int j = 0; j < m_hashSide; j++) {
            coeffs.push_back(lowFreq.at<float>(i, j));
        }
    }

    // Step 6: Median over the AC coefficients only, the DC term would skew it
    double median = calculateMedian(std::vector<float>(coeffs.begin() + 1, coeffs.end()));

    // Step 7: Generate hash bits
    std::vector<bool> bits;
    bits.reserve(coeffs.size());
    for (float coeff : coeffs) {
        bits.push_back(coeff >= median);
    }

    return packBits(bits);
}

double PHashCalculator::calculateMedian(std::vector<float> values)
{
    if (values.empty()) return 0.0;

    std::sort(values.begin(), values.end());
    size_t mid = values.size() / 2;

    if (values.size() % 2 == 0) {
        return (values[mid - 1] + values[mid]) / 2.0;
    } else {
        return values[mid];
    }
}
