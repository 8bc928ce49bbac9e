#include "imagefingerprinter.h"
#include "imageiohelper.h"
#include "phashcalculator.h"
#include "ahashcalculator.h"
#include "dhashcalculator.h"

std::vector<uint8_t> ImageFingerprinter::computeFingerprint(const QString& imagePath, QString* errorMessage) const
{
    cv::Mat image = ImageIOHelper::readFrame(imagePath, errorMessage, cv::IMREAD_COLOR);
    if (image.empty()) {
        return std::vector<uint8_t>();
    }

    try {
        return computeFingerprint(image);
    } catch (const cv::Exception& e) {
        if (errorMessage) {
            *errorMessage = QString("fingerprint failed: %1").arg(QString::fromStdString(e.what()));
        }
        return std::vector<uint8_t>();
    }
}

int ImageFingerprinter::hammingDistance(const std::vector<uint8_t>& hash1, const std::vector<uint8_t>& hash2)
{
    if (hash1.empty() || hash1.size() != hash2.size()) {
        return -1;
    }

    int distance = 0;
    for (size_t i = 0; i < hash1.size(); i++) {
        uint8_t xorResult = hash1[i] ^ hash2[i];
        // Brian Kernighan's bit count
        while (xorResult) {
            distance++;
            xorResult &= (xorResult - 1);
        }
    }

    return distance;
}

QString ImageFingerprinter::hashToHexString(const std::vector<uint8_t>& hash)
{
    QString hexString;
    hexString.reserve(static_cast<int>(hash.size()) * 2);

    for (uint8_t byte : hash) {
        hexString.append(QString("%1").arg(byte, 2, 16, QChar('0')));
    }

    return hexString;
}

std::vector<uint8_t> ImageFingerprinter::hexStringToHash(const QString& hexString)
{
    if (hexString.isEmpty() || hexString.length() % 2 != 0) {
        return std::vector<uint8_t>();
    }

    std::vector<uint8_t> hash;
    hash.reserve(hexString.length() / 2);

    for (int i = 0; i < hexString.length(); i += 2) {
        bool ok;
        uint byte = hexString.mid(i, 2).toUInt(&ok, 16);
        if (!ok) {
            return std::vector<uint8_t>();
        }
        hash.push_back(static_cast<uint8_t>(byte));
    }

    return hash;
}

bool ImageFingerprinter::isSupportedHashSide(int hashSide)
{
    return hashSide == 8 || hashSide == 16;
}

std::unique_ptr<ImageFingerprinter> ImageFingerprinter::create(HashAlgorithm algorithm, int hashSide)
{
    if (!isSupportedHashSide(hashSide)) {
        return nullptr;
    }

    switch (algorithm) {
        case HashAlgorithm::PHash:
            return std::make_unique<PHashCalculator>(hashSide);
        case HashAlgorithm::AHash:
            return std::make_unique<AHashCalculator>(hashSide);
        case HashAlgorithm::DHash:
            return std::make_unique<DHashCalculator>(hashSide);
    }
    return nullptr;
}

cv::Mat ImageFingerprinter::toGrayscale(const cv::Mat& image)
{
    cv::Mat grayscale;
    if (image.channels() == 3) {
        cv::cvtColor(image, grayscale, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, grayscale, cv::COLOR_BGRA2GRAY);
    } else {
        grayscale = image.clone();
    }

    if (grayscale.depth() != CV_8U) {
        grayscale.convertTo(grayscale, CV_8U);
    }
    return grayscale;
}

std::vector<uint8_t> ImageFingerprinter::packBits(const std::vector<bool>& bits)
{
    std::vector<uint8_t> hash((bits.size() + 7) / 8, 0);
    for (size_t bitIndex = 0; bitIndex < bits.size(); bitIndex++) {
        if (bits[bitIndex]) {
            size_t byteIndex = bitIndex / 8;
            int bitOffset = 7 - static_cast<int>(bitIndex % 8);  // MSB first
            hash[byteIndex] |= static_cast<uint8_t>(1 << bitOffset);
        }
    }
    return hash;
}
