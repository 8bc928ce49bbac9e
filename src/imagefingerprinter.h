#ifndef IMAGEFINGERPRINTER_H
#define IMAGEFINGERPRINTER_H

#include <opencv2/opencv.hpp>
#include <QString>
#include <cstdint>
#include <memory>
#include <vector>

enum class HashAlgorithm {
    PHash,
    AHash,
    DHash
};

/**
 * @brief Perceptual fingerprint capability interface
 *
 * A fingerprint is a fixed-length bit vector stored MSB first in a byte array
 * of bitLength() / 8 bytes. Visually similar images produce fingerprints with
 * a small Hamming distance. An empty vector means no fingerprint could be
 * computed.
 */
class ImageFingerprinter
{
public:
    virtual ~ImageFingerprinter() = default;

    /**
     * @brief Compute the fingerprint of a decoded image
     * @param image OpenCV Mat image (BGR, BGRA or grayscale)
     * @return Fingerprint bytes (empty vector on error)
     */
    virtual std::vector<uint8_t> computeFingerprint(const cv::Mat& image) const = 0;

    /**
     * @brief Number of bits in a fingerprint produced by this instance
     */
    virtual int bitLength() const = 0;

    /**
     * @brief Short algorithm name ("phash", "ahash", "dhash")
     */
    virtual QString name() const = 0;

    /**
     * @brief Distance between two fingerprints
     * @return Number of differing bits, or -1 if the fingerprints are not comparable
     */
    virtual int distance(const std::vector<uint8_t>& hash1, const std::vector<uint8_t>& hash2) const
    {
        return hammingDistance(hash1, hash2);
    }

    /**
     * @brief Read an image file and compute its fingerprint
     * @param imagePath Path to the image file
     * @param errorMessage Optional output, set to the reason when the result is empty
     * @return Fingerprint bytes (empty vector on error)
     */
    std::vector<uint8_t> computeFingerprint(const QString& imagePath, QString* errorMessage = nullptr) const;

    /**
     * @brief Calculate Hamming distance between two equal-length hashes
     * @return Number of differing bits, or -1 if either hash is empty or sizes differ
     */
    static int hammingDistance(const std::vector<uint8_t>& hash1, const std::vector<uint8_t>& hash2);

    static QString hashToHexString(const std::vector<uint8_t>& hash);

    /**
     * @brief Convert hex string to hash bytes
     * @return Hash as byte array (empty vector on malformed input)
     */
    static std::vector<uint8_t> hexStringToHash(const QString& hexString);

    /**
     * @brief Create a fingerprinter for the given algorithm
     * @param algorithm Hash algorithm variant
     * @param hashSide Side of the hash grid (8 → 64 bits, 16 → 256 bits)
     * @return Fingerprinter instance, or nullptr if hashSide is unsupported
     */
    static std::unique_ptr<ImageFingerprinter> create(HashAlgorithm algorithm, int hashSide = 8);

    static bool isSupportedHashSide(int hashSide);

protected:
    /**
     * @brief Convert an image to single-channel 8-bit grayscale
     */
    static cv::Mat toGrayscale(const cv::Mat& image);

    /**
     * @brief Pack a bit sequence MSB first into bytes
     */
    static std::vector<uint8_t> packBits(const std::vector<bool>& bits);
};

#endif // IMAGEFINGERPRINTER_H
