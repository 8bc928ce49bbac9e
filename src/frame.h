#ifndef FRAME_H
#define FRAME_H

#include <QString>
#include <cstdint>
#include <vector>

/**
 * @brief One candidate slide image in natural order
 *
 * An empty fingerprint marks a frame whose file could not be read or decoded;
 * readError then holds the reason.
 */
struct Frame {
    QString path;
    int sequenceIndex;
    std::vector<uint8_t> fingerprint;
    QString readError;

    Frame() : sequenceIndex(-1) {}
    Frame(const QString& filePath, int index, const std::vector<uint8_t>& hash = std::vector<uint8_t>())
        : path(filePath), sequenceIndex(index), fingerprint(hash) {}

    bool isReadable() const { return !fingerprint.empty(); }
};

/**
 * @brief A frame that was dropped because it could not be fingerprinted
 */
struct SkippedFrame {
    QString path;
    QString reason;
};

#endif // FRAME_H
