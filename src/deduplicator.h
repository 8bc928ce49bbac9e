#ifndef DEDUPLICATOR_H
#define DEDUPLICATOR_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <atomic>
#include <vector>
#include "frame.h"
#include "imagefingerprinter.h"

struct DeduplicationResult {
    std::vector<Frame> retained;        // Retained frames in original order
    std::vector<SkippedFrame> skipped;  // Unreadable frames, in original order
    int totalFrames;
    int duplicateCount;
    bool cancelled;

    DeduplicationResult() : totalFrames(0), duplicateCount(0), cancelled(false) {}

    int warningCount() const { return static_cast<int>(skipped.size()); }
};

/**
 * @brief Near-duplicate removal over an ordered frame sequence
 *
 * Each frame is compared only with the last retained frame. Runs of
 * near-identical captures collapse to their first frame while a slide that
 * reappears after a different slide is kept again.
 */
class Deduplicator : public QObject
{
    Q_OBJECT

public:
    explicit Deduplicator(QObject *parent = nullptr);

    /**
     * @brief Select the retained subsequence from fingerprinted frames
     *
     * Frames without a fingerprint are skipped and reported. A frame is kept
     * when there is no retained frame yet or its distance to the last retained
     * frame exceeds hammingThreshold.
     *
     * @param frames Frames in natural order
     * @param hammingThreshold Largest distance still treated as a duplicate
     * @param fingerprinter Supplies the distance metric
     * @param cancelFlag Optional flag checked once per frame
     * @return DeduplicationResult with retained and skipped frames
     */
    static DeduplicationResult selectUniqueFrames(const std::vector<Frame>& frames,
                                                  int hammingThreshold,
                                                  const ImageFingerprinter& fingerprinter,
                                                  const std::atomic<bool>* cancelFlag = nullptr);

    /**
     * @brief Fingerprint image files, in parallel when workerCount > 1
     * @param imagePaths Image paths in natural order
     * @param fingerprinter Fingerprint algorithm
     * @param workerCount Number of worker threads (0 = automatic)
     * @return One Frame per path, same order; unreadable files carry an empty fingerprint
     */
    std::vector<Frame> computeFingerprints(const QStringList& imagePaths,
                                           const ImageFingerprinter& fingerprinter,
                                           int workerCount = 1);

    /**
     * @brief Fingerprint the files and select the retained subsequence
     */
    DeduplicationResult run(const QStringList& imagePaths,
                            int hammingThreshold,
                            const ImageFingerprinter& fingerprinter,
                            int workerCount = 1);

    /**
     * @brief Ask a running pass to stop before the next frame (thread-safe)
     */
    void requestCancel();
    bool isCancelRequested() const;
    void resetCancel();

    static int optimalWorkerCount();

signals:
    /**
     * @brief Emitted from the calling thread as fingerprints complete
     */
    void fingerprintProgress(int current, int total);

    /**
     * @brief Emitted for every frame that could not be fingerprinted
     */
    void frameSkipped(const QString& filePath, const QString& reason);

private:
    void fingerprintBatch(const QStringList& imagePaths,
                          int startIndex,
                          int endIndex,
                          const ImageFingerprinter& fingerprinter,
                          std::vector<Frame>& frames,
                          std::atomic<int>& completedCount);

    std::atomic<bool> m_shouldCancel;
};

#endif // DEDUPLICATOR_H
