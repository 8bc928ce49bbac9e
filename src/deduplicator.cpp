#include "deduplicator.h"
#include <QDebug>
#include <algorithm>
#include <chrono>
#include <thread>

Deduplicator::Deduplicator(QObject *parent)
    : QObject(parent), m_shouldCancel(false)
{
}

void Deduplicator::requestCancel()
{
    m_shouldCancel.store(true);
}

bool Deduplicator::isCancelRequested() const
{
    return m_shouldCancel.load();
}

void Deduplicator::resetCancel()
{
    m_shouldCancel.store(false);
}

int Deduplicator::optimalWorkerCount()
{
    const int hardwareConcurrency = static_cast<int>(std::thread::hardware_concurrency());
    // Use hardware_concurrency - 1, but ensure at least 1 thread
    return std::max(1, hardwareConcurrency - 1);
}

DeduplicationResult Deduplicator::selectUniqueFrames(const std::vector<Frame>& frames,
                                                     int hammingThreshold,
                                                     const ImageFingerprinter& fingerprinter,
                                                     const std::atomic<bool>* cancelFlag)
{
    DeduplicationResult result;
    result.totalFrames = static_cast<int>(frames.size());

    const Frame* lastRetained = nullptr;

    for (const Frame& frame : frames) {
        if (cancelFlag && cancelFlag->load()) {
            result.cancelled = true;
            break;
        }

        if (!frame.isReadable()) {
            QString reason = frame.readError.isEmpty() ? QString("no fingerprint") : frame.readError;
            result.skipped.push_back({frame.path, reason});
            continue;
        }

        if (!lastRetained) {
            result.retained.push_back(frame);
            lastRetained = &frame;
            continue;
        }

        int distance = fingerprinter.distance(frame.fingerprint, lastRetained->fingerprint);

        // -1 means the fingerprints are not comparable; keep the frame
        if (distance < 0 || distance > hammingThreshold) {
            result.retained.push_back(frame);
            lastRetained = &frame;
        } else {
            result.duplicateCount++;
            qDebug() << "Deduplicator: Frame" << frame.sequenceIndex << "duplicates frame"
                     << lastRetained->sequenceIndex << "(distance:" << distance << ")";
        }
    }

    return result;
}

std::vector<Frame> Deduplicator::computeFingerprints(const QStringList& imagePaths,
                                                     const ImageFingerprinter& fingerprinter,
                                                     int workerCount)
{
    const int totalTasks = imagePaths.size();
    std::vector<Frame> frames(totalTasks);
    if (totalTasks == 0) {
        return frames;
    }

    if (workerCount <= 0) {
        workerCount = optimalWorkerCount();
    }
    const int numThreads = std::min(workerCount, totalTasks);

    std::atomic<int> completedCount(0);
    emit fingerprintProgress(0, totalTasks);

    if (numThreads == 1) {
        for (int i = 0; i < totalTasks; ++i) {
            if (m_shouldCancel.load()) {
                break;
            }
            fingerprintBatch(imagePaths, i, i + 1, fingerprinter, frames, completedCount);
            emit fingerprintProgress(completedCount.load(), totalTasks);
        }
        return frames;
    }

    const int tasksPerThread = (totalTasks + numThreads - 1) / numThreads; // Ceiling division
    std::vector<std::thread> threads;
    std::atomic<int> finishedThreads(0);

    for (int i = 0; i < numThreads; ++i) {
        int startIndex = i * tasksPerThread;
        int endIndex = std::min(startIndex + tasksPerThread, totalTasks);

        if (startIndex >= totalTasks) {
            break; // No more tasks for this thread
        }

        threads.emplace_back([this, &imagePaths, startIndex, endIndex, &fingerprinter, &frames,
                              &completedCount, &finishedThreads]() {
            fingerprintBatch(imagePaths, startIndex, endIndex, fingerprinter, frames, completedCount);
            finishedThreads.fetch_add(1);
        });
    }

    // Progress is reported from this thread only so receivers need no event loop
    const int startedThreads = static_cast<int>(threads.size());
    int lastReported = 0;
    while (finishedThreads.load() < startedThreads) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        int current = completedCount.load();
        if (current != lastReported) {
            lastReported = current;
            emit fingerprintProgress(current, totalTasks);
        }
    }

    for (auto& thread : threads) {
        thread.join();
    }

    if (completedCount.load() != lastReported) {
        emit fingerprintProgress(completedCount.load(), totalTasks);
    }

    return frames;
}

void Deduplicator::fingerprintBatch(const QStringList& imagePaths,
                                    int startIndex,
                                    int endIndex,
                                    const ImageFingerprinter& fingerprinter,
                                    std::vector<Frame>& frames,
                                    std::atomic<int>& completedCount)
{
    for (int i = startIndex; i < endIndex; ++i) {
        if (m_shouldCancel.load()) {
            return;
        }

        // Each slot is written by exactly one thread
        Frame& frame = frames[i];
        frame.path = imagePaths[i];
        frame.sequenceIndex = i;

        QString error;
        frame.fingerprint = fingerprinter.computeFingerprint(imagePaths[i], &error);
        if (frame.fingerprint.empty()) {
            frame.readError = error.isEmpty() ? QString("fingerprint could not be computed") : error;
        }

        completedCount.fetch_add(1);
    }
}

DeduplicationResult Deduplicator::run(const QStringList& imagePaths,
                                      int hammingThreshold,
                                      const ImageFingerprinter& fingerprinter,
                                      int workerCount)
{
    std::vector<Frame> frames = computeFingerprints(imagePaths, fingerprinter, workerCount);

    if (m_shouldCancel.load()) {
        DeduplicationResult result;
        result.totalFrames = imagePaths.size();
        result.cancelled = true;
        return result;
    }

    for (const Frame& frame : frames) {
        if (frame.isReadable()) {
            qDebug().noquote() << "Deduplicator:" << frame.path
                               << ImageFingerprinter::hashToHexString(frame.fingerprint);
        }
    }

    DeduplicationResult result = selectUniqueFrames(frames, hammingThreshold, fingerprinter, &m_shouldCancel);

    for (const SkippedFrame& skipped : result.skipped) {
        qWarning().noquote() << "Deduplicator: Skipping unreadable frame" << skipped.path
                             << "-" << skipped.reason;
        emit frameSkipped(skipped.path, skipped.reason);
    }

    qInfo() << "Deduplicator: Kept" << result.retained.size() << "of" << result.totalFrames
            << "frames," << result.duplicateCount << "duplicates," << result.warningCount() << "skipped";

    return result;
}
