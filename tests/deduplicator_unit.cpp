// Retention policy of the deduplication pass. Most cases use fingerprints
// built from integers; the worker tests fingerprint real files.
#include <QStringList>
#include <QTemporaryDir>
#include <atomic>
#include <string>
#include <vector>

#include "deduplicator.h"
#include "phashcalculator.h"
#include "test_helpers.hpp"

namespace {

using test_helpers::fingerprint64;

bool check(bool cond, const std::string &msg) {
    return test_helpers::check("deduplicator_unit", cond, msg);
}

const uint64_t kSlideA = 0x42976ffed82c07cdULL;
const uint64_t kSlideB = 0xe3e70602c20d4cacULL;

std::vector<Frame> make_frames(const std::vector<uint64_t> &hashes) {
    std::vector<Frame> frames;
    for (size_t i = 0; i < hashes.size(); ++i) {
        frames.emplace_back(QString("%1.jpg").arg(i + 1), static_cast<int>(i), fingerprint64(hashes[i]));
    }
    return frames;
}

QStringList retained_paths(const DeduplicationResult &result) {
    QStringList paths;
    for (const Frame &frame : result.retained) {
        paths << frame.path;
    }
    return paths;
}

bool test_single_frame() {
    PHashCalculator phash;
    DeduplicationResult result = Deduplicator::selectUniqueFrames(make_frames({kSlideA}), 8, phash);
    bool ok = check(result.retained.size() == 1, "single frame is retained");
    ok &= check(result.totalFrames == 1 && result.duplicateCount == 0, "single frame counts");
    ok &= check(Deduplicator::selectUniqueFrames({}, 8, phash).retained.empty(), "empty input retains nothing");
    return ok;
}

bool test_uniform_input() {
    PHashCalculator phash;
    bool ok = true;
    for (int length : {1, 2, 7, 150}) {
        DeduplicationResult result = Deduplicator::selectUniqueFrames(
            make_frames(std::vector<uint64_t>(length, kSlideA)), 8, phash);
        ok &= check(result.retained.size() == 1, "uniform input of length " + std::to_string(length) + " keeps one frame");
        ok &= check(!result.retained.empty() && result.retained.front().sequenceIndex == 0,
                    "the first frame of a uniform run is kept");
        ok &= check(result.duplicateCount == length - 1, "every later frame counts as duplicate");
    }
    return ok;
}

bool test_revisit_is_kept() {
    PHashCalculator phash;
    bool ok = check(ImageFingerprinter::hammingDistance(fingerprint64(kSlideA), fingerprint64(kSlideB)) > 8,
                    "precondition: A and B are far apart");

    DeduplicationResult result = Deduplicator::selectUniqueFrames(
        make_frames({kSlideA, kSlideA, kSlideB, kSlideA}), 8, phash);
    ok &= check(retained_paths(result) == QStringList({"1.jpg", "3.jpg", "4.jpg"}),
                "[A, A, B, A] retains [A, B, A]");
    return ok;
}

bool test_compares_with_last_retained_only() {
    PHashCalculator phash;
    // Each step drifts 5 bits from the previous frame; the third frame is
    // 10 bits from the first retained frame.
    const uint64_t f0 = 0;
    const uint64_t f1 = 0x1FULL;
    const uint64_t f2 = 0x3FFULL;
    DeduplicationResult result = Deduplicator::selectUniqueFrames(make_frames({f0, f1, f2}), 8, phash);
    bool ok = check(retained_paths(result) == QStringList({"1.jpg", "3.jpg"}),
                    "discarded frames do not become the comparison anchor");

    // Distance exactly at the threshold is a duplicate
    result = Deduplicator::selectUniqueFrames(make_frames({0, 0xFFULL}), 8, phash);
    ok &= check(result.retained.size() == 1, "distance equal to threshold is a duplicate");
    result = Deduplicator::selectUniqueFrames(make_frames({0, 0x1FFULL}), 8, phash);
    ok &= check(result.retained.size() == 2, "distance above threshold is retained");
    return ok;
}

bool test_threshold_monotonicity() {
    PHashCalculator phash;
    // Noisy captures of slides 0,1,0,2,3,1 (runs of near-identical frames)
    const std::vector<uint64_t> captures = {
        0x42976ffed82c07cdULL, 0x629f6fbed02e07cdULL, 0x629f6fbed82e17cdULL,
        0xe3e70602c20d4cacULL, 0xe3e70682c2094cacULL,
        0x629f6fbed82c07cdULL,
        0x1a5d2f346baa8455ULL, 0x0add2e346baa9455ULL, 0x2a5d2f346baa9455ULL, 0x0a5d2f366baa94d7ULL,
        0xf728b4fa42485e3aULL,
        0x63e70282c2094cadULL, 0xe3e70482c2094cacULL,
    };
    const std::vector<Frame> frames = make_frames(captures);

    bool ok = true;
    size_t previous = frames.size() + 1;
    for (int threshold = 0; threshold <= 64; ++threshold) {
        size_t length = Deduplicator::selectUniqueFrames(frames, threshold, phash).retained.size();
        ok &= check(length <= previous, "retained length does not grow at threshold " + std::to_string(threshold));
        previous = length;
    }

    ok &= check(Deduplicator::selectUniqueFrames(frames, 8, phash).retained.size() == 6,
                "default threshold keeps one frame per slide run");
    ok &= check(Deduplicator::selectUniqueFrames(frames, 0, phash).retained.size() == frames.size(),
                "threshold 0 keeps every non-identical frame");
    ok &= check(Deduplicator::selectUniqueFrames(frames, 64, phash).retained.size() == 1,
                "threshold at the bit length keeps only the first frame");
    return ok;
}

bool test_incomparable_fingerprints_are_kept() {
    PHashCalculator phash;
    std::vector<Frame> frames = make_frames({kSlideA, kSlideA, kSlideA});
    // A 256-bit fingerprint cannot be compared with the 64-bit ones around it
    frames[1].fingerprint = std::vector<uint8_t>(32, 0);
    bool ok = check(phash.distance(frames[0].fingerprint, frames[1].fingerprint) == -1,
                    "precondition: mixed lengths are not comparable");

    DeduplicationResult result = Deduplicator::selectUniqueFrames(frames, 64, phash);
    ok &= check(retained_paths(result) == QStringList({"1.jpg", "2.jpg", "3.jpg"}),
                "frames without a comparable distance are retained");
    ok &= check(result.duplicateCount == 0 && result.skipped.empty(), "incomparable frames are neither duplicates nor skipped");
    return ok;
}

bool test_unreadable_frame_is_skipped() {
    PHashCalculator phash;
    std::vector<Frame> frames = make_frames({kSlideA, 0, kSlideB});
    frames[1].fingerprint.clear();
    frames[1].readError = "unsupported or corrupt image data";

    DeduplicationResult result = Deduplicator::selectUniqueFrames(frames, 8, phash);
    bool ok = check(retained_paths(result) == QStringList({"1.jpg", "3.jpg"}), "[F1, F2(corrupt), F3] retains [F1, F3]");
    ok &= check(result.warningCount() == 1, "one warning for the corrupt frame");
    ok &= check(result.skipped.size() == 1 && result.skipped[0].path == "2.jpg" &&
                    result.skipped[0].reason == "unsupported or corrupt image data",
                "skipped frame keeps its path and reason");
    ok &= check(!result.cancelled, "skip does not abort the pass");

    // A corrupt frame between duplicates must not reset the anchor
    frames = make_frames({kSlideA, 0, kSlideA});
    frames[1].fingerprint.clear();
    result = Deduplicator::selectUniqueFrames(frames, 8, phash);
    ok &= check(result.retained.size() == 1 && result.duplicateCount == 1,
                "frame after a corrupt one is still compared with the last retained frame");
    ok &= check(result.skipped.size() == 1 && !result.skipped[0].reason.isEmpty(), "default skip reason is set");
    return ok;
}

bool test_cancel_flag() {
    PHashCalculator phash;
    std::atomic<bool> cancel(true);
    DeduplicationResult result = Deduplicator::selectUniqueFrames(make_frames({kSlideA, kSlideB}), 8, phash, &cancel);
    bool ok = check(result.cancelled, "cancel flag stops the pass");
    ok &= check(result.retained.empty(), "cancelled pass retains nothing further");
    return ok;
}

bool test_parallel_matches_sequential(const QString &dir) {
    PHashCalculator phash;
    QStringList slides;
    for (int s = 0; s < 4; ++s) {
        slides << QString("%1/slide_%2.png").arg(dir).arg(s);
    }
    if (test_helpers::write_distinct_slides(slides, phash, 16, 100).size() != 4) {
        return check(false, "write distinct fixture slides");
    }

    // Runs of three identical captures per slide
    QStringList paths;
    for (int i = 1; i <= 12; ++i) {
        const QString path = QString("%1/%2.png").arg(dir).arg(i);
        if (!QFile::copy(slides[(i - 1) / 3], path)) {
            return check(false, "copy fixture image");
        }
        paths << path;
    }
    paths << dir + "/missing.png";

    Deduplicator deduplicator;
    int lastProgress = -1;
    QObject::connect(&deduplicator, &Deduplicator::fingerprintProgress,
                     [&lastProgress](int current, int) { lastProgress = current; });
    QStringList skipped;
    QObject::connect(&deduplicator, &Deduplicator::frameSkipped,
                     [&skipped](const QString &path, const QString &) { skipped << path; });

    std::vector<Frame> sequential = deduplicator.computeFingerprints(paths, phash, 1);
    std::vector<Frame> parallel = deduplicator.computeFingerprints(paths, phash, 4);

    bool ok = check(sequential.size() == parallel.size() && sequential.size() == 13, "one frame per path");
    for (size_t i = 0; ok && i < sequential.size(); ++i) {
        ok &= check(sequential[i].path == parallel[i].path && sequential[i].sequenceIndex == static_cast<int>(i) &&
                        parallel[i].sequenceIndex == static_cast<int>(i),
                    "parallel fingerprinting keeps the input order");
        ok &= check(sequential[i].fingerprint == parallel[i].fingerprint,
                    "parallel and sequential fingerprints agree");
    }
    ok &= check(lastProgress == 13, "progress reaches the total");
    ok &= check(!parallel.back().isReadable() && !parallel.back().readError.isEmpty(),
                "missing file yields an empty fingerprint with a reason");

    DeduplicationResult result = deduplicator.run(paths, 8, phash, 3);
    ok &= check(result.retained.size() == 4, "four slides retained from runs of three");
    ok &= check(result.duplicateCount == 8, "eight duplicates removed");
    ok &= check(result.warningCount() == 1 && skipped == QStringList({dir + "/missing.png"}),
                "missing file reported through frameSkipped");
    return ok;
}

bool test_request_cancel(const QString &dir) {
    PHashCalculator phash;
    QStringList paths;
    for (int i = 1; i <= 5; ++i) {
        const QString path = QString("%1/cancel_%2.png").arg(dir).arg(i);
        if (!test_helpers::write_image(path, test_helpers::make_slide(i))) {
            return check(false, "write fixture image");
        }
        paths << path;
    }

    Deduplicator deduplicator;
    QObject::connect(&deduplicator, &Deduplicator::fingerprintProgress,
                     [&deduplicator](int current, int) {
        if (current == 2) {
            deduplicator.requestCancel();
        }
    });

    DeduplicationResult result = deduplicator.run(paths, 8, phash, 1);
    bool ok = check(result.cancelled, "requestCancel between frames cancels the run");
    ok &= check(result.retained.empty(), "cancelled run returns no retained frames");

    deduplicator.resetCancel();
    ok &= check(!deduplicator.isCancelRequested(), "resetCancel clears the request");
    return ok;
}

}  // namespace

int main() {
    QTemporaryDir dir;
    if (!dir.isValid()) {
        std::cerr << "[deduplicator_unit] cannot create temporary directory\n";
        return 2;
    }

    bool ok = true;
    ok &= test_single_frame();
    ok &= test_uniform_input();
    ok &= test_revisit_is_kept();
    ok &= test_compares_with_last_retained_only();
    ok &= test_threshold_monotonicity();
    ok &= test_incomparable_fingerprints_are_kept();
    ok &= test_unreadable_frame_is_skipped();
    ok &= test_cancel_flag();
    ok &= test_parallel_matches_sequential(dir.path());
    ok &= test_request_cancel(dir.path());
    return ok ? 0 : 1;
}
