#include <gtest/gtest.h>
#include "../src/slidereducer.h"
#include "../src/slidesifterrors.h"
#include "test_helpers.h"
#include <QTemporaryDir>
#include <new>
#include <vector>

namespace {

CandidateFrame frame(const QString& id, const std::vector<bool>& bits)
{
    return CandidateFrame{id, testimages::fromBits(bits)};
}

// Positions of the retained ids within the input, for order checks
std::vector<int> retainedIndices(const ReductionResult& result, const QStringList& ids)
{
    std::vector<int> indices;
    for (const QString& id : result.retained) {
        indices.push_back(ids.indexOf(id));
    }
    return indices;
}

// Runs out of memory on one chosen file
class ExhaustingReducer : public SlideReducer
{
public:
    explicit ExhaustingReducer(const QString& failingPath) : m_failingPath(failingPath) {}

protected:
    Fingerprint fingerprintFile(const QString& path) const override
    {
        if (path == m_failingPath) {
            throw std::bad_alloc();
        }
        return SlideReducer::fingerprintFile(path);
    }

private:
    QString m_failingPath;
};

}

class SlideReducerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(temp_dir.isValid());
        slide_a = testimages::leadingBits(0);
        slide_b = testimages::leadingBits(256);
    }

    QTemporaryDir temp_dir;
    SlideReducer reducer;
    std::vector<bool> slide_a;
    std::vector<bool> slide_b;
};

TEST_F(SlideReducerTest, RunsOfIdenticalFramesCollapse) {
    std::vector<CandidateFrame> candidates = {
        frame("1", slide_a), frame("2", slide_a), frame("3", slide_a),
        frame("4", slide_b), frame("5", slide_b)
    };

    ReductionResult result = reducer.reduce(candidates, 0.9);

    EXPECT_EQ(result.retained, QStringList({"1", "4"}));
    EXPECT_EQ(result.skippedCount(), 0);
    EXPECT_EQ(result.totalCandidates, 5);
    EXPECT_EQ(result.maxDistance, 25);
    EXPECT_FALSE(result.cancelled);
}

TEST_F(SlideReducerTest, EmptyInputGivesEmptyResult) {
    ReductionResult fromMemory = reducer.reduce(std::vector<CandidateFrame>(), 0.9);
    ReductionResult fromFiles = reducer.reduce(QStringList(), 0.9);

    EXPECT_TRUE(fromMemory.retained.isEmpty());
    EXPECT_TRUE(fromFiles.retained.isEmpty());
    EXPECT_EQ(fromFiles.skippedCount(), 0);
}

TEST_F(SlideReducerTest, AllUnreadableFramesAreSkipped) {
    QStringList paths;
    paths << testimages::writeGarbage(temp_dir.path(), "a.png")
          << testimages::writeGarbage(temp_dir.path(), "b.png")
          << temp_dir.filePath("does_not_exist.png");

    ReductionResult result;
    ASSERT_NO_THROW(result = reducer.reduce(paths, 0.9));

    EXPECT_TRUE(result.retained.isEmpty());
    EXPECT_EQ(result.skippedCount(), 3);
    EXPECT_EQ(result.skipped, paths);
}

TEST_F(SlideReducerTest, UnreadableFramesAreNeitherKeptNorCompared) {
    QString broken = testimages::writeGarbage(temp_dir.path(), "000.png");
    QString first = testimages::writeImage(temp_dir.path(), "001.png", testimages::fromBits(slide_a));
    QString missing = temp_dir.filePath("002.png");
    QString second = testimages::writeImage(temp_dir.path(), "003.png", testimages::fromBits(slide_b));

    ReductionResult result = reducer.reduce(QStringList() << broken << first << missing << second, 0.9);

    EXPECT_EQ(result.retained, QStringList({first, second}));
    EXPECT_EQ(result.skipped, QStringList({broken, missing}));
}

TEST_F(SlideReducerTest, SingleCandidateIsKept) {
    ReductionResult result = reducer.reduce({frame("only", slide_a)}, 0.0);

    EXPECT_EQ(result.retained, QStringList({"only"}));
}

TEST_F(SlideReducerTest, DuplicatesThenOneChangeKeepsTwo) {
    std::vector<CandidateFrame> candidates;
    for (int i = 0; i < 8; i++) {
        candidates.push_back(frame(QString("dup%1").arg(i), slide_a));
    }
    candidates.push_back(frame("changed", testimages::leadingBits(60)));

    ReductionResult result = reducer.reduce(candidates, 0.99);

    EXPECT_EQ(result.retained, QStringList({"dup0", "changed"}));
}

TEST_F(SlideReducerTest, ComparesAgainstLastKeptFrame) {
    // Every step is small, but the drift from the kept frame adds up
    std::vector<CandidateFrame> candidates = {
        frame("f0", testimages::leadingBits(0)),
        frame("f1", testimages::leadingBits(20)),
        frame("f2", testimages::leadingBits(40)),
        frame("f3", testimages::leadingBits(60)),
        frame("f4", testimages::leadingBits(80))
    };

    ReductionResult result = reducer.reduce(candidates, 0.9);

    EXPECT_EQ(result.retained, QStringList({"f0", "f2", "f4"}));
}

TEST_F(SlideReducerTest, DistanceEqualToCutoffIsDuplicate) {
    ReductionResult atCutoff = reducer.reduce(
        {frame("base", slide_a), frame("edge", testimages::leadingBits(25))}, 0.9);
    ReductionResult pastCutoff = reducer.reduce(
        {frame("base", slide_a), frame("edge", testimages::leadingBits(26))}, 0.9);

    EXPECT_EQ(atCutoff.retained, QStringList({"base"}));
    EXPECT_EQ(pastCutoff.retained, QStringList({"base", "edge"}));
}

TEST_F(SlideReducerTest, ThresholdOneKeepsEveryDistinctFrame) {
    std::vector<CandidateFrame> candidates = {
        frame("a", slide_a), frame("b", testimages::leadingBits(1)),
        frame("c", testimages::leadingBits(1)), frame("d", testimages::leadingBits(2))
    };

    ReductionResult result = reducer.reduce(candidates, 1.0);

    EXPECT_EQ(result.retained, QStringList({"a", "b", "d"}));
}

TEST_F(SlideReducerTest, ThresholdZeroKeepsOnlyTheFirstFrame) {
    ReductionResult result = reducer.reduce({frame("a", slide_a), frame("b", slide_b)}, 0.0);

    EXPECT_EQ(result.retained, QStringList({"a"}));
}

TEST_F(SlideReducerTest, RetainedCountGrowsWithThresholdAndKeepsOrder) {
    // A lecture that slowly builds up, with repeated frames in between
    const int setBits[] = {0, 0, 3, 10, 10, 11, 30, 31, 31, 60, 90, 90, 91, 140, 200, 256, 256};

    std::vector<CandidateFrame> candidates;
    QStringList ids;
    for (int i = 0; i < int(sizeof(setBits) / sizeof(setBits[0])); i++) {
        QString id = QString("frame_%1").arg(i, 2, 10, QChar('0'));
        candidates.push_back(frame(id, testimages::leadingBits(setBits[i])));
        ids << id;
    }

    int previousCount = 0;
    for (int step = 0; step <= 20; step++) {
        double threshold = step / 20.0;
        ReductionResult result = reducer.reduce(candidates, threshold);

        EXPECT_GE(result.retained.size(), previousCount) << "threshold " << threshold;
        previousCount = result.retained.size();

        ASSERT_FALSE(result.retained.isEmpty());
        EXPECT_EQ(result.retained.first(), ids.first());

        std::vector<int> indices = retainedIndices(result, ids);
        for (size_t i = 1; i < indices.size(); i++) {
            EXPECT_LT(indices[i - 1], indices[i]);
        }
    }

    // Threshold 1.0 keeps one frame per distinct picture
    EXPECT_EQ(previousCount, 12);
}

TEST_F(SlideReducerTest, ParallelFingerprintingMatchesSequential) {
    QStringList paths;
    for (int i = 0; i < 30; i++) {
        QString name = QString("slide_%1.png").arg(i, 6, 10, QChar('0'));
        if (i % 7 == 3) {
            paths << testimages::writeGarbage(temp_dir.path(), name);
        } else {
            std::vector<bool> bits = testimages::leadingBits((i / 4) * 30);
            paths << testimages::writeImage(temp_dir.path(), name, testimages::fromBits(bits));
        }
    }

    reducer.setWorkerCount(1);
    ReductionResult sequential = reducer.reduce(paths, 0.9);

    reducer.setWorkerCount(4);
    ReductionResult parallel = reducer.reduce(paths, 0.9);

    EXPECT_EQ(parallel.retained, sequential.retained);
    EXPECT_EQ(parallel.skipped, sequential.skipped);
    EXPECT_FALSE(parallel.cancelled);
    EXPECT_GT(sequential.retained.size(), 1);
}

TEST_F(SlideReducerTest, ReportsProgressThroughSignals) {
    int startedTotal = -1;
    int startedCutoff = -1;
    int progressCalls = 0;
    int lastProgress = 0;
    int finishedRetained = -1;
    int finishedSkipped = -1;
    QStringList skippedIds;

    QObject::connect(&reducer, &SlideReducer::deduplicationStarted, [&](int total, int cutoff) {
        startedTotal = total;
        startedCutoff = cutoff;
    });
    QObject::connect(&reducer, &SlideReducer::progressUpdated, [&](int current, int) {
        progressCalls++;
        lastProgress = current;
    });
    QObject::connect(&reducer, &SlideReducer::frameSkipped, [&](const QString& id, const QString&) {
        skippedIds << id;
    });
    QObject::connect(&reducer, &SlideReducer::deduplicationFinished, [&](int retained, int skipped) {
        finishedRetained = retained;
        finishedSkipped = skipped;
    });

    QString broken = testimages::writeGarbage(temp_dir.path(), "broken.png");
    QString good = testimages::writeImage(temp_dir.path(), "good.png", testimages::fromBits(slide_a));
    reducer.reduce(QStringList() << good << broken << good, 0.9);

    EXPECT_EQ(startedTotal, 3);
    EXPECT_EQ(startedCutoff, 25);
    EXPECT_EQ(progressCalls, 3);
    EXPECT_EQ(lastProgress, 3);
    EXPECT_EQ(skippedIds, QStringList({broken}));
    EXPECT_EQ(finishedRetained, 1);
    EXPECT_EQ(finishedSkipped, 1);
}

TEST_F(SlideReducerTest, InvalidThresholdFailsBeforeAnyWork) {
    bool started = false;
    QObject::connect(&reducer, &SlideReducer::deduplicationStarted, [&](int, int) {
        started = true;
    });

    EXPECT_THROW(reducer.reduce({frame("a", slide_a)}, 1.5), InvalidConfiguration);
    EXPECT_THROW(reducer.reduce(QStringList() << "x.png", -0.1), InvalidConfiguration);
    EXPECT_FALSE(started);
}

TEST_F(SlideReducerTest, CancelStopsAtNextCandidate) {
    QObject::connect(&reducer, &SlideReducer::progressUpdated, [&](int current, int) {
        if (current == 1) {
            reducer.requestCancel();
        }
    });

    ReductionResult result = reducer.reduce(
        {frame("a", slide_a), frame("b", slide_b), frame("c", slide_a)}, 0.9);

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.retained, QStringList({"a"}));
}

TEST_F(SlideReducerTest, GridSizeMustBePositive) {
    EXPECT_THROW(reducer.setGridSize(0), InvalidConfiguration);

    reducer.setGridSize(8);
    ReductionResult result = reducer.reduce({frame("a", slide_a)}, 0.5);
    EXPECT_EQ(result.maxDistance, 32);
}

TEST_F(SlideReducerTest, CancelBeforeRunIsHonoured) {
    std::vector<CandidateFrame> candidates = {frame("a", slide_a), frame("b", slide_b)};

    reducer.requestCancel();
    ReductionResult cancelled = reducer.reduce(candidates, 0.9);

    EXPECT_TRUE(cancelled.cancelled);
    EXPECT_TRUE(cancelled.retained.isEmpty());

    reducer.resetCancel();
    ReductionResult resumed = reducer.reduce(candidates, 0.9);

    EXPECT_FALSE(resumed.cancelled);
    EXPECT_EQ(resumed.retained, QStringList({"a", "b"}));
}

TEST_F(SlideReducerTest, WorkerFailureReachesTheCaller) {
    QStringList paths;
    for (int i = 0; i < 12; i++) {
        std::vector<bool> bits = testimages::leadingBits(i * 30);
        paths << testimages::writeImage(temp_dir.path(), QString("frame_%1.png").arg(i),
                                        testimages::fromBits(bits));
    }

    ExhaustingReducer failing(paths[7]);

    failing.setWorkerCount(4);
    EXPECT_THROW(failing.reduce(paths, 0.9), std::bad_alloc);

    failing.setWorkerCount(1);
    EXPECT_THROW(failing.reduce(paths, 0.9), std::bad_alloc);

    // The failed run leaves no cancel behind
    failing.setWorkerCount(4);
    ReductionResult result = failing.reduce(paths.mid(0, 7), 0.9);
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.retained.size(), 7);
}
