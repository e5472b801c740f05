#ifndef SLIDEREDUCER_H
#define SLIDEREDUCER_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QMutex>
#include <QWaitCondition>
#include <atomic>
#include <exception>
#include <functional>
#include <vector>
#include <opencv2/opencv.hpp>
#include "dhashcalculator.h"

/**
 * @brief One candidate frame already resident in memory
 */
struct CandidateFrame {
    QString id;
    cv::Mat image;
};

/**
 * @brief Outcome of one deduplication run
 */
struct ReductionResult {
    QStringList retained;       // Kept ids, in input order
    QStringList skipped;        // Ids that could not be fingerprinted
    int totalCandidates = 0;
    int maxDistance = 0;        // Hamming cutoff used for the run
    bool cancelled = false;

    int skippedCount() const { return skipped.size(); }
};

/**
 * @brief Collapses runs of near-identical frames into one slide each
 *
 * Walks the candidates once in order. A candidate is kept when it is the
 * first readable one, or when its fingerprint differs from the last *kept*
 * fingerprint by more than the Hamming cutoff. Discarded candidates never
 * become the comparison baseline, so slow drift over many similar frames
 * still ends up producing a new slide.
 *
 * File candidates may be fingerprinted on several worker threads; the
 * keep/discard decision always consumes them strictly in input order.
 */
class SlideReducer : public QObject
{
    Q_OBJECT

public:
    explicit SlideReducer(QObject *parent = nullptr);

    /**
     * @brief Side of the fingerprint grid (bits = gridSize^2)
     */
    void setGridSize(int gridSize);
    int gridSize() const { return m_gridSize; }

    /**
     * @brief Number of threads used to fingerprint files (<= 1 means inline)
     */
    void setWorkerCount(int workerCount);
    int workerCount() const { return m_workerCount; }

    /**
     * @brief Deduplicate image files
     * @param framePaths Frame files in playback order
     * @param similarityThreshold Threshold in [0, 1]; higher keeps more frames
     * @return Retained paths plus diagnostics
     * @throws InvalidConfiguration before any work if the threshold is invalid;
     *         rethrows non-decode failures (e.g. std::bad_alloc) from any worker
     */
    ReductionResult reduce(const QStringList& framePaths, double similarityThreshold);

    /**
     * @brief Deduplicate in-memory frames
     * @param candidates Frames in playback order
     * @param similarityThreshold Threshold in [0, 1]; higher keeps more frames
     * @return Retained ids plus diagnostics
     * @throws InvalidConfiguration before any work if the threshold is invalid
     */
    ReductionResult reduce(const std::vector<CandidateFrame>& candidates,
                           double similarityThreshold);

    /**
     * @brief Stop the current run at the next candidate boundary
     *
     * Safe to call from any thread. The interrupted run returns what it kept
     * so far with cancelled set. The request stays in effect, so a run that
     * starts afterwards returns at once, until resetCancel() is called.
     */
    void requestCancel();
    void resetCancel();

protected:
    /**
     * @brief Fingerprint one candidate with the current grid size
     *
     * Called from worker threads when several workers are configured.
     * DecodeError marks the candidate unreadable; any other exception
     * aborts the run and is rethrown from reduce().
     */
    virtual Fingerprint fingerprintFile(const QString& path) const;
    virtual Fingerprint fingerprintImage(const cv::Mat& image) const;

signals:
    void deduplicationStarted(int totalCandidates, int maxDistance);
    void progressUpdated(int current, int total);
    void frameSkipped(const QString& id, const QString& reason);
    void deduplicationFinished(int retainedCount, int skippedCount);

private:
    struct FingerprintOutcome {
        Fingerprint fingerprint;
        QString error;          // Non-empty when the candidate was unreadable
        bool available = true;  // False when the run was cancelled before it was produced
        std::exception_ptr failure;  // Anything other than a decode problem
    };

    using OutcomeSource = std::function<FingerprintOutcome(int)>;

    /**
     * @brief Fingerprint one candidate, turning failures into an outcome
     */
    FingerprintOutcome fingerprintOne(const std::function<Fingerprint()>& compute) const;

    /**
     * @brief The sequential keep/discard pass
     * @param ids Candidate ids in order
     * @param maxDistance Hamming cutoff
     * @param outcomeAt Returns the fingerprint outcome of candidate i, in order
     */
    ReductionResult decide(const QStringList& ids, int maxDistance,
                           const OutcomeSource& outcomeAt);

    /**
     * @brief Fingerprint files on worker threads while decide() consumes them
     */
    ReductionResult reduceParallel(const QStringList& framePaths, int maxDistance);

    int m_gridSize;
    int m_workerCount;
    std::atomic<bool> m_cancelRequested;

    // Hand-off between fingerprint workers and the decision stage
    QMutex m_outcomeMutex;
    QWaitCondition m_outcomeReady;
};

#endif // SLIDEREDUCER_H
