#include "slidereducer.h"
#include "similaritythreshold.h"
#include "slidesifterrors.h"
#include <QDebug>
#include <QMutexLocker>
#include <algorithm>
#include <thread>

SlideReducer::SlideReducer(QObject *parent)
    : QObject(parent),
      m_gridSize(DHashCalculator::DEFAULT_GRID_SIZE),
      m_workerCount(1),
      m_cancelRequested(false)
{
}

void SlideReducer::setGridSize(int gridSize)
{
    if (gridSize < 1) {
        throw InvalidConfiguration("Fingerprint grid size must be positive");
    }
    m_gridSize = gridSize;
}

void SlideReducer::setWorkerCount(int workerCount)
{
    m_workerCount = std::max(1, workerCount);
}

void SlideReducer::requestCancel()
{
    m_cancelRequested = true;
    QMutexLocker locker(&m_outcomeMutex);
    m_outcomeReady.wakeAll();
}

void SlideReducer::resetCancel()
{
    m_cancelRequested = false;
}

ReductionResult SlideReducer::reduce(const QStringList& framePaths, double similarityThreshold)
{
    const int maxDistance =
        SimilarityThreshold::maxHammingDistance(similarityThreshold, m_gridSize * m_gridSize);
    qInfo().noquote() << QString("Deduplication: %1 frames in | hamming cutoff=%2 (similarity=%3)")
                             .arg(framePaths.size())
                             .arg(maxDistance)
                             .arg(similarityThreshold, 0, 'f', 2);

    if (m_workerCount > 1 && framePaths.size() > 1) {
        return reduceParallel(framePaths, maxDistance);
    }

    return decide(framePaths, maxDistance, [this, &framePaths](int index) {
        return fingerprintOne([this, &framePaths, index]() {
            return fingerprintFile(framePaths[index]);
        });
    });
}

ReductionResult SlideReducer::reduce(const std::vector<CandidateFrame>& candidates,
                                     double similarityThreshold)
{
    const int maxDistance =
        SimilarityThreshold::maxHammingDistance(similarityThreshold, m_gridSize * m_gridSize);
    qInfo().noquote() << QString("Deduplication: %1 frames in | hamming cutoff=%2 (similarity=%3)")
                             .arg(candidates.size())
                             .arg(maxDistance)
                             .arg(similarityThreshold, 0, 'f', 2);

    QStringList ids;
    ids.reserve(static_cast<int>(candidates.size()));
    for (const CandidateFrame& candidate : candidates) {
        ids.append(candidate.id);
    }

    return decide(ids, maxDistance, [this, &candidates](int index) {
        return fingerprintOne([this, &candidates, index]() {
            return fingerprintImage(candidates[index].image);
        });
    });
}

Fingerprint SlideReducer::fingerprintFile(const QString& path) const
{
    return DHashCalculator::calculate(path, m_gridSize);
}

Fingerprint SlideReducer::fingerprintImage(const cv::Mat& image) const
{
    return DHashCalculator::calculate(image, m_gridSize);
}

SlideReducer::FingerprintOutcome
SlideReducer::fingerprintOne(const std::function<Fingerprint()>& compute) const
{
    FingerprintOutcome outcome;
    try {
        outcome.fingerprint = compute();
    } catch (const DecodeError& e) {
        outcome.error = QString::fromStdString(e.what());
    } catch (const cv::Exception& e) {
        outcome.error = QString("OpenCV: %1").arg(QString::fromStdString(e.what()));
    } catch (const std::exception&) {
        // Not a per-frame problem; decide() rethrows it on the calling thread
        outcome.failure = std::current_exception();
    }
    return outcome;
}

ReductionResult SlideReducer::decide(const QStringList& ids, int maxDistance,
                                     const OutcomeSource& outcomeAt)
{
    ReductionResult result;
    result.totalCandidates = ids.size();
    result.maxDistance = maxDistance;

    emit deduplicationStarted(ids.size(), maxDistance);

    Fingerprint lastKept;

    for (int i = 0; i < ids.size(); i++) {
        if (m_cancelRequested) {
            result.cancelled = true;
            break;
        }

        FingerprintOutcome outcome = outcomeAt(i);
        if (!outcome.available) {
            result.cancelled = true;
            break;
        }
        if (outcome.failure) {
            qCritical() << "Fingerprinting failed on" << ids[i];
            std::rethrow_exception(outcome.failure);
        }

        const QString& id = ids[i];

        if (!outcome.error.isEmpty()) {
            qWarning().noquote() << "Skipping unreadable frame" << id << ":" << outcome.error;
            result.skipped.append(id);
            emit frameSkipped(id, outcome.error);
        } else if (!lastKept.isValid()) {
            result.retained.append(id);
            lastKept = outcome.fingerprint;
            qDebug().noquote() << "Kept" << id << lastKept.toHex();
        } else {
            int distance = DHashCalculator::hammingDistance(outcome.fingerprint, lastKept);
            if (distance > maxDistance) {
                result.retained.append(id);
                lastKept = outcome.fingerprint;
                qDebug().noquote() << "Kept" << id << lastKept.toHex() << "distance" << distance;
            }
        }

        emit progressUpdated(i + 1, ids.size());
    }

    if (result.cancelled) {
        qInfo() << "Deduplication cancelled after" << result.retained.size() << "kept slides";
    } else {
        qInfo() << "Deduplication:" << result.retained.size() << "unique slides kept,"
                << result.skippedCount() << "unreadable";
    }

    emit deduplicationFinished(result.retained.size(), result.skippedCount());
    return result;
}

ReductionResult SlideReducer::reduceParallel(const QStringList& framePaths, int maxDistance)
{
    const int total = framePaths.size();
    const int workers = std::min(m_workerCount, total);

    std::vector<FingerprintOutcome> outcomes(total);
    std::vector<bool> ready(total, false);

    // Stops the workers when the decision stage leaves early
    std::atomic<bool> abandoned(false);

    std::vector<std::thread> threads;
    threads.reserve(workers);

    auto joinWorkers = [&threads, &abandoned]() {
        abandoned = true;
        for (std::thread& thread : threads) {
            thread.join();
        }
    };

    ReductionResult result;
    try {
        for (int w = 0; w < workers; w++) {
            threads.emplace_back([this, &framePaths, &outcomes, &ready, &abandoned, w, workers, total]() {
                for (int i = w; i < total; i += workers) {
                    if (m_cancelRequested || abandoned) {
                        break;
                    }
                    FingerprintOutcome outcome = fingerprintOne([this, &framePaths, i]() {
                        return fingerprintFile(framePaths[i]);
                    });

                    QMutexLocker locker(&m_outcomeMutex);
                    outcomes[i] = std::move(outcome);
                    ready[i] = true;
                    m_outcomeReady.wakeAll();
                }
            });
        }

        result = decide(framePaths, maxDistance, [this, &outcomes, &ready](int index) {
            QMutexLocker locker(&m_outcomeMutex);
            while (!ready[index]) {
                if (m_cancelRequested) {
                    FingerprintOutcome missing;
                    missing.available = false;
                    return missing;
                }
                m_outcomeReady.wait(&m_outcomeMutex, 100);
            }
            return std::move(outcomes[index]);
        });
    } catch (...) {
        joinWorkers();
        throw;
    }

    joinWorkers();
    return result;
}
