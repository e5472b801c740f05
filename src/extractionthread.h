#ifndef EXTRACTIONTHREAD_H
#define EXTRACTIONTHREAD_H

#include <QThread>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <memory>
#include "configmanager.h"
#include "sceneextractor.h"
#include "slidereducer.h"

/**
 * Runs both passes for one video off the GUI thread:
 * FFmpeg scene extraction into a working directory, then deduplication of
 * the extracted frames. Every outcome is reported through exactly one of
 * extractionFinished(), extractionFailed() or extractionCancelled().
 */
class ExtractionThread : public QThread
{
    Q_OBJECT

public:
    explicit ExtractionThread(QObject *parent = nullptr);
    ~ExtractionThread();

    /**
     * Start processing a video
     * @param videoPath Video to process
     * @param workDir Directory receiving the raw scene frames
     * @param config Thresholds and tool settings for this run
     * @return false if a run is already in progress
     * @throws InvalidConfiguration if a threshold or the grid size is unusable;
     *         nothing is started and a later call may succeed
     */
    bool startExtraction(const QString& videoPath, const QString& workDir,
                         const AppConfig& config);

    /**
     * Abandon the current run (kills FFmpeg, stops deduplication)
     */
    void cancel();

    /**
     * Check if a run is in progress
     */
    bool isProcessing() const;

signals:
    void statusMessage(const QString& message);
    void videoInfoLogged(const QString& info);
    void sceneExtractionProgress(double percentage);
    void deduplicationProgress(int current, int total);
    void frameSkipped(const QString& framePath, const QString& reason);
    void extractionFinished(const QStringList& slidePaths, int skippedFrames);
    void extractionFailed(const QString& error);
    void extractionCancelled();

protected:
    void run() override;

private:
    /**
     * Both passes; returns normally or throws on unexpected errors
     */
    void processVideo();

    std::unique_ptr<SceneExtractor> m_sceneExtractor;
    std::unique_ptr<SlideReducer> m_slideReducer;

    mutable QMutex m_mutex;
    QString m_videoPath;
    QString m_workDir;
    AppConfig m_config;
    bool m_shouldStop;
    bool m_isProcessing;
};

#endif // EXTRACTIONTHREAD_H
