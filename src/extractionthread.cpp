#include "extractionthread.h"
#include "similaritythreshold.h"
#include "slidesifterrors.h"
#include "videoprobe.h"
#include <QDebug>
#include <QMutexLocker>
#include <exception>

ExtractionThread::ExtractionThread(QObject *parent)
    : QThread(parent),
      m_sceneExtractor(std::make_unique<SceneExtractor>()),
      m_slideReducer(std::make_unique<SlideReducer>()),
      m_shouldStop(false),
      m_isProcessing(false)
{
    // Emitted on the worker thread, re-emitted on ours
    connect(m_sceneExtractor.get(), &SceneExtractor::extractionProgress,
            this, &ExtractionThread::sceneExtractionProgress);
    connect(m_slideReducer.get(), &SlideReducer::progressUpdated,
            this, &ExtractionThread::deduplicationProgress);
    connect(m_slideReducer.get(), &SlideReducer::frameSkipped,
            this, &ExtractionThread::frameSkipped);
}

ExtractionThread::~ExtractionThread()
{
    cancel();
    wait();
}

bool ExtractionThread::startExtraction(const QString& videoPath, const QString& workDir,
                                       const AppConfig& config)
{
    SimilarityThreshold::validate(config.similarityThreshold);
    if (config.hashGridSize < 1) {
        throw InvalidConfiguration("Fingerprint grid size must be positive");
    }

    QMutexLocker locker(&m_mutex);
    if (m_isProcessing || isRunning()) {
        return false;
    }

    m_sceneExtractor->setFfmpegPath(config.ffmpegPath);
    m_slideReducer->setGridSize(config.hashGridSize);
    m_slideReducer->setWorkerCount(ConfigManager::effectiveWorkerCount(config));

    // Cleared here only; a cancel() during probing must reach both passes
    m_sceneExtractor->resetCancel();
    m_slideReducer->resetCancel();

    m_videoPath = videoPath;
    m_workDir = workDir;
    m_config = config;
    m_shouldStop = false;
    m_isProcessing = true;

    start();
    return true;
}

void ExtractionThread::cancel()
{
    {
        QMutexLocker locker(&m_mutex);
        m_shouldStop = true;
    }
    m_sceneExtractor->cancel();
    m_slideReducer->requestCancel();
}

bool ExtractionThread::isProcessing() const
{
    QMutexLocker locker(&m_mutex);
    return m_isProcessing;
}

void ExtractionThread::run()
{
    try {
        processVideo();
    } catch (const std::exception& e) {
        qCritical() << "Unexpected extraction error:" << e.what();
        emit extractionFailed(QString::fromStdString(e.what()));
    }

    QMutexLocker locker(&m_mutex);
    m_isProcessing = false;
}

void ExtractionThread::processVideo()
{
    QString videoPath;
    QString workDir;
    AppConfig config;
    {
        QMutexLocker locker(&m_mutex);
        videoPath = m_videoPath;
        workDir = m_workDir;
        config = m_config;
    }

    auto stopRequested = [this]() {
        QMutexLocker locker(&m_mutex);
        return m_shouldStop;
    };

    // Pass 1: scene-change frames
    emit statusMessage("Pass 1/2 - Running FFmpeg scene detection ...");

    VideoProbe probe;
    if (!probe.open(videoPath.toStdString())) {
        emit extractionFailed(QString::fromStdString(probe.getLastError()));
        return;
    }

    if (stopRequested()) {
        emit extractionCancelled();
        return;
    }

    const VideoProbe::VideoInfo& videoInfo = probe.getVideoInfo();
    QString infoLog = QString("Video Info - Resolution: %1x%2, Duration: %3s, Frame Rate: %4fps, Codec: %5")
                          .arg(videoInfo.width)
                          .arg(videoInfo.height)
                          .arg(videoInfo.duration, 0, 'f', 1)
                          .arg(videoInfo.frameRate, 0, 'f', 2)
                          .arg(QString::fromStdString(videoInfo.codecName));
    qInfo().noquote() << infoLog;
    emit videoInfoLogged(infoLog);

    QStringList rawFrames;
    int frameCount = m_sceneExtractor->extractSceneFrames(videoPath, workDir,
                                                          config.sceneThreshold,
                                                          videoInfo.duration,
                                                          rawFrames);
    if (stopRequested()) {
        emit extractionCancelled();
        return;
    }
    if (frameCount < 0) {
        emit extractionFailed(m_sceneExtractor->getLastError());
        return;
    }
    if (frameCount == 0) {
        emit extractionFailed("FFmpeg produced no frames.\n"
                              "Try lowering the scene detection threshold.");
        return;
    }

    // Pass 2: collapse near-duplicates
    emit statusMessage(QString("Pass 2/2 - Deduplicating %1 frames ...").arg(frameCount));

    ReductionResult result = m_slideReducer->reduce(rawFrames, config.similarityThreshold);
    if (result.cancelled || stopRequested()) {
        emit extractionCancelled();
        return;
    }

    emit statusMessage(QString("Done - %1 unique slide(s) detected.").arg(result.retained.size()));
    emit extractionFinished(result.retained, result.skippedCount());
}
