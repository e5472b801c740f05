#ifndef SCENEEXTRACTOR_H
#define SCENEEXTRACTOR_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QByteArray>
#include <atomic>

/**
 * Runs the external FFmpeg binary to dump one PNG per detected scene change.
 *
 * The first frame is always emitted; after that a frame is written whenever
 * FFmpeg's scene score exceeds the sensitivity threshold. Files are named
 * slide_000001.png, slide_000002.png, ... in playback order.
 */
class SceneExtractor : public QObject
{
    Q_OBJECT

public:
    explicit SceneExtractor(QObject *parent = nullptr);

    /**
     * Set the FFmpeg executable (empty = search PATH)
     */
    void setFfmpegPath(const QString& ffmpegPath);
    QString ffmpegPath() const { return m_ffmpegPath; }

    /**
     * Extract scene-change frames from a video
     * @param videoPath Input video
     * @param outputDir Directory receiving slide_%06d.png (created if missing)
     * @param sceneThreshold FFmpeg scene score threshold
     * @param durationSeconds Video duration used for progress, <= 0 if unknown
     * @param framePaths Output: extracted files sorted in playback order
     * @return Number of frames extracted, -1 on error (see getLastError())
     */
    int extractSceneFrames(const QString& videoPath,
                           const QString& outputDir,
                           double sceneThreshold,
                           double durationSeconds,
                           QStringList& framePaths);

    /**
     * Kill a running FFmpeg process. Safe to call from any thread.
     * Also refuses later extractions until resetCancel().
     */
    void cancel();
    void resetCancel();

    QString getLastError() const { return m_lastError; }

    /**
     * Resolve the executable to launch
     * @param configuredPath Path from the configuration, may be empty
     * @return configuredPath if set, else ffmpeg found on PATH, else "ffmpeg"
     */
    static QString resolveFfmpegPath(const QString& configuredPath);

    /**
     * Build the FFmpeg command-line arguments for one extraction
     */
    static QStringList buildArguments(const QString& videoPath,
                                      const QString& outputDir,
                                      double sceneThreshold);

    /**
     * Parse one line of "-progress" output
     * @param line A key=value line
     * @return Encoded position in microseconds, or -1 if the line carries none
     */
    static qint64 parseProgressMicros(const QByteArray& line);

    /**
     * List extracted frames in a directory, sorted by file name
     */
    static QStringList collectFrames(const QString& outputDir);

signals:
    void extractionProgress(double percentage);

private:
    QString m_ffmpegPath;
    QString m_lastError;
    std::atomic<bool> m_cancelRequested;

    // FFmpeg's stderr can be long; only this much is kept for error reports
    static const int STDERR_TAIL_CHARS = 2000;
    static const int POLL_INTERVAL_MS = 200;
};

#endif // SCENEEXTRACTOR_H
