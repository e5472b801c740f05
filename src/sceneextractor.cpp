#include "sceneextractor.h"
#include <QDir>
#include <QDebug>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <algorithm>

SceneExtractor::SceneExtractor(QObject *parent)
    : QObject(parent),
      m_ffmpegPath(resolveFfmpegPath(QString())),
      m_cancelRequested(false)
{
}

void SceneExtractor::setFfmpegPath(const QString& ffmpegPath)
{
    m_ffmpegPath = resolveFfmpegPath(ffmpegPath);
}

void SceneExtractor::cancel()
{
    m_cancelRequested = true;
}

void SceneExtractor::resetCancel()
{
    m_cancelRequested = false;
}

QString SceneExtractor::resolveFfmpegPath(const QString& configuredPath)
{
    if (!configuredPath.trimmed().isEmpty()) {
        return configuredPath.trimmed();
    }

    QString found = QStandardPaths::findExecutable("ffmpeg");
    return found.isEmpty() ? QString("ffmpeg") : found;
}

QStringList SceneExtractor::buildArguments(const QString& videoPath,
                                           const QString& outputDir,
                                           double sceneThreshold)
{
    // Always keep frame 0, then every frame whose scene score passes the threshold
    QString filter = QString("select=eq(n\\,0)+gt(scene\\,%1),setpts=N/FRAME_RATE/TB")
                         .arg(QString::number(sceneThreshold));

    return QStringList()
        << "-hide_banner"
        << "-nostdin"
        << "-y"
        << "-i" << videoPath
        << "-vf" << filter
        << "-vsync" << "vfr"
        << "-q:v" << "2"
        << "-progress" << "pipe:1"
        << "-nostats"
        << QDir(outputDir).filePath("slide_%06d.png");
}

qint64 SceneExtractor::parseProgressMicros(const QByteArray& line)
{
    QByteArray trimmed = line.trimmed();
    int separator = trimmed.indexOf('=');
    if (separator <= 0) {
        return -1;
    }

    QByteArray key = trimmed.left(separator);
    // out_time_ms is also in microseconds (long-standing FFmpeg quirk)
    if (key != "out_time_us" && key != "out_time_ms") {
        return -1;
    }

    bool ok = false;
    qint64 micros = trimmed.mid(separator + 1).toLongLong(&ok);
    if (!ok || micros < 0) {
        return -1;
    }
    return micros;
}

QStringList SceneExtractor::collectFrames(const QString& outputDir)
{
    QDir dir(outputDir);
    QStringList frames = dir.entryList(QStringList() << "slide_*.png", QDir::Files, QDir::Name);

    // %06d numbering makes name order equal to playback order
    for (QString& frame : frames) {
        frame = dir.absoluteFilePath(frame);
    }
    return frames;
}

int SceneExtractor::extractSceneFrames(const QString& videoPath,
                                       const QString& outputDir,
                                       double sceneThreshold,
                                       double durationSeconds,
                                       QStringList& framePaths)
{
    framePaths.clear();
    m_lastError.clear();

    if (m_cancelRequested) {
        m_lastError = "Extraction cancelled";
        return -1;
    }

    if (!QDir().mkpath(outputDir)) {
        m_lastError = "Failed to create frame directory: " + outputDir;
        return -1;
    }

    QStringList arguments = buildArguments(videoPath, outputDir, sceneThreshold);

    QProcess process;
    process.setProgram(m_ffmpegPath);
    process.setArguments(arguments);

    qInfo().noquote() << "Video:" << videoPath
                      << QString("| scene_threshold=%1").arg(sceneThreshold, 0, 'f', 2);
    qDebug().noquote() << (QStringList() << m_ffmpegPath << arguments).join(" ");

    process.start();
    if (!process.waitForStarted()) {
        m_lastError = QString("Failed to start FFmpeg (%1): %2")
                          .arg(m_ffmpegPath, process.errorString());
        qCritical().noquote() << m_lastError;
        return -1;
    }

    const qint64 durationMicros = durationSeconds > 0.0
        ? static_cast<qint64>(durationSeconds * 1000000.0) : 0;
    QString stderrTail;
    double lastPercentage = -1.0;

    auto drainOutput = [&]() {
        while (process.canReadLine()) {
            QByteArray line = process.readLine();
            if (line.trimmed() == "progress=end") {
                lastPercentage = 100.0;
                emit extractionProgress(100.0);
                continue;
            }

            qint64 micros = parseProgressMicros(line);
            if (micros >= 0 && durationMicros > 0) {
                double percentage = std::min(100.0, micros * 100.0 / durationMicros);
                if (percentage - lastPercentage >= 1.0) {
                    lastPercentage = percentage;
                    emit extractionProgress(percentage);
                }
            }
        }

        stderrTail += QString::fromLocal8Bit(process.readAllStandardError());
        if (stderrTail.size() > STDERR_TAIL_CHARS) {
            stderrTail = stderrTail.right(STDERR_TAIL_CHARS);
        }
    };

    while (process.state() != QProcess::NotRunning) {
        if (m_cancelRequested) {
            process.kill();
            process.waitForFinished();
            m_lastError = "Extraction cancelled";
            qInfo() << "FFmpeg killed on request";
            return -1;
        }

        process.waitForReadyRead(POLL_INTERVAL_MS);
        drainOutput();
    }
    drainOutput();

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        qCritical() << "FFmpeg failed (code" << process.exitCode() << ")";
        m_lastError = QString("FFmpeg failed:\n%1").arg(stderrTail.trimmed());
        return -1;
    }

    framePaths = collectFrames(outputDir);
    qInfo() << "FFmpeg produced" << framePaths.size() << "raw frames";
    return framePaths.size();
}
