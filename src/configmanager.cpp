#include "configmanager.h"
#include <QtGlobal>
#include <algorithm>
#include <thread>

// Configuration keys
const QString ConfigManager::KEY_SCENE_THRESHOLD = "sceneThreshold";
const QString ConfigManager::KEY_SIMILARITY_THRESHOLD = "similarityThreshold";
const QString ConfigManager::KEY_FFMPEG_PATH = "ffmpegPath";
const QString ConfigManager::KEY_HASH_GRID_SIZE = "hashGridSize";
const QString ConfigManager::KEY_WORKER_COUNT = "workerCount";
const QString ConfigManager::KEY_LAST_VIDEO_DIR = "lastVideoDirectory";
const QString ConfigManager::KEY_PDF_MARGIN = "pdfMargin";

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings("SlideSift", "SlideSift", this);
}

ConfigManager::ConfigManager(const QString& iniPath, QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings(iniPath, QSettings::IniFormat, this);
}

AppConfig ConfigManager::loadConfig()
{
    AppConfig config;

    config.sceneThreshold = qBound(SCENE_THRESHOLD_MIN,
        m_settings->value(KEY_SCENE_THRESHOLD, config.sceneThreshold).toDouble(),
        SCENE_THRESHOLD_MAX);
    config.similarityThreshold = qBound(SIMILARITY_THRESHOLD_MIN,
        m_settings->value(KEY_SIMILARITY_THRESHOLD, config.similarityThreshold).toDouble(),
        SIMILARITY_THRESHOLD_MAX);
    config.ffmpegPath = m_settings->value(KEY_FFMPEG_PATH, config.ffmpegPath).toString();

    // Anything past 64 makes the fingerprint larger than a frame is worth
    config.hashGridSize = qBound(1, m_settings->value(KEY_HASH_GRID_SIZE, config.hashGridSize).toInt(), 64);
    config.workerCount = std::max(0, m_settings->value(KEY_WORKER_COUNT, config.workerCount).toInt());

    QString lastDir = m_settings->value(KEY_LAST_VIDEO_DIR, config.lastVideoDirectory).toString();
    if (QDir(lastDir).exists()) {
        config.lastVideoDirectory = lastDir;
    }

    config.pdfMargin = qBound(0.0, m_settings->value(KEY_PDF_MARGIN, config.pdfMargin).toDouble(), 200.0);

    return config;
}

void ConfigManager::saveConfig(const AppConfig& config)
{
    m_settings->setValue(KEY_SCENE_THRESHOLD, config.sceneThreshold);
    m_settings->setValue(KEY_SIMILARITY_THRESHOLD, config.similarityThreshold);
    m_settings->setValue(KEY_FFMPEG_PATH, config.ffmpegPath);
    m_settings->setValue(KEY_HASH_GRID_SIZE, config.hashGridSize);
    m_settings->setValue(KEY_WORKER_COUNT, config.workerCount);
    m_settings->setValue(KEY_LAST_VIDEO_DIR, config.lastVideoDirectory);
    m_settings->setValue(KEY_PDF_MARGIN, config.pdfMargin);

    m_settings->sync();
}

int ConfigManager::effectiveWorkerCount(const AppConfig& config)
{
    if (config.workerCount > 0) {
        return config.workerCount;
    }

    int coreCount = static_cast<int>(std::thread::hardware_concurrency());
    // Leave one core for the UI
    return std::max(1, coreCount - 1);
}
