#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include <QDir>

struct AppConfig {
    double sceneThreshold;
    double similarityThreshold;
    QString ffmpegPath;          // Empty = look up ffmpeg on PATH
    int hashGridSize;
    int workerCount;             // 0 = CPU cores - 1
    QString lastVideoDirectory;
    double pdfMargin;            // Points

    // Default values
    AppConfig() :
        sceneThreshold(0.25),
        similarityThreshold(0.92),
        hashGridSize(16),
        workerCount(0),
        lastVideoDirectory(QDir::homePath()),
        pdfMargin(20.0)
    {}
};

class ConfigManager : public QObject
{
    Q_OBJECT

public:
    /**
     * Use the platform's native settings store
     */
    explicit ConfigManager(QObject *parent = nullptr);

    /**
     * Use an INI file instead of the native store
     * @param iniPath Path to the settings file
     */
    explicit ConfigManager(const QString& iniPath, QObject *parent = nullptr);

    /**
     * Load configuration from persistent storage
     * @return AppConfig with loaded settings, out-of-range values clamped
     */
    AppConfig loadConfig();

    /**
     * Save configuration to persistent storage
     * @param config Configuration to save
     */
    void saveConfig(const AppConfig& config);

    /**
     * Worker threads to use for fingerprinting
     * @param config Loaded configuration
     * @return config.workerCount, or CPU cores - 1 (at least 1) when it is 0
     */
    static int effectiveWorkerCount(const AppConfig& config);

    // Ranges offered by the sliders
    static constexpr double SCENE_THRESHOLD_MIN = 0.05;
    static constexpr double SCENE_THRESHOLD_MAX = 0.70;
    static constexpr double SIMILARITY_THRESHOLD_MIN = 0.70;
    static constexpr double SIMILARITY_THRESHOLD_MAX = 0.99;

private:
    QSettings* m_settings;

    // Configuration keys
    static const QString KEY_SCENE_THRESHOLD;
    static const QString KEY_SIMILARITY_THRESHOLD;
    static const QString KEY_FFMPEG_PATH;
    static const QString KEY_HASH_GRID_SIZE;
    static const QString KEY_WORKER_COUNT;
    static const QString KEY_LAST_VIDEO_DIR;
    static const QString KEY_PDF_MARGIN;
};

#endif // CONFIGMANAGER_H
