#include <gtest/gtest.h>
#include "../src/configmanager.h"
#include <QSettings>
#include <QTemporaryDir>

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(temp_dir.isValid());
        ini_path = temp_dir.filePath("slidesift.ini");
    }

    QTemporaryDir temp_dir;
    QString ini_path;
};

TEST_F(ConfigManagerTest, DefaultsWhenNothingStored) {
    ConfigManager manager(ini_path);
    AppConfig config = manager.loadConfig();

    EXPECT_DOUBLE_EQ(config.sceneThreshold, 0.25);
    EXPECT_DOUBLE_EQ(config.similarityThreshold, 0.92);
    EXPECT_TRUE(config.ffmpegPath.isEmpty());
    EXPECT_EQ(config.hashGridSize, 16);
    EXPECT_EQ(config.workerCount, 0);
    EXPECT_DOUBLE_EQ(config.pdfMargin, 20.0);
}

TEST_F(ConfigManagerTest, SavedValuesAreLoadedBack) {
    AppConfig saved;
    saved.sceneThreshold = 0.40;
    saved.similarityThreshold = 0.85;
    saved.ffmpegPath = "/usr/local/bin/ffmpeg";
    saved.hashGridSize = 12;
    saved.workerCount = 3;
    saved.lastVideoDirectory = temp_dir.path();
    saved.pdfMargin = 36.0;

    {
        ConfigManager writer(ini_path);
        writer.saveConfig(saved);
    }

    ConfigManager reader(ini_path);
    AppConfig loaded = reader.loadConfig();

    EXPECT_DOUBLE_EQ(loaded.sceneThreshold, 0.40);
    EXPECT_DOUBLE_EQ(loaded.similarityThreshold, 0.85);
    EXPECT_EQ(loaded.ffmpegPath, "/usr/local/bin/ffmpeg");
    EXPECT_EQ(loaded.hashGridSize, 12);
    EXPECT_EQ(loaded.workerCount, 3);
    EXPECT_EQ(loaded.lastVideoDirectory, temp_dir.path());
    EXPECT_DOUBLE_EQ(loaded.pdfMargin, 36.0);
}

TEST_F(ConfigManagerTest, OutOfRangeValuesAreClamped) {
    {
        QSettings settings(ini_path, QSettings::IniFormat);
        settings.setValue("sceneThreshold", 5.0);
        settings.setValue("similarityThreshold", 0.1);
        settings.setValue("hashGridSize", 500);
        settings.setValue("workerCount", -3);
        settings.setValue("lastVideoDirectory", temp_dir.filePath("gone/away"));
        settings.setValue("pdfMargin", 1000.0);
    }

    ConfigManager manager(ini_path);
    AppConfig config = manager.loadConfig();

    EXPECT_DOUBLE_EQ(config.sceneThreshold, ConfigManager::SCENE_THRESHOLD_MAX);
    EXPECT_DOUBLE_EQ(config.similarityThreshold, ConfigManager::SIMILARITY_THRESHOLD_MIN);
    EXPECT_EQ(config.hashGridSize, 64);
    EXPECT_EQ(config.workerCount, 0);
    EXPECT_EQ(config.lastVideoDirectory, AppConfig().lastVideoDirectory);
    EXPECT_DOUBLE_EQ(config.pdfMargin, 200.0);
}

TEST_F(ConfigManagerTest, WorkerCountZeroMeansAutomatic) {
    AppConfig config;
    config.workerCount = 5;
    EXPECT_EQ(ConfigManager::effectiveWorkerCount(config), 5);

    config.workerCount = 0;
    EXPECT_GE(ConfigManager::effectiveWorkerCount(config), 1);
}
