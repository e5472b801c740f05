#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QGroupBox>
#include <QPushButton>
#include <QLabel>
#include <QLineEdit>
#include <QProgressBar>
#include <QTextEdit>
#include <QTemporaryDir>
#include <memory>

#include "configmanager.h"
#include "extractionthread.h"
#include "styledslider.h"

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    /**
     * @param config Settings loaded at startup
     * @param configManager Store the settings are written back to on close
     */
    MainWindow(const AppConfig& config, ConfigManager* configManager, QWidget *parent = nullptr);
    ~MainWindow();

    /**
     * Slider readouts, e.g. "0.25  (sensitive)"
     */
    static QString formatSceneThreshold(double value);
    static QString formatSimilarityThreshold(double value);

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onBrowseClicked();
    void onExtractClicked();
    void onCancelClicked();

    // Extraction thread slots
    void onStatusMessage(const QString& message);
    void onVideoInfoLogged(const QString& info);
    void onSceneExtractionProgress(double percentage);
    void onDeduplicationProgress(int current, int total);
    void onFrameSkipped(const QString& framePath, const QString& reason);
    void onExtractionFinished(const QStringList& slidePaths, int skippedFrames);
    void onExtractionFailed(const QString& error);
    void onExtractionCancelled();

private:
    void setupUI();
    void setupVideoSection();
    void setupThresholdSection();
    void setupControlSection();
    void setupStatusSection();
    void connectSignals();

    void setBusy(bool busy);
    void appendLog(const QString& message);
    AppConfig currentConfig() const;

    // UI Components
    QWidget* m_centralWidget;
    QVBoxLayout* m_mainLayout;

    // Video Section
    QGroupBox* m_videoGroup;
    QLineEdit* m_videoPathEdit;
    QPushButton* m_browseButton;

    // Threshold Section
    QGroupBox* m_thresholdGroup;
    StyledSlider* m_sceneSlider;
    StyledSlider* m_similaritySlider;

    // Control Section
    QLabel* m_statusLabel;
    QProgressBar* m_progressBar;
    QPushButton* m_extractButton;
    QPushButton* m_cancelButton;

    // Status Section
    QGroupBox* m_statusGroup;
    QTextEdit* m_statusText;

    // Backend components
    std::unique_ptr<ExtractionThread> m_extractionThread;
    std::unique_ptr<QTemporaryDir> m_workDir;
    ConfigManager* m_configManager;
    AppConfig m_config;
    QString m_currentVideoPath;
};

#endif // MAINWINDOW_H
