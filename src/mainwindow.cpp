#include "mainwindow.h"
#include "reviewdialog.h"
#include "slidesifterrors.h"
#include <QCloseEvent>
#include <QDebug>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>
#include <QTime>
#include <cmath>

MainWindow::MainWindow(const AppConfig& config, ConfigManager* configManager, QWidget *parent)
    : QMainWindow(parent),
      m_extractionThread(std::make_unique<ExtractionThread>()),
      m_configManager(configManager),
      m_config(config)
{
    setupUI();
    connectSignals();
    setBusy(false);

    setWindowTitle("SlideSift - Lecture Slide Extractor");
    resize(600, 640);
}

MainWindow::~MainWindow()
{
    if (m_extractionThread && m_extractionThread->isRunning()) {
        m_extractionThread->cancel();
        m_extractionThread->wait(5000);
    }
}

QString MainWindow::formatSceneThreshold(double value)
{
    QString text = QString::number(value, 'f', 2);
    if (value < 0.15) return text + "  (very sensitive)";
    if (value < 0.30) return text + "  (sensitive)";
    if (value < 0.45) return text + "  (balanced)";
    return text + "  (conservative)";
}

QString MainWindow::formatSimilarityThreshold(double value)
{
    QString text = QString::number(value, 'f', 2);
    if (value < 0.80) return text + "  (aggressive)";
    if (value < 0.88) return text + "  (strict)";
    if (value < 0.95) return text + "  (balanced)";
    return text + "  (lenient)";
}

void MainWindow::setupUI()
{
    m_centralWidget = new QWidget(this);
    setCentralWidget(m_centralWidget);

    m_mainLayout = new QVBoxLayout(m_centralWidget);
    m_mainLayout->setSpacing(8);
    m_mainLayout->setContentsMargins(12, 12, 12, 12);

    QLabel* titleLabel = new QLabel("Lecture Slide Extractor", m_centralWidget);
    titleLabel->setStyleSheet("QLabel { font-size: 20px; font-weight: bold; }");
    titleLabel->setAlignment(Qt::AlignCenter);
    m_mainLayout->addWidget(titleLabel);

    QLabel* subtitleLabel = new QLabel("Extract slides from screen-recorded lecture videos", m_centralWidget);
    subtitleLabel->setStyleSheet("QLabel { color: #888888; }");
    subtitleLabel->setAlignment(Qt::AlignCenter);
    m_mainLayout->addWidget(subtitleLabel);

    setupVideoSection();
    setupThresholdSection();
    setupControlSection();
    setupStatusSection();
}

void MainWindow::setupVideoSection()
{
    m_videoGroup = new QGroupBox("Video file", m_centralWidget);
    QHBoxLayout* layout = new QHBoxLayout(m_videoGroup);
    layout->setContentsMargins(8, 6, 8, 6);
    layout->setSpacing(8);

    m_videoPathEdit = new QLineEdit(m_videoGroup);
    m_videoPathEdit->setReadOnly(true);
    m_videoPathEdit->setPlaceholderText("No video selected");
    layout->addWidget(m_videoPathEdit, 1);

    m_browseButton = new QPushButton("Browse", m_videoGroup);
    m_browseButton->setFixedWidth(80);
    layout->addWidget(m_browseButton);

    m_mainLayout->addWidget(m_videoGroup);
}

void MainWindow::setupThresholdSection()
{
    m_thresholdGroup = new QGroupBox("Detection", m_centralWidget);
    QVBoxLayout* layout = new QVBoxLayout(m_thresholdGroup);
    layout->setContentsMargins(8, 6, 8, 6);
    layout->setSpacing(6);

    // Sliders work in hundredths
    m_sceneSlider = new StyledSlider(m_thresholdGroup);
    m_sceneSlider->setLabel("Scene sensitivity");
    m_sceneSlider->setRange(int(std::lround(ConfigManager::SCENE_THRESHOLD_MIN * 100)),
                            int(std::lround(ConfigManager::SCENE_THRESHOLD_MAX * 100)));
    m_sceneSlider->setValue(int(std::lround(m_config.sceneThreshold * 100)));
    m_sceneSlider->setValueFormatter([](int value) {
        return formatSceneThreshold(value / 100.0);
    });
    m_sceneSlider->setHints("<- catches more changes", "only big changes ->");
    layout->addWidget(m_sceneSlider);

    m_similaritySlider = new StyledSlider(m_thresholdGroup);
    m_similaritySlider->setLabel("Duplicate removal strictness");
    m_similaritySlider->setRange(int(std::lround(ConfigManager::SIMILARITY_THRESHOLD_MIN * 100)),
                                 int(std::lround(ConfigManager::SIMILARITY_THRESHOLD_MAX * 100)));
    m_similaritySlider->setValue(int(std::lround(m_config.similarityThreshold * 100)));
    m_similaritySlider->setValueFormatter([](int value) {
        return formatSimilarityThreshold(value / 100.0);
    });
    m_similaritySlider->setHints("<- removes more duplicates", "keeps more frames ->");
    m_similaritySlider->setZoneColors(QColor(244, 67, 54), QColor(76, 175, 80));  // Merge / Keep
    layout->addWidget(m_similaritySlider);

    m_mainLayout->addWidget(m_thresholdGroup);
}

void MainWindow::setupControlSection()
{
    m_statusLabel = new QLabel("", m_centralWidget);
    m_statusLabel->setAlignment(Qt::AlignCenter);
    m_statusLabel->setStyleSheet("QLabel { color: #aaaaaa; }");
    m_mainLayout->addWidget(m_statusLabel);

    m_progressBar = new QProgressBar(m_centralWidget);
    m_progressBar->setRange(0, 100);
    m_progressBar->setMaximumHeight(14);
    m_mainLayout->addWidget(m_progressBar);

    QHBoxLayout* buttonLayout = new QHBoxLayout();
    m_extractButton = new QPushButton("Extract Slides", m_centralWidget);
    m_extractButton->setMinimumHeight(48);
    QFont buttonFont = m_extractButton->font();
    buttonFont.setBold(true);
    m_extractButton->setFont(buttonFont);
    buttonLayout->addWidget(m_extractButton, 1);

    m_cancelButton = new QPushButton("Cancel", m_centralWidget);
    m_cancelButton->setMinimumHeight(48);
    buttonLayout->addWidget(m_cancelButton);

    m_mainLayout->addLayout(buttonLayout);
}

void MainWindow::setupStatusSection()
{
    m_statusGroup = new QGroupBox("Status Log", m_centralWidget);
    QVBoxLayout* layout = new QVBoxLayout(m_statusGroup);
    layout->setContentsMargins(8, 6, 8, 6);

    m_statusText = new QTextEdit(m_statusGroup);
    m_statusText->setReadOnly(true);
    m_statusText->setMinimumHeight(120);
    layout->addWidget(m_statusText);

    m_mainLayout->addWidget(m_statusGroup, 1);
}

void MainWindow::connectSignals()
{
    connect(m_browseButton, &QPushButton::clicked, this, &MainWindow::onBrowseClicked);
    connect(m_extractButton, &QPushButton::clicked, this, &MainWindow::onExtractClicked);
    connect(m_cancelButton, &QPushButton::clicked, this, &MainWindow::onCancelClicked);

    ExtractionThread* thread = m_extractionThread.get();
    connect(thread, &ExtractionThread::statusMessage, this, &MainWindow::onStatusMessage);
    connect(thread, &ExtractionThread::videoInfoLogged, this, &MainWindow::onVideoInfoLogged);
    connect(thread, &ExtractionThread::sceneExtractionProgress, this, &MainWindow::onSceneExtractionProgress);
    connect(thread, &ExtractionThread::deduplicationProgress, this, &MainWindow::onDeduplicationProgress);
    connect(thread, &ExtractionThread::frameSkipped, this, &MainWindow::onFrameSkipped);
    connect(thread, &ExtractionThread::extractionFinished, this, &MainWindow::onExtractionFinished);
    connect(thread, &ExtractionThread::extractionFailed, this, &MainWindow::onExtractionFailed);
    connect(thread, &ExtractionThread::extractionCancelled, this, &MainWindow::onExtractionCancelled);
}

AppConfig MainWindow::currentConfig() const
{
    AppConfig config = m_config;
    config.sceneThreshold = m_sceneSlider->value() / 100.0;
    config.similarityThreshold = m_similaritySlider->value() / 100.0;
    return config;
}

void MainWindow::setBusy(bool busy)
{
    m_extractButton->setEnabled(!busy);
    m_extractButton->setText(busy ? "Processing ..." : "Extract Slides");
    m_cancelButton->setEnabled(busy);
    m_browseButton->setEnabled(!busy);
    m_sceneSlider->setEnabled(!busy);
    m_similaritySlider->setEnabled(!busy);
    m_progressBar->setVisible(busy);
    m_progressBar->setValue(0);
}

void MainWindow::appendLog(const QString& message)
{
    QString timestamp = QTime::currentTime().toString("hh:mm:ss");
    m_statusText->append(QString("[%1] %2").arg(timestamp, message));
}

void MainWindow::onBrowseClicked()
{
    QString path = QFileDialog::getOpenFileName(
        this,
        "Select lecture video",
        m_config.lastVideoDirectory,
        "Video files (*.mp4 *.mkv *.avi *.mov *.webm *.flv *.wmv);;All files (*)"
    );

    if (path.isEmpty()) {
        return;
    }

    m_videoPathEdit->setText(path);
    m_videoPathEdit->setCursorPosition(path.length());
    m_config.lastVideoDirectory = QFileInfo(path).absolutePath();
    m_statusLabel->clear();
    qInfo().noquote() << "Video selected:" << path;
    appendLog("Video selected: " + path);
}

void MainWindow::onExtractClicked()
{
    QString path = m_videoPathEdit->text().trimmed();
    if (path.isEmpty() || !QFileInfo(path).isFile()) {
        QMessageBox::warning(this, "No file", "Please select a valid video file.");
        return;
    }

    // Frames of the previous run are no longer needed
    m_workDir.reset();
    m_workDir = std::make_unique<QTemporaryDir>(QDir::tempPath() + "/slidesift_XXXXXX");
    if (!m_workDir->isValid()) {
        QString error = "Cannot create temporary directory: " + m_workDir->errorString();
        m_workDir.reset();
        QMessageBox::critical(this, "Extraction failed", error);
        return;
    }

    AppConfig runConfig = currentConfig();
    try {
        if (!m_extractionThread->startExtraction(path, m_workDir->path(), runConfig)) {
            appendLog("An extraction is already running");
            return;
        }
    } catch (const InvalidConfiguration& e) {
        QMessageBox::critical(this, "Invalid settings", QString::fromStdString(e.what()));
        return;
    }

    m_config = runConfig;
    m_currentVideoPath = path;
    setBusy(true);
    appendLog(QString("Started: scene=%1, similarity=%2")
                  .arg(runConfig.sceneThreshold, 0, 'f', 2)
                  .arg(runConfig.similarityThreshold, 0, 'f', 2));
}

void MainWindow::onCancelClicked()
{
    if (m_extractionThread->isProcessing()) {
        m_cancelButton->setEnabled(false);
        m_statusLabel->setText("Cancelling ...");
        m_extractionThread->cancel();
    }
}

void MainWindow::onStatusMessage(const QString& message)
{
    m_statusLabel->setText(message);
    appendLog(message);
    m_progressBar->setValue(0);
}

void MainWindow::onVideoInfoLogged(const QString& info)
{
    appendLog(info);
}

void MainWindow::onSceneExtractionProgress(double percentage)
{
    m_progressBar->setValue(int(percentage));
}

void MainWindow::onDeduplicationProgress(int current, int total)
{
    if (total > 0) {
        m_progressBar->setValue(current * 100 / total);
    }
}

void MainWindow::onFrameSkipped(const QString& framePath, const QString& reason)
{
    appendLog(QString("Skipped %1: %2").arg(QFileInfo(framePath).fileName(), reason));
}

void MainWindow::onExtractionFinished(const QStringList& slidePaths, int skippedFrames)
{
    setBusy(false);

    if (skippedFrames > 0) {
        appendLog(QString("%1 frame(s) could not be read and were skipped").arg(skippedFrames));
    }

    if (slidePaths.isEmpty()) {
        m_statusLabel->setText("No slides detected - try lowering the thresholds.");
        return;
    }

    m_statusLabel->setText(QString("%1 unique slide(s) found").arg(slidePaths.size()));

    ReviewDialog dialog(slidePaths, m_currentVideoPath, m_config.pdfMargin, this);
    connect(&dialog, &ReviewDialog::statusMessage, this, [this](const QString& message) {
        m_statusLabel->setText(message);
        appendLog(message);
    });
    dialog.exec();
}

void MainWindow::onExtractionFailed(const QString& error)
{
    setBusy(false);
    m_statusLabel->setText("Error - see the status log for details");
    appendLog("Error: " + error);
    QMessageBox::critical(this, "Extraction failed", error);
}

void MainWindow::onExtractionCancelled()
{
    setBusy(false);
    m_statusLabel->setText("Extraction cancelled");
    appendLog("Extraction cancelled");
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (m_extractionThread->isRunning()) {
        m_extractionThread->cancel();
        m_extractionThread->wait();
    }

    if (m_configManager) {
        m_configManager->saveConfig(currentConfig());
    }

    m_workDir.reset();
    event->accept();
}
