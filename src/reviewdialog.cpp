#include "reviewdialog.h"
#include "slideexporter.h"
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QFileDialog>
#include <QMessageBox>
#include <QApplication>
#include <QGuiApplication>
#include <QScreen>
#include <QDebug>

ReviewDialog::ReviewDialog(const QStringList& imagePaths,
                           const QString& videoPath,
                           double pdfMargin,
                           QWidget *parent)
    : QDialog(parent),
      m_imagePaths(imagePaths),
      m_videoPath(videoPath),
      m_pdfMargin(pdfMargin)
{
    setupUI();
    populateGrid();
    updateCountLabel();
}

void ReviewDialog::setupUI()
{
    setWindowTitle("Review Detected Slides");
    setModal(true);

    QSize available = QGuiApplication::primaryScreen()
        ? QGuiApplication::primaryScreen()->availableSize() : QSize(1400, 1000);
    resize(qMin(1200, int(available.width() * 0.85)), qMin(820, int(available.height() * 0.85)));
    setMinimumSize(700, 500);

    QVBoxLayout* mainLayout = new QVBoxLayout(this);

    // Header row: [Title] [count] --- [Select All] [Deselect All]
    QHBoxLayout* headerLayout = new QHBoxLayout();

    QLabel* titleLabel = new QLabel("Review Extracted Slides", this);
    titleLabel->setStyleSheet("QLabel { font-size: 16px; font-weight: bold; }");
    headerLayout->addWidget(titleLabel);

    m_countLabel = new QLabel(this);
    headerLayout->addWidget(m_countLabel);
    headerLayout->addStretch();

    m_selectAllButton = new QPushButton("Select All", this);
    headerLayout->addWidget(m_selectAllButton);

    m_deselectAllButton = new QPushButton("Deselect All", this);
    headerLayout->addWidget(m_deselectAllButton);

    mainLayout->addLayout(headerLayout);

    QLabel* hintLabel = new QLabel("Click a slide to toggle  •  Dimmed = excluded  "
                                   "•  Slides are in playback order", this);
    hintLabel->setStyleSheet("QLabel { color: #888888; font-size: 11px; }");
    mainLayout->addWidget(hintLabel);

    // Scroll area with grid layout for thumbnails
    m_scrollArea = new QScrollArea(this);
    m_scrollArea->setWidgetResizable(true);

    m_gridContainer = new QWidget(m_scrollArea);
    m_gridLayout = new QGridLayout(m_gridContainer);
    m_gridLayout->setSpacing(12);
    m_gridLayout->setAlignment(Qt::AlignTop | Qt::AlignLeft);
    m_scrollArea->setWidget(m_gridContainer);

    mainLayout->addWidget(m_scrollArea);

    // Bottom row: [Cancel] --- [Save Images] [Generate PDF]
    QHBoxLayout* buttonLayout = new QHBoxLayout();

    m_cancelButton = new QPushButton("Cancel", this);
    buttonLayout->addWidget(m_cancelButton);
    buttonLayout->addStretch();

    m_saveImagesButton = new QPushButton("Save Images", this);
    m_saveImagesButton->setMinimumHeight(40);
    buttonLayout->addWidget(m_saveImagesButton);

    m_generatePdfButton = new QPushButton("Generate PDF", this);
    m_generatePdfButton->setMinimumHeight(40);
    m_generatePdfButton->setDefault(true);
    buttonLayout->addWidget(m_generatePdfButton);

    mainLayout->addLayout(buttonLayout);

    connect(m_selectAllButton, &QPushButton::clicked, this, &ReviewDialog::onSelectAll);
    connect(m_deselectAllButton, &QPushButton::clicked, this, &ReviewDialog::onDeselectAll);
    connect(m_cancelButton, &QPushButton::clicked, this, &QDialog::reject);
    connect(m_generatePdfButton, &QPushButton::clicked, this, &ReviewDialog::onGeneratePdf);
    connect(m_saveImagesButton, &QPushButton::clicked, this, &ReviewDialog::onSaveImages);
}

void ReviewDialog::populateGrid()
{
    for (int i = 0; i < m_imagePaths.size(); i++) {
        SlideItemWidget* itemWidget = new SlideItemWidget(m_imagePaths[i], i, m_gridContainer);

        connect(itemWidget, &SlideItemWidget::selectionChanged,
                this, &ReviewDialog::onSelectionChanged);

        m_gridLayout->addWidget(itemWidget, i / GRID_COLUMNS, i % GRID_COLUMNS);
        m_slideWidgets.append(itemWidget);
    }
}

QStringList ReviewDialog::selectedImagePaths() const
{
    QStringList selected;
    for (SlideItemWidget* widget : m_slideWidgets) {
        if (widget->isChecked()) {
            selected.append(widget->getImagePath());
        }
    }
    return selected;
}

void ReviewDialog::updateCountLabel()
{
    m_countLabel->setText(QString("%1 / %2 slides selected")
                              .arg(selectedImagePaths().size())
                              .arg(m_slideWidgets.size()));
}

void ReviewDialog::onSelectionChanged()
{
    updateCountLabel();
}

void ReviewDialog::onSelectAll()
{
    for (SlideItemWidget* widget : m_slideWidgets) {
        widget->blockSignals(true);
        widget->setChecked(true);
        widget->blockSignals(false);
    }
    updateCountLabel();
}

void ReviewDialog::onDeselectAll()
{
    for (SlideItemWidget* widget : m_slideWidgets) {
        widget->blockSignals(true);
        widget->setChecked(false);
        widget->blockSignals(false);
    }
    updateCountLabel();
}

bool ReviewDialog::ensureSelection()
{
    if (selectedImagePaths().isEmpty()) {
        QMessageBox::warning(this, "Nothing selected", "Select at least one slide.");
        return false;
    }
    return true;
}

void ReviewDialog::onGeneratePdf()
{
    if (!ensureSelection()) {
        return;
    }

    QString savePath = QFileDialog::getSaveFileName(
        this,
        "Save PDF as ...",
        SlideExporter::defaultPdfPath(m_videoPath),
        "PDF Files (*.pdf)"
    );

    if (savePath.isEmpty()) {
        return;  // User cancelled
    }

    if (!savePath.endsWith(".pdf", Qt::CaseInsensitive)) {
        savePath += ".pdf";
    }

    QApplication::setOverrideCursor(Qt::WaitCursor);
    QString error;
    QStringList selected = selectedImagePaths();
    bool ok = SlideExporter::buildPdf(selected, savePath, m_pdfMargin, &error);
    QApplication::restoreOverrideCursor();

    if (!ok) {
        qWarning().noquote() << "PDF error:" << error;
        QMessageBox::critical(this, "Error", error);
        return;
    }

    emit statusMessage(QString("PDF saved: %1 (%2 pages)").arg(savePath).arg(selected.size()));
    QMessageBox::information(this, "Done!", QString("PDF saved:\n%1").arg(savePath));
    accept();
}

void ReviewDialog::onSaveImages()
{
    if (!ensureSelection()) {
        return;
    }

    QString destFolder = QFileDialog::getExistingDirectory(
        this,
        "Choose (or create) a folder to save images into",
        SlideExporter::defaultExportFolder(m_videoPath)
    );

    if (destFolder.isEmpty()) {
        return;  // User cancelled
    }

    QApplication::setOverrideCursor(Qt::WaitCursor);
    QString error;
    int saved = SlideExporter::exportImages(selectedImagePaths(), destFolder, &error);
    QApplication::restoreOverrideCursor();

    if (saved < 0) {
        qWarning().noquote() << "Image export error:" << error;
        QMessageBox::critical(this, "Error", error);
        return;
    }

    emit statusMessage(QString("%1 image(s) saved to %2").arg(saved).arg(destFolder));
    QMessageBox::information(this, "Done!",
                             QString("%1 image(s) saved to:\n%2").arg(saved).arg(destFolder));
    accept();
}
