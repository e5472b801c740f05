#ifndef REVIEWDIALOG_H
#define REVIEWDIALOG_H

#include <QDialog>
#include <QScrollArea>
#include <QGridLayout>
#include <QPushButton>
#include <QLabel>
#include <QList>
#include <QString>
#include <QStringList>
#include "slideitemwidget.h"

/**
 * @brief Lets the user curate detected slides before export
 *
 * Shows every retained slide in playback order, all selected. The selected
 * subset can be written to a PDF or copied to a folder.
 */
class ReviewDialog : public QDialog
{
    Q_OBJECT

public:
    /**
     * @param imagePaths Retained slides in playback order
     * @param videoPath Source video, used for default export names
     * @param pdfMargin Page margin for PDF export (points)
     */
    ReviewDialog(const QStringList& imagePaths,
                 const QString& videoPath,
                 double pdfMargin,
                 QWidget *parent = nullptr);

    /**
     * @brief Selected slide paths in playback order
     */
    QStringList selectedImagePaths() const;

signals:
    void statusMessage(const QString& message);

private slots:
    void onSelectionChanged();
    void onSelectAll();
    void onDeselectAll();
    void onGeneratePdf();
    void onSaveImages();

private:
    void setupUI();
    void populateGrid();
    void updateCountLabel();
    bool ensureSelection();

    QStringList m_imagePaths;
    QString m_videoPath;
    double m_pdfMargin;

    QLabel* m_countLabel;
    QScrollArea* m_scrollArea;
    QWidget* m_gridContainer;
    QGridLayout* m_gridLayout;
    QList<SlideItemWidget*> m_slideWidgets;

    QPushButton* m_selectAllButton;
    QPushButton* m_deselectAllButton;
    QPushButton* m_cancelButton;
    QPushButton* m_generatePdfButton;
    QPushButton* m_saveImagesButton;

    static const int GRID_COLUMNS = 4;
};

#endif // REVIEWDIALOG_H
