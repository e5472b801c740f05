#ifndef SLIDEITEMWIDGET_H
#define SLIDEITEMWIDGET_H

#include <QWidget>
#include <QCheckBox>
#include <QLabel>
#include <QPixmap>
#include <QVBoxLayout>

/**
 * @brief Thumbnail tile for one detected slide in the review grid
 *
 * Starts selected. Clicking anywhere on the tile toggles it; deselected
 * tiles are drawn dimmed.
 */
class SlideItemWidget : public QWidget
{
    Q_OBJECT

public:
    /**
     * @param imagePath Slide image
     * @param index Zero-based position in playback order (shown as #index+1)
     */
    explicit SlideItemWidget(const QString& imagePath,
                             int index,
                             QWidget *parent = nullptr);

    bool isChecked() const;
    void setChecked(bool checked);

    QString getImagePath() const { return m_imagePath; }
    int getIndex() const { return m_index; }

signals:
    void selectionChanged(bool checked);

protected:
    void mousePressEvent(QMouseEvent* event) override;

private:
    void refreshStyle();

    static QPixmap makeThumbnail(const QString& imagePath);
    static QPixmap makeDimmed(const QPixmap& thumbnail);

    QString m_imagePath;
    int m_index;

    QPixmap m_thumbnail;
    QPixmap m_dimmedThumbnail;

    QCheckBox* m_checkbox;
    QLabel* m_thumbnailLabel;
    QLabel* m_numberLabel;

    static const int THUMB_WIDTH = 220;
    static const int THUMB_HEIGHT = 140;
};

#endif // SLIDEITEMWIDGET_H
