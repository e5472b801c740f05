#include "slideitemwidget.h"
#include <QMouseEvent>
#include <QFileInfo>
#include <QPainter>
#include <QHBoxLayout>

SlideItemWidget::SlideItemWidget(const QString& imagePath,
                                 int index,
                                 QWidget *parent)
    : QWidget(parent),
      m_imagePath(imagePath),
      m_index(index)
{
    m_thumbnail = makeThumbnail(imagePath);
    m_dimmedThumbnail = makeDimmed(m_thumbnail);

    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(6, 6, 6, 6);
    layout->setSpacing(4);

    m_thumbnailLabel = new QLabel(this);
    m_thumbnailLabel->setFixedSize(THUMB_WIDTH, THUMB_HEIGHT);
    m_thumbnailLabel->setAlignment(Qt::AlignCenter);
    layout->addWidget(m_thumbnailLabel, 0, Qt::AlignCenter);

    QHBoxLayout* footer = new QHBoxLayout();
    m_checkbox = new QCheckBox(this);
    m_checkbox->setChecked(true);
    footer->addWidget(m_checkbox);

    m_numberLabel = new QLabel(QString("#%1").arg(index + 1), this);
    m_numberLabel->setStyleSheet("QLabel { color: #aaaaaa; }");
    footer->addWidget(m_numberLabel);
    footer->addStretch();
    layout->addLayout(footer);

    setToolTip(QFileInfo(imagePath).fileName());
    setAttribute(Qt::WA_StyledBackground, true);
    setFixedSize(THUMB_WIDTH + 16, THUMB_HEIGHT + 44);

    connect(m_checkbox, &QCheckBox::toggled, this, [this](bool checked) {
        refreshStyle();
        emit selectionChanged(checked);
    });

    refreshStyle();
}

bool SlideItemWidget::isChecked() const
{
    return m_checkbox->isChecked();
}

void SlideItemWidget::setChecked(bool checked)
{
    m_checkbox->setChecked(checked);
}

void SlideItemWidget::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        m_checkbox->setChecked(!m_checkbox->isChecked());
    }
    QWidget::mousePressEvent(event);
}

void SlideItemWidget::refreshStyle()
{
    if (isChecked()) {
        setStyleSheet("SlideItemWidget { background-color: #1f538d; border: 2px solid #4a9eff; border-radius: 8px; }");
        m_thumbnailLabel->setPixmap(m_thumbnail);
    } else {
        setStyleSheet("SlideItemWidget { background-color: #3a3a3a; border: 2px solid #555555; border-radius: 8px; }");
        m_thumbnailLabel->setPixmap(m_dimmedThumbnail);
    }
}

QPixmap SlideItemWidget::makeThumbnail(const QString& imagePath)
{
    QPixmap padded(THUMB_WIDTH, THUMB_HEIGHT);
    padded.fill(QColor(30, 30, 30));

    QPixmap pixmap(imagePath);
    QPainter painter(&padded);
    if (!pixmap.isNull()) {
        QPixmap scaled = pixmap.scaled(THUMB_WIDTH, THUMB_HEIGHT, Qt::KeepAspectRatio, Qt::SmoothTransformation);
        painter.drawPixmap((THUMB_WIDTH - scaled.width()) / 2,
                           (THUMB_HEIGHT - scaled.height()) / 2,
                           scaled);
    } else {
        painter.setPen(QColor(170, 170, 170));
        painter.drawText(padded.rect(), Qt::AlignCenter, "No Preview");
    }
    return padded;
}

QPixmap SlideItemWidget::makeDimmed(const QPixmap& thumbnail)
{
    QPixmap dimmed = thumbnail.copy();
    QPainter painter(&dimmed);
    painter.fillRect(dimmed.rect(), QColor(0, 0, 0, 160));
    return dimmed;
}
