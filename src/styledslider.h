#ifndef STYLEDSLIDER_H
#define STYLEDSLIDER_H

#include <QWidget>
#include <functional>

/**
 * Horizontal slider with a title, a formatted value readout and hint texts
 * under both ends of the groove. Values are integers; callers map them to
 * their own scale (the threshold sliders use hundredths).
 */
class StyledSlider : public QWidget
{
    Q_OBJECT
    Q_PROPERTY(int minimum READ minimum WRITE setMinimum)
    Q_PROPERTY(int maximum READ maximum WRITE setMaximum)
    Q_PROPERTY(int value READ value WRITE setValue NOTIFY valueChanged)

public:
    using ValueFormatter = std::function<QString(int)>;

    explicit StyledSlider(QWidget* parent = nullptr);

    // Range
    int minimum() const { return m_minimum; }
    int maximum() const { return m_maximum; }
    void setMinimum(int min);
    void setMaximum(int max);
    void setRange(int min, int max);

    // Value
    int value() const { return m_value; }

    // Title shown above the groove on the left
    void setLabel(const QString& label);

    // Readout shown above the groove on the right
    void setValueFormatter(const ValueFormatter& formatter);
    QString valueText() const;

    // Hints under the low and high ends of the groove
    void setHints(const QString& lowHint, const QString& highHint);

    // Groove colors below and above the handle
    void setZoneColors(const QColor& lowColor, const QColor& highColor);

    QSize minimumSizeHint() const override;
    QSize sizeHint() const override;

public slots:
    void setValue(int value);

signals:
    void valueChanged(int value);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

private:
    int valueFromPosition(int pos) const;
    int positionFromValue(int value) const;
    QRect handleRect() const;
    QRect grooveRect() const;

    int m_minimum;
    int m_maximum;
    int m_value;

    bool m_pressed;
    int m_clickOffset;

    QString m_label;
    QString m_lowHint;
    QString m_highHint;
    ValueFormatter m_formatter;
    QColor m_lowColor;
    QColor m_highColor;

    static const int HANDLE_WIDTH = 8;
    static const int HANDLE_HEIGHT = 18;
    static const int GROOVE_HEIGHT = 4;
    static const int MARGIN = 6;
    static const int LABEL_HEIGHT = 18;
    static const int HINT_HEIGHT = 14;
};

#endif // STYLEDSLIDER_H
