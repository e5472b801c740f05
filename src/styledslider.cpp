#include "styledslider.h"
#include <QPainter>
#include <QMouseEvent>
#include <QKeyEvent>

StyledSlider::StyledSlider(QWidget* parent)
    : QWidget(parent)
    , m_minimum(0)
    , m_maximum(100)
    , m_value(50)
    , m_pressed(false)
    , m_clickOffset(0)
    , m_lowColor(QColor(100, 149, 237))   // Cornflower blue
    , m_highColor(QColor(90, 90, 90))
{
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
}

void StyledSlider::setMinimum(int min)
{
    if (min < m_maximum) {
        m_minimum = min;
        if (m_value < m_minimum) setValue(m_minimum);
        update();
    }
}

void StyledSlider::setMaximum(int max)
{
    if (max > m_minimum) {
        m_maximum = max;
        if (m_value > m_maximum) setValue(m_maximum);
        update();
    }
}

void StyledSlider::setRange(int min, int max)
{
    if (min < max) {
        m_minimum = min;
        m_maximum = max;
        if (m_value < m_minimum) m_value = m_minimum;
        if (m_value > m_maximum) m_value = m_maximum;
        update();
    }
}

void StyledSlider::setValue(int value)
{
    value = qBound(m_minimum, value, m_maximum);
    if (value != m_value) {
        m_value = value;
        emit valueChanged(m_value);
        update();
    }
}

void StyledSlider::setLabel(const QString& label)
{
    m_label = label;
    update();
}

void StyledSlider::setValueFormatter(const ValueFormatter& formatter)
{
    m_formatter = formatter;
    update();
}

QString StyledSlider::valueText() const
{
    if (m_formatter) {
        return m_formatter(m_value);
    }
    return QString::number(m_value);
}

void StyledSlider::setHints(const QString& lowHint, const QString& highHint)
{
    m_lowHint = lowHint;
    m_highHint = highHint;
    update();
}

void StyledSlider::setZoneColors(const QColor& lowColor, const QColor& highColor)
{
    m_lowColor = lowColor;
    m_highColor = highColor;
    update();
}

QSize StyledSlider::minimumSizeHint() const
{
    return QSize(160, LABEL_HEIGHT + HANDLE_HEIGHT + HINT_HEIGHT + MARGIN * 2);
}

QSize StyledSlider::sizeHint() const
{
    return QSize(360, LABEL_HEIGHT + HANDLE_HEIGHT + HINT_HEIGHT + MARGIN * 2);
}

QRect StyledSlider::grooveRect() const
{
    int y = MARGIN + LABEL_HEIGHT + (HANDLE_HEIGHT - GROOVE_HEIGHT) / 2;
    return QRect(MARGIN + HANDLE_WIDTH / 2, y, width() - MARGIN * 2 - HANDLE_WIDTH, GROOVE_HEIGHT);
}

int StyledSlider::positionFromValue(int value) const
{
    QRect groove = grooveRect();
    double ratio = double(value - m_minimum) / double(m_maximum - m_minimum);
    return groove.left() + int(ratio * groove.width());
}

int StyledSlider::valueFromPosition(int pos) const
{
    QRect groove = grooveRect();
    double ratio = double(pos - groove.left()) / double(groove.width());
    ratio = qBound(0.0, ratio, 1.0);
    return m_minimum + qRound(ratio * (m_maximum - m_minimum));
}

QRect StyledSlider::handleRect() const
{
    int pos = positionFromValue(m_value);
    return QRect(pos - HANDLE_WIDTH / 2, MARGIN + LABEL_HEIGHT, HANDLE_WIDTH, HANDLE_HEIGHT);
}

void StyledSlider::paintEvent(QPaintEvent* /*event*/)
{
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    QRect groove = grooveRect();
    int valuePos = positionFromValue(m_value);

    // Title on the left, formatted value on the right
    QRect headerRect(MARGIN, MARGIN, width() - MARGIN * 2, LABEL_HEIGHT);
    QFont font = painter.font();
    font.setBold(true);
    painter.setFont(font);
    painter.setPen(palette().color(QPalette::Text));
    painter.drawText(headerRect, Qt::AlignLeft | Qt::AlignVCenter, m_label);

    font.setBold(false);
    painter.setFont(font);
    painter.setPen(QColor(74, 158, 255));
    painter.drawText(headerRect, Qt::AlignRight | Qt::AlignVCenter, valueText());

    // Two-zone groove split at the handle
    painter.setPen(Qt::NoPen);

    QRect lowZoneRect(groove.left(), groove.top(), valuePos - groove.left(), groove.height());
    painter.setBrush(m_lowColor);
    painter.drawRoundedRect(lowZoneRect, 2, 2);

    QRect highZoneRect(valuePos, groove.top(), groove.right() - valuePos, groove.height());
    painter.setBrush(m_highColor);
    painter.drawRoundedRect(highZoneRect, 2, 2);

    // Draw handle
    QRect rect = handleRect();

    // Handle shadow
    painter.setPen(Qt::NoPen);
    painter.setBrush(QColor(0, 0, 0, 30));
    painter.drawRoundedRect(rect.adjusted(1, 1, 1, 1), 3, 3);

    // Handle body
    QLinearGradient gradient(rect.topLeft(), rect.bottomLeft());
    if (m_pressed) {
        gradient.setColorAt(0, QColor(200, 200, 200));
        gradient.setColorAt(1, QColor(160, 160, 160));
    } else {
        gradient.setColorAt(0, QColor(250, 250, 250));
        gradient.setColorAt(1, QColor(220, 220, 220));
    }
    painter.setBrush(gradient);
    painter.setPen(QPen(hasFocus() ? QColor(74, 158, 255) : QColor(180, 180, 180), 1));
    painter.drawRoundedRect(rect, 3, 3);

    // Handle grip lines
    painter.setPen(QPen(QColor(160, 160, 160), 1));
    int cx = rect.center().x();
    int cy = rect.center().y();
    painter.drawLine(cx - 1, cy - 3, cx - 1, cy + 3);
    painter.drawLine(cx + 1, cy - 3, cx + 1, cy + 3);

    // Hints under both ends
    font.setPointSize(9);
    painter.setFont(font);
    painter.setPen(palette().color(QPalette::PlaceholderText));
    QRect hintRect(MARGIN, rect.bottom() + 2, width() - MARGIN * 2, HINT_HEIGHT);
    painter.drawText(hintRect, Qt::AlignLeft | Qt::AlignVCenter, m_lowHint);
    painter.drawText(hintRect, Qt::AlignRight | Qt::AlignVCenter, m_highHint);
}

void StyledSlider::mousePressEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton) {
        QRect hRect = handleRect();

        if (hRect.contains(event->pos())) {
            m_pressed = true;
            m_clickOffset = event->pos().x() - positionFromValue(m_value);
        } else {
            // Click on track - move handle there
            setValue(valueFromPosition(event->pos().x()));
            m_pressed = true;
            m_clickOffset = 0;
        }
        update();
    }
}

void StyledSlider::mouseMoveEvent(QMouseEvent* event)
{
    if (m_pressed) {
        int value = valueFromPosition(event->pos().x() - m_clickOffset);
        setValue(value);
    } else {
        // Update cursor when hovering over handle
        QRect hRect = handleRect();
        if (hRect.contains(event->pos())) {
            setCursor(Qt::SizeHorCursor);
        } else {
            setCursor(Qt::ArrowCursor);
        }
    }
}

void StyledSlider::mouseReleaseEvent(QMouseEvent* /*event*/)
{
    m_pressed = false;
    update();
}

void StyledSlider::keyPressEvent(QKeyEvent* event)
{
    switch (event->key()) {
        case Qt::Key_Left:
        case Qt::Key_Down:
            setValue(m_value - 1);
            break;
        case Qt::Key_Right:
        case Qt::Key_Up:
            setValue(m_value + 1);
            break;
        case Qt::Key_Home:
            setValue(m_minimum);
            break;
        case Qt::Key_End:
            setValue(m_maximum);
            break;
        default:
            QWidget::keyPressEvent(event);
    }
}
