#include "OverlayWindowBase.hpp"

#include <QFont>
#include <QFontMetrics>
#include <QHideEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QScreen>

OverlayWindowBase::OverlayWindowBase(QWidget* parent) : QWidget(parent)
{
    setWindowFlags(Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint | Qt::Tool);
    setAttribute(Qt::WA_TranslucentBackground);
    setAttribute(Qt::WA_ShowWithoutActivating);
    setMouseTracking(true);
}

void OverlayWindowBase::setLabelText(const QString& label)
{
    if (m_label == label)
        return;

    m_label = label;
    labelChanged();
    update();
}

glm::ivec2 OverlayWindowBase::screenSize() const
{
    const QScreen* s = screen();
    if (!s)
        return glm::ivec2(0);

    const QSize size = s->geometry().size();
    return glm::ivec2(size.width(), size.height());
}

namespace
{
    constexpr int kLabelPadX = 4;
    constexpr int kLabelPadY = 2;

    QFont toQFont(const FontSpec& font)
    {
        QFont qfont(font.family, font.pointSize);
        qfont.setBold(font.bold);
        return qfont;
    }
} // namespace

QSize OverlayWindowBase::labelTabSize(const FontSpec& font) const
{
    if (m_label.isEmpty())
        return QSize();

    const QFontMetrics fm(toQFont(font));
    return QSize(fm.horizontalAdvance(m_label) + 2 * kLabelPadX, fm.height() + 2 * kLabelPadY);
}

void OverlayWindowBase::paintLabel(QPainter&       painter,
                                   const QPoint&   topLeft,
                                   const FontSpec& font,
                                   const QColor&   background,
                                   const QColor&   foreground) const
{
    if (m_label.isEmpty())
        return;

    const QRect tab(topLeft, labelTabSize(font));

    painter.fillRect(tab, background);
    painter.setFont(toQFont(font));
    painter.setPen(foreground);
    painter.drawText(tab, Qt::AlignCenter, m_label);
}

// ------------------------------------------------------------
// Mouse
// ------------------------------------------------------------

void OverlayWindowBase::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton)
    {
        QWidget::mousePressEvent(event);
        return;
    }

    const glm::ivec2 cursor = toIVec2(event->globalPosition().toPoint());
    if (startDrag(event->position().toPoint(), cursor))
        event->accept();
    else
        QWidget::mousePressEvent(event);
}

void OverlayWindowBase::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_drag.active())
    {
        updateHoverCursor(event->position().toPoint());
        QWidget::mouseMoveEvent(event);
        return;
    }

    const OverlayGeometry next = m_drag.update(toIVec2(event->globalPosition().toPoint()), dragLimits());
    if (next != overlayGeometry())
    {
        setOverlayGeometry(next);
        emit overlayGeometryChanged(false);
    }
    event->accept();
}

void OverlayWindowBase::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && m_drag.end())
    {
        event->accept();
        emit overlayGeometryChanged(true);
        return;
    }

    QWidget::mouseReleaseEvent(event);
}

void OverlayWindowBase::hideEvent(QHideEvent* event)
{
    // The release never arrives once hidden; finish the drag here.
    if (m_drag.end())
        emit overlayGeometryChanged(true);

    QWidget::hideEvent(event);
}
