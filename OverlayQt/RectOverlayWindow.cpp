#include "RectOverlayWindow.hpp"

#include <QPainter>
#include <QPen>

#include "Config.hpp"

RectOverlayWindow::RectOverlayWindow(const RectStyle& style, QWidget* parent) : OverlayWindowBase(parent)
{
    setRectStyle(style);
}

void RectOverlayWindow::setOverlayGeometry(const OverlayGeometry& geometry)
{
    setGeometry(geometry.pos.x, geometry.pos.y, geometry.size.x, geometry.size.y);
}

OverlayGeometry RectOverlayWindow::overlayGeometry() const
{
    const QRect r = geometry();
    return OverlayGeometry{glm::ivec2(r.x(), r.y()), glm::ivec2(r.width(), r.height())};
}

void RectOverlayWindow::applyStyle(const QVariantMap& style)
{
    setRectStyle(OverlayStyle::resolveRect(style));
}

void RectOverlayWindow::setRectStyle(const RectStyle& style)
{
    m_style = style;
    setWindowOpacity(m_style.alpha);
    setCursor(m_style.draggable ? Qt::SizeAllCursor : Qt::ArrowCursor);
    update();
}

bool RectOverlayWindow::inHandle(const QPoint& local) const
{
    return m_style.resizable &&
           DragController::inResizeHandle(toIVec2(local), glm::ivec2(width(), height()), m_style.resizeHandleSize);
}

void RectOverlayWindow::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);

    painter.fillRect(rect(), m_style.background);

    if (m_style.borderWidth > 0)
    {
        QPen pen(m_style.borderColor);
        pen.setWidth(m_style.borderWidth);
        pen.setJoinStyle(Qt::MiterJoin);
        painter.setPen(pen);
        painter.setBrush(Qt::NoBrush);

        // Keep the whole stroke inside the window.
        const int inset = m_style.borderWidth / 2;
        const int odd   = m_style.borderWidth % 2;
        painter.drawRect(rect().adjusted(inset, inset, -inset - odd, -inset - odd));
    }

    paintLabel(painter, QPoint(0, 0), m_style.labelFont, m_style.labelBackground, m_style.labelForeground);

    if (m_style.resizable)
    {
        const int h = m_style.resizeHandleSize;
        painter.fillRect(QRect(width() - h, height() - h, h, h), m_style.borderColor);
    }
}

bool RectOverlayWindow::startDrag(const QPoint& local, const glm::ivec2& cursor)
{
    if (inHandle(local))
    {
        m_drag.beginResize(cursor, overlayGeometry());
        return true;
    }

    if (!m_style.draggable)
        return false;

    m_drag.beginMove(OverlayKind::Rect, cursor, overlayGeometry());
    return true;
}

DragController::Limits RectOverlayWindow::dragLimits() const
{
    DragController::Limits limits = {};
    limits.screenSize             = screenSize();
    limits.minSize                = glm::ivec2(config::kMinRectSize);
    return limits;
}

void RectOverlayWindow::updateHoverCursor(const QPoint& local)
{
    if (inHandle(local))
        setCursor(Qt::SizeFDiagCursor);
    else
        setCursor(m_style.draggable ? Qt::SizeAllCursor : Qt::ArrowCursor);
}
