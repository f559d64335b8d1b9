#include "PointOverlayWindow.hpp"

#include <QPainter>
#include <algorithm>
#include <cstdlib>

PointOverlayWindow::PointOverlayWindow(const PointStyle& style, QWidget* parent) : OverlayWindowBase(parent)
{
    setPointStyle(style);
}

int PointOverlayWindow::windowEdge(const PointStyle& style, const QSize& label) noexcept
{
    const int labelReach = std::max(std::abs(style.labelOffsetX), std::abs(style.labelOffsetY));
    const int edge       = std::max({100, style.pointSize * 4, (labelReach + 50) * 2});

    if (label.isEmpty())
        return edge;

    const int reachX = std::max(std::abs(style.labelOffsetX), std::abs(style.labelOffsetX + label.width()));
    const int reachY = std::max(std::abs(style.labelOffsetY), std::abs(style.labelOffsetY + label.height()));
    return std::max(edge, (std::max(reachX, reachY) + 10) * 2);
}

void PointOverlayWindow::updateEdge()
{
    m_edge = windowEdge(m_style, labelTabSize(m_style.labelFont));
    placeWindow();
}

void PointOverlayWindow::labelChanged()
{
    updateEdge();
}

void PointOverlayWindow::placeWindow()
{
    const int half = m_edge / 2;
    setGeometry(m_point.x - half, m_point.y - half, m_edge, m_edge);
}

void PointOverlayWindow::setOverlayGeometry(const OverlayGeometry& geometry)
{
    m_point = geometry.pos;
    placeWindow();
}

OverlayGeometry PointOverlayWindow::overlayGeometry() const
{
    return OverlayGeometry{m_point, glm::ivec2(0)};
}

void PointOverlayWindow::applyStyle(const QVariantMap& style)
{
    setPointStyle(OverlayStyle::resolvePoint(style));
}

void PointOverlayWindow::setPointStyle(const PointStyle& style)
{
    m_style = style;

    setWindowOpacity(m_style.alpha);
    setCursor(m_style.draggable ? Qt::SizeAllCursor : Qt::ArrowCursor);
    updateEdge();
    update();
}

void PointOverlayWindow::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);

    const QPoint center(m_edge / 2, m_edge / 2);
    const int    r = m_style.pointSize;

    painter.setPen(Qt::NoPen);
    painter.setBrush(m_style.pointColor);
    painter.drawEllipse(center, r, r);

    const QPoint labelPos = center + QPoint(m_style.labelOffsetX, m_style.labelOffsetY);
    paintLabel(painter, labelPos, m_style.labelFont, m_style.labelBackground, m_style.labelForeground);
}

bool PointOverlayWindow::startDrag(const QPoint& local, const glm::ivec2& cursor)
{
    Q_UNUSED(local);

    if (!m_style.draggable)
        return false;

    m_drag.beginMove(OverlayKind::Point, cursor, overlayGeometry());
    return true;
}

DragController::Limits PointOverlayWindow::dragLimits() const
{
    DragController::Limits limits = {};
    limits.screenSize             = screenSize();
    limits.windowSize             = m_edge;
    limits.pointRadius            = m_style.pointSize;
    return limits;
}
