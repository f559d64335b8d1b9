#ifndef POINTOVERLAYWINDOW_HPP
#define POINTOVERLAYWINDOW_HPP

#include "OverlayWindowBase.hpp"

/**
 * @brief Point marker: filled circle centered in a square window, with the
 * label drawn at (label_offset_x, label_offset_y) from the point.
 *
 * The overlay geometry is the point position (screen coordinates); the
 * window is sized so the circle and the label always fit.
 */
class PointOverlayWindow : public OverlayWindowBase
{
    Q_OBJECT

public:
    explicit PointOverlayWindow(const PointStyle& style = {}, QWidget* parent = nullptr);

    void            setOverlayGeometry(const OverlayGeometry& geometry) override;
    OverlayGeometry overlayGeometry() const override;
    void            applyStyle(const QVariantMap& style) override;

    void setPointStyle(const PointStyle& style);

    const PointStyle& pointStyle() const noexcept
    {
        return m_style;
    }

    /**
     * @brief Edge of the square host window for a style.
     *
     * A non-empty `label` (tab size) grows the window until the tab, placed at
     * the label offset from the center, fits with a 10 px margin.
     */
    static int windowEdge(const PointStyle& style, const QSize& label = QSize()) noexcept;

protected:
    void paintEvent(QPaintEvent* event) override;
    void labelChanged() override;

    bool                   startDrag(const QPoint& local, const glm::ivec2& cursor) override;
    DragController::Limits dragLimits() const override;

private:
    void placeWindow();
    void updateEdge();

private:
    PointStyle m_style;
    glm::ivec2 m_point = glm::ivec2(0);
    int        m_edge  = 100;
};

#endif // POINTOVERLAYWINDOW_HPP
