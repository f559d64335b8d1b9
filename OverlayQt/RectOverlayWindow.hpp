#ifndef RECTOVERLAYWINDOW_HPP
#define RECTOVERLAYWINDOW_HPP

#include "OverlayWindowBase.hpp"

/**
 * @brief Rectangle overlay: translucent fill, border, label tab at the
 * top-left and a resize handle in the bottom-right corner.
 *
 * The window rectangle is the overlay geometry.
 */
class RectOverlayWindow : public OverlayWindowBase
{
    Q_OBJECT

public:
    explicit RectOverlayWindow(const RectStyle& style = {}, QWidget* parent = nullptr);

    void            setOverlayGeometry(const OverlayGeometry& geometry) override;
    OverlayGeometry overlayGeometry() const override;
    void            applyStyle(const QVariantMap& style) override;

    void setRectStyle(const RectStyle& style);

    const RectStyle& rectStyle() const noexcept
    {
        return m_style;
    }

protected:
    void paintEvent(QPaintEvent* event) override;

    bool                   startDrag(const QPoint& local, const glm::ivec2& cursor) override;
    DragController::Limits dragLimits() const override;
    void                   updateHoverCursor(const QPoint& local) override;

private:
    bool inHandle(const QPoint& local) const;

private:
    RectStyle m_style;
};

#endif // RECTOVERLAYWINDOW_HPP
