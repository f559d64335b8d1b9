#ifndef OVERLAYWINDOWBASE_HPP
#define OVERLAYWINDOWBASE_HPP

#include <QPoint>
#include <QSize>
#include <QString>
#include <QVariantMap>
#include <QWidget>
#include <glm/glm.hpp>

#include "CoreTypes.hpp"
#include "DragController.hpp"
#include "OverlayStyle.hpp"

class QHideEvent;
class QMouseEvent;
class QPainter;

inline glm::ivec2 toIVec2(const QPoint& p) noexcept
{
    return glm::ivec2(p.x(), p.y());
}

/**
 * @brief Frameless, translucent, always-on-top tool window hosting one overlay.
 *
 * Subclasses paint the overlay and map between the window rectangle and the
 * overlay geometry (a rect is its window, a point is the center of a square
 * window). Mouse handling is shared: press starts a DragController
 * interaction, move applies it, release ends it.
 */
class OverlayWindowBase : public QWidget
{
    Q_OBJECT

public:
    explicit OverlayWindowBase(QWidget* parent = nullptr);
    ~OverlayWindowBase() override = default;

    void setLabelText(const QString& label);

    const QString& labelText() const noexcept
    {
        return m_label;
    }

    virtual void            setOverlayGeometry(const OverlayGeometry& geometry) = 0;
    virtual OverlayGeometry overlayGeometry() const                             = 0;

    /**
     * @brief Resolve and apply a style map.
     * @throws InvalidStyleError, leaving the current style in place.
     */
    virtual void applyStyle(const QVariantMap& style) = 0;

    bool dragging() const noexcept
    {
        return m_drag.active();
    }

    /**
     * @brief Size of the painted label tab (text plus padding); empty without a label.
     */
    QSize labelTabSize(const FontSpec& font) const;

signals:
    /**
     * @brief Emitted while the user drags (finished = false) and once on release (finished = true).
     */
    void overlayGeometryChanged(bool finished);

protected:
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void hideEvent(QHideEvent* event) override;

    /// Called after the label text changed.
    virtual void labelChanged()
    {
    }

    /**
     * @brief Start a drag for a left press at `local` (window coordinates).
     * @return False if the press does not start an interaction.
     */
    virtual bool startDrag(const QPoint& local, const glm::ivec2& cursor) = 0;

    virtual DragController::Limits dragLimits() const = 0;

    virtual void updateHoverCursor(const QPoint& local)
    {
        Q_UNUSED(local);
    }

    glm::ivec2 screenSize() const;

    void paintLabel(QPainter& painter, const QPoint& topLeft, const FontSpec& font, const QColor& background,
                    const QColor& foreground) const;

protected:
    DragController m_drag;

private:
    QString m_label;
};

#endif // OVERLAYWINDOWBASE_HPP
