#ifndef QTOVERLAYWIDGET_HPP
#define QTOVERLAYWIDGET_HPP

#include <QMetaObject>
#include <memory>

#include "OverlayWidget.hpp"

class OverlayWindowBase;

/**
 * @brief OverlayWidget implemented by an OverlayWindowBase top-level window.
 *
 * Owns the window; releasing this object closes and deletes it. The window's
 * overlayGeometryChanged signal is forwarded to the installed handler.
 */
class QtOverlayWidget : public OverlayWidget
{
public:
    explicit QtOverlayWidget(std::unique_ptr<OverlayWindowBase> window);
    ~QtOverlayWidget() override;

    QtOverlayWidget(const QtOverlayWidget&)            = delete;
    QtOverlayWidget& operator=(const QtOverlayWidget&) = delete;

    void show() override;
    void hide() override;
    bool isVisible() const override;

    void            setGeometry(const OverlayGeometry& geometry) override;
    OverlayGeometry geometry() const override;

    void setLabel(const std::string& label) override;
    void setStyle(const QVariantMap& style) override;
    void setGeometryChangedHandler(GeometryChangedFn fn) override;

    OverlayWindowBase* window() const noexcept
    {
        return m_window.get();
    }

private:
    void forward(bool finished);

private:
    std::unique_ptr<OverlayWindowBase> m_window;
    GeometryChangedFn                  m_handler;
    QMetaObject::Connection            m_connection;
};

#endif // QTOVERLAYWIDGET_HPP
