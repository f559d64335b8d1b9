#include "QtOverlayWidget.hpp"

#include <QDebug>
#include <exception>

#include "OverlayWindowBase.hpp"

QtOverlayWidget::QtOverlayWidget(std::unique_ptr<OverlayWindowBase> window) : m_window(std::move(window))
{
    m_connection = QObject::connect(m_window.get(),
                                    &OverlayWindowBase::overlayGeometryChanged,
                                    m_window.get(),
                                    [this](bool finished) { forward(finished); });
}

QtOverlayWidget::~QtOverlayWidget()
{
    QObject::disconnect(m_connection);
    m_handler = nullptr;

    if (m_window)
        m_window->close();
}

void QtOverlayWidget::forward(bool finished)
{
    if (!m_handler)
        return;

    // Exceptions must not cross the Qt event loop.
    try
    {
        m_handler(m_window->overlayGeometry(), finished);
    }
    catch (const std::exception& e)
    {
        qWarning().noquote() << "[QtOverlayWidget][Warning] geometry handler failed:" << e.what();
    }
}

void QtOverlayWidget::show()
{
    m_window->show();
    m_window->raise();
}

void QtOverlayWidget::hide()
{
    m_window->hide();
}

bool QtOverlayWidget::isVisible() const
{
    return m_window->isVisible();
}

void QtOverlayWidget::setGeometry(const OverlayGeometry& geometry)
{
    m_window->setOverlayGeometry(geometry);
}

OverlayGeometry QtOverlayWidget::geometry() const
{
    return m_window->overlayGeometry();
}

void QtOverlayWidget::setLabel(const std::string& label)
{
    m_window->setLabelText(QString::fromStdString(label));
}

void QtOverlayWidget::setStyle(const QVariantMap& style)
{
    m_window->applyStyle(style);
}

void QtOverlayWidget::setGeometryChangedHandler(GeometryChangedFn fn)
{
    m_handler = std::move(fn);
}
