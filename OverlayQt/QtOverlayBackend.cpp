#include "QtOverlayBackend.hpp"

#include <QApplication>
#include <QDebug>

#include "OverlayErrors.hpp"
#include "OverlayStyle.hpp"
#include "PointOverlayWindow.hpp"
#include "QtOverlayWidget.hpp"
#include "RectOverlayWindow.hpp"

namespace
{
    // QApplication keeps references to argc/argv for its whole lifetime.
    int   g_argc      = 1;
    char  g_appName[] = "desktop-overlay-manager";
    char* g_argv[]    = {g_appName, nullptr};
} // namespace

QtOverlayBackend::QtOverlayBackend() = default;

QtOverlayBackend::~QtOverlayBackend()
{
    stopLoop();
}

void QtOverlayBackend::startLoop()
{
    if (m_started)
        return;

    QCoreApplication* existing = QCoreApplication::instance();
    if (existing && !qobject_cast<QApplication*>(existing))
        throw OverlayError("QtOverlayBackend: a non-GUI QCoreApplication is already running");

    if (!existing)
    {
        m_ownedApp = std::make_unique<QApplication>(g_argc, g_argv);
        qInfo() << "[QtOverlayBackend] created QApplication";
    }

    // Overlays are tool windows; hiding all of them must not end the loop.
    QApplication::setQuitOnLastWindowClosed(false);
    m_started = true;
}

void QtOverlayBackend::stopLoop() noexcept
{
    if (!m_started)
        return;

    m_started = false;

    if (m_inExec)
    {
        // exec() releases the owned application after it returns.
        QCoreApplication::quit();
        return;
    }

    releaseApplication();
}

void QtOverlayBackend::releaseApplication() noexcept
{
    if (!m_ownedApp)
        return;

    m_ownedApp.reset();
    qInfo() << "[QtOverlayBackend] released QApplication";
}

void QtOverlayBackend::processEvents()
{
    if (!m_started)
        throw LoopStoppedError("QtOverlayBackend::processEvents(): loop not running");

    QCoreApplication::processEvents();
}

int QtOverlayBackend::exec()
{
    if (!m_started)
        throw LoopStoppedError("QtOverlayBackend::exec(): loop not running");

    m_inExec     = true;
    const int rc = QApplication::exec();
    m_inExec     = false;

    if (!m_started)
        releaseApplication();

    return rc;
}

std::unique_ptr<OverlayWidget> QtOverlayBackend::createWidget(OverlayKind            kind,
                                                              const OverlayGeometry& geometry,
                                                              const std::string&     label,
                                                              const QVariantMap&     style)
{
    if (!m_started)
        throw LoopStoppedError("QtOverlayBackend::createWidget(): loop not running");

    std::unique_ptr<OverlayWindowBase> window;
    switch (kind)
    {
        case OverlayKind::Rect:
            window = std::make_unique<RectOverlayWindow>(OverlayStyle::resolveRect(style));
            break;
        case OverlayKind::Point:
            window = std::make_unique<PointOverlayWindow>(OverlayStyle::resolvePoint(style));
            break;
    }

    if (!window)
        throw OverlayError("QtOverlayBackend: unknown overlay kind");

    window->setLabelText(QString::fromStdString(label));
    window->setOverlayGeometry(geometry);

    return std::make_unique<QtOverlayWidget>(std::move(window));
}
