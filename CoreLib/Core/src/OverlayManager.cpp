#include "OverlayManager.hpp"

#include <QDebug>

#include "GeometryStore.hpp"
#include "OverlayBackend.hpp"
#include "OverlayErrors.hpp"
#include "OverlayRegistry.hpp"
#include "OverlayStyle.hpp"
#include "PathUtilities.hpp"

OverlayManager::OverlayManager(std::unique_ptr<OverlayBackend> backend, config::ManagerOptions options) :
    m_options(std::move(options)),
    m_backend(std::move(backend))
{
    if (!m_backend)
        throw OverlayError("OverlayManager: backend is null");

    m_store = std::make_unique<GeometryStore>(config::resolveConfigDir(m_options), m_options.storeFileName);
    m_store->load();

    m_registry = std::make_unique<OverlayRegistry>(*m_backend, *m_store, m_options.persistPolicy);

    m_backend->startLoop();
    m_running = true;

    qInfo().noquote() << "[OverlayManager] started, store" << PathUtil::toQString(m_store->filePath());
}

OverlayManager::~OverlayManager()
{
    destroy();
}

const std::filesystem::path& OverlayManager::configDir() const noexcept
{
    return m_store->directory();
}

void OverlayManager::requireRunning(const char* operation) const
{
    if (!m_running)
        throw LoopStoppedError(std::string("OverlayManager::") + operation + "(): event loop already stopped");
}

void OverlayManager::registerRect(const std::string& id, const RectOptions& options)
{
    requireRunning("registerRect");

    if (m_options.stylePolicy == StylePolicy::Strict)
        OverlayStyle::validate(OverlayKind::Rect, options.style, StylePolicy::Strict);

    const GeometryRequest request{options.x, options.y, options.width, options.height};
    m_registry->ensure(OverlayKind::Rect, id, options.label, request, options.style);
}

void OverlayManager::registerPosition(const std::string& id, const PointOptions& options)
{
    requireRunning("registerPosition");

    if (m_options.stylePolicy == StylePolicy::Strict)
        OverlayStyle::validate(OverlayKind::Point, options.style, StylePolicy::Strict);

    const GeometryRequest request{options.x, options.y, std::nullopt, std::nullopt};
    m_registry->ensure(OverlayKind::Point, id, options.label, request, options.style);
}

void OverlayManager::regsterPositon(const std::string& id, const PointOptions& options)
{
    registerPosition(id, options);
}

bool OverlayManager::unregisterRect(const std::string& id)
{
    requireRunning("unregisterRect");
    return m_registry->remove(OverlayKind::Rect, id);
}

bool OverlayManager::unregisterPosition(const std::string& id)
{
    requireRunning("unregisterPosition");
    return m_registry->remove(OverlayKind::Point, id);
}

RectGeometry OverlayManager::getRect(const std::string& id) const
{
    return m_registry->get(OverlayKind::Rect, id).toRect();
}

PointGeometry OverlayManager::getPosition(const std::string& id) const
{
    return m_registry->get(OverlayKind::Point, id).toPoint();
}

void OverlayManager::showAll()
{
    requireRunning("showAll");
    m_registry->showAll();
}

void OverlayManager::hideAll()
{
    requireRunning("hideAll");
    m_registry->hideAll();
}

void OverlayManager::processEvents()
{
    requireRunning("processEvents");
    m_backend->processEvents();
}

int OverlayManager::exec()
{
    requireRunning("exec");
    return m_backend->exec();
}

void OverlayManager::destroy() noexcept
{
    if (!m_running)
        return;

    m_registry->destroyAll();
    m_backend->stopLoop();
    m_loopOwnership.release();
    m_running = false;

    qInfo().noquote() << "[OverlayManager] stopped";
}
