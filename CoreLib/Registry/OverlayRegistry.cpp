#include "OverlayRegistry.hpp"

#include <QDebug>
#include <optional>

#include "GeometryStore.hpp"
#include "OverlayBackend.hpp"
#include "OverlayErrors.hpp"

namespace
{
    static QString describe(OverlayKind kind, const std::string& id)
    {
        return QString::fromLatin1(kindName(kind).data()) + QStringLiteral(" \"") + QString::fromStdString(id) +
               QStringLiteral("\"");
    }
} // namespace

OverlayRegistry::OverlayRegistry(OverlayBackend& backend, GeometryStore& store, config::PersistPolicy persist) noexcept :
    m_backend(&backend),
    m_store(&store),
    m_persist(persist)
{
}

OverlayRegistry::~OverlayRegistry()
{
    destroyAll();
}

OverlayRegistry::RecordMap& OverlayRegistry::records(OverlayKind kind) noexcept
{
    return kind == OverlayKind::Rect ? m_rects : m_points;
}

const OverlayRegistry::RecordMap& OverlayRegistry::records(OverlayKind kind) const noexcept
{
    return kind == OverlayKind::Rect ? m_rects : m_points;
}

void OverlayRegistry::validateRequest(OverlayKind kind, const std::string& id, const GeometryRequest& request)
{
    if (kind != OverlayKind::Rect)
        return;

    if (request.width && *request.width <= 0)
        throw InvalidGeometryError("OverlayRegistry: rect \"" + id + "\" width must be positive, got " +
                                   std::to_string(*request.width));

    if (request.height && *request.height <= 0)
        throw InvalidGeometryError("OverlayRegistry: rect \"" + id + "\" height must be positive, got " +
                                   std::to_string(*request.height));
}

void OverlayRegistry::applyRequest(OverlayKind kind, OverlayGeometry& geometry, const GeometryRequest& request) noexcept
{
    if (request.x)
        geometry.pos.x = *request.x;
    if (request.y)
        geometry.pos.y = *request.y;

    if (kind == OverlayKind::Point)
    {
        geometry.size = glm::ivec2(0);
        return;
    }

    if (request.width)
        geometry.size.x = *request.width;
    if (request.height)
        geometry.size.y = *request.height;
}

OverlayGeometry OverlayRegistry::resolveGeometry(OverlayKind kind, const std::string& id, const GeometryRequest& request) const
{
    OverlayGeometry geometry = kind == OverlayKind::Rect ? OverlayGeometry::fromRect(config::kDefaultRect)
                                                         : OverlayGeometry::fromPoint(config::kDefaultPoint);

    if (const std::optional<PersistedEntry> stored = m_store->get(kind, id))
        geometry = stored->geometry;

    applyRequest(kind, geometry, request);
    return geometry;
}

const OverlayRecord& OverlayRegistry::ensure(OverlayKind            kind,
                                             const std::string&     id,
                                             const std::string&     label,
                                             const GeometryRequest& request,
                                             const QVariantMap&     style)
{
    validateRequest(kind, id, request);

    const std::string shownLabel = label.empty() ? id : label;
    RecordMap&        map        = records(kind);

    if (auto it = map.find(id); it != map.end())
    {
        OverlayRecord& rec = it->second;

        // Style first: a rejected style leaves the record untouched.
        rec.widget->setStyle(style);
        rec.style = style;

        rec.label = shownLabel;
        rec.widget->setLabel(shownLabel);

        if (!request.empty())
        {
            applyRequest(kind, rec.geometry, request);
            rec.widget->setGeometry(rec.geometry);
        }

        if (!rec.visible || !rec.widget->isVisible())
            rec.widget->show();
        rec.visible = true;

        return rec;
    }

    const OverlayGeometry geometry = resolveGeometry(kind, id, request);

    std::unique_ptr<OverlayWidget> widget = m_backend->createWidget(kind, geometry, shownLabel, style);
    if (!widget)
        throw OverlayError("OverlayRegistry: backend did not create a widget for " + describe(kind, id).toStdString());

    OverlayRecord rec = {};
    rec.id            = id;
    rec.kind          = kind;
    rec.label         = shownLabel;
    rec.geometry      = geometry;
    rec.style         = style;
    rec.widget        = std::move(widget);

    OverlayRecord& stored = map.emplace(id, std::move(rec)).first->second;

    subscribe(stored);
    stored.widget->show();
    stored.visible = true;

    qDebug().noquote() << "[OverlayRegistry] created" << describe(kind, id) << "at" << geometry.pos.x << geometry.pos.y
                       << "size" << geometry.size.x << geometry.size.y;
    return stored;
}

void OverlayRegistry::subscribe(OverlayRecord& record)
{
    const OverlayKind kind = record.kind;
    const std::string id   = record.id;

    record.widget->setGeometryChangedHandler([this, kind, id](const OverlayGeometry& geometry, bool finished) {
        try
        {
            onGeometryChanged(kind, id, geometry, finished);
        }
        catch (const StoreWriteError& e)
        {
            // Raised inside the event loop; there is no caller to propagate to.
            qWarning().noquote() << "[OverlayRegistry][Warning]" << e.what();
        }
    });
}

bool OverlayRegistry::remove(OverlayKind kind, const std::string& id)
{
    RecordMap& map = records(kind);
    auto       it  = map.find(id);
    if (it == map.end())
        return false;

    map.erase(it);
    qDebug().noquote() << "[OverlayRegistry] removed" << describe(kind, id);
    return true;
}

void OverlayRegistry::onGeometryChanged(OverlayKind kind, const std::string& id, const OverlayGeometry& geometry, bool finished)
{
    RecordMap& map = records(kind);
    auto       it  = map.find(id);
    if (it == map.end())
    {
        qDebug().noquote() << "[OverlayRegistry] ignored geometry event for released" << describe(kind, id);
        return;
    }

    OverlayGeometry applied = geometry;
    if (kind == OverlayKind::Rect && (applied.size.x <= 0 || applied.size.y <= 0))
    {
        qWarning().noquote() << "[OverlayRegistry][Warning] rejected non-positive size" << applied.size.x
                             << applied.size.y << "for" << describe(kind, id);
        return;
    }
    if (kind == OverlayKind::Point)
        applied.size = glm::ivec2(0);

    it->second.geometry = applied;

    if (finished || m_persist == config::PersistPolicy::EveryChange)
        m_store->save(PersistedEntry{id, kind, applied});
}

OverlayGeometry OverlayRegistry::get(OverlayKind kind, const std::string& id) const
{
    if (const OverlayRecord* rec = find(kind, id))
        return rec->geometry;

    if (const std::optional<PersistedEntry> stored = m_store->get(kind, id))
        return stored->geometry;

    throw NotFoundError("OverlayRegistry: no " + describe(kind, id).toStdString() + " registered or stored");
}

void OverlayRegistry::showAll()
{
    for (RecordMap* map : {&m_rects, &m_points})
    {
        for (auto& [id, rec] : *map)
        {
            if (rec.visible)
                continue;
            rec.widget->show();
            rec.visible = true;
        }
    }
}

void OverlayRegistry::hideAll()
{
    for (RecordMap* map : {&m_rects, &m_points})
    {
        for (auto& [id, rec] : *map)
        {
            if (!rec.visible)
                continue;
            rec.widget->hide();
            rec.visible = false;
        }
    }
}

void OverlayRegistry::destroyAll() noexcept
{
    const std::size_t count = size();
    m_rects.clear();
    m_points.clear();

    if (count > 0)
        qDebug().noquote() << "[OverlayRegistry] destroyed" << count << "overlay(s)";
}

const OverlayRecord* OverlayRegistry::find(OverlayKind kind, const std::string& id) const
{
    const RecordMap& map = records(kind);
    if (auto it = map.find(id); it != map.end())
        return &it->second;
    return nullptr;
}

bool OverlayRegistry::contains(OverlayKind kind, const std::string& id) const
{
    return find(kind, id) != nullptr;
}

std::size_t OverlayRegistry::size() const noexcept
{
    return m_rects.size() + m_points.size();
}
