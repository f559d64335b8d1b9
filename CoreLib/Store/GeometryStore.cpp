#include "GeometryStore.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <QStringList>
#include <climits>
#include <cmath>

#include "OverlayErrors.hpp"
#include "PathUtilities.hpp"

namespace
{
    static StoreIOReport* reportOrLocal(StoreIOReport* out, StoreIOReport& local) noexcept
    {
        return out ? out : &local;
    }

    static std::string describe(OverlayKind kind, const std::string& id)
    {
        return std::string(kindName(kind)) + " \"" + id + "\"";
    }

    static int readIntField(const QJsonObject& obj, const char* name, OverlayKind kind, const std::string& id)
    {
        const QJsonValue v = obj.value(QLatin1String(name));
        if (!v.isDouble())
            throw CorruptStoreError("GeometryStore: " + describe(kind, id) + " has no numeric \"" + name + "\"");

        const double d = v.toDouble();
        if (d != std::floor(d) || d < static_cast<double>(INT_MIN) || d > static_cast<double>(INT_MAX))
            throw CorruptStoreError("GeometryStore: " + describe(kind, id) + " field \"" + name + "\" is not an integer");

        return static_cast<int>(d);
    }
} // namespace

GeometryStore::GeometryStore(std::filesystem::path configDir, std::string fileName) :
    m_dir(PathUtil::normalizedPath(configDir)),
    m_path(m_dir / fileName)
{
}

QString GeometryStore::sectionName(OverlayKind kind)
{
    return kind == OverlayKind::Rect ? QStringLiteral("rects") : QStringLiteral("points");
}

PersistedEntry GeometryStore::parseEntry(OverlayKind kind, const std::string& id, const QJsonValue& value)
{
    if (!value.isObject())
        throw CorruptStoreError("GeometryStore: " + describe(kind, id) + " is not an object");

    const QJsonObject obj = value.toObject();

    PersistedEntry entry = {};
    entry.id             = id;
    entry.kind           = kind;
    entry.geometry.pos   = glm::ivec2(readIntField(obj, "x", kind, id), readIntField(obj, "y", kind, id));

    if (kind == OverlayKind::Rect)
    {
        entry.geometry.size = glm::ivec2(readIntField(obj, "width", kind, id), readIntField(obj, "height", kind, id));
        if (entry.geometry.size.x <= 0 || entry.geometry.size.y <= 0)
            throw CorruptStoreError("GeometryStore: " + describe(kind, id) + " has a non-positive size");
    }

    return entry;
}

GeometryStore::ReadResult GeometryStore::readDocument(const std::filesystem::path& path, QJsonObject& out, std::string& problem)
{
    if (!PathUtil::fileExists(path))
        return ReadResult::Missing;

    QFile file(PathUtil::toQString(path));
    if (!file.open(QIODevice::ReadOnly))
    {
        problem = "cannot open " + path.string() + ": " + file.errorString().toStdString();
        return ReadResult::Corrupt;
    }

    QJsonParseError     err{};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError)
    {
        problem = "cannot parse " + path.string() + ": " + err.errorString().toStdString() +
                  " at offset " + std::to_string(err.offset);
        return ReadResult::Corrupt;
    }

    if (!doc.isObject())
    {
        problem = path.string() + " does not hold a JSON object";
        return ReadResult::Corrupt;
    }

    out = doc.object();
    return ReadResult::Ok;
}

void GeometryStore::writeDocument(const QJsonObject& doc) const
{
    std::error_code ec;
    if (!PathUtil::ensureDirectory(m_dir, ec))
        throw StoreWriteError("GeometryStore: cannot create directory " + m_dir.string() + ": " + ec.message());

    QSaveFile file(PathUtil::toQString(m_path));
    if (!file.open(QIODevice::WriteOnly))
        throw StoreWriteError("GeometryStore: cannot open " + m_path.string() + ": " + file.errorString().toStdString());

    const QByteArray bytes = QJsonDocument(doc).toJson(QJsonDocument::Indented);
    if (file.write(bytes) != bytes.size() || !file.flush())
    {
        const std::string why = file.errorString().toStdString();
        file.cancelWriting();
        throw StoreWriteError("GeometryStore: cannot write " + m_path.string() + ": " + why);
    }

    // commit() renames the temporary file over the store.
    if (!file.commit())
        throw StoreWriteError("GeometryStore: cannot commit " + m_path.string() + ": " + file.errorString().toStdString());
}

void GeometryStore::backupCorruptFile(StoreIOReport& report) const
{
    const std::filesystem::path backup = PathUtil::withSuffix(m_path, ".corrupt");
    const QString               target = PathUtil::toQString(backup);

    if (QFile::exists(target))
        QFile::remove(target);

    if (QFile::copy(PathUtil::toQString(m_path), target))
        report.info("kept a copy of the unreadable store at " + backup.string());
    else
        report.warning("could not back up the unreadable store to " + backup.string());
}

bool GeometryStore::migrateLegacy(StoreIOReport& report)
{
    const std::filesystem::path rectsPath  = m_dir / config::kLegacyRectsFileName;
    const std::filesystem::path pointsPath = m_dir / config::kLegacyPointsFileName;

    QJsonObject rects;
    QJsonObject points;
    std::string problem;

    const ReadResult rectsResult = readDocument(rectsPath, rects, problem);
    if (rectsResult == ReadResult::Corrupt)
    {
        report.warning("legacy " + problem);
        rects = {};
    }

    problem.clear();
    const ReadResult pointsResult = readDocument(pointsPath, points, problem);
    if (pointsResult == ReadResult::Corrupt)
    {
        report.warning("legacy " + problem);
        points = {};
    }

    if (rects.isEmpty() && points.isEmpty())
        return false;

    QJsonObject doc;
    doc.insert(sectionName(OverlayKind::Rect), rects);
    doc.insert(sectionName(OverlayKind::Point), points);
    m_document = doc;

    report.info("migrated " + std::to_string(rects.size()) + " rect(s) and " + std::to_string(points.size()) +
                " point(s) from legacy files into " + m_path.string());

    try
    {
        writeDocument(doc);
    }
    catch (const StoreWriteError& e)
    {
        // Migrated entries stay usable in memory; the next save() retries the write.
        report.error(e.what(), StoreIOStatus::WriteError);
    }

    return true;
}

void GeometryStore::rebuildEntries(StoreIOReport& report)
{
    m_entries.clear();

    // Unreadable data stays in m_document and is written back untouched.
    for (OverlayKind kind : {OverlayKind::Rect, OverlayKind::Point})
    {
        const QString    section = sectionName(kind);
        const QJsonValue value   = m_document.value(section);

        if (value.isUndefined())
            continue;

        if (!value.isObject())
        {
            report.warning("section \"" + section.toStdString() + "\" is not an object; ignored");
            continue;
        }

        const QJsonObject sectionObj = value.toObject();
        for (auto it = sectionObj.begin(); it != sectionObj.end(); ++it)
        {
            const std::string id = it.key().toStdString();
            try
            {
                PersistedEntry entry = parseEntry(kind, id, it.value());
                m_entries.emplace(EntryKey{kind, id}, std::move(entry));
            }
            catch (const CorruptStoreError& e)
            {
                report.warning(std::string(e.what()) + "; entry skipped, default geometry applies");
            }
        }
    }
}

GeometryStore::EntryMap GeometryStore::load(StoreIOReport* report)
{
    StoreIOReport  local = {};
    StoreIOReport* rep   = reportOrLocal(report, local);

    m_document = {};
    m_entries.clear();

    std::error_code ec;
    if (!PathUtil::ensureDirectory(m_dir, ec))
        rep->error("cannot create directory " + m_dir.string() + ": " + ec.message(), StoreIOStatus::WriteError);

    QJsonObject doc;
    std::string problem;

    switch (readDocument(m_path, doc, problem))
    {
        case ReadResult::Ok:
            m_document = doc;
            break;

        case ReadResult::Missing:
            if (!migrateLegacy(*rep))
                rep->info("no store at " + m_path.string() + "; starting empty");
            break;

        case ReadResult::Corrupt:
            rep->error(problem);
            backupCorruptFile(*rep);
            break;
    }

    rebuildEntries(*rep);

    rep->info("loaded " + std::to_string(m_entries.size()) + " entr" + (m_entries.size() == 1 ? "y" : "ies") +
              " from " + m_path.string());

    dumpStoreIOReport(*rep);
    return m_entries;
}

void GeometryStore::save(const PersistedEntry& entry)
{
    if (entry.kind == OverlayKind::Rect && (entry.geometry.size.x <= 0 || entry.geometry.size.y <= 0))
        throw InvalidGeometryError("GeometryStore::save: " + describe(entry.kind, entry.id) + " has a non-positive size");

    const QString section = sectionName(entry.kind);
    const QString key     = QString::fromStdString(entry.id);

    QJsonObject doc        = m_document;
    QJsonObject sectionObj = doc.value(section).toObject();
    QJsonObject obj        = sectionObj.value(key).toObject(); // keeps unknown fields

    obj.insert(QStringLiteral("x"), entry.geometry.pos.x);
    obj.insert(QStringLiteral("y"), entry.geometry.pos.y);
    if (entry.kind == OverlayKind::Rect)
    {
        obj.insert(QStringLiteral("width"), entry.geometry.size.x);
        obj.insert(QStringLiteral("height"), entry.geometry.size.y);
    }

    sectionObj.insert(key, obj);
    doc.insert(section, sectionObj);

    writeDocument(doc);

    m_document                                = std::move(doc);
    m_entries[EntryKey{entry.kind, entry.id}] = entry;
}

std::optional<PersistedEntry> GeometryStore::get(OverlayKind kind, const std::string& id) const
{
    if (auto it = m_entries.find(EntryKey{kind, id}); it != m_entries.end())
        return it->second;
    return std::nullopt;
}

bool GeometryStore::contains(OverlayKind kind, const std::string& id) const
{
    return m_entries.find(EntryKey{kind, id}) != m_entries.end();
}
