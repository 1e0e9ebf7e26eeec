module;
#include <expected>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QList>
#include <QRandomGenerator>
#include <QSaveFile>
#include <QStandardPaths>
#include <QString>
#include <QStringList>
#include <QVariantMap>

module emularr.services.game_catalog;

namespace {

QJsonObject entryToJson(const CatalogEntry& entry)
{
    QJsonObject obj;
    obj.insert("id", entry.id);
    obj.insert("name", entry.name);
    if (!entry.platform.isEmpty()) obj.insert("platform", entry.platform);
    obj.insert("filePath", entry.filePath);
    obj.insert("sourceDownloadDir", entry.sourceDownloadDir);
    obj.insert("tags", QJsonArray::fromStringList(entry.tags));
    obj.insert("dateAdded", static_cast<double>(entry.dateAdded));
    obj.insert("metadata", QJsonObject::fromVariantMap(entry.metadata));
    return obj;
}

CatalogEntry entryFromJson(const QJsonObject& obj)
{
    CatalogEntry entry;
    entry.id = obj.value("id").toString();
    entry.name = obj.value("name").toString();
    entry.platform = obj.value("platform").toString();
    entry.filePath = obj.value("filePath").toString();
    entry.sourceDownloadDir = obj.value("sourceDownloadDir").toString();
    for (const QJsonValue& tag : obj.value("tags").toArray()) entry.tags << tag.toString();
    entry.dateAdded = static_cast<qint64>(obj.value("dateAdded").toDouble(0));
    entry.metadata = obj.value("metadata").toObject().toVariantMap();
    return entry;
}

std::expected<QJsonArray, QString> readArray(const QString& path)
{
    QFile file(path);
    if (!file.exists()) return QJsonArray{};
    if (!file.open(QIODevice::ReadOnly)) {
        return std::unexpected(QStringLiteral("Cannot read %1: %2").arg(path, file.errorString()));
    }
    const QByteArray raw = file.readAll();
    if (raw.trimmed().isEmpty()) return QJsonArray{};

    QJsonParseError err{};
    const QJsonDocument doc = QJsonDocument::fromJson(raw, &err);
    if (err.error != QJsonParseError::NoError || !doc.isArray()) {
        return std::unexpected(QStringLiteral("Catalog %1 is corrupt: %2").arg(path, err.errorString()));
    }
    return doc.array();
}

QString makeEntryId()
{
    return QStringLiteral("%1-%2")
        .arg(QDateTime::currentMSecsSinceEpoch())
        .arg(QRandomGenerator::global()->generate(), 8, 16, QLatin1Char('0'));
}

} // namespace

JsonGameCatalog::JsonGameCatalog(const QString& filePath)
    : m_filePath(filePath)
{
}

QString JsonGameCatalog::defaultCatalogPath()
{
    const QString baseDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(baseDir).filePath(QStringLiteral("games.json"));
}

std::expected<CatalogEntry, QString> JsonGameCatalog::registerEntry(const CatalogEntryRequest& request)
{
    if (request.name.trimmed().isEmpty()) {
        return std::unexpected(QStringLiteral("Catalog entry needs a name"));
    }

    auto array = readArray(m_filePath);
    if (!array) return std::unexpected(array.error());

    CatalogEntry entry;
    entry.id = makeEntryId();
    entry.name = request.name.trimmed();
    entry.platform = request.platform;
    entry.filePath = request.filePath;
    entry.sourceDownloadDir = request.sourceDownloadDir;
    entry.dateAdded = QDateTime::currentMSecsSinceEpoch();
    entry.metadata = request.metadata;
    array->append(entryToJson(entry));

    const QString dir = QFileInfo(m_filePath).absolutePath();
    if (!QDir().mkpath(dir)) {
        return std::unexpected(QStringLiteral("Cannot create directory %1").arg(dir));
    }
    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        return std::unexpected(QStringLiteral("Cannot write %1: %2").arg(m_filePath, file.errorString()));
    }
    file.write(QJsonDocument(*array).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        return std::unexpected(QStringLiteral("Cannot save %1: %2").arg(m_filePath, file.errorString()));
    }

    qInfo() << "Cataloged" << entry.name << "as" << entry.id;
    return entry;
}

std::expected<QList<CatalogEntry>, QString> JsonGameCatalog::entries() const
{
    const auto array = readArray(m_filePath);
    if (!array) return std::unexpected(array.error());

    QList<CatalogEntry> out;
    for (const QJsonValue& value : *array) {
        if (value.isObject()) out.append(entryFromJson(value.toObject()));
    }
    return out;
}
