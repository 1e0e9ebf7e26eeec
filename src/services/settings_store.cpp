module;
#include <memory>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QString>
#include <QVariant>

module emularr.services.settings_store;

SettingsStore::SettingsStore(const QString& iniPath)
    : m_iniPath(iniPath)
{
}

std::unique_ptr<QSettings> SettingsStore::openSettings() const
{
    if (!m_iniPath.isEmpty()) {
        return std::make_unique<QSettings>(m_iniPath, QSettings::IniFormat);
    }
    return std::make_unique<QSettings>();
}

QString SettingsStore::defaultDownloadDirectory()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::DocumentsLocation);
    if (base.isEmpty()) base = QDir::homePath();
    return QDir(base).filePath(QStringLiteral("Emularr/Games"));
}

QString SettingsStore::downloadDirectory() const
{
    if (!m_directoryOverride.isEmpty()) return m_directoryOverride;

    auto settings = openSettings();
    settings->beginGroup(settingsGroup());
    const QString dir = settings->value(QStringLiteral("directory")).toString().trimmed();
    settings->endGroup();
    return dir.isEmpty() ? defaultDownloadDirectory() : dir;
}

int SettingsStore::chunkThreadCount() const
{
    if (m_threadsOverride > 0) return m_threadsOverride;

    auto settings = openSettings();
    settings->beginGroup(settingsGroup());
    bool ok = false;
    const int threads = settings->value(QStringLiteral("threads")).toString().trimmed().toInt(&ok);
    settings->endGroup();
    return (ok && threads > 0) ? threads : kDefaultThreads;
}

void SettingsStore::setDownloadDirectory(const QString& directory)
{
    auto settings = openSettings();
    settings->beginGroup(settingsGroup());
    settings->setValue(QStringLiteral("directory"), directory);
    settings->endGroup();
    settings->sync();
}

void SettingsStore::setChunkThreadCount(int threads)
{
    auto settings = openSettings();
    settings->beginGroup(settingsGroup());
    settings->setValue(QStringLiteral("threads"), threads);
    settings->endGroup();
    settings->sync();
}

void SettingsStore::setOverrides(const QString& directory, int threads)
{
    m_directoryOverride = directory.trimmed();
    m_threadsOverride = threads > 0 ? threads : 0;
}
