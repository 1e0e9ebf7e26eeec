/*!
 * @file        settings_store.cppm
 * @brief       Download engine configuration.
 * @details     Declares the configuration interface the download engine
 *              reads at task start, and a QSettings-backed implementation.
 *              Values set through setOverrides() live in memory only and
 *              shadow the stored ones; command-line drivers use them.
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <memory>
#include <QSettings>
#include <QString>

export module emularr.services.settings_store;

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

/**
 * @brief Settings the engine consults when a task starts.
 */
EMULARR_MODULE_EXPORT class EngineSettings {
public:
    virtual ~EngineSettings() = default;

    //!< @brief Directory receiving new downloads.
    virtual QString downloadDirectory() const = 0;

    //!< @brief Maximum concurrent chunks per task, always positive.
    virtual int chunkThreadCount() const = 0;
};

/**
 * @brief EngineSettings stored through QSettings, group "downloads".
 */
EMULARR_MODULE_EXPORT class SettingsStore : public EngineSettings {
public:
    //!< @brief Thread count used when none (or an invalid one) is stored.
    static constexpr int kDefaultThreads = 8;

    //!< @brief Use the application's default QSettings location.
    SettingsStore() = default;

    //!< @brief Use an explicit INI file (tests, portable installs).
    explicit SettingsStore(const QString& iniPath);

    QString downloadDirectory() const override;
    int chunkThreadCount() const override;

    //!< @brief Persist the download directory.
    void setDownloadDirectory(const QString& directory);

    //!< @brief Persist the chunk thread count.
    void setChunkThreadCount(int threads);

    /**
     * @brief Shadow stored values without writing them.
     * @param directory Empty keeps the stored directory.
     * @param threads Non-positive keeps the stored thread count.
     */
    void setOverrides(const QString& directory, int threads);

    //!< @brief <Documents>/Emularr/Games.
    static QString defaultDownloadDirectory();

    //!< @brief QSettings group holding the engine keys.
    static QString settingsGroup() { return QStringLiteral("downloads"); }

private:
    std::unique_ptr<QSettings> openSettings() const;

    QString m_iniPath;              //!< Explicit INI file, empty for the default store.
    QString m_directoryOverride;    //!< In-memory directory override.
    int m_threadsOverride = 0;      //!< In-memory thread override, 0 when unset.
};
