/*!
 * @file        game_catalog.cppm
 * @brief       Game library catalog for finished downloads.
 * @details     Declares the catalog interface the download manager feeds
 *              once a download (and its optional extraction) finishes, and
 *              a default implementation that keeps the library as a JSON
 *              array in a single file, rewritten atomically on every change.
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <expected>
#include <QList>
#include <QString>
#include <QStringList>
#include <QVariantMap>

export module emularr.services.game_catalog;

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

/**
 * @brief Data the engine supplies for a new library entry.
 */
EMULARR_MODULE_EXPORT struct CatalogEntryRequest {
    QString name;               //!< Game name.
    QString platform;           //!< Platform, may be empty.
    QString filePath;           //!< Extracted directory or the downloaded file.
    QString sourceDownloadDir;  //!< Directory the download was written to.
    QVariantMap metadata;       //!< originalFileName, extracted, size and caller extras.
};

/**
 * @brief One library entry.
 */
EMULARR_MODULE_EXPORT struct CatalogEntry {
    QString id;                 //!< Generated identifier.
    QString name;
    QString platform;
    QString filePath;
    QString sourceDownloadDir;
    QStringList tags;           //!< User tags, empty on creation.
    qint64 dateAdded = 0;       //!< Epoch milliseconds.
    QVariantMap metadata;
};

/**
 * @brief Records completed downloads as library entries.
 */
EMULARR_MODULE_EXPORT class GameCatalog {
public:
    virtual ~GameCatalog() = default;

    /**
     * @brief Add an entry.
     * @return The stored entry with id and dateAdded filled in, or an error message.
     */
    virtual std::expected<CatalogEntry, QString> registerEntry(const CatalogEntryRequest& request) = 0;
};

/**
 * @brief GameCatalog persisted as a JSON array file.
 */
EMULARR_MODULE_EXPORT class JsonGameCatalog : public GameCatalog {
public:
    /**
     * @brief Open (or lazily create) a catalog file.
     * @param filePath JSON file; missing files read as an empty library.
     */
    explicit JsonGameCatalog(const QString& filePath = defaultCatalogPath());

    std::expected<CatalogEntry, QString> registerEntry(const CatalogEntryRequest& request) override;

    //!< @brief Every stored entry in insertion order.
    std::expected<QList<CatalogEntry>, QString> entries() const;

    const QString& filePath() const { return m_filePath; }

    //!< @brief <AppData>/games.json.
    static QString defaultCatalogPath();

private:
    QString m_filePath; //!< Backing JSON file.
};
