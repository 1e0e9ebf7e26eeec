/*!
 * @file        downloadmanager.cppm
 * @brief       Download engine façade.
 * @details     Provides the entry point callers use to start, observe and
 *              control game downloads.
 *
 *              The manager reads the engine configuration when a task is
 *              created, resolves a unique output path, registers the task
 *              and hands it to a TransferController. Progress is polled
 *              through snapshot copies; nothing is pushed except two
 *              coarse signals.
 *
 *              Once a task completes, the manager runs the post-processing
 *              handoff: the archive is extracted (when it is one) into a
 *              folder named after the game, then the result is recorded in
 *              the game catalog. Both steps are best-effort; their failures
 *              are logged on the task and never change its status.
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <optional>
#include <QObject>
#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>
#include <QUrl>

#ifndef Q_MOC_RUN
export module emularr.core.downloadmanager;
import emularr.core.downloadtypes;
import emularr.core.taskregistry;
import emularr.core.transfercontroller;
import emularr.services.settings_store;
import emularr.services.archive_extractor;
import emularr.services.game_catalog;
#endif

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

/**
 * @brief Creates and controls download tasks.
 *
 * Collaborators are borrowed and must outlive the manager. A null extractor
 * or catalog disables that post-processing step.
 */
EMULARR_MODULE_EXPORT class DownloadManager : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a manager.
     * @param settings Engine configuration, read at task start.
     * @param extractor Archive extractor, or nullptr to keep archives packed.
     * @param catalog Game catalog, or nullptr to skip cataloging.
     * @param parent Optional parent QObject.
     */
    DownloadManager(EngineSettings& settings,
                    ArchiveExtractor* extractor,
                    GameCatalog* catalog,
                    QObject* parent = nullptr);
    ~DownloadManager() override;

    /**
     * @brief Start downloading a URL.
     *
     * Returns before any network activity.
     *
     * @param urlStr http(s) URL.
     * @param hint Transfer mode preference.
     * @param game Game name, platform and extra metadata.
     * @return The new task id, or an empty string when the URL is invalid or
     *         uses an unsupported scheme (magnet links, torrents).
     */
    QString startDownload(const QString& urlStr, StrategyHint hint, const GameInfo& game);

    //!< @brief Copy of a task's state, std::nullopt when unknown.
    std::optional<TaskSnapshot> getProgress(const QString& id) const;

    //!< @brief Copies of every task in creation order.
    QList<TaskSnapshot> getAllTasks() const;

    //!< @brief Ids of tasks that are Downloading or Paused.
    QStringList activeTaskIds() const;

    bool pause(const QString& id);
    bool resume(const QString& id);

    /**
     * @brief Cancel a task, delete its partial file and forget it.
     * @return false when the id is unknown or the task already finished.
     */
    bool cancel(const QString& id);

    /**
     * @brief Forget a finished task (Completed, Error).
     * @return false when the id is unknown or the task is still active.
     */
    bool prune(const QString& id);

    //!< @brief Forget every finished task. Returns how many were removed.
    int pruneFinished();

    //!< @brief Sampling interval applied to tasks created from now on.
    void setSampleIntervalMs(int ms) { m_sampleIntervalMs = ms; }

signals:
    void taskStatusChanged(const QString& id, DownloadStatus status);
    void taskPostProcessed(const QString& id);

private:
    //!< @brief Output path for a URL inside a directory; never an existing file.
    QString resolveDownloadPath(const QUrl& url, const QString& directory, const QString& displayName) const;

    TransferController* createController(const QString& id, const TransferController::Options& options);
    void onControllerStatusChanged(const QString& id, DownloadStatus status);

    //!< @brief Forget a task and schedule its controller for deletion.
    void dropTask(const QString& id);

    void postProcess(const QString& id);
    void finishPostProcess(const QString& id, const QString& resolvedPath, bool extracted);

    EngineSettings& m_settings;                             //!< Borrowed configuration.
    ArchiveExtractor* m_extractor = nullptr;                //!< Borrowed extractor, may be null.
    GameCatalog* m_catalog = nullptr;                       //!< Borrowed catalog, may be null.
    TaskRegistry m_registry;                                //!< Task snapshots.
    QHash<QString, TransferController*> m_controllers;      //!< Controllers by task id.
    int m_sampleIntervalMs = 500;                           //!< Progress sampling interval.
};

#include "downloadmanager.moc"
