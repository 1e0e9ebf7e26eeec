/*!
 * @file        taskregistry.cppm
 * @brief       Synchronized store of download task snapshots.
 * @details     The registry is the single point where task state is
 *              mutated and read. Every read returns a copy so callers never
 *              alias engine state; every write goes through update() under
 *              the registry mutex so a finishing fetcher and a polling
 *              reader cannot interleave.
 *
 *              Rows are kept in creation order.
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <functional>
#include <optional>
#include <QList>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <QVector>

#ifndef Q_MOC_RUN
export module emularr.core.taskregistry;
import emularr.core.downloadtypes;
#endif

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

/**
 * @brief Mutex-protected map of task id to task snapshot.
 *
 * Owned by DownloadManager and handed to controllers by reference.
 */
EMULARR_MODULE_EXPORT class TaskRegistry {
public:
    //!< @brief Mutation applied to one snapshot under the lock.
    using Mutator = std::function<void(TaskSnapshot&)>;

    TaskRegistry() = default;
    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    /**
     * @brief Add a new task row.
     * @return false when a row with the same id already exists.
     */
    bool insert(const TaskSnapshot& snapshot);

    /**
     * @brief Apply a mutation to one row.
     *
     * The mutator runs with the registry locked and must not call back into
     * the registry.
     * @return false when the id is unknown (e.g. the task was cancelled).
     */
    bool update(const QString& id, const Mutator& mutator);

    /**
     * @brief Append a timestamped line to a task's log.
     * @return false when the id is unknown.
     */
    bool appendLog(const QString& id, const QString& line);

    //!< @brief Copy of one row, std::nullopt when unknown.
    std::optional<TaskSnapshot> find(const QString& id) const;

    //!< @brief Copies of every row in creation order.
    QList<TaskSnapshot> all() const;

    //!< @brief Task ids in creation order.
    QStringList ids() const;

    //!< @brief Remove a row. Returns false when the id is unknown.
    bool remove(const QString& id);

    bool contains(const QString& id) const;
    int size() const;

private:
    //!< @brief Row index for an id, -1 when unknown. Caller holds the lock.
    int indexOf(const QString& id) const;

    mutable QMutex m_mutex;                 //!< Guards m_rows.
    QVector<TaskSnapshot> m_rows;           //!< Rows in creation order.
};
