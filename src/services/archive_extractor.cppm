/*!
 * @file        archive_extractor.cppm
 * @brief       Archive extraction handoff for finished downloads.
 * @details     Declares the extractor interface the download manager calls
 *              once a task completes, and a default implementation that
 *              drives the platform's archive tools (unzip, tar, 7z, unrar,
 *              gzip) through QProcess without blocking the event loop.
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <expected>
#include <functional>
#include <optional>
#include <QObject>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module emularr.services.archive_extractor;
#endif

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

/**
 * @brief Extracts archives into a destination directory.
 */
EMULARR_MODULE_EXPORT class ArchiveExtractor {
public:
    //!< @brief Extraction outcome: the directory holding the content, or an error message.
    using Result = std::expected<QString, QString>;
    using Callback = std::function<void(const Result&)>;

    virtual ~ArchiveExtractor() = default;

    //!< @brief Whether the file is an archive this extractor should unpack.
    virtual bool shouldExtract(const QString& filePath) const = 0;

    /**
     * @brief Unpack an archive asynchronously.
     * @param archivePath Archive on disk; it is never modified.
     * @param destinationDir Directory to create and fill.
     * @param done Invoked exactly once on the caller's thread.
     */
    virtual void extract(const QString& archivePath, const QString& destinationDir, Callback done) = 0;
};

/**
 * @brief ArchiveExtractor running command-line tools through QProcess.
 *
 * A non-zero exit status or a tool that cannot be started is reported as an
 * error; the archive is left in place either way.
 */
EMULARR_MODULE_EXPORT class ProcessArchiveExtractor : public QObject, public ArchiveExtractor {

    Q_OBJECT

public:
    /**
     * @brief Resolved tool invocation for one archive.
     */
    struct Command {
        QString program;            //!< Executable name, looked up on PATH.
        QStringList arguments;      //!< Tool arguments.
        QString standardOutputFile; //!< Redirect target for stream decompressors, else empty.
    };

    explicit ProcessArchiveExtractor(QObject* parent = nullptr);

    bool shouldExtract(const QString& filePath) const override;
    void extract(const QString& archivePath, const QString& destinationDir, Callback done) override;

    /**
     * @brief Tool invocation for an archive.
     * @return std::nullopt when the file is not a supported archive.
     */
    static std::optional<Command> commandFor(const QString& archivePath, const QString& destinationDir);

    //!< @brief Number of extractions still running.
    int runningCount() const { return m_running; }

private:
    int m_running = 0;  //!< In-flight processes.
};

#include "archive_extractor.moc"
