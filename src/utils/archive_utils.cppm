/*!
 * @file        archive_utils.cppm
 * @brief       Archive and disk-image classification helpers.
 * @details     Maps downloaded file names to the archive formats the
 *              post-download stage knows how to unpack, and recognizes the
 *              disk-image formats (optical media, console partitions) that
 *              must always be kept intact.
 *
 *              Classification is purely extension based; the file contents
 *              are never inspected.
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module emularr.utils.archive_utils;
#endif

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

EMULARR_MODULE_EXPORT namespace emularr::utils {

/**
 * @brief Archive container formats recognized by the extractor.
 */
enum class ArchiveKind {
    None,       //!< Not an extractable archive.
    Zip,        //!< .zip
    Tar,        //!< .tar, .tar.gz, .tgz
    SevenZip,   //!< .7z
    Rar,        //!< .rar
    Gzip        //!< Plain single-file .gz
};

/**
 * @brief Detects the archive kind of a file name or path.
 *
 * Disk images always map to ArchiveKind::None, even when a
 * compound suffix would otherwise look like an archive.
 *
 * @param filePath Full file name or path.
 * @return The detected archive kind.
 */
ArchiveKind detectArchiveKind(const QString& filePath);

//!< @brief True for optical-media and console disk images that must stay intact.
bool isDiskImage(const QString& filePath);

/**
 * @brief Decides whether a finished download should be extracted.
 *
 * The deny-list (disk images) is checked before the allow-list.
 */
bool shouldExtract(const QString& filePath);

/**
 * @brief Returns the file name with its archive suffix removed.
 *
 * "Game (USA).tar.gz" becomes "Game (USA)". Names without a recognized
 * archive suffix lose only their last suffix.
 */
QString archiveBaseName(const QString& filePath);

//!< @brief Allow-list of extractable suffixes (lowercase, with leading dot).
QStringList extractableSuffixes();

//!< @brief Deny-list of disk-image suffixes (lowercase, with leading dot).
QStringList diskImageSuffixes();

} // namespace emularr::utils
