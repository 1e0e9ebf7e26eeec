/*!
 * @file        download_utils.cppm
 * @brief       Common utility helpers for download paths and file names.
 * @details     Provides a collection of small, reusable helper functions shared
 *              across download core components. These utilities handle common
 *              tasks such as path normalization, filename inference from URLs,
 *              collision-free output paths and on-disk size inspection.
 *
 *              All helpers except uniqueFilePath() and fileSizeOnDisk() are
 *              side-effect free and safe for use from any component.
 *
 * @author      Emularr developers
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 The Emularr Project. All rights reserved.
 * @license     Proprietary. No license is granted beyond the copyright notice.
 */

module;
#include <QUrl>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module emularr.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define EMULARR_MODULE_EXPORT
#else
#define EMULARR_MODULE_EXPORT export
#endif

EMULARR_MODULE_EXPORT namespace emularr::utils {

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs to local paths and ensures a consistent representation
 * suitable for filesystem operations.
 *
 * @param path Local path or file:// URL.
 * @return Normalized local filesystem path.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Decodes a URL query string value.
 *
 * Handles standard percent-decoding and converts '+' characters into spaces,
 * as commonly used in application/x-www-form-urlencoded data.
 *
 * @param value Encoded query value.
 * @return Decoded string.
 */
QString decodeQueryValue(const QString& value);

/**
 * @brief Extracts a filename from a Content-Disposition header value.
 * @param value Raw Content-Disposition header value.
 * @return Extracted filename, or an empty string if none could be determined.
 */
QString filenameFromDisposition(const QString& value);

/**
 * @brief Infers a filename from a URL.
 *
 * Looks at disposition-style query parameters first (common on ROM mirrors
 * that redirect through signed storage URLs), then at the last path segment.
 *
 * @param url Source URL.
 * @return Inferred filename, already sanitized; empty when none is usable.
 */
QString fileNameFromUrl(const QUrl& url);

/**
 * @brief Replaces characters that are invalid in file names.
 *
 * Path separators, reserved characters and control characters become '_',
 * leading/trailing dots and spaces are trimmed and the result is capped
 * to 120 characters.
 *
 * @param name Raw name (e.g. a game title).
 * @return A name safe to use as a single path component, possibly empty.
 */
QString sanitizeFileName(const QString& name);

/**
 * @brief Generates a unique file path if the given path already exists.
 *
 * Appends a numeric suffix to avoid overwriting existing files.
 *
 * @param path Desired file path.
 * @return A unique, non-existing file path.
 */
QString uniqueFilePath(const QString& path);

//!< @brief Size of a regular file on disk, 0 when missing.
qint64 fileSizeOnDisk(const QString& path);

} // namespace emularr::utils
