/*!
 * @file        download_utils.cppm
 * @brief       Common utility helpers for download URL, progress, and checksum handling.
 * @details     Provides a collection of small, reusable helper functions shared
 *              across download core components. These utilities handle common
 *              tasks such as path normalization, download naming, checksum
 *              processing, and progress arithmetic.
 *
 *              All helpers are designed to be side-effect free and safe for use
 *              from the download core, the session manager, and tests alike.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QUrl>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module kavosh.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define KAVOSH_MODULE_EXPORT
#else
#define KAVOSH_MODULE_EXPORT export
#endif

KAVOSH_MODULE_EXPORT namespace kavosh::utils {

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
 *
 * @param value Raw Content-Disposition header value.
 * @return Extracted filename, or an empty string if none could be determined.
 */
QString filenameFromDisposition(const QString& value);

/**
 * @brief Infers a filename from a URL.
 *
 * Used to name a download when the caller does not supply one.
 *
 * @param url Source URL.
 * @return Inferred filename string.
 */
QString fileNameFromUrl(const QUrl& url);

/**
 * @brief Checks whether a URL must be fetched over the network.
 * @param url URL to inspect.
 * @return true for http and https URLs.
 */
bool isRemoteUrl(const QUrl& url);

/**
 * @brief Checks whether an HTTP status code denotes success (2xx).
 * @param status HTTP status code.
 */
bool isHttpSuccess(int status);

/**
 * @brief Normalizes a checksum string.
 *
 * Converts the checksum to lowercase and removes whitespace to ensure
 * consistent comparison.
 *
 * @param value Raw checksum string.
 * @return Normalized checksum string.
 */
QString normalizeChecksum(const QString& value);

/**
 * @brief Computes the lowercase hexadecimal SHA-256 digest of a payload.
 * @param payload Bytes to hash.
 * @return 64-character lowercase hex string.
 */
QString sha256Hex(const QByteArray& payload);

/**
 * @brief Computes a completion percentage.
 * @param loaded Bytes received.
 * @param total Bytes expected; must be positive.
 * @return Percentage in [0, 100], or -1 when total is unknown.
 */
qreal percentageOf(qint64 loaded, qint64 total);

/**
 * @brief Formats a byte count for log output (e.g. "1.5 MB").
 * @param bytes Byte count.
 */
QString formatBytes(qint64 bytes);

} // namespace kavosh::utils
