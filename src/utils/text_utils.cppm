/*!
 * @file        text_utils.cppm
 * @brief       Text normalization and sub-word piece helpers.
 * @details     Small helpers shared by the tokenizer and the assistant:
 *              whitespace collapsing, word-boundary marker conversion, UTF-16
 *              code point stepping, and byte-fallback piece handling
 *              (pieces of the form <0xNN>).
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QString>
#include <QtGlobal>

#include <optional>

#ifndef Q_MOC_RUN
export module kavosh.utils.text_utils;
#endif

#ifdef Q_MOC_RUN
#define KAVOSH_MODULE_EXPORT
#else
#define KAVOSH_MODULE_EXPORT export
#endif

KAVOSH_MODULE_EXPORT namespace kavosh::utils {

//!< @brief Word-boundary marker standing in for a preceding space (U+2581).
inline constexpr char16_t kWordBoundaryMarker = u'\u2581';

//!< @brief Placeholder rendered for ids that map to no piece (U+FFFD).
inline constexpr char16_t kReplacementCharacter = u'\uFFFD';

/**
 * @brief Replaces every run of whitespace with a single space.
 *
 * Unlike QString::simplified() the ends are not trimmed, so a leading space
 * still produces a leading word-boundary marker.
 *
 * @param text Input text.
 * @return Collapsed text.
 */
QString collapseWhitespace(const QString& text);

//!< @brief Replaces spaces with the word-boundary marker.
QString toWordBoundaryMarkers(const QString& text);

//!< @brief Replaces word-boundary markers with spaces.
QString fromWordBoundaryMarkers(const QString& text);

/**
 * @brief Returns the number of UTF-16 units of the code point at a position.
 * @param text Text.
 * @param pos Position of the first unit.
 * @return 2 for a valid surrogate pair, otherwise 1.
 */
qsizetype codePointLength(const QString& text, qsizetype pos);

/**
 * @brief Formats a byte-fallback piece.
 * @param byte Byte value.
 * @return Piece such as "<0x0A>".
 */
QString formatBytePiece(quint8 byte);

/**
 * @brief Parses a byte-fallback piece.
 * @param piece Candidate piece.
 * @return The byte value, or std::nullopt if piece is not of the form <0xNN>.
 */
std::optional<quint8> parseBytePiece(const QString& piece);

} // namespace kavosh::utils
