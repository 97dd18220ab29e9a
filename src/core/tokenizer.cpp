module;
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QStringView>

#include <algorithm>
#include <optional>

module kavosh.core.tokenizer;

import kavosh.utils.download_utils;
import kavosh.utils.text_utils;

namespace utils = kavosh::utils;

namespace {

const QString kSystemMarker = QStringLiteral("<|system|>");
const QString kUserMarker = QStringLiteral("<|user|>");
const QString kAssistantMarker = QStringLiteral("<|assistant|>");
const QString kEndMarker = QStringLiteral("<|end|>");

QHash<QString, int> defaultSpecialTokens()
{
    return {
        { QStringLiteral("<unk>"), 0 },
        { QStringLiteral("<s>"), 1 },
        { QStringLiteral("</s>"), 2 },
        { QStringLiteral("<|endoftext|>"), 32000 },
        { kAssistantMarker, 32001 },
        { kSystemMarker, 32006 },
        { kEndMarker, 32007 },
        { kUserMarker, 32010 },
    };
}

const QString& roleMarker(ChatRole role)
{
    switch (role) {
    case ChatRole::System: return kSystemMarker;
    case ChatRole::Assistant: return kAssistantMarker;
    case ChatRole::User: break;
    }
    return kUserMarker;
}

void setError(QString* error, const QString& message)
{
    qWarning() << "Tokenizer:" << message;
    if (error) *error = message;
}

} // namespace

std::optional<ChatRole> chatRoleFromString(const QString& name)
{
    const QString role = name.trimmed().toLower();
    if (role == QLatin1String("system")) return ChatRole::System;
    if (role == QLatin1String("user")) return ChatRole::User;
    if (role == QLatin1String("assistant")) return ChatRole::Assistant;
    return std::nullopt;
}

Tokenizer::Tokenizer()
    : m_special(defaultSpecialTokens())
{
    rebuildSpecialIndex();
}

void Tokenizer::rebuildSpecialIndex()
{
    m_specialIds.clear();
    m_specialByLength.clear();
    for (auto it = m_special.cbegin(); it != m_special.cend(); ++it) {
        m_specialIds.insert(it.value());
        m_specialByLength.append(it.key());
    }
    std::sort(m_specialByLength.begin(), m_specialByLength.end(),
              [](const QString& a, const QString& b) {
                  return a.size() != b.size() ? a.size() > b.size() : a < b;
              });
}

bool Tokenizer::load(const QByteArray& json, QString* error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        setError(error, QStringLiteral("Invalid tokenizer JSON: %1").arg(parseError.errorString()));
        return false;
    }

    const QJsonObject root = doc.object();
    QJsonValue vocabValue = root.value(QStringLiteral("model")).toObject().value(QStringLiteral("vocab"));
    if (!vocabValue.isObject() && !vocabValue.isArray()) {
        vocabValue = root.value(QStringLiteral("vocab"));
    }
    if (!vocabValue.isObject() && !vocabValue.isArray()) {
        setError(error, QStringLiteral("Tokenizer vocab not found in expected location"));
        return false;
    }

    QHash<QString, int> special = defaultSpecialTokens();
    QList<QPair<QString, int>> addedPieces;
    int overrides = 0;
    const QJsonArray added = root.value(QStringLiteral("added_tokens")).toArray();
    for (const QJsonValue& value : added) {
        const QJsonObject token = value.toObject();
        const QString content = token.value(QStringLiteral("content")).toString();
        const int id = token.value(QStringLiteral("id")).toInt(-1);
        if (content.isEmpty() || id < 0) continue;
        if (token.value(QStringLiteral("special")).toBool()) {
            if (special.value(content, -1) != id) ++overrides;
            special.insert(content, id);
        } else {
            addedPieces.append({ content, id });
        }
    }

    QSet<int> specialIds;
    for (int id : std::as_const(special)) specialIds.insert(id);

    QHash<QString, int> vocab;
    QHash<int, QString> pieces;
    int dropped = 0;
    auto addPiece = [&](const QString& piece, int id) {
        if (piece.isEmpty() || id < 0) return;
        if (specialIds.contains(id) || special.contains(piece)) {
            // the special map owns this id or literal
            if (special.value(piece, -1) != id) ++dropped;
            return;
        }
        vocab.insert(piece, id);
        pieces.insert(id, piece);
    };

    if (vocabValue.isObject()) {
        const QJsonObject table = vocabValue.toObject();
        for (auto it = table.constBegin(); it != table.constEnd(); ++it) {
            addPiece(it.key(), it.value().toInt(-1));
        }
    } else {
        const QJsonArray table = vocabValue.toArray();
        for (qsizetype i = 0; i < table.size(); ++i) {
            const QJsonValue item = table.at(i);
            const QString piece = item.isArray() ? item.toArray().at(0).toString() : item.toString();
            addPiece(piece, static_cast<int>(i));
        }
    }
    for (const auto& [piece, id] : std::as_const(addedPieces)) {
        addPiece(piece, id);
    }

    if (vocab.isEmpty()) {
        setError(error, QStringLiteral("Tokenizer vocab is empty"));
        return false;
    }
    if (dropped > 0) {
        qWarning() << "Tokenizer: dropped" << dropped << "vocab entries colliding with special tokens";
    }

    qsizetype maxLength = 0;
    bool byteFallback = false;
    for (auto it = vocab.cbegin(); it != vocab.cend(); ++it) {
        maxLength = qMax(maxLength, it.key().size());
        if (!byteFallback && utils::parseBytePiece(it.key())) byteFallback = true;
    }
    for (auto it = special.cbegin(); it != special.cend(); ++it) {
        pieces.insert(it.value(), it.key());
    }

    m_vocab = std::move(vocab);
    m_pieces = std::move(pieces);
    m_special = std::move(special);
    m_maxPieceLength = maxLength;
    m_byteFallback = byteFallback;
    rebuildSpecialIndex();
    m_loaded = true;

    qInfo() << "Tokenizer: loaded" << m_pieces.size() << "tokens," << m_special.size() << "special,"
            << overrides << "special overrides, byte fallback" << m_byteFallback;
    return true;
}

bool Tokenizer::loadFromFile(const QString& path, QString* error)
{
    QFile file(utils::normalizeFilePath(path));
    if (!file.open(QIODevice::ReadOnly)) {
        setError(error, QStringLiteral("Failed to open tokenizer %1: %2").arg(path, file.errorString()));
        return false;
    }
    return load(file.readAll(), error);
}

void Tokenizer::requireLoaded(const char* operation) const
{
    if (!m_loaded) {
        throw StateError(QStringLiteral("Tokenizer"),
                         QStringLiteral("Tokenizer not loaded; call load() before %1()")
                             .arg(QLatin1String(operation)));
    }
}

QList<int> Tokenizer::encode(const QString& text, const EncodeOptions& options) const
{
    requireLoaded("encode");

    const QString normalized = utils::collapseWhitespace(text.normalized(QString::NormalizationForm_C));

    QList<int> ids;
    if (options.addSpecialTokens) {
        ids.append(bosTokenId());
    }

    if (options.parseSpecialTokens) {
        const QStringView view(normalized);
        qsizetype start = 0;
        qsizetype pos = 0;
        while (pos < normalized.size()) {
            bool found = false;
            for (const QString& literal : m_specialByLength) {
                if (view.mid(pos).startsWith(literal)) {
                    encodeSegment(normalized.mid(start, pos - start), ids);
                    ids.append(m_special.value(literal));
                    pos += literal.size();
                    start = pos;
                    found = true;
                    break;
                }
            }
            if (!found) ++pos;
        }
        encodeSegment(normalized.mid(start), ids);
    } else {
        encodeSegment(normalized, ids);
    }

    if (options.truncation && options.maxLength > 0 && ids.size() > options.maxLength) {
        ids.resize(options.maxLength);
    }
    return ids;
}

void Tokenizer::encodeSegment(const QString& segment, QList<int>& out) const
{
    if (segment.isEmpty()) return;

    const QString text = utils::toWordBoundaryMarkers(segment);
    qsizetype pos = 0;
    while (pos < text.size()) {
        const qsizetype limit = qMin(m_maxPieceLength, text.size() - pos);
        bool matched = false;
        for (qsizetype len = limit; len > 0; --len) {
            const qsizetype end = pos + len;
            if (end < text.size() && text.at(end - 1).isHighSurrogate() && text.at(end).isLowSurrogate())
                continue;
            const auto it = m_vocab.constFind(text.mid(pos, len));
            if (it != m_vocab.cend()) {
                out.append(it.value());
                pos = end;
                matched = true;
                break;
            }
        }
        if (!matched) {
            const qsizetype n = utils::codePointLength(text, pos);
            encodeUnmatched(text.mid(pos, n), out);
            pos += n;
        }
    }
}

void Tokenizer::encodeUnmatched(const QString& unit, QList<int>& out) const
{
    if (m_byteFallback) {
        const QByteArray bytes = unit.toUtf8();
        QList<int> byteIds;
        for (char c : bytes) {
            const auto it = m_vocab.constFind(utils::formatBytePiece(static_cast<quint8>(c)));
            if (it == m_vocab.cend()) break;
            byteIds.append(it.value());
        }
        if (byteIds.size() == bytes.size()) {
            out.append(byteIds);
            return;
        }
    }
    out.append(unknownTokenId());
}

QString Tokenizer::decode(const QList<int>& ids, const DecodeOptions& options) const
{
    requireLoaded("decode");

    QString text;
    QByteArray pendingBytes;
    auto flush = [&]() {
        if (pendingBytes.isEmpty()) return;
        text += QString::fromUtf8(pendingBytes);
        pendingBytes.clear();
    };

    for (int id : ids) {
        if (m_specialIds.contains(id)) {
            if (options.skipSpecialTokens) continue;
            flush();
            text += m_pieces.value(id);
            continue;
        }
        const auto it = m_pieces.constFind(id);
        if (it == m_pieces.cend()) {
            flush();
            text += QChar(utils::kReplacementCharacter);
            continue;
        }
        if (const auto byte = utils::parseBytePiece(it.value())) {
            pendingBytes.append(static_cast<char>(*byte));
            continue;
        }
        flush();
        text += it.value();
    }
    flush();

    text = utils::fromWordBoundaryMarkers(text);
    if (options.cleanUpTokenizationSpaces) {
        text = utils::collapseWhitespace(text).trimmed();
    }
    return text;
}

QString Tokenizer::formatChat(const QList<ChatMessage>& messages) const
{
    QString prompt;
    for (const ChatMessage& message : messages) {
        prompt += roleMarker(message.role);
        prompt += QLatin1Char('\n');
        prompt += message.content;
        prompt += kEndMarker;
        prompt += QLatin1Char('\n');
    }
    prompt += kAssistantMarker;
    prompt += QLatin1Char('\n');
    return prompt;
}

QList<int> Tokenizer::encodeChat(const QList<ChatMessage>& messages, const EncodeOptions& options) const
{
    return encode(formatChat(messages), options);
}

int Tokenizer::getVocabSize() const
{
    return m_loaded ? static_cast<int>(m_pieces.size()) : 0;
}

std::optional<int> Tokenizer::tokenToId(const QString& token) const
{
    const auto special = m_special.constFind(token);
    if (special != m_special.cend()) return special.value();
    const auto it = m_vocab.constFind(token);
    if (it != m_vocab.cend()) return it.value();
    return std::nullopt;
}

std::optional<QString> Tokenizer::idToToken(int id) const
{
    const auto it = m_pieces.constFind(id);
    if (it != m_pieces.cend()) return it.value();
    for (auto s = m_special.cbegin(); s != m_special.cend(); ++s) {
        if (s.value() == id) return s.key();
    }
    return std::nullopt;
}
