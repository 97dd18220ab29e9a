/*!
 * @file        tokenizer.cppm
 * @brief       Sub-word tokenizer for causal language models.
 * @details     Maps prompt text to the integer token ids a model graph expects
 *              and back, using a vocabulary table loaded from a HuggingFace
 *              tokenizer.json artifact.
 *
 *              Segmentation is greedy leftmost-longest matching against the
 *              vocabulary, with a word-boundary marker (U+2581) standing in for
 *              spaces, byte-fallback pieces for unmatched code points when the
 *              vocabulary provides them, and direct recognition of special
 *              token literals such as those produced by formatChat().
 *
 *              The vocabulary and special-token map are populated once by
 *              load() and are immutable afterwards, so a loaded Tokenizer may
 *              be shared read-only between threads.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QHash>
#include <QList>
#include <QSet>
#include <QString>

#include <optional>

#ifndef Q_MOC_RUN
export module kavosh.core.tokenizer;
export import kavosh.core.errors;
#endif

#ifdef Q_MOC_RUN
#define KAVOSH_MODULE_EXPORT
#else
#define KAVOSH_MODULE_EXPORT export
#endif

//!< @brief Speaker of one conversation turn.
KAVOSH_MODULE_EXPORT enum class ChatRole {
    System,
    User,
    Assistant
};

/**
 * @brief Parses a role name ("system", "user", "assistant"), ignoring case.
 * @return The role, or std::nullopt for any other name.
 */
KAVOSH_MODULE_EXPORT std::optional<ChatRole> chatRoleFromString(const QString& name);

//!< @brief One conversation turn.
KAVOSH_MODULE_EXPORT struct ChatMessage {
    ChatRole role = ChatRole::User;
    QString content;
};

//!< @brief Options of Tokenizer::encode().
KAVOSH_MODULE_EXPORT struct EncodeOptions {
    bool addSpecialTokens = true;   //!< Prepend the sequence-start id.
    bool parseSpecialTokens = true; //!< Map special-token literals in the text to their ids.
    int maxLength = 0;              //!< Maximum sequence length, 0 for none.
    bool truncation = true;         //!< Truncate to maxLength.
};

//!< @brief Options of Tokenizer::decode().
KAVOSH_MODULE_EXPORT struct DecodeOptions {
    bool skipSpecialTokens = true;          //!< Drop special token ids from the output.
    bool cleanUpTokenizationSpaces = true;  //!< Collapse whitespace runs and trim.
};

/**
 * @brief Greedy longest-match sub-word tokenizer.
 *
 * A Tokenizer starts unloaded. encode() and decode() throw StateError until a
 * vocabulary has been loaded; formatChat() and isSpecialToken() only depend
 * on the special-token map, which has Phi-3 defaults from construction.
 */
KAVOSH_MODULE_EXPORT class Tokenizer {
public:
    Tokenizer();

    /**
     * @brief Load a vocabulary from tokenizer.json content.
     *
     * Accepts the vocabulary as an object {piece: id} or an array of
     * [piece, score] pairs (index = id), under "model.vocab" or a top-level
     * "vocab". Entries of "added_tokens" flagged "special" override the
     * special-token map. On failure the previous state is kept.
     *
     * @param json File content.
     * @param error Receives a description of the failure, may be null.
     * @return true on success.
     */
    bool load(const QByteArray& json, QString* error = nullptr);

    /**
     * @brief Load a vocabulary from a tokenizer.json file.
     * @param path Local path or file:// URL.
     * @param error Receives a description of the failure, may be null.
     * @return true on success.
     */
    bool loadFromFile(const QString& path, QString* error = nullptr);

    //!< @brief Whether a vocabulary is loaded.
    bool isLoaded() const { return m_loaded; }

    /**
     * @brief Convert text into token ids.
     * @param text Prompt text.
     * @param options Encoding options.
     * @return Token ids.
     * @throws StateError if no vocabulary is loaded.
     */
    QList<int> encode(const QString& text, const EncodeOptions& options = {}) const;

    /**
     * @brief Convert token ids back into text.
     *
     * Ids that map to neither a piece nor a special token decode to U+FFFD.
     *
     * @param ids Token ids.
     * @param options Decoding options.
     * @return Text.
     * @throws StateError if no vocabulary is loaded.
     */
    QString decode(const QList<int>& ids, const DecodeOptions& options = {}) const;

    /**
     * @brief Render a conversation in the flat prompt format.
     *
     * Each turn becomes "<|role|>\n{content}<|end|>\n"; the prompt always ends
     * with an open "<|assistant|>\n" turn. Works without a loaded vocabulary.
     */
    QString formatChat(const QList<ChatMessage>& messages) const;

    //!< @brief formatChat() followed by encode().
    QList<int> encodeChat(const QList<ChatMessage>& messages, const EncodeOptions& options = {}) const;

    //!< @brief Number of distinct ids known, 0 when unloaded.
    int getVocabSize() const;

    //!< @brief Whether id belongs to the special-token map.
    bool isSpecialToken(int id) const { return m_specialIds.contains(id); }

    //!< @brief Return the id of a piece or special literal, or std::nullopt.
    std::optional<int> tokenToId(const QString& token) const;

    //!< @brief Return the piece or special literal of an id, or std::nullopt.
    std::optional<QString> idToToken(int id) const;

    //!< @brief Return the special-token map.
    QHash<QString, int> specialTokens() const { return m_special; }

    int bosTokenId() const { return m_special.value(QStringLiteral("<s>"), 1); }
    int eosTokenId() const { return m_special.value(QStringLiteral("</s>"), 2); }
    int padTokenId() const { return m_special.value(QStringLiteral("<|endoftext|>"), 32000); }
    int unknownTokenId() const { return m_special.value(QStringLiteral("<unk>"), 0); }
    int endOfTurnTokenId() const { return m_special.value(QStringLiteral("<|end|>"), 32007); }

private:
    //!< @brief Rebuild the id set and the literal match order.
    void rebuildSpecialIndex();

    //!< @brief Greedy segmentation of text without special literals.
    void encodeSegment(const QString& segment, QList<int>& out) const;

    //!< @brief Emit byte-fallback pieces (or unknown) for one code point.
    void encodeUnmatched(const QString& unit, QList<int>& out) const;

    //!< @brief Throw StateError unless loaded.
    void requireLoaded(const char* operation) const;

    bool m_loaded = false;                  //!< Vocabulary loaded.
    QHash<QString, int> m_vocab;            //!< Matchable piece -> id.
    QHash<int, QString> m_pieces;           //!< id -> piece, specials included.
    qsizetype m_maxPieceLength = 0;         //!< Longest matchable piece, UTF-16 units.
    bool m_byteFallback = false;            //!< Vocabulary contains <0xNN> pieces.
    QHash<QString, int> m_special;          //!< Special literal -> id.
    QSet<int> m_specialIds;                 //!< Special ids.
    QList<QString> m_specialByLength;       //!< Special literals, longest first.
};
