#include <QByteArray>
#include <QString>
#include <QTemporaryFile>

#include <gtest/gtest.h>

import kavosh.core.tokenizer;

namespace {

const QByteArray kVocabulary = R"json({
    "model": {
        "type": "Unigram",
        "vocab": {
            "<unk>": 0, "<s>": 1, "</s>": 2,
            "\u2581hello": 3, "\u2581world": 4,
            "h": 5, "e": 6, "l": 7, "o": 8, "\u2581": 9,
            "w": 10, "r": 11, "d": 12,
            "<0xC3>": 13, "<0xA9>": 14,
            "!": 15, "Hi": 16, "\n": 17
        }
    },
    "added_tokens": [
        { "id": 32001, "content": "<|assistant|>", "special": true },
        { "id": 32007, "content": "<|end|>", "special": true },
        { "id": 32010, "content": "<|user|>", "special": true }
    ]
})json";

const QString kEAcute = QString(QChar(0x00E9));

class TokenizerTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        QString error;
        ASSERT_TRUE(tokenizer.load(kVocabulary, &error)) << error.toStdString();
    }

    Tokenizer tokenizer;
};

EncodeOptions plain()
{
    EncodeOptions options;
    options.addSpecialTokens = false;
    return options;
}

} // namespace

TEST_F(TokenizerTest, EncodeStartsWithSequenceStartOnlyWhenAsked)
{
    const QList<int> withStart = tokenizer.encode(QStringLiteral("hello"));
    ASSERT_FALSE(withStart.isEmpty());
    EXPECT_EQ(withStart.first(), tokenizer.bosTokenId());

    const QList<int> withoutStart = tokenizer.encode(QStringLiteral("hello"), plain());
    ASSERT_FALSE(withoutStart.isEmpty());
    EXPECT_NE(withoutStart.first(), tokenizer.bosTokenId());
    EXPECT_EQ(withoutStart, (QList<int>{ 5, 6, 7, 7, 8 }));
}

TEST_F(TokenizerTest, FormatChatWrapsTurnsInRoleMarkers)
{
    const QString prompt = tokenizer.formatChat({ { ChatRole::User, QStringLiteral("Hi") } });

    const qsizetype user = prompt.indexOf(QStringLiteral("<|user|>"));
    const qsizetype content = prompt.indexOf(QStringLiteral("Hi"), user);
    const qsizetype end = prompt.indexOf(QStringLiteral("<|end|>"), content);
    ASSERT_GE(user, 0);
    EXPECT_GT(content, user);
    EXPECT_GT(end, content);
    EXPECT_TRUE(prompt.endsWith(QStringLiteral("<|assistant|>\n")));
    EXPECT_EQ(prompt, QStringLiteral("<|user|>\nHi<|end|>\n<|assistant|>\n"));
}

TEST_F(TokenizerTest, FormatChatKeepsMessageOrder)
{
    const QString prompt = tokenizer.formatChat({ { ChatRole::System, QStringLiteral("Be brief.") },
                                                  { ChatRole::User, QStringLiteral("Hi") },
                                                  { ChatRole::Assistant, QStringLiteral("Hello!") } });
    EXPECT_EQ(prompt, QStringLiteral("<|system|>\nBe brief.<|end|>\n"
                                     "<|user|>\nHi<|end|>\n"
                                     "<|assistant|>\nHello!<|end|>\n"
                                     "<|assistant|>\n"));
}

TEST_F(TokenizerTest, WordsMatchLongestPieces)
{
    EXPECT_EQ(tokenizer.encode(QStringLiteral(" hello world"), plain()), (QList<int>{ 3, 4 }));
    EXPECT_EQ(tokenizer.encode(QStringLiteral(" hello   world"), plain()),
              tokenizer.encode(QStringLiteral(" hello world"), plain()));
}

TEST_F(TokenizerTest, SpecialLiteralsEncodeToTheirIds)
{
    // whitespace runs, newlines included, collapse to one word boundary
    const QList<int> ids = tokenizer.encode(QStringLiteral("<|user|>\nHi<|end|>"), plain());
    EXPECT_EQ(ids, (QList<int>{ 32010, 9, 16, 32007 }));

    EncodeOptions literal = plain();
    literal.parseSpecialTokens = false;
    EXPECT_FALSE(tokenizer.encode(QStringLiteral("<|end|>"), literal).contains(32007));
}

TEST_F(TokenizerTest, EncodeChatEncodesFormattedPrompt)
{
    const QList<ChatMessage> messages = { { ChatRole::User, QStringLiteral("Hi") } };
    EXPECT_EQ(tokenizer.encodeChat(messages), tokenizer.encode(tokenizer.formatChat(messages)));
    EXPECT_TRUE(tokenizer.encodeChat(messages).contains(tokenizer.endOfTurnTokenId()));
}

TEST_F(TokenizerTest, SpecialTokenIdentity)
{
    EXPECT_TRUE(tokenizer.isSpecialToken(tokenizer.bosTokenId()));
    EXPECT_TRUE(tokenizer.isSpecialToken(tokenizer.eosTokenId()));
    EXPECT_TRUE(tokenizer.isSpecialToken(tokenizer.unknownTokenId()));
    EXPECT_TRUE(tokenizer.isSpecialToken(32007));
    EXPECT_FALSE(tokenizer.isSpecialToken(3));
    EXPECT_FALSE(tokenizer.isSpecialToken(-1));
    EXPECT_FALSE(tokenizer.isSpecialToken(999999));
}

TEST_F(TokenizerTest, DecodeRoundTripsText)
{
    const QString text = QStringLiteral("hello world");
    EXPECT_EQ(tokenizer.decode(tokenizer.encode(text)), text);
    EXPECT_EQ(tokenizer.decode(tokenizer.encode(QStringLiteral(" hello world!"))), QStringLiteral("hello world!"));
}

TEST_F(TokenizerTest, DecodeSkipsSpecialTokensByDefault)
{
    const QList<int> ids = { 1, 3, 4, 32007, 2 };
    EXPECT_EQ(tokenizer.decode(ids), QStringLiteral("hello world"));

    DecodeOptions keep;
    keep.skipSpecialTokens = false;
    const QString raw = tokenizer.decode(ids, keep);
    EXPECT_TRUE(raw.startsWith(QStringLiteral("<s>")));
    EXPECT_TRUE(raw.contains(QStringLiteral("<|end|>")));
}

TEST_F(TokenizerTest, UnknownIdsDecodeToReplacementCharacter)
{
    const QString text = tokenizer.decode({ 3, 5000 });
    EXPECT_TRUE(text.contains(QChar(0xFFFD)));
    EXPECT_FALSE(text.contains(QStringLiteral("<unk>")));
}

TEST_F(TokenizerTest, UnmatchedCharactersFallBackToBytes)
{
    const QList<int> ids = tokenizer.encode(kEAcute, plain());
    EXPECT_EQ(ids, (QList<int>{ 13, 14 }));
    EXPECT_EQ(tokenizer.decode(ids), kEAcute);

    // decomposed input is composed before matching
    const QString decomposed = QStringLiteral("e") + QChar(0x0301);
    EXPECT_EQ(tokenizer.encode(decomposed, plain()), ids);
}

TEST_F(TokenizerTest, UnmatchedCharactersWithoutBytePiecesBecomeUnknown)
{
    EXPECT_EQ(tokenizer.encode(QStringLiteral("z"), plain()), (QList<int>{ tokenizer.unknownTokenId() }));
}

TEST_F(TokenizerTest, TruncationKeepsPrefix)
{
    const QList<int> full = tokenizer.encode(QStringLiteral("hello"));
    EncodeOptions options;
    options.maxLength = 3;
    const QList<int> truncated = tokenizer.encode(QStringLiteral("hello"), options);
    ASSERT_EQ(truncated.size(), 3);
    EXPECT_EQ(truncated, full.mid(0, 3));

    options.truncation = false;
    EXPECT_EQ(tokenizer.encode(QStringLiteral("hello"), options), full);
}

TEST_F(TokenizerTest, EmptyInput)
{
    EXPECT_EQ(tokenizer.encode(QString()), (QList<int>{ tokenizer.bosTokenId() }));
    EXPECT_TRUE(tokenizer.encode(QString(), plain()).isEmpty());
    EXPECT_TRUE(tokenizer.decode({}).isEmpty());
}

TEST_F(TokenizerTest, LookupsAndVocabSize)
{
    EXPECT_EQ(tokenizer.tokenToId(QStringLiteral("<|user|>")), 32010);
    EXPECT_EQ(tokenizer.tokenToId(QStringLiteral("\u2581world")), 4);
    EXPECT_FALSE(tokenizer.tokenToId(QStringLiteral("missing")).has_value());
    EXPECT_EQ(tokenizer.idToToken(16), QStringLiteral("Hi"));
    EXPECT_EQ(tokenizer.idToToken(32001), QStringLiteral("<|assistant|>"));
    EXPECT_FALSE(tokenizer.idToToken(5000).has_value());
    EXPECT_EQ(tokenizer.specialTokens().value(QStringLiteral("<|end|>")), 32007);

    // 15 regular pieces plus the 8 special tokens
    EXPECT_EQ(tokenizer.getVocabSize(), 23);
}

TEST(TokenizerStateTest, UnloadedTokenizerRejectsEncodeAndDecode)
{
    Tokenizer tokenizer;
    EXPECT_FALSE(tokenizer.isLoaded());
    EXPECT_EQ(tokenizer.getVocabSize(), 0);
    EXPECT_THROW(tokenizer.encode(QStringLiteral("hello")), StateError);
    EXPECT_THROW(tokenizer.decode({ 1, 2 }), StateError);

    // the special map is available before loading
    EXPECT_TRUE(tokenizer.isSpecialToken(1));
    EXPECT_TRUE(tokenizer.formatChat({ { ChatRole::User, QStringLiteral("Hi") } })
                    .endsWith(QStringLiteral("<|assistant|>\n")));
}

TEST(TokenizerStateTest, FailedLoadKeepsPreviousVocabulary)
{
    Tokenizer tokenizer;
    QString error;
    EXPECT_FALSE(tokenizer.load(QByteArray("{ not json"), &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(tokenizer.isLoaded());

    ASSERT_TRUE(tokenizer.load(kVocabulary));
    error.clear();
    EXPECT_FALSE(tokenizer.load(QByteArray(R"({"model": {"type": "BPE"}})"), &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_TRUE(tokenizer.isLoaded());
    EXPECT_EQ(tokenizer.encode(QStringLiteral(" hello"), plain()), (QList<int>{ 3 }));
}

TEST(TokenizerStateTest, ArrayVocabularyUsesPositionsAsIds)
{
    Tokenizer tokenizer;
    ASSERT_TRUE(tokenizer.load(QByteArray(R"json({
        "vocab": [["<unk>", 0.0], ["<s>", 0.0], ["</s>", 0.0], ["a", -1.0], ["b", -2.0], ["ab", -0.5]]
    })json")));

    EXPECT_EQ(tokenizer.encode(QStringLiteral("abb"), plain()), (QList<int>{ 5, 4 }));
    EXPECT_EQ(tokenizer.decode({ 5, 4 }), QStringLiteral("abb"));
}

TEST(TokenizerStateTest, SpecialAddedTokensOverrideDefaults)
{
    Tokenizer tokenizer;
    ASSERT_TRUE(tokenizer.load(QByteArray(R"json({
        "model": { "vocab": { "<unk>": 0, "<s>": 1, "</s>": 2, "a": 3, "<|end|>": 50, "b": 32007 } },
        "added_tokens": [ { "id": 100, "content": "<|end|>", "special": true } ]
    })json")));

    EXPECT_EQ(tokenizer.endOfTurnTokenId(), 100);
    EXPECT_TRUE(tokenizer.isSpecialToken(100));
    EXPECT_EQ(tokenizer.tokenToId(QStringLiteral("<|end|>")), 100);
    EXPECT_EQ(tokenizer.encode(QStringLiteral("a<|end|>"), plain()), (QList<int>{ 3, 100 }));
    EXPECT_EQ(tokenizer.idToToken(100), QStringLiteral("<|end|>"));
}

TEST(TokenizerStateTest, VocabularyEntriesCollidingWithSpecialIdsAreDropped)
{
    Tokenizer tokenizer;
    ASSERT_TRUE(tokenizer.load(QByteArray(R"json({
        "model": { "vocab": { "<unk>": 0, "<s>": 1, "</s>": 2, "a": 3, "b": 32007 } }
    })json")));

    EXPECT_FALSE(tokenizer.tokenToId(QStringLiteral("b")).has_value());
    EXPECT_EQ(tokenizer.idToToken(32007), QStringLiteral("<|end|>"));
    EXPECT_EQ(tokenizer.encode(QStringLiteral("b"), plain()), (QList<int>{ tokenizer.unknownTokenId() }));
}

TEST(TokenizerStateTest, LoadFromFile)
{
    QTemporaryFile file;
    ASSERT_TRUE(file.open());
    file.write(kVocabulary);
    file.close();

    Tokenizer tokenizer;
    EXPECT_TRUE(tokenizer.loadFromFile(file.fileName()));
    EXPECT_TRUE(tokenizer.isLoaded());

    QString error;
    Tokenizer missing;
    EXPECT_FALSE(missing.loadFromFile(QStringLiteral("/nonexistent/tokenizer.json"), &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST(TokenizerStateTest, ChatRoleNames)
{
    EXPECT_EQ(chatRoleFromString(QStringLiteral("User")), ChatRole::User);
    EXPECT_EQ(chatRoleFromString(QStringLiteral(" assistant ")), ChatRole::Assistant);
    EXPECT_EQ(chatRoleFromString(QStringLiteral("system")), ChatRole::System);
    EXPECT_FALSE(chatRoleFromString(QStringLiteral("tool")).has_value());
}
