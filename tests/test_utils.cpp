#include <QByteArray>
#include <QList>
#include <QRandomGenerator>
#include <QSet>
#include <QUrl>

#include <gtest/gtest.h>

#include <numeric>

import kavosh.utils.download_utils;
import kavosh.utils.text_utils;
import kavosh.utils.sampling_utils;

namespace utils = kavosh::utils;

TEST(DownloadUtilsTest, FileNameFromUrl)
{
    EXPECT_EQ(utils::fileNameFromUrl(QUrl(QStringLiteral("https://cdn.example.com/a/model.onnx?sig=1"))),
              QStringLiteral("model.onnx"));
    EXPECT_EQ(utils::fileNameFromUrl(QUrl(QStringLiteral(
                  "https://cdn.example.com/blob?response-content-disposition=attachment%3B%20filename%3D%22tok.json%22"))),
              QStringLiteral("tok.json"));
    EXPECT_EQ(utils::fileNameFromUrl(QUrl(QStringLiteral("https://cdn.example.com/get?filename=my+model.onnx"))),
              QStringLiteral("my model.onnx"));
    EXPECT_TRUE(utils::fileNameFromUrl(QUrl()).isEmpty());
}

TEST(DownloadUtilsTest, UrlAndStatusClassification)
{
    EXPECT_TRUE(utils::isRemoteUrl(QUrl(QStringLiteral("HTTPS://example.com/x"))));
    EXPECT_TRUE(utils::isRemoteUrl(QUrl(QStringLiteral("http://example.com/x"))));
    EXPECT_FALSE(utils::isRemoteUrl(QUrl::fromLocalFile(QStringLiteral("/tmp/x"))));
    EXPECT_TRUE(utils::isHttpSuccess(200));
    EXPECT_TRUE(utils::isHttpSuccess(206));
    EXPECT_FALSE(utils::isHttpSuccess(304));
    EXPECT_FALSE(utils::isHttpSuccess(500));
    EXPECT_EQ(utils::normalizeFilePath(QStringLiteral("file:///tmp/model.onnx")), QStringLiteral("/tmp/model.onnx"));
}

TEST(DownloadUtilsTest, PercentageIsBoundedAndUnknownWithoutTotal)
{
    EXPECT_DOUBLE_EQ(utils::percentageOf(50, 200), 25.0);
    EXPECT_DOUBLE_EQ(utils::percentageOf(300, 200), 100.0);
    EXPECT_LT(utils::percentageOf(10, 0), 0.0);
    EXPECT_LT(utils::percentageOf(10, -1), 0.0);
}

TEST(DownloadUtilsTest, ChecksumHelpers)
{
    EXPECT_EQ(utils::normalizeChecksum(QStringLiteral("  AB CD \n")), QStringLiteral("abcd"));
    EXPECT_EQ(utils::sha256Hex(QByteArray()),
              QStringLiteral("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
    EXPECT_EQ(utils::formatBytes(512), QStringLiteral("512 B"));
    EXPECT_EQ(utils::formatBytes(1536), QStringLiteral("1.5 KB"));
    EXPECT_EQ(utils::formatBytes(-1), QStringLiteral("?"));
}

TEST(TextUtilsTest, WhitespaceAndWordBoundaries)
{
    EXPECT_EQ(utils::collapseWhitespace(QStringLiteral(" a \t\n b  ")), QStringLiteral(" a b "));
    const QString marked = utils::toWordBoundaryMarkers(QStringLiteral(" a b"));
    EXPECT_EQ(marked.count(QChar(utils::kWordBoundaryMarker)), 2);
    EXPECT_EQ(utils::fromWordBoundaryMarkers(marked), QStringLiteral(" a b"));
}

TEST(TextUtilsTest, CodePointLengthRespectsSurrogatePairs)
{
    const QString text = QStringLiteral("a") + QString::fromUcs4(U"\U0001F600");
    EXPECT_EQ(utils::codePointLength(text, 0), 1);
    EXPECT_EQ(utils::codePointLength(text, 1), 2);
    // a lone high surrogate at the end counts as one unit
    EXPECT_EQ(utils::codePointLength(text.left(2), 1), 1);
}

TEST(TextUtilsTest, BytePieces)
{
    EXPECT_EQ(utils::formatBytePiece(0x0A), QStringLiteral("<0x0A>"));
    EXPECT_EQ(utils::formatBytePiece(0xE9), QStringLiteral("<0xE9>"));
    EXPECT_EQ(utils::parseBytePiece(QStringLiteral("<0xe9>")), quint8(0xE9));
    EXPECT_FALSE(utils::parseBytePiece(QStringLiteral("<0xZZ>")).has_value());
    EXPECT_FALSE(utils::parseBytePiece(QStringLiteral("<0x100>")).has_value());
    EXPECT_FALSE(utils::parseBytePiece(QStringLiteral("hello")).has_value());
}

TEST(SamplingUtilsTest, ArgmaxPicksFirstMaximum)
{
    EXPECT_EQ(utils::argmax({}), -1);
    EXPECT_EQ(utils::argmax({ 0.1f, 3.0f, 3.0f, -1.0f }), 1);
}

TEST(SamplingUtilsTest, RepetitionPenaltyLowersSeenTokensOnce)
{
    QList<float> logits = { 2.0f, -2.0f, 1.0f };
    utils::applyRepetitionPenalty(logits, { 0, 1, 0, 7, -3 }, 2.0);
    EXPECT_FLOAT_EQ(logits.at(0), 1.0f);
    EXPECT_FLOAT_EQ(logits.at(1), -4.0f);
    EXPECT_FLOAT_EQ(logits.at(2), 1.0f);

    QList<float> unchanged = { 2.0f, -2.0f };
    utils::applyRepetitionPenalty(unchanged, { 0, 1 }, 1.0);
    EXPECT_EQ(unchanged, (QList<float>{ 2.0f, -2.0f }));
}

TEST(SamplingUtilsTest, SoftmaxIsANormalizedDistribution)
{
    const QList<float> logits = { 1.0f, 2.0f, 3.0f };
    const QList<double> warm = utils::softmax(logits, 1.0);
    const QList<double> cold = utils::softmax(logits, 0.1);
    EXPECT_NEAR(std::accumulate(warm.cbegin(), warm.cend(), 0.0), 1.0, 1e-9);
    EXPECT_NEAR(std::accumulate(cold.cbegin(), cold.cend(), 0.0), 1.0, 1e-9);
    EXPECT_GT(cold.at(2), warm.at(2));
    EXPECT_LT(warm.at(0), warm.at(1));
}

TEST(SamplingUtilsTest, SamplingRespectsGreedyTopKAndTopP)
{
    QRandomGenerator rng(42);
    const QList<float> logits = { 0.5f, 4.0f, 0.2f, 3.9f };

    EXPECT_EQ(utils::sampleToken(logits, 0.0, 50, 0.9, rng), 1);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(utils::sampleToken(logits, 1.0, 1, 1.0, rng), 1);
        EXPECT_EQ(utils::sampleToken(logits, 1.0, 0, 0.01, rng), 1);
    }

    QSet<int> drawn;
    for (int i = 0; i < 200; ++i) {
        const int id = utils::sampleToken(logits, 1.0, 2, 1.0, rng);
        EXPECT_TRUE(id == 1 || id == 3);
        drawn.insert(id);
    }
    EXPECT_EQ(drawn.size(), 2);
    EXPECT_EQ(utils::sampleToken({}, 1.0, 0, 1.0, rng), -1);
}
