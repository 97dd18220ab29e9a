#include <QByteArray>
#include <QUrl>

#include <gtest/gtest.h>

import kavosh.services.package_catalog;

namespace {

const QUrl kManifestUrl(QStringLiteral("https://cdn.example.com/packages/standard/manifest.json"));

const QByteArray kManifest = R"json({
    "package": "standard",
    "name": "phi-3-mini",
    "version": "1.2.0",
    "resources": [
        { "name": "model", "filename": "model.onnx", "url": "model.onnx", "type": "model",
          "size": 2000000, "sha256": "  ABCDEF0123  " },
        { "name": "tokenizer", "filename": "tokenizer.json",
          "url": "https://mirror.example.com/tokenizer.json", "type": "tokenizer", "size": 500000 },
        { "filename": "generation_config.json", "type": "config", "size": 100,
          "checksum": "00ff" }
    ]
})json";

} // namespace

TEST(PackageManifestTest, ParsesResourcesAndResolvesRelativeUrls)
{
    QString error;
    const auto manifest = PackageManifest::fromJson(kManifest, kManifestUrl, &error);
    ASSERT_TRUE(manifest.has_value()) << error.toStdString();

    EXPECT_EQ(manifest->tier(), PackageTier::Standard);
    EXPECT_EQ(manifest->name(), QStringLiteral("phi-3-mini"));
    EXPECT_EQ(manifest->version(), QStringLiteral("1.2.0"));
    ASSERT_EQ(manifest->resources().size(), 3);

    const PackageResource& model = manifest->resources().at(0);
    EXPECT_EQ(model.url, QUrl(QStringLiteral("https://cdn.example.com/packages/standard/model.onnx")));
    EXPECT_EQ(model.type, ResourceType::Model);
    EXPECT_EQ(model.sha256, QStringLiteral("abcdef0123"));

    const PackageResource& vocabulary = manifest->resources().at(1);
    EXPECT_EQ(vocabulary.url, QUrl(QStringLiteral("https://mirror.example.com/tokenizer.json")));

    const PackageResource& config = manifest->resources().at(2);
    EXPECT_EQ(config.name, QStringLiteral("generation_config.json"));
    EXPECT_EQ(config.type, ResourceType::Data);
    EXPECT_EQ(config.sha256, QStringLiteral("00ff"));

    EXPECT_EQ(manifest->totalSize(), 2500100);
    EXPECT_EQ(manifest->modelResource()->name, QStringLiteral("model"));
    EXPECT_EQ(manifest->tokenizerResource()->name, QStringLiteral("tokenizer"));
}

TEST(PackageManifestTest, ProjectsToDownloadRequestsInOrder)
{
    const auto manifest = PackageManifest::fromJson(kManifest, kManifestUrl);
    ASSERT_TRUE(manifest.has_value());

    const QList<DownloadRequest> requests = manifest->toDownloadRequests();
    ASSERT_EQ(requests.size(), 3);
    EXPECT_EQ(requests.at(0).name, QStringLiteral("model"));
    EXPECT_EQ(requests.at(0).expectedSize, 2000000);
    EXPECT_EQ(requests.at(0).expectedChecksum, QStringLiteral("abcdef0123"));
    EXPECT_EQ(requests.at(1).name, QStringLiteral("tokenizer"));
    EXPECT_TRUE(requests.at(1).expectedChecksum.isEmpty());
    EXPECT_EQ(requests.at(2).name, QStringLiteral("generation_config.json"));
}

TEST(PackageManifestTest, AcceptsWrappedManifestAndLegacyTierKey)
{
    const auto manifest = PackageManifest::fromJson(QByteArray(R"json({
        "manifest": {
            "packageType": "Minimal",
            "resources": [ { "name": "model", "url": "https://cdn.example.com/m.onnx", "type": "onnx" } ]
        }
    })json"));
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->tier(), PackageTier::Minimal);
    EXPECT_TRUE(manifest->modelResource().has_value());
    EXPECT_FALSE(manifest->tokenizerResource().has_value());
}

TEST(PackageManifestTest, RejectsBrokenManifests)
{
    QString error;
    EXPECT_FALSE(PackageManifest::fromJson(QByteArray("[1, 2"), kManifestUrl, &error).has_value());
    EXPECT_FALSE(error.isEmpty());

    error.clear();
    EXPECT_FALSE(PackageManifest::fromJson(QByteArray(R"({"package": "huge", "resources": [{"url": "a.bin"}]})"),
                                           kManifestUrl, &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("huge")));

    EXPECT_FALSE(PackageManifest::fromJson(QByteArray(R"({"resources": []})"), kManifestUrl).has_value());

    // relative url without a base
    EXPECT_FALSE(PackageManifest::fromJson(QByteArray(R"({"resources": [{"url": "a.bin"}]})")).has_value());

    error.clear();
    EXPECT_FALSE(PackageManifest::fromJson(QByteArray(R"json({"resources": [
        {"name": "a", "url": "https://x.example.com/1"}, {"name": "a", "url": "https://x.example.com/2"}]})json"),
                                           kManifestUrl, &error).has_value());
    EXPECT_TRUE(error.contains(QStringLiteral("Duplicate")));
}

TEST(PackageManifestTest, TierNames)
{
    EXPECT_EQ(packageTierName(PackageTier::Full), QStringLiteral("full"));
    EXPECT_EQ(packageTierFromString(QStringLiteral(" FULL ")), PackageTier::Full);
    EXPECT_FALSE(packageTierFromString(QStringLiteral("tiny")).has_value());
}
