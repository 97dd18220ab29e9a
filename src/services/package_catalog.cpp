module;
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QSet>

#include <optional>

module kavosh.services.package_catalog;

import kavosh.utils.download_utils;

namespace utils = kavosh::utils;

namespace {

std::optional<PackageManifest> failWith(QString* error, const QString& message)
{
    qWarning() << "PackageManifest:" << message;
    if (error) *error = message;
    return std::nullopt;
}

ResourceType resourceTypeFromString(const QString& value)
{
    const QString type = value.trimmed().toLower();
    if (type == QLatin1String("model") || type == QLatin1String("ai-model") || type == QLatin1String("onnx"))
        return ResourceType::Model;
    if (type == QLatin1String("tokenizer") || type == QLatin1String("vocab"))
        return ResourceType::Tokenizer;
    return ResourceType::Data;
}

} // namespace

QString packageTierName(PackageTier tier)
{
    switch (tier) {
    case PackageTier::Minimal: return QStringLiteral("minimal");
    case PackageTier::Standard: return QStringLiteral("standard");
    case PackageTier::Full: return QStringLiteral("full");
    }
    return QStringLiteral("standard");
}

std::optional<PackageTier> packageTierFromString(const QString& name)
{
    const QString tier = name.trimmed().toLower();
    if (tier == QLatin1String("minimal")) return PackageTier::Minimal;
    if (tier == QLatin1String("standard")) return PackageTier::Standard;
    if (tier == QLatin1String("full")) return PackageTier::Full;
    return std::nullopt;
}

std::optional<PackageManifest> PackageManifest::fromJson(const QByteArray& json,
                                                         const QUrl& baseUrl,
                                                         QString* error)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return failWith(error, QStringLiteral("Invalid manifest JSON: %1").arg(err.errorString()));
    }

    QJsonObject obj = doc.object();
    if (obj.value(QStringLiteral("manifest")).isObject()) {
        obj = obj.value(QStringLiteral("manifest")).toObject();
    }

    PackageManifest manifest;
    QString tierName = obj.value(QStringLiteral("package")).toString();
    if (tierName.isEmpty()) tierName = obj.value(QStringLiteral("packageType")).toString();
    if (!tierName.isEmpty()) {
        const auto tier = packageTierFromString(tierName);
        if (!tier) {
            return failWith(error, QStringLiteral("Unknown package tier: %1").arg(tierName));
        }
        manifest.m_tier = *tier;
    }
    manifest.m_name = obj.value(QStringLiteral("name")).toString();
    manifest.m_version = obj.value(QStringLiteral("version")).toString();

    const QJsonValue resources = obj.value(QStringLiteral("resources"));
    if (!resources.isArray() || resources.toArray().isEmpty()) {
        return failWith(error, QStringLiteral("Manifest has no resources"));
    }

    QSet<QString> names;
    for (const QJsonValue& v : resources.toArray()) {
        if (!v.isObject()) {
            return failWith(error, QStringLiteral("Manifest resource is not an object"));
        }
        const QJsonObject r = v.toObject();
        PackageResource resource;
        resource.filename = r.value(QStringLiteral("filename")).toString();
        resource.name = r.value(QStringLiteral("name")).toString();
        resource.type = resourceTypeFromString(r.value(QStringLiteral("type")).toString());
        resource.size = static_cast<qint64>(r.value(QStringLiteral("size")).toDouble(0));
        resource.sha256 = r.value(QStringLiteral("sha256")).toString();
        if (resource.sha256.isEmpty()) {
            resource.sha256 = r.value(QStringLiteral("checksum")).toString();
        }
        resource.sha256 = utils::normalizeChecksum(resource.sha256);

        QString location = r.value(QStringLiteral("url")).toString();
        if (location.isEmpty()) location = resource.filename;
        if (location.isEmpty()) {
            return failWith(error, QStringLiteral("Manifest resource %1 has no url").arg(resource.name));
        }
        QUrl url(location);
        if (url.isRelative() && baseUrl.isValid()) {
            url = baseUrl.resolved(url);
        }
        if (!url.isValid() || url.isRelative()) {
            return failWith(error, QStringLiteral("Manifest resource has an unusable url: %1").arg(location));
        }
        resource.url = url;

        if (resource.filename.isEmpty()) resource.filename = utils::fileNameFromUrl(url);
        if (resource.name.isEmpty()) resource.name = resource.filename;
        if (names.contains(resource.name)) {
            return failWith(error, QStringLiteral("Duplicate manifest resource: %1").arg(resource.name));
        }
        names.insert(resource.name);
        manifest.m_resources.append(resource);
    }

    qInfo() << "PackageManifest:" << packageTierName(manifest.m_tier) << manifest.m_version
            << manifest.m_resources.size() << "resources," << utils::formatBytes(manifest.totalSize());
    return manifest;
}

qint64 PackageManifest::totalSize() const
{
    qint64 total = 0;
    for (const PackageResource& r : m_resources) total += qMax<qint64>(0, r.size);
    return total;
}

std::optional<PackageResource> PackageManifest::firstOfType(ResourceType type) const
{
    for (const PackageResource& r : m_resources) {
        if (r.type == type) return r;
    }
    return std::nullopt;
}

std::optional<PackageResource> PackageManifest::modelResource() const
{
    return firstOfType(ResourceType::Model);
}

std::optional<PackageResource> PackageManifest::tokenizerResource() const
{
    return firstOfType(ResourceType::Tokenizer);
}

QList<DownloadRequest> PackageManifest::toDownloadRequests() const
{
    QList<DownloadRequest> requests;
    requests.reserve(m_resources.size());
    for (const PackageResource& r : m_resources) {
        DownloadRequest request;
        request.url = r.url;
        request.name = r.name;
        request.expectedSize = r.size;
        request.expectedChecksum = r.sha256;
        requests.append(request);
    }
    return requests;
}
