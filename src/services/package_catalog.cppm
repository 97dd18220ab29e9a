/*!
 * @file        package_catalog.cppm
 * @brief       Offline package manifests.
 * @details     Parses the JSON manifest that describes one offline package
 *              tier (minimal, standard, full): the model graph, the
 *              vocabulary, and any data files, each with its location,
 *              expected size, and SHA-256 digest. A parsed manifest projects
 *              directly onto DownloadManager::downloadMultiple() requests.
 *
 *              Manifest shape:
 *              {
 *                "package": "standard", "name": "...", "version": "1.0.0",
 *                "resources": [
 *                  { "name": "model", "filename": "model.onnx", "url": "...",
 *                    "type": "model", "size": 123, "sha256": "..." }
 *                ]
 *              }
 *              A manifest wrapped as { "manifest": { ... } } is accepted too.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QList>
#include <QString>
#include <QUrl>

#include <optional>

#ifndef Q_MOC_RUN
export module kavosh.services.package_catalog;
export import kavosh.core.downloadertask;
#endif

#ifdef Q_MOC_RUN
#define KAVOSH_MODULE_EXPORT
#else
#define KAVOSH_MODULE_EXPORT export
#endif

//!< @brief Size and quality tier of a package.
KAVOSH_MODULE_EXPORT enum class PackageTier {
    Minimal,
    Standard,
    Full
};

//!< @brief Return "minimal", "standard" or "full".
KAVOSH_MODULE_EXPORT QString packageTierName(PackageTier tier);

//!< @brief Parse a tier name, ignoring case.
KAVOSH_MODULE_EXPORT std::optional<PackageTier> packageTierFromString(const QString& name);

//!< @brief Role of a resource inside a package.
KAVOSH_MODULE_EXPORT enum class ResourceType {
    Model,      //!< Model graph artifact.
    Tokenizer,  //!< Vocabulary artifact.
    Data        //!< Anything else.
};

//!< @brief One downloadable file of a package.
KAVOSH_MODULE_EXPORT struct PackageResource {
    QString name;
    QString filename;
    QUrl url;
    ResourceType type = ResourceType::Data;
    qint64 size = 0;
    QString sha256;
};

/**
 * @brief A parsed package manifest.
 */
KAVOSH_MODULE_EXPORT class PackageManifest {
public:
    /**
     * @brief Parse a manifest.
     *
     * Relative resource URLs are resolved against baseUrl. Every resource
     * needs a URL (or a filename resolvable against baseUrl); resource names
     * default to the filename and must be unique.
     *
     * @param json Manifest content.
     * @param baseUrl Location the manifest was fetched from, may be empty.
     * @param error Receives a description of the failure, may be null.
     * @return The manifest, or std::nullopt on failure.
     */
    static std::optional<PackageManifest> fromJson(const QByteArray& json,
                                                   const QUrl& baseUrl = QUrl(),
                                                   QString* error = nullptr);

    PackageTier tier() const { return m_tier; }
    QString name() const { return m_name; }
    QString version() const { return m_version; }
    const QList<PackageResource>& resources() const { return m_resources; }

    //!< @brief Sum of the declared resource sizes.
    qint64 totalSize() const;

    //!< @brief First resource of type Model, if any.
    std::optional<PackageResource> modelResource() const;

    //!< @brief First resource of type Tokenizer, if any.
    std::optional<PackageResource> tokenizerResource() const;

    //!< @brief One download request per resource, in manifest order.
    QList<DownloadRequest> toDownloadRequests() const;

private:
    std::optional<PackageResource> firstOfType(ResourceType type) const;

    PackageTier m_tier = PackageTier::Standard;
    QString m_name;
    QString m_version;
    QList<PackageResource> m_resources;
};
