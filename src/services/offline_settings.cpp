module;
#include <QDebug>
#include <QSettings>

#include <optional>

module kavosh.services.offline_settings;

static QString settingsGroup()
{
    return QStringLiteral("offline");
}

std::optional<BackendPreference> backendPreferenceFromString(const QString& name)
{
    const QString v = name.trimmed().toLower();
    if (v == QLatin1String("auto")) return BackendPreference::Auto;
    if (v == QLatin1String("gpu") || v == QLatin1String("webgpu") || v == QLatin1String("cuda"))
        return BackendPreference::Gpu;
    if (v == QLatin1String("portable") || v == QLatin1String("cpu") || v == QLatin1String("wasm"))
        return BackendPreference::Portable;
    return std::nullopt;
}

QString backendPreferenceName(BackendPreference preference)
{
    switch (preference) {
    case BackendPreference::Auto: return QStringLiteral("auto");
    case BackendPreference::Gpu: return QStringLiteral("gpu");
    case BackendPreference::Portable: return QStringLiteral("portable");
    }
    return QStringLiteral("auto");
}

OfflineSettings OfflineSettings::load()
{
    QSettings settings;
    return load(settings);
}

OfflineSettings OfflineSettings::load(QSettings& settings)
{
    OfflineSettings s;
    settings.beginGroup(settingsGroup());
    s.maxRetries = qMax(1, settings.value(QStringLiteral("maxRetries"), s.maxRetries).toInt());
    s.retryDelayMs = qMax(0, settings.value(QStringLiteral("retryDelayMs"), s.retryDelayMs).toInt());
    const QString backoff = settings.value(QStringLiteral("retryBackoff"), QStringLiteral("exponential"))
                                .toString().trimmed().toLower();
    if (backoff == QLatin1String("fixed")) {
        s.retryBackoff = BackoffMode::Fixed;
    } else if (backoff != QLatin1String("exponential")) {
        qWarning() << "OfflineSettings: unknown retryBackoff" << backoff << "-> exponential";
    }
    s.maxConcurrent = qMax(1, settings.value(QStringLiteral("maxConcurrent"), s.maxConcurrent).toInt());
    s.transferTimeoutMs = qMax(0, settings.value(QStringLiteral("transferTimeoutMs"), s.transferTimeoutMs).toInt());

    const QString backend = settings.value(QStringLiteral("executionBackend"), QStringLiteral("auto")).toString();
    if (const auto preference = backendPreferenceFromString(backend)) {
        s.executionBackend = *preference;
    } else {
        qWarning() << "OfflineSettings: unknown executionBackend" << backend << "-> auto";
    }
    s.manifestUrl = settings.value(QStringLiteral("manifestUrl"), s.manifestUrl).toString();

    GenerationConfig& g = s.generation;
    g.maxContextLength = qMax(1, settings.value(QStringLiteral("maxContextLength"), g.maxContextLength).toInt());
    g.maxNewTokens = qMax(1, settings.value(QStringLiteral("maxNewTokens"), g.maxNewTokens).toInt());
    g.temperature = settings.value(QStringLiteral("temperature"), g.temperature).toDouble();
    g.topK = qMax(0, settings.value(QStringLiteral("topK"), g.topK).toInt());
    g.topP = settings.value(QStringLiteral("topP"), g.topP).toDouble();
    g.repetitionPenalty = settings.value(QStringLiteral("repetitionPenalty"), g.repetitionPenalty).toDouble();
    if (g.repetitionPenalty <= 0.0) g.repetitionPenalty = 1.0;

    s.packageComplete = settings.value(QStringLiteral("packageComplete"), s.packageComplete).toBool();
    settings.endGroup();
    return s;
}

void OfflineSettings::save() const
{
    QSettings settings;
    save(settings);
}

void OfflineSettings::save(QSettings& settings) const
{
    settings.beginGroup(settingsGroup());
    settings.setValue(QStringLiteral("maxRetries"), maxRetries);
    settings.setValue(QStringLiteral("retryDelayMs"), retryDelayMs);
    settings.setValue(QStringLiteral("retryBackoff"),
                      retryBackoff == BackoffMode::Fixed ? QStringLiteral("fixed") : QStringLiteral("exponential"));
    settings.setValue(QStringLiteral("maxConcurrent"), maxConcurrent);
    settings.setValue(QStringLiteral("transferTimeoutMs"), transferTimeoutMs);
    settings.setValue(QStringLiteral("executionBackend"), backendPreferenceName(executionBackend));
    settings.setValue(QStringLiteral("manifestUrl"), manifestUrl);
    settings.setValue(QStringLiteral("maxContextLength"), generation.maxContextLength);
    settings.setValue(QStringLiteral("maxNewTokens"), generation.maxNewTokens);
    settings.setValue(QStringLiteral("temperature"), generation.temperature);
    settings.setValue(QStringLiteral("topK"), generation.topK);
    settings.setValue(QStringLiteral("topP"), generation.topP);
    settings.setValue(QStringLiteral("repetitionPenalty"), generation.repetitionPenalty);
    settings.setValue(QStringLiteral("packageComplete"), packageComplete);
    settings.endGroup();
}

DownloadOptions OfflineSettings::downloadOptions() const
{
    DownloadOptions options;
    options.maxRetries = maxRetries;
    options.retryDelayMs = retryDelayMs;
    options.backoff = retryBackoff;
    options.transferTimeoutMs = transferTimeoutMs;
    return options;
}

LoadOptions OfflineSettings::loadOptions() const
{
    LoadOptions options;
    options.backend = executionBackend;
    options.download = downloadOptions();
    return options;
}
