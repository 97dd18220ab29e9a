#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFuture>
#include <QTextStream>
#include <QUrl>
#include <QDebug>
#include <QException>

#include <exception>

import kavosh.core.downloadmanager;
import kavosh.core.tokenizer;
import kavosh.core.sessionmanager;
import kavosh.engines.onnxruntime;
import kavosh.services.package_catalog;
import kavosh.services.offline_settings;
import kavosh.services.offline_assistant;
import kavosh.utils.download_utils;

#ifndef APP_VERSION
#define APP_VERSION "0.1.0"
#endif

namespace utils = kavosh::utils;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("Genyleap"));
    QCoreApplication::setApplicationName(QStringLiteral("Kavosh"));
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Offline assistant: installs a model package and answers a prompt."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption manifestOption(QStringList{ "m", "manifest" },
                                            QStringLiteral("Package manifest URL."), QStringLiteral("url"));
    const QCommandLineOption promptOption(QStringList{ "p", "prompt" },
                                          QStringLiteral("User message."), QStringLiteral("text"));
    const QCommandLineOption systemOption(QStringLiteral("system"),
                                          QStringLiteral("System message."), QStringLiteral("text"));
    const QCommandLineOption backendOption(QStringLiteral("backend"),
                                           QStringLiteral("auto, gpu or portable."), QStringLiteral("name"));
    const QCommandLineOption maxTokensOption(QStringLiteral("max-tokens"),
                                             QStringLiteral("Tokens to generate at most."), QStringLiteral("n"));
    const QCommandLineOption temperatureOption(QStringLiteral("temperature"),
                                               QStringLiteral("Sampling temperature."), QStringLiteral("t"));
    const QCommandLineOption greedyOption(QStringLiteral("greedy"), QStringLiteral("Pick the most likely token."));
    parser.addOptions({ manifestOption, promptOption, systemOption, backendOption,
                        maxTokensOption, temperatureOption, greedyOption });
    parser.process(app);

    OfflineSettings settings = OfflineSettings::load();
    if (parser.isSet(manifestOption)) settings.manifestUrl = parser.value(manifestOption);
    if (parser.isSet(backendOption)) {
        const auto backend = backendPreferenceFromString(parser.value(backendOption));
        if (!backend) {
            qCritical() << "Unknown backend:" << parser.value(backendOption);
            return 2;
        }
        settings.executionBackend = *backend;
    }
    if (parser.isSet(maxTokensOption)) {
        bool ok = false;
        const int n = parser.value(maxTokensOption).toInt(&ok);
        if (ok && n > 0) settings.generation.maxNewTokens = n;
    }
    if (parser.isSet(temperatureOption)) {
        bool ok = false;
        const double t = parser.value(temperatureOption).toDouble(&ok);
        if (ok) settings.generation.temperature = t;
    }
    if (parser.isSet(greedyOption)) settings.generation.temperature = 0.0;

    const QUrl manifestUrl(settings.manifestUrl);
    if (!manifestUrl.isValid() || !utils::isRemoteUrl(manifestUrl)) {
        qCritical() << "A package manifest URL is required (--manifest).";
        return 2;
    }
    if (!parser.isSet(promptOption)) {
        qCritical() << "A prompt is required (--prompt).";
        return 2;
    }

    OnnxRuntimeEngine engine;
    DownloadManager downloads;
    downloads.setMaxConcurrent(settings.maxConcurrent);
    Tokenizer tokenizer;
    SessionManager session(&engine, &downloads);
    OfflineAssistant assistant(downloads, tokenizer, session);

    QTextStream out(stdout);
    QObject::connect(&assistant, &OfflineAssistant::tokenGenerated, &app, [&out](const QString& text, int) {
        out << text;
        out.flush();
    });

    QList<ChatMessage> messages;
    if (parser.isSet(systemOption)) messages.append({ ChatRole::System, parser.value(systemOption) });
    messages.append({ ChatRole::User, parser.value(promptOption) });

    DownloadOptions manifestOptions = settings.downloadOptions();
    downloads.downloadFile(manifestUrl, utils::fileNameFromUrl(manifestUrl), manifestOptions)
        .then(&app, [&, manifestUrl](const DownloadResult& result) {
            QString error;
            const auto manifest = PackageManifest::fromJson(result.payload, manifestUrl, &error);
            if (!manifest) {
                throw DownloadError(DownloadError::Kind::Protocol, result.name,
                                    QStringLiteral("Invalid manifest: %1").arg(error));
            }
            qInfo() << "Installing package" << manifest->version() << utils::formatBytes(manifest->totalSize());
            return assistant.installPackage(*manifest, settings.downloadOptions(),
                                            [](const AggregateProgress& p) {
                                                qDebug() << "Package download"
                                                         << p.filesCompleted << "/" << p.filesTotal
                                                         << p.percentage;
                                            },
                                            settings.loadOptions());
        })
        .unwrap()
        .then(&app, [&]() {
            settings.packageComplete = true;
            settings.save();
            return assistant.chat(messages, settings.generationConfig());
        })
        .unwrap()
        .then(&app, [&](const QString&) {
            out << Qt::endl;
            const InferenceStats stats = session.getStats();
            qInfo() << "Load" << stats.loadTimeMs << "ms, average step" << stats.averageInferenceTimeMs
                    << "ms over" << stats.totalInferences << "steps";
            QCoreApplication::exit(0);
        })
        .onFailed(&app, [](const QException& e) {
            qCritical() << "Failed:" << e.what();
            QCoreApplication::exit(1);
        })
        .onFailed(&app, [](const std::exception& e) {
            qCritical() << "Failed:" << e.what();
            QCoreApplication::exit(1);
        });

    return app.exec();
}
