module;
#include <QDebug>
#include <QFuture>
#include <QPromise>
#include <QSet>

#include <exception>
#include <memory>

module kavosh.services.offline_assistant;

import kavosh.utils.sampling_utils;

namespace utils = kavosh::utils;

namespace {

const QString kLogitsOutput = QStringLiteral("logits");

// Logits of the last position of a [batch, sequence, vocab] (or [.., vocab]) output.
QList<float> lastTokenLogits(const Tensor& logits)
{
    const qint64 vocab = logits.shape().isEmpty() ? 0 : logits.shape().last();
    const QList<float> values = logits.toFloats();
    if (vocab <= 0 || values.size() < vocab) {
        throw EngineError(QStringLiteral("model"), QStringLiteral("Model output has no logits row"));
    }
    return values.mid(values.size() - vocab);
}

const Tensor* findLogits(const TensorMap& outputs)
{
    const auto it = outputs.constFind(kLogitsOutput);
    if (it != outputs.cend()) return &it.value();
    for (auto o = outputs.cbegin(); o != outputs.cend(); ++o) {
        if (o.value().type() == TensorType::Float32) return &o.value();
    }
    return nullptr;
}

} // namespace

struct OfflineAssistant::Generation {
    QList<int> context;
    QList<int> generated;
    GenerationConfig config;
    QSet<int> stopTokens;
    std::shared_ptr<QPromise<QString>> promise;
};

OfflineAssistant::OfflineAssistant(DownloadManager& downloads,
                                   Tokenizer& tokenizer,
                                   SessionManager& session,
                                   QObject* parent)
    : QObject(parent),
    m_downloads(downloads),
    m_tokenizer(tokenizer),
    m_session(session),
    m_rng(QRandomGenerator::securelySeeded())
{
}

QFuture<void> OfflineAssistant::installPackage(const PackageManifest& manifest,
                                               const DownloadOptions& downloadOptions,
                                               AggregateProgressCallback onProgress,
                                               const LoadOptions& loadOptions)
{
    const auto model = manifest.modelResource();
    const auto vocabulary = manifest.tokenizerResource();
    if (!model || !vocabulary) {
        throw StateError(QStringLiteral("OfflineAssistant"),
                         QStringLiteral("Package manifest needs a model and a tokenizer resource"));
    }

    qInfo() << "OfflineAssistant: installing" << packageTierName(manifest.tier()) << "package"
            << manifest.version();
    m_packageComplete = false;

    const QString modelName = model->name;
    const QString vocabularyName = vocabulary->name;

    return m_downloads.downloadMultiple(manifest.toDownloadRequests(), std::move(onProgress), downloadOptions)
        .then(this, [this, modelName, vocabularyName, loadOptions](const QList<DownloadResult>& results) {
            QByteArray modelPayload;
            QByteArray vocabularyPayload;
            for (const DownloadResult& r : results) {
                if (r.name == modelName) modelPayload = r.payload;
                else if (r.name == vocabularyName) vocabularyPayload = r.payload;
            }

            QString error;
            if (!m_tokenizer.load(vocabularyPayload, &error)) {
                throw DownloadError(DownloadError::Kind::Integrity, vocabularyName,
                                    QStringLiteral("Vocabulary does not parse: %1").arg(error));
            }
            return m_session.loadModel(modelPayload, loadOptions);
        })
        .unwrap()
        .then(this, [this]() {
            m_packageComplete = true;
            qInfo() << "OfflineAssistant: package installed";
            emit packageInstalled();
        });
}

QFuture<QString> OfflineAssistant::generate(const QString& prompt, const GenerationConfig& config)
{
    if (m_generating) {
        throw StateError(QStringLiteral("OfflineAssistant"), QStringLiteral("A generation is already running"));
    }
    if (!m_session.isReady()) {
        throw StateError(QStringLiteral("OfflineAssistant"),
                         QStringLiteral("Model not loaded; install a package before generate()"));
    }

    auto generation = std::make_shared<Generation>();
    generation->config = config;
    generation->context = m_tokenizer.encode(prompt);
    if (generation->context.size() >= config.maxContextLength) {
        throw StateError(QStringLiteral("OfflineAssistant"),
                         QStringLiteral("Prompt of %1 tokens fills the context of %2")
                             .arg(generation->context.size()).arg(config.maxContextLength));
    }
    generation->stopTokens.insert(m_tokenizer.eosTokenId());
    for (int id : config.stopTokens) generation->stopTokens.insert(id);
    generation->promise = std::make_shared<QPromise<QString>>();
    generation->promise->start();

    m_stopRequested = false;
    m_generating = true;
    emit generatingChanged();

    qDebug() << "OfflineAssistant: generating from" << generation->context.size() << "prompt tokens";
    QFuture<QString> future = generation->promise->future();
    step(generation);
    return future;
}

QFuture<QString> OfflineAssistant::chat(const QList<ChatMessage>& messages, const GenerationConfig& config)
{
    GenerationConfig chatConfig = config;
    chatConfig.stopTokens.append(m_tokenizer.endOfTurnTokenId());
    if (const auto user = m_tokenizer.tokenToId(QStringLiteral("<|user|>"))) {
        chatConfig.stopTokens.append(*user);
    }
    return generate(m_tokenizer.formatChat(messages), chatConfig)
        .then([](const QString& reply) { return reply.trimmed(); });
}

TensorMap OfflineAssistant::buildInputs(const QList<int>& context) const
{
    const auto info = m_session.getModelInfo();
    const QStringList declared = info ? info->inputNames : QStringList();
    const qint64 n = context.size();

    QList<qint64> ids;
    QList<qint64> mask;
    QList<qint64> positions;
    ids.reserve(n);
    for (qint64 i = 0; i < n; ++i) {
        ids.append(context.at(i));
        mask.append(1);
        positions.append(i);
    }

    TensorMap inputs;
    inputs.insert(QStringLiteral("input_ids"), Tensor::fromInt64(ids, { 1, n }));
    if (declared.isEmpty() || declared.contains(QStringLiteral("attention_mask"))) {
        inputs.insert(QStringLiteral("attention_mask"), Tensor::fromInt64(mask, { 1, n }));
    }
    if (declared.contains(QStringLiteral("position_ids"))) {
        inputs.insert(QStringLiteral("position_ids"), Tensor::fromInt64(positions, { 1, n }));
    }
    return inputs;
}

void OfflineAssistant::step(const std::shared_ptr<Generation>& generation)
{
    QFuture<TensorMap> pass;
    try {
        pass = m_session.runInference(buildInputs(generation->context));
    } catch (const StateError& e) {
        failGeneration(generation, e);
        return;
    }

    pass.then(this, [this, generation](const TensorMap& outputs) {
            onStepFinished(generation, outputs);
        })
        .onFailed(this, [this, generation](const QException& e) {
            failGeneration(generation, e);
        })
        .onFailed(this, [this, generation](const std::exception& e) {
            failGeneration(generation, EngineError(QStringLiteral("model"), QString::fromUtf8(e.what())));
        });
}

void OfflineAssistant::onStepFinished(const std::shared_ptr<Generation>& generation, const TensorMap& outputs)
{
    const Tensor* logitsTensor = findLogits(outputs);
    if (!logitsTensor) {
        throw EngineError(QStringLiteral("model"), QStringLiteral("Model produced no float output"));
    }

    QList<float> logits = lastTokenLogits(*logitsTensor);
    const GenerationConfig& config = generation->config;
    utils::applyRepetitionPenalty(logits, generation->context, config.repetitionPenalty);
    const int next = utils::sampleToken(logits, config.temperature, config.topK, config.topP, m_rng);

    if (next < 0 || generation->stopTokens.contains(next)) {
        finishGeneration(generation);
        return;
    }

    generation->context.append(next);
    generation->generated.append(next);

    DecodeOptions pieceOptions;
    pieceOptions.cleanUpTokenizationSpaces = false;
    emit tokenGenerated(m_tokenizer.decode({ next }, pieceOptions), next);

    if (m_stopRequested
        || generation->generated.size() >= config.maxNewTokens
        || generation->context.size() >= config.maxContextLength) {
        finishGeneration(generation);
        return;
    }
    step(generation);
}

void OfflineAssistant::finishGeneration(const std::shared_ptr<Generation>& generation)
{
    const QString text = m_tokenizer.decode(generation->generated);
    qDebug() << "OfflineAssistant: generated" << generation->generated.size() << "tokens";
    m_generating = false;
    emit generatingChanged();
    generation->promise->addResult(text);
    generation->promise->finish();
}

void OfflineAssistant::failGeneration(const std::shared_ptr<Generation>& generation, const QException& error)
{
    qWarning() << "OfflineAssistant: generation failed:" << error.what();
    m_generating = false;
    emit generatingChanged();
    generation->promise->setException(error);
    generation->promise->finish();
}
