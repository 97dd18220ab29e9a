module;
#include <QDebug>
#include <QElapsedTimer>
#include <QFuture>
#include <QtConcurrent>

#include <cmath>
#include <memory>
#include <optional>
#include <stdexcept>
#include <variant>

module kavosh.core.sessionmanager;

import kavosh.utils.download_utils;

namespace utils = kavosh::utils;

namespace {

struct LoadedGraph {
    std::shared_ptr<GraphHandle> handle;
    ExecutionBackend backend = ExecutionBackend::Portable;
};

struct TimedOutputs {
    TensorMap outputs;
    double elapsedMs = 0.0;
};

// Runs on a worker thread.
LoadedGraph createGraph(ExecutionEngine* engine,
                        const QByteArray& bytes,
                        const QString& path,
                        SessionConfig config,
                        bool allowFallback)
{
    auto create = [&]() {
        return path.isEmpty() ? engine->createSession(bytes, config)
                              : engine->createSessionFromFile(path, config);
    };

    try {
        return { create(), config.backend };
    } catch (const EngineError& e) {
        if (!allowFallback || config.backend != ExecutionBackend::Gpu)
            throw;
        qWarning() << "SessionManager: gpu session failed, falling back to portable:" << e.message();
        config.backend = ExecutionBackend::Portable;
        return { create(), config.backend };
    }
}

} // namespace

SessionManager::SessionManager(ExecutionEngine* engine, DownloadManager* downloader, QObject* parent)
    : QObject(parent),
    m_engine(engine),
    m_downloader(downloader)
{
}

SessionManager::~SessionManager()
{
    release();
}

void SessionManager::requireEngine(const char* operation) const
{
    if (!m_engine || !m_engine->isAvailable()) {
        throw StateError(QStringLiteral("SessionManager"),
                         QStringLiteral("Inference engine not initialized; %1() needs an available engine")
                             .arg(QLatin1String(operation)));
    }
}

ExecutionBackend SessionManager::getBestExecutionProvider() const
{
    requireEngine("getBestExecutionProvider");
    if (m_engine->supportsBackend(ExecutionBackend::Gpu)) {
        qInfo() << "SessionManager:" << m_engine->name() << "offers a gpu backend";
        return ExecutionBackend::Gpu;
    }
    qInfo() << "SessionManager: gpu backend unavailable on" << m_engine->name() << "-> portable";
    return ExecutionBackend::Portable;
}

QFuture<void> SessionManager::loadModel(const ModelSource& source, const LoadOptions& options)
{
    requireEngine("loadModel");
    if (m_state == State::Loading) {
        throw StateError(QStringLiteral("SessionManager"), QStringLiteral("A model load is already in progress"));
    }

    QUrl remoteUrl;
    QString path;
    QByteArray bytes;
    if (const auto* url = std::get_if<QUrl>(&source)) {
        if (!url->isValid() || url->isEmpty()) {
            throw StateError(QStringLiteral("SessionManager"), QStringLiteral("Empty or invalid model URL"));
        }
        if (utils::isRemoteUrl(*url)) {
            if (!m_downloader) {
                throw StateError(QStringLiteral("SessionManager"),
                                 QStringLiteral("Remote model source needs a DownloadManager"));
            }
            remoteUrl = *url;
        } else if (url->isLocalFile() || url->scheme().isEmpty()) {
            path = url->isLocalFile() ? url->toLocalFile() : url->toString();
        } else {
            throw StateError(QStringLiteral("SessionManager"),
                             QStringLiteral("Unsupported model source scheme: %1").arg(url->scheme()));
        }
    } else {
        bytes = std::get<QByteArray>(source);
        if (bytes.isEmpty()) {
            throw StateError(QStringLiteral("SessionManager"), QStringLiteral("Empty model payload"));
        }
    }

    if (m_state == State::Loaded) {
        qInfo() << "SessionManager: replacing loaded model";
    }
    release();

    SessionConfig config;
    config.graphOptimization = options.graphOptimization;
    config.intraOpThreads = options.intraOpThreads;
    switch (options.backend) {
    case BackendPreference::Auto: config.backend = getBestExecutionProvider(); break;
    case BackendPreference::Gpu: config.backend = ExecutionBackend::Gpu; break;
    case BackendPreference::Portable: config.backend = ExecutionBackend::Portable; break;
    }
    const bool allowFallback = options.backend == BackendPreference::Auto;

    m_state = State::Loading;
    emit stateChanged();
    m_loadTimer.start();
    const quint64 generation = m_generation;
    ExecutionEngine* engine = m_engine;

    qInfo() << "SessionManager: loading model on" << executionBackendName(config.backend)
            << (remoteUrl.isValid() ? remoteUrl.toString() : path.isEmpty() ? QStringLiteral("<memory>") : path);

    QFuture<LoadedGraph> graph;
    if (remoteUrl.isValid()) {
        QFuture<DownloadResult> download;
        try {
            download = m_downloader->downloadFile(remoteUrl, utils::fileNameFromUrl(remoteUrl), options.download);
        } catch (const StateError&) {
            m_state = State::Unloaded;
            emit stateChanged();
            throw;
        }
        graph = download.then(QtFuture::Launch::Async, [engine, config, allowFallback](const DownloadResult& result) {
            return createGraph(engine, result.payload, QString(), config, allowFallback);
        });
    } else {
        graph = QtConcurrent::run([engine, bytes, path, config, allowFallback]() {
            return createGraph(engine, bytes, path, config, allowFallback);
        });
    }

    return graph
        .then(this, [this, generation](const LoadedGraph& loaded) {
            if (generation != m_generation) {
                loaded.handle->release();
                throw StateError(QStringLiteral("SessionManager"),
                                 QStringLiteral("Model load abandoned by release()"));
            }
            m_handle = loaded.handle;
            m_backend = loaded.backend;
            m_inputNames = m_handle->inputNames();
            m_outputNames = m_handle->outputNames();
            m_stats = InferenceStats();
            m_stats.loadTimeMs = static_cast<double>(m_loadTimer.nsecsElapsed()) / 1e6;
            m_state = State::Loaded;
            qInfo() << "SessionManager: model loaded on" << executionBackendName(m_backend)
                    << "in" << m_stats.loadTimeMs << "ms, inputs" << m_inputNames
                    << "outputs" << m_outputNames;
            emit stateChanged();
        })
        .onFailed(this, [this, generation]() {
            if (generation == m_generation && m_state == State::Loading) {
                m_state = State::Unloaded;
                emit stateChanged();
            }
            qWarning() << "SessionManager: model load failed";
            throw;
        });
}

QFuture<TensorMap> SessionManager::runInference(const TensorMap& inputs)
{
    if (!isReady()) {
        throw StateError(QStringLiteral("SessionManager"),
                         QStringLiteral("Model not loaded; call loadModel() before runInference()"));
    }

    std::shared_ptr<GraphHandle> handle = m_handle;
    const quint64 generation = m_generation;
    ++m_inFlight;

    return QtConcurrent::run([handle, inputs]() {
               QElapsedTimer timer;
               timer.start();
               TimedOutputs result;
               result.outputs = handle->run(inputs);
               result.elapsedMs = static_cast<double>(timer.nsecsElapsed()) / 1e6;
               return result;
           })
        .then(this, [this, generation](const TimedOutputs& result) {
            --m_inFlight;
            if (generation == m_generation) {
                const double count = static_cast<double>(m_stats.totalInferences);
                m_stats.lastInferenceTimeMs = result.elapsedMs;
                m_stats.averageInferenceTimeMs =
                    (m_stats.averageInferenceTimeMs * count + result.elapsedMs) / (count + 1.0);
                ++m_stats.totalInferences;
            }
            releaseRetired();
            emit inferenceCompleted(result.elapsedMs);
            return result.outputs;
        })
        .onFailed(this, [this]() -> TensorMap {
            --m_inFlight;
            releaseRetired();
            qWarning() << "SessionManager: inference failed";
            throw;
        });
}

Tensor SessionManager::createTensor(TensorType type, const QByteArray& data, const QList<qint64>& dims) const
{
    requireEngine("createTensor");
    return Tensor(type, dims, data);
}

Tensor SessionManager::createTensor(TensorType type, const QList<double>& values, const QList<qint64>& dims) const
{
    requireEngine("createTensor");
    if (Tensor::elementCountOf(dims) != values.size()) {
        throw std::invalid_argument(QStringLiteral("%1 values do not fill shape of %2 elements")
                                        .arg(values.size()).arg(Tensor::elementCountOf(dims)).toStdString());
    }

    switch (type) {
    case TensorType::Float32: {
        QList<float> v;
        v.reserve(values.size());
        for (double d : values) v.append(static_cast<float>(d));
        return Tensor::fromFloats(v, dims);
    }
    case TensorType::Int64: {
        QList<qint64> v;
        v.reserve(values.size());
        for (double d : values) v.append(static_cast<qint64>(std::llround(d)));
        return Tensor::fromInt64(v, dims);
    }
    case TensorType::Int32: {
        QList<qint32> v;
        v.reserve(values.size());
        for (double d : values) v.append(static_cast<qint32>(std::lround(d)));
        return Tensor::fromInt32(v, dims);
    }
    }
    throw std::invalid_argument("Unsupported tensor type");
}

std::optional<ModelInfo> SessionManager::getModelInfo() const
{
    if (!isReady()) return std::nullopt;
    ModelInfo info;
    info.inputNames = m_inputNames;
    info.outputNames = m_outputNames;
    info.backend = m_backend;
    info.stats = m_stats;
    return info;
}

void SessionManager::release()
{
    ++m_generation;
    if (m_handle) {
        if (m_inFlight > 0) {
            qInfo() << "SessionManager: releasing after" << m_inFlight << "in-flight inference(s)";
            m_retired.append(m_handle);
        } else {
            m_handle->release();
        }
        qInfo() << "SessionManager: model released";
    }
    m_handle.reset();
    m_inputNames.clear();
    m_outputNames.clear();
    m_backend = ExecutionBackend::Portable;
    m_stats = InferenceStats();
    if (m_state != State::Unloaded) {
        m_state = State::Unloaded;
        emit stateChanged();
    }
}

void SessionManager::releaseRetired()
{
    if (m_inFlight > 0) return;
    for (const auto& handle : std::as_const(m_retired)) {
        handle->release();
    }
    m_retired.clear();
}
