/*!
 * @file        sessionmanager.cppm
 * @brief       Model graph loading, backend selection, and inference driver.
 * @details     Owns the single model graph handle of one assistant instance.
 *              Selects the execution backend (GPU when the engine offers it,
 *              the portable backend otherwise), loads the graph from a remote
 *              URL, a local file, or an in-memory payload, runs forward
 *              passes on the global thread pool, and keeps latency
 *              statistics.
 *
 *              Contract violations (no engine, no model, unsupported source)
 *              throw StateError synchronously. Runtime failures (download,
 *              session creation, forward pass) are delivered through the
 *              returned QFuture.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QByteArray>
#include <QElapsedTimer>
#include <QFuture>
#include <QList>
#include <QStringList>
#include <QUrl>

#include <memory>
#include <optional>
#include <variant>

#ifndef Q_MOC_RUN
export module kavosh.core.sessionmanager;
export import kavosh.core.errors;
export import kavosh.core.executionengine;
export import kavosh.core.downloadmanager;
#endif

#ifdef Q_MOC_RUN
#define KAVOSH_MODULE_EXPORT
#else
#define KAVOSH_MODULE_EXPORT export
#endif

//!< @brief Backend requested by the caller.
KAVOSH_MODULE_EXPORT enum class BackendPreference {
    Auto,       //!< Best available, with one portable retry if GPU session creation fails.
    Gpu,        //!< GPU only.
    Portable    //!< Portable only.
};

/**
 * @brief Model graph location.
 *
 * A QUrl with an http or https scheme is fetched through the DownloadManager;
 * a file URL or a scheme-less path is opened by the engine; a QByteArray is
 * the serialized graph itself.
 */
KAVOSH_MODULE_EXPORT using ModelSource = std::variant<QUrl, QByteArray>;

//!< @brief Options of SessionManager::loadModel().
KAVOSH_MODULE_EXPORT struct LoadOptions {
    BackendPreference backend = BackendPreference::Auto;
    bool graphOptimization = true;
    int intraOpThreads = 0;
    DownloadOptions download;       //!< Retry, checksum, and progress options for remote sources.
};

//!< @brief Timing statistics of the loaded model.
KAVOSH_MODULE_EXPORT struct InferenceStats {
    double loadTimeMs = 0.0;                //!< Duration of the last successful load.
    double lastInferenceTimeMs = 0.0;       //!< Duration of the last forward pass.
    qint64 totalInferences = 0;             //!< Completed forward passes.
    double averageInferenceTimeMs = 0.0;    //!< Running mean of forward pass durations.
};

//!< @brief Snapshot of the loaded model.
KAVOSH_MODULE_EXPORT struct ModelInfo {
    QStringList inputNames;
    QStringList outputNames;
    ExecutionBackend backend = ExecutionBackend::Portable;
    InferenceStats stats;
};

/**
 * @brief Loads one model graph and runs forward passes on it.
 *
 * States: Unloaded -> Loading -> Loaded, and back to Unloaded through
 * release(). The graph handle is owned exclusively by this instance.
 */
KAVOSH_MODULE_EXPORT class SessionManager : public QObject {

    Q_OBJECT

    //!< @brief Whether a model is loaded.
    Q_PROPERTY(bool ready READ isReady NOTIFY stateChanged)

public:
    enum class State {
        Unloaded,
        Loading,
        Loaded
    };

    /**
     * @brief Construct a session manager.
     * @param engine Execution engine; may be null, in which case every
     *        engine-dependent call throws StateError.
     * @param downloader Used for remote model sources; may be null.
     * @param parent Optional parent QObject.
     */
    explicit SessionManager(ExecutionEngine* engine,
                            DownloadManager* downloader = nullptr,
                            QObject* parent = nullptr);

    ~SessionManager() override;

    /**
     * @brief Pick the backend for the next load.
     * @return Gpu when the engine supports it, Portable otherwise.
     * @throws StateError if no engine is available.
     */
    ExecutionBackend getBestExecutionProvider() const;

    /**
     * @brief Load a model graph.
     *
     * A loaded model is released first. The returned future finishes once
     * the graph is loaded, or holds DownloadError/EngineError.
     *
     * @throws StateError if no engine is available, a load is already in
     *         progress, or the source is empty or unsupported.
     */
    QFuture<void> loadModel(const ModelSource& source, const LoadOptions& options = {});

    /**
     * @brief Run one forward pass.
     * @param inputs Tensors keyed by input name.
     * @return Future of the output tensors keyed by output name.
     * @throws StateError if no model is loaded.
     */
    QFuture<TensorMap> runInference(const TensorMap& inputs);

    /**
     * @brief Build a tensor from raw element bytes.
     * @throws StateError if no engine is available.
     * @throws std::invalid_argument if data does not match dims.
     */
    Tensor createTensor(TensorType type, const QByteArray& data, const QList<qint64>& dims) const;

    /**
     * @brief Build a tensor from numbers, converted to the element type.
     * @throws StateError if no engine is available.
     * @throws std::invalid_argument if the value count does not match dims.
     */
    Tensor createTensor(TensorType type, const QList<double>& values, const QList<qint64>& dims) const;

    //!< @brief Snapshot of the loaded model, std::nullopt when none is loaded.
    std::optional<ModelInfo> getModelInfo() const;

    //!< @brief Snapshot of the statistics.
    InferenceStats getStats() const { return m_stats; }

    //!< @brief Whether a model is loaded and its handle is valid.
    bool isReady() const { return m_state == State::Loaded && m_handle != nullptr; }

    State state() const { return m_state; }

    /**
     * @brief Release the model and return to Unloaded.
     *
     * Idempotent. A pending load is abandoned. The native session is released
     * at once, or after the last in-flight forward pass when one is running.
     */
    void release();

signals:
    //!< @brief Emitted when the state changes.
    void stateChanged();

    /**
     * @brief Emitted after each successful forward pass.
     * @param elapsedMs Duration in milliseconds.
     */
    void inferenceCompleted(double elapsedMs);

private:
    //!< @brief Throw StateError unless the engine is present and initialized.
    void requireEngine(const char* operation) const;

    //!< @brief Release retired handles once no forward pass uses them.
    void releaseRetired();

    ExecutionEngine* m_engine = nullptr;                //!< Injected engine.
    DownloadManager* m_downloader = nullptr;            //!< Injected downloader.
    State m_state = State::Unloaded;                    //!< Current state.
    std::shared_ptr<GraphHandle> m_handle;              //!< Loaded graph.
    QList<std::shared_ptr<GraphHandle>> m_retired;      //!< Released while in flight.
    QStringList m_inputNames;                           //!< Declared inputs.
    QStringList m_outputNames;                          //!< Declared outputs.
    ExecutionBackend m_backend = ExecutionBackend::Portable;
    InferenceStats m_stats;                             //!< Statistics.
    quint64 m_generation = 0;                           //!< Bumped by release() to drop stale loads.
    int m_inFlight = 0;                                 //!< Running forward passes.
    QElapsedTimer m_loadTimer;                          //!< Load latency timer.
};

#include "sessionmanager.moc"
