/*!
 * @file        executionengine.cppm
 * @brief       Capability interface of neural-network execution engines.
 * @details     Declares the typed tensor container exchanged with model graphs
 *              and the two abstract seams the Session Manager depends on:
 *
 *              - ExecutionEngine: creates graph sessions on a backend and
 *                reports which backends it can use.
 *              - GraphHandle: one loaded graph; runs forward passes and
 *                exposes its declared input and output tensor names.
 *
 *              The production engine is built on ONNX Runtime; tests inject a
 *              scripted implementation of the same interface.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

#include <memory>

#ifndef Q_MOC_RUN
export module kavosh.core.executionengine;
export import kavosh.core.errors;
#endif

#ifdef Q_MOC_RUN
#define KAVOSH_MODULE_EXPORT
#else
#define KAVOSH_MODULE_EXPORT export
#endif

//!< @brief Element type of a tensor.
KAVOSH_MODULE_EXPORT enum class TensorType {
    Float32,
    Int64,
    Int32
};

//!< @brief Return "float32", "int64" or "int32".
KAVOSH_MODULE_EXPORT QString tensorTypeName(TensorType type);

//!< @brief Parse a type name as returned by tensorTypeName().
//!< @throws std::invalid_argument for unknown names.
KAVOSH_MODULE_EXPORT TensorType tensorTypeFromName(const QString& name);

//!< @brief Size in bytes of one element.
KAVOSH_MODULE_EXPORT qsizetype tensorElementSize(TensorType type);

/**
 * @brief Typed, shaped, contiguous tensor stored in host memory.
 *
 * The element buffer is a QByteArray, so copies are cheap and share data
 * until written.
 */
KAVOSH_MODULE_EXPORT class Tensor {
public:
    Tensor() = default;

    /**
     * @brief Construct a tensor over a raw element buffer.
     * @param type Element type.
     * @param shape Dimensions; every dimension must be >= 0.
     * @param data Elements in row-major order.
     * @throws std::invalid_argument if a dimension is negative or the buffer
     *         size does not match the shape.
     */
    Tensor(TensorType type, const QList<qint64>& shape, const QByteArray& data);

    static Tensor fromFloats(const QList<float>& values, const QList<qint64>& shape);
    static Tensor fromInt64(const QList<qint64>& values, const QList<qint64>& shape);
    static Tensor fromInt32(const QList<qint32>& values, const QList<qint64>& shape);

    /**
     * @brief Number of elements described by a shape.
     * @throws std::invalid_argument if a dimension is negative.
     */
    static qint64 elementCountOf(const QList<qint64>& shape);

    TensorType type() const { return m_type; }
    const QList<qint64>& shape() const { return m_shape; }
    const QByteArray& data() const { return m_data; }
    qint64 elementCount() const { return elementCountOf(m_shape); }
    bool isNull() const { return m_shape.isEmpty() && m_data.isEmpty(); }

    //!< @throws std::invalid_argument if the tensor is not Float32.
    QList<float> toFloats() const;

    //!< @throws std::invalid_argument if the tensor is not Int64.
    QList<qint64> toInt64() const;

    //!< @throws std::invalid_argument if the tensor is not Int32.
    QList<qint32> toInt32() const;

private:
    void requireType(TensorType type) const;

    TensorType m_type = TensorType::Float32;
    QList<qint64> m_shape;
    QByteArray m_data;
};

//!< @brief Tensors keyed by graph input or output name.
KAVOSH_MODULE_EXPORT using TensorMap = QMap<QString, Tensor>;

//!< @brief Hardware path used to run a graph.
KAVOSH_MODULE_EXPORT enum class ExecutionBackend {
    Gpu,        //!< GPU-accelerated provider.
    Portable    //!< Portable CPU provider, available everywhere.
};

//!< @brief Return "gpu" or "portable".
KAVOSH_MODULE_EXPORT QString executionBackendName(ExecutionBackend backend);

//!< @brief Options for creating a graph session.
KAVOSH_MODULE_EXPORT struct SessionConfig {
    ExecutionBackend backend = ExecutionBackend::Portable;
    bool graphOptimization = true;  //!< Enable all graph optimizations.
    int intraOpThreads = 0;         //!< 0 lets the engine decide.
};

/**
 * @brief One loaded model graph.
 *
 * run() may be called from a worker thread; calls on one handle are not
 * concurrent. release() frees the native session and is idempotent; run()
 * after release() throws EngineError.
 */
KAVOSH_MODULE_EXPORT class GraphHandle {
public:
    virtual ~GraphHandle() = default;

    virtual QStringList inputNames() const = 0;
    virtual QStringList outputNames() const = 0;

    /**
     * @brief Execute one forward pass.
     * @param inputs Tensors keyed by input name.
     * @return Tensors keyed by output name.
     * @throws EngineError on failure.
     */
    virtual TensorMap run(const TensorMap& inputs) = 0;

    virtual void release() = 0;
};

/**
 * @brief Factory of graph sessions on one inference runtime.
 */
KAVOSH_MODULE_EXPORT class ExecutionEngine {
public:
    virtual ~ExecutionEngine() = default;

    //!< @brief Engine name used in logs and errors.
    virtual QString name() const = 0;

    //!< @brief Whether the runtime was initialized and can create sessions.
    virtual bool isAvailable() const = 0;

    //!< @brief Whether sessions can be created on a backend.
    virtual bool supportsBackend(ExecutionBackend backend) const = 0;

    /**
     * @brief Create a session from an in-memory model.
     * @throws EngineError on failure.
     */
    virtual std::shared_ptr<GraphHandle> createSession(const QByteArray& model,
                                                       const SessionConfig& config) = 0;

    /**
     * @brief Create a session from a model file.
     * @throws EngineError on failure.
     */
    virtual std::shared_ptr<GraphHandle> createSessionFromFile(const QString& path,
                                                               const SessionConfig& config) = 0;
};
