/*!
 * @file        onnxengine.cppm
 * @brief       ONNX Runtime implementation of the execution engine interface.
 * @details     Creates ONNX Runtime sessions from serialized graphs held in
 *              memory or stored on disk, on the CUDA execution provider when
 *              the runtime library offers it or on the default CPU provider
 *              otherwise. Tensors are copied in and out of host memory;
 *              runtime failures are reported as EngineError.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QString>

#include <memory>

#include <onnxruntime_cxx_api.h>

#ifndef Q_MOC_RUN
export module kavosh.engines.onnxruntime;
export import kavosh.core.executionengine;
#endif

#ifdef Q_MOC_RUN
#define KAVOSH_MODULE_EXPORT
#else
#define KAVOSH_MODULE_EXPORT export
#endif

/**
 * @brief ExecutionEngine backed by the ONNX Runtime C++ API.
 *
 * One Ort::Env is shared by every session the engine creates; the engine
 * must outlive them.
 */
KAVOSH_MODULE_EXPORT class OnnxRuntimeEngine : public ExecutionEngine {
public:
    /**
     * @brief Initialize the runtime environment.
     * @param logId Identifier used in ONNX Runtime log output.
     */
    explicit OnnxRuntimeEngine(const char* logId = "kavosh");

    QString name() const override { return QStringLiteral("onnxruntime"); }
    bool isAvailable() const override { return m_env != nullptr; }
    bool supportsBackend(ExecutionBackend backend) const override;

    std::shared_ptr<GraphHandle> createSession(const QByteArray& model,
                                               const SessionConfig& config) override;
    std::shared_ptr<GraphHandle> createSessionFromFile(const QString& path,
                                                       const SessionConfig& config) override;

private:
    //!< @brief Translate a SessionConfig into session options.
    Ort::SessionOptions makeOptions(const SessionConfig& config) const;

    std::unique_ptr<Ort::Env> m_env;    //!< Runtime environment.
    bool m_cudaAvailable = false;       //!< CUDAExecutionProvider is compiled in.
};
