module;
#include <QDebug>
#include <QFile>
#include <QStringList>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <onnxruntime_cxx_api.h>

module kavosh.engines.onnxruntime;

namespace {

const QString kEngineName = QStringLiteral("onnxruntime");

ONNXTensorElementDataType toOrtType(TensorType type)
{
    switch (type) {
    case TensorType::Float32: return ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT;
    case TensorType::Int64: return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64;
    case TensorType::Int32: return ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32;
    }
    return ONNX_TENSOR_ELEMENT_DATA_TYPE_UNDEFINED;
}

/**
 * @brief Graph handle owning one Ort::Session.
 */
class OnnxGraph : public GraphHandle {
public:
    explicit OnnxGraph(std::unique_ptr<Ort::Session> session)
        : m_session(std::move(session))
    {
        Ort::AllocatorWithDefaultOptions allocator;
        for (size_t i = 0; i < m_session->GetInputCount(); ++i) {
            Ort::AllocatedStringPtr name = m_session->GetInputNameAllocated(i, allocator);
            m_inputStorage.emplace_back(name ? name.get() : "input_" + std::to_string(i));
        }
        for (size_t i = 0; i < m_session->GetOutputCount(); ++i) {
            Ort::AllocatedStringPtr name = m_session->GetOutputNameAllocated(i, allocator);
            m_outputStorage.emplace_back(name ? name.get() : "output_" + std::to_string(i));
        }
    }

    QStringList inputNames() const override { return toQt(m_inputStorage); }
    QStringList outputNames() const override { return toQt(m_outputStorage); }

    TensorMap run(const TensorMap& inputs) override
    {
        if (!m_session) {
            throw EngineError(kEngineName, QStringLiteral("Session was released"));
        }

        Ort::MemoryInfo memInfo = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

        std::vector<const char*> inputNames;
        std::vector<Ort::Value> inputValues;
        std::vector<std::vector<int64_t>> shapes;
        inputNames.reserve(m_inputStorage.size());
        inputValues.reserve(m_inputStorage.size());
        shapes.reserve(m_inputStorage.size());

        for (const std::string& name : m_inputStorage) {
            const auto it = inputs.constFind(QString::fromStdString(name));
            if (it == inputs.cend()) {
                throw EngineError(kEngineName, QStringLiteral("Missing input tensor: %1")
                                                   .arg(QString::fromStdString(name)));
            }
            const Tensor& tensor = it.value();
            shapes.emplace_back(tensor.shape().cbegin(), tensor.shape().cend());
            const std::vector<int64_t>& shape = shapes.back();
            // ONNX Runtime does not write to input buffers.
            void* data = const_cast<char*>(tensor.data().constData());
            inputValues.push_back(Ort::Value::CreateTensor(memInfo, data,
                                                           static_cast<size_t>(tensor.data().size()),
                                                           shape.data(), shape.size(),
                                                           toOrtType(tensor.type())));
            inputNames.push_back(name.c_str());
        }

        std::vector<const char*> outputNames;
        outputNames.reserve(m_outputStorage.size());
        for (const std::string& name : m_outputStorage) {
            outputNames.push_back(name.c_str());
        }

        std::vector<Ort::Value> outputs;
        try {
            outputs = m_session->Run(Ort::RunOptions{nullptr},
                                     inputNames.data(), inputValues.data(), inputValues.size(),
                                     outputNames.data(), outputNames.size());
        } catch (const Ort::Exception& ex) {
            throw EngineError(kEngineName, QString::fromUtf8(ex.what()));
        }

        TensorMap result;
        for (size_t i = 0; i < outputs.size(); ++i) {
            const Ort::Value& value = outputs[i];
            if (!value.IsTensor()) continue;
            const auto info = value.GetTensorTypeAndShapeInfo();
            const std::vector<int64_t> dims = info.GetShape();
            const QList<qint64> shape(dims.cbegin(), dims.cend());
            const size_t count = info.GetElementCount();
            const QString name = QString::fromStdString(m_outputStorage[i]);

            switch (info.GetElementType()) {
            case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT: {
                const float* p = value.GetTensorData<float>();
                result.insert(name, Tensor(TensorType::Float32, shape,
                                           QByteArray(reinterpret_cast<const char*>(p),
                                                      static_cast<qsizetype>(count * sizeof(float)))));
                break;
            }
            case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64: {
                const int64_t* p = value.GetTensorData<int64_t>();
                result.insert(name, Tensor(TensorType::Int64, shape,
                                           QByteArray(reinterpret_cast<const char*>(p),
                                                      static_cast<qsizetype>(count * sizeof(int64_t)))));
                break;
            }
            case ONNX_TENSOR_ELEMENT_DATA_TYPE_INT32: {
                const int32_t* p = value.GetTensorData<int32_t>();
                result.insert(name, Tensor(TensorType::Int32, shape,
                                           QByteArray(reinterpret_cast<const char*>(p),
                                                      static_cast<qsizetype>(count * sizeof(int32_t)))));
                break;
            }
            default:
                qWarning() << "OnnxRuntimeEngine: skipping output" << name << "of unsupported element type"
                           << static_cast<int>(info.GetElementType());
                break;
            }
        }
        return result;
    }

    void release() override
    {
        m_session.reset();
    }

private:
    static QStringList toQt(const std::vector<std::string>& names)
    {
        QStringList out;
        for (const std::string& n : names) out.append(QString::fromStdString(n));
        return out;
    }

    std::unique_ptr<Ort::Session> m_session;
    std::vector<std::string> m_inputStorage;
    std::vector<std::string> m_outputStorage;
};

} // namespace

OnnxRuntimeEngine::OnnxRuntimeEngine(const char* logId)
{
    try {
        m_env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, logId);
        const std::vector<std::string> providers = Ort::GetAvailableProviders();
        m_cudaAvailable = std::find(providers.cbegin(), providers.cend(),
                                    "CUDAExecutionProvider") != providers.cend();
        QStringList names;
        for (const std::string& p : providers) names.append(QString::fromStdString(p));
        qInfo() << "OnnxRuntimeEngine: providers" << names;
    } catch (const Ort::Exception& ex) {
        qCritical() << "OnnxRuntimeEngine: environment unavailable:" << ex.what();
        m_env.reset();
    }
}

bool OnnxRuntimeEngine::supportsBackend(ExecutionBackend backend) const
{
    if (!m_env) return false;
    return backend == ExecutionBackend::Portable || m_cudaAvailable;
}

Ort::SessionOptions OnnxRuntimeEngine::makeOptions(const SessionConfig& config) const
{
    Ort::SessionOptions options;
    if (config.intraOpThreads > 0) {
        options.SetIntraOpNumThreads(config.intraOpThreads);
    }
    options.SetInterOpNumThreads(1);
    options.SetGraphOptimizationLevel(config.graphOptimization ? GraphOptimizationLevel::ORT_ENABLE_ALL
                                                               : GraphOptimizationLevel::ORT_DISABLE_ALL);
    if (config.backend == ExecutionBackend::Gpu) {
        if (!m_cudaAvailable) {
            throw EngineError(kEngineName, QStringLiteral("CUDAExecutionProvider is not available"));
        }
        OrtCUDAProviderOptions cuda{};
        options.AppendExecutionProvider_CUDA(cuda);
    }
    return options;
}

std::shared_ptr<GraphHandle> OnnxRuntimeEngine::createSession(const QByteArray& model,
                                                              const SessionConfig& config)
{
    if (!m_env) {
        throw EngineError(kEngineName, QStringLiteral("Environment not initialized"));
    }
    try {
        Ort::SessionOptions options = makeOptions(config);
        auto session = std::make_unique<Ort::Session>(*m_env, model.constData(),
                                                      static_cast<size_t>(model.size()), options);
        return std::make_shared<OnnxGraph>(std::move(session));
    } catch (const Ort::Exception& ex) {
        throw EngineError(kEngineName, QString::fromUtf8(ex.what()));
    }
}

std::shared_ptr<GraphHandle> OnnxRuntimeEngine::createSessionFromFile(const QString& path,
                                                                      const SessionConfig& config)
{
    if (!m_env) {
        throw EngineError(kEngineName, QStringLiteral("Environment not initialized"));
    }
    if (!QFile::exists(path)) {
        throw EngineError(kEngineName, QStringLiteral("Model file not found: %1").arg(path));
    }
    try {
        Ort::SessionOptions options = makeOptions(config);
#ifdef _WIN32
        const std::wstring nativePath = path.toStdWString();
#else
        const std::string nativePath = QFile::encodeName(path).toStdString();
#endif
        auto session = std::make_unique<Ort::Session>(*m_env, nativePath.c_str(), options);
        return std::make_shared<OnnxGraph>(std::move(session));
    } catch (const Ort::Exception& ex) {
        throw EngineError(kEngineName, QString::fromUtf8(ex.what()));
    }
}
