module;
#include <QByteArray>
#include <QList>
#include <QString>

#include <cstring>
#include <stdexcept>

module kavosh.core.executionengine;

namespace {

template <typename T>
QByteArray packValues(const QList<T>& values)
{
    return QByteArray(reinterpret_cast<const char*>(values.constData()),
                      static_cast<qsizetype>(values.size() * sizeof(T)));
}

template <typename T>
QList<T> unpackValues(const QByteArray& data)
{
    QList<T> values(data.size() / static_cast<qsizetype>(sizeof(T)));
    if (!values.isEmpty()) {
        std::memcpy(values.data(), data.constData(), static_cast<size_t>(values.size()) * sizeof(T));
    }
    return values;
}

} // namespace

QString tensorTypeName(TensorType type)
{
    switch (type) {
    case TensorType::Float32: return QStringLiteral("float32");
    case TensorType::Int64: return QStringLiteral("int64");
    case TensorType::Int32: return QStringLiteral("int32");
    }
    return QStringLiteral("unknown");
}

TensorType tensorTypeFromName(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == QLatin1String("float32") || n == QLatin1String("float")) return TensorType::Float32;
    if (n == QLatin1String("int64")) return TensorType::Int64;
    if (n == QLatin1String("int32")) return TensorType::Int32;
    throw std::invalid_argument("Unsupported tensor type: " + name.toStdString());
}

qsizetype tensorElementSize(TensorType type)
{
    switch (type) {
    case TensorType::Float32: return sizeof(float);
    case TensorType::Int64: return sizeof(qint64);
    case TensorType::Int32: return sizeof(qint32);
    }
    return 0;
}

QString executionBackendName(ExecutionBackend backend)
{
    return backend == ExecutionBackend::Gpu ? QStringLiteral("gpu") : QStringLiteral("portable");
}

qint64 Tensor::elementCountOf(const QList<qint64>& shape)
{
    qint64 count = 1;
    for (qint64 dim : shape) {
        if (dim < 0) {
            throw std::invalid_argument("Tensor dimensions must be non-negative");
        }
        count *= dim;
    }
    return count;
}

Tensor::Tensor(TensorType type, const QList<qint64>& shape, const QByteArray& data)
    : m_type(type),
    m_shape(shape),
    m_data(data)
{
    const qint64 expected = elementCountOf(shape) * tensorElementSize(type);
    if (expected != data.size()) {
        throw std::invalid_argument(QStringLiteral("Tensor data holds %1 bytes, shape needs %2")
                                        .arg(data.size()).arg(expected).toStdString());
    }
}

Tensor Tensor::fromFloats(const QList<float>& values, const QList<qint64>& shape)
{
    return Tensor(TensorType::Float32, shape, packValues(values));
}

Tensor Tensor::fromInt64(const QList<qint64>& values, const QList<qint64>& shape)
{
    return Tensor(TensorType::Int64, shape, packValues(values));
}

Tensor Tensor::fromInt32(const QList<qint32>& values, const QList<qint64>& shape)
{
    return Tensor(TensorType::Int32, shape, packValues(values));
}

void Tensor::requireType(TensorType type) const
{
    if (m_type != type) {
        throw std::invalid_argument(QStringLiteral("Tensor is %1, not %2")
                                        .arg(tensorTypeName(m_type), tensorTypeName(type)).toStdString());
    }
}

QList<float> Tensor::toFloats() const
{
    requireType(TensorType::Float32);
    return unpackValues<float>(m_data);
}

QList<qint64> Tensor::toInt64() const
{
    requireType(TensorType::Int64);
    return unpackValues<qint64>(m_data);
}

QList<qint32> Tensor::toInt32() const
{
    requireType(TensorType::Int32);
    return unpackValues<qint32>(m_data);
}
