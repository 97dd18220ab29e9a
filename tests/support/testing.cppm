/*!
 * @file        testing.cppm
 * @brief       Test doubles shared by the Kavosh unit tests.
 * @details     Scripted network access manager and replies, a fake execution
 *              engine with its graph handle, and helpers that spin the event
 *              loop until a future settles.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QByteArray>
#include <QEventLoop>
#include <QFuture>
#include <QFutureWatcher>
#include <QHash>
#include <QList>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QPointer>
#include <QStringList>
#include <QThread>
#include <QTimer>
#include <QUrl>
#include <QElapsedTimer>
#include <QCoreApplication>

#include <atomic>
#include <cstring>
#include <functional>
#include <memory>
#include <optional>

export module kavosh.testing;
export import kavosh.core.executionengine;

export namespace kavosh::testing {

//!< @brief Scripted outcome of one GET.
struct FakeResponse {
    int httpStatus = 200;                               //!< 0 for a pure transport failure.
    QList<QByteArray> chunks;                           //!< Body, delivered one chunk per tick.
    bool sendContentLength = true;                      //!< Announce the body length.
    qint64 announcedLength = -1;                        //!< Overrides the announced length when > 0.
    QNetworkReply::NetworkError error = QNetworkReply::NoError;
    int chunkIntervalMs = 0;                            //!< Delay between chunks.

    static FakeResponse ok(const QList<QByteArray>& chunks, bool sendContentLength = true)
    {
        FakeResponse r;
        r.chunks = chunks;
        r.sendContentLength = sendContentLength;
        return r;
    }

    static FakeResponse transportFailure()
    {
        FakeResponse r;
        r.httpStatus = 0;
        r.error = QNetworkReply::ConnectionRefusedError;
        return r;
    }

    static FakeResponse status(int code)
    {
        FakeResponse r;
        r.httpStatus = code;
        r.chunks = { QByteArray("error page") };
        r.error = QNetworkReply::ContentNotFoundError;
        return r;
    }
};

class FakeReply : public QNetworkReply {
public:
    FakeReply(const QNetworkRequest& request, const FakeResponse& response, QObject* parent)
        : QNetworkReply(parent),
        m_response(response)
    {
        setRequest(request);
        setUrl(request.url());
        setOperation(QNetworkAccessManager::GetOperation);
        open(QIODevice::ReadOnly | QIODevice::Unbuffered);
        QTimer::singleShot(0, this, [this]() { sendMetaData(); });
    }

    void abort() override
    {
        if (isFinished()) return;
        m_aborted = true;
        setError(QNetworkReply::OperationCanceledError, QStringLiteral("Operation canceled"));
        setFinished(true);
        emit errorOccurred(QNetworkReply::OperationCanceledError);
        emit finished();
    }

    qint64 bytesAvailable() const override
    {
        return m_buffer.size() + QNetworkReply::bytesAvailable();
    }

protected:
    qint64 readData(char* data, qint64 maxSize) override
    {
        const qint64 n = qMin<qint64>(maxSize, m_buffer.size());
        if (n <= 0) return isFinished() ? -1 : 0;
        std::memcpy(data, m_buffer.constData(), static_cast<size_t>(n));
        m_buffer.remove(0, n);
        return n;
    }

private:
    void sendMetaData()
    {
        if (m_aborted) return;
        if (m_response.httpStatus > 0) {
            setAttribute(QNetworkRequest::HttpStatusCodeAttribute, m_response.httpStatus);
            qint64 length = 0;
            for (const QByteArray& c : std::as_const(m_response.chunks)) length += c.size();
            if (m_response.announcedLength > 0) length = m_response.announcedLength;
            if (m_response.sendContentLength) {
                setHeader(QNetworkRequest::ContentLengthHeader, length);
            }
            emit metaDataChanged();
        }
        scheduleNext();
    }

    void scheduleNext()
    {
        QTimer::singleShot(m_response.chunkIntervalMs, this, [this]() { deliverNext(); });
    }

    void deliverNext()
    {
        if (m_aborted) return;
        if (m_response.httpStatus > 0 && m_next < m_response.chunks.size()) {
            m_buffer.append(m_response.chunks.at(m_next++));
            emit readyRead();
            if (!m_aborted) scheduleNext();
            return;
        }
        if (m_response.error != QNetworkReply::NoError) {
            setError(m_response.error, QStringLiteral("Scripted network error"));
            emit errorOccurred(m_response.error);
        }
        setFinished(true);
        emit finished();
    }

    FakeResponse m_response;
    QByteArray m_buffer;
    qsizetype m_next = 0;
    bool m_aborted = false;
};

/**
 * @brief Network access manager answering GETs from a per-URL script.
 *
 * Attempt n of a URL receives the n-th scripted response; the last response
 * repeats once the script is exhausted.
 */
class FakeNetworkAccessManager : public QNetworkAccessManager {
public:
    using QNetworkAccessManager::QNetworkAccessManager;

    void script(const QUrl& url, const QList<FakeResponse>& responses) { m_scripts.insert(url, responses); }

    int requestCount(const QUrl& url) const { return m_hits.value(url); }

    QList<QUrl> requestOrder() const { return m_order; }

protected:
    QNetworkReply* createRequest(Operation op,
                                 const QNetworkRequest& request,
                                 QIODevice* outgoingData) override
    {
        Q_UNUSED(op);
        Q_UNUSED(outgoingData);
        const QUrl url = request.url();
        const int attempt = m_hits.value(url);
        m_hits[url] = attempt + 1;
        m_order.append(url);

        const QList<FakeResponse> responses = m_scripts.value(url);
        FakeResponse response = FakeResponse::status(404);
        if (!responses.isEmpty()) {
            response = responses.at(qMin<qsizetype>(attempt, responses.size() - 1));
        }
        return new FakeReply(request, response, this);
    }

private:
    QHash<QUrl, QList<FakeResponse>> m_scripts;
    QHash<QUrl, int> m_hits;
    QList<QUrl> m_order;
};

//!< @brief Produces the last-position logits for a token context.
using LogitsFunction = std::function<QList<float>(const QList<qint64>& ids)>;

class FakeGraph : public GraphHandle {
public:
    FakeGraph(QStringList inputs, QStringList outputs, LogitsFunction logits, int runDelayMs, bool failRuns)
        : m_inputs(std::move(inputs)),
        m_outputs(std::move(outputs)),
        m_logits(std::move(logits)),
        m_runDelayMs(runDelayMs),
        m_failRuns(failRuns)
    {
    }

    QStringList inputNames() const override { return m_inputs; }
    QStringList outputNames() const override { return m_outputs; }

    TensorMap run(const TensorMap& inputs) override
    {
        if (m_released) throw EngineError(QStringLiteral("fake"), QStringLiteral("Session released"));
        if (m_runDelayMs > 0) QThread::msleep(static_cast<unsigned long>(m_runDelayMs));
        ++runs;
        if (m_failRuns) throw EngineError(QStringLiteral("fake"), QStringLiteral("Scripted run failure"));

        const QList<qint64> ids = inputs.value(QStringLiteral("input_ids")).toInt64();
        lastInputNames = inputs.keys();
        const QList<float> row = m_logits ? m_logits(ids) : QList<float>{ 0.0f, 1.0f };

        TensorMap outputs;
        outputs.insert(QStringLiteral("logits"),
                       Tensor::fromFloats(row, { 1, 1, static_cast<qint64>(row.size()) }));
        return outputs;
    }

    void release() override { m_released = true; }

    bool isReleased() const { return m_released; }

    std::atomic<int> runs { 0 };
    QStringList lastInputNames;

private:
    QStringList m_inputs;
    QStringList m_outputs;
    LogitsFunction m_logits;
    int m_runDelayMs = 0;
    bool m_failRuns = false;
    std::atomic<bool> m_released { false };
};

/**
 * @brief Execution engine double creating FakeGraph sessions.
 */
class FakeEngine : public ExecutionEngine {
public:
    bool available = true;
    bool gpuSupported = false;
    bool failGpuSessions = false;
    bool failAllSessions = false;
    bool failRuns = false;
    int runDelayMs = 0;
    QStringList inputs { QStringLiteral("input_ids"), QStringLiteral("attention_mask") };
    QStringList outputs { QStringLiteral("logits") };
    LogitsFunction logits;

    QString name() const override { return QStringLiteral("fake"); }
    bool isAvailable() const override { return available; }
    bool supportsBackend(ExecutionBackend backend) const override
    {
        return backend == ExecutionBackend::Portable || gpuSupported;
    }

    std::shared_ptr<GraphHandle> createSession(const QByteArray& model, const SessionConfig& config) override
    {
        if (model.isEmpty()) throw EngineError(name(), QStringLiteral("Empty model"));
        return makeGraph(config);
    }

    std::shared_ptr<GraphHandle> createSessionFromFile(const QString& path, const SessionConfig& config) override
    {
        lastPath = path;
        return makeGraph(config);
    }

    std::atomic<int> sessionsCreated { 0 };
    QList<ExecutionBackend> attemptedBackends;
    QString lastPath;
    std::shared_ptr<FakeGraph> lastGraph;

private:
    std::shared_ptr<GraphHandle> makeGraph(const SessionConfig& config)
    {
        attemptedBackends.append(config.backend);
        if (failAllSessions || (failGpuSessions && config.backend == ExecutionBackend::Gpu)) {
            throw EngineError(name(), QStringLiteral("Scripted session failure on %1")
                                          .arg(executionBackendName(config.backend)));
        }
        ++sessionsCreated;
        lastGraph = std::make_shared<FakeGraph>(inputs, outputs, logits, runDelayMs, failRuns);
        return lastGraph;
    }
};

/**
 * @brief Spin the event loop until the future finishes.
 * @return Whether it finished before the timeout.
 */
template <typename T>
bool waitFor(const QFuture<T>& future, int timeoutMs = 5000)
{
    if (future.isFinished()) return true;
    QEventLoop loop;
    QFutureWatcher<T> watcher;
    QObject::connect(&watcher, &QFutureWatcherBase::finished, &loop, &QEventLoop::quit);
    QTimer::singleShot(timeoutMs, &loop, &QEventLoop::quit);
    watcher.setFuture(future);
    loop.exec();
    return future.isFinished();
}

//!< @brief Spin the event loop until the predicate holds.
inline bool waitUntil(const std::function<bool()>& predicate, int timeoutMs = 5000)
{
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeoutMs) return false;
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
    return true;
}

/**
 * @brief Wait for a future and capture the exception it holds.
 * @return The exception, or std::nullopt when the future succeeded.
 */
template <typename E, typename T>
std::optional<E> failureOf(const QFuture<T>& future, int timeoutMs = 5000)
{
    QFuture<T> f = future;
    if (!waitFor(f, timeoutMs)) return std::nullopt;
    try {
        f.waitForFinished();
    } catch (const E& e) {
        return e;
    }
    return std::nullopt;
}

} // namespace kavosh::testing
