module;
#include <QDebug>
#include <QFuture>
#include <QPointer>
#include <QPromise>
#include <QSet>
#include <QTimer>
#include <QtConcurrent>

#include <algorithm>
#include <limits>
#include <memory>
#include <optional>
#include <utility>

module kavosh.core.downloadmanager;

import kavosh.utils.download_utils;

namespace utils = kavosh::utils;

namespace {
// A batch never reports 100 before its last file is complete.
constexpr qreal kIncompleteCeiling = 99.9;
constexpr int kMaxBackoffShift = 16;
}

struct DownloadManager::Transfer {
    QPointer<DownloaderTask> task;
    DownloadRequest request;
    DownloadOptions options;
    SuccessHandler onSuccess;
    FailureHandler onFailure;
    ProgressHandler onProgress;
    bool cancelled = false;
    bool settled = false;
};

struct DownloadManager::Batch {
    QList<DownloadRequest> files;
    DownloadOptions options;
    AggregateProgressCallback callback;
    std::shared_ptr<QPromise<QList<DownloadResult>>> promise;
    QList<std::optional<DownloadResult>> results;
    QList<std::weak_ptr<Transfer>> transfers;
    QList<qint64> loaded;
    QList<qint64> totals;
    int next = 0;
    int running = 0;
    int completed = 0;
    qreal lastPercentage = -1.0;
    bool failed = false;
};

DownloadManager::DownloadManager(QNetworkAccessManager* network, QObject* parent)
    : QObject(parent),
    m_network(network)
{
    if (!m_network) {
        m_network = new QNetworkAccessManager(this);
    }
}

DownloadManager::~DownloadManager()
{
    for (const auto& transfer : std::as_const(m_transfers)) {
        if (transfer->task) {
            QObject::disconnect(transfer->task, nullptr, this, nullptr);
        }
    }
    m_transfers.clear();
}

void DownloadManager::setMaxConcurrent(int v)
{
    v = qMax(1, v);
    if (m_maxConcurrent == v) return;
    m_maxConcurrent = v;
    emit maxConcurrentChanged();
}

int DownloadManager::retryDelayFor(const DownloadOptions& options, int failedAttempts)
{
    const int base = qMax(0, options.retryDelayMs);
    if (options.backoff == BackoffMode::Fixed || failedAttempts <= 1)
        return base;
    const int shift = qMin(failedAttempts - 1, kMaxBackoffShift);
    const qint64 delay = static_cast<qint64>(base) << shift;
    return static_cast<int>(qMin<qint64>(delay, std::numeric_limits<int>::max()));
}

bool DownloadManager::validateChecksum(const QByteArray& payload, const QString& expectedHexDigest)
{
    const QString expected = utils::normalizeChecksum(expectedHexDigest);
    if (expected.isEmpty()) return false;
    return calculateChecksum(payload) == expected;
}

QString DownloadManager::calculateChecksum(const QByteArray& payload)
{
    return utils::sha256Hex(payload);
}

QFuture<DownloadResult> DownloadManager::downloadFile(const QUrl& url,
                                                      const QString& name,
                                                      const DownloadOptions& options)
{
    DownloadRequest request;
    request.url = url;
    request.name = name.isEmpty() ? utils::fileNameFromUrl(url) : name;
    request.expectedSize = options.expectedSize;
    request.expectedChecksum = options.expectedChecksum;

    if (m_transfers.contains(request.name)) {
        throw StateError(QStringLiteral("DownloadManager"),
                         QStringLiteral("Download already in progress: %1").arg(request.name));
    }

    auto promise = std::make_shared<QPromise<DownloadResult>>();
    QFuture<DownloadResult> future = promise->future();
    promise->start();

    launch(request, options,
           [promise](DownloadResult result) {
               promise->addResult(std::move(result));
               promise->finish();
           },
           [promise](const DownloadError& error) {
               promise->setException(error);
               promise->finish();
           });
    return future;
}

QFuture<QList<DownloadResult>> DownloadManager::downloadMultiple(const QList<DownloadRequest>& files,
                                                                 AggregateProgressCallback onOverallProgress,
                                                                 const DownloadOptions& options)
{
    auto batch = std::make_shared<Batch>();
    batch->options = options;
    batch->callback = std::move(onOverallProgress);

    QSet<QString> names;
    for (DownloadRequest request : files) {
        if (request.name.isEmpty()) {
            request.name = utils::fileNameFromUrl(request.url);
        }
        if (names.contains(request.name) || m_transfers.contains(request.name)) {
            throw StateError(QStringLiteral("DownloadManager"),
                             QStringLiteral("Duplicate download name: %1").arg(request.name));
        }
        names.insert(request.name);
        batch->files.append(request);
        batch->totals.append(request.expectedSize > 0 ? request.expectedSize : -1);
    }
    batch->results.resize(batch->files.size());
    batch->transfers.resize(batch->files.size());
    batch->loaded.fill(0, batch->files.size());

    batch->promise = std::make_shared<QPromise<QList<DownloadResult>>>();
    QFuture<QList<DownloadResult>> future = batch->promise->future();
    batch->promise->start();

    qInfo() << "DownloadManager: batch of" << batch->files.size() << "files, concurrency" << m_maxConcurrent;

    if (batch->files.isEmpty()) {
        publishBatchProgress(batch);
        batch->promise->addResult(QList<DownloadResult>());
        batch->promise->finish();
        return future;
    }

    pumpBatch(batch);
    return future;
}

void DownloadManager::pumpBatch(const std::shared_ptr<Batch>& batch)
{
    while (!batch->failed
           && batch->running < m_maxConcurrent
           && batch->next < batch->files.size()) {
        const int index = batch->next++;
        ++batch->running;

        auto onSuccess = [this, batch, index](DownloadResult result) {
            --batch->running;
            if (batch->failed) return;
            batch->loaded[index] = result.payload.size();
            batch->totals[index] = result.payload.size();
            batch->results[index] = std::move(result);
            ++batch->completed;
            publishBatchProgress(batch);

            if (batch->completed == batch->files.size()) {
                QList<DownloadResult> ordered;
                ordered.reserve(batch->results.size());
                for (auto& r : batch->results) {
                    ordered.append(std::move(*r));
                }
                batch->promise->addResult(std::move(ordered));
                batch->promise->finish();
                return;
            }
            pumpBatch(batch);
        };

        auto onFailure = [this, batch](const DownloadError& error) {
            --batch->running;
            if (batch->failed) return;
            batch->failed = true;
            qWarning() << "DownloadManager: batch failed:" << error.what();
            for (const auto& weak : std::as_const(batch->transfers)) {
                if (auto sibling = weak.lock()) {
                    if (!sibling->settled) cancelTransfer(sibling);
                }
            }
            batch->promise->setException(error);
            batch->promise->finish();
        };

        auto onProgress = [this, batch, index](const DownloadProgress& p) {
            if (batch->failed) return;
            batch->loaded[index] = p.loaded;
            if (p.total > 0) batch->totals[index] = p.total;
            publishBatchProgress(batch);
        };

        try {
            batch->transfers[index] = launch(batch->files.at(index), batch->options,
                                             std::move(onSuccess), std::move(onFailure),
                                             std::move(onProgress));
        } catch (const StateError& e) {
            --batch->running;
            batch->failed = true;
            for (const auto& weak : std::as_const(batch->transfers)) {
                if (auto sibling = weak.lock()) {
                    if (!sibling->settled) cancelTransfer(sibling);
                }
            }
            batch->promise->setException(e);
            batch->promise->finish();
            return;
        }
    }
}

void DownloadManager::publishBatchProgress(const std::shared_ptr<Batch>& batch)
{
    AggregateProgress agg;
    agg.filesTotal = static_cast<int>(batch->files.size());
    agg.filesCompleted = batch->completed;

    bool allKnown = true;
    for (int i = 0; i < batch->files.size(); ++i) {
        agg.loaded += batch->loaded.at(i);
        if (batch->totals.at(i) > 0)
            agg.total += batch->totals.at(i);
        else if (!batch->results.at(i))
            allKnown = false;
    }

    const bool done = batch->completed == batch->files.size();
    if (done) {
        agg.mode = ProgressMode::Percentage;
        agg.percentage = 100.0;
    } else if (allKnown && agg.total > 0) {
        agg.mode = ProgressMode::Percentage;
        const qreal raw = qMin(utils::percentageOf(agg.loaded, agg.total), kIncompleteCeiling);
        agg.percentage = qMax(raw, batch->lastPercentage);
    } else {
        agg.mode = ProgressMode::BytesOnly;
        agg.percentage = batch->lastPercentage;
    }
    batch->lastPercentage = agg.percentage;

    if (batch->callback) batch->callback(agg);
    emit overallProgress(agg);
}

std::shared_ptr<DownloadManager::Transfer> DownloadManager::launch(const DownloadRequest& request,
                                                                   const DownloadOptions& options,
                                                                   SuccessHandler onSuccess,
                                                                   FailureHandler onFailure,
                                                                   ProgressHandler onProgress)
{
    auto transfer = std::make_shared<Transfer>();
    transfer->request = request;
    if (transfer->request.name.isEmpty()) {
        transfer->request.name = utils::fileNameFromUrl(request.url);
    }
    if (transfer->request.expectedChecksum.isEmpty()) {
        transfer->request.expectedChecksum = options.expectedChecksum;
    }
    if (transfer->request.expectedSize <= 0) {
        transfer->request.expectedSize = options.expectedSize;
    }
    transfer->options = options;
    transfer->onSuccess = std::move(onSuccess);
    transfer->onFailure = std::move(onFailure);
    transfer->onProgress = std::move(onProgress);

    const QString name = transfer->request.name;
    if (m_transfers.contains(name)) {
        throw StateError(QStringLiteral("DownloadManager"),
                         QStringLiteral("Download already in progress: %1").arg(name));
    }

    auto* task = new DownloaderTask(m_network, transfer->request, this);
    task->setTransferTimeout(options.transferTimeoutMs);
    transfer->task = task;
    m_transfers.insert(name, transfer);

    connect(task, &DownloaderTask::progress, this, [this, transfer](qint64 received, qint64 total) {
        if (transfer->settled) return;
        DownloadProgress p;
        p.fileName = transfer->request.name;
        p.loaded = received;
        p.total = total;
        p.attempt = transfer->task ? transfer->task->attempts() : 1;
        if (total > 0) {
            p.mode = ProgressMode::Percentage;
            p.percentage = utils::percentageOf(received, total);
        }
        if (transfer->options.onProgress) transfer->options.onProgress(p);
        if (transfer->onProgress) transfer->onProgress(p);
        emit progress(p);
    });
    connect(task, &DownloaderTask::finished, this, [this, transfer](bool success) {
        onTaskFinished(transfer, success);
    });

    emit countsChanged();
    task->start();
    return transfer;
}

void DownloadManager::onTaskFinished(const std::shared_ptr<Transfer>& transfer, bool success)
{
    DownloaderTask* task = transfer->task;
    if (!task || transfer->settled) return;

    const QString name = transfer->request.name;

    if (success) {
        DownloadResult result;
        result.name = name;
        result.url = transfer->request.url;
        result.payload = task->takePayload();
        result.attempts = task->attempts();
        completeTransfer(transfer, std::move(result));
        return;
    }

    const DownloadError error = task->lastError().value_or(
        DownloadError(DownloadError::Kind::Transport, name,
                      QStringLiteral("Transfer failed"), 0, task->attempts()));

    if (transfer->cancelled || error.kind() == DownloadError::Kind::Cancelled) {
        failTransfer(transfer, DownloadError(DownloadError::Kind::Cancelled, name,
                                             QStringLiteral("Download cancelled"),
                                             error.httpStatus(), task->attempts()));
        return;
    }

    const int maxAttempts = qMax(1, transfer->options.maxRetries);
    const int attempts = task->attempts();
    if (error.isRetryable() && attempts < maxAttempts) {
        const int delay = retryDelayFor(transfer->options, attempts);
        qInfo() << "DownloadManager: retrying" << name << "attempt" << attempts + 1
                << "of" << maxAttempts << "in" << delay << "ms";
        task->appendLog(QStringLiteral("Retrying in %1 ms").arg(delay));
        emit retrying(name, attempts + 1, delay);

        QPointer<DownloaderTask> taskPtr(task);
        QTimer::singleShot(delay, this, [transfer, taskPtr]() {
            if (!taskPtr || transfer->settled) return;
            taskPtr->restart();
        });
        return;
    }

    failTransfer(transfer, error);
}

void DownloadManager::completeTransfer(const std::shared_ptr<Transfer>& transfer, DownloadResult result)
{
    const QString expected = utils::normalizeChecksum(transfer->request.expectedChecksum);
    if (expected.isEmpty()) {
        result.checksumState = ChecksumState::None;
        transfer->settled = true;
        untrack(transfer);
        emit downloadFinished(result.name, true);
        if (transfer->onSuccess) transfer->onSuccess(std::move(result));
        return;
    }

    const QByteArray payload = result.payload;
    QtConcurrent::run([payload]() { return DownloadManager::calculateChecksum(payload); })
        .then(this, [this, transfer, result = std::move(result), expected](const QString& actual) mutable {
            if (transfer->settled) return;
            if (transfer->cancelled) {
                failTransfer(transfer, DownloadError(DownloadError::Kind::Cancelled, result.name,
                                                     QStringLiteral("Download cancelled"),
                                                     0, result.attempts));
                return;
            }

            result.checksum = actual;
            if (actual == expected) {
                result.checksumState = ChecksumState::Ok;
            } else if (transfer->options.integrityPolicy == IntegrityPolicy::Keep) {
                qWarning() << "DownloadManager: checksum mismatch kept for" << result.name
                           << "expected" << expected << "got" << actual;
                result.checksumState = ChecksumState::Mismatch;
            } else {
                failTransfer(transfer, DownloadError(DownloadError::Kind::Integrity, result.name,
                                                     QStringLiteral("Checksum mismatch: expected %1, got %2")
                                                         .arg(expected, actual),
                                                     0, result.attempts));
                return;
            }

            transfer->settled = true;
            untrack(transfer);
            emit downloadFinished(result.name, true);
            if (transfer->onSuccess) transfer->onSuccess(std::move(result));
        });
}

void DownloadManager::failTransfer(const std::shared_ptr<Transfer>& transfer, const DownloadError& error)
{
    if (transfer->settled) return;
    transfer->settled = true;
    if (error.kind() != DownloadError::Kind::Cancelled) {
        qWarning() << "DownloadManager:" << error.what();
    }
    untrack(transfer);
    emit downloadFinished(transfer->request.name, false);
    if (transfer->onFailure) transfer->onFailure(error);
}

bool DownloadManager::cancelDownload(const QString& name)
{
    const auto transfer = m_transfers.value(name);
    if (!transfer) return false;
    cancelTransfer(transfer);
    return true;
}

void DownloadManager::cancelTransfer(const std::shared_ptr<Transfer>& transfer)
{
    const QString name = transfer->request.name;
    qDebug() << "DownloadManager: cancel" << name;
    transfer->cancelled = true;
    if (m_transfers.value(name) == transfer) {
        m_transfers.remove(name);
        emit countsChanged();
    }

    DownloaderTask* task = transfer->task;
    if (!task) return;
    task->cancel();

    // Between attempts nothing reaches a chunk boundary; settle now.
    if (!task->isRunning() && !transfer->settled) {
        failTransfer(transfer, DownloadError(DownloadError::Kind::Cancelled, name,
                                             QStringLiteral("Download cancelled"),
                                             0, task->attempts()));
    }
}

void DownloadManager::untrack(const std::shared_ptr<Transfer>& transfer)
{
    const QString name = transfer->request.name;
    if (m_transfers.value(name) == transfer) {
        m_transfers.remove(name);
        emit countsChanged();
    }
    if (transfer->task) {
        QObject::disconnect(transfer->task, nullptr, this, nullptr);
        transfer->task->deleteLater();
        transfer->task = nullptr;
    }
}
