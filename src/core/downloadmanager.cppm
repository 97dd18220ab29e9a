/*!
 * @file        downloadmanager.cppm
 * @brief       Central download orchestration, retry, and integrity manager.
 * @details     Provides the high-level controller responsible for creating,
 *              tracking, retrying, and validating in-memory download tasks,
 *              and for combining several of them into one package download.
 *
 *              Responsibilities include:
 *              - Single-file downloads resolved through QFuture
 *              - Multi-file downloads with aggregate, monotonic progress
 *              - Retry with fixed or exponential backoff on transport failures
 *              - SHA-256 checksum calculation and validation
 *              - Cooperative cancellation by download name
 *
 *              Progress is published both to per-call callbacks and to Qt
 *              signals, so any number of observers can subscribe.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QByteArray>
#include <QFuture>
#include <QHash>
#include <QList>
#include <QNetworkAccessManager>
#include <QStringList>
#include <QUrl>

#include <functional>
#include <memory>

#ifndef Q_MOC_RUN
export module kavosh.core.downloadmanager;
export import kavosh.core.errors;
export import kavosh.core.downloadertask;
#endif

#ifdef Q_MOC_RUN
#define KAVOSH_MODULE_EXPORT
#else
#define KAVOSH_MODULE_EXPORT export
#endif

/**
 * @brief How a progress value should be interpreted.
 *
 * Percentage is only meaningful when the total length is known; without it
 * progress degrades to byte counts.
 */
KAVOSH_MODULE_EXPORT enum class ProgressMode {
    Percentage,         //!< total and percentage are valid.
    BytesOnly           //!< total is unknown, percentage is -1.
};

//!< @brief Delay growth between retry attempts.
KAVOSH_MODULE_EXPORT enum class BackoffMode {
    Fixed,              //!< Every retry waits retryDelayMs.
    Exponential         //!< Retry n waits retryDelayMs * 2^(n-1).
};

//!< @brief What to do with a payload whose checksum does not match.
KAVOSH_MODULE_EXPORT enum class IntegrityPolicy {
    Discard,            //!< Fail the download with an Integrity error.
    Keep                //!< Resolve with the payload and ChecksumState::Mismatch.
};

//!< @brief Outcome of the post-download checksum check.
KAVOSH_MODULE_EXPORT enum class ChecksumState {
    None,               //!< No expected checksum was supplied.
    Ok,                 //!< Digest matched.
    Mismatch            //!< Digest differed (only with IntegrityPolicy::Keep).
};

//!< @brief Progress of one file.
KAVOSH_MODULE_EXPORT struct DownloadProgress {
    QString fileName;                       //!< Download name.
    qint64 loaded = 0;                      //!< Bytes received by the current attempt.
    qint64 total = -1;                      //!< Expected bytes, -1 when unknown.
    qreal percentage = -1.0;                //!< 0..100, -1 in BytesOnly mode.
    ProgressMode mode = ProgressMode::BytesOnly;
    int attempt = 1;                        //!< Current attempt number.
};

//!< @brief Progress of a multi-file download.
KAVOSH_MODULE_EXPORT struct AggregateProgress {
    qint64 loaded = 0;                      //!< Bytes received across all files.
    qint64 total = 0;                       //!< Expected bytes across all files.
    qreal percentage = -1.0;                //!< Non-decreasing; 100 only when every file completed.
    ProgressMode mode = ProgressMode::BytesOnly;
    int filesCompleted = 0;                 //!< Files fully downloaded.
    int filesTotal = 0;                     //!< Files requested.
};

//!< @brief Per-call download options.
KAVOSH_MODULE_EXPORT struct DownloadOptions {
    int maxRetries = 3;                     //!< Total transfer attempts, including the first.
    int retryDelayMs = 1000;                //!< Base delay between attempts.
    BackoffMode backoff = BackoffMode::Exponential;
    QString expectedChecksum;               //!< Expected SHA-256 hex digest.
    qint64 expectedSize = 0;                //!< Expected byte length, 0 when unknown.
    IntegrityPolicy integrityPolicy = IntegrityPolicy::Discard;
    int transferTimeoutMs = 0;              //!< Request stall timeout, 0 disables it.
    std::function<void(const DownloadProgress&)> onProgress; //!< Per-file progress observer.
};

//!< @brief A completed download.
KAVOSH_MODULE_EXPORT struct DownloadResult {
    QString name;                           //!< Download name.
    QUrl url;                               //!< Source URL.
    QByteArray payload;                     //!< Received bytes.
    QString checksum;                       //!< Actual SHA-256 digest, empty when not computed.
    ChecksumState checksumState = ChecksumState::None;
    int attempts = 0;                       //!< Transfer attempts used.
};

//!< @brief Observer of aggregate progress.
KAVOSH_MODULE_EXPORT using AggregateProgressCallback = std::function<void(const AggregateProgress&)>;

/**
 * @brief Central coordinator for in-memory download tasks.
 *
 * DownloadManager maintains the authoritative table of in-flight downloads,
 * keyed by download name. Every transfer runs on the thread that owns the
 * manager; results are delivered through QFuture.
 *
 * Failure semantics:
 * - Transport errors are retried up to DownloadOptions::maxRetries attempts.
 * - Protocol (HTTP status) errors fail immediately.
 * - Checksum mismatches fail with an Integrity error unless the policy is Keep.
 * - cancelDownload() makes the transfer fail with a Cancelled error.
 */
KAVOSH_MODULE_EXPORT class DownloadManager : public QObject {

    Q_OBJECT

    //!< @brief Maximum number of concurrent transfers inside downloadMultiple().
    Q_PROPERTY(int maxConcurrent READ maxConcurrent WRITE setMaxConcurrent NOTIFY maxConcurrentChanged)

    //!< @brief Number of currently tracked downloads.
    Q_PROPERTY(int activeCount READ activeCount NOTIFY countsChanged)

public:
    /**
     * @brief Construct a DownloadManager.
     * @param network Network access manager to use; a private one is created when null.
     * @param parent Optional parent QObject.
     */
    explicit DownloadManager(QNetworkAccessManager* network = nullptr, QObject* parent = nullptr);

    ~DownloadManager() override;

    /**
     * @brief Download one file into memory.
     *
     * @param url Source URL.
     * @param name Download name; derived from the URL when empty.
     * @param options Retry, checksum, and progress options.
     * @return Future resolving to the result, or holding a DownloadError.
     * @throws StateError if a download with the same name is already tracked.
     */
    QFuture<DownloadResult> downloadFile(const QUrl& url,
                                         const QString& name,
                                         const DownloadOptions& options = {});

    /**
     * @brief Download several files as one operation.
     *
     * Files are initiated in input order, at most maxConcurrent() at a time.
     * Results keep input order. The first terminal failure cancels the
     * remaining transfers and fails the whole operation.
     *
     * Per-file expectedSize and expectedChecksum take precedence over the
     * values in options.
     *
     * @param files Files to download.
     * @param onOverallProgress Observer of aggregate progress.
     * @param options Options applied to every file.
     * @return Future resolving to one result per input file.
     * @throws StateError if a name is duplicated or already tracked.
     */
    QFuture<QList<DownloadResult>> downloadMultiple(const QList<DownloadRequest>& files,
                                                    AggregateProgressCallback onOverallProgress = {},
                                                    const DownloadOptions& options = {});

    /**
     * @brief Compare the SHA-256 digest of a payload with an expected value.
     *
     * Comparison ignores case and surrounding whitespace. Never throws.
     *
     * @param payload Bytes to check.
     * @param expectedHexDigest Expected hex digest.
     * @return true when the digests match.
     */
    static bool validateChecksum(const QByteArray& payload, const QString& expectedHexDigest);

    /**
     * @brief Compute the SHA-256 digest of a payload.
     * @param payload Bytes to hash.
     * @return Lowercase hex digest.
     */
    static QString calculateChecksum(const QByteArray& payload);

    /**
     * @brief Cancel a tracked download.
     *
     * Removes the download from tracking; its transfer loop exits with a
     * Cancelled error at the next chunk boundary.
     *
     * @param name Download name.
     * @return true if a tracked download was found.
     */
    bool cancelDownload(const QString& name);

    //!< @brief Whether a download with this name is tracked.
    bool isTracking(const QString& name) const { return m_transfers.contains(name); }

    //!< @brief Return the names of tracked downloads.
    QStringList trackedNames() const { return m_transfers.keys(); }

    //!< @brief Return the number of tracked downloads.
    int activeCount() const { return static_cast<int>(m_transfers.size()); }

    //!< @brief Return the multi-file concurrency limit.
    int maxConcurrent() const { return m_maxConcurrent; }

    /**
     * @brief Set the multi-file concurrency limit.
     * @param v Limit, clamped to at least 1.
     */
    void setMaxConcurrent(int v);

    /**
     * @brief Compute the delay before the next attempt.
     * @param options Retry options.
     * @param failedAttempts Attempts already made (>= 1).
     * @return Delay in milliseconds.
     */
    static int retryDelayFor(const DownloadOptions& options, int failedAttempts);

signals:
    /**
     * @brief Emitted after every chunk of every tracked download.
     * @param progress Per-file progress.
     */
    void progress(const DownloadProgress& progress);

    /**
     * @brief Emitted whenever the aggregate progress of a multi-file download changes.
     * @param progress Aggregate progress.
     */
    void overallProgress(const AggregateProgress& progress);

    /**
     * @brief Emitted when a transport failure is about to be retried.
     * @param name Download name.
     * @param nextAttempt Number of the upcoming attempt.
     * @param delayMs Delay before it starts.
     */
    void retrying(const QString& name, int nextAttempt, int delayMs);

    /**
     * @brief Emitted when a download leaves tracking.
     * @param name Download name.
     * @param success Whether it produced a result.
     */
    void downloadFinished(const QString& name, bool success);

    //!< @brief Emitted when the concurrency limit changes.
    void maxConcurrentChanged();

    //!< @brief Emitted when the tracked count changes.
    void countsChanged();

private:
    struct Transfer;
    struct Batch;

    using SuccessHandler = std::function<void(DownloadResult)>;
    using FailureHandler = std::function<void(const DownloadError&)>;
    using ProgressHandler = std::function<void(const DownloadProgress&)>;

    /**
     * @brief Create, track, and start a task.
     * @param request File description.
     * @param options Options for this file.
     * @param onSuccess Called once with the result.
     * @param onFailure Called once with the terminal error.
     * @param onProgress Internal progress hook (aggregate tracking).
     * @return Tracking record of the started task.
     * @throws StateError if the name is already tracked.
     */
    std::shared_ptr<Transfer> launch(const DownloadRequest& request,
                const DownloadOptions& options,
                SuccessHandler onSuccess,
                FailureHandler onFailure,
                ProgressHandler onProgress = {});

    /**
     * @brief Apply retry and integrity policy to a finished attempt.
     * @param transfer Tracking record.
     * @param success Whether the attempt succeeded.
     */
    void onTaskFinished(const std::shared_ptr<Transfer>& transfer, bool success);

    //!< @brief Verify the payload of a successful attempt and settle the record.
    void completeTransfer(const std::shared_ptr<Transfer>& transfer, DownloadResult result);

    //!< @brief Settle the record with a terminal error.
    void failTransfer(const std::shared_ptr<Transfer>& transfer, const DownloadError& error);

    //!< @brief Request cooperative cancellation of a record.
    void cancelTransfer(const std::shared_ptr<Transfer>& transfer);

    //!< @brief Remove a record from tracking and dispose of its task.
    void untrack(const std::shared_ptr<Transfer>& transfer);

    //!< @brief Start queued files of a batch up to the concurrency limit.
    void pumpBatch(const std::shared_ptr<Batch>& batch);

    //!< @brief Recompute and publish the aggregate progress of a batch.
    void publishBatchProgress(const std::shared_ptr<Batch>& batch);

    QNetworkAccessManager* m_network = nullptr;                 //!< Network manager.
    QHash<QString, std::shared_ptr<Transfer>> m_transfers;      //!< Tracking table.
    int m_maxConcurrent = 2;                                    //!< Concurrency limit.
};

#include "downloadmanager.moc"
