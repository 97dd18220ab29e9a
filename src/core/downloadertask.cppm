/*!
 * @file        downloadertask.cppm
 * @brief       In-memory download task execution and lifecycle management.
 * @details     Implements a single HTTP transfer streamed into memory, with
 *              chunk-level progress reporting, cooperative cancellation, and
 *              classification of failures into transport and protocol errors.
 *
 *              This class represents the lowest-level active unit of work
 *              in the download system and encapsulates the networking,
 *              buffering, and state transitions required to fetch one remote
 *              artifact. Retry and integrity policies are applied by the
 *              DownloadManager that owns the task.
 *
 *              DownloaderTask is designed to be:
 *              - Observable (via Qt properties and signals)
 *              - Restartable after a failed attempt
 *              - Cancellable at every chunk boundary
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QObject>
#include <QByteArray>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QElapsedTimer>
#include <QStringList>
#include <QUrl>

#include <optional>

#ifndef Q_MOC_RUN
export module kavosh.core.downloadertask;
export import kavosh.core.errors;
#endif

#ifdef Q_MOC_RUN
#define KAVOSH_MODULE_EXPORT
#else
#define KAVOSH_MODULE_EXPORT export
#endif

/**
 * @brief Description of one file to fetch.
 *
 * expectedSize and expectedChecksum are optional: 0 and an empty string mean
 * "not known in advance".
 */
KAVOSH_MODULE_EXPORT struct DownloadRequest {
    QUrl url;                       //!< Source URL.
    QString name;                   //!< Destination name, unique among tracked downloads.
    qint64 expectedSize = 0;        //!< Expected byte length, 0 when unknown.
    QString expectedChecksum;       //!< Expected SHA-256 hex digest, empty when none.
};

/**
 * @brief Represents a single downloadable resource held in memory.
 *
 * DownloaderTask manages one transfer at a time:
 * - Network request setup and execution
 * - Streaming of the response body into a memory buffer
 * - Detection of HTTP status failures and transport failures
 * - Detection of bodies shorter than the announced Content-Length
 * - Emission of progress and state signals
 *
 * This class is intentionally self-contained and does not enforce retry or
 * integrity policies; those are handled by DownloadManager.
 */
KAVOSH_MODULE_EXPORT class DownloaderTask : public QObject {

    Q_OBJECT

    //!< @brief Current task state string.
    Q_PROPERTY(QString stateString READ stateString NOTIFY stateChanged)

    //!< @brief Log lines for this task.
    Q_PROPERTY(QStringList logLines READ logLines NOTIFY logLinesChanged)

public:
    /**
     * @brief Construct a new download task.
     * @param manager Network access manager used to issue requests.
     * @param request File description.
     * @param parent Optional parent QObject.
     */
    explicit DownloaderTask(QNetworkAccessManager* manager,
                            const DownloadRequest& request,
                            QObject* parent = nullptr);

    //!< @brief Start one transfer attempt.
    void start();

    //!< @brief Discard the previous attempt and start a new one.
    void restart();

    /**
     * @brief Request cooperative cancellation.
     *
     * A running transfer stops at its next chunk boundary (or when the reply
     * finishes, whichever comes first) and finishes with a Cancelled error.
     * A task that has not started yet finishes immediately.
     */
    void cancel();

    //!< @brief Return the download name.
    QString name() const { return m_request.name; }

    //!< @brief Return the source URL.
    QUrl url() const { return m_request.url; }

    //!< @brief Return the file description.
    const DownloadRequest& request() const { return m_request; }

    //!< @brief Return the number of attempts started so far.
    int attempts() const { return m_attempts; }

    //!< @brief Return bytes received by the current attempt.
    qint64 bytesReceived() const { return m_received; }

    /**
     * @brief Return the byte length of the payload, if known.
     *
     * Taken from the Content-Length header when the server sends one,
     * otherwise from the expected size of the request, otherwise -1.
     */
    qint64 bytesTotal() const;

    //!< @brief Return the payload received so far.
    const QByteArray& payload() const { return m_payload; }

    //!< @brief Move the payload out of the task.
    QByteArray takePayload();

    //!< @brief Return the failure of the last attempt, if any.
    const std::optional<DownloadError>& lastError() const { return m_lastError; }

    //!< @brief Whether cancel() was called.
    bool cancelRequested() const { return m_cancelRequested; }

    //!< @brief Check if the task is currently running.
    bool isRunning() const { return m_state == State::Downloading; }

    //!< @brief Check if the task was canceled.
    bool isCanceled() const { return m_state == State::Canceled; }

    //!< @brief Return the human-readable state string.
    QString stateString() const;

    /**
     * @brief Set the stall timeout applied to each request.
     * @param ms Timeout in milliseconds, 0 disables it.
     */
    void setTransferTimeout(int ms) { m_transferTimeoutMs = ms; }

    //!< @brief Return log lines.
    QStringList logLines() const { return m_logLines; }

    /**
     * @brief Append a log line.
     * @param line Log line.
     */
    void appendLog(const QString& line);

signals:
    /**
     * @brief Emitted after every received chunk.
     * @param bytesReceived Received bytes.
     * @param bytesTotal Total bytes, -1 when unknown.
     */
    void progress(qint64 bytesReceived, qint64 bytesTotal);

    /**
     * @brief Emitted when an attempt finishes.
     * @param success Whether the attempt succeeded.
     */
    void finished(bool success);

    //!< @brief Emitted when task state changes.
    void stateChanged();

    //!< @brief Emitted when log lines change.
    void logLinesChanged();

private:

    /**
     * @brief Internal task state machine.
     */
    enum class State {
        Idle,               //!< Task is created or waiting for a retry, not running.
        Downloading,        //!< Task is actively transferring data.
        Finished,           //!< Task has completed (success or failure).
        Canceled            //!< Task was explicitly canceled.
    };

    QNetworkAccessManager* m_manager = nullptr;     //!< Network manager.
    QNetworkReply* m_reply = nullptr;               //!< Active network reply.
    DownloadRequest m_request;                      //!< File description.

    State m_state = State::Idle;            //!< Current state.
    bool m_cancelRequested = false;         //!< Cooperative cancel flag.
    int m_attempts = 0;                     //!< Attempts started.
    int m_httpStatus = 0;                   //!< HTTP status of the current attempt.
    qint64 m_contentLength = -1;            //!< Content-Length of the current attempt.
    qint64 m_received = 0;                  //!< Bytes received by the current attempt.
    QByteArray m_payload;                   //!< Received body.
    std::optional<DownloadError> m_lastError; //!< Failure of the last attempt.
    int m_transferTimeoutMs = 0;            //!< Request stall timeout.
    QElapsedTimer m_attemptTimer;           //!< Attempt duration timer.
    QStringList m_logLines;                 //!< Log line list.
    int m_logLimit = 200;                   //!< Log line limit.

    //!< @brief Handle response headers.
    void onMetaDataChanged();

    //!< @brief Handle one received chunk.
    void onReadyRead();

    //!< @brief Handle reply completion.
    void onReplyFinished();

    /**
     * @brief Finish the attempt with an error.
     * @param kind Failure category.
     * @param message Description.
     */
    void fail(DownloadError::Kind kind, const QString& message);

    //!< @brief Finish the task as canceled.
    void finishCanceled();

    //!< @brief Disconnect, abort, and release the active reply.
    void dropReply();
};

#include "downloadertask.moc"
