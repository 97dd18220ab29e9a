module;
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QDebug>
#include <QPointer>
#include <QSslError>

#include <optional>
#include <utility>

module kavosh.core.downloadertask;

import kavosh.utils.download_utils;

namespace utils = kavosh::utils;

DownloaderTask::DownloaderTask(QNetworkAccessManager* manager,
                               const DownloadRequest& request,
                               QObject* parent)
    : QObject(parent),
    m_manager(manager),
    m_request(request)
{
    if (m_request.name.isEmpty()) {
        m_request.name = utils::fileNameFromUrl(m_request.url);
    }
}

qint64 DownloaderTask::bytesTotal() const
{
    if (m_contentLength > 0) return m_contentLength;
    if (m_request.expectedSize > 0) return m_request.expectedSize;
    return -1;
}

QByteArray DownloaderTask::takePayload()
{
    return std::exchange(m_payload, QByteArray());
}

void DownloaderTask::appendLog(const QString& line)
{
    if (line.trimmed().isEmpty()) return;
    m_logLines.append(line);
    while (m_logLines.size() > m_logLimit) {
        m_logLines.removeFirst();
    }
    emit logLinesChanged();
}

void DownloaderTask::start()
{
    if (m_state != State::Idle)
        return;

    if (m_cancelRequested) {
        finishCanceled();
        return;
    }

    ++m_attempts;
    m_lastError.reset();
    m_httpStatus = 0;
    m_contentLength = -1;
    m_received = 0;
    m_payload.clear();

    const QUrl activeUrl = m_request.url;
    if (!activeUrl.isValid() || activeUrl.isEmpty()) {
        m_state = State::Downloading;
        fail(DownloadError::Kind::Protocol, QStringLiteral("Invalid URL: %1").arg(activeUrl.toString()));
        return;
    }

    qDebug() << "DownloaderTask::start for" << activeUrl << "attempt" << m_attempts;
    appendLog(QStringLiteral("Start (attempt %1): %2").arg(m_attempts).arg(activeUrl.toString()));
    m_state = State::Downloading;
    emit stateChanged();
    m_attemptTimer.start();

    if (m_request.expectedSize > 0) {
        m_payload.reserve(m_request.expectedSize);
    }

    QNetworkRequest req(activeUrl);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);
    req.setRawHeader("User-Agent", "kavosh/1.0");
    if (m_transferTimeoutMs > 0) {
        req.setTransferTimeout(m_transferTimeoutMs);
    }

    QNetworkReply* reply = m_manager->get(req);
    m_reply = reply;
    QPointer<QNetworkReply> replyPtr(reply);

    connect(reply, &QNetworkReply::metaDataChanged, this, [this, replyPtr]() {
        if (!replyPtr || replyPtr != m_reply) return;
        onMetaDataChanged();
    });

    connect(reply, &QNetworkReply::errorOccurred, this, [this, replyPtr](QNetworkReply::NetworkError err) {
        if (!replyPtr || replyPtr != m_reply) return;
        if (err == QNetworkReply::OperationCanceledError || m_cancelRequested)
            return;
        qWarning() << "GET error:" << m_request.name << replyPtr->errorString();
        appendLog(QStringLiteral("GET error: %1").arg(replyPtr->errorString()));
    });
#if QT_CONFIG(ssl)
    connect(reply, &QNetworkReply::sslErrors, this, [](const QList<QSslError>& errors) {
        qWarning() << "GET SSL errors:" << errors;
    });
#endif

    connect(reply, &QNetworkReply::readyRead, this, [this, replyPtr]() {
        if (!replyPtr || replyPtr != m_reply) return;
        onReadyRead();
    });

    connect(reply, &QNetworkReply::finished, this, [this, replyPtr]() {
        if (!replyPtr) return;
        if (replyPtr != m_reply) {
            replyPtr->deleteLater();
            return;
        }
        onReplyFinished();
    });
}

void DownloaderTask::onMetaDataChanged()
{
    const QVariant status = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (status.isValid()) {
        m_httpStatus = status.toInt();
    }
    const QVariant cl = m_reply->header(QNetworkRequest::ContentLengthHeader);
    if (cl.isValid() && cl.toLongLong() > 0) {
        m_contentLength = cl.toLongLong();
        if (m_payload.capacity() < m_contentLength) {
            m_payload.reserve(m_contentLength);
        }
    } else if (m_httpStatus != 0) {
        qDebug() << "No Content-Length for" << m_request.name << "-> byte count progress only";
    }
}

void DownloaderTask::onReadyRead()
{
    if (m_state != State::Downloading)
        return;

    // chunk boundary: the only place a running transfer observes cancellation
    if (m_cancelRequested) {
        finishCanceled();
        return;
    }

    const QByteArray data = m_reply->readAll();
    if (m_httpStatus != 0 && !utils::isHttpSuccess(m_httpStatus)) {
        // error page body, not part of the payload
        return;
    }
    if (data.isEmpty()) return;

    m_payload.append(data);
    m_received += data.size();
    emit progress(m_received, bytesTotal());
}

void DownloaderTask::onReplyFinished()
{
    if (m_state != State::Downloading) {
        dropReply();
        return;
    }

    if (m_cancelRequested) {
        finishCanceled();
        return;
    }

    const QVariant status = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (status.isValid()) {
        m_httpStatus = status.toInt();
    }

    if (m_httpStatus != 0 && !utils::isHttpSuccess(m_httpStatus)) {
        const QString reason = m_reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
        fail(DownloadError::Kind::Protocol,
             QStringLiteral("HTTP error %1%2").arg(m_httpStatus).arg(reason.isEmpty() ? QString() : QStringLiteral(": ") + reason));
        return;
    }

    if (m_reply->error() != QNetworkReply::NoError) {
        fail(DownloadError::Kind::Transport, m_reply->errorString());
        return;
    }

    // drain anything readyRead has not delivered yet
    const QByteArray rest = m_reply->readAll();
    if (!rest.isEmpty()) {
        m_payload.append(rest);
        m_received += rest.size();
        emit progress(m_received, bytesTotal());
    }

    if (m_contentLength > 0 && m_received < m_contentLength) {
        fail(DownloadError::Kind::Transport,
             QStringLiteral("Stream truncated at %1 of %2 bytes").arg(m_received).arg(m_contentLength));
        return;
    }

    dropReply();
    qDebug() << "DownloaderTask finished" << m_request.name << utils::formatBytes(m_received)
             << "in" << m_attemptTimer.elapsed() << "ms";
    appendLog(QStringLiteral("Done: %1").arg(utils::formatBytes(m_received)));
    m_state = State::Finished;
    emit stateChanged();
    emit finished(true);
}

void DownloaderTask::fail(DownloadError::Kind kind, const QString& message)
{
    dropReply();
    m_lastError.emplace(kind, m_request.name, message, m_httpStatus, m_attempts);
    qWarning() << "DownloaderTask failed:" << m_request.name << DownloadError::kindName(kind) << message;
    appendLog(QStringLiteral("Failed (%1): %2").arg(DownloadError::kindName(kind), message));
    m_state = State::Finished;
    emit stateChanged();
    emit finished(false);
}

void DownloaderTask::finishCanceled()
{
    dropReply();
    m_payload.clear();
    m_lastError.emplace(DownloadError::Kind::Cancelled, m_request.name,
                        QStringLiteral("Download cancelled"), m_httpStatus, m_attempts);
    qDebug() << "DownloaderTask canceled" << m_request.name << "after" << m_received << "bytes";
    appendLog(QStringLiteral("Canceled"));
    m_state = State::Canceled;
    emit stateChanged();
    emit finished(false);
}

void DownloaderTask::dropReply()
{
    if (!m_reply) return;
    QNetworkReply* reply = m_reply;
    m_reply = nullptr;
    QObject::disconnect(reply, nullptr, this, nullptr);
    if (reply->isRunning()) reply->abort();
    reply->deleteLater();
}

void DownloaderTask::restart()
{
    if (m_state == State::Downloading || m_state == State::Canceled)
        return;
    appendLog(QStringLiteral("Restart requested"));
    dropReply();
    m_state = State::Idle;
    emit stateChanged();
    start();
}

void DownloaderTask::cancel()
{
    if (m_state == State::Canceled || m_cancelRequested)
        return;

    qDebug() << "Cancel requested for" << m_request.name;
    appendLog(QStringLiteral("Cancel requested"));
    m_cancelRequested = true;
    if (m_state == State::Idle) {
        finishCanceled();
    }
}

QString DownloaderTask::stateString() const
{
    if (m_lastError && m_state == State::Finished)
        return "Error";
    switch (m_state) {
    case State::Idle: return "Queued";
    case State::Downloading: return "Active";
    case State::Finished: return "Done";
    case State::Canceled: return "Canceled";
    }
    return "Unknown";
}
