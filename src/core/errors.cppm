/*!
 * @file        errors.cppm
 * @brief       Error taxonomy shared by the download, tokenizer, and session cores.
 * @details     Declares the exception types raised by the Kavosh core. All of
 *              them derive from QException so they can be stored in a QFuture
 *              and rethrown on the consuming side of a continuation chain.
 *
 *              - DownloadError: transport, protocol, integrity, and cancellation
 *                outcomes of a transfer.
 *              - StateError: an operation was invoked before its precondition
 *                (loaded vocabulary, loaded model, available engine) was met.
 *              - EngineError: the execution engine failed to create a session
 *                or to run a forward pass.
 *
 * @author      <a href='https://github.com/thecompez'>Kambiz Asadzadeh</a>
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     https://github.com/genyleap/kavosh/blob/main/LICENSE.md
 */

module;
#include <QException>
#include <QString>
#include <QByteArray>

#ifndef Q_MOC_RUN
export module kavosh.core.errors;
#endif

#ifdef Q_MOC_RUN
#define KAVOSH_MODULE_EXPORT
#else
#define KAVOSH_MODULE_EXPORT export
#endif

/**
 * @brief Failure of a download task.
 *
 * The kind decides how the Download Manager reacts:
 * - Transport: retried until the attempt budget is spent.
 * - Protocol: terminal, the server answered with a non-2xx status.
 * - Integrity: terminal, the payload digest did not match the expected one.
 * - Cancelled: the caller cancelled the download; not a fault.
 */
KAVOSH_MODULE_EXPORT class DownloadError : public QException {
public:
    enum class Kind {
        Transport,          //!< Connection dropped, timed out, or stream truncated.
        Protocol,           //!< Non-2xx HTTP status.
        Integrity,          //!< Checksum mismatch.
        Cancelled           //!< Cancelled through cancelDownload().
    };

    /**
     * @brief Construct a download error.
     * @param kind Failure category.
     * @param name Download name.
     * @param message Human-readable description.
     * @param httpStatus HTTP status code, 0 when none was received.
     * @param attempts Number of transfer attempts made.
     */
    DownloadError(Kind kind,
                  const QString& name,
                  const QString& message,
                  int httpStatus = 0,
                  int attempts = 0);

    void raise() const override { throw *this; }
    DownloadError* clone() const override { return new DownloadError(*this); }
    const char* what() const noexcept override { return m_what.constData(); }

    //!< @brief Return the failure category.
    Kind kind() const { return m_kind; }

    //!< @brief Return the download name.
    QString name() const { return m_name; }

    //!< @brief Return the description.
    QString message() const { return m_message; }

    //!< @brief Return the HTTP status, 0 when none.
    int httpStatus() const { return m_httpStatus; }

    //!< @brief Return the number of transfer attempts made.
    int attempts() const { return m_attempts; }

    //!< @brief Whether the Download Manager may retry this failure.
    bool isRetryable() const { return m_kind == Kind::Transport; }

    //!< @brief Return the category as a short lowercase string.
    static QString kindName(Kind kind);

private:
    Kind m_kind;
    QString m_name;
    QString m_message;
    int m_httpStatus = 0;
    int m_attempts = 0;
    QByteArray m_what;
};

/**
 * @brief An operation was invoked while its component was in the wrong state.
 *
 * Raised synchronously by the offending call. These are contract violations
 * of the caller, e.g. encode() before the vocabulary is loaded or
 * runInference() before a model is loaded.
 */
KAVOSH_MODULE_EXPORT class StateError : public QException {
public:
    /**
     * @brief Construct a state error.
     * @param component Component reporting the error (e.g. "Tokenizer").
     * @param message Missing precondition.
     */
    StateError(const QString& component, const QString& message);

    void raise() const override { throw *this; }
    StateError* clone() const override { return new StateError(*this); }
    const char* what() const noexcept override { return m_what.constData(); }

    //!< @brief Return the reporting component.
    QString component() const { return m_component; }

    //!< @brief Return the description.
    QString message() const { return m_message; }

private:
    QString m_component;
    QString m_message;
    QByteArray m_what;
};

/**
 * @brief Failure reported by an execution engine.
 *
 * Wraps backend-specific exceptions (e.g. Ort::Exception) so that session
 * creation and forward-pass failures reach the caller through QFuture.
 */
KAVOSH_MODULE_EXPORT class EngineError : public QException {
public:
    /**
     * @brief Construct an engine error.
     * @param engine Engine name (e.g. "onnxruntime").
     * @param message Backend message.
     */
    EngineError(const QString& engine, const QString& message);

    void raise() const override { throw *this; }
    EngineError* clone() const override { return new EngineError(*this); }
    const char* what() const noexcept override { return m_what.constData(); }

    QString engine() const { return m_engine; }
    QString message() const { return m_message; }

private:
    QString m_engine;
    QString m_message;
    QByteArray m_what;
};
