module;
#include <QException>
#include <QString>
#include <QByteArray>

module kavosh.core.errors;

DownloadError::DownloadError(Kind kind,
                             const QString& name,
                             const QString& message,
                             int httpStatus,
                             int attempts)
    : m_kind(kind),
    m_name(name),
    m_message(message),
    m_httpStatus(httpStatus),
    m_attempts(attempts)
{
    m_what = QStringLiteral("[%1] %2: %3").arg(kindName(kind), name, message).toUtf8();
}

QString DownloadError::kindName(Kind kind)
{
    switch (kind) {
    case Kind::Transport: return QStringLiteral("transport");
    case Kind::Protocol: return QStringLiteral("protocol");
    case Kind::Integrity: return QStringLiteral("integrity");
    case Kind::Cancelled: return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

StateError::StateError(const QString& component, const QString& message)
    : m_component(component),
    m_message(message)
{
    m_what = QStringLiteral("%1: %2").arg(component, message).toUtf8();
}

EngineError::EngineError(const QString& engine, const QString& message)
    : m_engine(engine),
    m_message(message)
{
    m_what = QStringLiteral("%1: %2").arg(engine, message).toUtf8();
}
