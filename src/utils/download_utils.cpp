module;
#include <QByteArray>
#include <QCryptographicHash>
#include <QFileInfo>
#include <QRegularExpression>
#include <QUrlQuery>
#include <QtGlobal>

module kavosh.utils.download_utils;

namespace kavosh::utils {

QString normalizeFilePath(const QString& path)
{
    if (path.startsWith("file://")) {
        QUrl url(path);
        if (url.isValid() && url.isLocalFile()) {
            return url.toLocalFile();
        }
    }
    return path;
}

QString decodeQueryValue(const QString& value)
{
    QString v = value;
    v.replace('+', ' ');
    return QUrl::fromPercentEncoding(v.toUtf8());
}

QString filenameFromDisposition(const QString& value)
{
    const QString decoded = decodeQueryValue(value);
    if (decoded.isEmpty()) return QString();
    static const QRegularExpression re(QStringLiteral("filename\\*?=(?:UTF-8''|\"?)([^\";]+)"));
    auto match = re.match(decoded);
    if (match.hasMatch()) return match.captured(1).trimmed();
    return QString();
}

QString fileNameFromUrl(const QUrl& url)
{
    if (!url.isValid()) return QString();
    QUrlQuery query(url);
    QString disp = query.queryItemValue(QStringLiteral("response-content-disposition"));
    if (disp.isEmpty()) disp = query.queryItemValue(QStringLiteral("content-disposition"));
    if (!disp.isEmpty()) {
        const QString fromDisp = filenameFromDisposition(disp);
        if (!fromDisp.isEmpty()) return fromDisp;
    }
    const QString filename = query.queryItemValue(QStringLiteral("filename"));
    if (!filename.isEmpty()) return decodeQueryValue(filename);

    return QFileInfo(url.path()).fileName();
}

bool isRemoteUrl(const QUrl& url)
{
    const QString scheme = url.scheme().toLower();
    return scheme == QStringLiteral("http") || scheme == QStringLiteral("https");
}

bool isHttpSuccess(int status)
{
    return status >= 200 && status < 300;
}

QString normalizeChecksum(const QString& value)
{
    QString out = value.trimmed().toLower();
    out.remove(' ');
    return out;
}

QString sha256Hex(const QByteArray& payload)
{
    return QString::fromLatin1(QCryptographicHash::hash(payload, QCryptographicHash::Sha256).toHex());
}

qreal percentageOf(qint64 loaded, qint64 total)
{
    if (total <= 0) return -1.0;
    const qreal pct = (static_cast<qreal>(loaded) / static_cast<qreal>(total)) * 100.0;
    return qBound<qreal>(0.0, pct, 100.0);
}

QString formatBytes(qint64 bytes)
{
    if (bytes < 0) return QStringLiteral("?");
    static const char* units[] = { "B", "KB", "MB", "GB", "TB" };
    qreal value = static_cast<qreal>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) return QStringLiteral("%1 B").arg(bytes);
    return QStringLiteral("%1 %2").arg(value, 0, 'f', 1).arg(QLatin1String(units[unit]));
}

} // namespace kavosh::utils
