module;
#include <QChar>
#include <QRegularExpression>
#include <QString>

#include <optional>

module kavosh.utils.text_utils;

namespace kavosh::utils {

QString collapseWhitespace(const QString& text)
{
    static const QRegularExpression re(QStringLiteral("\\s+"));
    QString out = text;
    out.replace(re, QStringLiteral(" "));
    return out;
}

QString toWordBoundaryMarkers(const QString& text)
{
    QString out = text;
    out.replace(QLatin1Char(' '), QChar(kWordBoundaryMarker));
    return out;
}

QString fromWordBoundaryMarkers(const QString& text)
{
    QString out = text;
    out.replace(QChar(kWordBoundaryMarker), QLatin1Char(' '));
    return out;
}

qsizetype codePointLength(const QString& text, qsizetype pos)
{
    if (pos + 1 < text.size()
        && text.at(pos).isHighSurrogate()
        && text.at(pos + 1).isLowSurrogate()) {
        return 2;
    }
    return 1;
}

QString formatBytePiece(quint8 byte)
{
    return QStringLiteral("<0x%1>").arg(QString::number(byte, 16).toUpper().rightJustified(2, QLatin1Char('0')));
}

std::optional<quint8> parseBytePiece(const QString& piece)
{
    if (piece.size() != 6 || !piece.startsWith(QStringLiteral("<0x")) || !piece.endsWith(QLatin1Char('>')))
        return std::nullopt;
    bool ok = false;
    const uint value = QStringView(piece).mid(3, 2).toUInt(&ok, 16);
    if (!ok || value > 0xFF)
        return std::nullopt;
    return static_cast<quint8>(value);
}

} // namespace kavosh::utils
