module;
#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QLatin1Char>
#include <QList>
#include <QString>
#include <QTime>

#include <initializer_list>
#include <optional>

module relaygate.backend.der;

namespace {
constexpr int kMaxNestingDepth = 32;

QByteArray base128(quint64 value)
{
    QByteArray out;
    out.prepend(static_cast<char>(value & 0x7F));
    value >>= 7;
    while (value > 0) {
        out.prepend(static_cast<char>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    return out;
}

QString twoDigits(int value)
{
    return QStringLiteral("%1").arg(value, 2, 10, QLatin1Char('0'));
}
}

QByteArray DerEncoder::length(qsizetype length)
{
    QByteArray out;
    if (length < 0x80) {
        out.append(static_cast<char>(length));
        return out;
    }

    quint64 remaining = static_cast<quint64>(length);
    while (remaining > 0) {
        out.prepend(static_cast<char>(remaining & 0xFF));
        remaining >>= 8;
    }
    out.prepend(static_cast<char>(0x80 | out.size()));
    return out;
}

QByteArray DerEncoder::tlv(quint8 tag, const QByteArray& content)
{
    QByteArray out;
    out.reserve(content.size() + 6);
    out.append(static_cast<char>(tag));
    out.append(length(content.size()));
    out.append(content);
    return out;
}

QByteArray DerEncoder::sequence(const QByteArray& content)
{
    return tlv(Sequence, content);
}

QByteArray DerEncoder::set(const QByteArray& content)
{
    return tlv(Set, content);
}

QByteArray DerEncoder::octetString(const QByteArray& content)
{
    return tlv(OctetString, content);
}

QByteArray DerEncoder::null()
{
    return tlv(Null, QByteArray());
}

QByteArray DerEncoder::integer(const QByteArray& magnitude)
{
    qsizetype firstSignificant = 0;
    while (firstSignificant < magnitude.size() && magnitude.at(firstSignificant) == '\0') {
        ++firstSignificant;
    }

    QByteArray content = magnitude.mid(firstSignificant);
    if (content.isEmpty()) {
        content.append('\0');
    } else if ((static_cast<quint8>(content.at(0)) & 0x80) != 0) {
        content.prepend('\0');
    }
    return tlv(Integer, content);
}

QByteArray DerEncoder::integer(quint64 value)
{
    QByteArray magnitude;
    while (value > 0) {
        magnitude.prepend(static_cast<char>(value & 0xFF));
        value >>= 8;
    }
    return integer(magnitude);
}

QByteArray DerEncoder::bitString(const QByteArray& bits)
{
    QByteArray content;
    content.reserve(bits.size() + 1);
    content.append('\0');
    content.append(bits);
    return tlv(BitString, content);
}

QByteArray DerEncoder::objectIdentifier(std::initializer_list<quint32> arcs)
{
    QByteArray content;
    if (arcs.size() >= 2) {
        auto it = arcs.begin();
        const quint64 first = *it++;
        const quint64 second = *it++;
        content.append(base128(first * 40 + second));
        for (; it != arcs.end(); ++it) {
            content.append(base128(*it));
        }
    }
    return tlv(ObjectIdentifier, content);
}

QByteArray DerEncoder::directoryString(const QString& value)
{
    return isPrintable(value) ? printableString(value) : utf8String(value);
}

QByteArray DerEncoder::printableString(const QString& value)
{
    return tlv(PrintableString, value.toLatin1());
}

QByteArray DerEncoder::utf8String(const QString& value)
{
    return tlv(Utf8String, value.toUtf8());
}

QByteArray DerEncoder::time(const QDateTime& dateTime)
{
    const QDateTime utc = dateTime.toUTC();
    const QDate date = utc.date();
    const QTime clock = utc.time();

    const QString tail = twoDigits(date.month())
        + twoDigits(date.day())
        + twoDigits(clock.hour())
        + twoDigits(clock.minute())
        + twoDigits(clock.second())
        + QLatin1Char('Z');

    if (date.year() >= 1950 && date.year() < 2050) {
        return tlv(UtcTime, (twoDigits(date.year() % 100) + tail).toLatin1());
    }
    return tlv(GeneralizedTime, (QStringLiteral("%1").arg(date.year(), 4, 10, QLatin1Char('0')) + tail).toLatin1());
}

QByteArray DerEncoder::contextConstructed(int number, const QByteArray& content)
{
    return tlv(static_cast<quint8>(0xA0 | (number & 0x1F)), content);
}

QByteArray DerEncoder::contextPrimitive(int number, const QByteArray& content)
{
    return tlv(static_cast<quint8>(0x80 | (number & 0x1F)), content);
}

bool DerEncoder::isPrintable(const QString& value)
{
    static const QString punctuation = QStringLiteral(" '()+,-./:=?");
    for (const QChar ch : value) {
        const char16_t c = ch.unicode();
        const bool alnum = (c >= u'A' && c <= u'Z') || (c >= u'a' && c <= u'z') || (c >= u'0' && c <= u'9');
        if (!alnum && !punctuation.contains(ch)) {
            return false;
        }
    }
    return true;
}

std::optional<DerElement> DerReader::readElement(const QByteArray& data, qsizetype offset)
{
    if (offset < 0 || offset + 2 > data.size()) {
        return std::nullopt;
    }

    DerElement element;
    element.offset = offset;
    element.tag = static_cast<quint8>(data.at(offset));
    if ((element.tag & 0x1F) == 0x1F) {
        return std::nullopt;
    }

    const quint8 first = static_cast<quint8>(data.at(offset + 1));
    qsizetype contentLength = 0;
    qsizetype header = 2;
    if (first < 0x80) {
        contentLength = first;
    } else {
        const int count = first & 0x7F;
        if (count == 0 || count > 4 || offset + 2 + count > data.size()) {
            return std::nullopt;
        }
        if (data.at(offset + 2) == '\0') {
            return std::nullopt;
        }
        for (int i = 0; i < count; ++i) {
            contentLength = (contentLength << 8) | static_cast<quint8>(data.at(offset + 2 + i));
        }
        if (contentLength < 0x80) {
            return std::nullopt;
        }
        header += count;
    }

    if (offset + header + contentLength > data.size()) {
        return std::nullopt;
    }

    element.headerSize = header;
    element.content = data.mid(offset + header, contentLength);
    return element;
}

std::optional<QList<DerElement>> DerReader::children(const DerElement& element)
{
    QList<DerElement> result;
    qsizetype position = 0;
    while (position < element.content.size()) {
        const auto child = readElement(element.content, position);
        if (!child.has_value()) {
            return std::nullopt;
        }
        position += child->totalSize();
        result.append(child.value());
    }
    return result;
}

bool DerReader::isWellFormed(const QByteArray& data)
{
    const auto root = readElement(data, 0);
    if (!root.has_value() || root->totalSize() != data.size()) {
        return false;
    }
    return isWellFormedElement(root.value(), 0);
}

bool DerReader::isWellFormedElement(const DerElement& element, int depth)
{
    if (!element.isConstructed()) {
        return true;
    }
    if (depth >= kMaxNestingDepth) {
        return false;
    }

    const auto nested = children(element);
    if (!nested.has_value()) {
        return false;
    }
    for (const DerElement& child : nested.value()) {
        if (!isWellFormedElement(child, depth + 1)) {
            return false;
        }
    }
    return true;
}
