module;
#include <QByteArray>
#include <QCryptographicHash>
#include <QDate>
#include <QDateTime>
#include <QHostAddress>
#include <QRandomGenerator>
#include <QString>
#include <QStringList>
#include <QTime>
#include <QTimeZone>

#include <optional>

module relaygate.backend.certificatebuilder;

import relaygate.backend.der;
import relaygate.backend.rsakeypair;

namespace {
constexpr int kKeyBits = 2048;
constexpr quint32 kMaxSerialExclusive = 0x80000000u;
constexpr qsizetype kPemLineLength = 64;

const QString kCertificateLabel = QStringLiteral("CERTIFICATE");
const QString kPrivateKeyLabel = QStringLiteral("PRIVATE KEY");

QByteArray sha256WithRsaAlgorithm()
{
    return DerEncoder::sequence(DerEncoder::objectIdentifier({1, 2, 840, 113549, 1, 1, 11}) + DerEncoder::null());
}

QByteArray rsaEncryptionAlgorithm()
{
    return DerEncoder::sequence(DerEncoder::objectIdentifier({1, 2, 840, 113549, 1, 1, 1}) + DerEncoder::null());
}

QByteArray commonNameOid()
{
    return DerEncoder::objectIdentifier({2, 5, 4, 3});
}

QByteArray distinguishedName(const QString& commonName)
{
    const QByteArray attribute = DerEncoder::sequence(commonNameOid() + DerEncoder::directoryString(commonName));
    return DerEncoder::sequence(DerEncoder::set(attribute));
}

QByteArray subjectAltNameExtension(const QStringList& dnsNames, const QStringList& ipAddresses)
{
    QByteArray names;
    for (const QString& dns : dnsNames) {
        names.append(DerEncoder::contextPrimitive(2, dns.toLatin1()));
    }
    for (const QString& ip : ipAddresses) {
        const QHostAddress address(ip);
        if (address.protocol() == QAbstractSocket::IPv4Protocol) {
            const quint32 value = address.toIPv4Address();
            QByteArray octets;
            octets.append(static_cast<char>((value >> 24) & 0xFF));
            octets.append(static_cast<char>((value >> 16) & 0xFF));
            octets.append(static_cast<char>((value >> 8) & 0xFF));
            octets.append(static_cast<char>(value & 0xFF));
            names.append(DerEncoder::contextPrimitive(7, octets));
        } else if (address.protocol() == QAbstractSocket::IPv6Protocol) {
            const Q_IPV6ADDR value = address.toIPv6Address();
            names.append(DerEncoder::contextPrimitive(7, QByteArray(reinterpret_cast<const char*>(value.c), 16)));
        }
    }

    const QByteArray extension = DerEncoder::sequence(
        DerEncoder::objectIdentifier({2, 5, 29, 17})
        + DerEncoder::octetString(DerEncoder::sequence(names)));
    return DerEncoder::contextConstructed(3, DerEncoder::sequence(extension));
}

QByteArray stripLeadingZeros(const QByteArray& value)
{
    qsizetype first = 0;
    while (first + 1 < value.size() && value.at(first) == '\0') {
        ++first;
    }
    return value.mid(first);
}

std::optional<QList<DerElement>> childrenOf(const std::optional<DerElement>& element, quint8 tag)
{
    if (!element.has_value() || element->tag != tag) {
        return std::nullopt;
    }
    return DerReader::children(element.value());
}

QString decodeString(const DerElement& element)
{
    switch (element.tag) {
    case DerEncoder::Utf8String:
        return QString::fromUtf8(element.content);
    case DerEncoder::PrintableString:
    case DerEncoder::Ia5String:
        return QString::fromLatin1(element.content);
    default:
        return {};
    }
}

QString commonNameOf(const DerElement& name)
{
    const auto sets = DerReader::children(name);
    if (!sets.has_value()) {
        return {};
    }

    const QByteArray cnOid = commonNameOid();
    for (const DerElement& set : sets.value()) {
        const auto attributes = DerReader::children(set);
        if (!attributes.has_value()) {
            continue;
        }
        for (const DerElement& attribute : attributes.value()) {
            const auto parts = DerReader::children(attribute);
            if (!parts.has_value() || parts->size() != 2) {
                continue;
            }
            const DerElement& oid = parts->at(0);
            if (oid.tag == DerEncoder::ObjectIdentifier
                && DerEncoder::tlv(oid.tag, oid.content) == cnOid) {
                return decodeString(parts->at(1));
            }
        }
    }
    return {};
}

std::optional<QDateTime> decodeTime(const DerElement& element)
{
    const QString text = QString::fromLatin1(element.content);
    int year = 0;
    QString rest;
    if (element.tag == DerEncoder::UtcTime && text.size() == 13) {
        bool ok = false;
        const int yy = text.left(2).toInt(&ok);
        if (!ok) {
            return std::nullopt;
        }
        year = yy < 50 ? 2000 + yy : 1900 + yy;
        rest = text.mid(2);
    } else if (element.tag == DerEncoder::GeneralizedTime && text.size() == 15) {
        bool ok = false;
        year = text.left(4).toInt(&ok);
        if (!ok) {
            return std::nullopt;
        }
        rest = text.mid(4);
    } else {
        return std::nullopt;
    }

    if (!rest.endsWith(QLatin1Char('Z'))) {
        return std::nullopt;
    }

    int fields[5] {};
    for (int i = 0; i < 5; ++i) {
        bool ok = false;
        fields[i] = rest.mid(i * 2, 2).toInt(&ok);
        if (!ok) {
            return std::nullopt;
        }
    }

    const QDateTime value(QDate(year, fields[0], fields[1]),
                          QTime(fields[2], fields[3], fields[4]),
                          QTimeZone::utc());
    if (!value.isValid()) {
        return std::nullopt;
    }
    return value;
}

QString describePublicKey(const DerElement& spki)
{
    const auto parts = DerReader::children(spki);
    if (!parts.has_value() || parts->size() != 2 || parts->at(1).tag != DerEncoder::BitString
        || parts->at(1).content.size() < 2) {
        return {};
    }

    const auto keyElement = DerReader::readElement(parts->at(1).content.mid(1));
    const auto keyParts = childrenOf(keyElement, DerEncoder::Sequence);
    if (!keyParts.has_value() || keyParts->isEmpty() || keyParts->at(0).tag != DerEncoder::Integer) {
        return {};
    }

    const QByteArray modulus = stripLeadingZeros(keyParts->at(0).content);
    if (modulus.isEmpty()) {
        return {};
    }
    int leadingBits = 0;
    for (quint8 top = static_cast<quint8>(modulus.at(0)); top != 0; top >>= 1) {
        ++leadingBits;
    }
    const qsizetype bits = (modulus.size() - 1) * 8 + leadingBits;
    return QStringLiteral("RSA %1-bit").arg(bits);
}
}

bool CertificateMaterial::isValid() const
{
    return !privateKeyPem.isEmpty() && !certificatePem.isEmpty() && !fingerprint.isEmpty();
}

bool CertificateInfo::isCurrentlyValid() const
{
    const QDateTime now = QDateTime::currentDateTimeUtc();
    return notBefore.isValid() && notAfter.isValid() && now >= notBefore && now <= notAfter;
}

qint64 CertificateInfo::daysUntilExpiration() const
{
    return QDateTime::currentDateTimeUtc().secsTo(notAfter) / 86400;
}

CertificateMaterial CertificateBuilder::generate(const CertificateRequest& request)
{
    CertificateRequest effective = request;
    if (!effective.notBefore.isValid()) {
        effective.notBefore = QDateTime::currentDateTimeUtc();
    }
    if (effective.serialNumber == 0) {
        effective.serialNumber = randomSerialNumber();
    }

    const RsaKeyPair key = RsaKeyPair::generate(kKeyBits);
    const QByteArray certificateDer = selfSignedCertificate(effective, key);

    CertificateMaterial material;
    material.privateKeyPem = toPem(pkcs8PrivateKey(key), kPrivateKeyLabel);
    material.certificatePem = toPem(certificateDer, kCertificateLabel);
    material.fingerprint = fingerprint(certificateDer);
    return material;
}

QByteArray CertificateBuilder::selfSignedCertificate(const CertificateRequest& request, const RsaKeyPair& key)
{
    const QByteArray tbs = tbsCertificate(request, key);
    const QByteArray signature = key.signPkcs1Sha256(tbs);
    return DerEncoder::sequence(tbs + sha256WithRsaAlgorithm() + DerEncoder::bitString(signature));
}

QByteArray CertificateBuilder::tbsCertificate(const CertificateRequest& request, const RsaKeyPair& key)
{
    const QDateTime notBefore = request.notBefore.toUTC();
    const QDateTime notAfter = notBefore.addDays(request.validityDays);
    const QByteArray name = distinguishedName(request.commonName);

    QByteArray body;
    body.append(DerEncoder::contextConstructed(0, DerEncoder::integer(quint64 {2})));
    body.append(DerEncoder::integer(static_cast<quint64>(request.serialNumber)));
    body.append(sha256WithRsaAlgorithm());
    body.append(name);
    body.append(DerEncoder::sequence(DerEncoder::time(notBefore) + DerEncoder::time(notAfter)));
    body.append(name);
    body.append(subjectPublicKeyInfo(key));
    body.append(subjectAltNameExtension(request.dnsNames, request.ipAddresses));
    return DerEncoder::sequence(body);
}

QByteArray CertificateBuilder::subjectPublicKeyInfo(const RsaKeyPair& key)
{
    const QByteArray publicKey = DerEncoder::sequence(DerEncoder::integer(key.modulus)
                                                      + DerEncoder::integer(key.publicExponent));
    return DerEncoder::sequence(rsaEncryptionAlgorithm() + DerEncoder::bitString(publicKey));
}

QByteArray CertificateBuilder::rsaPrivateKey(const RsaKeyPair& key)
{
    QByteArray body;
    body.append(DerEncoder::integer(quint64 {0}));
    body.append(DerEncoder::integer(key.modulus));
    body.append(DerEncoder::integer(key.publicExponent));
    body.append(DerEncoder::integer(key.privateExponent));
    body.append(DerEncoder::integer(key.prime1));
    body.append(DerEncoder::integer(key.prime2));
    body.append(DerEncoder::integer(key.exponent1));
    body.append(DerEncoder::integer(key.exponent2));
    body.append(DerEncoder::integer(key.coefficient));
    return DerEncoder::sequence(body);
}

QByteArray CertificateBuilder::pkcs8PrivateKey(const RsaKeyPair& key)
{
    return DerEncoder::sequence(DerEncoder::integer(quint64 {0})
                                + rsaEncryptionAlgorithm()
                                + DerEncoder::octetString(rsaPrivateKey(key)));
}

QString CertificateBuilder::toPem(const QByteArray& der, const QString& label)
{
    const QByteArray base64 = der.toBase64();
    QString pem = QStringLiteral("-----BEGIN %1-----\n").arg(label);
    for (qsizetype offset = 0; offset < base64.size(); offset += kPemLineLength) {
        pem += QString::fromLatin1(base64.mid(offset, kPemLineLength));
        pem += QLatin1Char('\n');
    }
    pem += QStringLiteral("-----END %1-----\n").arg(label);
    return pem;
}

std::optional<QByteArray> CertificateBuilder::fromPem(const QString& pem, const QString& label)
{
    const QString begin = QStringLiteral("-----BEGIN %1-----").arg(label);
    const QString end = QStringLiteral("-----END %1-----").arg(label);

    const qsizetype beginIndex = pem.indexOf(begin);
    if (beginIndex < 0) {
        return std::nullopt;
    }
    const qsizetype bodyStart = beginIndex + begin.size();
    const qsizetype endIndex = pem.indexOf(end, bodyStart);
    if (endIndex < 0) {
        return std::nullopt;
    }

    QByteArray body;
    for (const QChar ch : QStringView(pem).mid(bodyStart, endIndex - bodyStart)) {
        if (!ch.isSpace()) {
            body.append(static_cast<char>(ch.toLatin1()));
        }
    }

    const auto decoded = QByteArray::fromBase64Encoding(body, QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded || decoded.decoded.isEmpty()) {
        return std::nullopt;
    }
    return decoded.decoded;
}

QString CertificateBuilder::fingerprint(const QByteArray& der)
{
    const QByteArray digest = QCryptographicHash::hash(der, QCryptographicHash::Sha256);
    return QString::fromLatin1(digest.toHex(':').toUpper());
}

std::optional<CertificateInfo> CertificateBuilder::inspect(const QByteArray& der)
{
    if (!DerReader::isWellFormed(der)) {
        return std::nullopt;
    }

    const auto certificate = childrenOf(DerReader::readElement(der), DerEncoder::Sequence);
    if (!certificate.has_value() || certificate->size() != 3) {
        return std::nullopt;
    }
    const auto tbs = childrenOf(certificate->at(0), DerEncoder::Sequence);
    if (!tbs.has_value()) {
        return std::nullopt;
    }

    const qsizetype base = (!tbs->isEmpty() && tbs->at(0).tag == 0xA0) ? 1 : 0;
    if (tbs->size() < base + 6) {
        return std::nullopt;
    }

    const DerElement& serial = tbs->at(base);
    const DerElement& issuer = tbs->at(base + 2);
    const auto validity = childrenOf(tbs->at(base + 3), DerEncoder::Sequence);
    const DerElement& subject = tbs->at(base + 4);
    if (serial.tag != DerEncoder::Integer || !validity.has_value() || validity->size() != 2) {
        return std::nullopt;
    }

    const auto notBefore = decodeTime(validity->at(0));
    const auto notAfter = decodeTime(validity->at(1));
    if (!notBefore.has_value() || !notAfter.has_value()) {
        return std::nullopt;
    }

    CertificateInfo info;
    info.commonName = commonNameOf(subject);
    info.issuer = commonNameOf(issuer);
    info.serialNumber = QString::fromLatin1(stripLeadingZeros(serial.content).toHex().toUpper());
    info.fingerprint = fingerprint(der);
    info.publicKeyInfo = describePublicKey(tbs->at(base + 5));
    info.notBefore = notBefore.value();
    info.notAfter = notAfter.value();
    return info;
}

quint32 CertificateBuilder::randomSerialNumber()
{
    return QRandomGenerator::system()->bounded(1u, kMaxSerialExclusive);
}
