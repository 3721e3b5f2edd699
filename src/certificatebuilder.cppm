/*!
 * @file        certificatebuilder.cppm
 * @brief       Self-signed X.509 and PKCS#8 assembly by hand.
 *
 * @details
 * Builds a version 3 self-signed certificate (SHA-256 with RSA, single CN
 * name, UTCTime validity, SubjectAltName extension) and the matching PKCS#8
 * private key directly from DER builders. Also provides the PEM armor,
 * SHA-256 fingerprint, and a small reader that extracts display information
 * from an existing certificate.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QDateTime>
#include <QString>
#include <QStringList>
#include <QtTypes>

#include <optional>

#ifndef Q_MOC_RUN
export module relaygate.backend.certificatebuilder;
import relaygate.backend.rsakeypair;
#endif

/**
 * @struct CertificateMaterial
 * @brief PEM-encoded key and certificate plus the certificate fingerprint.
 */
export struct CertificateMaterial {
    QString privateKeyPem;  //!< PKCS#8 key, `PRIVATE KEY` armor.
    QString certificatePem; //!< X.509 certificate, `CERTIFICATE` armor.
    QString fingerprint;    //!< SHA-256 of the certificate DER, `AB:CD:...`.

    /**
     * @brief Check whether all three parts are present.
     * @return True for usable material.
     */
    bool isValid() const;
};

/**
 * @struct CertificateInfo
 * @brief Display fields decoded from a certificate.
 */
export struct CertificateInfo {
    QString commonName;    //!< Subject CN.
    QString issuer;        //!< Issuer CN.
    QString serialNumber;  //!< Serial as uppercase hex.
    QString fingerprint;   //!< SHA-256 fingerprint.
    QString publicKeyInfo; //!< For example `RSA 2048-bit`.
    QDateTime notBefore;   //!< Start of validity (UTC).
    QDateTime notAfter;    //!< End of validity (UTC).

    /**
     * @brief Check whether the current time lies inside the validity window.
     * @return True while valid.
     */
    bool isCurrentlyValid() const;

    /**
     * @brief Whole days until expiry, negative when already expired.
     * @return Day count.
     */
    qint64 daysUntilExpiration() const;
};

/**
 * @struct CertificateRequest
 * @brief Parameters for a new self-signed certificate.
 */
export struct CertificateRequest {
    QString commonName = QStringLiteral("RelayGate Local API"); //!< Subject and issuer CN.
    int validityDays = 3650;                                   //!< Lifetime from notBefore.
    QStringList dnsNames {QStringLiteral("localhost")};        //!< SubjectAltName DNS entries.
    QStringList ipAddresses {QStringLiteral("127.0.0.1"), QStringLiteral("10.0.0.1")}; //!< SubjectAltName IPv4 entries.
    QDateTime notBefore;                                       //!< Defaults to now when invalid.
    quint32 serialNumber = 0;                                  //!< Random when zero.
};

/**
 * @class CertificateBuilder
 * @brief Assembles certificates and keys from DER primitives.
 */
export class CertificateBuilder
{
public:
    /**
     * @brief Generate a fresh RSA-2048 key and self-signed certificate.
     * @param request Certificate parameters.
     * @return PEM material with fingerprint.
     *
     * CPU-bound. Throws `std::runtime_error` if key generation fails.
     */
    static CertificateMaterial generate(const CertificateRequest& request);

    /**
     * @brief Build and sign a certificate for an existing key.
     * @param request Certificate parameters (notBefore and serial must be set).
     * @param key Signing key; its public half is embedded.
     * @return Certificate DER.
     */
    static QByteArray selfSignedCertificate(const CertificateRequest& request, const RsaKeyPair& key);

    /**
     * @brief Build the to-be-signed portion of a certificate.
     * @param request Certificate parameters (notBefore and serial must be set).
     * @param key Key whose public half is embedded.
     * @return TBSCertificate DER.
     */
    static QByteArray tbsCertificate(const CertificateRequest& request, const RsaKeyPair& key);

    /**
     * @brief SubjectPublicKeyInfo carrying an RSA public key.
     * @param key Key pair.
     * @return DER.
     */
    static QByteArray subjectPublicKeyInfo(const RsaKeyPair& key);

    /**
     * @brief PKCS#1 RSAPrivateKey (version 0, n, e, d, p, q, dp, dq, qinv).
     * @param key Key pair.
     * @return DER.
     */
    static QByteArray rsaPrivateKey(const RsaKeyPair& key);

    /**
     * @brief PKCS#8 PrivateKeyInfo wrapping the RSAPrivateKey.
     * @param key Key pair.
     * @return DER.
     */
    static QByteArray pkcs8PrivateKey(const RsaKeyPair& key);

    /**
     * @brief Wrap DER in PEM armor with 64-character base64 lines.
     * @param der Encoded bytes.
     * @param label Armor label such as `CERTIFICATE`.
     * @return PEM text ending with a newline.
     */
    static QString toPem(const QByteArray& der, const QString& label);

    /**
     * @brief Extract DER from the first PEM block with the given label.
     * @param pem PEM text.
     * @param label Armor label.
     * @return Decoded bytes, or empty optional when armor or base64 is invalid.
     */
    static std::optional<QByteArray> fromPem(const QString& pem, const QString& label);

    /**
     * @brief SHA-256 fingerprint as colon-separated uppercase hex pairs.
     * @param der Certificate DER.
     * @return Fingerprint text.
     */
    static QString fingerprint(const QByteArray& der);

    /**
     * @brief Decode display information from certificate DER.
     * @param der Certificate DER.
     * @return Info, or empty optional when the structure is not recognised.
     */
    static std::optional<CertificateInfo> inspect(const QByteArray& der);

    /**
     * @brief Random positive serial number no larger than 2^31 - 1.
     * @return Serial from the system CSPRNG.
     */
    static quint32 randomSerialNumber();
};
