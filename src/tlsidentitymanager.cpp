module;
#include <QByteArray>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QMetaObject>
#include <QMutexLocker>
#include <QPointer>
#include <QSslCertificate>
#include <QSslConfiguration>
#include <QSslKey>
#include <QSslSocket>
#include <QStringList>
#include <QtConcurrent/QtConcurrentRun>

#include <exception>
#include <optional>
#include <utility>

module relaygate.backend.tlsidentitymanager;

import relaygate.backend.certificatebuilder;
import relaygate.backend.der;
import relaygate.backend.logging;
import relaygate.backend.secretstore;

namespace {
const QString kCertificateKey = QStringLiteral("tls/certificatePem");
const QString kPrivateKeyKey = QStringLiteral("tls/privateKeyPem");
const QString kFingerprintKey = QStringLiteral("tls/fingerprint");

void setError(QString* errorMessage, const QString& error)
{
    if (errorMessage) {
        *errorMessage = error;
    }
}
}

TlsIdentityManager::TlsIdentityManager(SecretStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
    const CertificateRequest defaults;
    m_commonName = defaults.commonName;
    m_validityDays = defaults.validityDays;
    loadMaterial();
}

bool TlsIdentityManager::hasCertificate() const
{
    QMutexLocker locker(&m_mutex);
    return m_material.isValid();
}

bool TlsIdentityManager::ensure(const QString& commonName, int validityDays, QString* errorMessage)
{
    {
        QMutexLocker locker(&m_mutex);
        if (!commonName.trimmed().isEmpty()) {
            m_commonName = commonName.trimmed();
        }
        if (validityDays > 0) {
            m_validityDays = validityDays;
        }
    }
    return ensure(errorMessage);
}

bool TlsIdentityManager::ensure(QString* errorMessage)
{
    if (hasCertificate()) {
        return true;
    }

    const auto generated = generateMaterial(currentRequest(), errorMessage);
    if (!generated.has_value()) {
        return false;
    }
    if (hasCertificate()) {
        return true;
    }
    return storeMaterial(generated.value(), errorMessage);
}

bool TlsIdentityManager::regenerate(QString* errorMessage)
{
    const auto generated = generateMaterial(currentRequest(), errorMessage);
    if (!generated.has_value()) {
        return false;
    }
    return storeMaterial(generated.value(), errorMessage);
}

void TlsIdentityManager::ensureAsync(GenerationCallback callback)
{
    startAsync(false, std::move(callback));
}

void TlsIdentityManager::regenerateAsync(GenerationCallback callback)
{
    startAsync(true, std::move(callback));
}

bool TlsIdentityManager::isGenerating() const
{
    return m_generating;
}

bool TlsIdentityManager::deleteCertificate(QString* errorMessage)
{
    if (!m_store->remove({kCertificateKey, kPrivateKeyKey, kFingerprintKey}, errorMessage)) {
        return false;
    }

    {
        QMutexLocker locker(&m_mutex);
        m_material = CertificateMaterial();
    }
    qCInfo(lcIdentity) << "TLS identity deleted";
    emit materialChanged();
    return true;
}

CertificateMaterial TlsIdentityManager::material() const
{
    QMutexLocker locker(&m_mutex);
    return m_material;
}

QString TlsIdentityManager::certificatePem() const
{
    QMutexLocker locker(&m_mutex);
    return m_material.certificatePem;
}

QString TlsIdentityManager::fingerprint() const
{
    QMutexLocker locker(&m_mutex);
    return m_material.fingerprint;
}

std::optional<CertificateInfo> TlsIdentityManager::info() const
{
    const auto der = CertificateBuilder::fromPem(certificatePem(), QStringLiteral("CERTIFICATE"));
    if (!der.has_value()) {
        return std::nullopt;
    }
    return CertificateBuilder::inspect(der.value());
}

std::optional<QSslConfiguration> TlsIdentityManager::sslConfiguration(QString* errorMessage) const
{
    const CertificateMaterial current = material();
    if (!current.isValid()) {
        setError(errorMessage, QStringLiteral("No TLS certificate is available."));
        return std::nullopt;
    }

    const QSslCertificate certificate(current.certificatePem.toLatin1(), QSsl::Pem);
    const QSslKey key(current.privateKeyPem.toLatin1(), QSsl::Rsa, QSsl::Pem, QSsl::PrivateKey);
    if (certificate.isNull() || key.isNull()) {
        setError(errorMessage, QStringLiteral("Stored TLS certificate or key could not be loaded."));
        return std::nullopt;
    }

    QSslConfiguration configuration = QSslConfiguration::defaultConfiguration();
    configuration.setLocalCertificate(certificate);
    configuration.setPrivateKey(key);
    configuration.setPeerVerifyMode(QSslSocket::VerifyNone);
    return configuration;
}

void TlsIdentityManager::setCommonName(const QString& commonName)
{
    QMutexLocker locker(&m_mutex);
    m_commonName = commonName;
}

void TlsIdentityManager::setValidityDays(int validityDays)
{
    if (validityDays <= 0) {
        return;
    }
    QMutexLocker locker(&m_mutex);
    m_validityDays = validityDays;
}

void TlsIdentityManager::startAsync(bool force, GenerationCallback callback)
{
    if (!force && hasCertificate()) {
        QMetaObject::invokeMethod(this, [this, callback]() {
            if (callback) {
                callback(true, QString());
            }
            emit generationFinished(true);
        }, Qt::QueuedConnection);
        return;
    }

    if (callback) {
        m_callbacks.append(std::move(callback));
    }
    if (m_generating) {
        return;
    }

    m_generating = true;
    emit generatingChanged();
    qCInfo(lcIdentity) << "Generating TLS identity in background";

    const CertificateRequest request = currentRequest();
    QPointer<TlsIdentityManager> guard(this);
    [[maybe_unused]] auto generationFuture = QtConcurrent::run([guard, request, force]() {
        QString error;
        const auto generated = generateMaterial(request, &error);
        if (!guard) {
            return;
        }

        QMetaObject::invokeMethod(guard.data(), [guard, force, generated, error]() {
            if (guard) {
                guard->completeAsync(force, generated, error);
            }
        }, Qt::QueuedConnection);
    });
}

void TlsIdentityManager::completeAsync(bool force, const std::optional<CertificateMaterial>& generated, const QString& error)
{
    bool ok = false;
    QString failure = error;
    if (generated.has_value()) {
        if (!force && hasCertificate()) {
            ok = true;
        } else {
            ok = storeMaterial(generated.value(), &failure);
        }
    }

    m_generating = false;
    emit generatingChanged();

    const QList<GenerationCallback> callbacks = std::exchange(m_callbacks, {});
    for (const GenerationCallback& callback : callbacks) {
        callback(ok, ok ? QString() : failure);
    }
    emit generationFinished(ok);
}

std::optional<CertificateMaterial> TlsIdentityManager::generateMaterial(const CertificateRequest& request, QString* errorMessage)
{
    try {
        CertificateMaterial material = CertificateBuilder::generate(request);
        qCInfo(lcIdentity).noquote() << "Generated TLS identity for" << request.commonName
                                     << "fingerprint" << material.fingerprint;
        return material;
    } catch (const std::exception& ex) {
        qCCritical(lcIdentity) << "TLS identity generation failed:" << ex.what();
        setError(errorMessage, QStringLiteral("Certificate generation failed."));
        return std::nullopt;
    }
}

bool TlsIdentityManager::storeMaterial(const CertificateMaterial& material, QString* errorMessage)
{
    const QJsonObject values {
        {kCertificateKey, material.certificatePem},
        {kPrivateKeyKey, material.privateKeyPem},
        {kFingerprintKey, material.fingerprint}
    };
    if (!m_store->setValues(values, errorMessage)) {
        qCWarning(lcIdentity) << "Failed to persist TLS identity";
        return false;
    }

    {
        QMutexLocker locker(&m_mutex);
        m_material = material;
    }
    emit materialChanged();
    return true;
}

void TlsIdentityManager::loadMaterial()
{
    const QString certificatePem = m_store->value(kCertificateKey);
    const QString privateKeyPem = m_store->value(kPrivateKeyKey);
    if (certificatePem.isEmpty() || privateKeyPem.isEmpty()) {
        return;
    }

    const auto der = CertificateBuilder::fromPem(certificatePem, QStringLiteral("CERTIFICATE"));
    if (!der.has_value() || !DerReader::isWellFormed(der.value())) {
        qCWarning(lcIdentity) << "Discarding stored TLS certificate that is not valid DER";
        QString error;
        if (!m_store->remove({kCertificateKey, kPrivateKeyKey, kFingerprintKey}, &error)) {
            qCWarning(lcIdentity) << "Could not remove invalid certificate:" << error;
        }
        return;
    }

    m_material.certificatePem = certificatePem;
    m_material.privateKeyPem = privateKeyPem;
    m_material.fingerprint = CertificateBuilder::fingerprint(der.value());
    qCDebug(lcIdentity).noquote() << "Loaded TLS identity" << m_material.fingerprint;
}

CertificateRequest TlsIdentityManager::currentRequest() const
{
    QMutexLocker locker(&m_mutex);
    CertificateRequest request;
    request.commonName = m_commonName;
    request.validityDays = m_validityDays;
    return request;
}
