/*!
 * @file        tlsidentitymanager.cppm
 * @brief       Self-signed TLS identity lifecycle for the control API.
 *
 * @details
 * Owns the single active certificate/key pair used by the HTTPS listener:
 * creates it on first use, replaces it on request, persists it in the secret
 * store and exposes fingerprint, display information and a ready-to-use
 * `QSslConfiguration`. Generation is CPU-bound and can run on the Qt global
 * thread pool with the result delivered back on the owner thread.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QList>
#include <QMutex>
#include <QObject>
#include <QSslConfiguration>
#include <QString>

#include <functional>
#include <optional>

#ifndef Q_MOC_RUN
export module relaygate.backend.tlsidentitymanager;
import relaygate.backend.certificatebuilder;
import relaygate.backend.secretstore;
#endif

#ifdef Q_MOC_RUN
#define RELAYGATE_MODULE_EXPORT
class SecretStore;
#else
#define RELAYGATE_MODULE_EXPORT export
#endif

/**
 * @class TlsIdentityManager
 * @brief Generates, stores and fingerprints the self-signed API identity.
 */
RELAYGATE_MODULE_EXPORT class TlsIdentityManager : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool hasCertificate READ hasCertificate NOTIFY materialChanged)
    Q_PROPERTY(QString fingerprint READ fingerprint NOTIFY materialChanged)
    Q_PROPERTY(bool generating READ isGenerating NOTIFY generatingChanged)

public:
    //! Completion callback for asynchronous generation.
    using GenerationCallback = std::function<void(bool ok, const QString& error)>;

    /**
     * @brief Construct manager and load stored material.
     * @param store Secret store holding certificate and key; must outlive the manager.
     * @param parent Optional QObject parent.
     */
    explicit TlsIdentityManager(SecretStore* store, QObject* parent = nullptr);

    /**
     * @brief Whether complete material is available.
     * @return True when certificate, key and fingerprint exist.
     */
    bool hasCertificate() const;

    /**
     * @brief Generate material only if none exists.
     * @param commonName Subject CN for a new certificate.
     * @param validityDays Lifetime for a new certificate.
     * @param errorMessage Optional output error.
     * @return True when material exists afterwards.
     *
     * A true no-op when material is present: stored bytes are not touched.
     */
    bool ensure(const QString& commonName, int validityDays, QString* errorMessage = nullptr);

    /**
     * @brief Generate material with the current name and validity if none exists.
     * @param errorMessage Optional output error.
     * @return True when material exists afterwards.
     */
    bool ensure(QString* errorMessage = nullptr);

    /**
     * @brief Always generate and overwrite material.
     * @param errorMessage Optional output error.
     * @return True when new material was stored.
     */
    bool regenerate(QString* errorMessage = nullptr);

    /**
     * @brief Run ensure() off the calling thread.
     * @param callback Optional completion callback, invoked on the owner thread.
     */
    void ensureAsync(GenerationCallback callback = {});

    /**
     * @brief Run regenerate() off the calling thread.
     * @param callback Optional completion callback, invoked on the owner thread.
     */
    void regenerateAsync(GenerationCallback callback = {});

    /**
     * @brief Whether an asynchronous generation is running.
     * @return True while generating.
     */
    bool isGenerating() const;

    /**
     * @brief Remove stored material.
     * @param errorMessage Optional output error.
     * @return True when the store was updated.
     */
    bool deleteCertificate(QString* errorMessage = nullptr);

    /**
     * @brief Snapshot of the active material.
     * @return Material, invalid when absent.
     */
    CertificateMaterial material() const;

    /**
     * @brief PEM of the active certificate.
     * @return PEM text, or empty string.
     */
    QString certificatePem() const;

    /**
     * @brief SHA-256 fingerprint of the active certificate.
     * @return `AB:CD:...` text, or empty string.
     */
    QString fingerprint() const;

    /**
     * @brief Display information of the active certificate.
     * @return Info, or empty optional when absent.
     */
    std::optional<CertificateInfo> info() const;

    /**
     * @brief TLS server configuration using the active material.
     * @param errorMessage Optional output error.
     * @return Configuration, or empty optional when material is absent or unreadable.
     */
    std::optional<QSslConfiguration> sslConfiguration(QString* errorMessage = nullptr) const;

    /**
     * @brief Subject CN used for new certificates.
     * @param commonName Name.
     */
    void setCommonName(const QString& commonName);

    /**
     * @brief Lifetime used for new certificates.
     * @param validityDays Days, must be positive.
     */
    void setValidityDays(int validityDays);

signals:
    //! Emitted when material is created, replaced or deleted.
    void materialChanged();
    //! Emitted when `generating` changes.
    void generatingChanged();
    //! Emitted after each asynchronous generation.
    void generationFinished(bool ok);

private:
    /**
     * @brief Start or join an asynchronous generation.
     * @param force Overwrite existing material.
     * @param callback Completion callback.
     */
    void startAsync(bool force, GenerationCallback callback);

    /**
     * @brief Finish an asynchronous generation on the owner thread.
     * @param force Requested mode.
     * @param generated Result of the worker, empty on failure.
     * @param error Worker error text.
     */
    void completeAsync(bool force, const std::optional<CertificateMaterial>& generated, const QString& error);

    /**
     * @brief Generate new material, converting failures to an error string.
     * @param request Certificate parameters.
     * @param errorMessage Optional output error.
     * @return Material, or empty optional.
     */
    static std::optional<CertificateMaterial> generateMaterial(const CertificateRequest& request, QString* errorMessage);

    bool storeMaterial(const CertificateMaterial& material, QString* errorMessage);
    void loadMaterial();
    CertificateRequest currentRequest() const;

    SecretStore* m_store = nullptr;          //!< Persistent storage (not owned).
    CertificateMaterial m_material;          //!< Active material.
    QString m_commonName;                    //!< CN for new certificates.
    int m_validityDays = 0;                  //!< Lifetime for new certificates.
    bool m_generating = false;               //!< Async generation in flight.
    QList<GenerationCallback> m_callbacks;   //!< Waiters for the in-flight generation.
    mutable QMutex m_mutex;                  //!< Guards material and request fields.
};

#include "tlsidentitymanager.moc"
