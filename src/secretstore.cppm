/*!
 * @file        secretstore.cppm
 * @brief       Owner-only JSON store for confidential values.
 *
 * @details
 * Keeps the API token and the TLS certificate/key in a single JSON object
 * persisted to a file readable only by the owning user. Writes go through
 * `QSaveFile` so a crash never leaves a truncated file behind.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QJsonObject>
#include <QMutex>
#include <QString>
#include <QStringList>

export module relaygate.backend.secretstore;

/**
 * @class SecretStore
 * @brief Thread-safe key/value store backed by an owner-only file.
 */
export class SecretStore
{
public:
    /**
     * @brief Open the store at @p filePath, loading existing content.
     * @param filePath JSON file path; parent directory is created on write.
     */
    explicit SecretStore(const QString& filePath);

    /**
     * @brief Backing file path.
     * @return Absolute or relative path given at construction.
     */
    QString filePath() const;

    /**
     * @brief Read a value.
     * @param key Entry name.
     * @return Stored text, or empty string when absent.
     */
    QString value(const QString& key) const;

    /**
     * @brief Check presence of a key.
     * @param key Entry name.
     * @return True when the key exists with a non-empty value.
     */
    bool contains(const QString& key) const;

    /**
     * @brief Store several values in one atomic write.
     * @param values Entries to set.
     * @param errorMessage Optional output error.
     * @return True when persisted.
     */
    bool setValues(const QJsonObject& values, QString* errorMessage = nullptr);

    /**
     * @brief Store one value.
     * @param key Entry name.
     * @param value Text to persist.
     * @param errorMessage Optional output error.
     * @return True when persisted.
     */
    bool setValue(const QString& key, const QString& value, QString* errorMessage = nullptr);

    /**
     * @brief Remove entries.
     * @param keys Entry names.
     * @param errorMessage Optional output error.
     * @return True when persisted.
     */
    bool remove(const QStringList& keys, QString* errorMessage = nullptr);

private:
    void load();
    bool persist(const QJsonObject& data, QString* errorMessage) const;

    QString m_filePath;       //!< Backing file.
    QJsonObject m_data;       //!< Cached content.
    mutable QMutex m_mutex;   //!< Guards m_data and file writes.
};
