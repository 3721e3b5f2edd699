module;
#include <QDir>
#include <QFile>
#include <QFileDevice>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLoggingCategory>
#include <QMutexLocker>
#include <QSaveFile>
#include <QStringList>

module relaygate.backend.secretstore;

import relaygate.backend.logging;

namespace {
void setError(QString* errorMessage, const QString& text)
{
    if (errorMessage) {
        *errorMessage = text;
    }
}
}

SecretStore::SecretStore(const QString& filePath)
    : m_filePath(filePath)
{
    load();
}

QString SecretStore::filePath() const
{
    return m_filePath;
}

QString SecretStore::value(const QString& key) const
{
    QMutexLocker locker(&m_mutex);
    return m_data.value(key).toString();
}

bool SecretStore::contains(const QString& key) const
{
    QMutexLocker locker(&m_mutex);
    return !m_data.value(key).toString().isEmpty();
}

bool SecretStore::setValues(const QJsonObject& values, QString* errorMessage)
{
    QMutexLocker locker(&m_mutex);
    QJsonObject next = m_data;
    for (auto it = values.constBegin(); it != values.constEnd(); ++it) {
        next.insert(it.key(), it.value());
    }
    if (!persist(next, errorMessage)) {
        return false;
    }
    m_data = next;
    return true;
}

bool SecretStore::setValue(const QString& key, const QString& value, QString* errorMessage)
{
    return setValues(QJsonObject {{key, value}}, errorMessage);
}

bool SecretStore::remove(const QStringList& keys, QString* errorMessage)
{
    QMutexLocker locker(&m_mutex);
    QJsonObject next = m_data;
    for (const QString& key : keys) {
        next.remove(key);
    }
    if (!persist(next, errorMessage)) {
        return false;
    }
    m_data = next;
    return true;
}

void SecretStore::load()
{
    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcSettings) << "Cannot read secret store" << m_filePath << file.errorString();
        return;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(lcSettings) << "Ignoring corrupt secret store" << m_filePath << parseError.errorString();
        return;
    }
    m_data = doc.object();
}

bool SecretStore::persist(const QJsonObject& data, QString* errorMessage) const
{
    const QFileInfo info(m_filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        setError(errorMessage, QStringLiteral("Failed to create directory: %1").arg(info.absolutePath()));
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(errorMessage, QStringLiteral("Failed to open secret store: %1").arg(m_filePath));
        return false;
    }
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    file.write(QJsonDocument(data).toJson(QJsonDocument::Compact));

    if (!file.commit()) {
        setError(errorMessage, QStringLiteral("Failed to write secret store to disk."));
        return false;
    }

    // The committed file must stay owner-only.
    if (!QFile::setPermissions(m_filePath, QFileDevice::ReadOwner | QFileDevice::WriteOwner)) {
        qCWarning(lcSettings) << "Could not restrict permissions on" << m_filePath;
    }
    return true;
}
