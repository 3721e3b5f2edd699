#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileDevice>
#include <QJsonObject>
#include <QSslCertificate>
#include <QSslConfiguration>
#include <QSslKey>
#include <QTemporaryDir>
#include <QThread>

#include <memory>
#include <optional>

#include <gtest/gtest.h>

import relaygate.backend.certificatebuilder;
import relaygate.backend.secretstore;
import relaygate.backend.tlsidentitymanager;
import relaygate.tests.faketunnel;

namespace {
class TlsIdentityManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.isValid());
        m_store = std::make_unique<SecretStore>(secretsPath());
    }

    QString secretsPath() const
    {
        return QDir(m_dir.path()).filePath(QStringLiteral("secrets.json"));
    }

    QTemporaryDir m_dir;
    std::unique_ptr<SecretStore> m_store;
};
}

TEST_F(TlsIdentityManagerTest, EnsureCreatesMaterialOnce)
{
    TlsIdentityManager manager(m_store.get());
    EXPECT_FALSE(manager.hasCertificate());

    QString error;
    ASSERT_TRUE(manager.ensure(&error)) << error.toStdString();
    EXPECT_TRUE(manager.hasCertificate());
    const CertificateMaterial first = manager.material();
    EXPECT_FALSE(first.fingerprint.isEmpty());
    QFile stored(secretsPath());
    ASSERT_TRUE(stored.open(QIODevice::ReadOnly));
    const QByteArray storedBefore = stored.readAll();
    stored.close();

    ASSERT_TRUE(manager.ensure(&error));
    const CertificateMaterial second = manager.material();
    EXPECT_EQ(second.privateKeyPem, first.privateKeyPem);
    EXPECT_EQ(second.certificatePem, first.certificatePem);
    EXPECT_EQ(second.fingerprint, first.fingerprint);
    ASSERT_TRUE(stored.open(QIODevice::ReadOnly));
    EXPECT_EQ(stored.readAll(), storedBefore);
}

TEST_F(TlsIdentityManagerTest, RegenerateReplacesMaterial)
{
    TlsIdentityManager manager(m_store.get());
    ASSERT_TRUE(manager.ensure());
    const QString before = manager.fingerprint();

    ASSERT_TRUE(manager.regenerate());
    EXPECT_NE(manager.fingerprint(), before);
}

TEST_F(TlsIdentityManagerTest, MaterialSurvivesReload)
{
    QString fingerprint;
    {
        TlsIdentityManager manager(m_store.get());
        ASSERT_TRUE(manager.ensure());
        fingerprint = manager.fingerprint();
    }

    SecretStore reopened(secretsPath());
    TlsIdentityManager manager(&reopened);
    EXPECT_TRUE(manager.hasCertificate());
    EXPECT_EQ(manager.fingerprint(), fingerprint);

    const std::optional<CertificateInfo> info = manager.info();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->commonName, QStringLiteral("RelayGate Local API"));
    EXPECT_EQ(info->fingerprint, fingerprint);
}

TEST_F(TlsIdentityManagerTest, SecretsFileIsOwnerOnly)
{
    TlsIdentityManager manager(m_store.get());
    ASSERT_TRUE(manager.ensure());

    const QFileDevice::Permissions permissions = QFile::permissions(secretsPath());
    EXPECT_TRUE(permissions.testFlag(QFileDevice::ReadOwner));
    EXPECT_TRUE(permissions.testFlag(QFileDevice::WriteOwner));
    EXPECT_FALSE(permissions.testFlag(QFileDevice::ReadGroup));
    EXPECT_FALSE(permissions.testFlag(QFileDevice::ReadOther));
}

TEST_F(TlsIdentityManagerTest, CorruptStoredCertificateIsDiscarded)
{
    ASSERT_TRUE(m_store->setValues(QJsonObject {
        {QStringLiteral("tls/certificatePem"), QStringLiteral("-----BEGIN CERTIFICATE-----\nAAAA\n-----END CERTIFICATE-----\n")},
        {QStringLiteral("tls/privateKeyPem"), QStringLiteral("garbage")},
        {QStringLiteral("tls/fingerprint"), QStringLiteral("00")}
    }));

    TlsIdentityManager manager(m_store.get());
    EXPECT_FALSE(manager.hasCertificate());
    EXPECT_FALSE(m_store->contains(QStringLiteral("tls/certificatePem")));

    ASSERT_TRUE(manager.ensure());
    EXPECT_TRUE(manager.hasCertificate());
}

TEST_F(TlsIdentityManagerTest, DeleteCertificateClearsMaterial)
{
    TlsIdentityManager manager(m_store.get());
    ASSERT_TRUE(manager.ensure());
    ASSERT_TRUE(manager.deleteCertificate());
    EXPECT_FALSE(manager.hasCertificate());
    EXPECT_TRUE(manager.fingerprint().isEmpty());
    EXPECT_FALSE(manager.sslConfiguration().has_value());
}

TEST_F(TlsIdentityManagerTest, SslConfigurationCarriesCertificateAndKey)
{
    TlsIdentityManager manager(m_store.get());
    ASSERT_TRUE(manager.ensure());

    QString error;
    const std::optional<QSslConfiguration> configuration = manager.sslConfiguration(&error);
    ASSERT_TRUE(configuration.has_value()) << error.toStdString();
    EXPECT_FALSE(configuration->localCertificate().isNull());
    EXPECT_FALSE(configuration->privateKey().isNull());
}

TEST_F(TlsIdentityManagerTest, ConcurrentAsyncRequestsShareOneGeneration)
{
    TlsIdentityManager manager(m_store.get());
    int completions = 0;
    bool allOk = true;
    Qt::HANDLE callbackThread = nullptr;
    const auto callback = [&](bool ok, const QString&) {
        ++completions;
        allOk = allOk && ok;
        callbackThread = QThread::currentThreadId();
    };

    manager.ensureAsync(callback);
    EXPECT_TRUE(manager.isGenerating());
    manager.ensureAsync(callback);

    ASSERT_TRUE(waitFor([&]() { return completions == 2; }, 30000));
    EXPECT_TRUE(allOk);
    EXPECT_FALSE(manager.isGenerating());
    EXPECT_TRUE(manager.hasCertificate());
    EXPECT_EQ(callbackThread, QThread::currentThreadId());
}

TEST_F(TlsIdentityManagerTest, AsyncEnsureKeepsExistingMaterial)
{
    TlsIdentityManager manager(m_store.get());
    ASSERT_TRUE(manager.ensure());
    const QString fingerprint = manager.fingerprint();

    bool done = false;
    manager.ensureAsync([&](bool ok, const QString&) {
        EXPECT_TRUE(ok);
        done = true;
    });
    ASSERT_TRUE(waitFor([&]() { return done; }, 30000));
    EXPECT_EQ(manager.fingerprint(), fingerprint);
}
