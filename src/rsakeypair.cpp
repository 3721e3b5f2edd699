module;
#include <QByteArray>
#include <QCryptographicHash>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/rsa.h>

#include <memory>
#include <stdexcept>

module relaygate.backend.rsakeypair;

namespace {
constexpr unsigned long kPublicExponent = 65537;

using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using BignumContextPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using KeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using KeyContextPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;

void check(bool condition, const char* what)
{
    if (!condition) {
        throw std::runtime_error(what);
    }
}

BignumPtr newBignum()
{
    BignumPtr bn(BN_new(), BN_clear_free);
    check(bn != nullptr, "BN_new failed");
    return bn;
}

BignumPtr toBignum(const QByteArray& bytes)
{
    BignumPtr bn(BN_bin2bn(reinterpret_cast<const unsigned char*>(bytes.constData()),
                           static_cast<int>(bytes.size()), nullptr),
                 BN_clear_free);
    check(bn != nullptr, "BN_bin2bn failed");
    return bn;
}

QByteArray toBytes(const BIGNUM* bn)
{
    QByteArray out(BN_num_bytes(bn), Qt::Uninitialized);
    BN_bn2bin(bn, reinterpret_cast<unsigned char*>(out.data()));
    return out;
}

BignumPtr keyParameter(const EVP_PKEY* key, const char* name)
{
    BIGNUM* raw = nullptr;
    check(EVP_PKEY_get_bn_param(key, name, &raw) == 1, "EVP_PKEY_get_bn_param failed");
    return BignumPtr(raw, BN_clear_free);
}
}

bool RsaKeyPair::isValid() const
{
    return !modulus.isEmpty() && !publicExponent.isEmpty() && !privateExponent.isEmpty()
        && !prime1.isEmpty() && !prime2.isEmpty() && !exponent1.isEmpty()
        && !exponent2.isEmpty() && !coefficient.isEmpty();
}

int RsaKeyPair::modulusSize() const
{
    qsizetype first = 0;
    while (first < modulus.size() && modulus.at(first) == '\0') {
        ++first;
    }
    return static_cast<int>(modulus.size() - first);
}

RsaKeyPair RsaKeyPair::generate(int bits)
{
    KeyContextPtr context(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr), EVP_PKEY_CTX_free);
    check(context != nullptr, "EVP_PKEY_CTX_new_from_name (RSA) failed");
    check(EVP_PKEY_keygen_init(context.get()) > 0, "EVP_PKEY_keygen_init failed");
    check(EVP_PKEY_CTX_set_rsa_keygen_bits(context.get(), bits) > 0, "EVP_PKEY_CTX_set_rsa_keygen_bits failed");

    BignumPtr exponent = newBignum();
    check(BN_set_word(exponent.get(), kPublicExponent) == 1, "BN_set_word failed");
    check(EVP_PKEY_CTX_set1_rsa_keygen_pubexp(context.get(), exponent.get()) > 0,
          "EVP_PKEY_CTX_set1_rsa_keygen_pubexp failed");

    EVP_PKEY* raw = nullptr;
    check(EVP_PKEY_keygen(context.get(), &raw) > 0, "EVP_PKEY_keygen failed");
    const KeyPtr key(raw, EVP_PKEY_free);

    const BignumPtr n = keyParameter(key.get(), OSSL_PKEY_PARAM_RSA_N);
    const BignumPtr e = keyParameter(key.get(), OSSL_PKEY_PARAM_RSA_E);
    const BignumPtr d = keyParameter(key.get(), OSSL_PKEY_PARAM_RSA_D);
    const BignumPtr p = keyParameter(key.get(), OSSL_PKEY_PARAM_RSA_FACTOR1);
    const BignumPtr q = keyParameter(key.get(), OSSL_PKEY_PARAM_RSA_FACTOR2);

    BignumContextPtr bnContext(BN_CTX_secure_new(), BN_CTX_free);
    check(bnContext != nullptr, "BN_CTX_secure_new failed");

    BignumPtr pMinusOne(BN_dup(p.get()), BN_clear_free);
    BignumPtr qMinusOne(BN_dup(q.get()), BN_clear_free);
    check(pMinusOne != nullptr && qMinusOne != nullptr, "BN_dup failed");
    check(BN_sub_word(pMinusOne.get(), 1) == 1 && BN_sub_word(qMinusOne.get(), 1) == 1, "BN_sub_word failed");

    BignumPtr dp = newBignum();
    BignumPtr dq = newBignum();
    BignumPtr qInverse = newBignum();
    check(BN_mod(dp.get(), d.get(), pMinusOne.get(), bnContext.get()) == 1, "BN_mod (dp) failed");
    check(BN_mod(dq.get(), d.get(), qMinusOne.get(), bnContext.get()) == 1, "BN_mod (dq) failed");
    check(BN_mod_inverse(qInverse.get(), q.get(), p.get(), bnContext.get()) != nullptr, "BN_mod_inverse failed");

    RsaKeyPair pair;
    pair.modulus = toBytes(n.get());
    pair.publicExponent = toBytes(e.get());
    pair.privateExponent = toBytes(d.get());
    pair.prime1 = toBytes(p.get());
    pair.prime2 = toBytes(q.get());
    pair.exponent1 = toBytes(dp.get());
    pair.exponent2 = toBytes(dq.get());
    pair.coefficient = toBytes(qInverse.get());
    return pair;
}

QByteArray RsaKeyPair::sha256DigestInfoPrefix()
{
    return QByteArray::fromHex("3031300d060960864801650304020105000420");
}

QByteArray RsaKeyPair::signPkcs1Sha256(const QByteArray& message) const
{
    check(isValid(), "RSA key is incomplete");

    const QByteArray digestInfo = sha256DigestInfoPrefix()
        + QCryptographicHash::hash(message, QCryptographicHash::Sha256);
    const int k = modulusSize();
    check(k >= digestInfo.size() + 11, "RSA modulus too short for SHA-256 DigestInfo");

    // EM = 0x00 || 0x01 || PS (0xFF...) || 0x00 || DigestInfo
    QByteArray encoded;
    encoded.reserve(k);
    encoded.append('\x00');
    encoded.append('\x01');
    encoded.append(QByteArray(k - 3 - digestInfo.size(), '\xff'));
    encoded.append('\x00');
    encoded.append(digestInfo);

    const BignumPtr m = toBignum(encoded);
    const BignumPtr d = toBignum(privateExponent);
    const BignumPtr n = toBignum(modulus);
    BignumPtr s = newBignum();

    BignumContextPtr bnContext(BN_CTX_secure_new(), BN_CTX_free);
    check(bnContext != nullptr, "BN_CTX_secure_new failed");
    check(BN_mod_exp_mont_consttime(s.get(), m.get(), d.get(), n.get(), bnContext.get(), nullptr) == 1,
          "BN_mod_exp_mont_consttime failed");

    QByteArray signature(k, Qt::Uninitialized);
    check(BN_bn2binpad(s.get(), reinterpret_cast<unsigned char*>(signature.data()), k) == k,
          "BN_bn2binpad failed");
    return signature;
}
