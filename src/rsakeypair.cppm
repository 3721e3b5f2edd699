/*!
 * @file        rsakeypair.cppm
 * @brief       RSA key material and PKCS#1 v1.5 signing.
 *
 * @details
 * Holds the raw components of an RSA private key as unsigned big-endian byte
 * strings, ready to be written into PKCS#1/PKCS#8 and SubjectPublicKeyInfo
 * structures. Key generation and the modular exponentiation behind signing
 * are delegated to OpenSSL's big-number and EVP layers; padding, DigestInfo
 * and the CRT parameters are computed here.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>

export module relaygate.backend.rsakeypair;

/**
 * @struct RsaKeyPair
 * @brief RSA private key components as unsigned big-endian magnitudes.
 */
export struct RsaKeyPair {
    QByteArray modulus;         //!< n.
    QByteArray publicExponent;  //!< e (65537).
    QByteArray privateExponent; //!< d.
    QByteArray prime1;          //!< p.
    QByteArray prime2;          //!< q.
    QByteArray exponent1;       //!< d mod (p - 1).
    QByteArray exponent2;       //!< d mod (q - 1).
    QByteArray coefficient;     //!< q^-1 mod p.

    /**
     * @brief Check that every component is present.
     * @return True when the key can be encoded and used for signing.
     */
    bool isValid() const;

    /**
     * @brief Modulus size in bytes (k).
     * @return Byte length of the modulus.
     */
    int modulusSize() const;

    /**
     * @brief Generate a new key pair with public exponent 65537.
     * @param bits Modulus size in bits.
     * @return Generated key pair.
     *
     * Randomness comes from OpenSSL's default DRBG. Throws
     * `std::runtime_error` when OpenSSL fails.
     */
    static RsaKeyPair generate(int bits = 2048);

    /**
     * @brief Sign with RSASSA-PKCS1-v1_5 over SHA-256.
     * @param message Bytes to sign (hashed internally).
     * @return Signature of exactly modulusSize() bytes.
     *
     * Throws `std::runtime_error` if the key is unusable.
     */
    QByteArray signPkcs1Sha256(const QByteArray& message) const;

    /**
     * @brief Encoded DigestInfo prefix for SHA-256 (RFC 8017, section 9.2).
     * @return 19-byte DER prefix preceding the 32-byte hash.
     */
    static QByteArray sha256DigestInfoPrefix();
};
