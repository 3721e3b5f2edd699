/*!
 * @file        der.cppm
 * @brief       ASN.1 DER encoding and structural decoding.
 *
 * @details
 * Small, explicit builders for the ASN.1 types needed to assemble X.509
 * certificates and PKCS#8 keys by hand (SEQUENCE, SET, INTEGER, OBJECT
 * IDENTIFIER, BIT STRING, OCTET STRING, strings, times and context tags),
 * plus a tag/length reader used to validate stored material.
 *
 * Builders have fixed shapes and never fail: every input produces a
 * well-formed TLV.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QDateTime>
#include <QList>
#include <QString>
#include <QtTypes>

#include <initializer_list>
#include <optional>

export module relaygate.backend.der;

/**
 * @class DerEncoder
 * @brief Builds DER-encoded TLV byte sequences.
 */
export class DerEncoder
{
public:
    //! Universal tag numbers used by the builders.
    enum Tag : quint8 {
        Integer = 0x02,
        BitString = 0x03,
        OctetString = 0x04,
        Null = 0x05,
        ObjectIdentifier = 0x06,
        Utf8String = 0x0C,
        PrintableString = 0x13,
        Ia5String = 0x16,
        UtcTime = 0x17,
        GeneralizedTime = 0x18,
        Sequence = 0x30,
        Set = 0x31
    };

    /**
     * @brief Encode a definite length (short or long form).
     * @param length Content length in bytes.
     * @return Length octets.
     */
    static QByteArray length(qsizetype length);

    /**
     * @brief Wrap content in a tag and length.
     * @param tag Identifier octet.
     * @param content Content octets.
     * @return Complete TLV.
     */
    static QByteArray tlv(quint8 tag, const QByteArray& content);

    static QByteArray sequence(const QByteArray& content);
    static QByteArray set(const QByteArray& content);
    static QByteArray octetString(const QByteArray& content);
    static QByteArray null();

    /**
     * @brief Encode an unsigned big-endian magnitude as INTEGER.
     *
     * Leading zero bytes are stripped and a single zero byte is prepended
     * when the high bit is set, so the value is never read as negative.
     *
     * @param magnitude Big-endian unsigned value (empty means zero).
     * @return INTEGER TLV.
     */
    static QByteArray integer(const QByteArray& magnitude);

    /**
     * @brief Encode a small non-negative INTEGER.
     * @param value Value.
     * @return INTEGER TLV.
     */
    static QByteArray integer(quint64 value);

    /**
     * @brief Encode a BIT STRING with zero unused bits.
     * @param bits Payload bytes.
     * @return BIT STRING TLV.
     */
    static QByteArray bitString(const QByteArray& bits);

    /**
     * @brief Encode an OBJECT IDENTIFIER from its arcs.
     * @param arcs Dotted components, at least two.
     * @return OBJECT IDENTIFIER TLV.
     */
    static QByteArray objectIdentifier(std::initializer_list<quint32> arcs);

    //! PrintableString when every character allows it, otherwise UTF8String.
    static QByteArray directoryString(const QString& value);

    static QByteArray printableString(const QString& value);
    static QByteArray utf8String(const QString& value);

    /**
     * @brief Encode an X.509 Time (UTCTime before 2050, else GeneralizedTime).
     * @param dateTime Instant, converted to UTC with second precision.
     * @return Time TLV.
     */
    static QByteArray time(const QDateTime& dateTime);

    //! Constructed context-specific tag `[n]` (EXPLICIT wrapping).
    static QByteArray contextConstructed(int number, const QByteArray& content);

    //! Primitive context-specific tag `[n]` (IMPLICIT primitive).
    static QByteArray contextPrimitive(int number, const QByteArray& content);

    /**
     * @brief Whether a string only holds PrintableString characters.
     * @param value Candidate string.
     * @return True when PrintableString can carry the value.
     */
    static bool isPrintable(const QString& value);
};

/**
 * @struct DerElement
 * @brief One decoded TLV.
 */
export struct DerElement {
    quint8 tag = 0;          //!< Identifier octet.
    qsizetype offset = 0;    //!< Offset of the identifier octet in the input.
    qsizetype headerSize = 0; //!< Identifier plus length octets.
    QByteArray content;      //!< Content octets.

    //! Whether the constructed bit is set.
    bool isConstructed() const { return (tag & 0x20) != 0; }

    //! Total encoded size.
    qsizetype totalSize() const { return headerSize + content.size(); }
};

/**
 * @class DerReader
 * @brief Decodes DER tag/length structure.
 *
 * @details
 * Only single-byte tags and definite lengths are accepted, which covers every
 * structure this project produces.
 */
export class DerReader
{
public:
    /**
     * @brief Read one element at an offset.
     * @param data Input buffer.
     * @param offset Position of the identifier octet.
     * @return Element, or empty optional on truncation/unsupported encoding.
     */
    static std::optional<DerElement> readElement(const QByteArray& data, qsizetype offset = 0);

    /**
     * @brief Split a constructed element into its direct children.
     * @param element Constructed element.
     * @return Children, or empty optional when the content is malformed.
     */
    static std::optional<QList<DerElement>> children(const DerElement& element);

    /**
     * @brief Whether the buffer is exactly one well-formed element.
     *
     * Constructed elements are checked recursively; their children must
     * consume the content exactly.
     *
     * @param data Input buffer.
     * @return True when structure is valid.
     */
    static bool isWellFormed(const QByteArray& data);

private:
    static bool isWellFormedElement(const DerElement& element, int depth);
};
