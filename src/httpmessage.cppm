/*!
 * @file        httpmessage.cppm
 * @brief       Minimal HTTP/1.1 request framing and response serialization.
 *
 * @details
 * The control API speaks one request per connection. The parser accepts a
 * request line, header fields and a `Content-Length` delimited body from a
 * growing receive buffer; responses are serialized with `Connection: close`.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QPair>
#include <QString>

export module relaygate.backend.httpmessage;

/**
 * @struct HttpRequest
 * @brief Parsed request. Header names are stored lowercase.
 */
export struct HttpRequest {
    QByteArray method;                     //!< Upper-case method token.
    QString path;                          //!< Decoded path without query.
    QString query;                         //!< Raw query string, without `?`.
    QByteArray version;                    //!< `HTTP/1.0` or `HTTP/1.1`.
    QHash<QByteArray, QByteArray> headers; //!< Lowercase name to value.
    QByteArray body;                       //!< Request body.

    /**
     * @brief Case-insensitive header lookup.
     * @param name Header name.
     * @return Value, or empty array when absent.
     */
    QByteArray header(const QByteArray& name) const;
};

/**
 * @struct HttpResponse
 * @brief Response under construction by handlers and middleware.
 */
export struct HttpResponse {
    int statusCode = 200;
    QList<QPair<QByteArray, QByteArray>> headers; //!< Ordered header fields.
    QByteArray body;

    /**
     * @brief Set a header, replacing any field with the same name.
     */
    void setHeader(const QByteArray& name, const QByteArray& value);
    QByteArray header(const QByteArray& name) const;
    bool hasHeader(const QByteArray& name) const;

    /**
     * @brief Wire form with `Content-Length` and `Connection: close`.
     */
    QByteArray serialize() const;

    static HttpResponse json(int statusCode, const QJsonObject& object);

    /**
     * @brief `{success:false, message}` response.
     */
    static HttpResponse error(int statusCode, const QString& message);
    static HttpResponse html(int statusCode, const QByteArray& document);
    static QByteArray reasonPhrase(int statusCode);
};

/**
 * @class HttpRequestParser
 * @brief Stateless framing of a single request from a receive buffer.
 */
export class HttpRequestParser
{
public:
    static constexpr qsizetype kMaxHeaderBytes = 16 * 1024;
    static constexpr qsizetype kMaxBodyBytes = 64 * 1024;

    enum class Status {
        Incomplete, //!< More bytes are needed.
        Complete,   //!< A full request was framed.
        Invalid     //!< Framing error; reply with errorStatus and close.
    };

    struct Result {
        Status status = Status::Incomplete;
        HttpRequest request;
        int errorStatus = 0;   //!< 400 or 413 when Invalid.
        QString errorMessage;  //!< Client-facing reason when Invalid.
    };

    /**
     * @brief Frame a request from the bytes received so far.
     * @param buffer Everything read from the connection.
     * @return Parse outcome.
     */
    static Result parse(const QByteArray& buffer);
};
