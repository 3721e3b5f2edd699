module;
#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QUrl>

module relaygate.backend.httpmessage;

namespace {
constexpr auto kHeaderTerminator = "\r\n\r\n";

HttpRequestParser::Result invalid(int status, const QString& message)
{
    HttpRequestParser::Result result;
    result.status = HttpRequestParser::Status::Invalid;
    result.errorStatus = status;
    result.errorMessage = message;
    return result;
}

bool isToken(const QByteArray& text)
{
    if (text.isEmpty()) {
        return false;
    }
    for (const char c : text) {
        const bool alpha = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        const bool digit = c >= '0' && c <= '9';
        if (!alpha && !digit && !QByteArray("!#$%&'*+-.^_`|~").contains(c)) {
            return false;
        }
    }
    return true;
}
}

QByteArray HttpRequest::header(const QByteArray& name) const
{
    return headers.value(name.toLower());
}

void HttpResponse::setHeader(const QByteArray& name, const QByteArray& value)
{
    for (auto& field : headers) {
        if (field.first.compare(name, Qt::CaseInsensitive) == 0) {
            field.second = value;
            return;
        }
    }
    headers.append({name, value});
}

QByteArray HttpResponse::header(const QByteArray& name) const
{
    for (const auto& field : headers) {
        if (field.first.compare(name, Qt::CaseInsensitive) == 0) {
            return field.second;
        }
    }
    return {};
}

bool HttpResponse::hasHeader(const QByteArray& name) const
{
    for (const auto& field : headers) {
        if (field.first.compare(name, Qt::CaseInsensitive) == 0) {
            return true;
        }
    }
    return false;
}

QByteArray HttpResponse::serialize() const
{
    QByteArray out;
    out.reserve(body.size() + 256);
    out += "HTTP/1.1 " + QByteArray::number(statusCode) + ' ' + reasonPhrase(statusCode) + "\r\n";
    for (const auto& field : headers) {
        if (field.first.compare("Content-Length", Qt::CaseInsensitive) == 0
            || field.first.compare("Connection", Qt::CaseInsensitive) == 0) {
            continue;
        }
        out += field.first + ": " + field.second + "\r\n";
    }
    out += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += body;
    return out;
}

HttpResponse HttpResponse::json(int statusCode, const QJsonObject& object)
{
    HttpResponse response;
    response.statusCode = statusCode;
    response.body = QJsonDocument(object).toJson(QJsonDocument::Compact);
    response.setHeader("Content-Type", "application/json");
    return response;
}

HttpResponse HttpResponse::error(int statusCode, const QString& message)
{
    return json(statusCode, QJsonObject {
        {QStringLiteral("success"), false},
        {QStringLiteral("message"), message}
    });
}

HttpResponse HttpResponse::html(int statusCode, const QByteArray& document)
{
    HttpResponse response;
    response.statusCode = statusCode;
    response.body = document;
    response.setHeader("Content-Type", "text/html; charset=utf-8");
    return response;
}

QByteArray HttpResponse::reasonPhrase(int statusCode)
{
    switch (statusCode) {
    case 200: return "OK";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "Unknown";
    }
}

HttpRequestParser::Result HttpRequestParser::parse(const QByteArray& buffer)
{
    const qsizetype headerEnd = buffer.indexOf(kHeaderTerminator);
    if (headerEnd < 0) {
        if (buffer.size() > kMaxHeaderBytes) {
            return invalid(400, QStringLiteral("Request header too large"));
        }
        return {};
    }
    if (headerEnd > kMaxHeaderBytes) {
        return invalid(400, QStringLiteral("Request header too large"));
    }

    const QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
    const QByteArray requestLine = lines.first().trimmed();
    const QList<QByteArray> parts = requestLine.split(' ');
    if (parts.size() != 3 || !isToken(parts.at(0)) || !parts.at(1).startsWith('/')
        || (parts.at(2) != "HTTP/1.1" && parts.at(2) != "HTTP/1.0")) {
        return invalid(400, QStringLiteral("Malformed request line"));
    }

    Result result;
    HttpRequest& request = result.request;
    request.method = parts.at(0).toUpper();
    request.version = parts.at(2);

    const QByteArray target = parts.at(1);
    const qsizetype queryStart = target.indexOf('?');
    const QByteArray rawPath = queryStart < 0 ? target : target.left(queryStart);
    request.path = QUrl::fromPercentEncoding(rawPath);
    if (queryStart >= 0) {
        request.query = QString::fromUtf8(target.mid(queryStart + 1));
    }

    for (qsizetype i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines.at(i).trimmed();
        if (line.isEmpty()) {
            continue;
        }
        const qsizetype colon = line.indexOf(':');
        if (colon <= 0 || !isToken(line.left(colon))) {
            return invalid(400, QStringLiteral("Malformed header field"));
        }
        const QByteArray name = line.left(colon).toLower();
        const QByteArray value = line.mid(colon + 1).trimmed();
        if (request.headers.contains(name)) {
            if (name == "content-length") {
                return invalid(400, QStringLiteral("Duplicate Content-Length"));
            }
            request.headers[name] += ", " + value;
        } else {
            request.headers.insert(name, value);
        }
    }

    if (request.headers.contains("transfer-encoding")) {
        return invalid(400, QStringLiteral("Transfer-Encoding is not supported"));
    }

    qsizetype contentLength = 0;
    if (request.headers.contains("content-length")) {
        bool ok = false;
        const QByteArray text = request.headers.value("content-length");
        contentLength = text.toLongLong(&ok);
        if (!ok || contentLength < 0 || text.startsWith('+')) {
            return invalid(400, QStringLiteral("Invalid Content-Length"));
        }
    }
    if (contentLength > kMaxBodyBytes) {
        return invalid(413, QStringLiteral("Request body too large"));
    }

    const qsizetype bodyStart = headerEnd + 4;
    if (buffer.size() - bodyStart < contentLength) {
        return {};
    }
    request.body = buffer.mid(bodyStart, contentLength);
    result.status = Status::Complete;
    return result;
}
