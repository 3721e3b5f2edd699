module;
#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

module relaygate.backend.apidocumentation;

namespace {
QJsonObject schemaRef(const QString& name)
{
    return QJsonObject {{QStringLiteral("$ref"), QStringLiteral("#/components/schemas/%1").arg(name)}};
}

QJsonObject jsonContent(const QString& schema, const QString& description)
{
    return QJsonObject {
        {QStringLiteral("description"), description},
        {QStringLiteral("content"), QJsonObject {
            {QStringLiteral("application/json"), QJsonObject {{QStringLiteral("schema"), schemaRef(schema)}}}
        }}
    };
}

QJsonObject property(const QString& type, const QString& description)
{
    return QJsonObject {
        {QStringLiteral("type"), type},
        {QStringLiteral("description"), description}
    };
}

QJsonObject schemas()
{
    QJsonObject port = property(QStringLiteral("integer"), QStringLiteral("Proxy server port (1-65535)"));
    port.insert(QStringLiteral("minimum"), 1);
    port.insert(QStringLiteral("maximum"), 65535);
    port.insert(QStringLiteral("example"), 1080);

    QJsonObject username = property(QStringLiteral("string"), QStringLiteral("SOCKS5 authentication username"));
    username.insert(QStringLiteral("nullable"), true);
    QJsonObject password = property(QStringLiteral("string"), QStringLiteral("SOCKS5 authentication password"));
    password.insert(QStringLiteral("nullable"), true);

    const QJsonObject connectRequest {
        {QStringLiteral("type"), QStringLiteral("object")},
        {QStringLiteral("required"), QJsonArray {QStringLiteral("host"), QStringLiteral("port")}},
        {QStringLiteral("properties"), QJsonObject {
            {QStringLiteral("host"), property(QStringLiteral("string"), QStringLiteral("Proxy server hostname or IP address"))},
            {QStringLiteral("port"), port},
            {QStringLiteral("username"), username},
            {QStringLiteral("password"), password}
        }}
    };

    const QJsonObject apiResponse {
        {QStringLiteral("type"), QStringLiteral("object")},
        {QStringLiteral("required"), QJsonArray {QStringLiteral("success"), QStringLiteral("message")}},
        {QStringLiteral("properties"), QJsonObject {
            {QStringLiteral("success"), property(QStringLiteral("boolean"), QStringLiteral("Whether the operation succeeded"))},
            {QStringLiteral("message"), property(QStringLiteral("string"), QStringLiteral("Human-readable result message"))}
        }}
    };

    QJsonObject state = property(QStringLiteral("string"), QStringLiteral("Current connection state"));
    state.insert(QStringLiteral("enum"), QJsonArray {
        QStringLiteral("disconnected"), QStringLiteral("connecting"), QStringLiteral("connected"),
        QStringLiteral("disconnecting"), QStringLiteral("error")
    });
    QJsonObject host = property(QStringLiteral("string"), QStringLiteral("Connected proxy host (present only when connected)"));
    host.insert(QStringLiteral("nullable"), true);
    QJsonObject connectedPort = property(QStringLiteral("integer"), QStringLiteral("Connected proxy port (present only when connected)"));
    connectedPort.insert(QStringLiteral("nullable"), true);

    const QJsonObject statusResponse {
        {QStringLiteral("type"), QStringLiteral("object")},
        {QStringLiteral("required"), QJsonArray {QStringLiteral("connected"), QStringLiteral("state")}},
        {QStringLiteral("properties"), QJsonObject {
            {QStringLiteral("connected"), property(QStringLiteral("boolean"), QStringLiteral("Whether the tunnel is connected"))},
            {QStringLiteral("state"), state},
            {QStringLiteral("host"), host},
            {QStringLiteral("port"), connectedPort}
        }}
    };

    const QJsonObject healthResponse {
        {QStringLiteral("type"), QStringLiteral("object")},
        {QStringLiteral("required"), QJsonArray {QStringLiteral("status"), QStringLiteral("service")}},
        {QStringLiteral("properties"), QJsonObject {
            {QStringLiteral("status"), property(QStringLiteral("string"), QStringLiteral("Health status"))},
            {QStringLiteral("service"), property(QStringLiteral("string"), QStringLiteral("Service name"))}
        }}
    };

    return QJsonObject {
        {QStringLiteral("ConnectRequest"), connectRequest},
        {QStringLiteral("ApiResponse"), apiResponse},
        {QStringLiteral("ErrorResponse"), apiResponse},
        {QStringLiteral("StatusResponse"), statusResponse},
        {QStringLiteral("HealthResponse"), healthResponse}
    };
}

QJsonObject operation(const RouteInfo& route)
{
    QJsonObject responses;
    if (route.responseSchema.isEmpty()) {
        responses.insert(QStringLiteral("200"), QJsonObject {
            {QStringLiteral("description"), route.summary},
            {QStringLiteral("content"), QJsonObject {
                {QStringLiteral("text/html"), QJsonObject {
                    {QStringLiteral("schema"), QJsonObject {{QStringLiteral("type"), QStringLiteral("string")}}}
                }}
            }}
        });
    } else {
        responses.insert(QStringLiteral("200"), jsonContent(route.responseSchema, route.summary));
    }
    if (!route.requestSchema.isEmpty()) {
        responses.insert(QStringLiteral("400"), jsonContent(QStringLiteral("ErrorResponse"), QStringLiteral("Invalid request")));
    }
    if (route.requiresAuth) {
        responses.insert(QStringLiteral("401"), jsonContent(QStringLiteral("ErrorResponse"),
                                                            QStringLiteral("Missing or invalid Authorization header")));
        responses.insert(QStringLiteral("403"), jsonContent(QStringLiteral("ErrorResponse"),
                                                            QStringLiteral("Invalid authentication token")));
    }

    QJsonObject op {
        {QStringLiteral("tags"), QJsonArray {route.tag}},
        {QStringLiteral("summary"), route.summary},
        {QStringLiteral("description"), route.description},
        {QStringLiteral("operationId"), route.operationId},
        {QStringLiteral("responses"), responses}
    };
    if (!route.requiresAuth) {
        op.insert(QStringLiteral("security"), QJsonArray {});
    }
    if (!route.requestSchema.isEmpty()) {
        op.insert(QStringLiteral("requestBody"), QJsonObject {
            {QStringLiteral("required"), true},
            {QStringLiteral("content"), QJsonObject {
                {QStringLiteral("application/json"), QJsonObject {{QStringLiteral("schema"), schemaRef(route.requestSchema)}}}
            }}
        });
    }
    return op;
}
}

QJsonObject ApiDocumentation::openApiDocument(const QList<RouteInfo>& routes, quint16 port)
{
    QJsonObject paths;
    QJsonArray tags;
    QStringList seenTags;
    for (const RouteInfo& route : routes) {
        QJsonObject item = paths.value(route.path).toObject();
        item.insert(QString::fromLatin1(route.method.toLower()), operation(route));
        paths.insert(route.path, item);
        if (!seenTags.contains(route.tag)) {
            seenTags.append(route.tag);
            tags.append(QJsonObject {{QStringLiteral("name"), route.tag}});
        }
    }

    return QJsonObject {
        {QStringLiteral("openapi"), QStringLiteral("3.0.3")},
        {QStringLiteral("info"), QJsonObject {
            {QStringLiteral("title"), QStringLiteral("RelayGate Control API")},
            {QStringLiteral("description"),
             QStringLiteral("HTTP API for controlling the RelayGate tunnel. "
                            "The server listens on all interfaces on port %1.").arg(port)},
            {QStringLiteral("version"), QStringLiteral("1.0.0")}
        }},
        {QStringLiteral("servers"), QJsonArray {
            QJsonObject {{QStringLiteral("url"), QStringLiteral("/")}, {QStringLiteral("description"), QStringLiteral("Current server")}}
        }},
        {QStringLiteral("tags"), tags},
        {QStringLiteral("paths"), paths},
        {QStringLiteral("components"), QJsonObject {
            {QStringLiteral("schemas"), schemas()},
            {QStringLiteral("securitySchemes"), QJsonObject {
                {QStringLiteral("bearerAuth"), QJsonObject {
                    {QStringLiteral("type"), QStringLiteral("http")},
                    {QStringLiteral("scheme"), QStringLiteral("bearer")},
                    {QStringLiteral("description"),
                     QStringLiteral("Required when authentication is enabled. Health and documentation endpoints are exempt.")}
                }}
            }}
        }},
        {QStringLiteral("security"), QJsonArray {QJsonObject {{QStringLiteral("bearerAuth"), QJsonArray {}}}}}
    };
}

QByteArray ApiDocumentation::swaggerHtml(const QList<RouteInfo>& routes, quint16 port)
{
    QByteArray document = QJsonDocument(openApiDocument(routes, port)).toJson(QJsonDocument::Compact);
    // Keep the inline script from being closed by document content.
    document.replace("</", "<\\/");

    QByteArray html;
    html += "<!DOCTYPE html>\n"
            "<html lang=\"en\">\n"
            "<head>\n"
            "  <meta charset=\"UTF-8\">\n"
            "  <meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n"
            "  <title>RelayGate - API Documentation</title>\n"
            "  <link rel=\"stylesheet\" href=\"https://unpkg.com/swagger-ui-dist@5/swagger-ui.css\">\n"
            "  <style>\n"
            "    .swagger-ui .topbar { display: none; }\n"
            "    body { margin: 0; padding: 0; }\n"
            "  </style>\n"
            "</head>\n"
            "<body>\n"
            "  <div id=\"swagger-ui\"></div>\n"
            "  <script src=\"https://unpkg.com/swagger-ui-dist@5/swagger-ui-bundle.js\"></script>\n"
            "  <script>\n"
            "    SwaggerUIBundle({\n"
            "      spec: ";
    html += document;
    html += ",\n"
            "      dom_id: '#swagger-ui',\n"
            "      deepLinking: true,\n"
            "      presets: [SwaggerUIBundle.presets.apis, SwaggerUIBundle.SwaggerUIStandalonePreset],\n"
            "      layout: \"BaseLayout\"\n"
            "    });\n"
            "  </script>\n"
            "</body>\n"
            "</html>\n";
    return html;
}
