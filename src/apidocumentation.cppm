/*!
 * @file        apidocumentation.cppm
 * @brief       OpenAPI document and Swagger UI page for the control API.
 *
 * @details
 * The route table drives routing, authentication exemptions and the generated
 * OpenAPI 3.0.3 document, so the documentation cannot drift from the server.
 *
 * @author      Kambiz Asadzadeh
 * @since       19 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

module;
#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>

export module relaygate.backend.apidocumentation;

/**
 * @struct RouteInfo
 * @brief One documented endpoint of the control API.
 */
export struct RouteInfo {
    QByteArray method;       //!< `GET` or `POST`.
    QString path;            //!< Exact path, no parameters.
    QString tag;             //!< OpenAPI tag.
    QString operationId;     //!< OpenAPI operation id.
    QString summary;         //!< One-line summary.
    QString description;     //!< Longer description.
    bool requiresAuth = true;  //!< Bearer token needed when auth is enabled.
    QString requestSchema;   //!< Component schema of the body, empty for none.
    QString responseSchema;  //!< Component schema of 200, empty for HTML.
};

/**
 * @class ApiDocumentation
 * @brief Renders the route table as OpenAPI JSON and Swagger HTML.
 */
export class ApiDocumentation
{
public:
    static constexpr auto kServiceName = "relaygate-control";

    static QJsonObject openApiDocument(const QList<RouteInfo>& routes, quint16 port);
    static QByteArray swaggerHtml(const QList<RouteInfo>& routes, quint16 port);
};
