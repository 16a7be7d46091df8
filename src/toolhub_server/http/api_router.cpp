#include "api_router.h"

#include <QDateTime>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSet>
#include <QUrlQuery>

#include "http_helpers.h"
#include "server_manager.h"

using Method = QHttpServerRequest::Method;
using StatusCode = QHttpServerResponse::StatusCode;

namespace toolhub_server {

namespace {

bool parseJsonObjectBody(const QHttpServerRequest& req, QJsonObject& out, QString& error) {
    const QByteArray body = req.body();
    if (body.trimmed().isEmpty()) {
        out = QJsonObject();
        error.clear();
        return true;
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        error = "request body must be a JSON object";
        return false;
    }

    out = doc.object();
    error.clear();
    return true;
}

struct CategoryInfo {
    const char* id;
    const char* name;
    const char* description;
};

// display order of /api/categories
const CategoryInfo kCategories[] = {
    {"design", "Design & Prototyping", "Design collaboration and prototyping tools"},
    {"development", "Development & Version Control", "Code repositories and development tools"},
    {"communication", "Communication & Collaboration", "Team messaging and collaboration platforms"},
    {"productivity", "Productivity & Project Management", "Note-taking and project management tools"},
    {"ecommerce", "E-commerce & Payments", "Online stores and payment processing"},
    {"advertising", "Advertising & Marketing", "Ad platforms and marketing automation"},
    {"crm", "CRM & Sales", "Customer relationship management"},
    {"maps", "Maps & Location", "Mapping and location services"},
    {"web_browser", "Web & Browser", "Web search and browser automation"},
    {"email", "Email & Communication", "Email services and communication tools"},
    {"cloud", "Cloud & Infrastructure", "Cloud services and infrastructure management"},
    {"financial", "Financial Services", "Banking and financial data services"},
    {"analytics", "Analytics & Data", "Data analysis and business intelligence"},
};

QJsonArray errorsToJson(const QList<toolhub::EnhancedError>& errors) {
    QJsonArray arr;
    for (const toolhub::EnhancedError& e : errors) {
        arr.append(e.toJson());
    }
    return arr;
}

QString timestampNow() {
    return QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
}

} // namespace

ApiRouter::ApiRouter(ServerManager* manager, QObject* parent)
    : QObject(parent)
    , m_manager(manager) {
}

ApiRouter::~ApiRouter() = default;

void ApiRouter::registerRoutes(QHttpServer& server) {
    server.route("/health", Method::Get,
                 [this](const QHttpServerRequest& req) { return handleHealth(req); });

    server.route("/api/servers", Method::Get,
                 [this](const QHttpServerRequest& req) { return handleServerList(req); });
    // install MUST be before /api/servers/<arg>/...
    server.route("/api/servers/install", Method::Post,
                 [this](const QHttpServerRequest& req) { return handleInstall(req); });
    server.route("/api/servers/<arg>/start", Method::Post,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleStart(id, req);
                 });
    server.route("/api/servers/<arg>/stop", Method::Post,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleStop(id, req);
                 });
    server.route("/api/servers/<arg>/status", Method::Get,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleStatus(id, req);
                 });
    server.route("/api/servers/<arg>/logs", Method::Get,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleLogs(id, req);
                 });
    server.route("/api/servers/<arg>/credentials", Method::Get,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleCredentials(id, req);
                 });
    server.route("/api/servers/<arg>/details", Method::Get,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleDetails(id, req);
                 });

    server.route("/api/categories", Method::Get,
                 [this](const QHttpServerRequest& req) { return handleCategories(req); });

    server.route("/api/validation/servers", Method::Get,
                 [this](const QHttpServerRequest& req) { return handleValidateAll(req); });
    server.route("/api/validation/servers/<arg>/autofix", Method::Post,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleAutoFix(id, req);
                 });
    server.route("/api/validation/servers/<arg>", Method::Get,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleValidateOne(id, req);
                 });

    server.route("/api/diagnostics/tools", Method::Get,
                 [this](const QHttpServerRequest& req) { return handleToolDiagnostics(req); });
    server.route("/api/system/health", Method::Get,
                 [this](const QHttpServerRequest& req) { return handleSystemHealth(req); });

    server.route("/api/errors/servers", Method::Get,
                 [this](const QHttpServerRequest& req) { return handleAllErrors(req); });
    server.route("/api/errors/servers/<arg>", Method::Get,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleServerErrors(id, req);
                 });
    server.route("/api/errors/servers/<arg>", Method::Delete,
                 [this](const QString& id, const QHttpServerRequest& req) {
                     return handleClearErrors(id, req);
                 });
}

QHttpServerResponse ApiRouter::handleHealth(const QHttpServerRequest& req) {
    Q_UNUSED(req);
    return jsonResponse(QJsonObject{{"status", "ok"}});
}

QHttpServerResponse ApiRouter::handleServerList(const QHttpServerRequest& req) {
    Q_UNUSED(req);
    QJsonArray servers;
    for (const BackendView& v : m_manager->lifecycle()->list()) {
        servers.append(v.toJson());
    }
    return jsonResponse(QJsonObject{{"servers", servers}});
}

QHttpServerResponse ApiRouter::handleCategories(const QHttpServerRequest& req) {
    Q_UNUSED(req);

    QHash<QString, int> serverCount;
    QHash<QString, int> toolsCount;
    for (const toolhub::BackendDefinition& def : m_manager->catalog().all()) {
        const QString category = def.category.isEmpty() ? QStringLiteral("uncategorized")
                                                        : def.category;
        serverCount[category]++;
        toolsCount[category] += def.toolsCount;
    }

    QJsonArray categories;
    auto append = [&](const QString& id, const QString& name, const QString& description) {
        QJsonObject obj;
        obj["id"] = id;
        obj["name"] = name;
        obj["description"] = description;
        obj["server_count"] = serverCount.value(id);
        obj["tools_count"] = toolsCount.value(id);
        categories.append(obj);
    };

    QSet<QString> known;
    for (const CategoryInfo& info : kCategories) {
        const QString id = QString::fromLatin1(info.id);
        known.insert(id);
        if (serverCount.value(id) > 0) {
            append(id, QString::fromUtf8(info.name), QString::fromUtf8(info.description));
        }
    }

    // categories outside the table, e.g. from a catalog file, are listed by id
    QStringList extra;
    for (auto it = serverCount.constBegin(); it != serverCount.constEnd(); ++it) {
        if (!known.contains(it.key())) {
            extra.append(it.key());
        }
    }
    extra.sort();
    for (const QString& id : extra) {
        append(id, id, QString());
    }
    return jsonResponse(QJsonObject{{"categories", categories}});
}

QHttpServerResponse ApiRouter::handleInstall(const QHttpServerRequest& req) {
    QJsonObject body;
    QString error;
    if (!parseJsonObjectBody(req, body, error)) {
        return errorResponse(StatusCode::BadRequest, error);
    }

    const QString id = body.value("server_id").toString();
    if (id.isEmpty()) {
        return errorResponse(StatusCode::BadRequest, "field 'server_id' is required");
    }
    const auto def = m_manager->catalog().find(id);
    if (!def) {
        return errorResponse(StatusCode::NotFound, "unknown server: " + id);
    }

    if (body.contains("config") && !body.value("config").isObject()) {
        return errorResponse(StatusCode::BadRequest, "field 'config' must be an object");
    }
    toolhub::EnvMap config;
    const QJsonObject configObj = body.value("config").toObject();
    for (auto it = configObj.constBegin(); it != configObj.constEnd(); ++it) {
        if (!it.value().isString()) {
            return errorResponse(StatusCode::BadRequest,
                                 QString("config value '%1' must be a string").arg(it.key()));
        }
        config.insert(it.key(), it.value().toString());
    }

    for (const QString& key : def->requiredEnv) {
        if (config.value(key).isEmpty() && def->defaultConfig.value(key).isEmpty()) {
            return errorResponse(StatusCode::BadRequest,
                                 QString("%1 is required for %2").arg(key, def->name));
        }
    }

    LifecycleManager* lifecycle = m_manager->lifecycle();
    const BackendState state = lifecycle->state(id);
    if (state == BackendState::Installing || state == BackendState::Running) {
        return errorResponse(StatusCode::Conflict,
                             QString("server %1 is %2").arg(id, backendStateName(state)));
    }

    if (!lifecycle->install(id, config, error)) {
        return errorResponse(StatusCode::InternalServerError, error);
    }
    return messageResponse("Installation started");
}

QHttpServerResponse ApiRouter::handleStart(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);
    if (!m_manager->catalog().contains(id)) {
        return errorResponse(StatusCode::NotFound, "unknown server: " + id);
    }

    LifecycleManager* lifecycle = m_manager->lifecycle();
    const BackendState state = lifecycle->state(id);
    if (state == BackendState::Running || state == BackendState::Installing) {
        return errorResponse(StatusCode::Conflict,
                             QString("server %1 is %2").arg(id, backendStateName(state)));
    }

    QString error;
    if (!lifecycle->start(id, error)) {
        return errorResponse(StatusCode::InternalServerError, error);
    }
    return messageResponse("Server started");
}

QHttpServerResponse ApiRouter::handleStop(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);
    if (!m_manager->catalog().contains(id)) {
        return errorResponse(StatusCode::NotFound, "unknown server: " + id);
    }

    LifecycleManager* lifecycle = m_manager->lifecycle();
    if (lifecycle->state(id) == BackendState::Installing) {
        return errorResponse(StatusCode::Conflict, QString("server %1 is installing").arg(id));
    }

    QString error;
    if (!lifecycle->stop(id, error)) {
        return errorResponse(StatusCode::InternalServerError, error);
    }
    return messageResponse("Server stopped");
}

QHttpServerResponse ApiRouter::handleStatus(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);
    BackendView view;
    if (!m_manager->lifecycle()->view(id, view)) {
        return errorResponse(StatusCode::NotFound, "unknown server: " + id);
    }

    QJsonObject result;
    result["status"] = backendStateName(view.state);
    result["port"] = view.definition.port;
    return jsonResponse(result);
}

QHttpServerResponse ApiRouter::handleLogs(const QString& id, const QHttpServerRequest& req) {
    if (!m_manager->catalog().contains(id)) {
        return errorResponse(StatusCode::NotFound, "unknown server: " + id);
    }

    const QUrlQuery query(req.url());
    int limit = queryInt(query, "limit", 100);
    if (limit < 1) {
        limit = 100;
    }

    const QStringList lines = m_manager->lifecycle()->logs(id, limit);
    return jsonResponse(QJsonObject{{"logs", QJsonArray::fromStringList(lines)}});
}

QHttpServerResponse ApiRouter::handleCredentials(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);
    const auto def = m_manager->catalog().find(id);
    if (!def) {
        return errorResponse(StatusCode::NotFound, "unknown server: " + id);
    }

    QJsonObject result;
    result["server_id"] = id;
    result["required_credentials"] = QJsonArray::fromStringList(def->requiredEnv);
    result["requires_credentials"] = !def->requiredEnv.isEmpty();
    return jsonResponse(result);
}

QHttpServerResponse ApiRouter::handleDetails(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);
    LifecycleManager* lifecycle = m_manager->lifecycle();
    BackendView view;
    if (!lifecycle->view(id, view)) {
        return errorResponse(StatusCode::NotFound, "unknown server: " + id);
    }

    const QList<toolhub::EnhancedError> errors = lifecycle->errorHistory()->errors(id);

    QJsonObject result;
    result["server"] = view.toJson();
    result["errors"] = errorsToJson(errors);
    result["error_count"] = errors.size();

    ValidationResult validation;
    QString error;
    if (lifecycle->validate(id, validation, error)) {
        result["validation"] = validation.toJson();
    } else {
        result["validation"] = QJsonValue::Null;
    }
    result["timestamp"] = timestampNow();
    return jsonResponse(result);
}

QHttpServerResponse ApiRouter::handleValidateAll(const QHttpServerRequest& req) {
    Q_UNUSED(req);
    LifecycleManager* lifecycle = m_manager->lifecycle();

    QJsonArray results;
    int valid = 0;
    int invalid = 0;
    for (const QString& id : m_manager->catalog().ids()) {
        ValidationResult result;
        QString error;
        // only installed backends can be validated
        if (!lifecycle->validate(id, result, error)) {
            continue;
        }
        if (result.isValid()) {
            ++valid;
        } else {
            ++invalid;
        }
        results.append(result.toJson());
    }

    QJsonObject summary;
    summary["total"] = valid + invalid;
    summary["valid"] = valid;
    summary["invalid"] = invalid;

    QJsonObject body;
    body["results"] = results;
    body["summary"] = summary;
    body["timestamp"] = timestampNow();
    return jsonResponse(body);
}

QHttpServerResponse ApiRouter::handleValidateOne(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);
    if (!m_manager->catalog().contains(id)) {
        return errorResponse(StatusCode::NotFound, "unknown server: " + id);
    }

    ValidationResult result;
    QString error;
    if (!m_manager->lifecycle()->validate(id, result, error)) {
        return errorResponse(StatusCode::NotFound, error);
    }
    return jsonResponse(result.toJson());
}

QHttpServerResponse ApiRouter::handleAutoFix(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);
    if (!m_manager->catalog().contains(id)) {
        return errorResponse(StatusCode::NotFound, "unknown server: " + id);
    }

    LifecycleManager* lifecycle = m_manager->lifecycle();
    const BackendState state = lifecycle->state(id);
    if (state == BackendState::NotInstalled) {
        return errorResponse(StatusCode::NotFound, QString("server %1 is not installed").arg(id));
    }
    if (state == BackendState::Installing) {
        return errorResponse(StatusCode::Conflict, QString("server %1 is installing").arg(id));
    }

    ValidationResult result;
    QString error;
    const bool success = lifecycle->autoFix(id, result, error);

    QJsonObject body;
    body["success"] = success && result.isValid();
    body["validation"] = result.toJson();
    if (!error.isEmpty()) {
        body["error"] = error;
    }
    return jsonResponse(body);
}

QHttpServerResponse ApiRouter::handleToolDiagnostics(const QHttpServerRequest& req) {
    Q_UNUSED(req);
    QJsonArray diagnostics;
    if (toolhub::ToolAggregator* aggregator = m_manager->aggregator()) {
        diagnostics = aggregator->diagnosticsJson();
    }

    QJsonObject body;
    body["diagnostics"] = diagnostics;
    body["timestamp"] = timestampNow();
    return jsonResponse(body);
}

QHttpServerResponse ApiRouter::handleSystemHealth(const QHttpServerRequest& req) {
    Q_UNUSED(req);
    return jsonResponse(QJsonObject{{"health", m_manager->systemHealth().toJson()}});
}

QHttpServerResponse ApiRouter::handleAllErrors(const QHttpServerRequest& req) {
    Q_UNUSED(req);
    const auto all = m_manager->lifecycle()->errorHistory()->all();

    QJsonObject errors;
    int total = 0;
    for (auto it = all.constBegin(); it != all.constEnd(); ++it) {
        errors[it.key()] = errorsToJson(it.value());
        total += it.value().size();
    }

    QJsonObject body;
    body["errors"] = errors;
    body["total_count"] = total;
    body["timestamp"] = timestampNow();
    return jsonResponse(body);
}

QHttpServerResponse ApiRouter::handleServerErrors(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);
    const QList<toolhub::EnhancedError> errors = m_manager->lifecycle()->errorHistory()->errors(id);

    QJsonObject body;
    body["server_id"] = id;
    body["errors"] = errorsToJson(errors);
    body["count"] = errors.size();
    body["timestamp"] = timestampNow();
    return jsonResponse(body);
}

QHttpServerResponse ApiRouter::handleClearErrors(const QString& id, const QHttpServerRequest& req) {
    Q_UNUSED(req);
    m_manager->lifecycle()->errorHistory()->clear(id);

    QJsonObject body;
    body["message"] = "Errors cleared successfully";
    body["server_id"] = id;
    return jsonResponse(body);
}

} // namespace toolhub_server
