#include "backend_catalog.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>

namespace toolhub {

namespace {

const QString kReferenceServersRepo = "https://github.com/modelcontextprotocol/servers.git";

BackendDefinition nodeBackend(const QString& id, const QString& name, const QString& description,
                              const QString& repoUrl, const QString& command, const QStringList& args,
                              int port, const QString& category, int toolsCount,
                              const QStringList& requiredEnv) {
    BackendDefinition def;
    def.id = id;
    def.name = name;
    def.description = description;
    def.repoUrl = repoUrl;
    def.runtime = RuntimeKind::NodeJs;
    def.command = command;
    def.args = args;
    def.env = {{"NODE_ENV", "production"}};
    def.port = port;
    def.category = category;
    def.toolsCount = toolsCount;
    def.requiredEnv = requiredEnv;
    return def;
}

BackendDefinition referenceBackend(const QString& id, const QString& name, const QString& description,
                                   int port, const QString& category, int toolsCount,
                                   const QStringList& requiredEnv) {
    BackendDefinition def = nodeBackend(id, name, description, kReferenceServersRepo, "npx",
                                        {"-y", "@modelcontextprotocol/server-" + id},
                                        port, category, toolsCount, requiredEnv);
    def.subPath = "src/" + id;
    return def;
}

BackendDefinition pythonBackend(const QString& id, const QString& name, const QString& description,
                                const QString& repoUrl, const QString& module, int port,
                                const QString& category, int toolsCount,
                                const QStringList& requiredEnv) {
    BackendDefinition def;
    def.id = id;
    def.name = name;
    def.description = description;
    def.repoUrl = repoUrl;
    def.runtime = RuntimeKind::Python;
    def.command = "python";
    def.args = {"-m", module};
    def.env = {{"PYTHONPATH", "."}};
    def.port = port;
    def.category = category;
    def.toolsCount = toolsCount;
    def.requiredEnv = requiredEnv;
    return def;
}

} // namespace

BackendCatalog::BackendCatalog(const QList<BackendDefinition>& definitions)
    : m_definitions(definitions) {
}

BackendCatalog BackendCatalog::builtin() {
    QList<BackendDefinition> defs;

    BackendDefinition ghl = nodeBackend(
        "gohighlevel", "GoHighLevel MCP",
        "CRM and marketing automation: lead generation, nurturing and sales pipelines",
        "https://github.com/mastanley13/GoHighLevel-MCP.git", "node", {"dist/server.js"},
        8000, "crm", 253, {"GHL_API_KEY", "GHL_LOCATION_ID"});
    ghl.env.insert("PORT", "8000");
    ghl.defaultConfig = {{"GHL_BASE_URL", "https://services.leadconnectorhq.com"},
                         {"NODE_ENV", "production"},
                         {"PORT", "8000"}};
    defs.append(ghl);

    defs.append(pythonBackend(
        "meta-ads", "Meta Ads MCP",
        "Facebook and Instagram advertising: campaigns, audiences and performance insights",
        "https://github.com/pipeboard-co/meta-ads-mcp.git", "meta_ads_mcp", 8001, "advertising", 22,
        {"META_ACCESS_TOKEN", "META_APP_ID", "META_APP_SECRET"}));
    defs.append(pythonBackend(
        "google-ads", "Google Ads MCP",
        "Google Ads search and display campaigns with conversion tracking",
        "https://github.com/cohnen/mcp-google-ads.git", "mcp_google_ads", 8002, "advertising", 30,
        {"GOOGLE_ADS_CUSTOMER_ID", "GOOGLE_ADS_DEVELOPER_TOKEN"}));
    defs.append(nodeBackend(
        "figma", "Figma MCP", "Figma files, comments and design nodes",
        "https://github.com/MatthewDailey/figma-mcp.git", "npx", {"figma-mcp"},
        8003, "design", 5, {"FIGMA_ACCESS_TOKEN"}));
    defs.append(referenceBackend("github", "GitHub MCP",
                                 "Repositories, issues and pull requests",
                                 8004, "development", 12, {"GITHUB_PERSONAL_ACCESS_TOKEN"}));
    defs.append(referenceBackend("slack", "Slack MCP", "Messaging, channels and workspace integrations",
                                 8005, "communication", 10, {"SLACK_BOT_TOKEN"}));
    defs.append(referenceBackend("notion", "Notion MCP", "Notes, databases and shared documentation",
                                 8006, "productivity", 7, {"NOTION_API_KEY"}));
    defs.append(referenceBackend("stripe", "Stripe MCP", "Payments, subscriptions and customers",
                                 8007, "ecommerce", 12, {"STRIPE_SECRET_KEY"}));
    defs.append(referenceBackend("google-maps", "Google Maps MCP", "Geocoding, directions and place search",
                                 8008, "maps", 6, {"GOOGLE_MAPS_API_KEY"}));
    defs.append(referenceBackend("brave-search", "Brave Search MCP", "Web search queries",
                                 8009, "web_browser", 3, {"BRAVE_SEARCH_API_KEY"}));
    defs.append(referenceBackend("gmail", "Gmail MCP", "Reading, sending and organising email",
                                 8010, "email", 9, {"GMAIL_CREDENTIALS"}));
    defs.append(referenceBackend("puppeteer", "Puppeteer MCP", "Browser automation and scraping",
                                 8011, "web_browser", 5, {}));
    defs.append(referenceBackend("docker", "Docker MCP", "Containers, images and deployments",
                                 8012, "cloud", 8, {}));

    return BackendCatalog(defs);
}

BackendCatalog BackendCatalog::loadFromFile(const QString& filePath, QString& error) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        error = "cannot open catalog file: " + filePath;
        return {};
    }

    QJsonParseError parseErr;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError) {
        error = "catalog parse error: " + parseErr.errorString();
        return {};
    }
    if (!doc.isArray()) {
        error = "catalog file must contain a JSON array";
        return {};
    }

    QList<BackendDefinition> defs;
    QSet<QString> seen;
    const QJsonArray arr = doc.array();
    for (const QJsonValue& v : arr) {
        if (!v.isObject()) {
            error = "catalog entries must be JSON objects";
            return {};
        }
        QString defErr;
        const BackendDefinition def = BackendDefinition::fromJson(v.toObject(), defErr);
        if (!defErr.isEmpty()) {
            error = defErr;
            return {};
        }
        if (seen.contains(def.id)) {
            error = "duplicate backend id in catalog: " + def.id;
            return {};
        }
        seen.insert(def.id);
        defs.append(def);
    }

    error.clear();
    return BackendCatalog(defs);
}

bool BackendCatalog::contains(const QString& id) const {
    return find(id).has_value();
}

std::optional<BackendDefinition> BackendCatalog::find(const QString& id) const {
    for (const BackendDefinition& def : m_definitions) {
        if (def.id == id) {
            return def;
        }
    }
    return std::nullopt;
}

QStringList BackendCatalog::ids() const {
    QStringList out;
    for (const BackendDefinition& def : m_definitions) {
        out.append(def.id);
    }
    return out;
}

} // namespace toolhub
