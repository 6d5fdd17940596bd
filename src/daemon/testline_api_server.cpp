#include "daemon/testline_api_server.hpp"

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <set>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>
#include <QUuid>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/day_window.hpp"

namespace testline {

namespace {

constexpr int kMaxRequestBytes = 1024 * 1024;

std::set<std::string> releaseIdsParam(const nlohmann::json &params)
{
    std::set<std::string> releaseIds;
    auto it = params.find("releaseIds");
    if (it == params.end() || it->is_null()) {
        return releaseIds;
    }
    if (!it->is_array()) {
        throw EngineError(ErrorKind::InvalidRequest, "releaseIds must be an array of strings");
    }
    for (const auto &item : *it) {
        if (!item.is_string()) {
            throw EngineError(ErrorKind::InvalidRequest, "releaseIds must be an array of strings");
        }
        releaseIds.insert(item.get<std::string>());
    }
    return releaseIds;
}

// True for a JSON integer that converts to int without narrowing.
bool fitsInt(const nlohmann::json &value)
{
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>()
            <= static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    }
    if (value.is_number_integer()) {
        const auto number = value.get<std::int64_t>();
        return number >= std::numeric_limits<int>::min()
            && number <= std::numeric_limits<int>::max();
    }
    return false;
}

std::optional<TimePoint> cutoffParam(const nlohmann::json &params)
{
    auto it = params.find("at");
    if (it == params.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw EngineError(ErrorKind::InvalidCutoff, "at must be an ISO-8601 string");
    }
    const auto cutoff = parseIso8601(it->get<std::string>());
    if (!cutoff.has_value()) {
        throw EngineError(ErrorKind::InvalidCutoff, "invalid at timestamp");
    }
    return cutoff;
}

const nlohmann::json &objectParam(const nlohmann::json &params, const char *key)
{
    auto it = params.find(key);
    if (it == params.end() || !it->is_object()) {
        throw EngineError(ErrorKind::InvalidRequest, std::string("missing ") + key + " object");
    }
    return *it;
}

// Timestamps the record parser would silently drop are rejected here.
void requireParsableTimes(const nlohmann::json &record, std::initializer_list<const char *> keys)
{
    for (const char *key : keys) {
        auto it = record.find(key);
        if (it == record.end() || it->is_null()) {
            continue;
        }
        if (!it->is_string() || !parseIso8601(it->get<std::string>()).has_value()) {
            throw EngineError(ErrorKind::InvalidRequest, std::string("invalid ") + key);
        }
    }
}

template <typename Record>
Record recordParam(const nlohmann::json &params, const char *key)
{
    const auto &object = objectParam(params, key);
    try {
        return object.get<Record>();
    } catch (const nlohmann::json::exception &ex) {
        throw EngineError(ErrorKind::InvalidRequest, std::string("invalid ") + key + ": " + ex.what());
    }
}

std::string stringParam(const nlohmann::json &params, const char *key)
{
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        throw EngineError(ErrorKind::InvalidRequest, std::string(key) + " must be a string");
    }
    return it->get<std::string>();
}

} // namespace

TestlineApiServer::TestlineApiServer(CoverageEngine &engine,
                                     const QString &socketName,
                                     QObject *parent)
    : QObject(parent)
    , m_engine(engine)
    , m_socketName(socketName.isEmpty() ? defaultSocketPath() : socketName)
{
}

TestlineApiServer::~TestlineApiServer() = default;

QString TestlineApiServer::socketName() const
{
    return m_socketName;
}

bool TestlineApiServer::start()
{
    const QString socketPath = m_socketName;
    if (socketPath.contains('/')) {
        const QFileInfo socketInfo(socketPath);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            qWarning() << "Failed to create runtime socket directory"
                       << socketInfo.absolutePath();
            return false;
        }

        if (QFile::exists(socketPath)) {
            if (!QLocalServer::removeServer(socketPath)) {
                qWarning() << "Failed to remove existing Testline socket" << socketPath;
                return false;
            }
        }
    } else {
        QLocalServer::removeServer(socketPath);
    }

    if (!m_server.listen(socketPath)) {
        qWarning() << "Failed to listen on Testline socket" << socketPath
                   << m_server.errorString();
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &TestlineApiServer::handleNewConnection);

    qInfo() << "Testline API server listening on" << socketPath;
    return true;
}

void TestlineApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &TestlineApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                this, [this, socket] {
                    m_pending.remove(socket);
                });
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void TestlineApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    QByteArray &buffer = m_pending[socket];
    buffer.append(socket->readAll());
    if (buffer.size() > kMaxRequestBytes) {
        m_pending.remove(socket);
        socket->write(makeErrorResponse("Request too large"));
        socket->flush();
        socket->disconnectFromServer();
        return;
    }

    // A request ends at the first newline. Clients that send one bare JSON
    // document without a newline are served once the document is complete.
    QByteArray payload;
    const int newline = buffer.indexOf('\n');
    if (newline >= 0) {
        payload = buffer.left(newline);
    } else if (nlohmann::json::accept(buffer.toStdString())) {
        payload = buffer;
    } else {
        return;
    }
    m_pending.remove(socket);

    handleRequest(socket, payload);
}

void TestlineApiServer::handleRequest(QLocalSocket *socket, const QByteArray &payload)
{
    if (!socket) {
        return;
    }
    const QByteArray response = handleRequestPayload(payload);
    socket->write(response);
    socket->flush();
    socket->disconnectFromServer();
}

QByteArray TestlineApiServer::handleRequestPayload(const QByteArray &payload)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    testline::logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        TLOG_WARN(QStringLiteral("TestlineApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("parse_payload"),
                  QStringLiteral("json_parse"),
                  testline::logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse("Invalid JSON payload");
    }

    // Echoed back as sent.
    nlohmann::json id = -1;
    if (parsed.contains("id") && (parsed["id"].is_number_integer() || parsed["id"].is_string())) {
        id = parsed["id"];
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        TLOG_WARN(QStringLiteral("TestlineApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("missing_method"),
                  QStringLiteral("json_parse"),
                  testline::logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse("Missing method", id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params")) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse("Invalid params", id);
        }
        params = parsed["params"];
    }

    nlohmann::json paramKeys = nlohmann::json::array();
    for (auto it = params.begin(); it != params.end(); ++it) {
        paramKeys.push_back(it.key());
    }
    TLOG_INFO(QStringLiteral("TestlineApiServer"),
              QStringLiteral("handleRequest"),
              QStringLiteral("api_request_received"),
              QStringLiteral("client_call"),
              QStringLiteral("json_rpc"),
              testline::logging::defaultWho(),
              corrId,
              (nlohmann::json{{"method", method},
                             {"paramKeys", paramKeys}}));

    const auto start = std::chrono::steady_clock::now();
    try {
        const auto result = dispatch(method, params);
        if (!result.has_value()) {
            TLOG_WARN(QStringLiteral("TestlineApiServer"),
                      QStringLiteral("handleRequest"),
                      QStringLiteral("api_request_error"),
                      QStringLiteral("unknown_method"),
                      QStringLiteral("json_rpc"),
                      testline::logging::defaultWho(),
                      corrId,
                      (nlohmann::json{{"method", method}}));
            return makeErrorResponse("Unknown method", id);
        }

        TLOG_INFO(QStringLiteral("TestlineApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_completed"),
                  QStringLiteral("client_call"),
                  QStringLiteral("json_rpc"),
                  testline::logging::defaultWho(),
                  corrId,
                  (nlohmann::json{{"method", method},
                                 {"durationMs",
                                  std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::steady_clock::now() - start).count()},
                                 {"warnings", corrScope.warnings()}}));
        return makeResultResponse(*result, id);
    } catch (const EngineError &ex) {
        TLOG_WARN(QStringLiteral("TestlineApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_rejected"),
                  QString::fromStdString(toErrorKindString(ex.kind())),
                  QStringLiteral("json_rpc"),
                  testline::logging::defaultWho(),
                  corrId,
                  (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), id, toErrorKindString(ex.kind()));
    } catch (const std::exception &ex) {
        TLOG_ERROR(QStringLiteral("TestlineApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("exception"),
                   QStringLiteral("json_rpc"),
                   testline::logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), id, "internal");
    }
}

std::optional<nlohmann::json> TestlineApiServer::dispatch(const std::string &method,
                                                         const nlohmann::json &params)
{
    if (method == "get_current_status") {
        const std::string testCaseId = stringParam(params, "testCaseId");
        nlohmann::json result;
        result["status"] = m_engine.getCurrentStatus(testCaseId, cutoffParam(params));
        return result;
    }

    if (method == "get_aggregate_snapshot") {
        const auto releaseIds = releaseIdsParam(params);
        nlohmann::json result;
        result["snapshot"] = m_engine.getAggregateSnapshot(releaseIds, cutoffParam(params));
        result["scope"] = scopeSignature(releaseIds);
        return result;
    }

    if (method == "get_trend") {
        const auto releaseIds = releaseIdsParam(params);
        auto windowIt = params.find("windowDays");
        if (windowIt == params.end() || !fitsInt(*windowIt)) {
            throw EngineError(ErrorKind::InvalidWindow, "windowDays must be 7, 14 or 30");
        }
        const int windowDays = windowIt->get<int>();
        const auto points = m_engine.getTrend(releaseIds, windowDays);

        nlohmann::json pointsJson = nlohmann::json::array();
        for (const auto &point : points) {
            nlohmann::json entry = point;
            entry["day"] = referenceDayLabel(
                referenceDayIndex(point.cutoff, m_engine.referenceUtcOffsetMinutes()));
            pointsJson.push_back(entry);
        }
        nlohmann::json result;
        result["windowDays"] = windowDays;
        result["scope"] = scopeSignature(releaseIds);
        result["referenceUtcOffsetMinutes"] = m_engine.referenceUtcOffsetMinutes();
        result["points"] = pointsJson;
        return result;
    }

    if (method == "get_coverage") {
        nlohmann::json result;
        result["coverage"] = m_engine.getCoverage(releaseIdsParam(params));
        return result;
    }

    if (method == "get_requirement_breakdown") {
        const auto rows = m_engine.getRequirementBreakdown(releaseIdsParam(params),
                                                           cutoffParam(params));
        nlohmann::json result;
        result["requirements"] = rows;
        return result;
    }

    if (method == "get_automation_summary") {
        nlohmann::json result;
        result["automation"] = m_engine.getAutomationSummary(releaseIdsParam(params));
        return result;
    }

    if (method == "get_diagnostics") {
        nlohmann::json result;
        result["diagnostics"] = m_engine.diagnostics();
        result["sourceTiePolicy"] = toSourceTiePolicyString(m_engine.sourceTiePolicy());
        return result;
    }

    if (method == "record_execution") {
        requireParsableTimes(objectParam(params, "execution"),
                             {"execution_date", "created_at", "updated_at"});
        const auto record = recordParam<ManualExecutionRecord>(params, "execution");
        m_engine.recordManualExecution(record);
        nlohmann::json result;
        result["recorded"] = record.id;
        result["status"] = m_engine.getCurrentStatus(record.testCaseId);
        return result;
    }

    if (method == "record_automation_run") {
        requireParsableTimes(objectParam(params, "automation"),
                             {"last_run_date", "last_run_at", "updated_at"});
        const auto record = recordParam<AutomationRecord>(params, "automation");
        m_engine.recordAutomationRun(record);
        nlohmann::json result;
        result["recorded"] = record.id;
        result["status"] = m_engine.getCurrentStatus(record.testCaseId);
        return result;
    }

    return std::nullopt;
}

QByteArray TestlineApiServer::makeErrorResponse(const QString &message,
                                                const nlohmann::json &id,
                                                const std::string &errorKind) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["errorKind"] = errorKind;
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

QByteArray TestlineApiServer::makeResultResponse(const nlohmann::json &result,
                                                 const nlohmann::json &id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

} // namespace testline
