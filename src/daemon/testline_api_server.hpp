#pragma once

#include <QHash>
#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

#include <optional>

#include <nlohmann/json.hpp>

#include "engine/coverage_engine.hpp"

namespace testline {

/**
 * TestlineApiServer exposes CoverageEngine queries over a local socket using
 * a minimal JSON-RPC-like protocol, one request per connection, terminated
 * by a newline:
 *   {"id": 1, "method": "get_trend", "params": {...}}
 *   -> {"result": {...}, "id": 1} or {"error": "...", "errorKind": "...", "id": 1}
 */
class TestlineApiServer : public QObject
{
    Q_OBJECT
public:
    TestlineApiServer(CoverageEngine &engine, const QString &socketName, QObject *parent = nullptr);
    ~TestlineApiServer() override;

    bool start();
    QString socketName() const;

    // Process a single JSON-RPC payload without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    void handleRequest(QLocalSocket *socket, const QByteArray &payload);
    // nullopt for an unknown method.
    std::optional<nlohmann::json> dispatch(const std::string &method, const nlohmann::json &params);
    QByteArray makeErrorResponse(const QString &message,
                                 const nlohmann::json &id = -1,
                                 const std::string &errorKind = "invalid_request") const;
    QByteArray makeResultResponse(const nlohmann::json &result, const nlohmann::json &id) const;

    CoverageEngine &m_engine;
    QString m_socketName;
    QLocalServer m_server;
    // Bytes received so far from clients whose request is not complete yet.
    QHash<QLocalSocket *, QByteArray> m_pending;
};

} // namespace testline
