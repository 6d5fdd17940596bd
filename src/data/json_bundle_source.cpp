#include "data/json_bundle_source.hpp"

#include <QDir>
#include <QFile>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace testline {

JsonBundleSource::JsonBundleSource(const QString &directory)
    : m_directory(directory)
{
}

const char *JsonBundleSource::testCasesFile()
{
    return "testcases.json";
}

const char *JsonBundleSource::requirementsFile()
{
    return "requirements.json";
}

const char *JsonBundleSource::releasesFile()
{
    return "releases.json";
}

const char *JsonBundleSource::executionsFile()
{
    return "executions.json";
}

const char *JsonBundleSource::automationsFile()
{
    return "automations.json";
}

const QString &JsonBundleSource::directory() const
{
    return m_directory;
}

nlohmann::json JsonBundleSource::readArray(const char *fileName) const
{
    const QString path = QDir(m_directory).filePath(QString::fromUtf8(fileName));
    QFile file(path);
    if (!file.exists()) {
        return nlohmann::json::array();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        throw EngineError(ErrorKind::InvalidRequest,
                          "cannot open " + path.toStdString());
    }

    const auto parsed = nlohmann::json::parse(file.readAll().toStdString(), nullptr, false);
    if (parsed.is_discarded()) {
        throw EngineError(ErrorKind::InvalidRequest,
                          "invalid JSON in " + path.toStdString());
    }
    // Upstream list endpoints sometimes wrap the array as {"items": [...]}.
    if (parsed.is_object() && parsed.contains("items") && parsed["items"].is_array()) {
        return parsed["items"];
    }
    if (!parsed.is_array()) {
        throw EngineError(ErrorKind::InvalidRequest,
                          "expected a JSON array in " + path.toStdString());
    }
    return parsed;
}

namespace {

std::string rejectedLabel(const nlohmann::json &item, const char *fileName, std::size_t index)
{
    if (item.is_object()) {
        auto it = item.find("id");
        if (it != item.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
        if (it != item.end() && it->is_number()) {
            return it->dump();
        }
    }
    return std::string(fileName) + "#" + std::to_string(index);
}

} // namespace

template <typename T>
std::vector<T> JsonBundleSource::readRecords(const char *fileName) const
{
    const nlohmann::json items = readArray(fileName);

    std::vector<T> records;
    records.reserve(items.size());
    std::vector<std::string> rejected;
    for (std::size_t index = 0; index < items.size(); ++index) {
        const auto &item = items[index];
        if (!item.is_object()) {
            rejected.push_back(rejectedLabel(item, fileName, index));
            continue;
        }
        try {
            records.push_back(item.get<T>());
        } catch (const nlohmann::json::exception &) {
            rejected.push_back(rejectedLabel(item, fileName, index));
        }
    }

    if (!rejected.empty()) {
        TLOG_WARN(QStringLiteral("JsonBundleSource"),
                  QStringLiteral("readRecords"),
                  QStringLiteral("records_ignored"),
                  QStringLiteral("not_a_record_object"),
                  QStringLiteral("json"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"file", fileName}, {"ignored", rejected}}));
    }

    std::lock_guard<std::mutex> lock(m_rejectedMutex);
    m_rejectedByFile[fileName] = std::move(rejected);
    return records;
}

std::vector<TestCase> JsonBundleSource::listTestCases() const
{
    return readRecords<TestCase>(testCasesFile());
}

std::vector<Requirement> JsonBundleSource::listRequirements() const
{
    return readRecords<Requirement>(requirementsFile());
}

std::vector<Release> JsonBundleSource::listReleases() const
{
    return readRecords<Release>(releasesFile());
}

std::vector<ManualExecutionRecord> JsonBundleSource::listManualExecutions() const
{
    return readRecords<ManualExecutionRecord>(executionsFile());
}

std::vector<AutomationRecord> JsonBundleSource::listAutomations() const
{
    return readRecords<AutomationRecord>(automationsFile());
}

std::vector<std::string> JsonBundleSource::rejectedRecordIds() const
{
    std::lock_guard<std::mutex> lock(m_rejectedMutex);
    std::vector<std::string> ids;
    for (const auto &[fileName, rejected] : m_rejectedByFile) {
        ids.insert(ids.end(), rejected.begin(), rejected.end());
    }
    return ids;
}

} // namespace testline
