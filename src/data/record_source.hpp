#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace testline {

// Read-only view of the upstream directories and execution logs.
// Implementations throw EngineError(InvalidRequest) when a collaborator
// cannot be read.
class RecordSource
{
public:
    virtual ~RecordSource() = default;

    virtual std::vector<TestCase> listTestCases() const = 0;
    virtual std::vector<Requirement> listRequirements() const = 0;
    virtual std::vector<Release> listReleases() const = 0;
    virtual std::vector<ManualExecutionRecord> listManualExecutions() const = 0;
    virtual std::vector<AutomationRecord> listAutomations() const = 0;

    // Entries dropped by the most recent list calls because they were not
    // readable records. Ids where the entry carries one, positions otherwise.
    virtual std::vector<std::string> rejectedRecordIds() const
    {
        return {};
    }
};

// Fetches every collaborator once.
inline RecordSet loadRecordSet(const RecordSource &source)
{
    RecordSet records;
    records.testCases = source.listTestCases();
    records.requirements = source.listRequirements();
    records.releases = source.listReleases();
    records.manualExecutions = source.listManualExecutions();
    records.automations = source.listAutomations();
    records.rejectedRecordIds = source.rejectedRecordIds();
    return records;
}

} // namespace testline
