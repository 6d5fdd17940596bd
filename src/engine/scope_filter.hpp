#pragma once

#include <set>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace testline {

struct Scope {
    ScopeKind kind = ScopeKind::Unrestricted;
    std::set<std::string> selectedReleaseIds;
    // Selected ids that match no release, requirement or test case.
    std::set<std::string> unknownReleaseIds;
    std::set<std::string> requirementIds;
    std::set<std::string> testCaseIds;

    bool unrestricted() const
    {
        return kind == ScopeKind::Unrestricted;
    }

    // Stable key for caching: "*" when unrestricted, else the sorted ids.
    std::string signature() const;
};

/**
 * Resolve a release selection into the requirements and test cases it
 * reaches. An empty selection means "no filter": every requirement and
 * test case is in scope.
 *
 * Otherwise a requirement is in scope when its release is selected, and a
 * test case is in scope when it is tagged with a selected release OR links
 * a requirement that is in scope.
 */
Scope computeScope(const std::set<std::string> &selectedReleaseIds,
                   const std::vector<TestCase> &testCases,
                   const std::vector<Requirement> &requirements,
                   const std::vector<Release> &releases);

std::string scopeSignature(const std::set<std::string> &selectedReleaseIds);

} // namespace testline
