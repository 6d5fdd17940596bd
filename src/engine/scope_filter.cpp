#include "engine/scope_filter.hpp"

#include <algorithm>

namespace testline {

namespace {

bool intersects(const std::set<std::string> &a, const std::set<std::string> &b)
{
    const auto &smaller = a.size() <= b.size() ? a : b;
    const auto &larger = a.size() <= b.size() ? b : a;
    return std::any_of(smaller.begin(), smaller.end(), [&larger](const std::string &id) {
        return larger.count(id) > 0;
    });
}

std::set<std::string> knownReleaseIds(const std::vector<TestCase> &testCases,
                                      const std::vector<Requirement> &requirements,
                                      const std::vector<Release> &releases)
{
    std::set<std::string> known;
    for (const auto &release : releases) {
        known.insert(release.id);
    }
    for (const auto &requirement : requirements) {
        if (requirement.releaseId.has_value()) {
            known.insert(*requirement.releaseId);
        }
    }
    for (const auto &testCase : testCases) {
        known.insert(testCase.releaseIds.begin(), testCase.releaseIds.end());
    }
    return known;
}

} // namespace

std::string scopeSignature(const std::set<std::string> &selectedReleaseIds)
{
    if (selectedReleaseIds.empty()) {
        return "*";
    }
    std::string signature;
    for (const auto &id : selectedReleaseIds) {
        if (!signature.empty()) {
            signature += ",";
        }
        signature += id;
    }
    return signature;
}

std::string Scope::signature() const
{
    return scopeSignature(selectedReleaseIds);
}

Scope computeScope(const std::set<std::string> &selectedReleaseIds,
                   const std::vector<TestCase> &testCases,
                   const std::vector<Requirement> &requirements,
                   const std::vector<Release> &releases)
{
    Scope scope;
    scope.selectedReleaseIds = selectedReleaseIds;

    if (selectedReleaseIds.empty()) {
        scope.kind = ScopeKind::Unrestricted;
        for (const auto &requirement : requirements) {
            scope.requirementIds.insert(requirement.id);
        }
        for (const auto &testCase : testCases) {
            scope.testCaseIds.insert(testCase.id);
        }
        return scope;
    }

    const auto known = knownReleaseIds(testCases, requirements, releases);
    for (const auto &id : selectedReleaseIds) {
        if (known.count(id) == 0) {
            scope.unknownReleaseIds.insert(id);
        }
    }
    scope.kind = scope.unknownReleaseIds.size() == selectedReleaseIds.size()
        ? ScopeKind::UnknownOnly
        : ScopeKind::Selected;

    for (const auto &requirement : requirements) {
        if (requirement.releaseId.has_value()
            && selectedReleaseIds.count(*requirement.releaseId) > 0) {
            scope.requirementIds.insert(requirement.id);
        }
    }

    for (const auto &testCase : testCases) {
        // A test case reached only through its requirement is still in scope.
        if (intersects(testCase.releaseIds, selectedReleaseIds)
            || intersects(testCase.requirementIds, scope.requirementIds)) {
            scope.testCaseIds.insert(testCase.id);
        }
    }

    return scope;
}

} // namespace testline
