#pragma once

namespace testline {

enum class EventSource {
    Manual,
    Automated
};

// Result carried by a recorded event.
enum class ExecutionResult {
    Passed,
    Failed,
    Blocked,
    Skipped
};

// Result of resolving a test case at a cutoff. NotExecuted means no event
// was known at the cutoff, which is distinct from an explicit Skipped.
enum class ResolvedResult {
    Passed,
    Failed,
    Blocked,
    Skipped,
    NotExecuted
};

enum class ResolvedSource {
    Manual,
    Automated,
    None
};

// Which source wins when a manual and an automated event share the exact
// same effective time.
enum class SourceTiePolicy {
    PreferManual,
    PreferAutomated
};

enum class ScopeKind {
    Unrestricted,
    Selected,
    UnknownOnly
};

} // namespace testline
