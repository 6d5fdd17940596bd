#include <QtTest/QtTest>

#include <algorithm>

#include "common/json_utils.hpp"
#include "engine/status_resolver.hpp"

namespace {

testline::TimePoint at(const char *iso)
{
    return *testline::parseIso8601(iso);
}

testline::StatusEvent event(const std::string &recordId,
                            testline::EventSource source,
                            testline::ExecutionResult result,
                            testline::TimePoint effective,
                            testline::TimePoint tiebreak)
{
    testline::StatusEvent e;
    e.testCaseId = "TC-1";
    e.recordId = recordId;
    e.source = source;
    e.result = result;
    e.effectiveTime = effective;
    e.tiebreakTime = tiebreak;
    return e;
}

} // namespace

class StatusResolverTests : public QObject
{
    Q_OBJECT
private slots:
    void testNoEventsIsNotExecuted();
    void testLatestEventWins();
    void testEventsAfterCutoffIgnored();
    void testResolveIsIdempotent();
    void testManualTieBrokenByCreationTime();
    void testSourceTiePolicy();
    void testSkippedDistinctFromNotExecuted();
    void testTimelineMatchesNaiveResolve();
};

void StatusResolverTests::testNoEventsIsNotExecuted()
{
    const auto status = testline::resolveStatus("TC-1", {}, at("2024-03-10T00:00:00Z"));
    QCOMPARE(status.result, testline::ResolvedResult::NotExecuted);
    QCOMPARE(status.source, testline::ResolvedSource::None);
    QVERIFY(!status.eventTime.has_value());
    QVERIFY(status.asOf == at("2024-03-10T00:00:00Z"));
}

void StatusResolverTests::testLatestEventWins()
{
    // Manual failure on day 1, automated pass on day 3.
    const std::vector<testline::StatusEvent> events = {
        event("auto-1", testline::EventSource::Automated, testline::ExecutionResult::Passed,
              at("2024-03-03T09:00:00Z"), at("2024-03-03T09:00:00Z")),
        event("ex-1", testline::EventSource::Manual, testline::ExecutionResult::Failed,
              at("2024-03-01T09:00:00Z"), at("2024-03-01T09:00:00Z")),
    };

    const auto day5 = testline::resolveStatus("TC-1", events, at("2024-03-05T00:00:00Z"));
    QCOMPARE(day5.result, testline::ResolvedResult::Passed);
    QCOMPARE(day5.source, testline::ResolvedSource::Automated);

    const auto day2 = testline::resolveStatus("TC-1", events, at("2024-03-02T00:00:00Z"));
    QCOMPARE(day2.result, testline::ResolvedResult::Failed);
    QCOMPARE(day2.source, testline::ResolvedSource::Manual);
}

void StatusResolverTests::testEventsAfterCutoffIgnored()
{
    const std::vector<testline::StatusEvent> events = {
        event("ex-1", testline::EventSource::Manual, testline::ExecutionResult::Passed,
              at("2024-03-01T09:00:00Z"), at("2024-03-01T09:00:00Z")),
        event("ex-2", testline::EventSource::Manual, testline::ExecutionResult::Failed,
              at("2024-03-04T09:00:00Z"), at("2024-03-04T09:00:00Z")),
    };

    // An event exactly at the cutoff is visible; one a millisecond later is not.
    const auto exact = testline::resolveStatus("TC-1", events, at("2024-03-04T09:00:00Z"));
    QCOMPARE(exact.result, testline::ResolvedResult::Failed);

    const auto before = testline::resolveStatus("TC-1", events, at("2024-03-04T08:59:59.999Z"));
    QCOMPARE(before.result, testline::ResolvedResult::Passed);

    const auto beforeAll = testline::resolveStatus("TC-1", events, at("2024-02-28T00:00:00Z"));
    QCOMPARE(beforeAll.result, testline::ResolvedResult::NotExecuted);
}

void StatusResolverTests::testResolveIsIdempotent()
{
    const std::vector<testline::StatusEvent> events = {
        event("ex-1", testline::EventSource::Manual, testline::ExecutionResult::Blocked,
              at("2024-03-01T09:00:00Z"), at("2024-03-01T09:00:00Z")),
        event("auto-1", testline::EventSource::Automated, testline::ExecutionResult::Passed,
              at("2024-03-01T09:00:00Z"), at("2024-03-01T09:30:00Z")),
    };
    const auto cutoff = at("2024-03-02T00:00:00Z");

    const auto first = testline::resolveStatus("TC-1", events, cutoff);
    const auto second = testline::resolveStatus("TC-1", events, cutoff);
    QCOMPARE(first.result, second.result);
    QCOMPARE(first.source, second.source);
    QVERIFY(first.eventTime == second.eventTime);
}

void StatusResolverTests::testManualTieBrokenByCreationTime()
{
    const auto day = at("2024-03-01T00:00:00Z");
    const auto older = event("ex-a", testline::EventSource::Manual, testline::ExecutionResult::Failed,
                             day, at("2024-03-01T10:00:00Z"));
    const auto newer = event("ex-b", testline::EventSource::Manual, testline::ExecutionResult::Passed,
                             day, at("2024-03-01T11:00:00Z"));
    const auto cutoff = at("2024-03-02T00:00:00Z");

    const auto forward = testline::resolveStatus("TC-1", {older, newer}, cutoff);
    const auto reverse = testline::resolveStatus("TC-1", {newer, older}, cutoff);
    QCOMPARE(forward.result, testline::ResolvedResult::Passed);
    QCOMPARE(reverse.result, testline::ResolvedResult::Passed);
}

void StatusResolverTests::testSourceTiePolicy()
{
    const auto day = at("2024-03-01T12:00:00Z");
    const auto manualEvent = event("ex-1", testline::EventSource::Manual,
                                   testline::ExecutionResult::Failed, day, day);
    // A later record update must not let the automated run jump the policy.
    const auto automatedEvent = event("auto-1", testline::EventSource::Automated,
                                      testline::ExecutionResult::Passed, day,
                                      at("2024-03-01T13:00:00Z"));
    const auto cutoff = at("2024-03-02T00:00:00Z");

    for (const auto &events : {std::vector<testline::StatusEvent>{manualEvent, automatedEvent},
                               std::vector<testline::StatusEvent>{automatedEvent, manualEvent}}) {
        const auto preferManual = testline::resolveStatus(
            "TC-1", events, cutoff, testline::SourceTiePolicy::PreferManual);
        QCOMPARE(preferManual.source, testline::ResolvedSource::Manual);
        QCOMPARE(preferManual.result, testline::ResolvedResult::Failed);

        const auto preferAutomated = testline::resolveStatus(
            "TC-1", events, cutoff, testline::SourceTiePolicy::PreferAutomated);
        QCOMPARE(preferAutomated.source, testline::ResolvedSource::Automated);
        QCOMPARE(preferAutomated.result, testline::ResolvedResult::Passed);
    }
}

void StatusResolverTests::testSkippedDistinctFromNotExecuted()
{
    const std::vector<testline::StatusEvent> events = {
        event("ex-1", testline::EventSource::Manual, testline::ExecutionResult::Skipped,
              at("2024-03-01T09:00:00Z"), at("2024-03-01T09:00:00Z")),
    };
    const auto status = testline::resolveStatus("TC-1", events, at("2024-03-02T00:00:00Z"));
    QCOMPARE(status.result, testline::ResolvedResult::Skipped);
    QCOMPARE(status.source, testline::ResolvedSource::Manual);
}

void StatusResolverTests::testTimelineMatchesNaiveResolve()
{
    std::vector<testline::StatusEvent> events = {
        event("ex-1", testline::EventSource::Manual, testline::ExecutionResult::Failed,
              at("2024-03-01T09:00:00Z"), at("2024-03-01T09:00:00Z")),
        event("ex-2", testline::EventSource::Manual, testline::ExecutionResult::Passed,
              at("2024-03-01T09:00:00Z"), at("2024-03-01T09:10:00Z")),
        event("auto-1", testline::EventSource::Automated, testline::ExecutionResult::Blocked,
              at("2024-03-01T09:00:00Z"), at("2024-03-01T08:00:00Z")),
        event("ex-3", testline::EventSource::Manual, testline::ExecutionResult::Skipped,
              at("2024-03-03T00:00:00Z"), at("2024-03-03T00:00:00Z")),
        event("auto-2", testline::EventSource::Automated, testline::ExecutionResult::Passed,
              at("2024-03-05T23:59:59.999Z"), at("2024-03-05T23:59:59.999Z")),
    };
    std::reverse(events.begin(), events.end());

    const std::vector<testline::TimePoint> cutoffs = {
        at("2024-02-29T00:00:00Z"),
        at("2024-03-01T09:00:00Z"),
        at("2024-03-02T12:00:00Z"),
        at("2024-03-03T00:00:00Z"),
        at("2024-03-05T23:59:59.998Z"),
        at("2024-03-05T23:59:59.999Z"),
        at("2024-04-01T00:00:00Z"),
    };

    for (auto policy : {testline::SourceTiePolicy::PreferManual,
                        testline::SourceTiePolicy::PreferAutomated}) {
        const testline::EventTimeline timeline("TC-1", events, policy);
        for (const auto &cutoff : cutoffs) {
            const auto naive = testline::resolveStatus("TC-1", events, cutoff, policy);
            const auto indexed = timeline.statusAt(cutoff);
            QCOMPARE(indexed.result, naive.result);
            QCOMPARE(indexed.source, naive.source);
            QVERIFY(indexed.eventTime == naive.eventTime);
        }
    }
}

QTEST_MAIN(StatusResolverTests)
#include "test_status_resolver.moc"
