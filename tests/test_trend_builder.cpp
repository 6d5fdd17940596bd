#include <QtTest/QtTest>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "engine/day_window.hpp"
#include "engine/trend_builder.hpp"

namespace {

testline::TimePoint at(const char *iso)
{
    return *testline::parseIso8601(iso);
}

testline::StatusEvent event(const std::string &testCaseId,
                            const std::string &recordId,
                            testline::EventSource source,
                            testline::ExecutionResult result,
                            testline::TimePoint when)
{
    testline::StatusEvent e;
    e.testCaseId = testCaseId;
    e.recordId = recordId;
    e.source = source;
    e.result = result;
    e.effectiveTime = when;
    e.tiebreakTime = when;
    return e;
}

testline::Scope scopeOf(std::set<std::string> testCaseIds)
{
    testline::Scope scope;
    scope.testCaseIds = std::move(testCaseIds);
    return scope;
}

bool throwsKind(int windowDays, testline::ErrorKind kind)
{
    try {
        testline::buildTrend(windowDays, scopeOf({"T1"}), {}, at("2024-03-10T12:00:00Z"), 0);
    } catch (const testline::EngineError &e) {
        return e.kind() == kind;
    }
    return false;
}

} // namespace

class TrendBuilderTests : public QObject
{
    Q_OBJECT
private slots:
    void testSupportedWindowLengths();
    void testUnsupportedWindowRejected();
    void testCutoffsAreEndOfDayOldestFirst();
    void testNoEventsIsAllNotExecuted();
    void testStatusChangesAcrossDays();
    void testReferenceOffsetMovesDayBoundary();
    void testDayLabels();
    void testCutoffBeforeEpochRejected();
};

void TrendBuilderTests::testSupportedWindowLengths()
{
    for (int window : {7, 14, 30}) {
        const auto points = testline::buildTrend(window, scopeOf({"T1"}), {},
                                                 at("2024-03-10T12:00:00Z"), 0);
        QCOMPARE(points.size(), static_cast<size_t>(window));
    }
}

void TrendBuilderTests::testUnsupportedWindowRejected()
{
    QVERIFY(throwsKind(0, testline::ErrorKind::InvalidWindow));
    QVERIFY(throwsKind(8, testline::ErrorKind::InvalidWindow));
    QVERIFY(throwsKind(31, testline::ErrorKind::InvalidWindow));
    QVERIFY(throwsKind(-7, testline::ErrorKind::InvalidWindow));
    QVERIFY(!testline::isSupportedWindow(1));
}

void TrendBuilderTests::testCutoffsAreEndOfDayOldestFirst()
{
    const auto cutoffs = testline::trendCutoffs(7, at("2024-03-10T12:00:00Z"), 0);
    QCOMPARE(cutoffs.size(), static_cast<size_t>(7));
    QVERIFY(cutoffs.front() == at("2024-03-04T23:59:59.999Z"));
    QVERIFY(cutoffs.back() == at("2024-03-10T23:59:59.999Z"));
    for (size_t i = 1; i < cutoffs.size(); ++i) {
        QVERIFY(cutoffs[i] - cutoffs[i - 1] == std::chrono::milliseconds(testline::kMillisPerDay));
    }
}

void TrendBuilderTests::testNoEventsIsAllNotExecuted()
{
    const auto points = testline::buildTrend(14, scopeOf({"T1", "T2", "T3"}), {},
                                             at("2024-03-10T12:00:00Z"), 0);
    for (const auto &point : points) {
        QCOMPARE(point.total, 3);
        QCOMPARE(point.notExecuted, 3);
        QCOMPARE(point.executed, 0);
        QCOMPARE(point.passRate, 0);
        QVERIFY(!point.coverage.has_value());
    }

    const auto empty = testline::buildTrend(7, scopeOf({}), {}, at("2024-03-10T12:00:00Z"), 0);
    QCOMPARE(empty.size(), static_cast<size_t>(7));
    QCOMPARE(empty.back().total, 0);
}

void TrendBuilderTests::testStatusChangesAcrossDays()
{
    // Manual failure on day 1, automated pass on day 3.
    testline::EventsByTestCase events;
    events["T1"] = {
        event("T1", "ex-1", testline::EventSource::Manual, testline::ExecutionResult::Failed,
              at("2024-03-01T09:00:00Z")),
        event("T1", "auto-1", testline::EventSource::Automated, testline::ExecutionResult::Passed,
              at("2024-03-03T09:00:00Z")),
    };
    const auto timelines = testline::buildTimelines(events, testline::SourceTiePolicy::PreferManual);

    // Window ends on 2024-03-07, so it starts on 2024-03-01.
    const auto points = testline::buildTrend(7, scopeOf({"T1"}), timelines,
                                             at("2024-03-07T08:00:00Z"), 0);
    QCOMPARE(points[0].failed, 1);
    QCOMPARE(points[1].failed, 1);
    QCOMPARE(points[2].passed, 1);
    QCOMPARE(points[6].passed, 1);
    QCOMPARE(points[6].passRate, 100);
}

void TrendBuilderTests::testReferenceOffsetMovesDayBoundary()
{
    // 22:30 UTC on the 10th is 00:30 on the 11th at UTC+2.
    testline::EventsByTestCase events;
    events["T1"] = {
        event("T1", "ex-1", testline::EventSource::Manual, testline::ExecutionResult::Passed,
              at("2024-03-10T22:30:00Z")),
    };
    const auto timelines = testline::buildTimelines(events, testline::SourceTiePolicy::PreferManual);
    const auto now = at("2024-03-10T23:30:00Z");

    const auto utc = testline::buildTrend(7, scopeOf({"T1"}), timelines, now, 0);
    QCOMPARE(utc.back().passed, 1);
    QVERIFY(utc.back().cutoff == at("2024-03-10T23:59:59.999Z"));

    const auto plusTwo = testline::buildTrend(7, scopeOf({"T1"}), timelines, now, 120);
    QVERIFY(plusTwo.back().cutoff == at("2024-03-11T21:59:59.999Z"));
    QCOMPARE(plusTwo.back().passed, 1);
    QCOMPARE(plusTwo[5].passed, 0);
    QCOMPARE(plusTwo[5].notExecuted, 1);
}

void TrendBuilderTests::testDayLabels()
{
    const auto late = at("2024-03-11T01:00:00Z");
    QCOMPARE(QString::fromStdString(testline::referenceDayLabel(testline::referenceDayIndex(late, 0))),
             QStringLiteral("2024-03-11"));
    QCOMPARE(QString::fromStdString(testline::referenceDayLabel(testline::referenceDayIndex(late, -300))),
             QStringLiteral("2024-03-10"));
    QCOMPARE(QString::fromStdString(testline::referenceDayLabel(0)), QStringLiteral("1970-01-01"));
}

void TrendBuilderTests::testCutoffBeforeEpochRejected()
{
    bool thrown = false;
    try {
        testline::validateCutoff(testline::TimePoint(std::chrono::seconds(-1)));
    } catch (const testline::EngineError &e) {
        thrown = e.kind() == testline::ErrorKind::InvalidCutoff;
    }
    QVERIFY(thrown);

    testline::validateCutoff(testline::TimePoint(std::chrono::seconds(0)));
}

QTEST_MAIN(TrendBuilderTests)
#include "test_trend_builder.moc"
