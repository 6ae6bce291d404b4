#include <gtest/gtest.h>
#include <algorithm>
#include "error_handler.hh"
#include "stamp_dispatcher.hh"
#include "test_support.hh"

namespace {

using test_support::RecordingRenderer;

std::vector<TimedPhoto> MakeTimeline(size_t count) {
    StampClock clock(CalendarDate{2025, 3, 5}, 10 * 3600);
    std::vector<TimedPhoto> timeline;
    for (size_t i = 0; i < count; ++i) {
        TimedPhoto timed;
        timed.photo.path = "/photos/" + std::to_string(i) + ".jpg";
        timed.photo.sort_key = std::to_string(i) + ".jpg";
        timed.phase = "main";
        timed.group_key = "";
        timed.at = clock.Now();
        timeline.push_back(timed);
        clock.Advance(65);
    }
    return timeline;
}

TEST(StampDispatcherTest, RendersEveryRecordWithFormattedTime) {
    RecordingRenderer renderer;
    StampFormatter formatter("en");
    StampDispatcher dispatcher(renderer, formatter, {"North gate", "Yard"});
    RunReport report;
    std::mt19937 rng(4);

    auto records = dispatcher.Dispatch(MakeTimeline(3), rng, report);
    ASSERT_EQ(records.size(), 3u);
    ASSERT_EQ(renderer.calls.size(), 3u);
    EXPECT_EQ(renderer.calls[0].timestamp, "05 Mar. 2025 10:00:00");
    EXPECT_EQ(renderer.calls[1].timestamp, "05 Mar. 2025 10:01:05");
    EXPECT_EQ(records[2].formatted_timestamp, "05 Mar. 2025 10:02:10");

    for (const auto& call : renderer.calls) {
        EXPECT_TRUE(call.location == "North gate" || call.location == "Yard");
    }
    EXPECT_EQ(report.RecordCount(), 3u);
    EXPECT_EQ(report.RenderedCount(), 3u);
    EXPECT_FALSE(report.HasFailures());
}

// -----------------------------------------------------------------------------
// Render failures are reported and the rest of the batch goes on
// -----------------------------------------------------------------------------
TEST(StampDispatcherTest, FailedRenderIsReportedAndSkipped) {
    RecordingRenderer renderer;
    renderer.fail_on = "/photos/1.jpg";
    renderer.throw_on = "/photos/2.jpg";
    StampFormatter formatter;
    StampDispatcher dispatcher(renderer, formatter, {"Site"});
    RunReport report;
    std::mt19937 rng(0);

    auto records = dispatcher.Dispatch(MakeTimeline(4), rng, report);
    EXPECT_EQ(records.size(), 4u);
    EXPECT_EQ(renderer.calls.size(), 4u);
    EXPECT_EQ(report.RenderedCount(), 2u);
    EXPECT_EQ(report.RenderFailureCount(), 2u);
    EXPECT_TRUE(report.HasFailures());

    json failures = report.ToJson()["render_failures"];
    ASSERT_EQ(failures.size(), 2u);
    EXPECT_EQ(failures[0]["path"].get<std::string>(), "/photos/1.jpg");
    EXPECT_EQ(failures[0]["reason"].get<std::string>(), "renderer reported failure");
    EXPECT_EQ(failures[1]["reason"].get<std::string>(), "disk full");
}

TEST(StampDispatcherTest, EmptyLocationsIsConfigError) {
    RecordingRenderer renderer;
    StampFormatter formatter;
    try {
        StampDispatcher dispatcher(renderer, formatter, {});
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.subject(), "LOCATIONS");
    }
}

TEST(StampDispatcherTest, LocationChoiceFollowsSeed) {
    std::vector<std::string> locations = {"A", "B", "C", "D", "E"};
    auto timeline = MakeTimeline(20);
    StampFormatter formatter;

    RecordingRenderer first_renderer, second_renderer;
    StampDispatcher first(first_renderer, formatter, locations);
    StampDispatcher second(second_renderer, formatter, locations);
    RunReport report;
    std::mt19937 rng_a(2024), rng_b(2024);

    auto a = first.Dispatch(timeline, rng_a, report);
    auto b = second.Dispatch(timeline, rng_b, report);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].location, b[i].location);
        EXPECT_NE(std::find(locations.begin(), locations.end(), a[i].location), locations.end());
    }
}

} // namespace
