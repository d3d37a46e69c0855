#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include <services/highlight_sink.hpp>
#include <trace/trace_workflow.hpp>
#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace traceflow;
using namespace traceflow::test;

namespace {

constexpr auto WAIT = std::chrono::seconds(5);

const Point BREAKER{100.0, 100.0};
const Point FUSE{300.0, 100.0};
const Point TRANSFORMER{500.0, 100.0};
const Point SWITCH{700.0, 100.0};
const Point MID_L1{200.0, 100.0};
const Point QUARTER_L3{550.0, 102.0};
const Point EMPTY_SPOT{400.0, 300.0};

// Identify service that always fails
class BrokenIdentify : public IdentifyService {
public:
    std::vector<IdentifyLayerResult> identify(const ScreenPoint&, double) override {
        throw TraceError(TraceErrorKind::Transport, "identify timed out");
    }
};

// Sink whose layer lookups fail
class ThrowingSink : public RecordingHighlightSink {
public:
    bool select_elements(const std::string&, const std::vector<NetworkElement>&) override {
        throw std::runtime_error("layer query failed");
    }
};

}  // namespace

class TraceWorkflowTest : public ::testing::Test {
protected:
    void SetUp() override {
        network = std::make_unique<InMemoryNetwork>(feeder_network(), session);
        network->load();
        gated = std::make_unique<GatedTraceService>(*network);
    }

    // Build the workflow against a tracer; the default runs traces directly
    TraceWorkflow& make_workflow(TraceService* tracer = nullptr,
                                 IdentifyService* identify = nullptr) {
        workflow = std::make_unique<TraceWorkflow>(session, WorkflowServices{
            identify ? *identify : static_cast<IdentifyService&>(*network),
            *network,
            tracer ? *tracer : static_cast<TraceService&>(*network),
            highlights});
        return *workflow;
    }

    TapOutcome tap(const Point& location) {
        return workflow->tap(session.viewport().to_screen(location), location);
    }

    void collect_start(const Point& location) {
        ASSERT_EQ(tap(location), TapOutcome::Added);
    }

    SessionContext session{test_config()};
    std::unique_ptr<InMemoryNetwork> network;
    std::unique_ptr<GatedTraceService> gated;
    RecordingHighlightSink highlights{std::vector<std::string>{DEVICE_LAYER, LINE_LAYER}};
    std::unique_ptr<TraceWorkflow> workflow;

    void TearDown() override {
        if (gated) {
            gated->release();
        }
        workflow.reset();
    }
};

// ============================================
// Transition Tests
// ============================================

TEST_F(TraceWorkflowTest, StartsIdle) {
    auto& wf = make_workflow();
    EXPECT_EQ(wf.state(), WorkflowState::Idle);
    EXPECT_TRUE(wf.can_start());
    EXPECT_FALSE(wf.can_cancel());
    EXPECT_FALSE(wf.hint().has_value());
    EXPECT_EQ(wf.point_type(), PointType::Start);
    EXPECT_EQ(wf.trace_type(), TraceType::Connected);
}

TEST_F(TraceWorkflowTest, StartEntersPointSelection) {
    auto& wf = make_workflow();
    wf.start();
    EXPECT_EQ(wf.state(), WorkflowState::SelectingPoints);
    EXPECT_EQ(wf.hint(), "Tap on the map to add a Starting Location.");

    wf.set_point_type(PointType::Barrier);
    EXPECT_EQ(wf.hint(), "Tap on the map to add a Barrier.");

    EXPECT_THROW(wf.start(), WorkflowError);
}

TEST_F(TraceWorkflowTest, OperationsRejectedOutsideTheirState) {
    auto& wf = make_workflow();
    EXPECT_THROW(wf.set_point_type(PointType::Barrier), WorkflowError);
    EXPECT_THROW(wf.next(), WorkflowError);
    EXPECT_THROW(wf.run_trace(), WorkflowError);
    EXPECT_THROW(wf.set_trace_type(TraceType::Upstream), WorkflowError);
    EXPECT_EQ(tap(FUSE), TapOutcome::Ignored);
    EXPECT_EQ(wf.state(), WorkflowState::Idle);
}

TEST_F(TraceWorkflowTest, NextRequiresStartPoint) {
    auto& wf = make_workflow();
    wf.start();
    EXPECT_FALSE(wf.can_advance());
    try {
        wf.next();
        FAIL() << "Expected WorkflowError";
    } catch (const WorkflowError& e) {
        EXPECT_EQ(e.kind(), WorkflowErrorKind::NoStartPoints);
    }

    // Barriers alone are not enough
    wf.set_point_type(PointType::Barrier);
    ASSERT_EQ(tap(FUSE), TapOutcome::Added);
    EXPECT_THROW(wf.next(), WorkflowError);
    EXPECT_EQ(wf.state(), WorkflowState::SelectingPoints);

    wf.set_point_type(PointType::Start);
    collect_start(MID_L1);
    EXPECT_TRUE(wf.can_advance());
    wf.next();
    EXPECT_EQ(wf.state(), WorkflowState::SelectingTraceType);
    EXPECT_EQ(wf.hint(), "Choose the trace type");
}

TEST_F(TraceWorkflowTest, UnsupportedTraceTypeRejected) {
    SessionConfig config = test_config();
    config.trace_types = {TraceType::Connected, TraceType::Downstream};
    SessionContext limited(config);
    TraceWorkflow wf(limited, WorkflowServices{*network, *network, *network, highlights});

    wf.start();
    try {
        wf.set_trace_type(TraceType::Upstream);
        FAIL() << "Expected WorkflowError";
    } catch (const WorkflowError& e) {
        EXPECT_EQ(e.kind(), WorkflowErrorKind::UnsupportedTraceType);
    }
    wf.set_trace_type(TraceType::Downstream);
    EXPECT_EQ(wf.trace_type(), TraceType::Downstream);
}

// ============================================
// Tap Resolution Tests
// ============================================

TEST_F(TraceWorkflowTest, SingleTerminalJunctionCommitsImmediately) {
    auto& wf = make_workflow();
    wf.start();
    EXPECT_EQ(tap(FUSE), TapOutcome::Added);

    ASSERT_EQ(wf.starting_points().size(), 1u);
    const TracePoint& point = wf.starting_points()[0];
    EXPECT_EQ(point.element.global_id, "{F1}");
    EXPECT_FALSE(point.element.terminal.has_value());
    EXPECT_EQ(point.location, FUSE);

    ASSERT_EQ(highlights.markers().size(), 1u);
    EXPECT_EQ(highlights.markers()[0].type, PointType::Start);
}

TEST_F(TraceWorkflowTest, EdgeTapRecordsFractionAlong) {
    auto& wf = make_workflow();
    wf.start();
    wf.set_point_type(PointType::Barrier);
    EXPECT_EQ(tap(QUARTER_L3), TapOutcome::Added);

    ASSERT_EQ(wf.barriers().size(), 1u);
    const NetworkElement& element = wf.barriers()[0].element;
    EXPECT_EQ(element.global_id, "{L3}");
    ASSERT_TRUE(element.fraction_along_edge.has_value());
    EXPECT_NEAR(*element.fraction_along_edge, 0.25, 1e-9);
    EXPECT_EQ(wf.barriers()[0].location, QUARTER_L3);
    EXPECT_TRUE(wf.starting_points().empty());
}

TEST_F(TraceWorkflowTest, LookupFailuresChangeNothing) {
    auto& wf = make_workflow();
    wf.start();
    EXPECT_EQ(tap(EMPTY_SPOT), TapOutcome::LookupFailure);
    EXPECT_EQ(wf.state(), WorkflowState::SelectingPoints);
    EXPECT_TRUE(wf.starting_points().empty());
    EXPECT_FALSE(wf.last_error().has_value());

    BrokenIdentify broken;
    auto& failing = make_workflow(nullptr, &broken);
    failing.start();
    EXPECT_EQ(tap(FUSE), TapOutcome::LookupFailure);
    EXPECT_TRUE(failing.starting_points().empty());
}

TEST_F(TraceWorkflowTest, TerminalSelectionCommitsChosenTerminal) {
    auto& wf = make_workflow();
    int prompts = 0;
    wf.subscribe([&](const WorkflowEvent& e) {
        if (e.kind == EventKind::TerminalSelectionRequired) ++prompts;
    });

    wf.start();
    EXPECT_EQ(tap(TRANSFORMER), TapOutcome::TerminalSelectionRequired);
    EXPECT_EQ(prompts, 1);
    ASSERT_TRUE(wf.pending_item().has_value());
    EXPECT_EQ(wf.pending_item()->element.global_id, "{T1}");
    ASSERT_EQ(wf.pending_terminals().size(), 3u);
    EXPECT_TRUE(wf.starting_points().empty());
    EXPECT_FALSE(wf.can_advance());

    // Taps wait until the choice is made
    EXPECT_EQ(tap(FUSE), TapOutcome::Ignored);
    EXPECT_THROW(wf.next(), WorkflowError);

    // Second of three terminals
    wf.select_terminal(1);
    EXPECT_FALSE(wf.pending_item().has_value());
    ASSERT_EQ(wf.starting_points().size(), 1u);
    ASSERT_TRUE(wf.starting_points()[0].element.terminal.has_value());
    EXPECT_EQ(wf.starting_points()[0].element.terminal->name, "Low");
    EXPECT_EQ(wf.starting_points()[0].element.terminal->id, 2u);
}

TEST_F(TraceWorkflowTest, TerminalSelectionErrors) {
    auto& wf = make_workflow();
    wf.start();
    try {
        wf.select_terminal(0);
        FAIL() << "Expected WorkflowError";
    } catch (const WorkflowError& e) {
        EXPECT_EQ(e.kind(), WorkflowErrorKind::NoPendingItem);
    }

    ASSERT_EQ(tap(BREAKER), TapOutcome::TerminalSelectionRequired);
    try {
        wf.select_terminal(2);
        FAIL() << "Expected WorkflowError";
    } catch (const WorkflowError& e) {
        EXPECT_EQ(e.kind(), WorkflowErrorKind::InvalidTerminal);
    }
    EXPECT_TRUE(wf.pending_item().has_value());

    wf.dismiss_terminal_selection();
    EXPECT_FALSE(wf.pending_item().has_value());
    EXPECT_TRUE(wf.starting_points().empty());
    EXPECT_EQ(tap(FUSE), TapOutcome::Added);
}

TEST_F(TraceWorkflowTest, PointCountsMatchResolvedTaps) {
    auto& wf = make_workflow();
    wf.start();

    size_t expected_starts = 0;
    size_t expected_barriers = 0;

    struct Step { Point at; PointType type; std::optional<size_t> terminal; };
    std::vector<Step> steps = {
        {FUSE, PointType::Start, std::nullopt},
        {EMPTY_SPOT, PointType::Start, std::nullopt},
        {TRANSFORMER, PointType::Barrier, size_t{0}},
        {MID_L1, PointType::Barrier, std::nullopt},
        {BREAKER, PointType::Start, std::nullopt},   // Dismissed below
        {SWITCH, PointType::Start, std::nullopt},
    };

    for (const auto& step : steps) {
        wf.set_point_type(step.type);
        TapOutcome outcome = tap(step.at);
        if (outcome == TapOutcome::TerminalSelectionRequired) {
            if (step.terminal) {
                wf.select_terminal(*step.terminal);
            } else {
                wf.dismiss_terminal_selection();
                continue;
            }
        } else if (outcome != TapOutcome::Added) {
            continue;
        }
        if (step.type == PointType::Start) ++expected_starts; else ++expected_barriers;
    }

    EXPECT_EQ(wf.starting_points().size(), expected_starts);
    EXPECT_EQ(wf.barriers().size(), expected_barriers);
    EXPECT_EQ(expected_starts, 2u);
    EXPECT_EQ(expected_barriers, 2u);
    EXPECT_EQ(highlights.markers().size(), 4u);
}

// ============================================
// Trace Tests
// ============================================

TEST_F(TraceWorkflowTest, RequestCarriesPointsAndTierConfiguration) {
    auto& wf = make_workflow();
    wf.start();
    collect_start(FUSE);
    wf.set_point_type(PointType::Barrier);
    ASSERT_EQ(tap(QUARTER_L3), TapOutcome::Added);
    wf.next();
    wf.set_trace_type(TraceType::Downstream);

    TraceRequest request = wf.build_request();
    EXPECT_EQ(request.type, TraceType::Downstream);
    EXPECT_EQ(global_ids(request.starting_locations), (std::vector<std::string>{"{F1}"}));
    EXPECT_EQ(global_ids(request.barriers), (std::vector<std::string>{"{L3}"}));
    ASSERT_TRUE(request.configuration.has_value());
    EXPECT_EQ(request.configuration->tier, "Medium Voltage Radial");
}

TEST_F(TraceWorkflowTest, UpstreamTraceShowsResultsByLayer) {
    auto& wf = make_workflow();
    std::vector<EventKind> events;
    wf.subscribe([&](const WorkflowEvent& e) { events.push_back(e.kind); });

    wf.start();
    collect_start(FUSE);
    wf.next();
    wf.set_trace_type(TraceType::Upstream);
    EXPECT_TRUE(wf.can_run_trace());
    wf.run_trace();

    ASSERT_TRUE(wf.wait_for_completion(WAIT));
    EXPECT_EQ(wf.state(), WorkflowState::ViewingResults);
    EXPECT_FALSE(wf.last_error().has_value());

    ASSERT_TRUE(wf.outcome().has_value());
    const TraceOutcome& outcome = *wf.outcome();
    EXPECT_FALSE(outcome.error.has_value());
    ASSERT_EQ(outcome.elements_by_layer.size(), 2u);
    EXPECT_EQ(global_ids(outcome.elements_by_layer.at(DEVICE_LAYER)),
              (std::vector<std::string>{"{F1}", "{BRK}"}));
    EXPECT_EQ(global_ids(outcome.elements_by_layer.at(LINE_LAYER)),
              (std::vector<std::string>{"{L1}"}));

    EXPECT_EQ(highlights.selections().size(), 2u);
    EXPECT_EQ(highlights.selections().at(LINE_LAYER).size(), 1u);

    EXPECT_NE(std::find(events.begin(), events.end(), EventKind::TraceCompleted), events.end());
    EXPECT_EQ(events.back(), EventKind::TraceCompleted);
}

TEST_F(TraceWorkflowTest, UndisplayedLayersAreSkipped) {
    RecordingHighlightSink lines_only(std::vector<std::string>{LINE_LAYER});
    TraceWorkflow wf(session, WorkflowServices{*network, *network, *network, lines_only});

    wf.start();
    ASSERT_EQ(wf.tap(session.viewport().to_screen(FUSE), FUSE), TapOutcome::Added);
    wf.next();
    wf.run_trace();
    ASSERT_TRUE(wf.wait_for_completion(WAIT));

    EXPECT_EQ(wf.state(), WorkflowState::ViewingResults);
    EXPECT_EQ(wf.outcome()->elements_by_layer.size(), 2u);
    EXPECT_EQ(lines_only.selections().size(), 1u);
    EXPECT_EQ(lines_only.selections().count(DEVICE_LAYER), 0u);
}

TEST_F(TraceWorkflowTest, TracingStateBlocksEditing) {
    auto& wf = make_workflow(gated.get());
    wf.start();
    collect_start(FUSE);
    wf.next();
    wf.run_trace();

    EXPECT_EQ(wf.state(), WorkflowState::Tracing);
    EXPECT_EQ(wf.hint(), "Tracing...");
    EXPECT_FALSE(wf.can_run_trace());
    EXPECT_THROW(wf.run_trace(), WorkflowError);
    EXPECT_EQ(tap(MID_L1), TapOutcome::Ignored);
    EXPECT_FALSE(wf.poll());

    gated->release();
    ASSERT_TRUE(wf.wait_for_completion(WAIT));
    EXPECT_EQ(wf.state(), WorkflowState::ViewingResults);
    EXPECT_EQ(wf.outcome()->element_count(), 7u);
}

TEST_F(TraceWorkflowTest, FailedTraceShowsEmptyResult) {
    FailingTraceService failing(TraceErrorKind::Service, "Subnetwork controller not found");
    auto& wf = make_workflow(&failing);
    wf.start();
    collect_start(FUSE);
    wf.next();
    wf.set_trace_type(TraceType::Upstream);
    wf.run_trace();

    ASSERT_TRUE(wf.wait_for_completion(WAIT));
    EXPECT_EQ(wf.state(), WorkflowState::ViewingResults);
    ASSERT_TRUE(wf.outcome().has_value());
    EXPECT_TRUE(wf.outcome()->empty());
    EXPECT_EQ(wf.outcome()->error, "Subnetwork controller not found");

    ASSERT_TRUE(wf.last_error().has_value());
    EXPECT_EQ(wf.last_error()->kind, IssueKind::TraceSubmissionFailure);
    EXPECT_TRUE(highlights.selections().empty());
    EXPECT_EQ(wf.starting_points().size(), 1u);
}

TEST_F(TraceWorkflowTest, FailedTraceCanReturnToIdle) {
    SessionConfig config = test_config();
    config.failure_policy = FailurePolicy::ReturnToIdle;
    SessionContext strict(config);
    FailingTraceService failing(TraceErrorKind::Transport, "connection refused");
    TraceWorkflow wf(strict, WorkflowServices{*network, *network, failing, highlights});

    wf.start();
    ASSERT_EQ(wf.tap(strict.viewport().to_screen(FUSE), FUSE), TapOutcome::Added);
    wf.next();
    wf.run_trace();
    ASSERT_TRUE(wf.wait_for_completion(WAIT));

    EXPECT_EQ(wf.state(), WorkflowState::Idle);
    EXPECT_FALSE(wf.outcome().has_value());
    EXPECT_TRUE(wf.starting_points().empty());
    ASSERT_TRUE(wf.last_error().has_value());
    EXPECT_EQ(wf.last_error()->message, "connection refused");
}

TEST_F(TraceWorkflowTest, ServiceSideCancellationIsReported) {
    FailingTraceService failing(TraceErrorKind::Cancelled, "Request aborted by server");
    auto& wf = make_workflow(&failing);
    wf.start();
    collect_start(FUSE);
    wf.next();
    wf.run_trace();
    ASSERT_TRUE(wf.wait_for_completion(WAIT));

    ASSERT_TRUE(wf.last_error().has_value());
    EXPECT_EQ(wf.last_error()->kind, IssueKind::CancellationRequested);
    EXPECT_EQ(wf.state(), WorkflowState::ViewingResults);
}

TEST_F(TraceWorkflowTest, NewCycleAfterResults) {
    auto& wf = make_workflow();
    wf.start();
    collect_start(FUSE);
    wf.next();
    wf.run_trace();
    ASSERT_TRUE(wf.wait_for_completion(WAIT));
    EXPECT_FALSE(wf.can_start());
    EXPECT_TRUE(wf.can_cancel());

    wf.reset();
    wf.start();
    EXPECT_TRUE(wf.starting_points().empty());
    EXPECT_FALSE(wf.outcome().has_value());
    EXPECT_TRUE(highlights.selections().empty());
    EXPECT_TRUE(highlights.markers().empty());
}

// ============================================
// Reset and Cancellation Tests
// ============================================

TEST_F(TraceWorkflowTest, ResetFromEveryStateClearsEverything) {
    auto& wf = make_workflow(gated.get());

    auto expect_clean = [&]() {
        EXPECT_EQ(wf.state(), WorkflowState::Idle);
        EXPECT_TRUE(wf.starting_points().empty());
        EXPECT_TRUE(wf.barriers().empty());
        EXPECT_FALSE(wf.pending_item().has_value());
        EXPECT_FALSE(wf.outcome().has_value());
        EXPECT_EQ(wf.point_type(), PointType::Start);
        EXPECT_EQ(wf.trace_type(), TraceType::Connected);
    };

    wf.reset();
    expect_clean();

    // Pending terminal choice
    wf.start();
    wf.set_point_type(PointType::Barrier);
    collect_start(FUSE);
    ASSERT_EQ(tap(TRANSFORMER), TapOutcome::TerminalSelectionRequired);
    wf.reset();
    expect_clean();

    // Trace type chosen
    wf.start();
    collect_start(FUSE);
    wf.next();
    wf.set_trace_type(TraceType::Subnetwork);
    wf.reset();
    expect_clean();

    // Results shown
    gated->release();
    wf.start();
    collect_start(FUSE);
    wf.next();
    wf.run_trace();
    ASSERT_TRUE(wf.wait_for_completion(WAIT));
    ASSERT_EQ(wf.state(), WorkflowState::ViewingResults);
    wf.reset();
    expect_clean();
    EXPECT_TRUE(highlights.selections().empty());
}

TEST_F(TraceWorkflowTest, ResetDuringTraceDropsLateResult) {
    auto& wf = make_workflow(gated.get());
    std::vector<EventKind> events;
    wf.subscribe([&](const WorkflowEvent& e) { events.push_back(e.kind); });

    wf.start();
    collect_start(FUSE);
    wf.next();
    wf.run_trace();
    ASSERT_TRUE(gated->wait_started(1));

    wf.reset();
    EXPECT_EQ(wf.state(), WorkflowState::Idle);

    // The worker finishes after the reset; nothing may reach the workflow
    gated->release();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(wf.poll());
    EXPECT_FALSE(wf.wait_for_completion(std::chrono::milliseconds(20)));

    EXPECT_EQ(wf.state(), WorkflowState::Idle);
    EXPECT_FALSE(wf.outcome().has_value());
    EXPECT_FALSE(wf.last_error().has_value());
    EXPECT_TRUE(highlights.selections().empty());
    EXPECT_EQ(std::count(events.begin(), events.end(), EventKind::TraceCompleted), 0);
    EXPECT_EQ(std::count(events.begin(), events.end(), EventKind::TraceFailed), 0);
}

TEST_F(TraceWorkflowTest, TraceAfterCancelledTraceUsesNewResult) {
    auto& wf = make_workflow(gated.get());
    wf.start();
    collect_start(FUSE);
    wf.next();
    wf.run_trace();
    ASSERT_TRUE(gated->wait_started(1));
    wf.reset();

    wf.start();
    collect_start(SWITCH);
    wf.next();
    wf.set_trace_type(TraceType::Upstream);
    wf.run_trace();
    gated->release();
    ASSERT_TRUE(wf.wait_for_completion(WAIT));

    ASSERT_TRUE(wf.outcome().has_value());
    EXPECT_FALSE(wf.outcome()->error.has_value());
    // Upstream from the switch reaches the whole feeder path back to the breaker
    EXPECT_EQ(wf.outcome()->element_count(), 7u);
}

// ============================================
// Subscription Tests
// ============================================

TEST_F(TraceWorkflowTest, SubscribersSeeStateChanges) {
    auto& wf = make_workflow();
    std::vector<WorkflowState> states;
    SubscriptionId id = wf.subscribe([&](const WorkflowEvent& e) {
        if (e.kind == EventKind::StateChanged) states.push_back(e.state);
    });

    wf.start();
    collect_start(FUSE);
    wf.next();
    wf.run_trace();
    ASSERT_TRUE(wf.wait_for_completion(WAIT));

    EXPECT_EQ(states, (std::vector<WorkflowState>{
        WorkflowState::SelectingPoints, WorkflowState::SelectingTraceType,
        WorkflowState::Tracing, WorkflowState::ViewingResults}));

    wf.unsubscribe(id);
    wf.reset();
    EXPECT_EQ(states.size(), 4u);
}

TEST_F(TraceWorkflowTest, EventsCarryTheNewState) {
    auto& wf = make_workflow();
    std::vector<std::pair<EventKind, WorkflowState>> events;
    wf.subscribe([&](const WorkflowEvent& e) {
        if (e.kind != EventKind::StateChanged) events.emplace_back(e.kind, e.state);
    });

    wf.start();
    collect_start(FUSE);
    wf.next();
    wf.run_trace();
    ASSERT_TRUE(wf.wait_for_completion(WAIT));
    wf.reset();

    EXPECT_EQ(events, (std::vector<std::pair<EventKind, WorkflowState>>{
        {EventKind::PointAdded, WorkflowState::SelectingPoints},
        {EventKind::TraceCompleted, WorkflowState::ViewingResults},
        {EventKind::Reset, WorkflowState::Idle}}));
}

TEST_F(TraceWorkflowTest, FailedTraceEventCarriesTheNewState) {
    FailingTraceService failing(TraceErrorKind::Service, "Subnetwork controller not found");
    auto& wf = make_workflow(&failing);
    std::optional<WorkflowState> failed_state;
    wf.subscribe([&](const WorkflowEvent& e) {
        if (e.kind == EventKind::TraceFailed) failed_state = e.state;
    });

    wf.start();
    collect_start(FUSE);
    wf.next();
    wf.run_trace();
    ASSERT_TRUE(wf.wait_for_completion(WAIT));
    EXPECT_EQ(failed_state, WorkflowState::ViewingResults);
}

TEST_F(TraceWorkflowTest, HighlightFailureStillShowsResults) {
    ThrowingSink sink;
    TraceWorkflow wf(session, WorkflowServices{*network, *network, *network, sink});

    wf.start();
    ASSERT_EQ(wf.tap(session.viewport().to_screen(FUSE), FUSE), TapOutcome::Added);
    wf.next();
    wf.run_trace();

    EXPECT_TRUE(wf.wait_for_completion(WAIT));
    EXPECT_EQ(wf.state(), WorkflowState::ViewingResults);
    ASSERT_TRUE(wf.outcome().has_value());
    EXPECT_EQ(wf.outcome()->element_count(), 7u);
    ASSERT_TRUE(wf.last_error().has_value());
    EXPECT_EQ(wf.last_error()->kind, IssueKind::TraceSubmissionFailure);
    EXPECT_EQ(wf.last_error()->message, "layer query failed");
    EXPECT_FALSE(wf.poll());

    wf.reset();
    EXPECT_EQ(wf.state(), WorkflowState::Idle);
}
