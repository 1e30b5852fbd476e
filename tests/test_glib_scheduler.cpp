// =============================================================================
// GlibScheduler Tests
// =============================================================================
// Runs the default Glib::MainContext for real; delays are a few tens of
// milliseconds so ordering holds without depending on machine speed.
// =============================================================================

#include <catch2/catch.hpp>
#include <glibmm.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "GlibScheduler.hpp"
#include "SweepSequencer.hpp"
#include "test_helpers/MockSweepEngine.hpp"

namespace {

// Dispatches every ready source of the default context for `seconds`.
void pumpFor(double seconds) {
  Glib::init();
  auto context = Glib::MainContext::get_default();
  const auto until = std::chrono::steady_clock::now() +
                     std::chrono::duration<double>(seconds);
  while (std::chrono::steady_clock::now() < until) {
    while (context->pending()) context->iteration(false);
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  while (context->pending()) context->iteration(false);
}

}  // namespace

// =============================================================================
// Timers
// =============================================================================

TEST_CASE("GlibScheduler runs each task once in due-time order",
          "[scheduler][glib]") {
  GlibScheduler scheduler;
  std::vector<std::string> ran;

  scheduler.scheduleAfter(0.06, [&]() { ran.push_back("late"); });
  scheduler.scheduleAfter(0.01, [&]() { ran.push_back("early"); });
  scheduler.scheduleAfter(0.03, [&]() { ran.push_back("middle"); });
  REQUIRE(scheduler.pendingCount() == 3);

  pumpFor(0.15);

  REQUIRE(ran == std::vector<std::string>{"early", "middle", "late"});
  REQUIRE(scheduler.pendingCount() == 0);

  // One-shot: nothing runs again
  pumpFor(0.05);
  REQUIRE(ran.size() == 3);
}

TEST_CASE("GlibScheduler never runs a cancelled task", "[scheduler][glib]") {
  GlibScheduler scheduler;
  bool cancelledRan = false;
  bool keptRan = false;

  auto id = scheduler.scheduleAfter(0.01, [&]() { cancelledRan = true; });
  scheduler.scheduleAfter(0.02, [&]() { keptRan = true; });
  REQUIRE(id != 0);

  scheduler.cancel(id);
  REQUIRE(scheduler.pendingCount() == 1);

  pumpFor(0.08);
  REQUIRE_FALSE(cancelledRan);
  REQUIRE(keptRan);

  SECTION("cancelling a finished id is ignored") {
    scheduler.cancel(id);
    REQUIRE(scheduler.pendingCount() == 0);
  }
}

TEST_CASE("GlibScheduler drops pending tasks when destroyed",
          "[scheduler][glib]") {
  bool ran = false;
  {
    GlibScheduler scheduler;
    scheduler.scheduleAfter(0.01, [&]() { ran = true; });
    scheduler.scheduleNextFrame([&]() { ran = true; });
  }
  pumpFor(0.08);
  REQUIRE_FALSE(ran);
}

TEST_CASE("GlibScheduler spaces frames by the frame interval",
          "[scheduler][glib]") {
  GlibScheduler scheduler(0.03);
  const double scheduledAt = scheduler.now();
  double ranAt = -1.0;

  scheduler.scheduleNextFrame([&]() { ranAt = scheduler.now(); });
  pumpFor(0.1);

  REQUIRE(ranAt >= scheduledAt + 0.025);
  REQUIRE(scheduler.pendingCount() == 0);
}

TEST_CASE("GlibScheduler accepts tasks scheduled from a running task",
          "[scheduler][glib]") {
  GlibScheduler scheduler;
  int chain = 0;

  scheduler.scheduleAfter(0.01, [&]() {
    chain++;
    scheduler.scheduleAfter(0.01, [&]() { chain++; });
  });
  pumpFor(0.08);

  REQUIRE(chain == 2);
  REQUIRE(scheduler.pendingCount() == 0);
}

// =============================================================================
// Sequencer on the GLib main loop
// =============================================================================

TEST_CASE("SweepSequencer completes a plan on a Glib::MainLoop",
          "[scheduler][glib][sequencer]") {
  Glib::init();
  auto loop = Glib::MainLoop::create();
  GlibScheduler scheduler(0.01);
  MockEngineLog log;
  MockEngineFactory factory{scheduler, log};
  factory.behavior = StartBehavior::Deferred;
  factory.startDelay = 0.01;
  RecordingStatusReporter reporter;

  SweepConfig config;
  config.waveforms = {WaveformKind::Sine};
  config.duration = 0.03;
  config.postSilenceDelay = 0.01;
  SweepSequencer sequencer(config, factory.make(), scheduler, reporter);

  SequencerState finished = SequencerState::Idle;
  sequencer.setFinishedCallback([&](SequencerState state) {
    finished = state;
    loop->quit();
  });

  // Safety net so a broken scheduler fails instead of hanging
  bool timedOut = false;
  auto guard = Glib::signal_timeout().connect(
      [&]() {
        timedOut = true;
        loop->quit();
        return false;
      },
      2000);

  REQUIRE(sequencer.trigger());
  loop->run();
  guard.disconnect();

  REQUIRE_FALSE(timedOut);
  REQUIRE(finished == SequencerState::Completed);
  REQUIRE(log.sweeps().size() == 2);
  REQUIRE(log.count("silenceWavetable") == 1);
  REQUIRE(log.count("silenceRegular") == 1);
  REQUIRE(reporter.last() == "All sweeps completed!");
  REQUIRE(scheduler.pendingCount() == 0);
}
