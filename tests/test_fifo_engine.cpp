// =============================================================================
// FifoSweepEngine Tests
// =============================================================================
// Uses a real named pipe in the temp directory; the test plays the
// generator's side by reading Command records from it.
// =============================================================================

#include <catch2/catch.hpp>
#include <fcntl.h>
#include <glibmm.h>
#include <signal.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>

#include "FifoSweepEngine.hpp"
#include "SweepErrors.hpp"
#include "test_helpers/FakeScheduler.hpp"

namespace {

std::string tempFifoPath(const char* name) {
  return Glib::build_filename(
      Glib::get_tmp_dir(),
      std::string(name) + "-" + std::to_string(getpid()));
}

// Generator side of the FIFO: created and opened for reading.
class FifoReader {
 public:
  explicit FifoReader(const std::string& path) : m_path(path), m_fd(-1) {
    create();
  }
  ~FifoReader() {
    if (m_fd >= 0) close(m_fd);
    unlink(m_path.c_str());
  }

  bool isOpen() const { return m_fd >= 0; }

  // Simula o gerador encerrando e um novo gerador abrindo o mesmo FIFO
  void closeReadEnd() {
    if (m_fd >= 0) close(m_fd);
    m_fd = -1;
  }
  void reopenReadEnd() {
    closeReadEnd();
    create();
  }

  bool next(Command& cmd) {
    return read(m_fd, &cmd, sizeof(Command)) ==
           static_cast<ssize_t>(sizeof(Command));
  }

 private:
  // Como o gerador: FIFO recriado a cada execução
  void create() {
    unlink(m_path.c_str());
    if (mkfifo(m_path.c_str(), 0600) == 0) {
      m_fd = open(m_path.c_str(), O_RDONLY | O_NONBLOCK);
    }
  }

  std::string m_path;
  int m_fd;
};

}  // namespace

TEST_CASE("FifoSweepEngine connects to a listening generator",
          "[engine][fifo]") {
  const std::string path = tempFifoPath("sweep-fifo");
  FifoReader reader(path);
  REQUIRE(reader.isOpen());

  FakeScheduler scheduler;
  FifoSweepEngine engine(scheduler, path);

  bool ready = false;
  std::exception_ptr startError;
  engine.start([&](std::exception_ptr error) {
    ready = true;
    startError = error;
  });

  REQUIRE(ready);
  REQUIRE_FALSE(startError);
  REQUIRE(engine.isConnected());

  Command cmd;
  REQUIRE(reader.next(cmd));
  REQUIRE(cmd.type == CMD_START);

  SECTION("engine-timed sweep carries the ramp") {
    engine.sweepRegular(WaveformKind::Sawtooth,
                        FrequencyRamp{20.0, 10000.0, 5.0});
    REQUIRE(reader.next(cmd));
    REQUIRE(cmd.type == CMD_SWEEP);
    REQUIRE(cmd.oscillator == OscillatorKind::Regular);
    REQUIRE(cmd.waveform == WaveformKind::Sawtooth);
    REQUIRE(cmd.startFrequency == 20.0);
    REQUIRE(cmd.endFrequency == 10000.0);
    REQUIRE(cmd.duration == 5.0);
  }

  SECTION("host-driven sweep sends frequency samples") {
    engine.sweepWavetable(WaveformKind::Sine, std::nullopt);
    engine.setWavetableFrequency(440.0);

    REQUIRE(reader.next(cmd));
    REQUIRE(cmd.type == CMD_SWEEP);
    REQUIRE(cmd.oscillator == OscillatorKind::Wavetable);
    REQUIRE(cmd.duration == 0.0);

    REQUIRE(reader.next(cmd));
    REQUIRE(cmd.type == CMD_SET_FREQ);
    REQUIRE(cmd.value == 440.0);
  }

  SECTION("silence targets one oscillator") {
    engine.silenceRegular();
    engine.silenceWavetable();

    REQUIRE(reader.next(cmd));
    REQUIRE(cmd.type == CMD_SILENCE);
    REQUIRE(cmd.oscillator == OscillatorKind::Regular);
    REQUIRE(reader.next(cmd));
    REQUIRE(cmd.oscillator == OscillatorKind::Wavetable);
  }

  SECTION("a second start is refused") {
    REQUIRE_THROWS_AS(engine.start([](std::exception_ptr) {}),
                      InitializationError);
  }
}

TEST_CASE("FifoSweepEngine reconnects after the generator restarts",
          "[engine][fifo]") {
  signal(SIGPIPE, SIG_IGN);
  const std::string path = tempFifoPath("sweep-fifo-restart");
  FifoReader reader(path);
  REQUIRE(reader.isOpen());

  FakeScheduler scheduler;
  FifoSweepEngine engine(scheduler, path);
  bool ready = false;
  engine.start([&](std::exception_ptr error) { ready = !error; });
  REQUIRE(ready);

  Command cmd;
  REQUIRE(reader.next(cmd));
  REQUIRE(cmd.type == CMD_START);

  reader.closeReadEnd();

  SECTION("fails while no generator is listening") {
    REQUIRE_THROWS_AS(engine.silenceRegular(), EngineOperationError);
    REQUIRE_FALSE(engine.isConnected());

    SECTION("and recovers once one is back") {
      reader.reopenReadEnd();
      REQUIRE_NOTHROW(engine.silenceRegular());
      REQUIRE(engine.isConnected());

      REQUIRE(reader.next(cmd));
      REQUIRE(cmd.type == CMD_START);
      REQUIRE(reader.next(cmd));
      REQUIRE(cmd.type == CMD_SILENCE);
      REQUIRE(cmd.oscillator == OscillatorKind::Regular);
    }
  }

  SECTION("a restarted generator gets the next command") {
    reader.reopenReadEnd();
    REQUIRE_NOTHROW(engine.sweepWavetable(WaveformKind::Sine, std::nullopt));
    REQUIRE(engine.isConnected());

    // Start again so the new generator renders
    REQUIRE(reader.next(cmd));
    REQUIRE(cmd.type == CMD_START);
    REQUIRE(reader.next(cmd));
    REQUIRE(cmd.type == CMD_SWEEP);
    REQUIRE(cmd.oscillator == OscillatorKind::Wavetable);
  }
}

TEST_CASE("FifoSweepEngine gives up when no generator listens",
          "[engine][fifo]") {
  const std::string path = tempFifoPath("sweep-fifo-missing");
  unlink(path.c_str());

  FakeScheduler scheduler;
  FifoSweepEngine engine(scheduler, path, 0.5);

  int calls = 0;
  std::exception_ptr startError;
  engine.start([&](std::exception_ptr error) {
    calls++;
    startError = error;
  });

  // Retries through the scheduler instead of blocking
  REQUIRE(calls == 0);
  REQUIRE(scheduler.pendingCount() == 1);

  scheduler.runUntilIdle();

  REQUIRE(calls == 1);
  REQUIRE(startError);
  REQUIRE_THROWS_AS(std::rethrow_exception(startError), InitializationError);
  REQUIRE(scheduler.now() >= 0.5);
  REQUIRE_FALSE(engine.isConnected());
}

TEST_CASE("FifoSweepEngine operations need a started engine",
          "[engine][fifo]") {
  FakeScheduler scheduler;
  FifoSweepEngine engine(scheduler, tempFifoPath("sweep-fifo-unused"));

  REQUIRE_THROWS_AS(engine.silenceWavetable(), EngineOperationError);
  REQUIRE_THROWS_AS(engine.sweepRegular(WaveformKind::Sine, std::nullopt),
                    EngineOperationError);
}

TEST_CASE("FifoSweepEngine cancels its retry when destroyed",
          "[engine][fifo]") {
  FakeScheduler scheduler;
  bool called = false;
  {
    FifoSweepEngine engine(scheduler, tempFifoPath("sweep-fifo-gone"));
    engine.start([&](std::exception_ptr) { called = true; });
    REQUIRE(scheduler.pendingCount() == 1);
  }
  REQUIRE(scheduler.pendingCount() == 0);
  scheduler.runUntilIdle();
  REQUIRE_FALSE(called);
}
