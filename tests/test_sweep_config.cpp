// =============================================================================
// SweepConfig Tests
// =============================================================================
// Lists, key file loading and command line precedence.
// =============================================================================

#include <catch2/catch.hpp>
#include <glibmm.h>
#include <unistd.h>

#include <cstdio>
#include <string>
#include <vector>

#include "Communication.hpp"
#include "SweepConfig.hpp"
#include "SweepErrors.hpp"

namespace {

// Owns a mutable argv for Glib::OptionContext::parse().
class ArgumentList {
 public:
  ArgumentList(std::initializer_list<std::string> args) : m_args(args) {
    for (auto& arg : m_args) m_pointers.push_back(arg.data());
    m_pointers.push_back(nullptr);
    m_argc = static_cast<int>(m_args.size());
    m_argv = m_pointers.data();
  }

  SweepOptions parse() {
    Glib::init();
    return parseSweepOptions(m_argc, m_argv, "- test");
  }

  int argc() const { return m_argc; }

 private:
  std::vector<std::string> m_args;
  std::vector<char*> m_pointers;
  int m_argc;
  char** m_argv;
};

// Key file written to the temp directory and removed afterwards.
class TempKeyFile {
 public:
  explicit TempKeyFile(const std::string& contents)
      : m_path(Glib::build_filename(
            Glib::get_tmp_dir(),
            "sweep-config-" + std::to_string(getpid()) + ".ini")) {
    Glib::file_set_contents(m_path, contents);
  }
  ~TempKeyFile() { std::remove(m_path.c_str()); }

  const std::string& path() const { return m_path; }

 private:
  std::string m_path;
};

}  // namespace

// =============================================================================
// Lists
// =============================================================================

TEST_CASE("parseWaveformList reads comma separated names", "[config]") {
  auto waveforms = parseWaveformList("sine, Square,saw ,triangle");
  REQUIRE(waveforms == std::vector<WaveformKind>{
                           WaveformKind::Sine, WaveformKind::Square,
                           WaveformKind::Sawtooth, WaveformKind::Triangle});

  REQUIRE(parseWaveformList("").empty());
  REQUIRE_THROWS_AS(parseWaveformList("sine,noise"), ConfigurationError);
}

TEST_CASE("parseOscillatorList accepts aliases", "[config]") {
  auto oscillators = parseOscillatorList("naive,bandlimited");
  REQUIRE(oscillators == std::vector<OscillatorKind>{OscillatorKind::Regular,
                                                     OscillatorKind::Wavetable});
  REQUIRE_THROWS_AS(parseOscillatorList("fm"), ConfigurationError);
}

TEST_CASE("SweepConfig defaults are valid", "[config]") {
  SweepConfig config;
  REQUIRE_NOTHROW(config.validate());
  REQUIRE(config.waitBeforeSilence() == DEFAULT_SWEEP_DURATION);

  config.fadeEpsilon = 0.05;
  REQUIRE(config.waitBeforeSilence() == Approx(DEFAULT_SWEEP_DURATION - 0.05));
}

// =============================================================================
// Command line and key file
// =============================================================================

TEST_CASE("parseSweepOptions keeps defaults without arguments",
          "[config][options]") {
  ArgumentList args{"sweep"};
  SweepOptions options = args.parse();

  REQUIRE(options.sweep.duration == DEFAULT_SWEEP_DURATION);
  REQUIRE(options.sweep.waveforms.size() == 4);
  REQUIRE(options.fifoPath == FIFO_COMMAND);
  REQUIRE_FALSE(options.runOnce);
  REQUIRE_FALSE(options.verbose);
}

TEST_CASE("parseSweepOptions applies command line values",
          "[config][options]") {
  ArgumentList args{"sweep",         "--start-freq", "100",
                    "-e",            "2000",         "--duration",
                    "1.5",           "--settle",     "0.25",
                    "--mode",        "host",         "--waveforms",
                    "square",        "--oscillators", "regular",
                    "--fifo",        "/tmp/other",   "--run"};
  SweepOptions options = args.parse();

  REQUIRE(options.sweep.startFrequency == 100.0);
  REQUIRE(options.sweep.endFrequency == 2000.0);
  REQUIRE(options.sweep.duration == 1.5);
  REQUIRE(options.sweep.postSilenceDelay == 0.25);
  REQUIRE(options.sweep.mode == SweepMode::HostDriven);
  REQUIRE(options.sweep.waveforms ==
          std::vector<WaveformKind>{WaveformKind::Square});
  REQUIRE(options.sweep.oscillators ==
          std::vector<OscillatorKind>{OscillatorKind::Regular});
  REQUIRE(options.fifoPath == "/tmp/other");
  REQUIRE(options.runOnce);
  // Recognized options are removed from argv
  REQUIRE(args.argc() == 1);
}

TEST_CASE("parseSweepOptions rejects bad input", "[config][options]") {
  SECTION("unknown option") {
    ArgumentList args{"sweep", "--loudness", "11"};
    REQUIRE_THROWS_AS(args.parse(), ConfigurationError);
  }
  SECTION("invalid range") {
    ArgumentList args{"sweep", "--start-freq", "5000", "--end-freq", "100"};
    REQUIRE_THROWS_AS(args.parse(), ConfigurationError);
  }
  SECTION("unknown mode") {
    ArgumentList args{"sweep", "--mode", "sideways"};
    REQUIRE_THROWS_AS(args.parse(), ConfigurationError);
  }
  SECTION("missing config file") {
    ArgumentList args{"sweep", "--config", "/nonexistent/sweep.ini"};
    REQUIRE_THROWS_AS(args.parse(), ConfigurationError);
  }
}

TEST_CASE("loadSweepConfigFile reads the sweep and engine groups",
          "[config][keyfile]") {
  TempKeyFile file(
      "[sweep]\n"
      "waveforms=sine;triangle\n"
      "oscillators=regular\n"
      "start_frequency=50\n"
      "duration=2\n"
      "fade_epsilon=0.1\n"
      "mode=host-driven\n"
      "frame_interval=0.02\n"
      "\n"
      "[engine]\n"
      "fifo=/tmp/from-file\n");

  SECTION("file values apply over defaults") {
    SweepOptions options;
    loadSweepConfigFile(file.path(), options);

    REQUIRE(options.sweep.waveforms ==
            std::vector<WaveformKind>{WaveformKind::Sine,
                                      WaveformKind::Triangle});
    REQUIRE(options.sweep.oscillators ==
            std::vector<OscillatorKind>{OscillatorKind::Regular});
    REQUIRE(options.sweep.startFrequency == 50.0);
    REQUIRE(options.sweep.endFrequency == DEFAULT_END_FREQUENCY);
    REQUIRE(options.sweep.duration == 2.0);
    REQUIRE(options.sweep.fadeEpsilon == 0.1);
    REQUIRE(options.sweep.mode == SweepMode::HostDriven);
    REQUIRE(options.sweep.frameInterval == 0.02);
    REQUIRE(options.fifoPath == "/tmp/from-file");
    REQUIRE(options.configFile == file.path());
  }

  SECTION("command line values apply over the file") {
    ArgumentList args{"sweep", "--config", file.path(), "--duration", "3",
                      "--mode", "engine-timed"};
    SweepOptions options = args.parse();

    REQUIRE(options.sweep.duration == 3.0);
    REQUIRE(options.sweep.mode == SweepMode::EngineTimed);
    REQUIRE(options.sweep.startFrequency == 50.0);
    REQUIRE(options.fifoPath == "/tmp/from-file");
  }
}

TEST_CASE("loadSweepConfigFile reports malformed values",
          "[config][keyfile]") {
  SECTION("non-numeric duration") {
    TempKeyFile file("[sweep]\nduration=long\n");
    SweepOptions options;
    REQUIRE_THROWS_AS(loadSweepConfigFile(file.path(), options),
                      ConfigurationError);
  }
  SECTION("unknown waveform") {
    TempKeyFile file("[sweep]\nwaveforms=sine;noise\n");
    SweepOptions options;
    REQUIRE_THROWS_AS(loadSweepConfigFile(file.path(), options),
                      ConfigurationError);
  }
}
