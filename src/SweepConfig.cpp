#include "SweepConfig.hpp"

#include <glibmm.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

#include "Communication.hpp"
#include "SweepErrors.hpp"

namespace {

const char* const SWEEP_GROUP = "sweep";
const char* const ENGINE_GROUP = "engine";

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string::npos) return {};
  const auto last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

// Quebra "a, b,c" em {"a", "b", "c"}, ignorando itens vazios.
std::vector<std::string> splitList(const std::string& text) {
  std::vector<std::string> items;
  std::istringstream iss(text);
  std::string item;
  while (std::getline(iss, item, ',')) {
    item = trim(item);
    if (!item.empty()) items.push_back(item);
  }
  return items;
}

WaveformKind requireWaveform(const std::string& name) {
  auto waveform = parseWaveformKind(name);
  if (!waveform) throw ConfigurationError("unknown waveform '" + name + "'");
  return *waveform;
}

OscillatorKind requireOscillator(const std::string& name) {
  auto oscillator = parseOscillatorKind(name);
  if (!oscillator) {
    throw ConfigurationError("unknown oscillator kind '" + name + "'");
  }
  return *oscillator;
}

SweepMode requireMode(const std::string& name) {
  auto mode = parseSweepMode(name);
  if (!mode) throw ConfigurationError("unknown sweep mode '" + name + "'");
  return *mode;
}

template <typename T>
bool hasDuplicates(std::vector<T> values) {
  std::sort(values.begin(), values.end());
  return std::adjacent_find(values.begin(), values.end()) != values.end();
}

[[noreturn]] void rejectValue(const char* what, double value,
                              const char* requirement) {
  std::ostringstream oss;
  oss << what << " must be " << requirement << " (got " << value << ")";
  throw ConfigurationError(oss.str());
}

Glib::OptionEntry makeEntry(const char* longName, gchar shortName,
                            const char* description,
                            const char* argDescription = nullptr) {
  Glib::OptionEntry entry;
  entry.set_long_name(longName);
  if (shortName != 0) entry.set_short_name(shortName);
  entry.set_description(description);
  if (argDescription) entry.set_arg_description(argDescription);
  return entry;
}

}  // namespace

void SweepConfig::validate() const {
  if (waveforms.empty()) {
    throw ConfigurationError("at least one waveform is required");
  }
  if (oscillators.empty()) {
    throw ConfigurationError("at least one oscillator kind is required");
  }
  if (hasDuplicates(waveforms)) {
    throw ConfigurationError("waveforms must not repeat");
  }
  if (hasDuplicates(oscillators)) {
    throw ConfigurationError("oscillator kinds must not repeat");
  }
  if (!std::isfinite(startFrequency) || startFrequency <= 0.0) {
    rejectValue("start frequency", startFrequency, "positive");
  }
  if (!std::isfinite(endFrequency) || endFrequency <= startFrequency) {
    rejectValue("end frequency", endFrequency,
                "greater than the start frequency");
  }
  if (!std::isfinite(duration) || duration <= 0.0) {
    rejectValue("duration", duration, "positive");
  }
  if (!std::isfinite(postSilenceDelay) || postSilenceDelay < 0.0) {
    rejectValue("post-silence delay", postSilenceDelay, "non-negative");
  }
  if (!std::isfinite(fadeEpsilon) || fadeEpsilon < 0.0 ||
      fadeEpsilon >= duration) {
    rejectValue("fade epsilon", fadeEpsilon,
                "non-negative and shorter than the duration");
  }
  if (mode == SweepMode::HostDriven &&
      (!std::isfinite(frameInterval) || frameInterval <= 0.0)) {
    rejectValue("frame interval", frameInterval, "positive");
  }
}

std::vector<WaveformKind> parseWaveformList(const std::string& text) {
  std::vector<WaveformKind> waveforms;
  for (const auto& name : splitList(text)) {
    waveforms.push_back(requireWaveform(name));
  }
  return waveforms;
}

std::vector<OscillatorKind> parseOscillatorList(const std::string& text) {
  std::vector<OscillatorKind> oscillators;
  for (const auto& name : splitList(text)) {
    oscillators.push_back(requireOscillator(name));
  }
  return oscillators;
}

void loadSweepConfigFile(const std::string& path, SweepOptions& options) {
  auto keyFile = Glib::KeyFile::create();
  SweepConfig& config = options.sweep;

  try {
    keyFile->load_from_file(path);

    if (keyFile->has_group(SWEEP_GROUP)) {
      auto readDouble = [&](const char* key, double& target) {
        if (keyFile->has_key(SWEEP_GROUP, key)) {
          target = keyFile->get_double(SWEEP_GROUP, key);
        }
      };
      readDouble("start_frequency", config.startFrequency);
      readDouble("end_frequency", config.endFrequency);
      readDouble("duration", config.duration);
      readDouble("post_silence_delay", config.postSilenceDelay);
      readDouble("fade_epsilon", config.fadeEpsilon);
      readDouble("frame_interval", config.frameInterval);

      if (keyFile->has_key(SWEEP_GROUP, "waveforms")) {
        config.waveforms.clear();
        for (const auto& name :
             keyFile->get_string_list(SWEEP_GROUP, "waveforms")) {
          config.waveforms.push_back(requireWaveform(trim(name.raw())));
        }
      }
      if (keyFile->has_key(SWEEP_GROUP, "oscillators")) {
        config.oscillators.clear();
        for (const auto& name :
             keyFile->get_string_list(SWEEP_GROUP, "oscillators")) {
          config.oscillators.push_back(requireOscillator(trim(name.raw())));
        }
      }
      if (keyFile->has_key(SWEEP_GROUP, "mode")) {
        config.mode =
            requireMode(trim(keyFile->get_string(SWEEP_GROUP, "mode").raw()));
      }
    }

    if (keyFile->has_group(ENGINE_GROUP) &&
        keyFile->has_key(ENGINE_GROUP, "fifo")) {
      options.fifoPath = keyFile->get_string(ENGINE_GROUP, "fifo").raw();
    }
  } catch (const Glib::Error& e) {
    throw ConfigurationError(path + ": " + e.what());
  }

  options.configFile = path;
}

SweepOptions parseSweepOptions(int& argc, char**& argv,
                               const std::string& summary) {
  // NaN marca "não informado" para as opções numéricas
  const double unset = std::numeric_limits<double>::quiet_NaN();
  double startFrequency = unset;
  double endFrequency = unset;
  double duration = unset;
  double postSilenceDelay = unset;
  double fadeEpsilon = unset;
  double frameInterval = unset;
  Glib::ustring mode;
  Glib::ustring waveforms;
  Glib::ustring oscillators;
  std::string configFile;
  std::string fifoPath;
  bool runOnce = false;
  bool verbose = false;

  Glib::OptionGroup group("sweep", "Sweep options", "Show sweep options");
  group.add_entry_filename(
      makeEntry("config", 'c', "Key file with [sweep] settings", "FILE"),
      configFile);
  group.add_entry(makeEntry("start-freq", 's', "Sweep start frequency", "HZ"),
                  startFrequency);
  group.add_entry(makeEntry("end-freq", 'e', "Sweep end frequency", "HZ"),
                  endFrequency);
  group.add_entry(
      makeEntry("duration", 'd', "Duration of each sweep", "SECONDS"),
      duration);
  group.add_entry(
      makeEntry("settle", 0, "Delay after each silence", "SECONDS"),
      postSilenceDelay);
  group.add_entry(makeEntry("fade-epsilon", 0,
                            "Time cut from each sweep to let it fade out",
                            "SECONDS"),
                  fadeEpsilon);
  group.add_entry(
      makeEntry("mode", 'm', "Sweep mode: engine-timed or host-driven",
                "MODE"),
      mode);
  group.add_entry(makeEntry("waveforms", 'w',
                            "Comma separated waveforms to sweep", "LIST"),
                  waveforms);
  group.add_entry(makeEntry("oscillators", 'o',
                            "Comma separated oscillator kinds to sweep",
                            "LIST"),
                  oscillators);
  group.add_entry(makeEntry("frame-interval", 0,
                            "Frequency update interval in host-driven mode",
                            "SECONDS"),
                  frameInterval);
  group.add_entry_filename(
      makeEntry("fifo", 0, "Command FIFO of the generator", "PATH"),
      fifoPath);
  group.add_entry(makeEntry("run", 'r', "Run one sweep and exit"), runOnce);
  group.add_entry(makeEntry("verbose", 'v', "Print debug messages"), verbose);

  Glib::OptionContext context(summary);
  context.set_main_group(group);

  try {
    context.parse(argc, argv);
  } catch (const Glib::Error& e) {
    throw ConfigurationError(e.what());
  }

  SweepOptions options;
  options.fifoPath = FIFO_COMMAND;
  if (!configFile.empty()) loadSweepConfigFile(configFile, options);

  SweepConfig& config = options.sweep;
  auto applyIfSet = [](double value, double& target) {
    if (!std::isnan(value)) target = value;
  };
  applyIfSet(startFrequency, config.startFrequency);
  applyIfSet(endFrequency, config.endFrequency);
  applyIfSet(duration, config.duration);
  applyIfSet(postSilenceDelay, config.postSilenceDelay);
  applyIfSet(fadeEpsilon, config.fadeEpsilon);
  applyIfSet(frameInterval, config.frameInterval);

  if (!mode.empty()) config.mode = requireMode(mode.raw());
  if (!waveforms.empty()) config.waveforms = parseWaveformList(waveforms.raw());
  if (!oscillators.empty()) {
    config.oscillators = parseOscillatorList(oscillators.raw());
  }
  if (!fifoPath.empty()) options.fifoPath = fifoPath;
  options.runOnce = runOnce;
  options.verbose = verbose;

  config.validate();
  return options;
}
