#include "SweepTypes.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

}  // namespace

const char* toString(WaveformKind waveform) {
  switch (waveform) {
    case WaveformKind::Sine:
      return "sine";
    case WaveformKind::Square:
      return "square";
    case WaveformKind::Sawtooth:
      return "sawtooth";
    case WaveformKind::Triangle:
      return "triangle";
  }
  return "unknown";
}

const char* toString(OscillatorKind oscillator) {
  switch (oscillator) {
    case OscillatorKind::Wavetable:
      return "wavetable";
    case OscillatorKind::Regular:
      return "regular";
  }
  return "unknown";
}

const char* toString(SweepMode mode) {
  switch (mode) {
    case SweepMode::EngineTimed:
      return "engine-timed";
    case SweepMode::HostDriven:
      return "host-driven";
  }
  return "unknown";
}

std::optional<WaveformKind> parseWaveformKind(const std::string& name) {
  const std::string key = lowercase(name);
  for (WaveformKind waveform : ALL_WAVEFORMS) {
    if (key == toString(waveform)) return waveform;
  }
  if (key == "saw") return WaveformKind::Sawtooth;
  return std::nullopt;
}

std::optional<OscillatorKind> parseOscillatorKind(const std::string& name) {
  const std::string key = lowercase(name);
  for (OscillatorKind oscillator : ALL_OSCILLATORS) {
    if (key == toString(oscillator)) return oscillator;
  }
  if (key == "bandlimited") return OscillatorKind::Wavetable;
  if (key == "naive") return OscillatorKind::Regular;
  return std::nullopt;
}

std::optional<SweepMode> parseSweepMode(const std::string& name) {
  const std::string key = lowercase(name);
  if (key == "engine-timed" || key == "engine") return SweepMode::EngineTimed;
  if (key == "host-driven" || key == "host") return SweepMode::HostDriven;
  return std::nullopt;
}
