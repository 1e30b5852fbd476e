#include "SweepPlan.hpp"

#include <algorithm>
#include <cmath>

namespace {

template <typename T>
bool contains(const std::vector<T>& values, T value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

}  // namespace

SweepPlan buildSweepPlan(const SweepConfig& config) {
  config.validate();

  SweepParameters parameters;
  parameters.startFrequency = config.startFrequency;
  parameters.endFrequency = config.endFrequency;
  parameters.duration = config.duration;
  parameters.mode = config.mode;

  SweepPlan plan;
  plan.reserve(config.waveforms.size() * config.oscillators.size());
  // As listas da configuração só filtram; a ordem é sempre a canônica
  for (WaveformKind waveform : ALL_WAVEFORMS) {
    if (!contains(config.waveforms, waveform)) continue;
    for (OscillatorKind oscillator : ALL_OSCILLATORS) {
      if (!contains(config.oscillators, oscillator)) continue;
      plan.push_back(
          {oscillator, waveform, parameters, config.postSilenceDelay});
    }
  }
  return plan;
}

double sweepFrequencyAt(const SweepParameters& parameters, double elapsed) {
  double progress = std::clamp(elapsed / parameters.duration, 0.0, 1.0);
  double ratio = parameters.endFrequency / parameters.startFrequency;
  return parameters.startFrequency * std::pow(ratio, progress);
}

bool endsWaveformGroup(const SweepPlan& plan, size_t index) {
  if (index + 1 >= plan.size()) return true;
  return plan[index + 1].waveform != plan[index].waveform;
}
