#include "Oscillator.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <utility>

namespace {

// Avança e faz wrap da fase normalizada
double advancePhase(double phase, double frequency, double sampleRate) {
  phase += frequency / sampleRate;
  phase -= std::floor(phase);
  return phase;
}

// Coeficiente do harmônico n na série de Fourier (em seno) da forma de onda
// com as mesmas convenções de NaiveOscillator::shape().
double harmonicAmplitude(WaveformKind waveform, int n) {
  switch (waveform) {
    case WaveformKind::Sine:
      return n == 1 ? 1.0 : 0.0;
    case WaveformKind::Square:
      return (n % 2 == 1) ? 4.0 / (M_PI * n) : 0.0;
    case WaveformKind::Sawtooth:
      return -2.0 / (M_PI * n);
    case WaveformKind::Triangle: {
      if (n % 2 == 0) return 0.0;
      double sign = ((n - 1) / 2) % 2 == 0 ? 1.0 : -1.0;
      return sign * 8.0 / (M_PI * M_PI * n * n);
    }
  }
  return 0.0;
}

}  // namespace

// ----------------------------------------------------------------------------
// NaiveOscillator
// ----------------------------------------------------------------------------

NaiveOscillator::NaiveOscillator(double sampleRate)
    : m_sampleRate(sampleRate), m_phase(0.0), m_waveform(WaveformKind::Sine) {}

double NaiveOscillator::shape(WaveformKind waveform, double phase) {
  switch (waveform) {
    case WaveformKind::Sine:
      return std::sin(2.0 * M_PI * phase);
    case WaveformKind::Square:
      return phase < 0.5 ? 1.0 : -1.0;
    case WaveformKind::Sawtooth:
      return 2.0 * phase - 1.0;
    case WaveformKind::Triangle: {
      // 0 em phase = 0, pico em 0.25, vale em 0.75
      double shifted = phase + 0.25;
      shifted -= std::floor(shifted);
      return 1.0 - 4.0 * std::fabs(shifted - 0.5);
    }
  }
  return 0.0;
}

double NaiveOscillator::process(double frequency) {
  double sample = shape(m_waveform, m_phase);
  m_phase = advancePhase(m_phase, frequency, m_sampleRate);
  return sample;
}

// ----------------------------------------------------------------------------
// WavetableBank
// ----------------------------------------------------------------------------

WavetableBank::WavetableBank(WaveformKind waveform, double sampleRate) {
  const double nyquist = sampleRate / 2.0;

  // Seno de referência: sin(2*pi*n*i/N) = sine[(n*i) mod N]
  std::vector<double> sine(TABLE_SIZE);
  for (int i = 0; i < TABLE_SIZE; ++i) {
    sine[i] = std::sin(2.0 * M_PI * i / TABLE_SIZE);
  }

  double topFrequency = BASE_FREQUENCY * 2.0;
  while (true) {
    int harmonics = std::max(1, static_cast<int>(nyquist / topFrequency));
    // A tabela só representa até TABLE_SIZE/2 harmônicos
    harmonics = std::min(harmonics, TABLE_SIZE / 2 - 1);
    if (waveform == WaveformKind::Sine) harmonics = 1;

    Table table{topFrequency, harmonics, std::vector<double>(TABLE_SIZE + 1)};
    for (int n = 1; n <= harmonics; ++n) {
      double amplitude = harmonicAmplitude(waveform, n);
      if (amplitude == 0.0) continue;
      for (int i = 0; i < TABLE_SIZE; ++i) {
        table.samples[i] +=
            amplitude * sine[(static_cast<long>(n) * i) % TABLE_SIZE];
      }
    }
    m_tables.push_back(std::move(table));

    if (harmonics == 1) break;
    topFrequency *= 2.0;
  }

  // Normaliza todas as tabelas pelo mesmo pico (overshoot de Gibbs)
  double peak = 0.0;
  for (const auto& table : m_tables) {
    for (int i = 0; i < TABLE_SIZE; ++i) {
      peak = std::max(peak, std::fabs(table.samples[i]));
    }
  }
  for (auto& table : m_tables) {
    if (peak > 0.0) {
      for (int i = 0; i < TABLE_SIZE; ++i) table.samples[i] /= peak;
    }
    table.samples[TABLE_SIZE] = table.samples[0];
  }
}

const WavetableBank& WavetableBank::shared(WaveformKind waveform,
                                           double sampleRate) {
  static std::mutex mutex;
  static std::map<std::pair<WaveformKind, int>, std::unique_ptr<WavetableBank>>
      banks;

  std::lock_guard<std::mutex> lock(mutex);
  auto key = std::make_pair(waveform, static_cast<int>(sampleRate));
  auto it = banks.find(key);
  if (it == banks.end()) {
    it = banks
             .emplace(key,
                      std::make_unique<WavetableBank>(waveform, sampleRate))
             .first;
  }
  return *it->second;
}

const WavetableBank::Table& WavetableBank::tableFor(double frequency) const {
  for (const auto& table : m_tables) {
    if (frequency <= table.topFrequency) return table;
  }
  return m_tables.back();
}

int WavetableBank::harmonicsFor(double frequency) const {
  return tableFor(frequency).harmonics;
}

double WavetableBank::lookup(double phase, double frequency) const {
  const Table& table = tableFor(frequency);
  double position = phase * TABLE_SIZE;
  int index = static_cast<int>(position) & (TABLE_SIZE - 1);
  double fraction = position - std::floor(position);
  double a = table.samples[index];
  double b = table.samples[index + 1];
  return a + (b - a) * fraction;
}

// ----------------------------------------------------------------------------
// WavetableOscillator
// ----------------------------------------------------------------------------

WavetableOscillator::WavetableOscillator(double sampleRate)
    : m_sampleRate(sampleRate),
      m_phase(0.0),
      m_waveform(WaveformKind::Sine),
      m_bank(&WavetableBank::shared(WaveformKind::Sine, sampleRate)) {}

void WavetableOscillator::setWaveform(WaveformKind waveform) {
  m_waveform = waveform;
  m_bank = &WavetableBank::shared(waveform, m_sampleRate);
}

double WavetableOscillator::process(double frequency) {
  double sample = m_bank->lookup(m_phase, frequency);
  m_phase = advancePhase(m_phase, frequency, m_sampleRate);
  return sample;
}

OscillatorPtr makeOscillator(OscillatorKind kind, double sampleRate) {
  if (kind == OscillatorKind::Wavetable) {
    return std::make_unique<WavetableOscillator>(sampleRate);
  }
  return std::make_unique<NaiveOscillator>(sampleRate);
}
