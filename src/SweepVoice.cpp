#include "SweepVoice.hpp"

#include <algorithm>
#include <cmath>

#include "Communication.hpp"

SweepVoice::SweepVoice(OscillatorPtr oscillator, double sampleRate)
    : m_oscillator(std::move(oscillator)),
      m_sampleRate(sampleRate),
      m_frequency(440.0),
      m_rampStart(0.0),
      m_rampEnd(0.0),
      m_rampLength(0),
      m_rampPosition(0),
      m_gain(0.0),
      m_gainStep(0.0) {}

double SweepVoice::clampFrequency(double frequency) const {
  return std::clamp(frequency, MIN_VOICE_FREQUENCY, m_sampleRate / 2.0);
}

void SweepVoice::sweep(WaveformKind waveform, double startFrequency,
                       double endFrequency, double duration) {
  sweep(waveform);
  m_rampStart = clampFrequency(startFrequency);
  m_rampEnd = clampFrequency(endFrequency);
  m_rampLength =
      std::max<int64_t>(1, static_cast<int64_t>(duration * m_sampleRate));
  m_rampPosition = 0;
  m_frequency = m_rampStart;
}

void SweepVoice::sweep(WaveformKind waveform) {
  m_oscillator->setWaveform(waveform);
  m_oscillator->reset();
  m_rampLength = 0;
  m_rampPosition = 0;
  m_gain = VOICE_GAIN;
  m_gainStep = 0.0;
}

void SweepVoice::setFrequency(double frequency) {
  m_rampLength = 0;
  m_rampPosition = 0;
  m_frequency = clampFrequency(frequency);
}

void SweepVoice::silence() {
  if (m_gain <= 0.0) return;
  double fadeSamples = std::max(1.0, SILENCE_FADE_SECONDS * m_sampleRate);
  m_gainStep = -m_gain / fadeSamples;
}

double SweepVoice::process() {
  if (m_rampPosition < m_rampLength) {
    double progress = static_cast<double>(m_rampPosition) / m_rampLength;
    m_frequency = m_rampStart * std::pow(m_rampEnd / m_rampStart, progress);
    if (++m_rampPosition == m_rampLength) m_frequency = m_rampEnd;
  }

  if (m_gain <= 0.0) return 0.0;

  double sample = m_oscillator->process(m_frequency) * m_gain;

  if (m_gainStep < 0.0) {
    m_gain += m_gainStep;
    if (m_gain <= 0.0) {
      m_gain = 0.0;
      m_gainStep = 0.0;
    }
  }
  return sample;
}
