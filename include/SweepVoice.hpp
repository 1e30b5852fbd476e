#ifndef SWEEP_VOICE_HPP
#define SWEEP_VOICE_HPP

#include <cstdint>

#include "Oscillator.hpp"

// Limites de frequência aceitos pelas vozes
constexpr double MIN_VOICE_FREQUENCY = 1.0;  ///< Hz

/**
 * @class SweepVoice
 * @brief Um oscilador com rampa exponencial de frequência e ganho com
 * fade-out linear.
 *
 * A rampa é contada em amostras, então a duração segue o relógio de áudio e
 * não o de parede.
 */
class SweepVoice {
 public:
  SweepVoice(OscillatorPtr oscillator, double sampleRate);

  // Varredura start -> end em `duration` segundos, ganho VOICE_GAIN.
  void sweep(WaveformKind waveform, double startFrequency, double endFrequency,
             double duration);

  // Varredura controlada de fora: a frequência vem de setFrequency().
  void sweep(WaveformKind waveform);

  // Fixa a frequência e descarta qualquer rampa em andamento.
  void setFrequency(double frequency);

  // Fade-out de SILENCE_FADE_SECONDS até ganho zero.
  void silence();

  // Próxima amostra já multiplicada pelo ganho.
  double process();

  double frequency() const { return m_frequency; }
  double gain() const { return m_gain; }
  bool isSounding() const { return m_gain > 0.0; }
  bool isRamping() const { return m_rampPosition < m_rampLength; }
  WaveformKind waveform() const { return m_oscillator->waveform(); }

 private:
  double clampFrequency(double frequency) const;

  OscillatorPtr m_oscillator;
  double m_sampleRate;
  double m_frequency;

  // Rampa exponencial: f = start * (end/start)^(pos/len)
  double m_rampStart;
  double m_rampEnd;
  int64_t m_rampLength;
  int64_t m_rampPosition;

  double m_gain;
  double m_gainStep;  // Negativo durante o fade-out
};

#endif  // SWEEP_VOICE_HPP
