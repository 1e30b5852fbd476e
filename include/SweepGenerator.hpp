#ifndef SWEEP_GENERATOR_HPP
#define SWEEP_GENERATOR_HPP

#include <glib.h>

#include <cmath>
#include <vector>

#include "ISignalGenerator.hpp"
#include "SweepVoice.hpp"

class SweepGenerator : public ISignalGenerator {
 private:
  double m_sampleRate;
  bool m_running;            // Se a geração está ativa (CMD_START/CMD_STOP)
  SweepVoice m_wavetable;    // Oscilador limitado em banda
  SweepVoice m_regular;      // Oscilador ingênuo
  int64_t m_samplesProduced;  // Relógio de áudio (estatística)

  SweepVoice& voiceFor(OscillatorKind kind) {
    return kind == OscillatorKind::Wavetable ? m_wavetable : m_regular;
  }

  static bool validFrequency(double frequency) {
    return std::isfinite(frequency) && frequency > 0.0;
  }

 public:
  explicit SweepGenerator(double sampleRate = SAMPLE_RATE)
      : m_sampleRate(sampleRate),
        m_running(false),
        m_wavetable(makeOscillator(OscillatorKind::Wavetable, sampleRate),
                    sampleRate),
        m_regular(makeOscillator(OscillatorKind::Regular, sampleRate),
                  sampleRate),
        m_samplesProduced(0) {}

  void start() override { m_running = true; }
  void stop() override { m_running = false; }
  bool isRunning() const override { return m_running; }

  /**
   * @brief Gera um bloco de amostras somando os dois osciladores.
   *
   * Cada voz avança a própria fase (oscilador de fase acumulada):
   *
   *    phase[n+1] = frac(phase[n] + f[n] / sampleRate)
   *
   * e, no modo engine-timed, a frequência segue a rampa exponencial
   *
   *    f[n] = start * (end / start)^(n / N),  N = duration * sampleRate
   *
   * O sequenciador nunca deixa as duas vozes em varredura ao mesmo tempo,
   * mas durante o fade-out de uma (SILENCE_FADE_SECONDS) a outra já pode
   * ter começado, por isso a saída é a soma.
   */
  std::vector<double> generateSamples(size_t count) override {
    std::vector<double> samples;
    if (!m_running) return samples;

    samples.reserve(count);
    for (size_t i = 0; i < count; ++i) {
      samples.push_back(m_wavetable.process() + m_regular.process());
    }
    m_samplesProduced += static_cast<int64_t>(count);
    return samples;
  }

  void handleCommand(const Command& cmd) override {
    switch (cmd.type) {
      case CMD_START:
        start();
        break;
      case CMD_STOP:
        stop();
        break;
      case CMD_SWEEP: {
        SweepVoice& voice = voiceFor(cmd.oscillator);
        if (cmd.duration > 0.0) {
          if (!validFrequency(cmd.startFrequency) ||
              !validFrequency(cmd.endFrequency)) {
            g_warning("ignoring sweep with invalid range %g -> %g Hz",
                      cmd.startFrequency, cmd.endFrequency);
            break;
          }
          voice.sweep(cmd.waveform, cmd.startFrequency, cmd.endFrequency,
                      cmd.duration);
        } else {
          voice.sweep(cmd.waveform);
        }
        break;
      }
      case CMD_SET_FREQ:
        if (!validFrequency(cmd.value)) {
          g_warning("ignoring invalid frequency %g Hz", cmd.value);
          break;
        }
        voiceFor(cmd.oscillator).setFrequency(cmd.value);
        break;
      case CMD_SILENCE:
        voiceFor(cmd.oscillator).silence();
        break;
      default:
        break;
    }
  }

  // Frequência da voz mais alta no momento (0 se ambas em silêncio).
  double currentFrequency() const {
    if (!m_wavetable.isSounding() && !m_regular.isSounding()) return 0.0;
    return m_wavetable.gain() >= m_regular.gain() ? m_wavetable.frequency()
                                                  : m_regular.frequency();
  }

  const SweepVoice& voice(OscillatorKind kind) const {
    return kind == OscillatorKind::Wavetable ? m_wavetable : m_regular;
  }
  double sampleRate() const { return m_sampleRate; }
  int64_t samplesProduced() const { return m_samplesProduced; }
};

#endif  // SWEEP_GENERATOR_HPP
