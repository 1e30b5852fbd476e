#ifndef OSCILLATOR_HPP
#define OSCILLATOR_HPP

#include <memory>
#include <vector>

#include "SweepTypes.hpp"

// Oscilador de fase acumulada; a frequência é informada a cada amostra para
// permitir rampas.
class IOscillator {
 public:
  IOscillator() = default;
  virtual ~IOscillator() = default;

  virtual void setWaveform(WaveformKind waveform) = 0;
  virtual WaveformKind waveform() const = 0;

  // Próxima amostra em [-1, 1] para a frequência `frequency` (Hz).
  virtual double process(double frequency) = 0;

  // Volta a fase para zero.
  virtual void reset() = 0;

  IOscillator(const IOscillator&) = delete;
  IOscillator& operator=(const IOscillator&) = delete;
};

using OscillatorPtr = std::unique_ptr<IOscillator>;

// Formas de onda ingênuas, sem limitação de banda (aliasing audível em
// frequências altas).
class NaiveOscillator : public IOscillator {
 public:
  explicit NaiveOscillator(double sampleRate);

  void setWaveform(WaveformKind waveform) override { m_waveform = waveform; }
  WaveformKind waveform() const override { return m_waveform; }
  double process(double frequency) override;
  void reset() override { m_phase = 0.0; }

  // Valor da forma de onda na fase `phase` em [0, 1).
  static double shape(WaveformKind waveform, double phase);

 private:
  double m_sampleRate;
  double m_phase;  // Fase normalizada [0, 1)
  WaveformKind m_waveform;
};

/**
 * @class WavetableBank
 * @brief Conjunto de tabelas limitadas em banda para uma forma de onda, uma
 * por oitava.
 *
 * A tabela k cobre frequências até 40 Hz * 2^k e contém apenas os
 * harmônicos abaixo de Nyquist para essa frequência de topo. Cada tabela é
 * a soma de Fourier da forma de onda, normalizada pelo pico global do banco.
 */
class WavetableBank {
 public:
  static constexpr int TABLE_SIZE = 2048;          ///< Potência de 2
  static constexpr double BASE_FREQUENCY = 20.0;   ///< Hz

  WavetableBank(WaveformKind waveform, double sampleRate);

  // Banco compartilhado, construído na primeira chamada.
  static const WavetableBank& shared(WaveformKind waveform, double sampleRate);

  // Amostra interpolada linearmente na tabela adequada a `frequency`.
  double lookup(double phase, double frequency) const;

  size_t tableCount() const { return m_tables.size(); }
  int harmonicsFor(double frequency) const;

 private:
  struct Table {
    double topFrequency;          ///< Maior frequência atendida (Hz)
    int harmonics;                ///< Harmônicos somados
    std::vector<double> samples;  ///< TABLE_SIZE + 1 (cópia da 1a amostra)
  };

  const Table& tableFor(double frequency) const;

  std::vector<Table> m_tables;
};

// Oscilador que lê do WavetableBank compartilhado.
class WavetableOscillator : public IOscillator {
 public:
  explicit WavetableOscillator(double sampleRate);

  void setWaveform(WaveformKind waveform) override;
  WaveformKind waveform() const override { return m_waveform; }
  double process(double frequency) override;
  void reset() override { m_phase = 0.0; }

 private:
  double m_sampleRate;
  double m_phase;
  WaveformKind m_waveform;
  const WavetableBank* m_bank;
};

OscillatorPtr makeOscillator(OscillatorKind kind, double sampleRate);

#endif  // OSCILLATOR_HPP
