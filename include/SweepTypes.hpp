#ifndef SWEEP_TYPES_HPP
#define SWEEP_TYPES_HPP

#include <array>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @file SweepTypes.hpp
 * @brief Tipos básicos compartilhados entre sequenciador, protocolo e
 * gerador.
 */

// Formas de onda suportadas pelos dois osciladores
enum class WaveformKind : uint8_t { Sine, Square, Sawtooth, Triangle };

// Tipo de oscilador: tabela limitada em banda ou ingênuo (com aliasing)
enum class OscillatorKind : uint8_t { Wavetable, Regular };

// Quem avança a frequência durante a varredura
enum class SweepMode : uint8_t {
  EngineTimed,  ///< O motor faz a rampa sozinho durante `duration`
  HostDriven    ///< O sequenciador envia amostras de frequência por quadro
};

// Ordem fixa usada na construção do plano
constexpr std::array<WaveformKind, 4> ALL_WAVEFORMS = {
    WaveformKind::Sine, WaveformKind::Square, WaveformKind::Sawtooth,
    WaveformKind::Triangle};

constexpr std::array<OscillatorKind, 2> ALL_OSCILLATORS = {
    OscillatorKind::Wavetable, OscillatorKind::Regular};

struct SweepParameters {
  double startFrequency = 20.0;  ///< Hz, > 0
  double endFrequency = 10000.0;  ///< Hz, > startFrequency
  double duration = 5.0;          ///< Segundos, > 0
  SweepMode mode = SweepMode::EngineTimed;

  bool operator==(const SweepParameters& other) const {
    return startFrequency == other.startFrequency &&
           endFrequency == other.endFrequency && duration == other.duration &&
           mode == other.mode;
  }
  bool operator!=(const SweepParameters& other) const {
    return !(*this == other);
  }
};

// Uma unidade de trabalho: varre `waveform` no oscilador `oscillator` e
// depois o silencia.
struct SweepStep {
  OscillatorKind oscillator;
  WaveformKind waveform;
  SweepParameters parameters;
  double postSilenceDelay;  ///< Espera após o silêncio (segundos)

  bool operator==(const SweepStep& other) const {
    return oscillator == other.oscillator && waveform == other.waveform &&
           parameters == other.parameters &&
           postSilenceDelay == other.postSilenceDelay;
  }
  bool operator!=(const SweepStep& other) const { return !(*this == other); }
};

// Nomes canônicos ("sine", "wavetable", "engine-timed", ...)
const char* toString(WaveformKind waveform);
const char* toString(OscillatorKind oscillator);
const char* toString(SweepMode mode);

// Conversão inversa; aceita maiúsculas/minúsculas. nullopt se desconhecido.
std::optional<WaveformKind> parseWaveformKind(const std::string& name);
std::optional<OscillatorKind> parseOscillatorKind(const std::string& name);
std::optional<SweepMode> parseSweepMode(const std::string& name);

#endif  // SWEEP_TYPES_HPP
