#ifndef SWEEP_CONFIG_HPP
#define SWEEP_CONFIG_HPP

#include <string>
#include <vector>

#include "SweepTypes.hpp"

/**
 * @file SweepConfig.hpp
 * @brief Configuração do sequenciador e carregamento a partir de arquivo
 * (Glib::KeyFile) e linha de comando (Glib::OptionContext).
 *
 * Precedência: valores padrão < arquivo de configuração < linha de comando.
 */

constexpr double DEFAULT_START_FREQUENCY = 20.0;     ///< Hz
constexpr double DEFAULT_END_FREQUENCY = 10000.0;    ///< Hz
constexpr double DEFAULT_SWEEP_DURATION = 5.0;       ///< Segundos
constexpr double DEFAULT_POST_SILENCE_DELAY = 0.5;   ///< Segundos
constexpr double DEFAULT_FRAME_INTERVAL = 1.0 / 60;  ///< Cadência host-driven

struct SweepConfig {
  std::vector<WaveformKind> waveforms{ALL_WAVEFORMS.begin(),
                                      ALL_WAVEFORMS.end()};
  std::vector<OscillatorKind> oscillators{ALL_OSCILLATORS.begin(),
                                          ALL_OSCILLATORS.end()};
  double startFrequency = DEFAULT_START_FREQUENCY;
  double endFrequency = DEFAULT_END_FREQUENCY;
  double duration = DEFAULT_SWEEP_DURATION;
  double postSilenceDelay = DEFAULT_POST_SILENCE_DELAY;
  double fadeEpsilon = 0.0;  ///< Subtraído da espera antes do silêncio
  SweepMode mode = SweepMode::EngineTimed;
  double frameInterval = DEFAULT_FRAME_INTERVAL;

  // Lança ConfigurationError descrevendo o primeiro campo inválido.
  void validate() const;

  // Espera entre o início da varredura e a chamada de silêncio.
  double waitBeforeSilence() const { return duration - fadeEpsilon; }
};

// Opções comuns aos executáveis de controle (controller e painel).
struct SweepOptions {
  SweepConfig sweep;
  std::string configFile;
  std::string fifoPath;
  bool runOnce = false;
  bool verbose = false;
};

// Aplica o grupo [sweep] (e [engine]) de um arquivo de chaves sobre `options`.
// Lança ConfigurationError se o arquivo não puder ser lido ou tiver valores
// inválidos.
void loadSweepConfigFile(const std::string& path, SweepOptions& options);

// Analisa argc/argv, removendo as opções reconhecidas. Lança
// ConfigurationError em opções desconhecidas ou valores inválidos. A
// configuração resultante já foi validada.
SweepOptions parseSweepOptions(int& argc, char**& argv,
                               const std::string& summary);

// Listas separadas por vírgula, ex.: "sine,square".
std::vector<WaveformKind> parseWaveformList(const std::string& text);
std::vector<OscillatorKind> parseOscillatorList(const std::string& text);

#endif  // SWEEP_CONFIG_HPP
