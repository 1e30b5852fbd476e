#ifndef ISWEEP_ENGINE_HPP
#define ISWEEP_ENGINE_HPP

#include <exception>
#include <functional>
#include <memory>
#include <optional>

#include "SweepTypes.hpp"

// Rampa exponencial executada pelo próprio motor (modo engine-timed).
struct FrequencyRamp {
  double startFrequency;
  double endFrequency;
  double duration;  ///< Segundos
};

// Sessão de áudio controlada pelo sequenciador. Implementações: o motor
// via FIFO (FifoSweepEngine) e os mocks dos testes.
class ISweepEngine {
 public:
  // Recebe nullptr em caso de sucesso ou a exceção (InitializationError).
  using ReadyCallback = std::function<void(std::exception_ptr)>;

  ISweepEngine() = default;
  virtual ~ISweepEngine() = default;

  // Inicia a sessão de forma assíncrona. `onReady` é chamado exatamente uma
  // vez, possivelmente antes do retorno, e nunca após a destruição.
  virtual void start(ReadyCallback onReady) = 0;

  // Começa a varredura; sem rampa, a frequência vem de set*Frequency().
  // Lançam EngineOperationError.
  virtual void sweepWavetable(WaveformKind waveform,
                              const std::optional<FrequencyRamp>& ramp) = 0;
  virtual void sweepRegular(WaveformKind waveform,
                            const std::optional<FrequencyRamp>& ramp) = 0;

  // Uma amostra de frequência (modo host-driven).
  virtual void setWavetableFrequency(double frequency) = 0;
  virtual void setRegularFrequency(double frequency) = 0;

  // Dispara o fade-out do oscilador.
  virtual void silenceWavetable() = 0;
  virtual void silenceRegular() = 0;

  // Não copiável (base polimórfica).
  ISweepEngine(const ISweepEngine&) = delete;
  ISweepEngine& operator=(const ISweepEngine&) = delete;
};

using SweepEnginePtr = std::unique_ptr<ISweepEngine>;

#endif  // ISWEEP_ENGINE_HPP
