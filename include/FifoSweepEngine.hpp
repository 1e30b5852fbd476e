#ifndef FIFO_SWEEP_ENGINE_HPP
#define FIFO_SWEEP_ENGINE_HPP

#include <string>

#include "Communication.hpp"
#include "IScheduler.hpp"
#include "ISweepEngine.hpp"

constexpr double START_TIMEOUT_SECONDS = 2.0;  ///< Espera pelo gerador
constexpr double START_RETRY_INTERVAL = 0.1;   ///< Entre tentativas de open

/**
 * @class FifoSweepEngine
 * @brief Motor de varredura remoto: cada operação vira um Command escrito no
 * FIFO do processo gerador.
 *
 * start() abre o FIFO em modo não-bloqueante. Enquanto o gerador não estiver
 * lendo (ENXIO/ENOENT), tenta de novo a cada START_RETRY_INTERVAL até
 * `startTimeout`, e então falha com InitializationError.
 *
 * Depois de iniciado, se o gerador fechar o FIFO (EPIPE) ou não estiver
 * conectado, cada envio tenta reabrir o FIFO uma vez; sem gerador lendo, o
 * envio falha com EngineOperationError e a próxima operação tenta de novo.
 */
class FifoSweepEngine : public ISweepEngine {
 public:
  explicit FifoSweepEngine(IScheduler& scheduler,
                           std::string fifoPath = FIFO_COMMAND,
                           double startTimeout = START_TIMEOUT_SECONDS);
  ~FifoSweepEngine() override;

  void start(ReadyCallback onReady) override;

  void sweepWavetable(WaveformKind waveform,
                      const std::optional<FrequencyRamp>& ramp) override;
  void sweepRegular(WaveformKind waveform,
                    const std::optional<FrequencyRamp>& ramp) override;
  void setWavetableFrequency(double frequency) override;
  void setRegularFrequency(double frequency) override;
  void silenceWavetable() override;
  void silenceRegular() override;

  bool isConnected() const { return m_fd >= 0; }

 private:
  void tryOpen();
  void finishStart(std::exception_ptr error);
  void sendSweep(OscillatorKind oscillator, WaveformKind waveform,
                 const std::optional<FrequencyRamp>& ramp);
  void send(const Command& cmd);
  bool reconnect();
  void disconnect();

  IScheduler& m_scheduler;
  std::string m_fifoPath;
  double m_startTimeout;
  int m_fd;  // Descritor de escrita do FIFO (-1 = desconectado)
  bool m_started;
  bool m_ready;  // start() concluído com sucesso
  double m_startedAt;
  IScheduler::TimerId m_retryTimer;
  ReadyCallback m_onReady;
};

#endif  // FIFO_SWEEP_ENGINE_HPP
