#ifndef SWEEP_SEQUENCER_HPP
#define SWEEP_SEQUENCER_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "IScheduler.hpp"
#include "ISweepEngine.hpp"
#include "IStatusReporter.hpp"
#include "SweepConfig.hpp"
#include "SweepPlan.hpp"

enum class SequencerState {
  Idle,          ///< Nunca disparado
  Initializing,  ///< Aguardando start() do motor
  Running,       ///< Executando o passo stepIndex()
  Completed,
  Failed,        ///< Ver lastError()
  Cancelled
};

const char* toString(SequencerState state);

/**
 * @class SweepSequencer
 * @brief Executa o plano de varreduras, um passo por vez, contra o motor.
 *
 * Protocolo de cada passo:
 *   1. status "Sweeping <oscilador> oscillator with <onda>..."
 *   2. sweep do oscilador (com rampa no modo engine-timed; no modo
 *      host-driven a frequência é enviada a cada quadro)
 *   3. espera de duration - fadeEpsilon
 *   4. silence do oscilador
 *   5. espera de postSilenceDelay
 *   6. ao fim do grupo da forma de onda, status "Finished sweeping ..."
 *
 * O motor é criado no primeiro disparo e reutilizado nos seguintes. Se o
 * start() falhar, ele é descartado e o próximo disparo cria outro; se uma
 * operação falhar no meio do plano, ele é mantido.
 *
 * O oscilador do passo corrente sempre recebe um silence ao sair do passo,
 * seja por sucesso, erro, cancelamento ou destruição do sequenciador.
 *
 * Não é thread-safe: todos os métodos e callbacks rodam na thread do
 * scheduler.
 */
class SweepSequencer {
 public:
  using EngineFactory = std::function<SweepEnginePtr()>;
  using FinishedCallback = std::function<void(SequencerState)>;

  SweepSequencer(SweepConfig config, EngineFactory engineFactory,
                 IScheduler& scheduler, IStatusReporter& reporter);
  ~SweepSequencer();

  SweepSequencer(const SweepSequencer&) = delete;
  SweepSequencer& operator=(const SweepSequencer&) = delete;

  // Inicia um plano novo. Retorna false (e não faz nada) se já houver um
  // plano em andamento.
  bool trigger();

  // Interrompe o plano em andamento. Durante a inicialização o pedido é
  // atendido quando o start() do motor termina. Retorna false se não havia
  // nada para cancelar.
  bool cancel();

  // Troca a configuração; recusada (false) durante um plano.
  bool setConfig(SweepConfig config);

  // Chamado com o estado final (Completed, Failed ou Cancelled).
  void setFinishedCallback(FinishedCallback callback) {
    m_onFinished = std::move(callback);
  }

  bool isBusy() const {
    return m_state == SequencerState::Initializing ||
           m_state == SequencerState::Running;
  }
  SequencerState state() const { return m_state; }
  size_t stepIndex() const { return m_stepIndex; }
  const std::string& lastError() const { return m_lastError; }
  bool hasEngine() const { return m_engine != nullptr; }
  const SweepPlan& plan() const { return m_plan; }
  const SweepConfig& config() const { return m_config; }

 private:
  class VoiceLease;

  void startEngine();
  void onEngineReady(std::exception_ptr error);
  void beginPlan();
  void runStep();
  void pushFrequencySample();
  void finishStep();
  void afterSettle();
  void complete();
  void fail(const std::string& message);
  void finishCancelled();

  void invokeSweep(const SweepStep& step);
  void invokeSetFrequency(OscillatorKind oscillator, double frequency);
  void schedulePending(double seconds, void (SweepSequencer::*next)());
  void cancelPendingTimer();
  void retireEngine();
  void transition(SequencerState next);
  void notifyFinished();

  SweepConfig m_config;
  EngineFactory m_engineFactory;
  IScheduler& m_scheduler;
  IStatusReporter& m_reporter;
  FinishedCallback m_onFinished;

  SweepEnginePtr m_engine;
  bool m_engineReady;
  // Motores que falharam no start(); destruídos fora da pilha de chamadas
  std::vector<SweepEnginePtr> m_retiredEngines;
  IScheduler::TimerId m_cleanupTimer;

  SweepPlan m_plan;
  SequencerState m_state;
  size_t m_stepIndex;
  double m_stepStartTime;  // Início do passo host-driven (scheduler.now())
  IScheduler::TimerId m_pendingTimer;
  bool m_cancelRequested;
  std::string m_lastError;

  // Declarado depois de m_engine: é destruído antes dele.
  std::unique_ptr<VoiceLease> m_lease;
};

#endif  // SWEEP_SEQUENCER_HPP
