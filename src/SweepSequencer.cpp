#include "SweepSequencer.hpp"

#include <glib.h>

#include <algorithm>

#include "SweepErrors.hpp"

// Mantém um oscilador "tocando" enquanto o passo estiver ativo. Se a
// concessão for destruída sem silence() explícito, o oscilador é silenciado
// no destrutor e uma eventual falha vai para o log.
class SweepSequencer::VoiceLease {
 public:
  VoiceLease(ISweepEngine& engine, OscillatorKind oscillator)
      : m_engine(engine), m_oscillator(oscillator), m_held(true) {}

  ~VoiceLease() {
    if (!m_held) return;
    try {
      silence();
    } catch (const std::exception& e) {
      g_warning("failed to silence %s oscillator: %s", toString(m_oscillator),
                e.what());
    }
  }

  VoiceLease(const VoiceLease&) = delete;
  VoiceLease& operator=(const VoiceLease&) = delete;

  // Silencia e libera; lança EngineOperationError.
  void silence() {
    m_held = false;
    if (m_oscillator == OscillatorKind::Wavetable) {
      m_engine.silenceWavetable();
    } else {
      m_engine.silenceRegular();
    }
  }

 private:
  ISweepEngine& m_engine;
  OscillatorKind m_oscillator;
  bool m_held;
};

namespace {

std::string sweepingStatus(const SweepStep& step) {
  return std::string("Sweeping ") + toString(step.oscillator) +
         " oscillator with " + toString(step.waveform) + "...";
}

std::string finishedStatus(WaveformKind waveform,
                           const std::vector<OscillatorKind>& oscillators) {
  std::string status =
      std::string("Finished sweeping ") + toString(waveform) + " waveform";
  if (oscillators.size() == 1) {
    return status + " for the " + toString(oscillators.front()) +
           " oscillator.";
  }
  return status + " for both oscillators.";
}

std::string describe(std::exception_ptr error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  }
  return {};
}

}  // namespace

const char* toString(SequencerState state) {
  switch (state) {
    case SequencerState::Idle:
      return "idle";
    case SequencerState::Initializing:
      return "initializing";
    case SequencerState::Running:
      return "running";
    case SequencerState::Completed:
      return "completed";
    case SequencerState::Failed:
      return "failed";
    case SequencerState::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

SweepSequencer::SweepSequencer(SweepConfig config,
                               EngineFactory engineFactory,
                               IScheduler& scheduler,
                               IStatusReporter& reporter)
    : m_config(std::move(config)),
      m_engineFactory(std::move(engineFactory)),
      m_scheduler(scheduler),
      m_reporter(reporter),
      m_engineReady(false),
      m_cleanupTimer(0),
      m_state(SequencerState::Idle),
      m_stepIndex(0),
      m_stepStartTime(0.0),
      m_pendingTimer(0),
      m_cancelRequested(false) {}

SweepSequencer::~SweepSequencer() {
  cancelPendingTimer();
  if (m_cleanupTimer != 0) m_scheduler.cancel(m_cleanupTimer);
  m_lease.reset();
}

bool SweepSequencer::trigger() {
  if (isBusy()) {
    g_debug("trigger ignored: sequencer is %s", toString(m_state));
    return false;
  }

  m_cancelRequested = false;
  m_lastError.clear();
  m_stepIndex = 0;

  try {
    m_plan = buildSweepPlan(m_config);
  } catch (const ConfigurationError& e) {
    m_plan.clear();
    fail(std::string("invalid configuration: ") + e.what());
    return true;
  }

  if (m_engine && m_engineReady) {
    beginPlan();
  } else {
    startEngine();
  }
  return true;
}

bool SweepSequencer::cancel() {
  switch (m_state) {
    case SequencerState::Initializing:
      m_cancelRequested = true;
      g_info("cancel requested, waiting for the audio engine to start");
      return true;
    case SequencerState::Running:
      finishCancelled();
      return true;
    default:
      return false;
  }
}

bool SweepSequencer::setConfig(SweepConfig config) {
  if (isBusy()) return false;
  m_config = std::move(config);
  return true;
}

void SweepSequencer::startEngine() {
  transition(SequencerState::Initializing);
  m_reporter.report("Starting audio engine...");

  try {
    m_engine = m_engineFactory();
    if (!m_engine) throw InitializationError("no audio engine available");
  } catch (const std::exception& e) {
    m_engine.reset();
    fail(std::string("audio engine could not be created: ") + e.what());
    return;
  }

  try {
    m_engine->start(
        [this](std::exception_ptr error) { onEngineReady(error); });
  } catch (const std::exception& e) {
    // start() que falha sem chamar o callback
    if (m_state == SequencerState::Initializing) {
      retireEngine();
      fail(std::string("audio engine failed to start: ") + e.what());
    }
  }
}

void SweepSequencer::onEngineReady(std::exception_ptr error) {
  if (m_state != SequencerState::Initializing) {
    g_debug("ignoring engine start result in state %s", toString(m_state));
    return;
  }

  if (error) {
    retireEngine();
    fail("audio engine failed to start: " + describe(error));
    return;
  }

  m_engineReady = true;
  g_info("audio engine ready");

  if (m_cancelRequested) {
    finishCancelled();
    return;
  }
  beginPlan();
}

void SweepSequencer::beginPlan() {
  m_stepIndex = 0;
  transition(SequencerState::Running);
  g_debug("running plan of %zu steps (%s)", m_plan.size(),
          toString(m_config.mode));
  runStep();
}

void SweepSequencer::runStep() {
  const SweepStep& step = m_plan[m_stepIndex];
  m_reporter.report(sweepingStatus(step));
  g_debug("step %zu: %s/%s %.1f Hz -> %.1f Hz in %.3f s", m_stepIndex,
          toString(step.oscillator), toString(step.waveform),
          step.parameters.startFrequency, step.parameters.endFrequency,
          step.parameters.duration);

  // A concessão existe antes do sweep: se ele falhar, o oscilador ainda é
  // silenciado.
  m_lease = std::make_unique<VoiceLease>(*m_engine, step.oscillator);

  try {
    invokeSweep(step);
  } catch (const std::exception& e) {
    fail(e.what());
    return;
  }

  if (step.parameters.mode == SweepMode::HostDriven) {
    m_stepStartTime = m_scheduler.now();
    pushFrequencySample();
  } else {
    schedulePending(m_config.waitBeforeSilence(),
                    &SweepSequencer::finishStep);
  }
}

void SweepSequencer::pushFrequencySample() {
  const SweepStep& step = m_plan[m_stepIndex];
  double elapsed = m_scheduler.now() - m_stepStartTime;
  if (elapsed >= m_config.waitBeforeSilence()) {
    finishStep();
    return;
  }

  try {
    invokeSetFrequency(step.oscillator,
                       sweepFrequencyAt(step.parameters, elapsed));
  } catch (const std::exception& e) {
    fail(e.what());
    return;
  }

  m_pendingTimer = m_scheduler.scheduleNextFrame([this]() {
    m_pendingTimer = 0;
    pushFrequencySample();
  });
}

void SweepSequencer::finishStep() {
  std::unique_ptr<VoiceLease> lease = std::move(m_lease);
  try {
    lease->silence();
  } catch (const std::exception& e) {
    fail(e.what());
    return;
  }

  schedulePending(m_plan[m_stepIndex].postSilenceDelay,
                  &SweepSequencer::afterSettle);
}

void SweepSequencer::afterSettle() {
  if (endsWaveformGroup(m_plan, m_stepIndex)) {
    m_reporter.report(
        finishedStatus(m_plan[m_stepIndex].waveform, m_config.oscillators));
  }

  if (m_stepIndex + 1 < m_plan.size()) {
    ++m_stepIndex;
    runStep();
  } else {
    complete();
  }
}

void SweepSequencer::complete() {
  transition(SequencerState::Completed);
  g_message("all %zu sweeps completed", m_plan.size());
  m_reporter.report("All sweeps completed!");
  notifyFinished();
}

void SweepSequencer::fail(const std::string& message) {
  cancelPendingTimer();
  m_lease.reset();
  m_lastError = message;
  m_cancelRequested = false;
  transition(SequencerState::Failed);
  g_warning("sweep failed at step %zu: %s", m_stepIndex, message.c_str());
  m_reporter.report("Error during sweep: " + message);
  notifyFinished();
}

void SweepSequencer::finishCancelled() {
  cancelPendingTimer();
  m_lease.reset();
  m_cancelRequested = false;
  transition(SequencerState::Cancelled);
  g_message("sweep cancelled at step %zu", m_stepIndex);
  m_reporter.report("Sweep cancelled.");
  notifyFinished();
}

void SweepSequencer::invokeSweep(const SweepStep& step) {
  std::optional<FrequencyRamp> ramp;
  if (step.parameters.mode == SweepMode::EngineTimed) {
    ramp = FrequencyRamp{step.parameters.startFrequency,
                         step.parameters.endFrequency,
                         step.parameters.duration};
  }

  if (step.oscillator == OscillatorKind::Wavetable) {
    m_engine->sweepWavetable(step.waveform, ramp);
  } else {
    m_engine->sweepRegular(step.waveform, ramp);
  }
}

void SweepSequencer::invokeSetFrequency(OscillatorKind oscillator,
                                        double frequency) {
  if (oscillator == OscillatorKind::Wavetable) {
    m_engine->setWavetableFrequency(frequency);
  } else {
    m_engine->setRegularFrequency(frequency);
  }
}

void SweepSequencer::schedulePending(double seconds,
                                     void (SweepSequencer::*next)()) {
  m_pendingTimer =
      m_scheduler.scheduleAfter(std::max(seconds, 0.0), [this, next]() {
        m_pendingTimer = 0;
        (this->*next)();
      });
}

void SweepSequencer::cancelPendingTimer() {
  if (m_pendingTimer == 0) return;
  m_scheduler.cancel(m_pendingTimer);
  m_pendingTimer = 0;
}

void SweepSequencer::retireEngine() {
  m_engineReady = false;
  if (!m_engine) return;
  // O motor pode estar na pilha (callback de start); a destruição fica para
  // a próxima volta do laço de eventos.
  m_retiredEngines.push_back(std::move(m_engine));
  if (m_cleanupTimer == 0) {
    m_cleanupTimer = m_scheduler.scheduleAfter(0.0, [this]() {
      m_cleanupTimer = 0;
      m_retiredEngines.clear();
    });
  }
}

void SweepSequencer::transition(SequencerState next) {
  g_debug("sequencer %s -> %s", toString(m_state), toString(next));
  m_state = next;
}

void SweepSequencer::notifyFinished() {
  if (m_onFinished) m_onFinished(m_state);
}
