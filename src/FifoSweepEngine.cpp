#include "FifoSweepEngine.hpp"

#include <fcntl.h>
#include <glib.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "SweepErrors.hpp"

FifoSweepEngine::FifoSweepEngine(IScheduler& scheduler, std::string fifoPath,
                                 double startTimeout)
    : m_scheduler(scheduler),
      m_fifoPath(std::move(fifoPath)),
      m_startTimeout(startTimeout),
      m_fd(-1),
      m_started(false),
      m_ready(false),
      m_startedAt(0.0),
      m_retryTimer(0) {}

FifoSweepEngine::~FifoSweepEngine() {
  if (m_retryTimer != 0) m_scheduler.cancel(m_retryTimer);
  if (m_fd >= 0) close(m_fd);
}

void FifoSweepEngine::start(ReadyCallback onReady) {
  if (m_started) throw InitializationError("audio engine already started");
  m_started = true;
  m_onReady = std::move(onReady);
  m_startedAt = m_scheduler.now();
  tryOpen();
}

void FifoSweepEngine::tryOpen() {
  // Abre o FIFO criado pelo gerador para enviar comandos
  int fd = open(m_fifoPath.c_str(), O_WRONLY | O_NONBLOCK);
  if (fd >= 0) {
    // A partir daqui as escritas podem bloquear: o gerador lê continuamente
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0) {
      std::string reason = std::strerror(errno);
      close(fd);
      finishStart(std::make_exception_ptr(
          InitializationError("cannot configure " + m_fifoPath + ": " + reason)));
      return;
    }
    m_fd = fd;

    try {
      send(Command(CMD_START));
    } catch (const EngineOperationError& e) {
      close(m_fd);
      m_fd = -1;
      finishStart(std::make_exception_ptr(InitializationError(e.what())));
      return;
    }

    g_info("connected to generator through %s", m_fifoPath.c_str());
    m_ready = true;
    finishStart(nullptr);
    return;
  }

  int err = errno;
  // ENXIO: FIFO existe mas ninguém lê; ENOENT: gerador ainda não o criou
  bool generatorMissing = (err == ENXIO || err == ENOENT);
  if (generatorMissing &&
      m_scheduler.now() - m_startedAt < m_startTimeout) {
    g_debug("generator not listening on %s yet, retrying", m_fifoPath.c_str());
    m_retryTimer =
        m_scheduler.scheduleAfter(START_RETRY_INTERVAL, [this]() {
          m_retryTimer = 0;
          tryOpen();
        });
    return;
  }

  std::string reason =
      generatorMissing ? "generator not running?" : std::strerror(err);
  finishStart(std::make_exception_ptr(
      InitializationError("cannot open " + m_fifoPath + ": " + reason)));
}

void FifoSweepEngine::finishStart(std::exception_ptr error) {
  ReadyCallback onReady = std::move(m_onReady);
  m_onReady = nullptr;
  if (onReady) onReady(error);
}

void FifoSweepEngine::sweepWavetable(WaveformKind waveform,
                                     const std::optional<FrequencyRamp>& ramp) {
  sendSweep(OscillatorKind::Wavetable, waveform, ramp);
}

void FifoSweepEngine::sweepRegular(WaveformKind waveform,
                                   const std::optional<FrequencyRamp>& ramp) {
  sendSweep(OscillatorKind::Regular, waveform, ramp);
}

void FifoSweepEngine::setWavetableFrequency(double frequency) {
  send(Command(CMD_SET_FREQ, OscillatorKind::Wavetable, frequency));
}

void FifoSweepEngine::setRegularFrequency(double frequency) {
  send(Command(CMD_SET_FREQ, OscillatorKind::Regular, frequency));
}

void FifoSweepEngine::silenceWavetable() {
  send(Command(CMD_SILENCE, OscillatorKind::Wavetable));
}

void FifoSweepEngine::silenceRegular() {
  send(Command(CMD_SILENCE, OscillatorKind::Regular));
}

void FifoSweepEngine::sendSweep(OscillatorKind oscillator,
                                WaveformKind waveform,
                                const std::optional<FrequencyRamp>& ramp) {
  Command cmd(CMD_SWEEP, oscillator);
  cmd.waveform = waveform;
  if (ramp) {
    cmd.startFrequency = ramp->startFrequency;
    cmd.endFrequency = ramp->endFrequency;
    cmd.duration = ramp->duration;
  }
  send(cmd);
}

bool FifoSweepEngine::reconnect() {
  int fd = open(m_fifoPath.c_str(), O_WRONLY | O_NONBLOCK);
  if (fd < 0) return false;
  int flags = fcntl(fd, F_GETFL);
  if (flags < 0 || fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0) {
    close(fd);
    return false;
  }
  m_fd = fd;

  // Um gerador novo começa parado
  Command startCmd(CMD_START);
  if (write(m_fd, &startCmd, sizeof(Command)) !=
      static_cast<ssize_t>(sizeof(Command))) {
    disconnect();
    return false;
  }
  g_info("reconnected to generator through %s", m_fifoPath.c_str());
  return true;
}

void FifoSweepEngine::disconnect() {
  if (m_fd >= 0) close(m_fd);
  m_fd = -1;
}

void FifoSweepEngine::send(const Command& cmd) {
  if (m_fd < 0 && !(m_ready && reconnect())) {
    throw EngineOperationError(m_ready ? "generator is not running"
                                       : "audio engine is not started");
  }

  ssize_t written = write(m_fd, &cmd, sizeof(Command));
  if (written < 0 && errno == EPIPE) {
    // O gerador fechou o FIFO (reiniciado ou encerrado): uma nova tentativa
    disconnect();
    g_warning("generator closed %s, reconnecting", m_fifoPath.c_str());
    if (!reconnect()) {
      throw EngineOperationError("generator closed the command FIFO");
    }
    written = write(m_fd, &cmd, sizeof(Command));
  }
  if (written != static_cast<ssize_t>(sizeof(Command))) {
    std::string reason = written < 0 ? std::strerror(errno) : "short write";
    throw EngineOperationError("failed to send command to generator: " +
                               reason);
  }
}
