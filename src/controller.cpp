// src/controller.cpp
// Controlador de terminal: executa o plano de varreduras contra o gerador
// usando o laço principal do GLib.
#include <glibmm.h>
#include <signal.h>
#include <unistd.h>

#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>

#include "../include/FifoSweepEngine.hpp"
#include "../include/GlibScheduler.hpp"
#include "../include/IStatusReporter.hpp"
#include "../include/SweepConfig.hpp"
#include "../include/SweepErrors.hpp"
#include "../include/SweepSequencer.hpp"

namespace {

void printStatus(const SweepSequencer& sequencer) {
  std::cout << "state: " << toString(sequencer.state());
  if (sequencer.state() == SequencerState::Running) {
    const SweepStep& step = sequencer.plan()[sequencer.stepIndex()];
    std::cout << " (step " << sequencer.stepIndex() + 1 << "/"
              << sequencer.plan().size() << ", " << toString(step.oscillator)
              << " " << toString(step.waveform) << ")";
  } else if (sequencer.state() == SequencerState::Failed) {
    std::cout << " - " << sequencer.lastError();
  }
  std::cout << "\nengine: " << (sequencer.hasEngine() ? "started" : "none")
            << ", mode: " << toString(sequencer.config().mode) << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  Glib::init();
  // Escrita em FIFO sem leitor vira EPIPE (EngineOperationError)
  signal(SIGPIPE, SIG_IGN);

  SweepOptions options;
  try {
    options = parseSweepOptions(argc, argv,
                                "- run frequency sweeps on the generator");
  } catch (const ConfigurationError& e) {
    std::cerr << "[CONTROLLER] " << e.what() << std::endl;
    return 2;
  }
  if (options.verbose) Glib::setenv("G_MESSAGES_DEBUG", "all");

  std::cout << "\n[CONTROLLER] PID: " << getpid() << std::endl;

  auto loop = Glib::MainLoop::create();
  GlibScheduler scheduler(options.sweep.frameInterval);
  ConsoleStatusReporter reporter;
  const std::string fifoPath = options.fifoPath;

  SweepSequencer sequencer(
      options.sweep,
      [&scheduler, fifoPath]() {
        return std::make_unique<FifoSweepEngine>(scheduler, fifoPath);
      },
      scheduler, reporter);

  // Modo não interativo: um plano e sai
  if (options.runOnce) {
    int exitCode = 1;
    sequencer.setFinishedCallback([&](SequencerState state) {
      exitCode = state == SequencerState::Completed ? 0 : 1;
      loop->quit();
    });
    sequencer.trigger();
    if (sequencer.isBusy()) loop->run();
    return exitCode;
  }

  // Mapa que associa nomes de comandos a funções que os executam.
  // A função recebe o restante da linha como argumento.
  std::map<std::string, std::function<void(const std::string&)>> handlers;

  handlers["sweep"] = [&](const std::string&) {
    if (!sequencer.trigger()) std::cout << "Sweep already running" << std::endl;
  };

  handlers["cancel"] = [&](const std::string&) {
    if (!sequencer.cancel()) std::cout << "Nothing to cancel" << std::endl;
  };

  handlers["status"] = [&](const std::string&) { printStatus(sequencer); };

  handlers["mode"] = [&](const std::string& value) {
    auto mode = parseSweepMode(value);
    if (!mode) {
      std::cout << "Error: mode must be engine-timed or host-driven"
                << std::endl;
      return;
    }
    SweepConfig config = sequencer.config();
    config.mode = *mode;
    if (!sequencer.setConfig(config)) {
      std::cout << "Error: cannot change mode while sweeping" << std::endl;
      return;
    }
    std::cout << "MODE=" << toString(*mode) << std::endl;
  };

  handlers["duration"] = [&](const std::string& value) {
    try {
      SweepConfig config = sequencer.config();
      config.duration = std::stod(value);
      config.validate();
      if (!sequencer.setConfig(config)) {
        std::cout << "Error: cannot change duration while sweeping"
                  << std::endl;
        return;
      }
      std::cout << "DURATION=" << config.duration << " s" << std::endl;
    } catch (const ConfigurationError& e) {
      std::cout << "Error: " << e.what() << std::endl;
    } catch (const std::logic_error&) {
      // std::stod: invalid_argument / out_of_range
      std::cout << "Error: invalid duration value" << std::endl;
    }
  };

  handlers["quit"] = [&](const std::string&) {
    sequencer.cancel();
    loop->quit();
  };

  // Exibe menu de ajuda
  std::cout << "\n=== CONTROLLER ===" << std::endl;
  for (const auto& [cmd, _] : handlers) {
    std::cout << "  " << cmd << std::endl;
  }
  std::cout << "==================\n" << std::endl;
  std::cout << "> " << std::flush;

  // Lê stdin pelo laço de eventos para não bloquear as varreduras
  auto input = Glib::IOChannel::create_from_fd(STDIN_FILENO);
  Glib::signal_io().connect(
      [&](Glib::IOCondition condition) -> bool {
        if ((condition & Glib::IOCondition::IO_IN) !=
            Glib::IOCondition::IO_IN) {
          loop->quit();
          return false;
        }

        Glib::ustring raw;
        try {
          if (input->read_line(raw) == Glib::IOStatus::ENDOFFILE) {
            loop->quit();
            return false;
          }
        } catch (const Glib::Error& e) {
          g_warning("failed to read command: %s", e.what());
          loop->quit();
          return false;
        }

        std::string line = raw.raw();
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
          line.pop_back();
        }

        if (!line.empty()) {
          std::istringstream iss(line);
          std::string cmdStr;
          std::string value;

          iss >> cmdStr;
          std::getline(iss >> std::ws,
                       value);  // Pega o resto da linha como argumento

          auto it = handlers.find(cmdStr);
          if (it != handlers.end()) {
            it->second(value);
          } else {
            std::cout << "Unknown command: " << cmdStr << std::endl;
          }
        }
        std::cout << "> " << std::flush;
        return true;
      },
      input, Glib::IOCondition::IO_IN | Glib::IOCondition::IO_HUP);

  loop->run();

  std::cout << "\n[CONTROLLER] Bye" << std::endl;
  return 0;
}
