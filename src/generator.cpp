// src/generator.cpp
// Processo gerador: recebe comandos pelo FIFO e escreve as amostras dos
// osciladores no buffer circular em memória compartilhada.

#include <fcntl.h>
#include <glibmm.h>
#include <signal.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <new>
#include <string>
#include <thread>

#include "../include/Communication.hpp"
#include "../include/SweepGenerator.hpp"

static volatile sig_atomic_t keepRunning = 1;

void signalHandler(int) { keepRunning = 0; }

int main(int argc, char* argv[]) {
  Glib::init();

  std::string fifoPath = FIFO_COMMAND;
  bool verbose = false;
  Glib::OptionGroup group("generator", "Generator options",
                          "Show generator options");
  Glib::OptionEntry fifoEntry;
  fifoEntry.set_long_name("fifo");
  fifoEntry.set_description("Command FIFO to create");
  fifoEntry.set_arg_description("PATH");
  group.add_entry_filename(fifoEntry, fifoPath);
  Glib::OptionEntry verboseEntry;
  verboseEntry.set_long_name("verbose");
  verboseEntry.set_short_name('v');
  verboseEntry.set_description("Print every command received");
  group.add_entry(verboseEntry, verbose);

  Glib::OptionContext context("- sweep audio generator");
  context.set_main_group(group);
  try {
    context.parse(argc, argv);
  } catch (const Glib::Error& e) {
    std::cerr << "[GENERATOR] " << e.what() << std::endl;
    return 2;
  }
  if (verbose) Glib::setenv("G_MESSAGES_DEBUG", "all");
  const char* fifo = fifoPath.c_str();

  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);
  signal(SIGPIPE, SIG_IGN);

  std::cout << "\n[GENERATOR] Started (PID: " << getpid() << ")\n" << std::endl;

  // Dois osciladores (wavetable e regular), silenciosos até o primeiro sweep
  SweepGenerator generator(SAMPLE_RATE);

  // Cria FIFO para receber comandos
  unlink(fifo);
  if (mkfifo(fifo, 0666) < 0) {
    g_critical("failed to create FIFO %s", fifo);
    return 1;
  }

  // Abre FIFO em modo não-bloqueante para leitura
  int cmdFd = open(fifo, O_RDONLY | O_NONBLOCK);
  if (cmdFd < 0) {
    g_critical("failed to open FIFO %s", fifo);
    unlink(fifo);
    return 1;
  }

  // Cria memória compartilhada para transferência de amostras
  shm_unlink(SHARED_MEMORY_NAME);
  int shmFd = shm_open(SHARED_MEMORY_NAME, O_CREAT | O_RDWR, 0666);
  if (shmFd < 0) {
    g_critical("failed to create shared memory %s", SHARED_MEMORY_NAME);
    close(cmdFd);
    unlink(fifo);
    return 1;
  }

  // Ajusta tamanho da memória compartilhada
  if (ftruncate(shmFd, sizeof(SharedBuffer)) < 0) {
    g_critical("failed to set shared memory size");
    close(cmdFd);
    close(shmFd);
    unlink(fifo);
    return 1;
  }

  // Mapeia memória compartilhada no espaço de endereço do processo
  SharedBuffer* buffer =
      (SharedBuffer*)mmap(nullptr, sizeof(SharedBuffer), PROT_READ | PROT_WRITE,
                          MAP_SHARED, shmFd, 0);

  if (buffer == MAP_FAILED) {
    g_critical("failed to map shared memory");
    close(cmdFd);
    close(shmFd);
    unlink(fifo);
    return 1;
  }

  // Inicializa o buffer (garante membros zerados)
  new (buffer) SharedBuffer();

  std::cout << "[GENERATOR] Ready. Waiting for commands on " << fifo
            << "\n"
            << std::endl;

  Command cmd;
  auto lastFrameTime = std::chrono::steady_clock::now();

  while (keepRunning) {
    // Lê todos os comandos pendentes (não-bloqueante)
    while (read(cmdFd, &cmd, sizeof(Command)) == sizeof(Command)) {
      if (cmd.type == CMD_QUIT) {
        keepRunning = 0;
        break;
      }
      g_debug("command %d on %s oscillator", static_cast<int>(cmd.type),
              toString(cmd.oscillator));
      generator.handleCommand(cmd);
    }

    // Gera novo quadro em intervalos fixos
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        now - lastFrameTime);

    if (elapsed.count() >= FRAME_INTERVAL_MS * 1000) {
      // Quantidade de amostras proporcional ao tempo real decorrido, para
      // que as rampas sigam o relógio de parede
      size_t count = static_cast<size_t>(
          std::min<int64_t>(elapsed.count() * SAMPLE_RATE / 1000000,
                            BUFFER_SIZE / 2));

      // Gera amostras apenas se o gerador estiver ativo
      if (generator.isRunning()) {
        auto samples = generator.generateSamples(count);
        if (!samples.empty()) {
          for (double sample : samples) {
            buffer->samples[buffer->writePos] = sample;
            buffer->writePos = (buffer->writePos + 1) % BUFFER_SIZE;
            buffer->totalProduced++;

            // Se buffer cheio, avança readPos (descarta o mais antigo)
            if (buffer->writePos == buffer->readPos) {
              buffer->readPos = (buffer->readPos + 1) % BUFFER_SIZE;
            }
          }
          buffer->currentFrequency = generator.currentFrequency();
          buffer->newDataAvailable = true;
        }
      }
      lastFrameTime = now;
    }

    // Pequena pausa para evitar uso excessivo de CPU
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  // Limpeza
  close(cmdFd);
  munmap(buffer, sizeof(SharedBuffer));
  close(shmFd);
  shm_unlink(SHARED_MEMORY_NAME);
  unlink(fifo);

  std::cout << "\n[GENERATOR] Shut down" << std::endl;
  return 0;
}
