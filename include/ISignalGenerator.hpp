#ifndef ISIGNAL_GENERATOR_HPP
#define ISIGNAL_GENERATOR_HPP

#include <memory>
#include <vector>

#include "Communication.hpp"

// Interface genérica para uma fonte de sinal controlada pelos comandos do
// FIFO (gerador de varreduras, fonte de teste, etc.)
class ISignalGenerator {
 public:
  ISignalGenerator() = default;
  virtual ~ISignalGenerator() = default;

  // Gera e retorna um bloco de `count` amostras (vazio se parado).
  virtual std::vector<double> generateSamples(size_t count) = 0;

  // Aplica um comando recebido do controlador. CMD_QUIT é tratado pelo
  // processo, não pelo gerador.
  virtual void handleCommand(const Command& cmd) = 0;

  virtual void start() = 0;
  virtual void stop() = 0;
  virtual bool isRunning() const = 0;

  // Não copiável (base polimórfica).
  ISignalGenerator(const ISignalGenerator&) = delete;
  ISignalGenerator& operator=(const ISignalGenerator&) = delete;
};

// Alias de conveniência.
using GeneratorPtr = std::unique_ptr<ISignalGenerator>;

#endif
