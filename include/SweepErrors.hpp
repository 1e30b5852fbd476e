#ifndef SWEEP_ERRORS_HPP
#define SWEEP_ERRORS_HPP

#include <stdexcept>
#include <string>

// Base de todos os erros do sequenciador de varredura.
class SweepError : public std::runtime_error {
 public:
  explicit SweepError(const std::string& message)
      : std::runtime_error(message) {}
};

// O motor de áudio não conseguiu iniciar (gerador ausente, FIFO inválido).
// A referência ao motor é descartada; a próxima tentativa reinicializa.
class InitializationError : public SweepError {
 public:
  explicit InitializationError(const std::string& message)
      : SweepError(message) {}
};

// Falha em sweep/silence/set durante o plano. O motor é mantido.
class EngineOperationError : public SweepError {
 public:
  explicit EngineOperationError(const std::string& message)
      : SweepError(message) {}
};

// Parâmetros inválidos; rejeitados antes de qualquer chamada ao motor.
class ConfigurationError : public SweepError {
 public:
  explicit ConfigurationError(const std::string& message)
      : SweepError(message) {}
};

#endif  // SWEEP_ERRORS_HPP
