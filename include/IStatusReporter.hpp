#ifndef ISTATUS_REPORTER_HPP
#define ISTATUS_REPORTER_HPP

#include <iostream>
#include <string>

// Destino das mensagens de progresso (somente apresentação).
class IStatusReporter {
 public:
  IStatusReporter() = default;
  virtual ~IStatusReporter() = default;

  virtual void report(const std::string& status) = 0;

  IStatusReporter(const IStatusReporter&) = delete;
  IStatusReporter& operator=(const IStatusReporter&) = delete;
};

// Escreve cada status em uma linha do terminal.
class ConsoleStatusReporter : public IStatusReporter {
 public:
  explicit ConsoleStatusReporter(std::ostream& out = std::cout) : m_out(out) {}

  void report(const std::string& status) override {
    m_out << "[STATUS] " << status << std::endl;
  }

 private:
  std::ostream& m_out;
};

#endif  // ISTATUS_REPORTER_HPP
