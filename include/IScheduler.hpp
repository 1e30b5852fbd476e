#ifndef ISCHEDULER_HPP
#define ISCHEDULER_HPP

#include <cstdint>
#include <functional>

// Pontos de suspensão cooperativos. Todas as tarefas rodam na mesma thread
// (o laço de eventos); nenhuma tarefa roda dentro da chamada que a agendou.
class IScheduler {
 public:
  using Task = std::function<void()>;
  using TimerId = uint64_t;  ///< 0 nunca é um id válido

  IScheduler() = default;
  virtual ~IScheduler() = default;

  // Tempo monotônico em segundos.
  virtual double now() const = 0;

  // Executa `task` depois de `seconds` segundos.
  virtual TimerId scheduleAfter(double seconds, Task task) = 0;

  // Executa `task` no próximo quadro (cadência de animação).
  virtual TimerId scheduleNextFrame(Task task) = 0;

  // Cancela uma tarefa pendente; ids já executados são ignorados.
  virtual void cancel(TimerId id) = 0;

  IScheduler(const IScheduler&) = delete;
  IScheduler& operator=(const IScheduler&) = delete;
};

#endif  // ISCHEDULER_HPP
