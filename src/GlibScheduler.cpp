#include "GlibScheduler.hpp"

#include <glibmm.h>

#include <algorithm>
#include <cmath>

namespace {

// Segundos -> milissegundos para Glib::signal_timeout()
unsigned int toMilliseconds(double seconds) {
  return static_cast<unsigned int>(std::lround(std::max(seconds, 0.0) * 1000));
}

}  // namespace

GlibScheduler::GlibScheduler(double frameInterval)
    : m_nextId(1),
      m_frameInterval(frameInterval),
      m_origin(std::chrono::steady_clock::now()) {}

GlibScheduler::~GlibScheduler() {
  for (auto& [id, connection] : m_timers) connection.disconnect();
}

double GlibScheduler::now() const {
  std::chrono::duration<double> elapsed =
      std::chrono::steady_clock::now() - m_origin;
  return elapsed.count();
}

IScheduler::TimerId GlibScheduler::scheduleAfter(double seconds, Task task) {
  TimerId id = m_nextId++;
  // Retorna false para que o timeout rode uma única vez
  auto connection = Glib::signal_timeout().connect(
      [this, id, task]() {
        m_timers.erase(id);
        task();
        return false;
      },
      toMilliseconds(seconds));
  m_timers.emplace(id, connection);
  return id;
}

IScheduler::TimerId GlibScheduler::scheduleNextFrame(Task task) {
  return scheduleAfter(m_frameInterval, std::move(task));
}

void GlibScheduler::cancel(TimerId id) {
  auto it = m_timers.find(id);
  if (it == m_timers.end()) return;
  it->second.disconnect();
  m_timers.erase(it);
}
