#ifndef GLIB_SCHEDULER_HPP
#define GLIB_SCHEDULER_HPP

#include <sigc++/sigc++.h>

#include <chrono>
#include <map>

#include "IScheduler.hpp"
#include "SweepConfig.hpp"

// Scheduler sobre o laço principal do GLib (Glib::MainLoop ou o laço do
// Gtk::Application). Deve ser usado somente na thread desse laço.
class GlibScheduler : public IScheduler {
 public:
  explicit GlibScheduler(double frameInterval = DEFAULT_FRAME_INTERVAL);
  ~GlibScheduler() override;

  double now() const override;
  TimerId scheduleAfter(double seconds, Task task) override;
  TimerId scheduleNextFrame(Task task) override;
  void cancel(TimerId id) override;

  void setFrameInterval(double seconds) { m_frameInterval = seconds; }
  size_t pendingCount() const { return m_timers.size(); }

 private:
  std::map<TimerId, sigc::connection> m_timers;  // Timeouts ainda ativos
  TimerId m_nextId;
  double m_frameInterval;
  std::chrono::steady_clock::time_point m_origin;
};

#endif  // GLIB_SCHEDULER_HPP
