#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <thread>

namespace powledger {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Provides thread lifecycle management with start/stop functionality.
 * Derived classes implement the runLoop() method which executes in the service
 * thread or in the current thread when using run().
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  explicit Service(const std::string &name);

  /**
   * Virtual destructor - derived classes must call stop() in their own
   * destructor since runLoop() is pure virtual
   */
  ~Service() override;

  Service(const Service &) = delete;
  Service &operator=(const Service &) = delete;

  bool isRunning() const { return isRunning_; }
  bool isStopSet() const { return isStopSet_; }

  Roe<void> run();
  Roe<void> start();
  void stop();

protected:
  /**
   * Main service loop - implement in derived classes.
   * Should check !isStopSet() periodically to allow graceful shutdown.
   */
  virtual void runLoop() = 0;

  /**
   * Called before the thread starts (in the calling thread context).
   * Returning an error aborts start.
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called after the thread has stopped (in the calling thread context).
   */
  virtual void onStop() {}

  /**
   * Called from stop() right after the stop flag is raised, before joining.
   * Override to unblock a runLoop() that waits on something other than the
   * stop flag.
   */
  virtual void onStopRequested() {}

private:
  std::atomic<bool> isStopSet_{ false };
  std::atomic<bool> isRunning_{ false };

  std::thread thread_;
};

} // namespace powledger
