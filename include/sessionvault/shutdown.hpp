#pragma once

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <mutex>
#include <vector>

namespace sessionvault {

class Engine;

/**
 * ShutdownHandler provides graceful shutdown for sessionvault engines.
 *
 * Usage:
 *   1. Create a ShutdownHandler instance (typically one per process)
 *   2. Register engines with RegisterEngine()
 *   3. Call InstallSignalHandlers() to catch SIGTERM/SIGINT/SIGHUP
 *   4. Call WaitForShutdown() from main(); once a signal arrives every
 *      registered engine drains its write queue and closes
 *
 * The signal handler only records the signal. Draining happens on the
 * thread blocked in WaitForShutdown(), since flushing the write queue takes
 * locks and joins threads.
 *
 * Thread-safe: All methods can be called from any thread.
 */
class ShutdownHandler {
 public:
  ShutdownHandler();
  ~ShutdownHandler();

  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;

  /**
   * Register an engine for shutdown.
   * The engine pointer must remain valid until Unregister() or shutdown.
   */
  void RegisterEngine(Engine* engine);

  void UnregisterEngine(Engine* engine);

  /**
   * Install signal handlers for SIGTERM, SIGINT, and SIGHUP.
   * Returns true if handlers were installed successfully.
   *
   * Note: This modifies global signal handlers. Only call once per process.
   */
  bool InstallSignalHandlers();

  void RestoreSignalHandlers();

  /**
   * Shut down all registered engines, then run callbacks.
   * Idempotent. Returns true if shutdown was performed, false if it had
   * already happened (or is happening on another thread, which this call
   * waits for).
   */
  bool Shutdown();

  /** True once Shutdown() ran or a handled signal arrived. */
  bool IsShutdownRequested() const;

  /**
   * Register a custom callback to run during shutdown.
   * Callbacks are invoked after engines are shut down, in registration order.
   */
  void OnShutdown(std::function<void()> callback);

  /**
   * Block until a signal arrives or Shutdown() completes elsewhere. When a
   * signal ended the wait, the shutdown runs on the calling thread.
   */
  void WaitForShutdown();

 private:
  static void SignalHandler(int signum);

  std::mutex mutex_;
  std::vector<Engine*> engines_;
  std::vector<std::function<void()>> callbacks_;
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> shutdown_complete_{false};
  bool handlers_installed_ = false;

  std::mutex done_mu_;
  std::condition_variable done_cv_;

  struct sigaction old_sigterm_;
  struct sigaction old_sigint_;
  struct sigaction old_sighup_;
};

/**
 * Global shutdown handler instance.
 * Use this for simple single-instance deployments.
 */
ShutdownHandler& GlobalShutdownHandler();

}  // namespace sessionvault
