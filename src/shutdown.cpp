#include <sessionvault/shutdown.hpp>

#include <algorithm>
#include <chrono>

#include <sessionvault/engine.hpp>
#include <sessionvault/logging.hpp>

namespace sessionvault {

namespace {

// Last handled signal, 0 when none. Only touched with async-signal-safe ops.
volatile std::sig_atomic_t g_signal = 0;

constexpr auto kSignalPollInterval = std::chrono::milliseconds(50);

}  // namespace

ShutdownHandler::ShutdownHandler() = default;

ShutdownHandler::~ShutdownHandler() {
  RestoreSignalHandlers();
  Shutdown();
}

void ShutdownHandler::RegisterEngine(Engine* engine) {
  if (!engine) return;

  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(engines_.begin(), engines_.end(), engine) != engines_.end()) return;
  engines_.push_back(engine);
}

void ShutdownHandler::UnregisterEngine(Engine* engine) {
  if (!engine) return;

  std::lock_guard<std::mutex> lock(mutex_);
  engines_.erase(std::remove(engines_.begin(), engines_.end(), engine), engines_.end());
}

void ShutdownHandler::SignalHandler(int signum) {
  g_signal = signum;
}

bool ShutdownHandler::InstallSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (handlers_installed_) {
    return true;
  }

  struct sigaction sa;
  sa.sa_handler = SignalHandler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;

  if (sigaction(SIGTERM, &sa, &old_sigterm_) != 0) {
    return false;
  }

  if (sigaction(SIGINT, &sa, &old_sigint_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    return false;
  }

  if (sigaction(SIGHUP, &sa, &old_sighup_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    return false;
  }

  handlers_installed_ = true;
  return true;
}

void ShutdownHandler::RestoreSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!handlers_installed_) {
    return;
  }

  sigaction(SIGTERM, &old_sigterm_, nullptr);
  sigaction(SIGINT, &old_sigint_, nullptr);
  sigaction(SIGHUP, &old_sighup_, nullptr);

  handlers_installed_ = false;
}

bool ShutdownHandler::Shutdown() {
  bool expected = false;
  if (!shutdown_requested_.compare_exchange_strong(expected, true)) {
    std::unique_lock<std::mutex> lock(done_mu_);
    done_cv_.wait(lock, [this] { return shutdown_complete_.load(); });
    return false;
  }

  std::vector<Engine*> engines_copy;
  std::vector<std::function<void()>> callbacks_copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    engines_copy = engines_;
    callbacks_copy = callbacks_;
    engines_.clear();
  }

  Logger()->info("shutting down {} engine(s)", engines_copy.size());
  for (Engine* engine : engines_copy) {
    engine->Shutdown();
  }

  for (const auto& callback : callbacks_copy) {
    if (callback) {
      callback();
    }
  }

  {
    std::lock_guard<std::mutex> lock(done_mu_);
    shutdown_complete_.store(true);
  }
  done_cv_.notify_all();
  return true;
}

bool ShutdownHandler::IsShutdownRequested() const {
  return shutdown_requested_.load() || g_signal != 0;
}

void ShutdownHandler::OnShutdown(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ShutdownHandler::WaitForShutdown() {
  {
    std::unique_lock<std::mutex> lock(done_mu_);
    while (!shutdown_complete_.load() && g_signal == 0) {
      done_cv_.wait_for(lock, kSignalPollInterval);
    }
    if (shutdown_complete_.load()) return;
  }

  Logger()->info("received signal {}", static_cast<int>(g_signal));
  Shutdown();
}

ShutdownHandler& GlobalShutdownHandler() {
  static ShutdownHandler instance;
  return instance;
}

}  // namespace sessionvault
