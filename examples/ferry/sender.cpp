/**
 * @file sender.cpp
 * @brief ferry_sender -- watches a directory tree and replicates every
 * closed file to all configured receivers.
 *
 * Architecture:
 *   DirWatcher (inotify, recursive)
 *        |
 *   WatchLoop thread -> FanoutDispatcher -> one SenderConnection per receiver
 *
 * ferry components used:
 *   - ferry::DirWatcher / WatchLoop  -- file-stable events
 *   - ferry::FanoutDispatcher        -- concurrent per-destination delivery
 *   - ferry::ShutdownManager         -- SIGINT/SIGTERM handling
 *   - ferry::IniConfig               -- ferry_sender.ini
 *   - ferry::log                     -- logging
 *
 * Usage:
 *   ferry_sender [--config ferry_sender.ini] [--watch /origen]
 *                [--dest 10.0.0.2:5001 ...] [--log-level info]
 */

#include "ferry/dispatcher.hpp"
#include "ferry/log.hpp"
#include "ferry/settings.hpp"
#include "ferry/shutdown.hpp"
#include "ferry/watcher.hpp"

#include <thread>

int main(int argc, char* argv[]) {
  ferry::log::Init();
  FERRY_SCOPE_EXIT(ferry::log::Shutdown());

  ferry::SenderSettings settings;
  auto loaded = ferry::LoadSenderSettings(argc, argv, settings);
  if (!loaded.has_value()) {
    FERRY_LOG_FATAL("Main", "Invalid configuration");
    return 1;
  }
  ferry::log::SetLevel(settings.log_level);

  ferry::ShutdownManager shutdown;
  auto sig = shutdown.InstallSignalHandlers();
  if (!sig.has_value()) {
    FERRY_LOG_FATAL("Main", "Cannot install signal handlers");
    return 1;
  }

  ferry::DirWatcher watcher;
  auto opened = watcher.Open(settings.watch_dir);
  if (!opened.has_value()) {
    FERRY_LOG_FATAL("Main", "Cannot watch %s: %s", settings.watch_dir.c_str(),
                    ferry::WatchErrorName(opened.get_error()));
    return 1;
  }

  for (const auto& d : settings.destinations) {
    FERRY_LOG_INFO("Main", "Destination %s", d.ToString().c_str());
  }
  ferry::FanoutDispatcher fanout(settings.destinations,
                                 settings.ToDispatcherOptions());
  fanout.Start();

  ferry::WatchLoop loop(watcher, fanout, settings.ToWatchOptions());
  std::thread loop_thread([&loop, &shutdown]() {
    auto r = loop.Run();
    if (!r.has_value()) shutdown.Quit();
  });

  // LIFO: the dispatcher stops last so the loop never feeds a stopped lane.
  (void)shutdown.Register(
      [](int, void* ctx) { static_cast<ferry::FanoutDispatcher*>(ctx)->Stop(); },
      &fanout);
  (void)shutdown.Register(
      [](int, void* ctx) { static_cast<ferry::WatchLoop*>(ctx)->Stop(); },
      &loop);
  shutdown.WaitForShutdown();
  loop_thread.join();

  const bool failed = shutdown.Signal() == 0;
  FERRY_LOG_INFO("Main", "Shutdown complete, %llu file event(s) dispatched",
                 static_cast<unsigned long long>(loop.Dispatched()));
  return failed ? 1 : 0;
}
