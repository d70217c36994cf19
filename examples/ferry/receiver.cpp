/**
 * @file receiver.cpp
 * @brief ferry_receiver -- accepts replication streams and publishes files.
 *
 * Every accepted connection gets its own session thread. Files appear under
 * dest_dir only after their checksum has been verified, through rename(2)
 * of a per-frame "<name>.part.XXXXXX" temp file.
 *
 * ferry components used:
 *   - ferry::Receiver         -- listener + per-connection sessions
 *   - ferry::ShutdownManager  -- SIGINT/SIGTERM handling
 *   - ferry::IniConfig        -- ferry_receiver.ini
 *   - ferry::log              -- logging
 *
 * Usage:
 *   ferry_receiver [--config ferry_receiver.ini] [--bind 0.0.0.0]
 *                  [--port 5001] [--dest-dir /destino] [--log-level info]
 */

#include "ferry/log.hpp"
#include "ferry/receiver.hpp"
#include "ferry/settings.hpp"
#include "ferry/shutdown.hpp"

int main(int argc, char* argv[]) {
  ferry::log::Init();
  FERRY_SCOPE_EXIT(ferry::log::Shutdown());

  ferry::ReceiverSettings settings;
  auto loaded = ferry::LoadReceiverSettings(argc, argv, settings);
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

  ferry::Receiver receiver(settings.ToReceiverOptions());
  auto started = receiver.Start(settings.bind.c_str(), settings.port,
                                settings.backlog);
  if (!started.has_value()) {
    FERRY_LOG_FATAL("Main", "Cannot start receiver on %s:%u: %s",
                    settings.bind.c_str(), static_cast<unsigned>(settings.port),
                    ferry::ReceiveErrorName(started.get_error()));
    return 1;
  }

  (void)shutdown.Register(
      [](int, void* ctx) { static_cast<ferry::Receiver*>(ctx)->Stop(); },
      &receiver);
  shutdown.WaitForShutdown();
  FERRY_LOG_INFO("Main", "Shutdown complete (signal %d)", shutdown.Signal());
  return 0;
}
