/**
 * Window viewer entry point.
 *
 * Each line read from stdin is scrolled in an SFML window the size of the
 * panel. "\n" inside a line starts a new display line.
 */

#include "os_agnostic/CommandHandler.hpp"
#include "os_agnostic/DisplayConfig.hpp"
#include "os_agnostic/Logger.hpp"
#include "os_agnostic/SessionManager.hpp"
#include "os_dependent/WindowSink.hpp"

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Everything the stdin reader touches. Shared so a reader still blocked in
// getline when the window closes never outlives what it points at.
struct ViewerState {
  explicit ViewerState(const DisplayConfig& config)
    : logger(std::cerr, logMutex), sessions(config, sink, logger) {}

  std::mutex logMutex;
  Logger logger;
  WindowSink sink;
  SessionManager sessions;
  std::atomic<bool> quitting{false};
  std::atomic<bool> inputDone{false};
};

int main() {
  const DisplayConfig config;
  auto state = std::make_shared<ViewerState>(config);
  WindowViewer viewer("textscroll", config.viewportWidth, config.viewportHeight);

  state->sessions.submit("textscroll\n\nType a line and press Enter");

  // Submissions arrive on their own thread, like requests on a server.
  std::thread reader([state] {
    std::string line;
    while (std::getline(std::cin, line)) {
      // After shutdown() every submit is rejected, so a late line cannot restart scrolling.
      const SubmissionResult result = state->sessions.submit(CommandHandler::unescape(line));
      if (state->quitting.load()) break;
      if (!result.accepted()) {
        state->logger.warn("input", "rejected: " + result.message);
      } else if (result.previousFault) {
        state->logger.warn("input", "previous session lost the display: " + *result.previousFault);
      }
    }
    state->inputDone.store(true);
  });

  // Closing the window or EOF on stdin quits.
  while (!state->inputDone.load() && viewer.present(state->sink)) {
  }

  state->quitting.store(true);
  state->sessions.shutdown();

  if (state->inputDone.load()) {
    reader.join();
  } else {
    // Still blocked in getline on an interactive stdin.
    reader.detach();
  }
  return 0;
}
