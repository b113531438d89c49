/**
 * Parses and executes commands with deterministic paint order:
 *
 *   > prev command
 *   prev feedback
 *
 *   > current command
 *   current feedback
 *   preview (only while text is scrolling)
 *   > new prompt
 *
 * Never hold coutMutex while calling into the SessionManager: swapping a
 * session joins a render thread that may itself be waiting on coutMutex.
 */

#include "CommandHandler.hpp"
#include <cctype>
#include <sstream>

static void toLowerInPlace(std::string& s) {
  for (auto& ch : s) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
}

static std::string trim(const std::string& s) {
  auto l = s.find_first_not_of(" \t");
  auto r = s.find_last_not_of(" \t");
  if (l == std::string::npos) return std::string{};
  return s.substr(l, r - l + 1);
}

static std::string trimQuotes(std::string s) {
  s = trim(s);
  if (s.size() >= 2 && ((s.front()=='"' && s.back()=='"') || (s.front()=='\'' && s.back()=='\''))) {
    s = s.substr(1, s.size()-2);
  }
  return s;
}

// Reads exactly one integer and nothing else.
static bool parseInt(const std::string& arg, int& value) {
  std::istringstream iss(trim(arg));
  int v = 0;
  if (!(iss >> v)) return false;
  std::string extra;
  if (iss >> extra) return false;
  value = v;
  return true;
}

std::string CommandHandler::unescape(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '\\' && i + 1 < text.size()) {
      const char next = text[i + 1];
      if (next == 'n')  { out.push_back('\n'); ++i; continue; }
      if (next == 't')  { out.push_back('\t'); ++i; continue; }
      if (next == '\\') { out.push_back('\\'); ++i; continue; }
    }
    out.push_back(ch);
  }
  return out;
}

void CommandHandler::enqueue(std::string cmd) {
  {
    std::lock_guard<std::mutex> lk(queueMutex);
    commandQueue.push(std::move(cmd));
  }
  queueCv.notify_one();
}

// --- Internal: write the help block assuming coutMutex is already held ---
static void writeHelpUnlocked(std::ostream& os) {
  os << "Commands:\n"
     << "  help                              - displays the commands and its description\n"
     << "  show <text>                       - scrolls <text> (\\n starts a new line)\n"
     << "  set_text <text>                   - same as show\n"
     << "  load_file <path>                  - scrolls the contents of a text file\n"
     << "  stop                              - stops scrolling\n"
     << "  status                            - shows the active session and its counters\n"
     << "  config                            - shows the settings the next text will use\n"
     << "  set_speed <px>                    - pixels scrolled per frame\n"
     << "  set_interval <ms>                 - delay between frames in milliseconds\n"
     << "  set_font <size>                   - glyph size in pixels\n"
     << "  set_width <chars>                 - wrap width in characters (0 fits the display)\n"
     << "  set_colors <fg> [bg]              - text and background colour (#rrggbb or a name)\n"
     << "  reset_config                      - drops every set_* override\n"
     << "  exit                              - terminates the console\n";
}

// --- Internal: paint transaction to enforce exact line order and clear old preview ---
void CommandHandler::paint(const std::string& line, const std::function<void(std::ostream&)>& feedback) {
  // Decide the new preview size before taking the output lock.
  const bool showPreview = previewRows > 0 && sessions.activeText().has_value();
  const int newRows = showPreview ? previewRows : 0;

  std::lock_guard<std::mutex> lock(ctx.coutMutex);

  // Always position relative to the *current* prompt anchor
  out << "\x1b[u";

  // 1) CLEAR the previous preview block above the (old) prompt anchor
  for (int k = 1; k <= ctx.getPreviewRows(); ++k) {
    out << "\x1b[u"
        << "\x1b[" << k << "F"
        << "\r\x1b[2K";
  }

  // 2) Echo the entered command on the prompt line, then newline into history
  out << "\x1b[u"
      << "\r\x1b[2K> " << line
      << "\n";

  // 3) Feedback block (can be multi-line; writer prints trailing newlines)
  if (feedback) feedback(out);

  // 4) Reserve rows ONLY if text is scrolling
  for (int i = 0; i < newRows; ++i) {
    out << "\x1b[2K" << "\n";   // blank placeholders for TerminalSink to paint over
  }

  // 5) NEW prompt line and save a fresh anchor for the sink/keyboard
  out << "\x1b[2K> "
      << "\x1b[s"
      << std::flush;

  ctx.setPreviewRows(newRows);
  ctx.setHasPromptLine(true);
}

// Fallback one-line message using the same atomic repaint
void CommandHandler::paintMessage(const std::string& line, const std::string& msg) {
  paint(line, [&](std::ostream& os) {
    os << msg << "\n";
  });
}

void CommandHandler::submitText(const std::string& line, const std::string& text) {
  const SubmissionResult result = sessions.submit(text, overrides);

  if (!result.accepted()) {
    paintMessage(line, "Rejected: " + result.message);
    return;
  }

  std::string msg = "Scrolling " + std::to_string(result.lineCount)
                    + (result.lineCount == 1 ? " line" : " lines")
                    + " (session " + std::to_string(result.sessionId) + ").";
  if (result.previousFault) {
    msg += "\nWarning: the previous session lost the display: " + *result.previousFault;
  }
  paintMessage(line, msg);
}

// Re-submits the scrolling text so a set_* change shows up immediately.
void CommandHandler::applyOverride(const std::string& line, const std::string& what) {
  if (auto text = sessions.activeText()) {
    const SubmissionResult result = sessions.submit(*text, overrides);
    if (!result.accepted()) {
      paintMessage(line, what + " (not applied: " + result.message + ")");
      return;
    }
    paintMessage(line, what + " Restarted scrolling.");
    return;
  }
  paintMessage(line, what);
}

void CommandHandler::execute(const std::string& line) {
  // Parse command + rest
  auto first_space = line.find_first_of(" \t");
  std::string cmd  = (first_space == std::string::npos) ? line : line.substr(0, first_space);
  std::string rest = (first_space == std::string::npos) ? std::string{} : line.substr(first_space + 1);
  toLowerInPlace(cmd);

  if (cmd.empty()) {
    paint(line, nullptr);
    return;
  }

  // HELP
  if (cmd == "help") {
    paint(line, [](std::ostream& os) {
      writeHelpUnlocked(os);
    });
    return;
  }

  // EXIT (no new prompt afterwards)
  if (cmd == "exit") {
    sessions.stop();
    {
      std::lock_guard<std::mutex> lock(ctx.coutMutex);
      out << "\x1b[u"
          << "\r\x1b[2K> " << line << "\n"
          << "Exiting...\n"
          << std::flush;
      ctx.setPreviewRows(0);
    }
    ctx.exitRequested.store(true);
    queueCv.notify_all();
    return;
  }

  // SHOW / SET_TEXT
  if (cmd == "show" || cmd == "set_text") {
    submitText(line, unescape(trimQuotes(rest)));
    return;
  }

  // LOAD FILE
  if (cmd == "load_file") {
    const std::string path = trimQuotes(rest);
    std::string content, error;
    if (!files.load(path, content, error)) {
      paintMessage(line, "Error: " + error);
      return;
    }
    submitText(line, content);
    return;
  }

  // STOP
  if (cmd == "stop") {
    const bool wasActive = sessions.activeText().has_value();
    sessions.stop();
    paintMessage(line, wasActive ? "Scrolling stopped." : "Nothing is scrolling.");
    return;
  }

  // STATUS
  if (cmd == "status") {
    const SessionStatus s = sessions.status();
    paint(line, [&](std::ostream& os) {
      if (!s.active) {
        os << "Idle.\n";
      } else {
        os << "Session " << s.sessionId << ": " << controllerStateName(s.state)
           << ", " << s.lineCount << " lines\n"
           << "  frames delivered " << s.stats.framesDelivered
           << ", failed " << s.stats.deliveryFailures
           << ", cycles " << s.stats.cycles
           << ", offset " << s.stats.offset << "px\n"
           << "  " << s.config.describe() << "\n";
      }
      if (s.fault) os << "Fault: " << *s.fault << "\n";
    });
    return;
  }

  // CONFIG
  if (cmd == "config") {
    const DisplayConfig effective = overrides.applyTo(sessions.baseConfig());
    paintMessage(line, "Next submission: " + effective.describe());
    return;
  }

  // RESET CONFIG
  if (cmd == "reset_config") {
    overrides = ConfigOverrides{};
    applyOverride(line, "Overrides cleared.");
    return;
  }

  // SET SPEED / INTERVAL / FONT / WIDTH
  if (cmd == "set_speed" || cmd == "set_interval" || cmd == "set_font" || cmd == "set_width") {
    int value = 0;
    if (!parseInt(rest, value)) {
      const char* arg = cmd == "set_speed" ? "<px>" : cmd == "set_interval" ? "<ms>"
                      : cmd == "set_font" ? "<size>" : "<chars>";
      paintMessage(line, "Usage: " + cmd + " " + arg);
      return;
    }

    // Validate against the merged config so a bad value never reaches a session.
    ConfigOverrides candidate = overrides;
    std::string what;
    if (cmd == "set_speed") {
      candidate.scrollSpeed = value;
      what = "Speed set to " + std::to_string(value) + " px/frame.";
    } else if (cmd == "set_interval") {
      candidate.frameInterval = std::chrono::milliseconds(value);
      what = "Interval set to " + std::to_string(value) + " ms.";
    } else if (cmd == "set_font") {
      candidate.fontSize = value;
      what = "Font size set to " + std::to_string(value) + " px.";
    } else {
      candidate.maxCharsPerLine = value;
      what = value == 0 ? std::string("Width set to fit the display.")
                        : "Width set to " + std::to_string(value) + " characters.";
    }

    if (auto problem = candidate.applyTo(sessions.baseConfig()).validate()) {
      paintMessage(line, "Invalid value: " + *problem);
      return;
    }
    overrides = candidate;
    applyOverride(line, what);
    return;
  }

  // SET COLORS
  if (cmd == "set_colors" || cmd == "set_colours") {
    std::istringstream iss(rest);
    std::string fg, bg;
    iss >> fg >> bg;
    if (fg.empty()) {
      paintMessage(line, "Usage: set_colors <fg> [bg]");
      return;
    }
    auto fgColor = Color::parse(fg);
    if (!fgColor) {
      paintMessage(line, "Unknown colour: " + fg);
      return;
    }
    std::optional<Color> bgColor;
    if (!bg.empty()) {
      bgColor = Color::parse(bg);
      if (!bgColor) {
        paintMessage(line, "Unknown colour: " + bg);
        return;
      }
    }
    overrides.foregroundColor = fgColor;
    if (bgColor) overrides.backgroundColor = bgColor;
    applyOverride(line, "Colours set to " + fgColor->toHex()
                        + (bgColor ? " on " + bgColor->toHex() : std::string{}) + ".");
    return;
  }

  // Unknown
  paintMessage(line, "Unknown command. Type 'help'.");
}

void CommandHandler::operator()() {
  // >>> JOIN INIT PHASE
  ctx.phase_barrier.arrive_and_wait();

  while (!ctx.exitRequested.load()) {
    std::string command;
    {
      std::unique_lock<std::mutex> lock(queueMutex);
      queueCv.wait(lock, [&]{ return !commandQueue.empty() || ctx.exitRequested.load(); });
      if (ctx.exitRequested.load()) break;
      command = std::move(commandQueue.front());
      commandQueue.pop();
    }
    execute(command);
  }

  ctx.stop_latch.count_down();
}
