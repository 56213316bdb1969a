/**
 * @file main.cpp
 * @brief agentmsg CLI — send, listen, list peers, or chat from a terminal.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11): global identity/transport/logging flags plus
 *    one of four subcommands.
 *  - Layer configuration: defaults <- --config file <- command line <- AGENTMSG_FILE_DIR
 *    (the environment only fills the shared directory when nothing else did).
 *  - Run one agentmsg::Messenger for the lifetime of the subcommand.
 *
 * Subcommands:
 *  - send <message>        start, settle, send, settle, stop, print "Sent: <message>"
 *  - listen                print "[HH:MM:SS] <uuid8>: <text>" until SIGINT/SIGTERM
 *  - peers [--wait S]      discover for S seconds (default 3), newest first
 *  - interactive           REPL; lines are sent, /peers lists, /quit exits
 *
 * Exit status: 0 on success, 1 on setup/send failure, 2 on bad configuration.
 */

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h> // isatty

#include <CLI/CLI.hpp>

#include "agentmsg/config.hpp"
#include "agentmsg/errors.hpp"
#include "agentmsg/logging.hpp"
#include "agentmsg/message.hpp"
#include "agentmsg/messenger.hpp"

using namespace agentmsg;

// ---------- small utilities ----------

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void on_signal(int) { g_stop_requested = 1; }

bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

std::string short_id(const std::string& uuid) { return uuid.substr(0, 8); }

// Local wall-clock "HH:MM:SS".
std::string clock_hms() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
  return buf;
}

std::string seen_ago(double now, double last_seen) {
  std::ostringstream ss;
  ss << "seen " << std::fixed << std::setprecision(1) << (now - last_seen) << "s ago";
  return ss.str();
}

// Peers sorted newest first.
std::vector<std::pair<std::string, double>> sorted_peers(const PeerMap& peers) {
  std::vector<std::pair<std::string, double>> rows(peers.begin(), peers.end());
  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) { return a.second > b.second; });
  return rows;
}

std::mutex g_out_mu;   // handler output vs. prompt

void print_line(const std::string& line) {
  std::lock_guard<std::mutex> lock(g_out_mu);
  std::cout << line << std::endl;
}

// ---------- subcommands ----------

int cmd_send(Messenger& m, const std::string& text) {
  m.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));   // let the sockets settle
  m.send(text);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  m.stop();
  std::cout << "Sent: " << text << "\n";
  return 0;
}

int cmd_listen(Messenger& m, const Ansi& ansi) {
  m.on_message([&ansi](const std::string& uuid, const std::string& text) {
    print_line(ansi.dim("[" + clock_hms() + "]") + " " + ansi.bold(short_id(uuid)) + ": " + text);
  });

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  m.start();
  print_line("Listening as " + short_id(m.uuid()) + "... (Ctrl+C to stop)");

  while (!g_stop_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  print_line("\nStopping...");
  m.stop();
  return 0;
}

int cmd_peers(Messenger& m, double wait_s, const Ansi& ansi) {
  m.start();
  std::cout << "Discovering peers for " << wait_s << " seconds..." << std::endl;
  std::this_thread::sleep_for(std::chrono::duration<double>(wait_s));

  const PeerMap peers = m.get_peers();
  m.stop();

  if (peers.empty()) {
    std::cout << "No peers found.\n";
    return 0;
  }

  std::cout << "\nFound " << peers.size() << " peer(s):\n";
  const double now = now_seconds();
  for (const auto& [uuid, last_seen] : sorted_peers(peers)) {
    std::cout << "  " << uuid << "  " << ansi.dim("(" + seen_ago(now, last_seen) + ")") << "\n";
  }
  return 0;
}

int cmd_interactive(Messenger& m, const Ansi& ansi) {
  m.on_message([&ansi](const std::string& uuid, const std::string& text) {
    std::lock_guard<std::mutex> lock(g_out_mu);
    std::cout << "\r" << ansi.dim("[" + clock_hms() + "]") << " " << ansi.bold(short_id(uuid))
              << ": " << text << "\n> " << std::flush;
  });

  m.start();
  print_line("Interactive mode as " + short_id(m.uuid()));
  print_line("Commands: /peers, /quit");
  print_line("Type a message and press Enter to send.\n");

  std::string line;
  while (true) {
    {
      std::lock_guard<std::mutex> lock(g_out_mu);
      std::cout << "> " << std::flush;
    }
    if (!std::getline(std::cin, line)) break;   // EOF

    // trim
    const auto b = line.find_first_not_of(" \t\r");
    if (b == std::string::npos) continue;
    line = line.substr(b, line.find_last_not_of(" \t\r") - b + 1);

    if (line == "/quit") break;

    if (line == "/peers") {
      const PeerMap peers = m.get_peers();
      if (peers.empty()) {
        print_line("No peers found.");
        continue;
      }
      const double now = now_seconds();
      print_line("Active peers (" + std::to_string(peers.size()) + "):");
      for (const auto& [uuid, last_seen] : sorted_peers(peers)) {
        print_line("  " + short_id(uuid) + " (" + seen_ago(now, last_seen) + ")");
      }
      continue;
    }

    if (line[0] == '/') {
      print_line(ansi.red("Unknown command: " + line));
      continue;
    }

    try {
      m.send(line);
    } catch (const SendFailure& e) {
      print_line(ansi.red(std::string("error: ") + e.what()));
    }
  }

  print_line("\nStopping...");
  m.stop();
  return 0;
}

} // namespace

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_uuid;
  std::string opt_file_dir;
  std::string opt_config;
  std::string opt_log_level;
  bool        opt_no_color = false;

  std::string opt_message;
  double      opt_wait = 3.0;

  CLI::App app{"Broadcast messaging between agents on one host or LAN segment"};
  app.name("agentmsg");
  app.require_subcommand(1);

  app.add_option("--uuid", opt_uuid, "Agent identity (generated when omitted)");
  app.add_option("--file-dir", opt_file_dir, "Shared directory for file-based transport (instead of multicast)");
  app.add_option("--config", opt_config, "JSON config file")->check(CLI::ExistingFile);
  app.add_option("--log-level", opt_log_level, "trace|debug|info|warn|error|critical|off");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  CLI::App* sub_send = app.add_subcommand("send", "Send a message and exit");
  sub_send->add_option("message", opt_message, "Message to send")->required();

  CLI::App* sub_listen = app.add_subcommand("listen", "Listen for messages until Ctrl+C");

  CLI::App* sub_peers = app.add_subcommand("peers", "List active peers");
  sub_peers->add_option("--wait", opt_wait, "Seconds to wait for peer discovery")
           ->capture_default_str()
           ->check(CLI::NonNegativeNumber);

  CLI::App* sub_interactive = app.add_subcommand("interactive", "Interactive REPL mode");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout();

  // Layer configuration.
  AppConfig cfg;
  try {
    if (!opt_config.empty()) cfg = load_config_file(opt_config);
  } catch (const ConfigError& e) {
    std::cerr << ansi.red(std::string("error: ") + e.what()) << "\n";
    return 2;
  }
  if (!opt_uuid.empty())      cfg.messenger.identity = opt_uuid;
  if (!opt_file_dir.empty())  cfg.messenger.shared_dir = opt_file_dir;
  if (!opt_log_level.empty()) cfg.logging.level = opt_log_level;
  apply_environment(cfg.messenger);

  init_logging(cfg.logging);

  int rc = 0;
  try {
    Messenger messenger(cfg.messenger);

    if (*sub_send)             rc = cmd_send(messenger, opt_message);
    else if (*sub_listen)      rc = cmd_listen(messenger, ansi);
    else if (*sub_peers)       rc = cmd_peers(messenger, opt_wait, ansi);
    else if (*sub_interactive) rc = cmd_interactive(messenger, ansi);
  } catch (const Error& e) {
    std::cerr << ansi.red(std::string("error: ") + e.what()) << "\n";
    rc = 1;
  }

  shutdown_logging();
  return rc;
}
