#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "client/transport.hpp"
#include "server/service.hpp"

namespace netfile {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(server::Service& service, std::shared_ptr<client::Transport> transport,
      std::istream& input = std::cin, std::ostream& output = std::cout);


  // ---- STARTUP ----
  void run();
  // Executes a single command line, returns false once the shell should stop
  bool execute(const std::string& line);

private:
  // ---- PARAMETERS ----
  bool running_;
  // System components
  server::Service& service_;
  std::shared_ptr<client::Transport> transport_;
  std::istream& input_;
  std::ostream& output_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::vector<std::string>& args);
  void handle_help_command();
  void handle_serve_command(const std::vector<std::string>& args, bool for_writing);
  void handle_close_command(const std::vector<std::string>& args);
  void handle_ls_command();
  void handle_info_command();
  void handle_get_command(const std::vector<std::string>& args);
  void handle_put_command(const std::vector<std::string>& args);
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace netfile
