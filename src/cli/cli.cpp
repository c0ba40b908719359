#include "cli/cli.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>
#include "client/remote_file.hpp"
#include "storage/local_file.hpp"
#include "storage/stream_adapters.hpp"
#include "utils/random.hpp"

namespace netfile {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(server::Service& service, std::shared_ptr<client::Transport> transport,
         std::istream& input, std::ostream& output)
  : running_(false)
  , service_(service)
  , transport_(std::move(transport))
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "CLI: Starting CLI loop";
  output_ << "netfile> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "netfile> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI: CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args;
  std::string arg;
  while (iss >> arg) {
    args.push_back(arg);
  }

  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else if (command == "serve") {
    handle_serve_command(args, false);
  }
  else if (command == "receive") {
    handle_serve_command(args, true);
  }
  else if (command == "close") {
    handle_close_command(args);
  }
  else if (command == "ls" && args.empty()) {
    handle_ls_command();
  }
  else if (command == "info" && args.empty()) {
    handle_info_command();
  }
  else if (command == "get") {
    handle_get_command(args);
  }
  else if (command == "put") {
    handle_put_command(args);
  }
  else {
    output_ << "Unknown command or invalid arguments, type 'help' for usage" << std::endl;
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                              Display this help message" << std::endl;
  output_ << "  serve <path> [id]                 Expose a local file for reading" << std::endl;
  output_ << "  receive <path> [id]               Expose a local file for writing" << std::endl;
  output_ << "  close <id>                        Stop exposing <id>" << std::endl;
  output_ << "  ls                                List exposed identifiers" << std::endl;
  output_ << "  info                              Show base URL and shared secret" << std::endl;
  output_ << "  get <url> <secret> <id> <dest>    Copy a remote file into <dest>" << std::endl;
  output_ << "  put <url> <secret> <id> <src>     Copy <src> into a remote file" << std::endl;
  output_ << "  quit                              Exit the shell" << std::endl;
}

void CLI::handle_serve_command(const std::vector<std::string>& args, bool for_writing) {
  if (args.empty() || args.size() > 2) {
    output_ << "Usage: " << (for_writing ? "receive" : "serve") << " <path> [id]" << std::endl;
    return;
  }

  const std::string& path = args[0];
  std::string id = args.size() == 2 ? args[1] : utils::file_id_from_path(path);

  try {
    if (for_writing) {
      service_.serve_writer(id, storage::LocalFile::open(path, storage::OpenMode::WRITE));
    } else {
      service_.serve_reader(id, storage::LocalFile::open(path, storage::OpenMode::READ));
    }
    output_ << (for_writing ? "Receiving " : "Serving ") << path << " as " << id << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error exposing " + path, e.what());
  }
}

void CLI::handle_close_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    output_ << "Usage: close <id>" << std::endl;
    return;
  }

  std::size_t closed = service_.registry().close(args[0]);
  if (closed == 0) {
    output_ << "Unknown identifier: " << args[0] << std::endl;
  } else {
    output_ << "Closed " << args[0] << std::endl;
  }
}

void CLI::handle_ls_command() {
  auto ids = service_.registry().ids();
  if (ids.empty()) {
    output_ << "Nothing exposed" << std::endl;
    return;
  }
  for (const auto& id : ids) {
    output_ << "  " << id << std::endl;
  }
}

void CLI::handle_info_command() {
  output_ << "URL:    " << service_.base_url() << std::endl;
  output_ << "Secret: " << service_.shared_secret() << std::endl;
}

void CLI::handle_get_command(const std::vector<std::string>& args) {
  if (args.size() != 4) {
    output_ << "Usage: get <url> <secret> <id> <dest>" << std::endl;
    return;
  }

  try {
    client::RemoteReader reader(transport_, args[0], args[1], args[2]);
    auto destination = storage::LocalFile::open(args[3], storage::OpenMode::WRITE);
    std::vector<char> buffer(server::DEFAULT_BUFFER_SIZE);
    std::uint64_t copied = storage::copy_buffer(*destination, reader, buffer);
    destination->close();
    output_ << "Copied " << copied << " bytes into " << args[3] << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error fetching " + args[2], e.what());
  }
}

void CLI::handle_put_command(const std::vector<std::string>& args) {
  if (args.size() != 4) {
    output_ << "Usage: put <url> <secret> <id> <src>" << std::endl;
    return;
  }

  try {
    auto source = storage::LocalFile::open(args[3], storage::OpenMode::READ);
    client::RemoteWriter writer(transport_, args[0], args[1], args[2]);
    std::vector<char> buffer(server::DEFAULT_BUFFER_SIZE);
    std::uint64_t copied = storage::copy_buffer(writer, *source, buffer);
    output_ << "Copied " << copied << " bytes to " << args[2] << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error sending " + args[3], e.what());
  }
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace netfile
