#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

namespace sendmer {

enum class Subcommand {
  None,
  Send,
  Receive
};

struct ParsedCommand {
  Subcommand command = Subcommand::None;
  // Path for send, ticket for receive.
  std::string target;
};

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "sendmer",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION);

  // Throws Error on malformed input. `--help` short-circuits the positional checks.
  ParsedCommand parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

  static Subcommand subcommand_from_string(const std::string& token);

private:
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);
  static bool is_repeated_flag(const std::string& alias, char flag);

  std::string process_name_;
  nlohmann::json settings_spec_;
};

} // namespace sendmer
