#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "log.hpp"

namespace sendmer {

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)) {}

Subcommand CommandLineParser::subcommand_from_string(const std::string& token) {
  auto lowered = SettingsManager::to_lower(token);
  if(lowered == "send") return Subcommand::Send;
  if(lowered == "receive" || lowered == "recv") return Subcommand::Receive;
  return Subcommand::None;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  if(candidate.size() >= 2 && candidate[0] == '-' &&
     std::isalpha(static_cast<unsigned char>(candidate[1]))) {
    return true;
  }
  return false;
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

bool CommandLineParser::is_repeated_flag(const std::string& alias, char flag) {
  return !alias.empty() &&
         std::all_of(alias.begin(), alias.end(), [flag](char ch){ return ch == flag; });
}

ParsedCommand CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::vector<std::string> positionals;

  auto fail = [](const std::string& message){
    throw Error(message);
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    auto handle_option = [&](const std::string& key_token, bool long_form){
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) {
          fail("Unknown option --" + key_token);
        }
        return false; // treat as positional for short tokens
      }
      std::string value;
      if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          fail("Missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        fail("Invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token.rfind("--", 0) == 0) {
      handle_option(token.substr(2), true);
      continue;
    }

    if(token.size() > 1 && token[0] == '-') {
      std::string alias = token.substr(1);
      // -v, -vv, -vvv
      if(is_repeated_flag(alias, 'v')) {
        std::string error;
        int level = settings.get<int>("verbose") + static_cast<int>(alias.size());
        if(!settings.set_from_json("verbose", level, error)) {
          fail("Invalid verbosity: " + error);
        }
        continue;
      }
      if(handle_option(alias, false)) {
        continue;
      }
      // fall through to positional if alias unrecognised
    }

    positionals.push_back(token);
  }

  ParsedCommand parsed;
  if(settings.help_requested()) {
    if(!positionals.empty()) parsed.command = subcommand_from_string(positionals.front());
    return parsed;
  }
  if(positionals.empty()) {
    fail("Missing subcommand");
  }
  parsed.command = subcommand_from_string(positionals.front());
  if(parsed.command == Subcommand::None) {
    fail("invalid subcommand \"" + positionals.front() + "\"\n\nAvailable subcommands are\n    send\n    receive");
  }
  if(positionals.size() < 2) {
    fail(parsed.command == Subcommand::Send ? "Missing path to send" : "Missing ticket");
  }
  if(positionals.size() > 2) {
    fail("Unexpected positional argument '" + positionals[2] + "'");
  }
  parsed.target = positionals[1];
  return parsed;
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - send files and directories over a direct connection", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} send <path> [options]", process_name_);
  print_out(nullptr, "  {} receive <ticket> [options]", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    auto description = entry.value("description", "");
    auto default_value = entry.at("default");
    std::string default_str;
    if(type == "bool") {
      default_str = default_value.get<bool>() ? "true" : "false";
    } else if(default_value.is_string()) {
      default_str = default_value.get<std::string>();
    } else {
      default_str = default_value.dump();
    }
    std::replace(key.begin(), key.end(), '_', '-');
    print_out(nullptr, "  --{} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              description,
              aliases.str(),
              default_str);
  }
  print_out(nullptr, "");
}

} // namespace sendmer
