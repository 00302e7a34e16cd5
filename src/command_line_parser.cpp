#include "command_line_parser.hpp"

#include <cctype>
#include <stdexcept>

#include "log.hpp"

namespace {

bool looks_like_option(const std::string& token) {
  return token.size() >= 2 && token[0] == '-' &&
         (token[1] == '-' || std::isalpha(static_cast<unsigned char>(token[1])));
}

const char* type_hint(SettingType type) {
  switch(type) {
    case SettingType::Bool: return "[true|false]";
    case SettingType::Int: return "<int>";
    case SettingType::UInt64: return "<bytes>";
    case SettingType::String: return "<text>";
  }
  return "<value>";
}

std::string printable(const nlohmann::json& value) {
  if(value.is_string()) return value.get<std::string>();
  return value.dump();
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name)
  : process_name_(std::move(process_name)) {}

bool CommandLineParser::apply_option(const std::vector<std::string>& args,
                                     std::size_t& i,
                                     SettingsManager& settings) const {
  const std::string& token = args[i];
  const bool long_form = token.rfind("--", 0) == 0;
  std::string name = token.substr(long_form ? 2 : 1);
  std::optional<std::string> inline_value;
  if(long_form) {
    auto eq = name.find('=');
    if(eq != std::string::npos) {
      inline_value = name.substr(eq + 1);
      name.resize(eq);
    }
  }

  auto key = settings.resolve_key(name);
  if(!key) {
    if(long_form) throw std::invalid_argument("Unknown option --" + name);
    return false; // a file whose name starts with '-'
  }

  std::string value;
  if(inline_value) {
    value = *inline_value;
  } else if(settings.is_bool_setting(*key)) {
    const bool explicit_value = i + 1 < args.size() && !looks_like_option(args[i + 1]) &&
                                SettingsManager::is_bool_literal(args[i + 1]);
    value = explicit_value ? args[++i] : "true";
  } else if(i + 1 < args.size()) {
    value = args[++i];
  } else {
    throw std::invalid_argument("Missing value for option '" + name + "'");
  }

  std::string error;
  if(!settings.set_from_string(*key, value, error)) {
    throw std::invalid_argument("Invalid value for option '" + name + "': " + error);
  }
  return true;
}

std::vector<std::string> CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  for(int n = 1; argv && n < argc; ++n) args.emplace_back(argv[n]);

  std::vector<std::string> files;
  std::size_t i = 0;
  for(; i < args.size(); ++i) {
    if(args[i] == "--") {
      ++i;
      break;
    }
    if(looks_like_option(args[i]) && apply_option(args, i, settings)) continue;
    files.push_back(args[i]);
  }
  files.insert(files.end(), args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
  return files;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  print_out(nullptr, "{} - resumable chunked file uploader", process_name_);
  print_out(nullptr, "Usage: {} [options] <file>...", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& setting : settings.settings()) {
    std::string aliases;
    for(const auto& alias : setting.aliases) {
      aliases += aliases.empty() ? " (alias: -" : ", -";
      aliases += alias;
    }
    if(!aliases.empty()) aliases += ")";
    print_out(nullptr, "  --{:<24} {:<13} {}{} (default: {})",
              setting.key, type_hint(setting.type), setting.description,
              aliases, printable(setting.default_value));
  }
  print_out(nullptr, "");
}
