#include "path_validator.hpp"

#include <vector>

#include "errors.hpp"

namespace sendmer {

namespace {

bool has_separator(std::string_view text) {
  return text.find('/') != std::string_view::npos ||
         text.find('\\') != std::string_view::npos;
}

} // namespace

std::string canonicalized_path_to_string(const std::filesystem::path& path,
                                         bool must_be_relative) {
  std::string out;
  std::vector<std::string> parts;
  if(path.has_root_name()) {
    throw PathValidationError("invalid path component \"" + path.root_name().string() + "\"");
  }
  for(const auto& component : path) {
    std::string text = component.string();
    if(component == path.root_directory() && !path.root_directory().empty() && parts.empty() && out.empty()) {
      if(must_be_relative) {
        throw PathValidationError("invalid path component \"" + text + "\"");
      }
      out.push_back('/');
      continue;
    }
    // A trailing separator shows up as an empty element.
    if(text.empty()) continue;
    if(text == "." || text == "..") {
      throw PathValidationError("invalid path component \"" + text + "\"");
    }
    if(has_separator(text)) {
      throw PathValidationError("invalid path component \"" + text + "\"");
    }
    parts.push_back(std::move(text));
  }
  for(std::size_t i = 0; i < parts.size(); ++i) {
    if(i > 0) out.push_back('/');
    out += parts[i];
  }
  return out;
}

void validate_path_component(std::string_view component) {
  if(has_separator(component)) {
    throw PathValidationError("path components must not contain a path separator: \"" +
                              std::string(component) + "\"");
  }
  if(component.empty() || component == "." || component == "..") {
    throw PathValidationError("invalid path component \"" + std::string(component) + "\"");
  }
}

std::filesystem::path get_export_path(const std::filesystem::path& root,
                                      std::string_view name) {
  std::filesystem::path out = root;
  std::size_t start = 0;
  while(true) {
    auto end = name.find('/', start);
    auto part = name.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
    validate_path_component(part);
    out /= std::string(part);
    if(end == std::string_view::npos) break;
    start = end + 1;
  }
  return out;
}

} // namespace sendmer
