#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace sendmer {

// Joins the normal components of an already canonical path with '/'.
// Throws PathValidationError on ".", "..", a component holding '/' or '\\',
// or a root directory when must_be_relative is set. With must_be_relative
// unset a root directory becomes a single leading '/'.
std::string canonicalized_path_to_string(const std::filesystem::path& path,
                                         bool must_be_relative);

// One collection name segment. Rejects separators, "." and ".." and the empty string.
void validate_path_component(std::string_view component);

// Maps a collection entry name back to a file under root.
std::filesystem::path get_export_path(const std::filesystem::path& root,
                                      std::string_view name);

} // namespace sendmer
