#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

// Replaces the file at `path` with `data`: writes a sibling temp file, fsyncs it and
// renames it over the target, so readers see either the old or the new content.
std::expected<void, std::string> atomic_write(const std::string& path, std::string_view data);
std::expected<void, std::string> atomic_write(const std::string& path,
                                              std::span<const uint8_t> data);
