#pragma once

#include "uvm/engine/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace uvm::engine {

// filename.wav=alias,offset,consonant,cutoff,preutterance,overlap
std::optional<OtoEntry> parse_oto_line(const std::string& line);
std::vector<OtoEntry> parse_oto(const std::string& text);

std::string format_number(double value);
std::string to_oto_line(const OtoEntry& entry);
std::string serialize_oto(const std::vector<OtoEntry>& entries);

// True if to_oto_line(entry) is a single line that parses back to the same
// file name and alias.
bool is_representable(const OtoEntry& entry);

std::vector<OtoEntry> read_oto_file(const std::filesystem::path& path);

// Replaces the target atomically; readers never observe a partial file.
void write_oto_file(const std::filesystem::path& path, const std::vector<OtoEntry>& entries);

}  // namespace uvm::engine
