#pragma once

#include "stream.hpp"

#include <filesystem>
#include <istream>
#include <ostream>
#include <string>

// Re-indents the JSON document read from in with two spaces and writes it to
// out as it is parsed. Member order, duplicate members and the spelling of
// numbers are kept. Throws UnpackException (JsonFormat) on malformed input.
void reformat_json(std::istream& in, std::ostream& out);

std::string format_json(const std::string& text);

// Re-indents the stream into target, followed by a newline.
void write_pretty_json(EntryStream& in, const std::filesystem::path& target);
