#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace pipeline
{

/// Strip leading and trailing ASCII whitespace
std::string trim_whitespace(std::string_view text);

/// Replace every invalid UTF-8 sequence with U+FFFD so the text can be serialised as JSON
std::string sanitize_utf8(const std::string& text);

/// True when the whole string decodes as UTF-8
bool is_valid_utf8(const std::string& text);

/// Reduce a client-supplied file name to a safe final path component
std::string sanitize_file_name(std::string_view name, std::size_t max_length = 96);

} // namespace pipeline
