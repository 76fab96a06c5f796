#include "TextUtils.hpp"
#include <utf8proc.h>

#include <algorithm>
#include <cctype>

namespace pipeline
{

namespace
{
constexpr utf8proc_int32_t kReplacementChar = 0xFFFD;
constexpr const char* kDefaultFileName = "upload.pdf";
} // namespace

std::string trim_whitespace(std::string_view text)
{
    std::size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])))
        ++start;
    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    return std::string(text.substr(start, end - start));
}

std::string sanitize_utf8(const std::string& text)
{
    if (text.empty())
        return text;

    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());

    std::string result;
    result.reserve(text.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint = 0;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            // Skip one byte of the broken sequence and emit a replacement
            utf8proc_uint8_t buffer[4];
            utf8proc_ssize_t written = utf8proc_encode_char(kReplacementChar, buffer);
            result.append(reinterpret_cast<const char*>(buffer), static_cast<std::size_t>(written));
            ++pos;
            continue;
        }
        result.append(text, static_cast<std::size_t>(pos), static_cast<std::size_t>(bytes));
        pos += bytes;
    }
    return result;
}

bool is_valid_utf8(const std::string& text)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data());
    const auto len = static_cast<utf8proc_ssize_t>(text.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint = 0;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
            return false;
        pos += bytes;
    }
    return true;
}

std::string sanitize_file_name(std::string_view name, std::size_t max_length)
{
    // Keep only the final component of either separator style
    auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos)
        name = name.substr(slash + 1);

    std::string out;
    out.reserve(std::min(name.size(), max_length));
    for (char ch : name)
    {
        if (out.size() >= max_length)
            break;
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-')
            out.push_back(ch);
        else
            out.push_back('_');
    }

    // Never produce "", "." or ".." as a path component
    if (out.empty() || out.find_first_not_of('.') == std::string::npos)
        return kDefaultFileName;
    return out;
}

} // namespace pipeline
