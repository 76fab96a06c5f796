#include "Diagnostics.hpp"

#include <algorithm>

namespace pipeline
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    if (bytes == 0)
        bytes = 1;
    max_preview_.store(bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t cut = utf8Boundary(text, MaxPreview());
    std::string out;
    out.reserve(cut + 24);

    for (char ch : text.substr(0, cut))
    {
        switch (ch)
        {
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out.push_back(ch);
            break;
        }
    }

    if (cut < text.size())
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }

    sanitize(out);
    return out;
}

// Largest prefix length <= limit that does not split a UTF-8 sequence.
std::size_t Diagnostics::utf8Boundary(std::string_view text, std::size_t limit) noexcept
{
    if (text.size() <= limit)
        return text.size();

    std::size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80)
        --cut;
    return cut;
}

void Diagnostics::sanitize(std::string& text)
{
    auto is_control = [](unsigned char c)
    {
        return (c < 0x20 && c != '\n' && c != '\r' && c != '\t') || c == 0x7F;
    };
    std::replace_if(text.begin(), text.end(), is_control, '?');
}

} // namespace pipeline
