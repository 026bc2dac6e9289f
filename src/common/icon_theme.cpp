#include "common/icon_theme.hpp"

#include <algorithm>
#include <utility>

#include "common/errors.hpp"

namespace auditray {

namespace {

const char *const kDefaultThemeName = "default";

bool isLowerAsciiLetter(char c)
{
    return c >= 'a' && c <= 'z';
}

std::string quoted(const std::string &value)
{
    std::string out = "\"";
    for (const char c : value) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

IconTheme::IconTheme(std::string name)
    : m_name(std::move(name))
{
}

IconTheme IconTheme::parse(const std::string &raw)
{
    if (raw.empty()) {
        throw ValidationError("Theme name must not be empty");
    }
    if (!std::all_of(raw.begin(), raw.end(), isLowerAsciiLetter)) {
        throw ValidationError("Theme contains invalid characters: " + quoted(raw));
    }
    return IconTheme(raw);
}

IconTheme IconTheme::defaultTheme()
{
    return IconTheme(kDefaultThemeName);
}

} // namespace auditray
