#pragma once

#include <string>

namespace auditray {

/**
 * Name of an icon theme directory.
 *
 * The name is later joined into a filesystem path, so it can only be obtained
 * through parse() (lowercase ASCII letters only, non-empty) or defaultTheme().
 * Once constructed, the value is safe to use as a single path segment.
 */
class IconTheme
{
public:
    // Throws ValidationError naming the rejected input.
    static IconTheme parse(const std::string &raw);
    static IconTheme defaultTheme();

    const std::string &name() const { return m_name; }

    bool operator==(const IconTheme &other) const { return m_name == other.m_name; }
    bool operator!=(const IconTheme &other) const { return !(*this == other); }

private:
    explicit IconTheme(std::string name);

    std::string m_name;
};

} // namespace auditray
