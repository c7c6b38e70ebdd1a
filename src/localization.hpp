#pragma once

#include <format>
#include <string>

// Picks the message catalog from LANG (zh* -> zh, otherwise en) and loads it
// from <exe dir>/../l10n, falling back to the build tree's l10n directory.
void init_localization();

// Catalog lookup; an unknown key comes back as "[MISSING_STRING: key]" so a
// gap in a translation shows up in the output instead of an empty line.
const std::string& get_string(const std::string& key);

// Fills the {} placeholders of a catalog message. A translation whose
// placeholders don't match the arguments must not take the install down, so
// the raw template is returned with the key appended.
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    const std::string& pattern = get_string(key);
    try {
        return std::vformat(pattern, std::make_format_args(args...));
    } catch (const std::format_error&) {
        return pattern + " [" + key + "]";
    }
}
