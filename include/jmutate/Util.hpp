/**
 * @file Util.hpp
 * @brief String, file and environment helpers
 */

#ifndef JMUTATE_UTIL_HPP
#define JMUTATE_UTIL_HPP

#include <optional>
#include <string>

namespace jmutate {

// ASCII case mapping; bytes >= 0x80 are left untouched so UTF-8 survives.
std::string to_lower(std::string s);
std::string to_upper(std::string s);

// Strip leading/trailing whitespace (space, tab, CR, LF, FF, VT).
std::string trim(const std::string& s);

// Lowercased extension including the dot (".json"), or "" if none.
std::string file_extension(const std::string& path);

// Read a whole file. Throws FileNotFoundError if it cannot be opened.
std::string read_text_file(const std::string& path);

// Environment lookup; nullopt when the variable is unset.
std::optional<std::string> get_env_var(const std::string& name);

} // namespace jmutate

#endif // JMUTATE_UTIL_HPP
