/**
 * @file Cli.hpp
 * @brief Command-line front end
 *
 * Commands:
 * - apply           transform the input document with the rule file
 * - validate        load the rule file and report errors
 * - resolve PATH    list JSON Pointers of the slots PATH matches
 *
 * Settings come from flags first, then environment variables, then
 * built-in defaults:
 * - rule file: --rules, JMUTATE_RULES
 * - indent:    --indent, JMUTATE_INDENT, 2 (-1 prints compact JSON)
 */

#ifndef JMUTATE_CLI_HPP
#define JMUTATE_CLI_HPP

#include <iosfwd>
#include <optional>
#include <string>

namespace jmutate {

/**
 * @brief Pick a setting from a flag or an environment variable
 * @param flag Value given on the command line, if any
 * @param env_name Environment variable consulted when @p flag is unset
 */
std::optional<std::string> resolve_setting(const std::optional<std::string>& flag,
                                           const std::string& env_name);

/**
 * @brief Parse an indent setting
 * @throws std::invalid_argument unless the text is an integer >= -1
 */
int parse_indent(const std::string& text);

/**
 * @brief Run the CLI
 *
 * @param argc, argv Command line, argv[0] being the program name
 * @param in Stream read when no --input is given
 * @param out Stream for results
 * @param err Stream for diagnostics
 * @return Process exit code: 0 on success, 1 on any error
 */
int run_cli(int argc, const char* const* argv,
            std::istream& in, std::ostream& out, std::ostream& err);

} // namespace jmutate

#endif // JMUTATE_CLI_HPP
