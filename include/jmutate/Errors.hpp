/**
 * @file Errors.hpp
 * @brief Exception types for jmutate load-time errors
 *
 * Only loading a rule source can fail. Applying rules to a document
 * never throws for path misses, type mismatches or bad values; those
 * are no-op outcomes.
 *
 * - MutateError: Base class
 * - FileNotFoundError: Rule or document file not found
 * - RuleParseError: JSON/TOML syntax errors in a rule source
 * - RuleValidationError: Structurally invalid rule (missing field,
 *   unknown operator, bad parameter)
 * - PathSyntaxError: Malformed path expression
 */

#ifndef JMUTATE_ERRORS_HPP
#define JMUTATE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace jmutate {

/**
 * @brief Base class for all jmutate exceptions
 */
class MutateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief File not found
 */
class FileNotFoundError : public MutateError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : MutateError("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Rule source parse error (JSON/TOML syntax)
 */
class RuleParseError : public MutateError {
public:
    /**
     * @brief Construct with source name, position and error details
     * @param file Path (or "<string>") of the rule source
     * @param line 1-based line of the error, 0 if unknown
     * @param column 1-based column of the error, 0 if unknown
     * @param details Detailed error message from parser
     */
    RuleParseError(std::string file, int line, int column, std::string details)
        : MutateError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line);
            if (column > 0) msg += ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief Malformed path expression
 *
 * Raised while compiling a path; never while resolving one.
 */
class PathSyntaxError : public MutateError {
public:
    /**
     * @brief Construct with expression, offending offset and reason
     * @param path The full path expression
     * @param position 0-based character offset where parsing failed
     * @param details What was expected
     */
    PathSyntaxError(std::string path, std::size_t position, std::string details)
        : MutateError("Invalid path '" + path + "' at offset " +
                      std::to_string(position) + ": " + details)
        , path_(std::move(path))
        , position_(position)
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept { return path_; }
    std::size_t position() const noexcept { return position_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string path_;
    std::size_t position_;
    std::string details_;
};

/**
 * @brief Structurally invalid rule
 *
 * Carries enough context to point at the offending record: its position
 * in the rule list, its id when one was readable, and the field.
 */
class RuleValidationError : public MutateError {
public:
    /**
     * @brief Construct with rule position, id, field and reason
     * @param index 0-based position of the rule in the source
     * @param rule_id The rule's id, or empty if it had none
     * @param field Field name (e.g., "action.op", "condition.value")
     * @param details Human-readable reason
     */
    RuleValidationError(std::size_t index, std::string rule_id,
                        std::string field, std::string details)
        : MutateError(format_message(index, rule_id, field, details))
        , index_(index)
        , rule_id_(std::move(rule_id))
        , field_(std::move(field))
        , details_(std::move(details))
    {}

    std::size_t index() const noexcept { return index_; }
    const std::string& rule_id() const noexcept { return rule_id_; }
    const std::string& field() const noexcept { return field_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::size_t index_;
    std::string rule_id_;
    std::string field_;
    std::string details_;

    static std::string format_message(std::size_t index, const std::string& rule_id,
                                      const std::string& field, const std::string& details) {
        std::string msg = "Invalid rule #" + std::to_string(index);
        if (!rule_id.empty()) msg += " ('" + rule_id + "')";
        if (!field.empty()) msg += " field '" + field + "'";
        return msg + ": " + details;
    }
};

} // namespace jmutate

#endif // JMUTATE_ERRORS_HPP
