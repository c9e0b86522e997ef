/**
 * @file Cli.cpp
 * @brief Command dispatch for the jmutate tool
 */

#include "jmutate/Cli.hpp"
#include "jmutate/Errors.hpp"
#include "jmutate/PathExpr.hpp"
#include "jmutate/RuleStore.hpp"
#include "jmutate/Transformer.hpp"
#include "jmutate/Util.hpp"

#include <cxxopts.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace jmutate {

namespace {

constexpr const char* kRulesEnv = "JMUTATE_RULES";
constexpr const char* kIndentEnv = "JMUTATE_INDENT";

Value read_document(const std::optional<std::string>& path, std::istream& in) {
    std::string text;
    std::string source = "<stdin>";
    if (path && *path != "-") {
        text = read_text_file(*path);
        source = *path;
    } else {
        std::ostringstream ss;
        ss << in.rdbuf();
        text = ss.str();
    }
    try {
        return Value::parse(text);
    } catch (const Value::parse_error& e) {
        throw MutateError("Invalid JSON document in '" + source + "': " + e.what());
    }
}

void write_document(const Value& doc, const std::optional<std::string>& path,
                    int indent, std::ostream& out) {
    std::string text = doc.dump(indent);
    if (path && *path != "-") {
        std::ofstream ofs(*path);
        if (!ofs) throw MutateError("Failed to open for write: " + *path);
        ofs << text << "\n";
        return;
    }
    out << text << "\n";
}

std::optional<std::string> flag(const cxxopts::ParseResult& result, const std::string& name) {
    if (!result.count(name)) return std::nullopt;
    return result[name].as<std::string>();
}

} // anonymous namespace

std::optional<std::string> resolve_setting(const std::optional<std::string>& flag,
                                           const std::string& env_name) {
    if (flag) return flag;
    return get_env_var(env_name);
}

int parse_indent(const std::string& text) {
    std::size_t pos = 0;
    int indent = 0;
    try {
        indent = std::stoi(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("indent must be an integer, got '" + text + "'");
    }
    if (pos != text.size() || indent < -1) {
        throw std::invalid_argument("indent must be an integer >= -1, got '" + text + "'");
    }
    return indent;
}

int run_cli(int argc, const char* const* argv,
            std::istream& in, std::ostream& out, std::ostream& err) {
    try {
        cxxopts::Options options("jmutate", "Apply declarative mutation rules to JSON documents");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("r,rules", "Rule file (.json or .toml); env JMUTATE_RULES", cxxopts::value<std::string>())
            ("i,input", "Input JSON document (default: stdin)", cxxopts::value<std::string>())
            ("o,output", "Output file (default: stdout)", cxxopts::value<std::string>())
            ("indent", "Output indent, -1 for compact; env JMUTATE_INDENT", cxxopts::value<std::string>())
            ("v,verbose", "Report loaded rules on stderr")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            out << options.help() << "\n";
            out << "Commands: apply | validate | resolve PATH\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];
        const bool verbose = result.count("verbose") > 0;

        // RESOLVE works on the document alone
        if (cmd == "resolve") {
            if (cmdv.size() < 2) {
                err << "Error: insufficient arguments for command 'resolve'\n";
                return 1;
            }
            PathExpr path = PathExpr::compile(cmdv[1]);
            Value doc = read_document(flag(result, "input"), in);
            for (const auto& slot : path.resolve(doc)) {
                out << slot.pointer() << "\n";
            }
            return 0;
        }

        if (cmd != "apply" && cmd != "validate") {
            err << "Unknown command: " << cmd << "\n";
            return 1;
        }

        auto rules_path = resolve_setting(flag(result, "rules"), kRulesEnv);
        if (!rules_path) {
            err << "Error: a rule file is required (--rules or " << kRulesEnv << ")\n";
            return 1;
        }

        RuleStore store;
        store.load_file(*rules_path);
        RuleSetPtr rules = store.snapshot();
        if (verbose) {
            err << "Loaded " << rules->size() << " rules from " << *rules_path
                << " (version " << store.version() << ")\n";
        }

        // VALIDATE
        if (cmd == "validate") {
            out << "OK: " << rules->size() << " rules\n";
            return 0;
        }

        // APPLY
        int indent = 2;
        if (auto text = resolve_setting(flag(result, "indent"), kIndentEnv)) {
            indent = parse_indent(*text);
        }
        Value doc = read_document(flag(result, "input"), in);
        transform(doc, rules);
        write_document(doc, flag(result, "output"), indent, out);
        return 0;

    } catch (const RuleValidationError& e) {
        err << "Invalid rules: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace jmutate
