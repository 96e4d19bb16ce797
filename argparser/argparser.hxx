#pragma once

/**
 * @file argparser.hxx
 * @brief CLI argument parser with optional TOML config file, used by the benchmark drivers
 * @version 2.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 *
 * TOML config support
 * -------------------
 * Pass --config <path/to/file.toml> on the CLI to load parameters from a TOML file
 *
 * Precedence (lowest → highest):
 *   1. Defaults registered with .default_val()
 *   2. Values from the TOML config file
 *   3. Values from the CLI
 *
 * Only flat `key = value` lines are read; an optional [table] header is
 * skipped. Inline comments after a value are allowed:
 *
 *   [run]
 *   filter       = "vector"
 *   min_duration = 0.5       # seconds
 *   min_runs     = 16
 *   verbose      = true
 *
 * Supported value literals
 *   int    : decimal integer, optionally signed
 *   double : decimal number, e.g. 0.25
 *   bool   : true / false
 *   string : double- or single-quoted string
 *   path   : quoted string for an arg whose type is fs::path
 */

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <variant>
#include <vector>

namespace rangebench::cli {

namespace fs = std::filesystem;

using Value = std::variant<int, double, bool, std::string, fs::path>;

struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// ── Argument descriptor ────────────────────────────────────────────────────

struct Arg {
    std::string name;    // long name, e.g. "min_runs"
    char shortName = 0;  // short name, e.g. 'r'  (0 = none)
    std::string help;
    bool required = false;

    std::type_index type{typeid(void)};

    std::optional<Value> defaultValue;
    std::optional<Value> minValue;  // inclusive, numeric args only
    std::optional<Value> maxValue;  // inclusive, numeric args only
    std::vector<Value> choices;

    auto shorthand(char short_name) -> Arg& {
        if (short_name == 0 || short_name == '-') {
            throw ParseError("invalid short name for --" + name);
        }
        shortName = short_name;
        return *this;
    }

    auto description(std::string_view description) -> Arg& {
        help = description;
        return *this;
    }

    auto require() -> Arg& {
        required = true;
        return *this;
    }

    template <typename T>
    auto default_val(T value) -> Arg& {
        defaultValue = normalize_and_store(value);
        return *this;
    }

    template <typename T>
    auto min(T value) -> Arg& {
        minValue = normalize_and_store(value);
        return *this;
    }

    template <typename T>
    auto max(T value) -> Arg& {
        maxValue = normalize_and_store(value);
        return *this;
    }

    template <typename T>
    auto allow(std::initializer_list<T> list) -> Arg& {
        for (auto v : list) {
            choices.emplace_back(normalize_and_store(v));
        }
        return *this;
    }

    template <typename T>
    auto normalize_and_store(T value) -> Value {
        if constexpr (std::is_same_v<T, bool>) {
            if (type != typeid(bool)) {
                throw ParseError("--" + name + ": type mismatch, expected bool");
            }
            return Value{value};
        } else if constexpr (std::is_same_v<T, fs::path>) {
            if (type != typeid(fs::path)) {
                throw ParseError("--" + name + ": type mismatch, expected path");
            }
            return Value{value};
        } else if constexpr (std::is_convertible_v<T, std::string>) {
            if (type != typeid(std::string)) {
                throw ParseError("--" + name + ": type mismatch, expected string");
            }
            return Value{std::string{value}};
        } else if constexpr (std::is_arithmetic_v<T>) {
            if (type == typeid(int)) {
                return Value{static_cast<int>(value)};
            }
            if (type == typeid(double)) {
                return Value{static_cast<double>(value)};
            }
            throw ParseError("--" + name + ": type mismatch, expected int or double");
        } else {
            throw ParseError("--" + name + ": unsupported type");
        }
    }
};

// ── Parser ─────────────────────────────────────────────────────────────────

class ArgParser {
   public:
    explicit ArgParser(std::string programName, std::string description = "")
        : programName_(std::move(programName)), description_(std::move(description)) {}

    template <typename T>
    auto add(std::string name) -> Arg& {
        if (find_arg(name) != nullptr) {
            throw ParseError("duplicate argument registration: --" + name);
        }
        args_.push_back(Arg{.name = std::move(name), .type = typeid(T)});
        return args_.back();
    }

    // ── parse ──────────────────────────────────────────────────────────
    //
    // Precedence: defaults < TOML config < CLI flags.
    // --config <file> is consumed before the CLI pass so it never reaches the
    // normal argument matching. --help stops parsing and sets help_requested().

    void parse(int argc, const char* const argv[]) {
        std::vector<std::string> tokens;
        for (int i = 1; i < argc; ++i) {
            tokens.emplace_back(argv[i]);
        }
        parse(tokens);
    }

    void parse(const std::vector<std::string>& tokens) {
        parsed_.clear();
        help_requested_ = false;

        for (auto& arg : args_) {
            if (arg.defaultValue) {
                parsed_[arg.name] = *arg.defaultValue;
            }
        }

        std::vector<std::string> remaining;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            if (tokens[i] == "--config" || tokens[i] == "-C") {
                if (i + 1 >= tokens.size()) {
                    throw ParseError("--config requires a file path");
                }
                load_toml(tokens[++i]);
            } else {
                remaining.push_back(tokens[i]);
            }
        }

        parse_cli_arguments(remaining);
        if (help_requested_) {
            return;
        }

        for (auto& arg : args_) {
            if (arg.required && !parsed_.contains(arg.name)) {
                throw ParseError("required argument missing: --" + arg.name);
            }
        }
    }

    // ── accessors ──────────────────────────────────────────────────────

    [[nodiscard]] auto help_requested() const -> bool { return help_requested_; }

    [[nodiscard]] auto has(const std::string& name) const -> bool { return parsed_.contains(name); }

    template <typename T>
    auto get(const std::string& name) const -> T {
        auto value_it = parsed_.find(name);
        if (value_it == parsed_.end()) {
            throw ParseError("argument not found: " + name);
        }

        const Arg* arg = nullptr;
        for (const auto& a : args_) {
            if (a.name == name) {
                arg = &a;
                break;
            }
        }
        if (arg == nullptr) {
            throw ParseError("internal error: argument '" + name + "' not registered");
        }
        if (arg->type != typeid(T)) {
            throw ParseError("type mismatch for --" + name + " (expected " + type_to_string(arg->type) + ", requested by get() " +
                             type_to_string(typeid(T)) + ")");
        }
        return std::get<T>(value_it->second);
    }

    // ── help ───────────────────────────────────────────────────────────

    void print_help(std::ostream& out = std::cerr) const {
        constexpr std::size_t HELP_COLUMN_WIDTH = 26;
        out << "Usage: " << programName_ << " [options]\n";
        if (!description_.empty()) {
            out << description_ << "\n";
        }
        out << "\nOptions:\n";
        out << "  -h, --help                Show this help message\n";
        out << "  -C, --config <file>       Load parameters from a TOML config file\n";

        for (const auto& arg : args_) {
            std::string left = "  --" + arg.name;
            if (arg.shortName != 0) {
                left += std::string(", -") + arg.shortName;
            }
            left += " <" + type_to_string(arg.type) + ">";

            if (left.size() < HELP_COLUMN_WIDTH) {
                left.resize(HELP_COLUMN_WIDTH, ' ');
            } else {
                left += ' ';
            }
            out << left << arg.help;

            if (arg.defaultValue) {
                out << " [default: " << value_to_string(*arg.defaultValue) << "]";
            }
            if (arg.minValue && arg.maxValue) {
                out << " [range: " << value_to_string(*arg.minValue) << ".." << value_to_string(*arg.maxValue) << "]";
            } else if (arg.minValue) {
                out << " [min: " << value_to_string(*arg.minValue) << "]";
            }
            if (!arg.choices.empty()) {
                out << " [choices: ";
                for (std::size_t i = 0; i < arg.choices.size(); ++i) {
                    if (i != 0U) {
                        out << '|';
                    }
                    out << value_to_string(arg.choices[i]);
                }
                out << ']';
            }
            if (arg.required) {
                out << " (required)";
            }
            out << '\n';
        }
    }

   private:
    void parse_cli_arguments(const std::vector<std::string>& remaining) {
        std::set<std::string> seenCli;
        for (std::size_t i = 0; i < remaining.size(); ++i) {
            const auto& tok = remaining[i];

            if (tok == "--help" || tok == "-h") {
                help_requested_ = true;
                return;
            }

            std::string key;
            if (tok.starts_with("--")) {
                key = tok.substr(2);
            } else if (tok.starts_with("-") && tok.size() == 2) {
                key = expand_short(tok[1]);
            } else {
                throw ParseError("unexpected token: " + tok);
            }

            Arg* arg = find_arg(key);
            if (arg == nullptr) {
                throw ParseError("unknown argument: --" + key);
            }
            if (!seenCli.insert(key).second) {
                throw ParseError("duplicate CLI argument: --" + key);
            }

            process_cli_value(*arg, key, remaining, i);
            validate(*arg, parsed_[key]);
        }
    }

    void process_cli_value(const Arg& arg, const std::string& key, const std::vector<std::string>& remaining, std::size_t& index) {
        // bool flags may be used without a value
        if (arg.type == typeid(bool)) {
            if (index + 1 < remaining.size() && !remaining[index + 1].starts_with("-")) {
                parsed_[key] = parse_bool(remaining[++index]);
            } else {
                parsed_[key] = true;
            }
        } else {
            if (index + 1 >= remaining.size()) {
                throw ParseError("--" + key + " requires a value");
            }
            parsed_[key] = parse_value(arg, remaining[++index]);
        }
    }

    // ── TOML loader ────────────────────────────────────────────────────

    void load_toml(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            throw ParseError("cannot open config file: " + path);
        }

        std::set<std::string> seenToml;
        std::string line;
        std::size_t line_num = 0;
        while (std::getline(file, line)) {
            ++line_num;
            auto stripped = strip_comment(trim(line));
            if (stripped.empty() || stripped[0] == '#' || stripped[0] == '[') {
                continue;
            }

            auto equal = stripped.find('=');
            if (equal == std::string::npos) {
                throw ParseError(path + ":" + std::to_string(line_num) + ": expected key = value, got: " + stripped);
            }

            std::string key = trim(stripped.substr(0, equal));
            std::string rawVal = trim(stripped.substr(equal + 1));

            Arg* arg = find_arg(key);
            if (arg == nullptr) {
                throw ParseError(path + ":" + std::to_string(line_num) + ": unknown key: " + key);
            }
            if (!seenToml.insert(key).second) {
                throw ParseError(path + ":" + std::to_string(line_num) + ": duplicate key: " + key);
            }

            Value toml_value = parse_value(*arg, rawVal);
            validate(*arg, toml_value);
            parsed_[key] = toml_value;
        }
    }

    // ── string utilities ───────────────────────────────────────────────

    static auto trim(const std::string& str) -> std::string {
        auto begin = str.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return {};
        }
        auto end = str.find_last_not_of(" \t\r\n");
        return str.substr(begin, end - begin + 1);
    }

    // Remove everything after the first '#' that is outside a quoted string.
    static auto strip_comment(const std::string& text) -> std::string {
        bool inDouble = false;
        bool inSingle = false;
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '"' && !inSingle) {
                inDouble = !inDouble;
            }
            if (text[i] == '\'' && !inDouble) {
                inSingle = !inSingle;
            }
            if (text[i] == '#' && !inDouble && !inSingle) {
                return trim(text.substr(0, i));
            }
        }
        return text;
    }

    auto find_arg(const std::string& key) -> Arg* {
        for (auto& arg : args_) {
            if (arg.name == key) {
                return &arg;
            }
        }
        return nullptr;
    }

    auto expand_short(char short_name) -> std::string {
        for (auto& arg : args_) {
            if (arg.shortName == short_name) {
                return arg.name;
            }
        }
        throw ParseError(std::string("unknown short option: -") + short_name);
    }

    static auto parse_bool(const std::string& str) -> bool {
        if (str == "true" || str == "1" || str == "yes") {
            return true;
        }
        if (str == "false" || str == "0" || str == "no") {
            return false;
        }
        throw ParseError("invalid bool value: " + str);
    }

    // std::stoi / std::stod accept trailing garbage; reject it here.
    template <typename N, typename Conv>
    static auto parse_number(const std::string& raw, Conv conv) -> N {
        std::size_t consumed = 0;
        N value = conv(raw, &consumed);
        if (consumed != raw.size()) {
            throw ParseError("trailing characters in number: " + raw);
        }
        return value;
    }

    static auto parse_value(const Arg& arg, const std::string& raw) -> Value {
        std::string clean = raw;
        if (clean.size() >= 2) {
            if ((clean.front() == '"' && clean.back() == '"') || (clean.front() == '\'' && clean.back() == '\'')) {
                clean = clean.substr(1, clean.size() - 2);
            }
        }

        try {
            if (arg.type == typeid(int)) {
                return Value{parse_number<int>(clean, [](const std::string& s, std::size_t* pos) { return std::stoi(s, pos); })};
            }
            if (arg.type == typeid(double)) {
                return Value{parse_number<double>(clean, [](const std::string& s, std::size_t* pos) { return std::stod(s, pos); })};
            }
            if (arg.type == typeid(bool)) {
                return Value{parse_bool(clean)};
            }
            if (arg.type == typeid(std::string)) {
                return Value{clean};
            }
            if (arg.type == typeid(fs::path)) {
                return Value{fs::path{clean}};
            }
        } catch (const std::exception& e) {
            throw ParseError("invalid value for --" + arg.name + ": " + e.what());
        }
        throw ParseError("--" + arg.name + ": unknown type index");
    }

    template <typename N>
    static void check_bounds(const Arg& arg, N value) {
        if (arg.minValue && value < std::get<N>(*arg.minValue)) {
            throw ParseError("--" + arg.name + ": value " + value_to_string(Value{value}) + " below minimum " + value_to_string(*arg.minValue));
        }
        if (arg.maxValue && value > std::get<N>(*arg.maxValue)) {
            throw ParseError("--" + arg.name + ": value " + value_to_string(Value{value}) + " above maximum " + value_to_string(*arg.maxValue));
        }
    }

    static void validate(const Arg& arg, const Value& val) {
        if (!arg.choices.empty()) {
            if (std::find(arg.choices.begin(), arg.choices.end(), val) == arg.choices.end()) {
                throw ParseError("--" + arg.name + ": value " + value_to_string(val) + " not in allowed choices");
            }
        }
        if (std::holds_alternative<int>(val)) {
            check_bounds(arg, std::get<int>(val));
        }
        if (std::holds_alternative<double>(val)) {
            check_bounds(arg, std::get<double>(val));
        }
    }

    static auto value_to_string(const Value& value) -> std::string {
        return std::visit(
            [](auto&& val) -> std::string {
                using T = std::decay_t<decltype(val)>;
                if constexpr (std::is_same_v<T, bool>) {
                    return val ? "true" : "false";
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return val;
                } else if constexpr (std::is_same_v<T, fs::path>) {
                    return val.string();
                } else {
                    std::ostringstream oss;
                    oss << val;
                    return oss.str();
                }
            },
            value);
    }

    static auto type_to_string(std::type_index type) -> std::string {
        if (type == typeid(int)) {
            return "int";
        }
        if (type == typeid(double)) {
            return "double";
        }
        if (type == typeid(bool)) {
            return "bool";
        }
        if (type == typeid(std::string)) {
            return "string";
        }
        if (type == typeid(fs::path)) {
            return "path";
        }
        return "unknown";
    }

    std::string programName_;
    std::string description_;
    std::vector<Arg> args_;
    std::map<std::string, Value> parsed_;
    bool help_requested_ = false;
};

/** Parses argv, printing the error and the usage text to stderr on failure. */
inline auto argparser_parse(ArgParser& parser, int argc, const char* const argv[]) -> bool {
    try {
        parser.parse(argc, argv);
        return true;
    } catch (const ParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        parser.print_help();
        return false;
    }
}

}  // namespace rangebench::cli
