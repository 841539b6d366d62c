/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser
 */

#pragma once

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace hydromesh {

/**
 * @brief Long/short option parser with flags and sectioned help
 *
 * Values are given as `--name value`, `--name=value` or `-n value`. Help
 * lists options in registration order under the most recent section.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        std::string section;
        bool has_value = true;
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    // Options registered after this call are listed under title in help
    void begin_section(const std::string& title) {
        section_ = title;
    }

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description) {
        register_option(Option{long_name, short_name, description, section_, true});
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option{long_name, short_name, description, section_, false});
    }

    void add_example(const std::string& example) {
        examples_.push_back(example);
    }

    /**
     * @brief Parse argv; false on --help or on any malformed argument
     */
    bool parse(int argc, char* argv[]) {
        parsed_values_.clear();
        help_requested_ = false;

        std::vector<std::string> args(argv + 1, argv + argc);
        if (std::find_if(args.begin(), args.end(),
                         [](const std::string& a) { return a == "--help" || a == "-h"; }) != args.end()) {
            help_requested_ = true;
            show_help();
            return false;
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            std::string name;
            std::optional<std::string> inline_value;

            if (arg.starts_with("--")) {
                name = arg.substr(2);
                size_t eq_pos = name.find('=');
                if (eq_pos != std::string::npos) {
                    inline_value = name.substr(eq_pos + 1);
                    name = name.substr(0, eq_pos);
                }
            } else if (arg.starts_with("-") && arg.size() > 1) {
                auto it = short_to_long_.find(arg.substr(1));
                if (it == short_to_long_.end()) {
                    std::cerr << "Unknown option: " << arg << std::endl;
                    return false;
                }
                name = it->second;
            } else {
                std::cerr << "Unexpected argument: " << arg << std::endl;
                return false;
            }

            const Option* option = find(name);
            if (option == nullptr) {
                std::cerr << "Unknown option: --" << name << std::endl;
                return false;
            }

            if (!option->has_value) {
                if (inline_value) {
                    std::cerr << "Flag --" << name << " does not take a value" << std::endl;
                    return false;
                }
                parsed_values_[name] = "true";
                continue;
            }

            if (inline_value && !inline_value->empty()) {
                parsed_values_[name] = *inline_value;
            } else if (!inline_value && i + 1 < args.size() && !args[i + 1].starts_with("-")) {
                parsed_values_[name] = args[++i];
            } else {
                std::cerr << "Option --" << name << " requires a value" << std::endl;
                return false;
            }
        }
        return true;
    }

    bool help_requested() const { return help_requested_; }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    /**
     * @brief Value converted to T; nullopt when absent or not wholly a T
     *
     * Unsigned types reject a leading minus sign instead of wrapping.
     */
    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }
        if constexpr (std::is_unsigned_v<T>) {
            if (value->find('-') != std::string::npos) {
                return std::nullopt;
            }
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && (iss >> std::ws).eof()) {
            return result;
        }
        return std::nullopt;
    }

    void show_help() const {
        std::cout << description_ << "\n";
        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS]\n";

        std::string current;
        for (const auto& option : options_) {
            if (option.section != current || &option == &options_.front()) {
                current = option.section;
                std::cout << "\n" << (current.empty() ? std::string("OPTIONS") : current) << ":\n";
            }
            std::string usage = "--" + option.long_name;
            if (!option.short_name.empty()) {
                usage = "-" + option.short_name + ", " + usage;
            }
            if (option.has_value) {
                usage += " VALUE";
            }
            std::cout << "    " << std::left << std::setw(32) << usage << option.description << "\n";
        }

        if (!examples_.empty()) {
            std::cout << "\nEXAMPLES:\n";
            for (const auto& example : examples_) {
                std::cout << "    " << program_name_ << " " << example << "\n";
            }
        }
    }

private:
    void register_option(Option option) {
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
        options_.push_back(std::move(option));
    }

    const Option* find(const std::string& long_name) const {
        auto it = std::find_if(options_.begin(), options_.end(),
                               [&](const Option& o) { return o.long_name == long_name; });
        return it == options_.end() ? nullptr : &*it;
    }

    std::string program_name_;
    std::string description_;
    std::string section_;
    std::vector<Option> options_;
    std::vector<std::string> examples_;
    std::map<std::string, std::string> short_to_long_;
    std::map<std::string, std::string> parsed_values_;
    bool help_requested_ = false;
};

} // namespace hydromesh
