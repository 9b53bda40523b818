#pragma once

#include <iostream>
#include <map>
#include <string>
#include <vector>

/*
Simple command line parser; works on Windows or Unix-based platforms.
Anything that isn't an option or an option's value is collected as a
positional argument, in order. A lone "--" ends option parsing.

Usage example:

    CommandLineParser parser;
    parser.addOption('c', "config", true);
    parser.addOption('h', "help", false);

    if (!parser.parse(argc, argv)) {
        return 1; // parsing error
    }
    for (const auto &input : parser.positional()) {
        std::cout << "input: " << input << "\n";
    }
*/

class CommandLineParser
{
  public:
    CommandLineParser() = default;

    void addOption(char shortOpt, const std::string &longOpt, bool requiresValue = true)
    {
        m_shortToLong[shortOpt] = longOpt;
        m_optionRequiresValue[longOpt] = requiresValue;
    }

    bool parse(int argc, char *argv[])
    {
        bool optionsDone = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (optionsDone || arg == "-" || arg.rfind("-", 0) != 0) {
                m_positional.push_back(arg);
            } else if (arg == "--") {
                optionsDone = true;
            } else if (arg.rfind("--", 0) == 0) {
                // Long option
                size_t eq = arg.find('=');
                std::string key = eq != std::string::npos ? arg.substr(2, eq - 2) : arg.substr(2);
                auto known = m_optionRequiresValue.find(key);
                if (known == m_optionRequiresValue.end()) {
                    std::cerr << "Unknown option: --" << key << "\n";
                    return false;
                }
                if (!known->second) {
                    m_flags[key] = true;
                } else if (eq != std::string::npos) {
                    m_options[key] = arg.substr(eq + 1);
                } else if ((i + 1) < argc && argv[i + 1][0] != '-') {
                    m_options[key] = argv[++i];
                } else {
                    std::cerr << "Missing value for option: --" << key << "\n";
                    return false;
                }
            } else if (arg.length() == 2) {
                // Short option
                char shortKey = arg[1];
                auto known = m_shortToLong.find(shortKey);
                if (known == m_shortToLong.end()) {
                    std::cerr << "Unknown option: -" << shortKey << "\n";
                    return false;
                }
                const std::string &key = known->second;
                if (!m_optionRequiresValue[key]) {
                    m_flags[key] = true;
                } else if ((i + 1) < argc && argv[i + 1][0] != '-') {
                    m_options[key] = argv[++i];
                } else {
                    std::cerr << "Missing value for option: -" << shortKey << "\n";
                    return false;
                }
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return false;
            }
        }

        return true;
    }

    bool hasFlag(const std::string &name) const { return m_flags.count(name) > 0; }

    bool hasOption(const std::string &name) const { return m_options.count(name) > 0; }

    std::string getOption(const std::string &name, const std::string &defaultValue = "") const
    {
        auto it = m_options.find(name);
        return it != m_options.end() ? it->second : defaultValue;
    }

    const std::vector<std::string> &positional() const { return m_positional; }

  private:
    std::map<char, std::string> m_shortToLong;
    std::map<std::string, bool> m_optionRequiresValue;
    std::map<std::string, std::string> m_options;
    std::map<std::string, bool> m_flags;
    std::vector<std::string> m_positional;
};
