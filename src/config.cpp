#include "config.h"

#include <cctype>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <string>

#include "errors.h"
#include "protocol.h"

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::string where(const std::string& origin, int lineno) {
    return " at " + origin + ":" + std::to_string(lineno);
}

static int parse_int(const std::string& key, const std::string& value,
                     const std::string& origin, int lineno) {
    static const std::regex re_int(R"(^[+-]?\d+$)");
    if (!std::regex_match(value, re_int))
        throw std::runtime_error(
            "Invalid " + key + " '" + value + "'" + where(origin, lineno));
    try {
        return std::stoi(value);
    } catch (const std::out_of_range&) {
        throw std::runtime_error(
            key + " value '" + value + "' is out of range" + where(origin, lineno));
    }
}

static double parse_seconds(const std::string& key, const std::string& value,
                            const std::string& origin, int lineno) {
    static const std::regex re_num(R"(^[+-]?(\d+\.?\d*|\.\d+)$)");
    if (!std::regex_match(value, re_num))
        throw std::runtime_error(
            "Invalid " + key + " '" + value + "'" + where(origin, lineno));
    return std::stod(value);
}

// -----------------------------------------------------------------------
// INI parser
// -----------------------------------------------------------------------

Config parse_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Cannot open config file: " + path);
    return parse_config(f, path);
}

Config parse_config(std::istream& in, const std::string& origin) {
    Config cfg;
    std::string section;
    int lineno = 0;

    std::regex re_section(R"(^\[([^\]]+)\]$)");
    std::regex re_kv(R"(^([^=]+)=(.*)$)");
    std::regex re_group(R"(^group_([1-4])$)");

    std::string line;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);

        // Skip blank lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';')
            continue;

        std::smatch m;

        // Section header
        if (std::regex_match(line, m, re_section)) {
            section = to_lower(trim(m[1].str()));
            if (section == "gateway")
                cfg.gateways.emplace_back();
            continue;
        }

        if (!std::regex_match(line, m, re_kv))
            throw std::runtime_error("Syntax error: '" + line + "'" + where(origin, lineno));

        // Unknown sections are silently ignored
        if (section != "gateway")
            continue;

        std::string key   = to_lower(trim(m[1].str()));
        std::string value = trim(m[2].str());
        ControllerConfig& gw = cfg.gateways.back();

        std::smatch gm;
        if (key == "host") {
            gw.host = value;
        } else if (key == "port") {
            gw.port = parse_int(key, value, origin, lineno);
        } else if (key == "repeat_commands") {
            gw.repeat_commands = parse_int(key, value, origin, lineno);
        } else if (key == "pause_between_commands") {
            gw.pause_between_commands = parse_seconds(key, value, origin, lineno);
        } else if (std::regex_match(key, gm, re_group)) {
            int slot = std::stoi(gm[1].str()) - 1;
            try {
                gw.groups[slot] = parse_bulb_type(value);
            } catch (const InvalidBulbType& e) {
                throw std::runtime_error(e.what() + where(origin, lineno));
            }
        }
        // Unknown keys are silently ignored
    }

    return cfg;
}

// -----------------------------------------------------------------------
// Validation
// -----------------------------------------------------------------------

void validate_config(const Config& cfg) {
    if (cfg.gateways.empty())
        throw std::runtime_error("Config defines no [gateway] section");

    for (size_t i = 0; i < cfg.gateways.size(); ++i) {
        try {
            normalize_controller_config(cfg.gateways[i]);
        } catch (const InvalidConfig& e) {
            throw InvalidConfig("gateway " + std::to_string(i + 1) + ": " + e.what());
        }
    }
}
