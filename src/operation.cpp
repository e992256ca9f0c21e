#include "operation.h"

#include <cctype>
#include <map>
#include <regex>
#include <stdexcept>

#include "data.h"
#include "errors.h"

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// Command line spellings use '-', table names use '_'.
static std::string normalize_name(const std::string& s) {
    std::string out = to_lower(s);
    for (auto& c : out)
        if (c == '-') c = '_';
    return out;
}

static uint8_t parse_channel(const std::string& s, int base, const std::string& whole) {
    int v = 0;
    try {
        v = std::stoi(s, nullptr, base);
    } catch (const std::exception&) {
        throw UnknownColor("Invalid colour '" + whole + "'");
    }
    if (v < 0 || v > 255)
        throw UnknownColor("Colour channel out of range (0-255) in '" + whole + "'");
    return static_cast<uint8_t>(v);
}

// -----------------------------------------------------------------------
// Colours
// -----------------------------------------------------------------------

Color parse_color(const std::string& text) {
    static const std::regex re_index(R"(^\s*(\d+)\s*$)");
    static const std::regex re_hex(R"(^\s*#([0-9a-fA-F]{2})([0-9a-fA-F]{2})([0-9a-fA-F]{2})\s*$)");
    static const std::regex re_triple(R"(^\s*(\d+)\s*,\s*(\d+)\s*,\s*(\d+)\s*$)");

    std::smatch m;
    if (std::regex_match(text, m, re_index)) {
        try {
            return IndexedColor{std::stoi(m[1].str())};
        } catch (const std::out_of_range&) {
            throw UnknownColor("Colour index out of range (0-255): " + text);
        }
    }
    if (std::regex_match(text, m, re_hex))
        return RgbColor{parse_channel(m[1].str(), 16, text),
                        parse_channel(m[2].str(), 16, text),
                        parse_channel(m[3].str(), 16, text)};
    if (std::regex_match(text, m, re_triple))
        return RgbColor{parse_channel(m[1].str(), 10, text),
                        parse_channel(m[2].str(), 10, text),
                        parse_channel(m[3].str(), 10, text)};

    std::string name = normalize_name(text);
    uint8_t hue;
    if (name == "white" || lookup_palette_color(name, hue))
        return NamedColor{name};
    throw UnknownColor("Unknown colour '" + text + "'");
}

// -----------------------------------------------------------------------
// Operations
// -----------------------------------------------------------------------

static const std::map<std::string, Command> command_names = {
    {"on",              Command::On},
    {"off",             Command::Off},
    {"white",           Command::White},
    {"color",           Command::SetColor},
    {"colour",          Command::SetColor},
    {"set_color",       Command::SetColor},
    {"brightness",      Command::SetBrightness},
    {"set_brightness",  Command::SetBrightness},
    {"disco",           Command::Disco},
    {"disco_faster",    Command::DiscoFaster},
    {"disco_slower",    Command::DiscoSlower},
    {"nightmode",       Command::Nightmode},
    {"brightness_up",   Command::BrightnessUp},
    {"brightness_down", Command::BrightnessDown},
    {"warmer",          Command::Warmer},
    {"cooler",          Command::Cooler},
};

Operation make_operation(Command command, int group) {
    Operation op;
    op.command = command;
    op.group   = group;
    return op;
}

Operation make_color_operation(const Color& color, int group) {
    Operation op = make_operation(Command::SetColor, group);
    op.color = color;
    return op;
}

Operation make_brightness_operation(const Brightness& brightness, int group) {
    Operation op = make_operation(Command::SetBrightness, group);
    op.brightness = brightness;
    return op;
}

Command parse_command_name(const std::string& name) {
    auto it = command_names.find(normalize_name(name));
    if (it == command_names.end())
        throw UnknownCommand("Unknown command '" + name + "'");
    return it->second;
}

const char* command_name(Command command) {
    switch (command) {
        case Command::On:             return "on";
        case Command::Off:            return "off";
        case Command::White:          return "white";
        case Command::SetColor:       return "set_color";
        case Command::SetBrightness:  return "set_brightness";
        case Command::Disco:          return "disco";
        case Command::DiscoFaster:    return "disco_faster";
        case Command::DiscoSlower:    return "disco_slower";
        case Command::Nightmode:      return "nightmode";
        case Command::BrightnessUp:   return "brightness_up";
        case Command::BrightnessDown: return "brightness_down";
        case Command::Warmer:         return "warmer";
        case Command::Cooler:         return "cooler";
    }
    return "unknown";
}

bool command_takes_argument(Command command) {
    return command == Command::SetColor || command == Command::SetBrightness;
}

Brightness parse_brightness(const std::string& text) {
    static const std::regex re_int(R"(^\s*-?\d+\s*$)");
    static const std::regex re_float(R"(^\s*-?(\d+\.\d*|\.\d+)\s*$)");

    try {
        if (std::regex_match(text, re_int)) {
            // Clamp before narrowing to int.
            long long v = std::stoll(text);
            if (v > 100) v = 100;
            if (v < 0) v = 0;
            return static_cast<int>(v);
        }
        if (std::regex_match(text, re_float))
            return std::stod(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Brightness value out of range: '" + text + "'");
    }
    throw std::invalid_argument("Invalid brightness '" + text + "'");
}

std::vector<Operation> parse_operations(const std::vector<std::string>& words, int group) {
    std::vector<Operation> ops;

    for (size_t i = 0; i < words.size(); ++i) {
        Command cmd = parse_command_name(words[i]);
        if (!command_takes_argument(cmd)) {
            ops.push_back(make_operation(cmd, group));
            continue;
        }

        if (i + 1 >= words.size())
            throw std::invalid_argument(
                std::string("Command '") + command_name(cmd) + "' expects an argument");
        const std::string& arg = words[++i];

        if (cmd == Command::SetColor)
            ops.push_back(make_color_operation(parse_color(arg), group));
        else
            ops.push_back(make_brightness_operation(parse_brightness(arg), group));
    }
    return ops;
}
