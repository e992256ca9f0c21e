#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "protocol.h"

// -----------------------------------------------------------------------
// Colour argument of set_color
// -----------------------------------------------------------------------

// One of the 16 palette names, or "white"
struct NamedColor {
    std::string name;
};

// Raw hue byte 0-255 for the 0x40 command. Other values raise UnknownColor.
struct IndexedColor {
    int value;
};

struct RgbColor {
    uint8_t r;
    uint8_t g;
    uint8_t b;
};

using Color = std::variant<NamedColor, IndexedColor, RgbColor>;

// Parse a colour argument:
//   "red", "white"   -> NamedColor (case-insensitive, '-' accepted for '_')
//   "156"            -> IndexedColor
//   "#ff0000"        -> RgbColor
//   "255,0,0"        -> RgbColor
// Throws UnknownColor if the text matches none of these forms.
Color parse_color(const std::string& text);

// -----------------------------------------------------------------------
// Operations
// -----------------------------------------------------------------------

enum class Command : uint8_t {
    On,
    Off,
    White,
    SetColor,
    SetBrightness,
    Disco,
    DiscoFaster,
    DiscoSlower,
    Nightmode,
    BrightnessUp,
    BrightnessDown,
    Warmer,
    Cooler,
};

// Integer percent, or a float (fraction of 100 if <= 1.0)
using Brightness = std::variant<int, double>;

// One controller call with its arguments. Used by the pool, the batch
// runner and the command line.
struct Operation {
    Command    command    = Command::On;
    int        group      = ALL_GROUPS;
    Color      color      = IndexedColor{0};  // SetColor only
    Brightness brightness = 0;                // SetBrightness only
};

Operation make_operation(Command command, int group = ALL_GROUPS);
Operation make_color_operation(const Color& color, int group = ALL_GROUPS);
Operation make_brightness_operation(const Brightness& brightness, int group = ALL_GROUPS);

// "on", "disco-faster", "disco_faster", "color", "set_color", ...
// Throws UnknownCommand if the name is not recognized.
Command parse_command_name(const std::string& name);

// Canonical name ("disco_faster")
const char* command_name(Command command);

// True for commands that take one argument (color, brightness).
bool command_takes_argument(Command command);

// Parse a word list such as {"color", "red", "brightness", "50", "off"} into
// operations targeting `group`.
// Throws UnknownCommand / UnknownColor / std::invalid_argument on bad input.
std::vector<Operation> parse_operations(const std::vector<std::string>& words,
                                        int group = ALL_GROUPS);

// Parse a brightness argument: "50" -> int, "0.5" / "50.0" -> double.
// Throws std::invalid_argument if the text is not a number.
Brightness parse_brightness(const std::string& text);
