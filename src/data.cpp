#include "data.h"

#include <array>
#include <iomanip>
#include <iostream>
#include <map>

#include "errors.h"

using GroupCommands = std::array<CommandSpec, 4>;

// -----------------------------------------------------------------------
// Colour palette
// Second byte of the 0x40 "set colour" command, in the order the colours
// appear on the vendor remote.
// -----------------------------------------------------------------------
static const struct { const char* name; uint8_t hue; } palette[] = {
    {"violet",        0x00},
    {"royal_blue",    0x10},
    {"baby_blue",     0x20},
    {"aqua",          0x30},
    {"royal_mint",    0x40},
    {"seafoam_green", 0x50},
    {"green",         0x60},
    {"lime_green",    0x70},
    {"yellow",        0x80},
    {"yellow_orange", 0x90},
    {"orange",        0xa0},
    {"red",           0xb0},
    {"pink",          0xc0},
    {"fusia",         0xd0},
    {"lilac",         0xe0},
    {"lavendar",      0xf0},
};

// -----------------------------------------------------------------------
// RGBW bulbs
// -----------------------------------------------------------------------
static std::map<std::string, CommandSpec> make_rgbw_commands() {
    std::map<std::string, CommandSpec> t = {
        {"all_on",        {0x42}},
        {"all_off",       {0x41}},
        {"all_white",     {0xc2}},
        {"all_nightmode", {0xc1}},
        {"disco",         {0x4d}},
        {"disco_faster",  {0x44}},
        {"disco_slower",  {0x43}},
        // Operand byte is appended by the caller.
        {"color_by_int",  {0x40}},
        {"brightness",    {0x4e}},
    };
    for (auto& c : palette)
        t[std::string("color_to_") + c.name] = {0x40, c.hue};
    return t;
}

static const std::map<std::string, CommandSpec> rgbw_commands = make_rgbw_commands();

static const std::map<std::string, GroupCommands> rgbw_group_commands = {
    {"on",        {{{0x45}, {0x47}, {0x49}, {0x4b}}}},
    {"off",       {{{0x46}, {0x48}, {0x4a}, {0x4c}}}},
    {"white",     {{{0xc5}, {0xc7}, {0xc9}, {0xcb}}}},
    {"nightmode", {{{0xc6}, {0xc8}, {0xca}, {0xcc}}}},
};

// -----------------------------------------------------------------------
// White (dual white / colour temperature) bulbs
// Brightness and colour temperature are relative steps; they act on the
// group that was most recently switched on.
// -----------------------------------------------------------------------
static const std::map<std::string, CommandSpec> white_commands = {
    {"all_on",          {0x35}},
    {"all_off",         {0x39}},
    {"all_white",       {0xb5}},  // full brightness
    {"all_nightmode",   {0xb9}},
    {"warmer",          {0x3e}},
    {"cooler",          {0x3f}},
    {"brightness_up",   {0x3c}},
    {"brightness_down", {0x34}},
};

static const std::map<std::string, GroupCommands> white_group_commands = {
    {"on",        {{{0x38}, {0x3d}, {0x37}, {0x32}}}},
    {"off",       {{{0x3b}, {0x33}, {0x3a}, {0x36}}}},
    {"white",     {{{0xb8}, {0xbd}, {0xb7}, {0xb2}}}},  // full brightness
    {"nightmode", {{{0xbb}, {0xb3}, {0xba}, {0xb6}}}},
};

// -----------------------------------------------------------------------
// Lookup
// -----------------------------------------------------------------------

static const std::map<std::string, CommandSpec>& flat_table(BulbType type) {
    return type == BulbType::White ? white_commands : rgbw_commands;
}

static const std::map<std::string, GroupCommands>& group_table(BulbType type) {
    return type == BulbType::White ? white_group_commands : rgbw_group_commands;
}

const CommandSpec& lookup_command(BulbType type, const std::string& name) {
    const auto& table = flat_table(type);
    auto it = table.find(name);
    if (it == table.end())
        throw UnknownCommand(
            "Unknown command '" + name + "' for " + bulb_type_name(type) + " bulbs");
    return it->second;
}

const CommandSpec& lookup_group_command(BulbType type, const std::string& name, int group) {
    const auto& table = group_table(type);
    auto it = table.find(name);
    if (it == table.end())
        throw UnknownCommand(
            "Unknown per-group command '" + name + "' for " + bulb_type_name(type) + " bulbs");
    if (group < 1 || group > 4)
        throw InvalidGroup("Group must be between 1 and 4 (was " + std::to_string(group) + ")");
    return it->second[group - 1];
}

bool has_command(BulbType type, const std::string& name) {
    return flat_table(type).count(name) != 0;
}

bool has_group_command(BulbType type, const std::string& name) {
    return group_table(type).count(name) != 0;
}

// -----------------------------------------------------------------------
// Palette
// -----------------------------------------------------------------------

bool lookup_palette_color(const std::string& name, uint8_t& hue_out) {
    for (auto& c : palette) {
        if (name == c.name) {
            hue_out = c.hue;
            return true;
        }
    }
    return false;
}

std::vector<std::string> palette_color_names() {
    std::vector<std::string> names;
    for (auto& c : palette)
        names.emplace_back(c.name);
    return names;
}

static void list_table(BulbType type) {
    std::cout << bulb_type_name(type) << " bulbs:\n";
    for (auto& [name, spec] : flat_table(type)) {
        if (name.rfind("color_to_", 0) == 0) continue;
        std::cout << "  " << std::left << std::setw(18) << name << std::right;
        hexdump_bytes(std::cout, spec.data(), spec.size());
        std::cout << "\n";
    }
    for (auto& [name, specs] : group_table(type)) {
        std::cout << "  " << std::left << std::setw(18) << (name + " (group)") << std::right;
        for (int g = 0; g < 4; ++g) {
            hexdump_bytes(std::cout, specs[g].data(), specs[g].size());
            std::cout << (g < 3 ? " / " : "\n");
        }
    }
}

void list_commands() {
    list_table(BulbType::Rgbw);
    std::cout << "\n";
    list_table(BulbType::White);

    std::cout << "\nNamed colours (rgbw only, plus \"white\"):\n  ";
    int col = 0;
    for (auto& c : palette) {
        std::cout << c.name;
        if (++col % 6 == 0) std::cout << "\n  ";
        else std::cout << " ";
    }
    std::cout << "\n";
}
