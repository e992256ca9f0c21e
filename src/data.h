#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "protocol.h"

// -----------------------------------------------------------------------
// Command tables
//
// Flat commands are looked up by name per bulb type:
//   RGBW:  all_on, all_off, all_white, all_nightmode, disco, disco_faster,
//          disco_slower, color_by_int (+hue operand), brightness (+2..27
//          operand), color_to_<palette name>
//   White: all_on, all_off, all_white (full brightness), all_nightmode,
//          warmer, cooler, brightness_up, brightness_down
//
// Per-group commands exist for on, off, white and nightmode and are indexed
// by group 1-4.
// -----------------------------------------------------------------------

// Returns the flat command for `name`.
// Throws UnknownCommand if the bulb type has no such command.
const CommandSpec& lookup_command(BulbType type, const std::string& name);

// Returns the per-group command for `name` and group 1-4.
// Throws UnknownCommand for an unknown name, InvalidGroup for a bad group.
const CommandSpec& lookup_group_command(BulbType type, const std::string& name, int group);

bool has_command(BulbType type, const std::string& name);
bool has_group_command(BulbType type, const std::string& name);

// -----------------------------------------------------------------------
// Colour palette (RGBW only)
// -----------------------------------------------------------------------

// Returns false if `name` is not one of the 16 palette colours.
// "white" is not in the palette; it uses the dedicated white commands.
bool lookup_palette_color(const std::string& name, uint8_t& hue_out);

// Palette names in wheel order (violet first)
std::vector<std::string> palette_color_names();

// Print both command tables and the palette to stdout (for --list-commands)
void list_commands();
