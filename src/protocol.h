#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

// -----------------------------------------------------------------------
// LimitlessLED / MiLight 3-byte frame layout (v3-v5 wifi gateways)
//
//  Byte  | Role
//  ------|------------------------------------------------------------------
//   0    | Opcode (selects command, group and bulb type)
//   1    | Operand (hue byte for 0x40, brightness 2..27 for 0x4E), else 0x00
//   2    | Always 0x55 (terminator)
//
// Commands shorter than 3 bytes are zero-padded to 2 bytes and then get the
// terminator appended. The gateway never answers.
// -----------------------------------------------------------------------

// Every datagram understood by the gateway is exactly 3 bytes long.
static constexpr int MILIGHT_FRAME_SIZE = 3;

static constexpr uint8_t FRAME_TERMINATOR = 0x55;

// Group argument meaning "every group on the gateway"
static constexpr int ALL_GROUPS = 0;

// Device brightness range accepted by the RGBW 0x4E command.
static constexpr int BRIGHTNESS_DEVICE_MIN = 2;
static constexpr int BRIGHTNESS_DEVICE_MAX = 27;

// Bulb families that can be paired with a gateway group. They use disjoint
// opcode sets.
enum class BulbType : uint8_t {
    Rgbw  = 0x00,
    White = 0x01,
};

// Raw command bytes before padding (1-2 bytes in the command table)
using CommandSpec = std::vector<uint8_t>;

// A complete 3-byte wire frame
using Frame = std::array<uint8_t, MILIGHT_FRAME_SIZE>;

// -----------------------------------------------------------------------
// Frame encoding
// -----------------------------------------------------------------------

// Pad a 1-3 byte command to a full frame:
//   [a]       -> [a, 0x00, 0x55]
//   [a, b]    -> [a, b,    0x55]
//   [a, b, c] -> unchanged
// Throws std::invalid_argument for an empty command or one longer than 3 bytes.
Frame encode_frame(const CommandSpec& command);

// Write bytes as space-separated lowercase hex ("42 00 55"), no newline.
// The stream's fill and base are reset afterwards.
void hexdump_bytes(std::ostream& out, const uint8_t* data, size_t size);

// -----------------------------------------------------------------------
// Hue conversion
// -----------------------------------------------------------------------

// Map an RGB triple to the hue byte of the RGBW 0x40 command.
// The bulb's colour wheel starts at blue and runs the opposite way to the
// HLS wheel, so the HLS hue h in [0,1) is remapped as
//   floor(((1 - h + 2/3) mod 1) * 256)
// Achromatic input (r == g == b) has no hue; black and white must be routed
// to "off" and "white" by the caller.
uint8_t rgb_to_hue(uint8_t r, uint8_t g, uint8_t b);

// -----------------------------------------------------------------------
// Brightness
// -----------------------------------------------------------------------

// Clamp a percentage to 0-100.
int clamp_percent(int percent);

// Interpret a floating-point brightness: values <= 1.0 are a fraction of 100,
// values > 1.0 are truncated to an integer percent (50.7 -> 50).
// The result is clamped to 0-100.
int brightness_percent(double value);

// Map a percentage (clamped to 0-100) to the device range 2-27:
//   floor(2 + percent / 100 * 25)
uint8_t brightness_device_value(int percent);

// -----------------------------------------------------------------------
// Bulb type names
// -----------------------------------------------------------------------

// "rgbw" / "white" (case-insensitive). Throws InvalidBulbType otherwise.
BulbType parse_bulb_type(const std::string& name);

const char* bulb_type_name(BulbType type);
