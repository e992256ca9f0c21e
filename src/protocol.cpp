#include "protocol.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <stdexcept>

#include "errors.h"

// -----------------------------------------------------------------------
// Frame encoding
// -----------------------------------------------------------------------

Frame encode_frame(const CommandSpec& command) {
    if (command.empty() || command.size() > static_cast<size_t>(MILIGHT_FRAME_SIZE))
        throw std::invalid_argument(
            "Command must be 1-3 bytes (got " + std::to_string(command.size()) + ")");

    // Frame{} zero-fills, so a 1-byte command already has its 0x00 operand.
    Frame f{};
    std::copy(command.begin(), command.end(), f.begin());
    if (command.size() < static_cast<size_t>(MILIGHT_FRAME_SIZE))
        f[MILIGHT_FRAME_SIZE - 1] = FRAME_TERMINATOR;
    return f;
}

void hexdump_bytes(std::ostream& out, const uint8_t* data, size_t size) {
    out << std::hex << std::setfill('0');
    for (size_t i = 0; i < size; ++i) {
        out << std::setw(2) << static_cast<int>(data[i]);
        if (i + 1 < size) out << " ";
    }
    out << std::dec << std::setfill(' ');
}

// -----------------------------------------------------------------------
// Hue conversion
// -----------------------------------------------------------------------

// HLS hue in [0,1), same branch order as the textbook rgb->hls algorithm.
static double hls_hue(double r, double g, double b) {
    double maxc = std::max({r, g, b});
    double minc = std::min({r, g, b});
    if (maxc == minc) return 0.0;

    double span = maxc - minc;
    double rc = (maxc - r) / span;
    double gc = (maxc - g) / span;
    double bc = (maxc - b) / span;

    double h;
    if (r == maxc)      h = bc - gc;
    else if (g == maxc) h = 2.0 + rc - bc;
    else                h = 4.0 + gc - rc;

    h = std::fmod(h / 6.0, 1.0);
    if (h < 0.0) h += 1.0;
    return h;
}

uint8_t rgb_to_hue(uint8_t r, uint8_t g, uint8_t b) {
    double h = hls_hue(r / 255.0, g / 255.0, b / 255.0);

    // Rotate so that blue is 0 and reverse the direction of the wheel.
    double wire = std::fmod(1.0 - h + 2.0 / 3.0, 1.0);
    int value = static_cast<int>(std::floor(wire * 256.0));
    return static_cast<uint8_t>(std::max(0, std::min(255, value)));
}

// -----------------------------------------------------------------------
// Brightness
// -----------------------------------------------------------------------

int clamp_percent(int percent) {
    return std::max(0, std::min(100, percent));
}

int brightness_percent(double value) {
    if (std::isnan(value) || value <= 0.0) return 0;
    if (value > 100.0) return 100;
    if (value <= 1.0)
        return clamp_percent(static_cast<int>(value * 100.0));
    return clamp_percent(static_cast<int>(value));
}

uint8_t brightness_device_value(int percent) {
    percent = clamp_percent(percent);
    int value = static_cast<int>(
        BRIGHTNESS_DEVICE_MIN +
        (static_cast<double>(percent) / 100.0) * (BRIGHTNESS_DEVICE_MAX - BRIGHTNESS_DEVICE_MIN));
    return static_cast<uint8_t>(value);
}

// -----------------------------------------------------------------------
// Bulb type names
// -----------------------------------------------------------------------

BulbType parse_bulb_type(const std::string& name) {
    std::string lower = name;
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    if (lower == "rgbw")  return BulbType::Rgbw;
    if (lower == "white") return BulbType::White;
    throw InvalidBulbType("Unknown bulb type '" + name + "' (expected rgbw or white)");
}

const char* bulb_type_name(BulbType type) {
    switch (type) {
        case BulbType::Rgbw:  return "rgbw";
        case BulbType::White: return "white";
    }
    return "unknown";
}
