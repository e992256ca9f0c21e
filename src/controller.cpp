#include "controller.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "data.h"
#include "errors.h"

// -----------------------------------------------------------------------
// Routing table
//
// flat       : command name in the flat table (used for ALL_GROUPS and as a
//              fallback when there is no per-group variant)
// per_group  : per-group command name, or nullptr
// send_on    : switch the target on first (colour/brightness only apply
//              to the group that was switched on last)
// off_first  : switch the target off first (nightmode only works from off).
//              The off step is always repeated, even when the command is not.
// repeat     : repeat repeat_commands times instead of sending once
// -----------------------------------------------------------------------
struct LedController::Route {
    std::string flat;
    const char* per_group;
    bool        send_on;
    bool        off_first;
    bool        repeat;
};

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

static void check_group(int group) {
    if (group < 1 || group > 4)
        throw InvalidGroup("Group must be between 1 and 4 (was " + std::to_string(group) + ")");
}

static void check_group_or_all(int group) {
    if (group != ALL_GROUPS) check_group(group);
}

ControllerConfig normalize_controller_config(const ControllerConfig& cfg) {
    ControllerConfig out = cfg;

    if (out.host.empty())
        throw InvalidConfig("Gateway host must not be empty");
    if (out.port < 1 || out.port > 65535)
        throw InvalidConfig("Port must be 1-65535 (got " + std::to_string(out.port) + ")");
    if (out.repeat_commands < 0)
        throw InvalidConfig("repeat_commands must not be negative (got " +
                            std::to_string(out.repeat_commands) + ")");
    if (out.repeat_commands == 0)
        out.repeat_commands = 1;
    if (!std::isfinite(out.pause_between_commands) || out.pause_between_commands < 0.0)
        throw InvalidConfig("pause_between_commands must be >= 0 seconds");

    for (int g = 0; g < 4; ++g) {
        BulbType t = out.groups[g];
        if (t != BulbType::Rgbw && t != BulbType::White)
            throw InvalidConfig("Invalid bulb type for group " + std::to_string(g + 1));
    }
    return out;
}

// -----------------------------------------------------------------------
// LedController
// -----------------------------------------------------------------------

LedController::LedController(const ControllerConfig& cfg)
    : LedController(cfg, nullptr, nullptr, nullptr) {}

LedController::LedController(const ControllerConfig& cfg,
                             std::shared_ptr<DatagramSender> sender,
                             std::shared_ptr<Clock> clock,
                             std::shared_ptr<PacingState> pacing)
    : _sender(sender ? std::move(sender) : std::make_shared<UdpSender>()),
      _pacing(pacing ? std::move(pacing) : std::make_shared<PacingState>(),
              clock ? std::move(clock) : std::make_shared<SteadyClock>(),
              0.0) {
    ControllerConfig checked = normalize_controller_config(cfg);
    _host            = checked.host;
    _port            = static_cast<uint16_t>(checked.port);
    _repeat_commands = checked.repeat_commands;
    _groups          = checked.groups;
    _pacing.set_pause(checked.pause_between_commands);
}

void LedController::on(int group) {
    static const Route route{"all_on", "on", false, false, true};
    _send_to_group(route, group);
}

void LedController::off(int group) {
    static const Route route{"all_off", "off", false, false, true};
    _send_to_group(route, group);
}

void LedController::white(int group) {
    static const Route route{"all_white", "white", true, false, true};
    _send_to_group(route, group);
}

void LedController::set_color(const Color& color, int group) {
    if (auto* named = std::get_if<NamedColor>(&color)) {
        set_color(named->name, group);
    } else if (auto* indexed = std::get_if<IndexedColor>(&color)) {
        set_color(indexed->value, group);
    } else {
        set_color(std::get<RgbColor>(color), group);
    }
}

void LedController::set_color(const std::string& name, int group) {
    // White has its own opcodes instead of a hue value.
    if (name == "white") {
        white(group);
        return;
    }
    uint8_t hue;
    if (!lookup_palette_color(name, hue))
        throw UnknownColor("Unknown colour '" + name + "'");

    Route route{"color_to_" + name, nullptr, true, false, true};
    _send_to_group(route, group);
}

void LedController::set_color(int hue, int group) {
    if (hue < 0 || hue > 255)
        throw UnknownColor("Colour index must be 0-255 (was " + std::to_string(hue) + ")");
    static const Route route{"color_by_int", nullptr, true, false, true};
    _send_to_group(route, group, static_cast<uint8_t>(hue));
}

void LedController::set_color(const RgbColor& rgb, int group) {
    // Achromatic colours have no hue.
    if (rgb.r == 0 && rgb.g == 0 && rgb.b == 0) {
        off(group);
        return;
    }
    if (rgb.r == 255 && rgb.g == 255 && rgb.b == 255) {
        white(group);
        return;
    }
    set_color(static_cast<int>(rgb_to_hue(rgb.r, rgb.g, rgb.b)), group);
}

int LedController::set_brightness(int percent, int group) {
    static const Route route{"brightness", nullptr, true, false, true};
    percent = clamp_percent(percent);
    _send_to_group(route, group, brightness_device_value(percent));
    return percent;
}

int LedController::set_brightness(double value, int group) {
    return set_brightness(brightness_percent(value), group);
}

void LedController::disco(int group) {
    static const Route route{"disco", nullptr, true, false, false};
    _send_to_group(route, group);
}

void LedController::disco_faster(int group) {
    static const Route route{"disco_faster", nullptr, true, false, false};
    _send_to_group(route, group);
}

void LedController::disco_slower(int group) {
    static const Route route{"disco_slower", nullptr, true, false, false};
    _send_to_group(route, group);
}

void LedController::nightmode(int group) {
    static const Route route{"all_nightmode", "nightmode", false, true, false};
    _send_to_group(route, group);
}

void LedController::brightness_up(int group) {
    static const Route route{"brightness_up", nullptr, true, false, false};
    _send_to_group(route, group);
}

void LedController::brightness_down(int group) {
    static const Route route{"brightness_down", nullptr, true, false, false};
    _send_to_group(route, group);
}

void LedController::warmer(int group) {
    static const Route route{"warmer", nullptr, true, false, false};
    _send_to_group(route, group);
}

void LedController::cooler(int group) {
    static const Route route{"cooler", nullptr, true, false, false};
    _send_to_group(route, group);
}

void LedController::execute(const Operation& op) {
    switch (op.command) {
        case Command::On:             on(op.group);              break;
        case Command::Off:            off(op.group);             break;
        case Command::White:          white(op.group);           break;
        case Command::SetColor:       set_color(op.color, op.group); break;
        case Command::SetBrightness:
            if (auto* pct = std::get_if<int>(&op.brightness))
                set_brightness(*pct, op.group);
            else
                set_brightness(std::get<double>(op.brightness), op.group);
            break;
        case Command::Disco:          disco(op.group);           break;
        case Command::DiscoFaster:    disco_faster(op.group);    break;
        case Command::DiscoSlower:    disco_slower(op.group);    break;
        case Command::Nightmode:      nightmode(op.group);       break;
        case Command::BrightnessUp:   brightness_up(op.group);   break;
        case Command::BrightnessDown: brightness_down(op.group); break;
        case Command::Warmer:         warmer(op.group);          break;
        case Command::Cooler:         cooler(op.group);          break;
    }
}

void LedController::batch_run(const std::vector<Operation>& ops) {
    // Puts the configured repeat count back on every exit path.
    struct RepeatRestore {
        int& target;
        int  saved;
        ~RepeatRestore() { target = saved; }
    } restore{_repeat_commands, _repeat_commands};

    _repeat_commands = 1;
    for (int pass = 0; pass < restore.saved; ++pass)
        for (const auto& op : ops)
            execute(op);
}

// ---- Group configuration ----

void LedController::set_group_type(int group, BulbType type) {
    check_group(group);
    if (type != BulbType::Rgbw && type != BulbType::White)
        throw InvalidBulbType("Invalid bulb type value " +
                              std::to_string(static_cast<int>(type)));
    _groups[group - 1] = type;
}

void LedController::set_group_type(int group, const std::string& type) {
    check_group(group);
    _groups[group - 1] = parse_bulb_type(type);
}

BulbType LedController::group_type(int group) const {
    check_group(group);
    return _groups[group - 1];
}

bool LedController::has_bulb_type(BulbType type) const {
    for (BulbType t : _groups)
        if (t == type) return true;
    return false;
}

// ---- Settings ----

void LedController::set_repeat_commands(int repeat) {
    if (repeat < 0)
        throw InvalidConfig("repeat_commands must not be negative (got " +
                            std::to_string(repeat) + ")");
    _repeat_commands = repeat == 0 ? 1 : repeat;
}

void LedController::set_pause_between_commands(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0)
        throw InvalidConfig("pause_between_commands must be >= 0 seconds");
    _pacing.set_pause(seconds);
}

// ---- Sending ----

std::vector<Frame> LedController::_resolve(const Route& route, int group,
                                           std::optional<uint8_t> operand) const {
    std::vector<Frame> frames;

    auto append = [&frames](const CommandSpec& spec, std::optional<uint8_t> arg) {
        CommandSpec raw = spec;
        if (arg) raw.push_back(*arg);
        frames.push_back(encode_frame(raw));
    };

    if (group == ALL_GROUPS) {
        // One flat command per bulb family present; families without the
        // command (e.g. warmer on RGBW) are skipped.
        for (BulbType type : {BulbType::Rgbw, BulbType::White}) {
            if (!has_bulb_type(type) || !has_command(type, route.flat)) continue;
            if (route.send_on)   append(lookup_command(type, "all_on"), std::nullopt);
            append(lookup_command(type, route.flat), operand);
        }
        return frames;
    }

    BulbType type = _groups[group - 1];
    const CommandSpec* target = nullptr;
    if (route.per_group && has_group_command(type, route.per_group))
        target = &lookup_group_command(type, route.per_group, group);
    else if (has_command(type, route.flat))
        target = &lookup_command(type, route.flat);

    // The group's bulb family has no such command.
    if (!target) return frames;

    if (route.send_on)   append(lookup_group_command(type, "on", group), std::nullopt);
    append(*target, operand);
    return frames;
}

void LedController::_send_to_group(const Route& route, int group,
                                   std::optional<uint8_t> operand) {
    check_group_or_all(group);

    // Resolve everything up front so a lookup error never leaves a call
    // half sent.
    std::vector<Frame> frames = _resolve(route, group, operand);
    std::vector<Frame> prelude;
    if (route.off_first && !frames.empty()) {
        static const Route off_route{"all_off", "off", false, false, true};
        prelude = _resolve(off_route, group, std::nullopt);
    }

    for (int pass = 0; pass < _repeat_commands; ++pass)
        for (const auto& f : prelude)
            _send_frame(f);

    int passes = route.repeat ? _repeat_commands : 1;
    for (int pass = 0; pass < passes; ++pass)
        for (const auto& f : frames)
            _send_frame(f);
}

void LedController::_send_frame(const Frame& f) {
    _pacing.wait();
    try {
        _sender->send(f.data(), _host, _port);
    } catch (...) {
        _pacing.mark_sent();
        throw;
    }
    _pacing.mark_sent();
}

// -----------------------------------------------------------------------
// ControllerPool
// -----------------------------------------------------------------------

ControllerPool::ControllerPool(const std::vector<ControllerConfig>& configs,
                               std::shared_ptr<DatagramSender> sender,
                               std::shared_ptr<Clock> clock)
    : _pacing(std::make_shared<PacingState>()) {
    if (!sender) sender = std::make_shared<UdpSender>();
    if (!clock)  clock  = std::make_shared<SteadyClock>();

    _controllers.reserve(configs.size());
    for (const auto& cfg : configs) {
        _controllers.emplace_back(cfg, sender, clock, _pacing);
        _pacing->min_pause = std::max(_pacing->min_pause,
                                      _controllers.back().pause_between_commands());
    }
}

static std::vector<ControllerConfig> configs_for_hosts(const std::vector<std::string>& hosts,
                                                       const ControllerConfig& base) {
    std::vector<ControllerConfig> configs;
    for (const auto& host : hosts) {
        ControllerConfig cfg = base;
        cfg.host = host;
        configs.push_back(cfg);
    }
    return configs;
}

ControllerPool::ControllerPool(const std::vector<std::string>& hosts,
                               const ControllerConfig& base,
                               std::shared_ptr<DatagramSender> sender,
                               std::shared_ptr<Clock> clock)
    : ControllerPool(configs_for_hosts(hosts, base), std::move(sender), std::move(clock)) {}

void ControllerPool::execute(int index, const Operation& op) {
    controller(index).execute(op);
}

void ControllerPool::batch_run(int index, const std::vector<Operation>& ops) {
    controller(index).batch_run(ops);
}

LedController& ControllerPool::controller(int index) {
    _check_index(index);
    return _controllers[static_cast<size_t>(index)];
}

void ControllerPool::_check_index(int index) const {
    if (index < 0 || index >= size())
        throw IndexOutOfRange("Controller index " + std::to_string(index) +
                              " out of range (pool has " + std::to_string(size()) +
                              " gateways)");
}
