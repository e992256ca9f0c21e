#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "operation.h"
#include "pacing.h"
#include "protocol.h"
#include "udp.h"

// Settings of one gateway.
struct ControllerConfig {
    std::string host;
    int         port                   = MILIGHT_DEFAULT_PORT;
    int         repeat_commands        = 3;    // 0 is treated as 1
    double      pause_between_commands = 0.1;  // seconds
    std::array<BulbType, 4> groups     = {BulbType::Rgbw, BulbType::Rgbw,
                                          BulbType::Rgbw, BulbType::Rgbw};
};

// Validate a config and return it with repeat_commands coerced to >= 1.
// Throws InvalidConfig on an empty host, a port outside 1-65535, a negative
// repeat count or a negative pause.
ControllerConfig normalize_controller_config(const ControllerConfig& cfg);

// -----------------------------------------------------------------------
// LedController
//
// Client for one gateway. Every operation takes an optional group (1-4);
// ALL_GROUPS addresses every group. Calls block until all frames, including
// pacing delays and repeats, have been sent.
//
// Commands that are safe to repeat (on, off, white, colour, brightness) are
// sent repeat_commands times since there is no delivery confirmation.
// Mode toggles and relative steps (disco*, nightmode, warmer/cooler,
// brightness_up/down) are sent exactly once: repeating them would cycle the
// mode or step more than once.
// -----------------------------------------------------------------------
class LedController {
public:
    // Uses a UdpSender, SteadyClock and a fresh pacing state.
    explicit LedController(const ControllerConfig& cfg);

    // `pacing` may be shared with other controllers (see ControllerPool).
    // Null collaborators are replaced by the defaults.
    LedController(const ControllerConfig& cfg,
                  std::shared_ptr<DatagramSender> sender,
                  std::shared_ptr<Clock> clock,
                  std::shared_ptr<PacingState> pacing = nullptr);

    void on(int group = ALL_GROUPS);
    void off(int group = ALL_GROUPS);

    // RGBW: white mode; white bulbs: full brightness
    void white(int group = ALL_GROUPS);

    // RGBW only. "white" and RGB (255,255,255) switch to white, RGB (0,0,0)
    // switches the group off.
    void set_color(const Color& color, int group = ALL_GROUPS);
    void set_color(const std::string& name, int group = ALL_GROUPS);
    void set_color(int hue, int group = ALL_GROUPS);
    void set_color(const RgbColor& rgb, int group = ALL_GROUPS);

    // RGBW only; white bulbs use brightness_up / brightness_down.
    // Returns the percentage actually applied (0-100).
    int set_brightness(int percent, int group = ALL_GROUPS);
    int set_brightness(double value, int group = ALL_GROUPS);

    // Each call advances to the next of the 20 built-in animations.
    void disco(int group = ALL_GROUPS);
    void disco_faster(int group = ALL_GROUPS);
    void disco_slower(int group = ALL_GROUPS);

    void nightmode(int group = ALL_GROUPS);

    // White bulbs only
    void brightness_up(int group = ALL_GROUPS);
    void brightness_down(int group = ALL_GROUPS);
    void warmer(int group = ALL_GROUPS);
    void cooler(int group = ALL_GROUPS);

    // Run one operation
    void execute(const Operation& op);

    // Run every operation once, then the whole list again, repeat_commands
    // times in total ([A,B,A,B,A,B] rather than [A,A,A,B,B,B]). The repeat
    // count is restored afterwards, also when an operation throws.
    void batch_run(const std::vector<Operation>& ops);

    // ---- Group configuration ----
    void     set_group_type(int group, BulbType type);
    void     set_group_type(int group, const std::string& type);
    BulbType group_type(int group) const;
    bool     has_bulb_type(BulbType type) const;

    // ---- Settings ----
    const std::string& host() const { return _host; }
    uint16_t           port() const { return _port; }
    int                repeat_commands() const { return _repeat_commands; }
    double             pause_between_commands() const { return _pacing.pause(); }

    void set_repeat_commands(int repeat);
    void set_pause_between_commands(double seconds);

    const std::shared_ptr<PacingState>& pacing_state() const { return _pacing.state(); }

private:
    struct Route;

    std::string             _host;
    uint16_t                _port            = MILIGHT_DEFAULT_PORT;
    int                     _repeat_commands = 1;
    std::array<BulbType, 4> _groups          = {};

    std::shared_ptr<DatagramSender> _sender;
    PacingGate                      _pacing;

    // Frames for one pass of `route` (prelude commands + target command).
    std::vector<Frame> _resolve(const Route& route, int group,
                                std::optional<uint8_t> operand) const;

    void _send_to_group(const Route& route, int group,
                        std::optional<uint8_t> operand = std::nullopt);
    void _send_frame(const Frame& f);
};

// -----------------------------------------------------------------------
// ControllerPool
//
// One LedController per gateway. All controllers share one pacing state, so
// consecutive calls respect the minimum pause even when they go to
// different gateways. The spacing used is the largest pause configured for
// any gateway in the pool.
// -----------------------------------------------------------------------
class ControllerPool {
public:
    explicit ControllerPool(const std::vector<ControllerConfig>& configs,
                            std::shared_ptr<DatagramSender> sender = nullptr,
                            std::shared_ptr<Clock> clock = nullptr);

    // Same settings for every gateway; only the host differs.
    ControllerPool(const std::vector<std::string>& hosts,
                   const ControllerConfig& base,
                   std::shared_ptr<DatagramSender> sender = nullptr,
                   std::shared_ptr<Clock> clock = nullptr);

    // Throws IndexOutOfRange if index is not a valid controller index.
    void execute(int index, const Operation& op);
    void batch_run(int index, const std::vector<Operation>& ops);

    LedController& controller(int index);

    int size() const { return static_cast<int>(_controllers.size()); }

    const std::shared_ptr<PacingState>& pacing_state() const { return _pacing; }

private:
    std::shared_ptr<PacingState> _pacing;
    std::vector<LedController>   _controllers;

    void _check_index(int index) const;
};
