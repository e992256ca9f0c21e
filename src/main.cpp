#include <getopt.h>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config.h"
#include "controller.h"
#include "data.h"
#include "operation.h"
#include "protocol.h"
#include "udp.h"

// -----------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------
static constexpr const char* VERSION = "1.3.0";

// -----------------------------------------------------------------------
// Help text
// -----------------------------------------------------------------------
static void print_help(const char* prog) {
    std::cout <<
R"(Usage: )" << prog << R"( [OPTIONS] COMMAND [ARG] [COMMAND [ARG] ...]

Control LimitlessLED / MiLight / EasyBulb lights through a wifi gateway.

Commands:
  on, off                  Switch lights on / off
  white                    RGBW: white mode; white bulbs: full brightness
  color VALUE              RGBW only. VALUE is a colour name (see
                           --list-commands), "white", a hue 0-255,
                           #rrggbb or r,g,b
  brightness VALUE         RGBW only. Integer percent 0-100, or a decimal
                           (<= 1.0 is a fraction, e.g. 0.5 = 50%)
  disco                    Start / cycle disco mode (sent once)
  disco-faster             Increase disco speed (sent once)
  disco-slower             Decrease disco speed (sent once)
  nightmode                Very dim light (sent once)
  brightness-up            White bulbs: one brightness step up
  brightness-down          White bulbs: one brightness step down
  warmer, cooler           White bulbs: colour temperature step

  Several commands run as a batch: every command is sent once, then the
  whole list again, repeat times in total.

Options:
  -h, --help               Show this help and exit
  -V, --version            Show version and exit
  --list-commands          Print the command tables and colour names

  -c, --config FILE        Read gateways from an INI config file
  -H, --host HOST          Gateway address (instead of --config)
  -p, --port PORT          Gateway UDP port (default 8899)
  -r, --repeat N           Send safe commands N times (default 3)
  -P, --pause SECONDS      Minimum pause between frames (default 0.1)
  --group-type N=TYPE      Bulb type of group N: rgbw or white

  -g, --group N            Target group 1-4 (default: all groups)
  -i, --index N            Gateway index in the config file (default 0)
  -a, --all-gateways       Send to every gateway in the config file

  -v, --verbose            Print every frame sent
  -n, --dry-run            Print frames instead of sending them

Examples:
  milight-ctl -H 192.168.1.6 on
  milight-ctl -H 192.168.1.6 -g 2 color red brightness 50
  milight-ctl -H 192.168.1.6 -g 3 --group-type 3=white warmer
  milight-ctl -c examples/milight.ini -a nightmode
)";
}

static int parse_int_arg(const char* arg, const char* what) {
    try {
        size_t pos = 0;
        int v = std::stoi(arg, &pos);
        if (pos != std::string(arg).size())
            throw std::invalid_argument(arg);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("invalid ") + what + " '" + arg + "'");
    }
}

static double parse_double_arg(const char* arg, const char* what) {
    try {
        size_t pos = 0;
        double v = std::stod(arg, &pos);
        if (pos != std::string(arg).size())
            throw std::invalid_argument(arg);
        return v;
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("invalid ") + what + " '" + arg + "'");
    }
}

// -----------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_help(argv[0]);
        return 0;
    }

    // ---- option definitions ----
    struct option long_opts[] = {
        {"help",          no_argument,       nullptr, 'h'},
        {"version",       no_argument,       nullptr, 'V'},
        {"list-commands", no_argument,       nullptr, 1001},
        {"config",        required_argument, nullptr, 'c'},
        {"host",          required_argument, nullptr, 'H'},
        {"port",          required_argument, nullptr, 'p'},
        {"repeat",        required_argument, nullptr, 'r'},
        {"pause",         required_argument, nullptr, 'P'},
        {"group-type",    required_argument, nullptr, 1002},
        {"group",         required_argument, nullptr, 'g'},
        {"index",         required_argument, nullptr, 'i'},
        {"all-gateways",  no_argument,       nullptr, 'a'},
        {"verbose",       no_argument,       nullptr, 'v'},
        {"dry-run",       no_argument,       nullptr, 'n'},
        {nullptr, 0, nullptr, 0}
    };

    // ---- collect requested settings ----
    std::string config_file;
    std::string host;
    int         port         = -1;   // -1 = not given
    int         repeat       = -1;
    double      pause        = -1.0;
    int         group        = ALL_GROUPS;
    int         index        = 0;
    bool        all_gateways = false;
    bool        verbose      = false;
    bool        dry_run      = false;

    struct GroupTypeArg { int group; BulbType type; };
    std::vector<GroupTypeArg> group_type_args;

    int opt;
    try {
        while ((opt = getopt_long(argc, argv, "+hVc:H:p:r:P:g:i:avn", long_opts, nullptr)) != -1) {
            switch (opt) {
            case 'h':
                print_help(argv[0]);
                return 0;

            case 'V':
                std::cout << "milight-ctl " << VERSION << "\n";
                return 0;

            case 1001:  // --list-commands
                list_commands();
                return 0;

            case 'c': config_file = optarg; break;
            case 'H': host = optarg; break;

            case 'p':
                port = parse_int_arg(optarg, "port");
                if (port < 1 || port > 65535) {
                    std::cerr << "Error: --port must be 1-65535\n";
                    return 1;
                }
                break;

            case 'r':
                repeat = parse_int_arg(optarg, "repeat count");
                if (repeat < 0) {
                    std::cerr << "Error: --repeat must not be negative\n";
                    return 1;
                }
                break;

            case 'P':
                pause = parse_double_arg(optarg, "pause");
                if (pause < 0.0) {
                    std::cerr << "Error: --pause must not be negative\n";
                    return 1;
                }
                break;

            case 1002: {  // --group-type N=TYPE
                std::string arg = optarg;
                auto eq = arg.find('=');
                if (eq == std::string::npos) {
                    std::cerr << "Error: --group-type expects N=TYPE (e.g. --group-type 2=white)\n";
                    return 1;
                }
                int g = parse_int_arg(arg.substr(0, eq).c_str(), "group");
                if (g < 1 || g > 4) {
                    std::cerr << "Error: group must be 1-4\n";
                    return 1;
                }
                group_type_args.push_back({g, parse_bulb_type(arg.substr(eq + 1))});
                break;
            }

            case 'g':
                group = parse_int_arg(optarg, "group");
                if (group < 0 || group > 4) {
                    std::cerr << "Error: --group must be 1-4 (0 = all groups)\n";
                    return 1;
                }
                break;

            case 'i':
                index = parse_int_arg(optarg, "gateway index");
                break;

            case 'a': all_gateways = true; break;
            case 'v': verbose = true; break;
            case 'n': dry_run = true; break;

            default:
                std::cerr << "Use --help for usage.\n";
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::vector<std::string> words(argv + optind, argv + argc);
    if (words.empty()) {
        std::cerr << "Error: no command given. Use --help for usage.\n";
        return 1;
    }

    int exit_code = 0;

    try {
        // ---- gateways ----
        std::vector<ControllerConfig> gateways;
        if (!config_file.empty()) {
            Config cfg = parse_config_file(config_file);
            validate_config(cfg);
            gateways = cfg.gateways;
            if (!host.empty())
                std::cerr << "Warning: --host ignored, gateways come from " << config_file << "\n";
        } else if (!host.empty()) {
            ControllerConfig gw;
            gw.host = host;
            gateways.push_back(gw);
        } else {
            std::cerr << "Error: no gateway given. Use --host or --config.\n";
            return 1;
        }

        // Command line settings override the file.
        for (auto& gw : gateways) {
            if (port >= 0)      gw.port = port;
            if (repeat >= 0)    gw.repeat_commands = repeat;
            if (pause >= 0.0)   gw.pause_between_commands = pause;
            for (auto& gt : group_type_args)
                gw.groups[gt.group - 1] = gt.type;
        }

        // ---- transport ----
        std::shared_ptr<DatagramSender> sender;
        if (dry_run)
            sender = std::make_shared<EchoSender>(std::cout, nullptr);
        else if (verbose)
            sender = std::make_shared<EchoSender>(std::cout, std::make_shared<UdpSender>());
        else
            sender = std::make_shared<UdpSender>();

        ControllerPool pool(gateways, sender);
        std::vector<Operation> ops = parse_operations(words, group);

        std::vector<int> targets;
        if (all_gateways) {
            for (int i = 0; i < pool.size(); ++i) targets.push_back(i);
        } else {
            targets.push_back(index);
        }

        for (int idx : targets) {
            if (verbose || dry_run) {
                const LedController& c = pool.controller(idx);
                std::cout << "=== Gateway " << idx << " (" << c.host() << ":" << c.port()
                          << ", " << ops.size() << " command(s)) ===\n";
            }
            if (ops.size() == 1)
                pool.execute(idx, ops.front());
            else
                pool.batch_run(idx, ops);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        exit_code = 1;
    }

    return exit_code;
}
