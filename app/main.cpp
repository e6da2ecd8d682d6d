#include "Flags.h"
#include "JsonIO.h"

#include "reelcut/Config.h"
#include "reelcut/Errors.h"
#include "reelcut/HighlightEngine.h"
#include "reelcut/Logging.h"
#include "reelcut/SQLiteStore.h"
#include "reelcut/Utility.h"

#include <fmt/core.h>
#include <getopt.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace reelcut;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitConfig = 2;
constexpr int kExitInsufficientSignal = 3;

void PrintUsage(const char* prog) {
    fmt::print(stderr,
               "Usage: {} [--input analysis.json] [--output result.json] [--db store.sqlite]\n"
               "          [--user ID] [--clips N] [--min SEC] [--max SEC] [--set-user-settings]\n",
               prog);
}

void PrintHelp(const char* prog) {
    PrintUsage(prog);
    fmt::print(stderr,
               "\n"
               "Detect highlight clips in an analyzed video and print them as JSON.\n"
               "\n"
               "  -i, --input FILE         analysis document (default: stdin)\n"
               "  -o, --output FILE        write result JSON here (default: stdout)\n"
               "  -d, --db FILE            SQLite store for results and user settings\n"
               "  -u, --user ID            apply this user's stored settings (requires --db)\n"
               "  -n, --clips N            number of clips [1,5]\n"
               "  -m, --min SEC            minimum clip duration [10,30]\n"
               "  -M, --max SEC            maximum clip duration [30,60]\n"
               "  -s, --set-user-settings  store --clips/--min/--max for --user and exit\n"
               "  -h, --help               show this help\n"
               "\n"
               "Environment: MAX_CLIPS_PER_VIDEO, CLIP_MIN_DURATION, CLIP_MAX_DURATION,\n"
               "AUDIO_ENERGY_WEIGHT, KEYWORD_WEIGHT, SCENE_CHANGE_WEIGHT, CHAPTER_MARKER_WEIGHT,\n"
               "SAMPLE_STEP, DECAY_WINDOW, LOG_LEVEL\n"
               "\n"
               "Exit codes: 0 ok, 1 failure, 2 invalid configuration, 3 insufficient signal\n");
}

struct Options {
    std::string input;
    std::string output;
    std::string db;
    std::string user;
    UserSettings flags;   // overrides given on the command line
    bool setUserSettings{false};
};

int Run(const Options& opts) {
    HighlightConfig config = load_config_from_env();
    logging::set_level(logging::level_from_string(config.logLevel));

    std::unique_ptr<SQLiteStore> store;
    if (!opts.db.empty()) {
        store = std::make_unique<SQLiteStore>(opts.db);
        store->initialize();
    }

    if (opts.setUserSettings) {
        if (!store || opts.user.empty()) {
            throw InvalidConfiguration("--set-user-settings requires --db and --user");
        }
        UserSettings settings = opts.flags;
        settings.userId = opts.user;
        // Validate the merged result before persisting it
        validate_config(apply_user_settings(config, settings));
        store->save_user_settings(settings);
        REELCUT_LOG_INFO("saved settings for user {}", opts.user);
        return kExitOk;
    }

    if (!opts.user.empty()) {
        if (!store) throw InvalidConfiguration("--user requires --db");
        if (auto saved = store->load_user_settings(opts.user)) {
            REELCUT_LOG_INFO("applying stored settings for user {}", opts.user);
            config = apply_user_settings(config, *saved);
        } else {
            REELCUT_LOG_INFO("no stored settings for user {}, using defaults", opts.user);
        }
    }
    config = apply_user_settings(config, opts.flags);

    HighlightEngine engine(config);

    HighlightRequest request;
    if (opts.input.empty()) {
        request = cli::read_request(std::cin);
    } else {
        std::ifstream in(opts.input);
        if (!in) throw std::runtime_error("cannot open input file " + opts.input);
        request = cli::read_request(in);
    }

    const HighlightResult result = engine.run(request);
    if (result.clips.empty()) {
        REELCUT_LOG_WARN("{}", kNoHighlightsMessage);
    }

    if (store) {
        store->save_result(result);
        REELCUT_LOG_INFO("saved {} clips for video {} to {}", result.clips.size(), result.videoId, opts.db);
    }

    const std::string json = cli::write_json(cli::result_to_json(result));
    if (opts.output.empty()) {
        std::cout << json << std::endl;
    } else {
        std::ofstream out(opts.output);
        if (!out) throw std::runtime_error("cannot open output file " + opts.output);
        out << json << "\n";
    }
    return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
    static struct option longopts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"db", required_argument, nullptr, 'd'},
        {"user", required_argument, nullptr, 'u'},
        {"clips", required_argument, nullptr, 'n'},
        {"min", required_argument, nullptr, 'm'},
        {"max", required_argument, nullptr, 'M'},
        {"set-user-settings", no_argument, nullptr, 's'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    Options opts;
    try {
        int opt;
        while ((opt = getopt_long(argc, argv, "i:o:d:u:n:m:M:sh", longopts, nullptr)) != -1) {
            switch (opt) {
                case 'i':
                    opts.input = optarg;
                    break;
                case 'o':
                    opts.output = optarg;
                    break;
                case 'd':
                    opts.db = optarg;
                    break;
                case 'u':
                    opts.user = optarg;
                    break;
                case 'n':
                    opts.flags.clipCount = cli::parse_int_flag("clips", optarg);
                    break;
                case 'm':
                    opts.flags.minDuration = cli::parse_number_flag("min", optarg);
                    break;
                case 'M':
                    opts.flags.maxDuration = cli::parse_number_flag("max", optarg);
                    break;
                case 's':
                    opts.setUserSettings = true;
                    break;
                case 'h':
                    PrintHelp(argv[0]);
                    return kExitOk;
                default: /* '?' */
                    PrintUsage(argv[0]);
                    return kExitConfig;
            }
        }
        if (optind < argc) {
            PrintUsage(argv[0]);
            return kExitConfig;
        }

        return Run(opts);
    } catch (const InvalidConfiguration& e) {
        REELCUT_LOG_ERROR("{}", e.what());
        fmt::print(stderr, "{}\n", e.user_message());
        return kExitConfig;
    } catch (const InsufficientSignal& e) {
        REELCUT_LOG_ERROR("{}", e.what());
        fmt::print(stderr, "{}\n", e.user_message());
        return kExitInsufficientSignal;
    } catch (const std::exception& e) {
        REELCUT_LOG_ERROR("{}", e.what());
        return kExitFailure;
    }
}
