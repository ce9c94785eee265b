#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config.hpp"
#include "errorCodes.hpp"
#include "networking/fileParsing.hpp"
#include "peer/peer.hpp"
#include "tracker/tracker.hpp"

enum class Mode {
    NONE,
    TRACKER,
    SEED,
    LEECH
};

static Mode        mode = Mode::NONE;
static std::string mode_arg;    //file to seed, or descriptor/uuid to leech
static std::string config_path;
static std::string out_path;
static int64_t     port_flag = -1;  //--port, applied once the mode is known

static std::atomic<bool> shutdown_requested = false;

void signalHandler(int) {
    shutdown_requested = true;
}

void printUsage() {
    std::cerr << "USAGE:\n"
              << "  chunkswarm --tracker [--port <#>]\n"
              << "  chunkswarm --seed <file>\n"
              << "  chunkswarm --leech <descriptor file | file uuid> [--out <path>]\n"
              << "OPTIONS:\n"
              << "  --config <path>         key = value settings, flags below override them\n"
              << "  --port <#>              tracker: port to listen on, peers: port to serve on\n"
              << "  --tracker-ip <IPv4>     tracker to use\n"
              << "  --tracker-port <#>      tracker to use\n"
              << "  --listen <IPv4>         address other peers reach this peer on\n"
              << "  --chunk-size <bytes>    chunk size used when seeding\n";
}

//value following flag i, or exits with usage
static std::string flagValue(int argc, char** argv, int& i) {
    if (i+1 >= argc) {
        std::cerr << "Missing value for " << argv[i] << std::endl;
        printUsage();
        exit(EXIT_FAILURE);
    }
    return argv[++i];
}

static uint64_t numericValue(const std::string& flag, const std::string& value, uint64_t max) {
    try {
        size_t used = 0;
        uint64_t n = std::stoull(value, &used);
        if (used == value.size() && n <= max)
            return n;
    } catch (const std::exception&) {}

    std::cerr << "Invalid value for " << flag << ": " << value << std::endl;
    exit(EXIT_FAILURE);
}

//stores a flag's value through the config parser, or exits
static void settingValue(const std::string& flag, const std::string& key, std::string value, csw::Config& config) {
    if (value == "localhost")
        value = "127.0.0.1";
    if (!csw::applySetting(key, value, config)) {
        std::cerr << "Invalid value for " << flag << ": " << value << std::endl;
        exit(EXIT_FAILURE);
    }
}

static void setMode(Mode m, const std::string& arg) {
    if (mode != Mode::NONE) {
        std::cerr << "Only one of --tracker, --seed or --leech may be given!" << std::endl;
        exit(EXIT_FAILURE);
    }
    mode     = m;
    mode_arg = arg;
}

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * parseArgs
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Picks the mode and fills config. The config file, if one is given, is
 *    loaded first so every other flag overrides it, wherever it appears on
 *    the command line.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
void parseArgs(int argc, char** argv, csw::Config& config) {
    for (int i = 1; i < argc; i++) {
        if (std::string(argv[i]) == "--config")
            config_path = flagValue(argc, argv, i);
    }

    if (!config_path.empty() && EXIT_SUCCESS != csw::loadConfig(config_path, config)) {
        std::cerr << "Could not load config " << config_path << std::endl;
        exit(EXIT_FAILURE);
    }

    for (int i = 1; i < argc; i++) {
        std::string flag(argv[i]);

        if (flag == "--config") {
            ++i; //handled above
        } else if (flag == "--tracker") {
            setMode(Mode::TRACKER, "");
        } else if (flag == "--seed") {
            setMode(Mode::SEED, flagValue(argc, argv, i));
        } else if (flag == "--leech") {
            setMode(Mode::LEECH, flagValue(argc, argv, i));
        } else if (flag == "--port") {
            port_flag = static_cast<int64_t>(numericValue(flag, flagValue(argc, argv, i), UINT16_MAX));
        } else if (flag == "--tracker-ip") {
            settingValue(flag, "tracker_ip", flagValue(argc, argv, i), config);
        } else if (flag == "--tracker-port") {
            config.tracker_port = static_cast<uint16_t>(numericValue(flag, flagValue(argc, argv, i), UINT16_MAX));
        } else if (flag == "--listen") {
            settingValue(flag, "listen_ip", flagValue(argc, argv, i), config);
        } else if (flag == "--out") {
            out_path = flagValue(argc, argv, i);
        } else if (flag == "--chunk-size") {
            settingValue(flag, "chunk_size", flagValue(argc, argv, i), config);
        } else if (flag == "--help" || flag == "-h") {
            printUsage();
            exit(EXIT_SUCCESS);
        } else {
            std::cerr << "Unknown option " << flag << std::endl;
            printUsage();
            exit(EXIT_FAILURE);
        }
    }

    if (mode == Mode::NONE) {
        std::cerr << "Must specify one of --tracker, --seed or --leech" << std::endl;
        printUsage();
        exit(EXIT_FAILURE);
    }

    //a tracker listens on --port, a peer serves chunks on it
    if (port_flag >= 0) {
        if (mode == Mode::TRACKER)
            config.tracker_port = static_cast<uint16_t>(port_flag);
        else
            config.listen_port = static_cast<uint16_t>(port_flag);
    }
}

//where a leeched file goes when --out isn't given
static std::string defaultOutPath(const std::string& source) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(source, ec)) {
        auto descriptor = csw::loadDescriptor(source);
        if (descriptor)
            return std::filesystem::path(descriptor->f_name).filename().string();
    }
    return source + ".download";
}

/*
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * main
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 * Description:
 * -> Runs a tracker, a seeder or a leecher until CONTROL+C.
 *
 * Takes:
 * -> argc:
 *    Number of command line args supplied.
 *
 * -> argv:
 *    The array of args.
 *
 * Returns:
 * -> On success:
 *    0
 * -> On failure:
 *    The status code of whatever failed.
 * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
 */
int main(int argc, char** argv) {
    csw::Config config;
    parseArgs(argc, argv, config); //exits on bad input

    //handle CONTROL+C
    signal(SIGINT,  signalHandler);
    signal(SIGTERM, signalHandler);

    int res = EXIT_FAILURE;
    switch (mode) {
        case Mode::TRACKER:
            res = csw::runTracker(config, shutdown_requested);
            break;
        case Mode::SEED:
            res = csw::seedFile(mode_arg, config, shutdown_requested);
            break;
        case Mode::LEECH: {
            std::string dest = out_path.empty() ? defaultOutPath(mode_arg) : out_path;
            res = csw::leechFile(mode_arg, dest, config, shutdown_requested);
            break;
        }
        case Mode::NONE:
            break;
    }

    if (res != EXIT_SUCCESS)
        std::cerr << "Exiting: " << csw::errorString(res) << std::endl;
    return res;
}
