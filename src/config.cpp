#include "config.hpp"
#include "networking/fileParsing.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

#include <arpa/inet.h>

namespace csw {

static bool parseUnsigned(const std::string& str, uint64_t& dest, uint64_t max_val) {
    if (str.empty() || str[0] == '-')
        return false;

    errno = 0;
    char* end = nullptr;
    unsigned long long val = std::strtoull(str.c_str(), &end, 10);
    if (end == str.c_str() || *end != '\0' || errno == ERANGE || val > max_val)
        return false;

    dest = static_cast<uint64_t>(val);
    return true;
}

static bool parseIp(const std::string& str, std::string& dest) {
    in_addr addr;
    if (inet_pton(AF_INET, str.c_str(), &addr) != 1)
        return false;
    dest = str;
    return true;
}

static bool parsePort(const std::string& str, uint16_t& dest) {
    uint64_t val;
    if (!parseUnsigned(str, val, 65535))
        return false;
    dest = static_cast<uint16_t>(val);
    return true;
}

//writes one key/value into config, false on unknown key or bad value
static bool applyTo(const std::string& key, const std::string& val, Config& config) {
    constexpr uint64_t NO_MAX = UINT64_MAX;

    if (key == "tracker_ip")              return parseIp(val, config.tracker_ip);
    if (key == "tracker_port")            return parsePort(val, config.tracker_port);
    if (key == "listen_ip")               return parseIp(val, config.listen_ip);
    if (key == "listen_port")             return parsePort(val, config.listen_port);
    if (key == "chunk_size")              return parseUnsigned(val, config.chunk_size, MAX_CHUNK_SIZE) && config.chunk_size > 0;
    if (key == "request_timeout_ms")      return parseUnsigned(val, config.request_timeout_ms, NO_MAX);
    if (key == "connect_timeout_ms")      return parseUnsigned(val, config.connect_timeout_ms, NO_MAX);
    if (key == "tracker_ttl_ms")          return parseUnsigned(val, config.tracker_ttl_ms, NO_MAX);
    if (key == "heartbeat_interval_ms")   return parseUnsigned(val, config.heartbeat_interval_ms, NO_MAX);
    if (key == "session_idle_timeout_ms") return parseUnsigned(val, config.session_idle_timeout_ms, NO_MAX);
    if (key == "retry_interval_ms")       return parseUnsigned(val, config.retry_interval_ms, NO_MAX);
    if (key == "max_sessions")            return parseUnsigned(val, config.max_sessions, NO_MAX) && config.max_sessions > 0;
    if (key == "swarm_retry_rounds")      return parseUnsigned(val, config.swarm_retry_rounds, NO_MAX);
    if (key == "min_peers")               return parseUnsigned(val, config.min_peers, NO_MAX);
    return false;
}

bool applySetting(const std::string& key, const std::string& val, Config& config) {
    Config updated = config;
    if (!applyTo(key, val, updated))
        return false;
    config = updated;
    return true;
}

int loadConfig(const std::string& config_path, Config& config) {
    std::ifstream input_file(config_path);
    if (!input_file) {
        std::cerr << "[loadConfig] Could not open " << config_path << std::endl;
        return EXIT_FAILURE;
    }

    auto trim = [](std::string& s) {
        const char* ws = " \t\r\n";
        s.erase(0, s.find_first_not_of(ws));
        s.erase(s.find_last_not_of(ws) + 1);
    };

    //work on a copy so a bad file leaves config untouched
    Config loaded = config;
    std::string line;
    size_t line_num = 0;
    while (std::getline(input_file, line)) {
        ++line_num;
        trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            std::cerr << "[loadConfig] " << config_path << ":" << line_num
                      << " expected key = value" << std::endl;
            return EXIT_FAILURE;
        }

        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        trim(key);
        trim(val);

        if (!applyTo(key, val, loaded)) {
            std::cerr << "[loadConfig] " << config_path << ":" << line_num
                      << " bad setting '" << key << "'" << std::endl;
            return EXIT_FAILURE;
        }
    }

    config = loaded;
    return EXIT_SUCCESS;
}

} //csw
