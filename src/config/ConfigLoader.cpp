#include "config/ConfigLoader.hpp"
#include "core/Errors.hpp"
#include "server/Logger.hpp"
#include <fstream>
#include <limits>
#include <sstream>

namespace flowrelay {
namespace config {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

/**
 * Strip surrounding quotes, or a trailing comment for bare values
 */
std::string unquote(const std::string& raw) {
    if (raw.size() >= 2 && (raw.front() == '"' || raw.front() == '\'')) {
        char quote = raw.front();
        auto close = raw.find(quote, 1);
        if (close != std::string::npos) {
            return raw.substr(1, close - 1);
        }
    }
    auto hash = raw.find('#');
    return trim(hash == std::string::npos ? raw : raw.substr(0, hash));
}

long parseNumber(const std::string& key, const std::string& value, int line,
                 long minValue, long maxValue) {
    long result = 0;
    try {
        size_t pos = 0;
        result = std::stol(value, &pos);
        if (pos != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw ConfigError("Line " + std::to_string(line) + ": '" + key +
                          "' expects a number, got '" + value + "'");
    }
    if (result < minValue || result > maxValue) {
        throw ConfigError("Line " + std::to_string(line) + ": '" + key +
                          "' out of range: " + value);
    }
    return result;
}

unsigned short parsePort(const std::string& key, const std::string& value, int line) {
    return static_cast<unsigned short>(parseNumber(key, value, line, 0, 65535));
}

std::chrono::seconds parseSeconds(const std::string& key, const std::string& value, int line) {
    return std::chrono::seconds(parseNumber(key, value, line, 0, std::numeric_limits<int>::max()));
}

bool parseBool(const std::string& key, const std::string& value, int line) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    throw ConfigError("Line " + std::to_string(line) + ": '" + key +
                      "' expects true/false, got '" + value + "'");
}

} // namespace

RelayConfig ConfigLoader::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }
    LOG_INFO("Loading configuration from: " + path);
    return loadStream(file);
}

RelayConfig ConfigLoader::loadString(const std::string& text) {
    std::istringstream in(text);
    return loadStream(in);
}

RelayConfig ConfigLoader::loadStream(std::istream& in) {
    RelayConfig config;
    std::string section;
    std::string line;
    int lineNumber = 0;

    while (std::getline(in, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        if (line.front() == '[') {
            auto close = line.find(']');
            if (close == std::string::npos) {
                throw ConfigError("Line " + std::to_string(lineNumber) + ": unterminated section header");
            }
            section = trim(line.substr(1, close - 1));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Line " + std::to_string(lineNumber) + ": expected 'key = value'");
        }
        std::string key = unquote(trim(line.substr(0, eq)));
        std::string value = unquote(trim(line.substr(eq + 1)));
        apply(config, section, key, value, lineNumber);
    }

    return config;
}

void ConfigLoader::apply(RelayConfig& config, const std::string& section,
                         const std::string& key, const std::string& value, int line) {
    const std::string mappingsPrefix = "node_mappings.";

    if (section == "comfy") {
        if (key == "host") config.upstream.host = value;
        else if (key == "port") config.upstream.port = parsePort(key, value, line);
        else if (key == "workflow") config.workflowPath = value;
        else if (key == "connect_timeout") config.upstream.connectTimeout = parseSeconds(key, value, line);
        else if (key == "request_timeout") config.upstream.requestTimeout = parseSeconds(key, value, line);
        else LOG_DEBUG("Ignoring unknown config key [comfy] " + key);
    } else if (section == "http-server") {
        if (key == "address") config.http.address = value;
        else if (key == "port") config.http.port = parsePort(key, value, line);
        else if (key == "threads") config.http.threads = static_cast<unsigned>(parseNumber(key, value, line, 2, 256));
        else LOG_DEBUG("Ignoring unknown config key [http-server] " + key);
    } else if (section == "server") {
        if (key == "address") config.relay.address = value;
        else if (key == "ws_port") config.relay.port = parsePort(key, value, line);
        else if (key == "threads") config.relay.threads = static_cast<unsigned>(parseNumber(key, value, line, 1, 256));
        else if (key == "max_queued_events") config.relay.maxQueuedEvents = static_cast<std::size_t>(parseNumber(key, value, line, 1, 1 << 20));
        else if (key == "write_timeout") config.relay.writeTimeout = parseSeconds(key, value, line);
        else LOG_DEBUG("Ignoring unknown config key [server] " + key);
    } else if (section == "execution") {
        if (key == "timeout") config.execution.timeout = parseSeconds(key, value, line);
        else if (key == "interrupt_fallback") config.execution.interruptFallback = parseSeconds(key, value, line);
        else if (key == "history_attempts") config.execution.historyAttempts = static_cast<int>(parseNumber(key, value, line, 1, 100));
        else LOG_DEBUG("Ignoring unknown config key [execution] " + key);
    } else if (section == "logging") {
        if (key == "level") config.logging.level = value;
        else if (key == "file") config.logging.file = value;
        else if (key == "color") config.logging.color = parseBool(key, value, line);
        else LOG_DEBUG("Ignoring unknown config key [logging] " + key);
    } else if (section == "node_mappings") {
        config.mappings.roles[key] = value;
    } else if (section.rfind(mappingsPrefix, 0) == 0 && section.size() > mappingsPrefix.size()) {
        config.mappings.variants[section.substr(mappingsPrefix.size())][key] = value;
    } else {
        LOG_DEBUG("Ignoring config key '" + key + "' in section [" + section + "]");
    }
}

} // namespace config
} // namespace flowrelay
