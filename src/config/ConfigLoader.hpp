#pragma once

#include "config/RelayConfig.hpp"
#include <istream>
#include <string>

namespace flowrelay {
namespace config {

/**
 * Reader for the relay's TOML-style configuration file
 *
 * Supported syntax:
 *   # comment
 *   [comfy]
 *   host = "127.0.0.1"
 *   port = 8188
 *   [node_mappings.text_to_image]
 *   prompt = "6"
 *
 * Keys missing from the file keep the defaults of RelayConfig.
 * Malformed values throw ConfigError.
 */
class ConfigLoader {
public:
    static RelayConfig loadFile(const std::string& path);
    static RelayConfig loadStream(std::istream& in);
    static RelayConfig loadString(const std::string& text);

private:
    static void apply(RelayConfig& config, const std::string& section,
                      const std::string& key, const std::string& value, int line);
};

} // namespace config
} // namespace flowrelay
