#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace flowrelay {
namespace upstream {

enum class RelayEventKind {
    Text,    // JSON object {type, data}
    Binary   // 8-byte little-endian event code + opaque image bytes
};

/**
 * One event received from the engine's event socket
 *
 * `raw` holds the frame exactly as received and is what gets relayed
 * downstream. The parsed fields exist only so the execution state machine
 * can look at the type tag. Events are immutable and shared between all
 * downstream deliveries via RelayEventPtr.
 */
class RelayEvent {
public:
    /**
     * Classify a text frame. Throws std::invalid_argument if it is not a
     * JSON object with a string "type".
     */
    static std::shared_ptr<const RelayEvent> fromText(std::string raw);

    /**
     * Classify a binary frame. Throws std::invalid_argument if it is
     * shorter than the 8-byte event code header.
     */
    static std::shared_ptr<const RelayEvent> fromBinary(std::string raw);

    /**
     * Build a relay-originated text event {"type": type, "data": data}
     */
    static std::shared_ptr<const RelayEvent> makeText(const std::string& type, const nlohmann::json& data);

    RelayEventKind kind() const { return m_kind; }
    bool isText() const { return m_kind == RelayEventKind::Text; }
    bool isBinary() const { return m_kind == RelayEventKind::Binary; }

    /// "type" of a text event; "binary" for binary frames
    const std::string& type() const { return m_type; }
    const nlohmann::json& data() const { return m_data; }
    uint64_t eventTypeCode() const { return m_eventTypeCode; }

    /// Frame bytes exactly as received
    const std::string& raw() const { return m_raw; }

    /// Image bytes of a binary event (frame minus the 8-byte header)
    std::string_view payload() const;

    /// data.prompt_id of a text event, empty if absent
    std::string promptId() const;

    static constexpr size_t kBinaryHeaderSize = 8;

private:
    RelayEvent() = default;

    RelayEventKind m_kind = RelayEventKind::Text;
    std::string m_type;
    nlohmann::json m_data;
    uint64_t m_eventTypeCode = 0;
    std::string m_raw;
};

using RelayEventPtr = std::shared_ptr<const RelayEvent>;

/**
 * Lenient payload readers. The engine's payloads are not schema-checked,
 * so a member of unexpected type reads as the fallback instead of throwing.
 */
int intField(const nlohmann::json& data, const char* key, int fallback);
std::string stringField(const nlohmann::json& data, const char* key, const std::string& fallback = "");

/**
 * Callback type for events read from the engine
 */
using EventCallback = std::function<void(const RelayEventPtr&)>;

} // namespace upstream
} // namespace flowrelay
