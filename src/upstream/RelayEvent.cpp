#include "upstream/RelayEvent.hpp"
#include <stdexcept>

namespace flowrelay {
namespace upstream {

std::shared_ptr<const RelayEvent> RelayEvent::fromText(std::string raw) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Text frame is not valid JSON: " + std::string(e.what()));
    }

    if (!parsed.is_object()) {
        throw std::invalid_argument("Text frame is not a JSON object");
    }
    auto typeIt = parsed.find("type");
    if (typeIt == parsed.end() || !typeIt->is_string()) {
        throw std::invalid_argument("Text frame has no string 'type'");
    }

    std::shared_ptr<RelayEvent> event(new RelayEvent());
    event->m_kind = RelayEventKind::Text;
    event->m_type = typeIt->get<std::string>();
    auto dataIt = parsed.find("data");
    event->m_data = dataIt != parsed.end() ? *dataIt : nlohmann::json::object();
    event->m_raw = std::move(raw);
    return event;
}

std::shared_ptr<const RelayEvent> RelayEvent::fromBinary(std::string raw) {
    if (raw.size() < kBinaryHeaderSize) {
        throw std::invalid_argument("Short binary frame: " + std::to_string(raw.size()) + " bytes");
    }

    uint64_t code = 0;
    for (size_t i = 0; i < kBinaryHeaderSize; ++i) {
        code |= static_cast<uint64_t>(static_cast<unsigned char>(raw[i])) << (8 * i);
    }

    std::shared_ptr<RelayEvent> event(new RelayEvent());
    event->m_kind = RelayEventKind::Binary;
    event->m_type = "binary";
    event->m_eventTypeCode = code;
    event->m_raw = std::move(raw);
    return event;
}

std::shared_ptr<const RelayEvent> RelayEvent::makeText(const std::string& type, const nlohmann::json& data) {
    std::shared_ptr<RelayEvent> event(new RelayEvent());
    event->m_kind = RelayEventKind::Text;
    event->m_type = type;
    event->m_data = data;
    event->m_raw = nlohmann::json{{"type", type}, {"data", data}}.dump();
    return event;
}

std::string_view RelayEvent::payload() const {
    if (m_kind != RelayEventKind::Binary) {
        return {};
    }
    return std::string_view(m_raw).substr(kBinaryHeaderSize);
}

std::string RelayEvent::promptId() const {
    if (!m_data.is_object()) {
        return "";
    }
    auto it = m_data.find("prompt_id");
    if (it == m_data.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

int intField(const nlohmann::json& data, const char* key, int fallback) {
    if (!data.is_object()) {
        return fallback;
    }
    auto it = data.find(key);
    if (it == data.end()) {
        return fallback;
    }
    if (it->is_number_integer()) {
        return static_cast<int>(it->get<int64_t>());
    }
    if (it->is_number_float()) {
        return static_cast<int>(it->get<double>());
    }
    return fallback;
}

std::string stringField(const nlohmann::json& data, const char* key, const std::string& fallback) {
    if (!data.is_object()) {
        return fallback;
    }
    auto it = data.find(key);
    if (it == data.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

} // namespace upstream
} // namespace flowrelay
