#pragma once

#include "shared_roots.hpp"
#include "transfer_registry.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace lx {

void to_json(nlohmann::json& j, const TransferRecord& record);

// Transfer-control surface: list / pause / resume / cancel, plus shared
// directory reassignment and server info. Transport-agnostic; the WebSocket
// control server feeds it decoded messages.
class ControlApi {
public:
    ControlApi(TransferRegistry& registry, SharedRoots& roots, uint16_t fast_port);

    // Dispatches one request by its "type" and returns the reply
    nlohmann::json handle(const nlohmann::json& request);

    // Same, from raw text; malformed JSON yields an error reply
    nlohmann::json handle_text(const std::string& text);

    // {"type":"transfers","transfers":[...]}
    nlohmann::json transfers_message() const;

private:
    nlohmann::json transfer_action(const std::string& action, const nlohmann::json& request);
    nlohmann::json set_directory(const nlohmann::json& request);
    nlohmann::json info() const;

    TransferRegistry& registry_;
    SharedRoots& roots_;
    uint16_t fast_port_;
};

} // namespace lx
