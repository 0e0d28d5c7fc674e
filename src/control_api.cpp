#include "control_api.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace lx {

static json error_reply(const std::string& message) {
    json reply;
    reply["type"] = "error";
    reply["message"] = message;
    return reply;
}

void to_json(json& j, const TransferRecord& record) {
    auto since_epoch = std::chrono::duration<double>(record.started.time_since_epoch());
    j = json{
        {"id", record.id},
        {"name", record.name},
        {"size", record.size},
        {"sent", record.sent},
        {"status", to_string(record.status)},
        {"client_ip", record.client_ip},
        {"started", since_epoch.count()},
    };
}

ControlApi::ControlApi(TransferRegistry& registry, SharedRoots& roots, uint16_t fast_port)
    : registry_(registry)
    , roots_(roots)
    , fast_port_(fast_port)
{
}

json ControlApi::handle_text(const std::string& text) {
    try {
        return handle(json::parse(text));
    } catch (const json::exception& e) {
        spdlog::warn("Control: Invalid JSON message: {}", e.what());
        return error_reply("invalid JSON");
    }
}

json ControlApi::handle(const json& request) {
    if (!request.is_object()) {
        return error_reply("expected a JSON object");
    }

    std::string type;
    try {
        type = request.value("type", "");
    } catch (const json::type_error&) {
        return error_reply("type must be a string");
    }

    if (type == "list") {
        return transfers_message();
    }
    if (type == "pause" || type == "resume" || type == "cancel") {
        return transfer_action(type, request);
    }
    if (type == "set_directory") {
        return set_directory(request);
    }
    if (type == "info") {
        return info();
    }
    if (type == "subscribe") {
        return json{{"type", "result"}, {"action", "subscribe"}, {"ok", true}};
    }
    if (type == "ping") {
        return json{{"type", "pong"}};
    }

    spdlog::debug("Control: Unknown message type: {}", type);
    return error_reply("unknown message type: " + type);
}

json ControlApi::transfers_message() const {
    json msg;
    msg["type"] = "transfers";
    msg["transfers"] = registry_.list();
    return msg;
}

json ControlApi::transfer_action(const std::string& action, const json& request) {
    auto id_it = request.find("id");
    if (id_it == request.end() || !id_it->is_string()) {
        return error_reply(action + " requires a string id");
    }
    std::string id = id_it->get<std::string>();

    bool ok = false;
    if (action == "pause") ok = registry_.pause(id);
    else if (action == "resume") ok = registry_.resume(id);
    else ok = registry_.cancel(id);

    json reply;
    reply["action"] = action;
    reply["id"] = id;
    if (ok) {
        reply["type"] = "result";
        reply["ok"] = true;
    } else {
        reply["type"] = "error";
        reply["message"] = "not found";
    }
    return reply;
}

json ControlApi::set_directory(const json& request) {
    auto dir_it = request.find("directory");
    std::string directory = dir_it != request.end() && dir_it->is_string()
        ? dir_it->get<std::string>() : std::string();
    if (!roots_.set_shared_dir(directory)) {
        json reply = error_reply("Directory does not exist");
        reply["action"] = "set_directory";
        return reply;
    }
    return json{
        {"type", "result"},
        {"action", "set_directory"},
        {"ok", true},
        {"directory", roots_.shared_dir()},
    };
}

json ControlApi::info() const {
    RootSnapshot roots = roots_.snapshot();
    return json{
        {"type", "info"},
        {"fast_port", fast_port_},
        {"directory", roots.shared_dir},
        {"home", roots.home_dir},
    };
}

} // namespace lx
