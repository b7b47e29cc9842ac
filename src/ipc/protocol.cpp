#include "protocol.hpp"
#include <nlohmann/json.hpp>
#include "../core/types/errors.hpp"

namespace Folio {
namespace Ipc {

using Core::ProtocolError;
using json = nlohmann::json;

const char* to_string(MessageType type) {
    switch (type) {
        case MessageType::Init:
            return "INIT";
        case MessageType::SetCookies:
            return "SET_COOKIES";
        case MessageType::Download:
            return "DOWNLOAD";
        case MessageType::Shutdown:
            return "SHUTDOWN";
        case MessageType::Ready:
            return "READY";
        case MessageType::Result:
            return "RESULT";
    }
    return "UNKNOWN";
}

std::optional<MessageType> message_type_from_string(const std::string& name) {
    static const MessageType all[] = {MessageType::Init,
                                      MessageType::SetCookies,
                                      MessageType::Download,
                                      MessageType::Shutdown,
                                      MessageType::Ready,
                                      MessageType::Result};
    for (MessageType type : all) {
        if (name == to_string(type))
            return type;
    }
    return std::nullopt;
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Render:
            return "render";
        case ErrorKind::Session:
            return "session";
        case ErrorKind::Filesystem:
            return "filesystem";
        case ErrorKind::Protocol:
            return "protocol";
        case ErrorKind::Internal:
            return "internal";
    }
    return "internal";
}

std::optional<ErrorKind> error_kind_from_string(const std::string& name) {
    for (ErrorKind kind : {ErrorKind::Render,
                           ErrorKind::Session,
                           ErrorKind::Filesystem,
                           ErrorKind::Protocol,
                           ErrorKind::Internal}) {
        if (name == to_string(kind))
            return kind;
    }
    return std::nullopt;
}

MessageType type_of(const Message& message) {
    return static_cast<MessageType>(message.index());
}

bool is_command(const Message& message) {
    MessageType type = type_of(message);
    return type != MessageType::Ready && type != MessageType::Result;
}

namespace {

json payload_of(const InitMessage& m) {
    const WorkerSettings& s = m.settings;
    return {{"workerId", s.worker_id},
            {"outputRoot", s.output_root},
            {"browserPath", s.browser_path},
            {"cdpPort", s.cdp_port},
            {"headless", s.headless},
            {"pageTimeoutMs", s.page_timeout_ms},
            {"settleMs", s.settle_ms}};
}

json payload_of(const SetCookiesMessage& m) {
    return {{"cookies", m.cookies}};
}

json payload_of(const DownloadMessage& m) {
    return {{"taskId", m.task_id},
            {"url", m.url},
            {"pageId", m.page_id},
            {"savePath", m.save_path},
            {"cookies", m.cookies}};
}

json payload_of(const ShutdownMessage&) {
    return json::object();
}

json payload_of(const ReadyMessage& m) {
    return {{"pid", m.pid}};
}

json payload_of(const ResultMessage& m) {
    json payload = {{"taskType", m.task_type}, {"taskId", m.task_id}};
    if (m.data) {
        payload["data"] = {{"pageId", m.data->page_id},
                           {"savedPath", m.data->saved_path},
                           {"title", m.data->title},
                           {"bytes", m.data->bytes},
                           {"blockIds", m.data->block_ids}};
    }
    if (m.error) {
        payload["error"] = {{"pageId", m.error->page_id},
                            {"message", m.error->message},
                            {"kind", to_string(m.error->kind)},
                            {"retryable", m.error->retryable}};
    }
    return payload;
}

// Typed field access; any missing or mistyped field is a protocol error.
template <typename T>
T field(const json& payload, const char* name) {
    auto it = payload.find(name);
    if (it == payload.end())
        throw ProtocolError(std::string("missing field '") + name + "'");
    try {
        return it->get<T>();
    } catch (const json::exception&) {
        throw ProtocolError(std::string("invalid field '") + name + "'");
    }
}

std::string required_string(const json& payload, const char* name) {
    std::string value = field<std::string>(payload, name);
    if (value.empty())
        throw ProtocolError(std::string("empty field '") + name + "'");
    return value;
}

InitMessage parse_init(const json& p) {
    InitMessage m;
    m.settings.worker_id       = field<int>(p, "workerId");
    m.settings.output_root     = required_string(p, "outputRoot");
    m.settings.browser_path    = field<std::string>(p, "browserPath");
    m.settings.cdp_port        = field<int>(p, "cdpPort");
    m.settings.headless        = field<bool>(p, "headless");
    m.settings.page_timeout_ms = field<int>(p, "pageTimeoutMs");
    m.settings.settle_ms       = field<int>(p, "settleMs");
    return m;
}

std::vector<Core::Cookie> parse_cookies(const json& p) {
    auto it = p.find("cookies");
    if (it == p.end() || !it->is_array())
        throw ProtocolError("missing field 'cookies'");
    try {
        return it->get<std::vector<Core::Cookie>>();
    } catch (const json::exception&) {
        throw ProtocolError("invalid field 'cookies'");
    }
}

DownloadMessage parse_download(const json& p) {
    DownloadMessage m;
    m.task_id   = required_string(p, "taskId");
    m.url       = required_string(p, "url");
    m.page_id   = required_string(p, "pageId");
    m.save_path = required_string(p, "savePath");
    m.cookies   = parse_cookies(p);
    if (m.save_path[0] != '/')
        throw ProtocolError("savePath must be absolute: " + m.save_path);
    return m;
}

ResultMessage parse_result(const json& p) {
    ResultMessage m;
    m.task_type = required_string(p, "taskType");
    m.task_id   = field<std::string>(p, "taskId");

    bool has_data  = p.contains("data");
    bool has_error = p.contains("error");
    if (has_data == has_error)
        throw ProtocolError("RESULT needs exactly one of data or error");

    if (has_data) {
        const json& d = p["data"];
        TaskData    data;
        data.page_id    = required_string(d, "pageId");
        data.saved_path = field<std::string>(d, "savedPath");
        data.title      = field<std::string>(d, "title");
        data.bytes      = field<size_t>(d, "bytes");
        data.block_ids  = field<size_t>(d, "blockIds");
        m.data          = std::move(data);
    }
    else {
        const json& e = p["error"];
        TaskError   error;
        error.page_id   = field<std::string>(e, "pageId");
        error.message   = field<std::string>(e, "message");
        error.retryable = field<bool>(e, "retryable");
        auto kind       = error_kind_from_string(field<std::string>(e, "kind"));
        if (!kind)
            throw ProtocolError("unknown error kind");
        error.kind = *kind;
        m.error    = std::move(error);
    }
    return m;
}

}  // namespace

std::string encode(const Message& message) {
    json payload = std::visit([](const auto& m) { return payload_of(m); }, message);
    return json{{"type", to_string(type_of(message))}, {"payload", payload}}.dump();
}

Message decode(const std::string& text) {
    json envelope;
    try {
        envelope = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ProtocolError("malformed message: " + std::string(e.what()));
    }

    if (!envelope.is_object())
        throw ProtocolError("message is not an object");
    auto type = message_type_from_string(field<std::string>(envelope, "type"));
    if (!type)
        throw ProtocolError("unknown message type");

    auto payload_it = envelope.find("payload");
    if (payload_it == envelope.end() || !payload_it->is_object())
        throw ProtocolError("missing payload object");
    const json& payload = *payload_it;

    switch (*type) {
        case MessageType::Init:
            return parse_init(payload);
        case MessageType::SetCookies:
            return SetCookiesMessage{parse_cookies(payload)};
        case MessageType::Download:
            return parse_download(payload);
        case MessageType::Shutdown:
            return ShutdownMessage{};
        case MessageType::Ready:
            return ReadyMessage{field<int>(payload, "pid")};
        case MessageType::Result:
            return parse_result(payload);
    }
    throw ProtocolError("unhandled message type");
}

}  // namespace Ipc
}  // namespace Folio
