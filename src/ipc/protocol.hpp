#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../core/types/cookie.hpp"

namespace Folio {
namespace Ipc {

enum class MessageType { Init, SetCookies, Download, Shutdown, Ready, Result };

const char*                to_string(MessageType type);
std::optional<MessageType> message_type_from_string(const std::string& name);

// Settings a worker needs to open its own browser session.
struct WorkerSettings {
    int         worker_id = 0;
    std::string output_root;
    std::string browser_path;
    int         cdp_port        = 0;
    bool        headless        = true;
    int         page_timeout_ms = 0;
    int         settle_ms       = 0;
};

struct InitMessage {
    WorkerSettings settings;
};

struct SetCookiesMessage {
    std::vector<Core::Cookie> cookies;
};

struct DownloadMessage {
    std::string               task_id;
    std::string               url;
    std::string               page_id;
    std::string               save_path;  // absolute
    std::vector<Core::Cookie> cookies;
};

struct ShutdownMessage {};

struct ReadyMessage {
    int pid = 0;
};

struct TaskData {
    std::string page_id;
    std::string saved_path;
    std::string title;
    size_t      bytes     = 0;
    size_t      block_ids = 0;
};

// Session: the worker's browser is gone and the worker exits after replying.
enum class ErrorKind { Render, Session, Filesystem, Protocol, Internal };

const char*              to_string(ErrorKind kind);
std::optional<ErrorKind> error_kind_from_string(const std::string& name);

struct TaskError {
    std::string page_id;
    std::string message;
    ErrorKind   kind      = ErrorKind::Internal;
    bool        retryable = false;
};

struct ResultMessage {
    std::string              task_type = "DOWNLOAD";
    std::string              task_id;
    std::optional<TaskData>  data;
    std::optional<TaskError> error;

    bool ok() const {
        return data.has_value();
    }
};

using Message = std::variant<InitMessage,
                             SetCookiesMessage,
                             DownloadMessage,
                             ShutdownMessage,
                             ReadyMessage,
                             ResultMessage>;

MessageType type_of(const Message& message);

// Messages the orchestrator may send, as opposed to those a worker sends back.
bool is_command(const Message& message);

// {"type": ..., "payload": {...}}
std::string encode(const Message& message);

// Throws Core::ProtocolError on malformed JSON, unknown types or invalid payloads.
Message decode(const std::string& text);

}  // namespace Ipc
}  // namespace Folio
