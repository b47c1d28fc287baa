#include "config/Settings.hpp"

#include <cstdlib>
#include <stdexcept>

namespace desk::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

void require_positive(int value, const char* name) {
    if (value <= 0) {
        throw std::invalid_argument(std::string(name) + " must be positive");
    }
}

} // namespace

void Settings::validate() const {
    require_positive(realtime.port, "port");
    require_positive(realtime.max_connections, "max_connections");
    require_positive(realtime.outbound_queue_capacity, "outbound_queue_capacity");
    require_positive(realtime.dispatch_queue_capacity, "dispatch_queue_capacity");
    require_positive(realtime.read_timeout_seconds, "read_timeout_seconds");
    require_positive(realtime.ping_interval_seconds, "ping_interval_seconds");
    require_positive(realtime.write_timeout_seconds, "write_timeout_seconds");
    require_positive(realtime.max_message_bytes, "max_message_bytes");
    require_positive(catch_up.default_limit, "catch_up.default_limit");
    require_positive(catch_up.max_limit, "catch_up.max_limit");
    require_positive(storage.write_buffer_size, "write_buffer_size");
    require_positive(notifier.queue_capacity, "notifier.queue_capacity");

    if (realtime.ping_interval_seconds >= realtime.read_timeout_seconds) {
        throw std::invalid_argument("ping_interval_seconds must be shorter than read_timeout_seconds");
    }
    if (catch_up.default_limit > catch_up.max_limit) {
        throw std::invalid_argument("catch_up.default_limit must not exceed catch_up.max_limit");
    }
    if (storage.backend != "memory" && storage.backend != "parquet") {
        throw std::invalid_argument("Unknown storage backend: " + storage.backend);
    }
}

Settings Settings::from_environment() {
    std::string env = env_or("DESK_ENV", "development");
    Settings s = (env == "production") ? production() : development();
    s.realtime.host = env_or("DESK_HOST", s.realtime.host);
    s.realtime.port = env_int_or("DESK_PORT", s.realtime.port);
    s.realtime.max_connections = env_int_or("DESK_MAX_CONNECTIONS", s.realtime.max_connections);
    s.realtime.outbound_queue_capacity = env_int_or("DESK_OUTBOUND_QUEUE", s.realtime.outbound_queue_capacity);
    s.realtime.dispatch_queue_capacity = env_int_or("DESK_DISPATCH_QUEUE", s.realtime.dispatch_queue_capacity);
    s.realtime.read_timeout_seconds = env_int_or("DESK_READ_TIMEOUT", s.realtime.read_timeout_seconds);
    s.realtime.ping_interval_seconds = env_int_or("DESK_PING_INTERVAL", s.realtime.ping_interval_seconds);
    s.realtime.write_timeout_seconds = env_int_or("DESK_WRITE_TIMEOUT", s.realtime.write_timeout_seconds);
    s.realtime.max_message_bytes = env_int_or("DESK_MAX_MESSAGE_BYTES", s.realtime.max_message_bytes);
    s.catch_up.default_limit = env_int_or("DESK_CATCHUP_DEFAULT_LIMIT", s.catch_up.default_limit);
    s.catch_up.max_limit = env_int_or("DESK_CATCHUP_MAX_LIMIT", s.catch_up.max_limit);
    s.storage.backend = env_or("DESK_STORAGE_BACKEND", s.storage.backend);
    s.storage.data_directory = env_or("DESK_DATA_DIRECTORY", s.storage.data_directory);
    s.storage.write_buffer_size = env_int_or("DESK_WRITE_BUFFER_SIZE", s.storage.write_buffer_size);
    s.auth.tokens = env_or("DESK_TOKENS", s.auth.tokens);
    s.notifier.queue_capacity = env_int_or("DESK_NOTIFY_QUEUE", s.notifier.queue_capacity);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.storage.data_directory = "data/dev";
    return s;
}

Settings Settings::production() {
    Settings s;
    s.realtime.max_connections = 8192;
    s.realtime.dispatch_queue_capacity = 1024;
    s.storage.backend = "parquet";
    s.storage.data_directory = "data/prod";
    s.notifier.queue_capacity = 1024;
    return s;
}

} // namespace desk::config
