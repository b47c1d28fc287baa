#pragma once

#include <string>

namespace desk::config {

struct RealtimeSettings {
    std::string host = "0.0.0.0";
    int port = 8080;
    int max_connections = 1024;
    int outbound_queue_capacity = 256;   // frames per session
    int dispatch_queue_capacity = 256;   // committed events awaiting fan-out
    int read_timeout_seconds = 60;
    int ping_interval_seconds = 54;      // must stay below read_timeout_seconds
    int write_timeout_seconds = 10;
    int max_message_bytes = 1024;
};

struct CatchUpSettings {
    int default_limit = 50;
    int max_limit = 200;
};

struct StorageSettings {
    std::string backend = "memory";       // "memory" or "parquet"
    std::string data_directory = "data";
    int write_buffer_size = 1;
};

struct AuthSettings {
    // Comma separated "token:user:role" triples.
    std::string tokens;
};

struct NotifierSettings {
    int queue_capacity = 128;
};

struct Settings {
    RealtimeSettings realtime;
    CatchUpSettings catch_up;
    StorageSettings storage;
    AuthSettings auth;
    NotifierSettings notifier;

    // Throws std::invalid_argument describing the first inconsistency.
    void validate() const;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace desk::config
