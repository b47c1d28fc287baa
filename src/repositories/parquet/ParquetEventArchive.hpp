#pragma once

#include "config/Settings.hpp"
#include "repositories/IEventArchive.hpp"

#include <arrow/filesystem/api.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace desk::repositories::pq {

// Writes committed events to
//   events/<yyyy-mm-dd>/events_<first id>_<last id>.parquet
// once `write_buffer_size` events have accumulated.
class ParquetEventArchive : public desk::repositories::IEventArchive {
public:
    ParquetEventArchive(std::shared_ptr<arrow::fs::FileSystem> fs,
                        const desk::config::StorageSettings& settings);
    ~ParquetEventArchive() override;

    /// Create a local filesystem rooted at root_dir (creates dir if needed).
    static std::shared_ptr<arrow::fs::FileSystem> make_local_fs(const std::string& root_dir);

    // IEventArchive
    void archive(const std::vector<desk::domain::TicketEvent>& events) override;
    std::vector<desk::domain::TicketEvent> load_all() const override;

    void flush();
    size_t buffered_count() const;

private:
    void flush_locked();
    void write_file(const std::string& path,
                    const std::vector<desk::domain::TicketEvent>& events);
    std::vector<desk::domain::TicketEvent> read_file(const std::string& path) const;

    static std::string date_string(int64_t timestamp_ms);

    std::shared_ptr<arrow::fs::FileSystem> fs_;
    desk::config::StorageSettings settings_;
    mutable std::mutex mutex_;
    std::vector<desk::domain::TicketEvent> buffer_;
};

} // namespace desk::repositories::pq
