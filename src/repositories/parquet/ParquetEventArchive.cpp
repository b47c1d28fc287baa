#include "repositories/parquet/ParquetEventArchive.hpp"
#include "repositories/parquet/ParquetSchemas.hpp"

#include <arrow/api.h>
#include <arrow/filesystem/api.h>
#include <arrow/filesystem/localfs.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace desk::domain;

namespace desk::repositories::pq {

namespace {

const std::string kEventsDir = "events";

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size()) return false;
    return str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ParquetEventArchive::ParquetEventArchive(
    std::shared_ptr<arrow::fs::FileSystem> fs,
    const desk::config::StorageSettings& settings)
    : fs_(std::move(fs))
    , settings_(settings) {
}

ParquetEventArchive::~ParquetEventArchive() {
    std::lock_guard lock(mutex_);
    try {
        flush_locked();
    } catch (const std::exception& e) {
        std::cerr << "[archive] Final flush failed, " << buffer_.size()
                  << " events not archived: " << e.what() << std::endl;
    }
}

std::shared_ptr<arrow::fs::FileSystem> ParquetEventArchive::make_local_fs(
    const std::string& root_dir) {
    auto local = std::make_shared<arrow::fs::LocalFileSystem>();
    check(local->CreateDir(root_dir, /*recursive=*/true), "create " + root_dir);
    return std::make_shared<arrow::fs::SubTreeFileSystem>(root_dir, local);
}

void ParquetEventArchive::archive(const std::vector<TicketEvent>& events) {
    std::lock_guard lock(mutex_);
    buffer_.insert(buffer_.end(), events.begin(), events.end());

    if (buffer_.size() >= static_cast<size_t>(std::max(settings_.write_buffer_size, 1))) {
        try {
            flush_locked();
        } catch (const std::exception&) {
            // The transaction that handed us these events is about to fail.
            buffer_.resize(buffer_.size() - events.size());
            throw;
        }
    }
}

void ParquetEventArchive::flush() {
    std::lock_guard lock(mutex_);
    flush_locked();
}

size_t ParquetEventArchive::buffered_count() const {
    std::lock_guard lock(mutex_);
    return buffer_.size();
}

void ParquetEventArchive::flush_locked() {
    if (buffer_.empty()) return;

    std::string dir = kEventsDir + "/" + date_string(buffer_.front().created_at.milliseconds());
    check(fs_->CreateDir(dir, /*recursive=*/true), "create " + dir);

    std::string path = dir + "/events_" + std::to_string(buffer_.front().id) + "_"
        + std::to_string(buffer_.back().id) + ".parquet";
    write_file(path, buffer_);
    buffer_.clear();
}

void ParquetEventArchive::write_file(const std::string& path,
                                     const std::vector<TicketEvent>& events) {
    arrow::Int64Builder id_builder, ticket_builder, created_builder;
    arrow::StringBuilder type_builder, payload_builder, actor_builder;

    for (const auto& e : events) {
        check(id_builder.Append(e.id), "append event_id");
        check(ticket_builder.Append(e.ticket_id), "append ticket_id");
        check(type_builder.Append(to_string(e.type)), "append event_type");
        check(payload_builder.Append(e.payload), "append payload");
        check(actor_builder.Append(e.actor_id.value()), "append actor_id");
        check(created_builder.Append(e.created_at.milliseconds()), "append created_at_ms");
    }

    std::shared_ptr<arrow::Array> arr_id, arr_ticket, arr_type, arr_payload, arr_actor, arr_created;
    check(id_builder.Finish(&arr_id), "finish event_id");
    check(ticket_builder.Finish(&arr_ticket), "finish ticket_id");
    check(type_builder.Finish(&arr_type), "finish event_type");
    check(payload_builder.Finish(&arr_payload), "finish payload");
    check(actor_builder.Finish(&arr_actor), "finish actor_id");
    check(created_builder.Finish(&arr_created), "finish created_at_ms");

    auto table = arrow::Table::Make(ParquetSchemas::ticket_event_schema(),
        {arr_id, arr_ticket, arr_type, arr_payload, arr_actor, arr_created});

    // Only complete files ever appear under a .parquet name.
    std::string tmp_path = path + ".tmp";
    try {
        auto outfile = fs_->OpenOutputStream(tmp_path);
        check(outfile.status(), "open " + tmp_path);
        check(::parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), *outfile,
                                           static_cast<int64_t>(events.size())),
              "write " + tmp_path);
        check((*outfile)->Close(), "close " + tmp_path);
        check(fs_->Move(tmp_path, path), "move " + tmp_path);
    } catch (const std::exception&) {
        auto status = fs_->DeleteFile(tmp_path);
        if (!status.ok()) {
            std::cerr << "[archive] Could not remove " << tmp_path << ": "
                      << status.ToString() << std::endl;
        }
        throw;
    }
}

std::vector<TicketEvent> ParquetEventArchive::load_all() const {
    std::lock_guard lock(mutex_);

    std::vector<TicketEvent> result;

    arrow::fs::FileSelector selector;
    selector.base_dir = kEventsDir;
    selector.allow_not_found = true;
    selector.recursive = true;
    auto listing = fs_->GetFileInfo(selector);
    check(listing.status(), "list " + kEventsDir);

    for (const auto& file_info : *listing) {
        if (file_info.type() != arrow::fs::FileType::File) continue;
        if (!ends_with(file_info.path(), ".parquet")) continue;
        auto events = read_file(file_info.path());
        result.insert(result.end(), events.begin(), events.end());
    }
    result.insert(result.end(), buffer_.begin(), buffer_.end());

    std::sort(result.begin(), result.end(),
              [](const TicketEvent& a, const TicketEvent& b) { return a.id < b.id; });
    return result;
}

std::vector<TicketEvent> ParquetEventArchive::read_file(const std::string& path) const {
    auto infile = fs_->OpenInputFile(path);
    check(infile.status(), "open " + path);

    auto reader_result = ::parquet::arrow::FileReader::Make(
        arrow::default_memory_pool(), ::parquet::ParquetFileReader::Open(*infile));
    check(reader_result.status(), "read " + path);
    auto reader = std::move(reader_result).ValueOrDie();

    std::shared_ptr<arrow::Table> table;
    check(reader->ReadTable(&table), "read " + path);

    auto combined = table->CombineChunks();
    check(combined.status(), "combine " + path);
    table = *combined;

    std::vector<TicketEvent> result;
    if (table->num_rows() == 0) return result;

    auto id_col = std::static_pointer_cast<arrow::Int64Array>(table->column(0)->chunk(0));
    auto ticket_col = std::static_pointer_cast<arrow::Int64Array>(table->column(1)->chunk(0));
    auto type_col = std::static_pointer_cast<arrow::StringArray>(table->column(2)->chunk(0));
    auto payload_col = std::static_pointer_cast<arrow::StringArray>(table->column(3)->chunk(0));
    auto actor_col = std::static_pointer_cast<arrow::StringArray>(table->column(4)->chunk(0));
    auto created_col = std::static_pointer_cast<arrow::Int64Array>(table->column(5)->chunk(0));

    result.reserve(static_cast<size_t>(table->num_rows()));
    for (int64_t i = 0; i < table->num_rows(); ++i) {
        result.push_back(TicketEvent{
            id_col->Value(i),
            ticket_col->Value(i),
            event_type_from_string(type_col->GetString(i)),
            payload_col->GetString(i),
            UserId(actor_col->GetString(i)),
            Timestamp(created_col->Value(i)),
        });
    }
    return result;
}

std::string ParquetEventArchive::date_string(int64_t timestamp_ms) {
    auto seconds = timestamp_ms / 1000;
    std::time_t time = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

} // namespace desk::repositories::pq
