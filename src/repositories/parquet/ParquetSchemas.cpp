#include "repositories/parquet/ParquetSchemas.hpp"

namespace desk::repositories::pq {

std::shared_ptr<arrow::Schema> ParquetSchemas::ticket_event_schema() {
    return arrow::schema({
        arrow::field("event_id", arrow::int64(), /*nullable=*/false),
        arrow::field("ticket_id", arrow::int64(), /*nullable=*/false),
        arrow::field("event_type", arrow::utf8(), /*nullable=*/false),
        arrow::field("payload", arrow::utf8(), /*nullable=*/false),
        arrow::field("actor_id", arrow::utf8(), /*nullable=*/false),
        arrow::field("created_at_ms", arrow::int64(), /*nullable=*/false),
    });
}

} // namespace desk::repositories::pq
