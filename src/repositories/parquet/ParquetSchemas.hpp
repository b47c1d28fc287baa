#pragma once

#include <arrow/api.h>

namespace desk::repositories::pq {

class ParquetSchemas {
public:
    // One row per committed ticket event.
    static std::shared_ptr<arrow::Schema> ticket_event_schema();
};

} // namespace desk::repositories::pq
