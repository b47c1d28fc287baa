#pragma once

#include <cstdint>

namespace desk::domain {

// Store-assigned row ids. Zero means "not persisted yet".
using TicketId = int64_t;
using CommentId = int64_t;
using EventId = int64_t;

} // namespace desk::domain
