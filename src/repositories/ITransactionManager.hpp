#pragma once

#include "repositories/ICommentRepository.hpp"
#include "repositories/IEventLogRepository.hpp"
#include "repositories/ITicketRepository.hpp"

#include <functional>

namespace desk::repositories {

// Transaction-bound repositories. Reads see the unit's own staged writes.
class IUnitOfWork {
public:
    virtual ITicketRepository& tickets() = 0;
    virtual ICommentRepository& comments() = 0;
    virtual IEventLogRepository& events() = 0;

    virtual ~IUnitOfWork() = default;
};

class ITransactionManager {
public:
    // Runs `work` atomically. An exception thrown by `work` discards every
    // staged write and propagates unchanged; a failed commit throws
    // TransientInfraError.
    virtual void with_transaction(const std::function<void(IUnitOfWork&)>& work) = 0;

    virtual ~ITransactionManager() = default;
};

} // namespace desk::repositories
