#pragma once
#include "store/DocumentStore.hpp"
#include "store/PhysicalStore.hpp"
#include "task/Executor.hpp"
#include "vfs/VfsOptions.hpp"

namespace PV {

/**
 * VfsContext — the stores and executor one set of directory operations runs against
 *
 * Every operation receives the context explicitly; nothing is looked up from
 * process-wide state. The context does not own the stores or the executor,
 * which must outlive it.
 */
class VfsContext final {
public:
    VfsContext(DocumentStore& documents, PhysicalStore& physical, Executor& executor, VfsOptions options = {})
        : documents_(documents)
        , physical_(physical)
        , executor_(executor)
        , options_(std::move(options)) {}

    auto documents() const noexcept -> DocumentStore& { return documents_; }
    auto physical() const noexcept -> PhysicalStore& { return physical_; }
    auto executor() const noexcept -> Executor& { return executor_; }
    auto options() const noexcept -> VfsOptions const& { return options_; }
    auto docType() const noexcept -> std::string const& { return options_.docType; }

private:
    DocumentStore& documents_;
    PhysicalStore& physical_;
    Executor&      executor_;
    VfsOptions     options_;
};

} // namespace PV
