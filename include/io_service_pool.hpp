#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

#include "io_service.hpp"
#include "types.hpp"

namespace pasture {


/// One io_service per worker thread. All rings after the first share the
/// kernel worker pool of the first one.
class io_service_pool
{
public:
    explicit io_service_pool(std::size_t init_size)
    {
        if (init_size == 0)
            throw std::invalid_argument("io_service_pool needs at least one io_service");
        pool_.reserve(init_size);
        pool_.emplace_back();
        pool_[0].init(io_service::kDEFAULT_URING_QUEUE_DEPTH);
        for (std::size_t i = 1; i != init_size; ++i) {
            pool_.emplace_back();
            pool_[i].init(io_service::kDEFAULT_URING_QUEUE_DEPTH, pool_[0].get_uring_fd());
        }
    }

    io_service& get_io_service(thread_meta thread) noexcept {
        return pool_[thread.thread_id % pool_.size()];
    }

    std::size_t size() const noexcept { return pool_.size(); }

private:
    std::vector<io_service> pool_;
};

}
