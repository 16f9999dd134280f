#pragma once

#include <cerrno>
#include <chrono>
#include <coroutine>
#include <cstring>
#include <liburing.h>
#include <liburing/io_uring.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <utility>

#include "timeout.hpp"

namespace pasture {

struct resume_handle {
	int result{0}; // negative errno on failure
	std::coroutine_handle<> coro;

	void resume(int res) noexcept {
		result = res;
		coro.resume();
	}
};

/// Awaits the completion of one submission queue entry. The result is the
/// cqe's res field: a byte count, or -errno. An operation that carried a
/// linked timeout which expired completes with -ECANCELED.
struct [[nodiscard]] io_awaitable {
	explicit io_awaitable(io_uring_sqe *sqe) noexcept : sqe_(sqe) {}

	struct await_uring {
		explicit await_uring(io_uring_sqe *sqe) : sqe_(sqe) {}
		io_uring_sqe *sqe_;
		resume_handle resume_handler_;

		constexpr bool await_ready() const noexcept { return false; }

		void await_suspend(std::coroutine_handle<> coro_handle) noexcept {
			resume_handler_.coro = coro_handle;
			io_uring_sqe_set_data(sqe_, &resume_handler_);
		}

		int await_resume() const noexcept { return resume_handler_.result; }
	};

	await_uring operator co_await() { return await_uring{sqe_}; }

	private:
	io_uring_sqe *sqe_;
};

/// One io_uring instance. Not thread safe: every worker thread drives its own.
class io_service {
public:
	static constexpr unsigned kDEFAULT_URING_QUEUE_DEPTH = 64;

	io_service() : ring_(std::make_unique<struct io_uring>()) {}

	~io_service() noexcept {
		if (ring_ && initialized_)
			io_uring_queue_exit(ring_.get());
	}

	io_service(const io_service &) = delete;
	io_service &operator=(const io_service &) = delete;
	io_service(io_service &&other) noexcept
		: ring_(std::move(other.ring_))
		, initialized_(std::exchange(other.initialized_, false)) {}

	int get_uring_fd() const noexcept { return ring_->ring_fd; }

	/// Set up the ring. When `uring_fd` refers to another ring, the kernel
	/// worker pool of that ring is shared. Throws std::runtime_error.
	void init(unsigned entries = kDEFAULT_URING_QUEUE_DEPTH, int uring_fd = -1) {
		struct io_uring_params param;
		std::memset(&param, 0, sizeof(param));
		if (uring_fd > 0) {
			param.flags |= IORING_SETUP_ATTACH_WQ;
			param.wq_fd = uring_fd;
		}

		int ret = io_uring_queue_init_params(entries, ring_.get(), &param);
		if (ret < 0) {
			throw std::runtime_error(
				std::string("Failed to init io_uring, reason: ") + std::strerror(-ret));
		}
		initialized_ = true;
	}

	/// Submit pending entries, wait at most `max_wait` for completions and
	/// resume the coroutines they belong to. Entries with no user data (the
	/// linked timeouts) are only reaped.
	void wait_io_and_resume_coroutine(std::chrono::milliseconds max_wait) {
		io_uring_cqe *cqe = nullptr;
		auto ts = duration_to_timespec(max_wait);
		int ret = io_uring_submit_and_wait_timeout(ring_.get(), &cqe, 1, &ts, nullptr);
		if (ret < 0 && ret != -ETIME && ret != -EINTR) {
			throw std::runtime_error(
				std::string("io_uring wait failed: ") + std::strerror(-ret));
		}

		unsigned cqe_num = 0;
		unsigned head;
		io_uring_for_each_cqe(ring_.get(), head, cqe)
		{
			++cqe_num;
			auto resume_handler =
				static_cast<resume_handle *>(io_uring_cqe_get_data(cqe));
			if (resume_handler) {
				resume_handler->resume(cqe->res);
			}
		}
		// must be called after io_uring_for_each_cqe()
		io_uring_cq_advance(ring_.get(), cqe_num);
	}

	/// Get `count` consecutive free entries; the first one is returned.
	/// Flushes the submission queue first when there is not enough room.
	io_uring_sqe *get_sqe(unsigned count = 1) {
		if (io_uring_sq_space_left(ring_.get()) < count)
			io_uring_submit(ring_.get());
		auto *sqe = io_uring_get_sqe(ring_.get());
		if (sqe == nullptr)
			throw std::runtime_error("io_uring submission queue is full");
		return sqe;
	}


public: // socket io interfaces
	/// read data from a socket.
	/// \param sockfd the socket to read from.
	/// \param buf pinter to a buffer to read data into.
	/// \param len count of bytes to read.
	/// \param flags bit mask influences the read.
	/// \param timeout when not null, cancel the read once it expires. It is
	/// read by the kernel at submission, so it must outlive the co_await.
	io_awaitable recv(int sockfd, void *buf, size_t len, int flags,
						const __kernel_timespec *timeout = nullptr) {
		io_uring_sqe *sqe = get_sqe(timeout ? 2 : 1);
		io_uring_prep_recv(sqe, sockfd, buf, len, flags);
		link_timeout(sqe, timeout);
		return io_awaitable{sqe};
	}

	/// same as recv, but for writing to a socket.
	io_awaitable send(int sockfd, const void *buf, size_t len, int flags,
						const __kernel_timespec *timeout = nullptr) {
		io_uring_sqe *sqe = get_sqe(timeout ? 2 : 1);
		io_uring_prep_send(sqe, sockfd, buf, len, flags);
		link_timeout(sqe, timeout);
		return io_awaitable{sqe};
	}

private:
	// chain a timeout entry right behind `sqe`; its completion carries no
	// user data so nobody is resumed for it
	void link_timeout(io_uring_sqe *sqe, const __kernel_timespec *timeout) {
		if (timeout == nullptr)
			return;
		sqe->flags |= IOSQE_IO_LINK;
		io_uring_sqe *timeout_sqe = io_uring_get_sqe(ring_.get());
		io_uring_prep_link_timeout(timeout_sqe,
			const_cast<__kernel_timespec *>(timeout), 0);
		io_uring_sqe_set_data(timeout_sqe, nullptr);
	}

	std::unique_ptr<io_uring> ring_;
	bool initialized_{false};
};

} // namespace pasture
