#pragma once

#include <chrono>
#include <cstddef>
#include <cstring>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>

#include "log/loglevel.hpp"


namespace pasture {

namespace log {


using Time_t = std::chrono::time_point<std::chrono::system_clock>;

template <std::size_t RecordSize>
struct FixedSizeRecord
{
    static constexpr std::size_t Size = RecordSize;

    FixedSizeRecord() noexcept { clear(); }

    FixedSizeRecord(const FixedSizeRecord& rhs) noexcept {
        std::memcpy(data, rhs.data, RecordSize);
        size = rhs.size;
    }

    FixedSizeRecord& operator=(const FixedSizeRecord& rhs) noexcept {
        std::memcpy(data, rhs.data, RecordSize);
        size = rhs.size;
        return *this;
    }

    std::string_view view() const noexcept { return {data, size}; }

    char data[RecordSize];
    std::size_t size{0};
private:
    void clear() noexcept { std::memset(data, 0, RecordSize); size = 0; }
};


// Formats one line into a record. The format string starts with the
// timestamp placeholders, so the current time is passed ahead of the
// caller's arguments. Lines longer than the record are cut and still end
// with a newline.
template <typename T>
struct MakeRecordImpl
{
    template <typename S, typename... Args>
    void operator()(T* out, S format, Args&&... args)
    {
        Time_t nowTime(std::chrono::system_clock::now());
        auto nowMs = std::chrono::floor<std::chrono::milliseconds>(nowTime.time_since_epoch());

        auto res = fmt::format_to_n(out->data, T::Size, format, nowTime, nowMs, std::forward<Args>(args)...);
        if (res.size > T::Size) {
            out->size = T::Size;
            out->data[T::Size - 1] = '\n';
        } else {
            out->size = res.size;
        }
    }
};

static constexpr std::size_t DesireRecordSize = 512;
using Record = FixedSizeRecord<DesireRecordSize>;
using MakeRecord = MakeRecordImpl<Record>;

} // namespace log

} // namespace pasture
