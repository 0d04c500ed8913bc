#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"
#include "core/logging.h"

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace scale::codec {

// ===================================================================
// Output: anything bytes can be appended to
// ===================================================================
//
// A sink either is a std::vector<uint8_t> or has a member
//   void write(std::span<const uint8_t>)
// and may additionally provide
//   void push_byte(uint8_t)
// when a single-byte append is cheaper than a one-element span.
// Writes never fail.
// ===================================================================

template <typename O>
concept Output =
    std::same_as<O, std::vector<uint8_t>> ||
    requires(O& o, std::span<const uint8_t> bytes) { o.write(bytes); };

template <Output O>
inline void write_bytes(O& out, std::span<const uint8_t> bytes) {
    if constexpr (std::same_as<O, std::vector<uint8_t>>) {
        out.insert(out.end(), bytes.begin(), bytes.end());
    } else {
        out.write(bytes);
    }
}

template <Output O>
inline void push_byte(O& out, uint8_t byte) {
    if constexpr (std::same_as<O, std::vector<uint8_t>>) {
        out.push_back(byte);
    } else if constexpr (requires { out.push_byte(byte); }) {
        out.push_byte(byte);
    } else {
        out.write(std::span<const uint8_t>(&byte, 1));
    }
}

// ===================================================================
// Input: a source that yields exactly the bytes asked for, or fails
// ===================================================================
//
// Required member:
//   core::Result<void> read(std::span<uint8_t> into)
//     Fills `into` completely or fails; a partial read is never
//     reported as success.
//
// Optional members, with the defaults used when absent:
//   core::Result<uint8_t> read_byte()         one-byte read()
//   std::optional<size_t> remaining_len()     std::nullopt (unknown)
//   core::Result<void>    descend_ref()       succeeds
//   void                  ascend_ref()        no-op
//   core::Result<void>    skip_bytes(size_t)  chunked read()
//
// descend_ref()/ascend_ref() bracket the decode of every nested
// sequence or owned indirection so that a wrapper can bound recursion.
// ===================================================================

template <typename I>
concept Input = requires(I& in, std::span<uint8_t> into) {
    { in.read(into) } -> std::same_as<core::Result<void>>;
};

/// Largest buffer, in bytes, allocated up front for a length-prefixed
/// value when the input cannot tell how much data it still holds.
/// Beyond this the buffer grows as elements actually arrive.
inline constexpr size_t MAX_PREALLOCATION = 4 * 1024;

inline core::Error not_enough_data() {
    return core::make_error(core::ErrorCode::NOT_ENOUGH_DATA,
                            "Not enough data to fill buffer");
}

template <Input I>
inline core::Result<uint8_t> read_byte(I& in) {
    if constexpr (requires { { in.read_byte() } -> std::same_as<core::Result<uint8_t>>; }) {
        return in.read_byte();
    } else {
        uint8_t b = 0;
        SCALE_TRY_VOID(in.read(std::span<uint8_t>(&b, 1)));
        return b;
    }
}

template <Input I>
inline std::optional<size_t> remaining_len(I& in) {
    if constexpr (requires { { in.remaining_len() } -> std::same_as<std::optional<size_t>>; }) {
        return in.remaining_len();
    } else {
        return std::nullopt;
    }
}

template <Input I>
inline core::Result<void> descend_ref(I& in) {
    if constexpr (requires { { in.descend_ref() } -> std::same_as<core::Result<void>>; }) {
        return in.descend_ref();
    } else {
        return core::make_ok();
    }
}

template <Input I>
inline void ascend_ref(I& in) {
    if constexpr (requires { in.ascend_ref(); }) {
        in.ascend_ref();
    }
}

/// Discard the next @p n bytes.
template <Input I>
inline core::Result<void> skip_bytes(I& in, size_t n) {
    if constexpr (requires { { in.skip_bytes(n) } -> std::same_as<core::Result<void>>; }) {
        return in.skip_bytes(n);
    } else {
        std::array<uint8_t, 256> scratch{};
        while (n > 0) {
            size_t chunk = std::min(n, scratch.size());
            SCALE_TRY_VOID(in.read(std::span<uint8_t>(scratch.data(), chunk)));
            n -= chunk;
        }
        return core::make_ok();
    }
}

// ===================================================================
// Sinks
// ===================================================================

// ---------------------------------------------------------------------------
// ByteWriter -- appends to an external vector it does not own
// ---------------------------------------------------------------------------
class ByteWriter {
public:
    explicit ByteWriter(std::vector<uint8_t>& vec) : vec_(vec) {}

    void write(std::span<const uint8_t> data) {
        vec_.insert(vec_.end(), data.begin(), data.end());
    }

    void push_byte(uint8_t byte) { vec_.push_back(byte); }

private:
    std::vector<uint8_t>& vec_;
};

// ---------------------------------------------------------------------------
// SizeCounter -- discards bytes, remembers how many were written
// ---------------------------------------------------------------------------
class SizeCounter {
public:
    void write(std::span<const uint8_t> data) noexcept { size_ += data.size(); }
    void push_byte(uint8_t) noexcept { ++size_; }

    [[nodiscard]] size_t size() const noexcept { return size_; }

private:
    size_t size_ = 0;
};

// ---------------------------------------------------------------------------
// StackWriter<N> -- fixed-capacity sink for small value encodings
// ---------------------------------------------------------------------------
// Writing past N bytes is a programming error.
// ---------------------------------------------------------------------------
template <size_t N>
class StackWriter {
public:
    void write(std::span<const uint8_t> data) {
        if (data.size() > N - len_) {
            throw std::logic_error("StackWriter: capacity exceeded");
        }
        std::memcpy(buf_.data() + len_, data.data(), data.size());
        len_ += data.size();
    }

    [[nodiscard]] std::span<const uint8_t> bytes() const noexcept {
        return std::span<const uint8_t>(buf_.data(), len_);
    }

private:
    std::array<uint8_t, N> buf_{};
    size_t                 len_ = 0;
};

// ===================================================================
// Sources
// ===================================================================

// ---------------------------------------------------------------------------
// SliceInput -- zero-copy reader over a byte span
// ---------------------------------------------------------------------------
class SliceInput {
public:
    explicit SliceInput(std::span<const uint8_t> data) : data_(data) {}

    core::Result<void> read(std::span<uint8_t> into) {
        if (into.size() > remaining()) {
            return not_enough_data();
        }
        if (!into.empty()) {
            std::memcpy(into.data(), data_.data() + pos_, into.size());
        }
        pos_ += into.size();
        return core::make_ok();
    }

    core::Result<uint8_t> read_byte() {
        if (pos_ >= data_.size()) {
            return not_enough_data();
        }
        return data_[pos_++];
    }

    core::Result<void> skip_bytes(size_t n) {
        if (n > remaining()) {
            return not_enough_data();
        }
        pos_ += n;
        return core::make_ok();
    }

    [[nodiscard]] std::optional<size_t> remaining_len() const noexcept {
        return remaining();
    }

    [[nodiscard]] size_t remaining() const noexcept {
        return data_.size() - pos_;
    }

    [[nodiscard]] size_t position() const noexcept { return pos_; }

    /// Bytes not yet consumed.
    [[nodiscard]] std::span<const uint8_t> rest() const noexcept {
        return data_.subspan(pos_);
    }

private:
    std::span<const uint8_t> data_;
    size_t                   pos_ = 0;
};

// ---------------------------------------------------------------------------
// DepthLimitInput -- fails once nested decodes go deeper than a limit
// ---------------------------------------------------------------------------
template <Input I>
class DepthLimitInput {
public:
    DepthLimitInput(I& inner, uint32_t max_depth)
        : inner_(inner), max_depth_(max_depth) {}

    core::Result<void> read(std::span<uint8_t> into) {
        return inner_.read(into);
    }

    core::Result<uint8_t> read_byte() { return codec::read_byte(inner_); }

    core::Result<void> skip_bytes(size_t n) {
        return codec::skip_bytes(inner_, n);
    }

    [[nodiscard]] std::optional<size_t> remaining_len() {
        return codec::remaining_len(inner_);
    }

    core::Result<void> descend_ref() {
        SCALE_TRY_VOID(codec::descend_ref(inner_));
        ++depth_;
        if (depth_ > max_depth_) {
            LOG_DEBUG(core::LogCategory::DECODE,
                      "depth " + std::to_string(depth_) +
                      " exceeds limit " + std::to_string(max_depth_));
            ascend_ref();
            return core::make_error(
                core::ErrorCode::DEPTH_LIMIT,
                "Maximum recursion depth reached when decoding");
        }
        return core::make_ok();
    }

    void ascend_ref() {
        codec::ascend_ref(inner_);
        if (depth_ > 0) --depth_;
    }

    [[nodiscard]] uint32_t depth() const noexcept { return depth_; }

private:
    I&       inner_;
    uint32_t max_depth_;
    uint32_t depth_ = 0;
};

// ---------------------------------------------------------------------------
// CountedInput -- counts the bytes successfully read through it
// ---------------------------------------------------------------------------
// The counter saturates at UINT32_MAX; count() then returns std::nullopt
// ("max count reached").  Failed reads are not counted.
// ---------------------------------------------------------------------------
template <Input I>
class CountedInput {
public:
    explicit CountedInput(I& inner) : inner_(inner) {}

    core::Result<void> read(std::span<uint8_t> into) {
        SCALE_TRY_VOID(inner_.read(into));
        add(into.size());
        return core::make_ok();
    }

    core::Result<uint8_t> read_byte() {
        auto b = codec::read_byte(inner_);
        if (b.ok()) add(1);
        return b;
    }

    core::Result<void> skip_bytes(size_t n) {
        SCALE_TRY_VOID(codec::skip_bytes(inner_, n));
        add(n);
        return core::make_ok();
    }

    [[nodiscard]] std::optional<size_t> remaining_len() {
        return codec::remaining_len(inner_);
    }

    core::Result<void> descend_ref() { return codec::descend_ref(inner_); }
    void ascend_ref() { codec::ascend_ref(inner_); }

    [[nodiscard]] std::optional<uint32_t> count() const noexcept {
        if (counter_ == std::numeric_limits<uint32_t>::max()) {
            return std::nullopt;
        }
        return counter_;
    }

private:
    void add(size_t n) noexcept {
        constexpr uint32_t MAX = std::numeric_limits<uint32_t>::max();
        counter_ = n >= static_cast<size_t>(MAX - counter_)
                       ? MAX
                       : counter_ + static_cast<uint32_t>(n);
    }

    I&       inner_;
    uint32_t counter_ = 0;
};

}  // namespace scale::codec
