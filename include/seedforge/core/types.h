// SEEDFORGE - Core Types
// Copyright (c) 2024 SEEDFORGE Developers
// MIT License
//
// Byte buffers, a read-only view over them, and fixed-width digests.

#ifndef SEEDFORGE_CORE_TYPES_H
#define SEEDFORGE_CORE_TYPES_H

#include "seedforge/core/hex.h"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace seedforge {

using Byte = uint8_t;
using Bytes = std::vector<Byte>;

/**
 * Pointer and length over contiguous elements. Converts implicitly from
 * any container with data() and size(), so std::vector, std::array and
 * the digest types below can be passed where a view is expected.
 */
template<typename T>
class Span {
public:
    Span() = default;
    Span(T* data, size_t size) : data_(data), size_(size) {}

    template<typename Container,
             typename = decltype(std::declval<Container&>().data()),
             typename = decltype(std::declval<Container&>().size())>
    Span(Container&& c) : data_(c.data()), size_(c.size()) {}

    T* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    T& operator[](size_t i) const { return data_[i]; }
    T* begin() const { return data_; }
    T* end() const { return data_ + size_; }

private:
    T* data_{nullptr};
    size_t size_{0};
};

using ByteSpan = Span<const Byte>;

/// N-byte digest, zero-initialized, compared bytewise
template<size_t N>
class Digest {
public:
    static constexpr size_t SIZE = N;

    Digest() { bytes_.fill(0); }

    /// Copy exactly N bytes from src
    explicit Digest(const Byte* src) { std::copy(src, src + N, bytes_.begin()); }

    Byte* data() { return bytes_.data(); }
    const Byte* data() const { return bytes_.data(); }
    constexpr size_t size() const { return N; }

    Byte& operator[](size_t i) { return bytes_[i]; }
    const Byte& operator[](size_t i) const { return bytes_[i]; }

    Byte* begin() { return bytes_.data(); }
    Byte* end() { return bytes_.data() + N; }
    const Byte* begin() const { return bytes_.data(); }
    const Byte* end() const { return bytes_.data() + N; }

    bool operator==(const Digest& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const Digest& other) const { return bytes_ != other.bytes_; }

    std::string ToHex() const { return BytesToHex(bytes_.data(), N); }

private:
    std::array<Byte, N> bytes_;
};

using Hash256 = Digest<32>;
using Hash512 = Digest<64>;

} // namespace seedforge

#endif // SEEDFORGE_CORE_TYPES_H
