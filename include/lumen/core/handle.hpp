#pragma once

/// @file handle.hpp
/// @brief Type-safe generational handles for lumen_core

#include "fwd.hpp"
#include "error.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>
#include <optional>
#include <functional>
#include <string>

namespace lumen_core {

// =============================================================================
// Handle Constants
// =============================================================================

namespace handle_constants {
    /// Maximum index value (32 bits, all-ones reserved for null)
    constexpr std::uint32_t MAX_INDEX = UINT32_MAX - 1;

    /// Generation marking a retired slot; never carried by a live handle
    constexpr std::uint32_t MAX_GENERATION = UINT32_MAX;

    /// Null handle bits
    constexpr std::uint64_t NULL_BITS = UINT64_MAX;

    /// Default slot limit of an allocator
    constexpr std::size_t MAX_SLOTS = static_cast<std::size_t>(MAX_INDEX) + 1;
}

// =============================================================================
// Handle<T>
// =============================================================================

/// Type-safe generational index handle
/// Layout: [Generation(32 bits) | Index(32 bits)]
template<typename T>
struct Handle {
    std::uint64_t bits = handle_constants::NULL_BITS;

    constexpr Handle() noexcept = default;

    [[nodiscard]] static constexpr Handle create(std::uint32_t index, std::uint32_t generation) noexcept {
        Handle h;
        h.bits = (static_cast<std::uint64_t>(generation) << 32) | static_cast<std::uint64_t>(index);
        return h;
    }

    [[nodiscard]] static constexpr Handle null() noexcept {
        return Handle{};
    }

    [[nodiscard]] constexpr bool is_null() const noexcept {
        return bits == handle_constants::NULL_BITS;
    }

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return bits != handle_constants::NULL_BITS;
    }

    [[nodiscard]] constexpr std::uint32_t index() const noexcept {
        return static_cast<std::uint32_t>(bits & 0xFFFFFFFFull);
    }

    [[nodiscard]] constexpr std::uint32_t generation() const noexcept {
        return static_cast<std::uint32_t>(bits >> 32);
    }

    [[nodiscard]] constexpr std::uint64_t to_bits() const noexcept {
        return bits;
    }

    [[nodiscard]] static constexpr Handle from_bits(std::uint64_t raw) noexcept {
        Handle h;
        h.bits = raw;
        return h;
    }

    constexpr bool operator==(const Handle&) const noexcept = default;
    constexpr bool operator!=(const Handle&) const noexcept = default;

    explicit constexpr operator bool() const noexcept {
        return is_valid();
    }
};

// =============================================================================
// HandleAllocator<T>
// =============================================================================

/// Manages slot allocation and generation tracking for handles.
///
/// Freeing a handle bumps its slot generation so every copy of the old handle
/// stops validating. A slot whose generation reaches MAX_GENERATION is retired
/// instead of recycled, so generations never wrap back onto an old handle.
template<typename T>
class HandleAllocator {
public:
    HandleAllocator() = default;

    explicit HandleAllocator(std::size_t capacity) {
        m_generations.reserve(capacity);
        m_free_list.reserve(capacity);
    }

    /// Allocate new handle (null once every slot below the limit is in use or retired)
    [[nodiscard]] Handle<T> allocate() {
        std::uint32_t index;

        if (!m_free_list.empty()) {
            index = m_free_list.back();
            m_free_list.pop_back();
        } else {
            if (m_generations.size() >= m_slot_limit) {
                return Handle<T>::null();
            }
            index = static_cast<std::uint32_t>(m_generations.size());
            m_generations.push_back(0);
        }

        return Handle<T>::create(index, m_generations[index]);
    }

    /// Free handle (returns true if it was live)
    bool free(Handle<T> handle) {
        if (!is_valid(handle)) {
            return false;
        }

        std::uint32_t index = handle.index();
        std::uint32_t next = m_generations[index] + 1;
        m_generations[index] = next;

        if (next == handle_constants::MAX_GENERATION) {
            ++m_retired;
        } else {
            m_free_list.push_back(index);
        }
        return true;
    }

    [[nodiscard]] bool is_valid(Handle<T> handle) const {
        if (handle.is_null()) {
            return false;
        }

        std::uint32_t index = handle.index();
        if (index >= m_generations.size()) {
            return false;
        }

        return m_generations[index] == handle.generation();
    }

    /// Check if index refers to an allocated slot (live, free or retired)
    [[nodiscard]] bool in_range(Handle<T> handle) const noexcept {
        return !handle.is_null() && handle.index() < m_generations.size();
    }

    [[nodiscard]] std::uint32_t generation_at(std::uint32_t index) const {
        if (index >= m_generations.size()) {
            return 0;
        }
        return m_generations[index];
    }

    /// Live handle count
    [[nodiscard]] std::size_t len() const noexcept {
        return m_generations.size() - m_free_list.size() - m_retired;
    }

    [[nodiscard]] bool is_empty() const noexcept {
        return len() == 0;
    }

    /// Total slots including freed and retired
    [[nodiscard]] std::size_t capacity() const noexcept {
        return m_generations.size();
    }

    [[nodiscard]] std::size_t free_count() const noexcept {
        return m_free_list.size();
    }

    [[nodiscard]] std::size_t retired_count() const noexcept {
        return m_retired;
    }

    /// Cap the number of slots; clamped to MAX_SLOTS. Existing slots are kept.
    void set_slot_limit(std::size_t limit) noexcept {
        m_slot_limit = std::min(limit, handle_constants::MAX_SLOTS);
    }

    [[nodiscard]] std::size_t slot_limit() const noexcept {
        return m_slot_limit;
    }

    /// True when allocate() would return a null handle
    [[nodiscard]] bool is_full() const noexcept {
        return m_free_list.empty() && m_generations.size() >= m_slot_limit;
    }

    void clear() {
        m_generations.clear();
        m_free_list.clear();
        m_retired = 0;
    }

    void reserve(std::size_t capacity) {
        m_generations.reserve(capacity);
        m_free_list.reserve(capacity);
    }

private:
    std::vector<std::uint32_t> m_generations;
    std::vector<std::uint32_t> m_free_list;
    std::size_t m_retired = 0;
    std::size_t m_slot_limit = handle_constants::MAX_SLOTS;
};

// =============================================================================
// HandleMap<T>
// =============================================================================

/// Storage container pairing allocator with values
template<typename T>
class HandleMap {
public:
    HandleMap() = default;

    explicit HandleMap(std::size_t capacity) {
        m_allocator.reserve(capacity);
        m_values.reserve(capacity);
    }

    /// Insert value and get handle
    [[nodiscard]] Handle<T> insert(T value) {
        Handle<T> handle = m_allocator.allocate();
        if (handle.is_null()) {
            return handle;
        }

        std::uint32_t index = handle.index();
        if (index >= m_values.size()) {
            m_values.resize(index + 1);
        }

        m_values[index] = std::move(value);
        return handle;
    }

    /// Remove value by handle
    [[nodiscard]] std::optional<T> remove(Handle<T> handle) {
        if (!contains(handle)) {
            return std::nullopt;
        }

        std::uint32_t index = handle.index();
        std::optional<T> result = std::move(m_values[index]);
        m_values[index].reset();

        m_allocator.free(handle);
        return result;
    }

    [[nodiscard]] const T* get(Handle<T> handle) const {
        if (!contains(handle)) {
            return nullptr;
        }
        return &m_values[handle.index()].value();
    }

    [[nodiscard]] T* get_mut(Handle<T> handle) {
        if (!contains(handle)) {
            return nullptr;
        }
        return &m_values[handle.index()].value();
    }

    [[nodiscard]] bool contains(Handle<T> handle) const {
        return m_allocator.is_valid(handle) &&
               handle.index() < m_values.size() &&
               m_values[handle.index()].has_value();
    }

    /// Classify why a handle does not resolve (nullopt if it does)
    [[nodiscard]] std::optional<HandleError> check(Handle<T> handle) const {
        if (handle.is_null()) {
            return HandleError::null();
        }
        if (!m_allocator.in_range(handle)) {
            return HandleError::out_of_bounds();
        }
        if (!contains(handle)) {
            return HandleError::stale();
        }
        return std::nullopt;
    }

    [[nodiscard]] std::size_t len() const noexcept {
        return m_allocator.len();
    }

    [[nodiscard]] bool is_empty() const noexcept {
        return m_allocator.is_empty();
    }

    void clear() {
        m_allocator.clear();
        m_values.clear();
    }

    void reserve(std::size_t capacity) {
        m_allocator.reserve(capacity);
        m_values.reserve(capacity);
    }

    void set_slot_limit(std::size_t limit) noexcept {
        m_allocator.set_slot_limit(limit);
    }

    [[nodiscard]] bool is_full() const noexcept {
        return m_allocator.is_full();
    }

    [[nodiscard]] const HandleAllocator<T>& allocator() const noexcept {
        return m_allocator;
    }

    /// Iterate over all live entries
    template<typename F>
    void for_each(F&& func) const {
        for (std::size_t i = 0; i < m_values.size(); ++i) {
            if (m_values[i].has_value()) {
                auto index = static_cast<std::uint32_t>(i);
                func(Handle<T>::create(index, m_allocator.generation_at(index)), m_values[i].value());
            }
        }
    }

    template<typename F>
    void for_each_mut(F&& func) {
        for (std::size_t i = 0; i < m_values.size(); ++i) {
            if (m_values[i].has_value()) {
                auto index = static_cast<std::uint32_t>(i);
                func(Handle<T>::create(index, m_allocator.generation_at(index)), m_values[i].value());
            }
        }
    }

    /// Get result wrapper with error handling
    [[nodiscard]] Result<std::reference_wrapper<const T>> get_result(Handle<T> handle) const {
        if (auto err = check(handle)) {
            return Err<std::reference_wrapper<const T>>(std::move(*err));
        }
        return Ok(std::cref(*get(handle)));
    }

private:
    HandleAllocator<T> m_allocator;
    std::vector<std::optional<T>> m_values;
};

// =============================================================================
// Debug Utilities (Implemented in handle.cpp)
// =============================================================================

namespace debug {

/// Format a raw handle value for debugging
std::string format_handle_bits(std::uint64_t bits);

} // namespace debug

} // namespace lumen_core

/// Hash specialization for Handle
template<typename T>
struct std::hash<lumen_core::Handle<T>> {
    std::size_t operator()(const lumen_core::Handle<T>& h) const noexcept {
        return std::hash<std::uint64_t>{}(h.bits);
    }
};
