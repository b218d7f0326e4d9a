#ifndef FIXED_VECTOR_HPP
#define FIXED_VECTOR_HPP

#include <algorithm>
#include <array>
#include <cassert>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <type_traits>
#include <utility>

// Vector with inline storage and a compile time capacity
template <typename T, std::size_t Capacity>
class FixedVector {
public:
    using value_type = T;
    using size_type = std::size_t;
    using iterator = typename std::array<T, Capacity>::iterator;
    using const_iterator = typename std::array<T, Capacity>::const_iterator;

    FixedVector() : m_buffer{}, m_size(0) {}

    FixedVector(std::initializer_list<T> initList) : m_buffer{}, m_size(static_cast<Size>(initList.size())) {
        assert(initList.size() <= Capacity);
        std::copy(initList.begin(), initList.end(), m_buffer.begin());
    }

    iterator begin() {
        return m_buffer.begin();
    }

    iterator end() {
        return m_buffer.begin() + m_size;
    }

    const_iterator begin() const {
        return m_buffer.begin();
    }

    const_iterator end() const {
        return m_buffer.begin() + m_size;
    }

    T* data() {
        return m_buffer.data();
    }

    const T* data() const {
        return m_buffer.data();
    }

    std::size_t size() const {
        return static_cast<std::size_t>(m_size);
    }

    static constexpr std::size_t capacity() {
        return Capacity;
    }

    bool empty() const {
        return m_size == 0;
    }

    void pushBack(const T& data) {
        assert(m_size < Capacity);
        m_buffer[m_size] = data;
        ++m_size;
    }

    void pushBack(T&& data) {
        assert(m_size < Capacity);
        m_buffer[m_size] = std::move(data);
        ++m_size;
    }

    void clear() {
        // Reset the old elements so that owned resources are released
        std::fill(m_buffer.begin(), m_buffer.begin() + m_size, T{});
        m_size = 0;
    }

    const T& back() const {
        assert(m_size > 0);
        return m_buffer[m_size - 1];
    }

    T& back() {
        assert(m_size > 0);
        return m_buffer[m_size - 1];
    }

    const T& operator[](std::size_t index) const {
        assert(index < m_size);
        return m_buffer[index];
    }

    T& operator[](std::size_t index) {
        assert(index < m_size);
        return m_buffer[index];
    }

    bool contains(const T& data) const {
        return std::find(begin(), end(), data) != end();
    }

    bool operator==(const FixedVector& rhs) const {
        return std::equal(begin(), end(), rhs.begin(), rhs.end());
    }

    auto operator<=>(const FixedVector& rhs) const {
        return std::lexicographical_compare_three_way(
            begin(), end(),
            rhs.begin(), rhs.end(),
            std::compare_three_way()
        );
    }

private:
    using Size =
        std::conditional_t<(Capacity <= std::numeric_limits<std::uint8_t>::max()), std::uint8_t,
        std::conditional_t<(Capacity <= std::numeric_limits<std::uint16_t>::max()), std::uint16_t,
        std::size_t
        >>;

    std::array<T, Capacity> m_buffer;
    Size m_size;
};

#endif // FIXED_VECTOR_HPP
