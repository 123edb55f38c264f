/**
 * @file ring_buffer.h
 * @brief Fixed-size circular buffer for sample history
 *
 * Overwrites the oldest element when full. Not thread-safe; the owner
 * provides synchronization.
 */

#pragma once

#include <cstddef>
#include <vector>

namespace semcache::utils {

/**
 * @brief Fixed-size circular buffer with automatic overwrite
 *
 * A capacity of 0 yields a buffer that accepts and discards every push.
 *
 * @tparam T Element type to store
 */
template <typename T>
class RingBuffer {
 public:
  /**
   * @brief Construct a ring buffer with fixed capacity
   * @param capacity Maximum number of elements to store
   */
  explicit RingBuffer(size_t capacity) : buffer_(capacity), capacity_(capacity) {}

  /**
   * @brief Add an element, overwriting the oldest one when full
   */
  void Push(const T& item) {
    if (capacity_ == 0) {
      return;
    }
    buffer_[head_] = item;
    head_ = (head_ + 1) % capacity_;
    if (size_ < capacity_) {
      ++size_;
    }
  }

  /**
   * @brief Get all elements, oldest first
   */
  [[nodiscard]] std::vector<T> GetAll() const {
    std::vector<T> result;
    result.reserve(size_);
    // Oldest element sits at head_ once the buffer has wrapped
    const size_t start = size_ < capacity_ ? 0 : head_;
    for (size_t i = 0; i < size_; ++i) {
      result.push_back(buffer_[(start + i) % capacity_]);
    }
    return result;
  }

  [[nodiscard]] size_t Size() const { return size_; }
  [[nodiscard]] size_t Capacity() const { return capacity_; }

  void Clear() {
    head_ = 0;
    size_ = 0;
  }

 private:
  std::vector<T> buffer_;  ///< Underlying storage
  size_t head_ = 0;        ///< Index where next element will be written
  size_t size_ = 0;        ///< Current number of elements
  size_t capacity_;        ///< Maximum capacity
};

}  // namespace semcache::utils
