#pragma once

#include <type_traits>

namespace partstream {

/**
 * A simple growable byte buffer with exponential growth and cheap front erasure.
 * It backs the decoder retention buffer and the encoder scratch buffer, do not use it for general-purpose data
 * storage (prefer vector in that case).
 */
template <class T, class ViewType, class SizeType>
class RawBytesBase {
 public:
  using value_type = T;
  using size_type = SizeType;
  using view_type = ViewType;
  using pointer = value_type *;
  using const_pointer = const value_type *;
  using iterator = value_type *;
  using const_iterator = const value_type *;

  static_assert(std::is_trivially_copyable_v<T> && sizeof(T) == 1);
  static_assert(std::is_unsigned_v<SizeType>, "RawBytesBase requires an unsigned size type");

  RawBytesBase() noexcept = default;

  explicit RawBytesBase(size_type capacity);

  explicit RawBytesBase(ViewType data);

  RawBytesBase(const RawBytesBase &rhs);
  RawBytesBase(RawBytesBase &&rhs) noexcept;

  RawBytesBase &operator=(const RawBytesBase &rhs);
  RawBytesBase &operator=(RawBytesBase &&rhs) noexcept;

  ~RawBytesBase();

  void append(const_pointer first, const_pointer last);

  void append(ViewType data) { append(data.data(), data.data() + data.size()); }

  void push_back(value_type byte);

  void clear() noexcept { _size = 0; }

  // Drops the first 'n' bytes, shifting the remaining ones to the front.
  void erase_front(size_type n);

  [[nodiscard]] size_type size() const noexcept { return _size; }

  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }

  void reserve(size_type newCapacity);

  void ensureAvailableCapacity(size_type availableCapacity);

  [[nodiscard]] pointer data() noexcept { return _buf; }
  [[nodiscard]] const_pointer data() const noexcept { return _buf; }

  [[nodiscard]] iterator begin() noexcept { return _buf; }
  [[nodiscard]] const_iterator begin() const noexcept { return _buf; }

  [[nodiscard]] iterator end() noexcept { return _buf + _size; }
  [[nodiscard]] const_iterator end() const noexcept { return _buf + _size; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  operator ViewType() const noexcept { return {_buf, _size}; }

  bool operator==(const RawBytesBase &rhs) const noexcept;

  using trivially_relocatable = std::true_type;

 private:
  void reserveExponential(size_type newCapacity);

  void reallocUp(size_type newCapacity);

  void unchecked_append(const_pointer first, const_pointer last);

  pointer _buf = nullptr;
  size_type _size = 0;
  size_type _capacity = 0;
};

}  // namespace partstream
