#include "outflow/raw-bytes.hpp"

#include <cassert>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <new>
#include <span>
#include <string_view>
#include <utility>

#include "outflow/raw-chars.hpp"

namespace outflow {

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType>::RawBytesBase(size_type capacity)
    : _buf(static_cast<pointer>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType>::RawBytesBase(ViewType data) : RawBytesBase(static_cast<size_type>(data.size())) {
  if (!data.empty()) {
    std::memcpy(_buf, data.data(), _capacity);
    _size = _capacity;
  }
}

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType>::RawBytesBase(const RawBytesBase &rhs) : RawBytesBase(rhs.size()) {
  _size = rhs.size();
  if (!empty()) {
    std::memcpy(_buf, rhs.data(), _size);
  }
}

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType>::RawBytesBase(RawBytesBase &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType> &RawBytesBase<T, ViewType, SizeType>::operator=(RawBytesBase &&rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType> &RawBytesBase<T, ViewType, SizeType>::operator=(const RawBytesBase &rhs) {
  if (this != &rhs) {
    reserve(rhs.size());
    _size = rhs.size();
    if (!empty()) {
      std::memcpy(_buf, rhs.data(), _size);
    }
  }
  return *this;
}

template <class T, class ViewType, class SizeType>
RawBytesBase<T, ViewType, SizeType>::~RawBytesBase() {
  std::free(_buf);
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::unchecked_append(const_pointer first, const_pointer last) {
  if (first != last) {
    const auto sz = static_cast<size_type>(last - first);
    std::memcpy(_buf + _size, first, sz);
    _size += sz;
  }
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::append(const_pointer first, const_pointer last) {
  assert(first <= last);
  ensureAvailableCapacityExponential(static_cast<size_type>(last - first));
  unchecked_append(first, last);
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::push_back(value_type byte) {
  ensureAvailableCapacityExponential(1U);
  _buf[_size++] = byte;
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::erase_front(size_type n) {
  assert(n <= _size);
  if (n != 0) {
    std::memmove(_buf, _buf + n, _size - n);
    _size -= n;
  }
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::setSize(size_type newSize) {
  assert(newSize <= _capacity);
  _size = newSize;
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::addSize(size_type delta) {
  assert(_size + delta <= _capacity);
  _size += delta;
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::reserve(size_type newCapacity) {
  if (_capacity < newCapacity) {
    reallocUp(newCapacity);
  }
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::ensureAvailableCapacity(size_type availableCapacity) {
  reserve(_size + availableCapacity);
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::ensureAvailableCapacityExponential(size_type availableCapacity) {
  const size_type required = _size + availableCapacity;
  if (_capacity < required) {
    const auto doubled = static_cast<size_type>((_capacity * size_type{2}) + size_type{1});
    // NOLINTNEXTLINE(readability-use-std-min-max) to avoid include of <algorithm>
    reallocUp(required < doubled ? doubled : required);
  }
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::swap(RawBytesBase &rhs) noexcept {
  using std::swap;
  swap(_buf, rhs._buf);
  swap(_size, rhs._size);
  swap(_capacity, rhs._capacity);
}

template <class T, class ViewType, class SizeType>
bool RawBytesBase<T, ViewType, SizeType>::operator==(const RawBytesBase &rhs) const noexcept {
  if (size() != rhs.size()) {
    return false;
  }
  // memcmp with nullptr is undefined behavior even for a zero size
  return empty() || std::memcmp(data(), rhs.data(), size()) == 0;
}

template <class T, class ViewType, class SizeType>
void RawBytesBase<T, ViewType, SizeType>::reallocUp(size_type newCapacity) {
  auto *newBuf = static_cast<pointer>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

template class RawBytesBase<char, std::string_view, std::size_t>;
template class RawBytesBase<std::byte, std::span<const std::byte>, std::size_t>;

}  // namespace outflow
