/**
 * @file secure_vector.hpp
 * @brief Locked, zeroed-on-free storage for shared secrets and
 * constant-time comparison
 */

#pragma once

#include <cstdint>
#include <cstdlib>
#include <new>
#include <span>
#include <vector>

#include <sys/mman.h>
#include <unistd.h>

namespace jwsign {

/**
 * @brief Allocator that locks pages in memory and zeroes them before release
 *
 * Used for HMAC secrets held by Key. Locking is best effort: mlock failures
 * (e.g. RLIMIT_MEMLOCK) do not fail the allocation.
 */
template <typename T>
class SecureAllocator {
 public:
  using value_type = T;
  using size_type = std::size_t;

  template <typename U>
  struct rebind {
    using other = SecureAllocator<U>;
  };

  SecureAllocator() = default;

  template <typename U>
  SecureAllocator(const SecureAllocator<U>&) noexcept {}

  T* allocate(size_t n) {
    if (n == 0) return nullptr;

    size_t page_size = getPageSize();
    size_t aligned_size = alignedSize(n, page_size);

    T* ptr = static_cast<T*>(std::aligned_alloc(page_size, aligned_size));
    if (!ptr) throw std::bad_alloc();

    mlock(ptr, aligned_size);
    return ptr;
  }

  void deallocate(T* ptr, size_t n) noexcept {
    if (!ptr) return;
    size_t aligned_size = alignedSize(n, getPageSize());

    // volatile keeps the compiler from eliding the wipe
    volatile unsigned char* p =
        static_cast<volatile unsigned char*>(static_cast<void*>(ptr));
    for (size_t i = 0; i < n * sizeof(T); ++i) {
      p[i] = 0;
    }

    munlock(ptr, aligned_size);
    std::free(ptr);
  }

  template <typename U>
  bool operator==(const SecureAllocator<U>&) const noexcept {
    return true;
  }

  template <typename U>
  bool operator!=(const SecureAllocator<U>&) const noexcept {
    return false;
  }

 private:
  static size_t getPageSize() noexcept {
    return static_cast<size_t>(sysconf(_SC_PAGESIZE));
  }

  static size_t alignedSize(size_t n, size_t page_size) noexcept {
    size_t size = n * sizeof(T);
    return ((size + page_size - 1) / page_size) * page_size;
  }
};

template <typename T>
using SecureVector = std::vector<T, SecureAllocator<T>>;

namespace secure_utils {

/**
 * @brief Constant-time memory comparison
 *
 * Every byte of both regions is visited regardless of where the first
 * difference occurs.
 * @return 0 if equal, non-zero otherwise
 */
inline int constantTimeCompare(const void* a, const void* b,
                               size_t size) noexcept {
  const volatile unsigned char* va =
      static_cast<const volatile unsigned char*>(a);
  const volatile unsigned char* vb =
      static_cast<const volatile unsigned char*>(b);
  unsigned char result = 0;

  for (size_t i = 0; i < size; ++i) {
    result |= va[i] ^ vb[i];
  }

  return result;
}

/**
 * @brief Constant-time equality of two byte sequences
 *
 * Length is not secret: sequences of different length compare unequal
 * immediately. For equal lengths the running time depends only on the
 * length.
 */
inline bool constantTimeEqual(std::span<const uint8_t> a,
                              std::span<const uint8_t> b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  if (a.empty()) {
    return true;
  }
  return constantTimeCompare(a.data(), b.data(), a.size()) == 0;
}

template <typename T>
SecureVector<T> to_secure_vector(std::span<const T> data) {
  return SecureVector<T>(data.begin(), data.end());
}

}  // namespace secure_utils

}  // namespace jwsign
