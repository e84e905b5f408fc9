/*
 * Isomorph - Deep structural equality for dynamically typed values
 * Copyright (C) 2025  Ivan Pidhurskyi
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */


#pragma once

#include <gc.h>

#include <cstddef>
#include <cstring>
#include <new>
#include <string_view>
#include <type_traits>
#include <utility>

/**
 * \file memory.hpp
 * Garbage-collected allocation for heap objects and their payloads
 *
 * Every object reachable from an iso::value lives in Boehm GC memory. Payloads
 * that hold pointers to other objects are allocated with GC_malloc (scanned),
 * scalar payloads and character data with GC_malloc_atomic (not scanned).
 * Destructors of GC-allocated objects never run.
 *
 * \ingroup memory
 */

namespace iso {

/**
 * Create a garbage-collected object
 *
 * The memory is scanned by the collector, so \p T may hold pointers to other
 * collected objects (including through containers using gc_allocator).
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make(Args&& ...args)
{
  void *mem = GC_malloc(sizeof(T));
  if (mem == nullptr)
    throw std::bad_alloc {};
  return new (mem) T {std::forward<Args>(args)...};
}

/**
 * Create a garbage-collected object whose memory is not scanned for pointers
 *
 * \ingroup memory
 */
template <typename T, typename ...Args>
T*
make_atomic(Args&& ...args)
{
  void *mem = GC_malloc_atomic(sizeof(T));
  if (mem == nullptr)
    throw std::bad_alloc {};
  return new (mem) T {std::forward<Args>(args)...};
}

inline void*
allocate(size_t size)
{
  void *mem = GC_malloc(size);
  if (mem == nullptr)
    throw std::bad_alloc {};
  return mem;
}

inline void*
allocate_atomic(size_t size)
{
  void *mem = GC_malloc_atomic(size);
  if (mem == nullptr)
    throw std::bad_alloc {};
  return mem;
}

/**
 * Copy a string into atomic collected memory
 *
 * The copy is zero-terminated; the terminator is not counted in the returned
 * view.
 */
inline std::string_view
copy_string(std::string_view str)
{
  char *data = static_cast<char*>(allocate_atomic(str.size() + 1));
  std::memcpy(data, str.data(), str.size());
  data[str.size()] = '\0';
  return {data, str.size()};
}


/**
 * STL allocator drawing from scanned collected memory
 *
 * Containers that store values (or raw object pointers) must use this
 * allocator, otherwise the collector cannot see the references they hold.
 *
 * \ingroup memory
 */
template <typename T>
struct gc_allocator {
  using value_type = T;
  using size_type = size_t;
  using difference_type = ptrdiff_t;
  using propagate_on_container_move_assignment = std::true_type;
  using is_always_equal = std::true_type;

  gc_allocator() noexcept = default;

  template <typename U>
  gc_allocator(const gc_allocator<U>&) noexcept { }

  [[nodiscard]] T*
  allocate(size_type n)
  { return static_cast<T*>(iso::allocate(n * sizeof(T))); }

  void
  deallocate(T *p, [[maybe_unused]] size_type n) noexcept
  { GC_free(p); }

  template <typename U>
  bool
  operator == (const gc_allocator<U>&) const noexcept
  { return true; }
}; // struct iso::gc_allocator

} // namespace iso
