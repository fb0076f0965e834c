#pragma once

#include <memory>
#include <utility>

// Owning heap indirection with value semantics.
// Copying a box copies the pointee, comparing two boxes compares the pointees.
// Used for the recursive children of expression nodes, which are owned by
// exactly one parent.
// A moved-from box is empty: it may be assigned, compared or destroyed, but not
// dereferenced.
template<typename T>
class box
{
public:
  box(T value)
    : ptr(std::make_unique<T>(std::move(value)))
  {  }

  box(const box& other)
    : ptr(other.ptr ? std::make_unique<T>(*other.ptr) : nullptr)
  {  }

  box(box&& other) noexcept = default;

  box& operator=(const box& other)
  {
    if(this != &other)
      ptr = other.ptr ? std::make_unique<T>(*other.ptr) : nullptr;
    return *this;
  }

  box& operator=(box&& other) noexcept = default;

  T& operator*() { return *ptr; }
  const T& operator*() const { return *ptr; }

  T* operator->() { return ptr.get(); }
  const T* operator->() const { return ptr.get(); }

  bool empty() const { return ptr == nullptr; }

  bool operator==(const box& other) const
  {
    if(ptr == nullptr || other.ptr == nullptr)
      return ptr == other.ptr;
    return *ptr == *other.ptr;
  }
  bool operator!=(const box& other) const
  { return !(*this == other); }
private:
  std::unique_ptr<T> ptr;
};
