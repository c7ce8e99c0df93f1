#pragma once

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

#include "glog/logging.h"

namespace orrery {
namespace base {
namespace internal_not_null {

// A wrapper around a pointer (raw or |std::unique_ptr|) which is guaranteed
// not to be null.  Construction from a null pointer fails a |CHECK|.  The
// wrapper converts implicitly to the underlying pointer, so that it can be
// passed to functions expecting the pointer itself.
template<typename Pointer>
class not_null final {
 public:
  using pointer = Pointer;
  using element_type = std::remove_reference_t<decltype(*std::declval<Pointer>())>;

  not_null() = delete;
  not_null(std::nullptr_t) = delete;  // NOLINT(runtime/explicit)

  // Implicit so that a |T*| may be passed where a |not_null<T*>| is expected.
  not_null(Pointer pointer);  // NOLINT(runtime/explicit)

  template<typename OtherPointer,
           typename = std::enable_if_t<
               std::is_convertible_v<OtherPointer, Pointer> &&
               !std::is_same_v<OtherPointer, Pointer>>>
  not_null(not_null<OtherPointer> other);  // NOLINT(runtime/explicit)

  not_null(not_null const&) = default;
  not_null(not_null&&) = default;
  not_null& operator=(not_null const&) = default;
  not_null& operator=(not_null&&) = default;

  // Returns the underlying pointer.
  operator Pointer const&() const&;  // NOLINT(runtime/explicit)
  operator Pointer&&() &&;  // NOLINT(runtime/explicit)

  element_type& operator*() const;
  decltype(std::addressof(std::declval<element_type&>())) operator->() const;

  // For |unique_ptr|s.
  template<typename P = Pointer>
  decltype(std::declval<P const&>().get()) get() const;

  Pointer const& underlying() const;

 private:
  template<typename OtherPointer>
  friend class not_null;

  Pointer pointer_;
};

template<typename Pointer>
not_null<Pointer>::not_null(Pointer pointer) : pointer_(std::move(pointer)) {
  CHECK(pointer_ != nullptr);
}

template<typename Pointer>
template<typename OtherPointer, typename>
not_null<Pointer>::not_null(not_null<OtherPointer> other)
    : pointer_(std::move(other.pointer_)) {}

template<typename Pointer>
not_null<Pointer>::operator Pointer const&() const& {
  return pointer_;
}

template<typename Pointer>
not_null<Pointer>::operator Pointer&&() && {
  return std::move(pointer_);
}

template<typename Pointer>
typename not_null<Pointer>::element_type& not_null<Pointer>::operator*()
    const {
  return *pointer_;
}

template<typename Pointer>
decltype(std::addressof(
    std::declval<typename not_null<Pointer>::element_type&>()))
not_null<Pointer>::operator->() const {
  return std::addressof(*pointer_);
}

template<typename Pointer>
template<typename P>
decltype(std::declval<P const&>().get()) not_null<Pointer>::get() const {
  return pointer_.get();
}

template<typename Pointer>
Pointer const& not_null<Pointer>::underlying() const {
  return pointer_;
}

template<typename Left, typename Right>
bool operator==(not_null<Left> const& left, not_null<Right> const& right) {
  return left.underlying() == right.underlying();
}

template<typename Left, typename Right>
bool operator<(not_null<Left> const& left, not_null<Right> const& right) {
  return left.underlying() < right.underlying();
}

template<typename Pointer>
not_null<Pointer> check_not_null(Pointer pointer) {
  return not_null<Pointer>(std::move(pointer));
}

template<typename T, typename... Args>
not_null<std::unique_ptr<T>> make_not_null_unique(Args&&... args) {
  return not_null<std::unique_ptr<T>>(
      std::make_unique<T>(std::forward<Args>(args)...));
}

}  // namespace internal_not_null

using internal_not_null::check_not_null;
using internal_not_null::make_not_null_unique;
using internal_not_null::not_null;

}  // namespace base
}  // namespace orrery
