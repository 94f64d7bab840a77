// Copyright 2010-2025 Google LLC
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// StrongInt<Tag, T> is a "logical" integer type carrying a unit tag. Two
// values can be added or compared only if they have the same tag, and a raw
// integer never converts implicitly into a StrongInt. This is the dimension
// check used for every length and coordinate handled by the packer: a width in
// one unit cannot be added to an offset in another one by mistake.
//
// Usage:
//   DEFINE_STRONG_INT_TYPE(Coordinate, int64_t);
//
//   Coordinate x(3);
//   Coordinate w(4);
//   Coordinate end = x + w;        // OK.
//   int64_t raw = end.value();     // Explicit unwrapping.
//   Coordinate bad = x + 4;        // Does not compile.
//
// Supported operations:
//     -StrongInt<T>
//     StrongInt<T> +/- StrongInt<T> => StrongInt<T>
//     all comparisons between two StrongInt<T>
//
// The class has a single data member and all methods are inline, so a
// StrongInt compiles away to its native type. Pass it by value.

#ifndef RECTPACK_BASE_STRONG_INT_H_
#define RECTPACK_BASE_STRONG_INT_H_

#include <limits>
#include <ostream>
#include <type_traits>
#include <utility>

namespace rectpack {

template <typename TagType, typename NativeType>
class StrongInt {
 public:
  typedef NativeType ValueType;

  constexpr StrongInt() : value_(NativeType()) {}

  // Explicit initialization from a numeric primitive.
  template <
      class T,
      class = std::enable_if_t<std::is_same_v<
          decltype(static_cast<ValueType>(std::declval<T>())), ValueType>>>
  explicit constexpr StrongInt(T init_value)
      : value_(static_cast<ValueType>(init_value)) {}

  constexpr ValueType value() const { return value_; }

  constexpr StrongInt operator-() const { return StrongInt(-value_); }

 private:
  ValueType value_;

  static_assert(std::numeric_limits<ValueType>::is_integer,
                "invalid integer type for strong int");
  static_assert(std::numeric_limits<ValueType>::is_signed,
                "coordinates and lengths must be signed");
};

template <typename TagType, typename ValueType>
std::ostream& operator<<(std::ostream& os, StrongInt<TagType, ValueType> arg) {
  return os << arg.value();
}

#define RECTPACK_STRONG_INT_VS_STRONG_INT_BINARY_OP(op)      \
  template <typename TagType, typename ValueType>            \
  constexpr StrongInt<TagType, ValueType> operator op(       \
      StrongInt<TagType, ValueType> lhs,                     \
      StrongInt<TagType, ValueType> rhs) {                   \
    return StrongInt<TagType, ValueType>(                    \
        static_cast<ValueType>(lhs.value() op rhs.value())); \
  }
RECTPACK_STRONG_INT_VS_STRONG_INT_BINARY_OP(+);
RECTPACK_STRONG_INT_VS_STRONG_INT_BINARY_OP(-);
#undef RECTPACK_STRONG_INT_VS_STRONG_INT_BINARY_OP

#define RECTPACK_STRONG_INT_COMPARISON_OP(op)                     \
  template <typename TagType, typename ValueType>                 \
  constexpr bool operator op(StrongInt<TagType, ValueType> lhs,   \
                             StrongInt<TagType, ValueType> rhs) { \
    return lhs.value() op rhs.value();                            \
  }
RECTPACK_STRONG_INT_COMPARISON_OP(==);  // NOLINT(whitespace/operators)
RECTPACK_STRONG_INT_COMPARISON_OP(!=);  // NOLINT(whitespace/operators)
RECTPACK_STRONG_INT_COMPARISON_OP(<);   // NOLINT(whitespace/operators)
RECTPACK_STRONG_INT_COMPARISON_OP(<=);  // NOLINT(whitespace/operators)
RECTPACK_STRONG_INT_COMPARISON_OP(>);   // NOLINT(whitespace/operators)
RECTPACK_STRONG_INT_COMPARISON_OP(>=);  // NOLINT(whitespace/operators)
#undef RECTPACK_STRONG_INT_COMPARISON_OP

}  // namespace rectpack

// Defines a StrongInt named type_name over value_type. The tag struct makes
// every definition a distinct type, even with the same value_type.
#define DEFINE_STRONG_INT_TYPE(type_name, value_type)                    \
  struct type_name##_strong_int_tag_ {};                                 \
  typedef ::rectpack::StrongInt<type_name##_strong_int_tag_, value_type> \
      type_name;

#endif  // RECTPACK_BASE_STRONG_INT_H_
