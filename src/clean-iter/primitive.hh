#pragma once

#include <clean-iter/fwd.hh>
#include <clean-iter/function_ref.hh>
#include <clean-iter/optional.hh>
#include <clean-iter/partition_result.hh>
#include <clean-iter/span.hh>
#include <clean-iter/vector.hh>

// =========================================================================================================
// Non-template entry points for numeric element types
// =========================================================================================================
//
// For T in {i8, i16, i32, i64, f32, f64}, ci::primitive offers the core operations over ci::span<T const>
// with ci::function_ref operations. These are plain functions compiled once into the library,
// so callers pay neither template instantiation nor the generic dispatch.
//
// All of them are defined in primitive.cc by forwarding to impl::array_engine.
// Results are identical to the generic ci::select, ci::count, ... on a ci::vector<T>.
//
// sum accumulates in i64 for integer types and f64 for floating point types.
//
// Usage:
//   ci::vector<ci::i32> values = {3, 1, 2};
//   auto const big = ci::primitive::count(ci::span<ci::i32 const>(values), [](ci::i32 v) { return v > 1; });
//   ci::primitive::sort_this(ci::span<ci::i32>(values));

#define CI_IMPL_PRIMITIVE_DECLARE_OPS(T, SumT)                                                                    \
    [[nodiscard]] ci::vector<T> select(ci::span<T const> values, ci::function_ref<bool(T)> pred);                 \
    [[nodiscard]] ci::vector<T> reject(ci::span<T const> values, ci::function_ref<bool(T)> pred);                 \
    [[nodiscard]] ci::partition_result<ci::vector<T>> partition(ci::span<T const> values, ci::function_ref<bool(T)> pred); \
    [[nodiscard]] ci::vector<T> collect(ci::span<T const> values, ci::function_ref<T(T)> fn);                     \
    [[nodiscard]] isize count(ci::span<T const> values, ci::function_ref<bool(T)> pred);                          \
    [[nodiscard]] bool any_satisfy(ci::span<T const> values, ci::function_ref<bool(T)> pred);                     \
    [[nodiscard]] bool all_satisfy(ci::span<T const> values, ci::function_ref<bool(T)> pred);                     \
    [[nodiscard]] bool none_satisfy(ci::span<T const> values, ci::function_ref<bool(T)> pred);                    \
    [[nodiscard]] ci::optional<T> detect(ci::span<T const> values, ci::function_ref<bool(T)> pred);               \
    [[nodiscard]] isize detect_index(ci::span<T const> values, ci::function_ref<bool(T)> pred);                   \
    [[nodiscard]] bool contains(ci::span<T const> values, T value);                                               \
    [[nodiscard]] T inject_into(ci::span<T const> values, T seed, ci::function_ref<T(T, T)> fn);                  \
    [[nodiscard]] SumT sum(ci::span<T const> values);                                                             \
    [[nodiscard]] ci::optional<T> min(ci::span<T const> values);                                                  \
    [[nodiscard]] ci::optional<T> max(ci::span<T const> values);                                                  \
    [[nodiscard]] ci::vector<ci::vector<T>> chunk(ci::span<T const> values, isize size);                          \
    void sort_this(ci::span<T> values)

namespace ci::primitive
{
CI_IMPL_PRIMITIVE_DECLARE_OPS(i8, i64);
CI_IMPL_PRIMITIVE_DECLARE_OPS(i16, i64);
CI_IMPL_PRIMITIVE_DECLARE_OPS(i32, i64);
CI_IMPL_PRIMITIVE_DECLARE_OPS(i64, i64);
CI_IMPL_PRIMITIVE_DECLARE_OPS(f32, f64);
CI_IMPL_PRIMITIVE_DECLARE_OPS(f64, f64);
} // namespace ci::primitive

#undef CI_IMPL_PRIMITIVE_DECLARE_OPS
