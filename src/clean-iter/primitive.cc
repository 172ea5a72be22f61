#include <clean-iter/impl/array_engine.hh>
#include <clean-iter/primitive.hh>

#define CI_IMPL_PRIMITIVE_DEFINE_OPS(T, SumT)                                                                      \
    ci::vector<T> ci::primitive::select(ci::span<T const> values, ci::function_ref<bool(T)> pred)                  \
    {                                                                                                              \
        return impl::array_engine::select(values, pred);                                                           \
    }                                                                                                              \
    ci::vector<T> ci::primitive::reject(ci::span<T const> values, ci::function_ref<bool(T)> pred)                  \
    {                                                                                                              \
        return impl::array_engine::reject(values, pred);                                                           \
    }                                                                                                              \
    ci::partition_result<ci::vector<T>> ci::primitive::partition(ci::span<T const> values, ci::function_ref<bool(T)> pred) \
    {                                                                                                              \
        return impl::array_engine::partition(values, pred);                                                        \
    }                                                                                                              \
    ci::vector<T> ci::primitive::collect(ci::span<T const> values, ci::function_ref<T(T)> fn)                      \
    {                                                                                                              \
        return impl::array_engine::collect(values, fn);                                                            \
    }                                                                                                              \
    ci::isize ci::primitive::count(ci::span<T const> values, ci::function_ref<bool(T)> pred)                       \
    {                                                                                                              \
        return impl::array_engine::count(values, pred);                                                            \
    }                                                                                                              \
    bool ci::primitive::any_satisfy(ci::span<T const> values, ci::function_ref<bool(T)> pred)                      \
    {                                                                                                              \
        return impl::array_engine::any_satisfy(values, pred);                                                      \
    }                                                                                                              \
    bool ci::primitive::all_satisfy(ci::span<T const> values, ci::function_ref<bool(T)> pred)                      \
    {                                                                                                              \
        return impl::array_engine::all_satisfy(values, pred);                                                      \
    }                                                                                                              \
    bool ci::primitive::none_satisfy(ci::span<T const> values, ci::function_ref<bool(T)> pred)                     \
    {                                                                                                              \
        return impl::array_engine::none_satisfy(values, pred);                                                     \
    }                                                                                                              \
    ci::optional<T> ci::primitive::detect(ci::span<T const> values, ci::function_ref<bool(T)> pred)                \
    {                                                                                                              \
        return impl::array_engine::detect(values, pred);                                                           \
    }                                                                                                              \
    ci::isize ci::primitive::detect_index(ci::span<T const> values, ci::function_ref<bool(T)> pred)                \
    {                                                                                                              \
        return impl::array_engine::detect_index(values, pred);                                                     \
    }                                                                                                              \
    bool ci::primitive::contains(ci::span<T const> values, T value)                                                \
    {                                                                                                              \
        return impl::array_engine::contains(values, value);                                                        \
    }                                                                                                              \
    T ci::primitive::inject_into(ci::span<T const> values, T seed, ci::function_ref<T(T, T)> fn)                   \
    {                                                                                                              \
        return impl::array_engine::inject_into(values, seed, fn);                                                  \
    }                                                                                                              \
    SumT ci::primitive::sum(ci::span<T const> values)                                                              \
    {                                                                                                              \
        return impl::array_engine::inject_into(values, SumT(0), [](SumT acc, T v) { return SumT(acc + SumT(v)); }); \
    }                                                                                                              \
    ci::optional<T> ci::primitive::min(ci::span<T const> values)                                                   \
    {                                                                                                              \
        return impl::array_engine::min(values);                                                                    \
    }                                                                                                              \
    ci::optional<T> ci::primitive::max(ci::span<T const> values)                                                   \
    {                                                                                                              \
        return impl::array_engine::max(values);                                                                    \
    }                                                                                                              \
    ci::vector<ci::vector<T>> ci::primitive::chunk(ci::span<T const> values, isize size)                           \
    {                                                                                                              \
        return impl::array_engine::chunk(values, size);                                                            \
    }                                                                                                              \
    void ci::primitive::sort_this(ci::span<T> values)                                                              \
    {                                                                                                              \
        impl::array_engine::sort_this(values);                                                                     \
    }                                                                                                              \
    static_assert(true, "") // swallow semicolon

CI_IMPL_PRIMITIVE_DEFINE_OPS(ci::i8, ci::i64);
CI_IMPL_PRIMITIVE_DEFINE_OPS(ci::i16, ci::i64);
CI_IMPL_PRIMITIVE_DEFINE_OPS(ci::i32, ci::i64);
CI_IMPL_PRIMITIVE_DEFINE_OPS(ci::i64, ci::i64);
CI_IMPL_PRIMITIVE_DEFINE_OPS(ci::f32, ci::f64);
CI_IMPL_PRIMITIVE_DEFINE_OPS(ci::f64, ci::f64);
