#pragma once

#include <clean-iter/fwd.hh>
#include <clean-iter/invocable.hh>
#include <clean-iter/utility.hh>

#include <type_traits>

/// Non-owning reference to a callable object with signature T
///
/// Similar to std::function_ref (C++26), a trivially copyable view of any callable object.
/// The per-type entry points of primitive.hh take their operations as function_ref,
/// so that one non-template function serves every lambda a caller passes.
///
/// IMPORTANT LIFETIME RULE:
///   function_ref never owns. Any referenced callable object must outlive the function_ref.
///   Binding to temporaries is fine for immediate function arguments only.
///
/// Supports implicit construction from:
///   - function pointers
///   - lambdas / functors
///   - pointer-to-member functions
///   - pointer-to-member objects
///
/// Usage example:
///   ci::isize count_even(ci::span<int const> values, ci::function_ref<bool(int)> pred);
///
///   count_even(values, [](int x) { return x % 2 == 0; });
///
/// Limitations:
///   - Does not support noexcept qualification in signature
///   - Does not support ref-qualified signatures (e.g., R() &&)
template <class R, class... Args>
struct ci::function_ref<R(Args...)>
{
    // internal storage
private:
    void* _payload = nullptr;
    R (*_thunk)(void*, Args...) = nullptr;

    // construction
public:
    /// default constructor creates an invalid/null function_ref
    function_ref() = default;

    /// construct from any callable that can be invoked with Args... and returns something convertible to R
    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, function_ref> && ci::is_invocable_r<R, F&, Args...>)
    function_ref(F&& f) : _payload((void*)&f)
    {
        using Fn = std::remove_reference_t<F>;
        // NOLINTBEGIN
        _thunk = [](void* p, Args... args) -> R { return ci::invoke(*static_cast<Fn*>(p), ci::forward<Args>(args)...); };
        // NOLINTEND
    }

    // copy and move (trivial, compiler-generated)
public:
    function_ref(function_ref const&) = default;
    function_ref(function_ref&&) = default;
    function_ref& operator=(function_ref const&) = default;
    function_ref& operator=(function_ref&&) = default;
    ~function_ref() = default;

    // queries
public:
    /// returns true if this function_ref references a valid callable
    [[nodiscard]] bool is_valid() const { return _thunk != nullptr; }

    [[nodiscard]] explicit operator bool() const { return is_valid(); }

    // invocation
public:
    /// invoke the referenced callable with the given arguments
    /// precondition: is_valid()
    R operator()(Args... args) const
    {
        CI_ASSERT(_thunk != nullptr, "calling invalid function_ref is UB");
        return _thunk(_payload, ci::forward<Args>(args)...);
    }
};
