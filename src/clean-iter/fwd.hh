#pragma once

#include <cstddef>
#include <cstdint>


namespace ci
{

//
// Primitives
//

// Explicitly-sized primitive types
// We use these wherever the range matters (element types of the primitive entry points, sums, indices).
// Plain "int" is fine for small counts in tests and examples.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// floating point
using f32 = float;
using f64 = double;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes, indices and counts are signed i64 throughout (detect_index returns -1, take/drop counts can be
// validated for negativity, "size - 1" never wraps).
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Callables
//

template <class Signature>
struct function_ref;

//
// Views
//

template <class T>
struct span;

//
// Values
//

struct nullopt_t;
template <class T>
struct optional;

template <class T, class U>
struct pair;

//
// Container
//

template <class T, class ContainerT>
struct allocating_container;

template <class T>
struct vector;

template <class K, class V>
struct list_multimap;

template <class ContainerT>
struct partition_result;

//
// Immutable collaborators
//

template <class T>
struct immutable_list;
template <class K, class V>
struct immutable_map;
struct interval;

//
// Iteration protocol
//

enum class iteration_capability;
enum class fold_result;

template <class Derived>
struct rich_iterable;

namespace impl
{
template <class EngineT>
struct engine_ops;

struct sequential_engine;
struct random_access_engine;
struct array_engine;
struct rich_engine;
} // namespace impl

//
// Errors
//

class invalid_argument_error;
class unsupported_operation_error;

} // namespace ci
