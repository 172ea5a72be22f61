#pragma once

#include <clean-iter/fwd.hh>

/// Result of partition: the elements that satisfied the predicate and those that did not.
/// Both containers keep traversal order (for ordered container types).
/// Every source element ends up in exactly one of them.
///
/// Usage:
///   auto [evens, odds] = ci::partition(values, is_even);
template <class ContainerT>
struct ci::partition_result
{
    ContainerT selected;
    ContainerT rejected;
};
