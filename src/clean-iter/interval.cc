#include <clean-iter/errors.hh>
#include <clean-iter/interval.hh>
#include <clean-iter/to_string.hh>

#include <limits>

namespace
{
// |to - from|, exact for every pair of i64
ci::u64 distance(ci::i64 from, ci::i64 to) { return from <= to ? ci::u64(to) - ci::u64(from) : ci::u64(from) - ci::u64(to); }

ci::u64 magnitude(ci::i64 step) { return step < 0 ? ci::u64(0) - ci::u64(step) : ci::u64(step); }
} // namespace

ci::interval ci::interval::from_to_by(i64 from, i64 to, i64 step)
{
    if (step == 0)
        impl::throw_invalid_argument("interval step must not be zero");
    if (from < to && step < 0)
        impl::throw_invalid_argument("interval step must be positive when counting up from " + ci::to_string(from)
                                     + " to " + ci::to_string(to) + ", but was " + ci::to_string(step));
    if (from > to && step > 0)
        impl::throw_invalid_argument("interval step must be negative when counting down from " + ci::to_string(from)
                                     + " to " + ci::to_string(to) + ", but was " + ci::to_string(step));

    // number of steps after the first element
    auto const steps = distance(from, to) / magnitude(step);
    if (steps >= ci::u64(std::numeric_limits<isize>::max()))
        impl::throw_invalid_argument("interval from " + ci::to_string(from) + " to " + ci::to_string(to) + " by "
                                     + ci::to_string(step) + " has too many elements");

    return interval(from, to, step, isize(steps) + 1);
}

bool ci::interval::contains(i64 value) const
{
    if (_step > 0 ? (value < _from || value > _to) : (value > _from || value < _to))
        return false;

    return distance(_from, value) % magnitude(_step) == 0;
}
