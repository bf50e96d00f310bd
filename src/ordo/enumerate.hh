#pragma once

#include <ordo/assert.hh>
#include <ordo/fwd.hh>

#include <cstdint>
#include <type_traits>
#include <utility>

// Enumeration protocol for ordered containers
//
// Besides plain iteration (begin/end), ordered maps support a signal-driven fold:
//
//     auto r = map.reduce(0, [](int acc, auto const& entry) {
//         if (entry.first == "stop")
//             return ordo::halt(acc);
//         return ordo::cont(acc + entry.second);
//     });
//
// After every entry the callback tells the traversal how to proceed:
//   - ordo::cont(acc)     continue with the new accumulator
//   - ordo::halt(acc)     stop immediately, result status is halted
//   - ordo::suspend(acc)  pause, result status is suspended and r.rest resumes at the next entry:
//                         map.resume(r.rest, r.acc, fn)
//
// Everything is synchronous: "suspend" only hands a pull cursor back to the caller.

/// How a fold callback wants the traversal to continue.
enum class ordo::step_kind
{
    cont,
    halt,
    suspend,
};

/// How a fold ended.
enum class ordo::reduction_status
{
    done,
    halted,
    suspended,
};

/// Signal returned by a fold callback: the next accumulator and what to do with it.
template <class Acc>
struct ordo::step
{
    step_kind kind = step_kind::cont;
    Acc acc;
};

namespace ordo
{
template <class Acc>
[[nodiscard]] constexpr step<std::decay_t<Acc>> cont(Acc&& acc)
{
    return {step_kind::cont, std::forward<Acc>(acc)};
}
template <class Acc>
[[nodiscard]] constexpr step<std::decay_t<Acc>> halt(Acc&& acc)
{
    return {step_kind::halt, std::forward<Acc>(acc)};
}
template <class Acc>
[[nodiscard]] constexpr step<std::decay_t<Acc>> suspend(Acc&& acc)
{
    return {step_kind::suspend, std::forward<Acc>(acc)};
}
} // namespace ordo

/// Pull-based traversal position inside an ordered map.
///
/// next() yields one entry at a time in insertion order and returns nullptr once exhausted.
/// A cursor observes the map, it does not own it: the map must outlive the cursor,
/// and structurally modifying the map (inserting or removing keys) while a cursor is
/// in flight is a programming error that is caught by an assertion on the next pull.
/// Overwriting the value of an existing key keeps cursors valid.
template <class Map>
struct ordo::cursor
{
    using entry_type = typename Map::value_type;

    /// A default cursor is exhausted.
    cursor() = default;

    /// Returns the next entry and advances, or nullptr when the traversal is complete.
    [[nodiscard]] entry_type const* next()
    {
        if (_map == nullptr)
            return nullptr;

        ORDO_ASSERT(_stamp == _map->_stamp, "cursor used after the map was structurally modified");

        auto const& ledger = _map->_ledger;
        while (_slot < isize(ledger.size()) && !ledger[_slot].has_value())
            ++_slot;

        if (_slot >= isize(ledger.size()))
        {
            _map = nullptr;
            return nullptr;
        }

        ++_yielded;
        return &*ledger[_slot++];
    }

    /// True if next() is guaranteed to return nullptr.
    [[nodiscard]] bool is_exhausted() const
    {
        if (_map == nullptr)
            return true;
        return _yielded >= _map->size();
    }

    /// Number of entries this cursor has yielded so far.
    [[nodiscard]] isize position() const { return _yielded; }

private:
    explicit cursor(Map const& map) : _map(&map), _stamp(map._stamp) {}

    Map const* _map = nullptr;
    isize _slot = 0;
    isize _yielded = 0;
    std::uint64_t _stamp = 0;

    friend Map;
};

/// Outcome of a fold over an ordered map.
/// When suspended, `rest` continues with the first entry that was not yet visited.
template <class Acc, class Map>
struct ordo::reduction
{
    reduction_status status = reduction_status::done;
    Acc acc;
    cursor<Map> rest;

    [[nodiscard]] bool is_done() const { return status == reduction_status::done; }
    [[nodiscard]] bool is_halted() const { return status == reduction_status::halted; }
    [[nodiscard]] bool is_suspended() const { return status == reduction_status::suspended; }
};
