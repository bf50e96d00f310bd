#pragma once

#include <ordo/assert.hh>
#include <ordo/enumerate.hh>
#include <ordo/errors.hh>
#include <ordo/fwd.hh>
#include <ordo/render.hh>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>


/// Associative container mapping keys of type K to values of type V that enumerates in insertion order.
///
/// Iteration yields std::pair<K const, V> in the order in which keys were first inserted.
/// Overwriting the value of a present key never moves it; removing a key and inserting it again
/// appends it at the current tail.
///
/// Representation:
///   - position ledger: a vector of slots in insertion order, each either live (holding the entry)
///     or a tombstone left behind by a removal
///   - value store: a hash index from key to the ledger slot of its entry
///
/// The two structures are private and only changed together, so at every observable state the
/// live ledger keys and the indexed keys are the same set and every index entry names the slot
/// holding its key. Trailing tombstones are dropped right away and the ledger is compacted once
/// tombstones make up half of it, which keeps removal O(1) amortized.
///
/// Complexity (average): lookup, put, update and membership O(1); appending a new key O(1) amortized;
/// remove and pop O(1) amortized; size O(1).
///
/// Value semantics: copies are deep and independent. All operations are all-or-nothing: if a
/// caller-supplied function, a key/value copy or an ingestion source throws, the map is left as it was.
///
/// Construction from a source without a defined order (e.g. a std::unordered_map) produces an
/// unspecified order. Use an ordered source (vector of pairs, std::map, another ordered_map) when the
/// order matters.
template <class K, class V, class HashT, class EqualT>
struct ordo::ordered_map
{
    // member types
public:
    using key_type = K;
    using mapped_type = V;
    using value_type = std::pair<K const, V>;
    using hasher = HashT;
    using key_equal = EqualT;

    /// Marks the type for ordo::render and the key path helpers.
    static constexpr bool is_ordered_map = true;

    /// The ledger is compacted once tombstones make up at least 1/compaction_divisor of it.
    static constexpr isize compaction_divisor = 2;
    /// Ledgers with fewer slots than this are never compacted.
    static constexpr isize compaction_min_slots = 16;

    template <bool IsConst>
    struct basic_iterator;
    using iterator = basic_iterator<false>;
    using const_iterator = basic_iterator<true>;

    template <bool Keys>
    struct projection_view;
    using key_view = projection_view<true>;
    using value_view = projection_view<false>;

    // internal storage types
private:
    using ledger_t = std::vector<std::optional<value_type>>;
    using index_t = std::unordered_map<K, isize, HashT, EqualT>;

    // construction
public:
    ordered_map() = default;

    /// Builds the map from pairs, e.g. ordo::ordered_map<std::string, int>{{"a", 1}, {"b", 2}}.
    /// Duplicate keys keep their first position and their last value.
    ordered_map(std::initializer_list<std::pair<K, V>> entries) { extend(entries); }

    /// Builds the map from an iterator range of pairs, with the same rules as extend().
    template <std::input_iterator It, std::sentinel_for<It> Sentinel>
    ordered_map(It first, Sentinel last)
    {
        for (; first != last; ++first)
        {
            auto&& e = *first;
            put(K(std::get<0>(e)), V(std::get<1>(e)));
        }
    }

    /// Creates a map from any range whose elements are (key, value) pairs.
    template <class Range>
    [[nodiscard]] static ordered_map create_from(Range&& source)
    {
        auto m = ordered_map();
        m.extend(std::forward<Range>(source));
        return m;
    }

    /// Creates a map from any range, mapping every element through fn into a (key, value) pair first.
    template <class Range, class F>
    [[nodiscard]] static ordered_map create_from_transformed(Range&& source, F&& fn)
    {
        auto m = ordered_map();
        for (auto&& e : source)
        {
            auto&& kv = std::invoke(fn, e);
            m.put(K(std::get<0>(kv)), V(std::get<1>(kv)));
        }
        return m;
    }

    // ordered_map has deep-copy value semantics
    ~ordered_map() = default;
    ordered_map(ordered_map const&) = default;
    ordered_map& operator=(ordered_map const& rhs)
    {
        if (this != &rhs)
        {
            auto copy = rhs;
            *this = std::move(copy);
        }
        return *this;
    }
    ordered_map(ordered_map&& rhs) noexcept
      : _ledger(std::move(rhs._ledger)), _index(std::move(rhs._index)), _tombstones(rhs._tombstones), _stamp(rhs._stamp)
    {
        rhs.impl_reset();
    }
    ordered_map& operator=(ordered_map&& rhs) noexcept
    {
        if (this != &rhs)
        {
            _ledger = std::move(rhs._ledger);
            _index = std::move(rhs._index);
            _tombstones = rhs._tombstones;
            _stamp = std::max(_stamp, rhs._stamp) + 1; // invalidates cursors into either map
            rhs.impl_reset();
        }
        return *this;
    }

    // queries
public:
    /// Number of entries, O(1).
    [[nodiscard]] isize size() const { return isize(_index.size()); }
    [[nodiscard]] bool empty() const { return _index.empty(); }

    /// O(1) average membership test against the value store.
    [[nodiscard]] bool has_key(K const& key) const { return _index.contains(key); }
    [[nodiscard]] bool contains(K const& key) const { return _index.contains(key); }

    /// True if key is present and holds a value equal to value.
    /// Uses the value store, never scans the ledger.
    [[nodiscard]] bool contains_entry(K const& key, V const& value) const
    {
        auto const* v = try_get(key);
        return v != nullptr && *v == value;
    }

    // element access
public:
    /// Pointer to the value stored under key, nullptr if absent.
    /// Distinguishes "not found" from a present key holding an empty-like value.
    [[nodiscard]] V const* try_get(K const& key) const
    {
        auto const it = _index.find(key);
        if (it == _index.end())
            return nullptr;
        return &_ledger[it->second]->second;
    }
    [[nodiscard]] V* try_get(K const& key)
    {
        auto const it = _index.find(key);
        if (it == _index.end())
            return nullptr;
        return &_ledger[it->second]->second;
    }

    /// Copy of the value stored under key, std::nullopt if absent.
    [[nodiscard]] std::optional<V> fetch(K const& key) const
    {
        if (auto const* v = try_get(key))
            return *v;
        return std::nullopt;
    }

    /// The value stored under key, or default_value if absent.
    [[nodiscard]] V get(K const& key, V default_value) const
    {
        if (auto const* v = try_get(key))
            return *v;
        return default_value;
    }

    /// Checked access. Throws ordo::key_not_found_error if key is absent.
    [[nodiscard]] V& at(K const& key)
    {
        auto* v = try_get(key);
        if (v == nullptr)
            impl_throw_key_not_found(key);
        return *v;
    }
    [[nodiscard]] V const& at(K const& key) const
    {
        auto const* v = try_get(key);
        if (v == nullptr)
            impl_throw_key_not_found(key);
        return *v;
    }

    /// Write-through access: a missing key is appended at the tail with a value-initialized V.
    V& operator[](K const& key)
    {
        if (auto* v = try_get(key))
            return *v;
        impl_append(key, V());
        return _ledger.back()->second;
    }

    /// First entry in insertion order.
    /// Precondition: !empty().
    [[nodiscard]] value_type const& front() const
    {
        ORDO_ASSERT(!empty(), "front() on an empty ordered_map");
        return *begin();
    }

    /// Last entry in insertion order.
    /// Precondition: !empty().
    [[nodiscard]] value_type const& back() const
    {
        ORDO_ASSERT(!empty(), "back() on an empty ordered_map");
        // trailing tombstones are trimmed eagerly, so the last slot is live
        ORDO_ASSERT(_ledger.back().has_value(), "ledger ends in a tombstone");
        return *_ledger.back();
    }

    /// Keys in insertion order. A read-only view into the map, not a copy.
    [[nodiscard]] key_view keys() const { return key_view(*this); }

    /// Values in insertion order of their keys. A read-only view into the map, not a copy.
    [[nodiscard]] value_view values() const { return value_view(*this); }

    /// Snapshot of the keys in insertion order.
    [[nodiscard]] std::vector<K> key_list() const
    {
        auto r = std::vector<K>();
        r.reserve(size());
        for (auto const& e : *this)
            r.push_back(e.first);
        return r;
    }

    /// Snapshot of all entries in insertion order.
    /// Feeding the result back into create_from() reproduces an equal map.
    [[nodiscard]] std::vector<std::pair<K, V>> to_pairs() const
    {
        auto r = std::vector<std::pair<K, V>>();
        r.reserve(size());
        for (auto const& e : *this)
            r.emplace_back(e.first, e.second);
        return r;
    }

    // modifiers
public:
    /// Stores value under key.
    /// A new key is appended at the tail, an existing key keeps its position and gets the new value.
    ordered_map& put(K key, V value)
    {
        if (auto* v = try_get(key))
            *v = std::move(value);
        else
            impl_append(std::move(key), std::move(value));
        return *this;
    }

    /// Like put(), but only if key is absent. Otherwise the map is unchanged.
    ordered_map& put_new(K key, V value)
    {
        if (!has_key(key))
            impl_append(std::move(key), std::move(value));
        return *this;
    }

    /// Like put_new(), but the value is computed by fn() only if key is absent.
    /// fn is never invoked when key is already present.
    template <class F>
    ordered_map& put_new_lazy(K key, F&& fn)
    {
        if (!has_key(key))
            impl_append(std::move(key), V(std::invoke(std::forward<F>(fn))));
        return *this;
    }

    /// Replaces the value under key with fn(current value), keeping its position.
    /// If key is absent, default_value is appended at the tail instead (fn is not invoked).
    template <class F>
    ordered_map& update(K key, V default_value, F&& fn)
    {
        if (auto* v = try_get(key))
        {
            V next = std::invoke(std::forward<F>(fn), std::as_const(*v));
            *v = std::move(next);
        }
        else
        {
            impl_append(std::move(key), std::move(default_value));
        }
        return *this;
    }

    /// Replaces the value under key with fn(current value), keeping its position.
    /// Throws ordo::key_not_found_error if key is absent; the map is left unmodified.
    template <class F>
    ordered_map& update_existing(K const& key, F&& fn)
    {
        auto* v = try_get(key);
        if (v == nullptr)
            impl_throw_key_not_found(key);

        V next = std::invoke(std::forward<F>(fn), std::as_const(*v));
        *v = std::move(next);
        return *this;
    }

    /// Single-step read-modify-write through the key path protocol.
    ///
    /// fn receives a pointer to the current value (nullptr if key is absent) and returns:
    ///   - a value: stored under key (appended at the tail if key was absent)
    ///   - std::nullopt: key is removed
    /// Returns the previous value, std::nullopt if key was absent.
    template <class F>
    std::optional<V> get_and_update(K const& key, F&& fn)
    {
        auto* v = try_get(key);
        std::optional<V> next = std::invoke(std::forward<F>(fn), static_cast<V const*>(v));

        if (!next.has_value())
            return pop(key);

        if (v == nullptr)
        {
            impl_append(key, std::move(*next));
            return std::nullopt;
        }

        auto previous = std::optional<V>(std::move(*v));
        *v = std::move(*next);
        return previous;
    }

    /// Removes key from the map. No-op if key is absent.
    ordered_map& remove(K const& key)
    {
        auto const it = _index.find(key);
        if (it != _index.end())
            impl_remove_slot(it);
        return *this;
    }

    /// Removes key and returns its value, std::nullopt if key was absent.
    std::optional<V> pop(K const& key)
    {
        auto const it = _index.find(key);
        if (it == _index.end())
            return std::nullopt;

        auto value = std::optional<V>(std::move(_ledger[it->second]->second));
        impl_remove_slot(it);
        return value;
    }

    /// Removes key and returns its value, default_value if key was absent.
    V pop(K const& key, V default_value)
    {
        if (auto v = pop(key))
            return std::move(*v);
        return default_value;
    }

    /// Removes all entries.
    void clear()
    {
        _ledger.clear();
        _index.clear();
        _tombstones = 0;
        ++_stamp;
    }

    // bulk operations
public:
    /// Folds a range of (key, value) pairs into the map, in source order.
    ///
    /// Keys already present before the call keep their position, keys new to the map are appended
    /// in the order they first appear in the source. A key that appears several times ends up at its
    /// first appearance with its last value.
    ///
    /// Elements may be std::pair, std::tuple or anything else std::get<0>/<1> accepts; keys and values
    /// are converted with K(...) and V(...).
    /// If the source or a conversion throws, every change made by this call is rolled back.
    template <class Range>
    ordered_map& extend(Range&& source)
    {
        auto journal = impl_journal{.first_new_slot = isize(_ledger.size())};
        try
        {
            for (auto&& e : source)
                impl_journaled_put(journal, K(std::get<0>(e)), V(std::get<1>(e)));
        }
        catch (...)
        {
            impl_rollback(journal);
            throw;
        }
        return *this;
    }

    /// Merges other into this map, visiting other in its insertion order.
    /// Keys new to this map are appended in that order; for keys present in both, the incoming value wins
    /// and the key keeps its position here.
    ordered_map& merge(ordered_map const& other)
    {
        return merge(other, [](K const&, V const&, V const& incoming) { return incoming; });
    }

    /// Merges other into this map, resolving keys present in both with fn(key, existing, incoming).
    /// If fn throws, every change made by this call is rolled back.
    template <class F>
    ordered_map& merge(ordered_map const& other, F&& fn)
    {
        auto journal = impl_journal{.first_new_slot = isize(_ledger.size())};
        try
        {
            // other may alias *this: no keys get appended in that case, so the iteration stays valid
            for (auto const& [key, incoming] : other)
            {
                if (auto const* existing = try_get(key))
                    impl_journaled_put(journal, key, V(std::invoke(fn, key, *existing, incoming)));
                else
                    impl_journaled_put(journal, key, incoming);
            }
        }
        catch (...)
        {
            impl_rollback(journal);
            throw;
        }
        return *this;
    }

    // enumeration
public:
    [[nodiscard]] iterator begin() { return iterator(_ledger.begin(), _ledger.end()); }
    [[nodiscard]] iterator end() { return iterator(_ledger.end(), _ledger.end()); }
    [[nodiscard]] const_iterator begin() const { return const_iterator(_ledger.begin(), _ledger.end()); }
    [[nodiscard]] const_iterator end() const { return const_iterator(_ledger.end(), _ledger.end()); }
    [[nodiscard]] const_iterator cbegin() const { return begin(); }
    [[nodiscard]] const_iterator cend() const { return end(); }

    /// Pull cursor positioned before the first entry.
    [[nodiscard]] ordo::cursor<ordered_map> cursor() const { return ordo::cursor<ordered_map>(*this); }

    /// Folds over the entries in insertion order; fn(acc, entry) returns ordo::cont / halt / suspend.
    template <class Acc, class F>
    [[nodiscard]] ordo::reduction<Acc, ordered_map> reduce(Acc acc, F&& fn) const
    {
        return resume(cursor(), std::move(acc), std::forward<F>(fn));
    }

    /// Continues a fold from a cursor, typically the `rest` of a suspended reduction.
    template <class Acc, class F>
    [[nodiscard]] ordo::reduction<Acc, ordered_map> resume(ordo::cursor<ordered_map> at, Acc acc, F&& fn) const
    {
        ORDO_ASSERT(at._map == nullptr || at._map == this, "cursor belongs to a different ordered_map");

        while (auto const* e = at.next())
        {
            ordo::step<Acc> s = std::invoke(fn, std::move(acc), *e);
            acc = std::move(s.acc);

            switch (s.kind)
            {
            case step_kind::cont: break;
            case step_kind::halt: return {reduction_status::halted, std::move(acc), at};
            case step_kind::suspend: return {reduction_status::suspended, std::move(acc), at};
            }
        }

        return {reduction_status::done, std::move(acc), at};
    }

    /// Entries at positions start, start + step, ... in insertion order, at most length of them.
    /// Out-of-range starts and lengths produce an empty or shortened result.
    /// Precondition: step > 0.
    [[nodiscard]] std::vector<std::pair<K, V>> slice(isize start, isize length, isize step = 1) const
    {
        ORDO_ASSERT(step > 0, "slice step must be positive");

        auto r = std::vector<std::pair<K, V>>();
        if (step <= 0 || start < 0 || length <= 0 || start >= size())
            return r;

        // start + i * step stays inside the map for every i < count
        auto const reachable = 1 + (size() - 1 - start) / step;
        auto const count = std::min(length, reachable);
        r.reserve(count);

        if (_tombstones == 0)
        {
            // ledger positions are entry positions
            for (isize i = 0; i < count; ++i)
            {
                auto const& e = *_ledger[start + i * step];
                r.emplace_back(e.first, e.second);
            }
            return r;
        }

        auto pos = isize(0);
        auto next_taken = start;
        for (auto const& e : *this)
        {
            if (pos == next_taken)
            {
                r.emplace_back(e.first, e.second);
                if (isize(r.size()) == count)
                    break;
                next_taken += step;
            }
            ++pos;
        }
        return r;
    }

    // comparison
public:
    /// Equal iff both maps hold the same entries in the same order.
    [[nodiscard]] friend bool operator==(ordered_map const& lhs, ordered_map const& rhs)
    {
        if (lhs.size() != rhs.size())
            return false;

        return std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                          [](value_type const& a, value_type const& b)
                          { return key_equal()(a.first, b.first) && a.second == b.second; });
    }

    // diagnostics
public:
    /// Checks that value store and position ledger describe the same entries.
    /// O(n), intended for assertions and tests.
    [[nodiscard]] bool is_consistent() const
    {
        if (isize(_ledger.size()) != size() + _tombstones)
            return false;
        if (!_ledger.empty() && !_ledger.back().has_value())
            return false;

        isize live = 0;
        for (isize i = 0; i < isize(_ledger.size()); ++i)
        {
            if (!_ledger[i].has_value())
                continue;

            ++live;
            auto const it = _index.find(_ledger[i]->first);
            if (it == _index.end() || it->second != i)
                return false;
        }
        return live == size();
    }

    /// Number of tombstones currently held by the ledger.
    [[nodiscard]] isize tombstone_count() const { return _tombstones; }

    // iterators and views
public:
    /// Forward iterator over the live ledger slots.
    template <bool IsConst>
    struct basic_iterator
    {
        using value_type = ordered_map::value_type;
        using ledger_iterator
            = std::conditional_t<IsConst, typename ledger_t::const_iterator, typename ledger_t::iterator>;

        using iterator_category = std::forward_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using reference = std::conditional_t<IsConst, value_type const&, value_type&>;
        using pointer = std::conditional_t<IsConst, value_type const*, value_type*>;

        basic_iterator() = default;

        [[nodiscard]] reference operator*() const { return **_it; }
        [[nodiscard]] pointer operator->() const { return &**_it; }

        basic_iterator& operator++()
        {
            ++_it;
            impl_skip_tombstones();
            return *this;
        }
        basic_iterator operator++(int)
        {
            auto r = *this;
            ++*this;
            return r;
        }

        [[nodiscard]] bool operator==(basic_iterator const& rhs) const { return _it == rhs._it; }

        operator basic_iterator<true>() const
            requires(!IsConst)
        {
            return basic_iterator<true>(_it, _end);
        }

    private:
        basic_iterator(ledger_iterator it, ledger_iterator end) : _it(it), _end(end) { impl_skip_tombstones(); }

        void impl_skip_tombstones()
        {
            while (_it != _end && !_it->has_value())
                ++_it;
        }

        ledger_iterator _it = {};
        ledger_iterator _end = {};

        friend ordered_map;
        template <bool>
        friend struct basic_iterator;
    };

    /// Read-only view of either the keys or the values, in insertion order.
    template <bool Keys>
    struct projection_view
    {
        using element_type = std::conditional_t<Keys, K, V>;

        struct iterator
        {
            using iterator_category = std::forward_iterator_tag;
            using value_type = element_type;
            using difference_type = std::ptrdiff_t;
            using reference = element_type const&;
            using pointer = element_type const*;

            [[nodiscard]] reference operator*() const
            {
                if constexpr (Keys)
                    return _it->first;
                else
                    return _it->second;
            }
            [[nodiscard]] pointer operator->() const { return &**this; }

            iterator& operator++()
            {
                ++_it;
                return *this;
            }
            iterator operator++(int)
            {
                auto r = *this;
                ++_it;
                return r;
            }

            [[nodiscard]] bool operator==(iterator const& rhs) const { return _it == rhs._it; }

            const_iterator _it = {};
        };

        explicit projection_view(ordered_map const& map) : _map(&map) {}

        [[nodiscard]] iterator begin() const { return iterator{_map->begin()}; }
        [[nodiscard]] iterator end() const { return iterator{_map->end()}; }
        [[nodiscard]] isize size() const { return _map->size(); }
        [[nodiscard]] bool empty() const { return _map->empty(); }

        /// Element-wise comparison against any range, e.g. map.keys() == std::vector<std::string>{"a", "b"}.
        template <class Range>
            requires(!std::is_same_v<Range, projection_view>)
        [[nodiscard]] bool operator==(Range const& rhs) const
        {
            return std::equal(begin(), end(), std::begin(rhs), std::end(rhs));
        }

    private:
        ordered_map const* _map;
    };

    // implementation
private:
    /// Undo log of a bulk operation.
    /// New keys are appended from first_new_slot on (the pending append list, in first-seen order);
    /// overwritten values are saved with their slot so they can be restored in reverse order.
    struct impl_journal
    {
        isize first_new_slot = 0;
        std::vector<std::pair<isize, V>> overwritten = {};
    };

    ledger_t _ledger;
    index_t _index;
    isize _tombstones = 0;
    std::uint64_t _stamp = 0; // bumped on every structural change, checked by cursors

    template <class M>
    friend struct ordo::cursor;

    void impl_reset() noexcept
    {
        _ledger.clear();
        _index.clear();
        _tombstones = 0;
        ++_stamp;
    }

    // appends a new entry at the tail
    // precondition: key is absent
    void impl_append(K key, V value)
    {
        auto const slot = isize(_ledger.size());
        _ledger.emplace_back(std::in_place, key, std::move(value));
        try
        {
            _index.emplace(std::move(key), slot);
        }
        catch (...)
        {
            _ledger.pop_back();
            throw;
        }
        ++_stamp;
    }

    void impl_remove_slot(typename index_t::const_iterator it)
    {
        auto const slot = it->second;
        _index.erase(it);
        _ledger[slot].reset();
        ++_tombstones;
        ++_stamp;

        // keep the ledger tail live
        while (!_ledger.empty() && !_ledger.back().has_value())
        {
            _ledger.pop_back();
            --_tombstones;
        }

        if (isize(_ledger.size()) >= compaction_min_slots && _tombstones * compaction_divisor >= isize(_ledger.size()))
            impl_compact();
    }

    // moves all live entries to the front of the ledger, preserving their order
    void impl_compact()
    {
        isize write = 0;
        for (isize read = 0; read < isize(_ledger.size()); ++read)
        {
            if (!_ledger[read].has_value())
                continue;

            if (write != read)
            {
                _ledger[write].emplace(std::move(*_ledger[read]));
                _ledger[read].reset();
                _index.find(_ledger[write]->first)->second = write;
            }
            ++write;
        }

        while (isize(_ledger.size()) > write)
            _ledger.pop_back();

        _tombstones = 0;
        ++_stamp;

        ORDO_ASSERT(is_consistent(), "ledger compaction broke the key index");
    }

    void impl_journaled_put(impl_journal& journal, K key, V value)
    {
        auto const it = _index.find(key);
        if (it == _index.end())
        {
            impl_append(std::move(key), std::move(value));
            return;
        }

        auto& current = _ledger[it->second]->second;
        journal.overwritten.emplace_back(it->second, std::move(current));
        current = std::move(value);
    }

    void impl_rollback(impl_journal& journal)
    {
        for (auto i = isize(journal.overwritten.size()) - 1; i >= 0; --i)
        {
            auto& [slot, previous] = journal.overwritten[i];
            _ledger[slot]->second = std::move(previous);
        }

        while (isize(_ledger.size()) > journal.first_new_slot)
        {
            _index.erase(_ledger.back()->first);
            _ledger.pop_back();
        }
        ++_stamp;
    }

    [[noreturn]] ORDO_COLD_FUNC void impl_throw_key_not_found(K const& key) const
    {
        throw key_not_found_error(ordo::render(key), ordo::render(*this, render_config{.max_length = error_render_max_length}));
    }
};

namespace ordo
{
/// Value-returning merge: a copy of a with b merged in (incoming values win).
template <class K, class V, class HashT, class EqualT>
[[nodiscard]] ordered_map<K, V, HashT, EqualT> merged(ordered_map<K, V, HashT, EqualT> a,
                                                      ordered_map<K, V, HashT, EqualT> const& b)
{
    a.merge(b);
    return a;
}

/// Value-returning merge with conflict resolution fn(key, value in a, value in b).
template <class K, class V, class HashT, class EqualT, class F>
[[nodiscard]] ordered_map<K, V, HashT, EqualT> merged(ordered_map<K, V, HashT, EqualT> a,
                                                      ordered_map<K, V, HashT, EqualT> const& b,
                                                      F&& fn)
{
    a.merge(b, std::forward<F>(fn));
    return a;
}
} // namespace ordo
