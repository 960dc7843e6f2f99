#pragma once

#include <sebbu-collections/optional.hh>
#include <sebbu-collections/span.hh>
#include <sebbu-collections/vector.hh>

/// Stable-id storage ("coat check"): every inserted element gets a ticket id that stays valid until
/// the element is removed, and is never handed out again.
///
/// Storage is a vector of (id, optional<T>) entries sorted by id. Ids are issued in increasing
/// order and only ever appended, so the sort order comes for free and lookups are binary searches.
/// Removing an element leaves a tombstone (empty optional) in place.
/// Once fewer than slot_count() / compaction_divisor entries are live, all tombstones are removed
/// in one ordered pass.
///
/// Complexity:
///   push_back           amortized O(1)
///   get / find / pop    O(log n), pop additionally amortized O(1) for compaction
///   iteration           O(slot_count())
///
/// Usage:
///   sc::ticket_map<connection> connections;
///   auto const id = connections.push_back(connection{...});
///   if (auto* c = connections.find(id))
///       c->send(...);
///   auto closed = connections.pop(id); // sc::nullopt if id is unknown or already removed
///
/// NOTE: get/find/pop do not distinguish an id that was never issued from one that was removed.
template <class T>
struct sc::ticket_map
{
    /// Compaction runs when size() < slot_count() / compaction_divisor after a removal.
    static constexpr isize compaction_divisor = 2;

    struct entry
    {
        isize id = 0;
        sc::optional<T> value; // empty for tombstones
    };

    /// Forward cursor over the live elements, in ascending id order.
    template <class EntryT, class ElementT>
    struct live_cursor
    {
        EntryT* pos = nullptr;
        EntryT* last = nullptr;

        live_cursor(EntryT* begin, EntryT* end) : pos(begin), last(end) { skip_tombstones(); }

        [[nodiscard]] ElementT& operator*() const { return pos->value.value(); }
        /// Ticket id of the current element.
        [[nodiscard]] isize id() const { return pos->id; }

        live_cursor& operator++()
        {
            ++pos;
            skip_tombstones();
            return *this;
        }
        [[nodiscard]] bool operator!=(sc::sentinel) const { return pos != last; }
        [[nodiscard]] bool operator==(sc::sentinel) const { return pos == last; }

    private:
        void skip_tombstones()
        {
            while (pos != last && !pos->value.has_value())
                ++pos;
        }
    };

    using iterator = live_cursor<entry, T>;
    using const_iterator = live_cursor<entry const, T const>;

    // insertion
public:
    /// Stores a new element and returns its ticket id.
    template <class... Args>
    isize emplace_back(Args&&... args)
    {
        auto const id = _next_id;

        // args may refer to a stored element, so the value is built before _entries can reallocate
        _entries.push_back(entry{id, sc::optional<T>(T(sc::forward<Args>(args)...))});

        ++_next_id;
        ++_live_count;
        return id;
    }

    isize push_back(T const& value) { return emplace_back(value); }
    isize push_back(T&& value) { return emplace_back(sc::move(value)); }

    /// Stores copies of all elements of source and returns their ids in input order.
    [[nodiscard]] sc::vector<isize> push_back_range(sc::span<T const> source)
    {
        auto ids = sc::vector<isize>::create_with_capacity(source.size());
        for (auto const& v : source)
            ids.push_back(push_back(v));
        return ids;
    }

    // lookup
public:
    /// Position of the entry with the given id in the entry sequence, tombstones included.
    /// Returns sc::nullopt if the id is not stored (never issued, or compacted away).
    [[nodiscard]] sc::optional<isize> find_index(isize id) const
    {
        isize lo = 0;
        isize hi = _entries.size();
        while (lo < hi)
        {
            auto const mid = lo + (hi - lo) / 2;
            auto const mid_id = _entries[mid].id;

            if (mid_id == id)
                return mid;

            if (mid_id < id)
                lo = mid + 1;
            else
                hi = mid;
        }
        return sc::nullopt;
    }

    /// Pointer to the live element with the given id, nullptr otherwise.
    [[nodiscard]] T* find(isize id)
    {
        auto const idx = find_index(id);
        if (!idx.has_value())
            return nullptr;

        auto& slot = _entries[idx.value()].value;
        return slot.has_value() ? &slot.value() : nullptr;
    }
    [[nodiscard]] T const* find(isize id) const
    {
        auto const idx = find_index(id);
        if (!idx.has_value())
            return nullptr;

        auto const& slot = _entries[idx.value()].value;
        return slot.has_value() ? &slot.value() : nullptr;
    }

    /// Copy of the element with the given id, sc::nullopt if absent or removed.
    [[nodiscard]] sc::optional<T> get(isize id) const
    {
        if (auto const* p = find(id))
            return *p;
        return sc::nullopt;
    }

    [[nodiscard]] bool contains(isize id) const { return find(id) != nullptr; }

    // removal
public:
    /// Removes the element with the given id and returns it.
    /// Returns sc::nullopt without any mutation if the id is absent or already removed.
    [[nodiscard("use remove() if you don't need the return value")]] sc::optional<T> pop(isize id)
    {
        auto* const slot = find_live_slot(id);
        if (slot == nullptr)
            return sc::nullopt;

        sc::optional<T> result = sc::move(*slot).value();
        tombstone(*slot);
        return result;
    }

    /// Removes the element with the given id.
    /// Returns false without any mutation if the id is absent or already removed.
    bool remove(isize id)
    {
        auto* const slot = find_live_slot(id);
        if (slot == nullptr)
            return false;

        tombstone(*slot);
        return true;
    }

    /// Removes all elements. Ids are not reset, next_id() keeps counting.
    void clear()
    {
        _entries.clear();
        _live_count = 0;
    }

    // queries
public:
    /// Number of live elements.
    [[nodiscard]] isize size() const { return _live_count; }
    [[nodiscard]] bool empty() const { return _live_count == 0; }

    /// Number of stored entries, tombstones included.
    [[nodiscard]] isize slot_count() const { return _entries.size(); }

    /// Id that the next insertion will receive.
    [[nodiscard]] isize next_id() const { return _next_id; }

    // iteration
public:
    [[nodiscard]] iterator begin() { return iterator(_entries.begin(), _entries.end()); }
    [[nodiscard]] const_iterator begin() const { return const_iterator(_entries.begin(), _entries.end()); }
    [[nodiscard]] sc::sentinel end() const { return {}; }

    /// Calls f(id, element) for every live element in ascending id order.
    template <class F>
    void each(F&& f)
    {
        for (auto& e : _entries)
            if (e.value.has_value())
                f(e.id, e.value.value());
    }
    template <class F>
    void each(F&& f) const
    {
        for (auto const& e : _entries)
            if (e.value.has_value())
                f(e.id, e.value.value());
    }

    // ticket_map has deep-copy value semantics
    ticket_map() = default;
    ~ticket_map() = default;
    ticket_map(ticket_map const&) = default;
    ticket_map& operator=(ticket_map const&) = default;

    // moved-from maps are empty but keep their id counter, so they never reissue ids
    ticket_map(ticket_map&& rhs) noexcept
      : _entries(sc::move(rhs._entries)), _next_id(rhs._next_id), _live_count(sc::exchange(rhs._live_count, 0))
    {
    }
    ticket_map& operator=(ticket_map&& rhs) noexcept
    {
        if (this != &rhs)
        {
            _entries = sc::move(rhs._entries);
            _next_id = rhs._next_id;
            _live_count = sc::exchange(rhs._live_count, 0);
        }
        return *this;
    }

private:
    [[nodiscard]] sc::optional<T>* find_live_slot(isize id)
    {
        auto const idx = find_index(id);
        if (!idx.has_value())
            return nullptr;

        auto& slot = _entries[idx.value()].value;
        return slot.has_value() ? &slot : nullptr;
    }

    // slot must be live, invalidates all entry pointers if compaction runs
    void tombstone(sc::optional<T>& slot)
    {
        slot.reset();
        --_live_count;

        if (_live_count < _entries.size() / compaction_divisor)
            _entries.remove_if([](entry const& e) { return !e.value.has_value(); });
    }

    sc::vector<entry> _entries;
    isize _next_id = 0;
    isize _live_count = 0;
};
