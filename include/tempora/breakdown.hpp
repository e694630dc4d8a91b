#pragma once

#include "tempora/time_unit.hpp"

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <utility>
#include <vector>

#include <cstddef>

namespace tempora {

/**
 * Mapping from TimeUnit to an amount of that unit.
 *
 * Used in two directions:
 * - as input, where a Duration is the sum of `amount * divisor(unit)` over
 *   all entries (e.g. `{{TimeUnit::hours, 1}, {TimeUnit::minutes, 30}}`)
 * - as output of Duration::breakdown(), where entries appear in
 *   significance order
 *
 * Entries keep insertion order. Each unit appears at most once; setting a
 * unit that is already present replaces its amount in place. Equality is
 * mapping equality and ignores entry order.
 */
class Breakdown {
public:
    using Entry = std::pair<TimeUnit, double>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Breakdown() = default;

    Breakdown(std::initializer_list<Entry> entries) {
        for (const auto& [unit, amount] : entries) {
            set(unit, amount);
        }
    }

    /// Insert or replace the amount for `unit`
    void set(TimeUnit unit, double amount) {
        if (auto it = find(unit); it != entries_.end()) {
            it->second = amount;
            return;
        }
        entries_.emplace_back(unit, amount);
    }

    [[nodiscard]] std::optional<double> get(TimeUnit unit) const noexcept {
        if (auto it = find(unit); it != entries_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] bool contains(TimeUnit unit) const noexcept {
        return find(unit) != entries_.end();
    }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    /// Units in insertion order
    [[nodiscard]] std::vector<TimeUnit> units() const {
        std::vector<TimeUnit> out;
        out.reserve(entries_.size());
        for (const auto& entry : entries_) {
            out.push_back(entry.first);
        }
        return out;
    }

    /// Sum of amount * divisor over all entries; empty breakdown is 0
    [[nodiscard]] double total_milliseconds() const noexcept {
        double sum = 0.0;
        for (const auto& [unit, amount] : entries_) {
            sum += divisor(unit) * amount;
        }
        return sum;
    }

    friend bool operator==(const Breakdown& a, const Breakdown& b) noexcept {
        if (a.size() != b.size()) {
            return false;
        }
        return std::all_of(a.begin(), a.end(), [&b](const Entry& e) {
            auto other = b.get(e.first);
            return other.has_value() && *other == e.second;
        });
    }

private:
    std::vector<Entry>::iterator find(TimeUnit unit) noexcept {
        return std::find_if(entries_.begin(), entries_.end(),
                            [unit](const Entry& e) { return e.first == unit; });
    }

    std::vector<Entry>::const_iterator find(TimeUnit unit) const noexcept {
        return std::find_if(entries_.begin(), entries_.end(),
                            [unit](const Entry& e) { return e.first == unit; });
    }

    std::vector<Entry> entries_;
};

/**
 * Options for Duration::breakdown().
 *
 * Unset fields take defaults that depend on whether a unit list was given:
 * - no unit list:  float_last = true,  include_zero = false
 * - unit list:     float_last = false, include_zero = true
 */
struct BreakdownOptions {
    /// Last (smallest) unit carries the fractional remainder instead of dropping it
    std::optional<bool> float_last;
    /// Keep entries whose amount is zero
    std::optional<bool> include_zero;
};

} // namespace tempora
