#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace vdbc::model {

    // ─── Raw value → label enumeration (VAL_ / VAL_TABLE_) ──────────────────────
    class ValueTable {
        dp::Map<i64, dp::String> entries_;

      public:
        ValueTable() = default;

        // Keys are unique; re-adding a raw value replaces its label
        ValueTable &add(i64 raw, dp::String label) {
            entries_[raw] = std::move(label);
            return *this;
        }

        dp::Optional<dp::String> label(i64 raw) const {
            auto it = entries_.find(raw);
            if (it != entries_.end())
                return it->second;
            return dp::nullopt;
        }

        dp::Optional<i64> value_of(const dp::String &label) const {
            for (const auto &entry : entries_) {
                if (entry.second == label)
                    return entry.first;
            }
            return dp::nullopt;
        }

        bool contains(i64 raw) const { return entries_.find(raw) != entries_.end(); }
        usize size() const noexcept { return entries_.size(); }
        bool empty() const noexcept { return entries_.empty(); }
        const dp::Map<i64, dp::String> &entries() const noexcept { return entries_; }
    };

} // namespace vdbc::model
