// strip.cpp - removal of absent mapping entries from a value tree

#include "wirepack/strip.hpp"

#include <string>
#include <unordered_map>

namespace wirepack {

depth_exceeded::depth_exceeded(std::size_t limit)
    : std::runtime_error("maximum depth of " + std::to_string(limit) + " exceeded")
    , limit_(limit)
{
}

namespace {

// =============================================================================
// stripper_t - state of a single strip() call
// =============================================================================

class stripper_t {
public:
    explicit stripper_t(std::size_t max_depth) : max_depth_(max_depth) {}

    auto strip(const value_t& value, std::size_t depth) -> value_t {
        if (!value.is_composite()) {
            return value;
        }
        if (depth > max_depth_) {
            throw depth_exceeded(max_depth_);
        }
        auto [it, inserted] = memo_.try_emplace(value.identity(), value);
        if (!inserted) {
            return it->second;
        }
        auto result = value.is_sequence()
            ? strip_sequence(value, depth)
            : strip_mapping(value, depth);
        memo_[value.identity()] = result;
        return result;
    }

private:
    std::size_t max_depth_;

    // Node -> its stripped form. While a node is still being stripped it
    // maps to itself, which is what a cycle back into it receives.
    std::unordered_map<const void*, value_t> memo_;

    auto strip_sequence(const value_t& value, std::size_t depth) -> value_t {
        const auto& items = *value.as_sequence();
        auto result = sequence_ptr{};

        for (std::size_t i = 0; i < items.size(); ++i) {
            auto item = strip(items[i], depth + 1);
            if (!result && item.identity() != items[i].identity()) {
                result = std::make_shared<sequence_t>();
                result->reserve(items.size());
                result->assign(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(i));
            }
            if (result) {
                result->push_back(std::move(item));
            }
        }
        if (!result) {
            return value;
        }
        return result;
    }

    auto strip_mapping(const value_t& value, std::size_t depth) -> value_t {
        const auto& entries = *value.as_mapping();
        auto result = mapping_ptr{};

        // Entries before the first change are all kept and unchanged
        auto start = [&](std::size_t first_change) {
            result = std::make_shared<mapping_t>();
            result->reserve(entries.size());
            for (std::size_t j = 0; j < first_change; ++j) {
                const auto& [key, item] = entries.entry(j);
                result->append(key, item);
            }
        };

        for (std::size_t i = 0; i < entries.size(); ++i) {
            const auto& [key, item] = entries.entry(i);
            if (item.is_absent()) {
                if (!result) start(i);
                continue;
            }
            auto stripped = strip(item, depth + 1);
            if (!result && stripped.identity() != item.identity()) {
                start(i);
            }
            if (result) {
                result->append(key, std::move(stripped));
            }
        }
        if (!result) {
            return value;
        }
        return result;
    }
};

} // namespace

auto strip(const value_t& value) -> value_t {
    return strip(value, default_max_depth);
}

auto strip(const value_t& value, std::size_t max_depth) -> value_t {
    return stripper_t{max_depth}.strip(value, 0);
}

} // namespace wirepack
