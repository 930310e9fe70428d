/*!
 * \file member_parser.hpp
 * \brief Lazily built string index mapping formatted members back to members
 * \author Max Qian <lightapt.com>
 * \date 2024-6-7
 * \copyright Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ENUMKIT_META_MEMBER_PARSER_HPP
#define ENUMKIT_META_MEMBER_PARSER_HPP

#include <atomic>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

#include "enumkit/meta/enum_format.hpp"
#include "enumkit/type/noncopyable.hpp"
#include "enumkit/utils/string.hpp"

namespace enumkit::meta {

/**
 * @brief Hash index from the formatted string of every member to the member.
 *
 * Built once per (cache, format). The ordinal table is built eagerly; the
 * ignore-case table is derived from it on the first ignore-case lookup and
 * shares its entries. Both tables chain colliding entries through per-entry
 * next indexes.
 *
 * @tparam Member A member record exposing asString(EnumFormat).
 */
template <typename Member>
class EnumMemberParser : public type::NonCopyable {
public:
    /**
     * @param format The format every member is rendered in.
     * @param members Every member, canonical and aliases, in merged order.
     * When two members render to the same string the later one wins.
     */
    EnumMemberParser(EnumFormat format, std::span<const Member* const> members)
        : format_(format) {
        entries_.reserve(members.size());
        buckets_.assign(bucketCountFor(members.size()), NO_ENTRY);
        for (const auto* member : members) {
            auto formatted = member->asString(format);
            if (!formatted) {
                continue;
            }
            const auto hash = utils::ordinalHash(*formatted);
            auto& bucket = buckets_[hash & (buckets_.size() - 1)];
            auto existing = findIn(bucket, *formatted, hash);
            if (existing != NO_ENTRY) {
                entries_[existing].member = member;
                continue;
            }
            entries_.push_back(
                Entry{std::move(*formatted), member, hash, bucket});
            bucket = static_cast<std::int32_t>(entries_.size() - 1);
        }
        spdlog::trace("Built parser index for format {} with {} entries",
                      toString(format), entries_.size());
    }

    ~EnumMemberParser() { delete ignoreCase_.load(std::memory_order_acquire); }

    /**
     * @brief Looks a formatted string up.
     *
     * The exact spelling is tried first; with ignoreCase an ASCII
     * case-insensitive match is tried next.
     *
     * @return The member, or nullptr if nothing matches.
     */
    [[nodiscard]] auto tryParse(std::string_view text, bool ignoreCase) const
        -> const Member* {
        const auto hash = utils::ordinalHash(text);
        const auto index =
            findIn(buckets_[hash & (buckets_.size() - 1)], text, hash);
        if (index != NO_ENTRY) {
            return entries_[index].member;
        }
        if (ignoreCase) {
            return ignoreCaseTable().find(text, entries_);
        }
        return nullptr;
    }

    [[nodiscard]] auto format() const noexcept -> EnumFormat { return format_; }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return entries_.size();
    }

private:
    static constexpr std::int32_t NO_ENTRY = -1;

    struct Entry {
        std::string key;
        const Member* member;
        std::size_t hash;
        std::int32_t next;
    };

    // Nodes reference entries by index; hashes are ignore-case hashes
    struct IgnoreCaseTable {
        struct Node {
            std::int32_t entry;
            std::size_t hash;
            std::int32_t next;
        };

        std::vector<std::int32_t> buckets;
        std::vector<Node> nodes;

        auto find(std::string_view text, const std::vector<Entry>& entries)
            const -> const Member* {
            const auto hash = utils::ordinalIgnoreCaseHash(text);
            for (auto i = buckets[hash & (buckets.size() - 1)]; i != NO_ENTRY;
                 i = nodes[static_cast<std::size_t>(i)].next) {
                const auto& node = nodes[static_cast<std::size_t>(i)];
                const auto& entry = entries[static_cast<std::size_t>(node.entry)];
                if (node.hash == hash &&
                    utils::equalsIgnoreCase(entry.key, text)) {
                    return entry.member;
                }
            }
            return nullptr;
        }
    };

    static auto bucketCountFor(std::size_t count) -> std::size_t {
        return std::bit_ceil(count == 0 ? std::size_t{1} : count);
    }

    auto findIn(std::int32_t head, std::string_view text,
                std::size_t hash) const -> std::int32_t {
        for (auto i = head; i != NO_ENTRY;
             i = entries_[static_cast<std::size_t>(i)].next) {
            const auto& entry = entries_[static_cast<std::size_t>(i)];
            if (entry.hash == hash && entry.key == text) {
                return i;
            }
        }
        return NO_ENTRY;
    }

    auto ignoreCaseTable() const -> const IgnoreCaseTable& {
        if (const auto* table = ignoreCase_.load(std::memory_order_acquire)) {
            return *table;
        }
        auto* built = buildIgnoreCaseTable();
        const IgnoreCaseTable* expected = nullptr;
        if (ignoreCase_.compare_exchange_strong(expected, built,
                                                std::memory_order_acq_rel,
                                                std::memory_order_acquire)) {
            return *built;
        }
        delete built;
        return *expected;
    }

    // Entries are visited in insertion order, so a later key that folds onto
    // an earlier one replaces it.
    auto buildIgnoreCaseTable() const -> IgnoreCaseTable* {
        auto table = std::make_unique<IgnoreCaseTable>();
        table->buckets.assign(buckets_.size(), NO_ENTRY);
        table->nodes.reserve(entries_.size());
        for (std::size_t e = 0; e < entries_.size(); ++e) {
            const auto& entry = entries_[e];
            const auto hash = utils::ordinalIgnoreCaseHash(entry.key);
            auto& bucket = table->buckets[hash & (table->buckets.size() - 1)];
            bool replaced = false;
            for (auto i = bucket; i != NO_ENTRY;
                 i = table->nodes[static_cast<std::size_t>(i)].next) {
                auto& node = table->nodes[static_cast<std::size_t>(i)];
                if (node.hash == hash &&
                    utils::equalsIgnoreCase(
                        entries_[static_cast<std::size_t>(node.entry)].key,
                        entry.key)) {
                    node.entry = static_cast<std::int32_t>(e);
                    replaced = true;
                    break;
                }
            }
            if (!replaced) {
                table->nodes.push_back(typename IgnoreCaseTable::Node{
                    static_cast<std::int32_t>(e), hash, bucket});
                bucket = static_cast<std::int32_t>(table->nodes.size() - 1);
            }
        }
        spdlog::trace("Built ignore-case parser index for format {}",
                      toString(format_));
        return table.release();
    }

    EnumFormat format_;
    std::vector<Entry> entries_;
    std::vector<std::int32_t> buckets_;
    mutable std::atomic<const IgnoreCaseTable*> ignoreCase_{nullptr};
};

}  // namespace enumkit::meta

#endif  // ENUMKIT_META_MEMBER_PARSER_HPP
