/*
 * enum_containers.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-11

Description: Read-only sequences of the members, names and values of an
enumeration, backed by the cache storage where possible

**************************************************/

#ifndef ENUMKIT_TYPE_ENUM_CONTAINERS_HPP
#define ENUMKIT_TYPE_ENUM_CONTAINERS_HPP

#include <cstddef>
#include <iterator>
#include <memory>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

#include "enumkit/error/exception.hpp"
#include "enumkit/meta/enum_cache.hpp"
#include "enumkit/meta/enum_format.hpp"
#include "enumkit/meta/enum_traits.hpp"

namespace enumkit::meta {
template <ReflectedEnum E>
class EnumMember;
}  // namespace enumkit::meta

namespace enumkit::type {

/**
 * @brief Forward iterator reading a container element by index.
 */
template <typename Container>
class IndexIterator {
public:
    using value_type = typename Container::value_type;
    using difference_type = std::ptrdiff_t;
    using reference = value_type;
    using pointer = void;
    using iterator_concept = std::forward_iterator_tag;
    using iterator_category = std::input_iterator_tag;

    IndexIterator() = default;
    IndexIterator(const Container* container, std::size_t index)
        : container_(container), index_(index) {}

    auto operator*() const -> value_type { return (*container_)[index_]; }

    auto operator++() -> IndexIterator& {
        ++index_;
        return *this;
    }

    auto operator++(int) -> IndexIterator {
        auto copy = *this;
        ++index_;
        return copy;
    }

    friend bool operator==(const IndexIterator&, const IndexIterator&) = default;

private:
    const Container* container_ = nullptr;
    std::size_t index_ = 0;
};

/**
 * @brief Members of a selection.
 *
 * Refers to the cache storage when the selection needs no filtering or
 * reordering, otherwise owns a private copy of the member list.
 */
template <typename Cache>
class MemberList {
public:
    using member_type = typename Cache::member_type;

    MemberList(const Cache& cache, meta::EnumMemberSelection selection) {
        if (auto view = cache.membersView(selection)) {
            members_ = *view;
        } else {
            owned_ = std::make_shared<std::vector<const member_type*>>(
                cache.getMembers(selection));
            members_ = *owned_;
        }
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return members_.size();
    }

    [[nodiscard]] auto at(std::size_t index) const -> const member_type& {
        if (index >= members_.size()) {
            THROW_INVALID_ARGUMENT("index {} is out of range for {} members",
                                   index, members_.size());
        }
        return *members_[index];
    }

    [[nodiscard]] auto operator[](std::size_t index) const
        -> const member_type& {
        return *members_[index];
    }

private:
    std::span<const member_type* const> members_;
    std::shared_ptr<const std::vector<const member_type*>> owned_;
};

template <meta::ReflectedEnum E>
using CacheOf = meta::EnumCache<std::underlying_type_t<E>>;

/**
 * @brief The members of a selection, as EnumMember<E>.
 */
template <meta::ReflectedEnum E>
class MembersContainer {
public:
    using value_type = meta::EnumMember<E>;
    using iterator = IndexIterator<MembersContainer>;

    MembersContainer(const CacheOf<E>& cache,
                     meta::EnumMemberSelection selection)
        : members_(cache, selection) {}

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return members_.size();
    }
    [[nodiscard]] auto empty() const noexcept -> bool { return size() == 0; }

    [[nodiscard]] auto operator[](std::size_t index) const -> value_type {
        return value_type(members_[index]);
    }
    [[nodiscard]] auto at(std::size_t index) const -> value_type {
        return value_type(members_.at(index));
    }

    [[nodiscard]] auto begin() const -> iterator { return {this, 0}; }
    [[nodiscard]] auto end() const -> iterator { return {this, size()}; }

    [[nodiscard]] auto toVector() const -> std::vector<value_type> {
        return {begin(), end()};
    }

private:
    MemberList<CacheOf<E>> members_;
};

/**
 * @brief The names of a selection. Names live as long as the cache.
 */
template <meta::ReflectedEnum E>
class NamesContainer {
public:
    using value_type = std::string_view;
    using iterator = IndexIterator<NamesContainer>;

    NamesContainer(const CacheOf<E>& cache,
                   meta::EnumMemberSelection selection)
        : members_(cache, selection) {}

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return members_.size();
    }
    [[nodiscard]] auto empty() const noexcept -> bool { return size() == 0; }

    [[nodiscard]] auto operator[](std::size_t index) const -> value_type {
        return members_[index].name();
    }
    [[nodiscard]] auto at(std::size_t index) const -> value_type {
        return members_.at(index).name();
    }

    [[nodiscard]] auto begin() const -> iterator { return {this, 0}; }
    [[nodiscard]] auto end() const -> iterator { return {this, size()}; }

    [[nodiscard]] auto toVector() const -> std::vector<std::string> {
        return {begin(), end()};
    }

private:
    MemberList<CacheOf<E>> members_;
};

/**
 * @brief The values of a selection.
 *
 * A cached container converts every value once on construction and serves
 * later reads from that array; otherwise values are converted on access.
 */
template <meta::ReflectedEnum E>
class ValuesContainer {
public:
    using value_type = E;
    using iterator = IndexIterator<ValuesContainer>;

    ValuesContainer(const CacheOf<E>& cache,
                    meta::EnumMemberSelection selection, bool cached = false)
        : members_(cache, selection) {
        if (cached) {
            auto values = std::make_shared<std::vector<E>>();
            values->reserve(members_.size());
            for (std::size_t i = 0; i < members_.size(); ++i) {
                values->push_back(static_cast<E>(members_[i].value()));
            }
            values_ = std::move(values);
        }
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return members_.size();
    }
    [[nodiscard]] auto empty() const noexcept -> bool { return size() == 0; }
    [[nodiscard]] auto isCached() const noexcept -> bool {
        return values_ != nullptr;
    }

    [[nodiscard]] auto operator[](std::size_t index) const -> value_type {
        if (values_) {
            return (*values_)[index];
        }
        return static_cast<E>(members_[index].value());
    }
    [[nodiscard]] auto at(std::size_t index) const -> value_type {
        return static_cast<E>(members_.at(index).value());
    }

    [[nodiscard]] auto begin() const -> iterator { return {this, 0}; }
    [[nodiscard]] auto end() const -> iterator { return {this, size()}; }

    [[nodiscard]] auto toVector() const -> std::vector<E> {
        if (values_) {
            return *values_;
        }
        return {begin(), end()};
    }

private:
    MemberList<CacheOf<E>> members_;
    std::shared_ptr<const std::vector<E>> values_;
};

}  // namespace enumkit::type

#endif  // ENUMKIT_TYPE_ENUM_CONTAINERS_HPP
