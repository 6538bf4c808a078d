#pragma once

#include "lob/text.hpp"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace lob {

template <typename T>
class Seq;

namespace detail {

template <typename T>
struct is_seq : std::false_type {};

template <typename T>
struct is_seq<Seq<T>> : std::true_type {};

template <typename R>
using range_value_t = std::remove_cvref_t<decltype(*std::begin(std::declval<R &>()))>;

template <typename T>
concept Hashable = requires(const T &value) {
    { std::hash<T>{}(value) } -> std::convertible_to<std::size_t>;
};

template <typename T>
concept StringLike = std::is_convertible_v<const T &, std::string_view>;

// Numeric sums over text parse the text; everything else converts directly.
template <typename U, typename V>
U convert(const V &value) {
    if constexpr (StringLike<V> && std::is_integral_v<U>) {
        return static_cast<U>(parse_integer(value));
    } else if constexpr (StringLike<V> && std::is_floating_point_v<U>) {
        return static_cast<U>(parse_double(value));
    } else {
        return U(value);
    }
}

inline void require_positive(std::size_t n, const char *what) {
    if (n == 0)
        throw std::invalid_argument(std::string(what) + " size must be greater than 0");
}

} // namespace detail

/**
 * @brief A lazy, single-pass sequence.
 *
 * Elements are pulled one at a time from a generator. Copies share the same
 * generator, so a sequence is consumed once no matter how many handles exist.
 * Every lazy operation returns a new sequence that pulls from this one; every
 * terminal operation drains it.
 */
template <typename T>
class Seq {
public:
    using value_type = T;
    using Generator = std::function<std::optional<T>()>;

    explicit Seq(Generator next) : next_(std::make_shared<Generator>(std::move(next))) {
    }

    /** @brief Pulls the next element, or nullopt once exhausted. */
    std::optional<T> next() const {
        return (*next_)();
    }

    /**
     * @brief Wraps any iterable. A Seq is returned as is; anything else is
     * copied up front.
     */
    template <typename R>
    static Seq<T> of(R values) {
        if constexpr (detail::is_seq<std::remove_cvref_t<R>>::value) {
            return values;
        } else {
            auto items = std::make_shared<std::vector<T>>(std::begin(values), std::end(values));
            return Seq<T>([items, pos = std::size_t{0}]() mutable -> std::optional<T> {
                if (pos >= items->size())
                    return std::nullopt;
                return (*items)[pos++];
            });
        }
    }

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = T *;
        using reference = T &;

        iterator() = default;
        explicit iterator(const Seq *seq) : seq_(seq) {
            advance();
        }

        T &operator*() {
            return *current_;
        }
        T *operator->() {
            return &*current_;
        }
        iterator &operator++() {
            advance();
            return *this;
        }
        void operator++(int) {
            advance();
        }
        bool operator==(std::default_sentinel_t) const {
            return !current_.has_value();
        }

    private:
        void advance() {
            current_ = seq_->next();
        }

        const Seq *seq_ = nullptr;
        std::optional<T> current_;
    };

    iterator begin() const {
        return iterator(this);
    }
    std::default_sentinel_t end() const {
        return {};
    }

    // Selection

    template <typename F>
    Seq<T> filter(F pred) const {
        return Seq<T>([src = *this, pred = std::move(pred)]() mutable -> std::optional<T> {
            while (auto item = src.next()) {
                if (std::invoke(pred, *item))
                    return item;
            }
            return std::nullopt;
        });
    }

    Seq<T> take(std::size_t n) const {
        return Seq<T>([src = *this, n, taken = std::size_t{0}]() mutable -> std::optional<T> {
            if (taken >= n)
                return std::nullopt;
            ++taken;
            return src.next();
        });
    }

    Seq<T> skip(std::size_t n) const {
        return Seq<T>([src = *this, n, skipped = false]() mutable -> std::optional<T> {
            if (!skipped) {
                skipped = true;
                for (std::size_t i = 0; i < n; ++i) {
                    if (!src.next())
                        return std::nullopt;
                }
            }
            return src.next();
        });
    }

    template <typename F>
    Seq<T> take_while(F pred) const {
        return Seq<T>([src = *this, pred = std::move(pred), done = false]() mutable -> std::optional<T> {
            if (done)
                return std::nullopt;
            auto item = src.next();
            if (!item || !std::invoke(pred, *item)) {
                done = true;
                return std::nullopt;
            }
            return item;
        });
    }

    template <typename F>
    Seq<T> skip_while(F pred) const {
        return Seq<T>([src = *this, pred = std::move(pred), skipping = true]() mutable -> std::optional<T> {
            while (skipping) {
                auto item = src.next();
                if (!item)
                    return std::nullopt;
                if (!std::invoke(pred, *item)) {
                    skipping = false;
                    return item;
                }
            }
            return src.next();
        });
    }

    /** @brief Drops repeated elements, keeping the first occurrence. */
    Seq<T> unique() const {
        if constexpr (detail::Hashable<T>) {
            return filter([seen = std::unordered_set<T>()](const T &item) mutable {
                return seen.insert(item).second;
            });
        } else if constexpr (std::totally_ordered<T>) {
            return filter([seen = std::set<T>()](const T &item) mutable { return seen.insert(item).second; });
        } else {
            return filter([seen = std::vector<T>()](const T &item) mutable {
                if (std::find(seen.begin(), seen.end(), item) != seen.end())
                    return false;
                seen.push_back(item);
                return true;
            });
        }
    }

    // Transformation

    template <typename F>
    auto map(F f) const {
        using U = std::remove_cvref_t<std::invoke_result_t<F &, T &>>;
        return Seq<U>([src = *this, f = std::move(f)]() mutable -> std::optional<U> {
            if (auto item = src.next())
                return std::invoke(f, *item);
            return std::nullopt;
        });
    }

    Seq<std::pair<std::size_t, T>> enumerate() const {
        using Indexed = std::pair<std::size_t, T>;
        return Seq<Indexed>([src = *this, index = std::size_t{0}]() mutable -> std::optional<Indexed> {
            auto item = src.next();
            if (!item)
                return std::nullopt;
            return Indexed{index++, std::move(*item)};
        });
    }

    /** @brief Pairs elements positionally; stops at the shorter side. */
    template <typename R>
    auto zip(R other) const {
        using U = detail::range_value_t<R>;
        using Pair = std::pair<T, U>;
        return Seq<Pair>([src = *this, rhs = Seq<U>::of(std::move(other))]() mutable -> std::optional<Pair> {
            auto left = src.next();
            if (!left)
                return std::nullopt;
            auto right = rhs.next();
            if (!right)
                return std::nullopt;
            return Pair{std::move(*left), std::move(*right)};
        });
    }

    /** @brief Maps each element to an iterable and concatenates the results. */
    template <typename F>
    auto flat_map(F f) const {
        using Inner = std::remove_cvref_t<std::invoke_result_t<F &, T &>>;
        using U = detail::range_value_t<Inner>;
        return Seq<U>([src = *this, f = std::move(f), inner = std::optional<Seq<U>>()]() mutable -> std::optional<U> {
            while (true) {
                if (inner) {
                    if (auto value = inner->next())
                        return value;
                    inner.reset();
                }
                auto item = src.next();
                if (!item)
                    return std::nullopt;
                inner = Seq<U>::of(std::invoke(f, *item));
            }
        });
    }

    auto flatten() const {
        return flat_map([](T &item) -> T & { return item; });
    }

    // Grouping

    /** @brief Consecutive groups of `n`; the last one may be shorter. */
    Seq<std::vector<T>> chunk(std::size_t n) const {
        detail::require_positive(n, "chunk");
        using Chunk = std::vector<T>;
        return Seq<Chunk>([src = *this, n]() mutable -> std::optional<Chunk> {
            Chunk chunk;
            chunk.reserve(n);
            while (chunk.size() < n) {
                auto item = src.next();
                if (!item)
                    break;
                chunk.push_back(std::move(*item));
            }
            if (chunk.empty())
                return std::nullopt;
            return chunk;
        });
    }

    /** @brief Sliding windows of exactly `n`; nothing when fewer than `n` elements exist. */
    Seq<std::vector<T>> window(std::size_t n) const {
        detail::require_positive(n, "window");
        using Window = std::vector<T>;
        return Seq<Window>([src = *this, n, buffer = Window()]() mutable -> std::optional<Window> {
            if (buffer.size() == n)
                buffer.erase(buffer.begin());
            while (buffer.size() < n) {
                auto item = src.next();
                if (!item)
                    return std::nullopt;
                buffer.push_back(std::move(*item));
            }
            return buffer;
        });
    }

    /**
     * @brief Groups elements by key, in order of each key's first appearance.
     *
     * The source is drained on the first pull.
     */
    template <typename F>
    auto group_by(F key_fn) const {
        using K = std::remove_cvref_t<std::invoke_result_t<F &, T &>>;
        using Group = std::pair<K, std::vector<T>>;
        return deferred<Group>([src = *this, key_fn = std::move(key_fn)]() mutable {
            std::vector<Group> groups;
            std::map<K, std::size_t> index;
            while (auto item = src.next()) {
                K key = std::invoke(key_fn, *item);
                auto [it, inserted] = index.try_emplace(key, groups.size());
                if (inserted)
                    groups.emplace_back(std::move(key), std::vector<T>{});
                groups[it->second].second.push_back(std::move(*item));
            }
            return groups;
        });
    }

    /**
     * @brief Inner join: every (left, right) pair whose keys match, in left order.
     *
     * `other` is indexed by `right_key` on the first pull; the left side streams.
     */
    template <typename R, typename FL, typename FR>
    auto join_inner(R other, FL left_key, FR right_key) const {
        using U = detail::range_value_t<R>;
        using Pair = std::pair<T, U>;
        return join_impl<Pair>(std::move(other), std::move(left_key), std::move(right_key), false);
    }

    /** @brief Left join: unmatched left elements appear once paired with nullopt. */
    template <typename R, typename FL, typename FR>
    auto join_left(R other, FL left_key, FR right_key) const {
        using U = detail::range_value_t<R>;
        using Pair = std::pair<T, std::optional<U>>;
        return join_impl<Pair>(std::move(other), std::move(left_key), std::move(right_key), true);
    }

    template <typename R, typename FL, typename FR>
    auto join(R other, FL left_key, FR right_key) const {
        return join_inner(std::move(other), std::move(left_key), std::move(right_key));
    }

    // Ordering

    Seq<T> sorted() const {
        return deferred<T>([src = *this]() {
            std::vector<T> items = src.to_list();
            std::sort(items.begin(), items.end());
            return items;
        });
    }

    /** @brief Stable sort by a projected key. */
    template <typename F>
    Seq<T> sort_by(F key_fn) const {
        return deferred<T>([src = *this, key_fn = std::move(key_fn)]() mutable {
            std::vector<T> items = src.to_list();
            std::stable_sort(items.begin(), items.end(),
                             [&](T &a, T &b) { return std::invoke(key_fn, a) < std::invoke(key_fn, b); });
            return items;
        });
    }

    // Terminal

    std::size_t count() const {
        std::size_t n = 0;
        while (next())
            ++n;
        return n;
    }

    /**
     * @brief Adds every element into a `U`.
     *
     * When the elements are text and `U` is numeric, each element is parsed;
     * malformed text counts as zero.
     */
    template <typename U = T>
    U sum() const {
        U total{};
        while (auto item = next())
            total += detail::convert<U>(*item);
        return total;
    }

    std::optional<T> min() const {
        std::optional<T> best;
        while (auto item = next()) {
            if (!best || *item < *best)
                best = std::move(item);
        }
        return best;
    }

    std::optional<T> max() const {
        std::optional<T> best;
        while (auto item = next()) {
            if (!best || *best < *item)
                best = std::move(item);
        }
        return best;
    }

    std::optional<T> first() const {
        return next();
    }

    std::optional<T> last() const {
        std::optional<T> last;
        while (auto item = next())
            last = std::move(item);
        return last;
    }

    template <typename F>
    std::optional<T> reduce(F f) const {
        std::optional<T> acc = next();
        if (!acc)
            return std::nullopt;
        while (auto item = next())
            acc = static_cast<T>(std::invoke(f, *acc, *item));
        return acc;
    }

    template <typename A, typename F>
    A fold(A init, F f) const {
        while (auto item = next())
            init = std::invoke(f, std::move(init), *item);
        return init;
    }

    template <typename F>
    bool any(F pred) const {
        while (auto item = next()) {
            if (std::invoke(pred, *item))
                return true;
        }
        return false;
    }

    template <typename F>
    bool all(F pred) const {
        while (auto item = next()) {
            if (!std::invoke(pred, *item))
                return false;
        }
        return true;
    }

    std::vector<T> to_list() const {
        std::vector<T> items;
        while (auto item = next())
            items.push_back(std::move(*item));
        return items;
    }

    template <typename C = std::vector<T>>
    C collect() const {
        C out;
        while (auto item = next())
            out.insert(out.end(), std::move(*item));
        return out;
    }

private:
    template <typename U, typename Build>
    static Seq<U> deferred(Build build) {
        return Seq<U>([build = std::move(build), items = std::optional<std::vector<U>>(),
                       pos = std::size_t{0}]() mutable -> std::optional<U> {
            if (!items)
                items = build();
            if (pos >= items->size())
                return std::nullopt;
            return std::move((*items)[pos++]);
        });
    }

    template <typename Pair, typename R, typename FL, typename FR>
    Seq<Pair> join_impl(R other, FL left_key, FR right_key, bool keep_unmatched) const {
        using U = detail::range_value_t<R>;
        using K = std::remove_cvref_t<std::invoke_result_t<FR &, U &>>;
        using Index = std::map<K, std::vector<U>>;

        return Seq<Pair>([src = *this, other = std::move(other), left_key = std::move(left_key),
                          right_key = std::move(right_key), keep_unmatched, index = std::optional<Index>(),
                          current = std::optional<T>(), matches = static_cast<const std::vector<U> *>(nullptr),
                          pos = std::size_t{0}]() mutable -> std::optional<Pair> {
            if (!index) {
                index.emplace();
                for (auto &&item : other) {
                    U value = item;
                    K key = std::invoke(right_key, value);
                    (*index)[std::move(key)].push_back(std::move(value));
                }
            }
            while (true) {
                if (current && matches && pos < matches->size())
                    return Pair{*current, (*matches)[pos++]};

                current = src.next();
                if (!current)
                    return std::nullopt;
                auto found = index->find(std::invoke(left_key, *current));
                pos = 0;
                if (found != index->end()) {
                    matches = &found->second;
                } else {
                    matches = nullptr;
                    if constexpr (std::is_constructible_v<Pair, T &, std::nullopt_t>) {
                        if (keep_unmatched)
                            return Pair{*current, std::nullopt};
                    }
                }
            }
        });
    }

    std::shared_ptr<Generator> next_;
};

/** @brief A sequence over any iterable's elements. */
template <typename R>
auto from(R values) {
    using T = detail::range_value_t<R>;
    return Seq<T>::of(std::move(values));
}

/** @brief The integers in [start, end). */
inline Seq<long long> range(long long start, long long end) {
    return Seq<long long>([current = start, end]() mutable -> std::optional<long long> {
        if (current >= end)
            return std::nullopt;
        return current++;
    });
}

} // namespace lob
