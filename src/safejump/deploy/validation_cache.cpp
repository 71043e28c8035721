#include <safejump/config.hpp>
#include <safejump/core/assert.h>
#include <safejump/deploy/validation_cache.hpp>
#include <safejump/validation_error.hpp>

#include <boost/intrusive/list.hpp>
#include <boost/intrusive/unordered_set.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

SAFEJUMP_NAMESPACE_BEGIN

class ValidationCache::Impl
{
    using ListHook =
        boost::intrusive::list_member_hook<boost::intrusive::link_mode<
            boost::intrusive::link_mode_type::normal_link>>;

    static_assert(sizeof(ListHook) == 16);
    static_assert(alignof(ListHook) == 8);

    using SetHook =
        boost::intrusive::unordered_set_member_hook<boost::intrusive::link_mode<
            boost::intrusive::link_mode_type::normal_link>>;

    static_assert(sizeof(SetHook) == 8);
    static_assert(alignof(SetHook) == 8);

    struct Item
    {
        ValidationKey key{};
        ValidationError verdict{ValidationError::Success};

        ListHook list_hook{};
        SetHook set_hook{};
    };

    using List = boost::intrusive::list<
        Item, boost::intrusive::member_hook<Item, ListHook, &Item::list_hook>,
        boost::intrusive::constant_time_size<true>>;

    struct HashFunc
    {
        [[gnu::always_inline]] size_t operator()(ValidationKey const &key) const
        {
            size_t h;
            std::memcpy(&h, key.code_hash.bytes, sizeof(h));
            h ^= static_cast<size_t>(key.revision) << 2;
            h ^= static_cast<size_t>(key.implicit_stop_at_end);
            h ^= static_cast<size_t>(key.require_consistent_stack_height) << 1;
            return h;
        }
    };

    struct KeyFunc
    {
        typedef ValidationKey type;

        [[gnu::always_inline]] constexpr ValidationKey const &
        operator()(Item const &item) const
        {
            return item.key;
        }
    };

    using Set = boost::intrusive::unordered_set<
        Item, boost::intrusive::member_hook<Item, SetHook, &Item::set_hook>,
        boost::intrusive::constant_time_size<false>,
        boost::intrusive::hash<HashFunc>,
        boost::intrusive::power_2_buckets<true>,
        boost::intrusive::incremental<true>,
        boost::intrusive::key_of_value<KeyFunc>>;

    static_assert(std::is_same_v<Set::key_type, ValidationKey>);

    static constexpr size_t N = ValidationCache::capacity;

    mutable std::mutex mutex_;

    Item items_[N]{};
    size_t n_{0};

    List list_{};
    Set::bucket_type set_buckets_[N];
    Set set_{Set::bucket_traits(set_buckets_, N)};

    std::pair<size_t, size_t> hit_rate_{0, 0};

public:
    Impl() = default;

    std::pair<size_t, size_t> hit_rate() const
    {
        std::unique_lock ulk(mutex_);
        SAFEJUMP_ASSERT(ulk.owns_lock());
        return hit_rate_;
    }

    size_t size() const
    {
        std::unique_lock ulk(mutex_);
        SAFEJUMP_ASSERT(ulk.owns_lock());
        return list_.size();
    }

    std::optional<ValidationError> get(ValidationKey const &key)
    {
        std::unique_lock ulk(mutex_);
        SAFEJUMP_ASSERT(ulk.owns_lock());
        ++hit_rate_.second;
        auto const it = set_.find(key);
        if (it == set_.end()) {
            return std::nullopt;
        }
        ++hit_rate_.first;
        list_.erase(list_.iterator_to(*it));
        list_.push_front(*it);
        return it->verdict;
    }

    void put(ValidationKey const &key, ValidationError const verdict)
    {
        std::unique_lock ulk(mutex_);
        SAFEJUMP_ASSERT(ulk.owns_lock());
        if (auto const it = set_.find(key); it != set_.end()) {
            it->verdict = verdict;
            list_.erase(list_.iterator_to(*it));
            list_.push_front(*it);
            return;
        }
        Item *item = nullptr;
        if (n_ < N) {
            item = &items_[n_++];
        }
        else {
            item = &list_.back();
            list_.pop_back();
            set_.erase(item->key);
            LOG_DEBUG(
                "evicted verdict for revision {}",
                static_cast<int>(item->key.revision));
        }
        SAFEJUMP_DEBUG_ASSERT(item);
        item->key = key;
        item->verdict = verdict;
        list_.push_front(*item);
        auto const [it, inserted] = set_.insert(*item);
        SAFEJUMP_DEBUG_ASSERT(inserted);
    }
};

ValidationCache::ValidationCache()
    : impl_(std::make_unique<Impl>())
{
}

ValidationCache::~ValidationCache() {}

std::optional<ValidationError> ValidationCache::get(ValidationKey const &key)
{
    return impl_->get(key);
}

void ValidationCache::put(ValidationKey const &key, ValidationError const verdict)
{
    impl_->put(key, verdict);
}

std::pair<size_t, size_t> ValidationCache::hit_rate() const
{
    return impl_->hit_rate();
}

size_t ValidationCache::size() const
{
    return impl_->size();
}

SAFEJUMP_NAMESPACE_END
