#pragma once

#include "rdbcpp/core/exception.hpp"
#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace rdbcpp {
namespace core {

/**
 * @brief Producer behind one subscription
 *
 * next() returns std::nullopt when exhausted and throws on failure. The
 * source releases its resources on exhaustion, on failure, on cancel() and in
 * its destructor, whichever comes first.
 */
template<typename T>
class Source {
public:
    virtual ~Source() = default;

    virtual std::optional<T> next() = 0;
    virtual void cancel() noexcept = 0;
};

/**
 * @brief Active pull on a ResultStream
 *
 * Move-only. Errors are rethrown once from the pull that hit them; afterwards
 * the subscription is finished. Destroying an unfinished subscription cancels
 * it.
 */
template<typename T>
class Subscription {
public:
    explicit Subscription(std::unique_ptr<Source<T>> source)
        : source_(std::move(source)) {
        done_ = (source_ == nullptr);
    }

    ~Subscription() { cancel(); }

    Subscription(Subscription&& other) noexcept
        : source_(std::move(other.source_)), done_(other.done_) {
        other.done_ = true;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            cancel();
            source_ = std::move(other.source_);
            done_ = other.done_;
            other.done_ = true;
        }
        return *this;
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    std::optional<T> next() {
        if (done_) {
            return std::nullopt;
        }
        try {
            auto item = source_->next();
            if (!item) {
                done_ = true;
                source_.reset();
            }
            return item;
        }
        catch (...) {
            done_ = true;
            cancelSource();
            throw;
        }
    }

    /**
     * @brief Pull up to n items
     * @return fewer than n items only when the stream has completed
     */
    std::vector<T> request(size_t n) {
        std::vector<T> batch;
        batch.reserve(n);
        while (batch.size() < n) {
            auto item = next();
            if (!item) {
                break;
            }
            batch.push_back(std::move(*item));
        }
        return batch;
    }

    void cancel() noexcept {
        done_ = true;
        cancelSource();
    }

    bool isDone() const noexcept { return done_; }

    /**
     * @brief Single-pass input iterator over the remaining items
     */
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        Iterator(Subscription* subscription, bool end)
            : subscription_(subscription), end_(end) {
            if (!end_) {
                fetch();
            }
        }

        Iterator& operator++() {
            fetch();
            return *this;
        }

        bool operator==(const Iterator& other) const { return end_ == other.end_; }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

        reference operator*() const { return current_.value(); }
        pointer operator->() const { return &current_.value(); }

    private:
        void fetch() {
            current_ = subscription_->next();
            end_ = !current_.has_value();
        }

        Subscription* subscription_;
        std::optional<T> current_;
        bool end_;
    };

    Iterator begin() { return Iterator(this, false); }
    Iterator end() { return Iterator(this, true); }

private:
    void cancelSource() noexcept {
        if (source_) {
            source_->cancel();
            source_.reset();
        }
    }

    std::unique_ptr<Source<T>> source_;
    bool done_ = false;
};

template<typename T>
class Single;

template<typename T>
class ResultStream;

namespace detail {

template<typename T>
class VectorSource : public Source<T> {
public:
    explicit VectorSource(std::vector<T> items) : items_(std::move(items)) {}

    std::optional<T> next() override {
        if (position_ >= items_.size()) {
            return std::nullopt;
        }
        return std::move(items_[position_++]);
    }

    void cancel() noexcept override { position_ = items_.size(); }

private:
    std::vector<T> items_;
    size_t position_ = 0;
};

template<typename T>
class ErrorSource : public Source<T> {
public:
    explicit ErrorSource(std::exception_ptr error) : error_(std::move(error)) {}

    std::optional<T> next() override {
        if (!error_) {
            return std::nullopt;
        }
        auto error = std::move(error_);
        error_ = nullptr;
        std::rethrow_exception(error);
    }

    void cancel() noexcept override { error_ = nullptr; }

private:
    std::exception_ptr error_;
};

template<typename In, typename Out, typename F>
class MapSource : public Source<Out> {
public:
    MapSource(Subscription<In> upstream, F fn)
        : upstream_(std::move(upstream)), fn_(std::move(fn)) {}

    std::optional<Out> next() override {
        auto item = upstream_.next();
        if (!item) {
            return std::nullopt;
        }
        return std::optional<Out>(fn_(std::move(*item)));
    }

    void cancel() noexcept override { upstream_.cancel(); }

private:
    Subscription<In> upstream_;
    F fn_;
};

template<typename T, typename P>
class FilterSource : public Source<T> {
public:
    FilterSource(Subscription<T> upstream, P predicate)
        : upstream_(std::move(upstream)), predicate_(std::move(predicate)) {}

    std::optional<T> next() override {
        while (auto item = upstream_.next()) {
            if (predicate_(*item)) {
                return item;
            }
        }
        return std::nullopt;
    }

    void cancel() noexcept override { upstream_.cancel(); }

private:
    Subscription<T> upstream_;
    P predicate_;
};

template<typename T>
class TakeSource : public Source<T> {
public:
    TakeSource(Subscription<T> upstream, size_t limit)
        : upstream_(std::move(upstream)), remaining_(limit) {
        if (remaining_ == 0) {
            upstream_.cancel();
        }
    }

    std::optional<T> next() override {
        if (remaining_ == 0) {
            return std::nullopt;
        }
        auto item = upstream_.next();
        if (item && --remaining_ == 0) {
            // Enough items: release the upstream cursor right away
            upstream_.cancel();
        }
        return item;
    }

    void cancel() noexcept override {
        remaining_ = 0;
        upstream_.cancel();
    }

private:
    Subscription<T> upstream_;
    size_t remaining_;
};

template<typename T>
class ConcatSource : public Source<T> {
public:
    ConcatSource(ResultStream<T> first, ResultStream<T> second);

    std::optional<T> next() override;
    void cancel() noexcept override;

private:
    std::optional<ResultStream<T>> pendingFirst_;
    std::optional<ResultStream<T>> pendingSecond_;
    std::optional<Subscription<T>> current_;
};

} // namespace detail

/**
 * @brief Lazy, cold, single-subscription sequence
 *
 * Nothing happens until subscribe(); the factory then creates the source
 * (for statements: acquires a connection and sends the SQL). Copies share
 * one subscription slot, so a stream is consumed at most once no matter how
 * many handles exist.
 */
template<typename T>
class ResultStream {
public:
    using value_type = T;
    using Factory = std::function<std::unique_ptr<Source<T>>()>;

    explicit ResultStream(Factory factory)
        : state_(std::make_shared<State>(std::move(factory))) {}

    static ResultStream just(std::vector<T> items) {
        auto shared = std::make_shared<std::vector<T>>(std::move(items));
        return ResultStream([shared]() -> std::unique_ptr<Source<T>> {
            return std::make_unique<detail::VectorSource<T>>(std::move(*shared));
        });
    }

    static ResultStream empty() { return just({}); }

    static ResultStream error(std::exception_ptr error) {
        return ResultStream([error]() -> std::unique_ptr<Source<T>> {
            return std::make_unique<detail::ErrorSource<T>>(error);
        });
    }

    /**
     * @throws AlreadyConsumed on a second subscription
     */
    Subscription<T> subscribe() const {
        if (state_->subscribed.exchange(true)) {
            throw AlreadyConsumed("Result stream can be subscribed only once");
        }
        auto factory = std::move(state_->factory);
        state_->factory = nullptr;
        return Subscription<T>(factory());
    }

    bool isSubscribed() const noexcept { return state_->subscribed.load(); }

    template<typename F>
    auto map(F fn) const -> ResultStream<std::invoke_result_t<F, T&&>> {
        using R = std::invoke_result_t<F, T&&>;
        ResultStream self = *this;
        return ResultStream<R>([self, fn]() -> std::unique_ptr<Source<R>> {
            return std::make_unique<detail::MapSource<T, R, F>>(self.subscribe(), fn);
        });
    }

    template<typename P>
    ResultStream filter(P predicate) const {
        ResultStream self = *this;
        return ResultStream([self, predicate]() -> std::unique_ptr<Source<T>> {
            return std::make_unique<detail::FilterSource<T, P>>(self.subscribe(), predicate);
        });
    }

    ResultStream take(size_t n) const {
        ResultStream self = *this;
        return ResultStream([self, n]() -> std::unique_ptr<Source<T>> {
            return std::make_unique<detail::TakeSource<T>>(self.subscribe(), n);
        });
    }

    // Items of this stream, then items of other; other is subscribed only
    // after this one completes
    ResultStream concatWith(ResultStream other) const {
        ResultStream self = *this;
        return ResultStream([self, other]() -> std::unique_ptr<Source<T>> {
            return std::make_unique<detail::ConcatSource<T>>(self, other);
        });
    }

    Single<std::vector<T>> collectList() const;

    // First item or nullopt; the rest of the stream is cancelled
    Single<std::optional<T>> first() const;

    // Drain the stream, discarding items
    Single<void> then() const;

    // Subscribe and drain into a vector
    std::vector<T> toList() const { return collectList().get(); }

private:
    struct State {
        explicit State(Factory f) : factory(std::move(f)) {}
        Factory factory;
        std::atomic<bool> subscribed{false};
    };

    std::shared_ptr<State> state_;
};

/**
 * @brief Lazy computation of exactly one value (or completion for void)
 *
 * Cold like ResultStream: the supplier runs on get(), once.
 */
template<typename T>
class Single {
public:
    using value_type = T;
    using Supplier = std::function<T()>;

    explicit Single(Supplier supplier)
        : state_(std::make_shared<State>(std::move(supplier))) {}

    template<typename U = T>
        requires (!std::is_void_v<U>)
    static Single just(U value) {
        return Single([value]() -> T { return value; });
    }

    static Single error(std::exception_ptr error) {
        return Single([error]() -> T { std::rethrow_exception(error); });
    }

    /**
     * @brief Run the computation
     * @throws AlreadyConsumed when called a second time
     */
    T get() const {
        if (state_->consumed.exchange(true)) {
            throw AlreadyConsumed("Single result can be consumed only once");
        }
        auto supplier = std::move(state_->supplier);
        state_->supplier = nullptr;
        return supplier();
    }

    bool isConsumed() const noexcept { return state_->consumed.load(); }

    template<typename F>
    auto map(F fn) const {
        Single self = *this;
        if constexpr (std::is_void_v<T>) {
            using R = std::invoke_result_t<F>;
            return Single<R>([self, fn]() mutable -> R {
                self.get();
                return fn();
            });
        } else {
            using R = std::invoke_result_t<F, T&&>;
            return Single<R>([self, fn]() mutable -> R {
                return fn(self.get());
            });
        }
    }

    // fn returns a Single or ResultStream that is subscribed after this one
    template<typename F>
    auto flatMap(F fn) const {
        Single self = *this;
        if constexpr (std::is_void_v<T>) {
            using Next = std::invoke_result_t<F>;
            return chain<Next>([self, fn]() mutable { self.get(); return fn(); });
        } else {
            using Next = std::invoke_result_t<F, T&&>;
            return chain<Next>([self, fn]() mutable { return fn(self.get()); });
        }
    }

    // Run this, then other; other's result is the result
    template<typename U>
    Single<U> then(Single<U> other) const {
        return flatMap([other](auto&&...) { return other; });
    }

    Single<void> then() const {
        Single self = *this;
        return Single<void>([self]() { self.get(); });
    }

private:
    template<typename Next, typename G>
    static auto chain(G produce) {
        if constexpr (is_stream<Next>::value) {
            using R = typename Next::value_type;
            return ResultStream<R>([produce]() mutable -> std::unique_ptr<Source<R>> {
                return std::make_unique<ForwardSource<R>>(produce().subscribe());
            });
        } else {
            using R = typename Next::value_type;
            return Single<R>([produce]() mutable -> R { return produce().get(); });
        }
    }

    template<typename S>
    struct is_stream : std::false_type {};
    template<typename S>
    struct is_stream<ResultStream<S>> : std::true_type {};

    template<typename R>
    class ForwardSource : public Source<R> {
    public:
        explicit ForwardSource(Subscription<R> upstream) : upstream_(std::move(upstream)) {}
        std::optional<R> next() override { return upstream_.next(); }
        void cancel() noexcept override { upstream_.cancel(); }
    private:
        Subscription<R> upstream_;
    };

    struct State {
        explicit State(Supplier s) : supplier(std::move(s)) {}
        Supplier supplier;
        std::atomic<bool> consumed{false};
    };

    std::shared_ptr<State> state_;
};

template<typename T>
Single<std::vector<T>> ResultStream<T>::collectList() const {
    ResultStream self = *this;
    return Single<std::vector<T>>([self]() {
        std::vector<T> items;
        auto subscription = self.subscribe();
        while (auto item = subscription.next()) {
            items.push_back(std::move(*item));
        }
        return items;
    });
}

template<typename T>
Single<std::optional<T>> ResultStream<T>::first() const {
    ResultStream self = *this;
    return Single<std::optional<T>>([self]() {
        auto subscription = self.subscribe();
        auto item = subscription.next();
        subscription.cancel();
        return item;
    });
}

template<typename T>
Single<void> ResultStream<T>::then() const {
    ResultStream self = *this;
    return Single<void>([self]() {
        auto subscription = self.subscribe();
        while (subscription.next()) {
        }
    });
}

namespace detail {

template<typename T>
ConcatSource<T>::ConcatSource(ResultStream<T> first, ResultStream<T> second)
    : pendingFirst_(std::move(first)), pendingSecond_(std::move(second)) {}

template<typename T>
std::optional<T> ConcatSource<T>::next() {
    while (true) {
        if (!current_) {
            if (pendingFirst_) {
                current_.emplace(pendingFirst_->subscribe());
                pendingFirst_.reset();
            } else if (pendingSecond_) {
                current_.emplace(pendingSecond_->subscribe());
                pendingSecond_.reset();
            } else {
                return std::nullopt;
            }
        }
        if (auto item = current_->next()) {
            return item;
        }
        current_.reset();
    }
}

template<typename T>
void ConcatSource<T>::cancel() noexcept {
    pendingFirst_.reset();
    pendingSecond_.reset();
    if (current_) {
        current_->cancel();
        current_.reset();
    }
}

} // namespace detail

} // namespace core
} // namespace rdbcpp
