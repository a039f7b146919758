#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace hyperload::core
{

/// 용량 제한이 있는 MPSC 채널.
///
/// - Sender는 복사할 때마다 송신자 수가 늘고, 소멸/release() 시 줄어든다.
/// - 송신자가 하나도 남지 않고 큐가 비면 Receiver::recv()는 nullopt를 반환한다.
///   (모든 생산자가 끝난 시점 == 채널이 닫힌 시점. 스레드 join 여부와는 무관)
/// - 큐가 가득 차면 send()는 자리가 날 때까지 블록한다. 결과를 버리지 않는다.
/// - Receiver가 사라지면 send()는 false를 반환한다.
template <typename T>
class Channel
{
    struct State
    {
        explicit State(std::size_t cap) : capacity(cap == 0 ? 1 : cap) {}

        std::mutex mu;
        std::condition_variable notEmpty;
        std::condition_variable notFull;
        std::deque<T> items;
        const std::size_t capacity;
        std::size_t senders{0};
        bool receiverGone{false};
    };

  public:
    class Sender
    {
      public:
        Sender() = default;

        Sender(const Sender &other) : state_(other.state_) { attach_(); }
        Sender &operator=(const Sender &other)
        {
            if (this != &other)
            {
                release();
                state_ = other.state_;
                attach_();
            }
            return *this;
        }

        Sender(Sender &&other) noexcept : state_(std::move(other.state_)) {}
        Sender &operator=(Sender &&other) noexcept
        {
            if (this != &other)
            {
                release();
                state_ = std::move(other.state_);
            }
            return *this;
        }

        ~Sender() { release(); }

        /// 블로킹 전송. 수신측이 사라졌거나 이미 release된 핸들이면 false.
        [[nodiscard]] bool send(T value)
        {
            if (!state_)
                return false;

            std::unique_lock lk(state_->mu);
            state_->notFull.wait(lk, [this] {
                return state_->receiverGone || state_->items.size() < state_->capacity;
            });
            if (state_->receiverGone)
                return false;

            state_->items.push_back(std::move(value));
            lk.unlock();
            state_->notEmpty.notify_one();
            return true;
        }

        /// 송신자 참조를 즉시 반납한다. (idempotent)
        void release() noexcept
        {
            if (!state_)
                return;

            bool last = false;
            {
                std::scoped_lock lk(state_->mu);
                last = (--state_->senders == 0);
            }
            if (last)
                state_->notEmpty.notify_all();
            state_.reset();
        }

        [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

      private:
        friend class Channel;

        explicit Sender(std::shared_ptr<State> st) : state_(std::move(st)) { attach_(); }

        void attach_()
        {
            if (!state_)
                return;
            std::scoped_lock lk(state_->mu);
            ++state_->senders;
        }

        std::shared_ptr<State> state_;
    };

    class Receiver
    {
      public:
        Receiver() = default;

        Receiver(const Receiver &) = delete;
        Receiver &operator=(const Receiver &) = delete;

        Receiver(Receiver &&) noexcept = default;
        Receiver &operator=(Receiver &&other) noexcept
        {
            if (this != &other)
            {
                detach_();
                state_ = std::move(other.state_);
            }
            return *this;
        }

        ~Receiver() { detach_(); }

        /// 다음 항목을 꺼낸다. 모든 Sender가 반납되고 큐가 비었으면 nullopt.
        [[nodiscard]] std::optional<T> recv()
        {
            if (!state_)
                return std::nullopt;

            std::unique_lock lk(state_->mu);
            state_->notEmpty.wait(lk, [this] { return !state_->items.empty() || state_->senders == 0; });
            if (state_->items.empty())
                return std::nullopt;

            T value = std::move(state_->items.front());
            state_->items.pop_front();
            lk.unlock();
            state_->notFull.notify_one();
            return value;
        }

        [[nodiscard]] std::size_t capacity() const noexcept { return state_ ? state_->capacity : 0; }

      private:
        friend class Channel;

        explicit Receiver(std::shared_ptr<State> st) : state_(std::move(st)) {}

        void detach_() noexcept
        {
            if (!state_)
                return;
            {
                std::scoped_lock lk(state_->mu);
                state_->receiverGone = true;
                state_->items.clear();
            }
            state_->notFull.notify_all();
            state_.reset();
        }

        std::shared_ptr<State> state_;
    };

    /// 송신 핸들 1개와 수신 핸들을 만든다. 추가 생산자는 Sender를 복사해서 얻는다.
    static std::pair<Sender, Receiver> open(std::size_t capacity)
    {
        auto st = std::make_shared<State>(capacity);
        return {Sender{st}, Receiver{st}};
    }
};

} // namespace hyperload::core
