#pragma once

#include <climits>
#include <deque>
#include <optional>
#include <runlib/concurrent/mutexed_value.hh>
#include <runlib/concurrent/semaphore.hh>
#include <type_traits>

namespace concurrent {

template <class Elem>
class BoundedQueue {
private:
    Semaphore free_slots_;
    Semaphore queued_elems_{0};
    MutexedValue<std::deque<Elem>> elems_;

public:
    explicit BoundedQueue(unsigned max_size = SEM_VALUE_MAX)
    : free_slots_(max_size) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue(BoundedQueue&&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;
    BoundedQueue& operator=(BoundedQueue&&) = delete;

    ~BoundedQueue() = default;

    // Returns std::nullopt iff there are no more elements and
    // signal_no_more_elems() was called
    std::optional<Elem> pop_opt() {
        queued_elems_.wait();
        return elems_.perform([&](auto& elems) -> std::optional<Elem> {
            if (elems.empty()) {
                queued_elems_.post(); // Let other consumers notice the end too
                return std::nullopt;
            }

            auto elem = std::optional<Elem>{std::move(elems.front())};
            elems.pop_front();
            free_slots_.post();
            return elem;
        });
    }

    // If an exception is thrown, @p elem is left intact
    void push(Elem&& elem) {
        free_slots_.wait();
        elems_.perform([&](auto& elems) {
            elems.emplace_back(std::move(elem));
            queued_elems_.post();
        });
    }

    // Calling push() after this method is forbidden. This method may be called
    // more than once
    void signal_no_more_elems() { queued_elems_.post(); }
};

} // namespace concurrent
