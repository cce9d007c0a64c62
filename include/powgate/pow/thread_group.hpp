/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace powgate {
namespace pow {

/**
 * Owns the threads of one search. If the group is destroyed with threads
 * still running (an exception left the scope, e.g. a failed spawn), it calls
 * the stop callback first and then joins every thread, so nothing outlives
 * the state the threads point at.
 */
class ThreadGroup {
public:
    explicit ThreadGroup(std::function<void()> request_stop);
    ~ThreadGroup();

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    // Throws std::system_error if the thread cannot be started
    void spawn(std::function<void()> body);

    void join_all();

    std::size_t size() const { return threads_.size(); }

private:
    std::function<void()> request_stop_;
    std::vector<std::thread> threads_;
};

} // namespace pow
} // namespace powgate
