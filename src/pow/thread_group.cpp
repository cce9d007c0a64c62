/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powgate/pow/thread_group.hpp"

#include <utility>

namespace powgate {
namespace pow {

ThreadGroup::ThreadGroup(std::function<void()> request_stop)
    : request_stop_(std::move(request_stop)) {}

ThreadGroup::~ThreadGroup() {
    bool running = false;
    for (const auto& t : threads_) {
        running = running || t.joinable();
    }
    if (running && request_stop_) {
        request_stop_();
    }
    join_all();
}

void ThreadGroup::spawn(std::function<void()> body) {
    threads_.emplace_back(std::move(body));
}

void ThreadGroup::join_all() {
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

} // namespace pow
} // namespace powgate
