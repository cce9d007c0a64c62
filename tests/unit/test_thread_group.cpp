/*
 * Unit tests for search thread ownership
 * Copyright (C) 2025 Regis Araujo Melo
 * GPL-3.0-only
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <powgate/pow/thread_group.hpp>

#include <atomic>
#include <stdexcept>
#include <system_error>

using namespace powgate::pow;

TEST_SUITE("Thread group") {
    TEST_CASE("join_all waits for every thread") {
        std::atomic<int> done{0};
        ThreadGroup group([] {});
        for (int i = 0; i < 4; ++i) {
            group.spawn([&done] { done.fetch_add(1); });
        }
        CHECK(group.size() == 4);
        group.join_all();
        CHECK(done.load() == 4);
    }

    TEST_CASE("spawn failure mid-loop stops and joins running threads") {
        std::atomic<bool> stop{false};
        std::atomic<int> finished{0};
        bool stop_requested = false;

        try {
            ThreadGroup group([&] {
                stop_requested = true;
                stop.store(true);
            });
            for (int i = 0; i < 3; ++i) {
                group.spawn([&] {
                    while (!stop.load()) {
                        std::this_thread::yield();
                    }
                    finished.fetch_add(1);
                });
            }
            // Same exception std::thread raises when the thread limit is reached
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
        } catch (const std::system_error& e) {
            CHECK(e.code() == std::errc::resource_unavailable_try_again);
        }

        CHECK(stop_requested);
        CHECK(finished.load() == 3);
    }

    TEST_CASE("no stop request once threads are joined") {
        bool stop_requested = false;
        {
            ThreadGroup group([&] { stop_requested = true; });
            group.spawn([] {});
            group.join_all();
        }
        CHECK_FALSE(stop_requested);
    }
}
