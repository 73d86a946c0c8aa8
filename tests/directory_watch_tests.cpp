#include "test_common.hpp"

#ifdef __linux__
#include <unistd.h>
#endif

using namespace pathmon;
using pathmon::test_support::TempDir;
using pathmon::test_support::touch;

#ifdef __linux__

TEST_CASE("Opening a missing directory reports not found") {
    auto port = std::make_shared<CompletionPort>();
    TempDir tmp("watch_missing");
    try {
        DirectoryWatch watch(tmp.path() / "absent", 1, port);
        FAIL("expected filesystem_error");
    } catch (const fs::filesystem_error& e) {
        REQUIRE(e.code() == std::errc::no_such_file_or_directory);
    }
}

TEST_CASE("Zero-byte delivery grows the buffer and keeps the watch") {
    TempDir tmp("watch_grow");
    auto port = std::make_shared<CompletionPort>();
    DirectoryWatch watch(tmp.path(), 7, port, 16);
    watch.track({});
    watch.rearm();
    touch(tmp.path() / "a_long_entry_name");

    Completion c = port->wait();
    REQUIRE(c.key == 7);
    auto bytes = watch.take_delivery(c);
    REQUIRE(bytes.has_value());
    REQUIRE(*bytes == 0);

    std::size_t before = watch.buffer_size();
    watch.grow_buffer();
    REQUIRE(watch.buffer_size() >= 2 * before);
    watch.rearm();
    REQUIRE_FALSE(watch.prefix_lost());

    // The event stays queued until the buffer is large enough.
    std::vector<ChangeRecord> records;
    for (int i = 0; i < 4 && records.empty(); ++i) {
        Completion next = port->wait();
        REQUIRE(next.key == 7);
        auto got = watch.take_delivery(next);
        if (!got)
            continue;
        if (*got == 0) {
            watch.grow_buffer();
            continue;
        }
        records = watch.parse(*got);
    }
    REQUIRE_FALSE(records.empty());
    REQUIRE(records.front().name == fs::path("a_long_entry_name"));
}

TEST_CASE("Records below the prefix are named relative to it") {
    TempDir tmp("watch_relative");
    fs::create_directories(tmp.path() / "sub");
    auto port = std::make_shared<CompletionPort>();
    DirectoryWatch watch(tmp.path(), 3, port);
    watch.track({fs::path("sub") / "target"});
    watch.rearm();

    touch(tmp.path() / "sub" / "target");
    Completion c = port->wait();
    REQUIRE(c.key == 3);
    auto bytes = watch.take_delivery(c);
    REQUIRE(bytes.has_value());
    REQUIRE(*bytes > 0);
    auto records = watch.parse(*bytes);
    REQUIRE_FALSE(records.empty());
    REQUIRE(records.front().name == fs::path("sub") / "target");
    REQUIRE(tail_matches(fs::path("sub") / "target", records.front().name));
}

TEST_CASE("Removing the watched directory loses the prefix") {
    TempDir tmp("watch_lost");
    fs::path dir = tmp.path() / "gone";
    fs::create_directories(dir);
    auto port = std::make_shared<CompletionPort>();
    DirectoryWatch watch(dir, 9, port);
    watch.track({});
    watch.rearm();

    fs::remove(dir);
    for (int i = 0; i < 4 && !watch.prefix_lost(); ++i) {
        auto bytes = watch.take_delivery(port->wait());
        if (bytes && *bytes > 0)
            watch.parse(*bytes);
    }
    REQUIRE(watch.prefix_lost());
}

TEST_CASE("Retracking drops watches no tail passes through") {
    TempDir tmp("watch_retrack");
    fs::create_directories(tmp.path() / "a" / "b");
    fs::create_directories(tmp.path() / "c");
    auto port = std::make_shared<CompletionPort>();
    DirectoryWatch watch(tmp.path(), 5, port);

    watch.track({fs::path("a") / "b" / "file.txt"});
    REQUIRE(watch.watched_directories() == 3);

    watch.track({fs::path("c") / "file.txt"});
    REQUIRE(watch.watched_directories() == 2);

    watch.track({});
    REQUIRE(watch.watched_directories() == 1);

    // Events in a dropped directory no longer arrive.
    watch.rearm();
    touch(tmp.path() / "a" / "b" / "file.txt");
    touch(tmp.path() / "c" / "file.txt");
    std::error_code ec;
    REQUIRE(port->post_wake(ec));
    for (;;) {
        Completion c = port->wait();
        if (c.key == kWakeKey)
            break;
        auto bytes = watch.take_delivery(c);
        if (bytes && *bytes > 0)
            REQUIRE(watch.parse(*bytes).empty());
    }
}

TEST_CASE("Tracking an unreadable directory throws") {
    if (geteuid() == 0)
        SKIP("permission checks do not apply to root");
    TempDir tmp("watch_denied");
    fs::path locked = tmp.path() / "locked";
    fs::create_directories(locked);
    fs::permissions(locked, fs::perms::owner_read, fs::perm_options::remove);
    auto port = std::make_shared<CompletionPort>();
    DirectoryWatch watch(tmp.path(), 6, port);

    REQUIRE_THROWS_AS(watch.track({fs::path("locked") / "sub" / "file.txt"}), std::system_error);
    fs::permissions(locked, fs::perms::owner_read, fs::perm_options::add);
}

TEST_CASE("Posted wake carries the wake key") {
    auto port = std::make_shared<CompletionPort>();
    std::error_code ec;
    REQUIRE(port->post_wake(ec));
    Completion c = port->wait();
    REQUIRE(c.key == kWakeKey);
    REQUIRE_FALSE(c.has_request);
}

#endif

#ifdef _WIN32

TEST_CASE("A re-armed request does not overwrite the batch being decoded") {
    TempDir tmp("watch_rearm");
    auto port = std::make_shared<CompletionPort>();
    DirectoryWatch watch(tmp.path(), 4, port);
    watch.rearm();
    touch(tmp.path() / "first");

    Completion c = port->wait();
    REQUIRE(c.key == 4);
    auto bytes = watch.take_delivery(c);
    REQUIRE(bytes.has_value());
    REQUIRE(*bytes > 0);

    // Queue a second change and let the new request complete before parsing.
    watch.rearm();
    touch(tmp.path() / "second_entry_with_a_longer_name");
    Completion next = port->wait();
    REQUIRE(next.key == 4);

    auto records = watch.parse(*bytes);
    REQUIRE_FALSE(records.empty());
    REQUIRE(records.front().name == fs::path("first"));
}

#endif
