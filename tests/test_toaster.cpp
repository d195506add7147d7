#include "splitdeck/core/Toaster.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace sdeck;

// No initialize(): these run without a session bus

static void test_disabled_toaster_queues_nothing() {
    Toaster toaster(false, 1000);
    toaster.error("connection lost");
    toaster.info("tab opened");
    toaster.configError("bad value");
    assert(toaster.pendingCount() == 0);
    assert(toaster.configErrorCount() == 0);
    assert(!toaster.isConnected());
}

static void test_queue_is_capped() {
    Toaster toaster(true, 60000);
    toaster.info("one");
    toaster.success("two");
    toaster.warning("three");
    toaster.error("four");
    toaster.info("five");
    assert(toaster.pendingCount() == 3);

    toaster.update();
    assert(toaster.pendingCount() == 3);
}

static void test_notifications_expire() {
    Toaster toaster(true, 20);
    toaster.info("short lived");
    assert(toaster.pendingCount() == 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    toaster.update();
    assert(toaster.pendingCount() == 0);
}

static void test_config_errors_persist_until_cleared() {
    Toaster toaster(true, 20);
    toaster.configError("layout.min_ratio out of range");
    toaster.configError("unknown section 'theme'");
    assert(toaster.configErrorCount() == 2);

    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    toaster.update();
    assert(toaster.configErrorCount() == 2);

    toaster.clearConfigErrors();
    assert(toaster.configErrorCount() == 0);
}

int main() {
    test_disabled_toaster_queues_nothing();
    test_queue_is_capped();
    test_notifications_expire();
    test_config_errors_persist_until_cleared();

    std::cout << "test_toaster: all tests passed" << std::endl;
    return 0;
}
