#include <HarborCore.hpp>
#include <cassert>
#include <iostream>

#include "StoreTests.hpp"
#include "RetryTests.hpp"
#include "QueueTests.hpp"
#include "SchedulerTests.hpp"
#include "ConnectionMonitorTests.hpp"
#include "SyncManagerTests.hpp"
#include "SessionTests.hpp"
#include "NetworkTests.hpp"
#include "OfflineCacheTests.hpp"

int main() {
    std::cout << "=== HarborCore Tests ===" << std::endl;
    std::cout << std::endl;

    // Expected failures log at warn; keep the output readable
    harbor::set_log_level(harbor::log_level::error);

    try {
        // Storage
        store_tests::run_all();
        retry_tests::run_all();
        queue_tests::run_all();
        offline_cache_tests::run_all();

        // Connectivity and sync
        scheduler_tests::run_all();
        network_tests::run_all();
        connection_monitor_tests::run_all();
        sync_manager_tests::run_all();

        // Sessions and reference data
        session_tests::run_all();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed! (9 test suites)" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
