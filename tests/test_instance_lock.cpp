// Tests for the single-instance lock

#include "instance_lock.hpp"
#include <iostream>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace talkpaste;

void test_second_instance_refused() {
    std::cout << "Testing a second holder is refused..." << std::endl;

    auto path = (std::filesystem::temp_directory_path() / "talkpaste_test.lock").string();

    InstanceLock first(path);
    assert(first.acquire());
    assert(first.held());
    assert(first.acquire());    // Idempotent

    {
        std::ifstream in(path);
        long pid = 0;
        in >> pid;
        assert(pid == static_cast<long>(getpid()));
    }

    InstanceLock second(path);
    assert(!second.acquire());
    assert(!second.held());

    first.release();
    assert(!first.held());
    assert(second.acquire());

    std::filesystem::remove(path);
    std::cout << "  PASS" << std::endl;
}

void test_released_on_destruction() {
    std::cout << "Testing lock is released when the holder goes away..." << std::endl;

    auto path = (std::filesystem::temp_directory_path() / "talkpaste_test2.lock").string();
    {
        InstanceLock scoped(path);
        assert(scoped.acquire());
    }

    InstanceLock next(path);
    assert(next.acquire());
    next.release();

    std::filesystem::remove(path);
    std::cout << "  PASS" << std::endl;
}

void test_default_path() {
    std::cout << "Testing default lock path..." << std::endl;

    setenv("TMPDIR", "/var/tmp", 1);
    assert(InstanceLock::default_path("talkpaste") == "/var/tmp/talkpaste.lock");
    unsetenv("TMPDIR");
    assert(InstanceLock::default_path("talkpaste") == "/tmp/talkpaste.lock");

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Instance Lock Test Suite ===" << std::endl << std::endl;

    test_second_instance_refused();
    test_released_on_destruction();
    test_default_path();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
