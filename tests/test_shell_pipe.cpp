// Tests for piping text into helper commands

#include "shell_pipe.hpp"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace talkpaste;

void test_text_reaches_command() {
    std::cout << "Testing text is written to the command's stdin..." << std::endl;

    auto path = std::filesystem::temp_directory_path() / "talkpaste_test_pipe.txt";
    std::string text = "n8n 測試\nsecond line";
    assert(pipe_to_command("cat > '" + path.string() + "'", text));

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    assert(ss.str() == text);

    std::filesystem::remove(path);
    std::cout << "  PASS" << std::endl;
}

void test_exit_status_checked() {
    std::cout << "Testing a failing command is reported..." << std::endl;

    assert(!pipe_to_command("exit 3", ""));
    assert(pipe_to_command("cat > /dev/null", ""));

    std::cout << "  PASS" << std::endl;
}

void test_missing_tool_survivable() {
    std::cout << "Testing a missing tool does not kill the process..." << std::endl;

    ignore_broken_pipe();

    // More than a pipe buffer, so the write outlives the shell
    std::string big(1 << 20, 'x');
    assert(!pipe_to_command("talkpaste_no_such_tool 2>/dev/null", big));
    assert(!pipe_to_command("exit 0", big));

    // The next helper still runs
    assert(pipe_to_command("cat > /dev/null", big));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "\n=== Shell Pipe Test Suite ===" << std::endl << std::endl;

    test_text_reaches_command();
    test_exit_status_checked();
    test_missing_tool_survivable();

    std::cout << "\n=== All Tests Passed! ===" << std::endl << std::endl;
    return 0;
}
