#include "shell_pipe.hpp"
#include <cstdio>
#include <csignal>
#include <sys/wait.h>

namespace talkpaste {

bool pipe_to_command(const std::string& cmd, const std::string& text) {
    FILE* pipe = popen(cmd.c_str(), "w");
    if (!pipe) return false;

    size_t written = fwrite(text.data(), 1, text.size(), pipe);
    int status = pclose(pipe);
    if (status == -1) return false;

    return written == text.size() && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

void ignore_broken_pipe() {
    signal(SIGPIPE, SIG_IGN);
}

} // namespace talkpaste
