#pragma once

#include <string>

namespace talkpaste {

// Run cmd through /bin/sh and write text to its stdin. True if every byte was
// written and the command exited with status 0.
bool pipe_to_command(const std::string& cmd, const std::string& text);

// Make writes to a pipe whose reader has exited fail with EPIPE instead of
// killing the process. Call once at startup, before any helper is spawned.
void ignore_broken_pipe();

} // namespace talkpaste
