#pragma once

namespace lyricvid {
namespace utils {

// SIGINT/SIGTERM request a cooperative cancel; a second signal terminates
void install_signal_handlers();

bool is_cancel_requested();
void request_cancel();

// Signal that requested the cancel, 0 when none or requested in code
int cancel_signal();

// Re-arm after a cancelled job so the next one can run
void reset_cancel();

} // namespace utils
} // namespace lyricvid
