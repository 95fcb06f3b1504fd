#pragma once

#include "ui/InputEvent.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#ifdef __linux__
#include <termios.h>
#endif

namespace colpick::ui {

/**
 * Controlling terminal of the picker.
 *
 * Talks to /dev/tty rather than stdin/stdout so the picker still works
 * when its output is captured by a shell ($(colpick file)). Output goes
 * through a writer thread; input is decoded into InputEvents.
 */
class Terminal {
public:
    static Terminal& instance();

    /// Raw mode plus alternate screen. Returns false if no tty is available.
    bool init();
    void shutdown();

    int input_fd() const { return fd_; }

    // Enqueue raw data for asynchronous writing to the tty
    void write_raw(const std::string& text);

    /// Next decoded event, or an event with an empty key name if none is pending.
    InputEvent read_input();

    int get_terminal_width() const;
    int get_terminal_height() const;

    /// How long to wait for the rest of a sequence after a trailing ESC.
    static constexpr int ESCAPE_TIMEOUT_MS = 25;

    /// Split complete terminal input into key events.
    static std::vector<InputEvent> decode(std::string_view bytes);

    /**
     * Decode one read() chunk. An incomplete trailing sequence (ESC, a CSI
     * without its final byte, part of a UTF-8 character) is kept in `carry`
     * and completed by the next chunk.
     */
    static std::vector<InputEvent> decode(std::string_view chunk, std::string& carry);

    /// Events for input left in `carry` when no more bytes arrive; clears it.
    static std::vector<InputEvent> flush_incomplete(std::string& carry);

private:
    Terminal();
    ~Terminal();

    void writer_loop();
    void fill_pending();
    bool read_chunk(std::string& out);

    bool initialized_ = false;
    int fd_ = -1;
    std::deque<InputEvent> pending_;
    std::string input_carry_;

    // Async writer components
    std::thread writer_thread_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::string> write_queue_;
    std::atomic<bool> running_{false};

#ifdef __linux__
    ::termios original_termios_{};
#endif
};

}  // namespace colpick::ui
