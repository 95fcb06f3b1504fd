#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <unistd.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <fcntl.h>
#include <cstring>
#include <csignal>
#include <cerrno>
#include <poll.h>
#include <algorithm>
#include <format>

namespace colpick::ui {

// Only set a flag here; the size is queried from the event loop
static volatile std::sig_atomic_t g_resize_pending = 0;

static void sigwinch_handler(int) {
    g_resize_pending = 1;
}

namespace {

constexpr char ESC = '\033';

InputEvent named(const std::string& name, int code = 0) {
    return InputEvent{InputEvent::Type::KeyPress, code, name, 0, 0};
}

// Length of the UTF-8 sequence introduced by `lead`; 1 for ASCII and stray bytes
size_t utf8_length(unsigned char lead) {
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

// Name of a single non-escape byte sequence starting at bytes[i]; advances i
std::string decode_plain(std::string_view bytes, size_t& i) {
    unsigned char c = static_cast<unsigned char>(bytes[i]);

    if (c == '\r') { ++i; return "enter"; }
    if (c == '\n') { ++i; return "ctrl+j"; }
    if (c == '\t') { ++i; return "tab"; }
    if (c == 0x7F) { ++i; return "backspace"; }
    if (c == ' ') { ++i; return "space"; }
    if (c == 0) { ++i; return "ctrl+@"; }
    if (c < 0x20) {
        ++i;
        return std::string("ctrl+") + static_cast<char>('a' + c - 1);
    }
    if (c < 0x80) {
        ++i;
        return std::string(1, static_cast<char>(c));
    }

    size_t len = std::min(utf8_length(c), bytes.size() - i);
    std::string out(bytes.substr(i, len));
    i += len;
    return out;
}

std::string csi_tilde_name(int code) {
    switch (code) {
        case 1: case 7: return "home";
        case 2: return "insert";
        case 3: return "delete";
        case 4: case 8: return "end";
        case 5: return "pgup";
        case 6: return "pgdown";
        default: return "";
    }
}

std::string csi_final_name(char final) {
    switch (final) {
        case 'A': return "up";
        case 'B': return "down";
        case 'C': return "right";
        case 'D': return "left";
        case 'H': return "home";
        case 'F': return "end";
        case 'Z': return "shift+tab";
        default: return "";
    }
}

}  // namespace

std::vector<InputEvent> Terminal::decode(std::string_view bytes) {
    std::string carry;
    auto events = decode(bytes, carry);
    auto rest = flush_incomplete(carry);
    events.insert(events.end(), rest.begin(), rest.end());
    return events;
}

std::vector<InputEvent> Terminal::decode(std::string_view chunk, std::string& carry) {
    std::string input = std::move(carry);
    input.append(chunk);
    carry.clear();

    std::string_view bytes(input);
    std::vector<InputEvent> events;
    size_t i = 0;

    while (i < bytes.size()) {
        if (bytes[i] != ESC) {
            unsigned char first = static_cast<unsigned char>(bytes[i]);
            if (utf8_length(first) > bytes.size() - i) {
                carry.assign(bytes.substr(i));
                break;
            }
            std::string name = decode_plain(bytes, i);
            events.push_back(named(name, first < 0x80 ? first : 0));
            continue;
        }

        // Escape at the end of the chunk may start a sequence still in flight
        if (i + 1 >= bytes.size()) {
            carry.assign(bytes.substr(i));
            break;
        }

        char next = bytes[i + 1];
        if (next == '[' || next == 'O') {
            // CSI / SS3: parameters then one final byte in 0x40..0x7E
            size_t j = i + 2;
            int param = 0;
            bool has_param = false;
            while (j < bytes.size() && bytes[j] >= 0x30 && bytes[j] <= 0x3F) {
                if (bytes[j] >= '0' && bytes[j] <= '9' && !has_param) {
                    param = param * 10 + (bytes[j] - '0');
                } else if (bytes[j] == ';') {
                    has_param = true;  // Modifiers after ';' are not distinguished
                }
                ++j;
            }
            if (j >= bytes.size()) {
                carry.assign(bytes.substr(i));
                break;
            }

            char final = bytes[j];
            std::string name = final == '~' ? csi_tilde_name(param) : csi_final_name(final);
            if (name.empty()) {
                util::Logger::debug(std::format("Terminal: unknown sequence ESC {}", std::string(bytes.substr(i + 1, j - i))));
            } else {
                events.push_back(named(name));
            }
            i = j + 1;
            continue;
        }

        if (next == ESC) {
            events.push_back(named("esc", 27));
            ++i;
            continue;
        }

        // ESC followed by a key: alt+key
        if (utf8_length(static_cast<unsigned char>(next)) > bytes.size() - i - 1) {
            carry.assign(bytes.substr(i));
            break;
        }
        i += 1;
        std::string name = decode_plain(bytes, i);
        events.push_back(named("alt+" + name));
    }
    return events;
}

std::vector<InputEvent> Terminal::flush_incomplete(std::string& carry) {
    std::vector<InputEvent> events;
    if (carry.empty()) return events;

    if (carry[0] == ESC) {
        events.push_back(named("esc", 27));
        if (carry.size() > 1) {
            util::Logger::debug(std::format("Terminal: dropping incomplete sequence ESC {}", carry.substr(1)));
        }
    } else {
        events.push_back(named(carry));
    }
    carry.clear();
    return events;
}

Terminal& Terminal::instance() {
    static Terminal instance;
    return instance;
}

Terminal::Terminal() {}
Terminal::~Terminal() {
    shutdown();
}

bool Terminal::init() {
    if (initialized_) return true;

    fd_ = ::open("/dev/tty", O_RDWR | O_NOCTTY);
    if (fd_ < 0) {
        util::Logger::error(std::format("Terminal: cannot open /dev/tty: {}", std::strerror(errno)));
        return false;
    }

#ifdef __linux__
    tcgetattr(fd_, &original_termios_);

    ::termios raw = original_termios_;
    raw.c_lflag &= ~(ECHO | ICANON | ISIG);  // ctrl+c arrives as a key
    raw.c_iflag &= ~(IXON | ICRNL);          // Disable flow control and CR->NL
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    tcsetattr(fd_, TCSAFLUSH, &raw);

    std::signal(SIGWINCH, sigwinch_handler);
#endif

    running_ = true;
    writer_thread_ = std::thread(&Terminal::writer_loop, this);

    write_raw("\033[?1049h");  // Enter alternate screen buffer
    write_raw("\033[?25l");    // Hide cursor
    initialized_ = true;
    return true;
}

void Terminal::shutdown() {
    if (!initialized_) return;

    write_raw("\033[?25h");    // Show cursor
    write_raw("\033[?1049l");  // Exit alternate screen buffer

    // Writer drains the queue before it stops
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
    if (writer_thread_.joinable()) {
        writer_thread_.join();
    }

#ifdef __linux__
    tcsetattr(fd_, TCSAFLUSH, &original_termios_);
#endif
    ::close(fd_);
    fd_ = -1;
    pending_.clear();
    input_carry_.clear();
    initialized_ = false;
}

void Terminal::writer_loop() {
    while (true) {
        std::string chunk;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !write_queue_.empty() || !running_; });

            if (write_queue_.empty()) break;  // Stopped and drained
            chunk = std::move(write_queue_.front());
            write_queue_.pop_front();
        }

        size_t written = 0;
        while (written < chunk.size()) {
            ssize_t n = ::write(fd_, chunk.data() + written, chunk.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
            } else if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    struct pollfd pfd = {fd_, POLLOUT, 0};
                    poll(&pfd, 1, 100);
                    continue;
                }
                util::Logger::error("Terminal writer error: " + std::string(std::strerror(errno)));
                break;
            }
        }
    }
}

void Terminal::write_raw(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        write_queue_.push_back(text);
    }
    queue_cv_.notify_one();
}

bool Terminal::read_chunk(std::string& out) {
    char buf[256];
    ssize_t n;
    do {
        n = ::read(fd_, buf, sizeof(buf));
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            util::Logger::debug(std::format("Terminal: read() failed, errno={}", errno));
        }
        return false;
    }
    out.assign(buf, static_cast<size_t>(n));
    return n > 0;
}

void Terminal::fill_pending() {
    std::string chunk;
    if (!read_chunk(chunk)) return;
    for (auto& event : decode(chunk, input_carry_)) {
        pending_.push_back(std::move(event));
    }

    // Finish a sequence split across reads; a lone ESC that stays alone is the esc key
    while (!input_carry_.empty()) {
        struct pollfd pfd = {fd_, POLLIN, 0};
        bool more = poll(&pfd, 1, ESCAPE_TIMEOUT_MS) > 0 && read_chunk(chunk);
        auto events = more ? decode(chunk, input_carry_) : flush_incomplete(input_carry_);
        for (auto& event : events) {
            pending_.push_back(std::move(event));
        }
    }
}

InputEvent Terminal::read_input() {
    if (g_resize_pending) {
        g_resize_pending = 0;
        return InputEvent::resize(get_terminal_width(), get_terminal_height());
    }

    if (pending_.empty() && fd_ >= 0) {
        fill_pending();
    }
    if (pending_.empty()) {
        return named("");
    }

    InputEvent event = std::move(pending_.front());
    pending_.pop_front();
    return event;
}

int Terminal::get_terminal_width() const {
    winsize w{};
    if (fd_ < 0 || ioctl(fd_, TIOCGWINSZ, &w) < 0 || w.ws_col == 0) return 80;
    return w.ws_col;
}

int Terminal::get_terminal_height() const {
    winsize w{};
    if (fd_ < 0 || ioctl(fd_, TIOCGWINSZ, &w) < 0 || w.ws_row == 0) return 24;
    return w.ws_row;
}

}  // namespace colpick::ui
