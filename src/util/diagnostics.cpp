#include <tid/diagnostics.hpp>
#include <tid/log.hpp>
#include <atomic>
#include <string>

namespace tid {

static std::atomic<Observer*> s_default_observer{nullptr};

Observer* default_observer() {
    return s_default_observer.load(std::memory_order_acquire);
}

void set_default_observer(Observer* observer) {
    s_default_observer.store(observer, std::memory_order_release);
}

LogObserver& log_observer() {
    static LogObserver instance;
    return instance;
}

std::string to_hex(const Bytes128& bytes) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(32);
    for (uint8_t b : bytes) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0F];
    }
    return out;
}

// Input strings are untrusted and may be huge; only a prefix is logged.
static std::string clip(std::string_view input) {
    constexpr std::size_t max_shown = 64;
    if (input.size() <= max_shown) return std::string(input);
    return std::string(input.substr(0, max_shown)) + "...";
}

void LogObserver::on_encode(const Bytes128& bytes, std::string_view encoded) {
    if (!log::enabled(log::Trace)) return;
    log::trace("encode %s -> %.*s", to_hex(bytes).c_str(),
               static_cast<int>(encoded.size()), encoded.data());
}

void LogObserver::on_decode_begin(std::string_view input) {
    if (!log::enabled(log::Trace)) return;
    log::trace("decode '%s' (%zu bytes)", clip(input).c_str(), input.size());
}

void LogObserver::on_decode_ok(std::string_view input, const Bytes128& bytes) {
    if (!log::enabled(log::Trace)) return;
    log::trace("decode '%s' -> %s", clip(input).c_str(), to_hex(bytes).c_str());
}

void LogObserver::on_decode_error(std::string_view input, const TidError& error) {
    if (!log::enabled(log::Debug)) return;
    log::debug("decode '%s' rejected: %s (%s)", clip(input).c_str(),
               TidError::reason_name(error.reason), error.hint.c_str());
}

} // namespace tid
