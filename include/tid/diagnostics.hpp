#pragma once

#include <tid/base32.hpp>
#include <string_view>

namespace tid {

// Optional trace hooks around encode/decode. Every hook defaults to a no-op;
// codec results never depend on whether an observer is attached.
class Observer {
public:
    virtual ~Observer() = default;

    virtual void on_encode(const Bytes128& /*bytes*/, std::string_view /*encoded*/) {}
    virtual void on_decode_begin(std::string_view /*input*/) {}
    virtual void on_decode_ok(std::string_view /*input*/, const Bytes128& /*bytes*/) {}
    virtual void on_decode_error(std::string_view /*input*/, const TidError& /*error*/) {}
};

// Forwards codec events to tid::log: trace for entry and success, debug for
// rejected input.
class LogObserver : public Observer {
public:
    void on_encode(const Bytes128& bytes, std::string_view encoded) override;
    void on_decode_begin(std::string_view input) override;
    void on_decode_ok(std::string_view input, const Bytes128& bytes) override;
    void on_decode_error(std::string_view input, const TidError& error) override;
};

// Observer installed by Config::apply(); nullptr when diagnostics are off
Observer* default_observer();
void set_default_observer(Observer* observer);

// Shared LogObserver instance
LogObserver& log_observer();

// Lower-case hex of the payload, for diagnostics
std::string to_hex(const Bytes128& bytes);

} // namespace tid
