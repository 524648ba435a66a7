#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

// Startup-path helpers: socket setup and config loading fail loudly, the audio path never does.
inline void throw_if_err(const std::error_code& ec, std::string_view where) {
    if (ec) throw std::runtime_error(std::string(where) + ": " + ec.message());
}

inline void require(bool condition, std::string_view what) {
    if (!condition) throw std::runtime_error(std::string(what));
}
