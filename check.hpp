#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <asio/error.hpp>
#include <asio/system_error.hpp>

// Socket setup failures are fatal for the object being constructed
inline void throw_if_err(const std::error_code& ec, std::string_view where) {
    if (ec) throw asio::system_error(ec, std::string(where));
}

// Errors that only mean "the socket was closed or cancelled underneath us"
inline bool is_shutdown_error(const std::error_code& ec) {
    return ec == asio::error::operation_aborted || ec == asio::error::bad_descriptor;
}
