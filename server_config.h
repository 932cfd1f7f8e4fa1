#pragma once

#include <chrono>
#include <cstddef>

using namespace std::chrono_literals;

// Server configuration constants

namespace server_config {
constexpr auto   OFFER_INTERVAL       = 1s;
constexpr auto   REQUEST_READ_TIMEOUT = 5s;   // per-connection wait for the size line
constexpr auto   SEND_TIMEOUT         = 5s;   // per write while serving a TCP transfer
constexpr auto   UDP_SEND_PACING      = 1ms;  // delay between two payload segments
constexpr size_t RECV_BUF_SIZE        = 1024;
constexpr size_t MAX_REQUEST_LINE     = 64;   // "18446744073709551615\n" fits easily

}  // namespace server_config
