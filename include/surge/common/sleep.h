#pragma once

#include <boost/asio/awaitable.hpp>

#include <chrono>

namespace surge::common {

/// Suspends the calling coroutine. Returns false if the wait was aborted.
boost::asio::awaitable<bool> sleepFor(std::chrono::milliseconds duration);

} // namespace surge::common
