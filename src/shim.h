#ifndef SANDBOXD_SHIM_H
#define SANDBOXD_SHIM_H

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace sandboxd {

// I/O
using EventLoop = boost::asio::io_context;
using Timer = boost::asio::steady_timer;
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Callback = std::function<void()>;

// File
using Path = boost::filesystem::path;

using StringView = boost::string_view;

template <typename Type>
using Optional = boost::optional<Type>;

inline Path RandomPath(const Path& model) {
  return boost::filesystem::unique_path(model);
}

}

#endif //SANDBOXD_SHIM_H
