#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <exception>
#include <string>
#include <thread>
#include <vector>

#include "util/my_logging.hpp"

namespace lanlink {

struct IocConfig {
  int threads{2};
  std::string name{"lanlink-ioc"};
};

// Owns an io_context and the worker threads that run it. Destruction stops the
// context and joins the workers.
class IoContextManager {
public:
  explicit IoContextManager(const IocConfig &config)
      : name_(config.name), work_guard_(boost::asio::make_work_guard(ioc_)) {
    int threads = config.threads > 0 ? config.threads : 1;
    workers_.reserve(threads);
    for (int i = 0; i < threads; ++i) {
      workers_.emplace_back([this, i]() { run_worker(i); });
    }
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << fmt::format("{} started with {} threads", name_, threads);
  }

  ~IoContextManager() { stop(); }

  IoContextManager(const IoContextManager &) = delete;
  IoContextManager &operator=(const IoContextManager &) = delete;

  boost::asio::io_context &ioc() { return ioc_; }

  void stop() {
    if (stopped_) {
      return;
    }
    stopped_ = true;
    work_guard_.reset();
    ioc_.stop();
    for (auto &t : workers_) {
      if (t.joinable()) {
        t.join();
      }
    }
    BOOST_LOG_SEV(app_logger(), trivial::debug) << name_ << " stopped";
  }

private:
  void run_worker(int index) {
    for (;;) {
      try {
        ioc_.run();
        return;
      } catch (const std::exception &e) {
        BOOST_LOG_SEV(app_logger(), trivial::error)
            << fmt::format("{} worker {} caught exception: {}", name_, index,
                           e.what());
      }
    }
  }

  std::string name_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type>
      work_guard_;
  std::vector<std::thread> workers_;
  bool stopped_{false};
};

} // namespace lanlink
