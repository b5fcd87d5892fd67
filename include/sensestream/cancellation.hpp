#pragma once
#include <boost/chrono.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/lock_guard.hpp>
#include <boost/thread/mutex.hpp>
#include <chrono>

namespace sensestream {

// Shutdown request shared between the signal handler and the ingestion loop.
class CancellationToken {
public:
  void cancel() {
    {
      boost::lock_guard<boost::mutex> lk(m_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  bool cancelled() const {
    boost::lock_guard<boost::mutex> lk(m_);
    return cancelled_;
  }

  // Sleeps for d or until cancel(). Returns false if cancelled.
  template <class Rep, class Period>
  bool sleep_for(std::chrono::duration<Rep, Period> d) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    boost::unique_lock<boost::mutex> lk(m_);
    cv_.wait_for(lk, boost::chrono::milliseconds(ms), [&] { return cancelled_; });
    return !cancelled_;
  }

private:
  mutable boost::mutex m_;
  boost::condition_variable_any cv_;
  bool cancelled_{false};
};

} // namespace sensestream
