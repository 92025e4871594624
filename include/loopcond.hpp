//REV: basic loop variable that will be passed. It contains:
// (atomic) bool (loop) -- specifies continue looping if true
// condition_variable and mutex, which must be used as an additional
// condition (with || OR) for all sleeps, waits, etc.

// Single atomic for loop variable is good, but it does not address the issue
// where a producer dies, and a consumer waits infinitely for some condition
// based on it. It may be in some inner loop e.g. while(not condition)

// This is "fixed" by forcing user to include this in all waits/sleeps

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

#include <Timer.hpp>

inline bool shouldloop( const std::atomic<bool>& loop )
{
  return (true == loop.load(std::memory_order_relaxed));
}

struct loopcond
{
  std::atomic<bool> loop;
  std::condition_variable cv;
  std::mutex mu;
  const std::uint64_t wakeuptime_ns;
  const std::string tag;

  loopcond( const std::string& mytag="", const std::uint64_t _wakeuptime_ns=50000000 )
    : loop(true), wakeuptime_ns(_wakeuptime_ns), tag(mytag)
  {  }

  bool operator()( ) const
  {
    return shouldloop(loop);
  }

  void stop()
  {
    {
      const std::lock_guard<std::mutex> lock(mu);
      loop = false;
    }
    cv.notify_all();
  }

  void start()
  {
    {
      const std::lock_guard<std::mutex> lock(mu);
      loop = true;
    }
    cv.notify_all();
  }

  //Returns early (false) if stopped while sleeping.
  bool sleepfor( const double& secs )
  {
    Timer t;
    std::unique_lock<std::mutex> lk( mu );
    while( shouldloop(loop) &&
	   t.elapsed() < secs )
      {
	cv.wait_for( lk, std::chrono::nanoseconds( wakeuptime_ns ) );
      }
    return shouldloop(loop);
  }
};
