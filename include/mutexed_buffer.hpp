//REV: bounded mutexed deque. End is newest, beginning is oldest.
// When full, either the oldest element is dropped (default, live sensor data where stale samples are worthless)
// or the incoming one is. Each drop is counted so the loss is visible to consumers.

// Consumers wait on the public cv/pmu pair (or use the timed pop helpers).

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <Timer.hpp>

enum class drop_policy
  {
    DROP_OLDEST,
    DROP_NEWEST
  };

inline const char* drop_policy_str( const drop_policy p )
{
  return (p == drop_policy::DROP_NEWEST) ? "drop_newest" : "drop_oldest";
}

template <typename T>
struct mutexed_buffer
{
private:
  std::deque<T> buf;
  size_t maxsize;
  drop_policy policy;
  uint64_t written;
  uint64_t ndropped;
  bool closed;
  std::string tag;

public:
  mutexed_buffer( const size_t sz=0, const drop_policy _policy=drop_policy::DROP_OLDEST, const std::string& _tag="" )
    : maxsize(sz), policy(_policy), written(0), ndropped(0), closed(false), tag(_tag)
  { return; }

  //REV: pmu guards buf; cv is notified on every add and on close.
  std::mutex pmu;
  std::condition_variable cv;

  void set_maxsize( const size_t sz )
  {
    const std::lock_guard<std::mutex> lock(pmu);
    maxsize=sz;
    _fixsize();
  }

  void set_policy( const drop_policy p )
  {
    const std::lock_guard<std::mutex> lock(pmu);
    policy=p;
  }

  void set_tag( const std::string& _tag )
  {
    const std::lock_guard<std::mutex> lock(pmu);
    tag = _tag;
  }

  //Returns false if the element (or an older one) was dropped to make room, or if closed.
  bool addone( const T& toadd )
  {
    bool good = true;
    {
      const std::lock_guard<std::mutex> lock(pmu);
      if( closed )
	{
	  return false;
	}

      ++written;
      if( maxsize > 0 && buf.size() >= maxsize && policy == drop_policy::DROP_NEWEST )
	{
	  ++ndropped;
	  good = false;
	}
      else
	{
	  buf.push_back(toadd);
	  good = !_fixsize();
	}
    }
    cv.notify_all();
    return good;
  }

  //REV: drop from beginning!!
  bool _fixsize()
  {
    bool erasedsome=false;
    if( maxsize > 0 )
      {
	while( buf.size() > maxsize )
	  {
	    buf.pop_front();
	    ++ndropped;
	    erasedsome=true;
	  }
      }
#if RTNEON_DEBUG_LEVEL > 10
    if( erasedsome ) { fprintf(stderr, "MBUF [%s] -- dropped oldest (total dropped %lu)\n", tag.c_str(), (unsigned long)ndropped); }
#endif
    return erasedsome;
  }

  size_t popallto( std::vector<T>& topopto )
  {
    const std::lock_guard<std::mutex> lock(pmu);
    size_t moved = buf.size();
    std::move( buf.begin(),
	       buf.end(),
	       std::back_inserter(topopto) );
    buf.clear();
    return moved;
  }

  //Blocks until something is in the buffer, it is closed, or timeout passes (timeout_sec < 0 waits forever).
  size_t wait_popallto( std::vector<T>& topopto, const double timeout_sec )
  {
    std::unique_lock<std::mutex> lk(pmu);
    _wait( lk, timeout_sec );
    size_t moved = buf.size();
    std::move( buf.begin(),
	       buf.end(),
	       std::back_inserter(topopto) );
    buf.clear();
    return moved;
  }

  std::optional<T> wait_pop_front( const double timeout_sec )
  {
    std::unique_lock<std::mutex> lk(pmu);
    _wait( lk, timeout_sec );
    if( buf.empty() )
      {
	return std::nullopt;
      }
    T v = std::move(buf.front());
    buf.pop_front();
    return v;
  }

  //Newest element; everything older is discarded (counted as dropped).
  std::optional<T> wait_pop_newest( const double timeout_sec )
  {
    std::unique_lock<std::mutex> lk(pmu);
    _wait( lk, timeout_sec );
    if( buf.empty() )
      {
	return std::nullopt;
      }
    T v = std::move(buf.back());
    ndropped += buf.size()-1;
    buf.clear();
    return v;
  }

  size_t size()
  {
    const std::lock_guard<std::mutex> lock(pmu);
    return buf.size();
  }

  uint64_t get_dropped()
  {
    const std::lock_guard<std::mutex> lock(pmu);
    return ndropped;
  }

  uint64_t get_written()
  {
    const std::lock_guard<std::mutex> lock(pmu);
    return written;
  }

  void clear()
  {
    const std::lock_guard<std::mutex> lock(pmu);
    buf.clear();
  }

  //Wakes all waiters; further adds are refused. Remaining elements can still be popped.
  void close()
  {
    {
      const std::lock_guard<std::mutex> lock(pmu);
      closed = true;
    }
    cv.notify_all();
  }

  void reopen()
  {
    const std::lock_guard<std::mutex> lock(pmu);
    closed = false;
  }

  bool is_closed()
  {
    const std::lock_guard<std::mutex> lock(pmu);
    return closed;
  }

private:
  void _wait( std::unique_lock<std::mutex>& lk, const double timeout_sec )
  {
    if( timeout_sec < 0 )
      {
	cv.wait( lk, [&]() { return !buf.empty() || closed; } );
      }
    else
      {
	cv.wait_for( lk, std::chrono::duration<double>(timeout_sec), [&]() { return !buf.empty() || closed; } );
      }
  }
};
