#pragma once

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <utility>

#include <boost/asio.hpp>

#include <rtneon_defines.hpp>
#include <looper.hpp>
#include <session_config.hpp>
#include <httprest.hpp>
#include <utilities.hpp>
#include <Timer.hpp>

//REV: device clock = local clock + offset.
// translate(device_ts) = device_ts - offset, to_device(local_ts) = local_ts + offset (exact inverse).

struct echo_measurement
{
  int64_t client_send_ms=0;
  int64_t device_ms=0;
  int64_t client_recv_ms=0;

  int64_t rtt_ms() const
  {
    return client_recv_ms - client_send_ms;
  }
};

//Source of time-echo round trips. One probe() is one batch.
struct time_echo_source
{
  virtual ~time_echo_source()
  { }

  //Appends up to n measurements taken within timeout_sec. Returns false if none could be taken.
  virtual bool probe( const size_t n, std::vector<echo_measurement>& out, const double timeout_sec ) = 0;
};


//Time echo protocol on the device's time_echo_port: send 8 bytes (client ms, big endian),
// receive 16 bytes (echoed client ms, device ms, big endian).
struct tcp_time_echo_source
  : public time_echo_source
{
private:
  std::string host;
  int port;

public:
  tcp_time_echo_source( const std::string& _host, const int _port )
    : host(_host), port(_port)
  { }

  bool probe( const size_t n, std::vector<echo_measurement>& out, const double timeout_sec ) override
  {
    size_t got=0;
    Timer t;
    auto remaining = [&]() { return timeout_sec - t.elapsed(); };
    try
      {
	boost::asio::io_context ioc;
	boost::asio::ip::tcp::socket socket{ioc};
	boost::asio::ip::tcp::endpoint dst( boost::asio::ip::make_address(host), (unsigned short)port );
	boost::system::error_code ec;

	if( !run_with_deadline( ioc,
				[&]( auto handler ) { socket.async_connect( dst, handler ); },
				[&]() { boost::system::error_code ig; socket.close(ig); },
				remaining(), ec ) )
	  {
	    fprintf(stderr, "CLOCK: cannot connect to time echo [%s:%d]: [%s]\n", host.c_str(), port, ec.message().c_str());
	    return false;
	  }

	socket.set_option( boost::asio::ip::tcp::no_delay(true) );

	for( size_t i=0; i<n && remaining() > 0; ++i )
	  {
	    uint8_t sendbuf[8];
	    uint8_t recvbuf[16];
	    echo_measurement m;
	    m.client_send_ms = get_unix_time_ms();
	    write_be_u64( sendbuf, (uint64_t)m.client_send_ms );

	    bool good = run_with_deadline( ioc,
					   [&]( auto handler ) { boost::asio::async_write( socket, boost::asio::buffer(sendbuf, sizeof(sendbuf)), handler ); },
					   [&]() { boost::system::error_code ig; socket.close(ig); },
					   remaining(), ec );
	    if( good )
	      {
		good = run_with_deadline( ioc,
					  [&]( auto handler ) { boost::asio::async_read( socket, boost::asio::buffer(recvbuf, sizeof(recvbuf)), handler ); },
					  [&]() { boost::system::error_code ig; socket.close(ig); },
					  remaining(), ec );
	      }
	    m.client_recv_ms = get_unix_time_ms();

	    if( !good )
	      {
		fprintf(stderr, "CLOCK: time echo [%s:%d] failed after %lu echoes: [%s]\n", host.c_str(), port, (unsigned long)got, ec.message().c_str());
		break;
	      }

	    if( (int64_t)read_be_u64( recvbuf ) != m.client_send_ms )
	      {
		fprintf(stderr, "CLOCK: time echo [%s:%d] echoed a different timestamp, skipping\n", host.c_str(), port);
		continue;
	      }
	    m.device_ms = (int64_t)read_be_u64( recvbuf + 8 );
	    out.push_back( m );
	    ++got;
	  }

	boost::system::error_code ig;
	socket.close( ig );
      }
    catch( const boost::system::system_error& e )
      {
	fprintf(stderr, "CLOCK: time echo [%s:%d] error [%s]\n", host.c_str(), port, e.what());
      }
    return got > 0;
  }
};


struct clock_offset
{
  rtneon_time_ns_t estimate_ns=0;
  rtneon_time_ns_t uncertainty_ns=0;
  //1 = low jitter, falls toward 0 as round trips get noisy
  double confidence=0;
  rtneon_time_ns_t last_updated_ns=0;
  bool valid=false;
  size_t measurements=0;
};


struct clock_offset_estimator
  : public looper
{
private:
  clock_config cfg;

  std::atomic<int64_t> offset_ns;
  std::atomic<bool> offset_valid;

  mutable std::mutex mu;
  clock_offset current;
  bool reprobe_early=false;

  std::shared_ptr<time_echo_source> source;
  std::thread probe_thread;

public:
  clock_offset_estimator( const clock_config& _cfg=clock_config() )
    : looper("clock"), cfg(_cfg), offset_ns(0), offset_valid(false)
  { }

  ~clock_offset_estimator()
  {
    stop();
  }

  //Lock-free; identity until the first estimate.
  rtneon_time_ns_t translate( const rtneon_time_ns_t device_ts_ns ) const
  {
    return device_ts_ns - offset_ns.load(std::memory_order_acquire);
  }

  rtneon_time_ns_t to_device( const rtneon_time_ns_t local_ts_ns ) const
  {
    return local_ts_ns + offset_ns.load(std::memory_order_acquire);
  }

  bool has_estimate() const
  {
    return offset_valid.load(std::memory_order_acquire);
  }

  clock_offset get() const
  {
    const std::lock_guard<std::mutex> lock(mu);
    return current;
  }

  //Fixes the offset, e.g. when the device clock is known to be synchronized.
  void set_offset( const rtneon_time_ns_t off_ns )
  {
    const std::lock_guard<std::mutex> lock(mu);
    current.estimate_ns = off_ns;
    current.valid = true;
    current.confidence = 1.0;
    current.last_updated_ns = get_unix_time_ns();
    offset_ns.store( off_ns, std::memory_order_release );
    offset_valid.store( true, std::memory_order_release );
  }

  //One probe batch on the given source, folded into the estimate.
  clock_offset estimate( time_echo_source& src )
  {
    clock_offset res;
    estimate( src, cfg.echo_timeout_sec, res );
    return res;
  }

  //As above with the batch bounded by timeout_sec. False if no echo came back in time; res is then the
  // previous estimate with its confidence halved.
  bool estimate( time_echo_source& src, const double timeout_sec, clock_offset& res )
  {
    std::vector<echo_measurement> meas;
    if( !src.probe( cfg.probe_count, meas, timeout_sec ) )
      {
	const std::lock_guard<std::mutex> lock(mu);
	current.confidence *= 0.5;
	res = current;
	return false;
      }
    res = update_from_measurements( meas, get_unix_time_ns() );
    return true;
  }

  clock_offset estimate()
  {
    std::shared_ptr<time_echo_source> src;
    {
      const std::lock_guard<std::mutex> lock(mu);
      src = source;
    }
    if( !src )
      {
	return get();
      }
    return estimate( *src );
  }

  //Folds one batch into the estimate:
  // per echo offset = device - (send + (rtt - processing)/2), batch offset = median,
  // smoothed by EWMA, replaced outright if it jumps by more than drift_reset_ns (and an early reprobe is scheduled).
  // If rtt jitter exceeds the threshold, confidence drops and the previous offset is kept.
  clock_offset update_from_measurements( const std::vector<echo_measurement>& meas, const rtneon_time_ns_t now_ns )
  {
    const std::lock_guard<std::mutex> lock(mu);
    if( meas.empty() )
      {
	current.confidence *= 0.5;
	return current;
      }

    std::vector<int64_t> offsets;
    double rttsum=0;
    for( const auto& m : meas )
      {
	double oneway_ms = (m.rtt_ms() - cfg.assumed_processing_ms) / 2.0;
	double off_ms = (double)m.device_ms - ((double)m.client_send_ms + oneway_ms);
	offsets.push_back( (int64_t)std::llround( off_ms * 1e6 ) );
	rttsum += m.rtt_ms();
      }

    std::sort( offsets.begin(), offsets.end() );
    int64_t median;
    const size_t n = offsets.size();
    if( n % 2 == 1 )
      {
	median = offsets[n/2];
      }
    else
      {
	median = offsets[n/2 - 1] + (offsets[n/2] - offsets[n/2 - 1]) / 2;
      }

    const double rttmean = rttsum / n;
    double var=0;
    for( const auto& m : meas )
      {
	var += (m.rtt_ms() - rttmean) * (m.rtt_ms() - rttmean);
      }
    const double jitter_ms = std::sqrt( var / n );

    reprobe_early = false;
    if( !current.valid )
      {
	current.estimate_ns = median;
	current.valid = true;
	current.confidence = (jitter_ms > cfg.jitter_threshold_ms) ? 0.25 : 1.0 / (1.0 + jitter_ms / cfg.jitter_threshold_ms);
      }
    else if( jitter_ms > cfg.jitter_threshold_ms )
      {
#if RTNEON_DEBUG_LEVEL > 0
	fprintf(stderr, "CLOCK: round trip jitter %lf ms over threshold, keeping offset %ld ns\n", jitter_ms, (long)current.estimate_ns);
#endif
	current.confidence *= 0.5;
	current.measurements += meas.size();
	return current;
      }
    else if( std::llabs( median - current.estimate_ns ) > cfg.drift_reset_ns )
      {
#if RTNEON_DEBUG_LEVEL > 0
	fprintf(stdout, "CLOCK: offset jumped %ld -> %ld ns, resetting\n", (long)current.estimate_ns, (long)median);
#endif
	current.estimate_ns = median;
	current.confidence = 1.0 / (1.0 + jitter_ms / cfg.jitter_threshold_ms);
	reprobe_early = true;
      }
    else
      {
	current.estimate_ns = (int64_t)std::llround( cfg.ewma_alpha * median + (1.0 - cfg.ewma_alpha) * current.estimate_ns );
	current.confidence = 1.0 / (1.0 + jitter_ms / cfg.jitter_threshold_ms);
      }

    current.uncertainty_ns = (int64_t)std::llround( (rttmean / 2.0 + jitter_ms) * 1e6 );
    current.last_updated_ns = now_ns;
    current.measurements += meas.size();

    offset_ns.store( current.estimate_ns, std::memory_order_release );
    offset_valid.store( true, std::memory_order_release );

#if RTNEON_DEBUG_LEVEL > 5
    fprintf(stdout, "CLOCK: offset %ld ns (+- %ld) conf %lf from %lu echoes\n", (long)current.estimate_ns, (long)current.uncertainty_ns, current.confidence, (unsigned long)n);
#endif
    return current;
  }

  bool wants_early_reprobe() const
  {
    const std::lock_guard<std::mutex> lock(mu);
    return reprobe_early;
  }

  //Periodic refresh on its own thread. Restarting with a new source replaces the old one.
  void start( std::shared_ptr<time_echo_source> src )
  {
    stop();
    const std::lock_guard<std::mutex> lock(startstop_mu);
    {
      const std::lock_guard<std::mutex> lk(mu);
      source = src;
    }
    startlooping();
    probe_thread = std::thread( &clock_offset_estimator::probeloop, this );
  }

  void stop()
  {
    const std::lock_guard<std::mutex> lock(startstop_mu);
    stoplooping();
    JOIN( probe_thread );
  }

private:
  void probeloop()
  {
    while( localloop() )
      {
	estimate();
	const double wait = wants_early_reprobe() ? cfg.reprobe_interval_sec : cfg.probe_interval_sec;
	if( !localloop.sleepfor( wait ) )
	  {
	    break;
	  }
      }
  }
};
