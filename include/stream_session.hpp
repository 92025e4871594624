#pragma once

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <rtneon_defines.hpp>
#include <rtneon_errors.hpp>
#include <looper.hpp>
#include <mutexed_buffer.hpp>
#include <session_config.hpp>
#include <sensor_types.hpp>
#include <stream_transport.hpp>
#include <unit_decoder.hpp>
#include <clock_offset_estimator.hpp>
#include <Timer.hpp>

//Subscription to one sensor of one device.
//  IDLE -> CONNECTING -> STREAMING -> ERROR -> (backoff) -> CONNECTING ...
//  ERROR -> CLOSED once the sensor is no longer desired, or close() from any state.
//Each (re)connect starts a new epoch; the first sample of an epoch is flagged so consumers see the discontinuity.

enum class stream_state
  {
    IDLE,
    CONNECTING,
    STREAMING,
    ERROR,
    CLOSED
  };

inline const char* stream_state_str( const stream_state s )
{
  switch( s )
    {
    case stream_state::IDLE: return "idle";
    case stream_state::CONNECTING: return "connecting";
    case stream_state::STREAMING: return "streaming";
    case stream_state::ERROR: return "error";
    case stream_state::CLOSED: return "closed";
    }
  return "unknown";
}

struct stream_state_event
{
  sensor_kind kind=sensor_kind::GAZE;
  stream_state state=stream_state::IDLE;
  uint64_t epoch=0;
  std::string error;
};

typedef std::function<void(const sample_ptr&)> sample_handler;
typedef std::function<void(const stream_state_event&)> stream_state_handler;


struct stream_session
  : public looper
{
private:
  sensor_kind kind;
  media_type media;
  std::string device_id;
  std::string url;

  std::shared_ptr<transport_provider> provider;
  decoder_factory make_decoder;
  std::shared_ptr<clock_offset_estimator> clock;
  stream_config cfg;

  mutexed_buffer<transport_unit> units;
  mutexed_buffer<sample_ptr> samples;

  mutable std::mutex st_mu;
  stream_state st=stream_state::IDLE;
  uint64_t cur_epoch=0;

  std::mutex handler_mu;
  sample_handler on_sample;
  stream_state_handler on_state;

  std::atomic<bool> desired;
  std::atomic<bool> closed;
  std::mutex close_mu;
  bool started=false;
  std::thread mythread;

  //producer-side, only touched by mythread
  bool first_in_epoch=false;
  rtneon_time_ns_t last_local_ns=std::numeric_limits<rtneon_time_ns_t>::min();
  bool produced_in_epoch=false;

public:
  stream_session( const sensor_kind _kind, const std::string& _device_id, std::shared_ptr<transport_provider> _provider,
		  decoder_factory _make_decoder, std::shared_ptr<clock_offset_estimator> _clock, const stream_config& _cfg=stream_config() )
    : looper(std::string("stream ") + sensor_kind_str(_kind)), kind(_kind), media(media_for_kind(_kind)), device_id(_device_id),
      provider(_provider), make_decoder(_make_decoder), clock(_clock), cfg(_cfg),
      units(_cfg.unit_buffer_size, drop_policy::DROP_OLDEST, std::string("units ") + sensor_kind_str(_kind)),
      samples(_cfg.sample_buffer_size, _cfg.policy, std::string("samples ") + sensor_kind_str(_kind)),
      desired(true), closed(false)
  { }

  ~stream_session()
  {
    close();
  }

  sensor_kind get_kind() const
  {
    return kind;
  }

  const std::string& get_url() const
  {
    return url;
  }

  //Handlers run on the session's own thread and must not block.
  void set_sample_handler( sample_handler h )
  {
    const std::lock_guard<std::mutex> lock(handler_mu);
    on_sample = h;
  }

  void set_state_handler( stream_state_handler h )
  {
    const std::lock_guard<std::mutex> lock(handler_mu);
    on_state = h;
  }

  //Starts subscribing in the background; progress is visible through state() and the state handler.
  void open( const std::string& _url )
  {
    const std::lock_guard<std::mutex> lock(startstop_mu);
    if( closed )
      {
	throw device_error( rtneon_errc::CLOSED, std::string("stream session [") + sensor_kind_str(kind) + "] already closed" );
      }
    if( started )
      {
	return;
      }
    url = _url;
    tag = std::string("stream ") + sensor_kind_str(kind) + " " + url;
    started = true;
    startlooping();
    mythread = std::thread( &stream_session::doloop, this );
  }

  //An undesired session stops retrying after its next failure.
  void set_desired( const bool d )
  {
    desired = d;
  }

  bool is_desired() const
  {
    return desired;
  }

  stream_state state() const
  {
    const std::lock_guard<std::mutex> lock(st_mu);
    return st;
  }

  uint64_t epoch() const
  {
    const std::lock_guard<std::mutex> lock(st_mu);
    return cur_epoch;
  }

  //Oldest buffered sample. nullopt on timeout, or once closed and drained.
  std::optional<sample_ptr> next( const double timeout_sec )
  {
    return samples.wait_pop_front( timeout_sec );
  }

  //Newest buffered sample, discarding everything older.
  std::optional<sample_ptr> latest( const double timeout_sec )
  {
    return samples.wait_pop_newest( timeout_sec );
  }

  size_t buffered()
  {
    return samples.size();
  }

  uint64_t dropped()
  {
    return samples.get_dropped();
  }

  //Non-blocking: the session stops retrying, abandons an open in progress and winds down on its own thread.
  // close() still has to be called to join it.
  void request_stop()
  {
    desired = false;
    stoplooping();
    units.close();
  }

  void close()
  {
    const std::lock_guard<std::mutex> lock(close_mu);
    if( closed.exchange(true) )
      {
	return;
      }
    desired = false;
    {
      const std::lock_guard<std::mutex> lk(startstop_mu);
      stoplooping();
      units.close();
      JOIN( mythread );
    }
    samples.close();
    _set_state( stream_state::CLOSED, "" );

#if RTNEON_DEBUG_LEVEL > 1
    fprintf(stdout, "STREAM [%s]: closed [%s] (%lu samples dropped)\n", sensor_kind_str(kind), url.c_str(), (unsigned long)samples.get_dropped());
#endif
  }

private:
  void _set_state( const stream_state s, const std::string& err )
  {
    stream_state_event ev;
    {
      const std::lock_guard<std::mutex> lock(st_mu);
      if( st == stream_state::CLOSED )
	{
	  return;
	}
      st = s;
      ev.kind = kind;
      ev.state = s;
      ev.epoch = cur_epoch;
      ev.error = err;
    }
    stream_state_handler h;
    {
      const std::lock_guard<std::mutex> lock(handler_mu);
      h = on_state;
    }
    if( h )
      {
	h( ev );
      }
  }

  void _produce( decoded_sample& d )
  {
    auto s = std::make_shared<sample>();
    s->kind = kind;
    s->device_id = device_id;
    s->device_ts_ns = d.device_ts_ns;
    s->local_ts_ns = clock ? clock->translate( d.device_ts_ns ) : d.device_ts_ns;
    //offset updates may step backwards; never within an epoch
    if( s->local_ts_ns < last_local_ns )
      {
	s->local_ts_ns = last_local_ns;
      }
    last_local_ns = s->local_ts_ns;
    {
      const std::lock_guard<std::mutex> lock(st_mu);
      s->epoch = cur_epoch;
    }
    s->first_after_reconnect = first_in_epoch;
    first_in_epoch = false;
    s->payload = std::move( d.payload );
    produced_in_epoch = true;

    sample_ptr sp = s;
    samples.addone( sp );

    sample_handler h;
    {
      const std::lock_guard<std::mutex> lock(handler_mu);
      h = on_sample;
    }
    if( h )
      {
	h( sp );
      }
  }

  //Runs until the transport fails, stalls, or too many units in a row fail to decode. Returns why.
  std::string _pump( stream_transport& transport, unit_decoder& decoder )
  {
    Timer since_unit;
    size_t consecutive_errors=0;
    std::vector<transport_unit> batch;
    std::vector<decoded_sample> decoded;

    while( localloop() )
      {
	batch.clear();
	units.wait_popallto( batch, 0.1 );
	if( batch.empty() )
	  {
	    if( !transport.alive() )
	      {
		return "transport closed";
	      }
	    if( since_unit.elapsed() > cfg.stall_timeout_sec )
	      {
		return "no data for " + std::to_string(cfg.stall_timeout_sec) + " sec";
	      }
	    continue;
	  }
	since_unit.reset();

	for( const auto& u : batch )
	  {
	    decoded.clear();
	    if( !decoder.decode( u, decoded ) )
	      {
		++consecutive_errors;
#if RTNEON_DEBUG_LEVEL > 10
		fprintf(stderr, "STREAM [%s]: skipping undecodable unit (%lu bytes, %lu in a row)\n", sensor_kind_str(kind), (unsigned long)u.size(), (unsigned long)consecutive_errors);
#endif
		if( consecutive_errors > cfg.decode_error_threshold )
		  {
		    return std::to_string(consecutive_errors) + " consecutive decode errors";
		  }
		continue;
	      }
	    consecutive_errors = 0;
	    for( auto& d : decoded )
	      {
		_produce( d );
	      }
	  }
      }
    return "";
  }

  void doloop()
  {
    double backoff = cfg.backoff_initial_sec;
    while( localloop() )
      {
	{
	  const std::lock_guard<std::mutex> lock(st_mu);
	  ++cur_epoch;
	}
	first_in_epoch = true;
	produced_in_epoch = false;
	last_local_ns = std::numeric_limits<rtneon_time_ns_t>::min();
	_set_state( stream_state::CONNECTING, "" );

	std::string err;
	std::shared_ptr<stream_transport> transport = provider->acquire( url, err, [this]() { return !localloop(); } );
	std::unique_ptr<unit_decoder> decoder;
	if( !localloop() )
	  {
	    err = "stopped while opening";
	  }
	else if( transport && !transport->has_media( media ) )
	  {
	    err = std::string("no ") + media_type_str(media) + " stream in [" + url + "]";
	  }
	else if( transport )
	  {
	    decoder = make_decoder( kind );
	    if( !decoder )
	      {
		err = "no decoder";
	      }
	    else if( decoder->init( *transport, err ) )
	      {
		units.clear();
		const uint64_t subid = transport->subscribe( media, [this]( const transport_unit& u ) { units.addone( u ); } );
#if RTNEON_DEBUG_LEVEL > 0
		fprintf(stdout, "STREAM [%s]: streaming [%s] epoch %lu\n", sensor_kind_str(kind), url.c_str(), (unsigned long)epoch());
#endif
		_set_state( stream_state::STREAMING, "" );
		err = _pump( *transport, *decoder );
		transport->unsubscribe( subid );
	      }
	  }
	decoder.reset();
	transport.reset();

	if( !localloop() )
	  {
	    break;
	  }

	fprintf(stderr, "STREAM [%s]: [%s] failed: %s\n", sensor_kind_str(kind), url.c_str(), err.c_str());
	_set_state( stream_state::ERROR, err );
	if( produced_in_epoch )
	  {
	    backoff = cfg.backoff_initial_sec;
	  }

	if( !desired || !localloop.sleepfor( backoff ) || !desired )
	  {
	    break;
	  }
	backoff = std::min( backoff * 2, cfg.backoff_max_sec );
      }

    if( !desired )
      {
	samples.close();
	_set_state( stream_state::CLOSED, "" );
      }
  }
};
