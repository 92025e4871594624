#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <future>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <utility>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include <rtneon_defines.hpp>
#include <rtneon_errors.hpp>
#include <session_config.hpp>
#include <mutexed_buffer.hpp>
#include <device_endpoint.hpp>
#include <device_status.hpp>
#include <device_command.hpp>
#include <calibration.hpp>
#include <clock_offset_estimator.hpp>
#include <zeroconf_service_discoverer.hpp>
#include <session_orchestrator.hpp>
#include <Timer.hpp>

using namespace nlohmann;

//Blocking handle on one device for a single-threaded caller.
//The orchestrator and all its sessions run on a private io_context thread; the caller only ever waits on
// bounded per-sensor queues or on command futures. The one exception is estimate_time_offset(), a probe
// batch bounded by its timeout.

struct matched_samples
{
  sample_ptr primary;
  sample_ptr secondary;
};

struct matched_scene_and_gaze
{
  sample_ptr scene;
  sample_ptr gaze;
};

struct matched_scene_eyes_and_gaze
{
  sample_ptr scene;
  sample_ptr eye_left;
  sample_ptr eye_right;
  sample_ptr gaze;
};

//All audio produced since the previous scene frame, up to this one.
struct matched_scene_audio_and_gaze
{
  sample_ptr scene;
  std::vector<sample_ptr> audio;
  sample_ptr gaze;
};


struct sync_device
{
private:
  session_config cfg;
  session_dependencies deps;

  boost::asio::io_context ioc;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work;
  std::thread io_thread;

  std::unique_ptr<session_orchestrator> orch;

  //one handoff queue per kind, created up front and never added to
  std::map<sensor_kind, std::unique_ptr<mutexed_buffer<sample_ptr>>> queues;

  std::mutex hist_mu;
  std::condition_variable hist_cv;
  std::map<sensor_kind, std::deque<sample_ptr>> history;

  std::atomic<bool> closed;
  std::mutex close_mu;

public:
  //Connects right away. Throws device_error if the device cannot be reached.
  sync_device( const device_endpoint& ep, const session_config& _cfg=session_config(), const session_dependencies& _deps=session_dependencies() )
    : cfg(_cfg), deps(_deps), closed(false)
  {
    for( auto k : ALL_SENSOR_KINDS )
      {
	queues[k] = std::make_unique<mutexed_buffer<sample_ptr>>( cfg.facade.queue_size, cfg.stream.policy, std::string("facade ") + sensor_kind_str(k) );
	history[k];
      }
    if( !deps.make_echo_source )
      {
	deps.make_echo_source = []( const std::string& host, const int port ) { return std::make_shared<tcp_time_echo_source>( host, port ); };
      }

    work.emplace( boost::asio::make_work_guard( ioc ) );
    io_thread = std::thread( &sync_device::ioloop, this );

    orch = std::make_unique<session_orchestrator>( ioc, cfg, deps );
    orch->subscribe( [this]( const session_event& ev ) { _on_event( ev ); } );
    try
      {
	orch->connect( ep );
      }
    catch( const std::exception& )
      {
	close();
	throw;
      }
  }

  ~sync_device()
  {
    close();
  }

  sync_device( const sync_device& ) = delete;
  sync_device& operator=( const sync_device& ) = delete;

  const device_endpoint& endpoint() const
  {
    return orch->endpoint();
  }

  //////////// STREAMS

  void streaming_start( const sensor_kind k )
  {
    _check_open();
    orch->request_sensor( k );
  }

  //Nothing of kind is handed out after this returns, until it is received again.
  void streaming_stop( const sensor_kind k )
  {
    if( closed )
      {
	return;
      }
    //under hist_mu so a sample being delivered right now either lands before the clear or sees the release
    const std::lock_guard<std::mutex> lock(hist_mu);
    orch->release_sensor( k );
    queues.at(k)->clear();
    history[k].clear();
  }

  std::set<sensor_kind> streaming_sensors() const
  {
    return orch->active_sensors();
  }

  //Next sample of kind, starting its stream if needed. nullopt on timeout.
  std::optional<sample_ptr> receive( const sensor_kind k, const double timeout_sec )
  {
    _check_open();
    orch->request_sensor( k );
    return queues.at(k)->wait_pop_front( timeout_sec );
  }

  std::optional<sample_ptr> receive_gaze_datum( const double timeout_sec )
  {
    return receive( sensor_kind::GAZE, timeout_sec );
  }

  std::optional<sample_ptr> receive_scene_video_frame( const double timeout_sec )
  {
    return receive( sensor_kind::SCENE, timeout_sec );
  }

  std::optional<sample_ptr> receive_imu_datum( const double timeout_sec )
  {
    return receive( sensor_kind::IMU, timeout_sec );
  }

  std::optional<sample_ptr> receive_eye_event( const double timeout_sec )
  {
    return receive( sensor_kind::EYE_EVENTS, timeout_sec );
  }

  std::optional<sample_ptr> receive_audio_frame( const double timeout_sec )
  {
    return receive( sensor_kind::AUDIO, timeout_sec );
  }

  //Left eye frame with the right eye frame closest in time.
  std::optional<matched_samples> receive_eyes_video_frame( const double timeout_sec )
  {
    return receive_matched( sensor_kind::EYE_LEFT, sensor_kind::EYE_RIGHT, timeout_sec );
  }

  //Next primary sample plus the secondary sample closest to it in local time.
  std::optional<matched_samples> receive_matched( const sensor_kind primary, const sensor_kind secondary, const double timeout_sec )
  {
    _check_open();
    Timer t;
    orch->request_sensor( secondary );
    auto p = receive( primary, timeout_sec );
    if( !p )
      {
	return std::nullopt;
      }
    auto s = _closest( secondary, (*p)->local_ts_ns, timeout_sec - t.elapsed() );
    if( !s )
      {
	return std::nullopt;
      }
    return matched_samples{ *p, s };
  }

  std::optional<matched_scene_and_gaze> receive_matched_scene_video_frame_and_gaze( const double timeout_sec )
  {
    auto m = receive_matched( sensor_kind::SCENE, sensor_kind::GAZE, timeout_sec );
    if( !m )
      {
	return std::nullopt;
      }
    return matched_scene_and_gaze{ m->primary, m->secondary };
  }

  std::optional<matched_scene_eyes_and_gaze> receive_matched_scene_and_eyes_video_frames_and_gaze( const double timeout_sec )
  {
    _check_open();
    Timer t;
    orch->request_sensor( sensor_kind::EYE_LEFT );
    orch->request_sensor( sensor_kind::EYE_RIGHT );
    orch->request_sensor( sensor_kind::GAZE );
    auto m = receive_matched( sensor_kind::SCENE, sensor_kind::GAZE, timeout_sec );
    if( !m )
      {
	return std::nullopt;
      }
    const rtneon_time_ns_t ts = m->primary->local_ts_ns;
    auto l = _closest( sensor_kind::EYE_LEFT, ts, timeout_sec - t.elapsed() );
    auto r = l ? _closest( sensor_kind::EYE_RIGHT, ts, timeout_sec - t.elapsed() ) : nullptr;
    if( !l || !r )
      {
	return std::nullopt;
      }
    return matched_scene_eyes_and_gaze{ m->primary, l, r, m->secondary };
  }

  std::optional<matched_scene_audio_and_gaze> receive_matched_scene_video_frame_and_audio( const double timeout_sec )
  {
    _check_open();
    orch->request_sensor( sensor_kind::AUDIO );
    auto m = receive_matched( sensor_kind::SCENE, sensor_kind::GAZE, timeout_sec );
    if( !m )
      {
	return std::nullopt;
      }
    matched_scene_audio_and_gaze res;
    res.scene = m->primary;
    res.gaze = m->secondary;
    res.audio = _audio_until( m->primary->local_ts_ns );
    return res;
  }

  //////////// STATUS

  //Cached snapshot, never blocks.
  device_status_ptr status() const
  {
    return orch->status();
  }

  int battery_level_percent() const { return _status_or_throw()->phone.battery_level; }
  std::string battery_state() const { return _status_or_throw()->phone.battery_state; }
  int64_t memory_num_free_bytes() const { return _status_or_throw()->phone.memory_bytes; }
  std::string memory_state() const { return _status_or_throw()->phone.memory_state; }
  std::string phone_name() const { return _status_or_throw()->phone.device_name; }
  std::string phone_id() const { return _status_or_throw()->phone.device_id; }
  std::string phone_ip() const { return _status_or_throw()->phone.ip; }
  std::string version_glasses() const { return _status_or_throw()->hardware.version; }
  std::string serial_number_glasses() const { return _status_or_throw()->hardware.glasses_serial; }
  std::string serial_number_scene_cam() const { return _status_or_throw()->hardware.world_camera_serial; }
  std::string module_serial() const { return _status_or_throw()->hardware.module_serial; }
  recording_state get_recording_state() const { return _status_or_throw()->rec_state; }

  //////////// COMMANDS
  //Each waits at most timeout_sec (default: request plus confirmation under the configured command timeout)
  // and throws device_error(TIMEOUT) past it. The command itself still runs to completion on the device.

  //Returns the id of the new recording once the device reports it recording.
  std::string recording_start( const std::optional<double> timeout_sec=std::nullopt )
  {
    _command( device_command::recording_start(), timeout_sec );
    auto st = status();
    return (st && st->recording) ? st->recording->id : std::string();
  }

  //Returns only after the device reports the recording saved and idle.
  void recording_stop_and_save( const std::optional<double> timeout_sec=std::nullopt )
  {
    _command( device_command::recording_stop_and_save(), timeout_sec );
  }

  void recording_cancel( const std::optional<double> timeout_sec=std::nullopt )
  {
    _command( device_command::recording_cancel(), timeout_sec );
  }

  //ts_ns is device (unix ns) time; without it the device stamps the event on arrival.
  json send_event( const std::string& name, const std::optional<int64_t> ts_ns=std::nullopt, const std::optional<double> timeout_sec=std::nullopt )
  {
    return _command( device_command::event_send( name, ts_ns ), timeout_sec ).result;
  }

  //Active template definition and current answers: {"template": ..., "data": ...}
  json get_template( const std::optional<double> timeout_sec=std::nullopt )
  {
    return _command( device_command::template_get(), timeout_sec ).result;
  }

  json post_template( const json& answers, const std::optional<double> timeout_sec=std::nullopt )
  {
    return _command( device_command::template_set( answers ), timeout_sec ).result;
  }

  device_calibration get_calibration( const std::optional<double> timeout_sec=std::nullopt )
  {
    auto r = _command( device_command::calibration_get(), timeout_sec );
    return parse_calibration( r.binary );
  }

  //Fresh pull from the device, replaces the cached snapshot.
  device_status_ptr refresh_status( const std::optional<double> timeout_sec=std::nullopt )
  {
    _command( device_command::status_get(), timeout_sec );
    return status();
  }

  //One probe batch against the device's time echo service, bounded by timeout_sec (default: the configured
  // echo timeout). nullopt if the device does not offer one, device_error(TIMEOUT) if no echo came back in time.
  std::optional<clock_offset> estimate_time_offset( const std::optional<double> timeout_sec=std::nullopt )
  {
    _check_open();
    auto st = status();
    if( !st || !st->phone.time_echo_port )
      {
	return std::nullopt;
      }
    const std::string host = st->phone.ip.empty() ? orch->endpoint().host : st->phone.ip;
    auto src = deps.make_echo_source( host, *st->phone.time_echo_port );
    const double tmo = timeout_sec.value_or( cfg.clock.echo_timeout_sec );
    clock_offset res;
    if( !orch->clock_estimator()->estimate( *src, tmo, res ) )
      {
	throw device_error( rtneon_errc::TIMEOUT, "no time echo from " + host + ":" + std::to_string(*st->phone.time_echo_port) + " within " + std::to_string(tmo) + " sec" );
      }
    return res;
  }

  //////////// LIFETIME

  void close()
  {
    const std::lock_guard<std::mutex> lock(close_mu);
    if( closed.exchange(true) )
      {
	return;
      }
    if( orch )
      {
	orch->close();
      }
    work.reset();
    ioc.stop();
    JOIN( io_thread );
    for( auto& q : queues )
      {
	q.second->close();
      }
    { const std::lock_guard<std::mutex> lk(hist_mu); }
    hist_cv.notify_all();
  }

  bool is_closed() const
  {
    return closed;
  }

private:
  void ioloop()
  {
    while( true )
      {
	try
	  {
	    ioc.run();
	    break;
	  }
	catch( const std::exception& e )
	  {
	    fprintf(stderr, "DEVICE: background handler threw [%s], continuing\n", e.what());
	  }
      }
  }

  void _check_open() const
  {
    if( closed )
      {
	throw device_error( rtneon_errc::CLOSED, "device handle closed" );
      }
  }

  device_status_ptr _status_or_throw() const
  {
    _check_open();
    auto st = status();
    if( !st )
      {
	throw device_error( rtneon_errc::NOT_CONNECTED, "no status from device yet" );
      }
    return st;
  }

  double _command_timeout() const
  {
    //request plus device confirmation, each bounded by the command timeout
    return 2 * cfg.control.command_timeout_sec + 1.0;
  }

  command_result _command( const device_command& cmd, const std::optional<double> timeout_sec )
  {
    _check_open();
    auto fut = orch->send_command( cmd );
    if( fut.wait_for( sec_to_ns_duration( timeout_sec.value_or( _command_timeout() ) ) ) != std::future_status::ready )
      {
	throw device_error( rtneon_errc::TIMEOUT, std::string(command_type_str(cmd.type)) + " did not complete" );
      }
    command_result r = fut.get();
    r.throw_if_failed();
    return r;
  }

  size_t _history_size( const sensor_kind k ) const
  {
    if( k == sensor_kind::AUDIO )
      {
	return cfg.facade.audio_history_size;
      }
    if( k == sensor_kind::SCENE )
      {
	return std::max<size_t>( 2, cfg.facade.queue_size );
      }
    return cfg.facade.match_history_size;
  }

  //Runs on the orchestrator strand.
  void _on_event( const session_event& ev )
  {
    if( ev.type == session_event_type::SAMPLE && ev.kind && ev.sample )
      {
	const sensor_kind k = *ev.kind;
	{
	  const std::lock_guard<std::mutex> lock(hist_mu);
	  if( !orch->is_requested( k ) )
	    {
	      return;
	    }
	  queues.at(k)->addone( ev.sample );
	  auto& h = history[k];
	  h.push_back( ev.sample );
	  while( h.size() > _history_size( k ) )
	    {
	      h.pop_front();
	    }
	}
	hist_cv.notify_all();
      }
    else if( ev.type == session_event_type::DISCONNECTED )
      {
	fprintf(stderr, "DEVICE: [%s] disconnected, streams resume after reconnect\n", ev.device_id.c_str());
      }
    else if( ev.type == session_event_type::STREAM_STATE && ev.kind )
      {
#if RTNEON_DEBUG_LEVEL > 1
	fprintf(stdout, "DEVICE: [%s] %s stream %s (epoch %lu) %s\n", ev.device_id.c_str(), sensor_kind_str(*ev.kind), stream_state_str(ev.state), (unsigned long)ev.epoch, ev.error.c_str());
#endif
      }
  }

  //Sample of kind closest to ts in local time; waits for the first one if none arrived yet.
  sample_ptr _closest( const sensor_kind k, const rtneon_time_ns_t ts, const double timeout_sec )
  {
    std::unique_lock<std::mutex> lk(hist_mu);
    auto& h = history[k];
    hist_cv.wait_for( lk, sec_to_ns_duration( std::max( 0.0, timeout_sec ) ), [&]() { return !h.empty() || closed; } );
    sample_ptr best;
    rtneon_time_ns_t bestdiff = 0;
    for( const auto& s : h )
      {
	rtneon_time_ns_t diff = std::llabs( s->local_ts_ns - ts );
	if( !best || diff < bestdiff )
	  {
	    best = s;
	    bestdiff = diff;
	  }
      }
    return best;
  }

  std::vector<sample_ptr> _audio_until( const rtneon_time_ns_t ts )
  {
    std::vector<sample_ptr> res;
    const std::lock_guard<std::mutex> lock(hist_mu);
    auto& h = history[sensor_kind::AUDIO];
    while( !h.empty() && h.front()->local_ts_ns <= ts )
      {
	res.push_back( h.front() );
	h.pop_front();
      }
    return res;
  }
};


//First device that answers discovery, connected. nullptr if none appeared or the connection failed.
inline std::unique_ptr<sync_device> discover_one_device( const double timeout_sec=10.0, const session_config& cfg=session_config(),
							  std::shared_ptr<advertisement_source> source=nullptr,
							  const session_dependencies& deps=session_dependencies() )
{
  if( !source )
    {
      source = std::make_shared<mdns_advertisement_source>();
    }
  auto ep = discover_one( source, timeout_sec, cfg.discovery );
  if( !ep )
    {
      return nullptr;
    }
  try
    {
      return std::make_unique<sync_device>( *ep, cfg, deps );
    }
  catch( const device_error& e )
    {
      fprintf(stderr, "DEVICE: found %s but could not connect: %s\n", ep->tostr().c_str(), e.what());
      return nullptr;
    }
}
