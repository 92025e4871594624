#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

#include <utility>

#include <boost/asio.hpp>

#include <rtneon_defines.hpp>
#include <rtneon_errors.hpp>
#include <session_config.hpp>
#include <device_endpoint.hpp>
#include <device_status.hpp>
#include <device_command.hpp>
#include <control_transport.hpp>
#include <control_session.hpp>
#include <clock_offset_estimator.hpp>
#include <stream_transport.hpp>
#include <rtsp_transport_pool.hpp>
#include <unit_decoder.hpp>
#include <av_unit_decoder.hpp>
#include <stream_session.hpp>

//Keeps one stream session open for every sensor that is both requested and reported connected by the device,
// and merges status and samples of one device into a single event surface.
//Reconciliation and event delivery run on a strand of the caller's io_context. Blocking I/O stays on the
// control, clock and stream session threads; sessions taken out of service are joined on a reaper thread.
//A sample is delivered only while its session is the current one for a requested sensor.

enum class session_event_type
  {
    STATUS,
    DISCONNECTED,
    SAMPLE,
    STREAM_STATE
  };

inline const char* session_event_type_str( const session_event_type t )
{
  switch( t )
    {
    case session_event_type::STATUS: return "status";
    case session_event_type::DISCONNECTED: return "disconnected";
    case session_event_type::SAMPLE: return "sample";
    case session_event_type::STREAM_STATE: return "stream_state";
    }
  return "unknown";
}

struct session_event
{
  session_event_type type=session_event_type::STATUS;
  std::string device_id;
  //Set for SAMPLE and STREAM_STATE.
  std::optional<sensor_kind> kind;

  device_status_ptr status;
  bool fresh=false;

  sample_ptr sample;

  stream_state state=stream_state::IDLE;
  uint64_t epoch=0;
  std::string error;
};

typedef std::function<void(const session_event&)> session_event_handler;


//Everything the orchestrator talks to the outside world through.
struct session_dependencies
{
  std::function<std::shared_ptr<control_transport>()> make_control_transport;
  std::shared_ptr<transport_provider> transports;
  decoder_factory make_decoder;
  std::function<std::shared_ptr<time_echo_source>(const std::string&, const int)> make_echo_source;

  static session_dependencies defaults( const session_config& cfg=session_config() )
  {
    session_dependencies d;
    const double idle = cfg.control.liveness_timeout_sec;
    d.make_control_transport = [idle]() { return std::make_shared<neon_control_transport>( idle ); };
    d.transports = std::make_shared<rtsp_transport_pool>( cfg.stream.open_timeout_sec, cfg.stream.stall_timeout_sec );
    d.make_decoder = &make_default_decoder;
    d.make_echo_source = []( const std::string& host, const int port ) { return std::make_shared<tcp_time_echo_source>( host, port ); };
    return d;
  }
};


struct session_orchestrator
{
private:
  //Posted handlers hold this; close() clears self so nothing runs on a closed orchestrator.
  struct handler_guard
  {
    std::mutex mu;
    session_orchestrator* self=nullptr;
  };

  struct active_stream
  {
    std::shared_ptr<stream_session> session;
    std::string url;
  };

  boost::asio::strand<boost::asio::io_context::executor_type> strand;
  session_config cfg;
  session_dependencies deps;
  std::shared_ptr<handler_guard> guard;

  std::shared_ptr<clock_offset_estimator> clock;
  mutable std::mutex ctl_mu;
  std::shared_ptr<control_session> control;
  device_endpoint ep;

  //strand only
  device_status_ptr cur_status;
  bool control_live=false;
  std::optional<int> clock_echo_port;

  mutable std::mutex smu;
  std::set<sensor_kind> desired;
  std::map<sensor_kind, active_stream> streams;

  std::mutex reap_mu;
  std::condition_variable reap_cv;
  std::deque<std::shared_ptr<stream_session>> reapq;
  bool reaping=true;
  std::thread reaper;

  std::mutex sub_mu;
  std::map<uint64_t, session_event_handler> subscribers;
  uint64_t next_sub_id=1;

  std::mutex connect_mu;
  std::atomic<bool> closed;
  std::mutex close_mu;

public:
  session_orchestrator( boost::asio::io_context& ioc, const session_config& _cfg=session_config(),
			const session_dependencies& _deps=session_dependencies() )
    : strand(boost::asio::make_strand(ioc)), cfg(_cfg), deps(_deps), closed(false)
  {
    //unset members fall back to the real device stack
    if( !deps.make_control_transport || !deps.transports || !deps.make_decoder || !deps.make_echo_source )
      {
	session_dependencies d = session_dependencies::defaults( cfg );
	if( !deps.make_control_transport ) { deps.make_control_transport = d.make_control_transport; }
	if( !deps.transports ) { deps.transports = d.transports; }
	if( !deps.make_decoder ) { deps.make_decoder = d.make_decoder; }
	if( !deps.make_echo_source ) { deps.make_echo_source = d.make_echo_source; }
      }
    guard = std::make_shared<handler_guard>();
    guard->self = this;
    clock = std::make_shared<clock_offset_estimator>( cfg.clock );
    reaper = std::thread( &session_orchestrator::reaploop, this );
  }

  ~session_orchestrator()
  {
    close();
  }

  //Blocks until the control channel is live with a first snapshot. Throws device_error.
  void connect( const device_endpoint& _ep )
  {
    const std::lock_guard<std::mutex> lock(connect_mu);
    if( closed )
      {
	throw device_error( rtneon_errc::CLOSED, "orchestrator already closed" );
      }
    if( _control() )
      {
	throw device_error( rtneon_errc::REJECTED, "orchestrator already connected to " + ep.tostr() );
      }

    ep = _ep;
    auto cs = std::make_shared<control_session>( deps.make_control_transport(), cfg.control );
    std::weak_ptr<handler_guard> wg = guard;
    cs->subscribe( [this, wg]( const status_event& ev ) {
		     auto g = wg.lock();
		     if( !g ) { return; }
		     boost::asio::post( strand, [g, ev]() {
					  const std::lock_guard<std::mutex> lk(g->mu);
					  if( g->self ) { g->self->_on_status( ev ); }
					} );
		   } );
    {
      const std::lock_guard<std::mutex> lk(ctl_mu);
      control = cs;
    }
    try
      {
	cs->connect( ep );
	//close() may have run while connect blocked, before it could see the control session
	if( closed )
	  {
	    throw device_error( rtneon_errc::CLOSED, "orchestrator closed while connecting" );
	  }
      }
    catch( const device_error& e )
      {
	fprintf(stderr, "ORCHESTRATOR: cannot connect to %s: %s\n", ep.tostr().c_str(), e.what());
	{
	  const std::lock_guard<std::mutex> lk(ctl_mu);
	  control.reset();
	}
	cs->close();
	throw;
      }
  }

  const device_endpoint& endpoint() const
  {
    return ep;
  }

  std::string device_id() const
  {
    return ep.identity();
  }

  //Latest snapshot, nullptr before connect.
  device_status_ptr status() const
  {
    auto cs = _control();
    return cs ? cs->status() : nullptr;
  }

  std::shared_ptr<clock_offset_estimator> clock_estimator() const
  {
    return clock;
  }

  void request_sensor( const sensor_kind k )
  {
    {
      const std::lock_guard<std::mutex> lock(smu);
      if( !desired.insert( k ).second )
	{
	  return;
	}
    }
    _post_reconcile();
  }

  void release_sensor( const sensor_kind k )
  {
    {
      const std::lock_guard<std::mutex> lock(smu);
      if( desired.erase( k ) == 0 )
	{
	  return;
	}
    }
    _post_reconcile();
  }

  std::set<sensor_kind> desired_sensors() const
  {
    const std::lock_guard<std::mutex> lock(smu);
    return desired;
  }

  bool is_requested( const sensor_kind k ) const
  {
    const std::lock_guard<std::mutex> lock(smu);
    return desired.count( k ) > 0;
  }

  std::set<sensor_kind> active_sensors() const
  {
    const std::lock_guard<std::mutex> lock(smu);
    std::set<sensor_kind> res;
    for( const auto& s : streams )
      {
	res.insert( s.first );
      }
    return res;
  }

  std::future<command_result> send_command( const device_command& cmd )
  {
    auto cs = _control();
    if( closed || !cs )
      {
	std::promise<command_result> p;
	p.set_value( command_result::failure( 0, closed ? rtneon_errc::CLOSED : rtneon_errc::NOT_CONNECTED,
					      closed ? "orchestrator closed" : "orchestrator not connected" ) );
	return p.get_future();
      }
    return cs->send_command( cmd );
  }

  //Blocks until the control channel status satisfies pred (see control_session::wait_status).
  bool wait_status( const std::function<bool(const device_status&)>& pred, const double timeout_sec )
  {
    auto cs = _control();
    return cs && cs->wait_status( pred, timeout_sec );
  }

  //Handlers run on the strand, in production order, and must not block or call close().
  uint64_t subscribe( session_event_handler h )
  {
    const std::lock_guard<std::mutex> lock(sub_mu);
    uint64_t id = next_sub_id++;
    subscribers[id] = h;
    return id;
  }

  void unsubscribe( const uint64_t id )
  {
    const std::lock_guard<std::mutex> lock(sub_mu);
    subscribers.erase( id );
  }

  void close()
  {
    const std::lock_guard<std::mutex> lock(close_mu);
    if( closed.exchange(true) )
      {
	return;
      }

    auto cs = _control();
    if( cs )
      {
	cs->close();
      }

    //waits out a handler that is running right now
    {
      const std::lock_guard<std::mutex> lk(guard->mu);
      guard->self = nullptr;
    }

    std::map<sensor_kind, active_stream> toclose;
    {
      const std::lock_guard<std::mutex> lk(smu);
      toclose.swap( streams );
    }
    for( auto& s : toclose )
      {
	s.second.session->request_stop();
      }
    for( auto& s : toclose )
      {
	s.second.session->close();
      }

    {
      const std::lock_guard<std::mutex> lk(reap_mu);
      reaping = false;
    }
    reap_cv.notify_all();
    JOIN( reaper );

    clock->stop();
#if RTNEON_DEBUG_LEVEL > 0
    fprintf(stdout, "ORCHESTRATOR: closed [%s]\n", ep.tostr().c_str());
#endif
  }

private:
  std::shared_ptr<control_session> _control() const
  {
    const std::lock_guard<std::mutex> lock(ctl_mu);
    return control;
  }

  template <typename F>
  void _post( F&& f )
  {
    std::weak_ptr<handler_guard> wg = guard;
    boost::asio::post( strand, [wg, f]() {
			 auto g = wg.lock();
			 if( !g ) { return; }
			 const std::lock_guard<std::mutex> lk(g->mu);
			 if( g->self ) { f( *g->self ); }
		       } );
  }

  void _post_reconcile()
  {
    _post( []( session_orchestrator& o ) { o._reconcile(); } );
  }

  void _emit( const session_event& ev )
  {
    std::vector<session_event_handler> hs;
    {
      const std::lock_guard<std::mutex> lock(sub_mu);
      for( auto& s : subscribers )
	{
	  hs.push_back( s.second );
	}
    }
    for( auto& h : hs )
      {
	try
	  {
	    h( ev );
	  }
	catch( const std::exception& e )
	  {
	    fprintf(stderr, "ORCHESTRATOR: event subscriber threw [%s]\n", e.what());
	  }
      }
  }

  void _on_status( const status_event& sev )
  {
    session_event ev;
    ev.device_id = ep.identity();
    ev.status = sev.status;
    ev.fresh = sev.fresh;

    if( sev.type == status_event_type::DISCONNECTED )
      {
	control_live = false;
	//transports live on the same phone; they are rebuilt from the next fresh snapshot
	_close_all_streams();
	ev.type = session_event_type::DISCONNECTED;
	_emit( ev );
	return;
      }

    //After a disconnect only a full pull counts; stale pushes cannot bring streams back.
    if( !control_live && !sev.fresh )
      {
	return;
      }
    control_live = true;
    cur_status = sev.status;
    ev.type = session_event_type::STATUS;
    _emit( ev );

    _update_clock();
    _reconcile();
  }

  void _update_clock()
  {
    if( !cur_status || !deps.make_echo_source )
      {
	return;
      }
    const auto& port = cur_status->phone.time_echo_port;
    if( port && port != clock_echo_port )
      {
	clock_echo_port = port;
	const std::string host = cur_status->phone.ip.empty() ? ep.host : cur_status->phone.ip;
#if RTNEON_DEBUG_LEVEL > 0
	fprintf(stdout, "ORCHESTRATOR: clock probe on [%s:%d]\n", host.c_str(), *port);
#endif
	clock->start( deps.make_echo_source( host, *port ) );
      }
  }

  //Stops a session without waiting for it; the reaper joins it.
  void _retire( const std::shared_ptr<stream_session>& s )
  {
#if RTNEON_DEBUG_LEVEL > 0
    fprintf(stdout, "ORCHESTRATOR: closing [%s] stream\n", sensor_kind_str(s->get_kind()));
#endif
    s->request_stop();
    {
      const std::lock_guard<std::mutex> lk(reap_mu);
      reapq.push_back( s );
    }
    reap_cv.notify_all();
  }

  void reaploop()
  {
    while( true )
      {
	std::shared_ptr<stream_session> s;
	{
	  std::unique_lock<std::mutex> lk(reap_mu);
	  reap_cv.wait( lk, [&]() { return !reapq.empty() || !reaping; } );
	  if( reapq.empty() )
	    {
	      break;
	    }
	  s = reapq.front();
	  reapq.pop_front();
	}
	s->close();
      }
  }

  void _close_all_streams()
  {
    std::map<sensor_kind, active_stream> toclose;
    {
      const std::lock_guard<std::mutex> lk(smu);
      toclose.swap( streams );
    }
    for( auto& s : toclose )
      {
	_retire( s.second.session );
      }
  }

  bool _is_current( const sensor_kind k, const std::weak_ptr<stream_session>& ws ) const
  {
    const std::lock_guard<std::mutex> lk(smu);
    auto it = streams.find( k );
    if( it == streams.end() || desired.count( k ) == 0 )
      {
	return false;
      }
    return !ws.owner_before( it->second.session ) && !it->second.session.owner_before( ws );
  }

  //Brings the open streams to (desired & connected). URL changes count as a different stream.
  void _reconcile()
  {
    std::set<sensor_kind> want;
    std::set<sensor_kind> wanted;
    {
      const std::lock_guard<std::mutex> lk(smu);
      wanted = desired;
    }
    std::map<sensor_kind, std::string> urls;
    if( control_live && cur_status )
      {
	for( auto k : wanted )
	  {
	    if( cur_status->is_connected( k ) )
	      {
		want.insert( k );
		urls[k] = cur_status->sensor_for( k )->url();
	      }
	  }
      }

    std::vector<std::shared_ptr<stream_session>> toclose;
    {
      const std::lock_guard<std::mutex> lk(smu);
      for( auto it = streams.begin(); it != streams.end(); )
	{
	  if( want.count( it->first ) == 0 || urls[it->first] != it->second.url )
	    {
	      toclose.push_back( it->second.session );
	      it = streams.erase( it );
	    }
	  else
	    {
	      ++it;
	    }
	}
    }
    for( auto& s : toclose )
      {
	_retire( s );
      }

    for( auto k : want )
      {
	{
	  const std::lock_guard<std::mutex> lk(smu);
	  if( streams.count( k ) > 0 )
	    {
	      continue;
	    }
	}
	auto sess = std::make_shared<stream_session>( k, ep.identity(), deps.transports, deps.make_decoder, clock, cfg.stream );
	_hook( sess );
#if RTNEON_DEBUG_LEVEL > 0
	fprintf(stdout, "ORCHESTRATOR: opening [%s] stream at [%s]\n", sensor_kind_str(k), urls[k].c_str());
#endif
	{
	  const std::lock_guard<std::mutex> lk(smu);
	  streams[k] = active_stream{ sess, urls[k] };
	}
	sess->open( urls[k] );
      }
  }

  //Forwards a session's samples and state changes onto the strand. Samples of a session that was retired
  // in the meantime are dropped there.
  void _hook( const std::shared_ptr<stream_session>& sess )
  {
    const std::string devid = ep.identity();
    const sensor_kind k = sess->get_kind();
    std::weak_ptr<handler_guard> wg = guard;
    std::weak_ptr<stream_session> ws = sess;
    auto strand_copy = strand;

    sess->set_sample_handler( [wg, ws, strand_copy, devid, k]( const sample_ptr& s ) {
				boost::asio::post( strand_copy, [wg, ws, devid, k, s]() {
						     auto g = wg.lock();
						     if( !g ) { return; }
						     const std::lock_guard<std::mutex> lk(g->mu);
						     if( !g->self || !g->self->_is_current( k, ws ) ) { return; }
						     session_event ev;
						     ev.type = session_event_type::SAMPLE;
						     ev.device_id = devid;
						     ev.kind = k;
						     ev.sample = s;
						     g->self->_emit( ev );
						   } );
			      } );

    sess->set_state_handler( [wg, strand_copy, devid, k]( const stream_state_event& sev ) {
			       boost::asio::post( strand_copy, [wg, devid, k, sev]() {
						    auto g = wg.lock();
						    if( !g ) { return; }
						    const std::lock_guard<std::mutex> lk(g->mu);
						    if( !g->self ) { return; }
						    session_event ev;
						    ev.type = session_event_type::STREAM_STATE;
						    ev.device_id = devid;
						    ev.kind = k;
						    ev.state = sev.state;
						    ev.epoch = sev.epoch;
						    ev.error = sev.error;
						    g->self->_emit( ev );
						  } );
			     } );
  }
};
