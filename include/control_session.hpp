#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include <nlohmann/json.hpp>

#include <rtneon_defines.hpp>
#include <rtneon_errors.hpp>
#include <looper.hpp>
#include <session_config.hpp>
#include <device_endpoint.hpp>
#include <device_status.hpp>
#include <device_command.hpp>
#include <control_transport.hpp>
#include <Timer.hpp>

using namespace nlohmann;

//Control channel to one device.
//  DISCONNECTED -> CONNECTING -> LIVE -> DISCONNECTED -> CONNECTING ... -> CLOSED
//A listener thread keeps the cached status current from pushes and reconnects with capped exponential backoff.
//A link that stays quiet past the liveness timeout is probed with a status pull and dropped if that fails.
//A single command worker executes commands in submission order.

enum class control_state
  {
    DISCONNECTED,
    CONNECTING,
    LIVE,
    CLOSED
  };

inline const char* control_state_str( const control_state s )
{
  switch( s )
    {
    case control_state::DISCONNECTED: return "disconnected";
    case control_state::CONNECTING: return "connecting";
    case control_state::LIVE: return "live";
    case control_state::CLOSED: return "closed";
    }
  return "unknown";
}

enum class status_event_type
  {
    SNAPSHOT,
    DISCONNECTED
  };

struct status_event
{
  status_event_type type=status_event_type::SNAPSHOT;
  device_status_ptr status;
  //true when status is a full pull (connect, reconnect, status.get) rather than a push update
  bool fresh=false;
};

typedef std::function<void(const status_event&)> status_handler;


struct control_session
  : public looper
{
private:
  std::shared_ptr<control_transport> transport;
  control_config cfg;
  device_endpoint ep;

  mutable std::mutex status_mu;
  std::condition_variable status_cv;
  device_status_ptr current;
  control_state st=control_state::DISCONNECTED;

  //held while a snapshot is replaced and delivered, so deliveries never interleave
  std::mutex publish_mu;

  std::mutex sub_mu;
  std::map<uint64_t, status_handler> subscribers;
  uint64_t next_sub_id=1;

  struct pending_command
  {
    uint64_t id=0;
    device_command cmd;
    std::promise<command_result> prom;
  };

  std::mutex cmd_mu;
  std::condition_variable cmd_cv;
  std::deque<std::shared_ptr<pending_command>> cmdq;
  uint64_t next_request_id=1;
  bool started=false;

  std::thread listen_thread;
  std::thread cmd_thread;

  std::atomic<bool> closed;
  std::mutex close_mu;

public:
  control_session( std::shared_ptr<control_transport> _transport, const control_config& _cfg=control_config() )
    : looper("control"), transport(_transport), cfg(_cfg), closed(false)
  {
    if( !transport )
      {
	throw device_error( rtneon_errc::CONNECTION_ERROR, "control session needs a transport" );
      }
  }

  ~control_session()
  {
    close();
  }

  //Opens the channel and pulls the first full snapshot. Throws device_error(connection_error) if the device
  // is not reachable within the connect timeout.
  void connect( const device_endpoint& _ep )
  {
    const std::lock_guard<std::mutex> lock(startstop_mu);
    if( closed )
      {
	throw device_error( rtneon_errc::CLOSED, "control session already closed" );
      }
    if( started )
      {
	fprintf(stderr, "CONTROL: connect() called twice for [%s], ignoring\n", ep.tostr().c_str());
	return;
      }

    ep = _ep;
    tag = "control " + ep.identity();
    _set_state( control_state::CONNECTING );

    std::string err;
    if( !_open_and_snapshot( err ) )
      {
	_set_state( control_state::DISCONNECTED );
	throw device_error( rtneon_errc::CONNECTION_ERROR, err );
      }
    //close() waits on startstop_mu while we open; it must not find threads it cannot see
    if( closed )
      {
	transport->close();
	throw device_error( rtneon_errc::CLOSED, "control session closed while connecting" );
      }

#if RTNEON_DEBUG_LEVEL > 0
    fprintf(stdout, "CONTROL: live [%s] status [%s]\n", ep.tostr().c_str(), status()->tostr().c_str());
#endif

    startlooping();
    {
      const std::lock_guard<std::mutex> lk(cmd_mu);
      started = true;
    }
    listen_thread = std::thread( &control_session::listenloop, this );
    cmd_thread = std::thread( &control_session::cmdloop, this );
  }

  //Latest snapshot, never does I/O. nullptr before the first connect.
  device_status_ptr status() const
  {
    const std::lock_guard<std::mutex> lock(status_mu);
    return current;
  }

  control_state state() const
  {
    const std::lock_guard<std::mutex> lock(status_mu);
    return st;
  }

  const device_endpoint& endpoint() const
  {
    return ep;
  }

  uint64_t subscribe( status_handler h )
  {
    const std::lock_guard<std::mutex> lock(sub_mu);
    uint64_t id = next_sub_id++;
    subscribers[id] = h;
    return id;
  }

  void unsubscribe( const uint64_t id )
  {
    const std::lock_guard<std::mutex> lock(sub_mu);
    subscribers.erase(id);
  }

  //Queued and executed in submission order. The future always becomes ready (CLOSED if the session closes first).
  std::future<command_result> send_command( const device_command& cmd )
  {
    auto pc = std::make_shared<pending_command>();
    pc->cmd = cmd;
    auto fut = pc->prom.get_future();
    {
      const std::lock_guard<std::mutex> lock(cmd_mu);
      pc->id = next_request_id++;
      if( closed )
	{
	  pc->prom.set_value( command_result::failure( pc->id, rtneon_errc::CLOSED, "control session closed" ) );
	  return fut;
	}
      if( !started )
	{
	  pc->prom.set_value( command_result::failure( pc->id, rtneon_errc::NOT_CONNECTED, "control session never connected" ) );
	  return fut;
	}
      cmdq.push_back( pc );
    }
    cmd_cv.notify_all();
    return fut;
  }

  //Blocks until pred holds for the cached status, the session leaves LIVE, or timeout passes.
  bool wait_status( const std::function<bool(const device_status&)>& pred, const double timeout_sec )
  {
    std::unique_lock<std::mutex> lk(status_mu);
    status_cv.wait_for( lk, sec_to_ns_duration(timeout_sec), [&]() { return (current && pred(*current)) || closed; } );
    return current && pred(*current);
  }

  void close()
  {
    const std::lock_guard<std::mutex> lock(close_mu);
    if( closed.exchange(true) )
      {
	return;
      }

#if RTNEON_DEBUG_LEVEL > 1
    fprintf(stdout, "CONTROL: closing [%s]\n", ep.tostr().c_str());
#endif

    //serialized with connect(), which may still be opening the transport
    const std::lock_guard<std::mutex> sl(startstop_mu);
    stoplooping();
    { const std::lock_guard<std::mutex> lk(cmd_mu); }
    cmd_cv.notify_all();
    { const std::lock_guard<std::mutex> lk(status_mu); }
    status_cv.notify_all();

    JOIN( listen_thread );
    JOIN( cmd_thread );

    std::deque<std::shared_ptr<pending_command>> leftover;
    {
      const std::lock_guard<std::mutex> lk(cmd_mu);
      leftover.swap( cmdq );
    }
    for( auto& pc : leftover )
      {
	pc->prom.set_value( command_result::failure( pc->id, rtneon_errc::CLOSED, "control session closed" ) );
      }

    transport->close();
    _set_state( control_state::CLOSED );
  }

private:
  void _set_state( const control_state s )
  {
    {
      const std::lock_guard<std::mutex> lock(status_mu);
      st = s;
    }
    status_cv.notify_all();
  }

  bool _open_and_snapshot( std::string& err )
  {
    if( !transport->open( ep, cfg.connect_timeout_sec, err ) )
      {
	transport->close();
	return false;
      }

    auto snap = _pull_snapshot( cfg.connect_timeout_sec, err );
    if( !snap )
      {
	transport->close();
	return false;
      }

    _replace_and_publish( snap, true );
    return true;
  }

  std::shared_ptr<device_status> _pull_snapshot( const double timeout_sec, std::string& err )
  {
    auto rep = transport->request( boost::beast::http::verb::get, "/api/status", "", timeout_sec );
    command_result r;
    reply_to_result( rep, r );
    if( !r.ok() )
      {
	err = std::string("status pull failed (") + errc_str(r.code) + "): " + r.message;
	return nullptr;
      }
    try
      {
	return device_status::from_status_array( r.result );
      }
    catch( const device_error& e )
      {
	err = e.what();
	return nullptr;
      }
  }

  void _deliver( const status_event& ev )
  {
    std::vector<status_handler> hs;
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
	    fprintf(stderr, "CONTROL: status subscriber threw [%s]\n", e.what());
	  }
      }
  }

  //A full snapshot: becomes current and the session is LIVE.
  void _replace_and_publish( std::shared_ptr<device_status> snap, const bool fresh )
  {
    const std::lock_guard<std::mutex> pl(publish_mu);
    {
      const std::lock_guard<std::mutex> lock(status_mu);
      snap->version = (current ? current->version : 0) + 1;
      current = snap;
      if( !closed )
	{
	  st = control_state::LIVE;
	}
    }
    status_cv.notify_all();
    _deliver( status_event{ status_event_type::SNAPSHOT, snap, fresh } );
  }

  void _apply_push( const json& comp )
  {
    const std::lock_guard<std::mutex> pl(publish_mu);
    device_status_ptr next;
    {
      const std::lock_guard<std::mutex> lock(status_mu);
      if( !current )
	{
	  return;
	}
      next = current->apply_component( comp );
      if( !next )
	{
	  return;
	}
      current = next;
    }
    status_cv.notify_all();
    _deliver( status_event{ status_event_type::SNAPSHOT, next, false } );
  }

  void _mark_disconnected()
  {
    const std::lock_guard<std::mutex> pl(publish_mu);
    device_status_ptr last;
    {
      const std::lock_guard<std::mutex> lock(status_mu);
      st = control_state::DISCONNECTED;
      last = current;
    }
    status_cv.notify_all();
    fprintf(stderr, "CONTROL: lost connection to [%s]\n", ep.tostr().c_str());
    _deliver( status_event{ status_event_type::DISCONNECTED, last, false } );
  }

  void _handle_push( const std::string& msg )
  {
    json j = json::parse( msg, nullptr, false );
    if( j.is_discarded() )
      {
	fprintf(stderr, "CONTROL: unparseable push from [%s], skipping\n", ep.tostr().c_str());
	return;
      }
    if( j.is_array() )
      {
	for( const auto& comp : j )
	  {
	    _apply_push( comp );
	  }
      }
    else
      {
	_apply_push( j );
      }
  }

  //No push for liveness_timeout_sec: a status pull must succeed or the link counts as lost.
  bool _check_liveness()
  {
    std::string err;
    auto snap = _pull_snapshot( cfg.connect_timeout_sec, err );
    if( !snap )
      {
	fprintf(stderr, "CONTROL: [%s] silent for %lf sec and %s\n", ep.tostr().c_str(), cfg.liveness_timeout_sec, err.c_str());
	return false;
      }
    _replace_and_publish( snap, true );
    return true;
  }

  void listenloop()
  {
    double backoff = cfg.backoff_initial_sec;
    Timer since_heard;
    while( localloop() )
      {
	if( state() == control_state::LIVE )
	  {
	    std::string msg;
	    auto r = transport->read_push( msg, cfg.push_poll_sec );
	    bool lost = (r == push_read::CLOSED);
	    if( r == push_read::MESSAGE )
	      {
		since_heard.reset();
		_handle_push( msg );
	      }
	    else if( !lost && cfg.liveness_timeout_sec > 0 && since_heard.elapsed() > cfg.liveness_timeout_sec && localloop() )
	      {
		lost = !_check_liveness();
		since_heard.reset();
	      }

	    if( lost )
	      {
		transport->close();
		_mark_disconnected();
		backoff = cfg.backoff_initial_sec;
	      }
	  }
	else
	  {
	    if( !localloop.sleepfor( backoff ) )
	      {
		break;
	      }
	    _set_state( control_state::CONNECTING );
	    std::string err;
	    if( _open_and_snapshot( err ) )
	      {
		fprintf(stdout, "CONTROL: reconnected to [%s]\n", ep.tostr().c_str());
		backoff = cfg.backoff_initial_sec;
		since_heard.reset();
	      }
	    else
	      {
#if RTNEON_DEBUG_LEVEL > 0
		fprintf(stderr, "CONTROL: reconnect to [%s] failed [%s], retry in %lf sec\n", ep.tostr().c_str(), err.c_str(), backoff*2);
#endif
		_set_state( control_state::DISCONNECTED );
		backoff = std::min( backoff * 2, cfg.backoff_max_sec );
	      }
	  }
      }
  }

  void cmdloop()
  {
    while( true )
      {
	std::shared_ptr<pending_command> pc;
	{
	  std::unique_lock<std::mutex> lk(cmd_mu);
	  cmd_cv.wait( lk, [&]() { return !cmdq.empty() || !localloop(); } );
	  if( !localloop() )
	    {
	      break;
	    }
	  pc = cmdq.front();
	  cmdq.pop_front();
	}

	command_result r = _execute( pc->id, pc->cmd );
#if RTNEON_DEBUG_LEVEL > 1
	fprintf(stdout, "CONTROL: command #%lu [%s] -> [%s] %s\n", (unsigned long)pc->id, command_type_str(pc->cmd.type), errc_str(r.code), r.message.c_str());
#endif
	pc->prom.set_value( std::move(r) );
      }
  }

  //Waits for the device to confirm a command through status.
  void _confirm( const std::function<bool(const device_status&)>& pred, command_result& res )
  {
    std::unique_lock<std::mutex> lk(status_mu);
    status_cv.wait_for( lk, sec_to_ns_duration(cfg.command_timeout_sec),
			[&]() { return (current && pred(*current)) || st != control_state::LIVE || closed; } );
    if( current && pred(*current) )
      {
	return;
      }
    if( closed )
      {
	res.code = rtneon_errc::CLOSED;
	res.message = "closed while waiting for confirmation";
      }
    else if( st != control_state::LIVE )
      {
	res.code = rtneon_errc::CONNECTION_ERROR;
	res.message = "disconnected while waiting for confirmation";
      }
    else
      {
	res.code = rtneon_errc::TIMEOUT;
	res.message = "device did not confirm within " + std::to_string(cfg.command_timeout_sec) + " sec";
      }
  }

  command_result _post( const uint64_t id, const std::string& target, const std::string& body )
  {
    command_result res;
    res.request_id = id;
    auto rep = transport->request( boost::beast::http::verb::post, target, body, cfg.command_timeout_sec );
    reply_to_result( rep, res );
    return res;
  }

  command_result _get( const uint64_t id, const std::string& target )
  {
    command_result res;
    res.request_id = id;
    auto rep = transport->request( boost::beast::http::verb::get, target, "", cfg.command_timeout_sec );
    reply_to_result( rep, res );
    return res;
  }

  command_result _execute( const uint64_t id, const device_command& cmd )
  {
    if( closed )
      {
	return command_result::failure( id, rtneon_errc::CLOSED, "control session closed" );
      }
    if( state() != control_state::LIVE )
      {
	return command_result::failure( id, rtneon_errc::NOT_CONNECTED, std::string("control channel is ") + control_state_str(state()) );
      }

    switch( cmd.type )
      {
      case command_type::RECORDING_START:
	{
	  auto res = _post( id, "/api/recording:start", "" );
	  if( res.ok() )
	    {
	      _confirm( [](const device_status& s) { return s.rec_state == recording_state::RECORDING; }, res );
	    }
	  return res;
	}
      case command_type::RECORDING_STOP_AND_SAVE:
	{
	  auto res = _post( id, "/api/recording:stop_and_save", "" );
	  if( res.ok() )
	    {
	      _confirm( [](const device_status& s) { return s.rec_state == recording_state::IDLE; }, res );
	    }
	  return res;
	}
      case command_type::RECORDING_CANCEL:
	{
	  auto res = _post( id, "/api/recording:cancel", "" );
	  if( res.ok() )
	    {
	      _confirm( [](const device_status& s) { return s.rec_state == recording_state::IDLE; }, res );
	    }
	  return res;
	}
      case command_type::EVENT_SEND:
	{
	  json body;
	  body["name"] = cmd.event_name;
	  if( cmd.event_ts_ns )
	    {
	      body["timestamp"] = *cmd.event_ts_ns;
	    }
	  return _post( id, "/api/event", body.dump() );
	}
      case command_type::TEMPLATE_GET:
	{
	  auto def = _get( id, "/api/template" );
	  if( !def.ok() )
	    {
	      return def;
	    }
	  auto data = _get( id, "/api/template_data" );
	  if( !data.ok() )
	    {
	      return data;
	    }
	  command_result res;
	  res.request_id = id;
	  res.result["template"] = def.result;
	  res.result["data"] = data.result;
	  return res;
	}
      case command_type::TEMPLATE_SET:
	{
	  return _post( id, "/api/template_data", cmd.template_data.dump() );
	}
      case command_type::CALIBRATION_GET:
	{
	  command_result res;
	  res.request_id = id;
	  auto rep = transport->request( boost::beast::http::verb::get, "/calibration.bin", "", cfg.command_timeout_sec );
	  if( rep.is_success() )
	    {
	      res.binary = rep.body_bytes();
	    }
	  else
	    {
	      reply_to_result( rep, res );
	    }
	  return res;
	}
      case command_type::STATUS_GET:
	{
	  auto res = _get( id, "/api/status" );
	  if( !res.ok() )
	    {
	      return res;
	    }
	  try
	    {
	      _replace_and_publish( device_status::from_status_array( res.result ), true );
	    }
	  catch( const device_error& e )
	    {
	      res.code = rtneon_errc::PROTOCOL_ERROR;
	      res.message = e.what();
	    }
	  return res;
	}
      }
    return command_result::failure( id, rtneon_errc::PROTOCOL_ERROR, "unknown command" );
  }
};
