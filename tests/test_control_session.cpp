//control_session against a scripted device: snapshot, pushes, commands and their confirmation,
// ordering, reconnect after a dropped channel, close.

#include <cassert>
#include <cstdio>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <fake_device.hpp>

struct event_log
{
  std::mutex mu;
  std::vector<status_event> events;

  void add( const status_event& ev )
  {
    const std::lock_guard<std::mutex> lock(mu);
    events.push_back( ev );
  }

  size_t count( const status_event_type t, const bool fresh_only=false )
  {
    const std::lock_guard<std::mutex> lock(mu);
    size_t n=0;
    for( auto& e : events )
      {
	if( e.type == t && (!fresh_only || e.fresh) )
	  {
	    ++n;
	  }
      }
    return n;
  }

  bool saw_rec_state( const recording_state s )
  {
    const std::lock_guard<std::mutex> lock(mu);
    for( auto& e : events )
      {
	if( e.status && e.status->rec_state == s )
	  {
	    return true;
	  }
      }
    return false;
  }
};

static std::vector<uint8_t> calibration_bytes()
{
  std::vector<uint8_t> v( CALIBRATION_BLOB_SIZE, 0 );
  for( size_t i=0; i<v.size(); ++i )
    {
      v[i] = (uint8_t)(i & 0xff);
    }
  return v;
}

int main()
{
  const device_endpoint ep( "10.0.0.2" );
  const session_config cfg = fast_test_config();

  //////////// unreachable device
  {
    auto dev = std::make_shared<fake_neon_device>();
    dev->set_reachable( false );
    control_session cs( std::make_shared<fake_control_transport>( dev ), cfg.control );

    auto r = cs.send_command( device_command::status_get() ).get();
    assert( r.code == rtneon_errc::NOT_CONNECTED );

    bool threw=false;
    try
      {
	cs.connect( ep );
      }
    catch( const device_error& e )
      {
	threw = (e.code == rtneon_errc::CONNECTION_ERROR);
      }
    assert( threw );
    assert( cs.state() == control_state::DISCONNECTED );
    assert( !cs.status() );
  }

  //////////// commands
  {
    auto dev = std::make_shared<fake_neon_device>();
    dev->calibration = calibration_bytes();
    control_session cs( std::make_shared<fake_control_transport>( dev ), cfg.control );
    event_log log;
    cs.subscribe( [&log]( const status_event& ev ) { log.add( ev ); } );

    cs.connect( ep );
    assert( cs.state() == control_state::LIVE );
    assert( cs.status() );
    assert( cs.status()->phone.battery_level == 87 );
    assert( log.count( status_event_type::SNAPSHOT, true ) == 1 );

    //recording start is confirmed through status before it resolves
    auto r = cs.send_command( device_command::recording_start() ).get();
    assert( r.ok() );
    assert( r.result["id"] == "rec-1" );
    assert( cs.status()->rec_state == recording_state::RECORDING );
    assert( cs.status()->recording->id == "rec-1" );

    r = cs.send_command( device_command::recording_start() ).get();
    assert( r.code == rtneon_errc::REJECTED );
    assert( r.message == "Already recording!" );

    //stop resolves only once the device is idle again
    r = cs.send_command( device_command::recording_stop_and_save() ).get();
    assert( r.ok() );
    assert( cs.status()->rec_state == recording_state::IDLE );
    assert( cs.status()->last_recording->action == "SAVE" );
    assert( log.saw_rec_state( recording_state::SAVING ) );

    r = cs.send_command( device_command::recording_cancel() ).get();
    assert( r.code == rtneon_errc::REJECTED );

    assert( cs.send_command( device_command::recording_start() ).get().ok() );
    r = cs.send_command( device_command::recording_cancel() ).get();
    assert( r.ok() );
    assert( cs.status()->last_recording->action == "DISCARD" );
    assert( cs.status()->last_recording->id == "rec-2" );

    //events
    r = cs.send_command( device_command::event_send( "trial.begin", 12345 ) ).get();
    assert( r.ok() );
    assert( r.result["name"] == "trial.begin" );
    assert( r.result["timestamp"] == 12345 );
    assert( cs.wait_status( []( const device_status& s ) { return s.last_event_name == "trial.begin"; }, 2.0 ) );

    r = cs.send_command( device_command::event_send( "no.ts" ) ).get();
    assert( r.ok() && r.result["timestamp"].get<int64_t>() > 0 );

    //templates
    r = cs.send_command( device_command::template_get() ).get();
    assert( r.ok() );
    assert( r.result["template"]["id"] == "tmpl-1" );
    assert( r.result["data"]["q1"][0] == "S01" );

    r = cs.send_command( device_command::template_set( { {"q1", json::array( { "S02" } )} } ) ).get();
    assert( r.ok() );
    assert( r.result["q1"][0] == "S02" );

    //calibration comes back as raw bytes
    r = cs.send_command( device_command::calibration_get() ).get();
    assert( r.ok() );
    assert( r.binary == dev->calibration );

    //status.get publishes a fresh snapshot
    const size_t fresh = log.count( status_event_type::SNAPSHOT, true );
    r = cs.send_command( device_command::status_get() ).get();
    assert( r.ok() );
    assert( log.count( status_event_type::SNAPSHOT, true ) == fresh + 1 );

    //commands run in submission order, ids increase
    const size_t before = dev->get_requests().size();
    std::vector<std::future<command_result>> futs;
    for( const char* n : { "a", "b", "c", "d" } )
      {
	futs.push_back( cs.send_command( device_command::event_send( n ) ) );
      }
    uint64_t lastid=0;
    for( auto& f : futs )
      {
	auto res = f.get();
	assert( res.ok() );
	assert( res.request_id > lastid );
	lastid = res.request_id;
      }
    auto reqs = dev->get_requests();
    assert( reqs.size() == before + 4 );
    for( size_t i=before; i<reqs.size(); ++i )
      {
	assert( reqs[i] == "POST /api/event" );
      }

    //pushes update the cache
    dev->push( { {"model", "Phone"}, {"data", { {"battery_level", 42} }} } );
    assert( cs.wait_status( []( const device_status& s ) { return s.phone.battery_level == 42; }, 2.0 ) );

    cs.close();
    cs.close();
    assert( cs.state() == control_state::CLOSED );
    r = cs.send_command( device_command::status_get() ).get();
    assert( r.code == rtneon_errc::CLOSED );

    bool threw=false;
    try
      {
	cs.connect( ep );
      }
    catch( const device_error& e )
      {
	threw = (e.code == rtneon_errc::CLOSED);
      }
    assert( threw );
  }

  //////////// dropped channel, reconnect, fresh snapshot
  {
    auto dev = std::make_shared<fake_neon_device>();
    control_session cs( std::make_shared<fake_control_transport>( dev ), cfg.control );
    event_log log;
    cs.subscribe( [&log]( const status_event& ev ) { log.add( ev ); } );
    cs.connect( ep );
    assert( dev->num_opens() == 1 );

    dev->drop( true );
    assert( wait_until( [&]() { return log.count( status_event_type::DISCONNECTED ) == 1; }, 2.0 ) );
    assert( cs.state() != control_state::LIVE );
    //the last known status stays readable
    assert( cs.status() && cs.status()->phone.battery_level == 87 );

    auto r = cs.send_command( device_command::recording_start() ).get();
    assert( r.code == rtneon_errc::NOT_CONNECTED );
    assert( !dev->is_recording() );

    //the device changed while we were away; the reconnect snapshot carries it
    {
      const std::lock_guard<std::mutex> lock(dev->mu);
      dev->phone["battery_level"] = 50;
    }
    dev->set_reachable( true );
    assert( wait_until( [&]() { return cs.state() == control_state::LIVE; }, 3.0 ) );
    assert( log.count( status_event_type::SNAPSHOT, true ) == 2 );
    assert( cs.status()->phone.battery_level == 50 );
    assert( dev->num_opens() >= 2 );

    assert( cs.send_command( device_command::recording_start() ).get().ok() );
    cs.close();
  }

  //////////// a link that goes silent is dropped and re-established
  {
    auto dev = std::make_shared<fake_neon_device>();
    control_config cc = cfg.control;
    cc.liveness_timeout_sec = 0.2;
    control_session cs( std::make_shared<fake_control_transport>( dev ), cc );
    event_log log;
    cs.subscribe( [&log]( const status_event& ev ) { log.add( ev ); } );
    cs.connect( ep );

    dev->set_silent( true );
    assert( wait_until( [&]() { return log.count( status_event_type::DISCONNECTED ) == 1; }, 3.0 ) );
    assert( cs.state() != control_state::LIVE );

    dev->set_silent( false );
    assert( wait_until( [&]() { return cs.state() == control_state::LIVE; }, 3.0 ) );
    assert( dev->num_opens() >= 2 );
    cs.close();
  }

  //////////// a quiet but healthy link stays live
  {
    auto dev = std::make_shared<fake_neon_device>();
    control_config cc = cfg.control;
    cc.liveness_timeout_sec = 0.1;
    control_session cs( std::make_shared<fake_control_transport>( dev ), cc );
    event_log log;
    cs.subscribe( [&log]( const status_event& ev ) { log.add( ev ); } );
    cs.connect( ep );
    std::this_thread::sleep_for( std::chrono::milliseconds(500) );
    assert( cs.state() == control_state::LIVE );
    assert( log.count( status_event_type::DISCONNECTED ) == 0 );
    assert( dev->num_opens() == 1 );

    size_t pulls=0;
    for( auto& r : dev->get_requests() )
      {
	if( r == "GET /api/status" ) { ++pulls; }
      }
    assert( pulls >= 3 );
    cs.close();
  }

  //////////// close while connect is still opening
  {
    auto dev = std::make_shared<fake_neon_device>();
    dev->open_delay_sec = 0.3;
    auto cs = std::make_shared<control_session>( std::make_shared<fake_control_transport>( dev ), cfg.control );
    rtneon_errc code = rtneon_errc::OK;
    std::thread connector( [&]() {
			     try
			       {
				 cs->connect( ep );
			       }
			     catch( const device_error& e )
			       {
				 code = e.code;
			       }
			   } );
    std::this_thread::sleep_for( std::chrono::milliseconds(50) );
    cs->close();
    connector.join();
    assert( code == rtneon_errc::CLOSED );
    assert( cs->state() == control_state::CLOSED );
    assert( cs->send_command( device_command::status_get() ).get().code == rtneon_errc::CLOSED );
    cs.reset();
  }

  //////////// unconfirmed commands time out
  {
    auto dev = std::make_shared<fake_neon_device>();
    dev->confirms = false;
    control_config cc = cfg.control;
    cc.command_timeout_sec = 0.3;
    control_session cs( std::make_shared<fake_control_transport>( dev ), cc );
    cs.connect( ep );

    auto r = cs.send_command( device_command::recording_start() ).get();
    assert( r.code == rtneon_errc::TIMEOUT );
    assert( dev->is_recording() );
    cs.close();
  }

  //////////// close resolves everything still pending
  {
    auto dev = std::make_shared<fake_neon_device>();
    dev->confirms = false;
    control_config cc = cfg.control;
    cc.command_timeout_sec = 10.0;
    control_session cs( std::make_shared<fake_control_transport>( dev ), cc );
    cs.connect( ep );

    auto f1 = cs.send_command( device_command::recording_start() );
    auto f2 = cs.send_command( device_command::event_send( "late" ) );
    std::this_thread::sleep_for( std::chrono::milliseconds(100) );

    Timer t;
    cs.close();
    assert( t.elapsed() < 2.0 );
    assert( f1.get().code == rtneon_errc::CLOSED );
    assert( f2.get().code == rtneon_errc::CLOSED );
  }

  std::puts("control_session: ALL TESTS PASSED");
  return 0;
}
