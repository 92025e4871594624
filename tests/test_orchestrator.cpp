//session_orchestrator against a scripted device: open streams track (requested & connected),
// control loss tears streams down until a fresh snapshot, audio shares the scene transport, clock probing.

#include <cassert>
#include <cstdio>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <thread>

#include <utility>

#include <boost/asio.hpp>

#include <fake_device.hpp>

struct session_log
{
  std::mutex mu;
  std::map<session_event_type, size_t> counts;
  std::map<sensor_kind, size_t> samples;
  std::vector<sample_ptr> last;
  std::vector<session_event_type> order;

  void add( const session_event& ev )
  {
    const std::lock_guard<std::mutex> lock(mu);
    ++counts[ev.type];
    order.push_back( ev.type );
    if( ev.type == session_event_type::SAMPLE )
      {
	assert( ev.kind && ev.sample && *ev.kind == ev.sample->kind );
	++samples[*ev.kind];
	last.push_back( ev.sample );
	if( last.size() > 16 ) { last.erase( last.begin() ); }
      }
  }

  size_t count( const session_event_type t )
  {
    const std::lock_guard<std::mutex> lock(mu);
    return counts[t];
  }

  size_t nsamples( const sensor_kind k )
  {
    const std::lock_guard<std::mutex> lock(mu);
    return samples[k];
  }

  sample_ptr newest()
  {
    const std::lock_guard<std::mutex> lock(mu);
    return last.empty() ? nullptr : last.back();
  }

  //No sample between a DISCONNECTED and the STATUS that follows it.
  bool quiet_while_disconnected()
  {
    const std::lock_guard<std::mutex> lock(mu);
    bool away=false;
    for( auto t : order )
      {
	if( t == session_event_type::DISCONNECTED ) { away = true; }
	else if( t == session_event_type::STATUS ) { away = false; }
	else if( t == session_event_type::SAMPLE && away ) { return false; }
      }
    return true;
  }

  void reset_samples()
  {
    const std::lock_guard<std::mutex> lock(mu);
    samples.clear();
    last.clear();
  }
};

//io_context first so it outlives the orchestrator's strand.
struct rig
{
  boost::asio::io_context ioc;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
  std::thread iothread;

  std::shared_ptr<fake_neon_device> dev;
  std::shared_ptr<fake_transport_provider> prov;
  std::shared_ptr<fake_echo_source> echo;
  session_log log;
  std::unique_ptr<session_orchestrator> orch;

  rig()
    : work(boost::asio::make_work_guard(ioc)),
      dev(std::make_shared<fake_neon_device>()),
      prov(std::make_shared<fake_transport_provider>()),
      echo(std::make_shared<fake_echo_source>( 5000 ))
  {
    iothread = std::thread( [this]() { ioc.run(); } );
    orch = std::make_unique<session_orchestrator>( ioc, fast_test_config(), fake_dependencies( dev, prov, echo ) );
    orch->subscribe( [this]( const session_event& ev ) { log.add( ev ); } );
    prov->start_feeding();
  }

  ~rig()
  {
    orch->close();
    prov->stop_feeding();
    work.reset();
    ioc.stop();
    JOIN( iothread );
  }
};

static const std::map<sensor_kind, std::string> SENSOR_OF =
  { { sensor_kind::GAZE, "gaze" }, { sensor_kind::SCENE, "world" }, { sensor_kind::EYE_LEFT, "eyes" },
    { sensor_kind::EYE_RIGHT, "eyes" }, { sensor_kind::IMU, "imu" }, { sensor_kind::EYE_EVENTS, "eye_events" },
    { sensor_kind::AUDIO, "world" } };

int main()
{
  const device_endpoint ep( "10.0.0.2" );

  //////////// before connect, connect errors
  {
    rig r;
    auto res = r.orch->send_command( device_command::status_get() ).get();
    assert( res.code == rtneon_errc::NOT_CONNECTED );
    assert( !r.orch->status() );

    r.dev->set_reachable( false );
    bool threw=false;
    try
      {
	r.orch->connect( ep );
      }
    catch( const device_error& e )
      {
	threw = (e.code == rtneon_errc::CONNECTION_ERROR);
      }
    assert( threw );

    //a failed connect can be retried
    r.dev->set_reachable( true );
    r.orch->connect( ep );
    assert( r.orch->status() );
    assert( r.orch->device_id() == ep.identity() );

    threw=false;
    try
      {
	r.orch->connect( ep );
      }
    catch( const device_error& e )
      {
	threw = (e.code == rtneon_errc::REJECTED);
      }
    assert( threw );
    assert( wait_until( [&]() { return r.log.count( session_event_type::STATUS ) >= 1; }, 2.0 ) );

    r.orch->close();
    r.orch->close();
    res = r.orch->send_command( device_command::status_get() ).get();
    assert( res.code == rtneon_errc::CLOSED );
  }

  //////////// requested sensors stream, released ones stop
  {
    rig r;
    r.orch->request_sensor( sensor_kind::GAZE );
    r.orch->request_sensor( sensor_kind::GAZE );
    //requests before connect take effect once status is known
    assert( r.orch->active_sensors().empty() );
    r.orch->connect( ep );

    assert( wait_until( [&]() { return r.log.nsamples( sensor_kind::GAZE ) >= 10; }, 3.0 ) );
    assert( r.orch->active_sensors() == std::set<sensor_kind>( { sensor_kind::GAZE } ) );
    assert( r.log.nsamples( sensor_kind::SCENE ) == 0 );
    auto s = r.log.newest();
    assert( s && s->device_id == ep.identity() );
    assert( r.log.count( session_event_type::STREAM_STATE ) >= 2 );

    r.orch->release_sensor( sensor_kind::GAZE );
    assert( wait_until( [&]() { return r.orch->active_sensors().empty(); }, 3.0 ) );
    r.log.reset_samples();
    std::this_thread::sleep_for( std::chrono::milliseconds(200) );
    assert( r.log.nsamples( sensor_kind::GAZE ) == 0 );
  }

  //////////// audio alone rides on the world session, and shares it with the scene
  {
    rig r;
    r.orch->connect( ep );
    const std::string world = fake_sensor_url( "world" );
    r.orch->request_sensor( sensor_kind::AUDIO );
    assert( wait_until( [&]() { return r.log.nsamples( sensor_kind::AUDIO ) >= 10; }, 3.0 ) );
    assert( r.log.nsamples( sensor_kind::SCENE ) == 0 );
    auto s = r.log.newest();
    assert( s && s->audio() );

    r.orch->request_sensor( sensor_kind::SCENE );
    assert( wait_until( [&]() { return r.log.nsamples( sensor_kind::SCENE ) >= 10; }, 3.0 ) );
    assert( r.prov->num_creations( world ) == 1 );
    assert( r.prov->num_acquisitions( world ) == 2 );
    assert( r.prov->open_urls() == std::set<std::string>( { world } ) );
  }

  //////////// streams follow (requested & connected) through random changes
  {
    rig r;
    r.orch->connect( ep );
    std::mt19937 rng( 1234 );
    const std::vector<sensor_kind> kinds = { sensor_kind::GAZE, sensor_kind::SCENE, sensor_kind::EYE_LEFT,
					     sensor_kind::IMU, sensor_kind::EYE_EVENTS, sensor_kind::AUDIO };
    const std::vector<std::string> sensors = { "gaze", "world", "eyes", "imu", "eye_events" };
    std::set<sensor_kind> requested;
    std::map<std::string, bool> connected;
    for( auto& n : sensors ) { connected[n] = true; }

    for( int step=0; step<25; ++step )
      {
	if( rng() % 2 == 0 )
	  {
	    auto k = kinds[ rng() % kinds.size() ];
	    if( requested.count(k) ) { requested.erase(k); r.orch->release_sensor(k); }
	    else { requested.insert(k); r.orch->request_sensor(k); }
	  }
	else
	  {
	    auto n = sensors[ rng() % sensors.size() ];
	    connected[n] = !connected[n];
	    r.dev->set_sensor_connected( n, connected[n] );
	  }

	std::set<sensor_kind> expected;
	for( auto k : requested )
	  {
	    if( connected[ SENSOR_OF.at(k) ] ) { expected.insert(k); }
	  }
	assert( wait_until( [&]() { return r.orch->active_sensors() == expected; }, 3.0 ) );
	assert( r.orch->desired_sensors() == requested );
      }
  }

  //////////// control loss closes every stream until a fresh snapshot
  {
    rig r;
    r.orch->connect( ep );
    r.orch->request_sensor( sensor_kind::GAZE );
    r.orch->request_sensor( sensor_kind::IMU );
    assert( wait_until( [&]() { return r.orch->active_sensors().size() == 2; }, 3.0 ) );

    r.dev->drop( true );
    assert( wait_until( [&]() { return r.log.count( session_event_type::DISCONNECTED ) == 1; }, 3.0 ) );
    assert( wait_until( [&]() { return r.orch->active_sensors().empty(); }, 3.0 ) );
    //still wanted
    assert( r.orch->desired_sensors().size() == 2 );

    //while we were away imu went offline
    {
      const std::lock_guard<std::mutex> lock(r.dev->mu);
      r.dev->sensors["imu"] = fake_neon_device::_sensor_json( "imu", false );
    }
    r.dev->set_reachable( true );
    assert( wait_until( [&]() { return r.orch->active_sensors() == std::set<sensor_kind>( { sensor_kind::GAZE } ); }, 3.0 ) );
    r.log.reset_samples();
    assert( wait_until( [&]() { return r.log.nsamples( sensor_kind::GAZE ) >= 5; }, 3.0 ) );
    assert( r.log.quiet_while_disconnected() );
  }

  //////////// a stream stuck opening holds up neither the strand nor the other streams
  {
    rig r;
    const std::string world = fake_sensor_url( "world" );
    r.prov->set_open_delay( world, 3.0, false );
    r.orch->connect( ep );
    r.orch->request_sensor( sensor_kind::GAZE );
    r.orch->request_sensor( sensor_kind::SCENE );
    assert( wait_until( [&]() { return r.log.nsamples( sensor_kind::GAZE ) >= 5; }, 3.0 ) );
    assert( wait_until( [&]() { return r.prov->num_acquisitions( world ) == 1; }, 2.0 ) );

    Timer t;
    r.orch->release_sensor( sensor_kind::SCENE );
    assert( wait_until( [&]() { return r.orch->active_sensors() == std::set<sensor_kind>( { sensor_kind::GAZE } ); }, 1.0 ) );
    r.log.reset_samples();
    assert( wait_until( [&]() { return r.log.nsamples( sensor_kind::GAZE ) >= 20; }, 1.0 ) );
    r.orch->request_sensor( sensor_kind::IMU );
    assert( wait_until( [&]() { return r.log.nsamples( sensor_kind::IMU ) >= 5; }, 1.0 ) );
    assert( t.elapsed() < 2.5 );
    assert( r.log.nsamples( sensor_kind::SCENE ) == 0 );
  }

  //////////// close while connect is still opening the control channel
  {
    rig r;
    r.dev->open_delay_sec = 0.3;
    rtneon_errc code = rtneon_errc::OK;
    std::thread connector( [&]() {
			     try
			       {
				 r.orch->connect( ep );
			       }
			     catch( const device_error& e )
			       {
				 code = e.code;
			       }
			   } );
    std::this_thread::sleep_for( std::chrono::milliseconds(50) );
    r.orch->close();
    connector.join();
    assert( code == rtneon_errc::CLOSED );
    assert( r.orch->send_command( device_command::status_get() ).get().code == rtneon_errc::CLOSED );
  }

  //////////// clock probing starts once the device advertises its echo port
  {
    rig r;
    r.orch->connect( ep );
    assert( !r.orch->clock_estimator()->has_estimate() );
    r.dev->set_time_echo_port( 12321 );
    assert( wait_until( [&]() { return r.orch->clock_estimator()->has_estimate(); }, 3.0 ) );
    assert( r.orch->clock_estimator()->get().estimate_ns == 5000LL * 1000000LL );

    r.orch->request_sensor( sensor_kind::GAZE );
    assert( wait_until( [&]() { return r.log.nsamples( sensor_kind::GAZE ) >= 1; }, 3.0 ) );
    auto s = r.log.newest();
    assert( s->local_ts_ns == s->device_ts_ns - 5000LL * 1000000LL );

    //same port again does not restart probing
    const int probes = r.echo->nprobes;
    r.dev->push( { {"model", "Phone"}, {"data", { {"battery_level", 10} }} } );
    assert( r.orch->wait_status( []( const device_status& st ) { return st.phone.battery_level == 10; }, 2.0 ) );
    std::this_thread::sleep_for( std::chrono::milliseconds(100) );
    assert( r.echo->nprobes == probes );
  }

  //////////// nothing is delivered after close
  {
    rig r;
    r.orch->connect( ep );
    r.orch->request_sensor( sensor_kind::GAZE );
    assert( wait_until( [&]() { return r.log.nsamples( sensor_kind::GAZE ) >= 1; }, 3.0 ) );
    r.orch->close();
    assert( r.orch->active_sensors().empty() );
    std::this_thread::sleep_for( std::chrono::milliseconds(50) );
    const size_t n = r.log.nsamples( sensor_kind::GAZE );
    std::this_thread::sleep_for( std::chrono::milliseconds(200) );
    assert( r.log.nsamples( sensor_kind::GAZE ) == n );
  }

  std::puts("orchestrator: ALL TESTS PASSED");
  return 0;
}
