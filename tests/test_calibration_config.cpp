//calibration.bin parsing (layout, crc) and session config loading.

#include <cassert>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#include <boost/crc.hpp>

#include <calibration.hpp>
#include <session_config.hpp>

static void put_le_f64( std::vector<uint8_t>& v, const double d )
{
  uint64_t u=0;
  std::memcpy( &u, &d, sizeof(u) );
  for( int i=0; i<8; ++i )
    {
      v.push_back( (uint8_t)((u >> (8*i)) & 0xff) );
    }
}

//Camera n has matrix entries n*100 + i, distortion n*10 + i, extrinsics n*1000 + i.
static void put_camera( std::vector<uint8_t>& v, const int n )
{
  for( int i=0; i<9; ++i ) { put_le_f64( v, n*100 + i ); }
  for( int i=0; i<8; ++i ) { put_le_f64( v, n*10 + i ); }
  for( int i=0; i<16; ++i ) { put_le_f64( v, n*1000 + i ); }
}

static std::vector<uint8_t> make_blob()
{
  std::vector<uint8_t> v;
  v.push_back( 1 );
  for( char c : std::string("ABC123") )
    {
      v.push_back( (uint8_t)c );
    }
  put_camera( v, 1 );
  put_camera( v, 2 );
  put_camera( v, 3 );

  boost::crc_32_type crc;
  crc.process_bytes( v.data(), v.size() );
  const uint32_t c = crc.checksum();
  for( int i=0; i<4; ++i )
    {
      v.push_back( (uint8_t)((c >> (8*i)) & 0xff) );
    }
  return v;
}

int main()
{
  //////////// calibration layout
  {
    auto blob = make_blob();
    assert( blob.size() == CALIBRATION_BLOB_SIZE );
    assert( blob.size() == 803 );

    auto cal = parse_calibration( blob );
    assert( cal.version == 1 );
    assert( cal.serial == "ABC123" );
    assert( cal.crc_ok );

    assert( cal.scene.camera_matrix(0,0) == 100 );
    assert( cal.scene.camera_matrix(2,2) == 108 );
    assert( cal.scene.distortion.size() == 8 );
    assert( cal.scene.distortion[7] == 17 );
    assert( cal.scene.extrinsics(3,3) == 1015 );
    assert( cal.right_eye.camera_matrix(0,1) == 201 );
    assert( cal.left_eye.extrinsics(1,0) == 3004 );
  }

  //////////// corrupted blob is reported, not thrown
  {
    auto blob = make_blob();
    blob[10] ^= 0xff;
    auto cal = parse_calibration( blob );
    assert( !cal.crc_ok );
    assert( cal.serial == "ABC123" );
  }

  //////////// short serial is nul padded
  {
    auto blob = make_blob();
    blob[4] = 0;
    blob[5] = 0;
    blob[6] = 0;
    auto cal = parse_calibration( blob );
    assert( cal.serial == "ABC" );
  }

  //////////// truncated blob
  {
    auto blob = make_blob();
    blob.resize( 100 );
    bool threw=false;
    try
      {
	parse_calibration( blob );
      }
    catch( const device_error& e )
      {
	threw = (e.code == rtneon_errc::PROTOCOL_ERROR);
      }
    assert( threw );
  }

  //////////// config defaults
  {
    session_config c = session_config_from_json( json::object() );
    assert( c.control.command_timeout_sec == RTNEON_COMMAND_TIMEOUT_SEC );
    assert( c.control.liveness_timeout_sec == RTNEON_LIVENESS_TIMEOUT_SEC );
    assert( c.stream.sample_buffer_size == RTNEON_SAMPLE_BUFFER_SIZE );
    assert( c.stream.policy == drop_policy::DROP_OLDEST );
    assert( c.facade.queue_size == RTNEON_FACADE_QUEUE_SIZE );
    assert( c.discovery.name_prefix == RTNEON_MDNS_NAME_PREFIX );
    assert( c.clock.probe_count == RTNEON_CLOCK_PROBE_COUNT );
  }

  //////////// config overrides, unknown keys ignored
  {
    json j = { {"stream", { {"sample_buffer_size", 8}, {"drop_policy", "drop_newest"}, {"stall_timeout_sec", 3.5} }},
	       {"clock", { {"ewma_alpha", 0.5}, {"drift_reset_ns", 1000} }},
	       {"control", { {"backoff_max_sec", 2.0}, {"liveness_timeout_sec", 0} }},
	       {"facade", { {"queue_size", 4} }},
	       {"discovery", { {"requery_interval_sec", 0.5} }},
	       {"whatever", 1} };
    session_config c = session_config_from_json( j );
    assert( c.stream.sample_buffer_size == 8 );
    assert( c.stream.policy == drop_policy::DROP_NEWEST );
    assert( c.stream.stall_timeout_sec == 3.5 );
    assert( c.stream.unit_buffer_size == RTNEON_UNIT_BUFFER_SIZE );
    assert( c.clock.ewma_alpha == 0.5 );
    assert( c.clock.drift_reset_ns == 1000 );
    assert( c.control.backoff_max_sec == 2.0 );
    assert( c.control.liveness_timeout_sec == 0 );
    assert( c.control.backoff_initial_sec == RTNEON_RECONNECT_BACKOFF_INITIAL_SEC );
    assert( c.facade.queue_size == 4 );
    assert( c.discovery.requery_interval_sec == 0.5 );

    //unknown policy keeps the default
    c = session_config_from_json( { {"stream", { {"drop_policy", "block"} }} } );
    assert( c.stream.policy == drop_policy::DROP_OLDEST );
  }

  //////////// wrong types are rejected
  {
    bool threw=false;
    try
      {
	session_config_from_json( { {"stream", { {"sample_buffer_size", "big"} }} } );
      }
    catch( const device_error& e )
      {
	threw = (e.code == rtneon_errc::PROTOCOL_ERROR);
      }
    assert( threw );
  }

  //////////// config files
  {
    const std::string path = "test_calibration_config_session.json";
    {
      std::ofstream ofs( path );
      ofs << "{ \"facade\": { \"queue_size\": 3 } }";
    }
    session_config c = load_session_config( path );
    assert( c.facade.queue_size == 3 );
    std::remove( path.c_str() );

    bool threw=false;
    try
      {
	load_session_config( "does/not/exist.json" );
      }
    catch( const device_error& e )
      {
	threw = (e.code == rtneon_errc::NOT_FOUND);
      }
    assert( threw );
  }

  std::puts("calibration_config: ALL TESTS PASSED");
  return 0;
}
