//Gaze, eye event and IMU payload parsing, and the data stream decoders built on them.

#include <cassert>
#include <cstdio>
#include <string>
#include <vector>

#include <imu_packet.pb.h>

#include <unit_decoder.hpp>
#include <av_unit_decoder.hpp>

static void put_floats( std::vector<uint8_t>& v, const std::vector<float>& fs )
{
  for( auto f : fs )
    {
      uint8_t b[4];
      write_be_f32( b, f );
      v.insert( v.end(), b, b+4 );
    }
}

static void put_i32( std::vector<uint8_t>& v, const int32_t i )
{
  uint8_t b[4];
  write_be_u32( b, (uint32_t)i );
  v.insert( v.end(), b, b+4 );
}

static void put_i64( std::vector<uint8_t>& v, const int64_t i )
{
  uint8_t b[8];
  write_be_u64( b, (uint64_t)i );
  v.insert( v.end(), b, b+8 );
}

static std::vector<uint8_t> gaze_bytes( const float x, const float y, const bool worn )
{
  std::vector<uint8_t> v;
  put_floats( v, { x, y } );
  v.push_back( worn ? 255 : 0 );
  return v;
}

static std::string imu_message( const uint64_t ts, const float gx )
{
  rtneon_pb::ImuPacket pkt;
  pkt.set_tsns( ts );
  pkt.mutable_gyrodata()->set_x( gx );
  pkt.mutable_gyrodata()->set_y( 2.0f );
  pkt.mutable_gyrodata()->set_z( 3.0f );
  pkt.mutable_acceldata()->set_z( 1.0f );
  pkt.mutable_rotvecdata()->set_w( 1.0f );
  std::string s;
  pkt.SerializeToString( &s );
  return s;
}

static transport_unit unit_of( const std::vector<uint8_t>& bytes, const rtneon_time_ns_t ts, const media_type m=media_type::DATA )
{
  transport_unit u;
  u.media = m;
  u.device_ts_ns = ts;
  u.pkt = make_avpacket_from_bytes( bytes.data(), bytes.size() );
  return u;
}

int main()
{
  //////////// gaze, 9 bytes
  {
    auto v = gaze_bytes( 800.5f, 600.25f, true );
    assert( v.size() == GAZE_RECORD_SIZE );
    gaze_datum g;
    assert( parse_gaze_record( v.data(), v.size(), g ) );
    assert( g.x == 800.5f && g.y == 600.25f );
    assert( g.worn );
    assert( !g.right && !g.eye_left && !g.eyelid_left );

    v[8] = 0;
    assert( parse_gaze_record( v.data(), v.size(), g ) );
    assert( !g.worn );
  }

  //////////// gaze, dual monocular
  {
    auto v = gaze_bytes( 10, 20, true );
    put_floats( v, { 30, 40 } );
    assert( v.size() == GAZE_DUAL_RECORD_SIZE );
    gaze_datum g;
    assert( parse_gaze_record( v.data(), v.size(), g ) );
    assert( g.right && g.right->x == 30 && g.right->y == 40 );
    assert( !g.eye_left );
  }

  //////////// gaze, eye state and eyelids
  {
    auto v = gaze_bytes( 1, 2, true );
    put_floats( v, { 4.5f, -30, 10, -35, 0, 0, 1 } );
    put_floats( v, { 4.0f, 30, 10, -35, 0, 1, 0 } );
    assert( v.size() == GAZE_EYESTATE_RECORD_SIZE );
    gaze_datum g;
    assert( parse_gaze_record( v.data(), v.size(), g ) );
    assert( g.eye_left && g.eye_right );
    assert( g.eye_left->pupil_diameter_mm == 4.5f );
    assert( g.eye_left->eyeball_center_mm.x == -30 );
    assert( g.eye_left->optical_axis.z == 1 );
    assert( g.eye_right->pupil_diameter_mm == 4.0f );
    assert( g.eye_right->optical_axis.y == 1 );
    assert( !g.eyelid_left );

    put_floats( v, { 0.5f, -0.5f, 9.0f, 0.25f, -0.25f, 8.0f } );
    assert( v.size() == GAZE_EYELID_RECORD_SIZE );
    assert( parse_gaze_record( v.data(), v.size(), g ) );
    assert( g.eyelid_left && g.eyelid_right );
    assert( g.eyelid_left->aperture_mm == 9.0f );
    assert( g.eyelid_right->angle_top_rad == 0.25f );
  }

  //////////// gaze, bad sizes
  {
    std::vector<uint8_t> v( 12, 0 );
    gaze_datum g;
    assert( !parse_gaze_record( v.data(), v.size(), g ) );
    assert( !parse_gaze_record( nullptr, 9, g ) );
    assert( !parse_gaze_record( v.data(), 0, g ) );
  }

  //////////// eye events
  {
    std::vector<uint8_t> fix;
    put_i32( fix, 1 );
    put_i64( fix, 1000 );
    put_i64( fix, 2000 );
    put_floats( fix, { 1, 2, 3, 4, 5, 6, 7, 8, 9, 10 } );
    assert( fix.size() == EYE_EVENT_FULL_SIZE );
    eye_event_datum ev;
    assert( parse_eye_event_record( fix.data(), fix.size(), ev ) );
    assert( ev.type == eye_event_type::FIXATION );
    assert( ev.start_ns == 1000 && ev.end_ns == 2000 );
    assert( ev.geometry );
    assert( ev.geometry->start_gaze.x == 1 && ev.geometry->end_gaze.y == 4 );
    assert( ev.geometry->mean_gaze.x == 5 );
    assert( ev.geometry->amplitude_pixels == 7 && ev.geometry->amplitude_angle_deg == 8 );
    assert( ev.geometry->max_velocity == 10 );

    //truncated fixation
    assert( !parse_eye_event_record( fix.data(), 40, ev ) );

    std::vector<uint8_t> onset;
    put_i32( onset, 2 );
    put_i64( onset, 5000 );
    assert( parse_eye_event_record( onset.data(), onset.size(), ev ) );
    assert( ev.type == eye_event_type::SACCADE_ONSET );
    assert( ev.start_ns == 5000 && ev.end_ns == 0 );
    assert( !ev.geometry );

    std::vector<uint8_t> blink;
    put_i32( blink, 4 );
    put_i64( blink, 7000 );
    put_i64( blink, 7150 );
    assert( parse_eye_event_record( blink.data(), blink.size(), ev ) );
    assert( ev.type == eye_event_type::BLINK );
    assert( ev.end_ns == 7150 );

    std::vector<uint8_t> unknown;
    put_i32( unknown, 9 );
    put_i64( unknown, 1 );
    assert( !parse_eye_event_record( unknown.data(), unknown.size(), ev ) );
    assert( !parse_eye_event_record( blink.data(), 8, ev ) );
  }

  //////////// imu, size prefixed messages
  {
    std::vector<uint8_t> payload;
    for( int i=0; i<3; ++i )
      {
	auto m = imu_message( 1000 + i, (float)i );
	payload.push_back( (uint8_t)((m.size() >> 8) & 0xff) );
	payload.push_back( (uint8_t)(m.size() & 0xff) );
	payload.insert( payload.end(), m.begin(), m.end() );
      }
    std::vector<decoded_sample> out;
    assert( parse_imu_payload( payload.data(), payload.size(), out ) );
    assert( out.size() == 3 );
    for( int i=0; i<3; ++i )
      {
	assert( out[i].kind == sensor_kind::IMU );
	assert( out[i].device_ts_ns == 1000 + i );
	const imu_datum* d = std::get_if<imu_datum>( &out[i].payload );
	assert( d );
	assert( d->gyro_dps[0] == (float)i && d->gyro_dps[1] == 2.0f );
	assert( d->accel_g[2] == 1.0f );
	assert( d->quaternion[3] == 1.0f );
      }
  }

  //////////// imu, single unprefixed message
  {
    auto m = imu_message( 42, 5.0f );
    std::vector<uint8_t> payload( m.begin(), m.end() );
    std::vector<decoded_sample> out;
    assert( parse_imu_payload( payload.data(), payload.size(), out ) );
    assert( out.size() == 1 );
    assert( out[0].device_ts_ns == 42 );

    std::vector<uint8_t> junk = { 0xff, 0xff, 0xff };
    out.clear();
    assert( !parse_imu_payload( junk.data(), junk.size(), out ) );
    assert( out.empty() );
  }

  //////////// data decoders
  {
    auto gd = make_default_decoder( sensor_kind::GAZE );
    assert( gd );
    std::vector<decoded_sample> out;
    assert( gd->decode( unit_of( gaze_bytes( 3, 4, true ), 777 ), out ) );
    assert( out.size() == 1 );
    assert( out[0].kind == sensor_kind::GAZE );
    assert( out[0].device_ts_ns == 777 );
    assert( std::get_if<gaze_datum>( &out[0].payload )->x == 3 );
    assert( !gd->decode( unit_of( { 1, 2, 3 }, 778 ), out ) );
    assert( out.size() == 1 );

    //imu keeps its own timestamp, not the unit's
    auto id = make_default_decoder( sensor_kind::IMU );
    auto m = imu_message( 123456, 1.0f );
    out.clear();
    assert( id->decode( unit_of( std::vector<uint8_t>( m.begin(), m.end() ), 999 ), out ) );
    assert( out.size() == 1 && out[0].device_ts_ns == 123456 );

    auto ed = make_default_decoder( sensor_kind::EYE_EVENTS );
    std::vector<uint8_t> onset;
    put_i32( onset, 3 );
    put_i64( onset, 55 );
    out.clear();
    assert( ed->decode( unit_of( onset, 56 ), out ) );
    assert( out[0].device_ts_ns == 56 );
    assert( std::get_if<eye_event_datum>( &out[0].payload )->type == eye_event_type::FIXATION_ONSET );
  }

  std::puts("sensor_parsers: ALL TESTS PASSED");
  return 0;
}
