//device_status: snapshots from /api/status, component pushes, recording transitions, sensor lookup.

#include <cassert>
#include <cstdio>

#include <fake_device.hpp>

int main()
{
  fake_neon_device dev;
  const json arr = dev.status_array_locked();

  //////////// full snapshot
  {
    auto st = device_status::from_status_array( arr, 3 );
    assert( st->version == 3 );
    assert( st->phone.battery_level == 87 );
    assert( st->phone.device_name == "OnePlus 8" );
    assert( st->phone.device_id == "b66de52865b67021" );
    assert( st->phone.memory_bytes == 123456789 );
    assert( !st->phone.time_echo_port );
    assert( st->hardware.world_camera_serial == "ABC123" );
    assert( st->hardware.module_serial == "M42" );
    assert( st->rec_state == recording_state::IDLE );
    assert( !st->recording );

    auto g = st->sensor_for( sensor_kind::GAZE );
    assert( g );
    assert( g->url() == fake_sensor_url( "gaze" ) );
    assert( st->is_connected( sensor_kind::GAZE ) );
    assert( st->is_connected( sensor_kind::EYE_LEFT ) );
    assert( st->sensor_for( sensor_kind::EYE_LEFT )->url() == st->sensor_for( sensor_kind::EYE_RIGHT )->url() );

    //no separate audio sensor: audio rides on the world session
    auto a = st->sensor_for( sensor_kind::AUDIO );
    assert( a && a->sensor == "world" );
    assert( st->connected_kinds().size() == ALL_SENSOR_KINDS.size() );
  }

  //////////// a separate, connected audio sensor wins
  {
    auto st = device_status::from_status_array( arr );
    json aud = fake_neon_device::_sensor_json( "audio", true );
    aud["port"] = 8087;
    auto next = st->apply_component( { {"model", "Sensor"}, {"data", aud} } );
    assert( next );
    assert( next->sensor_for( sensor_kind::AUDIO )->port == 8087 );

    aud["connected"] = false;
    next = next->apply_component( { {"model", "Sensor"}, {"data", aud} } );
    assert( next->sensor_for( sensor_kind::AUDIO )->sensor == "world" );
  }

  //////////// pushes produce new snapshots, the old one is untouched
  {
    auto st = device_status::from_status_array( arr, 1 );
    auto next = st->apply_component( { {"model", "Sensor"}, {"data", fake_neon_device::_sensor_json( "gaze", false )} } );
    assert( next );
    assert( next->version == 2 );
    assert( !next->is_connected( sensor_kind::GAZE ) );
    assert( st->is_connected( sensor_kind::GAZE ) );
    assert( next->sensors.size() == st->sensors.size() );

    //a sensor without ip or port is not streamable
    json noport = fake_neon_device::_sensor_json( "imu", true );
    noport["port"] = 0;
    next = next->apply_component( { {"model", "Sensor"}, {"data", noport} } );
    assert( !next->is_connected( sensor_kind::IMU ) );

    //non-direct sensors are never used for streaming
    json ws = fake_neon_device::_sensor_json( "eyes", true );
    ws["conn_type"] = "WEBSOCKET";
    auto n2 = st->apply_component( { {"model", "Sensor"}, {"data", ws} } );
    assert( n2->sensors.size() == st->sensors.size() + 1 );
    assert( n2->sensor_for( sensor_kind::EYE_LEFT )->is_direct() );

    auto phone = st->apply_component( { {"model", "Phone"}, {"data", { {"battery_level", 12}, {"time_echo_port", 12321} }} } );
    assert( phone->phone.battery_level == 12 );
    assert( phone->phone.device_name == "OnePlus 8" );
    assert( phone->phone.time_echo_port && *phone->phone.time_echo_port == 12321 );

    //unknown and malformed components are ignored
    assert( !st->apply_component( { {"model", "Something"}, {"data", json::object()} } ) );
    assert( !st->apply_component( json::array() ) );
    assert( !st->apply_component( { {"model", "Phone"}, {"data", 3} } ) );

    //wrong field types keep the old value
    auto odd = st->apply_component( { {"model", "Phone"}, {"data", { {"battery_level", "lots"} }} } );
    assert( odd && odd->phone.battery_level == 87 );
  }

  //////////// recording transitions
  {
    auto st = device_status::from_status_array( arr );
    auto rec = [&]( device_status_ptr s, const std::string& action ) {
		 return s->apply_component( { {"model", "Recording"}, {"data", { {"id", "r1"}, {"action", action}, {"rec_duration_ns", 5} }} } );
	       };
    auto s1 = rec( st, "START" );
    assert( s1->rec_state == recording_state::RECORDING );
    assert( s1->recording && s1->recording->id == "r1" );

    auto s2 = rec( s1, "STOP" );
    assert( s2->rec_state == recording_state::SAVING );

    auto s3 = rec( s2, "SAVE" );
    assert( s3->rec_state == recording_state::IDLE );
    assert( !s3->recording );
    assert( s3->last_recording && s3->last_recording->action == "SAVE" );

    auto s4 = rec( rec( st, "START" ), "DISCARD" );
    assert( s4->rec_state == recording_state::IDLE );

    auto s5 = rec( rec( st, "START" ), "ERROR" );
    assert( s5->rec_state == recording_state::IDLE );
  }

  //////////// events and templates
  {
    auto st = device_status::from_status_array( arr );
    auto ev = st->apply_component( { {"model", "Event"}, {"data", { {"name", "trial.begin"}, {"timestamp", 99} }} } );
    assert( ev->last_event_name == "trial.begin" && ev->last_event_ts_ns == 99 );
    auto tm = st->apply_component( { {"model", "Template"}, {"data", { {"id", "tmpl-9"} }} } );
    assert( tm->active_template_id == "tmpl-9" );
  }

  //////////// the status result must be an array
  {
    bool threw=false;
    try
      {
	device_status::from_status_array( json::object() );
      }
    catch( const device_error& e )
      {
	threw = (e.code == rtneon_errc::PROTOCOL_ERROR);
      }
    assert( threw );
  }

  std::puts("device_status: ALL TESTS PASSED");
  return 0;
}
