#pragma once

#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include <rtneon_defines.hpp>
#include <rtneon_errors.hpp>
#include <sensor_types.hpp>

using namespace nlohmann;

//Device status as reported by /api/status (full array) and the status websocket (one component per message).
//Snapshots are immutable: applying a component yields a new snapshot with version+1.
//Fields the device adds later are ignored.

enum class recording_state
  {
    IDLE,
    RECORDING,
    SAVING
  };

inline const char* recording_state_str( const recording_state s )
{
  switch( s )
    {
    case recording_state::IDLE: return "idle";
    case recording_state::RECORDING: return "recording";
    case recording_state::SAVING: return "saving";
    }
  return "unknown";
}

//Device-side sensor names
const char* const SENSOR_NAME_GAZE = "gaze";
const char* const SENSOR_NAME_WORLD = "world";
const char* const SENSOR_NAME_EYES = "eyes";
const char* const SENSOR_NAME_IMU = "imu";
const char* const SENSOR_NAME_EYE_EVENTS = "eye_events";
const char* const SENSOR_NAME_AUDIO = "audio";

const char* const CONN_TYPE_DIRECT = "DIRECT";


template <typename T>
T json_value_or( const json& j, const char* key, const T& dflt )
{
  if( j.is_object() && j.contains(key) && !j[key].is_null() )
    {
      try
	{
	  return j[key].get<T>();
	}
      catch( const json::exception& e )
	{
#if RTNEON_DEBUG_LEVEL > 5
	  fprintf(stderr, "STATUS: field [%s] has unexpected type, ignoring (%s)\n", key, e.what());
#endif
	}
    }
  return dflt;
}


struct sensor_descriptor
{
  std::string sensor;
  std::string conn_type;
  bool connected=false;

  std::string protocol;
  std::string ip;
  int port=0;
  std::string params;

  std::string stream_error;

  bool is_direct() const
  {
    return conn_type == CONN_TYPE_DIRECT;
  }

  std::string url() const
  {
    return protocol + "://" + ip + ":" + std::to_string(port) + "/?" + params;
  }

  static sensor_descriptor from_json( const json& d )
  {
    sensor_descriptor s;
    s.sensor = json_value_or<std::string>( d, "sensor", "" );
    s.conn_type = json_value_or<std::string>( d, "conn_type", "" );
    s.connected = json_value_or<bool>( d, "connected", false );
    s.protocol = json_value_or<std::string>( d, "protocol", "rtsp" );
    s.ip = json_value_or<std::string>( d, "ip", "" );
    s.port = json_value_or<int>( d, "port", 0 );
    s.params = json_value_or<std::string>( d, "params", "" );
    //stream_error may be a bool or a string depending on firmware.
    if( d.contains("stream_error") && d["stream_error"].is_string() )
      {
	s.stream_error = d["stream_error"].get<std::string>();
      }
    else if( json_value_or<bool>( d, "stream_error", false ) )
      {
	s.stream_error = "stream error";
      }
    return s;
  }
};

struct phone_info
{
  int battery_level=0;
  std::string battery_state;
  int64_t memory_bytes=0;
  std::string memory_state;
  std::string device_name;
  std::string device_id;
  std::string ip;
  std::optional<int> time_echo_port;
};

struct hardware_info
{
  std::string version;
  std::string glasses_serial;
  std::string world_camera_serial;
  std::string module_serial;
};

struct recording_info
{
  std::string id;
  std::string action;
  std::string message;
  int64_t rec_duration_ns=0;
};


struct device_status;
typedef std::shared_ptr<const device_status> device_status_ptr;

struct device_status
{
  uint64_t version=0;

  recording_state rec_state=recording_state::IDLE;

  //Present while a recording is open (recording or saving).
  std::optional<recording_info> recording;
  std::optional<recording_info> last_recording;

  phone_info phone;
  hardware_info hardware;
  std::vector<sensor_descriptor> sensors;

  std::string active_template_id;

  std::string last_event_name;
  int64_t last_event_ts_ns=0;

  //New snapshot with the component applied, or nullptr if the component is not one we model.
  device_status_ptr apply_component( const json& component ) const
  {
    auto next = std::make_shared<device_status>(*this);
    if( next->_apply( component ) )
      {
	next->version = version + 1;
	return next;
      }
    return nullptr;
  }

  //Builds a full snapshot from the "result" array of /api/status. The owner assigns the version.
  static std::shared_ptr<device_status> from_status_array( const json& arr, const uint64_t _version=0 )
  {
    if( !arr.is_array() )
      {
	throw device_error( rtneon_errc::PROTOCOL_ERROR, "status result is not an array" );
      }
    auto st = std::make_shared<device_status>();
    for( const auto& comp : arr )
      {
	st->_apply( comp );
      }
    st->version = _version;
    return st;
  }

  //Descriptor that backs the given kind, if the device lists it.
  std::optional<sensor_descriptor> sensor_for( const sensor_kind k ) const
  {
    switch( k )
      {
      case sensor_kind::GAZE: return _find_direct( SENSOR_NAME_GAZE );
      case sensor_kind::SCENE: return _find_direct( SENSOR_NAME_WORLD );
      case sensor_kind::EYE_LEFT:
      case sensor_kind::EYE_RIGHT:
	return _find_direct( SENSOR_NAME_EYES );
      case sensor_kind::IMU: return _find_direct( SENSOR_NAME_IMU );
      case sensor_kind::EYE_EVENTS: return _find_direct( SENSOR_NAME_EYE_EVENTS );
      case sensor_kind::AUDIO:
	{
	  //Audio is carried inside the scene (world) session unless the device lists it separately.
	  auto aud = _find_direct( SENSOR_NAME_AUDIO );
	  if( aud && aud->connected )
	    {
	      return aud;
	    }
	  return _find_direct( SENSOR_NAME_WORLD );
	}
      }
    return std::nullopt;
  }

  bool is_connected( const sensor_kind k ) const
  {
    auto d = sensor_for( k );
    return d && d->connected && !d->ip.empty() && d->port > 0;
  }

  std::set<sensor_kind> connected_kinds() const
  {
    std::set<sensor_kind> res;
    for( auto k : ALL_SENSOR_KINDS )
      {
	if( is_connected(k) )
	  {
	    res.insert(k);
	  }
      }
    return res;
  }

  std::string tostr() const
  {
    std::string s = "v" + std::to_string(version) + " rec=" + recording_state_str(rec_state) + " sensors=[";
    for( auto k : connected_kinds() )
      {
	s += std::string(sensor_kind_str(k)) + " ";
      }
    s += "] battery=" + std::to_string(phone.battery_level);
    return s;
  }

private:
  std::optional<sensor_descriptor> _find_direct( const std::string& name ) const
  {
    for( const auto& s : sensors )
      {
	if( s.sensor == name && s.is_direct() )
	  {
	    return s;
	  }
      }
    return std::nullopt;
  }

  bool _apply( const json& component )
  {
    if( !component.is_object() || !component.contains("model") || !component["model"].is_string() )
      {
	return false;
      }
    const std::string model = component["model"].get<std::string>();
    const json data = component.contains("data") ? component["data"] : json::object();
    if( !data.is_object() )
      {
	return false;
      }

    if( model == "Phone" )
      {
	phone.battery_level = json_value_or<int>( data, "battery_level", phone.battery_level );
	phone.battery_state = json_value_or<std::string>( data, "battery_state", phone.battery_state );
	phone.memory_bytes = json_value_or<int64_t>( data, "memory", phone.memory_bytes );
	phone.memory_state = json_value_or<std::string>( data, "memory_state", phone.memory_state );
	phone.device_name = json_value_or<std::string>( data, "device_name", phone.device_name );
	phone.device_id = json_value_or<std::string>( data, "device_id", phone.device_id );
	phone.ip = json_value_or<std::string>( data, "ip", phone.ip );
	if( data.contains("time_echo_port") && data["time_echo_port"].is_number_integer() )
	  {
	    phone.time_echo_port = data["time_echo_port"].get<int>();
	  }
	return true;
      }
    else if( model == "Hardware" )
      {
	hardware.version = json_value_or<std::string>( data, "version", hardware.version );
	hardware.glasses_serial = json_value_or<std::string>( data, "glasses_serial", hardware.glasses_serial );
	hardware.world_camera_serial = json_value_or<std::string>( data, "world_camera_serial", hardware.world_camera_serial );
	hardware.module_serial = json_value_or<std::string>( data, "module_serial", hardware.module_serial );
	return true;
      }
    else if( model == "Sensor" )
      {
	auto s = sensor_descriptor::from_json( data );
	if( s.sensor.empty() )
	  {
	    return false;
	  }
	for( auto& existing : sensors )
	  {
	    if( existing.sensor == s.sensor && existing.conn_type == s.conn_type )
	      {
		existing = s;
		return true;
	      }
	  }
	sensors.push_back( s );
	return true;
      }
    else if( model == "Recording" )
      {
	recording_info r;
	r.id = json_value_or<std::string>( data, "id", "" );
	r.action = json_value_or<std::string>( data, "action", "" );
	r.message = json_value_or<std::string>( data, "message", "" );
	r.rec_duration_ns = json_value_or<int64_t>( data, "rec_duration_ns", 0 );

	if( r.action == "START" )
	  {
	    rec_state = recording_state::RECORDING;
	    recording = r;
	  }
	else if( r.action == "STOP" )
	  {
	    rec_state = recording_state::SAVING;
	    recording = r;
	  }
	else if( r.action == "SAVE" || r.action == "DISCARD" || r.action == "ERROR" )
	  {
	    rec_state = recording_state::IDLE;
	    recording.reset();
	    last_recording = r;
	  }
	else
	  {
	    //e.g. periodic duration updates while recording
	    if( recording && recording->id == r.id )
	      {
		recording->rec_duration_ns = r.rec_duration_ns;
	      }
	  }
	return true;
      }
    else if( model == "Event" )
      {
	last_event_name = json_value_or<std::string>( data, "name", "" );
	last_event_ts_ns = json_value_or<int64_t>( data, "timestamp", 0 );
	return true;
      }
    else if( model == "Template" )
      {
	active_template_id = json_value_or<std::string>( data, "id", active_template_id );
	return true;
      }

#if RTNEON_DEBUG_LEVEL > 10
    fprintf(stdout, "STATUS: ignoring unknown model [%s]\n", model.c_str());
#endif
    return false;
  }
};
