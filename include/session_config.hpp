#pragma once

#include <cstdio>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include <rtneon_defines.hpp>
#include <rtneon_errors.hpp>
#include <mutexed_buffer.hpp>

using namespace nlohmann;

//Runtime tunables. Every member defaults to the compile-time value from rtneon_defines.hpp;
// a json file only needs to name what it overrides. Unknown keys are ignored.

struct clock_config
{
  double probe_interval_sec = RTNEON_CLOCK_PROBE_INTERVAL_SEC;
  double reprobe_interval_sec = RTNEON_CLOCK_REPROBE_INTERVAL_SEC;
  size_t probe_count = RTNEON_CLOCK_PROBE_COUNT;
  double ewma_alpha = RTNEON_CLOCK_EWMA_ALPHA;
  double echo_timeout_sec = RTNEON_CLOCK_ECHO_TIMEOUT_SEC;
  double jitter_threshold_ms = RTNEON_CLOCK_RTT_JITTER_THRESHOLD_MS;
  double assumed_processing_ms = RTNEON_CLOCK_ASSUMED_PROCESSING_MS;
  rtneon_time_ns_t drift_reset_ns = RTNEON_CLOCK_DRIFT_RESET_NS;
};

struct stream_config
{
  size_t sample_buffer_size = RTNEON_SAMPLE_BUFFER_SIZE;
  size_t unit_buffer_size = RTNEON_UNIT_BUFFER_SIZE;
  drop_policy policy = drop_policy::DROP_OLDEST;
  size_t decode_error_threshold = RTNEON_DECODE_ERROR_THRESHOLD;
  double stall_timeout_sec = RTNEON_STREAM_STALL_TIMEOUT_SEC;
  double backoff_initial_sec = RTNEON_STREAM_BACKOFF_INITIAL_SEC;
  double backoff_max_sec = RTNEON_STREAM_BACKOFF_MAX_SEC;
  double open_timeout_sec = RTNEON_RTSP_OPEN_TIMEOUT_SEC;
};

struct control_config
{
  double connect_timeout_sec = RTNEON_CONNECT_TIMEOUT_SEC;
  double command_timeout_sec = RTNEON_COMMAND_TIMEOUT_SEC;
  double backoff_initial_sec = RTNEON_RECONNECT_BACKOFF_INITIAL_SEC;
  double backoff_max_sec = RTNEON_RECONNECT_BACKOFF_MAX_SEC;
  double push_poll_sec = RTNEON_PUSH_POLL_SEC;
  //0 disables the check
  double liveness_timeout_sec = RTNEON_LIVENESS_TIMEOUT_SEC;
};

struct facade_config
{
  size_t queue_size = RTNEON_FACADE_QUEUE_SIZE;
  size_t match_history_size = RTNEON_MATCH_HISTORY_SIZE;
  size_t audio_history_size = RTNEON_AUDIO_MATCH_HISTORY_SIZE;
};

struct discovery_config
{
  std::string service = RTNEON_MDNS_SERVICE;
  std::string name_prefix = RTNEON_MDNS_NAME_PREFIX;
  double requery_interval_sec = 1.0;
  //how long a found device waits for a TXT record sent in a later packet
  double txt_grace_sec = RTNEON_MDNS_TXT_GRACE_SEC;
};

struct session_config
{
  clock_config clock;
  stream_config stream;
  control_config control;
  facade_config facade;
  discovery_config discovery;
};


template <typename T>
void json_get_if( const json& j, const char* key, T& dst )
{
  if( j.is_object() && j.contains(key) && !j[key].is_null() )
    {
      dst = j[key].get<T>();
    }
}

inline void from_json( const json& j, clock_config& c )
{
  json_get_if( j, "probe_interval_sec", c.probe_interval_sec );
  json_get_if( j, "reprobe_interval_sec", c.reprobe_interval_sec );
  json_get_if( j, "probe_count", c.probe_count );
  json_get_if( j, "ewma_alpha", c.ewma_alpha );
  json_get_if( j, "echo_timeout_sec", c.echo_timeout_sec );
  json_get_if( j, "jitter_threshold_ms", c.jitter_threshold_ms );
  json_get_if( j, "assumed_processing_ms", c.assumed_processing_ms );
  json_get_if( j, "drift_reset_ns", c.drift_reset_ns );
}

inline void from_json( const json& j, stream_config& c )
{
  json_get_if( j, "sample_buffer_size", c.sample_buffer_size );
  json_get_if( j, "unit_buffer_size", c.unit_buffer_size );
  json_get_if( j, "decode_error_threshold", c.decode_error_threshold );
  json_get_if( j, "stall_timeout_sec", c.stall_timeout_sec );
  json_get_if( j, "backoff_initial_sec", c.backoff_initial_sec );
  json_get_if( j, "backoff_max_sec", c.backoff_max_sec );
  json_get_if( j, "open_timeout_sec", c.open_timeout_sec );
  if( j.contains("drop_policy") && j["drop_policy"].is_string() )
    {
      std::string p = j["drop_policy"].get<std::string>();
      if( p == "drop_newest" )
	{
	  c.policy = drop_policy::DROP_NEWEST;
	}
      else if( p == "drop_oldest" )
	{
	  c.policy = drop_policy::DROP_OLDEST;
	}
      else
	{
	  fprintf(stderr, "CONFIG: unknown drop_policy [%s], keeping [%s]\n", p.c_str(), drop_policy_str(c.policy));
	}
    }
}

inline void from_json( const json& j, control_config& c )
{
  json_get_if( j, "connect_timeout_sec", c.connect_timeout_sec );
  json_get_if( j, "command_timeout_sec", c.command_timeout_sec );
  json_get_if( j, "backoff_initial_sec", c.backoff_initial_sec );
  json_get_if( j, "backoff_max_sec", c.backoff_max_sec );
  json_get_if( j, "push_poll_sec", c.push_poll_sec );
  json_get_if( j, "liveness_timeout_sec", c.liveness_timeout_sec );
}

inline void from_json( const json& j, facade_config& c )
{
  json_get_if( j, "queue_size", c.queue_size );
  json_get_if( j, "match_history_size", c.match_history_size );
  json_get_if( j, "audio_history_size", c.audio_history_size );
}

inline void from_json( const json& j, discovery_config& c )
{
  json_get_if( j, "service", c.service );
  json_get_if( j, "name_prefix", c.name_prefix );
  json_get_if( j, "requery_interval_sec", c.requery_interval_sec );
  json_get_if( j, "txt_grace_sec", c.txt_grace_sec );
}

inline void from_json( const json& j, session_config& c )
{
  json_get_if( j, "clock", c.clock );
  json_get_if( j, "stream", c.stream );
  json_get_if( j, "control", c.control );
  json_get_if( j, "facade", c.facade );
  json_get_if( j, "discovery", c.discovery );
}

inline session_config session_config_from_json( const json& j )
{
  session_config c;
  try
    {
      ::from_json( j, c );
    }
  catch( const json::exception& e )
    {
      throw device_error( rtneon_errc::PROTOCOL_ERROR, std::string("bad session config: ") + e.what() );
    }
  return c;
}

inline session_config load_session_config( const std::string& path )
{
  std::ifstream ifs( path );
  if( !ifs.is_open() )
    {
      throw device_error( rtneon_errc::NOT_FOUND, "cannot open session config [" + path + "]" );
    }

  json j;
  try
    {
      ifs >> j;
    }
  catch( const json::exception& e )
    {
      throw device_error( rtneon_errc::PROTOCOL_ERROR, "cannot parse session config [" + path + "]: " + e.what() );
    }

#if RTNEON_DEBUG_LEVEL > 0
  fprintf(stdout, "CONFIG: loaded session config from [%s]\n", path.c_str());
#endif
  return session_config_from_json( j );
}
