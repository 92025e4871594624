#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <rtneon_defines.hpp>
#include <sensor_types.hpp>
#include <stream_transport.hpp>
#include <gaze_parser.hpp>
#include <eye_events_parser.hpp>
#include <imu_parser.hpp>

//Turns transport units of one sensor kind into decoded samples (device time, not yet translated).
struct unit_decoder
{
  virtual ~unit_decoder()
  { }

  //Called once per (re)connect with the transport the units will come from.
  virtual bool init( const stream_transport& transport, std::string& err ) = 0;

  //False if the unit could not be decoded. A good unit may yield nothing (codec delay) or several samples.
  virtual bool decode( const transport_unit& u, std::vector<decoded_sample>& out ) = 0;
};

typedef std::function<std::unique_ptr<unit_decoder>(const sensor_kind)> decoder_factory;


struct gaze_decoder
  : public unit_decoder
{
  bool init( const stream_transport& transport, std::string& err ) override
  {
    (void)transport;
    (void)err;
    return true;
  }

  bool decode( const transport_unit& u, std::vector<decoded_sample>& out ) override
  {
    gaze_datum g;
    if( !parse_gaze_record( u.data(), u.size(), g ) )
      {
	return false;
      }
    out.push_back( decoded_sample{ sensor_kind::GAZE, u.device_ts_ns, g } );
    return true;
  }
};

struct eye_events_decoder
  : public unit_decoder
{
  bool init( const stream_transport& transport, std::string& err ) override
  {
    (void)transport;
    (void)err;
    return true;
  }

  bool decode( const transport_unit& u, std::vector<decoded_sample>& out ) override
  {
    eye_event_datum ev;
    if( !parse_eye_event_record( u.data(), u.size(), ev ) )
      {
	return false;
      }
    out.push_back( decoded_sample{ sensor_kind::EYE_EVENTS, u.device_ts_ns, ev } );
    return true;
  }
};

//IMU packets carry their own device timestamp, which is used instead of the RTP one.
struct imu_decoder
  : public unit_decoder
{
  bool init( const stream_transport& transport, std::string& err ) override
  {
    (void)transport;
    (void)err;
    return true;
  }

  bool decode( const transport_unit& u, std::vector<decoded_sample>& out ) override
  {
    return parse_imu_payload( u.data(), u.size(), out );
  }
};
