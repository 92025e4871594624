#pragma once

#include <cstdint>
#include <cstdio>

#include <rtneon_defines.hpp>
#include <sensor_types.hpp>
#include <utilities.hpp>

//Eye event RTP payloads, big endian. All start with int32 type and int64 start (device ns).
//  saccade/fixation (0/1): type start end + 10 float32 (start xy, end xy, mean xy, amplitude px, amplitude deg,
//                          mean velocity, max velocity)                                       = 60 bytes
//  onsets (2/3):           type start                                                          = 12 bytes
//  blink (4):              type start end                                                      = 20 bytes

const size_t EYE_EVENT_ONSET_SIZE = 12;
const size_t EYE_EVENT_BLINK_SIZE = 20;
const size_t EYE_EVENT_FULL_SIZE = 60;

inline bool parse_eye_event_record( const uint8_t* data, const size_t len, eye_event_datum& ev )
{
  if( !data || len < EYE_EVENT_ONSET_SIZE )
    {
      return false;
    }

  const int32_t type = read_be_i32( data );
  ev = eye_event_datum();
  ev.start_ns = read_be_i64( data+4 );

  switch( type )
    {
    case 0:
    case 1:
      {
	if( len < EYE_EVENT_FULL_SIZE )
	  {
	    break;
	  }
	ev.type = (eye_event_type)type;
	ev.end_ns = read_be_i64( data+12 );
	const uint8_t* p = data + 20;
	eye_event_geometry geo;
	geo.start_gaze = cv::Point2f( read_be_f32(p), read_be_f32(p+4) );
	geo.end_gaze = cv::Point2f( read_be_f32(p+8), read_be_f32(p+12) );
	geo.mean_gaze = cv::Point2f( read_be_f32(p+16), read_be_f32(p+20) );
	geo.amplitude_pixels = read_be_f32( p+24 );
	geo.amplitude_angle_deg = read_be_f32( p+28 );
	geo.mean_velocity = read_be_f32( p+32 );
	geo.max_velocity = read_be_f32( p+36 );
	ev.geometry = geo;
	return true;
      }
    case 2:
    case 3:
      ev.type = (eye_event_type)type;
      return true;
    case 4:
      {
	if( len < EYE_EVENT_BLINK_SIZE )
	  {
	    break;
	  }
	ev.type = eye_event_type::BLINK;
	ev.end_ns = read_be_i64( data+12 );
	return true;
      }
    default:
      break;
    }

#if RTNEON_DEBUG_LEVEL > 10
  fprintf(stderr, "EYE EVENTS: cannot parse type [%d] from [%lu] bytes\n", type, (unsigned long)len);
#endif
  return false;
}
