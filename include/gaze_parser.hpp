#pragma once

#include <cstdint>
#include <cstdio>

#include <rtneon_defines.hpp>
#include <sensor_types.hpp>
#include <utilities.hpp>

//Gaze RTP payloads, all fields big endian float32 except the worn byte (255 = worn).
//   9 bytes: x y worn
//  17 bytes: x y worn right_x right_y                              (dual monocular)
//  65 bytes: x y worn + left (pupil, centre xyz, axis xyz) + right (same)
//  89 bytes: 65 byte record + eyelid left (top, bottom, aperture) + eyelid right (same)

const size_t GAZE_RECORD_SIZE = 9;
const size_t GAZE_DUAL_RECORD_SIZE = 17;
const size_t GAZE_EYESTATE_RECORD_SIZE = 65;
const size_t GAZE_EYELID_RECORD_SIZE = 89;

inline const uint8_t* _parse_eye_state( const uint8_t* p, eye_state& e )
{
  e.pupil_diameter_mm = read_be_f32( p );
  e.eyeball_center_mm = cv::Point3f( read_be_f32(p+4), read_be_f32(p+8), read_be_f32(p+12) );
  e.optical_axis = cv::Point3f( read_be_f32(p+16), read_be_f32(p+20), read_be_f32(p+24) );
  return p + 28;
}

inline const uint8_t* _parse_eyelid_state( const uint8_t* p, eyelid_state& e )
{
  e.angle_top_rad = read_be_f32( p );
  e.angle_bottom_rad = read_be_f32( p+4 );
  e.aperture_mm = read_be_f32( p+8 );
  return p + 12;
}

//False for any length the device does not produce.
inline bool parse_gaze_record( const uint8_t* data, const size_t len, gaze_datum& g )
{
  if( !data || (len != GAZE_RECORD_SIZE && len != GAZE_DUAL_RECORD_SIZE &&
		len != GAZE_EYESTATE_RECORD_SIZE && len != GAZE_EYELID_RECORD_SIZE) )
    {
#if RTNEON_DEBUG_LEVEL > 10
      fprintf(stderr, "GAZE: unexpected record size [%lu]\n", (unsigned long)len);
#endif
      return false;
    }

  g = gaze_datum();
  g.x = read_be_f32( data );
  g.y = read_be_f32( data+4 );
  g.worn = (data[8] == 255);

  const uint8_t* p = data + GAZE_RECORD_SIZE;
  if( len == GAZE_DUAL_RECORD_SIZE )
    {
      g.right = cv::Point2f( read_be_f32(p), read_be_f32(p+4) );
      return true;
    }

  if( len >= GAZE_EYESTATE_RECORD_SIZE )
    {
      eye_state l, r;
      p = _parse_eye_state( p, l );
      p = _parse_eye_state( p, r );
      g.eye_left = l;
      g.eye_right = r;
    }

  if( len == GAZE_EYELID_RECORD_SIZE )
    {
      eyelid_state l, r;
      p = _parse_eyelid_state( p, l );
      p = _parse_eyelid_state( p, r );
      g.eyelid_left = l;
      g.eyelid_right = r;
    }
  return true;
}
