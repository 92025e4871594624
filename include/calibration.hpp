#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <boost/crc.hpp>

#include <rtneon_errors.hpp>

//REV: /calibration.bin is a packed little-endian record:
// u1 version, 6 bytes serial,
// then for scene, right eye, left eye camera: 3x3 f8 camera matrix, 8 f8 distortion, 4x4 f8 extrinsics,
// then u4 crc32 over everything before it.

const size_t CALIBRATION_BLOB_SIZE = 1 + 6 + 3 * (9 + 8 + 16) * 8 + 4;

struct camera_calibration
{
  cv::Matx33d camera_matrix;
  std::vector<double> distortion;
  cv::Matx44d extrinsics;
};

struct device_calibration
{
  uint8_t version=0;
  std::string serial;

  camera_calibration scene;
  camera_calibration right_eye;
  camera_calibration left_eye;

  uint32_t crc=0;
  bool crc_ok=false;
};

inline double read_le_f64( const uint8_t* p )
{
  uint64_t u=0;
  for( int i=7; i>=0; --i )
    {
      u = (u << 8) | (uint64_t)p[i];
    }
  double d=0;
  std::memcpy( &d, &u, sizeof(d) );
  return d;
}

inline uint32_t read_le_u32( const uint8_t* p )
{
  return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

inline const uint8_t* _parse_camera( const uint8_t* p, camera_calibration& cam )
{
  for( int r=0; r<3; ++r )
    {
      for( int c=0; c<3; ++c )
	{
	  cam.camera_matrix(r,c) = read_le_f64(p);
	  p += 8;
	}
    }

  cam.distortion.resize(8);
  for( size_t i=0; i<8; ++i )
    {
      cam.distortion[i] = read_le_f64(p);
      p += 8;
    }

  for( int r=0; r<4; ++r )
    {
      for( int c=0; c<4; ++c )
	{
	  cam.extrinsics(r,c) = read_le_f64(p);
	  p += 8;
	}
    }
  return p;
}

//Throws device_error(protocol_error) on a truncated blob. A crc mismatch is reported, not thrown.
inline device_calibration parse_calibration( const std::vector<uint8_t>& blob )
{
  if( blob.size() < CALIBRATION_BLOB_SIZE )
    {
      throw device_error( rtneon_errc::PROTOCOL_ERROR, "calibration blob too short (" + std::to_string(blob.size()) + " bytes)" );
    }

  device_calibration cal;
  const uint8_t* p = blob.data();
  cal.version = p[0];
  p += 1;

  size_t seriallen=0;
  while( seriallen < 6 && p[seriallen] != 0 )
    {
      ++seriallen;
    }
  cal.serial = std::string( (const char*)p, seriallen );
  p += 6;

  p = _parse_camera( p, cal.scene );
  p = _parse_camera( p, cal.right_eye );
  p = _parse_camera( p, cal.left_eye );

  cal.crc = read_le_u32( p );

  boost::crc_32_type crc;
  crc.process_bytes( blob.data(), CALIBRATION_BLOB_SIZE - 4 );
  cal.crc_ok = (crc.checksum() == cal.crc);

  if( !cal.crc_ok )
    {
      fprintf(stderr, "CALIBRATION: crc mismatch for serial [%s] (got %08x expected %08x)\n", cal.serial.c_str(), cal.crc, (uint32_t)crc.checksum());
    }
  return cal;
}
