#pragma once

#include <cstdint>
#include <cstdio>
#include <vector>

#include <imu_packet.pb.h>

#include <rtneon_defines.hpp>
#include <sensor_types.hpp>
#include <utilities.hpp>

//IMU RTP payloads carry one or more rtneon_pb::ImuPacket messages, each prefixed by its size as big endian uint16.
//Older firmware sends a single unprefixed message per payload.

inline void _imu_from_packet( const rtneon_pb::ImuPacket& pkt, decoded_sample& out )
{
  imu_datum d;
  d.gyro_dps = cv::Vec3f( pkt.gyrodata().x(), pkt.gyrodata().y(), pkt.gyrodata().z() );
  d.accel_g = cv::Vec3f( pkt.acceldata().x(), pkt.acceldata().y(), pkt.acceldata().z() );
  d.quaternion = cv::Vec4f( pkt.rotvecdata().x(), pkt.rotvecdata().y(), pkt.rotvecdata().z(), pkt.rotvecdata().w() );
  out.kind = sensor_kind::IMU;
  out.device_ts_ns = (rtneon_time_ns_t)pkt.tsns();
  out.payload = d;
}

//Appends every reading in the payload. False (nothing appended) if the payload is not IMU data.
inline bool parse_imu_payload( const uint8_t* data, const size_t len, std::vector<decoded_sample>& out )
{
  if( !data || len == 0 )
    {
      return false;
    }

  std::vector<decoded_sample> framed;
  size_t off = 0;
  bool good = true;
  while( off < len )
    {
      if( off + 2 > len )
	{
	  good = false;
	  break;
	}
      const size_t sz = ((size_t)data[off] << 8) | (size_t)data[off+1];
      off += 2;
      if( sz == 0 || off + sz > len )
	{
	  good = false;
	  break;
	}
      rtneon_pb::ImuPacket pkt;
      if( !pkt.ParseFromArray( data + off, (int)sz ) )
	{
	  good = false;
	  break;
	}
      decoded_sample s;
      _imu_from_packet( pkt, s );
      framed.push_back( std::move(s) );
      off += sz;
    }

  if( good && !framed.empty() )
    {
      for( auto& s : framed )
	{
	  out.push_back( std::move(s) );
	}
      return true;
    }

  rtneon_pb::ImuPacket pkt;
  if( pkt.ParseFromArray( data, (int)len ) && pkt.has_gyrodata() )
    {
      decoded_sample s;
      _imu_from_packet( pkt, s );
      out.push_back( std::move(s) );
      return true;
    }

#if RTNEON_DEBUG_LEVEL > 10
  fprintf(stderr, "IMU: cannot parse [%lu] byte payload\n", (unsigned long)len);
#endif
  return false;
}
