#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

inline std::vector<std::string> split_string( const std::string& input, const char delim)
{
  std::vector<std::string> result;
  auto e = input.end();
  auto i = input.begin();
  while (i != e)
    {
      i = std::find_if_not(i, e, [delim](char c) { return c == delim; });
      if (i == e) { break; }
      auto j = std::find(i, e, delim);
      result.emplace_back(i, j);
      i = j;
    }
  return result;
}

inline bool strstartswith( const std::string& mystring, const std::string& probe )
{
  return (mystring.rfind(probe, 0) == 0);
}

//REV: local unix time (system clock), used for all local timestamps
inline int64_t get_unix_time_ns()
{
  return std::chrono::duration_cast<std::chrono::nanoseconds>( std::chrono::system_clock::now().time_since_epoch() ).count();
}

inline int64_t get_unix_time_ms()
{
  return std::chrono::duration_cast<std::chrono::milliseconds>( std::chrono::system_clock::now().time_since_epoch() ).count();
}


//////////// BIG ENDIAN (network order) readers/writers for device records

inline uint32_t read_be_u32( const uint8_t* p )
{
  return ( (uint32_t)p[0] << 24 ) | ( (uint32_t)p[1] << 16 ) | ( (uint32_t)p[2] << 8 ) | (uint32_t)p[3];
}

inline uint64_t read_be_u64( const uint8_t* p )
{
  return ( (uint64_t)read_be_u32(p) << 32 ) | (uint64_t)read_be_u32(p+4);
}

inline int32_t read_be_i32( const uint8_t* p )
{
  return (int32_t)read_be_u32(p);
}

inline int64_t read_be_i64( const uint8_t* p )
{
  return (int64_t)read_be_u64(p);
}

inline float read_be_f32( const uint8_t* p )
{
  uint32_t u = read_be_u32(p);
  float f=0;
  static_assert( sizeof(f) == sizeof(u), "float must be 32 bits" );
  std::memcpy(&f, &u, sizeof(u));
  return f;
}

inline void write_be_u64( uint8_t* p, const uint64_t v )
{
  for( int i=0; i<8; ++i )
    {
      p[i] = (uint8_t)( (v >> (56 - 8*i)) & 0xFF );
    }
}

inline void write_be_u32( uint8_t* p, const uint32_t v )
{
  for( int i=0; i<4; ++i )
    {
      p[i] = (uint8_t)( (v >> (24 - 8*i)) & 0xFF );
    }
}

inline void write_be_f32( uint8_t* p, const float f )
{
  uint32_t u=0;
  std::memcpy(&u, &f, sizeof(u));
  write_be_u32( p, u );
}
