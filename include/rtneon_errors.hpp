#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace nlohmann;

enum class rtneon_errc
  {
    OK=0,
    NOT_FOUND,
    CONNECTION_ERROR,
    TIMEOUT,
    REJECTED,
    PROTOCOL_ERROR,
    CLOSED,
    NOT_CONNECTED
  };

inline const char* errc_str( const rtneon_errc e )
{
  switch( e )
    {
    case rtneon_errc::OK: return "ok";
    case rtneon_errc::NOT_FOUND: return "not_found";
    case rtneon_errc::CONNECTION_ERROR: return "connection_error";
    case rtneon_errc::TIMEOUT: return "timeout";
    case rtneon_errc::REJECTED: return "rejected";
    case rtneon_errc::PROTOCOL_ERROR: return "protocol_error";
    case rtneon_errc::CLOSED: return "closed";
    case rtneon_errc::NOT_CONNECTED: return "not_connected";
    }
  return "unknown";
}

//Thrown only at the caller-facing surface (connect, blocking facade calls, discovery setup).
struct device_error
  : public std::runtime_error
{
  rtneon_errc code;

  device_error( const rtneon_errc _code, const std::string& msg )
    : std::runtime_error( std::string(errc_str(_code)) + ": " + msg ), code(_code)
  { }
};


//Outcome of one control-channel command. result carries the device's "result" member (json),
// binary carries raw bodies (calibration).
struct command_result
{
  uint64_t request_id=0;
  rtneon_errc code=rtneon_errc::OK;
  std::string message;
  json result;
  std::vector<uint8_t> binary;

  bool ok() const
  {
    return code == rtneon_errc::OK;
  }

  static command_result failure( const uint64_t id, const rtneon_errc c, const std::string& msg )
  {
    command_result r;
    r.request_id = id;
    r.code = c;
    r.message = msg;
    return r;
  }

  //REV: facade helper
  const command_result& throw_if_failed() const
  {
    if( !ok() )
      {
	throw device_error( code, message );
      }
    return *this;
  }
};
