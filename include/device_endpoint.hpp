#pragma once

#include <map>
#include <optional>
#include <string>

#include <rtneon_defines.hpp>
#include <utilities.hpp>

//A resolved device. Immutable once built by discovery (or by hand, for a known address).
struct device_endpoint
{
  std::string host;
  int control_port=RTNEON_DEFAULT_API_PORT;

  std::string device_name;
  std::string device_id;
  std::string service_name;

  //TXT key/values from the advertisement, opaque to us.
  std::map<std::string,std::string> capabilities;

  device_endpoint()
  { }

  device_endpoint( const std::string& _host, const int _port=RTNEON_DEFAULT_API_PORT )
    : host(_host), control_port(_port)
  { }

  //device_id when advertised, otherwise host:port
  std::string identity() const
  {
    if( !device_id.empty() )
      {
	return device_id;
      }
    return host + ":" + std::to_string(control_port);
  }

  std::string port_str() const
  {
    return std::to_string(control_port);
  }

  std::string tostr() const
  {
    return "[" + device_name + "] id=[" + device_id + "] at " + host + ":" + port_str();
  }

  bool operator==( const device_endpoint& rhs ) const
  {
    return identity() == rhs.identity() && host == rhs.host && control_port == rhs.control_port;
  }
};


//REV: instance names look like
// PI monitor:OnePlus 8:b66de52865b67021._http._tcp.local.
// i.e. <prefix>:<device name>:<device id>.<service>
inline std::optional<device_endpoint> endpoint_from_service_name( const std::string& instance_name, const std::string& host, const int port,
								  const std::string& prefix=RTNEON_MDNS_NAME_PREFIX )
{
  if( !strstartswith( instance_name, prefix + ":" ) )
    {
      return std::nullopt;
    }

  std::string rest = instance_name.substr( prefix.size() + 1 );
  auto lastcolon = rest.rfind(':');
  if( lastcolon == std::string::npos )
    {
      return std::nullopt;
    }

  device_endpoint ep( host, port );
  ep.service_name = instance_name;
  ep.device_name = rest.substr( 0, lastcolon );

  std::string idpart = rest.substr( lastcolon + 1 );
  auto dot = idpart.find('.');
  ep.device_id = (dot == std::string::npos) ? idpart : idpart.substr(0, dot);

  if( ep.device_id.empty() || host.empty() )
    {
      return std::nullopt;
    }
  return ep;
}
