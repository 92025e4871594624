#pragma once

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <sys/select.h>
#include <sys/time.h>

#include <mdns.h>
#include <mdns_cpp/utils.hpp>

#include <rtneon_defines.hpp>
#include <rtneon_errors.hpp>
#include <session_config.hpp>
#include <device_endpoint.hpp>
#include <utilities.hpp>
#include <Timer.hpp>

using namespace mdns_cpp;

//One answer from the network, before any filtering.
//  10.42.0.157:5353 : answer PI monitor:OnePlus 8:b66de52865b67021._http._tcp.local. SRV pi.local. priority 0 weight 0 port 8080
struct zeroconf_service_reply_struct
{
  std::string srcaddrport;
  std::string srcaddr;
  std::string name;
  std::string svcname;
  int dstport=0;
  bool ip6=false;
  //false for a TXT-only answer, which carries txt for name and nothing else
  bool has_srv=true;
  std::map<std::string,std::string> txt;

  zeroconf_service_reply_struct()
  { }

  zeroconf_service_reply_struct( const std::string& _srcaddrport, const std::string& _name, const std::string& _svcname, const int _dstport )
    : srcaddrport(_srcaddrport), name(_name), svcname(_svcname), dstport(_dstport)
  {
    //drop everything after the last colon, assuming it is the port
    auto lastcolon = srcaddrport.rfind(':');
    srcaddr = (lastcolon == std::string::npos) ? srcaddrport : srcaddrport.substr( 0, lastcolon );

    //REV: ipv6 source addresses print as [addr]:port, and "::" is legal inside them
    ip6 = (srcaddr.find(':') != std::string::npos);
    if( ip6 && !srcaddr.empty() && srcaddr.front() == '[' && srcaddr.back() == ']' )
      {
	srcaddr = srcaddr.substr( 1, srcaddr.size()-2 );
      }
  }

  std::string tostr() const
  {
    return "SRC ADDR:PORT=" + srcaddrport + "   SRC ADDR=" + srcaddr + "    NAME=" + name + "    svcname=" + svcname + "    DST PORT=" + std::to_string(dstport);
  }
};


//Where advertisements come from. The mDNS source is the real one; tests substitute their own.
struct advertisement_source
{
  virtual ~advertisement_source()
  { }

  //Throws device_error(connection_error) if no socket can be opened.
  virtual void open() = 0;
  virtual void send_query( const std::string& service ) = 0;
  //Waits up to timeout_sec and appends whatever replies arrived. TXT records come as separate has_srv=false replies.
  virtual void poll( const double timeout_sec, std::vector<zeroconf_service_reply_struct>& out ) = 0;
  virtual void close() = 0;
};


struct mdns_query_user_data
{
  std::vector<zeroconf_service_reply_struct>* replies;
};

static int query_callback(int sock, const struct sockaddr *from, size_t addrlen, mdns_entry_type_t entry,
                          uint16_t query_id, uint16_t rtype, uint16_t rclass, uint32_t ttl, const void *data,
                          size_t size, size_t name_offset, size_t name_length, size_t record_offset,
                          size_t record_length, void *user_data)
{
  (void)sizeof(sock);
  (void)sizeof(entry);
  (void)sizeof(query_id);
  (void)sizeof(rclass);
  (void)sizeof(ttl);
  (void)sizeof(name_length);

  char addrbuffer[128]{};
  char namebuffer[512]{};
  char entrybuffer[512]{};

  mdns_query_user_data* ud = (mdns_query_user_data*)(user_data);

  const auto fromaddrstr = ipAddressToString(addrbuffer, sizeof(addrbuffer), from, addrlen);
  mdns_string_t entrystr = mdns_string_extract(data, size, &name_offset, entrybuffer, sizeof(entrybuffer));

  if (rtype == MDNS_RECORDTYPE_SRV)
    {
      mdns_record_srv_t srv =
        mdns_record_parse_srv(data, size, record_offset, record_length, namebuffer, sizeof(namebuffer));

#if RTNEON_DEBUG_LEVEL >= 100
      fprintf(stdout, "%s : %.*s SRV %.*s priority %d weight %d port %d\n", fromaddrstr.c_str(),
	      MDNS_STRING_FORMAT(entrystr), MDNS_STRING_FORMAT(srv.name), srv.priority, srv.weight, srv.port);
#endif
      ud->replies->push_back( zeroconf_service_reply_struct( fromaddrstr, std::string(entrystr.str, entrystr.length), std::string(srv.name.str, srv.name.length), srv.port ) );
    }
  else if (rtype == MDNS_RECORDTYPE_TXT)
    {
      const size_t TXTBUFSIZE=128;
      mdns_record_txt_t txtbuffer[TXTBUFSIZE];
      size_t parsed = mdns_record_parse_txt(data, size, record_offset, record_length, txtbuffer, TXTBUFSIZE);
      zeroconf_service_reply_struct rep( fromaddrstr, std::string(entrystr.str, entrystr.length), "", 0 );
      rep.has_srv = false;
      for (size_t itxt = 0; itxt < parsed; ++itxt)
	{
	  rep.txt[ std::string(txtbuffer[itxt].key.str, txtbuffer[itxt].key.length) ] =
	    std::string(txtbuffer[itxt].value.str, txtbuffer[itxt].value.length);
	}
      ud->replies->push_back( rep );
    }
  return 0;
}


struct mdns_advertisement_source
  : public advertisement_source
{
private:
  std::vector<int> sockets;
  std::vector<int> query_ids;
  std::vector<uint8_t> buffer;

public:
  mdns_advertisement_source()
    : buffer(2048)
  { }

  ~mdns_advertisement_source()
  {
    close();
  }

  void open() override
  {
    close();
    //REV: one ipv4 socket on an ephemeral port, bound to INADDR_ANY. Replies come back unicast.
    int sock = mdns_socket_open_ipv4( NULL );
    if( sock < 0 )
      {
	throw device_error( rtneon_errc::CONNECTION_ERROR, std::string("cannot open mDNS socket: ") + strerror(errno) );
      }
    sockets.push_back( sock );
    query_ids.push_back( -1 );

#if RTNEON_DEBUG_LEVEL >= 100
    fprintf(stdout, "DISCOVERY: opened %lu socket(s) for mDNS query\n", (unsigned long)sockets.size());
#endif
  }

  void send_query( const std::string& service ) override
  {
    for( size_t isock=0; isock<sockets.size(); ++isock )
      {
	query_ids[isock] = mdns_query_send( sockets[isock], MDNS_RECORDTYPE_PTR, service.data(), service.size(),
					    buffer.data(), buffer.size(), 0 );
	if( query_ids[isock] < 0 )
	  {
	    fprintf(stderr, "DISCOVERY: failed to send mDNS query: [%s]\n", strerror(errno));
	  }
      }
  }

  void poll( const double timeout_sec, std::vector<zeroconf_service_reply_struct>& out ) override
  {
    mdns_query_user_data ud{ &out };

    Timer t;
    while( t.elapsed() < timeout_sec )
      {
	double remain = timeout_sec - t.elapsed();
	struct timeval timeout;
	timeout.tv_sec = (long)remain;
	timeout.tv_usec = (long)((remain - (long)remain) * 1e6);

	int nfds = 0;
	fd_set readfs;
	FD_ZERO(&readfs);
	for( auto s : sockets )
	  {
	    if( s >= nfds ) { nfds = s + 1; }
	    FD_SET(s, &readfs);
	  }

	int res = select(nfds, &readfs, 0, 0, &timeout);
	if( res <= 0 )
	  {
	    break;
	  }
	for( size_t isock=0; isock<sockets.size(); ++isock )
	  {
	    if( FD_ISSET(sockets[isock], &readfs) )
	      {
		mdns_query_recv( sockets[isock], buffer.data(), buffer.size(), query_callback, &ud, query_ids[isock] );
	      }
	  }
      }
  }

  void close() override
  {
    for( auto s : sockets )
      {
	mdns_socket_close( s );
      }
    sockets.clear();
    query_ids.clear();
  }
};


//Lazy, time-bounded, restartable scan. Each device is yielded once per scan window.
//TXT records may come in a different packet than the SRV, before or after it. They are kept for the whole scan,
// and a device whose TXT is not known yet is held back for up to txt_grace_sec to pick it up.
struct device_scan
{
private:
  struct held_device
  {
    std::string name;
    device_endpoint ep;
    Timer since;
  };

  std::shared_ptr<advertisement_source> source;
  discovery_config cfg;
  double timeout_sec;

  Timer deadline;
  Timer since_query;
  std::set<std::string> seen;
  std::vector<zeroconf_service_reply_struct> pending;
  std::map<std::string, std::map<std::string,std::string>> txts;
  std::deque<held_device> held;
  bool opened=false;

public:
  device_scan( std::shared_ptr<advertisement_source> _source, const double _timeout_sec, const discovery_config& _cfg=discovery_config() )
    : source(_source), cfg(_cfg), timeout_sec(_timeout_sec)
  { }

  ~device_scan()
  {
    if( opened )
      {
	source->close();
      }
  }

  double remaining() const
  {
    return timeout_sec - deadline.elapsed();
  }

  //Next newly seen device, or nullopt once the window has elapsed.
  std::optional<device_endpoint> next()
  {
    if( !opened )
      {
	source->open();
	opened = true;
	source->send_query( cfg.service );
	since_query.reset();
      }

    while( true )
      {
	for( const auto& rep : pending )
	  {
	    if( !rep.has_srv )
	      {
		for( const auto& kv : rep.txt )
		  {
		    txts[rep.name][kv.first] = kv.second;
		  }
		continue;
	      }
	    auto ep = endpoint_from_service_name( rep.name, rep.srcaddr, rep.dstport, cfg.name_prefix );
	    if( !ep || seen.count( ep->identity() ) > 0 )
	      {
		continue;
	      }
	    seen.insert( ep->identity() );
	    held.push_back( held_device{ rep.name, *ep, Timer() } );
	  }
	pending.clear();

	const double remain = remaining();
	for( auto it = held.begin(); it != held.end(); ++it )
	  {
	    auto tit = txts.find( it->name );
	    if( tit != txts.end() || it->since.elapsed() >= cfg.txt_grace_sec || remain <= 0 )
	      {
		device_endpoint ep = it->ep;
		if( tit != txts.end() )
		  {
		    ep.capabilities = tit->second;
		  }
		held.erase( it );
#if RTNEON_DEBUG_LEVEL > 0
		fprintf(stdout, "DISCOVERY: found %s\n", ep.tostr().c_str());
#endif
		return ep;
	      }
	  }

	if( remain <= 0 )
	  {
	    return std::nullopt;
	  }

	if( since_query.elapsed() >= cfg.requery_interval_sec )
	  {
	    source->send_query( cfg.service );
	    since_query.reset();
	  }

	double slice = std::min( remain, std::max( 0.05, cfg.requery_interval_sec - since_query.elapsed() ) );
	if( !held.empty() )
	  {
	    slice = std::min( slice, std::max( 0.01, cfg.txt_grace_sec - held.front().since.elapsed() ) );
	  }
	source->poll( slice, pending );
      }
  }

  //Re-arms the window and forgets what was already yielded.
  void restart( const double _timeout_sec )
  {
    timeout_sec = _timeout_sec;
    deadline.reset();
    seen.clear();
    pending.clear();
    held.clear();
    if( opened )
      {
	source->send_query( cfg.service );
	since_query.reset();
      }
  }
};


inline std::optional<device_endpoint> discover_one( std::shared_ptr<advertisement_source> source, const double timeout_sec, const discovery_config& cfg=discovery_config() )
{
  device_scan scan( source, timeout_sec, cfg );
  return scan.next();
}

inline std::optional<device_endpoint> discover_one( const double timeout_sec=10.0, const discovery_config& cfg=discovery_config() )
{
  return discover_one( std::make_shared<mdns_advertisement_source>(), timeout_sec, cfg );
}

inline std::vector<device_endpoint> discover_devices( std::shared_ptr<advertisement_source> source, const double timeout_sec, const discovery_config& cfg=discovery_config() )
{
  std::vector<device_endpoint> res;
  device_scan scan( source, timeout_sec, cfg );
  while( auto ep = scan.next() )
    {
      res.push_back( *ep );
    }
  return res;
}

inline std::vector<device_endpoint> discover_devices( const double timeout_sec=10.0, const discovery_config& cfg=discovery_config() )
{
  return discover_devices( std::make_shared<mdns_advertisement_source>(), timeout_sec, cfg );
}
