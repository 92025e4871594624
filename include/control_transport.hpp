#pragma once

#include <chrono>
#include <cstdio>
#include <memory>
#include <string>

#include <utility>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <rtneon_defines.hpp>
#include <device_endpoint.hpp>
#include <httprest.hpp>
#include <Timer.hpp>

enum class push_read
  {
    MESSAGE,
    TIMEOUT,
    CLOSED
  };

//The control channel's wire. open/read_push/close are only ever called from the session's listener thread;
// request may be called concurrently from the command worker.
struct control_transport
{
  virtual ~control_transport()
  { }

  //Opens the push (status) channel. Returns false with err set if not reachable within timeout_sec.
  virtual bool open( const device_endpoint& ep, const double timeout_sec, std::string& err ) = 0;

  virtual void close() = 0;

  //Request/response on the device REST API.
  virtual http_reply request( const boost::beast::http::verb method, const std::string& target, const std::string& body, const double timeout_sec ) = 0;

  //Waits up to timeout_sec for one push message.
  virtual push_read read_push( std::string& msg, const double timeout_sec ) = 0;
};


//REST over HTTP, pushes over ws://host:port/api/status
struct neon_control_transport
  : public control_transport
{
private:
  device_endpoint ep;
  double idle_timeout_sec;

  boost::asio::io_context ioc;
  std::unique_ptr<boost::beast::websocket::stream<boost::asio::ip::tcp::socket>> ws;
  boost::beast::flat_buffer buffer;

  bool read_pending=false;
  bool read_done=false;
  boost::system::error_code read_ec;

public:
  //A socket that carries nothing, not even a pong, for idle_timeout_sec fails the pending read. 0 disables.
  neon_control_transport( const double _idle_timeout_sec=RTNEON_LIVENESS_TIMEOUT_SEC )
    : idle_timeout_sec(_idle_timeout_sec)
  { }

  ~neon_control_transport()
  {
    close();
  }

  bool open( const device_endpoint& _ep, const double timeout_sec, std::string& err ) override
  {
    close();
    ep = _ep;
    Timer t;
    auto remaining = [&]() { return timeout_sec - t.elapsed(); };

    try
      {
	ws = std::make_unique<boost::beast::websocket::stream<boost::asio::ip::tcp::socket>>( ioc );
	boost::asio::ip::tcp::resolver resolver{ioc};
	boost::system::error_code ec;

	boost::asio::ip::tcp::resolver::results_type results;
	bool good = run_with_deadline( ioc,
				       [&]( auto handler ) {
					 resolver.async_resolve( ep.host, ep.port_str(),
								 [&results, handler]( const boost::system::error_code& e, boost::asio::ip::tcp::resolver::results_type r ) mutable
								 {
								   results = r;
								   handler( e );
								 } );
				       },
				       [&]() { resolver.cancel(); },
				       remaining(), ec );
	if( good )
	  {
	    good = run_with_deadline( ioc,
				      [&]( auto handler ) { boost::asio::async_connect( ws->next_layer(), results, handler ); },
				      [&]() { boost::system::error_code ig; ws->next_layer().close(ig); },
				      remaining(), ec );
	  }

	if( good )
	  {
	    auto opt = boost::beast::websocket::stream_base::timeout::suggested( boost::beast::role_type::client );
	    if( idle_timeout_sec > 0 )
	      {
		opt.idle_timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>( std::chrono::duration<double>( idle_timeout_sec ) );
		opt.keep_alive_pings = true;
	      }
	    ws->set_option( opt );
	    const std::string hoststr = ep.host + ":" + ep.port_str();
	    good = run_with_deadline( ioc,
				      [&]( auto handler ) { ws->async_handshake( hoststr, RTNEON_STATUS_WS_TARGET, handler ); },
				      [&]() { boost::system::error_code ig; ws->next_layer().close(ig); },
				      remaining(), ec );
	  }

	if( !good )
	  {
	    err = "websocket to " + ep.host + ":" + ep.port_str() + RTNEON_STATUS_WS_TARGET + " failed: " + ec.message();
	    ws.reset();
	    return false;
	  }
      }
    catch( const boost::system::system_error& e )
      {
	err = std::string("websocket setup error: ") + e.what();
	ws.reset();
	return false;
      }

    read_pending = false;
    read_done = false;
    buffer.consume( buffer.size() );

#if RTNEON_DEBUG_LEVEL > 1
    fprintf(stdout, "CONTROL: status websocket open to [%s]\n", ep.tostr().c_str());
#endif
    return true;
  }

  void close() override
  {
    if( !ws )
      {
	return;
      }

    boost::system::error_code ig;
    ws->next_layer().shutdown( boost::asio::ip::tcp::socket::shutdown_both, ig );
    ws->next_layer().close( ig );
    //drain a pending read so its handler does not outlive the stream
    ioc.restart();
    ioc.run();
    ws.reset();
    read_pending = false;
    read_done = false;
  }

  http_reply request( const boost::beast::http::verb method, const std::string& target, const std::string& body, const double timeout_sec ) override
  {
    return http_request( ep.host, ep.port_str(), method, target, body, timeout_sec );
  }

  push_read read_push( std::string& msg, const double timeout_sec ) override
  {
    if( !ws )
      {
	return push_read::CLOSED;
      }

    if( !read_pending )
      {
	read_pending = true;
	read_done = false;
	ws->async_read( buffer, [this]( const boost::system::error_code& e, std::size_t )
	{
	  read_ec = e;
	  read_done = true;
	} );
      }

    ioc.restart();
    ioc.run_for( sec_to_ns_duration(timeout_sec) );

    if( !read_done )
      {
	return push_read::TIMEOUT;
      }

    read_pending = false;
    if( read_ec )
      {
#if RTNEON_DEBUG_LEVEL > 0
	fprintf(stderr, "CONTROL: status websocket read failed [%s]: [%s]\n", ep.tostr().c_str(), read_ec.message().c_str());
#endif
	return push_read::CLOSED;
      }

    msg = boost::beast::buffers_to_string( buffer.data() );
    buffer.consume( buffer.size() );
    return push_read::MESSAGE;
  }
};
