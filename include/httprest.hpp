#pragma once

//standard libs
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

//Other libs
//JSON
#include <nlohmann/json.hpp>

//BOOST ASIO (asynch IO)
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

//HTTP client. (BOOST BEAST)
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

// my includes
#include <rtneon_defines.hpp>
#include <rtneon_errors.hpp>
#include <utilities.hpp>
#include <Timer.hpp>

using namespace nlohmann;


inline std::chrono::nanoseconds sec_to_ns_duration( const double sec )
{
  return std::chrono::duration_cast<std::chrono::nanoseconds>( std::chrono::duration<double>( sec > 0 ? sec : 0 ) );
}

//Runs one asynchronous operation on a private io_context, giving up after timeout_sec.
//On timeout the operation is cancelled (cancel must abort it, e.g. by closing the socket) and drained,
// so nothing references this frame afterwards. ec is set to timed_out in that case.
template <typename Start, typename Cancel>
bool run_with_deadline( boost::asio::io_context& ioc, Start&& start, Cancel&& cancel, const double timeout_sec, boost::system::error_code& ec )
{
  bool done=false;
  start( [&done, &ec]( const boost::system::error_code& e, auto&&... ) { ec = e; done = true; } );
  ioc.restart();
  ioc.run_for( sec_to_ns_duration(timeout_sec) );
  if( !done )
    {
      cancel();
      ioc.restart();
      ioc.run();
      ec = boost::asio::error::timed_out;
      return false;
    }
  return !ec;
}


struct http_reply
{
  bool ok=false; //got a response at all
  bool timed_out=false;
  int status=0;
  std::string body;
  std::string error;

  bool is_success() const
  {
    return ok && status >= 200 && status < 300;
  }

  std::vector<uint8_t> body_bytes() const
  {
    return std::vector<uint8_t>( body.begin(), body.end() );
  }
};


//One HTTP/1.1 request with an overall deadline. Never throws; failures are in the reply.
inline http_reply http_request( const std::string& host, const std::string& port,
				const boost::beast::http::verb method, const std::string& target,
				const std::string& body, const double timeout_sec )
{
  http_reply reply;
  Timer t;
  auto remaining = [&]() { return timeout_sec - t.elapsed(); };

  try
    {
      boost::asio::io_context ioc;
      boost::asio::ip::tcp::resolver resolver{ioc};
      boost::asio::ip::tcp::socket socket{ioc};
      boost::system::error_code ec;

      boost::asio::ip::tcp::resolver::results_type results;
      bool good = run_with_deadline( ioc,
				     [&]( auto handler ) {
				       resolver.async_resolve( host, port,
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
				    [&]( auto handler ) { boost::asio::async_connect( socket, results, handler ); },
				    [&]() { boost::system::error_code ig; socket.close(ig); },
				    remaining(), ec );
	}

      const int version = 11;
      boost::beast::http::request<boost::beast::http::string_body> req{method, target, version};
      req.set(boost::beast::http::field::host, host);
      req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
      if( !body.empty() )
	{
	  req.set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
	  req.body() = body;
	}
      req.prepare_payload();

      if( good )
	{
	  good = run_with_deadline( ioc,
				    [&]( auto handler ) { boost::beast::http::async_write( socket, req, handler ); },
				    [&]() { boost::system::error_code ig; socket.close(ig); },
				    remaining(), ec );
	}

      boost::beast::flat_buffer buffer;
      boost::beast::http::response<boost::beast::http::string_body> res;
      if( good )
	{
	  good = run_with_deadline( ioc,
				    [&]( auto handler ) { boost::beast::http::async_read( socket, buffer, res, handler ); },
				    [&]() { boost::system::error_code ig; socket.close(ig); },
				    remaining(), ec );
	}

      if( !good )
	{
	  reply.timed_out = (ec == boost::asio::error::timed_out);
	  reply.error = ec.message();
#if RTNEON_HTTP_DEBUG_LEVEL > 0
	  fprintf(stderr, "HTTP: %s %s:%s%s failed: [%s]\n", std::string(boost::beast::http::to_string(method)).c_str(), host.c_str(), port.c_str(), target.c_str(), reply.error.c_str());
#endif
	  return reply;
	}

      reply.ok = true;
      reply.status = (int)res.result_int();
      reply.body = std::move(res.body());

#if RTNEON_HTTP_DEBUG_LEVEL > 10
      fprintf(stdout, "HTTP: %s %s -> [%d] BODY: [%s]\n", std::string(boost::beast::http::to_string(method)).c_str(), target.c_str(), reply.status, reply.body.c_str());
#endif

      boost::system::error_code ig;
      socket.shutdown( boost::asio::ip::tcp::socket::shutdown_both, ig );
      socket.close( ig );
    }
  catch( const boost::system::system_error& e )
    {
      fprintf(stderr, "HTTP: caught error from boost for [%s%s]: [%s]\n", host.c_str(), target.c_str(), e.what());
      reply.ok = false;
      reply.error = e.what();
    }
  return reply;
}


//Device replies are {"message": ..., "result": ...}. Fills code/message/result of a command result.
inline void reply_to_result( const http_reply& reply, command_result& res )
{
  if( !reply.ok )
    {
      res.code = reply.timed_out ? rtneon_errc::TIMEOUT : rtneon_errc::CONNECTION_ERROR;
      res.message = reply.error;
      return;
    }

  json j;
  if( !reply.body.empty() )
    {
      j = json::parse( reply.body, nullptr, false );
    }

  if( j.is_object() )
    {
      if( j.contains("message") && j["message"].is_string() )
	{
	  res.message = j["message"].get<std::string>();
	}
      if( j.contains("result") )
	{
	  res.result = j["result"];
	}
    }

  if( !reply.is_success() )
    {
      res.code = rtneon_errc::REJECTED;
      if( res.message.empty() )
	{
	  res.message = "device returned HTTP " + std::to_string(reply.status);
	}
      return;
    }

  if( j.is_discarded() )
    {
      res.code = rtneon_errc::PROTOCOL_ERROR;
      res.message = "unparseable reply body";
      return;
    }

  res.code = rtneon_errc::OK;
}
