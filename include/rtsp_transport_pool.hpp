#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <rtneon_defines.hpp>
#include <stream_transport.hpp>
#include <rtsp_receiver.hpp>

//Hands out one rtsp_transport per URL for as long as someone holds it. The world session carries both scene video
// and audio, so the scene and audio stream sessions end up on the same reader.
//A transport whose reader died is replaced on the next acquire.
struct rtsp_transport_pool
  : public transport_provider
{
private:
  //One URL being opened. Later callers for the same URL wait on it instead of opening a second reader.
  struct pending_open
  {
    std::mutex mu;
    std::condition_variable cv;
    bool done=false;
    std::shared_ptr<rtsp_transport> t;
    std::string err;
  };

  std::mutex mu;
  std::map<std::string, std::weak_ptr<rtsp_transport>> transports;
  std::map<std::string, std::shared_ptr<pending_open>> opening;
  double open_timeout_sec;
  double read_timeout_sec;

public:
  rtsp_transport_pool( const double _open_timeout_sec=RTNEON_RTSP_OPEN_TIMEOUT_SEC, const double _read_timeout_sec=RTNEON_STREAM_STALL_TIMEOUT_SEC )
    : open_timeout_sec(_open_timeout_sec), read_timeout_sec(_read_timeout_sec)
  { }

  std::shared_ptr<stream_transport> acquire( const std::string& url, std::string& err, const cancel_check& cancelled=cancel_check() ) override
  {
    //REV: mu only guards the maps; a slow open of one URL never blocks acquires of another.
    std::shared_ptr<pending_open> po;
    {
      const std::lock_guard<std::mutex> lock(mu);
      _prune();

      auto it = transports.find( url );
      if( it != transports.end() )
	{
	  auto existing = it->second.lock();
	  if( existing && existing->alive() )
	    {
#if RTNEON_DEBUG_LEVEL > 1
	      fprintf(stdout, "RTSP POOL: sharing [%s] (%lu subscribers)\n", url.c_str(), (unsigned long)existing->num_subscribers());
#endif
	      return existing;
	    }
	}

      auto oit = opening.find( url );
      if( oit != opening.end() )
	{
	  po = oit->second;
	}
      else
	{
	  opening[url] = std::make_shared<pending_open>();
	}
    }

    if( po )
      {
	return _wait_open( *po, url, err, cancelled );
      }

    auto t = std::make_shared<rtsp_transport>( url, open_timeout_sec, read_timeout_sec );
    std::string openerr;
    const bool good = t->start( openerr, cancelled );
    {
      const std::lock_guard<std::mutex> lock(mu);
      po = opening[url];
      opening.erase( url );
      if( good )
	{
	  transports[url] = t;
	}
    }
    {
      const std::lock_guard<std::mutex> lk(po->mu);
      po->done = true;
      if( good )
	{
	  po->t = t;
	}
      po->err = openerr;
    }
    po->cv.notify_all();

    if( !good )
      {
	err = openerr;
	return nullptr;
      }
    return t;
  }

  size_t num_open()
  {
    const std::lock_guard<std::mutex> lock(mu);
    _prune();
    return transports.size();
  }

private:
  std::shared_ptr<stream_transport> _wait_open( pending_open& po, const std::string& url, std::string& err, const cancel_check& cancelled )
  {
    std::unique_lock<std::mutex> lk(po.mu);
    while( !po.done )
      {
	if( cancelled && cancelled() )
	  {
	    err = "gave up waiting for [" + url + "] to open";
	    return nullptr;
	  }
	po.cv.wait_for( lk, std::chrono::milliseconds(50) );
      }
    if( !po.t )
      {
	err = po.err;
	return nullptr;
      }
    return po.t;
  }

  void _prune()
  {
    for( auto it = transports.begin(); it != transports.end(); )
      {
	if( it->second.expired() )
	  {
	    it = transports.erase( it );
	  }
	else
	  {
	    ++it;
	  }
      }
  }
};
