#pragma once

#include <cstdio>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <rtneon_defines.hpp>
#include <rtneon_ffmpeg.hpp>
#include <looper.hpp>
#include <sensor_types.hpp>

//One framed media unit as delivered by a streaming transport, already stamped with device time.
struct transport_unit
{
  media_type media=media_type::DATA;
  int stream_index=0;
  rtneon_time_ns_t device_ts_ns=0;
  //Shared read-only between every session subscribed to the transport.
  std::shared_ptr<const AVPacket> pkt;

  const uint8_t* data() const { return pkt ? pkt->data : nullptr; }
  size_t size() const { return pkt ? (size_t)pkt->size : 0; }
};

typedef std::function<void(const transport_unit&)> unit_handler;


//An opened streaming session (one RTSP URL). Several stream sessions may subscribe to different media of the same
// transport (scene video and audio share the world session). Handlers run on the transport's reader thread and
// must not block.
struct stream_transport
  : public looper
{
private:
  std::mutex submu;
  std::map<uint64_t, std::pair<media_type, unit_handler>> subscribers;
  uint64_t next_sub_id=1;

protected:
  std::string myurl;

  //Holds submu for the whole dispatch so that after unsubscribe() returns the handler is never called again.
  void _dispatch( const transport_unit& u )
  {
    const std::lock_guard<std::mutex> lock(submu);
    for( auto& s : subscribers )
      {
	if( s.second.first == u.media )
	  {
	    s.second.second( u );
	  }
      }
  }

public:
  stream_transport( const std::string& _url )
    : looper(_url), myurl(_url)
  { }

  virtual ~stream_transport()
  { }

  const std::string& url() const
  {
    return myurl;
  }

  uint64_t subscribe( const media_type m, unit_handler h )
  {
    const std::lock_guard<std::mutex> lock(submu);
    uint64_t id = next_sub_id++;
    subscribers[id] = std::make_pair( m, h );
    return id;
  }

  void unsubscribe( const uint64_t id )
  {
    const std::lock_guard<std::mutex> lock(submu);
    subscribers.erase(id);
  }

  size_t num_subscribers()
  {
    const std::lock_guard<std::mutex> lock(submu);
    return subscribers.size();
  }

  //False once the reader has hit an unrecoverable error or was closed.
  virtual bool alive() const = 0;
  virtual bool has_media( const media_type m ) const = 0;
  //Codec parameters and time base of the stream carrying m. nullptr for data streams without codec info.
  virtual const AVCodecParameters* codec_parameters( const media_type m ) const = 0;
  virtual AVRational time_base( const media_type m ) const = 0;
  virtual void close() = 0;
};


//Polled while a transport is being opened; true gives up the open.
typedef std::function<bool()> cancel_check;

//Hands out started transports. A provider may share one transport between callers asking for the same URL.
struct transport_provider
{
  virtual ~transport_provider()
  { }

  //nullptr with err set if the transport could not be opened or cancelled turned true while opening.
  virtual std::shared_ptr<stream_transport> acquire( const std::string& url, std::string& err, const cancel_check& cancelled=cancel_check() ) = 0;
};
