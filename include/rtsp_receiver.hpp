#pragma once

#include <atomic>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <rtneon_defines.hpp>
#include <rtneon_ffmpeg.hpp>
#include <stream_transport.hpp>
#include <Timer.hpp>

//Receives one RTSP session from the device with FFmpeg, stamps every packet with device (unix ns) time and
// hands it to the subscribers of its media type.
//REV: device time = start_time_realtime (RTCP NTP of the stream start, usec) + pts in the stream time base.
// Packets read before the first RTCP sender report have no realtime anchor and are dropped.

inline void rtneon_ffmpeg_network_init()
{
  static std::once_flag once;
  std::call_once( once, []() { avformat_network_init(); } );
}

typedef std::shared_ptr<AVCodecParameters> avcodecpar_ptr;

struct rtsp_transport
  : public stream_transport
{
private:
  AVFormatContext* fmt_context=nullptr;
  std::thread mythread;

  double open_timeout_sec;
  double read_timeout_sec;

  //interrupt callback state
  std::mutex tmu;
  Timer t;
  bool incall=false;
  double calltimeout=0;
  //set only while start() opens the session
  cancel_check open_cancelled;
  std::atomic<bool> closing;

  std::atomic<bool> isalive;
  std::mutex closemu;

  //stream index per media_type (video, audio, data), -1 if absent
  int streamidx[3] = {-1, -1, -1};
  AVRational tbs[3] = { {0,1}, {0,1}, {0,1} };
  avcodecpar_ptr codecpars[3];

  uint64_t nread=0;
  uint64_t nunanchored=0;

  void _begin_call( const double timeout )
  {
    const std::lock_guard<std::mutex> lock(tmu);
    t.reset();
    incall = true;
    calltimeout = timeout;
  }

  void _end_call()
  {
    const std::lock_guard<std::mutex> lock(tmu);
    incall = false;
  }

public:
  //FFmpeg interrupt callback: closing, the opener gave up, or a blocking call ran past its timeout.
  bool should_interrupt()
  {
    if( closing )
      {
	return true;
      }
    const std::lock_guard<std::mutex> lock(tmu);
    if( open_cancelled && open_cancelled() )
      {
	return true;
      }
    return incall && t.elapsed() > calltimeout;
  }

  rtsp_transport( const std::string& _url, const double _open_timeout_sec=RTNEON_RTSP_OPEN_TIMEOUT_SEC,
		  const double _read_timeout_sec=RTNEON_STREAM_STALL_TIMEOUT_SEC )
    : stream_transport(_url), open_timeout_sec(_open_timeout_sec), read_timeout_sec(_read_timeout_sec), closing(false), isalive(false)
  {
    rtneon_ffmpeg_network_init();
  }

  ~rtsp_transport()
  {
    close();
  }

  //Opens the session and starts the reader thread. The open is abandoned as soon as cancelled returns true.
  bool start( std::string& err, const cancel_check& cancelled=cancel_check() );

  bool alive() const override
  {
    return isalive;
  }

  bool has_media( const media_type m ) const override
  {
    return streamidx[(int)m] >= 0;
  }

  const AVCodecParameters* codec_parameters( const media_type m ) const override
  {
    return codecpars[(int)m].get();
  }

  AVRational time_base( const media_type m ) const override
  {
    return tbs[(int)m];
  }

  void close() override
  {
    const std::lock_guard<std::mutex> lock(closemu);
    closing = true;
    stoplooping();
    JOIN( mythread );
    if( fmt_context )
      {
#if RTNEON_DEBUG_LEVEL > 1
	fprintf(stdout, "RTSP: closing [%s] after %lu packets (%lu before realtime anchor)\n", myurl.c_str(), (unsigned long)nread, (unsigned long)nunanchored);
#endif
	avformat_close_input( &fmt_context );
      }
    isalive = false;
  }

private:
  bool init( std::string& err );

  static media_type _media_of( const AVMediaType t )
  {
    if( t == AVMEDIA_TYPE_VIDEO ) { return media_type::VIDEO; }
    if( t == AVMEDIA_TYPE_AUDIO ) { return media_type::AUDIO; }
    return media_type::DATA;
  }

  void doloop()
  {
    while( localloop() )
      {
	AVPacket* packet = av_packet_alloc();
	if( !packet )
	  {
	    fprintf(stderr, "RTSP: [%s] cannot allocate packet\n", myurl.c_str());
	    break;
	  }

	_begin_call( read_timeout_sec );
	int v = av_read_frame( fmt_context, packet );
	_end_call();

	if( v != 0 )
	  {
	    av_packet_free( &packet );
	    if( !closing )
	      {
		fprintf(stderr, "RTSP: [%s] read failed, transport is dead: [%s]\n", myurl.c_str(), av_error_str(v).c_str());
	      }
	    break;
	  }
	++nread;

	auto pkt = make_avpacket_ptr( packet );
	if( packet->stream_index < 0 || (unsigned)packet->stream_index >= fmt_context->nb_streams )
	  {
	    continue;
	  }

	AVStream* st = fmt_context->streams[packet->stream_index];
	const media_type m = _media_of( st->codecpar->codec_type );
	if( streamidx[(int)m] != packet->stream_index )
	  {
	    //second stream of the same media type, we only serve the first
	    continue;
	  }

	const int64_t rt_usec = fmt_context->start_time_realtime;
	if( rt_usec == AV_NOPTS_VALUE || rt_usec <= 0 || packet->pts == AV_NOPTS_VALUE )
	  {
	    ++nunanchored;
	    continue;
	  }

	transport_unit u;
	u.media = m;
	u.stream_index = packet->stream_index;
	u.device_ts_ns = rt_usec * 1000 + av_rescale_q( packet->pts, st->time_base, AVRational{1, 1000000000} );
	u.pkt = pkt;

#if RTNEON_DEBUG_LEVEL > 100
	fprintf(stdout, "[%s]  RTSP packet :size: [%d]  pts: [%ld]  dev ts: [%ld]\n", myurl.c_str(), packet->size, (long)packet->pts, (long)u.device_ts_ns );
#endif
	_dispatch( u );
      }
    isalive = false;
  }
};


inline int rtsp_interrupt_callback( void* opaque )
{
  rtsp_transport* myrecvr = (rtsp_transport*)opaque;
  return myrecvr->should_interrupt() ? 1 : 0;
}


inline bool rtsp_transport::init( std::string& err )
{
  fmt_context = avformat_alloc_context();
  if( !fmt_context )
    {
      err = "cannot allocate format context";
      return false;
    }

  fmt_context->interrupt_callback.opaque = (void*)this;
  fmt_context->interrupt_callback.callback = &rtsp_interrupt_callback;

  AVDictionary *opts = NULL;
  av_dict_set(&opts, "buffer_size", "655360", 0);
  av_dict_set(&opts, "recv_buffer_size", "655360", 0);
  av_dict_set(&opts, "thread_queue_size", "512", 0);

#if RTNEON_DEBUG_LEVEL > 1
  fprintf(stdout, "RTSP: opening [%s]\n", myurl.c_str() );
#endif

  _begin_call( open_timeout_sec );
  int averr1 = avformat_open_input(&fmt_context, myurl.c_str(), NULL, &opts);
  _end_call();
  av_dict_free( &opts );
  if( averr1 != 0 )
    {
      //avformat_open_input frees the context on failure
      fmt_context = nullptr;
      err = "cannot open [" + myurl + "]: " + av_error_str(averr1);
      return false;
    }

  _begin_call( open_timeout_sec );
  int averr2 = avformat_find_stream_info(fmt_context, NULL);
  _end_call();
  if( averr2 < 0 )
    {
      err = "no stream info for [" + myurl + "]: " + av_error_str(averr2);
      avformat_close_input( &fmt_context );
      return false;
    }

  for( unsigned i=0; i<fmt_context->nb_streams; ++i )
    {
      AVStream* st = fmt_context->streams[i];
      const media_type m = _media_of( st->codecpar->codec_type );
      if( streamidx[(int)m] < 0 )
	{
	  streamidx[(int)m] = (int)i;
	  tbs[(int)m] = st->time_base;
	  AVCodecParameters* par = avcodec_parameters_alloc();
	  if( par && avcodec_parameters_copy( par, st->codecpar ) >= 0 )
	    {
	      codecpars[(int)m] = avcodecpar_ptr( par, []( AVCodecParameters* p ) { avcodec_parameters_free( &p ); } );
	    }
	  else if( par )
	    {
	      avcodec_parameters_free( &par );
	    }
	}
    }

#if RTNEON_DEBUG_LEVEL > 5
  av_dump_format(fmt_context, 0, myurl.c_str(), 0);
#endif
  return true;
}

inline bool rtsp_transport::start( std::string& err, const cancel_check& cancelled )
{
  const std::lock_guard<std::mutex> lock(startstop_mu);
  if( isalive )
    {
      return true;
    }
  if( closing )
    {
      err = "transport closed";
      return false;
    }
  {
    const std::lock_guard<std::mutex> lk(tmu);
    open_cancelled = cancelled;
  }
  const bool opened = init( err );
  {
    const std::lock_guard<std::mutex> lk(tmu);
    open_cancelled = cancel_check();
  }
  if( !opened )
    {
      if( cancelled && cancelled() )
	{
	  err = "open of [" + myurl + "] cancelled";
	}
      fprintf(stderr, "RTSP: %s\n", err.c_str());
      return false;
    }

  isalive = true;
  startlooping();
  mythread = std::thread( &rtsp_transport::doloop, this );
  return true;
}
