#pragma once

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <rtneon_defines.hpp>
#include <rtneon_ffmpeg.hpp>
#include <sensor_types.hpp>
#include <stream_transport.hpp>
#include <unit_decoder.hpp>

//REV: decoded frames keep the packet pts, and the transport tells us the device time of each packet, so
// device time of a frame = (device ts - pts) of the latest packet + frame pts. Works across B-frame reordering
// and for audio codecs that split or merge packets.

struct avcodec_context_deleter
{
  void operator()( AVCodecContext* c ) const
  {
    avcodec_free_context( &c );
  }
};

struct sws_context_deleter
{
  void operator()( SwsContext* c ) const
  {
    sws_freeContext( c );
  }
};

struct swr_context_deleter
{
  void operator()( SwrContext* c ) const
  {
    swr_free( &c );
  }
};

typedef std::unique_ptr<AVCodecContext, avcodec_context_deleter> avcodec_context_ptr;
typedef std::unique_ptr<AVFrame, avframe_deleter> avframe_uptr;


//Shared codec plumbing for the FFmpeg backed decoders.
struct av_unit_decoder
  : public unit_decoder
{
protected:
  sensor_kind kind;
  media_type media;
  avcodec_context_ptr codec_context;
  avframe_uptr frame;
  AVRational tb{0,1};

  bool have_base=false;
  rtneon_time_ns_t base_ns=0;
  uint64_t nframes=0;

public:
  av_unit_decoder( const sensor_kind _kind )
    : kind(_kind), media(media_for_kind(_kind))
  { }

  virtual ~av_unit_decoder()
  { }

  bool init( const stream_transport& transport, std::string& err ) override
  {
    codec_context.reset();
    have_base = false;

    const AVCodecParameters* par = transport.codec_parameters( media );
    if( !par )
      {
	err = std::string("no ") + media_type_str(media) + " stream in [" + transport.url() + "]";
	return false;
      }
    tb = transport.time_base( media );

    const AVCodec* codec = avcodec_find_decoder( par->codec_id );
    if( !codec )
      {
	err = std::string("no decoder for codec [") + avcodec_get_name(par->codec_id) + "]";
	return false;
      }

    codec_context = avcodec_context_ptr( avcodec_alloc_context3( codec ) );
    if( !codec_context )
      {
	err = "cannot allocate codec context";
	return false;
      }

    int ret = avcodec_parameters_to_context( codec_context.get(), par );
    if( ret < 0 )
      {
	err = "codec parameters: " + av_error_str(ret);
	return false;
      }
    codec_context->pkt_timebase = tb;

    ret = avcodec_open2( codec_context.get(), codec, NULL );
    if( ret < 0 )
      {
	err = std::string("cannot open codec [") + codec->name + "]: " + av_error_str(ret);
	return false;
      }

    frame = avframe_uptr( av_frame_alloc() );
    if( !frame )
      {
	err = "cannot allocate frame";
	return false;
      }

#if RTNEON_DEBUG_LEVEL > 1
    fprintf(stdout, "DECODER [%s]: opened [%s] time base %d/%d\n", sensor_kind_str(kind), codec->name, tb.num, tb.den);
#endif
    return _init_converter( err );
  }

  bool decode( const transport_unit& u, std::vector<decoded_sample>& out ) override
  {
    if( !codec_context || !u.pkt )
      {
	return false;
      }

    if( u.pkt->pts != AV_NOPTS_VALUE )
      {
	base_ns = u.device_ts_ns - _pts_to_ns( u.pkt->pts );
	have_base = true;
      }

    int sent = avcodec_send_packet( codec_context.get(), u.pkt.get() );
    if( sent < 0 && sent != AVERROR(EAGAIN) )
      {
#if RTNEON_DEBUG_LEVEL > 10
	fprintf(stderr, "DECODER [%s]: send packet failed [%s]\n", sensor_kind_str(kind), av_error_str(sent).c_str());
#endif
	return false;
      }

    while( true )
      {
	int recv = avcodec_receive_frame( codec_context.get(), frame.get() );
	if( recv == AVERROR(EAGAIN) || recv == AVERROR_EOF )
	  {
	    break;
	  }
	if( recv < 0 )
	  {
#if RTNEON_DEBUG_LEVEL > 10
	    fprintf(stderr, "DECODER [%s]: receive frame failed [%s]\n", sensor_kind_str(kind), av_error_str(recv).c_str());
#endif
	    return false;
	  }

	int64_t pts = frame->best_effort_timestamp;
	if( pts == AV_NOPTS_VALUE )
	  {
	    pts = frame->pts;
	  }
	rtneon_time_ns_t ts = (pts != AV_NOPTS_VALUE && have_base) ? base_ns + _pts_to_ns( pts ) : u.device_ts_ns;

	bool good = _convert( frame.get(), ts, out );
	av_frame_unref( frame.get() );
	if( !good )
	  {
	    return false;
	  }
	++nframes;
      }
    return true;
  }

protected:
  rtneon_time_ns_t _pts_to_ns( const int64_t pts ) const
  {
    return av_rescale_q( pts, tb, AVRational{1, 1000000000} );
  }

  virtual bool _init_converter( std::string& err ) = 0;
  virtual bool _convert( const AVFrame* f, const rtneon_time_ns_t ts, std::vector<decoded_sample>& out ) = 0;
};


//Scene camera and eye cameras. The eye camera sends both eyes side by side; eye_left is the left half.
struct video_unit_decoder
  : public av_unit_decoder
{
private:
  std::unique_ptr<SwsContext, sws_context_deleter> sws;
  int srcw=0;
  int srch=0;
  int srcfmt=-1;

public:
  video_unit_decoder( const sensor_kind _kind )
    : av_unit_decoder(_kind)
  { }

protected:
  bool _init_converter( std::string& err ) override
  {
    (void)err;
    sws.reset();
    srcw = srch = 0;
    srcfmt = -1;
    return true;
  }

  bool _convert( const AVFrame* f, const rtneon_time_ns_t ts, std::vector<decoded_sample>& out ) override
  {
    if( f->width <= 0 || f->height <= 0 )
      {
	return false;
      }

    if( !sws || f->width != srcw || f->height != srch || f->format != srcfmt )
      {
	srcw = f->width;
	srch = f->height;
	srcfmt = f->format;
#if RTNEON_DEBUG_LEVEL > 1
	fprintf(stdout, "DECODER [%s]: converting [%s] %dx%d to BGR24\n", sensor_kind_str(kind), av_get_pix_fmt_name((AVPixelFormat)srcfmt), srcw, srch);
#endif
	sws.reset( sws_getContext( srcw, srch, (AVPixelFormat)srcfmt, srcw, srch, AV_PIX_FMT_BGR24, SWS_AREA, NULL, NULL, NULL ) );
	if( !sws )
	  {
	    fprintf(stderr, "DECODER [%s]: cannot create scaler for %dx%d\n", sensor_kind_str(kind), srcw, srch);
	    return false;
	  }
      }

    cv::Mat bgr( srch, srcw, CV_8UC3 );
    uint8_t* dstdata[4] = { bgr.data, nullptr, nullptr, nullptr };
    int dstlinesize[4] = { (int)bgr.step[0], 0, 0, 0 };
    sws_scale( sws.get(), f->data, f->linesize, 0, srch, dstdata, dstlinesize );

    video_frame vf;
    if( kind == sensor_kind::EYE_LEFT )
      {
	vf.bgr = bgr( cv::Rect( 0, 0, srcw/2, srch ) ).clone();
      }
    else if( kind == sensor_kind::EYE_RIGHT )
      {
	vf.bgr = bgr( cv::Rect( srcw/2, 0, srcw - srcw/2, srch ) ).clone();
      }
    else
      {
	vf.bgr = bgr;
      }
    out.push_back( decoded_sample{ kind, ts, std::move(vf) } );
    return true;
  }
};


//Microphone audio, resampled (format only) to interleaved s16 at the source rate and channel count.
struct audio_unit_decoder
  : public av_unit_decoder
{
private:
  std::unique_ptr<SwrContext, swr_context_deleter> swr;
  int rate=0;
  int channels=0;
  int srcfmt=-1;

public:
  audio_unit_decoder()
    : av_unit_decoder(sensor_kind::AUDIO)
  { }

protected:
  bool _init_converter( std::string& err ) override
  {
    (void)err;
    swr.reset();
    rate = channels = 0;
    srcfmt = -1;
    return true;
  }

  bool _setup_swr( const AVFrame* f )
  {
    rate = f->sample_rate;
    channels = (int)avframe_channels( f );
    srcfmt = f->format;

    SwrContext* ctx = nullptr;
#ifdef RTNEON_FFMPEG_CH_LAYOUT
    AVChannelLayout outlayout;
    av_channel_layout_default( &outlayout, channels );
    int ret = swr_alloc_set_opts2( &ctx, &outlayout, AV_SAMPLE_FMT_S16, rate,
				   &f->ch_layout, (AVSampleFormat)srcfmt, rate, 0, NULL );
    av_channel_layout_uninit( &outlayout );
    if( ret < 0 )
      {
	fprintf(stderr, "DECODER [audio]: cannot configure resampler [%s]\n", av_error_str(ret).c_str());
	return false;
      }
#else
    int64_t layout = f->channel_layout ? (int64_t)f->channel_layout : av_get_default_channel_layout( channels );
    ctx = swr_alloc_set_opts( NULL, layout, AV_SAMPLE_FMT_S16, rate,
			      layout, (AVSampleFormat)srcfmt, rate, 0, NULL );
#endif
    if( !ctx )
      {
	return false;
      }
    swr.reset( ctx );
    int ret2 = swr_init( swr.get() );
    if( ret2 < 0 )
      {
	fprintf(stderr, "DECODER [audio]: cannot init resampler [%s]\n", av_error_str(ret2).c_str());
	swr.reset();
	return false;
      }
#if RTNEON_DEBUG_LEVEL > 1
    fprintf(stdout, "DECODER [audio]: %d Hz, %d channels, [%s] -> s16\n", rate, channels, av_get_sample_fmt_name((AVSampleFormat)srcfmt));
#endif
    return true;
  }

  bool _convert( const AVFrame* f, const rtneon_time_ns_t ts, std::vector<decoded_sample>& out ) override
  {
    if( f->nb_samples <= 0 || avframe_channels( f ) <= 0 )
      {
	return false;
      }
    if( !swr || f->sample_rate != rate || avframe_channels( f ) != channels || f->format != srcfmt )
      {
	if( !_setup_swr( f ) )
	  {
	    return false;
	  }
      }

    const int maxout = swr_get_out_samples( swr.get(), f->nb_samples );
    if( maxout <= 0 )
      {
	return false;
      }
    audio_frame af;
    af.sample_rate = rate;
    af.channels = channels;
    af.pcm.resize( (size_t)maxout * channels );
    uint8_t* outp = (uint8_t*)af.pcm.data();
    const int n = swr_convert( swr.get(), &outp, maxout, (const uint8_t**)f->extended_data, f->nb_samples );
    if( n < 0 )
      {
	fprintf(stderr, "DECODER [audio]: resample failed [%s]\n", av_error_str(n).c_str());
	return false;
      }
    af.pcm.resize( (size_t)n * channels );
    if( n > 0 )
      {
	out.push_back( decoded_sample{ sensor_kind::AUDIO, ts, std::move(af) } );
      }
    return true;
  }
};


//Decoder for each sensor kind as the device sends it.
inline std::unique_ptr<unit_decoder> make_default_decoder( const sensor_kind k )
{
  switch( k )
    {
    case sensor_kind::GAZE: return std::make_unique<gaze_decoder>();
    case sensor_kind::EYE_EVENTS: return std::make_unique<eye_events_decoder>();
    case sensor_kind::IMU: return std::make_unique<imu_decoder>();
    case sensor_kind::SCENE:
    case sensor_kind::EYE_LEFT:
    case sensor_kind::EYE_RIGHT:
      return std::make_unique<video_unit_decoder>( k );
    case sensor_kind::AUDIO: return std::make_unique<audio_unit_decoder>();
    }
  return nullptr;
}
