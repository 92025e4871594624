#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

extern "C"{
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libavutil/pixdesc.h>
#include <libavutil/channel_layout.h>
#include <libswscale/swscale.h>
#include <libswresample/swresample.h>
}

//REV: ffmpeg 5.1 replaced channel_layout/channels with ch_layout
#if LIBAVUTIL_VERSION_INT >= AV_VERSION_INT(57, 28, 100)
#define RTNEON_FFMPEG_CH_LAYOUT 1
#endif

inline std::string av_error_str( const int averr )
{
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  int success = av_strerror( averr, buf, sizeof(buf) );
  if( 0 == success )
    {
      return std::string(buf);
    }
  fprintf(stderr, "REV: unknown AVERROR [%d]\n", averr);
  return std::string("averror ") + std::to_string(averr);
}

struct avpacket_deleter
{
  void operator()( AVPacket* p ) const
  {
    av_packet_free( &p );
  }
};

struct avframe_deleter
{
  void operator()( AVFrame* f ) const
  {
    av_frame_free( &f );
  }
};

typedef std::shared_ptr<AVPacket> avpacket_ptr;

inline avpacket_ptr make_avpacket_ptr( AVPacket* p )
{
  return avpacket_ptr( p, avpacket_deleter() );
}

//Packet holding a copy of the given bytes (used for data streams and tests).
inline avpacket_ptr make_avpacket_from_bytes( const uint8_t* data, const size_t size )
{
  AVPacket* p = av_packet_alloc();
  if( !p )
    {
      return nullptr;
    }
  if( av_new_packet( p, (int)size ) < 0 )
    {
      av_packet_free( &p );
      return nullptr;
    }
  if( size > 0 )
    {
      std::memcpy( p->data, data, size );
    }
  return make_avpacket_ptr( p );
}

inline int64_t avframe_channels( const AVFrame* frame )
{
#ifdef RTNEON_FFMPEG_CH_LAYOUT
  return frame->ch_layout.nb_channels;
#else
  return frame->channels;
#endif
}
