#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <opencv2/core.hpp>

#include <rtneon_defines.hpp>

enum class sensor_kind
  {
    GAZE,
    SCENE,
    EYE_LEFT,
    EYE_RIGHT,
    IMU,
    EYE_EVENTS,
    AUDIO
  };

const std::vector<sensor_kind> ALL_SENSOR_KINDS =
  { sensor_kind::GAZE, sensor_kind::SCENE, sensor_kind::EYE_LEFT, sensor_kind::EYE_RIGHT,
    sensor_kind::IMU, sensor_kind::EYE_EVENTS, sensor_kind::AUDIO };

inline const char* sensor_kind_str( const sensor_kind k )
{
  switch( k )
    {
    case sensor_kind::GAZE: return "gaze";
    case sensor_kind::SCENE: return "scene";
    case sensor_kind::EYE_LEFT: return "eye_left";
    case sensor_kind::EYE_RIGHT: return "eye_right";
    case sensor_kind::IMU: return "imu";
    case sensor_kind::EYE_EVENTS: return "eye_events";
    case sensor_kind::AUDIO: return "audio";
    }
  return "unknown";
}

inline std::optional<sensor_kind> sensor_kind_from_str( const std::string& s )
{
  for( auto k : ALL_SENSOR_KINDS )
    {
      if( s == sensor_kind_str(k) )
	{
	  return k;
	}
    }
  return std::nullopt;
}

//What a transport unit carries.
enum class media_type
  {
    VIDEO,
    AUDIO,
    DATA
  };

inline const char* media_type_str( const media_type m )
{
  switch( m )
    {
    case media_type::VIDEO: return "video";
    case media_type::AUDIO: return "audio";
    case media_type::DATA: return "data";
    }
  return "unknown";
}

inline media_type media_for_kind( const sensor_kind k )
{
  switch( k )
    {
    case sensor_kind::SCENE:
    case sensor_kind::EYE_LEFT:
    case sensor_kind::EYE_RIGHT:
      return media_type::VIDEO;
    case sensor_kind::AUDIO:
      return media_type::AUDIO;
    default:
      return media_type::DATA;
    }
}


//////////// PAYLOADS

//Per-eye 3d state. Eyeball centre in mm (scene camera coordinates), optical axis is a unit vector.
struct eye_state
{
  float pupil_diameter_mm=0;
  cv::Point3f eyeball_center_mm;
  cv::Point3f optical_axis;
};

struct eyelid_state
{
  float angle_top_rad=0;
  float angle_bottom_rad=0;
  float aperture_mm=0;
};

//x, y in scene camera pixels, origin top left. When dual monocular, x/y is the left eye.
struct gaze_datum
{
  float x=0;
  float y=0;
  bool worn=false;

  std::optional<cv::Point2f> right;

  std::optional<eye_state> eye_left;
  std::optional<eye_state> eye_right;

  std::optional<eyelid_state> eyelid_left;
  std::optional<eyelid_state> eyelid_right;
};

struct video_frame
{
  cv::Mat bgr;
};

//Interleaved signed 16 bit PCM.
struct audio_frame
{
  std::vector<int16_t> pcm;
  int sample_rate=0;
  int channels=0;

  size_t nsamples() const
  {
    return (channels > 0) ? pcm.size() / channels : 0;
  }

  rtneon_time_ns_t duration_ns() const
  {
    if( sample_rate <= 0 ) { return 0; }
    return (rtneon_time_ns_t)( (int64_t)nsamples() * 1000000000LL / sample_rate );
  }
};

//gyro in deg/s, accel in g, rotation as quaternion (x y z w).
struct imu_datum
{
  cv::Vec3f gyro_dps;
  cv::Vec3f accel_g;
  cv::Vec4f quaternion;
};

enum class eye_event_type
  {
    SACCADE=0,
    FIXATION=1,
    SACCADE_ONSET=2,
    FIXATION_ONSET=3,
    BLINK=4
  };

inline const char* eye_event_type_str( const eye_event_type t )
{
  switch( t )
    {
    case eye_event_type::SACCADE: return "saccade";
    case eye_event_type::FIXATION: return "fixation";
    case eye_event_type::SACCADE_ONSET: return "saccade_onset";
    case eye_event_type::FIXATION_ONSET: return "fixation_onset";
    case eye_event_type::BLINK: return "blink";
    }
  return "unknown";
}

//Only present for completed fixations/saccades. Positions in scene pixels.
struct eye_event_geometry
{
  cv::Point2f start_gaze;
  cv::Point2f end_gaze;
  cv::Point2f mean_gaze;
  float amplitude_pixels=0;
  float amplitude_angle_deg=0;
  float mean_velocity=0;
  float max_velocity=0;
};

struct eye_event_datum
{
  eye_event_type type=eye_event_type::FIXATION;
  rtneon_time_ns_t start_ns=0;
  rtneon_time_ns_t end_ns=0; //0 for onsets
  std::optional<eye_event_geometry> geometry;
};

typedef std::variant<gaze_datum, video_frame, audio_frame, imu_datum, eye_event_datum> sample_payload;


//One decoded, timestamped sensor sample. Immutable once produced.
struct sample
{
  sensor_kind kind=sensor_kind::GAZE;
  std::string device_id;

  rtneon_time_ns_t device_ts_ns=0;
  rtneon_time_ns_t local_ts_ns=0;

  //Incremented every time the producing stream session (re)connects.
  uint64_t epoch=0;
  bool first_after_reconnect=false;

  sample_payload payload;

  const gaze_datum* gaze() const { return std::get_if<gaze_datum>(&payload); }
  const video_frame* video() const { return std::get_if<video_frame>(&payload); }
  const audio_frame* audio() const { return std::get_if<audio_frame>(&payload); }
  const imu_datum* imu() const { return std::get_if<imu_datum>(&payload); }
  const eye_event_datum* eye_event() const { return std::get_if<eye_event_datum>(&payload); }
};

typedef std::shared_ptr<const sample> sample_ptr;


//Output of a unit decoder, before clock translation.
struct decoded_sample
{
  sensor_kind kind=sensor_kind::GAZE;
  rtneon_time_ns_t device_ts_ns=0;
  sample_payload payload;
};
