#pragma once

#include <cstdint>
#include <cstddef>

//REV: debug levels. > 10 is chatty (per-unit), > 100 prints everything.
#ifndef RTNEON_DEBUG_LEVEL
#define RTNEON_DEBUG_LEVEL 1
#endif

#ifndef RTNEON_HTTP_DEBUG_LEVEL
#define RTNEON_HTTP_DEBUG_LEVEL 0
#endif

#define STR_(x) #x
#define STR(x) STR_(x)


//////////// TIME TYPES
//device and local timestamps are unix nanoseconds
typedef std::int64_t rtneon_time_ns_t;


//////////// NETWORK DEFAULTS
const int RTNEON_DEFAULT_API_PORT = 8080;

const char* const RTNEON_MDNS_SERVICE = "_http._tcp.local.";
const char* const RTNEON_MDNS_NAME_PREFIX = "PI monitor";
const double RTNEON_MDNS_TXT_GRACE_SEC = 0.25;

const char* const RTNEON_STATUS_WS_TARGET = "/api/status";


//////////// CONTROL
const double RTNEON_CONNECT_TIMEOUT_SEC = 5.0;
const double RTNEON_COMMAND_TIMEOUT_SEC = 5.0;
const double RTNEON_RECONNECT_BACKOFF_INITIAL_SEC = 0.5;
const double RTNEON_RECONNECT_BACKOFF_MAX_SEC = 8.0;
const double RTNEON_PUSH_POLL_SEC = 0.25;
//without a push for this long the session pulls status to prove the link is alive
const double RTNEON_LIVENESS_TIMEOUT_SEC = 5.0;


//////////// STREAMS
const double RTNEON_STREAM_BACKOFF_INITIAL_SEC = 0.5;
const double RTNEON_STREAM_BACKOFF_MAX_SEC = 8.0;
const double RTNEON_STREAM_STALL_TIMEOUT_SEC = 10.0;
const double RTNEON_RTSP_OPEN_TIMEOUT_SEC = 5.0;

//samples held per sensor before the oldest is dropped
const size_t RTNEON_SAMPLE_BUFFER_SIZE = 32;

//transport units queued per session between the reader and the decoder
const size_t RTNEON_UNIT_BUFFER_SIZE = 256;

//consecutive undecodable units before the session reconnects
const size_t RTNEON_DECODE_ERROR_THRESHOLD = 30;


//////////// CLOCK
const double RTNEON_CLOCK_PROBE_INTERVAL_SEC = 30.0;
const double RTNEON_CLOCK_REPROBE_INTERVAL_SEC = 2.0;
const size_t RTNEON_CLOCK_PROBE_COUNT = 20;
const double RTNEON_CLOCK_EWMA_ALPHA = 0.2;
const double RTNEON_CLOCK_ECHO_TIMEOUT_SEC = 1.0;
const double RTNEON_CLOCK_RTT_JITTER_THRESHOLD_MS = 20.0;
const double RTNEON_CLOCK_ASSUMED_PROCESSING_MS = 0.0;

//20 msec
const rtneon_time_ns_t RTNEON_CLOCK_DRIFT_RESET_NS = 20000000;


//////////// FACADE
const size_t RTNEON_FACADE_QUEUE_SIZE = 1;
const size_t RTNEON_MATCH_HISTORY_SIZE = 200;
const size_t RTNEON_AUDIO_MATCH_HISTORY_SIZE = 500;


//////////// MACROS

#define JOIN( j )   if( j.joinable() ) { j.join(); }
