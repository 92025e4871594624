#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

using namespace nlohmann;

enum class command_type
  {
    RECORDING_START,
    RECORDING_STOP_AND_SAVE,
    RECORDING_CANCEL,
    EVENT_SEND,
    TEMPLATE_GET,
    TEMPLATE_SET,
    CALIBRATION_GET,
    STATUS_GET
  };

inline const char* command_type_str( const command_type c )
{
  switch( c )
    {
    case command_type::RECORDING_START: return "recording.start";
    case command_type::RECORDING_STOP_AND_SAVE: return "recording.stop_and_save";
    case command_type::RECORDING_CANCEL: return "recording.cancel";
    case command_type::EVENT_SEND: return "event.send";
    case command_type::TEMPLATE_GET: return "template.get";
    case command_type::TEMPLATE_SET: return "template.set";
    case command_type::CALIBRATION_GET: return "calibration.get";
    case command_type::STATUS_GET: return "status.get";
    }
  return "unknown";
}

struct device_command
{
  command_type type=command_type::STATUS_GET;

  //event.send
  std::string event_name;
  std::optional<int64_t> event_ts_ns;

  //template.set: question id -> answer
  json template_data;

  static device_command recording_start() { device_command c; c.type=command_type::RECORDING_START; return c; }
  static device_command recording_stop_and_save() { device_command c; c.type=command_type::RECORDING_STOP_AND_SAVE; return c; }
  static device_command recording_cancel() { device_command c; c.type=command_type::RECORDING_CANCEL; return c; }
  static device_command template_get() { device_command c; c.type=command_type::TEMPLATE_GET; return c; }
  static device_command calibration_get() { device_command c; c.type=command_type::CALIBRATION_GET; return c; }
  static device_command status_get() { device_command c; c.type=command_type::STATUS_GET; return c; }

  static device_command event_send( const std::string& name, const std::optional<int64_t> ts_ns=std::nullopt )
  {
    device_command c;
    c.type = command_type::EVENT_SEND;
    c.event_name = name;
    c.event_ts_ns = ts_ns;
    return c;
  }

  static device_command template_set( const json& data )
  {
    device_command c;
    c.type = command_type::TEMPLATE_SET;
    c.template_data = data;
    return c;
  }
};
