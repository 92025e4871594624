#pragma once

//Everything a caller needs: discovery, the async orchestrator and the blocking device handle.

#include <rtneon_defines.hpp>
#include <rtneon_errors.hpp>
#include <session_config.hpp>
#include <sensor_types.hpp>
#include <device_endpoint.hpp>
#include <device_status.hpp>
#include <device_command.hpp>
#include <calibration.hpp>
#include <zeroconf_service_discoverer.hpp>
#include <clock_offset_estimator.hpp>
#include <control_session.hpp>
#include <stream_session.hpp>
#include <session_orchestrator.hpp>
#include <sync_device.hpp>
