#pragma once

/**
@file
@brief The entrypoint of the Pulsekey core library. Includes everything needed to drive keys from a motion controller.
*/

#include <pulsekey/version.hpp>

#include <pulsekey/sys/bridge.hpp>
