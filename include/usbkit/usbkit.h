/**
 * @file usbkit.h
 * @brief Umbrella header for the usbkit core.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "usbkit/types.h"
#include "usbkit/error.h"
#include "usbkit/logging.h"
#include "usbkit/log_registry.h"
#include "usbkit/descriptors.h"
#include "usbkit/context.h"
#include "usbkit/device.h"
#include "usbkit/device_list.h"
#include "usbkit/device_handle.h"
#include "usbkit/builder.h"
