#pragma once

// Umbrella header

#include "telemux/version.hpp"
#include "telemux/core/error.hpp"
#include "telemux/core/timestamp.hpp"
#include "telemux/core/source/concepts.hpp"
#include "telemux/core/stream/descriptor.hpp"
#include "telemux/core/stream/sample.hpp"
#include "telemux/core/stream/sample_queue.hpp"
#include "telemux/core/stream/resolver.hpp"
#include "telemux/core/inlet/manager.hpp"
#include "telemux/core/recording/manager.hpp"
#include "telemux/core/archive/tar_lz4.hpp"
#include "telemux/core/relay/session.hpp"
#include "telemux/hub.hpp"
