/**
 * Collaboration Event Bridge C++ Client
 *
 * Forwards operational events (tool output, status notices, lifecycle
 * markers) from an in-process producer to the collaboration server's HTTP
 * ingest endpoint in batches, without blocking the producer.
 *
 * Header-only. Link with libcurl, spdlog and pthreads.
 */

#pragma once

#include "collab/config.hpp"
#include "collab/logging.hpp"
#include "collab/event.hpp"
#include "collab/event_queue.hpp"
#include "collab/transport.hpp"
#include "collab/http_transport.hpp"
#include "collab/event_bridge.hpp"
#include "collab/global_bridge.hpp"
#include "collab/bridge_sink.hpp"
