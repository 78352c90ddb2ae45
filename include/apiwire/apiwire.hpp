#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// apiwire
// ═══════════════════════════════════════════════════════════════════════════
// Everything a client library needs to drive the engine. Individual headers
// can be included instead to keep compile times down.

#include "apiwire/codec/content_codec.hpp"
#include "apiwire/engine/engine.hpp"
#include "apiwire/engine/engine_config.hpp"
#include "apiwire/engine/engine_error.hpp"
#include "apiwire/engine/request_spec.hpp"
#include "apiwire/log/logger.hpp"
#include "apiwire/transport/backoff_policy.hpp"
#include "apiwire/transport/http_client.hpp"
#include "apiwire/transport/retry_policy.hpp"
