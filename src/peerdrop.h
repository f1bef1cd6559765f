#pragma once

// Public entry point: one session per peer pair, fed with copy-pasted blobs
#include "chunk_io.h"
#include "config.h"
#include "errors.h"
#include "logger.h"
#include "memory_transport.h"
#include "signaling.h"
#include "tcp_transport.h"
#include "transfer_events.h"
#include "transfer_session.h"
#include "version.h"
