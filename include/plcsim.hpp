#pragma once

// ─── Core ────────────────────────────────────────────────────────────────────
#include "plcsim/core/constants.hpp"
#include "plcsim/core/error.hpp"
#include "plcsim/core/types.hpp"

// ─── Utilities ───────────────────────────────────────────────────────────────
#include "plcsim/util/concurrent_queue.hpp"
#include "plcsim/util/event.hpp"
#include "plcsim/util/scheduler.hpp"
#include "plcsim/util/state_machine.hpp"
#include "plcsim/util/timer.hpp"

// ─── Telegram ────────────────────────────────────────────────────────────────
#include "plcsim/telegram/codec.hpp"
#include "plcsim/telegram/telegram.hpp"

// ─── Link ────────────────────────────────────────────────────────────────────
#include "plcsim/link/connection.hpp"
#include "plcsim/link/event_channel.hpp"
#include "plcsim/link/frame_assembler.hpp"
#include "plcsim/link/session.hpp"
#include "plcsim/link/tcp_socket.hpp"

// ─── Simulation ──────────────────────────────────────────────────────────────
#include "plcsim/sim/device.hpp"
#include "plcsim/sim/engine.hpp"
#include "plcsim/sim/event_log.hpp"
#include "plcsim/sim/sequence.hpp"
