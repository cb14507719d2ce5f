/// @file semilog.hpp
/// @brief Umbrella header for the semilog-cpp library.
///
/// Include this single header for access to all public types: the
/// lattice primitives, the per-actor schema, ActorSession, the fold, the
/// codec, Substrate and Replica, the report, logging and Error.

#pragma once

#include <semilog-cpp/codec.hpp>
#include <semilog-cpp/detailed.hpp>
#include <semilog-cpp/error.hpp>
#include <semilog-cpp/lattice.hpp>
#include <semilog-cpp/log.hpp>
#include <semilog-cpp/primitives.hpp>
#include <semilog-cpp/replica.hpp>
#include <semilog-cpp/report.hpp>
#include <semilog-cpp/schema.hpp>
#include <semilog-cpp/session.hpp>
#include <semilog-cpp/substrate.hpp>
#include <semilog-cpp/types.hpp>
