// SPDX-License-Identifier: MIT

// src/rx_pipe.hpp
#pragma once

// Core protocol
#include "lib/stream/actor.hpp"
#include "lib/stream/contract.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/observable.hpp"
#include "lib/stream/proxy.hpp"
#include "lib/stream/subscription.hpp"

// Multicast and multi-source
#include "lib/stream/bridge.hpp"
#include "lib/stream/flatten.hpp"
#include "lib/stream/latest.hpp"
#include "lib/stream/subject.hpp"

// Library
#include "src/lazy.hpp"
#include "src/operators/enumerate.hpp"
#include "src/operators/error_if_empty.hpp"
#include "src/operators/filter.hpp"
#include "src/operators/map.hpp"
#include "src/operators/scan.hpp"
#include "src/operators/take.hpp"
#include "src/operators/tap.hpp"
#include "src/sources.hpp"
