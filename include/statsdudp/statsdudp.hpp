// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "statsdudp/core/config_loader.hpp"
#include "statsdudp/core/logger.hpp"
#include "statsdudp/network/async_sender.hpp"
#include "statsdudp/network/endpoint_resolver.hpp"
#include "statsdudp/network/payload_splitter.hpp"
#include "statsdudp/network/sync_sender.hpp"
#include "statsdudp/network/transport_errors.hpp"
#include "statsdudp/network/transport_handle.hpp"
#include "statsdudp/network/transport_types.hpp"
#include "statsdudp/parsers/minimal_toml.hpp"
#include "statsdudp/statsd_udp.hpp"
