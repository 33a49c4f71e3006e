#pragma once

#include <string>
#include <vector>

#include "lightbench/config/BenchConfig.hpp"
#include "lightbench/protocol/ProtocolAdapter.hpp"

namespace lightbench {

// protocol is "jsonrpc", "rest" or "coap". Throws BridgeStartupError for
// coap when the datagram loop cannot be started, ConfigError for an
// unknown protocol.
AdapterPtr makeAdapter(const std::string& protocol, const BenchConfig& cfg);

// Every enabled protocol with a positive weight. A protocol whose adapter
// cannot be created is logged and left out; the rest still run.
std::vector<WeightedAdapter> buildAdapters(const BenchConfig& cfg);

} // namespace lightbench
