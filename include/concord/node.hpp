#pragma once

// concord/node.hpp — Identity of the local node that originates events.
//
// DESIGN:
//   Every envelope carries `origin_node`. The Lamport clock file is keyed by
//   it, so the id must be stable across invocations on the same machine.
//   node_id:   explicit value, else $CONCORD_NODE_ID, else "cli-<hostname>".
//   process_id: informational only (log records, `config show`).
//
// EXTENSION_POINT: multi_agent_nodes
//   Current: one node id per host.
//   Upgrade path: derive "cli-<hostname>-<agent>" when several agents share a
//   host and want independent clocks.
//   Invariant: a node id must NEVER be reused by two hosts, otherwise their
//   logical clocks interleave without a total order.

#include <cstdint>
#include <string>

namespace concord {

struct NodeIdentity {
  std::string node_id;
  std::string hostname;
  int64_t     process_id{0};
};

std::string local_hostname();

// Resolve the node identity. `explicit_node_id` wins when non-empty.
NodeIdentity resolve_node_identity(const std::string& explicit_node_id = "");

std::string node_identity_to_json(const NodeIdentity& n);

}  // namespace concord
