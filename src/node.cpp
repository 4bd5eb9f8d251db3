#include "concord/node.hpp"

#include <cstdlib>
#include <sstream>
#include <unistd.h>  // getpid, gethostname

#include "concord/jsonlite.hpp"

namespace concord {

std::string local_hostname() {
  char buf[256] = {};
  if (::gethostname(buf, sizeof(buf) - 1) == 0 && buf[0]) return buf;
  return "unknown-host";
}

NodeIdentity resolve_node_identity(const std::string& explicit_node_id) {
  NodeIdentity n;
  n.hostname   = local_hostname();
  n.process_id = static_cast<int64_t>(::getpid());

  if (!explicit_node_id.empty()) {
    n.node_id = explicit_node_id;
  } else {
    const char* e = std::getenv("CONCORD_NODE_ID");
    n.node_id = (e && e[0]) ? std::string(e) : "cli-" + n.hostname;
  }
  return n;
}

std::string node_identity_to_json(const NodeIdentity& n) {
  std::ostringstream o;
  o << "{"
    << "\"node_id\":\"" << jsonlite::escape(n.node_id) << "\""
    << ",\"hostname\":\"" << jsonlite::escape(n.hostname) << "\""
    << ",\"process_id\":" << n.process_id
    << "}";
  return o.str();
}

}  // namespace concord
