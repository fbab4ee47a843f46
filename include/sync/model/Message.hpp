#pragma once

#include "sync/model/WorkItem.hpp"

#include <variant>

namespace ms::sync::model {

// Everything the status reducer hears about. Producers and workers never
// touch totals or the session directly.
namespace msg {

struct Planned  { WorkItem item; };                 // append to the session log
struct Progress { uint64_t seq = 0; uint64_t bytes = 0; };
struct Done     { WorkItem item; };                 // copied, deleted, faked or replayed
struct Failed   { WorkItem item; };
struct Vanished { WorkItem item; };                 // source disappeared mid-flight
struct Prepared { uint64_t totalCount = 0; uint64_t totalBytes = 0; };

}

using Message = std::variant<msg::Planned, msg::Progress, msg::Done, msg::Failed, msg::Vanished, msg::Prepared>;

}
