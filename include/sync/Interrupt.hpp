#pragma once

#include <atomic>

namespace ms::sync::interrupt {

// SIGINT and SIGTERM set the flag; a second signal exits right away with 130.
void install();

[[nodiscard]] std::atomic<bool>& flag();

void reset();

}
