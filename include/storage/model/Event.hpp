#pragma once

#include "storage/Error.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ms::storage::model {

enum class EventType { Create, Remove };

struct Event {
    EventType type{EventType::Create};
    std::string path;
    uint64_t size = 0; // 0 on Create means the size must be confirmed with stat
};

struct EventItem {
    std::optional<Event> event{};
    std::optional<Error> error{};
};

}
