#include "castbridge/core/event_bus.hpp"
#include "castbridge/utils/logger.hpp"

namespace castbridge::core {

void EventBus::handle_exception(const std::string& event_type, const std::exception& e) {
    CASTBRIDGE_LOG_ERROR("EventBus", "Exception in event handler for " + event_type + ": " + e.what());
}

}
