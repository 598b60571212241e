#pragma once

#include "event.hpp"

#include <string_view>

// Delivery tier from whether the event's project is the active one and its
// level. `warning` is accepted as an alias of `warn`; unknown levels are Silent.
Priority classify(bool target_active, std::string_view level);
