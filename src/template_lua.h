#pragma once

#include "template_engine.h"

#include "sol/sol.hpp"

namespace venvy {

// Sequence tables (1..n) become lists, string-keyed tables become maps. An empty table
// is an empty list. Functions, threads and mixed-key tables throw template_error.
template_value template_value_from_lua(sol::object const &obj);

}  // namespace venvy
