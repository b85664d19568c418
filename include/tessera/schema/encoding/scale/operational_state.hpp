#pragma once

#include <tessera/schema/operational_state.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(tessera::schema,
                             operational_state_t,
                             tessera::schema::operational_state_t::active,
                             tessera::schema::operational_state_t::halted)
