#pragma once

#include <warden/schema/execution_mode.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(warden::schema,
                             execution_mode_t,
                             warden::schema::execution_mode_t::shadow,
                             warden::schema::execution_mode_t::pilot,
                             warden::schema::execution_mode_t::production)
