#pragma once

#include <warden/schema/signature_scheme.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(warden::schema,
                             signature_scheme_t,
                             warden::schema::signature_scheme_t::ml_dsa_65,
                             warden::schema::signature_scheme_t::ed25519)
