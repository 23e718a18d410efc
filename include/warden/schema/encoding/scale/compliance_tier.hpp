#pragma once

#include <warden/schema/compliance_tier.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    warden::schema,
    compliance_tier_t,
    warden::schema::compliance_tier_t::informational_tier,
    warden::schema::compliance_tier_t::advisory_tier,
    warden::schema::compliance_tier_t::policy_tier,
    warden::schema::compliance_tier_t::law_tier)
