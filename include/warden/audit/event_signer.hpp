#pragma once

#include <warden/schema/primitives.hpp>
#include <warden/schema/public_key.hpp>

#include <functional>

namespace warden::audit {

/// Signs an event digest. Installed by the engine; an empty signer leaves
/// events unsigned.
using event_signer_t =
    std::function<schema::signature_envelope_t(const schema::hash32_t&)>;

}  // namespace warden::audit
