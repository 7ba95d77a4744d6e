//! # Entry Identities
//!
//! Synthetic keys attached to every text entry so that presentation widgets
//! (combo boxes, list rows) keep a stable identity across redraws. They carry
//! no meaning and are never serialized into an argument vector.

#ifndef ARGRUN_STATE_IDENTITY_HPP
#define ARGRUN_STATE_IDENTITY_HPP

#include <string>

namespace argrun::state {

/// Returns a fresh RFC 4122 version-4 UUID string
/// ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx").
///
/// Random bits come from OpenSSL's CSPRNG. If it is unavailable, a
/// process-unique counter-based id ("local-<n>") is returned and a warning is
/// logged once.
[[nodiscard]] std::string new_identity();

} // namespace argrun::state

#endif // ARGRUN_STATE_IDENTITY_HPP
