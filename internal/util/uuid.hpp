#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace audit::util {

// Random (version 4) UUID, canonical lowercase 8-4-4-4-12 text.
std::string GenerateUUIDString();

/*
  Accepts any-case canonical UUID text and returns it lowercased.

  Braced, urn: and hyphen-less forms are rejected; ids are compared as
  strings in every backend, so only one spelling may reach storage.
*/
std::optional<std::string> CanonicalUUID(std::string_view text);

inline bool IsWellFormedUUID(std::string_view text) {
  return CanonicalUUID(text).has_value();
}

} // namespace audit::util
