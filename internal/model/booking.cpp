#include "booking.hpp"

namespace roombook::model {

std::string_view ToString(Role role) {
  switch (role) {
    case Role::kUser:
      return "user";
    case Role::kFacilityManager:
      return "facility_manager";
    case Role::kAdmin:
      return "admin";
    case Role::kAuditor:
      return "auditor";
    case Role::kService:
      return "service";
  }
  return "user";
}

std::optional<Role> ParseRole(std::string_view text) {
  if (text == "user") return Role::kUser;
  if (text == "facility_manager") return Role::kFacilityManager;
  if (text == "admin") return Role::kAdmin;
  if (text == "auditor") return Role::kAuditor;
  if (text == "service") return Role::kService;
  return std::nullopt;
}

} // namespace roombook::model
