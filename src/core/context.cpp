#include "tidewater/core/context.h"

#include "tidewater/core/errors.h"

namespace tidewater {

Ship& SimContext::ship(const std::string& id) {
  if (auto* s = find_ptr(state.ships, id)) return *s;
  throw ProcessError("Unknown ship: " + id);
}

CustomerSite& SimContext::customer(const std::string& id) {
  if (auto* c = find_ptr(state.customers, id)) return *c;
  throw ProcessError("Unknown customer: " + id);
}

} // namespace tidewater
