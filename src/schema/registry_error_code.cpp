#include <reliquary/schema/registry_error_code.hpp>

namespace reliquary::schema {

namespace {

struct registry_category_t final : public std::error_category {
  const char* name() const noexcept override { return "reliquary.registry"; }

  std::string message(int value) const override {
    switch (static_cast<registry_error_code>(value)) {
      case registry_error_code::not_found:
        return "artifact not found";
      case registry_error_code::duplicate:
        return "artifact id already present";
      case registry_error_code::format_invalid:
        return "text or tag collection outside bounds";
      case registry_error_code::range_invalid:
        return "numeric value outside bounds";
      case registry_error_code::insufficient_privileges:
        return "caller is not the artifact guardian";
    }
    return "unknown registry error";
  }
};

}  // namespace

const std::error_category& registry_category() noexcept {
  static const auto category = registry_category_t{};
  return category;
}

std::error_code make_error_code(const registry_error_code code) noexcept {
  return {static_cast<int>(code), registry_category()};
}

}  // namespace reliquary::schema
