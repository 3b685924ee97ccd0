#include "insight.hpp"

#include <string>
#include <string_view>

namespace insights {

const FieldValue *find_field(const DataPoint &record, std::string_view name) {
  for (const auto &field : record) {
    if (field.name == name)
      return &field.value;
  }
  return nullptr;
}

std::string priority_to_string(Priority priority) {
  switch (priority) {
  case Priority::HIGH:
    return "high";
  case Priority::MEDIUM:
    return "medium";
  case Priority::LOW:
    return "low";
  }
  return "low";
}

int priority_weight(Priority priority) {
  switch (priority) {
  case Priority::HIGH:
    return 3;
  case Priority::MEDIUM:
    return 2;
  case Priority::LOW:
    return 1;
  }
  return 1;
}

} // namespace insights
