#include <consign/execution/rules.hpp>

namespace consign::execution::rules {

consign::schema::transition_result_t make_rejection(
    consign::schema::transition_error_code code,
    std::string log,
    std::string info) {
  auto result = consign::schema::transition_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{kCodespace};
  return result;
}

consign::schema::transition_result_t make_acceptance(
    consign::schema::write_set_t write_set) {
  auto result = consign::schema::transition_result_t{};
  result.code = 0;
  result.write_set = std::move(write_set);
  return result;
}

}  // namespace consign::execution::rules
