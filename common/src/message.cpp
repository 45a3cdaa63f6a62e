#include "common/message.hpp"

namespace webpool {

std::string to_string(const Message& msg) {
  if (std::holds_alternative<NewJob>(msg)) return "NEW_JOB";
  return "TERMINATE";
}

}  // namespace webpool
