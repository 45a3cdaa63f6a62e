#pragma once

#include <string>
#include <variant>

#include "common/job.hpp"

namespace webpool {

struct NewJob {
  Job job;
};

struct Terminate {};

// What travels through the dispatch channel. Each Message is received by
// exactly one worker.
using Message = std::variant<NewJob, Terminate>;

std::string to_string(const Message& msg);

inline bool is_terminate(const Message& msg) {
  return std::holds_alternative<Terminate>(msg);
}

}  // namespace webpool
