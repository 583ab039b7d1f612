#include "utils/status.hpp"

#include <cstdint>
#include <cstring>

namespace taskexec {

constexpr int CODE_WIDTH = sizeof(StatusCode);

Status::Status(StatusCode code, const std::string& msg) {
  // Layout: [code][message length][message bytes]
  const uint32_t length = (uint32_t)msg.size();
  auto result = new char[length + sizeof(length) + CODE_WIDTH];
  std::memcpy(result, &code, CODE_WIDTH);
  std::memcpy(result + CODE_WIDTH, &length, sizeof(length));
  std::memcpy(result + sizeof(length) + CODE_WIDTH, msg.data(), length);

  state_ = result;
}

Status::Status() : state_(nullptr) {
}

Status::~Status() {
  delete[] state_;
}

Status::Status(const Status& s) : state_(nullptr) {
  CopyFrom(s);
}

Status&
Status::operator=(const Status& s) {
  if (this != &s) {
    CopyFrom(s);
  }
  return *this;
}

Status::Status(Status&& s) noexcept : state_(nullptr) {
  MoveFrom(s);
}

Status&
Status::operator=(Status&& s) noexcept {
  if (this != &s) {
    MoveFrom(s);
  }
  return *this;
}

void Status::CopyFrom(const Status& s) {
  delete[] state_;
  state_ = nullptr;
  if (s.state_ == nullptr) {
    return;
  }

  uint32_t length = 0;
  std::memcpy(&length, s.state_ + CODE_WIDTH, sizeof(length));
  size_t buff_len = length + sizeof(length) + CODE_WIDTH;
  state_ = new char[buff_len];
  std::memcpy(state_, s.state_, buff_len);
}

void Status::MoveFrom(Status& s) {
  delete[] state_;
  state_ = s.state_;
  s.state_ = nullptr;
}

std::string
Status::message() const {
  if (state_ == nullptr) {
    return "OK";
  }

  std::string msg;
  uint32_t length = 0;
  std::memcpy(&length, state_ + CODE_WIDTH, sizeof(length));
  if (length > 0) {
    msg.append(state_ + sizeof(length) + CODE_WIDTH, length);
  }

  return msg;
}

std::string
Status::ToString() const {
  if (state_ == nullptr) {
    return "OK";
  }

  std::string result;
  switch (code()) {
    case EXECUTOR_SUCCESS:
      result = "OK ";
      break;
    case EXECUTOR_UNEXPECTED_ERROR:
      result = "Unexpected error: ";
      break;
    case POOL_NOT_FOUND:
      result = "Pool not found: ";
      break;
    case POOL_OVERLOAD:
    case WORKER_POOL_OVERLOAD:
      result = "Overload: ";
      break;
    case MANAGER_CLOSED:
    case WORKER_POOL_CLOSED:
      result = "Closed: ";
      break;
    case INVALID_CONFIG:
    case WORKER_POOL_INVALID_ARGUMENT:
      result = "Invalid config: ";
      break;
    case CONFIG_LOAD_ERROR:
      result = "Config load error: ";
      break;
    case SHUTDOWN_TIMEOUT:
      result = "Timeout: ";
      break;
    default:
      result = "Error code(" + std::to_string(code()) + "): ";
      break;
  }

  result += message();
  return result;
}

}  // namespace taskexec
