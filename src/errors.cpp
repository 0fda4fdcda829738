#include "include/errors.hpp"
#include <cerrno>
#include <cstring>

std::string errno_message(const std::string &context, const std::string &path) {
  return context + ": " + path + ": " + std::strerror(errno);
}
