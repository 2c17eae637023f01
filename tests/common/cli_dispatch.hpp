#ifndef RECONKIT_TESTS_COMMON_CLI_DISPATCH_HPP_
#define RECONKIT_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "reconkit/cli/router.hpp"

#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace reconkit::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return reconkit::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

// Redirects a standard stream into a buffer for the guard's lifetime.
class ScopedStreamCapture {
public:
  explicit ScopedStreamCapture(std::ostream& stream)
      : stream_(stream), previous_(stream.rdbuf(buffer_.rdbuf())) {}
  ~ScopedStreamCapture() {
    stream_.rdbuf(previous_);
  }

  ScopedStreamCapture(const ScopedStreamCapture&) = delete;
  ScopedStreamCapture& operator=(const ScopedStreamCapture&) = delete;

  std::string str() const {
    return buffer_.str();
  }

private:
  std::ostream& stream_;
  std::ostringstream buffer_;
  std::streambuf* previous_;
};

} // namespace reconkit::tests::common

#endif // RECONKIT_TESTS_COMMON_CLI_DISPATCH_HPP_
