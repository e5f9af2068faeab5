#pragma once

#include <stdexcept>
#include <string>

namespace streamfs {

// Failure reported by a backing store capability (accessor, stream reader or
// writer). Carries the errno value handed back to the FUSE layer and whether
// the retry policy may try the operation again.
class RemoteError : public std::runtime_error {
public:
  RemoteError(int err, const std::string& what, bool transient = false)
      : std::runtime_error(what), err_(err), transient_(transient) {}

  int err() const noexcept { return err_; }
  bool transient() const noexcept { return transient_; }

private:
  int err_;
  bool transient_;
};

// Builds a RemoteError from an errno value, classifying EINTR, EAGAIN, EBUSY
// and ETIMEDOUT as transient.
RemoteError make_errno_error(int err, const std::string& context);

// errno to report for an arbitrary exception escaping a filesystem operation
int error_code(const std::exception& e) noexcept;

}  // namespace streamfs
