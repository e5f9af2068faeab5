#include <streamfs/errors.h>

#include <errno.h>
#include <string.h>

#include <new>

namespace streamfs {

RemoteError make_errno_error(int err, const std::string& context) {
  bool transient = err == EINTR || err == EAGAIN || err == EBUSY || err == ETIMEDOUT;
  return RemoteError(err, context + ": " + strerror(err), transient);
}

int error_code(const std::exception& e) noexcept {
  if (auto remote = dynamic_cast<const RemoteError*>(&e)) {
    return remote->err() ? remote->err() : EIO;
  }
  if (dynamic_cast<const std::bad_alloc*>(&e)) {
    return ENOMEM;
  }
  return EIO;
}

}  // namespace streamfs
