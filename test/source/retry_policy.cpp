#include <doctest/doctest.h>
#include <streamfs/retry_policy.h>

#include "test_doubles.h"

using namespace streamfs;
using namespace streamfs::test;
using std::chrono::milliseconds;
using std::chrono::seconds;

TEST_CASE("Retry - success on the first attempt") {
  FakeClock clock;
  RetryPolicy retry(clock);
  int calls = 0;
  int result = retry.run("op", [&]() {
    calls++;
    return 7;
  });
  CHECK(result == 7);
  CHECK(calls == 1);
  CHECK(clock.sleeps.empty());
}

TEST_CASE("Retry - transient failures back off exponentially") {
  FakeClock clock;
  RetryPolicy retry(clock);
  int calls = 0;
  std::string result = retry.run("op", [&]() {
    if (++calls < 3) {
      throw RemoteError(EAGAIN, "busy", true);
    }
    return std::string("done");
  });
  CHECK(result == "done");
  CHECK(calls == 3);
  CHECK(clock.sleeps == std::vector<Duration>{seconds(1), seconds(2)});
}

TEST_CASE("Retry - permanent failures are not retried") {
  FakeClock clock;
  RetryPolicy retry(clock);
  int calls = 0;
  try {
    retry.run("op", [&]() {
      calls++;
      throw RemoteError(ENOENT, "missing");
    });
    FAIL("expected a RemoteError");
  } catch (const RemoteError& e) {
    CHECK(e.err() == ENOENT);
  }
  CHECK(calls == 1);
  CHECK(clock.sleeps.empty());

  // Errors that are not RemoteErrors pass straight through
  calls = 0;
  CHECK_THROWS_AS(retry.run("op",
                            [&]() {
                              calls++;
                              throw std::runtime_error("bug");
                            }),
                  std::runtime_error);
  CHECK(calls == 1);
}

TEST_CASE("Retry - gives up after the attempt limit") {
  FakeClock clock;
  RetryOptions options;
  options.max_attempts = 3;
  RetryPolicy retry(clock, options);
  int calls = 0;
  CHECK_THROWS_AS(retry.run("op",
                            [&]() {
                              calls++;
                              throw RemoteError(ETIMEDOUT, "timeout", true);
                            }),
                  RemoteError);
  CHECK(calls == 3);
  CHECK(clock.sleeps.size() == 2);
}

TEST_CASE("Retry - gives up when the next delay would pass the time limit") {
  FakeClock clock;
  RetryOptions options;
  options.time_limit = milliseconds(2500);
  RetryPolicy retry(clock, options);
  int calls = 0;
  CHECK_THROWS_AS(retry.run("op",
                            [&]() {
                              calls++;
                              throw RemoteError(EBUSY, "busy", true);
                            }),
                  RemoteError);
  CHECK(calls == 2);
  CHECK(clock.sleeps == std::vector<Duration>{seconds(1)});
}

TEST_CASE("Retry - backoff is capped") {
  FakeClock clock;
  RetryOptions options;
  options.max_delay = seconds(5);
  RetryPolicy retry(clock, options);
  CHECK(retry.backoff(1) == seconds(1));
  CHECK(retry.backoff(2) == seconds(2));
  CHECK(retry.backoff(3) == seconds(4));
  CHECK(retry.backoff(4) == seconds(5));
  CHECK(retry.backoff(100) == seconds(5));
}

TEST_CASE("Errors - errno classification") {
  CHECK(make_errno_error(EAGAIN, "x").transient());
  CHECK(make_errno_error(EINTR, "x").transient());
  CHECK(make_errno_error(ETIMEDOUT, "x").transient());
  CHECK_FALSE(make_errno_error(ENOENT, "x").transient());
  CHECK(make_errno_error(ENOENT, "x").err() == ENOENT);

  CHECK(error_code(RemoteError(EACCES, "denied")) == EACCES);
  CHECK(error_code(RemoteError(0, "unknown")) == EIO);
  CHECK(error_code(std::runtime_error("other")) == EIO);
  CHECK(error_code(std::bad_alloc()) == ENOMEM);
}
