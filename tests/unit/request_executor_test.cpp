#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include "request_executor.hpp"
#include "cancellation_token.hpp"
#include "resilience_metrics.hpp"
#include "fake_transport.hpp"

using namespace voxguard;
using voxguard::test::FakeTransport;

class RequestExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<ManualClock>();
    metrics_ = std::make_shared<ResilienceMetrics>();

    breaker_config_.failure_threshold = 3;
    breaker_config_.success_threshold = 1;
    breaker_config_.recovery_timeout = std::chrono::milliseconds(1000);

    policy_.max_attempts = 3;
    policy_.base_delay = std::chrono::milliseconds(10);
    policy_.max_delay = std::chrono::milliseconds(100);

    request_.method = "POST";
    request_.url = "http://localhost:8000/v1/voice/deepfake";
    request_.body = "payload";
  }

  std::unique_ptr<RequestExecutor> MakeExecutor(std::shared_ptr<FakeTransport> transport,
                                                std::shared_ptr<RateLimiter> limiter = nullptr) {
    breaker_ = std::make_shared<CircuitBreaker>("deepfake", breaker_config_, clock_);
    auto retry = std::make_shared<RetryOrchestrator>(policy_, 1);
    return std::make_unique<RequestExecutor>(std::move(transport), std::move(limiter), breaker_,
                                             retry, options_, clock_, metrics_);
  }

  std::shared_ptr<ManualClock> clock_;
  std::shared_ptr<ResilienceMetrics> metrics_;
  std::shared_ptr<CircuitBreaker> breaker_;
  CircuitBreakerConfig breaker_config_;
  RetryPolicy policy_;
  ExecutorOptions options_;
  HttpRequest request_;
};

TEST_F(RequestExecutorTest, Success_FirstAttempt) {
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&, int) {
    return FakeTransport::Status(200, "{}");
  });
  auto executor = MakeExecutor(transport);

  RequestOutcome outcome = executor->Execute(request_);
  EXPECT_TRUE(outcome.succeeded);
  EXPECT_EQ(outcome.terminal_reason, TerminalReason::Success);
  EXPECT_EQ(outcome.attempts_used, 1);
  EXPECT_EQ(outcome.retries, 0);
  EXPECT_EQ(outcome.last_response.status_code, 200);
  EXPECT_EQ(transport->GetCallCount(), 1);
  EXPECT_EQ(transport->GetLastTimeout(), options_.request_timeout);
}

TEST_F(RequestExecutorTest, RetriesTransientThenSucceeds) {
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&, int index) {
    return index < 2 ? FakeTransport::Status(503) : FakeTransport::Status(200);
  });
  breaker_config_.failure_threshold = 5;
  auto executor = MakeExecutor(transport);

  RequestOutcome outcome = executor->Execute(request_);
  EXPECT_TRUE(outcome.succeeded);
  EXPECT_EQ(outcome.attempts_used, 3);
  EXPECT_EQ(outcome.retries, 2);
  EXPECT_EQ(clock_->GetSleepCount(), 2);
  EXPECT_LE(clock_->GetTotalSlept(), std::chrono::milliseconds(30));

  // Body is re-sent unchanged
  for (const auto& sent : transport->GetRequests()) {
    EXPECT_EQ(sent.body, "payload");
  }

  auto snapshot = metrics_->Snapshot();
  EXPECT_EQ(snapshot.files_succeeded, 1u);
  EXPECT_EQ(snapshot.retry_count, 2u);
  EXPECT_EQ(snapshot.transport_attempts, 3u);
}

TEST_F(RequestExecutorTest, FatalStatus_SingleAttempt) {
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&, int) {
    return FakeTransport::Status(404);
  });
  auto executor = MakeExecutor(transport);

  RequestOutcome outcome = executor->Execute(request_);
  EXPECT_FALSE(outcome.succeeded);
  EXPECT_EQ(outcome.terminal_reason, TerminalReason::FatalClientError);
  EXPECT_EQ(outcome.attempts_used, 1);
  EXPECT_EQ(outcome.retries, 0);
  EXPECT_EQ(transport->GetCallCount(), 1);
  EXPECT_EQ(clock_->GetSleepCount(), 0);
  EXPECT_EQ(metrics_->Snapshot().files_failed, 1u);
}

TEST_F(RequestExecutorTest, MaxRetriesExceeded) {
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&, int) {
    return HttpResponse::FromError(TransportError::Timeout, "deadline");
  });
  breaker_config_.failure_threshold = 10;
  auto executor = MakeExecutor(transport);

  RequestOutcome outcome = executor->Execute(request_);
  EXPECT_EQ(outcome.terminal_reason, TerminalReason::MaxRetriesExceeded);
  EXPECT_EQ(outcome.attempts_used, 3);
  EXPECT_EQ(outcome.retries, 2);
  EXPECT_EQ(outcome.last_response.error, TransportError::Timeout);
  EXPECT_EQ(transport->GetCallCount(), 3);
}

TEST_F(RequestExecutorTest, BreakerOpen_ShortCircuits) {
  // One attempt per call so each call is one breaker failure
  policy_.max_attempts = 1;
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&, int) {
    return FakeTransport::Status(500);
  });
  auto executor = MakeExecutor(transport);

  int breaker_open = 0;
  for (int i = 0; i < 5; ++i) {
    RequestOutcome outcome = executor->Execute(request_);
    if (outcome.terminal_reason == TerminalReason::BreakerOpen) {
      breaker_open++;
      EXPECT_EQ(outcome.attempts_used, 0);
    }
  }

  EXPECT_EQ(transport->GetCallCount(), 3);
  EXPECT_EQ(breaker_open, 2);
  EXPECT_EQ(breaker_->GetState(), CircuitBreaker::State::Open);
  EXPECT_EQ(metrics_->Snapshot().breaker_trips, 2u);
}

TEST_F(RequestExecutorTest, BreakerOpen_MidRetryStopsLoop) {
  breaker_config_.failure_threshold = 2;
  policy_.max_attempts = 5;
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&, int) {
    return FakeTransport::Status(502);
  });
  auto executor = MakeExecutor(transport);

  RequestOutcome outcome = executor->Execute(request_);
  EXPECT_EQ(outcome.terminal_reason, TerminalReason::BreakerOpen);
  EXPECT_EQ(transport->GetCallCount(), 2);
  EXPECT_EQ(outcome.attempts_used, 2);
}

TEST_F(RequestExecutorTest, BreakerRecovers_AfterTimeout) {
  policy_.max_attempts = 1;
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&, int index) {
    return index < 3 ? FakeTransport::Status(500) : FakeTransport::Status(200);
  });
  auto executor = MakeExecutor(transport);

  for (int i = 0; i < 3; ++i) {
    executor->Execute(request_);
  }
  ASSERT_EQ(breaker_->GetState(), CircuitBreaker::State::Open);

  clock_->Advance(std::chrono::milliseconds(1000));
  RequestOutcome outcome = executor->Execute(request_);
  EXPECT_TRUE(outcome.succeeded);
  EXPECT_EQ(breaker_->GetState(), CircuitBreaker::State::Closed);
}

TEST_F(RequestExecutorTest, RejectMode_RateLimited) {
  options_.admission_mode = AdmissionMode::Reject;
  clock_->SetAutoAdvance(false);
  auto limiter = std::make_shared<RateLimiter>(2, 1, clock_);
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&, int) {
    return FakeTransport::Status(200);
  });
  auto executor = MakeExecutor(transport, limiter);

  EXPECT_TRUE(executor->Execute(request_).succeeded);
  EXPECT_TRUE(executor->Execute(request_).succeeded);
  RequestOutcome outcome = executor->Execute(request_);
  EXPECT_EQ(outcome.terminal_reason, TerminalReason::RateLimited);
  EXPECT_EQ(outcome.attempts_used, 0);
  EXPECT_EQ(transport->GetCallCount(), 2);
  EXPECT_EQ(metrics_->Snapshot().rate_limited, 1u);
}

TEST_F(RequestExecutorTest, WaitMode_BlocksForToken) {
  auto limiter = std::make_shared<RateLimiter>(1, 10, clock_);
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&, int) {
    return FakeTransport::Status(200);
  });
  auto executor = MakeExecutor(transport, limiter);

  auto start = clock_->Now();
  EXPECT_TRUE(executor->Execute(request_).succeeded);
  EXPECT_TRUE(executor->Execute(request_).succeeded);
  EXPECT_GE(clock_->Now() - start, std::chrono::milliseconds(99));
  EXPECT_EQ(transport->GetCallCount(), 2);
}

TEST_F(RequestExecutorTest, Cancelled_BeforeAttempt) {
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&, int) {
    return FakeTransport::Status(200);
  });
  auto executor = MakeExecutor(transport);

  CancellationToken token;
  token.Cancel();
  RequestOutcome outcome = executor->Execute(request_, &token);
  EXPECT_EQ(outcome.terminal_reason, TerminalReason::Cancelled);
  EXPECT_EQ(transport->GetCallCount(), 0);
  EXPECT_EQ(metrics_->Snapshot().cancelled, 1u);
}

TEST_F(RequestExecutorTest, Cancelled_DuringRetries) {
  CancellationToken token;
  auto transport = std::make_shared<FakeTransport>([&token](const HttpRequest&, int) {
    token.Cancel();
    return FakeTransport::Status(503);
  });
  auto executor = MakeExecutor(transport);

  RequestOutcome outcome = executor->Execute(request_, &token);
  EXPECT_EQ(outcome.terminal_reason, TerminalReason::Cancelled);
  EXPECT_EQ(transport->GetCallCount(), 1);
}

TEST_F(RequestExecutorTest, RetryAfter_RaisesDelay) {
  policy_.max_attempts = 2;
  policy_.max_delay = std::chrono::milliseconds(5000);
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&, int index) {
    if (index == 0) {
      HttpResponse response = FakeTransport::Status(429);
      response.SetHeader("Retry-After", "2");
      return response;
    }
    return FakeTransport::Status(200);
  });
  auto executor = MakeExecutor(transport);

  RequestOutcome outcome = executor->Execute(request_);
  EXPECT_TRUE(outcome.succeeded);
  EXPECT_EQ(clock_->GetTotalSlept(), std::chrono::seconds(2));
}

TEST_F(RequestExecutorTest, TransportException_IsProtocolError) {
  policy_.max_attempts = 1;
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&, int) -> HttpResponse {
    throw std::runtime_error("socket exploded");
  });
  auto executor = MakeExecutor(transport);

  RequestOutcome outcome = executor->Execute(request_);
  EXPECT_EQ(outcome.terminal_reason, TerminalReason::MaxRetriesExceeded);
  EXPECT_EQ(outcome.last_response.error, TransportError::ProtocolError);
}

TEST_F(RequestExecutorTest, LatencyMeasuredOnClock) {
  auto transport = std::make_shared<FakeTransport>([this](const HttpRequest&, int) {
    clock_->Advance(std::chrono::milliseconds(250));
    return FakeTransport::Status(200);
  });
  auto executor = MakeExecutor(transport);

  RequestOutcome outcome = executor->Execute(request_);
  EXPECT_DOUBLE_EQ(outcome.GetLatencyMs(), 250.0);
}

TEST_F(RequestExecutorTest, InvalidConstruction) {
  auto transport = std::make_shared<FakeTransport>([](const HttpRequest&, int) {
    return FakeTransport::Status(200);
  });
  auto breaker = std::make_shared<CircuitBreaker>("x", breaker_config_, clock_);
  auto retry = std::make_shared<RetryOrchestrator>(policy_);

  EXPECT_THROW(RequestExecutor(nullptr, nullptr, breaker, retry, options_, clock_),
               std::invalid_argument);
  EXPECT_THROW(RequestExecutor(transport, nullptr, nullptr, retry, options_, clock_),
               std::invalid_argument);

  ExecutorOptions bad = options_;
  bad.request_timeout = std::chrono::milliseconds(0);
  EXPECT_THROW(RequestExecutor(transport, nullptr, breaker, retry, bad, clock_),
               std::invalid_argument);
}
