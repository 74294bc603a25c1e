#include "Capabilities.hpp"
#include "InstanceUid.hpp"
#include "PollTrigger.hpp"
#include "RetryBackoff.hpp"
#include "SessionState.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <iostream>
#include <string>
#include <thread>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

int TestCapabilities() {
    Capabilities capabilities{AgentCapability::ReportsStatus, AgentCapability::AcceptsRemoteConfig};
    if (capabilities.Bits() != 0x3) {
        return Fail("Unexpected capability bits: " + std::to_string(capabilities.Bits()));
    }
    if (!capabilities.Has(AgentCapability::AcceptsRemoteConfig) || capabilities.Has(AgentCapability::ReportsHealth)) {
        return Fail("Has() reports the wrong capabilities.");
    }
    if (capabilities.ToString() != "ReportsStatus|AcceptsRemoteConfig") {
        return Fail("Unexpected capability text: " + capabilities.ToString());
    }
    if (Capabilities().ToString() != "none") {
        return Fail("Empty capabilities should print as none.");
    }
    if (Capabilities::FromBits(0x2000).ToString() != "ReportsHeartbeat") {
        return Fail("ReportsHeartbeat should be bit 0x2000.");
    }
    if (Capabilities::FromBits(0x10000).ToString().find("0x10000") == std::string::npos) {
        return Fail("Unknown bits should be printed in hex.");
    }
    return 0;
}

int TestInstanceUid() {
    InstanceUid plain;
    if (!InstanceUid::Parse("0123456789abcdef0123456789ABCDEF", plain)) {
        return Fail("Plain hex uid rejected.");
    }
    if (plain.ToString() != "0123456789ABCDEF0123456789ABCDEF") {
        return Fail("Unexpected uid text: " + plain.ToString());
    }

    InstanceUid hyphenated;
    if (!InstanceUid::Parse("01234567-89ab-cdef-0123-456789abcdef", hyphenated) || hyphenated != plain) {
        return Fail("Hyphenated uid should parse to the same bytes.");
    }

    InstanceUid rejected;
    if (InstanceUid::Parse("0123456789-abcdef0123456789abcdef", rejected)
        || InstanceUid::Parse("0123456789abcdef0123456789abcdeg", rejected)
        || InstanceUid::Parse("", rejected)) {
        return Fail("Malformed uid accepted.");
    }
    if (InstanceUid::FromBytes(std::string(15, 'x'), rejected)) {
        return Fail("Short byte uid accepted.");
    }

    if (!InstanceUid().IsNil()) {
        return Fail("Default uid should be nil.");
    }

    const InstanceUid first = InstanceUid::Generate();
    const InstanceUid second = InstanceUid::Generate();
    if (first.IsNil() || first == second) {
        return Fail("Generated uids should be non-nil and distinct.");
    }
    if ((static_cast<unsigned char>(first.Bytes()[6]) >> 4) != 7) {
        return Fail("Generated uid is not version 7.");
    }
    return 0;
}

int TestSessionState() {
    SessionStateMachine session;
    if (session.TransitionTo(SessionState::Stopping).code != ClientErrorCode::NotRunning) {
        return Fail("Stopping before start should report NotRunning.");
    }
    if (!session.TransitionTo(SessionState::Started)) {
        return Fail("NotStarted -> Started rejected.");
    }
    if (session.TransitionTo(SessionState::Started).code != ClientErrorCode::AlreadyStarted) {
        return Fail("Second start should report AlreadyStarted.");
    }
    if (!session.TransitionTo(SessionState::Stopping) || !session.TransitionTo(SessionState::Stopped)) {
        return Fail("Started -> Stopping -> Stopped rejected.");
    }
    if (session.TransitionTo(SessionState::Stopping).code != ClientErrorCode::AlreadyStopped) {
        return Fail("Stopping a stopped session should report AlreadyStopped.");
    }
    if (session.TransitionTo(SessionState::Started).code != ClientErrorCode::AlreadyStarted) {
        return Fail("Restarting a stopped session should report AlreadyStarted.");
    }
    if (session.Current() != SessionState::Stopped) {
        return Fail("Rejected transitions must not change state.");
    }
    return 0;
}

int TestRetryBackoff() {
    RetryPolicy policy;
    policy.initialDelay = std::chrono::milliseconds(100);
    policy.maxDelay = std::chrono::milliseconds(350);
    policy.multiplier = 2.0;

    std::string error;
    if (!ValidateRetryPolicy(policy, error)) {
        return Fail("Valid retry policy rejected: " + error);
    }

    RetryBackoff backoff(policy);
    const long long expected[] = {100, 200, 350, 350};
    for (const long long delay : expected) {
        const auto next = backoff.NextDelay();
        if (next.count() != delay) {
            return Fail("Unexpected backoff delay " + std::to_string(next.count()) + ", wanted " + std::to_string(delay));
        }
    }
    if (backoff.Failures() != 4) {
        return Fail("Backoff should count failures.");
    }

    backoff.Reset();
    if (backoff.NextDelay().count() != 100) {
        return Fail("Reset should return to the initial delay.");
    }
    if (backoff.NextDelay(std::chrono::milliseconds(5000)).count() != 5000) {
        return Fail("A longer server hint should win over the computed delay.");
    }

    RetryPolicy broken = policy;
    broken.maxDelay = std::chrono::milliseconds(10);
    if (ValidateRetryPolicy(broken, error)) {
        return Fail("Max delay below initial delay accepted.");
    }
    RetryPolicy notANumber = policy;
    notANumber.multiplier = std::numeric_limits<double>::quiet_NaN();
    if (ValidateRetryPolicy(notANumber, error)) {
        return Fail("A NaN multiplier accepted.");
    }
    return 0;
}

int TestRetryHints() {
    if (ParseRetryAfter("120") != std::chrono::milliseconds(120000) || ParseRetryAfter(" 0 ") != std::chrono::milliseconds(0)) {
        return Fail("Delta-seconds Retry-After not parsed.");
    }
    if (ParseRetryAfter("") || ParseRetryAfter("-5") || ParseRetryAfter("1.5")
        || ParseRetryAfter("Wed, 21 Oct 2015 07:28:00 GMT")) {
        return Fail("Only plain decimal Retry-After values should be honoured.");
    }
    if (ParseRetryAfter("99999999999999999") != kMaxRetryHint
        || ParseRetryAfter("99999999999999999999999999") != kMaxRetryHint) {
        return Fail("A huge Retry-After should be capped at 24h.");
    }
    if (RetryHintFromSeconds(UINT64_MAX) != kMaxRetryHint || RetryHintFromSeconds(3).count() != 3000) {
        return Fail("Unexpected second hint conversion.");
    }
    if (RetryHintFromNanoseconds(UINT64_MAX) != kMaxRetryHint || RetryHintFromNanoseconds(2500000).count() != 2) {
        return Fail("Unexpected nanosecond hint conversion.");
    }

    RetryBackoff backoff;
    if (backoff.NextDelay(*ParseRetryAfter("99999999999999999")) != kMaxRetryHint) {
        return Fail("A capped hint should still win over the computed delay.");
    }
    return 0;
}

int TestExchangeSpans() {
    const std::string traceparent = NewTraceParent();
    if (traceparent.size() != 55 || traceparent.compare(0, 3, "00-") != 0 || traceparent.compare(52, 3, "-01") != 0) {
        return Fail("Malformed traceparent " + traceparent);
    }
    if (std::string(SpanName(ExchangeKind::Report)) != "opamp.exchange"
        || std::string(SpanName(ExchangeKind::Disconnect)) != "opamp.disconnect") {
        return Fail("Unexpected span names.");
    }

    ExchangeAttributes attributes;
    attributes.sequenceNum = 4;
    attributes.attempt = 2;
    ExchangeSpan span = Tracer::Instance().StartExchange(attributes);
    ExchangeSpan other = Tracer::Instance().StartExchange(attributes);
    if (span.TraceParent().size() != 55 || span.TraceParent() == other.TraceParent()) {
        return Fail("Every exchange should get its own traceparent.");
    }
    span.RecordHttpStatus(503);
    span.Finish(false, "503");
    span.Finish(true);
    if (!span.Finished() || other.Finished()) {
        return Fail("Finish should end only its own span.");
    }
    return 0;
}

int TestPollTrigger() {
    PollTrigger trigger;
    const auto start = PollTrigger::Clock::now();
    if (trigger.WaitUntil(start + std::chrono::milliseconds(20)) != PollEvent::Tick) {
        return Fail("Expired wait should report Tick.");
    }

    trigger.Reschedule();
    trigger.RequestSend();
    if (trigger.WaitUntil(PollTrigger::Clock::now() + std::chrono::seconds(5)) != PollEvent::SendNow) {
        return Fail("SendNow should win over Reschedule.");
    }
    if (trigger.SendPending()) {
        return Fail("SendNow should be consumed.");
    }
    if (trigger.WaitUntil(PollTrigger::Clock::now() + std::chrono::milliseconds(10)) != PollEvent::Tick) {
        return Fail("SendNow should also consume the pending reschedule.");
    }

    std::thread stopper([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        trigger.RequestStop();
    });
    const bool slept = trigger.SleepFor(std::chrono::seconds(10));
    stopper.join();
    if (slept) {
        return Fail("SleepFor should be cut short by stop.");
    }

    trigger.RequestSend();
    if (trigger.WaitUntil(PollTrigger::Clock::now() + std::chrono::seconds(5)) != PollEvent::Stop) {
        return Fail("Stop should win over SendNow.");
    }
    return 0;
}
} // namespace

int main() {
    if (const int rc = TestCapabilities()) {
        return rc;
    }
    if (const int rc = TestInstanceUid()) {
        return rc;
    }
    if (const int rc = TestSessionState()) {
        return rc;
    }
    if (const int rc = TestRetryBackoff()) {
        return rc;
    }
    if (const int rc = TestRetryHints()) {
        return rc;
    }
    if (const int rc = TestExchangeSpans()) {
        return rc;
    }
    return TestPollTrigger();
}
