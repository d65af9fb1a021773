#pragma once

#include <chrono>
#include <cstdint>

namespace ttlkv {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Wall-clock time source for the Store, in whole epoch seconds (the unit the
// backing file stores expirations in). Tests use ManualClock to step time
// forward instead of sleeping.

class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual int64_t now() const = 0;
};

// ── SystemClock ──────────────────────────────────────────────────────────────

class SystemClock final : public Clock {
public:
    [[nodiscard]] int64_t now() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

// ── ManualClock ──────────────────────────────────────────────────────────────
//
// Test implementation: time only advances via explicit advance() calls.

class ManualClock final : public Clock {
public:
    explicit ManualClock(int64_t start = 1'700'000'000) : now_(start) {}

    [[nodiscard]] int64_t now() const override {
        return now_;
    }

    void advance(std::chrono::seconds delta) {
        now_ += delta.count();
    }

    void set(int64_t epoch_seconds) {
        now_ = epoch_seconds;
    }

private:
    int64_t now_;
};

} // namespace ttlkv
