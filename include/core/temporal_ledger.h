#pragma once

#include "core/record.h"
#include "infrastructure/error_handling.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <cstdint>
#include <memory>
#include <optional>
#include <functional>

namespace phichain {
namespace core {

struct TemporalState {
    std::optional<Record> forward;
    std::optional<Record> backward;
    bool symmetric = false;
};

struct LedgerStats {
    uint64_t forwardCount = 0;
    uint64_t backwardCount = 0;
    uint64_t totalCount = 0;
    // Fraction of index-aligned (forward[i], backward[i]) pairs that are
    // symmetric; 0.0 when either chain is empty.
    double symmetryScore = 0.0;
    // |(forward/backward) - phi| / phi; +infinity when backward is empty.
    double temporalBalance = 0.0;
};

// Two append-only chains whose tails must stay phi-symmetric. Every
// public operation holds one lock covering both chains.
class TemporalLedger {
public:
    explicit TemporalLedger(const utils::LedgerConfig& config = utils::LedgerConfig());
    ~TemporalLedger();

    TemporalLedger(const TemporalLedger&) = delete;
    TemporalLedger& operator=(const TemporalLedger&) = delete;

    // Fails with REJECTED_SYMMETRY, leaving both chains untouched, when the
    // opposite chain is non-empty and its tail is not symmetric with the
    // candidate.
    Result<Record> append(const std::vector<uint8_t>& payload, Direction direction);
    Result<Record> append(const std::vector<uint8_t>& payload, Direction direction, double createdAt);
    Result<Record> append(const std::string& payload, Direction direction);

    bool isSymmetric(const Record& a, const Record& b) const;
    static bool isSymmetric(const Record& a, const Record& b, double tolerance);
    // forward primary / backward mirror; 0.0 for same-direction pairs or a
    // zero denominator.
    static long double symmetryRatio(const Record& a, const Record& b);

    // Negative positions count from the tail (-1 is the most recent).
    TemporalState temporalState(int64_t position) const;

    // Pops forward then backward once per step; removed records are
    // returned most recent first.
    std::vector<Record> rewind(size_t steps);

    LedgerStats stats() const;

    std::vector<Record> forwardChain() const;
    std::vector<Record> backwardChain() const;
    size_t size(Direction direction) const;
    bool empty() const;

    // Recomputes every digest and checks predecessor linkage in both chains.
    bool verifyChains() const;

    double symmetryTolerance() const;

    void onAppend(std::function<void(const Record&)> callback);
    void onRewind(std::function<void(const std::vector<Record>&)> callback);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
