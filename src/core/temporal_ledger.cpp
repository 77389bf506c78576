#include "core/temporal_ledger.h"
#include "core/hash_engine.h"
#include "math/phi_math.h"
#include "utils/logger.h"
#include <mutex>
#include <chrono>
#include <cmath>
#include <limits>
#include <algorithm>

namespace phichain {
namespace core {

static double wallClockSeconds() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

static std::string shortDigest(const std::string& digest) {
    return digest.size() > 16 ? digest.substr(0, 16) : digest;
}

struct TemporalLedger::Impl {
    std::vector<Record> forward;
    std::vector<Record> backward;
    double tolerance = utils::DEFAULT_SYMMETRY_TOLERANCE;
    mutable std::mutex mtx;
    std::function<void(const Record&)> appendCallback;
    std::function<void(const std::vector<Record>&)> rewindCallback;

    std::vector<Record>& chain(Direction direction) {
        return direction == Direction::FORWARD ? forward : backward;
    }

    const std::vector<Record>& chain(Direction direction) const {
        return direction == Direction::FORWARD ? forward : backward;
    }

    static const Record* resolve(const std::vector<Record>& records, int64_t position);
    static bool verifyChain(const std::vector<Record>& records, Direction direction);
};

const Record* TemporalLedger::Impl::resolve(const std::vector<Record>& records, int64_t position) {
    int64_t size = static_cast<int64_t>(records.size());
    int64_t index = position < 0 ? size + position : position;
    if (index < 0 || index >= size) return nullptr;
    return &records[static_cast<size_t>(index)];
}

bool TemporalLedger::Impl::verifyChain(const std::vector<Record>& records, Direction direction) {
    std::string expectedPredecessor = GENESIS_SENTINEL;
    for (const auto& record : records) {
        if (record.direction != direction) return false;
        if (record.predecessorDigest != expectedPredecessor) return false;
        if (!record.verify()) return false;
        expectedPredecessor = record.primaryDigest;
    }
    return true;
}

TemporalLedger::TemporalLedger(const utils::LedgerConfig& config) : impl_(std::make_unique<Impl>()) {
    if (std::isfinite(config.symmetryTolerance) && config.symmetryTolerance > 0.0) {
        impl_->tolerance = config.symmetryTolerance;
    } else {
        LOG_WARN("Ignoring invalid symmetry tolerance, using default");
    }
}

TemporalLedger::~TemporalLedger() = default;

Result<Record> TemporalLedger::append(const std::vector<uint8_t>& payload, Direction direction) {
    return append(payload, direction, wallClockSeconds());
}

Result<Record> TemporalLedger::append(const std::string& payload, Direction direction) {
    return append(std::vector<uint8_t>(payload.begin(), payload.end()), direction, wallClockSeconds());
}

Result<Record> TemporalLedger::append(const std::vector<uint8_t>& payload, Direction direction, double createdAt) {
    Record candidate;
    candidate.payload = payload;
    candidate.direction = direction;
    candidate.createdAt = createdAt;
    candidate.primaryDigest = HashEngine::primaryDigest(payload);
    candidate.mirrorDigest = direction == Direction::FORWARD
        ? candidate.primaryDigest
        : HashEngine::mirrorDigest(payload, direction);

    std::function<void(const Record&)> callback;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        auto& target = impl_->chain(direction);
        const auto& other = impl_->chain(opposite(direction));

        candidate.predecessorDigest = target.empty() ? GENESIS_SENTINEL : target.back().primaryDigest;

        if (!other.empty() && !isSymmetric(candidate, other.back(), impl_->tolerance)) {
            LOG_WARN(std::string("Rejected ") + directionToString(direction) + " record " +
                     shortDigest(candidate.primaryDigest) + " (payload " +
                     utils::Logger::redactPayload(candidate.payloadString()) + "): not symmetric with " +
                     directionToString(opposite(direction)) + " tail " +
                     shortDigest(other.back().primaryDigest));
            return Result<Record>(makeError(ErrorCode::REJECTED_SYMMETRY,
                "record is not phi-symmetric with the latest opposite-direction record",
                directionToString(direction)));
        }

        target.push_back(candidate);
        callback = impl_->appendCallback;
        LOG_DEBUG(std::string("Appended ") + directionToString(direction) + " record #" +
                  std::to_string(target.size() - 1) + " " + shortDigest(candidate.primaryDigest));
    }

    if (callback) callback(candidate);
    return Result<Record>(candidate);
}

long double TemporalLedger::symmetryRatio(const Record& a, const Record& b) {
    if (a.direction == b.direction) return 0.0L;

    const Record& fwd = a.direction == Direction::FORWARD ? a : b;
    const Record& bwd = a.direction == Direction::FORWARD ? b : a;

    math::Uint256 numerator = HashEngine::digestValue(fwd.primaryDigest);
    math::Uint256 denominator = HashEngine::digestValue(bwd.mirrorDigest);
    if (denominator.isZero()) return 0.0L;

    return numerator.toLongDouble() / denominator.toLongDouble();
}

bool TemporalLedger::isSymmetric(const Record& a, const Record& b, double tolerance) {
    if (a.direction == b.direction) return false;

    long double ratio = symmetryRatio(a, b);
    if (ratio == 0.0L) return false;

    long double phi = math::PHI.toLongDouble();
    return std::fabs(ratio - phi) / phi < static_cast<long double>(tolerance);
}

bool TemporalLedger::isSymmetric(const Record& a, const Record& b) const {
    return isSymmetric(a, b, symmetryTolerance());
}

TemporalState TemporalLedger::temporalState(int64_t position) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    TemporalState state;

    const Record* fwd = Impl::resolve(impl_->forward, position);
    const Record* bwd = Impl::resolve(impl_->backward, position);
    if (fwd) state.forward = *fwd;
    if (bwd) state.backward = *bwd;
    if (fwd && bwd) {
        state.symmetric = isSymmetric(*fwd, *bwd, impl_->tolerance);
    }
    return state;
}

std::vector<Record> TemporalLedger::rewind(size_t steps) {
    std::vector<Record> removed;
    std::function<void(const std::vector<Record>&)> callback;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        for (size_t i = 0; i < steps; i++) {
            if (impl_->forward.empty() && impl_->backward.empty()) break;
            if (!impl_->forward.empty()) {
                removed.push_back(std::move(impl_->forward.back()));
                impl_->forward.pop_back();
            }
            if (!impl_->backward.empty()) {
                removed.push_back(std::move(impl_->backward.back()));
                impl_->backward.pop_back();
            }
        }
        callback = impl_->rewindCallback;
    }

    if (!removed.empty()) {
        LOG_INFO("Rewound " + std::to_string(steps) + " step(s), removed " +
                 std::to_string(removed.size()) + " record(s)");
    }
    if (callback) callback(removed);
    return removed;
}

LedgerStats TemporalLedger::stats() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    LedgerStats s;
    s.forwardCount = impl_->forward.size();
    s.backwardCount = impl_->backward.size();
    s.totalCount = s.forwardCount + s.backwardCount;

    size_t pairs = std::min(impl_->forward.size(), impl_->backward.size());
    if (pairs > 0) {
        size_t symmetricPairs = 0;
        for (size_t i = 0; i < pairs; i++) {
            if (isSymmetric(impl_->forward[i], impl_->backward[i], impl_->tolerance)) {
                symmetricPairs++;
            }
        }
        s.symmetryScore = static_cast<double>(symmetricPairs) / static_cast<double>(pairs);
    }

    if (impl_->backward.empty()) {
        s.temporalBalance = std::numeric_limits<double>::infinity();
    } else {
        double phi = static_cast<double>(math::PHI.toLongDouble());
        double ratio = static_cast<double>(s.forwardCount) / static_cast<double>(s.backwardCount);
        s.temporalBalance = std::fabs(ratio - phi) / phi;
    }
    return s;
}

std::vector<Record> TemporalLedger::forwardChain() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->forward;
}

std::vector<Record> TemporalLedger::backwardChain() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->backward;
}

size_t TemporalLedger::size(Direction direction) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->chain(direction).size();
}

bool TemporalLedger::empty() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->forward.empty() && impl_->backward.empty();
}

bool TemporalLedger::verifyChains() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return Impl::verifyChain(impl_->forward, Direction::FORWARD) &&
           Impl::verifyChain(impl_->backward, Direction::BACKWARD);
}

double TemporalLedger::symmetryTolerance() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->tolerance;
}

void TemporalLedger::onAppend(std::function<void(const Record&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->appendCallback = callback;
}

void TemporalLedger::onRewind(std::function<void(const std::vector<Record>&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->rewindCallback = callback;
}

}
}
