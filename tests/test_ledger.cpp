#include "core/temporal_ledger.h"
#include "core/hash_engine.h"
#include "math/phi_math.h"
#include "utils/logger.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <thread>
#include <vector>

namespace phichain {
namespace tests {

using core::Direction;
using core::Record;
using core::TemporalLedger;

// forward "forward-0" is phi-symmetric with each of these backward payloads.
static const char* SYM_FORWARD = "forward-0";
static const char* SYM_BACKWARD_A = "backward-1021";
static const char* SYM_BACKWARD_B = "backward-1599";

class LedgerTests {
public:
    static void runAll() {
        utils::Logger::setLevel(utils::LogLevel::OFF);

        testFirstAppendAccepted();
        testTxScenarioRejected();
        testSymmetricPairAccepted();
        testRejectionFromForwardSide();
        testChainLinkage();
        testRejectionAtomicity();
        testTemporalState();
        testRewindSingleForward();
        testRewindCounts();
        testRewindEmpty();
        testStatsEmpty();
        testStatsMixed();
        testSymmetryPredicate();
        testDivisionGuard();
        testToleranceConfig();
        testCallbacks();
        testExplicitTimestamp();
        testConcurrentAppends();
        testIndependentLedgers();
        std::cout << "All ledger tests passed!" << std::endl;
    }

    static void testFirstAppendAccepted() {
        std::cout << "Testing first append..." << std::endl;

        TemporalLedger ledger;
        auto result = ledger.append("tx1", Direction::FORWARD);
        assert(result.ok());
        assert(result.value().predecessorDigest == core::GENESIS_SENTINEL);
        assert(result.value().predecessorDigest == std::string(64, '0'));
        assert(result.value().primaryDigest == result.value().mirrorDigest);
        assert(ledger.size(Direction::FORWARD) == 1);
        assert(ledger.size(Direction::BACKWARD) == 0);

        std::cout << "  First append: PASSED" << std::endl;
    }

    static void testTxScenarioRejected() {
        std::cout << "Testing tx1/tx2 scenario..." << std::endl;

        TemporalLedger ledger;
        assert(ledger.append("tx1", Direction::FORWARD).ok());

        std::vector<uint8_t> tx1 = {'t', 'x', '1'};
        std::vector<uint8_t> tx2 = {'t', 'x', '2'};
        long double f = core::HashEngine::digestValue(core::HashEngine::primaryDigest(tx1)).toLongDouble();
        long double b = core::HashEngine::digestValue(core::HashEngine::mirrorDigest(tx2, Direction::BACKWARD)).toLongDouble();
        long double ratio = f / b;
        long double phi = math::PHI.toLongDouble();
        assert(std::fabs(ratio - 1.0768962356965080422L) < 1e-12L);
        assert(std::fabs(ratio - phi) / phi > 0.001L);

        auto result = ledger.append("tx2", Direction::BACKWARD);
        assert(result.failed());
        assert(result.error().code == ErrorCode::REJECTED_SYMMETRY);
        assert(ledger.size(Direction::FORWARD) == 1);
        assert(ledger.size(Direction::BACKWARD) == 0);

        std::cout << "  tx1/tx2 scenario: PASSED" << std::endl;
    }

    static void testSymmetricPairAccepted() {
        std::cout << "Testing symmetric pair..." << std::endl;

        TemporalLedger ledger;
        auto fwd = ledger.append(SYM_FORWARD, Direction::FORWARD);
        assert(fwd.ok());
        auto bwd = ledger.append(SYM_BACKWARD_A, Direction::BACKWARD);
        assert(bwd.ok());
        assert(bwd.value().predecessorDigest == core::GENESIS_SENTINEL);
        assert(bwd.value().mirrorDigest != bwd.value().primaryDigest);
        assert(ledger.isSymmetric(fwd.value(), bwd.value()));
        assert(ledger.isSymmetric(bwd.value(), fwd.value()));

        long double ratio = TemporalLedger::symmetryRatio(fwd.value(), bwd.value());
        assert(std::fabs(ratio - 1.6193834745204640L) < 1e-9L);

        auto second = ledger.append(SYM_BACKWARD_B, Direction::BACKWARD);
        assert(second.ok());
        assert(second.value().predecessorDigest == bwd.value().primaryDigest);

        std::cout << "  Symmetric pair: PASSED" << std::endl;
    }

    static void testRejectionFromForwardSide() {
        std::cout << "Testing forward-side rejection..." << std::endl;

        TemporalLedger ledger;
        assert(ledger.append(SYM_BACKWARD_A, Direction::BACKWARD).ok());

        auto rejected = ledger.append("tx1", Direction::FORWARD);
        assert(rejected.failed());
        assert(rejected.error().code == ErrorCode::REJECTED_SYMMETRY);
        assert(ledger.size(Direction::FORWARD) == 0);

        assert(ledger.append(SYM_FORWARD, Direction::FORWARD).ok());
        assert(ledger.size(Direction::FORWARD) == 1);

        std::cout << "  Forward-side rejection: PASSED" << std::endl;
    }

    static void testChainLinkage() {
        std::cout << "Testing chain linkage..." << std::endl;

        TemporalLedger ledger;
        for (int i = 0; i < 8; i++) {
            assert(ledger.append("entry-" + std::to_string(i), Direction::FORWARD).ok());
        }

        auto chain = ledger.forwardChain();
        assert(chain.size() == 8);
        assert(chain[0].predecessorDigest == std::string(64, '0'));
        for (size_t i = 1; i < chain.size(); i++) {
            assert(chain[i].predecessorDigest == chain[i - 1].primaryDigest);
            assert(chain[i].direction == Direction::FORWARD);
        }
        assert(ledger.verifyChains());

        std::cout << "  Chain linkage: PASSED" << std::endl;
    }

    static void testRejectionAtomicity() {
        std::cout << "Testing rejection atomicity..." << std::endl;

        TemporalLedger ledger;
        assert(ledger.append(SYM_FORWARD, Direction::FORWARD).ok());
        assert(ledger.append(SYM_BACKWARD_A, Direction::BACKWARD).ok());

        auto beforeForward = ledger.forwardChain();
        auto beforeBackward = ledger.backwardChain();
        for (int i = 0; i < 20; i++) {
            auto r = ledger.append("noise-" + std::to_string(i), Direction::BACKWARD);
            if (r.failed()) {
                assert(r.error().code == ErrorCode::REJECTED_SYMMETRY);
                assert(ledger.size(Direction::BACKWARD) == beforeBackward.size());
            } else {
                beforeBackward.push_back(r.value());
            }
        }
        assert(ledger.forwardChain().size() == beforeForward.size());
        assert(ledger.forwardChain()[0].primaryDigest == beforeForward[0].primaryDigest);
        assert(ledger.verifyChains());

        std::cout << "  Rejection atomicity: PASSED" << std::endl;
    }

    static void testTemporalState() {
        std::cout << "Testing temporal state..." << std::endl;

        TemporalLedger ledger;
        assert(ledger.append("tx1", Direction::FORWARD).ok());
        assert(ledger.append(SYM_FORWARD, Direction::FORWARD).ok());
        assert(ledger.append(SYM_BACKWARD_A, Direction::BACKWARD).ok());
        assert(ledger.append(SYM_BACKWARD_B, Direction::BACKWARD).ok());

        auto head = ledger.temporalState(0);
        assert(head.forward && head.forward->payloadString() == "tx1");
        assert(head.backward && head.backward->payloadString() == SYM_BACKWARD_A);
        assert(!head.symmetric);

        auto tail = ledger.temporalState(-1);
        assert(tail.forward && tail.forward->payloadString() == SYM_FORWARD);
        assert(tail.backward && tail.backward->payloadString() == SYM_BACKWARD_B);
        assert(tail.symmetric);

        auto second = ledger.temporalState(-2);
        assert(second.forward && second.forward->payloadString() == "tx1");

        auto missing = ledger.temporalState(5);
        assert(!missing.forward);
        assert(!missing.backward);
        assert(!missing.symmetric);

        auto tooNegative = ledger.temporalState(-3);
        assert(!tooNegative.forward && !tooNegative.backward);

        TemporalLedger lopsided;
        assert(lopsided.append("a", Direction::FORWARD).ok());
        assert(lopsided.append("b", Direction::FORWARD).ok());
        auto oneSided = lopsided.temporalState(1);
        assert(oneSided.forward && oneSided.forward->payloadString() == "b");
        assert(!oneSided.backward);
        assert(!oneSided.symmetric);

        std::cout << "  Temporal state: PASSED" << std::endl;
    }

    static void testRewindSingleForward() {
        std::cout << "Testing rewind of single forward entry..." << std::endl;

        TemporalLedger ledger;
        assert(ledger.append("tx1", Direction::FORWARD).ok());

        auto removed = ledger.rewind(1);
        assert(removed.size() == 1);
        assert(removed[0].payloadString() == "tx1");
        assert(removed[0].direction == Direction::FORWARD);
        assert(ledger.empty());

        std::cout << "  Rewind single forward: PASSED" << std::endl;
    }

    static void testRewindCounts() {
        std::cout << "Testing rewind counts..." << std::endl;

        TemporalLedger ledger;
        assert(ledger.append("tx1", Direction::FORWARD).ok());
        assert(ledger.append(SYM_FORWARD, Direction::FORWARD).ok());
        assert(ledger.append(SYM_BACKWARD_A, Direction::BACKWARD).ok());
        assert(ledger.append(SYM_BACKWARD_B, Direction::BACKWARD).ok());

        auto first = ledger.rewind(1);
        assert(first.size() == 2);
        assert(first[0].payloadString() == SYM_FORWARD);
        assert(first[1].payloadString() == SYM_BACKWARD_B);

        auto rest = ledger.rewind(5);
        assert(rest.size() == 2);
        assert(rest[0].payloadString() == "tx1");
        assert(rest[1].payloadString() == SYM_BACKWARD_A);
        assert(ledger.empty());

        TemporalLedger uneven;
        for (int i = 0; i < 4; i++) {
            assert(uneven.append("f" + std::to_string(i), Direction::FORWARD).ok());
        }
        auto removed = uneven.rewind(3);
        assert(removed.size() == 3);
        assert(removed[0].payloadString() == "f3");
        assert(removed[1].payloadString() == "f2");
        assert(removed[2].payloadString() == "f1");
        assert(uneven.size(Direction::FORWARD) == 1);
        assert(uneven.verifyChains());

        std::cout << "  Rewind counts: PASSED" << std::endl;
    }

    static void testRewindEmpty() {
        std::cout << "Testing rewind on empty ledger..." << std::endl;

        TemporalLedger ledger;
        assert(ledger.rewind(3).empty());
        assert(ledger.rewind(0).empty());
        assert(ledger.empty());

        std::cout << "  Rewind empty: PASSED" << std::endl;
    }

    static void testStatsEmpty() {
        std::cout << "Testing stats on empty chains..." << std::endl;

        TemporalLedger ledger;
        auto s = ledger.stats();
        assert(s.forwardCount == 0 && s.backwardCount == 0 && s.totalCount == 0);
        assert(s.symmetryScore == 0.0);
        assert(std::isinf(s.temporalBalance) && s.temporalBalance > 0);

        assert(ledger.append("tx1", Direction::FORWARD).ok());
        s = ledger.stats();
        assert(s.symmetryScore == 0.0);
        assert(!std::isnan(s.symmetryScore));
        assert(s.temporalBalance == std::numeric_limits<double>::infinity());

        std::cout << "  Stats empty: PASSED" << std::endl;
    }

    static void testStatsMixed() {
        std::cout << "Testing stats on mixed chains..." << std::endl;

        TemporalLedger ledger;
        assert(ledger.append(SYM_FORWARD, Direction::FORWARD).ok());
        assert(ledger.append(SYM_BACKWARD_A, Direction::BACKWARD).ok());
        auto s = ledger.stats();
        assert(s.totalCount == 2);
        assert(s.symmetryScore == 1.0);
        assert(std::fabs(s.temporalBalance - 0.3819660112501051) < 1e-12);

        TemporalLedger half;
        assert(half.append("tx1", Direction::FORWARD).ok());
        assert(half.append(SYM_FORWARD, Direction::FORWARD).ok());
        assert(half.append(SYM_BACKWARD_A, Direction::BACKWARD).ok());
        assert(half.append(SYM_BACKWARD_B, Direction::BACKWARD).ok());
        s = half.stats();
        assert(s.forwardCount == 2 && s.backwardCount == 2 && s.totalCount == 4);
        assert(s.symmetryScore == 0.5);
        assert(s.symmetryScore >= 0.0 && s.symmetryScore <= 1.0);

        assert(half.append(SYM_FORWARD, Direction::FORWARD).ok());
        s = half.stats();
        assert(std::fabs(s.temporalBalance - 0.0729490168751577) < 1e-12);

        std::cout << "  Stats mixed: PASSED" << std::endl;
    }

    static void testSymmetryPredicate() {
        std::cout << "Testing symmetry predicate..." << std::endl;

        TemporalLedger ledger;
        auto a = ledger.append(SYM_FORWARD, Direction::FORWARD);
        auto b = ledger.append(SYM_FORWARD, Direction::FORWARD);
        assert(a.ok() && b.ok());
        assert(!ledger.isSymmetric(a.value(), b.value()));
        assert(TemporalLedger::symmetryRatio(a.value(), b.value()) == 0.0L);
        assert(!TemporalLedger::isSymmetric(a.value(), a.value(), 10.0));

        std::cout << "  Symmetry predicate: PASSED" << std::endl;
    }

    static void testDivisionGuard() {
        std::cout << "Testing zero-denominator guard..." << std::endl;

        Record fwd;
        fwd.direction = Direction::FORWARD;
        fwd.primaryDigest = std::string(63, '0') + "1";
        fwd.mirrorDigest = fwd.primaryDigest;

        Record bwd;
        bwd.direction = Direction::BACKWARD;
        bwd.primaryDigest = std::string(64, 'f');
        bwd.mirrorDigest = std::string(64, '0');

        assert(!TemporalLedger::isSymmetric(fwd, bwd, 1e9));
        assert(TemporalLedger::symmetryRatio(fwd, bwd) == 0.0L);

        bwd.mirrorDigest = "not-hex";
        assert(!TemporalLedger::isSymmetric(fwd, bwd, 1e9));

        std::cout << "  Zero-denominator guard: PASSED" << std::endl;
    }

    static void testToleranceConfig() {
        std::cout << "Testing tolerance configuration..." << std::endl;

        TemporalLedger strict;
        assert(strict.symmetryTolerance() == utils::DEFAULT_SYMMETRY_TOLERANCE);

        utils::LedgerConfig loose;
        loose.symmetryTolerance = 0.5;
        TemporalLedger lenient(loose);
        assert(lenient.append("tx1", Direction::FORWARD).ok());
        assert(lenient.append("tx2", Direction::BACKWARD).ok());

        utils::LedgerConfig bogus;
        bogus.symmetryTolerance = -1.0;
        TemporalLedger fallback(bogus);
        assert(fallback.symmetryTolerance() == utils::DEFAULT_SYMMETRY_TOLERANCE);

        std::cout << "  Tolerance configuration: PASSED" << std::endl;
    }

    static void testCallbacks() {
        std::cout << "Testing callbacks..." << std::endl;

        TemporalLedger ledger;
        int appended = 0;
        size_t rewound = 0;
        ledger.onAppend([&appended](const Record&) { appended++; });
        ledger.onRewind([&rewound](const std::vector<Record>& removed) { rewound += removed.size(); });

        assert(ledger.append("tx1", Direction::FORWARD).ok());
        assert(ledger.append("tx2", Direction::BACKWARD).failed());
        assert(appended == 1);

        ledger.rewind(2);
        assert(rewound == 1);

        std::cout << "  Callbacks: PASSED" << std::endl;
    }

    static void testExplicitTimestamp() {
        std::cout << "Testing explicit timestamp..." << std::endl;

        TemporalLedger ledger;
        std::vector<uint8_t> payload = {0x00, 0xff, 0x10};
        auto r = ledger.append(payload, Direction::FORWARD, 1735000000.5);
        assert(r.ok());
        assert(r.value().createdAt == 1735000000.5);
        assert(r.value().payload == payload);

        auto now = ledger.append("later", Direction::FORWARD);
        assert(now.ok());
        assert(now.value().createdAt > 1735000000.5);

        std::cout << "  Explicit timestamp: PASSED" << std::endl;
    }

    static void testConcurrentAppends() {
        std::cout << "Testing concurrent appends..." << std::endl;

        TemporalLedger ledger;
        std::vector<std::thread> workers;
        for (int t = 0; t < 4; t++) {
            workers.emplace_back([&ledger, t]() {
                for (int i = 0; i < 50; i++) {
                    auto r = ledger.append("w" + std::to_string(t) + "-" + std::to_string(i), Direction::FORWARD);
                    assert(r.ok());
                    (void)r;
                }
            });
        }
        for (auto& w : workers) w.join();

        assert(ledger.size(Direction::FORWARD) == 200);
        assert(ledger.verifyChains());

        std::cout << "  Concurrent appends: PASSED" << std::endl;
    }

    static void testIndependentLedgers() {
        std::cout << "Testing independent ledgers..." << std::endl;

        TemporalLedger first;
        TemporalLedger second;
        assert(first.append("tx1", Direction::FORWARD).ok());
        assert(second.empty());
        assert(second.append("tx2", Direction::BACKWARD).ok());
        assert(first.size(Direction::BACKWARD) == 0);
        assert(second.size(Direction::FORWARD) == 0);

        std::cout << "  Independent ledgers: PASSED" << std::endl;
    }
};

}
}

int main() {
    phichain::tests::LedgerTests::runAll();
    return 0;
}
