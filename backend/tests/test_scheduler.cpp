#include "../src/core/Scheduler.hpp"
#include "../src/core/MemoryModel.hpp"
#include "../src/core/CardStateMachine.hpp"
#include "../src/core/ForgettingCurve.hpp"
#include "test_suite.hpp"

#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

namespace {

constexpr std::time_t kT0 = 1700000000;
constexpr std::time_t kDay = 86400;

Card matureCard(double stability, double difficulty) {
    Card c;
    c.id = "mature";
    c.ownerId = "owner";
    c.state = CardState::Review;
    c.stability = stability;
    c.difficulty = difficulty;
    c.reps = 6;
    c.lapses = 1;
    c.lastReviewAt = kT0 - 10 * kDay;
    c.nextReviewAt = kT0;
    c.scheduledDays = 10.0;
    return c;
}

ReviewOutcome answer(bool correct, std::time_t at) {
    return ReviewOutcome::fromCorrectness(correct, at);
}

void test_initialize_card(TestSuite& suite, const Scheduler& scheduler) {
    Card c = scheduler.initializeCard("alice", kT0);
    suite.require(!c.id.empty(), "new card should get an id");
    suite.require(c.ownerId == "alice", "new card keeps owner");
    suite.require(c.createdAt == kT0, "new card keeps creation time");
    suite.require(c.state == CardState::New, "new card starts in New");
    suite.require(c.reps == 0 && c.lapses == 0, "new card has no reps or lapses");
    suite.require(!c.stability && !c.difficulty, "new card has no memory state");
    suite.require(!c.lastReviewAt && !c.nextReviewAt, "new card is unscheduled");
    suite.require(!c.deletedAt, "new card is visible");
    suite.require(c.isDue(kT0), "new card is due immediately");

    Card other = scheduler.initializeCard("alice", kT0);
    suite.require(other.id != c.id, "card ids should be unique");
}

void test_first_review(TestSuite& suite, const Scheduler& scheduler) {
    const auto& cfg = scheduler.config();
    Card c = scheduler.initializeCard("alice", kT0);

    Card good = scheduler.reviewCard(c, answer(true, kT0 + 100));
    suite.require(good.state == CardState::Learning || good.state == CardState::Review,
        "first correct answer moves a new card out of New");
    suite.require(good.state == CardState::Learning, "first review always enters Learning");
    suite.require(good.reps == 1, "first review sets reps to 1");
    suite.require(good.lapses == 0, "first review is never a lapse");
    suite.require(good.lastReviewAt == kT0 + 100, "lastReviewAt is the answer time");
    suite.require(good.nextReviewAt && *good.nextReviewAt > kT0 + 100, "next review lies after the answer");
    suite.require(*good.nextReviewAt == kT0 + 100 + 600, "correct first answer uses the 10 minute step");
    suite.require(good.difficulty && *good.difficulty == cfg.initial_difficulty, "difficulty seeded with default");
    suite.require(good.stability && *good.stability == cfg.initial_stability_good, "stability seeded for correct answer");

    Card bad = scheduler.reviewCard(c, answer(false, kT0));
    suite.require(bad.state == CardState::Learning, "first incorrect answer also enters Learning");
    suite.require(*bad.nextReviewAt == kT0 + 60, "incorrect first answer uses the 1 minute retry step");
    suite.require(bad.lapses == 0, "failing a new card is not a lapse");
    suite.require(*bad.stability == cfg.initial_stability_again, "stability seeded for incorrect answer");

    suite.require(c.state == CardState::New && c.reps == 0, "reviewCard must not modify its input");
}

void test_learning_graduation(TestSuite& suite, const Scheduler& scheduler) {
    const auto& cfg = scheduler.config();
    Card c = scheduler.initializeCard("alice", kT0);
    std::time_t now = kT0;

    int reviews = 0;
    while (c.state != CardState::Review && reviews < 10) {
        c = scheduler.reviewCard(c, answer(true, now));
        ++reviews;
        if (c.state == CardState::Learning) {
            suite.require(c.scheduledDays < cfg.graduation_threshold_days, "learning steps stay below one day");
        }
        now = *c.nextReviewAt;
    }

    suite.require(c.state == CardState::Review, "consecutive correct answers graduate a learning card");
    suite.require(reviews <= 5, "graduation should take only a few correct answers");
    suite.require(c.scheduledDays >= cfg.graduation_threshold_days, "graduated interval is at least one day");

    Card failed = scheduler.initializeCard("alice", kT0);
    failed = scheduler.reviewCard(failed, answer(true, kT0));
    Card retry = scheduler.reviewCard(failed, answer(false, *failed.nextReviewAt));
    suite.require(retry.state == CardState::Learning, "incorrect answer keeps a learning card in Learning");
    suite.require(retry.lapses == 0, "learning failures do not count as lapses");
    suite.require(*retry.nextReviewAt == *failed.nextReviewAt + 60, "learning retry uses the short fixed step");
}

void test_mature_lapse(TestSuite& suite, const Scheduler& scheduler) {
    Card c = matureCard(10.0, 5.0);
    Card lapsed = scheduler.reviewCard(c, answer(false, kT0));

    suite.require(lapsed.state == CardState::Relearning, "incorrect Review answer enters Relearning");
    suite.require(lapsed.lapses == c.lapses + 1, "Review -> Relearning increments lapses by one");
    suite.require(*lapsed.stability < 10.0, "lapse reduces stability");
    suite.require(*lapsed.stability > 0.0, "lapse keeps stability positive");
    suite.require(*lapsed.stability >= 1.0, "one lapse shrinks stability instead of resetting it");
    suite.require(*lapsed.difficulty > 5.0, "lapse makes the card harder");
    suite.require(*lapsed.nextReviewAt == kT0 + 600, "relearning uses the relearning step");
    suite.require(lapsed.reps == c.reps + 1, "lapse still counts as a review");

    Card again = scheduler.reviewCard(lapsed, answer(false, *lapsed.nextReviewAt));
    suite.require(again.state == CardState::Relearning, "incorrect Relearning answer stays in Relearning");
    suite.require(again.lapses == lapsed.lapses, "same lapse episode is counted once");
    suite.require(*again.stability <= *lapsed.stability, "incorrect answer never increases stability");

    Card recovered = again;
    std::time_t now = *again.nextReviewAt;
    for (int i = 0; i < 10 && recovered.state != CardState::Review; ++i) {
        recovered = scheduler.reviewCard(recovered, answer(true, now));
        now = *recovered.nextReviewAt;
    }
    suite.require(recovered.state == CardState::Review, "correct answers graduate a relearning card");
    suite.require(recovered.lapses == again.lapses, "recovering does not change lapses");
}

void test_review_success(TestSuite& suite, const Scheduler& scheduler) {
    const auto& cfg = scheduler.config();
    Card c = matureCard(10.0, 5.0);
    Card next = scheduler.reviewCard(c, answer(true, kT0));

    suite.require(next.state == CardState::Review, "correct Review answer stays in Review");
    suite.require(*next.stability > 10.0, "correct answer increases stability");
    suite.require(*next.difficulty < 5.0, "correct answer makes the card easier");
    suite.require(next.lapses == c.lapses, "correct answer does not touch lapses");

    double expected = ForgettingCurve::scheduledDays(*next.stability, cfg.target_retention);
    suite.require(near(next.scheduledDays, expected, 1e-12), "review interval follows the inverse forgetting curve");
    suite.require(*next.nextReviewAt == ForgettingCurve::addDays(kT0, expected), "nextReviewAt = answeredAt + interval");

    Card huge = matureCard(cfg.maximum_stability, 3.0);
    Card capped = scheduler.reviewCard(huge, answer(true, kT0));
    suite.require(capped.scheduledDays == cfg.maximum_interval_days, "intervals are capped at the maximum");
    suite.require(*capped.stability == cfg.maximum_stability, "stability is capped at the maximum");
}

void test_updater_monotonicity(TestSuite& suite, const SchedulerConfig& cfg) {
    MemoryState base{ 10.0, 5.0 };

    double previous = std::numeric_limits<double>::infinity();
    for (double r = 0.05; r <= 1.0; r += 0.05) {
        MemoryState m = MemoryModel::update(cfg, base, r, true);
        suite.require(m.stability <= previous, "stability gain must not grow with retrievability");
        suite.require(m.stability > base.stability, "correct answer always increases stability");
        previous = m.stability;
    }

    previous = std::numeric_limits<double>::infinity();
    for (double d = cfg.minimum_difficulty; d <= cfg.maximum_difficulty; d += 0.5) {
        MemoryState m = MemoryModel::update(cfg, MemoryState{ 10.0, d }, 0.9, true);
        suite.require(m.stability <= previous, "stability gain must not grow with difficulty");
        previous = m.stability;
    }

    MemoryState easiest = MemoryModel::update(cfg, MemoryState{ 10.0, cfg.minimum_difficulty }, 0.9, true);
    suite.require(easiest.difficulty == cfg.minimum_difficulty, "difficulty is floored at the minimum");

    MemoryState hardest = MemoryModel::update(cfg, MemoryState{ 10.0, cfg.maximum_difficulty }, 0.9, false);
    suite.require(hardest.difficulty == cfg.maximum_difficulty, "difficulty is capped at the maximum");
    suite.require(hardest.stability < 10.0 && hardest.stability > 0.0, "lapse shrinks but keeps stability positive");
}

void test_stability_floor(TestSuite& suite, const Scheduler& scheduler) {
    const auto& cfg = scheduler.config();
    Card c = matureCard(500.0, 5.0);
    std::time_t now = kT0;

    for (int i = 0; i < 300; ++i) {
        c = scheduler.reviewCard(c, answer(false, now));
        now = *c.nextReviewAt;
        suite.require(!std::isnan(*c.stability) && *c.stability > 0.0, "stability must stay positive");
        suite.require(*c.stability >= cfg.minimum_stability, "stability must respect the floor");
        suite.require(*c.difficulty <= cfg.maximum_difficulty, "difficulty must respect the ceiling");
    }
    suite.require(*c.stability == cfg.minimum_stability, "many lapses settle on the stability floor");
    suite.require(c.lapses == 2, "only the first failure of the episode is a lapse");
}

void test_state_machine_closure(TestSuite& suite, const Scheduler& scheduler) {
    std::mt19937 rng(42);
    std::bernoulli_distribution coin(0.7);

    Card c = scheduler.initializeCard("alice", kT0);
    std::time_t now = kT0;

    for (int i = 0; i < 500; ++i) {
        bool correct = coin(rng);
        Card next = scheduler.reviewCard(c, answer(correct, now));

        bool known = next.state == CardState::Learning || next.state == CardState::Review
            || next.state == CardState::Relearning;
        suite.require(known, "review must produce a defined post-New state");
        suite.require(next.reps == c.reps + 1, "every review increments reps");

        bool lapseEdge = c.state == CardState::Review && next.state == CardState::Relearning;
        suite.require(next.lapses == c.lapses + (lapseEdge ? 1 : 0),
            "lapses change exactly on Review -> Relearning");
        suite.require(next.scheduledDays >= 0.0, "intervals are never negative");
        suite.require(*next.nextReviewAt > now, "next review is always in the future");

        c = next;
        // Answer on time, sometimes late
        now = *c.nextReviewAt + (coin(rng) ? 0 : 3 * kDay);
    }
}

void test_deleted_card_rejected(TestSuite& suite, const Scheduler& scheduler) {
    Card c = matureCard(10.0, 5.0);
    c.softDelete(kT0);

    bool threw = false;
    try {
        scheduler.reviewCard(c, answer(true, kT0));
    }
    catch (const std::logic_error&) {
        threw = true;
    }
    suite.require(threw, "reviewing a soft-deleted card must throw logic_error");
}

void test_soft_delete_round_trip(TestSuite& suite, const Scheduler& scheduler) {
    Card c = scheduler.initializeCard("alice", kT0);
    c = scheduler.reviewCard(c, answer(true, kT0));
    c = scheduler.reviewCard(c, answer(false, *c.nextReviewAt));
    const Card original = c;

    suite.require(c.softDelete(kT0 + kDay), "first soft delete succeeds");
    suite.require(c.isDeleted() && *c.deletedAt == kT0 + kDay, "deletedAt is set");
    suite.require(!c.softDelete(kT0 + 2 * kDay), "second soft delete is rejected");
    suite.require(*c.deletedAt == kT0 + kDay, "rejected delete keeps the first timestamp");
    suite.require(!c.isDue(kT0 + 100 * kDay), "deleted cards are never due");

    suite.require(c.restore(), "restore succeeds on a deleted card");
    suite.require(c == original, "restore(softDelete(c)) == c");
    suite.require(!c.restore(), "restore on a visible card is rejected");
}

void test_corrupt_inputs(TestSuite& suite, const Scheduler& scheduler) {
    const auto& cfg = scheduler.config();

    Card c = matureCard(-5.0, 50.0);
    Card out = scheduler.reviewCard(c, answer(true, kT0));
    suite.require(*out.stability >= cfg.minimum_stability && *out.stability <= cfg.maximum_stability,
        "corrupt stability is clamped");
    suite.require(*out.difficulty >= cfg.minimum_difficulty && *out.difficulty <= cfg.maximum_difficulty,
        "corrupt difficulty is clamped");

    Card missing = matureCard(10.0, 5.0);
    missing.stability.reset();
    missing.difficulty = std::nan("");
    Card repaired = scheduler.reviewCard(missing, answer(false, kT0));
    suite.require(repaired.stability && !std::isnan(*repaired.stability), "missing stability is reseeded");
    suite.require(repaired.difficulty && !std::isnan(*repaired.difficulty), "NaN difficulty is repaired");

    Card skewed = matureCard(10.0, 5.0);
    skewed.lastReviewAt = kT0 + 5 * kDay;
    Card afterSkew = scheduler.reviewCard(skewed, answer(true, kT0));
    suite.require(*afterSkew.nextReviewAt > kT0, "clock skew still schedules into the future");
    suite.require(afterSkew.lastReviewAt == kT0, "lastReviewAt follows the answer time");
}

void test_card_retrievability(TestSuite& suite, const Scheduler& scheduler) {
    Card fresh = scheduler.initializeCard("alice", kT0);
    suite.require(!scheduler.retrievability(fresh, kT0), "new cards have no retrievability");

    Card c = matureCard(7.0, 5.0);
    c.lastReviewAt = kT0;
    auto r = scheduler.retrievability(c, kT0 + 7 * kDay);
    suite.require(r && near(*r, 0.5, 1e-12), "card retrievability halves after its stability");
}

void test_state_machine_table(TestSuite& suite, const SchedulerConfig& cfg) {
    using CardStateMachine::next;
    const double tenMinutes = 10.0 / 1440.0;

    auto s = next(cfg, CardState::Learning, true, 0.5);
    suite.require(s.state == CardState::Learning && near(s.intervalDays, tenMinutes), "short candidate keeps Learning");

    s = next(cfg, CardState::Learning, true, 1.0);
    suite.require(s.state == CardState::Review && s.intervalDays == 1.0, "candidate at the threshold graduates");

    s = next(cfg, CardState::Relearning, true, 3.5);
    suite.require(s.state == CardState::Review && s.intervalDays == 3.5 && !s.lapse, "relearning graduates");

    s = next(cfg, CardState::Review, true, 0.2);
    suite.require(s.state == CardState::Review && s.intervalDays == cfg.graduation_threshold_days,
        "review intervals are floored at the graduation threshold");

    s = next(cfg, CardState::Review, false, 30.0);
    suite.require(s.state == CardState::Relearning && s.lapse, "review failure is a lapse");

    s = next(cfg, CardState::Relearning, false, 30.0);
    suite.require(s.state == CardState::Relearning && !s.lapse, "relearning failure is not a second lapse");
}

void test_config(TestSuite& suite) {
    SchedulerConfig cfg = SchedulerConfig::deserialize(
        "# tuned\n"
        "target_retention: 0.85\n"
        "maximum_interval_days:180\n"
        "max_update_attempts: 5\n"
        "unknown_key: 3\n"
        "\n");
    suite.require(cfg.target_retention == 0.85, "config reads target_retention");
    suite.require(cfg.maximum_interval_days == 180.0, "config reads maximum_interval_days");
    suite.require(cfg.max_update_attempts == 5, "config reads max_update_attempts");
    suite.require(cfg.initial_difficulty == 5.0, "unspecified keys keep defaults");

    SchedulerConfig round = SchedulerConfig::deserialize(cfg.serialize());
    suite.require(round.target_retention == cfg.target_retention
        && round.maximum_interval_days == cfg.maximum_interval_days
        && round.max_update_attempts == cfg.max_update_attempts,
        "serialize/deserialize keeps values");

    bool threw = false;
    try { SchedulerConfig::deserialize("target_retention: 1.5\n"); }
    catch (const std::invalid_argument&) { threw = true; }
    suite.require(threw, "target_retention outside (0,1) is rejected");

    threw = false;
    try { SchedulerConfig::deserialize("stability_growth: fast\n"); }
    catch (const std::invalid_argument&) { threw = true; }
    suite.require(threw, "non-numeric values are rejected");

    threw = false;
    try { SchedulerConfig::deserialize("max_update_attempts: 1e20\n"); }
    catch (const std::invalid_argument&) { threw = true; }
    suite.require(threw, "max_update_attempts beyond int range is rejected");

    threw = false;
    try { SchedulerConfig::deserialize("max_update_attempts: 2.5\n"); }
    catch (const std::invalid_argument&) { threw = true; }
    suite.require(threw, "fractional max_update_attempts is rejected");

    threw = false;
    try {
        SchedulerConfig bad;
        bad.minimum_stability = 0.0;
        Scheduler scheduler(bad);
    }
    catch (const std::invalid_argument&) { threw = true; }
    suite.require(threw, "Scheduler refuses a stability floor below 0.1");

    threw = false;
    try {
        SchedulerConfig bad;
        bad.lapse_stability_factor = 1.2;
        bad.validate();
    }
    catch (const std::invalid_argument&) { threw = true; }
    suite.require(threw, "a lapse factor that grows stability is rejected");
}

} // namespace

int main() {
    TestSuite suite;
    SchedulerConfig cfg;
    Scheduler scheduler(cfg);

    test_initialize_card(suite, scheduler);
    test_first_review(suite, scheduler);
    test_learning_graduation(suite, scheduler);
    test_mature_lapse(suite, scheduler);
    test_review_success(suite, scheduler);
    test_updater_monotonicity(suite, cfg);
    test_stability_floor(suite, scheduler);
    test_state_machine_closure(suite, scheduler);
    test_deleted_card_rejected(suite, scheduler);
    test_soft_delete_round_trip(suite, scheduler);
    test_corrupt_inputs(suite, scheduler);
    test_card_retrievability(suite, scheduler);
    test_state_machine_table(suite, cfg);
    test_config(suite);

    return suite.finish("Scheduler");
}
